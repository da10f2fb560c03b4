/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Render/IteratorLoopRenderer.hpp>

#include <llvm/ADT/StringMap.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Model/Reducer.hpp>

namespace pipelift::render {

    namespace {

        auto error(const std::string &msg) -> llvm::Error {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), msg);
        }

        const llvm::StringMap< std::string > kWrapperTypes = {
            {     "int",   "Integer" },
            {    "long",      "Long" },
            {  "double",    "Double" },
            {   "float",     "Float" },
            {   "short",     "Short" },
            {    "byte",      "Byte" },
            {    "char", "Character" },
            { "boolean",   "Boolean" }
        };

        std::string boxed(const std::string &type) {
            auto it = kWrapperTypes.find(type);
            return it == kWrapperTypes.end() ? type : it->second;
        }

        std::string iteratorType(const std::string &element_type) {
            if (element_type.empty() || element_type == "var") {
                return "Iterator";
            }
            return "Iterator<" + boxed(element_type) + ">";
        }

        std::string elementTypeOf(const model::LoopModel &model) {
            if (!model.element.type.empty() && model.element.type != "var") {
                return model.element.type;
            }
            return model.source.element_type;
        }

        llvm::Error checkIterable(const model::LoopModel &model) {
            if (model.source.kind == model::SourceKind::Array
                && ast::isPrimitiveType(model.source.element_type))
            {
                return error("primitive array '" + model.source.expression + "' has no iterator");
            }
            return llvm::Error::success();
        }

        // Expression obtaining the iterator from the source.
        ast::ExprPtr iteratorSource(const analysis::LoopView &view, const model::LoopModel &model) {
            namespace build = ast::build;
            if (model.source.kind == model::SourceKind::Array) {
                return build::call(
                    build::call(build::name("Arrays"), "asList", build::exprs(view.source->clone())),
                    "iterator"
                );
            }
            return build::call(view.source->clone(), "iterator");
        }

        std::string iteratorSourceText(const model::LoopModel &model) {
            if (model.source.kind == model::SourceKind::Array) {
                return "Arrays.asList(" + model.source.expression + ").iterator()";
            }
            return model.source.expression + ".iterator()";
        }

    } // namespace

    std::string iteratorName(const ast::Stmt &loop) {
        std::string candidate = "it";
        for (unsigned suffix = 1; analysis::mentionsName(loop, candidate); ++suffix) {
            candidate = "it" + std::to_string(suffix);
        }
        return candidate;
    }

    llvm::Expected< IteratorLoop >
    buildIteratorLoop(const analysis::LoopView &view, const model::LoopModel &model) {
        namespace build = ast::build;
        if (auto err = checkIterable(model)) {
            return std::move(err);
        }

        auto iterator = iteratorName(*view.loop);
        auto element  = elementTypeOf(model);

        auto next = build::var(
            view.element_type.empty() ? boxed(element) : view.element_type, view.element_name,
            build::call(build::name(iterator, build::local(iteratorType(element))), "next")
        );
        next.is_final = view.element_final;

        std::vector< ast::StmtPtr > body;
        body.push_back(build::decl(std::move(next)));
        for (const auto *stmt : view.body) {
            body.push_back(stmt->clone());
        }

        IteratorLoop result;
        result.declaration = build::decl(iteratorType(element), iterator, iteratorSource(view, model));
        result.loop        = build::whileStmt(
            build::call(build::name(iterator, build::local(iteratorType(element))), "hasNext"),
            build::block(std::move(body))
        );
        result.declaration->setLocation(view.loop->location());
        result.loop->setLocation(view.loop->location());
        return std::move(result);
    }

    llvm::Expected< Replacement > renderIteratorLoop(
        const analysis::LoopView &view, const model::LoopModel &model, const RenderContext &context
    ) {
        auto built = buildIteratorLoop(view, model);
        if (!built) {
            return built.takeError();
        }

        Replacement replacement;
        replacement.loop = context.loop;
        replacement.remove(context.companion);
        replacement.require(kIteratorSymbol);
        if (model.source.kind == model::SourceKind::Array) {
            replacement.require(kArraysSymbol);
        }
        replacement.statements.push_back(ast::toString(*built->declaration));
        replacement.statements.push_back(ast::toString(*built->loop));
        return replacement;
    }

    std::vector< std::string > modelBodyStatements(const model::LoopModel &model) {
        std::vector< std::string > stmts;
        std::string current = model.element.name;
        bool counting       = false;

        for (const auto &operation : model.operations) {
            if (const auto *filter = std::get_if< model::FilterOp >(&operation)) {
                stmts.push_back("if (!(" + filter->predicate + ")) { continue; }");
                continue;
            }
            const auto &map = std::get< model::MapOp >(operation);
            if (map.produced_variable == model::kCountingVariable) {
                counting = true;
            } else if (map.produced_variable == current) {
                stmts.push_back(current + " = " + map.expression + ";");
            } else {
                stmts.push_back(
                    map.output_type.value_or("var") + " " + map.produced_variable + " = "
                    + map.expression + ";"
                );
            }
            current = map.produced_variable;
        }

        if (!model.terminal) {
            return stmts;
        }
        std::visit(
            [&](const auto &terminal) {
                using T = std::decay_t< decltype(terminal) >;
                if constexpr (std::is_same_v< T, model::ForEachTerminal >) {
                    stmts.insert(stmts.end(), terminal.body.begin(), terminal.body.end());
                } else if constexpr (std::is_same_v< T, model::CollectTerminal >) {
                    stmts.push_back(terminal.target + ".add(" + current + ");");
                } else if constexpr (std::is_same_v< T, model::ReduceTerminal >) {
                    stmts.push_back(
                        model::loopUpdateFor(terminal.kind, terminal.accumulator, current, counting)
                    );
                } else {
                    switch (terminal.kind) {
                        case model::MatchKind::Any:
                            stmts.push_back("if (" + terminal.condition + ") { return true; }");
                            break;
                        case model::MatchKind::None:
                            stmts.push_back("if (" + terminal.condition + ") { return false; }");
                            break;
                        case model::MatchKind::All:
                            stmts.push_back("if (!(" + terminal.condition + ")) { return false; }");
                            break;
                    }
                }
            },
            *model.terminal
        );
        return stmts;
    }

    llvm::Expected< std::vector< std::string > >
    renderModelIteratorLoop(const model::LoopModel &model, llvm::StringRef iterator) {
        if (auto err = checkIterable(model)) {
            return std::move(err);
        }
        auto element = elementTypeOf(model);
        std::string prefix = model.element.is_final ? "final " : "";

        std::string loop = "while (" + iterator.str() + ".hasNext()) { " + prefix
            + (element.empty() ? std::string("var") : element) + " " + model.element.name + " = "
            + iterator.str() + ".next();";
        for (const auto &stmt : modelBodyStatements(model)) {
            loop += " " + stmt;
        }
        loop += " }";

        return std::vector< std::string >{
            iteratorType(element) + " " + iterator.str() + " = " + iteratorSourceText(model) + ";",
            loop
        };
    }

    ast::StmtPtr buildEnhancedFor(const analysis::LoopView &view) {
        namespace build = ast::build;
        std::vector< ast::StmtPtr > body;
        for (const auto *stmt : view.body) {
            body.push_back(stmt->clone());
        }
        auto element = build::var(view.element_type, view.element_name);
        element.is_final = view.element_final;
        element.non_null = view.element_non_null;

        auto loop = build::forEach(std::move(element), view.source->clone(), build::block(std::move(body)));
        loop->setLocation(view.loop->location());
        return loop;
    }

    llvm::Expected< Replacement >
    renderEnhancedFor(const analysis::LoopView &view, const RenderContext &context) {
        if (view.form == analysis::LoopForm::EnhancedFor) {
            return error("loop is already an enhanced-for loop");
        }
        if (view.element_type.empty()) {
            return error("element type of '" + view.element_name + "' is unknown");
        }

        Replacement replacement;
        replacement.loop = context.loop;
        replacement.remove(context.companion);
        replacement.statements.push_back(ast::toString(*buildEnhancedFor(view)));
        return replacement;
    }

} // namespace pipelift::render
