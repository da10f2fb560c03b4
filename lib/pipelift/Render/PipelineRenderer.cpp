/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Render/PipelineRenderer.hpp>

#include <set>

#include <llvm/ADT/StringSet.h>
#include <llvm/Support/FormatVariadic.h>

#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/Util/Log.hpp>

namespace pipelift::render {

    namespace {

        auto error(const std::string &msg) -> llvm::Error {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), msg);
        }

        // Primitive array element types that need boxing before objects flow
        // through the pipeline.
        const llvm::StringSet<> kBoxablePrimitives = { "int", "long", "double" };

        // Wraps expressions whose text has a top-level space so a method call
        // can be appended.
        std::string asReceiver(llvm::StringRef text) {
            int depth = 0;
            for (char c : text) {
                if (c == '(' || c == '[' || c == '<') {
                    ++depth;
                } else if (c == ')' || c == ']' || c == '>') {
                    --depth;
                } else if (c == ' ' && depth == 0) {
                    return "(" + text.str() + ")";
                }
            }
            return text.str();
        }

        std::string lambda(llvm::StringRef param, llvm::StringRef body) {
            return (param + " -> " + body).str();
        }

        std::string forEachLambda(llvm::StringRef param, const model::ForEachTerminal &terminal) {
            if (terminal.single_expression && terminal.body.size() == 1U) {
                llvm::StringRef text = terminal.body.front();
                return lambda(param, text.rtrim().rtrim(';'));
            }
            std::string block = "{";
            for (const auto &stmt : terminal.body) {
                block += " " + stmt;
            }
            block += " }";
            return lambda(param, block);
        }

        std::string collectorCall(model::CollectorKind kind) {
            switch (kind) {
                case model::CollectorKind::ToList:
                    return ".collect(Collectors.toList())";
                case model::CollectorKind::ToSet:
                    return ".collect(Collectors.toSet())";
            }
            UNREACHABLE("unknown collector kind {0}", static_cast< int >(kind));
        }

        // `T target = new C<>();`, optionally with a capacity argument.
        const ast::DeclStmt *emptyCollectionDeclaration(const ast::Stmt *stmt, llvm::StringRef target) {
            const auto *decl = llvm::dyn_cast_or_null< ast::DeclStmt >(stmt);
            if (decl == nullptr || !decl->isSingleDecl() || decl->getSingleDecl().name != target) {
                return nullptr;
            }
            const auto *creation =
                llvm::dyn_cast_or_null< ast::NewExpr >(ast::ignoreParens(decl->getSingleDecl().init.get()));
            if (creation == nullptr || creation->getArgs().size() > 1U) {
                return nullptr;
            }
            if (creation->getArgs().size() == 1U) {
                const auto *hint = llvm::dyn_cast< ast::LiteralExpr >(ast::ignoreParens(creation->getArgs().front().get()));
                if (hint == nullptr || hint->getLiteralKind() != ast::LiteralKind::Number) {
                    return nullptr;
                }
            }
            return decl;
        }

        // Assignment of `value` to `target`, folded into the preceding empty
        // declaration of the target when allowed.
        std::string assignTo(
            llvm::StringRef target, llvm::StringRef value, const RenderContext &context,
            Replacement &replacement
        ) {
            const auto *decl = context.merge_declarations
                ? emptyCollectionDeclaration(context.preceding, target)
                : nullptr;
            if (decl == nullptr) {
                return (target + " = " + value + ";").str();
            }
            replacement.remove(decl);
            const auto &var = decl->getSingleDecl();
            std::string prefix = var.is_final ? "final " : "";
            return prefix + var.type + " " + target.str() + " = " + value.str() + ";";
        }

        std::string sourceStream(const model::LoopModel &model, Replacement &replacement) {
            const auto &source = model.source;
            switch (source.kind) {
                case model::SourceKind::Array: {
                    replacement.require(kArraysSymbol);
                    auto stream = "Arrays.stream(" + source.expression + ")";
                    if (kBoxablePrimitives.contains(source.element_type)) {
                        stream += ".boxed()";
                    }
                    return stream;
                }
                case model::SourceKind::Collection:
                    return asReceiver(source.expression) + ".stream()";
                case model::SourceKind::Iterable:
                    replacement.require(kStreamSupportSymbol);
                    return "StreamSupport.stream(" + asReceiver(source.expression)
                        + ".spliterator(), false)";
            }
            UNREACHABLE("unknown source kind {0}", static_cast< int >(source.kind));
        }

        bool isDirectForEach(const model::LoopModel &model) {
            return model.operations.empty()
                && std::holds_alternative< model::ForEachTerminal >(*model.terminal)
                && model.source.kind != model::SourceKind::Array;
        }

        std::string renderMatch(
            const model::MatchTerminal &match, const std::string &stream, const std::string &param
        ) {
            auto predicate = lambda(param, match.condition);
            switch (match.kind) {
                case model::MatchKind::Any:
                    return "if (" + stream + ".anyMatch(" + predicate + ")) { return true; }";
                case model::MatchKind::None:
                    return "if (!" + stream + ".noneMatch(" + predicate + ")) { return false; }";
                case model::MatchKind::All:
                    return "if (!" + stream + ".allMatch(" + predicate + ")) { return false; }";
            }
            UNREACHABLE("unknown match kind {0}", static_cast< int >(match.kind));
        }

        llvm::Error checkAvailable(
            const std::set< std::string > &available, const std::vector< std::string > &consumed,
            llvm::StringRef where
        ) {
            for (const auto &name : consumed) {
                if (available.count(name) == 0U) {
                    return error(llvm::formatv("variable '{0}' is not in scope at {1}", name, where).str());
                }
            }
            return llvm::Error::success();
        }

    } // namespace

    llvm::Error validateScopes(const model::LoopModel &model) {
        std::set< std::string > available = { model.element.name };
        std::string current               = model.element.name;

        for (const auto &operation : model.operations) {
            if (const auto *map = std::get_if< model::MapOp >(&operation)) {
                if (auto err = checkAvailable(available, map->consumed, "map '" + map->expression + "'")) {
                    return err;
                }
                available.erase(current);
                available.insert(map->produced_variable);
                current = map->produced_variable;
                continue;
            }
            const auto &filter = std::get< model::FilterOp >(operation);
            if (auto err = checkAvailable(available, filter.consumed, "filter '" + filter.predicate + "'")) {
                return err;
            }
        }

        if (!model.terminal) {
            return error("loop model has no terminal");
        }
        if (const auto *for_each = std::get_if< model::ForEachTerminal >(&*model.terminal)) {
            return checkAvailable(available, for_each->consumed, "forEach body");
        }
        if (const auto *match = std::get_if< model::MatchTerminal >(&*model.terminal)) {
            return checkAvailable(available, match->consumed, "match '" + match->condition + "'");
        }
        return llvm::Error::success();
    }

    std::string renderStream(const model::LoopModel &model, Replacement &replacement) {
        auto stream  = sourceStream(model, replacement);
        auto current = model.element.name;
        for (const auto &operation : model.operations) {
            if (const auto *map = std::get_if< model::MapOp >(&operation)) {
                stream += ".map(" + lambda(current, map->expression) + ")";
                current = map->produced_variable;
            } else {
                const auto &filter = std::get< model::FilterOp >(operation);
                stream += ".filter(" + lambda(current, filter.predicate) + ")";
            }
        }
        return stream;
    }

    llvm::Expected< Replacement >
    renderPipeline(const model::LoopModel &model, const RenderContext &context) {
        if (!model.isConvertible()) {
            return error("loop model is not convertible");
        }
        if (auto err = validateScopes(model)) {
            return std::move(err);
        }

        Replacement replacement;
        replacement.loop = context.loop;
        replacement.remove(context.companion);

        auto param = model.currentVariable();
        if (isDirectForEach(model)) {
            const auto &for_each = std::get< model::ForEachTerminal >(*model.terminal);
            replacement.statements.push_back(
                asReceiver(model.source.expression) + ".forEach(" + forEachLambda(param, for_each) + ");"
            );
            return replacement;
        }

        auto stream = renderStream(model, replacement);
        std::visit(
            [&](const auto &terminal) {
                using T = std::decay_t< decltype(terminal) >;
                if constexpr (std::is_same_v< T, model::ForEachTerminal >) {
                    auto call = terminal.ordered ? ".forEachOrdered(" : ".forEach(";
                    replacement.statements.push_back(
                        stream + call + forEachLambda(param, terminal) + ");"
                    );
                } else if constexpr (std::is_same_v< T, model::CollectTerminal >) {
                    replacement.require(kCollectorsSymbol);
                    replacement.statements.push_back(assignTo(
                        terminal.target, stream + collectorCall(terminal.kind), context, replacement
                    ));
                } else if constexpr (std::is_same_v< T, model::ReduceTerminal >) {
                    replacement.statements.push_back(
                        terminal.accumulator + " = " + stream + ".reduce(" + terminal.identity + ", "
                        + terminal.accumulator_fn + ");"
                    );
                } else {
                    replacement.statements.push_back(renderMatch(terminal, stream, param));
                }
            },
            *model.terminal
        );
        return replacement;
    }

    llvm::Expected< Replacement > renderConcatenation(
        const std::vector< model::LoopModel > &members,
        const std::vector< const ast::Stmt * > &loops, const RenderContext &context
    ) {
        if (members.size() < 2U || members.size() != loops.size()) {
            return error("a concatenation needs at least two member loops");
        }

        Replacement replacement;
        replacement.loop = context.loop;

        std::string target;
        model::CollectorKind kind = model::CollectorKind::ToList;
        std::string stream;
        for (std::size_t index = 0; index < members.size(); ++index) {
            const auto &member = members[index];
            if (!member.isConvertible()) {
                return error("group member is not convertible");
            }
            const auto *collect = std::get_if< model::CollectTerminal >(&*member.terminal);
            if (collect == nullptr) {
                return error("group member does not collect into a target");
            }
            if (index == 0U) {
                target = collect->target;
                kind   = collect->kind;
            } else if (collect->target != target) {
                return error("group members collect into different targets");
            }
            if (auto err = validateScopes(member)) {
                return std::move(err);
            }

            auto member_stream = renderStream(member, replacement);
            stream = index == 0U ? member_stream
                                 : "Stream.concat(" + stream + ", " + member_stream + ")";
            if (loops[index] != context.loop) {
                replacement.remove(loops[index]);
            }
        }

        replacement.require(kStreamSymbol);
        replacement.require(kCollectorsSymbol);
        replacement.statements.push_back(
            assignTo(target, stream + collectorCall(kind), context, replacement)
        );
        return replacement;
    }

} // namespace pipelift::render
