/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/LoopExtractor.hpp>

#include <algorithm>

#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/AST/SyntaxVisitor.hpp>
#include <pipelift/Analysis/PatternDetectors.hpp>
#include <pipelift/Analysis/SafetyAnalyzer.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Model/Reducer.hpp>

namespace pipelift::analysis {

    namespace {

        // Statements that cannot move into a lambda body: returns, throws and
        // unlabeled continues of the loop being converted.
        class LambdaBodyChecker final : public ast::RecursiveSyntaxVisitor< LambdaBodyChecker >
        {
          public:
            std::string problem;

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool TraverseLoop(const ast::Stmt *loop) {
                ++depth;
                auto result = TraverseStmtChildren(loop);
                --depth;
                return result;
            }

            bool VisitStmt(const ast::Stmt *stmt) {
                if (llvm::isa< ast::ReturnStmt >(stmt)) {
                    problem = "return statement outside a match shape";
                } else if (llvm::isa< ast::ThrowStmt >(stmt)) {
                    problem = "throw statement in loop body";
                } else if (const auto *jump = llvm::dyn_cast< ast::ContinueStmt >(stmt)) {
                    if (!jump->hasLabel() && depth == 0U) {
                        problem = "continue statement outside a guard";
                    }
                }
                return problem.empty();
            }

          private:
            unsigned depth = 0;
        };

        class LambdaReturnFinder final : public ast::RecursiveSyntaxVisitor< LambdaReturnFinder >
        {
          public:
            bool found = false;

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool VisitStmt(const ast::Stmt *stmt) {
                found = llvm::isa< ast::ReturnStmt >(stmt);
                return !found;
            }
        };

        // First loop-local name read by a step after a map moved the pipeline
        // to another variable; empty when every step reads only its input.
        std::string staleReference(
            const std::string &element, const std::vector< model::Operation > &ops,
            const model::Terminal &terminal
        ) {
            std::string current = element;
            auto stale          = [&](const std::vector< std::string > &consumed) -> std::string {
                for (const auto &name : consumed) {
                    if (name != current) {
                        return "'" + name + "' is used after the pipeline moved on to '" + current + "'";
                    }
                }
                return {};
            };

            for (const auto &operation : ops) {
                if (const auto *map = std::get_if< model::MapOp >(&operation)) {
                    if (auto reason = stale(map->consumed); !reason.empty()) {
                        return reason;
                    }
                    current = map->produced_variable;
                } else if (auto reason = stale(std::get< model::FilterOp >(operation).consumed);
                           !reason.empty())
                {
                    return reason;
                }
            }
            if (const auto *for_each = std::get_if< model::ForEachTerminal >(&terminal)) {
                return stale(for_each->consumed);
            }
            if (const auto *match = std::get_if< model::MatchTerminal >(&terminal)) {
                return stale(match->consumed);
            }
            return {};
        }

        std::string declaredType(const ast::NameExpr &name) {
            return name.type().empty() ? name.getBinding().type : name.type();
        }

    } // namespace

    LoopExtractor::LoopExtractor(
        const LoopView &view, ExtractionContext context, const Options &options
    )
        : view(view), context(context), options(options), locals(declaredNames(view.body)) {
        locals.insert(view.element_name);
    }

    std::string LoopExtractor::currentVariable(const std::vector< model::Operation > &ops) const {
        for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
            if (const auto *map = std::get_if< model::MapOp >(&*it)) {
                return map->produced_variable;
            }
        }
        return view.element_name;
    }

    void LoopExtractor::recordUses(
        const std::vector< const ast::NameExpr * > &uses, std::vector< std::string > &consumed,
        std::vector< std::string > &captured
    ) const {
        auto add_unique = [](std::vector< std::string > &names, const std::string &name) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        };
        for (const auto *use : uses) {
            const auto &name = use->getName();
            if (locals.count(name) != 0U) {
                add_unique(consumed, name);
                continue;
            }
            auto kind = use->getBinding().kind;
            if (kind == ast::BindingKind::Local || kind == ast::BindingKind::Parameter) {
                add_unique(captured, name);
            }
        }
    }

    bool LoopExtractor::mentionedOutside(const ast::Stmt &except, llvm::StringRef name) const {
        unsigned total = 0;
        for (const auto *stmt : view.body) {
            total += countMentions(*stmt, name);
        }
        return total > countMentions(except, name);
    }

    std::set< std::string > LoopExtractor::reservedNames() const {
        auto names = context.names_in_use;
        names.insert(locals.begin(), locals.end());
        return names;
    }

    bool LoopExtractor::isProvablyNonNull(const ast::Expr *expr) const {
        expr = ast::ignoreParens(expr);
        if (const auto *literal = llvm::dyn_cast< ast::LiteralExpr >(expr)) {
            return literal->getLiteralKind() == ast::LiteralKind::String;
        }
        if (const auto *name = llvm::dyn_cast< ast::NameExpr >(expr)) {
            if (name->getName() == view.element_name) {
                return view.element_non_null;
            }
            return name->getBinding().non_null;
        }
        if (const auto *binary = llvm::dyn_cast< ast::BinaryExpr >(expr)) {
            // String concatenation never yields null.
            if (binary->getOp() != "+") {
                return false;
            }
            auto is_string = [](const ast::Expr *operand) {
                const auto *literal = llvm::dyn_cast< ast::LiteralExpr >(ast::ignoreParens(operand));
                return (literal != nullptr && literal->getLiteralKind() == ast::LiteralKind::String)
                    || model::categorize(operand->type()) == model::NumericCategory::String;
            };
            return is_string(binary->getLHS()) || is_string(binary->getRHS());
        }
        if (const auto *call = llvm::dyn_cast< ast::CallExpr >(expr)) {
            const auto *owner = ast::asSimpleName(call->getReceiver());
            return owner != nullptr && owner->getName() == "String"
                && (call->getMethod() == "valueOf" || call->getMethod() == "format");
        }
        return false;
    }

    std::optional< model::Terminal > LoopExtractor::collectTerminal(
        const ast::Stmt &stmt, const std::string &current, std::vector< model::Operation > &ops
    ) {
        auto collect = patterns::matchCollect(stmt);
        if (!collect) {
            return std::nullopt;
        }
        const auto &target = collect->target->getName();
        if (target == current || locals.count(target) != 0U || mentionedOutside(stmt, target)
            || mentionsName(*collect->value, target))
        {
            return std::nullopt;
        }

        auto target_type = declaredType(*collect->target);
        if (!target_type.empty()) {
            auto kind = classifySourceKind(target_type, options);
            if (!kind || *kind != model::SourceKind::Collection) {
                return std::nullopt;
            }
        }

        if (!ast::isIdentityReference(collect->value, current)) {
            model::MapOp map{ .expression        = ast::toString(*collect->value),
                              .produced_variable = current,
                              .output_type       = std::nullopt,
                              .consumed          = {},
                              .captured          = {} };
            auto element = ast::elementType(target_type);
            if (!element.empty()) {
                map.output_type = element;
            }
            recordUses(nameUses(*collect->value), map.consumed, map.captured);
            ops.emplace_back(std::move(map));
        }

        return model::CollectTerminal{ .kind = llvm::StringRef(target_type).contains("Set")
                                                   ? model::CollectorKind::ToSet
                                                   : model::CollectorKind::ToList,
                                       .target      = target,
                                       .target_type = target_type };
    }

    std::optional< model::Terminal > LoopExtractor::reduceTerminal(
        const ast::Stmt &stmt, const std::string &current, std::vector< model::Operation > &ops
    ) {
        auto accumulation = patterns::matchAccumulation(stmt);
        if (!accumulation) {
            return std::nullopt;
        }
        const auto &acc = accumulation->accumulator->getName();
        if (acc == current || locals.count(acc) != 0U || mentionedOutside(stmt, acc)
            || (accumulation->value != nullptr && mentionsName(*accumulation->value, acc)))
        {
            return std::nullopt;
        }

        auto acc_type = declaredType(*accumulation->accumulator);
        bool operands_non_null = false;
        if (accumulation->value == nullptr) {
            ops.emplace_back(model::MapOp{ .expression        = model::countingLiteral(acc_type),
                                           .produced_variable = model::kCountingVariable,
                                           .output_type       = std::nullopt,
                                           .consumed          = {},
                                           .captured          = {} });
        } else {
            if (!ast::isIdentityReference(accumulation->value, current)) {
                model::MapOp map{ .expression        = ast::toString(*accumulation->value),
                                  .produced_variable = current,
                                  .output_type       = std::nullopt,
                                  .consumed          = {},
                                  .captured          = {} };
                if (!acc_type.empty()) {
                    map.output_type = acc_type;
                }
                recordUses(nameUses(*accumulation->value), map.consumed, map.captured);
                ops.emplace_back(std::move(map));
            }
            operands_non_null = accumulation->accumulator->getBinding().non_null
                && isProvablyNonNull(accumulation->value);
        }

        return model::ReduceTerminal{
            .identity         = acc,
            .accumulator_fn   = model::combinerFor(
                accumulation->kind, acc_type, operands_non_null, reservedNames()
            ),
            .kind             = accumulation->kind,
            .accumulator      = acc,
            .accumulator_type = acc_type,
        };
    }

    ExtractionResult LoopExtractor::fallbackForEach(
        llvm::ArrayRef< const ast::Stmt * > stmts, std::vector< model::Operation > ops
    ) {
        for (const auto *stmt : stmts) {
            LambdaBodyChecker checker;
            checker.TraverseStmt(stmt);
            if (!checker.problem.empty()) {
                return Aborted{ checker.problem };
            }
        }

        model::ForEachTerminal terminal;
        terminal.ordered           = !ops.empty();
        terminal.single_expression = stmts.size() == 1U && llvm::isa< ast::ExprStmt >(stmts.front());
        for (const auto *stmt : stmts) {
            terminal.body.push_back(ast::toString(*stmt));
        }
        recordUses(nameUses(std::vector< const ast::Stmt * >(stmts.begin(), stmts.end())),
                   terminal.consumed, terminal.captured);
        return Produced{ .operations = std::move(ops), .terminal = std::move(terminal) };
    }

    ExtractionResult LoopExtractor::extractStatements(
        llvm::ArrayRef< const ast::Stmt * > stmts, std::vector< model::Operation > ops
    ) {
        for (std::size_t index = 0; index < stmts.size(); ++index) {
            const auto &stmt   = *stmts[index];
            const bool is_last = index + 1U == stmts.size();
            auto current       = currentVariable(ops);

            if (const auto *cond = patterns::matchGuardContinue(stmt)) {
                model::FilterOp filter{ .predicate = ast::negatedText(*cond), .consumed = {}, .captured = {} };
                recordUses(nameUses(*cond), filter.consumed, filter.captured);
                ops.emplace_back(std::move(filter));
                continue;
            }

            if (is_last) {
                if (auto match = patterns::matchEarlyReturn(stmt, context.following)) {
                    model::MatchTerminal terminal{ .kind      = match->kind,
                                                   .condition = ast::toString(*match->condition),
                                                   .consumed  = {},
                                                   .captured  = {} };
                    recordUses(nameUses(*match->condition), terminal.consumed, terminal.captured);
                    return Produced{ .operations = std::move(ops), .terminal = std::move(terminal) };
                }
                if (auto tail = patterns::matchGuardedTail(stmt)) {
                    model::FilterOp filter{ .predicate = ast::toString(*tail->condition),
                                            .consumed  = {},
                                            .captured  = {} };
                    recordUses(nameUses(*tail->condition), filter.consumed, filter.captured);
                    ops.emplace_back(std::move(filter));
                    return extractStatements(tail->body, std::move(ops));
                }
                if (auto terminal = collectTerminal(stmt, current, ops)) {
                    return Produced{ .operations = std::move(ops), .terminal = std::move(*terminal) };
                }
                if (auto terminal = reduceTerminal(stmt, current, ops)) {
                    return Produced{ .operations = std::move(ops), .terminal = std::move(*terminal) };
                }
            } else {
                if (const auto *decl = patterns::matchMapDeclaration(stmt)) {
                    model::MapOp map{ .expression        = ast::toString(*decl->init),
                                      .produced_variable = decl->name,
                                      .output_type       = std::nullopt,
                                      .consumed          = {},
                                      .captured          = {} };
                    if (!decl->type.empty() && decl->type != "var") {
                        map.output_type = decl->type;
                    }
                    recordUses(nameUses(*decl->init), map.consumed, map.captured);
                    ops.emplace_back(std::move(map));
                    continue;
                }
                if (const auto *value = patterns::matchReassignment(stmt, current)) {
                    model::MapOp map{ .expression        = ast::toString(*value),
                                      .produced_variable = current,
                                      .output_type       = std::nullopt,
                                      .consumed          = {},
                                      .captured          = {} };
                    recordUses(nameUses(*value), map.consumed, map.captured);
                    ops.emplace_back(std::move(map));
                    continue;
                }
            }

            return fallbackForEach(stmts.drop_front(index), std::move(ops));
        }

        // Every statement was consumed by guards and maps.
        model::ForEachTerminal terminal;
        terminal.ordered = !ops.empty();
        return Produced{ .operations = std::move(ops), .terminal = std::move(terminal) };
    }

    ExtractionResult LoopExtractor::extractPipeline() {
        if (view.body.empty()) {
            return Aborted{ "empty loop body" };
        }
        return extractStatements(view.body, {});
    }

    ModelResult LoopExtractor::extractModel() {
        auto source_type = view.sourceType();
        auto kind        = classifySourceKind(source_type, options);
        if (!kind) {
            return Aborted{ "unsupported source type '" + source_type + "'" };
        }

        model::LoopModel model;
        model.source.kind       = *kind;
        model.source.expression = ast::toString(*view.source);
        model.source.element_type = view.element_type.empty() || view.element_type == "var"
            ? ast::elementType(source_type)
            : view.element_type;
        model.element  = model::ElementBinding{ .name     = view.element_name,
                                                .type     = view.element_type,
                                                .is_final = view.element_final };
        model.metadata = scanControlFlow(view);

        auto result = extractPipeline();
        if (auto *aborted = std::get_if< Aborted >(&result)) {
            return std::move(*aborted);
        }
        auto &produced = std::get< Produced >(result);
        if (auto reason = staleReference(view.element_name, produced.operations, produced.terminal);
            !reason.empty())
        {
            return Aborted{ std::move(reason) };
        }
        model.operations = std::move(produced.operations);
        model.terminal   = std::move(produced.terminal);
        return model;
    }

    ModelResult
    extractLoopModel(const LoopView &view, ExtractionContext context, const Options &options) {
        LoopExtractor extractor(view, context, options);
        return extractor.extractModel();
    }

    ModelResult extractForEachCallModel(const LoopView &view, const Options &options) {
        for (const auto *stmt : view.body) {
            LambdaReturnFinder finder;
            finder.TraverseStmt(stmt);
            if (finder.found) {
                return Aborted{ "return statement in forEach lambda body" };
            }
        }

        auto source_type = view.sourceType();
        auto kind        = classifySourceKind(source_type, options);
        if (!kind) {
            return Aborted{ "unsupported source type '" + source_type + "'" };
        }

        model::LoopModel model;
        model.source = model::SourceDescriptor{ .kind         = *kind,
                                                .expression   = ast::toString(*view.source),
                                                .element_type = view.element_type };
        model.element = model::ElementBinding{ .name     = view.element_name,
                                               .type     = view.element_type,
                                               .is_final = false };

        model::ForEachTerminal terminal;
        terminal.single_expression = view.synthesized != nullptr;
        for (const auto *stmt : view.body) {
            terminal.body.push_back(ast::toString(*stmt));
        }
        model.terminal = std::move(terminal);
        return model;
    }

} // namespace pipelift::analysis
