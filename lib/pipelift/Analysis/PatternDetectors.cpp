/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/PatternDetectors.hpp>

#include <pipelift/AST/SyntaxUtils.hpp>

namespace pipelift::analysis::patterns {

    namespace {

        // The single statement of a branch, unwrapping a one-statement block.
        const ast::Stmt *singleStatement(const ast::Stmt *stmt) {
            auto stmts = ast::flattenBody(stmt);
            return stmts.size() == 1U ? stmts.front() : nullptr;
        }

        const ast::IfStmt *asSimpleIf(const ast::Stmt &stmt) {
            const auto *if_stmt = llvm::dyn_cast< ast::IfStmt >(&stmt);
            if (if_stmt == nullptr || if_stmt->getElse() != nullptr) {
                return nullptr;
            }
            return if_stmt;
        }

        std::optional< bool > returnedBoolean(const ast::Stmt *stmt) {
            const auto *ret = llvm::dyn_cast_or_null< ast::ReturnStmt >(stmt);
            if (ret == nullptr) {
                return std::nullopt;
            }
            return ast::booleanLiteralValue(ret->getValue());
        }

        const ast::Expr *expressionOf(const ast::Stmt &stmt) {
            const auto *expr_stmt = llvm::dyn_cast< ast::ExprStmt >(&stmt);
            return expr_stmt == nullptr ? nullptr : ast::ignoreParens(expr_stmt->getExpr());
        }

        bool isUnitLiteral(const ast::Expr *expr) {
            const auto *literal = llvm::dyn_cast< ast::LiteralExpr >(ast::ignoreParens(expr));
            return literal != nullptr && literal->getLiteralKind() == ast::LiteralKind::Number
                && literal->getSpelling() == "1";
        }

        std::optional< Accumulation > matchMinMax(const ast::AssignExpr &assign) {
            const auto *acc  = ast::asSimpleName(assign.getLHS());
            const auto *call = llvm::dyn_cast< ast::CallExpr >(ast::ignoreParens(assign.getRHS()));
            if (acc == nullptr || call == nullptr || call->getNumArgs() != 2U) {
                return std::nullopt;
            }
            const auto *owner = ast::asSimpleName(call->getReceiver());
            if (owner == nullptr || owner->getName() != "Math") {
                return std::nullopt;
            }

            model::ReducerKind kind;
            if (call->getMethod() == "max") {
                kind = model::ReducerKind::Max;
            } else if (call->getMethod() == "min") {
                kind = model::ReducerKind::Min;
            } else {
                return std::nullopt;
            }

            if (ast::isIdentityReference(call->getArg(0), acc->getName())) {
                return Accumulation{ .kind = kind, .accumulator = acc, .value = call->getArg(1) };
            }
            if (ast::isIdentityReference(call->getArg(1), acc->getName())) {
                return Accumulation{ .kind = kind, .accumulator = acc, .value = call->getArg(0) };
            }
            return std::nullopt;
        }

    } // namespace

    const ast::Expr *matchGuardContinue(const ast::Stmt &stmt) {
        const auto *if_stmt = asSimpleIf(stmt);
        if (if_stmt == nullptr) {
            return nullptr;
        }
        const auto *jump = llvm::dyn_cast_or_null< ast::ContinueStmt >(singleStatement(if_stmt->getThen()));
        if (jump == nullptr || jump->hasLabel()) {
            return nullptr;
        }
        return if_stmt->getCond();
    }

    std::optional< EarlyReturn > matchEarlyReturn(const ast::Stmt &stmt, const ast::Stmt *following) {
        const auto *if_stmt = asSimpleIf(stmt);
        if (if_stmt == nullptr) {
            return std::nullopt;
        }
        auto inside = returnedBoolean(singleStatement(if_stmt->getThen()));
        if (!inside) {
            return std::nullopt;
        }
        // Without a boolean return after the loop the opposite value is implied.
        auto after = returnedBoolean(following).value_or(!*inside);

        if (*inside && !after) {
            return EarlyReturn{ .kind = model::MatchKind::Any, .condition = if_stmt->getCond() };
        }
        if (!*inside && after) {
            if (const auto *positive = ast::stripNegation(if_stmt->getCond())) {
                return EarlyReturn{ .kind = model::MatchKind::All, .condition = positive };
            }
            return EarlyReturn{ .kind = model::MatchKind::None, .condition = if_stmt->getCond() };
        }
        return std::nullopt;
    }

    std::optional< GuardedTail > matchGuardedTail(const ast::Stmt &stmt) {
        const auto *if_stmt = asSimpleIf(stmt);
        if (if_stmt == nullptr) {
            return std::nullopt;
        }
        return GuardedTail{ .condition = if_stmt->getCond(),
                            .body      = ast::flattenBody(if_stmt->getThen()) };
    }

    const ast::VarDecl *matchMapDeclaration(const ast::Stmt &stmt) {
        const auto *decl = llvm::dyn_cast< ast::DeclStmt >(&stmt);
        if (decl == nullptr || !decl->isSingleDecl() || !decl->getSingleDecl().init) {
            return nullptr;
        }
        return &decl->getSingleDecl();
    }

    const ast::Expr *matchReassignment(const ast::Stmt &stmt, llvm::StringRef current) {
        const auto *assign = llvm::dyn_cast_or_null< ast::AssignExpr >(expressionOf(stmt));
        if (assign == nullptr || assign->isCompound()
            || !ast::isIdentityReference(assign->getLHS(), current))
        {
            return nullptr;
        }
        return assign->getRHS();
    }

    std::optional< CollectCall > matchCollect(const ast::Stmt &stmt) {
        const auto *call = llvm::dyn_cast_or_null< ast::CallExpr >(expressionOf(stmt));
        if (call == nullptr || call->getMethod() != "add" || call->getNumArgs() != 1U) {
            return std::nullopt;
        }
        const auto *target = ast::asSimpleName(call->getReceiver());
        if (target == nullptr) {
            return std::nullopt;
        }
        return CollectCall{ .target = target, .value = call->getArg(0) };
    }

    std::optional< Accumulation > matchAccumulation(const ast::Stmt &stmt) {
        const auto *expr = expressionOf(stmt);
        if (expr == nullptr) {
            return std::nullopt;
        }

        if (const auto *unary = llvm::dyn_cast< ast::UnaryExpr >(expr)) {
            const auto *acc = ast::asSimpleName(unary->getOperand());
            if (acc == nullptr || !unary->isIncrementOrDecrement()) {
                return std::nullopt;
            }
            return Accumulation{ .kind        = unary->isIncrement() ? model::ReducerKind::Increment
                                                                     : model::ReducerKind::Decrement,
                                 .accumulator = acc,
                                 .value       = nullptr };
        }

        const auto *assign = llvm::dyn_cast< ast::AssignExpr >(expr);
        if (assign == nullptr) {
            return std::nullopt;
        }
        if (!assign->isCompound()) {
            return matchMinMax(*assign);
        }

        const auto *acc = ast::asSimpleName(assign->getLHS());
        if (acc == nullptr) {
            return std::nullopt;
        }
        const auto &op = assign->getOp();
        if (op == "+=") {
            if (model::categorize(acc->getBinding().type) == model::NumericCategory::String) {
                return Accumulation{ .kind        = model::ReducerKind::StringConcat,
                                     .accumulator = acc,
                                     .value       = assign->getRHS() };
            }
            if (isUnitLiteral(assign->getRHS())) {
                return Accumulation{ .kind        = model::ReducerKind::Increment,
                                     .accumulator = acc,
                                     .value       = nullptr };
            }
            return Accumulation{ .kind        = model::ReducerKind::Sum,
                                 .accumulator = acc,
                                 .value       = assign->getRHS() };
        }
        if (op == "-=") {
            return Accumulation{ .kind        = model::ReducerKind::Decrement,
                                 .accumulator = acc,
                                 .value       = isUnitLiteral(assign->getRHS()) ? nullptr : assign->getRHS() };
        }
        if (op == "*=") {
            return Accumulation{ .kind        = model::ReducerKind::Product,
                                 .accumulator = acc,
                                 .value       = assign->getRHS() };
        }
        return std::nullopt;
    }

} // namespace pipelift::analysis::patterns
