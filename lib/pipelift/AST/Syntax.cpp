/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::ast {

    namespace {

        std::vector< ExprPtr > cloneAll(const std::vector< ExprPtr > &exprs) {
            std::vector< ExprPtr > result;
            result.reserve(exprs.size());
            for (const auto &expr : exprs) {
                result.push_back(expr->clone());
            }
            return result;
        }

        std::vector< StmtPtr > cloneAll(const std::vector< StmtPtr > &stmts) {
            std::vector< StmtPtr > result;
            result.reserve(stmts.size());
            for (const auto &stmt : stmts) {
                result.push_back(stmt->clone());
            }
            return result;
        }

    } // namespace

    ExprPtr CallExpr::clone() const {
        return finishClone(std::make_unique< CallExpr >(
            receiver ? receiver->clone() : nullptr, method, cloneAll(args)
        ));
    }

    ExprPtr NewExpr::clone() const {
        return finishClone(std::make_unique< NewExpr >(class_type, cloneAll(args)));
    }

    LambdaExpr::LambdaExpr(std::vector< std::string > params, ExprPtr expr_body)
        : Expr(Kind::Lambda), params(std::move(params)), expr_body(std::move(expr_body)) {}

    LambdaExpr::LambdaExpr(std::vector< std::string > params, StmtPtr block_body)
        : Expr(Kind::Lambda), params(std::move(params)), block_body(std::move(block_body)) {}

    LambdaExpr::~LambdaExpr() = default;

    ExprPtr LambdaExpr::clone() const {
        if (expr_body) {
            return finishClone(std::make_unique< LambdaExpr >(params, expr_body->clone()));
        }
        return finishClone(std::make_unique< LambdaExpr >(params, block_body->clone()));
    }

    StmtPtr BlockStmt::clone() const {
        return finishClone(std::make_unique< BlockStmt >(cloneAll(stmts)));
    }

    StmtPtr DeclStmt::clone() const {
        std::vector< VarDecl > copies;
        copies.reserve(vars.size());
        for (const auto &var : vars) {
            copies.push_back(var.clone());
        }
        return finishClone(std::make_unique< DeclStmt >(std::move(copies)));
    }

    StmtPtr ForStmt::clone() const {
        return finishClone(std::make_unique< ForStmt >(
            cloneAll(init), cond ? cond->clone() : nullptr, cloneAll(updates), body->clone()
        ));
    }

    StmtPtr TryStmt::clone() const {
        std::vector< CatchClause > clauses;
        clauses.reserve(catches.size());
        for (const auto &clause : catches) {
            clauses.push_back(CatchClause{ .param = clause.param.clone(),
                                           .body  = clause.body->clone() });
        }
        return finishClone(std::make_unique< TryStmt >(
            body->clone(), std::move(clauses), finally_body ? finally_body->clone() : nullptr
        ));
    }

    StmtPtr SwitchStmt::clone() const {
        std::vector< SwitchCase > copies;
        copies.reserve(cases.size());
        for (const auto &group : cases) {
            copies.push_back(SwitchCase{ .labels = cloneAll(group.labels),
                                         .body   = cloneAll(group.body) });
        }
        return finishClone(std::make_unique< SwitchStmt >(selector->clone(), std::move(copies)));
    }

} // namespace pipelift::ast
