/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <pipelift/AST/Syntax.hpp>

// Node factories used by the JSON reader, the loop renderers and the tests.
namespace pipelift::ast::build {

    template< typename... Ts >
    std::vector< ExprPtr > exprs(Ts &&...items) {
        std::vector< ExprPtr > result;
        result.reserve(sizeof...(items));
        (result.push_back(std::forward< Ts >(items)), ...);
        return result;
    }

    template< typename... Ts >
    std::vector< StmtPtr > stmts(Ts &&...items) {
        std::vector< StmtPtr > result;
        result.reserve(sizeof...(items));
        (result.push_back(std::forward< Ts >(items)), ...);
        return result;
    }

    Binding local(std::string type, bool non_null = false);
    Binding param(std::string type, bool non_null = false);
    Binding field(std::string type);

    // Name typed after its binding.
    ExprPtr name(std::string identifier, Binding binding = {});

    ExprPtr intLit(int64_t value);
    ExprPtr boolLit(bool value);
    ExprPtr strLit(const std::string &text); // adds the quotes
    ExprPtr nullLit();
    ExprPtr literal(LiteralKind kind, std::string spelling, std::string type = {});

    ExprPtr paren(ExprPtr sub);
    ExprPtr unary(UnaryOp op, ExprPtr operand);
    ExprPtr logicalNot(ExprPtr operand);
    ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs, std::string type = {});
    ExprPtr assign(std::string op, ExprPtr lhs, ExprPtr rhs);
    ExprPtr call(ExprPtr receiver, std::string method, std::vector< ExprPtr > args = {});
    ExprPtr fieldAccess(ExprPtr base, std::string member);
    ExprPtr arrayAccess(ExprPtr base, ExprPtr index);
    ExprPtr newObject(std::string class_type, std::vector< ExprPtr > args = {});
    ExprPtr cast(std::string type, ExprPtr sub);
    ExprPtr conditional(ExprPtr cond, ExprPtr then_expr, ExprPtr else_expr);
    ExprPtr thisExpr();
    ExprPtr lambda(std::vector< std::string > params, ExprPtr body);
    ExprPtr lambda(std::vector< std::string > params, StmtPtr block_body);
    ExprPtr methodRef(std::string qualifier, std::string method);

    // Sets the static type on an expression and hands it back.
    ExprPtr typed(ExprPtr expr, std::string type);

    VarDecl var(std::string type, std::string identifier, ExprPtr init = nullptr);
    VarDecl finalVar(std::string type, std::string identifier, ExprPtr init = nullptr);

    StmtPtr block(std::vector< StmtPtr > body = {});
    StmtPtr exprStmt(ExprPtr expr);
    StmtPtr decl(VarDecl declaration);
    StmtPtr decl(std::string type, std::string identifier, ExprPtr init = nullptr);
    StmtPtr ifStmt(ExprPtr cond, StmtPtr then_stmt, StmtPtr else_stmt = nullptr);
    StmtPtr returnStmt(ExprPtr value = nullptr);
    StmtPtr breakStmt(std::string label = {});
    StmtPtr continueStmt(std::string label = {});
    StmtPtr throwStmt(ExprPtr value);
    StmtPtr forEach(VarDecl element, ExprPtr iterable, StmtPtr body);
    StmtPtr forStmt(
        std::vector< StmtPtr > init, ExprPtr cond, std::vector< ExprPtr > updates, StmtPtr body
    );
    StmtPtr whileStmt(ExprPtr cond, StmtPtr body);
    StmtPtr doStmt(StmtPtr body, ExprPtr cond);
    StmtPtr tryStmt(StmtPtr body, std::vector< CatchClause > catches, StmtPtr finally_body = nullptr);
    StmtPtr switchStmt(ExprPtr selector, std::vector< SwitchCase > cases);
    StmtPtr synchronizedStmt(ExprPtr lock, StmtPtr body);
    StmtPtr labeled(std::string label, StmtPtr body);
    StmtPtr empty();

    // Wraps statements into a method body of a single-type compilation unit.
    MethodDecl method(
        std::string identifier, std::string return_type, std::vector< VarDecl > params,
        std::vector< StmtPtr > body
    );

} // namespace pipelift::ast::build
