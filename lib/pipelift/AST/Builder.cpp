/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/Builder.hpp>

namespace pipelift::ast::build {

    Binding local(std::string type, bool non_null) {
        return Binding{ .kind     = BindingKind::Local,
                        .type     = std::move(type),
                        .is_final = false,
                        .non_null = non_null };
    }

    Binding param(std::string type, bool non_null) {
        return Binding{ .kind     = BindingKind::Parameter,
                        .type     = std::move(type),
                        .is_final = false,
                        .non_null = non_null };
    }

    Binding field(std::string type) {
        return Binding{ .kind = BindingKind::Field, .type = std::move(type) };
    }

    ExprPtr name(std::string identifier, Binding binding) {
        auto type = binding.type;
        auto expr = std::make_unique< NameExpr >(std::move(identifier), std::move(binding));
        expr->setType(std::move(type));
        return expr;
    }

    ExprPtr literal(LiteralKind kind, std::string spelling, std::string type) {
        auto expr = std::make_unique< LiteralExpr >(kind, std::move(spelling));
        expr->setType(std::move(type));
        return expr;
    }

    ExprPtr intLit(int64_t value) {
        return literal(LiteralKind::Number, std::to_string(value), "int");
    }

    ExprPtr boolLit(bool value) {
        return literal(LiteralKind::Boolean, value ? "true" : "false", "boolean");
    }

    ExprPtr strLit(const std::string &text) {
        return literal(LiteralKind::String, "\"" + text + "\"", "String");
    }

    ExprPtr nullLit() { return literal(LiteralKind::Null, "null"); }

    ExprPtr paren(ExprPtr sub) {
        auto type = sub->type();
        return typed(std::make_unique< ParenExpr >(std::move(sub)), std::move(type));
    }

    ExprPtr unary(UnaryOp op, ExprPtr operand) {
        auto type = op == UnaryOp::Not ? std::string("boolean") : operand->type();
        return typed(std::make_unique< UnaryExpr >(op, std::move(operand)), std::move(type));
    }

    ExprPtr logicalNot(ExprPtr operand) { return unary(UnaryOp::Not, std::move(operand)); }

    ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs, std::string type) {
        return typed(
            std::make_unique< BinaryExpr >(std::move(op), std::move(lhs), std::move(rhs)),
            std::move(type)
        );
    }

    ExprPtr assign(std::string op, ExprPtr lhs, ExprPtr rhs) {
        auto type = lhs->type();
        return typed(
            std::make_unique< AssignExpr >(std::move(op), std::move(lhs), std::move(rhs)),
            std::move(type)
        );
    }

    ExprPtr call(ExprPtr receiver, std::string method, std::vector< ExprPtr > args) {
        return std::make_unique< CallExpr >(
            std::move(receiver), std::move(method), std::move(args)
        );
    }

    ExprPtr fieldAccess(ExprPtr base, std::string member) {
        return std::make_unique< FieldAccessExpr >(std::move(base), std::move(member));
    }

    ExprPtr arrayAccess(ExprPtr base, ExprPtr index) {
        return std::make_unique< ArrayAccessExpr >(std::move(base), std::move(index));
    }

    ExprPtr newObject(std::string class_type, std::vector< ExprPtr > args) {
        auto type = class_type;
        return typed(
            std::make_unique< NewExpr >(std::move(class_type), std::move(args)), std::move(type)
        );
    }

    ExprPtr cast(std::string type, ExprPtr sub) {
        auto target = type;
        return typed(std::make_unique< CastExpr >(std::move(type), std::move(sub)), target);
    }

    ExprPtr conditional(ExprPtr cond, ExprPtr then_expr, ExprPtr else_expr) {
        auto type = then_expr->type();
        return typed(
            std::make_unique< ConditionalExpr >(
                std::move(cond), std::move(then_expr), std::move(else_expr)
            ),
            std::move(type)
        );
    }

    ExprPtr thisExpr() { return std::make_unique< ThisExpr >(); }

    ExprPtr lambda(std::vector< std::string > params, ExprPtr body) {
        return std::make_unique< LambdaExpr >(std::move(params), std::move(body));
    }

    ExprPtr lambda(std::vector< std::string > params, StmtPtr block_body) {
        return std::make_unique< LambdaExpr >(std::move(params), std::move(block_body));
    }

    ExprPtr methodRef(std::string qualifier, std::string method) {
        return std::make_unique< MethodRefExpr >(std::move(qualifier), std::move(method));
    }

    ExprPtr typed(ExprPtr expr, std::string type) {
        expr->setType(std::move(type));
        return expr;
    }

    VarDecl var(std::string type, std::string identifier, ExprPtr init) {
        return VarDecl{ .name     = std::move(identifier),
                        .type     = std::move(type),
                        .is_final = false,
                        .non_null = false,
                        .init     = std::move(init) };
    }

    VarDecl finalVar(std::string type, std::string identifier, ExprPtr init) {
        auto declaration     = var(std::move(type), std::move(identifier), std::move(init));
        declaration.is_final = true;
        return declaration;
    }

    StmtPtr block(std::vector< StmtPtr > body) {
        return std::make_unique< BlockStmt >(std::move(body));
    }

    StmtPtr exprStmt(ExprPtr expr) { return std::make_unique< ExprStmt >(std::move(expr)); }

    StmtPtr decl(VarDecl declaration) {
        std::vector< VarDecl > vars;
        vars.push_back(std::move(declaration));
        return std::make_unique< DeclStmt >(std::move(vars));
    }

    StmtPtr decl(std::string type, std::string identifier, ExprPtr init) {
        return decl(var(std::move(type), std::move(identifier), std::move(init)));
    }

    StmtPtr ifStmt(ExprPtr cond, StmtPtr then_stmt, StmtPtr else_stmt) {
        return std::make_unique< IfStmt >(
            std::move(cond), std::move(then_stmt), std::move(else_stmt)
        );
    }

    StmtPtr returnStmt(ExprPtr value) { return std::make_unique< ReturnStmt >(std::move(value)); }

    StmtPtr breakStmt(std::string label) {
        return std::make_unique< BreakStmt >(std::move(label));
    }

    StmtPtr continueStmt(std::string label) {
        return std::make_unique< ContinueStmt >(std::move(label));
    }

    StmtPtr throwStmt(ExprPtr value) { return std::make_unique< ThrowStmt >(std::move(value)); }

    StmtPtr forEach(VarDecl element, ExprPtr iterable, StmtPtr body) {
        return std::make_unique< ForEachStmt >(
            std::move(element), std::move(iterable), std::move(body)
        );
    }

    StmtPtr forStmt(
        std::vector< StmtPtr > init, ExprPtr cond, std::vector< ExprPtr > updates, StmtPtr body
    ) {
        return std::make_unique< ForStmt >(
            std::move(init), std::move(cond), std::move(updates), std::move(body)
        );
    }

    StmtPtr whileStmt(ExprPtr cond, StmtPtr body) {
        return std::make_unique< WhileStmt >(std::move(cond), std::move(body));
    }

    StmtPtr doStmt(StmtPtr body, ExprPtr cond) {
        return std::make_unique< DoStmt >(std::move(body), std::move(cond));
    }

    StmtPtr tryStmt(StmtPtr body, std::vector< CatchClause > catches, StmtPtr finally_body) {
        return std::make_unique< TryStmt >(
            std::move(body), std::move(catches), std::move(finally_body)
        );
    }

    StmtPtr switchStmt(ExprPtr selector, std::vector< SwitchCase > cases) {
        return std::make_unique< SwitchStmt >(std::move(selector), std::move(cases));
    }

    StmtPtr synchronizedStmt(ExprPtr lock, StmtPtr body) {
        return std::make_unique< SynchronizedStmt >(std::move(lock), std::move(body));
    }

    StmtPtr labeled(std::string label, StmtPtr body) {
        return std::make_unique< LabeledStmt >(std::move(label), std::move(body));
    }

    StmtPtr empty() { return std::make_unique< EmptyStmt >(); }

    MethodDecl method(
        std::string identifier, std::string return_type, std::vector< VarDecl > params,
        std::vector< StmtPtr > body
    ) {
        return MethodDecl{ .name        = std::move(identifier),
                           .return_type = std::move(return_type),
                           .params      = std::move(params),
                           .body        = std::make_unique< BlockStmt >(std::move(body)) };
    }

} // namespace pipelift::ast::build
