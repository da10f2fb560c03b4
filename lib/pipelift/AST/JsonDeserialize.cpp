/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/JsonDeserialize.hpp>

#include <optional>

#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/FormatVariadic.h>

#include <pipelift/AST/Builder.hpp>

namespace pipelift::ast {

    namespace {

        auto error(const llvm::Twine &msg) -> llvm::Error {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), msg);
        }

        std::string get_string(const json_obj &obj, llvm::StringRef key) {
            if (auto value = obj.getString(key)) {
                return value->str();
            }
            return {};
        }

        bool get_bool(const json_obj &obj, llvm::StringRef key) {
            if (auto value = obj.getBoolean(key)) {
                return *value;
            }
            return false;
        }

        std::optional< BindingKind > binding_kind(llvm::StringRef kind) {
            return llvm::StringSwitch< std::optional< BindingKind > >(kind)
                .Case("local", BindingKind::Local)
                .Case("parameter", BindingKind::Parameter)
                .Case("field", BindingKind::Field)
                .Case("unresolved", BindingKind::Unresolved)
                .Default(std::nullopt);
        }

        std::optional< LiteralKind > literal_kind(llvm::StringRef kind) {
            return llvm::StringSwitch< std::optional< LiteralKind > >(kind)
                .Case("number", LiteralKind::Number)
                .Case("string", LiteralKind::String)
                .Case("char", LiteralKind::Char)
                .Case("boolean", LiteralKind::Boolean)
                .Case("null", LiteralKind::Null)
                .Default(std::nullopt);
        }

        std::optional< UnaryOp > unary_op(llvm::StringRef op, bool postfix) {
            if (op == "++") {
                return postfix ? UnaryOp::PostInc : UnaryOp::PreInc;
            }
            if (op == "--") {
                return postfix ? UnaryOp::PostDec : UnaryOp::PreDec;
            }
            return llvm::StringSwitch< std::optional< UnaryOp > >(op)
                .Case("!", UnaryOp::Not)
                .Case("-", UnaryOp::Minus)
                .Case("+", UnaryOp::Plus)
                .Case("~", UnaryOp::BitNot)
                .Default(std::nullopt);
        }

    } // namespace

    expected< std::unique_ptr< CompilationUnit > > JsonReader::read_unit(const json_val &root) {
        const auto *root_obj = root.getAsObject();
        if (root_obj == nullptr) {
            return error("compilation unit must be a json object");
        }

        auto unit  = std::make_unique< CompilationUnit >();
        unit->name = get_string(*root_obj, "name");

        const auto *types = root_obj->getArray("types");
        if (types == nullptr) {
            return error("missing json array for compilation unit types");
        }

        for (const auto &type_val : *types) {
            const auto *type_obj = type_val.getAsObject();
            if (type_obj == nullptr) {
                return error("invalid json value for type declaration");
            }
            auto type = read_type(*type_obj);
            if (!type) {
                return type.takeError();
            }
            unit->types.push_back(std::move(*type));
        }

        return std::move(unit);
    }

    expected< TypeDecl > JsonReader::read_type(const json_obj &type_obj) {
        TypeDecl type;
        type.name = get_string(type_obj, "name");

        scopes.emplace_back();
        if (const auto *fields = type_obj.getArray("fields")) {
            for (const auto &field_val : *fields) {
                const auto *field_obj = field_val.getAsObject();
                if (field_obj == nullptr) {
                    return error("invalid json value for field of " + type.name);
                }
                auto field = read_var(*field_obj, BindingKind::Field);
                if (!field) {
                    return field.takeError();
                }
                declare(*field, BindingKind::Field);
                type.fields.push_back(std::move(*field));
            }
        }

        if (const auto *methods = type_obj.getArray("methods")) {
            for (const auto &method_val : *methods) {
                const auto *method_obj = method_val.getAsObject();
                if (method_obj == nullptr) {
                    return error("invalid json value for method of " + type.name);
                }
                auto method = read_method(*method_obj);
                if (!method) {
                    return method.takeError();
                }
                type.methods.push_back(std::move(*method));
            }
        }
        scopes.pop_back();

        return std::move(type);
    }

    expected< MethodDecl > JsonReader::read_method(const json_obj &method_obj) {
        MethodDecl method;
        method.name        = get_string(method_obj, "name");
        method.return_type = get_string(method_obj, "returnType");

        scopes.emplace_back();
        if (const auto *params = method_obj.getArray("params")) {
            for (const auto &param_val : *params) {
                const auto *param_obj = param_val.getAsObject();
                if (param_obj == nullptr) {
                    return error("invalid json value for parameter of " + method.name);
                }
                auto param = read_var(*param_obj, BindingKind::Parameter);
                if (!param) {
                    return param.takeError();
                }
                declare(*param, BindingKind::Parameter);
                method.params.push_back(std::move(*param));
            }
        }

        if (const auto *body_val = method_obj.get("body")) {
            auto body = read_stmt(*body_val);
            if (!body) {
                return body.takeError();
            }
            if (!llvm::isa< BlockStmt >(body->get())) {
                return error("method body of " + method.name + " must be a block");
            }
            method.body.reset(llvm::cast< BlockStmt >(body->release()));
        }
        scopes.pop_back();

        return std::move(method);
    }

    expected< VarDecl > JsonReader::read_var(const json_obj &var_obj, BindingKind kind) {
        auto name = get_string(var_obj, "name");
        if (name.empty()) {
            return error("variable declaration without a name");
        }

        VarDecl var{ .name     = std::move(name),
                     .type     = get_string(var_obj, "type"),
                     .is_final = get_bool(var_obj, "final"),
                     .non_null = get_bool(var_obj, "nonNull"),
                     .init     = nullptr };

        if (kind == BindingKind::Field) {
            return std::move(var);
        }

        auto init = read_optional_expr(var_obj, "init");
        if (!init) {
            return init.takeError();
        }
        var.init = std::move(*init);
        return std::move(var);
    }

    void JsonReader::declare(const VarDecl &var, BindingKind kind) {
        if (scopes.empty()) {
            scopes.emplace_back();
        }
        scopes.back()[var.name] = Binding{ .kind     = kind,
                                           .type     = var.type,
                                           .is_final = var.is_final,
                                           .non_null = var.non_null };
    }

    Binding JsonReader::resolve(const std::string &name) const {
        for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope) {
            auto iter = scope->find(name);
            if (iter != scope->end()) {
                return iter->second;
            }
        }
        return Binding{};
    }

    expected< StmtPtr > JsonReader::read_optional_stmt(const json_obj &obj, llvm::StringRef key) {
        const auto *value = obj.get(key);
        if (value == nullptr || value->kind() == json_val::Null) {
            return StmtPtr{};
        }
        return read_stmt(*value);
    }

    expected< ExprPtr > JsonReader::read_optional_expr(const json_obj &obj, llvm::StringRef key) {
        const auto *value = obj.get(key);
        if (value == nullptr || value->kind() == json_val::Null) {
            return ExprPtr{};
        }
        return read_expr(*value);
    }

    expected< std::vector< StmtPtr > > JsonReader::read_stmts(const json_arr *array) {
        std::vector< StmtPtr > result;
        if (array == nullptr) {
            return std::move(result);
        }
        for (const auto &value : *array) {
            auto stmt = read_stmt(value);
            if (!stmt) {
                return stmt.takeError();
            }
            result.push_back(std::move(*stmt));
        }
        return std::move(result);
    }

    expected< std::vector< ExprPtr > > JsonReader::read_exprs(const json_arr *array) {
        std::vector< ExprPtr > result;
        if (array == nullptr) {
            return std::move(result);
        }
        for (const auto &value : *array) {
            auto expr = read_expr(value);
            if (!expr) {
                return expr.takeError();
            }
            result.push_back(std::move(*expr));
        }
        return std::move(result);
    }

    expected< StmtPtr > JsonReader::read_stmt(const json_val &value) {
        const auto *obj = value.getAsObject();
        if (obj == nullptr) {
            return error("statement must be a json object");
        }

        auto kind = get_string(*obj, "kind");
        StmtPtr stmt;

        if (kind == "block") {
            scopes.emplace_back();
            auto body = read_stmts(obj->getArray("stmts"));
            scopes.pop_back();
            if (!body) {
                return body.takeError();
            }
            stmt = build::block(std::move(*body));
        } else if (kind == "expr") {
            auto expr = read_optional_expr(*obj, "expr");
            if (!expr) {
                return expr.takeError();
            }
            if (!*expr) {
                return error("expression statement without expression");
            }
            stmt = build::exprStmt(std::move(*expr));
        } else if (kind == "decl") {
            const auto *vars = obj->getArray("vars");
            if (vars == nullptr) {
                return error("missing json array for declaration vars");
            }
            std::vector< VarDecl > decls;
            for (const auto &var_val : *vars) {
                const auto *var_obj = var_val.getAsObject();
                if (var_obj == nullptr) {
                    return error("invalid json value for declaration fragment");
                }
                auto var = read_var(*var_obj, BindingKind::Local);
                if (!var) {
                    return var.takeError();
                }
                // Fragments inherit the statement's type and modifiers.
                if (var->type.empty()) {
                    var->type = get_string(*obj, "type");
                }
                var->is_final = var->is_final || get_bool(*obj, "final");
                declare(*var, BindingKind::Local);
                decls.push_back(std::move(*var));
            }
            stmt = std::make_unique< DeclStmt >(std::move(decls));
        } else if (kind == "if") {
            auto cond = read_optional_expr(*obj, "cond");
            if (!cond) {
                return cond.takeError();
            }
            auto then_stmt = read_optional_stmt(*obj, "then");
            if (!then_stmt) {
                return then_stmt.takeError();
            }
            auto else_stmt = read_optional_stmt(*obj, "else");
            if (!else_stmt) {
                return else_stmt.takeError();
            }
            if (!*cond || !*then_stmt) {
                return error("if statement requires 'cond' and 'then'");
            }
            stmt = build::ifStmt(std::move(*cond), std::move(*then_stmt), std::move(*else_stmt));
        } else if (kind == "return") {
            auto ret = read_optional_expr(*obj, "value");
            if (!ret) {
                return ret.takeError();
            }
            stmt = build::returnStmt(std::move(*ret));
        } else if (kind == "break") {
            stmt = build::breakStmt(get_string(*obj, "label"));
        } else if (kind == "continue") {
            stmt = build::continueStmt(get_string(*obj, "label"));
        } else if (kind == "throw") {
            auto thrown = read_optional_expr(*obj, "value");
            if (!thrown) {
                return thrown.takeError();
            }
            if (!*thrown) {
                return error("throw statement without value");
            }
            stmt = build::throwStmt(std::move(*thrown));
        } else if (kind == "foreach") {
            const auto *var_obj = obj->getObject("var");
            if (var_obj == nullptr) {
                return error("missing json object for foreach var");
            }
            auto iterable = read_optional_expr(*obj, "iterable");
            if (!iterable) {
                return iterable.takeError();
            }
            auto var = read_var(*var_obj, BindingKind::Local);
            if (!var) {
                return var.takeError();
            }
            scopes.emplace_back();
            declare(*var, BindingKind::Local);
            auto body = read_optional_stmt(*obj, "body");
            scopes.pop_back();
            if (!body) {
                return body.takeError();
            }
            if (!*iterable || !*body) {
                return error("foreach statement requires 'iterable' and 'body'");
            }
            stmt = build::forEach(std::move(*var), std::move(*iterable), std::move(*body));
        } else if (kind == "for") {
            scopes.emplace_back();
            auto init = read_stmts(obj->getArray("init"));
            if (!init) {
                scopes.pop_back();
                return init.takeError();
            }
            auto cond = read_optional_expr(*obj, "cond");
            if (!cond) {
                scopes.pop_back();
                return cond.takeError();
            }
            auto updates = read_exprs(obj->getArray("update"));
            if (!updates) {
                scopes.pop_back();
                return updates.takeError();
            }
            auto body = read_optional_stmt(*obj, "body");
            scopes.pop_back();
            if (!body) {
                return body.takeError();
            }
            if (!*body) {
                return error("for statement requires 'body'");
            }
            stmt = build::forStmt(
                std::move(*init), std::move(*cond), std::move(*updates), std::move(*body)
            );
        } else if (kind == "while" || kind == "do") {
            auto cond = read_optional_expr(*obj, "cond");
            if (!cond) {
                return cond.takeError();
            }
            auto body = read_optional_stmt(*obj, "body");
            if (!body) {
                return body.takeError();
            }
            if (!*cond || !*body) {
                return error(kind + " statement requires 'cond' and 'body'");
            }
            stmt = kind == "while" ? build::whileStmt(std::move(*cond), std::move(*body))
                                   : build::doStmt(std::move(*body), std::move(*cond));
        } else if (kind == "try") {
            auto body = read_optional_stmt(*obj, "body");
            if (!body) {
                return body.takeError();
            }
            std::vector< CatchClause > catches;
            if (const auto *clauses = obj->getArray("catches")) {
                for (const auto &clause_val : *clauses) {
                    const auto *clause_obj = clause_val.getAsObject();
                    const auto *param_obj =
                        clause_obj != nullptr ? clause_obj->getObject("param") : nullptr;
                    if (param_obj == nullptr) {
                        return error("catch clause requires a 'param' object");
                    }
                    auto param = read_var(*param_obj, BindingKind::Local);
                    if (!param) {
                        return param.takeError();
                    }
                    scopes.emplace_back();
                    declare(*param, BindingKind::Local);
                    auto handler = read_optional_stmt(*clause_obj, "body");
                    scopes.pop_back();
                    if (!handler) {
                        return handler.takeError();
                    }
                    if (!*handler) {
                        return error("catch clause without body");
                    }
                    catches.push_back(CatchClause{ .param = std::move(*param),
                                                   .body  = std::move(*handler) });
                }
            }
            auto finally_body = read_optional_stmt(*obj, "finally");
            if (!finally_body) {
                return finally_body.takeError();
            }
            if (!*body) {
                return error("try statement requires 'body'");
            }
            stmt = build::tryStmt(
                std::move(*body), std::move(catches), std::move(*finally_body)
            );
        } else if (kind == "switch") {
            auto selector = read_optional_expr(*obj, "selector");
            if (!selector) {
                return selector.takeError();
            }
            if (!*selector) {
                return error("switch statement requires 'selector'");
            }
            std::vector< SwitchCase > cases;
            if (const auto *groups = obj->getArray("cases")) {
                for (const auto &group_val : *groups) {
                    const auto *group_obj = group_val.getAsObject();
                    if (group_obj == nullptr) {
                        return error("invalid json value for switch case");
                    }
                    auto labels = read_exprs(group_obj->getArray("labels"));
                    if (!labels) {
                        return labels.takeError();
                    }
                    auto body = read_stmts(group_obj->getArray("body"));
                    if (!body) {
                        return body.takeError();
                    }
                    cases.push_back(SwitchCase{ .labels = std::move(*labels),
                                                .body   = std::move(*body) });
                }
            }
            stmt = build::switchStmt(std::move(*selector), std::move(cases));
        } else if (kind == "synchronized") {
            auto lock = read_optional_expr(*obj, "lock");
            if (!lock) {
                return lock.takeError();
            }
            auto body = read_optional_stmt(*obj, "body");
            if (!body) {
                return body.takeError();
            }
            if (!*lock || !*body) {
                return error("synchronized statement requires 'lock' and 'body'");
            }
            stmt = build::synchronizedStmt(std::move(*lock), std::move(*body));
        } else if (kind == "labeled") {
            auto body = read_optional_stmt(*obj, "body");
            if (!body) {
                return body.takeError();
            }
            if (!*body) {
                return error("labeled statement without body");
            }
            stmt = build::labeled(get_string(*obj, "label"), std::move(*body));
        } else if (kind == "empty") {
            stmt = build::empty();
        } else {
            return error(llvm::formatv("unknown statement kind '{0}'", kind).str());
        }

        stmt->setLocation(get_string(*obj, "loc"));
        return std::move(stmt);
    }

    expected< ExprPtr > JsonReader::read_expr(const json_val &value) {
        const auto *obj = value.getAsObject();
        if (obj == nullptr) {
            return error("expression must be a json object");
        }

        auto kind = get_string(*obj, "kind");
        auto type = get_string(*obj, "type");
        ExprPtr expr;

        // Reads a required operand, returning the error from the enclosing function.
        auto operand = [&](llvm::StringRef key) -> expected< ExprPtr > {
            auto sub = read_optional_expr(*obj, key);
            if (!sub) {
                return sub.takeError();
            }
            if (!*sub) {
                return error(llvm::formatv("{0} expression requires '{1}'", kind, key).str());
            }
            return std::move(*sub);
        };

        if (kind == "name") {
            auto name    = get_string(*obj, "name");
            auto binding = resolve(name);
            if (const auto *binding_obj = obj->getObject("binding")) {
                auto resolved = binding_kind(get_string(*binding_obj, "kind"));
                if (!resolved) {
                    return error("unknown binding kind for name '" + name + "'");
                }
                binding = Binding{ .kind     = *resolved,
                                   .type     = get_string(*binding_obj, "type"),
                                   .is_final = get_bool(*binding_obj, "final"),
                                   .non_null = get_bool(*binding_obj, "nonNull") };
            }
            expr = build::name(std::move(name), std::move(binding));
        } else if (kind == "literal") {
            auto literal = literal_kind(get_string(*obj, "literal"));
            if (!literal) {
                return error("unknown literal kind");
            }
            auto spelling = get_string(*obj, "value");
            if (*literal == LiteralKind::String && !llvm::StringRef(spelling).startswith("\"")) {
                spelling = "\"" + spelling + "\"";
            }
            expr = build::literal(*literal, std::move(spelling));
        } else if (kind == "paren") {
            auto sub = operand("expr");
            if (!sub) {
                return sub.takeError();
            }
            expr = build::paren(std::move(*sub));
        } else if (kind == "unary") {
            auto op = unary_op(get_string(*obj, "op"), get_bool(*obj, "postfix"));
            if (!op) {
                return error("unknown unary operator '" + get_string(*obj, "op") + "'");
            }
            auto sub = operand("operand");
            if (!sub) {
                return sub.takeError();
            }
            expr = build::unary(*op, std::move(*sub));
        } else if (kind == "binary" || kind == "assign") {
            auto lhs = operand("lhs");
            if (!lhs) {
                return lhs.takeError();
            }
            auto rhs = operand("rhs");
            if (!rhs) {
                return rhs.takeError();
            }
            auto op = get_string(*obj, "op");
            if (op.empty()) {
                return error(kind + " expression without operator");
            }
            expr = kind == "binary" ? build::binary(op, std::move(*lhs), std::move(*rhs))
                                    : build::assign(op, std::move(*lhs), std::move(*rhs));
        } else if (kind == "call") {
            auto receiver = read_optional_expr(*obj, "receiver");
            if (!receiver) {
                return receiver.takeError();
            }
            auto args = read_exprs(obj->getArray("args"));
            if (!args) {
                return args.takeError();
            }
            expr = build::call(std::move(*receiver), get_string(*obj, "method"), std::move(*args));
        } else if (kind == "field") {
            auto base = operand("base");
            if (!base) {
                return base.takeError();
            }
            expr = build::fieldAccess(std::move(*base), get_string(*obj, "name"));
        } else if (kind == "index") {
            auto base = operand("base");
            if (!base) {
                return base.takeError();
            }
            auto index = operand("index");
            if (!index) {
                return index.takeError();
            }
            expr = build::arrayAccess(std::move(*base), std::move(*index));
        } else if (kind == "new") {
            auto args = read_exprs(obj->getArray("args"));
            if (!args) {
                return args.takeError();
            }
            expr = build::newObject(get_string(*obj, "class"), std::move(*args));
        } else if (kind == "cast") {
            auto sub = operand("expr");
            if (!sub) {
                return sub.takeError();
            }
            expr = build::cast(get_string(*obj, "target"), std::move(*sub));
        } else if (kind == "conditional") {
            auto cond = operand("cond");
            if (!cond) {
                return cond.takeError();
            }
            auto then_expr = operand("then");
            if (!then_expr) {
                return then_expr.takeError();
            }
            auto else_expr = operand("else");
            if (!else_expr) {
                return else_expr.takeError();
            }
            expr = build::conditional(
                std::move(*cond), std::move(*then_expr), std::move(*else_expr)
            );
        } else if (kind == "this") {
            expr = build::thisExpr();
        } else if (kind == "lambda") {
            std::vector< std::string > params;
            scopes.emplace_back();
            if (const auto *param_arr = obj->getArray("params")) {
                for (const auto &param : *param_arr) {
                    if (auto param_name = param.getAsString()) {
                        params.push_back(param_name->str());
                        scopes.back()[params.back()] = Binding{ .kind = BindingKind::Local };
                    }
                }
            }
            const auto *body = obj->get("body");
            if (body == nullptr || body->getAsObject() == nullptr) {
                scopes.pop_back();
                return error("lambda expression requires 'body'");
            }
            // A block body is a statement; anything else is an expression body.
            if (get_string(*body->getAsObject(), "kind") == "block") {
                auto block = read_stmt(*body);
                scopes.pop_back();
                if (!block) {
                    return block.takeError();
                }
                expr = build::lambda(std::move(params), std::move(*block));
            } else {
                auto body_expr = read_expr(*body);
                scopes.pop_back();
                if (!body_expr) {
                    return body_expr.takeError();
                }
                expr = build::lambda(std::move(params), std::move(*body_expr));
            }
        } else if (kind == "methodref") {
            expr = build::methodRef(get_string(*obj, "qualifier"), get_string(*obj, "method"));
        } else {
            return error(llvm::formatv("unknown expression kind '{0}'", kind).str());
        }

        if (!type.empty()) {
            expr->setType(std::move(type));
        }
        return std::move(expr);
    }

    expected< std::unique_ptr< CompilationUnit > > parseCompilationUnit(llvm::StringRef text) {
        auto root = llvm::json::parse(text);
        if (!root) {
            return root.takeError();
        }
        JsonReader reader;
        return reader.read_unit(*root);
    }

} // namespace pipelift::ast
