/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>

#include <llvm/ADT/StringSwitch.h>

namespace pipelift::ast {

    namespace {

        bool isPrimary(const Expr &expr) {
            switch (expr.getKind()) {
                case Expr::Kind::Name:
                case Expr::Kind::Literal:
                case Expr::Kind::Paren:
                case Expr::Kind::Call:
                case Expr::Kind::FieldAccess:
                case Expr::Kind::ArrayAccess:
                case Expr::Kind::This:
                    return true;
                default:
                    return false;
            }
        }

    } // namespace

    const Expr *ignoreParens(const Expr *expr) {
        while (const auto *paren = llvm::dyn_cast_or_null< ParenExpr >(expr)) {
            expr = paren->getSubExpr();
        }
        return expr;
    }

    const NameExpr *asSimpleName(const Expr *expr) {
        return llvm::dyn_cast_or_null< NameExpr >(ignoreParens(expr));
    }

    bool isIdentityReference(const Expr *expr, llvm::StringRef name) {
        const auto *simple = asSimpleName(expr);
        return simple != nullptr && simple->getName() == name;
    }

    const Expr *stripNegation(const Expr *expr) {
        const auto *unary = llvm::dyn_cast_or_null< UnaryExpr >(ignoreParens(expr));
        if (unary == nullptr || unary->getOp() != UnaryOp::Not) {
            return nullptr;
        }
        return ignoreParens(unary->getOperand());
    }

    std::string negatedText(const Expr &expr) {
        if (const auto *operand = stripNegation(&expr)) {
            return toString(*operand);
        }
        if (isPrimary(expr)) {
            return "!" + toString(expr);
        }
        return "!(" + toString(expr) + ")";
    }

    std::optional< bool > booleanLiteralValue(const Expr *expr) {
        const auto *literal = llvm::dyn_cast_or_null< LiteralExpr >(ignoreParens(expr));
        if (literal == nullptr || literal->getLiteralKind() != LiteralKind::Boolean) {
            return std::nullopt;
        }
        return literal->getSpelling() == "true";
    }

    std::vector< const Stmt * > flattenBody(const Stmt *body) {
        std::vector< const Stmt * > result;
        if (body == nullptr || llvm::isa< EmptyStmt >(body)) {
            return result;
        }
        if (const auto *block = llvm::dyn_cast< BlockStmt >(body)) {
            for (const auto &stmt : block->body()) {
                result.push_back(stmt.get());
            }
            return result;
        }
        result.push_back(body);
        return result;
    }

    std::string erasure(llvm::StringRef type) {
        auto raw = type.trim();
        raw      = raw.substr(0, raw.find('<'));
        if (raw.endswith("[]")) {
            return raw.str();
        }
        auto dot = raw.rfind('.');
        if (dot != llvm::StringRef::npos) {
            raw = raw.substr(dot + 1);
        }
        return raw.trim().str();
    }

    bool isArrayType(llvm::StringRef type) { return type.trim().endswith("[]"); }

    bool isPrimitiveType(llvm::StringRef type) {
        return llvm::StringSwitch< bool >(type.trim())
            .Cases("int", "long", "double", "float", "short", "byte", "char", "boolean", true)
            .Default(false);
    }

    std::string elementType(llvm::StringRef type) {
        auto trimmed = type.trim();
        if (trimmed.endswith("[]")) {
            return trimmed.drop_back(2).trim().str();
        }

        auto open = trimmed.find('<');
        if (open == llvm::StringRef::npos || !trimmed.endswith(">")) {
            return {};
        }

        // First top-level type argument.
        auto args  = trimmed.slice(open + 1, trimmed.size() - 1);
        int depth  = 0;
        size_t end = args.size();
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == '<') {
                ++depth;
            } else if (args[i] == '>') {
                --depth;
            } else if (args[i] == ',' && depth == 0) {
                end = i;
                break;
            }
        }

        auto first = args.substr(0, end).trim();
        if (first.consume_front("?")) {
            first = first.trim();
            if (!first.consume_front("extends")) {
                return {};
            }
            first = first.trim();
        }
        return first.str();
    }

} // namespace pipelift::ast
