/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::ast {

    const Expr *ignoreParens(const Expr *expr);

    // The expression, parentheses stripped, when it is a simple name.
    const NameExpr *asSimpleName(const Expr *expr);

    bool isIdentityReference(const Expr *expr, llvm::StringRef name);

    // Operand of a leading boolean not, parentheses stripped on both sides;
    // null when the expression is not negated.
    const Expr *stripNegation(const Expr *expr);

    // Text of the logical negation: `!x` for primaries, `y` for `!y`, `!(a && b)` otherwise.
    std::string negatedText(const Expr &expr);

    std::optional< bool > booleanLiteralValue(const Expr *expr);

    // Statements of a loop or branch body: the block's children, or the statement itself.
    std::vector< const Stmt * > flattenBody(const Stmt *body);

    // =========================================================================
    // Type name helpers. Types are source spellings such as
    // `java.util.List<String>`, `int[]` or `Map<K, V>`.
    // =========================================================================

    // Unqualified raw type name: `java.util.List<String>` -> `List`.
    std::string erasure(llvm::StringRef type);

    bool isArrayType(llvm::StringRef type);

    bool isPrimitiveType(llvm::StringRef type);

    // Element type of an array or the first type argument of a generic type;
    // wildcard bounds are unwrapped. Empty when unknown.
    std::string elementType(llvm::StringRef type);

} // namespace pipelift::ast
