/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::analysis {

    struct LoopView;

    struct ScopeInfo
    {
        // Locals declared in the loop body, nested loops excluded.
        std::set< std::string > declared;
        // Non-field simple names assigned or incremented in the loop, nested loops excluded.
        std::set< std::string > modified;
        // Non-field names from enclosing scopes that the loop reads or writes.
        std::set< std::string > referenced;
    };

    ScopeInfo scanLoopScope(const LoopView &view);

    // Loops that have no view (classic for, do, general while): init, condition,
    // updates and body are scanned.
    ScopeInfo scanLoopScope(const ast::Stmt &loop);

    // Every name declared anywhere inside the statements, lambda parameters included.
    std::set< std::string > declaredNames(const std::vector< const ast::Stmt * > &stmts);

    // Non-field simple-name uses, excluding names declared inside the given
    // syntax (lambda parameters, nested declarations).
    std::vector< const ast::NameExpr * > nameUses(const ast::Expr &expr);
    std::vector< const ast::NameExpr * > nameUses(const std::vector< const ast::Stmt * > &stmts);

    bool mentionsName(const ast::Stmt &stmt, llvm::StringRef name);
    bool mentionsName(const ast::Expr &expr, llvm::StringRef name);

    // Number of simple-name references to `name` inside `stmt`.
    unsigned countMentions(const ast::Stmt &stmt, llvm::StringRef name);

    // Simple names assigned or incremented anywhere inside `stmt`, lambdas excluded.
    std::set< std::string > assignedNames(const ast::Stmt &stmt);

} // namespace pipelift::analysis
