/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Model/Reducer.hpp>

/**
 * @brief Independent statement classifiers used by the loop extractor.
 *
 * Each matcher only inspects the shape of one statement and returns the
 * syntax pieces the extractor needs; it never decides whether the match is
 * legal at the statement's position or with respect to the rest of the loop.
 */
namespace pipelift::analysis::patterns {

    // `if (cond) continue;` with an unlabeled continue and no else branch.
    // Returns the condition.
    const ast::Expr *matchGuardContinue(const ast::Stmt &stmt);

    struct EarlyReturn
    {
        model::MatchKind kind;
        // Condition with the leading negation removed for All.
        const ast::Expr *condition;
    };

    // `if (cond) return true|false;` whose loop is followed by `following`.
    // When `following` is a boolean return it must return the opposite value.
    std::optional< EarlyReturn > matchEarlyReturn(const ast::Stmt &stmt, const ast::Stmt *following);

    struct GuardedTail
    {
        const ast::Expr *condition;
        std::vector< const ast::Stmt * > body;
    };

    // `if (cond) { ... }` without else branch.
    std::optional< GuardedTail > matchGuardedTail(const ast::Stmt &stmt);

    // `T y = expr;` with exactly one declarator and an initializer.
    const ast::VarDecl *matchMapDeclaration(const ast::Stmt &stmt);

    // `current = expr;`; returns the assigned value.
    const ast::Expr *matchReassignment(const ast::Stmt &stmt, llvm::StringRef current);

    struct CollectCall
    {
        const ast::NameExpr *target;
        const ast::Expr *value;
    };

    // `target.add(value);`
    std::optional< CollectCall > matchCollect(const ast::Stmt &stmt);

    struct Accumulation
    {
        model::ReducerKind kind;
        const ast::NameExpr *accumulator;
        // Folded value; null for counting increments and decrements.
        const ast::Expr *value;
    };

    // `acc++`, `acc--`, `acc += v`, `acc -= v`, `acc *= v`,
    // `acc = Math.max(acc, v)` and `acc = Math.min(acc, v)`.
    std::optional< Accumulation > matchAccumulation(const ast::Stmt &stmt);

} // namespace pipelift::analysis::patterns
