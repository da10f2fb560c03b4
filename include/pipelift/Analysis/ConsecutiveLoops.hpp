/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::analysis {

    // Run of sibling enhanced-for loops in one block that each append to the
    // same target collection.
    struct ConsecutiveLoopGroup
    {
        std::string target;
        std::vector< const ast::ForEachStmt * > loops;
        // Statement right before the first member, or null.
        const ast::Stmt *preceding = nullptr;
        // Statement right after the last member, or null.
        const ast::Stmt *following = nullptr;
    };

    // Maximal runs of two or more loops whose body reduces to a single
    // `target.add(...)`, possibly behind guards and declarations.
    std::vector< ConsecutiveLoopGroup > findConsecutiveLoopGroups(const ast::BlockStmt &block);

    // Every block of the method, nested blocks included.
    std::vector< const ast::BlockStmt * > collectBlocks(const ast::MethodDecl &method);

} // namespace pipelift::analysis
