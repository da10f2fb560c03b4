/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

// Internal header for the loop conversion pipeline.
// This file is NOT installed; it is only included by the conversion pass
// .cpp files under lib/pipelift/AST/. All symbols live in the
// pipelift::ast::detail namespace so they do not pollute the public API.

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <pipelift/AST/ASTPassManager.hpp>
#include <pipelift/AST/ConversionPipeline.hpp>
#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/ConsecutiveLoops.hpp>
#include <pipelift/Analysis/LoopTree.hpp>
#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Render/Replacement.hpp>

namespace pipelift::ast::detail {

    // =========================================================================
    // Statement placement
    // =========================================================================

    // Position of a statement inside its enclosing block.
    struct BlockPosition
    {
        const BlockStmt *block = nullptr;
        std::size_t index      = 0;

        // Sibling `offset` statements away, or null.
        const Stmt *sibling(std::ptrdiff_t offset) const;

        // Every statement after this one in the block.
        std::vector< const Stmt * > following() const;
    };

    using PositionMap = std::unordered_map< const Stmt *, BlockPosition >;

    // Positions of every statement that sits directly in a block of `method`.
    PositionMap indexBlocks(const MethodDecl &method);

    // =========================================================================
    // Pipeline-wide mutable state passed to every pass
    // =========================================================================

    // Consecutive-loop group accepted and rendered by the grouping pass.
    struct GroupPlan
    {
        analysis::ConsecutiveLoopGroup group;
        render::Replacement replacement;
    };

    struct MethodLoops
    {
        const MethodDecl *method = nullptr;
        analysis::LoopTree tree;
        PositionMap positions;
    };

    struct PipelineState
    {
        // Loops absorbed into a rendered group; the per-loop passes leave them
        // alone. Members of a group that failed to render are not listed.
        std::unordered_set< const Stmt * > handled;
        std::vector< GroupPlan > groups;
        std::vector< MethodLoops > methods;
        std::vector< render::Replacement > replacements;

        unsigned loops_seen      = 0;
        unsigned loops_converted = 0;
        unsigned groups_merged   = 0;
        unsigned render_failures = 0;
    };

    // Text describing an iteration construct that has no loop view.
    std::string loopKindName(const Stmt &loop);

    // =========================================================================
    // Pass registration
    // =========================================================================

    void addConsecutiveLoopGroupingPass(ASTPassManager &pm, PipelineState &state);
    void addLoopDecisionPass(ASTPassManager &pm, PipelineState &state);
    void addReplacementEmissionPass(ASTPassManager &pm, PipelineState &state);

} // namespace pipelift::ast::detail
