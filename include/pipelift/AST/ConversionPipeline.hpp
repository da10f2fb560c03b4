/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/Support/JSON.h>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/LoopTree.hpp>
#include <pipelift/Render/Replacement.hpp>
#include <pipelift/Util/Options.hpp>

namespace pipelift::ast {

    struct LoopDecisionRecord
    {
        std::string location;
        std::string loop_kind;
        analysis::Decision decision = analysis::Decision::Unknown;
        std::string reason;
    };

    struct ConversionResult
    {
        // Group rewrites first, then single loops with inner loops before outer ones.
        std::vector< render::Replacement > replacements;
        // One per loop statement, in source order.
        std::vector< LoopDecisionRecord > decisions;
        unsigned loops_seen      = 0;
        unsigned loops_converted = 0;
        unsigned groups_merged   = 0;
        unsigned render_failures = 0;
    };

    bool runConversionPipeline(
        const CompilationUnit &unit, const pipelift::Options &options, ConversionResult &result
    );

    llvm::json::Value toJSON(const LoopDecisionRecord &record);

} // namespace pipelift::ast
