/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Render/Replacement.hpp>

namespace pipelift::render {

    // Re-checks that every name an entry of the chain consumes is available
    // where that entry is placed. The available names start with the element
    // and follow the maps: each map drops the variable it supersedes and adds
    // the one it produces.
    llvm::Error validateScopes(const model::LoopModel &model);

    // `source.stream()` (or its array and iterable equivalents) followed by
    // the map and filter chain.
    std::string renderStream(const model::LoopModel &model, Replacement &replacement);

    // Pipeline statement replacing a single convertible loop.
    llvm::Expected< Replacement >
    renderPipeline(const model::LoopModel &model, const RenderContext &context);

    // `target = Stream.concat(...).collect(...)` for a group of loops that
    // collect into the same target. `context.loop` is the first member; the
    // other members are removed.
    llvm::Expected< Replacement > renderConcatenation(
        const std::vector< model::LoopModel > &members,
        const std::vector< const ast::Stmt * > &loops, const RenderContext &context
    );

} // namespace pipelift::render
