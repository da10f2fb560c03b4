/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Render/Replacement.hpp>

namespace pipelift::render {

    // `it`, or `it1`, `it2`, ... when the name is already used in `loop`.
    std::string iteratorName(const ast::Stmt &loop);

    struct IteratorLoop
    {
        ast::StmtPtr declaration; // Iterator<T> it = source.iterator();
        ast::StmtPtr loop;        // while (it.hasNext()) { T x = it.next(); ... }
    };

    // Iterator-driven while loop over the view's source. The element is
    // re-declared through `next()` and the original body statements are
    // cloned after it.
    llvm::Expected< IteratorLoop >
    buildIteratorLoop(const analysis::LoopView &view, const model::LoopModel &model);

    llvm::Expected< Replacement > renderIteratorLoop(
        const analysis::LoopView &view, const model::LoopModel &model, const RenderContext &context
    );

    // Loop body reconstructed from the model alone: map declarations, negated
    // filter guards and the imperative form of the terminal.
    std::vector< std::string > modelBodyStatements(const model::LoopModel &model);

    // Iterator declaration and while loop built from the model alone.
    llvm::Expected< std::vector< std::string > >
    renderModelIteratorLoop(const model::LoopModel &model, llvm::StringRef iterator);

    // Enhanced-for loop equivalent to an indexed or iterator-driven loop.
    ast::StmtPtr buildEnhancedFor(const analysis::LoopView &view);

    llvm::Expected< Replacement >
    renderEnhancedFor(const analysis::LoopView &view, const RenderContext &context);

} // namespace pipelift::render
