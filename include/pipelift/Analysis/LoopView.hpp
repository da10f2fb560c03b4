/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/ArrayRef.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::analysis {

    enum class LoopForm : uint8_t {
        EnhancedFor = 0, // for (T x : source)
        IndexedFor,      // for (int i = 0; i < source.size(); i++) { T x = source.get(i); ... }
        IteratorWhile,   // Iterator<T> it = source.iterator(); while (it.hasNext()) { T x = it.next(); ... }
        ForEachCall      // source.forEach(x -> ...); / source.stream().forEach(x -> ...);
    };

    const char *toString(LoopForm form);

    // Read-only view of an iteration construct reduced to its source, element
    // binding and ordered body statements.
    struct LoopView
    {
        LoopForm form             = LoopForm::EnhancedFor;
        const ast::Stmt *loop     = nullptr;
        const ast::Expr *source   = nullptr;
        std::string element_name;
        std::string element_type;
        bool element_final    = false;
        bool element_non_null = false;
        // Body statements; the element fetch of indexed and iterator loops is dropped.
        std::vector< const ast::Stmt * > body;
        // Index or iterator variable; empty for enhanced-for loops.
        std::string control_variable;
        // Iterator declaration that is removed together with an iterator loop.
        const ast::Stmt *companion = nullptr;
        // Statement wrapping the expression body of a forEach lambda; `body`
        // points into it.
        std::shared_ptr< const ast::Stmt > synthesized;

        // Static type of the source expression, falling back to its binding.
        std::string sourceType() const;
    };

    std::optional< LoopView > viewEnhancedFor(const ast::ForEachStmt &loop);

    std::optional< LoopView > viewIndexedFor(const ast::ForStmt &loop);

    // Statement-level `forEach` call with a one-parameter lambda on a
    // collection or on its `stream()`. Chained stream operations are rejected.
    std::optional< LoopView > viewForEachCall(const ast::ExprStmt &stmt);

    // `preceding` is the statement right before the loop in its block and
    // `following` the statements after it. The iterator must not outlive the loop.
    std::optional< LoopView > viewIteratorWhile(
        const ast::WhileStmt &loop, const ast::Stmt *preceding,
        llvm::ArrayRef< const ast::Stmt * > following = {}
    );

} // namespace pipelift::analysis
