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
#include <llvm/Support/JSON.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::render {

    inline constexpr const char *kArraysSymbol        = "java.util.Arrays";
    inline constexpr const char *kStreamSupportSymbol = "java.util.stream.StreamSupport";
    inline constexpr const char *kCollectorsSymbol    = "java.util.stream.Collectors";
    inline constexpr const char *kStreamSymbol        = "java.util.stream.Stream";
    inline constexpr const char *kIteratorSymbol      = "java.util.Iterator";

    // Edit description handed back to the caller; the tree itself is never
    // modified.
    struct Replacement
    {
        // Statement replaced by `statements`.
        const ast::Stmt *loop = nullptr;
        // Statements deleted together with `loop`.
        std::vector< const ast::Stmt * > removed;
        std::vector< std::string > statements;
        // Symbols the caller must make resolvable (imports).
        std::vector< std::string > required_symbols;

        void require(llvm::StringRef symbol);
        void remove(const ast::Stmt *stmt);
    };

    // Where a replacement is placed and what may be folded into it.
    struct RenderContext
    {
        const ast::Stmt *loop      = nullptr;
        // Statement removed together with the loop (iterator declaration).
        const ast::Stmt *companion = nullptr;
        // Statement right before the loop, candidate for the declaration merge.
        const ast::Stmt *preceding = nullptr;
        bool merge_declarations    = true;
    };

    llvm::json::Value toJSON(const Replacement &replacement);

} // namespace pipelift::render
