/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <vector>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Util/Options.hpp>

namespace pipelift::ast {

    // Passes only read the tree; everything they produce goes into the state
    // they were constructed with.
    class ASTPass
    {
      public:
        virtual ~ASTPass() = default;

        virtual const char *name(void) const = 0;
        virtual bool run(const CompilationUnit &unit, const pipelift::Options &options) = 0;
    };

    class ASTPassManager
    {
      public:
        void add_pass(std::unique_ptr< ASTPass > pass);
        bool run(const CompilationUnit &unit, const pipelift::Options &options);

      private:
        std::vector< std::unique_ptr< ASTPass > > passes;
    };

} // namespace pipelift::ast
