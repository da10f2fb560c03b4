/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/Support/raw_ostream.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::ast {

    // Compact single-line Java rendering. Parentheses are printed only where the
    // tree contains a ParenExpr.
    void print(const Expr &expr, llvm::raw_ostream &os);
    void print(const Stmt &stmt, llvm::raw_ostream &os);

    std::string toString(const Expr &expr);
    std::string toString(const Stmt &stmt);

    // `final T a = x, b` without the trailing semicolon.
    void printDeclarators(const std::vector< VarDecl > &vars, llvm::raw_ostream &os);

} // namespace pipelift::ast
