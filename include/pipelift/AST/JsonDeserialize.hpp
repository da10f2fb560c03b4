/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

/**
 * @brief Reads the JSON syntax tree view produced by the front end.
 *
 * Names that carry no explicit "binding" are resolved against the enclosing
 * declarations (lambda parameters, locals, method parameters, fields) in
 * source order.
 */

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::ast {

    using json_arr = llvm::json::Array;
    using json_obj = llvm::json::Object;
    using json_val = llvm::json::Value;

    template< typename T >
    using expected = llvm::Expected< T >;

    class JsonReader
    {
      public:
        expected< std::unique_ptr< CompilationUnit > > read_unit(const json_val &root);

      private:
        using Scope = std::unordered_map< std::string, Binding >;

        expected< TypeDecl > read_type(const json_obj &type_obj);
        expected< MethodDecl > read_method(const json_obj &method_obj);
        expected< VarDecl > read_var(const json_obj &var_obj, BindingKind kind);

        expected< StmtPtr > read_stmt(const json_val &value);
        expected< std::vector< StmtPtr > > read_stmts(const json_arr *array);
        expected< ExprPtr > read_expr(const json_val &value);
        expected< std::vector< ExprPtr > > read_exprs(const json_arr *array);

        expected< StmtPtr > read_optional_stmt(const json_obj &obj, llvm::StringRef key);
        expected< ExprPtr > read_optional_expr(const json_obj &obj, llvm::StringRef key);

        void declare(const VarDecl &var, BindingKind kind);
        Binding resolve(const std::string &name) const;

        std::vector< Scope > scopes;
    };

    expected< std::unique_ptr< CompilationUnit > > parseCompilationUnit(llvm::StringRef text);

} // namespace pipelift::ast
