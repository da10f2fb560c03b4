/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Render/Replacement.hpp>

#include <algorithm>

#include <pipelift/AST/Printer.hpp>

namespace pipelift::render {

    namespace {

        llvm::json::Object describeStmt(const ast::Stmt &stmt) {
            return llvm::json::Object{
                { "location", stmt.location() },
                {     "text", ast::toString(stmt) }
            };
        }

    } // namespace

    void Replacement::require(llvm::StringRef symbol) {
        auto it = std::find(required_symbols.begin(), required_symbols.end(), symbol);
        if (it == required_symbols.end()) {
            required_symbols.emplace_back(symbol.str());
        }
    }

    void Replacement::remove(const ast::Stmt *stmt) {
        if (stmt != nullptr && std::find(removed.begin(), removed.end(), stmt) == removed.end()) {
            removed.push_back(stmt);
        }
    }

    llvm::json::Value toJSON(const Replacement &replacement) {
        llvm::json::Array removed;
        for (const auto *stmt : replacement.removed) {
            removed.push_back(describeStmt(*stmt));
        }

        llvm::json::Array statements;
        for (const auto &text : replacement.statements) {
            statements.push_back(text);
        }

        llvm::json::Array symbols;
        for (const auto &symbol : replacement.required_symbols) {
            symbols.push_back(symbol);
        }

        auto replaced = describeStmt(*replacement.loop);
        return llvm::json::Object{
            {   "replaced", std::move(replaced) },
            {    "removed", std::move(removed) },
            { "statements", std::move(statements) },
            {    "symbols", std::move(symbols) }
        };
    }

} // namespace pipelift::render
