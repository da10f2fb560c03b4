/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/ASTPassManager.hpp>

#include <pipelift/Util/Log.hpp>

namespace pipelift::ast {

    void ASTPassManager::add_pass(std::unique_ptr< ASTPass > pass) {
        passes.emplace_back(std::move(pass));
    }

    bool ASTPassManager::run(const CompilationUnit &unit, const pipelift::Options &options) {
        for (const auto &pass : passes) {
            if (!pass->run(unit, options)) {
                LOG(ERROR) << "AST pass " << pass->name() << " failed on " << unit.name << "\n";
                return false;
            }
        }
        return true;
    }

} // namespace pipelift::ast
