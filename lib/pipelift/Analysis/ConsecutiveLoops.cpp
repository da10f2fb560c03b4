/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/ConsecutiveLoops.hpp>

#include <optional>

#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/AST/SyntaxVisitor.hpp>
#include <pipelift/Analysis/PatternDetectors.hpp>

namespace pipelift::analysis {

    namespace {

        // Target appended to by the last statement of the loop body.
        std::optional< std::string > appendTarget(const ast::ForEachStmt &loop) {
            auto body = ast::flattenBody(loop.getBody());
            // Guarded tails nest the append one level deeper.
            while (body.size() == 1U) {
                auto tail = patterns::matchGuardedTail(*body.front());
                if (!tail) {
                    break;
                }
                body = tail->body;
            }
            if (body.empty()) {
                return std::nullopt;
            }
            auto collect = patterns::matchCollect(*body.back());
            if (!collect) {
                return std::nullopt;
            }
            return collect->target->getName();
        }

        class BlockCollector final : public ast::RecursiveSyntaxVisitor< BlockCollector >
        {
          public:
            std::vector< const ast::BlockStmt * > blocks;

            bool VisitStmt(const ast::Stmt *stmt) {
                if (const auto *block = llvm::dyn_cast< ast::BlockStmt >(stmt)) {
                    blocks.push_back(block);
                }
                return true;
            }
        };

    } // namespace

    std::vector< ConsecutiveLoopGroup > findConsecutiveLoopGroups(const ast::BlockStmt &block) {
        std::vector< ConsecutiveLoopGroup > groups;
        const auto &stmts = block.body();

        std::size_t index = 0;
        while (index < stmts.size()) {
            const auto *first = llvm::dyn_cast< ast::ForEachStmt >(stmts[index].get());
            auto target       = first != nullptr ? appendTarget(*first) : std::nullopt;
            if (!target) {
                ++index;
                continue;
            }

            ConsecutiveLoopGroup group;
            group.target    = *target;
            group.preceding = index > 0U ? stmts[index - 1U].get() : nullptr;
            group.loops.push_back(first);

            auto next = index + 1U;
            for (; next < stmts.size(); ++next) {
                const auto *loop = llvm::dyn_cast< ast::ForEachStmt >(stmts[next].get());
                if (loop == nullptr || appendTarget(*loop) != target) {
                    break;
                }
                group.loops.push_back(loop);
            }
            group.following = next < stmts.size() ? stmts[next].get() : nullptr;

            if (group.loops.size() >= 2U) {
                groups.emplace_back(std::move(group));
            }
            index = next;
        }
        return groups;
    }

    std::vector< const ast::BlockStmt * > collectBlocks(const ast::MethodDecl &method) {
        BlockCollector collector;
        collector.TraverseStmt(method.body.get());
        return collector.blocks;
    }

} // namespace pipelift::analysis
