/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

// Orchestrates the loop conversion pipeline by composing the passes defined
// in LoopGroupingPass.cpp, LoopDecisionPass.cpp and ReplacementEmissionPass.cpp.

#include <pipelift/AST/ConversionPipeline.hpp>

#include <pipelift/AST/ASTPassManager.hpp>
#include <pipelift/AST/SyntaxVisitor.hpp>
#include <pipelift/Util/Log.hpp>

#include "ConversionPipelineInternal.hpp"

namespace pipelift::ast {

    namespace detail {

        namespace {

            class BlockIndexer final : public RecursiveSyntaxVisitor< BlockIndexer >
            {
              public:
                explicit BlockIndexer(PositionMap &positions) : positions(positions) {}

                bool VisitStmt(const Stmt *stmt) {
                    if (const auto *block = llvm::dyn_cast< BlockStmt >(stmt)) {
                        for (std::size_t index = 0; index < block->size(); ++index) {
                            positions[block->body()[index].get()] = BlockPosition{ block, index };
                        }
                    }
                    return true;
                }

              private:
                PositionMap &positions;
            };

        } // namespace

        const Stmt *BlockPosition::sibling(std::ptrdiff_t offset) const {
            if (block == nullptr) {
                return nullptr;
            }
            auto target = static_cast< std::ptrdiff_t >(index) + offset;
            if (target < 0 || target >= static_cast< std::ptrdiff_t >(block->size())) {
                return nullptr;
            }
            return block->body()[static_cast< std::size_t >(target)].get();
        }

        std::vector< const Stmt * > BlockPosition::following() const {
            std::vector< const Stmt * > stmts;
            if (block == nullptr) {
                return stmts;
            }
            for (auto next = index + 1U; next < block->size(); ++next) {
                stmts.push_back(block->body()[next].get());
            }
            return stmts;
        }

        PositionMap indexBlocks(const MethodDecl &method) {
            PositionMap positions;
            BlockIndexer indexer(positions);
            indexer.TraverseStmt(method.body.get());
            return positions;
        }

        std::string loopKindName(const Stmt &loop) {
            switch (loop.getKind()) {
                case Stmt::Kind::ForEach:
                    return "enhanced-for";
                case Stmt::Kind::For:
                    return "for";
                case Stmt::Kind::While:
                    return "while";
                case Stmt::Kind::Do:
                    return "do-while";
                default:
                    UNREACHABLE("statement kind {0} is not a loop", static_cast< int >(loop.getKind()));
            }
        }

    } // namespace detail

    bool runConversionPipeline(
        const CompilationUnit &unit, const pipelift::Options &options, ConversionResult &result
    ) {
        ASTPassManager pass_manager;
        detail::PipelineState state;

        // Step 1: group sibling loops collecting into one target. Must run
        // first so the per-loop passes see the absorbed loops as handled.
        if (options.enable_loop_grouping && options.target_format == TargetFormat::Stream) {
            detail::addConsecutiveLoopGroupingPass(pass_manager, state);
        }

        // Step 2: pre-order push / post-order decide over every method.
        detail::addLoopDecisionPass(pass_manager, state);

        // Step 3: render groups and convertible loops.
        detail::addReplacementEmissionPass(pass_manager, state);

        if (!pass_manager.run(unit, options)) {
            return false;
        }

        for (const auto &method : state.methods) {
            for (analysis::NodeId id = 0; id < method.tree.size(); ++id) {
                const auto &node = method.tree.node(id);
                result.decisions.push_back(LoopDecisionRecord{
                    .location  = node.loop->location(),
                    .loop_kind = node.view ? analysis::toString(node.view->form)
                                           : detail::loopKindName(*node.loop),
                    .decision  = node.decision,
                    .reason    = node.reason });
            }
        }
        result.replacements    = std::move(state.replacements);
        result.loops_seen      = state.loops_seen;
        result.loops_converted = state.loops_converted;
        result.groups_merged   = state.groups_merged;
        result.render_failures = state.render_failures;

        if (options.verbose) {
            LOG(INFO) << unit.name << ": " << result.loops_seen << " loops, "
                      << result.loops_converted << " converted, " << result.groups_merged
                      << " groups merged, " << result.render_failures << " render failures\n";
        }
        return true;
    }

    llvm::json::Value toJSON(const LoopDecisionRecord &record) {
        return llvm::json::Object{
            { "location", record.location },
            {     "kind", record.loop_kind },
            { "decision", analysis::toString(record.decision) },
            {   "reason", record.reason }
        };
    }

} // namespace pipelift::ast
