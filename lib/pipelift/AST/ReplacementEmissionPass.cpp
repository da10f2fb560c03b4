/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Render/IteratorLoopRenderer.hpp>
#include <pipelift/Render/PipelineRenderer.hpp>
#include <pipelift/Util/Log.hpp>

#include "ConversionPipelineInternal.hpp"

namespace pipelift::ast::detail {

    namespace {

        class ReplacementEmissionPass final : public ASTPass
        {
          public:
            explicit ReplacementEmissionPass(PipelineState &state) : state(state) {}

            const char *name(void) const override { return "ReplacementEmissionPass"; }

            bool run(const CompilationUnit &, const pipelift::Options &options) override {
                if (options.verbose) {
                    LOG(DEBUG) << "Running AST pass: " << name() << "\n";
                }

                for (const auto &plan : state.groups) {
                    emitGroup(plan);
                }
                for (auto &loops : state.methods) {
                    for (auto id : loops.tree.postOrder()) {
                        auto &node = loops.tree.node(id);
                        if (node.decision == analysis::Decision::Convertible && node.model) {
                            emitLoop(loops, node, options);
                        }
                    }
                }
                return true;
            }

          private:
            void emitGroup(const GroupPlan &plan) {
                ++state.groups_merged;
                state.loops_converted += static_cast< unsigned >(plan.group.loops.size());
                state.replacements.push_back(plan.replacement);
            }

            llvm::Expected< render::Replacement > render(
                const analysis::LoopTreeNode &node, const render::RenderContext &context,
                const pipelift::Options &options
            ) {
                switch (options.target_format) {
                    case TargetFormat::Stream:
                        return render::renderPipeline(*node.model, context);
                    case TargetFormat::IteratorWhile:
                        return render::renderIteratorLoop(*node.view, *node.model, context);
                    case TargetFormat::EnhancedFor:
                        return render::renderEnhancedFor(*node.view, context);
                }
                UNREACHABLE("unknown target format {0}", static_cast< int >(options.target_format));
            }

            void emitLoop(
                const MethodLoops &loops, analysis::LoopTreeNode &node,
                const pipelift::Options &options
            ) {
                // Iterator loops start at their iterator declaration.
                const auto *first = node.view->companion != nullptr ? node.view->companion : node.loop;
                const BlockPosition *position = nullptr;
                if (auto it = loops.positions.find(first); it != loops.positions.end()) {
                    position = &it->second;
                }

                render::RenderContext context{
                    .loop               = node.loop,
                    .companion          = node.view->companion,
                    .preceding          = position != nullptr ? position->sibling(-1) : nullptr,
                    .merge_declarations = options.merge_declarations
                };

                auto replacement = render(node, context, options);
                if (!replacement) {
                    ++state.render_failures;
                    auto message  = llvm::toString(replacement.takeError());
                    LOG(WARNING) << "Rendering loop at " << node.loop->location()
                                 << " failed: " << message << "\n";
                    node.decision = analysis::Decision::NotConvertible;
                    node.reason   = "rendering failed: " + message;
                    return;
                }
                ++state.loops_converted;
                state.replacements.push_back(std::move(*replacement));
            }

            PipelineState &state;
        };

    } // namespace

    void addReplacementEmissionPass(ASTPassManager &pm, PipelineState &state) {
        pm.add_pass(std::make_unique< ReplacementEmissionPass >(state));
    }

} // namespace pipelift::ast::detail
