/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <exception>

#include <pipelift/Analysis/LoopExtractor.hpp>
#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Analysis/SafetyAnalyzer.hpp>
#include <pipelift/Render/PipelineRenderer.hpp>
#include <pipelift/Util/Log.hpp>

#include "ConversionPipelineInternal.hpp"

namespace pipelift::ast::detail {

    namespace {

        // Model of one group member, or std::nullopt with `reason` set when
        // the member cannot take part in the concatenation.
        std::optional< model::LoopModel > memberModel(
            const ForEachStmt &loop, const Stmt *following, const std::string &target,
            const analysis::MethodContext &context, const pipelift::Options &options,
            std::string &reason
        ) {
            auto view = analysis::viewEnhancedFor(loop);
            if (!view) {
                reason = "not an enhanced-for loop";
                return std::nullopt;
            }
            if (auto verdict = analysis::checkStructure(*view, context, options); !verdict) {
                reason = verdict.reason;
                return std::nullopt;
            }

            auto result = analysis::extractLoopModel(
                *view,
                analysis::ExtractionContext{ .following    = following,
                                             .names_in_use = context.declaredNames() },
                options
            );
            if (const auto *aborted = std::get_if< analysis::Aborted >(&result)) {
                reason = aborted->reason;
                return std::nullopt;
            }
            auto &model = std::get< model::LoopModel >(result);
            if (!model.isConvertible()) {
                reason = "loop has no terminal";
                return std::nullopt;
            }
            const auto *collect = std::get_if< model::CollectTerminal >(&*model.terminal);
            if (collect == nullptr || collect->target != target) {
                reason = "loop does not collect into '" + target + "'";
                return std::nullopt;
            }
            if (auto verdict = analysis::checkSideEffects(*view, model); !verdict) {
                reason = verdict.reason;
                return std::nullopt;
            }
            if (auto verdict = analysis::checkCapturedVariables(model, context); !verdict) {
                reason = verdict.reason;
                return std::nullopt;
            }
            return std::move(model);
        }

        class ConsecutiveLoopGroupingPass final : public ASTPass
        {
          public:
            explicit ConsecutiveLoopGroupingPass(PipelineState &state) : state(state) {}

            const char *name(void) const override { return "ConsecutiveLoopGroupingPass"; }

            bool run(const CompilationUnit &unit, const pipelift::Options &options) override {
                if (options.verbose) {
                    LOG(DEBUG) << "Running AST pass: " << name() << "\n";
                }

                for (const auto &type : unit.types) {
                    for (const auto &method : type.methods) {
                        if (method.body) {
                            groupMethod(method, options);
                        }
                    }
                }
                return true;
            }

          private:
            void groupMethod(const MethodDecl &method, const pipelift::Options &options) {
                analysis::MethodContext context(method);
                for (const auto *block : analysis::collectBlocks(method)) {
                    for (auto &group : analysis::findConsecutiveLoopGroups(*block)) {
                        auto models = validate(group, context, options);
                        if (!models) {
                            continue;
                        }
                        auto replacement = renderGroup(group, *models, options);
                        if (!replacement) {
                            continue;
                        }
                        for (const auto *loop : group.loops) {
                            state.handled.insert(loop);
                        }
                        state.groups.push_back(GroupPlan{ .group       = std::move(group),
                                                          .replacement = std::move(*replacement) });
                    }
                }
            }

            // Concatenated rewrite of a validated group. On failure the
            // members are left to the per-loop passes.
            std::optional< render::Replacement > renderGroup(
                const analysis::ConsecutiveLoopGroup &group,
                const std::vector< model::LoopModel > &models, const pipelift::Options &options
            ) {
                std::vector< const Stmt * > members(group.loops.begin(), group.loops.end());
                render::RenderContext context{ .loop               = group.loops.front(),
                                               .companion          = nullptr,
                                               .preceding          = group.preceding,
                                               .merge_declarations = options.merge_declarations };

                auto replacement = render::renderConcatenation(models, members, context);
                if (!replacement) {
                    ++state.render_failures;
                    LOG(WARNING) << "Concatenated rewrite of '" << group.target << "' at "
                                 << group.loops.front()->location()
                                 << " failed: " << llvm::toString(replacement.takeError())
                                 << "; converting the loops one by one\n";
                    return std::nullopt;
                }
                return std::move(*replacement);
            }

            std::optional< std::vector< model::LoopModel > > validate(
                const analysis::ConsecutiveLoopGroup &group, const analysis::MethodContext &context,
                const pipelift::Options &options
            ) {
                std::vector< model::LoopModel > models;
                for (std::size_t index = 0; index < group.loops.size(); ++index) {
                    const auto *loop      = group.loops[index];
                    const auto *following = index + 1U < group.loops.size() ? group.loops[index + 1U]
                                                                           : group.following;
                    std::string reason;
                    std::optional< model::LoopModel > model;
                    try {
                        model = memberModel(*loop, following, group.target, context, options, reason);
                    } catch (const std::exception &e) {
                        LOG(WARNING) << "Loop grouping failed at " << loop->location() << ": "
                                     << e.what() << "\n";
                        return std::nullopt;
                    }
                    if (!model) {
                        if (options.verbose) {
                            LOG(DEBUG) << "Group on '" << group.target << "' rejected at "
                                       << loop->location() << ": " << reason << "\n";
                        }
                        return std::nullopt;
                    }
                    models.push_back(std::move(*model));
                }
                return models;
            }

            PipelineState &state;
        };

    } // namespace

    void addConsecutiveLoopGroupingPass(ASTPassManager &pm, PipelineState &state) {
        pm.add_pass(std::make_unique< ConsecutiveLoopGroupingPass >(state));
    }

} // namespace pipelift::ast::detail
