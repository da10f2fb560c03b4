/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <exception>

#include <pipelift/AST/SyntaxVisitor.hpp>
#include <pipelift/Analysis/LoopExtractor.hpp>
#include <pipelift/Analysis/SafetyAnalyzer.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Util/Log.hpp>

#include "ConversionPipelineInternal.hpp"

namespace pipelift::ast::detail {

    namespace {

        bool formEnabled(analysis::LoopForm form, const pipelift::Options &options) {
            switch (form) {
                case analysis::LoopForm::EnhancedFor:
                    return true;
                case analysis::LoopForm::IndexedFor:
                    return options.convert_index_loops;
                case analysis::LoopForm::IteratorWhile:
                    return options.convert_iterator_loops;
                case analysis::LoopForm::ForEachCall:
                    return true;
            }
            return false;
        }

        // Loops already written in the requested target form.
        bool alreadyInTargetForm(analysis::LoopForm form, TargetFormat target) {
            return (target == TargetFormat::IteratorWhile && form == analysis::LoopForm::IteratorWhile)
                || (target == TargetFormat::EnhancedFor && form == analysis::LoopForm::EnhancedFor);
        }

        std::optional< analysis::LoopView >
        viewLoop(const Stmt &loop, const BlockPosition *position) {
            if (const auto *for_each = llvm::dyn_cast< ForEachStmt >(&loop)) {
                return analysis::viewEnhancedFor(*for_each);
            }
            if (const auto *for_stmt = llvm::dyn_cast< ForStmt >(&loop)) {
                return analysis::viewIndexedFor(*for_stmt);
            }
            if (const auto *while_stmt = llvm::dyn_cast< WhileStmt >(&loop)) {
                if (position == nullptr) {
                    return analysis::viewIteratorWhile(*while_stmt, nullptr);
                }
                return analysis::viewIteratorWhile(
                    *while_stmt, position->sibling(-1), position->following()
                );
            }
            return std::nullopt;
        }

        // Pre-order push, post-order decide. A loop is only decided after all
        // loops nested inside it.
        class LoopTreeBuilder final : public RecursiveSyntaxVisitor< LoopTreeBuilder >
        {
          public:
            LoopTreeBuilder(MethodLoops &loops, PipelineState &state, const pipelift::Options &options)
                : loops(loops), state(state), options(options), context(*loops.method) {}

            bool TraverseLoop(const Stmt *loop) {
                return traverseIteration(*loop, viewLoop(*loop, findPosition(*loop)));
            }

            // forEach call statements iterate too when rewriting away from streams.
            bool TraverseStmtChildren(const Stmt *stmt) {
                if (options.target_format != TargetFormat::Stream) {
                    if (const auto *expr = llvm::dyn_cast< ExprStmt >(stmt)) {
                        if (auto view = analysis::viewForEachCall(*expr)) {
                            return traverseIteration(*stmt, std::move(view));
                        }
                    }
                }
                return Base::TraverseStmtChildren(stmt);
            }

          private:
            using Base = RecursiveSyntaxVisitor< LoopTreeBuilder >;

            bool traverseIteration(const Stmt &iteration, std::optional< analysis::LoopView > view) {
                auto scope = view ? analysis::scanLoopScope(*view) : analysis::scanLoopScope(iteration);
                loops.tree.push(iteration, std::move(view), std::move(scope));
                ++state.loops_seen;

                if (!Base::TraverseStmtChildren(&iteration)) {
                    return false;
                }

                auto id = loops.tree.pop();
                decide(id);
                if (options.verbose) {
                    const auto &node = loops.tree.node(id);
                    LOG(DEBUG) << "Loop at " << iteration.location() << ": "
                               << analysis::toString(node.decision)
                               << (node.reason.empty() ? "" : " (" + node.reason + ")") << "\n";
                }
                return true;
            }

            const BlockPosition *findPosition(const Stmt &loop) const {
                auto it = loops.positions.find(&loop);
                return it == loops.positions.end() ? nullptr : &it->second;
            }

            void reject(analysis::LoopTreeNode &node, std::string reason) {
                node.decision = analysis::Decision::NotConvertible;
                node.reason   = std::move(reason);
            }

            void decide(analysis::NodeId id) {
                auto &node = loops.tree.node(id);
                if (state.handled.count(node.loop) != 0U) {
                    node.decision = analysis::Decision::Convertible;
                    node.reason   = "merged into a concatenated rewrite";
                    return;
                }
                if (loops.tree.hasConvertibleDescendant(id)) {
                    node.decision = analysis::Decision::SkippedInnerConverted;
                    node.reason   = "a nested loop is converted";
                    return;
                }
                if (!node.view) {
                    reject(node, "unsupported loop form");
                    return;
                }
                if (!formEnabled(node.view->form, options)) {
                    reject(node, std::string(analysis::toString(node.view->form)) + " loops are disabled");
                    return;
                }
                if (alreadyInTargetForm(node.view->form, options.target_format)) {
                    reject(node, "loop is already in the target form");
                    return;
                }

                try {
                    analyze(id);
                } catch (const std::exception &e) {
                    LOG(WARNING) << "Loop analysis failed at " << node.loop->location() << ": "
                                 << e.what() << "\n";
                    reject(loops.tree.node(id), std::string("internal error: ") + e.what());
                }
            }

            void analyze(analysis::NodeId id) {
                auto &node       = loops.tree.node(id);
                const auto &view = *node.view;

                if (view.form == analysis::LoopForm::ForEachCall) {
                    auto result = analysis::extractForEachCallModel(view, options);
                    if (const auto *aborted = std::get_if< analysis::Aborted >(&result)) {
                        reject(node, aborted->reason);
                        return;
                    }
                    node.decision = analysis::Decision::Convertible;
                    node.model    = std::move(std::get< model::LoopModel >(result));
                    return;
                }

                if (auto verdict = analysis::checkStructure(view, context, options); !verdict) {
                    reject(node, verdict.reason);
                    return;
                }
                if (auto verdict = analysis::checkCaptureSafety(loops.tree, id); !verdict) {
                    reject(node, verdict.reason);
                    return;
                }

                const auto *position = findPosition(*node.loop);
                analysis::ExtractionContext extraction{
                    .following    = position != nullptr ? position->sibling(1) : nullptr,
                    .names_in_use = context.declaredNames()
                };
                auto result = analysis::extractLoopModel(view, extraction, options);
                if (const auto *aborted = std::get_if< analysis::Aborted >(&result)) {
                    reject(node, aborted->reason);
                    return;
                }

                auto &loop_model = std::get< model::LoopModel >(result);
                if (!loop_model.isConvertible()) {
                    reject(node, "loop has no terminal");
                    return;
                }
                if (auto verdict = analysis::checkSideEffects(view, loop_model); !verdict) {
                    reject(node, verdict.reason);
                    return;
                }
                if (auto verdict = analysis::checkCapturedVariables(loop_model, context); !verdict) {
                    reject(node, verdict.reason);
                    return;
                }

                if (options.verbose) {
                    LOG(DEBUG) << "Extracted loop model at " << node.loop->location() << "\n";
                    model::describe(loop_model, llvm::outs());
                }
                node.decision = analysis::Decision::Convertible;
                node.model    = std::move(loop_model);
            }

            MethodLoops &loops;
            PipelineState &state;
            const pipelift::Options &options;
            analysis::MethodContext context;
        };

        class LoopDecisionPass final : public ASTPass
        {
          public:
            explicit LoopDecisionPass(PipelineState &state) : state(state) {}

            const char *name(void) const override { return "LoopDecisionPass"; }

            bool run(const CompilationUnit &unit, const pipelift::Options &options) override {
                if (options.verbose) {
                    LOG(DEBUG) << "Running AST pass: " << name() << "\n";
                }

                for (const auto &type : unit.types) {
                    for (const auto &method : type.methods) {
                        if (!method.body) {
                            continue;
                        }
                        auto &loops     = state.methods.emplace_back();
                        loops.method    = &method;
                        loops.positions = indexBlocks(method);

                        LoopTreeBuilder builder(loops, state, options);
                        if (!builder.TraverseStmt(method.body.get())) {
                            LOG(ERROR) << "Loop traversal of " << type.name << "." << method.name
                                       << " stopped early\n";
                            return false;
                        }
                    }
                }
                return true;
            }

          private:
            PipelineState &state;
        };

    } // namespace

    void addLoopDecisionPass(ASTPassManager &pm, PipelineState &state) {
        pm.add_pass(std::make_unique< LoopDecisionPass >(state));
    }

} // namespace pipelift::ast::detail
