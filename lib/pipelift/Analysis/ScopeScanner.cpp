/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/AST/SyntaxVisitor.hpp>

namespace pipelift::analysis {

    namespace {

        // Simple name written by an assignment or increment, if any.
        const ast::NameExpr *writtenName(const ast::Expr *expr) {
            if (const auto *assign = llvm::dyn_cast< ast::AssignExpr >(expr)) {
                return ast::asSimpleName(assign->getLHS());
            }
            if (const auto *unary = llvm::dyn_cast< ast::UnaryExpr >(expr)) {
                if (unary->isIncrementOrDecrement()) {
                    return ast::asSimpleName(unary->getOperand());
                }
            }
            return nullptr;
        }

        // Scans a loop without descending into loops nested inside it.
        class LoopScopeVisitor final : public ast::RecursiveSyntaxVisitor< LoopScopeVisitor >
        {
          public:
            enum class Phase : uint8_t { Declarations, References };

            LoopScopeVisitor(const ast::Stmt *root, Phase phase, ScopeInfo &scope)
                : root(root), phase(phase), scope(scope) {}

            std::set< std::string > excluded;

            bool TraverseLoop(const ast::Stmt *loop) {
                if (loop != root) {
                    return true;
                }
                return TraverseStmtChildren(loop);
            }

            bool VisitVarDecl(const ast::VarDecl &var) {
                if (phase == Phase::Declarations) {
                    scope.declared.insert(var.name);
                }
                return true;
            }

            bool VisitExpr(const ast::Expr *expr) {
                if (phase == Phase::Declarations) {
                    if (const auto *lambda = llvm::dyn_cast< ast::LambdaExpr >(expr)) {
                        scope.declared.insert(lambda->getParams().begin(), lambda->getParams().end());
                    }
                    return true;
                }

                if (const auto *written = writtenName(expr)) {
                    if (written->getBinding().kind != ast::BindingKind::Field) {
                        scope.modified.insert(written->getName());
                    }
                }

                const auto *name = llvm::dyn_cast< ast::NameExpr >(expr);
                if (name == nullptr || name->getBinding().kind == ast::BindingKind::Field) {
                    return true;
                }
                if (excluded.count(name->getName()) != 0U
                    || scope.declared.count(name->getName()) != 0U)
                {
                    return true;
                }
                scope.referenced.insert(name->getName());
                return true;
            }

          private:
            const ast::Stmt *root;
            Phase phase;
            ScopeInfo &scope;
        };

        class DeclarationCollector final
            : public ast::RecursiveSyntaxVisitor< DeclarationCollector >
        {
          public:
            std::set< std::string > names;

            bool VisitVarDecl(const ast::VarDecl &var) {
                names.insert(var.name);
                return true;
            }

            bool VisitExpr(const ast::Expr *expr) {
                if (const auto *lambda = llvm::dyn_cast< ast::LambdaExpr >(expr)) {
                    names.insert(lambda->getParams().begin(), lambda->getParams().end());
                }
                return true;
            }
        };

        class NameUseCollector final : public ast::RecursiveSyntaxVisitor< NameUseCollector >
        {
          public:
            std::vector< const ast::NameExpr * > uses;

            bool VisitExpr(const ast::Expr *expr) {
                if (const auto *name = llvm::dyn_cast< ast::NameExpr >(expr)) {
                    if (name->getBinding().kind != ast::BindingKind::Field) {
                        uses.push_back(name);
                    }
                }
                return true;
            }
        };

        class NameMentionFinder final : public ast::RecursiveSyntaxVisitor< NameMentionFinder >
        {
          public:
            explicit NameMentionFinder(llvm::StringRef name) : name(name) {}

            bool found         = false;
            bool stop_at_first = true;
            unsigned count     = 0;

            bool VisitExpr(const ast::Expr *expr) {
                const auto *use = llvm::dyn_cast< ast::NameExpr >(expr);
                if (use != nullptr && use->getName() == name) {
                    found = true;
                    ++count;
                    return !stop_at_first;
                }
                return true;
            }

          private:
            llvm::StringRef name;
        };

        class AssignmentCollector final
            : public ast::RecursiveSyntaxVisitor< AssignmentCollector >
        {
          public:
            std::set< std::string > names;

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool VisitExpr(const ast::Expr *expr) {
                if (const auto *written = writtenName(expr)) {
                    names.insert(written->getName());
                }
                return true;
            }
        };

        std::vector< const ast::NameExpr * >
        dropDeclared(std::vector< const ast::NameExpr * > uses, const std::set< std::string > &declared) {
            std::vector< const ast::NameExpr * > result;
            for (const auto *use : uses) {
                if (declared.count(use->getName()) == 0U) {
                    result.push_back(use);
                }
            }
            return result;
        }

    } // namespace

    ScopeInfo scanLoopScope(const LoopView &view) {
        ScopeInfo scope;
        LoopScopeVisitor declarations(view.loop, LoopScopeVisitor::Phase::Declarations, scope);
        for (const auto *stmt : view.body) {
            declarations.TraverseStmt(stmt);
        }

        LoopScopeVisitor references(view.loop, LoopScopeVisitor::Phase::References, scope);
        references.excluded.insert(view.element_name);
        if (!view.control_variable.empty()) {
            references.excluded.insert(view.control_variable);
        }
        for (const auto *stmt : view.body) {
            references.TraverseStmt(stmt);
        }
        return scope;
    }

    ScopeInfo scanLoopScope(const ast::Stmt &loop) {
        ScopeInfo scope;
        LoopScopeVisitor declarations(&loop, LoopScopeVisitor::Phase::Declarations, scope);
        declarations.TraverseStmtChildren(&loop);

        LoopScopeVisitor references(&loop, LoopScopeVisitor::Phase::References, scope);
        references.TraverseStmtChildren(&loop);
        return scope;
    }

    std::set< std::string > declaredNames(const std::vector< const ast::Stmt * > &stmts) {
        DeclarationCollector collector;
        for (const auto *stmt : stmts) {
            collector.TraverseStmt(stmt);
        }
        return collector.names;
    }

    std::vector< const ast::NameExpr * > nameUses(const ast::Expr &expr) {
        DeclarationCollector declarations;
        declarations.TraverseExpr(&expr);
        NameUseCollector collector;
        collector.TraverseExpr(&expr);
        return dropDeclared(std::move(collector.uses), declarations.names);
    }

    std::vector< const ast::NameExpr * > nameUses(const std::vector< const ast::Stmt * > &stmts) {
        NameUseCollector collector;
        for (const auto *stmt : stmts) {
            collector.TraverseStmt(stmt);
        }
        return dropDeclared(std::move(collector.uses), declaredNames(stmts));
    }

    bool mentionsName(const ast::Stmt &stmt, llvm::StringRef name) {
        NameMentionFinder finder(name);
        finder.TraverseStmt(&stmt);
        return finder.found;
    }

    bool mentionsName(const ast::Expr &expr, llvm::StringRef name) {
        NameMentionFinder finder(name);
        finder.TraverseExpr(&expr);
        return finder.found;
    }

    unsigned countMentions(const ast::Stmt &stmt, llvm::StringRef name) {
        NameMentionFinder finder(name);
        finder.stop_at_first = false;
        finder.TraverseStmt(&stmt);
        return finder.count;
    }

    std::set< std::string > assignedNames(const ast::Stmt &stmt) {
        AssignmentCollector collector;
        collector.TraverseStmt(&stmt);
        return collector.names;
    }

} // namespace pipelift::analysis
