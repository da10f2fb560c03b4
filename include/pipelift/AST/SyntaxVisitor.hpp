/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <llvm/Support/Casting.h>

#include <pipelift/AST/Syntax.hpp>

namespace pipelift::ast {

    // Pre-order traversal in the style of clang::RecursiveASTVisitor. Derived
    // classes override VisitStmt / VisitExpr / VisitVarDecl and may shadow
    // TraverseLoop or TraverseLambda to prune subtrees. Returning false from any
    // hook stops the traversal.
    template< typename Derived >
    class RecursiveSyntaxVisitor
    {
      public:
        Derived &getDerived() { return *static_cast< Derived * >(this); }

        bool VisitStmt(const Stmt *) { return true; }
        bool VisitExpr(const Expr *) { return true; }
        bool VisitVarDecl(const VarDecl &) { return true; }

        bool TraverseLoop(const Stmt *loop) { return getDerived().TraverseStmtChildren(loop); }

        bool TraverseLambda(const LambdaExpr *lambda) {
            return getDerived().TraverseExprChildren(lambda);
        }

        bool TraverseStmt(const Stmt *stmt) {
            if (stmt == nullptr) {
                return true;
            }
            if (!getDerived().VisitStmt(stmt)) {
                return false;
            }
            if (stmt->isLoop()) {
                return getDerived().TraverseLoop(stmt);
            }
            return getDerived().TraverseStmtChildren(stmt);
        }

        bool TraverseExpr(const Expr *expr) {
            if (expr == nullptr) {
                return true;
            }
            if (!getDerived().VisitExpr(expr)) {
                return false;
            }
            if (const auto *lambda = llvm::dyn_cast< LambdaExpr >(expr)) {
                return getDerived().TraverseLambda(lambda);
            }
            return getDerived().TraverseExprChildren(expr);
        }

        bool TraverseVarDecl(const VarDecl &var) {
            if (!getDerived().VisitVarDecl(var)) {
                return false;
            }
            return TraverseExpr(var.init.get());
        }

        bool TraverseStmtChildren(const Stmt *stmt) {
            switch (stmt->getKind()) {
                case Stmt::Kind::Block:
                    for (const auto &child : llvm::cast< BlockStmt >(stmt)->body()) {
                        if (!TraverseStmt(child.get())) {
                            return false;
                        }
                    }
                    return true;
                case Stmt::Kind::Expr:
                    return TraverseExpr(llvm::cast< ExprStmt >(stmt)->getExpr());
                case Stmt::Kind::Decl:
                    for (const auto &var : llvm::cast< DeclStmt >(stmt)->decls()) {
                        if (!TraverseVarDecl(var)) {
                            return false;
                        }
                    }
                    return true;
                case Stmt::Kind::If: {
                    const auto *if_stmt = llvm::cast< IfStmt >(stmt);
                    return TraverseExpr(if_stmt->getCond()) && TraverseStmt(if_stmt->getThen())
                        && TraverseStmt(if_stmt->getElse());
                }
                case Stmt::Kind::Return:
                    return TraverseExpr(llvm::cast< ReturnStmt >(stmt)->getValue());
                case Stmt::Kind::Throw:
                    return TraverseExpr(llvm::cast< ThrowStmt >(stmt)->getValue());
                case Stmt::Kind::ForEach: {
                    const auto *loop = llvm::cast< ForEachStmt >(stmt);
                    return TraverseExpr(loop->getIterable()) && TraverseVarDecl(loop->getVar())
                        && TraverseStmt(loop->getBody());
                }
                case Stmt::Kind::For: {
                    const auto *loop = llvm::cast< ForStmt >(stmt);
                    for (const auto &init : loop->getInit()) {
                        if (!TraverseStmt(init.get())) {
                            return false;
                        }
                    }
                    if (!TraverseExpr(loop->getCond())) {
                        return false;
                    }
                    for (const auto &update : loop->getUpdates()) {
                        if (!TraverseExpr(update.get())) {
                            return false;
                        }
                    }
                    return TraverseStmt(loop->getBody());
                }
                case Stmt::Kind::While: {
                    const auto *loop = llvm::cast< WhileStmt >(stmt);
                    return TraverseExpr(loop->getCond()) && TraverseStmt(loop->getBody());
                }
                case Stmt::Kind::Do: {
                    const auto *loop = llvm::cast< DoStmt >(stmt);
                    return TraverseStmt(loop->getBody()) && TraverseExpr(loop->getCond());
                }
                case Stmt::Kind::Try: {
                    const auto *try_stmt = llvm::cast< TryStmt >(stmt);
                    if (!TraverseStmt(try_stmt->getBody())) {
                        return false;
                    }
                    for (const auto &clause : try_stmt->getCatches()) {
                        if (!TraverseVarDecl(clause.param) || !TraverseStmt(clause.body.get())) {
                            return false;
                        }
                    }
                    return TraverseStmt(try_stmt->getFinally());
                }
                case Stmt::Kind::Switch: {
                    const auto *switch_stmt = llvm::cast< SwitchStmt >(stmt);
                    if (!TraverseExpr(switch_stmt->getSelector())) {
                        return false;
                    }
                    for (const auto &group : switch_stmt->getCases()) {
                        for (const auto &label : group.labels) {
                            if (!TraverseExpr(label.get())) {
                                return false;
                            }
                        }
                        for (const auto &child : group.body) {
                            if (!TraverseStmt(child.get())) {
                                return false;
                            }
                        }
                    }
                    return true;
                }
                case Stmt::Kind::Synchronized: {
                    const auto *sync = llvm::cast< SynchronizedStmt >(stmt);
                    return TraverseExpr(sync->getLock()) && TraverseStmt(sync->getBody());
                }
                case Stmt::Kind::Labeled:
                    return TraverseStmt(llvm::cast< LabeledStmt >(stmt)->getBody());
                case Stmt::Kind::Break:
                case Stmt::Kind::Continue:
                case Stmt::Kind::Empty:
                    return true;
            }
            return true;
        }

        bool TraverseExprChildren(const Expr *expr) {
            switch (expr->getKind()) {
                case Expr::Kind::Paren:
                    return TraverseExpr(llvm::cast< ParenExpr >(expr)->getSubExpr());
                case Expr::Kind::Unary:
                    return TraverseExpr(llvm::cast< UnaryExpr >(expr)->getOperand());
                case Expr::Kind::Binary: {
                    const auto *binary = llvm::cast< BinaryExpr >(expr);
                    return TraverseExpr(binary->getLHS()) && TraverseExpr(binary->getRHS());
                }
                case Expr::Kind::Assign: {
                    const auto *assign = llvm::cast< AssignExpr >(expr);
                    return TraverseExpr(assign->getLHS()) && TraverseExpr(assign->getRHS());
                }
                case Expr::Kind::Call: {
                    const auto *call = llvm::cast< CallExpr >(expr);
                    if (!TraverseExpr(call->getReceiver())) {
                        return false;
                    }
                    for (const auto &arg : call->getArgs()) {
                        if (!TraverseExpr(arg.get())) {
                            return false;
                        }
                    }
                    return true;
                }
                case Expr::Kind::FieldAccess:
                    return TraverseExpr(llvm::cast< FieldAccessExpr >(expr)->getBase());
                case Expr::Kind::ArrayAccess: {
                    const auto *access = llvm::cast< ArrayAccessExpr >(expr);
                    return TraverseExpr(access->getBase()) && TraverseExpr(access->getIndex());
                }
                case Expr::Kind::New:
                    for (const auto &arg : llvm::cast< NewExpr >(expr)->getArgs()) {
                        if (!TraverseExpr(arg.get())) {
                            return false;
                        }
                    }
                    return true;
                case Expr::Kind::Cast:
                    return TraverseExpr(llvm::cast< CastExpr >(expr)->getSubExpr());
                case Expr::Kind::Conditional: {
                    const auto *cond = llvm::cast< ConditionalExpr >(expr);
                    return TraverseExpr(cond->getCond()) && TraverseExpr(cond->getThen())
                        && TraverseExpr(cond->getElse());
                }
                case Expr::Kind::Lambda: {
                    const auto *lambda = llvm::cast< LambdaExpr >(expr);
                    return TraverseExpr(lambda->getExprBody())
                        && TraverseStmt(lambda->getBlockBody());
                }
                case Expr::Kind::Name:
                case Expr::Kind::Literal:
                case Expr::Kind::This:
                case Expr::Kind::MethodRef:
                    return true;
            }
            return true;
        }
    };

} // namespace pipelift::ast
