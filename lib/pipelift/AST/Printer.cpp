/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/AST/Printer.hpp>
#include <pipelift/Util/Log.hpp>

namespace pipelift::ast {

    namespace {

        const char *spelling(UnaryOp op) {
            switch (op) {
                case UnaryOp::Not:
                    return "!";
                case UnaryOp::Minus:
                    return "-";
                case UnaryOp::Plus:
                    return "+";
                case UnaryOp::BitNot:
                    return "~";
                case UnaryOp::PreInc:
                case UnaryOp::PostInc:
                    return "++";
                case UnaryOp::PreDec:
                case UnaryOp::PostDec:
                    return "--";
            }
            UNREACHABLE("unknown unary operator {0}", static_cast< int >(op));
        }

        void printArgs(const std::vector< ExprPtr > &args, llvm::raw_ostream &os) {
            os << "(";
            bool first = true;
            for (const auto &arg : args) {
                if (!first) {
                    os << ", ";
                }
                first = false;
                print(*arg, os);
            }
            os << ")";
        }

        void printStmts(const std::vector< StmtPtr > &stmts, llvm::raw_ostream &os) {
            for (const auto &stmt : stmts) {
                os << " ";
                print(*stmt, os);
            }
        }

        // Init clause of a classic for loop: declarations and expressions without `;`.
        void printForInit(const std::vector< StmtPtr > &init, llvm::raw_ostream &os) {
            bool first = true;
            for (const auto &stmt : init) {
                if (!first) {
                    os << ", ";
                }
                first = false;
                if (const auto *decl = llvm::dyn_cast< DeclStmt >(stmt.get())) {
                    printDeclarators(decl->decls(), os);
                } else if (const auto *expr_stmt = llvm::dyn_cast< ExprStmt >(stmt.get())) {
                    print(*expr_stmt->getExpr(), os);
                }
            }
        }

    } // namespace

    void printDeclarators(const std::vector< VarDecl > &vars, llvm::raw_ostream &os) {
        if (vars.empty()) {
            return;
        }
        if (vars.front().is_final) {
            os << "final ";
        }
        os << vars.front().type << " ";
        bool first = true;
        for (const auto &var : vars) {
            if (!first) {
                os << ", ";
            }
            first = false;
            os << var.name;
            if (var.init) {
                os << " = ";
                print(*var.init, os);
            }
        }
    }

    void print(const Expr &expr, llvm::raw_ostream &os) {
        switch (expr.getKind()) {
            case Expr::Kind::Name:
                os << llvm::cast< NameExpr >(expr).getName();
                return;
            case Expr::Kind::Literal:
                os << llvm::cast< LiteralExpr >(expr).getSpelling();
                return;
            case Expr::Kind::Paren:
                os << "(";
                print(*llvm::cast< ParenExpr >(expr).getSubExpr(), os);
                os << ")";
                return;
            case Expr::Kind::Unary: {
                const auto &unary = llvm::cast< UnaryExpr >(expr);
                if (unary.isPostfix()) {
                    print(*unary.getOperand(), os);
                    os << spelling(unary.getOp());
                } else {
                    os << spelling(unary.getOp());
                    print(*unary.getOperand(), os);
                }
                return;
            }
            case Expr::Kind::Binary: {
                const auto &binary = llvm::cast< BinaryExpr >(expr);
                print(*binary.getLHS(), os);
                os << " " << binary.getOp() << " ";
                print(*binary.getRHS(), os);
                return;
            }
            case Expr::Kind::Assign: {
                const auto &assign = llvm::cast< AssignExpr >(expr);
                print(*assign.getLHS(), os);
                os << " " << assign.getOp() << " ";
                print(*assign.getRHS(), os);
                return;
            }
            case Expr::Kind::Call: {
                const auto &call = llvm::cast< CallExpr >(expr);
                if (const auto *receiver = call.getReceiver()) {
                    print(*receiver, os);
                    os << ".";
                }
                os << call.getMethod();
                printArgs(call.getArgs(), os);
                return;
            }
            case Expr::Kind::FieldAccess: {
                const auto &access = llvm::cast< FieldAccessExpr >(expr);
                print(*access.getBase(), os);
                os << "." << access.getName();
                return;
            }
            case Expr::Kind::ArrayAccess: {
                const auto &access = llvm::cast< ArrayAccessExpr >(expr);
                print(*access.getBase(), os);
                os << "[";
                print(*access.getIndex(), os);
                os << "]";
                return;
            }
            case Expr::Kind::New: {
                const auto &alloc = llvm::cast< NewExpr >(expr);
                os << "new " << alloc.getClassType();
                printArgs(alloc.getArgs(), os);
                return;
            }
            case Expr::Kind::Cast: {
                const auto &cast = llvm::cast< CastExpr >(expr);
                os << "(" << cast.getTargetType() << ") ";
                print(*cast.getSubExpr(), os);
                return;
            }
            case Expr::Kind::Conditional: {
                const auto &cond = llvm::cast< ConditionalExpr >(expr);
                print(*cond.getCond(), os);
                os << " ? ";
                print(*cond.getThen(), os);
                os << " : ";
                print(*cond.getElse(), os);
                return;
            }
            case Expr::Kind::This:
                os << "this";
                return;
            case Expr::Kind::Lambda: {
                const auto &lambda = llvm::cast< LambdaExpr >(expr);
                const auto &params = lambda.getParams();
                if (params.size() == 1U) {
                    os << params.front();
                } else {
                    os << "(";
                    for (std::size_t i = 0; i < params.size(); ++i) {
                        os << (i == 0 ? "" : ", ") << params[i];
                    }
                    os << ")";
                }
                os << " -> ";
                if (const auto *body = lambda.getExprBody()) {
                    print(*body, os);
                } else {
                    print(*lambda.getBlockBody(), os);
                }
                return;
            }
            case Expr::Kind::MethodRef: {
                const auto &ref = llvm::cast< MethodRefExpr >(expr);
                os << ref.getQualifier() << "::" << ref.getMethod();
                return;
            }
        }
        UNREACHABLE("unknown expression kind {0}", static_cast< int >(expr.getKind()));
    }

    void print(const Stmt &stmt, llvm::raw_ostream &os) {
        switch (stmt.getKind()) {
            case Stmt::Kind::Block: {
                os << "{";
                printStmts(llvm::cast< BlockStmt >(stmt).body(), os);
                os << " }";
                return;
            }
            case Stmt::Kind::Expr:
                print(*llvm::cast< ExprStmt >(stmt).getExpr(), os);
                os << ";";
                return;
            case Stmt::Kind::Decl:
                printDeclarators(llvm::cast< DeclStmt >(stmt).decls(), os);
                os << ";";
                return;
            case Stmt::Kind::If: {
                const auto &if_stmt = llvm::cast< IfStmt >(stmt);
                os << "if (";
                print(*if_stmt.getCond(), os);
                os << ") ";
                print(*if_stmt.getThen(), os);
                if (const auto *else_stmt = if_stmt.getElse()) {
                    os << " else ";
                    print(*else_stmt, os);
                }
                return;
            }
            case Stmt::Kind::Return: {
                const auto *value = llvm::cast< ReturnStmt >(stmt).getValue();
                os << "return";
                if (value != nullptr) {
                    os << " ";
                    print(*value, os);
                }
                os << ";";
                return;
            }
            case Stmt::Kind::Break: {
                const auto &brk = llvm::cast< BreakStmt >(stmt);
                os << "break" << (brk.hasLabel() ? " " + brk.getLabel() : "") << ";";
                return;
            }
            case Stmt::Kind::Continue: {
                const auto &cont = llvm::cast< ContinueStmt >(stmt);
                os << "continue" << (cont.hasLabel() ? " " + cont.getLabel() : "") << ";";
                return;
            }
            case Stmt::Kind::Throw:
                os << "throw ";
                print(*llvm::cast< ThrowStmt >(stmt).getValue(), os);
                os << ";";
                return;
            case Stmt::Kind::ForEach: {
                const auto &loop = llvm::cast< ForEachStmt >(stmt);
                os << "for (" << (loop.getVar().is_final ? "final " : "") << loop.getVar().type
                   << " " << loop.getVar().name << " : ";
                print(*loop.getIterable(), os);
                os << ") ";
                print(*loop.getBody(), os);
                return;
            }
            case Stmt::Kind::For: {
                const auto &loop = llvm::cast< ForStmt >(stmt);
                os << "for (";
                printForInit(loop.getInit(), os);
                os << ";";
                if (const auto *cond = loop.getCond()) {
                    os << " ";
                    print(*cond, os);
                }
                os << ";";
                bool first = true;
                for (const auto &update : loop.getUpdates()) {
                    os << (first ? " " : ", ");
                    first = false;
                    print(*update, os);
                }
                os << ") ";
                print(*loop.getBody(), os);
                return;
            }
            case Stmt::Kind::While: {
                const auto &loop = llvm::cast< WhileStmt >(stmt);
                os << "while (";
                print(*loop.getCond(), os);
                os << ") ";
                print(*loop.getBody(), os);
                return;
            }
            case Stmt::Kind::Do: {
                const auto &loop = llvm::cast< DoStmt >(stmt);
                os << "do ";
                print(*loop.getBody(), os);
                os << " while (";
                print(*loop.getCond(), os);
                os << ");";
                return;
            }
            case Stmt::Kind::Try: {
                const auto &try_stmt = llvm::cast< TryStmt >(stmt);
                os << "try ";
                print(*try_stmt.getBody(), os);
                for (const auto &clause : try_stmt.getCatches()) {
                    os << " catch (" << clause.param.type << " " << clause.param.name << ") ";
                    print(*clause.body, os);
                }
                if (const auto *finally_body = try_stmt.getFinally()) {
                    os << " finally ";
                    print(*finally_body, os);
                }
                return;
            }
            case Stmt::Kind::Switch: {
                const auto &switch_stmt = llvm::cast< SwitchStmt >(stmt);
                os << "switch (";
                print(*switch_stmt.getSelector(), os);
                os << ") {";
                for (const auto &group : switch_stmt.getCases()) {
                    if (group.labels.empty()) {
                        os << " default:";
                    }
                    for (const auto &label : group.labels) {
                        os << " case ";
                        print(*label, os);
                        os << ":";
                    }
                    printStmts(group.body, os);
                }
                os << " }";
                return;
            }
            case Stmt::Kind::Synchronized: {
                const auto &sync = llvm::cast< SynchronizedStmt >(stmt);
                os << "synchronized (";
                print(*sync.getLock(), os);
                os << ") ";
                print(*sync.getBody(), os);
                return;
            }
            case Stmt::Kind::Labeled: {
                const auto &labeled = llvm::cast< LabeledStmt >(stmt);
                os << labeled.getLabel() << ": ";
                print(*labeled.getBody(), os);
                return;
            }
            case Stmt::Kind::Empty:
                os << ";";
                return;
        }
        UNREACHABLE("unknown statement kind {0}", static_cast< int >(stmt.getKind()));
    }

    std::string toString(const Expr &expr) {
        std::string out;
        llvm::raw_string_ostream os(out);
        print(expr, os);
        os.flush();
        return out;
    }

    std::string toString(const Stmt &stmt) {
        std::string out;
        llvm::raw_string_ostream os(out);
        print(stmt, os);
        os.flush();
        return out;
    }

} // namespace pipelift::ast
