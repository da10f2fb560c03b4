/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

/**
 * @brief Read-only syntax tree of the Java subset consumed by the converter.
 *
 * Nodes own their children through std::unique_ptr. Dispatch uses the LLVM
 * RTTI scheme: every node carries a Kind tag and each subclass provides
 * classof(), so llvm::isa / llvm::dyn_cast work on the hierarchy.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>

namespace pipelift::ast {

    class Expr;
    class Stmt;

    using ExprPtr = std::unique_ptr< Expr >;
    using StmtPtr = std::unique_ptr< Stmt >;

    enum class BindingKind : uint8_t { Unresolved = 0, Local, Parameter, Field };

    // Resolved declaration information for a simple name.
    struct Binding
    {
        BindingKind kind = BindingKind::Unresolved;
        std::string type;
        bool is_final = false;
        bool non_null = false;
    };

    // =========================================================================
    // Expressions
    // =========================================================================

    class Expr
    {
      public:
        enum class Kind : uint8_t {
            Name,
            Literal,
            Paren,
            Unary,
            Binary,
            Assign,
            Call,
            FieldAccess,
            ArrayAccess,
            New,
            Cast,
            Conditional,
            This,
            Lambda,
            MethodRef
        };

        virtual ~Expr() = default;

        Kind getKind() const { return kind; }

        // Static type of the expression, empty when unknown.
        const std::string &type() const { return type_name; }
        void setType(std::string name) { type_name = std::move(name); }

        virtual ExprPtr clone() const = 0;

      protected:
        explicit Expr(Kind kind) : kind(kind) {}

        ExprPtr finishClone(ExprPtr copy) const {
            copy->type_name = type_name;
            return copy;
        }

      private:
        Kind kind;
        std::string type_name;
    };

    class NameExpr final : public Expr
    {
      public:
        NameExpr(std::string name, Binding binding)
            : Expr(Kind::Name), name(std::move(name)), binding(std::move(binding)) {}

        const std::string &getName() const { return name; }
        const Binding &getBinding() const { return binding; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< NameExpr >(name, binding));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Name; }

      private:
        std::string name;
        Binding binding;
    };

    enum class LiteralKind : uint8_t { Number, String, Char, Boolean, Null };

    class LiteralExpr final : public Expr
    {
      public:
        // `spelling` is the literal as written in source, quotes and suffixes included.
        LiteralExpr(LiteralKind literal_kind, std::string spelling)
            : Expr(Kind::Literal), literal_kind(literal_kind), spelling(std::move(spelling)) {}

        LiteralKind getLiteralKind() const { return literal_kind; }
        const std::string &getSpelling() const { return spelling; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< LiteralExpr >(literal_kind, spelling));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Literal; }

      private:
        LiteralKind literal_kind;
        std::string spelling;
    };

    class ParenExpr final : public Expr
    {
      public:
        explicit ParenExpr(ExprPtr sub) : Expr(Kind::Paren), sub(std::move(sub)) {}

        const Expr *getSubExpr() const { return sub.get(); }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< ParenExpr >(sub->clone()));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Paren; }

      private:
        ExprPtr sub;
    };

    enum class UnaryOp : uint8_t { Not, Minus, Plus, BitNot, PreInc, PreDec, PostInc, PostDec };

    class UnaryExpr final : public Expr
    {
      public:
        UnaryExpr(UnaryOp op, ExprPtr operand)
            : Expr(Kind::Unary), op(op), operand(std::move(operand)) {}

        UnaryOp getOp() const { return op; }
        const Expr *getOperand() const { return operand.get(); }

        bool isIncrementOrDecrement() const {
            return op == UnaryOp::PreInc || op == UnaryOp::PreDec || op == UnaryOp::PostInc
                || op == UnaryOp::PostDec;
        }

        bool isIncrement() const { return op == UnaryOp::PreInc || op == UnaryOp::PostInc; }

        bool isPostfix() const { return op == UnaryOp::PostInc || op == UnaryOp::PostDec; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< UnaryExpr >(op, operand->clone()));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Unary; }

      private:
        UnaryOp op;
        ExprPtr operand;
    };

    class BinaryExpr final : public Expr
    {
      public:
        BinaryExpr(std::string op, ExprPtr lhs, ExprPtr rhs)
            : Expr(Kind::Binary), op(std::move(op)), lhs(std::move(lhs)), rhs(std::move(rhs)) {}

        const std::string &getOp() const { return op; }
        const Expr *getLHS() const { return lhs.get(); }
        const Expr *getRHS() const { return rhs.get(); }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< BinaryExpr >(op, lhs->clone(), rhs->clone()));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Binary; }

      private:
        std::string op;
        ExprPtr lhs;
        ExprPtr rhs;
    };

    // Simple (`=`) and compound (`+=`, `-=`, ...) assignment.
    class AssignExpr final : public Expr
    {
      public:
        AssignExpr(std::string op, ExprPtr lhs, ExprPtr rhs)
            : Expr(Kind::Assign), op(std::move(op)), lhs(std::move(lhs)), rhs(std::move(rhs)) {}

        const std::string &getOp() const { return op; }
        const Expr *getLHS() const { return lhs.get(); }
        const Expr *getRHS() const { return rhs.get(); }
        bool isCompound() const { return op != "="; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< AssignExpr >(op, lhs->clone(), rhs->clone()));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Assign; }

      private:
        std::string op;
        ExprPtr lhs;
        ExprPtr rhs;
    };

    class CallExpr final : public Expr
    {
      public:
        CallExpr(ExprPtr receiver, std::string method, std::vector< ExprPtr > args)
            : Expr(Kind::Call)
            , receiver(std::move(receiver))
            , method(std::move(method))
            , args(std::move(args)) {}

        // Null for unqualified calls.
        const Expr *getReceiver() const { return receiver.get(); }
        const std::string &getMethod() const { return method; }
        const std::vector< ExprPtr > &getArgs() const { return args; }
        std::size_t getNumArgs() const { return args.size(); }
        const Expr *getArg(std::size_t index) const { return args[index].get(); }

        ExprPtr clone() const override;

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Call; }

      private:
        ExprPtr receiver;
        std::string method;
        std::vector< ExprPtr > args;
    };

    class FieldAccessExpr final : public Expr
    {
      public:
        FieldAccessExpr(ExprPtr base, std::string name)
            : Expr(Kind::FieldAccess), base(std::move(base)), name(std::move(name)) {}

        const Expr *getBase() const { return base.get(); }
        const std::string &getName() const { return name; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< FieldAccessExpr >(base->clone(), name));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::FieldAccess; }

      private:
        ExprPtr base;
        std::string name;
    };

    class ArrayAccessExpr final : public Expr
    {
      public:
        ArrayAccessExpr(ExprPtr base, ExprPtr index)
            : Expr(Kind::ArrayAccess), base(std::move(base)), index(std::move(index)) {}

        const Expr *getBase() const { return base.get(); }
        const Expr *getIndex() const { return index.get(); }

        ExprPtr clone() const override {
            return finishClone(
                std::make_unique< ArrayAccessExpr >(base->clone(), index->clone())
            );
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::ArrayAccess; }

      private:
        ExprPtr base;
        ExprPtr index;
    };

    class NewExpr final : public Expr
    {
      public:
        NewExpr(std::string class_type, std::vector< ExprPtr > args)
            : Expr(Kind::New), class_type(std::move(class_type)), args(std::move(args)) {}

        // The instantiated type as written, e.g. `ArrayList<>`.
        const std::string &getClassType() const { return class_type; }
        const std::vector< ExprPtr > &getArgs() const { return args; }

        ExprPtr clone() const override;

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::New; }

      private:
        std::string class_type;
        std::vector< ExprPtr > args;
    };

    class CastExpr final : public Expr
    {
      public:
        CastExpr(std::string target, ExprPtr sub)
            : Expr(Kind::Cast), target(std::move(target)), sub(std::move(sub)) {}

        const std::string &getTargetType() const { return target; }
        const Expr *getSubExpr() const { return sub.get(); }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< CastExpr >(target, sub->clone()));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Cast; }

      private:
        std::string target;
        ExprPtr sub;
    };

    class ConditionalExpr final : public Expr
    {
      public:
        ConditionalExpr(ExprPtr cond, ExprPtr then_expr, ExprPtr else_expr)
            : Expr(Kind::Conditional)
            , cond(std::move(cond))
            , then_expr(std::move(then_expr))
            , else_expr(std::move(else_expr)) {}

        const Expr *getCond() const { return cond.get(); }
        const Expr *getThen() const { return then_expr.get(); }
        const Expr *getElse() const { return else_expr.get(); }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< ConditionalExpr >(
                cond->clone(), then_expr->clone(), else_expr->clone()
            ));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Conditional; }

      private:
        ExprPtr cond;
        ExprPtr then_expr;
        ExprPtr else_expr;
    };

    class ThisExpr final : public Expr
    {
      public:
        ThisExpr() : Expr(Kind::This) {}

        ExprPtr clone() const override { return finishClone(std::make_unique< ThisExpr >()); }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::This; }
    };

    // Lambda with either an expression body or a block body.
    class LambdaExpr final : public Expr
    {
      public:
        LambdaExpr(std::vector< std::string > params, ExprPtr expr_body);
        LambdaExpr(std::vector< std::string > params, StmtPtr block_body);
        ~LambdaExpr() override;

        const std::vector< std::string > &getParams() const { return params; }
        const Expr *getExprBody() const { return expr_body.get(); }
        const Stmt *getBlockBody() const { return block_body.get(); }

        ExprPtr clone() const override;

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::Lambda; }

      private:
        std::vector< std::string > params;
        ExprPtr expr_body;
        StmtPtr block_body;
    };

    class MethodRefExpr final : public Expr
    {
      public:
        MethodRefExpr(std::string qualifier, std::string method)
            : Expr(Kind::MethodRef), qualifier(std::move(qualifier)), method(std::move(method)) {}

        const std::string &getQualifier() const { return qualifier; }
        const std::string &getMethod() const { return method; }

        ExprPtr clone() const override {
            return finishClone(std::make_unique< MethodRefExpr >(qualifier, method));
        }

        static bool classof(const Expr *expr) { return expr->getKind() == Kind::MethodRef; }

      private:
        std::string qualifier;
        std::string method;
    };

    // =========================================================================
    // Statements
    // =========================================================================

    class Stmt
    {
      public:
        enum class Kind : uint8_t {
            Block,
            Expr,
            Decl,
            If,
            Return,
            Break,
            Continue,
            Throw,
            ForEach,
            For,
            While,
            Do,
            Try,
            Switch,
            Synchronized,
            Labeled,
            Empty
        };

        virtual ~Stmt() = default;

        Kind getKind() const { return kind; }

        // Source location as reported by the front end (e.g. `Foo.java:12`).
        const std::string &location() const { return loc; }
        void setLocation(std::string location) { loc = std::move(location); }

        bool isLoop() const {
            return kind == Kind::ForEach || kind == Kind::For || kind == Kind::While
                || kind == Kind::Do;
        }

        virtual StmtPtr clone() const = 0;

      protected:
        explicit Stmt(Kind kind) : kind(kind) {}

        StmtPtr finishClone(StmtPtr copy) const {
            copy->loc = loc;
            return copy;
        }

      private:
        Kind kind;
        std::string loc;
    };

    // One declared variable; shared by local declarations, parameters and fields.
    struct VarDecl
    {
        std::string name;
        std::string type;
        bool is_final = false;
        bool non_null = false;
        ExprPtr init;

        VarDecl clone() const {
            return VarDecl{ .name     = name,
                            .type     = type,
                            .is_final = is_final,
                            .non_null = non_null,
                            .init     = init ? init->clone() : nullptr };
        }
    };

    class BlockStmt final : public Stmt
    {
      public:
        explicit BlockStmt(std::vector< StmtPtr > stmts)
            : Stmt(Kind::Block), stmts(std::move(stmts)) {}

        const std::vector< StmtPtr > &body() const { return stmts; }
        std::size_t size() const { return stmts.size(); }
        bool empty() const { return stmts.empty(); }

        StmtPtr clone() const override;

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Block; }

      private:
        std::vector< StmtPtr > stmts;
    };

    class ExprStmt final : public Stmt
    {
      public:
        explicit ExprStmt(ExprPtr expr) : Stmt(Kind::Expr), expr(std::move(expr)) {}

        const Expr *getExpr() const { return expr.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< ExprStmt >(expr->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Expr; }

      private:
        ExprPtr expr;
    };

    class DeclStmt final : public Stmt
    {
      public:
        explicit DeclStmt(std::vector< VarDecl > vars) : Stmt(Kind::Decl), vars(std::move(vars)) {}

        const std::vector< VarDecl > &decls() const { return vars; }
        bool isSingleDecl() const { return vars.size() == 1U; }
        const VarDecl &getSingleDecl() const { return vars.front(); }

        StmtPtr clone() const override;

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Decl; }

      private:
        std::vector< VarDecl > vars;
    };

    class IfStmt final : public Stmt
    {
      public:
        IfStmt(ExprPtr cond, StmtPtr then_stmt, StmtPtr else_stmt)
            : Stmt(Kind::If)
            , cond(std::move(cond))
            , then_stmt(std::move(then_stmt))
            , else_stmt(std::move(else_stmt)) {}

        const Expr *getCond() const { return cond.get(); }
        const Stmt *getThen() const { return then_stmt.get(); }
        const Stmt *getElse() const { return else_stmt.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< IfStmt >(
                cond->clone(), then_stmt->clone(), else_stmt ? else_stmt->clone() : nullptr
            ));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::If; }

      private:
        ExprPtr cond;
        StmtPtr then_stmt;
        StmtPtr else_stmt;
    };

    class ReturnStmt final : public Stmt
    {
      public:
        explicit ReturnStmt(ExprPtr value) : Stmt(Kind::Return), value(std::move(value)) {}

        // Null for a bare `return;`.
        const Expr *getValue() const { return value.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< ReturnStmt >(value ? value->clone() : nullptr));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Return; }

      private:
        ExprPtr value;
    };

    class BreakStmt final : public Stmt
    {
      public:
        explicit BreakStmt(std::string label) : Stmt(Kind::Break), label(std::move(label)) {}

        const std::string &getLabel() const { return label; }
        bool hasLabel() const { return !label.empty(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< BreakStmt >(label));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Break; }

      private:
        std::string label;
    };

    class ContinueStmt final : public Stmt
    {
      public:
        explicit ContinueStmt(std::string label) : Stmt(Kind::Continue), label(std::move(label)) {}

        const std::string &getLabel() const { return label; }
        bool hasLabel() const { return !label.empty(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< ContinueStmt >(label));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Continue; }

      private:
        std::string label;
    };

    class ThrowStmt final : public Stmt
    {
      public:
        explicit ThrowStmt(ExprPtr value) : Stmt(Kind::Throw), value(std::move(value)) {}

        const Expr *getValue() const { return value.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< ThrowStmt >(value->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Throw; }

      private:
        ExprPtr value;
    };

    // Enhanced for loop: for (T var : iterable) body
    class ForEachStmt final : public Stmt
    {
      public:
        ForEachStmt(VarDecl var, ExprPtr iterable, StmtPtr body)
            : Stmt(Kind::ForEach)
            , var(std::move(var))
            , iterable(std::move(iterable))
            , body(std::move(body)) {}

        const VarDecl &getVar() const { return var; }
        const Expr *getIterable() const { return iterable.get(); }
        const Stmt *getBody() const { return body.get(); }

        StmtPtr clone() const override {
            return finishClone(
                std::make_unique< ForEachStmt >(var.clone(), iterable->clone(), body->clone())
            );
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::ForEach; }

      private:
        VarDecl var;
        ExprPtr iterable;
        StmtPtr body;
    };

    class ForStmt final : public Stmt
    {
      public:
        ForStmt(
            std::vector< StmtPtr > init, ExprPtr cond, std::vector< ExprPtr > updates,
            StmtPtr body
        )
            : Stmt(Kind::For)
            , init(std::move(init))
            , cond(std::move(cond))
            , updates(std::move(updates))
            , body(std::move(body)) {}

        const std::vector< StmtPtr > &getInit() const { return init; }
        // Null when the condition is omitted.
        const Expr *getCond() const { return cond.get(); }
        const std::vector< ExprPtr > &getUpdates() const { return updates; }
        const Stmt *getBody() const { return body.get(); }

        StmtPtr clone() const override;

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::For; }

      private:
        std::vector< StmtPtr > init;
        ExprPtr cond;
        std::vector< ExprPtr > updates;
        StmtPtr body;
    };

    class WhileStmt final : public Stmt
    {
      public:
        WhileStmt(ExprPtr cond, StmtPtr body)
            : Stmt(Kind::While), cond(std::move(cond)), body(std::move(body)) {}

        const Expr *getCond() const { return cond.get(); }
        const Stmt *getBody() const { return body.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< WhileStmt >(cond->clone(), body->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::While; }

      private:
        ExprPtr cond;
        StmtPtr body;
    };

    class DoStmt final : public Stmt
    {
      public:
        DoStmt(StmtPtr body, ExprPtr cond)
            : Stmt(Kind::Do), body(std::move(body)), cond(std::move(cond)) {}

        const Stmt *getBody() const { return body.get(); }
        const Expr *getCond() const { return cond.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< DoStmt >(body->clone(), cond->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Do; }

      private:
        StmtPtr body;
        ExprPtr cond;
    };

    struct CatchClause
    {
        VarDecl param;
        StmtPtr body;
    };

    class TryStmt final : public Stmt
    {
      public:
        TryStmt(StmtPtr body, std::vector< CatchClause > catches, StmtPtr finally_body)
            : Stmt(Kind::Try)
            , body(std::move(body))
            , catches(std::move(catches))
            , finally_body(std::move(finally_body)) {}

        const Stmt *getBody() const { return body.get(); }
        const std::vector< CatchClause > &getCatches() const { return catches; }
        const Stmt *getFinally() const { return finally_body.get(); }

        StmtPtr clone() const override;

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Try; }

      private:
        StmtPtr body;
        std::vector< CatchClause > catches;
        StmtPtr finally_body;
    };

    // A `case` group; no labels means `default`.
    struct SwitchCase
    {
        std::vector< ExprPtr > labels;
        std::vector< StmtPtr > body;
    };

    class SwitchStmt final : public Stmt
    {
      public:
        SwitchStmt(ExprPtr selector, std::vector< SwitchCase > cases)
            : Stmt(Kind::Switch), selector(std::move(selector)), cases(std::move(cases)) {}

        const Expr *getSelector() const { return selector.get(); }
        const std::vector< SwitchCase > &getCases() const { return cases; }

        StmtPtr clone() const override;

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Switch; }

      private:
        ExprPtr selector;
        std::vector< SwitchCase > cases;
    };

    class SynchronizedStmt final : public Stmt
    {
      public:
        SynchronizedStmt(ExprPtr lock, StmtPtr body)
            : Stmt(Kind::Synchronized), lock(std::move(lock)), body(std::move(body)) {}

        const Expr *getLock() const { return lock.get(); }
        const Stmt *getBody() const { return body.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< SynchronizedStmt >(lock->clone(), body->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Synchronized; }

      private:
        ExprPtr lock;
        StmtPtr body;
    };

    class LabeledStmt final : public Stmt
    {
      public:
        LabeledStmt(std::string label, StmtPtr body)
            : Stmt(Kind::Labeled), label(std::move(label)), body(std::move(body)) {}

        const std::string &getLabel() const { return label; }
        const Stmt *getBody() const { return body.get(); }

        StmtPtr clone() const override {
            return finishClone(std::make_unique< LabeledStmt >(label, body->clone()));
        }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Labeled; }

      private:
        std::string label;
        StmtPtr body;
    };

    class EmptyStmt final : public Stmt
    {
      public:
        EmptyStmt() : Stmt(Kind::Empty) {}

        StmtPtr clone() const override { return finishClone(std::make_unique< EmptyStmt >()); }

        static bool classof(const Stmt *stmt) { return stmt->getKind() == Kind::Empty; }
    };

    // =========================================================================
    // Declarations
    // =========================================================================

    struct MethodDecl
    {
        std::string name;
        std::string return_type;
        std::vector< VarDecl > params;
        std::unique_ptr< BlockStmt > body; // null for abstract methods
    };

    struct TypeDecl
    {
        std::string name;
        std::vector< VarDecl > fields;
        std::vector< MethodDecl > methods;
    };

    struct CompilationUnit
    {
        std::string name;
        std::vector< TypeDecl > types;
    };

} // namespace pipelift::ast
