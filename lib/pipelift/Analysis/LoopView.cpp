/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/LoopView.hpp>

#include <llvm/ADT/StringSet.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Util/Log.hpp>

namespace pipelift::analysis {

    namespace {

        // Sources that can be re-evaluated on every iteration without side effects.
        bool isStableReference(const ast::Expr *expr) {
            expr = ast::ignoreParens(expr);
            if (llvm::isa< ast::NameExpr >(expr)) {
                return true;
            }
            if (const auto *access = llvm::dyn_cast< ast::FieldAccessExpr >(expr)) {
                const auto *base = ast::ignoreParens(access->getBase());
                return llvm::isa< ast::ThisExpr >(base) || isStableReference(base);
            }
            return false;
        }

        bool sameReference(const ast::Expr *lhs, const ast::Expr *rhs) {
            return ast::toString(*ast::ignoreParens(lhs)) == ast::toString(*ast::ignoreParens(rhs));
        }

        bool isIndexIncrement(const ast::Expr *update, llvm::StringRef index) {
            update = ast::ignoreParens(update);
            if (const auto *unary = llvm::dyn_cast< ast::UnaryExpr >(update)) {
                return unary->isIncrement() && ast::isIdentityReference(unary->getOperand(), index);
            }
            if (const auto *assign = llvm::dyn_cast< ast::AssignExpr >(update)) {
                const auto *step = llvm::dyn_cast< ast::LiteralExpr >(ast::ignoreParens(assign->getRHS()));
                return assign->getOp() == "+=" && ast::isIdentityReference(assign->getLHS(), index)
                    && step != nullptr && step->getSpelling() == "1";
            }
            return false;
        }

        // `T x = <fetch>;` as the first body statement.
        const ast::VarDecl *elementFetch(const ast::Stmt *stmt) {
            const auto *decl = llvm::dyn_cast_or_null< ast::DeclStmt >(stmt);
            if (decl == nullptr || !decl->isSingleDecl() || !decl->getSingleDecl().init) {
                return nullptr;
            }
            return &decl->getSingleDecl();
        }

        // Receivers that are already part of a stream pipeline.
        const llvm::StringSet<> kStreamOperations = {
            "stream", "parallelStream", "map",   "filter", "flatMap", "sorted",   "distinct",
            "limit",  "skip",           "peek",  "boxed",  "mapToObj", "mapToInt", "mapToLong",
            "mapToDouble", "parallel", "sequential", "unordered", "takeWhile", "dropWhile"
        };

        bool mentionedIn(llvm::ArrayRef< const ast::Stmt * > stmts, llvm::StringRef name) {
            for (const auto *stmt : stmts) {
                if (mentionsName(*stmt, name)) {
                    return true;
                }
            }
            return false;
        }

    } // namespace

    const char *toString(LoopForm form) {
        switch (form) {
            case LoopForm::EnhancedFor:
                return "enhanced-for";
            case LoopForm::IndexedFor:
                return "indexed-for";
            case LoopForm::IteratorWhile:
                return "iterator-while";
            case LoopForm::ForEachCall:
                return "forEach-call";
        }
        UNREACHABLE("unknown loop form {0}", static_cast< int >(form));
    }

    std::string LoopView::sourceType() const {
        if (source == nullptr) {
            return {};
        }
        if (!source->type().empty()) {
            return source->type();
        }
        if (const auto *name = ast::asSimpleName(source)) {
            return name->getBinding().type;
        }
        return {};
    }

    std::optional< LoopView > viewEnhancedFor(const ast::ForEachStmt &loop) {
        return LoopView{ .form             = LoopForm::EnhancedFor,
                         .loop             = &loop,
                         .source           = loop.getIterable(),
                         .element_name     = loop.getVar().name,
                         .element_type     = loop.getVar().type,
                         .element_final    = loop.getVar().is_final,
                         .element_non_null = loop.getVar().non_null,
                         .body             = ast::flattenBody(loop.getBody()),
                         .control_variable = {},
                         .companion        = nullptr };
    }

    std::optional< LoopView > viewIndexedFor(const ast::ForStmt &loop) {
        // for (int i = 0; ...)
        if (loop.getInit().size() != 1U) {
            return std::nullopt;
        }
        const auto *init = llvm::dyn_cast< ast::DeclStmt >(loop.getInit().front().get());
        if (init == nullptr || !init->isSingleDecl()) {
            return std::nullopt;
        }
        const auto &index = init->getSingleDecl();
        const auto *start = llvm::dyn_cast_or_null< ast::LiteralExpr >(ast::ignoreParens(index.init.get()));
        if (start == nullptr || start->getSpelling() != "0") {
            return std::nullopt;
        }

        // i < source.size() / i < source.length
        const auto *cond = llvm::dyn_cast_or_null< ast::BinaryExpr >(ast::ignoreParens(loop.getCond()));
        if (cond == nullptr || cond->getOp() != "<" || !ast::isIdentityReference(cond->getLHS(), index.name)) {
            return std::nullopt;
        }

        const ast::Expr *source = nullptr;
        bool is_array           = false;
        const auto *bound       = ast::ignoreParens(cond->getRHS());
        if (const auto *size = llvm::dyn_cast< ast::CallExpr >(bound)) {
            if (size->getMethod() == "size" && size->getNumArgs() == 0U && size->getReceiver() != nullptr) {
                source = size->getReceiver();
            }
        } else if (const auto *length = llvm::dyn_cast< ast::FieldAccessExpr >(bound)) {
            if (length->getName() == "length") {
                source   = length->getBase();
                is_array = true;
            }
        }
        if (source == nullptr || !isStableReference(source)) {
            return std::nullopt;
        }

        if (loop.getUpdates().size() != 1U || !isIndexIncrement(loop.getUpdates().front().get(), index.name)) {
            return std::nullopt;
        }

        // T x = source.get(i) / T x = source[i]
        auto body           = ast::flattenBody(loop.getBody());
        const auto *element = body.empty() ? nullptr : elementFetch(body.front());
        if (element == nullptr) {
            return std::nullopt;
        }
        const auto *fetch = ast::ignoreParens(element->init.get());
        if (is_array) {
            const auto *access = llvm::dyn_cast< ast::ArrayAccessExpr >(fetch);
            if (access == nullptr || !sameReference(access->getBase(), source)
                || !ast::isIdentityReference(access->getIndex(), index.name))
            {
                return std::nullopt;
            }
        } else {
            const auto *get = llvm::dyn_cast< ast::CallExpr >(fetch);
            if (get == nullptr || get->getMethod() != "get" || get->getNumArgs() != 1U
                || get->getReceiver() == nullptr || !sameReference(get->getReceiver(), source)
                || !ast::isIdentityReference(get->getArg(0), index.name))
            {
                return std::nullopt;
            }
        }

        body.erase(body.begin());
        if (mentionedIn(body, index.name)) {
            return std::nullopt;
        }

        return LoopView{ .form             = LoopForm::IndexedFor,
                         .loop             = &loop,
                         .source           = source,
                         .element_name     = element->name,
                         .element_type     = element->type,
                         .element_final    = element->is_final,
                         .element_non_null = element->non_null,
                         .body             = std::move(body),
                         .control_variable = index.name,
                         .companion        = nullptr };
    }

    std::optional< LoopView > viewForEachCall(const ast::ExprStmt &stmt) {
        const auto *call = llvm::dyn_cast< ast::CallExpr >(ast::ignoreParens(stmt.getExpr()));
        if (call == nullptr || call->getMethod() != "forEach" || call->getNumArgs() != 1U
            || call->getReceiver() == nullptr)
        {
            return std::nullopt;
        }
        const auto *lambda = llvm::dyn_cast< ast::LambdaExpr >(ast::ignoreParens(call->getArg(0)));
        if (lambda == nullptr || lambda->getParams().size() != 1U) {
            return std::nullopt;
        }

        // coll.stream().forEach(...) iterates `coll`.
        const auto *source = ast::ignoreParens(call->getReceiver());
        if (const auto *stream = llvm::dyn_cast< ast::CallExpr >(source)) {
            if (stream->getMethod() == "stream" && stream->getNumArgs() == 0U
                && stream->getReceiver() != nullptr)
            {
                source = ast::ignoreParens(stream->getReceiver());
            }
        }
        if (const auto *chained = llvm::dyn_cast< ast::CallExpr >(source)) {
            if (kStreamOperations.contains(chained->getMethod())) {
                return std::nullopt;
            }
        }

        LoopView view{ .form             = LoopForm::ForEachCall,
                       .loop             = &stmt,
                       .source           = source,
                       .element_name     = lambda->getParams().front(),
                       .element_type     = {},
                       .element_final    = false,
                       .element_non_null = false,
                       .body             = {},
                       .control_variable = {},
                       .companion        = nullptr,
                       .synthesized      = nullptr };
        view.element_type = ast::elementType(view.sourceType());

        if (const auto *block = lambda->getBlockBody()) {
            view.body = ast::flattenBody(block);
        } else if (const auto *expr = lambda->getExprBody()) {
            auto wrapped = ast::build::exprStmt(expr->clone());
            wrapped->setLocation(stmt.location());
            view.synthesized = std::move(wrapped);
            view.body.push_back(view.synthesized.get());
        }
        return view;
    }

    std::optional< LoopView > viewIteratorWhile(
        const ast::WhileStmt &loop, const ast::Stmt *preceding,
        llvm::ArrayRef< const ast::Stmt * > following
    ) {
        // Iterator<T> it = source.iterator();
        const auto *iterator = elementFetch(preceding);
        if (iterator == nullptr) {
            return std::nullopt;
        }
        if (!iterator->type.empty() && ast::erasure(iterator->type) != "Iterator") {
            return std::nullopt;
        }
        const auto *obtain = llvm::dyn_cast< ast::CallExpr >(ast::ignoreParens(iterator->init.get()));
        if (obtain == nullptr || obtain->getMethod() != "iterator" || obtain->getNumArgs() != 0U
            || obtain->getReceiver() == nullptr)
        {
            return std::nullopt;
        }

        // while (it.hasNext())
        const auto *has_next = llvm::dyn_cast< ast::CallExpr >(ast::ignoreParens(loop.getCond()));
        if (has_next == nullptr || has_next->getMethod() != "hasNext" || has_next->getNumArgs() != 0U
            || !ast::isIdentityReference(has_next->getReceiver(), iterator->name))
        {
            return std::nullopt;
        }

        // T x = it.next();
        auto body           = ast::flattenBody(loop.getBody());
        const auto *element = body.empty() ? nullptr : elementFetch(body.front());
        if (element == nullptr) {
            return std::nullopt;
        }
        const auto *next = llvm::dyn_cast< ast::CallExpr >(ast::ignoreParens(element->init.get()));
        if (next == nullptr || next->getMethod() != "next" || next->getNumArgs() != 0U
            || !ast::isIdentityReference(next->getReceiver(), iterator->name))
        {
            return std::nullopt;
        }

        body.erase(body.begin());
        if (mentionedIn(body, iterator->name) || mentionedIn(following, iterator->name)) {
            return std::nullopt;
        }

        auto element_type = element->type;
        if (element_type.empty() || element_type == "var") {
            element_type = ast::elementType(iterator->type);
        }

        return LoopView{ .form             = LoopForm::IteratorWhile,
                         .loop             = &loop,
                         .source           = obtain->getReceiver(),
                         .element_name     = element->name,
                         .element_type     = std::move(element_type),
                         .element_final    = element->is_final,
                         .element_non_null = element->non_null,
                         .body             = std::move(body),
                         .control_variable = iterator->name,
                         .companion        = preceding };
    }

} // namespace pipelift::analysis
