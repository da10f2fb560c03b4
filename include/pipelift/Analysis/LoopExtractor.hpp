/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/ArrayRef.h>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Util/Options.hpp>

namespace pipelift::analysis {

    // Extraction stopped; the loop stays unchanged.
    struct Aborted
    {
        std::string reason;
    };

    // Operation chain and terminal decomposed from a loop body.
    struct Produced
    {
        std::vector< model::Operation > operations;
        model::Terminal terminal;
    };

    using ExtractionResult = std::variant< Aborted, Produced >;

    using ModelResult = std::variant< Aborted, model::LoopModel >;

    // Surroundings of the loop statement inside its enclosing block.
    struct ExtractionContext
    {
        // Statement right after the loop, or null.
        const ast::Stmt *following = nullptr;
        // Locals and parameters of the enclosing method; generated lambda
        // parameters must not redeclare them.
        std::set< std::string > names_in_use;
    };

    class LoopExtractor
    {
      public:
        LoopExtractor(const LoopView &view, ExtractionContext context, const Options &options);

        // Walks the body in statement order and classifies every statement.
        ExtractionResult extractPipeline();

        // Full model: source, element, pipeline and control-flow metadata.
        ModelResult extractModel();

      private:
        ExtractionResult
        extractStatements(llvm::ArrayRef< const ast::Stmt * > stmts, std::vector< model::Operation > ops);

        ExtractionResult fallbackForEach(
            llvm::ArrayRef< const ast::Stmt * > stmts, std::vector< model::Operation > ops
        );

        std::optional< model::Terminal > collectTerminal(
            const ast::Stmt &stmt, const std::string &current, std::vector< model::Operation > &ops
        );

        std::optional< model::Terminal > reduceTerminal(
            const ast::Stmt &stmt, const std::string &current, std::vector< model::Operation > &ops
        );

        // Loop-local names read by `expr`, and enclosing locals it captures.
        void recordUses(
            const std::vector< const ast::NameExpr * > &uses, std::vector< std::string > &consumed,
            std::vector< std::string > &captured
        ) const;

        bool mentionedOutside(const ast::Stmt &except, llvm::StringRef name) const;

        bool isProvablyNonNull(const ast::Expr *expr) const;

        // Method names plus every name declared by the loop body.
        std::set< std::string > reservedNames() const;

        std::string currentVariable(const std::vector< model::Operation > &ops) const;

        const LoopView &view;
        ExtractionContext context;
        const Options &options;
        std::set< std::string > locals;
    };

    ModelResult
    extractLoopModel(const LoopView &view, ExtractionContext context, const Options &options);

    // Model of a forEach call: the lambda body becomes a ForEach terminal over
    // the call's source. A `return` in the lambda body has no loop equivalent
    // without restructuring and aborts.
    ModelResult extractForEachCallModel(const LoopView &view, const Options &options);

} // namespace pipelift::analysis
