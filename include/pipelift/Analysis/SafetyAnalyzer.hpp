/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include <llvm/ADT/StringRef.h>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Model/LoopModel.hpp>
#include <pipelift/Util/Options.hpp>

namespace pipelift::analysis {

    struct SafetyVerdict
    {
        bool safe = true;
        std::string reason;

        static SafetyVerdict accept() { return {}; }

        static SafetyVerdict reject(std::string reason) {
            return SafetyVerdict{ .safe = false, .reason = std::move(reason) };
        }

        explicit operator bool() const { return safe; }
    };

    // Origin of an iterated collection, ordered from safest to least safe.
    enum class ThreadSafety : uint8_t {
        LocallyCreated = 0,
        ConcurrentSafeType,
        Immutable,
        SynchronizedWrapper,
        PotentiallyShared
    };

    const char *toString(ThreadSafety safety);

    // Declaration facts about the method enclosing the loops under analysis.
    class MethodContext
    {
      public:
        explicit MethodContext(const ast::MethodDecl &method);

        // Initializer of the first local declaration named `name`, or null.
        const ast::Expr *initializerOf(llvm::StringRef name) const;

        bool isParameter(llvm::StringRef name) const;

        // Locals and parameters written anywhere in the method after their declaration.
        const std::set< std::string > &modifiedNames() const { return modified; }

        // Every parameter and local declared in the method, lambda parameters included.
        const std::set< std::string > &declaredNames() const { return declared; }

      private:
        std::unordered_map< std::string, const ast::Expr * > initializers;
        std::set< std::string > parameters;
        std::set< std::string > modified;
        std::set< std::string > declared;
    };

    // Source kind of a loop over a value of static type `type`; unsupported
    // types (maps, streams, iterators, optionals, non-boxable primitive
    // arrays) yield std::nullopt.
    std::optional< model::SourceKind >
    classifySourceKind(llvm::StringRef type, const Options &options);

    ThreadSafety classifyThreadSafety(
        const ast::Expr &source, const MethodContext &method, const Options &options
    );

    model::LoopMetadata scanControlFlow(const LoopView &view);

    // Checks that only depend on the loop shape: source kind, control flow,
    // disallowed nested statements, source modification and, for indexed
    // loops, the thread safety of the source.
    SafetyVerdict
    checkStructure(const LoopView &view, const MethodContext &method, const Options &options);

    // Rejects writes to simple names that are neither declared in the loop,
    // fields, nor the accumulator of a reduce terminal.
    SafetyVerdict checkSideEffects(const LoopView &view, const model::LoopModel &model);

    // Lambda bodies may only capture effectively final locals.
    SafetyVerdict checkCapturedVariables(const model::LoopModel &model, const MethodContext &method);

} // namespace pipelift::analysis
