/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

/**
 * @brief Abstract loop model: the iterated source, the per-iteration element,
 * the ordered map/filter chain and the single terminal action.
 *
 * Every expression is stored as printed source text. `consumed` lists record
 * the loop-local names (element, body declarations) an entry reads; the
 * renderer re-validates them against the names available at that point of
 * the chain. `captured` lists record the enclosing locals and parameters an
 * entry reads; they end up inside a lambda and must be effectively final.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include <pipelift/Model/Reducer.hpp>

namespace pipelift::model {

    enum class SourceKind : uint8_t { Array = 0, Collection, Iterable };

    const char *toString(SourceKind kind);

    struct SourceDescriptor
    {
        SourceKind kind = SourceKind::Collection;
        std::string expression;
        std::string element_type;
    };

    struct ElementBinding
    {
        std::string name;
        std::string type;
        bool is_final = false;
    };

    // Name given to the value produced by a counting map (`x -> 1`).
    inline constexpr const char *kCountingVariable = "_item";

    struct MapOp
    {
        std::string expression;
        std::string produced_variable;
        std::optional< std::string > output_type;
        std::vector< std::string > consumed;
        std::vector< std::string > captured;
    };

    struct FilterOp
    {
        std::string predicate;
        std::vector< std::string > consumed;
        std::vector< std::string > captured;
    };

    using Operation = std::variant< MapOp, FilterOp >;

    struct ForEachTerminal
    {
        std::vector< std::string > body;
        bool ordered = false;
        // The body is one expression statement and renders as an expression lambda.
        bool single_expression = false;
        std::vector< std::string > consumed;
        std::vector< std::string > captured;
    };

    enum class CollectorKind : uint8_t { ToList = 0, ToSet };

    const char *toString(CollectorKind kind);

    struct CollectTerminal
    {
        CollectorKind kind = CollectorKind::ToList;
        std::string target;
        std::string target_type;
    };

    struct ReduceTerminal
    {
        std::string identity;
        std::string accumulator_fn;
        ReducerKind kind = ReducerKind::Sum;
        std::string accumulator;
        std::string accumulator_type;
    };

    enum class MatchKind : uint8_t { Any = 0, None, All };

    const char *toString(MatchKind kind);

    struct MatchTerminal
    {
        MatchKind kind = MatchKind::Any;
        std::string condition;
        std::vector< std::string > consumed;
        std::vector< std::string > captured;
    };

    using Terminal = std::variant< ForEachTerminal, CollectTerminal, ReduceTerminal, MatchTerminal >;

    struct LoopMetadata
    {
        bool has_break            = false;
        bool has_labeled_continue = false;
    };

    struct LoopModel
    {
        SourceDescriptor source;
        ElementBinding element;
        std::vector< Operation > operations;
        std::optional< Terminal > terminal;
        LoopMetadata metadata;

        // A model without terminal, or with disqualifying control flow, is
        // never converted.
        bool isConvertible() const {
            return terminal.has_value() && !metadata.has_break && !metadata.has_labeled_continue;
        }

        // Parameter name of the lambda for the next chain entry: the variable
        // produced by the last map, else the element.
        std::string currentVariable() const;
    };

    // Multi-line human readable dump used by verbose logging.
    void describe(const LoopModel &model, llvm::raw_ostream &os);

} // namespace pipelift::model
