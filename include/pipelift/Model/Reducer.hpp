/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>

#include <llvm/ADT/StringRef.h>

namespace pipelift::model {

    enum class ReducerKind : uint8_t {
        Increment = 0, // acc++ / ++acc / acc += 1 counting form
        Decrement,     // acc-- / --acc, and acc -= expr
        Sum,           // acc += expr
        Product,       // acc *= expr
        StringConcat,  // acc += expr on a String accumulator
        Max,           // acc = Math.max(acc, expr)
        Min            // acc = Math.min(acc, expr)
    };

    const char *toString(ReducerKind kind);

    // Numeric family of an accumulator type; wrapper and primitive spellings
    // collapse onto the same category.
    enum class NumericCategory : uint8_t { Int, Long, Double, Float, Short, Byte, Char, String, Unknown };

    NumericCategory categorize(llvm::StringRef type);

    // Literal `1` spelled for the accumulator type: `1L`, `1.0`, `(short) 1`, ...
    std::string countingLiteral(llvm::StringRef accumulator_type);

    // Combining function passed to `reduce`. `operands_non_null` enables
    // String::concat for string accumulation. Lambda parameters avoid every
    // name in `names_in_use`.
    std::string combinerFor(
        ReducerKind kind, llvm::StringRef accumulator_type, bool operands_non_null,
        const std::set< std::string > &names_in_use = {}
    );

    // `base`, or `base1`, `base2`, ... for the first spelling not in `names_in_use`.
    std::string freshName(const std::string &base, const std::set< std::string > &names_in_use);

    // Statement folding `value` into `accumulator` inside an imperative loop.
    // `counting` is set when `value` is the counting literal map.
    std::string loopUpdateFor(
        ReducerKind kind, llvm::StringRef accumulator, llvm::StringRef value, bool counting
    );

} // namespace pipelift::model
