/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Model/Reducer.hpp>

#include <llvm/ADT/StringSwitch.h>

#include <pipelift/Util/Log.hpp>

namespace pipelift::model {

    namespace {

        bool isNarrow(NumericCategory category) {
            return category == NumericCategory::Short || category == NumericCategory::Byte
                || category == NumericCategory::Char;
        }

        const char *primitiveName(NumericCategory category) {
            switch (category) {
                case NumericCategory::Short:
                    return "short";
                case NumericCategory::Byte:
                    return "byte";
                case NumericCategory::Char:
                    return "char";
                default:
                    return "int";
            }
        }

        // Parameter names of a two-argument combiner lambda.
        struct LambdaParams
        {
            std::string lhs;
            std::string rhs;

            std::string head() const { return "(" + lhs + ", " + rhs + ") -> "; }
        };

        LambdaParams paramsFor(const std::set< std::string > &names_in_use) {
            return LambdaParams{ .lhs = freshName("a", names_in_use),
                                 .rhs = freshName("b", names_in_use) };
        }

        // `(a, b) -> a op b`, narrowed back for short/byte/char streams.
        std::string
        binaryLambda(llvm::StringRef op, NumericCategory category, const LambdaParams &params) {
            auto combined = params.lhs + " " + op.str() + " " + params.rhs;
            if (isNarrow(category)) {
                return params.head() + "(" + primitiveName(category) + ") (" + combined + ")";
            }
            return params.head() + combined;
        }

        std::string extremum(bool max, NumericCategory category, const LambdaParams &params) {
            const char *method = max ? "max" : "min";
            switch (category) {
                case NumericCategory::Int:
                    return std::string("Integer::") + method;
                case NumericCategory::Long:
                    return std::string("Long::") + method;
                case NumericCategory::Double:
                    return std::string("Double::") + method;
                case NumericCategory::Float:
                    return std::string("Float::") + method;
                case NumericCategory::Short:
                case NumericCategory::Byte:
                case NumericCategory::Char:
                    return params.head() + params.lhs + (max ? " >= " : " <= ") + params.rhs + " ? "
                        + params.lhs + " : " + params.rhs;
                case NumericCategory::String:
                case NumericCategory::Unknown:
                    return std::string("Math::") + method;
            }
            UNREACHABLE("unknown numeric category {0}", static_cast< int >(category));
        }

    } // namespace

    const char *toString(ReducerKind kind) {
        switch (kind) {
            case ReducerKind::Increment:
                return "Increment";
            case ReducerKind::Decrement:
                return "Decrement";
            case ReducerKind::Sum:
                return "Sum";
            case ReducerKind::Product:
                return "Product";
            case ReducerKind::StringConcat:
                return "StringConcat";
            case ReducerKind::Max:
                return "Max";
            case ReducerKind::Min:
                return "Min";
        }
        UNREACHABLE("unknown reducer kind {0}", static_cast< int >(kind));
    }

    NumericCategory categorize(llvm::StringRef type) {
        auto name = type.trim();
        name.consume_front("java.lang.");
        return llvm::StringSwitch< NumericCategory >(name)
            .Cases("int", "Integer", NumericCategory::Int)
            .Cases("long", "Long", NumericCategory::Long)
            .Cases("double", "Double", NumericCategory::Double)
            .Cases("float", "Float", NumericCategory::Float)
            .Cases("short", "Short", NumericCategory::Short)
            .Cases("byte", "Byte", NumericCategory::Byte)
            .Cases("char", "Character", NumericCategory::Char)
            .Case("String", NumericCategory::String)
            .Default(NumericCategory::Unknown);
    }

    std::string countingLiteral(llvm::StringRef accumulator_type) {
        switch (categorize(accumulator_type)) {
            case NumericCategory::Long:
                return "1L";
            case NumericCategory::Double:
                return "1.0";
            case NumericCategory::Float:
                return "1.0f";
            case NumericCategory::Short:
                return "(short) 1";
            case NumericCategory::Byte:
                return "(byte) 1";
            case NumericCategory::Char:
                return "(char) 1";
            case NumericCategory::Int:
            case NumericCategory::String:
            case NumericCategory::Unknown:
                return "1";
        }
        return "1";
    }

    std::string freshName(const std::string &base, const std::set< std::string > &names_in_use) {
        std::string candidate = base;
        for (unsigned suffix = 1; names_in_use.count(candidate) != 0U; ++suffix) {
            candidate = base + std::to_string(suffix);
        }
        return candidate;
    }

    std::string combinerFor(
        ReducerKind kind, llvm::StringRef accumulator_type, bool operands_non_null,
        const std::set< std::string > &names_in_use
    ) {
        auto category = categorize(accumulator_type);
        auto params   = paramsFor(names_in_use);
        switch (kind) {
            case ReducerKind::Increment:
            case ReducerKind::Sum:
                switch (category) {
                    case NumericCategory::Long:
                        return "Long::sum";
                    case NumericCategory::Double:
                        return "Double::sum";
                    case NumericCategory::Float:
                    case NumericCategory::Short:
                    case NumericCategory::Byte:
                    case NumericCategory::Char:
                        return binaryLambda("+", category, params);
                    default:
                        return "Integer::sum";
                }
            case ReducerKind::Decrement:
                return binaryLambda("-", category, params);
            case ReducerKind::Product:
                return binaryLambda("*", category, params);
            case ReducerKind::StringConcat:
                return operands_non_null ? "String::concat" : binaryLambda("+", category, params);
            case ReducerKind::Max:
                return extremum(true, category, params);
            case ReducerKind::Min:
                return extremum(false, category, params);
        }
        UNREACHABLE("unknown reducer kind {0}", static_cast< int >(kind));
    }

    std::string loopUpdateFor(
        ReducerKind kind, llvm::StringRef accumulator, llvm::StringRef value, bool counting
    ) {
        auto acc = accumulator.str();
        switch (kind) {
            case ReducerKind::Increment:
                return counting ? acc + "++;" : acc + " += " + value.str() + ";";
            case ReducerKind::Decrement:
                return counting ? acc + "--;" : acc + " -= " + value.str() + ";";
            case ReducerKind::Sum:
            case ReducerKind::StringConcat:
                return acc + " += " + value.str() + ";";
            case ReducerKind::Product:
                return acc + " *= " + value.str() + ";";
            case ReducerKind::Max:
                return acc + " = Math.max(" + acc + ", " + value.str() + ");";
            case ReducerKind::Min:
                return acc + " = Math.min(" + acc + ", " + value.str() + ");";
        }
        UNREACHABLE("unknown reducer kind {0}", static_cast< int >(kind));
    }

} // namespace pipelift::model
