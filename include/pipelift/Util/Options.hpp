/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pipelift {

    enum class TargetFormat : uint8_t {
        Stream = 0,    // chained stream pipeline
        IteratorWhile, // Iterator<T> it = src.iterator(); while (it.hasNext()) ...
        EnhancedFor    // for (T x : src) ...
    };

    struct Options
    {
        bool verbose                = false;
        TargetFormat target_format  = TargetFormat::Stream;
        bool enable_loop_grouping   = true;
        bool merge_declarations     = true;
        bool convert_index_loops    = true;
        bool convert_iterator_loops = true;

        // Extra type names treated as collections / as concurrency-safe collections.
        std::vector< std::string > collection_types;
        std::vector< std::string > concurrent_types;

        std::string output_file;
        std::string input_file;
        std::string config_file;

        bool print_decisions = false;
    };

} // namespace pipelift
