/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <llvm/Support/YAMLTraits.h>

#include <pipelift/Util/Log.hpp>
#include <pipelift/Util/Options.hpp>
#include <pipelift/YAML/BaseSpec.hpp>
#include <pipelift/YAML/YAMLParser.hpp>

namespace pipelift::config {

    struct Features
    {
        bool consecutive_loop_grouping = true;
        bool merge_declarations        = true;
        bool index_loops               = true;
        bool iterator_loops            = true;
    };

    struct TypeTables
    {
        std::vector< std::string > collections;
        std::vector< std::string > concurrent;
    };

    struct ConversionConfig
    {
        std::string api_version;
        Metadata metadata;
        TargetFormat target = TargetFormat::Stream;
        Features features;
        TypeTables types;
    };

    // Which settings were already given explicitly and must not be overridden by a file.
    struct ExplicitSettings
    {
        bool target        = false;
        bool loop_grouping = false;
    };

} // namespace pipelift::config

namespace pipelift::yaml {

    namespace utils {

        [[maybe_unused]] static std::optional< config::ConversionConfig >
        loadConfiguration(const std::string &file_path) {
            YAMLParser parser;
            auto result = parser.parse_from_file< config::ConversionConfig >(file_path);
            if (!result) {
                LOG(ERROR) << "Failed to load pipelift configuration: " << file_path << "\n";
                return std::nullopt;
            }
            return result;
        }

        // Folds a configuration document into the options; type tables are appended.
        [[maybe_unused]] static void applyConfiguration(
            const config::ConversionConfig &config, Options &options,
            const config::ExplicitSettings &fixed = {}
        ) {
            if (!fixed.target) {
                options.target_format = config.target;
            }
            if (!fixed.loop_grouping) {
                options.enable_loop_grouping = config.features.consecutive_loop_grouping;
            }
            options.merge_declarations     = config.features.merge_declarations;
            options.convert_index_loops    = config.features.index_loops;
            options.convert_iterator_loops = config.features.iterator_loops;

            options.collection_types.insert(
                options.collection_types.end(), config.types.collections.begin(),
                config.types.collections.end()
            );
            options.concurrent_types.insert(
                options.concurrent_types.end(), config.types.concurrent.begin(),
                config.types.concurrent.end()
            );
        }

    } // namespace utils

} // namespace pipelift::yaml

namespace llvm::yaml {

    template<>
    struct MappingTraits< pipelift::config::Features >
    {
        static void mapping(IO &io, pipelift::config::Features &features) {
            io.mapOptional("consecutive_loop_grouping", features.consecutive_loop_grouping, true);
            io.mapOptional("merge_declarations", features.merge_declarations, true);
            io.mapOptional("index_loops", features.index_loops, true);
            io.mapOptional("iterator_loops", features.iterator_loops, true);
        }
    };

    template<>
    struct MappingTraits< pipelift::config::TypeTables >
    {
        static void mapping(IO &io, pipelift::config::TypeTables &types) {
            io.mapOptional("collections", types.collections);
            io.mapOptional("concurrent", types.concurrent);
        }
    };

    template<>
    struct MappingTraits< pipelift::config::ConversionConfig >
    {
        static void mapping(IO &io, pipelift::config::ConversionConfig &config) {
            io.mapOptional("apiVersion", config.api_version);
            io.mapOptional("metadata", config.metadata);
            io.mapOptional("target", config.target, pipelift::TargetFormat::Stream);
            io.mapOptional("features", config.features);
            io.mapOptional("types", config.types);
        }

        static std::string validate(IO &, pipelift::config::ConversionConfig &config) {
            if (!config.api_version.empty()
                && !llvm::StringRef(config.api_version).startswith("pipelift/"))
            {
                return "unsupported apiVersion '" + config.api_version + "'";
            }
            return {};
        }
    };

} // namespace llvm::yaml
