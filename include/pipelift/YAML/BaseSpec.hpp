/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/Support/YAMLTraits.h>

#include <pipelift/Util/Options.hpp>

/* Domain objects shared by every pipelift configuration document. */
namespace pipelift::config {

    struct Metadata
    {
        std::string name;
        std::string description;
        std::string version;
        std::string author;
    };

} // namespace pipelift::config

namespace llvm::yaml {

    template<>
    struct MappingTraits< pipelift::config::Metadata >
    {
        static void mapping(IO &io, pipelift::config::Metadata &metadata) {
            io.mapOptional("name", metadata.name);
            io.mapOptional("description", metadata.description);
            io.mapOptional("version", metadata.version);
            io.mapOptional("author", metadata.author);
        }
    };

    // Any other scalar is rejected by the input with "unknown enumerated scalar".
    template<>
    struct ScalarEnumerationTraits< pipelift::TargetFormat >
    {
        static void enumeration(IO &io, pipelift::TargetFormat &value) {
            io.enumCase(value, "stream", pipelift::TargetFormat::Stream);
            io.enumCase(value, "iterator", pipelift::TargetFormat::IteratorWhile);
            io.enumCase(value, "enhanced-for", pipelift::TargetFormat::EnhancedFor);
        }
    };

} // namespace llvm::yaml
