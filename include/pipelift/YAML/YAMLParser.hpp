/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>

#include <pipelift/Util/Log.hpp>

namespace pipelift::yaml {

    class YAMLParser
    {
      public:
        YAMLParser()  = default;
        ~YAMLParser() = default;

        template< typename T >
        std::optional< T > parse_from_file(const std::string &file_path); // NOLINT

        template< typename T >
        std::optional< T > parse_from_string(const std::string &yaml_content); // NOLINT

        // Serialize any YAML-serializable type to string
        template< typename T >
        std::string serialize_to_string(const T &object);

        template< typename T >
        bool validate_yaml_file(const std::string &file_path);

      private:
        std::unique_ptr< llvm::MemoryBuffer > load_file(const std::string &file_path);

        template< typename T >
        std::optional< T > parse_yaml_content(llvm::StringRef content, llvm::StringRef name);
    };

    template< typename T >
    std::optional< T >
    YAMLParser::parse_yaml_content(llvm::StringRef content, llvm::StringRef name) {
        T result;
        llvm::yaml::Input input(content);

        input >> result;

        if (input.error()) {
            LOG(ERROR) << "Invalid YAML document '" << name
                       << "': " << input.error().message() << "\n";
            return std::nullopt;
        }

        return result;
    }

} // namespace pipelift::yaml
