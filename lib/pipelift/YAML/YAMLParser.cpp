/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/YAML/YAMLParser.hpp>

#include <optional>

#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <pipelift/Util/Log.hpp>
#include <pipelift/YAML/ConfigurationFile.hpp>

namespace pipelift::yaml {

    template< typename T >
    std::optional< T > YAMLParser::parse_from_file(const std::string &file_path) {
        auto buffer = load_file(file_path);
        if (!buffer) {
            LOG(ERROR) << "Failed to load file: " << file_path << "\n";
            return std::nullopt;
        }

        return parse_yaml_content< T >(buffer->getBuffer(), file_path);
    }

    template< typename T >
    std::optional< T > YAMLParser::parse_from_string(const std::string &yaml_content) {
        return parse_yaml_content< T >(yaml_content, "<string>");
    }

    template< typename T >
    std::string YAMLParser::serialize_to_string(const T &object) {
        std::string output;
        llvm::raw_string_ostream stream(output);
        llvm::yaml::Output yaml_output(stream);

        // yaml::Output takes a mutable reference
        T copy = object;
        yaml_output << copy;

        return stream.str();
    }

    template< typename T >
    bool YAMLParser::validate_yaml_file(const std::string &file_path) {
        auto buffer = load_file(file_path);
        if (!buffer) {
            LOG(ERROR) << "Failed to load file: " << file_path << "\n";
            return false;
        }

        return parse_yaml_content< T >(buffer->getBuffer(), file_path).has_value();
    }

    std::unique_ptr< llvm::MemoryBuffer > YAMLParser::load_file(const std::string &file_path) {
        if (!llvm::sys::fs::exists(file_path)) {
            LOG(ERROR) << "File does not exist: " << file_path << "\n";
            return nullptr;
        }

        auto bufferOrErr = llvm::MemoryBuffer::getFile(file_path);
        if (!bufferOrErr) {
            LOG(ERROR) << "Failed to read file: " << file_path << " - "
                       << bufferOrErr.getError().message() << "\n";
            return nullptr;
        }

        return std::move(bufferOrErr.get());
    }

    template std::optional< config::ConversionConfig >
    YAMLParser::parse_from_file< config::ConversionConfig >(const std::string &file_path);

    template std::optional< config::ConversionConfig >
    YAMLParser::parse_from_string< config::ConversionConfig >(const std::string &yaml_content);

    template std::string YAMLParser::serialize_to_string< config::ConversionConfig >(
        const config::ConversionConfig &object
    );

    template bool YAMLParser::validate_yaml_file< config::ConversionConfig >(
        const std::string &file_path
    );

} // namespace pipelift::yaml
