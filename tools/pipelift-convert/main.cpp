/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

// pipelift-convert: read the JSON syntax tree of a Java compilation unit, decide
// which loops can be rewritten and emit the replacements and per-loop decisions
// as a JSON document.

#include <cstdlib>
#include <memory>

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <pipelift/AST/ConversionPipeline.hpp>
#include <pipelift/AST/JsonDeserialize.hpp>
#include <pipelift/Util/Log.hpp>
#include <pipelift/Util/Options.hpp>
#include <pipelift/YAML/ConfigurationFile.hpp>

namespace {

    const llvm::cl::opt< std::string > input_filename( // NOLINT(cert-err58-cpp)
        "input", llvm::cl::desc("Input syntax tree (JSON)"), llvm::cl::value_desc("filename"),
        llvm::cl::Required
    );

    const llvm::cl::opt< std::string > output_filename( // NOLINT(cert-err58-cpp)
        "output", llvm::cl::desc("Output file (default: stdout)"),
        llvm::cl::value_desc("filename"), llvm::cl::init("")
    );

    const llvm::cl::opt< std::string > config_filename( // NOLINT(cert-err58-cpp)
        "config", llvm::cl::desc("YAML conversion configuration"),
        llvm::cl::value_desc("filename"), llvm::cl::init("")
    );

    const llvm::cl::opt< pipelift::TargetFormat > target_format( // NOLINT(cert-err58-cpp)
        "target", llvm::cl::desc("Shape of the rewritten loops"),
        llvm::cl::values(
            clEnumValN(pipelift::TargetFormat::Stream, "stream", "Stream pipelines"),
            clEnumValN(pipelift::TargetFormat::IteratorWhile, "iterator", "Iterator while loops"),
            clEnumValN(pipelift::TargetFormat::EnhancedFor, "enhanced-for", "Enhanced for loops")
        ),
        llvm::cl::init(pipelift::TargetFormat::Stream)
    );

    const llvm::cl::opt< bool > enable_loop_grouping( // NOLINT(cert-err58-cpp)
        "enable-loop-grouping",
        llvm::cl::desc("Merge consecutive loops appending to one list into a concatenation"),
        llvm::cl::init(true)
    );

    const llvm::cl::opt< bool > verbose( // NOLINT(cert-err58-cpp)
        "verbose", llvm::cl::desc("Enable debug logs"), llvm::cl::init(false)
    );

    const llvm::cl::opt< bool > print_decisions( // NOLINT(cert-err58-cpp)
        "print-decisions", llvm::cl::desc("Print one line per loop decision to stderr"),
        llvm::cl::init(false)
    );

    pipelift::Options parseCommandLineOptions(int argc, char **argv) {
        llvm::cl::ParseCommandLineOptions(
            argc, argv, "pipelift-convert: rewrite imperative loops as pipelines\n"
        );

        return {
            .verbose              = verbose.getValue(),
            .target_format        = target_format.getValue(),
            .enable_loop_grouping = enable_loop_grouping.getValue(),
            .output_file          = output_filename.getValue(),
            .input_file           = input_filename.getValue(),
            .config_file          = config_filename.getValue(),
            .print_decisions      = print_decisions.getValue(),
        };
    }

    bool applyConfigFile(pipelift::Options &options) {
        if (options.config_file.empty()) {
            return true;
        }

        auto config = pipelift::yaml::utils::loadConfiguration(options.config_file);
        if (!config) {
            return false;
        }

        pipelift::config::ExplicitSettings fixed{
            .target        = target_format.getNumOccurrences() > 0,
            .loop_grouping = enable_loop_grouping.getNumOccurrences() > 0,
        };
        pipelift::yaml::utils::applyConfiguration(*config, options, fixed);

        if (options.verbose) {
            LOG(DEBUG) << "Loaded configuration '" << config->metadata.name << "' from "
                       << options.config_file << "\n";
        }
        return true;
    }

    void printDecisions(const pipelift::ast::ConversionResult &result) {
        for (const auto &record : result.decisions) {
            llvm::errs() << llvm::formatv(
                "{0,-12} {1,-16} {2}", record.location, record.loop_kind,
                pipelift::analysis::toString(record.decision)
            );
            if (!record.reason.empty()) {
                llvm::errs() << ": " << record.reason;
            }
            llvm::errs() << "\n";
        }
    }

    llvm::json::Value toJSON(const pipelift::ast::ConversionResult &result) {
        llvm::json::Array replacements;
        for (const auto &replacement : result.replacements) {
            replacements.push_back(pipelift::render::toJSON(replacement));
        }

        llvm::json::Array decisions;
        for (const auto &record : result.decisions) {
            decisions.push_back(pipelift::ast::toJSON(record));
        }

        return llvm::json::Object{
            { "replacements", std::move(replacements) },
            {    "decisions",    std::move(decisions) }
        };
    }

    bool writeOutput(const llvm::json::Value &document, const std::string &filename) {
        if (filename.empty()) {
            llvm::outs() << llvm::formatv("{0:2}", document) << "\n";
            return true;
        }

        std::error_code ec;
        llvm::raw_fd_ostream output(filename, ec, llvm::sys::fs::OF_Text);
        if (ec) {
            LOG(ERROR) << "Failed to open output file '" << filename << "': " << ec.message()
                       << "\n";
            return false;
        }
        output << llvm::formatv("{0:2}", document) << "\n";
        return true;
    }

} // namespace

int main(int argc, char **argv) {
    llvm::InitLLVM init(argc, argv);
    auto options = parseCommandLineOptions(argc, argv);

    if (!applyConfigFile(options)) {
        return EXIT_FAILURE;
    }

    auto buffer = llvm::MemoryBuffer::getFileOrSTDIN(options.input_file, /*IsText=*/true);
    if (!buffer) {
        LOG(ERROR) << "Failed to read input file '" << options.input_file
                   << "': " << buffer.getError().message() << "\n";
        return EXIT_FAILURE;
    }

    auto unit = pipelift::ast::parseCompilationUnit(buffer.get()->getBuffer());
    if (!unit) {
        LOG(ERROR) << "Failed to parse syntax tree: " << llvm::toString(unit.takeError())
                   << "\n";
        return EXIT_FAILURE;
    }

    pipelift::ast::ConversionResult result;
    if (!pipelift::ast::runConversionPipeline(**unit, options, result)) {
        LOG(ERROR) << "Conversion pipeline failed\n";
        return EXIT_FAILURE;
    }

    if (options.print_decisions) {
        printDecisions(result);
    }

    if (!writeOutput(toJSON(result), options.output_file)) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
