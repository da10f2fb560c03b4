/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <pipelift/YAML/ConfigurationFile.hpp>

using namespace pipelift;
using namespace pipelift::config;

namespace {

    constexpr const char *kFullDocument = R"(apiVersion: pipelift/v1
metadata:
  name: legacy-service
  description: convert the collection helpers
  version: "1.2"
  author: platform
target: iterator
features:
  consecutive_loop_grouping: false
  merge_declarations: false
  index_loops: true
  iterator_loops: false
types:
  collections: [ com.acme.Bag, com.acme.Roster ]
  concurrent: [ com.acme.SharedBag ]
)";

    std::optional< ConversionConfig > parse(const std::string &text) {
        yaml::YAMLParser parser;
        return parser.parse_from_string< ConversionConfig >(text);
    }

} // namespace

TEST(ConfigurationTest, ParsesFullDocument) {
    auto config = parse(kFullDocument);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->api_version, "pipelift/v1");
    EXPECT_EQ(config->metadata.name, "legacy-service");
    EXPECT_EQ(config->metadata.version, "1.2");
    EXPECT_EQ(config->target, TargetFormat::IteratorWhile);
    EXPECT_FALSE(config->features.consecutive_loop_grouping);
    EXPECT_FALSE(config->features.merge_declarations);
    EXPECT_TRUE(config->features.index_loops);
    EXPECT_FALSE(config->features.iterator_loops);
    EXPECT_EQ(config->types.collections, (std::vector< std::string >{ "com.acme.Bag", "com.acme.Roster" }));
    EXPECT_EQ(config->types.concurrent, (std::vector< std::string >{ "com.acme.SharedBag" }));
}

TEST(ConfigurationTest, MissingKeysKeepDefaults) {
    auto config = parse("target: enhanced-for\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->target, TargetFormat::EnhancedFor);
    EXPECT_TRUE(config->api_version.empty());
    EXPECT_TRUE(config->features.consecutive_loop_grouping);
    EXPECT_TRUE(config->features.merge_declarations);
    EXPECT_TRUE(config->types.collections.empty());
}

TEST(ConfigurationTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(parse("target: parallel\n").has_value());
    EXPECT_FALSE(parse("apiVersion: other/v1\n").has_value());
    EXPECT_FALSE(parse("features:\n  index_loops: maybe\n").has_value());
    EXPECT_FALSE(parse("unexpected: 1\n").has_value());
}

TEST(ConfigurationTest, AppliesToOptions) {
    auto config = parse(kFullDocument);
    ASSERT_TRUE(config.has_value());

    Options options;
    options.collection_types.push_back("com.acme.Existing");
    yaml::utils::applyConfiguration(*config, options);

    EXPECT_EQ(options.target_format, TargetFormat::IteratorWhile);
    EXPECT_FALSE(options.enable_loop_grouping);
    EXPECT_FALSE(options.merge_declarations);
    EXPECT_TRUE(options.convert_index_loops);
    EXPECT_FALSE(options.convert_iterator_loops);
    EXPECT_EQ(
        options.collection_types,
        (std::vector< std::string >{ "com.acme.Existing", "com.acme.Bag", "com.acme.Roster" })
    );
    EXPECT_EQ(options.concurrent_types, (std::vector< std::string >{ "com.acme.SharedBag" }));
}

TEST(ConfigurationTest, ExplicitSettingsAreNotOverridden) {
    auto config = parse(kFullDocument);
    ASSERT_TRUE(config.has_value());

    Options options;
    options.target_format        = TargetFormat::EnhancedFor;
    options.enable_loop_grouping = true;
    yaml::utils::applyConfiguration(
        *config, options, ExplicitSettings{ .target = true, .loop_grouping = true }
    );

    EXPECT_EQ(options.target_format, TargetFormat::EnhancedFor);
    EXPECT_TRUE(options.enable_loop_grouping);
    EXPECT_FALSE(options.merge_declarations);
}

TEST(ConfigurationTest, SerializedDocumentParsesBack) {
    auto config = parse(kFullDocument);
    ASSERT_TRUE(config.has_value());

    yaml::YAMLParser parser;
    auto text = parser.serialize_to_string(*config);
    EXPECT_NE(text.find("target:"), std::string::npos);
    EXPECT_NE(text.find("iterator"), std::string::npos);

    auto reparsed = parse(text);
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed->target, config->target);
    EXPECT_EQ(reparsed->types.collections, config->types.collections);
}

TEST(ConfigurationTest, LoadsFromFile) {
    llvm::SmallString< 128 > path;
    int fd = -1;
    ASSERT_FALSE(llvm::sys::fs::createTemporaryFile("pipelift-config", "yaml", fd, path));
    {
        llvm::raw_fd_ostream out(fd, /*shouldClose=*/true);
        out << kFullDocument;
    }

    auto config = yaml::utils::loadConfiguration(path.str().str());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->metadata.author, "platform");

    yaml::YAMLParser parser;
    EXPECT_TRUE(parser.validate_yaml_file< ConversionConfig >(path.str().str()));

    ASSERT_FALSE(llvm::sys::fs::remove(path));
    EXPECT_FALSE(yaml::utils::loadConfiguration(path.str().str()).has_value());
}
