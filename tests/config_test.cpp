/**
 * @file config_test.cpp
 * @brief Unit tests for RAGBackendConfig loading and validation
 */

#include <fstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "rag_config.h"
#include "rag_errors.h"
#include "rag_types.h"
#include "test_support.h"

namespace docindex::rag {

TEST(ConfigTest, DefaultsAreValid) {
    RAGBackendConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.embedding_dimension, 384ul);
    EXPECT_EQ(config.chunk_size, 1000ul);
    EXPECT_EQ(config.chunk_overlap, 200ul);
    EXPECT_EQ(config.index_backend, "usearch");
}

TEST(ConfigTest, OverlapMustBeSmallerThanChunkSize) {
    RAGBackendConfig config;
    config.chunk_size = 100;
    config.chunk_overlap = 100;
    EXPECT_THROW(config.validate(), ValidationError);
}

TEST(ConfigTest, ZeroDimensionIsRejected) {
    RAGBackendConfig config;
    config.embedding_dimension = 0;
    EXPECT_THROW(config.validate(), ValidationError);
}

TEST(ConfigTest, UnknownBackendIsRejected) {
    RAGBackendConfig config;
    config.index_backend = "faiss";
    EXPECT_THROW(config.validate(), ValidationError);
}

TEST(ConfigTest, JsonOverridesOnlyGivenKeys) {
    auto config = config_from_json(nlohmann::json{
        {"embedding_dimension", 8},
        {"chunk_size", 64},
        {"chunk_overlap", 16},
        {"index_backend", "flat"}
    });
    EXPECT_EQ(config.embedding_dimension, 8ul);
    EXPECT_EQ(config.chunk_size, 64ul);
    EXPECT_EQ(config.chunk_overlap, 16ul);
    EXPECT_EQ(config.index_backend, "flat");
    EXPECT_EQ(config.top_k, 5ul);
}

TEST(ConfigTest, WrongJsonTypeIsValidationError) {
    EXPECT_THROW(config_from_json(nlohmann::json{{"chunk_size", "large"}}), ValidationError);
    EXPECT_THROW(config_from_json(nlohmann::json::array()), ValidationError);
}

TEST(ConfigTest, RoundTripsThroughJson) {
    RAGBackendConfig config;
    config.chunk_size = 256;
    config.chunk_overlap = 32;
    config.prompt_template = "{query} / {context}";
    nlohmann::json j = config;

    auto loaded = config_from_json(j);
    EXPECT_EQ(loaded.chunk_size, 256ul);
    EXPECT_EQ(loaded.chunk_overlap, 32ul);
    EXPECT_EQ(loaded.prompt_template, "{query} / {context}");
}

TEST(ConfigTest, LoadsConfigFile) {
    TempDir dir;
    std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << R"({"top_k": 7, "metadata_path": "library.sqlite"})";
    }

    auto config = load_config_file(path);
    EXPECT_EQ(config.top_k, 7ul);
    EXPECT_EQ(config.metadata_path, "library.sqlite");
}

TEST(ConfigTest, MissingOrMalformedFileIsValidationError) {
    TempDir dir;
    EXPECT_THROW(load_config_file(dir.file("absent.json")), ValidationError);

    std::string path = dir.file("broken.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config_file(path), ValidationError);
}

// ============================================================================
// Title derivation
// ============================================================================

TEST(DeriveTitleTest, ReplacesSeparatorsAndDropsExtension) {
    EXPECT_EQ(derive_title("annual_report-final.pdf"), "annual report final");
}

TEST(DeriveTitleTest, RemovesYearsAndCollapsesWhitespace) {
    EXPECT_EQ(derive_title("docs/Climate_Study_2021__Summary.txt"), "Climate Study Summary");
    EXPECT_EQ(derive_title("1999-budget.md"), "budget");
}

TEST(DeriveTitleTest, KeepsNumbersThatAreNotYears) {
    EXPECT_EQ(derive_title("part_12345.txt"), "part 12345");
}

} // namespace docindex::rag
