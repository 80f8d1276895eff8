/**
 * @file vector_index_test.cpp
 * @brief Unit tests for the vector index backends and index generations
 */

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "index_generation.h"
#include "rag_config.h"
#include "rag_errors.h"
#include "test_support.h"
#include "vector_index_flat.h"
#include "vector_index_usearch.h"

namespace docindex::rag {

namespace {

std::vector<float> unit(std::vector<float> v) {
    float norm = 0.0f;
    for (float x : v) {
        norm += x * x;
    }
    norm = std::sqrt(norm);
    for (float& x : v) {
        x /= norm;
    }
    return v;
}

std::vector<ChunkId> ids_of(const std::vector<SearchHit>& hits) {
    std::vector<ChunkId> ids;
    for (const auto& hit : hits) {
        ids.push_back(hit.chunk_id);
    }
    return ids;
}

std::unique_ptr<IVectorIndex> make_index(const std::string& backend, size_t dimension) {
    if (backend == "usearch") {
        USearchIndexConfig config;
        config.exact_search = true;
        return std::make_unique<USearchVectorIndex>(dimension, config);
    }
    return std::make_unique<FlatVectorIndex>(dimension);
}

} // namespace

// ============================================================================
// Backend conformance (flat and usearch)
// ============================================================================

class VectorIndexBackendTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override { index_ = make_index(GetParam(), 4); }

    void add(ChunkId id, std::vector<float> v) {
        auto normalized = unit(std::move(v));
        index_->add(id, normalized.data());
    }

    std::vector<SearchHit> search(std::vector<float> q, size_t k) {
        auto normalized = unit(std::move(q));
        return index_->search(normalized.data(), k);
    }

    std::unique_ptr<IVectorIndex> index_;
};

TEST_P(VectorIndexBackendTest, RanksByCosineSimilarity) {
    add(10, {1, 0, 0, 0});
    add(11, {1, 1, 0, 0});
    add(12, {0, 0, 1, 0});

    auto hits = search({1, 0, 0, 0}, 3);
    ASSERT_EQ(hits.size(), 3ul);
    EXPECT_EQ(ids_of(hits), (std::vector<ChunkId>{10, 11, 12}));
    EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
    EXPECT_NEAR(hits[1].score, 1.0f / std::sqrt(2.0f), 1e-5);
    EXPECT_NEAR(hits[2].score, 0.0f, 1e-5);
}

TEST_P(VectorIndexBackendTest, TiesBreakByAscendingChunkId) {
    add(7, {0, 1, 0, 0});
    add(3, {0, 1, 0, 0});
    add(5, {0, 1, 0, 0});

    auto hits = search({0, 1, 0, 0}, 3);
    EXPECT_EQ(ids_of(hits), (std::vector<ChunkId>{3, 5, 7}));
}

TEST_P(VectorIndexBackendTest, KLargerThanSizeReturnsAll) {
    add(1, {1, 0, 0, 0});
    add(2, {0, 1, 0, 0});
    EXPECT_EQ(search({1, 1, 1, 1}, 10).size(), 2ul);
    EXPECT_EQ(index_->size(), 2ul);
}

TEST_P(VectorIndexBackendTest, DuplicateIdIsRejected) {
    add(1, {1, 0, 0, 0});
    EXPECT_THROW(add(1, {0, 1, 0, 0}), IndexBuildError);
    EXPECT_EQ(index_->size(), 1ul);
}

TEST_P(VectorIndexBackendTest, SaveAndLoadPreserveResults) {
    TempDir dir;
    add(1, {1, 0, 0, 0});
    add(2, {0, 1, 0, 0});
    add(3, {0, 0, 1, 1});
    index_->save(dir.file("index.bin"));

    auto loaded = make_index(GetParam(), 4);
    loaded->load(dir.file("index.bin"));
    EXPECT_EQ(loaded->size(), 3ul);

    auto q = unit({0, 0, 1, 1});
    EXPECT_EQ(ids_of(loaded->search(q.data(), 1)), (std::vector<ChunkId>{3}));
}

TEST_P(VectorIndexBackendTest, LoadRejectsOtherDimension) {
    TempDir dir;
    add(1, {1, 0, 0, 0});
    index_->save(dir.file("index.bin"));

    auto other = make_index(GetParam(), 8);
    EXPECT_THROW(other->load(dir.file("index.bin")), StorageError);
}

TEST_P(VectorIndexBackendTest, LoadMissingFileIsStorageError) {
    TempDir dir;
    EXPECT_THROW(index_->load(dir.file("absent.bin")), StorageError);
}

INSTANTIATE_TEST_SUITE_P(Backends, VectorIndexBackendTest,
                         ::testing::Values("flat", "usearch"));

TEST(VectorIndexFactoryTest, SelectsBackendFromConfig) {
    RAGBackendConfig config;
    config.index_backend = "flat";
    EXPECT_EQ(make_vector_index_factory(config)->backend_name(), "flat");
    config.index_backend = "usearch";
    EXPECT_EQ(make_vector_index_factory(config)->backend_name(), "usearch");
    config.index_backend = "annoy";
    EXPECT_THROW(make_vector_index_factory(config), ValidationError);
}

TEST(VectorIndexFactoryTest, FlatIsRebuildOnlyAndUSearchIncremental) {
    EXPECT_FALSE(FlatVectorIndex(4).supports_incremental_insert());
    EXPECT_TRUE(USearchVectorIndex(4, USearchIndexConfig{}).supports_incremental_insert());
}

// ============================================================================
// Checksum
// ============================================================================

TEST(ChunkSetChecksumTest, IndependentOfOrder) {
    EXPECT_EQ(chunk_set_checksum({3, 1, 2}), chunk_set_checksum({1, 2, 3}));
}

TEST(ChunkSetChecksumTest, DiffersForDifferentSets) {
    EXPECT_NE(chunk_set_checksum({1, 2, 3}), chunk_set_checksum({1, 2, 4}));
    EXPECT_NE(chunk_set_checksum({1, 2}), chunk_set_checksum({1, 2, 3}));
}

// ============================================================================
// Index generations
// ============================================================================

class IndexGenerationTest : public ::testing::Test {
protected:
    IndexGenerationTest()
        : factory_(std::make_shared<FlatVectorIndexFactory>()), builder_(factory_, 4) {}

    EmbeddingEntries entries() {
        return {
            {1, unit({1, 0, 0, 0})},
            {2, unit({0, 1, 0, 0})},
            {3, unit({0, 0, 1, 0})},
        };
    }

    std::shared_ptr<FlatVectorIndexFactory> factory_;
    IndexBuilder builder_;
};

TEST_F(IndexGenerationTest, BuildHoldsExactlyTheEntries) {
    auto generation = builder_.build(4, entries());
    EXPECT_EQ(generation->number(), 4u);
    EXPECT_EQ(generation->size(), 3ul);
    EXPECT_EQ(generation->vector_count(), 3ul);
    EXPECT_EQ(generation->chunk_ids(), (std::vector<ChunkId>{1, 2, 3}));
    EXPECT_EQ(generation->checksum(), chunk_set_checksum({1, 2, 3}));
}

TEST_F(IndexGenerationTest, SearchCapsKAtChunkCount) {
    auto generation = builder_.build(1, entries());
    auto hits = generation->search(unit({0, 1, 0, 0}), 50);
    ASSERT_EQ(hits.size(), 3ul);
    EXPECT_EQ(hits[0].chunk_id, 2);
}

TEST_F(IndexGenerationTest, WrongQueryDimensionIsValidationError) {
    auto generation = builder_.build(1, entries());
    EXPECT_THROW(generation->search({1.0f, 0.0f}, 1), ValidationError);
}

TEST_F(IndexGenerationTest, WrongEmbeddingDimensionIsIntegrityError) {
    EmbeddingEntries bad = {{1, {1.0f, 0.0f}}};
    EXPECT_THROW(builder_.build(1, bad), IntegrityError);
}

TEST_F(IndexGenerationTest, CancelledBuildThrows) {
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(builder_.build(1, entries(), &token), OperationCancelled);
}

TEST_F(IndexGenerationTest, IdCountMustMatchIndex) {
    auto index = std::make_unique<FlatVectorIndex>(4);
    auto v = unit({1, 0, 0, 0});
    index->add(1, v.data());
    EXPECT_THROW(IndexGeneration(1, 0, {1, 2}, std::move(index)), IntegrityError);
}

TEST_F(IndexGenerationTest, AppendExtendsChunkSet) {
    USearchIndexConfig config;
    config.exact_search = true;
    IndexBuilder builder(std::make_shared<USearchVectorIndexFactory>(config), 4);
    auto generation = builder.build(1, entries());
    ASSERT_TRUE(generation->supports_append());

    generation->append({{9, unit({0, 0, 0, 1})}}, 2);
    EXPECT_EQ(generation->number(), 2u);
    EXPECT_EQ(generation->size(), 4ul);
    EXPECT_EQ(generation->search(unit({0, 0, 0, 1}), 1)[0].chunk_id, 9);
}

TEST_F(IndexGenerationTest, SaveAndLoadWithSidecar) {
    TempDir dir;
    auto generation = builder_.build(6, entries());
    generation->save(dir.file("gen.idx"));

    auto loaded = IndexGeneration::load(dir.file("gen.idx"), *factory_, 4);
    EXPECT_EQ(loaded->number(), 6u);
    EXPECT_EQ(loaded->chunk_ids(), generation->chunk_ids());
    EXPECT_EQ(loaded->checksum(), generation->checksum());
    EXPECT_EQ(loaded->search(unit({0, 0, 1, 0}), 1)[0].chunk_id, 3);
}

TEST_F(IndexGenerationTest, LoadFailsOnMissingOrMismatchedFiles) {
    TempDir dir;
    EXPECT_THROW(IndexGeneration::load(dir.file("absent.idx"), *factory_, 4), StorageError);

    builder_.build(1, entries())->save(dir.file("gen.idx"));
    EXPECT_THROW(IndexGeneration::load(dir.file("gen.idx"), *factory_, 8), StorageError);
}

} // namespace docindex::rag
