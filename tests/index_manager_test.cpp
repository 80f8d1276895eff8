/**
 * @file index_manager_test.cpp
 * @brief Unit tests for IndexManager mutations, failures and recovery
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <sqlite3.h>

#include "index_manager.h"
#include "metadata_store.h"
#include "rag_errors.h"
#include "test_support.h"

namespace docindex::rag {

namespace {

DocumentInput doc(const std::string& id, const std::string& text) {
    DocumentInput input;
    input.id = id;
    input.text = text;
    return input;
}

std::vector<ChunkId> sorted_ids(std::vector<ChunkId> ids) {
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

class IndexManagerTest : public ::testing::Test {
protected:
    IndexManagerTest()
        : embedder_(std::make_shared<FakeEmbeddingProvider>(8)),
          factory_(std::make_shared<SlowFlatIndexFactory>()),
          config_(small_config(dir_)) {}

    void open() {
        manager_.reset();
        store_ = std::make_shared<MetadataStore>(config_.metadata_path);
        manager_ = std::make_unique<IndexManager>(config_, store_, embedder_, factory_);
    }

    void close() {
        manager_.reset();
        store_.reset();
    }

    std::vector<ChunkId> generation_ids() const {
        auto generation = manager_->current_generation();
        return generation ? sorted_ids(generation->chunk_ids()) : std::vector<ChunkId>{};
    }

    TempDir dir_;
    std::shared_ptr<FakeEmbeddingProvider> embedder_;
    std::shared_ptr<SlowFlatIndexFactory> factory_;
    RAGBackendConfig config_;
    std::shared_ptr<MetadataStore> store_;
    std::unique_ptr<IndexManager> manager_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(IndexManagerTest, StartsEmpty) {
    open();
    EXPECT_EQ(manager_->state(), ManagerState::kEmpty);
    EXPECT_EQ(manager_->current_generation(), nullptr);

    IndexStats stats = manager_->stats();
    EXPECT_EQ(stats.document_count, 0ul);
    EXPECT_EQ(stats.vector_count, 0ul);
    EXPECT_EQ(stats.state, "EMPTY");
}

TEST_F(IndexManagerTest, EmbedderDimensionMustMatchConfig) {
    store_ = std::make_shared<MetadataStore>(config_.metadata_path);
    auto wrong = std::make_shared<FakeEmbeddingProvider>(16);
    EXPECT_THROW(IndexManager(config_, store_, wrong, factory_), ValidationError);
}

TEST_F(IndexManagerTest, InvalidConfigIsRejected) {
    config_.chunk_overlap = config_.chunk_size;
    store_ = std::make_shared<MetadataStore>(config_.metadata_path);
    EXPECT_THROW(IndexManager(config_, store_, embedder_, factory_), ValidationError);
}

// ============================================================================
// Add
// ============================================================================

TEST_F(IndexManagerTest, AddChunksEmbedsAndPublishes) {
    open();
    AddResult result = manager_->add_document(doc("doc1", "aaaabbbb"));

    EXPECT_EQ(result.status, DocumentStatus::kProcessed);
    EXPECT_EQ(result.chunk_count, 2ul);
    EXPECT_EQ(manager_->state(), ManagerState::kReady);

    IndexStats stats = manager_->stats();
    EXPECT_EQ(stats.document_count, 1ul);
    EXPECT_EQ(stats.chunk_count, 2ul);
    EXPECT_EQ(stats.vector_count, 2ul);
    EXPECT_EQ(stats.generation, 1u);

    EXPECT_EQ(generation_ids(), sorted_ids(store_->all_chunk_ids()));
    EXPECT_EQ(store_->get_document("doc1").status, DocumentStatus::kProcessed);
    EXPECT_EQ(store_->get_document("doc1").title, "doc1");
}

TEST_F(IndexManagerTest, EachAddPublishesNewGeneration) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    manager_->add_document(doc("doc2", "bbbb"));
    EXPECT_EQ(manager_->stats().generation, 2u);
    EXPECT_EQ(manager_->stats().vector_count, 2ul);
}

TEST_F(IndexManagerTest, DuplicateIdIsRejectedWithoutChanges) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    IndexStats before = manager_->stats();

    EXPECT_THROW(manager_->add_document(doc("doc1", "bbbb")), ValidationError);

    IndexStats after = manager_->stats();
    EXPECT_EQ(after.chunk_count, before.chunk_count);
    EXPECT_EQ(after.generation, before.generation);
    EXPECT_EQ(store_->get_chunks_by_document("doc1")[0].text, "aaaa");
}

TEST_F(IndexManagerTest, EmptyTextIsValidationError) {
    open();
    EXPECT_THROW(manager_->add_document(doc("doc1", "")), ValidationError);
    EXPECT_FALSE(store_->find_document("doc1").has_value());
}

TEST_F(IndexManagerTest, EmbeddingFailureMarksDocumentFailed) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    auto before = generation_ids();

    embedder_->set_failing(true);
    EXPECT_THROW(manager_->add_document(doc("doc2", "bbbb")), EmbeddingUnavailable);

    EXPECT_EQ(store_->get_document("doc2").status, DocumentStatus::kFailed);
    EXPECT_TRUE(store_->get_chunks_by_document("doc2").empty());
    EXPECT_EQ(generation_ids(), before);
    EXPECT_FALSE(manager_->mutations_halted());
}

TEST_F(IndexManagerTest, FailedDocumentCanBeAddedAgain) {
    open();
    embedder_->set_failing(true);
    EXPECT_THROW(manager_->add_document(doc("doc1", "aaaa")), EmbeddingUnavailable);

    embedder_->set_failing(false);
    AddResult result = manager_->add_document(doc("doc1", "aaaa"));
    EXPECT_EQ(result.status, DocumentStatus::kProcessed);
    EXPECT_EQ(manager_->stats().vector_count, 1ul);
}

TEST_F(IndexManagerTest, IndexBuildFailureKeepsCurrentGeneration) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    auto before = generation_ids();
    uint64_t generation = manager_->stats().generation;

    factory_->set_fail_after(1);
    EXPECT_THROW(manager_->add_document(doc("doc2", "bbbbcccc")), IndexBuildError);

    EXPECT_EQ(generation_ids(), before);
    EXPECT_EQ(manager_->stats().generation, generation);
    EXPECT_EQ(manager_->state(), ManagerState::kReady);
    EXPECT_EQ(store_->get_document("doc2").status, DocumentStatus::kFailed);
}

TEST_F(IndexManagerTest, BatchAddReportsPerDocument) {
    open();
    auto results = manager_->add_documents({doc("a", "aaaa"), doc("b", ""), doc("c", "cccc")});

    ASSERT_EQ(results.size(), 3ul);
    EXPECT_EQ(results[0].status, DocumentStatus::kProcessed);
    EXPECT_EQ(results[1].status, DocumentStatus::kFailed);
    EXPECT_EQ(results[1].code, DIX_ERROR_VALIDATION);
    EXPECT_EQ(results[2].status, DocumentStatus::kProcessed);
    EXPECT_EQ(manager_->stats().vector_count, 2ul);
}

TEST_F(IndexManagerTest, IncrementalBackendAppendsInPlace) {
    config_.index_backend = "usearch";
    manager_.reset();
    store_ = std::make_shared<MetadataStore>(config_.metadata_path);
    manager_ = std::make_unique<IndexManager>(config_, store_, embedder_);

    manager_->add_document(doc("doc1", "aaaa"));
    auto first = manager_->current_generation();
    manager_->add_document(doc("doc2", "bbbb"));

    EXPECT_EQ(manager_->current_generation(), first);
    EXPECT_EQ(first->number(), 2u);
    EXPECT_EQ(generation_ids(), sorted_ids(store_->all_chunk_ids()));
}

// ============================================================================
// Delete
// ============================================================================

TEST_F(IndexManagerTest, DeleteRemovesDocumentChunks) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    manager_->add_document(doc("doc2", "bbbbcccc"));

    manager_->delete_document("doc2");

    EXPECT_FALSE(store_->find_document("doc2").has_value());
    EXPECT_EQ(manager_->stats().vector_count, 1ul);
    EXPECT_EQ(generation_ids(), sorted_ids(store_->all_chunk_ids()));
}

TEST_F(IndexManagerTest, DeleteUnknownIsNotFoundAndChangesNothing) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    IndexStats before = manager_->stats();

    EXPECT_THROW(manager_->delete_document("missing"), NotFoundError);

    IndexStats after = manager_->stats();
    EXPECT_EQ(after.document_count, before.document_count);
    EXPECT_EQ(after.vector_count, before.vector_count);
    EXPECT_EQ(after.generation, before.generation);
}

TEST_F(IndexManagerTest, DeletingLastDocumentEmptiesIndex) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    manager_->delete_document("doc1");

    EXPECT_EQ(manager_->state(), ManagerState::kEmpty);
    EXPECT_EQ(manager_->current_generation(), nullptr);
}

TEST_F(IndexManagerTest, DeleteFailedDocument) {
    open();
    embedder_->set_failing(true);
    EXPECT_THROW(manager_->add_document(doc("doc1", "aaaa")), EmbeddingUnavailable);
    embedder_->set_failing(false);

    EXPECT_NO_THROW(manager_->delete_document("doc1"));
    EXPECT_EQ(store_->count_documents(), 0ul);
}

// ============================================================================
// Rebuild and reset
// ============================================================================

TEST_F(IndexManagerTest, RebuildIsIdempotent) {
    open();
    manager_->add_document(doc("doc1", "aaaabbbb"));
    manager_->add_document(doc("doc2", "cccc"));
    auto before = generation_ids();
    uint64_t generation = manager_->stats().generation;
    size_t calls = embedder_->calls();

    manager_->rebuild();
    EXPECT_EQ(generation_ids(), before);
    manager_->rebuild();
    EXPECT_EQ(generation_ids(), before);

    EXPECT_EQ(manager_->stats().generation, generation + 2);
    // Stored embeddings are reused
    EXPECT_EQ(embedder_->calls(), calls);
}

TEST_F(IndexManagerTest, RebuildCanReembed) {
    config_.reembed_on_rebuild = true;
    open();
    manager_->add_document(doc("doc1", "aaaabbbb"));
    size_t calls = embedder_->calls();

    manager_->rebuild();
    EXPECT_GT(embedder_->calls(), calls);
    EXPECT_EQ(manager_->stats().vector_count, 2ul);
}

TEST_F(IndexManagerTest, ReembedFailureLeavesPublishedGenerationUntouched) {
    config_.reembed_on_rebuild = true;
    config_.index_path = dir_.file("index.gen");
    open();
    manager_->add_document(doc("doc1", "aaaabbbb"));
    auto before = generation_ids();
    uint64_t generation = manager_->stats().generation;
    auto persisted = store_->load_index_state();
    ASSERT_TRUE(persisted.has_value());

    // Another connection holds the write lock, so storing the new vectors
    // fails once the busy timeout runs out
    sqlite3* blocker = nullptr;
    ASSERT_EQ(sqlite3_open(config_.metadata_path.c_str(), &blocker), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(blocker, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr), SQLITE_OK);

    EXPECT_THROW(manager_->rebuild(), StorageError);

    EXPECT_EQ(sqlite3_exec(blocker, "ROLLBACK;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(blocker);

    EXPECT_EQ(generation_ids(), before);
    EXPECT_EQ(manager_->stats().generation, generation);
    EXPECT_EQ(manager_->state(), ManagerState::kReady);
    auto after = store_->load_index_state();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->generation, persisted->generation);

    manager_->rebuild();
    EXPECT_EQ(manager_->stats().generation, generation + 1);
}

// ============================================================================
// Embedding timeout
// ============================================================================

TEST_F(IndexManagerTest, EmbeddingTimeoutMarksDocumentFailed) {
    config_.embed_timeout_ms = 50;
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    auto before = generation_ids();
    uint64_t generation = manager_->stats().generation;

    embedder_->set_delay_ms(300);
    EXPECT_THROW(manager_->add_document(doc("slow", "bbbb")), EmbeddingUnavailable);

    EXPECT_EQ(store_->get_document("slow").status, DocumentStatus::kFailed);
    EXPECT_TRUE(store_->get_chunks_by_document("slow").empty());
    EXPECT_EQ(generation_ids(), before);
    EXPECT_EQ(manager_->stats().generation, generation);
    EXPECT_EQ(manager_->state(), ManagerState::kReady);
    EXPECT_FALSE(manager_->mutations_halted());
}

TEST_F(IndexManagerTest, TimedOutEmbeddingBlocksFurtherCallsUntilItReturns) {
    config_.embed_timeout_ms = 50;
    open();

    embedder_->set_delay_ms(300);
    EXPECT_THROW(manager_->add_document(doc("slow", "aaaa")), EmbeddingUnavailable);
    size_t calls = embedder_->calls();

    // The abandoned call is still inside the provider: refused, not started
    EXPECT_THROW(manager_->add_document(doc("next", "bbbb")), EmbeddingUnavailable);
    EXPECT_THROW(manager_->embed_query("bbbb"), EmbeddingUnavailable);
    EXPECT_EQ(embedder_->calls(), calls);
    EXPECT_EQ(embedder_->max_concurrent_calls(), 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    embedder_->set_delay_ms(0);

    AddResult result = manager_->add_document(doc("next", "bbbb"));
    EXPECT_EQ(result.status, DocumentStatus::kProcessed);
    EXPECT_EQ(embedder_->max_concurrent_calls(), 1);
}

TEST_F(IndexManagerTest, CloseWaitsForTimedOutEmbedding) {
    config_.embed_timeout_ms = 50;
    open();

    embedder_->set_delay_ms(300);
    EXPECT_THROW(manager_->add_document(doc("slow", "aaaa")), EmbeddingUnavailable);
    EXPECT_EQ(embedder_->running_calls(), 1);

    close();
    EXPECT_EQ(embedder_->running_calls(), 0);
}

TEST_F(IndexManagerTest, ResetDeletesEverything) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    manager_->reset();

    EXPECT_EQ(manager_->state(), ManagerState::kEmpty);
    EXPECT_EQ(store_->count_documents(), 0ul);
    EXPECT_EQ(store_->count(), 0ul);
    EXPECT_FALSE(store_->load_index_state().has_value());

    manager_->add_document(doc("doc1", "bbbb"));
    EXPECT_EQ(manager_->stats().vector_count, 1ul);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(IndexManagerTest, CancelledRebuildLeavesGenerationUntouched) {
    open();
    std::string text(200, 'a');
    manager_->add_document(doc("doc1", text));
    auto before = manager_->current_generation();

    factory_->set_delay_ms(10);
    std::atomic<bool> cancelled{false};
    std::thread rebuilder([&]() {
        try {
            manager_->rebuild();
        } catch (const OperationCancelled&) {
            cancelled.store(true);
        }
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager_->state() != ManagerState::kRebuilding &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(manager_->state(), ManagerState::kRebuilding);
    manager_->cancel_active();
    rebuilder.join();

    EXPECT_TRUE(cancelled.load());
    EXPECT_EQ(manager_->current_generation(), before);
    EXPECT_EQ(manager_->state(), ManagerState::kReady);
}

// ============================================================================
// Integrity halt
// ============================================================================

TEST_F(IndexManagerTest, IntegrityErrorHaltsMutationsUntilResumed) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    ChunkId id = store_->all_chunk_ids()[0];
    auto good = store_->get_embeddings({id})[0].second;

    // A stored embedding of the wrong dimension cannot be indexed
    store_->update_embeddings({{id, {1.0f, 0.0f}}});
    EXPECT_THROW(manager_->rebuild(), IntegrityError);
    EXPECT_TRUE(manager_->mutations_halted());
    EXPECT_THROW(manager_->add_document(doc("doc2", "bbbb")), MutationsHaltedError);
    EXPECT_EQ(manager_->stats().vector_count, 1ul);

    store_->update_embeddings({{id, good}});
    manager_->resume_mutations();
    EXPECT_FALSE(manager_->mutations_halted());
    EXPECT_NO_THROW(manager_->add_document(doc("doc2", "bbbb")));
}

// ============================================================================
// Persistence and recovery
// ============================================================================

TEST_F(IndexManagerTest, PersistedGenerationIsLoadedOnRestart) {
    config_.index_path = dir_.file("index.gen");
    open();
    manager_->add_document(doc("doc1", "aaaabbbb"));
    manager_->add_document(doc("doc2", "cccc"));
    auto before = generation_ids();
    uint64_t generation = manager_->stats().generation;
    close();

    EXPECT_TRUE(std::filesystem::exists(config_.index_path));
    EXPECT_TRUE(std::filesystem::exists(config_.index_path + ".meta.json"));

    open();
    EXPECT_EQ(manager_->state(), ManagerState::kReady);
    EXPECT_EQ(generation_ids(), before);
    // Loaded, not rebuilt
    EXPECT_EQ(manager_->stats().generation, generation);
}

TEST_F(IndexManagerTest, StaleGenerationIsRebuiltOnRestart) {
    config_.index_path = dir_.file("index.gen");
    open();
    manager_->add_document(doc("doc1", "aaaa"));
    uint64_t generation = manager_->stats().generation;

    // Metadata gains a chunk the persisted generation never saw
    Document extra;
    extra.id = "doc2";
    extra.filename = "doc2";
    extra.title = "doc2";
    extra.status = DocumentStatus::kProcessed;
    store_->create_document(extra);
    NewChunk chunk;
    chunk.text = "bbbb";
    chunk.embedding = embedder_->embed("bbbb");
    store_->create_chunks("doc2", std::vector<NewChunk>{chunk});
    close();

    open();
    EXPECT_EQ(manager_->stats().vector_count, 2ul);
    EXPECT_GT(manager_->stats().generation, generation);
    EXPECT_EQ(generation_ids(), sorted_ids(store_->all_chunk_ids()));
}

TEST_F(IndexManagerTest, MissingGenerationFileIsRebuilt) {
    config_.index_path = dir_.file("index.gen");
    open();
    manager_->add_document(doc("doc1", "aaaabbbb"));
    close();

    std::filesystem::remove(config_.index_path);
    open();
    EXPECT_EQ(manager_->stats().vector_count, 2ul);
}

TEST_F(IndexManagerTest, PendingDocumentIsFailedOnRestart) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));

    // Simulate a crash between chunk creation and status update
    Document pending;
    pending.id = "doc2";
    pending.filename = "doc2";
    pending.title = "doc2";
    pending.status = DocumentStatus::kPending;
    store_->create_document(pending);
    NewChunk chunk;
    chunk.text = "bbbb";
    chunk.embedding = embedder_->embed("bbbb");
    store_->create_chunks("doc2", std::vector<NewChunk>{chunk});
    close();

    open();
    EXPECT_EQ(store_->get_document("doc2").status, DocumentStatus::kFailed);
    EXPECT_TRUE(store_->get_chunks_by_document("doc2").empty());
    EXPECT_EQ(manager_->stats().vector_count, 1ul);
    EXPECT_EQ(generation_ids(), sorted_ids(store_->all_chunk_ids()));
}

TEST_F(IndexManagerTest, StatisticsJsonCarriesState) {
    open();
    manager_->add_document(doc("doc1", "aaaa"));

    nlohmann::json stats = manager_->statistics();
    EXPECT_EQ(stats["state"], "READY");
    EXPECT_EQ(stats["vector_count"], 1);
    EXPECT_EQ(stats["mutations_halted"], false);
    EXPECT_EQ(stats["embedding_provider"], "FakeEmbeddingProvider");
}

} // namespace docindex::rag
