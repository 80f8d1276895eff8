/**
 * @file metadata_store_test.cpp
 * @brief Unit tests for the SQLite metadata store
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "metadata_store.h"
#include "rag_errors.h"
#include "test_support.h"

namespace docindex::rag {

class MetadataStoreTest : public ::testing::Test {
protected:
    MetadataStoreTest() : store_(std::make_unique<MetadataStore>(dir_.file("meta.sqlite"))) {}

    Document make_document(const std::string& id,
                           DocumentStatus status = DocumentStatus::kProcessed) {
        Document doc;
        doc.id = id;
        doc.filename = id + ".txt";
        doc.title = "Title " + id;
        doc.uploaded_at = 1700000000;
        doc.byte_size = 42;
        doc.status = status;
        return doc;
    }

    std::vector<ChunkId> add_chunks(const std::string& document_id,
                                    const std::vector<std::string>& texts) {
        std::vector<NewChunk> chunks;
        for (size_t i = 0; i < texts.size(); ++i) {
            NewChunk chunk;
            chunk.text = texts[i];
            chunk.source_offset = static_cast<int64_t>(i * 4);
            chunk.embedding = {static_cast<float>(i), 1.0f, 0.5f};
            chunks.push_back(std::move(chunk));
        }
        return store_->create_chunks(document_id, chunks);
    }

    TempDir dir_;
    std::unique_ptr<MetadataStore> store_;
};

// ============================================================================
// Documents
// ============================================================================

TEST_F(MetadataStoreTest, CreateAndGetDocument) {
    store_->create_document(make_document("doc1"));

    Document doc = store_->get_document("doc1");
    EXPECT_EQ(doc.filename, "doc1.txt");
    EXPECT_EQ(doc.title, "Title doc1");
    EXPECT_EQ(doc.uploaded_at, 1700000000);
    EXPECT_EQ(doc.byte_size, 42);
    EXPECT_EQ(doc.status, DocumentStatus::kProcessed);
    EXPECT_EQ(store_->count_documents(), 1ul);
}

TEST_F(MetadataStoreTest, DuplicateDocumentIsIntegrityError) {
    store_->create_document(make_document("doc1"));
    EXPECT_THROW(store_->create_document(make_document("doc1")), IntegrityError);
}

TEST_F(MetadataStoreTest, UnknownDocumentIsNotFound) {
    EXPECT_THROW(store_->get_document("missing"), NotFoundError);
    EXPECT_FALSE(store_->find_document("missing").has_value());
    EXPECT_THROW(store_->delete_document("missing"), NotFoundError);
    EXPECT_THROW(store_->set_document_status("missing", DocumentStatus::kFailed), NotFoundError);
}

TEST_F(MetadataStoreTest, StatusUpdatesAndFilters) {
    store_->create_document(make_document("a", DocumentStatus::kPending));
    store_->create_document(make_document("b", DocumentStatus::kPending));
    store_->set_document_status("b", DocumentStatus::kFailed);

    auto pending = store_->documents_with_status(DocumentStatus::kPending);
    ASSERT_EQ(pending.size(), 1ul);
    EXPECT_EQ(pending[0].id, "a");
    EXPECT_EQ(store_->get_document("b").status, DocumentStatus::kFailed);
}

TEST_F(MetadataStoreTest, ListDocumentsReportsChunkSummary) {
    store_->create_document(make_document("doc1"));
    store_->create_document(make_document("doc2"));
    add_chunks("doc1", {"abcd", "ef"});

    auto docs = store_->list_documents();
    ASSERT_EQ(docs.size(), 2ul);
    for (const auto& doc : docs) {
        if (doc.id == "doc1") {
            EXPECT_EQ(doc.chunk_count, 2ul);
            EXPECT_EQ(doc.total_length, 6ul);
        } else {
            EXPECT_EQ(doc.chunk_count, 0ul);
            EXPECT_EQ(doc.total_length, 0ul);
        }
    }
}

// ============================================================================
// Chunks
// ============================================================================

TEST_F(MetadataStoreTest, ChunkPositionsAndIdsIncrease) {
    store_->create_document(make_document("doc1"));
    auto first = add_chunks("doc1", {"aaaa", "bbbb"});
    auto second = add_chunks("doc1", {"cccc"});

    ASSERT_EQ(first.size(), 2ul);
    ASSERT_EQ(second.size(), 1ul);
    EXPECT_LT(first[0], first[1]);
    EXPECT_LT(first[1], second[0]);

    auto chunks = store_->get_chunks_by_document("doc1");
    ASSERT_EQ(chunks.size(), 3ul);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].position, i);
    }
    EXPECT_EQ(chunks[2].text, "cccc");
}

TEST_F(MetadataStoreTest, ChunksForUnknownDocumentAreNotFound) {
    EXPECT_THROW(add_chunks("missing", {"x"}), NotFoundError);
}

TEST_F(MetadataStoreTest, EmbeddingsRoundTripAsBlobs) {
    store_->create_document(make_document("doc1"));
    auto ids = add_chunks("doc1", {"aaaa", "bbbb"});

    auto embeddings = store_->get_embeddings({ids[1], ids[0]});
    ASSERT_EQ(embeddings.size(), 2ul);
    EXPECT_EQ(embeddings[0].first, ids[1]);
    EXPECT_EQ(embeddings[0].second, (std::vector<float>{1.0f, 1.0f, 0.5f}));
    EXPECT_EQ(embeddings[1].second, (std::vector<float>{0.0f, 1.0f, 0.5f}));

    store_->update_embeddings({{ids[0], {9.0f, 8.0f, 7.0f}}});
    EXPECT_EQ(store_->get_embeddings({ids[0]})[0].second,
              (std::vector<float>{9.0f, 8.0f, 7.0f}));
}

TEST_F(MetadataStoreTest, MissingEmbeddingIsIntegrityError) {
    store_->create_document(make_document("doc1"));
    auto ids = store_->create_chunks("doc1", std::vector<std::string>{"text only"});
    EXPECT_THROW(store_->get_embeddings(ids), IntegrityError);
    EXPECT_THROW(store_->get_embeddings({ids[0] + 1000}), IntegrityError);
}

TEST_F(MetadataStoreTest, ResolveChunksJoinsDocumentAndSkipsUnknown) {
    store_->create_document(make_document("doc1"));
    auto ids = add_chunks("doc1", {"aaaa", "bbbb"});

    auto records = store_->resolve_chunks({ids[1], ids[0] + 1000, ids[0]});
    ASSERT_EQ(records.size(), 2ul);
    EXPECT_EQ(records[0].id, ids[1]);
    EXPECT_EQ(records[0].text, "bbbb");
    EXPECT_EQ(records[0].position, 1ul);
    EXPECT_EQ(records[0].title, "Title doc1");
    EXPECT_EQ(records[0].filename, "doc1.txt");
    EXPECT_EQ(records[1].id, ids[0]);
}

TEST_F(MetadataStoreTest, DeleteDocumentCascadesToChunks) {
    store_->create_document(make_document("doc1"));
    store_->create_document(make_document("doc2"));
    auto doomed = add_chunks("doc1", {"aaaa", "bbbb"});
    auto kept = add_chunks("doc2", {"cccc"});

    auto removed = store_->delete_document("doc1");
    EXPECT_EQ(removed, doomed);
    EXPECT_EQ(store_->count(), 1ul);
    EXPECT_EQ(store_->all_chunk_ids(), kept);
    EXPECT_TRUE(store_->get_chunks_by_ids(doomed).empty());
}

TEST_F(MetadataStoreTest, DeleteChunksKeepsDocument) {
    store_->create_document(make_document("doc1"));
    add_chunks("doc1", {"aaaa", "bbbb"});

    EXPECT_EQ(store_->delete_chunks_by_document("doc1"), 2ul);
    EXPECT_EQ(store_->count(), 0ul);
    EXPECT_TRUE(store_->find_document("doc1").has_value());
}

TEST_F(MetadataStoreTest, ChunkIdsAreNeverReused) {
    store_->create_document(make_document("doc1"));
    auto before = add_chunks("doc1", {"aaaa", "bbbb"});

    store_->delete_all();
    EXPECT_EQ(store_->count_documents(), 0ul);
    EXPECT_EQ(store_->count(), 0ul);

    store_->create_document(make_document("doc1"));
    auto after = add_chunks("doc1", {"cccc"});
    EXPECT_GT(after[0], before[1]);
}

TEST_F(MetadataStoreTest, AllChunksInInsertionOrder) {
    store_->create_document(make_document("b"));
    store_->create_document(make_document("a"));
    auto first = add_chunks("b", {"1111"});
    auto second = add_chunks("a", {"2222"});

    auto chunks = store_->get_all_chunks();
    ASSERT_EQ(chunks.size(), 2ul);
    EXPECT_EQ(chunks[0].id, first[0]);
    EXPECT_EQ(chunks[1].id, second[0]);
    EXPECT_FALSE(chunks[0].embedding.empty());
}

// ============================================================================
// Index state and durability
// ============================================================================

TEST_F(MetadataStoreTest, IndexStateRoundTrips) {
    EXPECT_FALSE(store_->load_index_state().has_value());

    IndexState state;
    state.generation = 7;
    state.chunk_count = 3;
    state.checksum = 0xFEDCBA9876543210ull;
    state.dimension = 8;
    state.built_at = 1700000123;
    store_->save_index_state(state);

    auto loaded = store_->load_index_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->generation, 7u);
    EXPECT_EQ(loaded->chunk_count, 3ul);
    EXPECT_EQ(loaded->checksum, 0xFEDCBA9876543210ull);
    EXPECT_EQ(loaded->dimension, 8ul);
    EXPECT_EQ(loaded->built_at, 1700000123);

    store_->clear_index_state();
    EXPECT_FALSE(store_->load_index_state().has_value());
}

TEST_F(MetadataStoreTest, DataSurvivesReopen) {
    store_->create_document(make_document("doc1"));
    auto ids = add_chunks("doc1", {"aaaa"});
    store_.reset();

    MetadataStore reopened(dir_.file("meta.sqlite"));
    EXPECT_EQ(reopened.count_documents(), 1ul);
    EXPECT_EQ(reopened.all_chunk_ids(), ids);
}

} // namespace docindex::rag
