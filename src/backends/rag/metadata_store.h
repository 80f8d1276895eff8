/**
 * @file metadata_store.h
 * @brief Durable document and chunk metadata (SQLite)
 */

#ifndef DOCINDEX_METADATA_STORE_H
#define DOCINDEX_METADATA_STORE_H

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rag_types.h"

namespace docindex {
namespace rag {

/**
 * @brief Mapping from document and chunk identifiers to their fields
 *
 * Every write is committed (WAL, synchronous=FULL) before the call returns.
 * Chunk identifiers come from an AUTOINCREMENT key and are never reused,
 * not even after delete_all(). Reads run on pooled read connections and do
 * not wait for writers.
 *
 * Thread-safe.
 */
class MetadataStore {
public:
    /**
     * @throws StorageError if the database cannot be opened or migrated
     */
    explicit MetadataStore(const std::string& db_path);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // -------------------------------------------------------------------------
    // Documents
    // -------------------------------------------------------------------------

    /**
     * @throws IntegrityError if the identifier already exists
     */
    void create_document(const Document& document);

    /**
     * @throws NotFoundError
     */
    Document get_document(const std::string& document_id) const;

    std::optional<Document> find_document(const std::string& document_id) const;

    /**
     * @brief All documents with their chunk count and total text length
     */
    std::vector<Document> list_documents() const;

    std::vector<Document> documents_with_status(DocumentStatus status) const;

    /**
     * @throws NotFoundError
     */
    void set_document_status(const std::string& document_id, DocumentStatus status);

    /**
     * @brief Delete a document and, by cascade, its chunks
     *
     * @return Identifiers of the removed chunks
     * @throws NotFoundError
     */
    std::vector<ChunkId> delete_document(const std::string& document_id);

    size_t count_documents() const;

    // -------------------------------------------------------------------------
    // Chunks
    // -------------------------------------------------------------------------

    /**
     * @brief Append chunks to a document in one transaction
     *
     * Positions continue after the document's existing chunks.
     *
     * @return New chunk identifiers, in input order
     * @throws NotFoundError if the document does not exist
     * @throws IntegrityError on a duplicate chunk identifier or position
     */
    std::vector<ChunkId> create_chunks(const std::string& document_id,
                                       const std::vector<NewChunk>& chunks);

    /**
     * @brief Append chunks that carry text only
     */
    std::vector<ChunkId> create_chunks(const std::string& document_id,
                                       const std::vector<std::string>& texts);

    /**
     * @brief Chunks for the given ids, in the order given; unknown ids are skipped
     */
    std::vector<Chunk> get_chunks_by_ids(const std::vector<ChunkId>& ids,
                                         bool with_embeddings = false) const;

    /**
     * @brief Chunks joined with their document's title and filename
     *
     * Reads one snapshot; unknown ids are skipped.
     */
    std::vector<ChunkRecord> resolve_chunks(const std::vector<ChunkId>& ids) const;

    /**
     * @brief Chunks of one document in position order
     */
    std::vector<Chunk> get_chunks_by_document(const std::string& document_id,
                                              bool with_embeddings = false) const;

    std::vector<ChunkId> chunk_ids_by_document(const std::string& document_id) const;

    /**
     * @brief Every chunk id in insertion order
     */
    std::vector<ChunkId> all_chunk_ids() const;

    /**
     * @brief Every chunk with its embedding, in insertion order
     */
    std::vector<Chunk> get_all_chunks() const;

    /**
     * @brief Stored embeddings for the given ids, in the order given
     * @throws IntegrityError if an id is unknown or has no embedding
     */
    std::vector<std::pair<ChunkId, std::vector<float>>> get_embeddings(
        const std::vector<ChunkId>& ids) const;

    /**
     * @brief Replace stored embeddings in one transaction
     */
    void update_embeddings(const std::vector<std::pair<ChunkId, std::vector<float>>>& embeddings);

    size_t delete_chunks_by_document(const std::string& document_id);

    /**
     * @brief Chunk count
     */
    size_t count() const;

    /**
     * @brief Delete every document and chunk; identifiers keep increasing
     */
    void delete_all();

    // -------------------------------------------------------------------------
    // Index state
    // -------------------------------------------------------------------------

    void save_index_state(const IndexState& state);
    std::optional<IndexState> load_index_state() const;
    void clear_index_state();

    const std::string& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_METADATA_STORE_H
