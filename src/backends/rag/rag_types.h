/**
 * @file rag_types.h
 * @brief Records shared by the metadata store, index manager and retrieval
 */

#ifndef DOCINDEX_RAG_TYPES_H
#define DOCINDEX_RAG_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docindex {
namespace rag {

using ChunkId = int64_t;

enum class DocumentStatus {
    kPending,
    kProcessed,
    kFailed,
};

const char* to_string(DocumentStatus status) noexcept;

/**
 * @brief Parse a status column value
 * @throws IntegrityError for an unknown value
 */
DocumentStatus parse_document_status(const std::string& value);

/**
 * @brief Source document
 */
struct Document {
    std::string id;
    std::string filename;
    std::string title;
    int64_t uploaded_at = 0;      // Unix seconds
    int64_t byte_size = 0;
    DocumentStatus status = DocumentStatus::kPending;

    // Filled by MetadataStore::list_documents / get_document
    size_t chunk_count = 0;
    size_t total_length = 0;
};

/**
 * @brief Retrievable unit of a document. Immutable once created.
 */
struct Chunk {
    ChunkId id = 0;
    std::string document_id;
    size_t position = 0;                    // 0-based order within the document
    std::string text;
    std::optional<int64_t> source_offset;   // byte offset into the document text
    std::vector<float> embedding;
};

/**
 * @brief Input for MetadataStore::create_chunks
 */
struct NewChunk {
    std::string text;
    std::optional<int64_t> source_offset;
    std::vector<float> embedding;
};

/**
 * @brief Chunk resolved for a search hit, joined with its document
 */
struct ChunkRecord {
    ChunkId id = 0;
    std::string document_id;
    size_t position = 0;
    std::string text;
    std::string title;
    std::string filename;
};

/**
 * @brief Last persisted generation, recorded next to the metadata
 */
struct IndexState {
    uint64_t generation = 0;
    size_t chunk_count = 0;
    uint64_t checksum = 0;
    size_t dimension = 0;
    int64_t built_at = 0;
};

struct IndexStats {
    size_t document_count = 0;
    size_t chunk_count = 0;
    size_t vector_count = 0;
    size_t dimension = 0;
    uint64_t generation = 0;
    std::string state;
    std::string backend;
    std::string embedding_model;
    std::string index_path;
};

void to_json(nlohmann::json& j, const IndexStats& stats);
void to_json(nlohmann::json& j, const Document& document);

/**
 * @brief Display title derived from a filename
 *
 * Drops the extension, turns '_' and '-' into spaces, removes 19xx/20xx
 * years and collapses whitespace. "deep_learning-2019.pdf" -> "deep learning".
 */
std::string derive_title(const std::string& filename);

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RAG_TYPES_H
