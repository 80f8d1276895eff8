/**
 * @file rag_config.h
 * @brief Configuration of the document index
 */

#ifndef DOCINDEX_RAG_CONFIG_H
#define DOCINDEX_RAG_CONFIG_H

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace docindex {
namespace rag {

/**
 * @brief Backend configuration
 *
 * Passed by value to the chunker, index manager and retrieval engine at
 * construction time. Nothing reads configuration from globals.
 */
struct RAGBackendConfig {
    // Embeddings
    size_t embedding_dimension = 384;
    size_t embed_batch_size = 32;
    size_t embed_timeout_ms = 0;                    // 0 disables the timeout
    std::string embedding_model_name = "all-MiniLM-L6-v2";

    // Chunking (characters)
    size_t chunk_size = 1000;
    size_t chunk_overlap = 200;
    size_t min_chunk_size = 100;

    // Retrieval and context
    size_t top_k = 5;
    size_t max_context_tokens = 2048;
    size_t chars_per_token = 4;
    std::string prompt_template =
        "Context from relevant documents:\n{context}\n\nQuestion: {query}\n\nAnswer:";

    // Vector index
    std::string index_backend = "usearch";          // "usearch" or "flat"
    size_t connectivity = 16;                       // HNSW M
    size_t expansion_add = 128;
    size_t expansion_search = 64;
    bool exact_search = false;

    // Persistence
    std::string metadata_path = "docindex.sqlite";
    std::string index_path;                         // empty keeps generations in memory
    bool reembed_on_rebuild = false;

    /**
     * @brief Check invariants between fields
     * @throws ValidationError
     */
    void validate() const;
};

void to_json(nlohmann::json& j, const RAGBackendConfig& config);

/**
 * @brief Read a configuration; absent keys keep their defaults
 * @throws ValidationError on wrong types or invalid values
 */
RAGBackendConfig config_from_json(const nlohmann::json& j);

/**
 * @brief Load a JSON configuration file
 * @throws ValidationError if the file is unreadable or malformed
 */
RAGBackendConfig load_config_file(const std::string& path);

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RAG_CONFIG_H
