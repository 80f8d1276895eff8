/**
 * @file rag_backend.h
 * @brief Document index backend
 */

#ifndef DOCINDEX_RAG_BACKEND_H
#define DOCINDEX_RAG_BACKEND_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "context_assembler.h"
#include "index_manager.h"
#include "inference_provider.h"
#include "metadata_store.h"
#include "rag_config.h"
#include "retrieval_engine.h"

namespace docindex {
namespace rag {

/**
 * @brief Retrieval output prepared for a language model
 */
struct AskResult {
    std::vector<RetrievalResult> results;
    std::string context;
    std::string prompt;
};

/**
 * @brief Document index coordinating metadata, embeddings and the vector index
 *
 * Owns the metadata store, index manager, retrieval engine and context
 * assembler built from one configuration. Thread-safe: queries run
 * concurrently with each other and with one mutation at a time.
 */
class RAGBackend {
public:
    /**
     * @brief Open (or create) the index described by config
     *
     * @param config Backend configuration
     * @param embedding_provider Embedding provider, required
     * @param index_factory Vector index backend; nullptr selects config.index_backend
     * @throws ValidationError, StorageError, IntegrityError
     */
    RAGBackend(
        const RAGBackendConfig& config,
        std::shared_ptr<IEmbeddingProvider> embedding_provider,
        std::shared_ptr<IVectorIndexFactory> index_factory = nullptr
    );

    ~RAGBackend();

    RAGBackend(const RAGBackend&) = delete;
    RAGBackend& operator=(const RAGBackend&) = delete;

    /**
     * @brief Chunk, embed and index a document
     *
     * @param id Unique document identifier
     * @param text Extracted document text
     * @param filename Source filename (defaults to id)
     * @param title Display title (derived from filename when empty)
     */
    AddResult add_document(
        const std::string& id,
        const std::string& text,
        const std::string& filename = "",
        const std::string& title = ""
    );

    std::vector<AddResult> add_documents(const std::vector<DocumentInput>& documents);

    void delete_document(const std::string& id);

    void rebuild();

    /**
     * @brief Cancel the add, delete or rebuild in flight
     */
    void cancel_rebuild();

    /**
     * @brief Delete everything. Irreversible.
     */
    void reset();

    void resume_mutations();

    /**
     * @brief Search for relevant chunks using query text
     *
     * @param query_text Query text to embed and search
     * @param top_k Number of results, must be positive
     * @return Results sorted by similarity
     */
    std::vector<RetrievalResult> search(const std::string& query_text, size_t top_k) const;

    std::vector<RetrievalResult> search_vector(const std::vector<float>& query, size_t top_k) const;

    /**
     * @brief Retrieve, build context and format the prompt
     *
     * @param top_k Number of chunks; 0 uses config.top_k
     */
    AskResult ask(const std::string& question, size_t top_k = 0) const;

    std::string build_context(const std::vector<RetrievalResult>& results) const;

    std::string format_prompt(const std::string& query, const std::string& context) const;

    std::vector<Document> list_documents() const;

    Document get_document(const std::string& id) const;

    IndexStats stats() const;

    nlohmann::json get_statistics() const;

    size_t document_count() const;

    const RAGBackendConfig& config() const { return config_; }

    IndexManager& index_manager() { return *manager_; }

private:
    RAGBackendConfig config_;
    std::shared_ptr<MetadataStore> store_;
    std::shared_ptr<IndexManager> manager_;
    std::unique_ptr<RetrievalEngine> retrieval_;
    ContextAssembler assembler_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RAG_BACKEND_H
