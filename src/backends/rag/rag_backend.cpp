/**
 * @file rag_backend.cpp
 * @brief Document index backend
 */

#include "rag_backend.h"

#include "dix/core/dix_logger.h"
#include "rag_errors.h"

#define LOG_TAG "RAG.Backend"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

RAGBackend::RAGBackend(
    const RAGBackendConfig& config,
    std::shared_ptr<IEmbeddingProvider> embedding_provider,
    std::shared_ptr<IVectorIndexFactory> index_factory
) : config_(config),
    assembler_(config) {
    config_.validate();

    if (!embedding_provider || !embedding_provider->is_ready()) {
        throw EmbeddingUnavailable("embedding provider not available");
    }

    store_ = std::make_shared<MetadataStore>(config_.metadata_path);
    manager_ = std::make_shared<IndexManager>(config_, store_, std::move(embedding_provider),
                                              std::move(index_factory));
    retrieval_ = std::make_unique<RetrievalEngine>(manager_);

    LOGI("RAG backend initialized: dim=%zu, chunk_size=%zu, backend=%s, documents=%zu",
         config_.embedding_dimension, config_.chunk_size, config_.index_backend.c_str(),
         store_->count_documents());
}

RAGBackend::~RAGBackend() = default;

AddResult RAGBackend::add_document(
    const std::string& id,
    const std::string& text,
    const std::string& filename,
    const std::string& title
) {
    DocumentInput input;
    input.id = id;
    input.text = text;
    input.filename = filename;
    input.title = title;
    return manager_->add_document(input);
}

std::vector<AddResult> RAGBackend::add_documents(const std::vector<DocumentInput>& documents) {
    auto results = manager_->add_documents(documents);

    size_t processed = 0;
    for (const auto& result : results) {
        if (result.status == DocumentStatus::kProcessed) {
            ++processed;
        }
    }
    LOGI("Batch add: %zu of %zu documents processed", processed, results.size());
    return results;
}

void RAGBackend::delete_document(const std::string& id) {
    manager_->delete_document(id);
}

void RAGBackend::rebuild() {
    manager_->rebuild();
}

void RAGBackend::cancel_rebuild() {
    manager_->cancel_active();
}

void RAGBackend::reset() {
    manager_->reset();
}

void RAGBackend::resume_mutations() {
    manager_->resume_mutations();
}

std::vector<RetrievalResult> RAGBackend::search(const std::string& query_text,
                                                size_t top_k) const {
    return retrieval_->query(query_text, top_k);
}

std::vector<RetrievalResult> RAGBackend::search_vector(const std::vector<float>& query,
                                                       size_t top_k) const {
    return retrieval_->query_vector(query, top_k);
}

AskResult RAGBackend::ask(const std::string& question, size_t top_k) const {
    AskResult answer;
    answer.results = retrieval_->query(question, top_k > 0 ? top_k : config_.top_k);
    answer.context = assembler_.build_context(answer.results);
    answer.prompt = assembler_.format_prompt(question, answer.context);

    LOGI("Built context from %zu chunks, %zu chars", answer.results.size(),
         answer.context.size());
    return answer;
}

std::string RAGBackend::build_context(const std::vector<RetrievalResult>& results) const {
    return assembler_.build_context(results);
}

std::string RAGBackend::format_prompt(const std::string& query,
                                      const std::string& context) const {
    return assembler_.format_prompt(query, context);
}

std::vector<Document> RAGBackend::list_documents() const {
    return store_->list_documents();
}

Document RAGBackend::get_document(const std::string& id) const {
    return store_->get_document(id);
}

IndexStats RAGBackend::stats() const {
    return manager_->stats();
}

nlohmann::json RAGBackend::get_statistics() const {
    nlohmann::json stats = manager_->statistics();
    stats["documents"] = store_->list_documents();
    return stats;
}

size_t RAGBackend::document_count() const {
    return store_->count_documents();
}

} // namespace rag
} // namespace docindex
