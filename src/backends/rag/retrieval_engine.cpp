/**
 * @file retrieval_engine.cpp
 * @brief Ranked chunk retrieval against the current index generation
 */

#include "retrieval_engine.h"

#include <unordered_map>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"
#include "vector_math.h"

#define LOG_TAG "RAG.Retrieval"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // namespace

void to_json(nlohmann::json& j, const RetrievalResult& result) {
    j = nlohmann::json{
        {"chunk_id", result.chunk_id},
        {"document_id", result.document_id},
        {"position", result.position},
        {"text", result.text},
        {"title", result.title},
        {"filename", result.filename},
        {"score", result.score}
    };
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<const IndexManager> manager)
    : manager_(std::move(manager)) {
    if (!manager_) {
        throw ValidationError("index manager is required");
    }
}

std::vector<RetrievalResult> RetrievalEngine::query(const std::string& text, size_t k) const {
    if (k == 0) {
        throw ValidationError("k must be a positive integer");
    }
    if (is_blank(text)) {
        throw ValidationError("query text is empty");
    }

    auto generation = manager_->current_generation();
    if (!generation || generation->size() == 0) {
        return {};
    }

    // The generation searched is taken after embedding, in search_current
    return search_current(manager_->embed_query(text), k);
}

std::vector<RetrievalResult> RetrievalEngine::query_vector(std::vector<float> vector,
                                                           size_t k) const {
    if (k == 0) {
        throw ValidationError("k must be a positive integer");
    }
    if (vector.size() != manager_->config().embedding_dimension) {
        throw ValidationError("query vector dimension " + std::to_string(vector.size()) +
                              " does not match " +
                              std::to_string(manager_->config().embedding_dimension));
    }
    if (!normalize_vector(vector)) {
        throw ValidationError("query vector has zero length");
    }

    return search_current(vector, k);
}

std::vector<RetrievalResult> RetrievalEngine::search_current(const std::vector<float>& vector,
                                                             size_t k) const {
    for (;;) {
        auto generation = manager_->current_generation();
        if (!generation || generation->size() == 0) {
            return {};
        }

        size_t missing = 0;
        auto results = resolve(generation->search(vector, k), missing);
        if (missing == 0) {
            LOGI("Query returned %zu results from generation %llu", results.size(),
                 static_cast<unsigned long long>(generation->number()));
            return results;
        }

        // Metadata is deleted only after the generation without those chunks
        // is swapped in, so a newer generation exists: search that one
        if (manager_->current_generation() != generation) {
            LOGI("Generation %llu was replaced during the query; searching again",
                 static_cast<unsigned long long>(generation->number()));
            continue;
        }

        LOGW("%zu chunks of the current generation are missing from the metadata store",
             missing);
        return results;
    }
}

std::vector<RetrievalResult> RetrievalEngine::resolve(const std::vector<SearchHit>& hits,
                                                      size_t& missing) const {
    std::vector<ChunkId> ids;
    ids.reserve(hits.size());
    for (const auto& hit : hits) {
        ids.push_back(hit.chunk_id);
    }

    std::unordered_map<ChunkId, ChunkRecord> records;
    for (auto& record : manager_->store()->resolve_chunks(ids)) {
        ChunkId id = record.id;
        records.emplace(id, std::move(record));
    }

    std::vector<RetrievalResult> results;
    results.reserve(hits.size());
    missing = 0;
    for (const auto& hit : hits) {
        auto it = records.find(hit.chunk_id);
        if (it == records.end()) {
            ++missing;
            continue;
        }
        RetrievalResult result;
        result.chunk_id = hit.chunk_id;
        result.document_id = it->second.document_id;
        result.position = it->second.position;
        result.text = it->second.text;
        result.title = it->second.title;
        result.filename = it->second.filename;
        result.score = hit.score;
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace rag
} // namespace docindex
