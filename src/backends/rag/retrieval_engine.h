/**
 * @file retrieval_engine.h
 * @brief Ranked chunk retrieval against the current index generation
 */

#ifndef DOCINDEX_RETRIEVAL_ENGINE_H
#define DOCINDEX_RETRIEVAL_ENGINE_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "index_manager.h"

namespace docindex {
namespace rag {

/**
 * @brief Search result resolved against the metadata store
 */
struct RetrievalResult {
    ChunkId chunk_id = 0;
    std::string document_id;
    size_t position = 0;
    std::string text;
    std::string title;
    std::string filename;
    float score = 0.0f;       // cosine similarity
};

void to_json(nlohmann::json& j, const RetrievalResult& result);

/**
 * @brief Embeds queries and searches the current generation
 *
 * The generation is taken after the query is embedded. Chunk records are
 * resolved after the search, so they come from the same or a later
 * metadata snapshot. A hit whose chunk has since been deleted means a newer
 * generation was swapped in, and the search is repeated against it, so a
 * result set is always complete for one generation. Thread-safe; never
 * blocks on mutations.
 */
class RetrievalEngine {
public:
    explicit RetrievalEngine(std::shared_ptr<const IndexManager> manager);

    /**
     * @brief Top-k chunks for a text query
     *
     * k is capped at the generation's chunk count. An empty index returns
     * no results without calling the embedder.
     *
     * @throws ValidationError if k is 0 or the text is blank
     * @throws EmbeddingUnavailable
     */
    std::vector<RetrievalResult> query(const std::string& text, size_t k) const;

    /**
     * @brief Top-k chunks for a query vector (normalised before searching)
     *
     * @throws ValidationError if k is 0, the dimension is wrong or the
     *         vector is zero
     */
    std::vector<RetrievalResult> query_vector(std::vector<float> vector, size_t k) const;

private:
    std::vector<RetrievalResult> search_current(const std::vector<float>& vector, size_t k) const;
    std::vector<RetrievalResult> resolve(const std::vector<SearchHit>& hits,
                                         size_t& missing) const;

    std::shared_ptr<const IndexManager> manager_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RETRIEVAL_ENGINE_H
