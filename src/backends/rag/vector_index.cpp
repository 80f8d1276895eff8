/**
 * @file vector_index.cpp
 * @brief Backend selection, hit ordering and chunk-set checksum
 */

#include "vector_index.h"

#include <algorithm>

#include "rag_config.h"
#include "rag_errors.h"
#include "vector_index_flat.h"
#include "vector_index_usearch.h"

namespace docindex {
namespace rag {

bool hit_ranks_before(const SearchHit& a, const SearchHit& b) noexcept {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
}

void sort_hits(std::vector<SearchHit>& hits) {
    std::sort(hits.begin(), hits.end(), hit_ranks_before);
}

std::shared_ptr<IVectorIndexFactory> make_vector_index_factory(const RAGBackendConfig& config) {
    if (config.index_backend == "flat") {
        return std::make_shared<FlatVectorIndexFactory>();
    }
    if (config.index_backend == "usearch") {
        USearchIndexConfig usearch_config;
        usearch_config.connectivity = config.connectivity;
        usearch_config.expansion_add = config.expansion_add;
        usearch_config.expansion_search = config.expansion_search;
        usearch_config.exact_search = config.exact_search;
        return std::make_shared<USearchVectorIndexFactory>(usearch_config);
    }
    throw ValidationError("unknown index backend: " + config.index_backend);
}

uint64_t chunk_set_checksum(std::vector<ChunkId> ids) {
    constexpr uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr uint64_t kPrime = 1099511628211ULL;

    std::sort(ids.begin(), ids.end());

    uint64_t hash = kOffsetBasis;
    for (ChunkId id : ids) {
        auto value = static_cast<uint64_t>(id);
        for (int byte = 0; byte < 8; ++byte) {
            hash ^= (value >> (byte * 8)) & 0xFFu;
            hash *= kPrime;
        }
    }
    return hash;
}

} // namespace rag
} // namespace docindex
