/**
 * @file vector_index_flat.cpp
 * @brief Exact inner-product index
 */

#include "vector_index_flat.h"

#include <algorithm>
#include <cstring>
#include <fstream>

#include "rag_errors.h"
#include "vector_math.h"

namespace docindex {
namespace rag {

namespace {

constexpr char kMagic[8] = {'D', 'I', 'X', 'F', 'L', 'A', 'T', '1'};

} // namespace

FlatVectorIndex::FlatVectorIndex(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ValidationError("vector dimension must be positive");
    }
}

void FlatVectorIndex::reserve(size_t capacity) {
    ids_.reserve(capacity);
    vectors_.reserve(capacity * dimension_);
    id_set_.reserve(capacity);
}

void FlatVectorIndex::add(ChunkId id, const float* vector) {
    if (!id_set_.insert(id).second) {
        throw IndexBuildError("duplicate chunk id " + std::to_string(id));
    }
    ids_.push_back(id);
    vectors_.insert(vectors_.end(), vector, vector + dimension_);
}

std::vector<SearchHit> FlatVectorIndex::search(const float* query, size_t k) const {
    std::vector<SearchHit> hits;
    if (k == 0 || ids_.empty()) {
        return hits;
    }

    hits.reserve(ids_.size());
    for (size_t row = 0; row < ids_.size(); ++row) {
        SearchHit hit;
        hit.chunk_id = ids_[row];
        hit.score = dot_product(query, vectors_.data() + row * dimension_, dimension_);
        hits.push_back(hit);
    }

    size_t keep = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + keep, hits.end(), hit_ranks_before);
    hits.resize(keep);
    return hits;
}

void FlatVectorIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError("cannot open " + path + " for writing");
    }

    uint64_t dimension = dimension_;
    uint64_t count = ids_.size();
    out.write(kMagic, sizeof(kMagic));
    out.write(reinterpret_cast<const char*>(&dimension), sizeof(dimension));
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));
    out.write(reinterpret_cast<const char*>(ids_.data()),
              static_cast<std::streamsize>(ids_.size() * sizeof(ChunkId)));
    out.write(reinterpret_cast<const char*>(vectors_.data()),
              static_cast<std::streamsize>(vectors_.size() * sizeof(float)));
    out.flush();
    if (!out) {
        throw StorageError("failed writing " + path);
    }
}

void FlatVectorIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("cannot open " + path);
    }

    char magic[sizeof(kMagic)];
    uint64_t dimension = 0;
    uint64_t count = 0;
    in.read(magic, sizeof(magic));
    in.read(reinterpret_cast<char*>(&dimension), sizeof(dimension));
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw StorageError(path + " is not a flat index file");
    }
    if (dimension != dimension_) {
        throw StorageError("index file dimension " + std::to_string(dimension) +
                           " does not match " + std::to_string(dimension_));
    }

    std::vector<ChunkId> ids(count);
    std::vector<float> vectors(count * dimension_);
    in.read(reinterpret_cast<char*>(ids.data()),
            static_cast<std::streamsize>(ids.size() * sizeof(ChunkId)));
    in.read(reinterpret_cast<char*>(vectors.data()),
            static_cast<std::streamsize>(vectors.size() * sizeof(float)));
    if (!in) {
        throw StorageError(path + " is truncated");
    }

    std::unordered_set<ChunkId> id_set(ids.begin(), ids.end());
    if (id_set.size() != ids.size()) {
        throw StorageError(path + " contains duplicate chunk ids");
    }

    ids_ = std::move(ids);
    vectors_ = std::move(vectors);
    id_set_ = std::move(id_set);
}

nlohmann::json FlatVectorIndex::statistics() const {
    nlohmann::json stats;
    stats["backend"] = backend_name();
    stats["num_vectors"] = ids_.size();
    stats["dimension"] = dimension_;
    stats["memory_bytes"] = vectors_.size() * sizeof(float) + ids_.size() * sizeof(ChunkId);
    return stats;
}

std::unique_ptr<IVectorIndex> FlatVectorIndexFactory::create(size_t dimension) const {
    return std::make_unique<FlatVectorIndex>(dimension);
}

} // namespace rag
} // namespace docindex
