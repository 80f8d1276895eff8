/**
 * @file vector_index_usearch.cpp
 * @brief Vector index implementation using USearch
 */

// Disable FP16 and SIMD before including USearch headers
#define USEARCH_USE_FP16LIB 0
#define USEARCH_USE_SIMSIMD 0

// Define f16_native_t based on platform capabilities
// USearch expects this type to be defined when FP16LIB and SIMSIMD are disabled
#if defined(__ARM_ARCH) || defined(__aarch64__) || defined(_M_ARM64)
    #if __has_include(<arm_fp16.h>)
        #include <arm_fp16.h>
        using f16_native_t = __fp16;
    #else
        #include <cstdint>
        using f16_native_t = uint16_t;  // binary16 representation
    #endif
#else
    // Non-ARM platforms (x86, x86_64)
    #include <cstdint>
    using f16_native_t = uint16_t;  // binary16 representation
#endif

#include "vector_index_usearch.h"

#include <algorithm>

#include <usearch/index_dense.hpp>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"

#define LOG_TAG "RAG.VectorIndex"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

using namespace unum::usearch;

namespace {

constexpr size_t kMinCapacity = 64;

} // namespace

// =============================================================================
// IMPLEMENTATION
// =============================================================================

class USearchVectorIndex::Impl {
public:
    Impl(size_t dimension, const USearchIndexConfig& config)
        : dimension_(dimension), config_(config) {
        if (dimension_ == 0) {
            throw ValidationError("vector dimension must be positive");
        }

        index_dense_config_t usearch_config;
        usearch_config.connectivity = config.connectivity;
        usearch_config.expansion_add = config.expansion_add;
        usearch_config.expansion_search = config.expansion_search;

        // Inner product over unit vectors; distance is 1 - cosine similarity
        metric_punned_t metric(
            static_cast<std::size_t>(dimension_),
            metric_kind_t::ip_k,
            scalar_kind_t::f32_k
        );

        auto result = index_dense_t::make(metric, usearch_config);
        if (!result) {
            LOGE("Failed to create USearch index: %s", result.error.what());
            throw IndexBuildError(std::string("failed to create USearch index: ") +
                                  result.error.what());
        }
        index_ = std::move(result.index);
    }

    size_t dimension() const noexcept { return dimension_; }

    size_t size() const noexcept { return index_.size(); }

    void reserve(size_t capacity) {
        if (capacity <= index_.capacity()) {
            return;
        }
        if (!index_.reserve(capacity)) {
            throw IndexBuildError("failed to reserve USearch capacity " +
                                  std::to_string(capacity));
        }
    }

    void add(ChunkId id, const float* vector) {
        auto key = static_cast<default_key_t>(id);
        if (index_.contains(key)) {
            throw IndexBuildError("duplicate chunk id " + std::to_string(id));
        }

        // Grow geometrically; USearch requires capacity before add()
        if (index_.size() + 1 > index_.capacity()) {
            reserve(std::max(kMinCapacity, index_.capacity() * 2));
        }

        auto add_result = index_.add(key, vector);
        if (!add_result) {
            LOGE("Failed to add chunk %lld to index: %s",
                 static_cast<long long>(id), add_result.error.what());
            throw IndexBuildError(std::string("USearch add failed: ") + add_result.error.what());
        }
    }

    std::vector<SearchHit> search(const float* query, size_t k) const {
        std::vector<SearchHit> hits;
        if (k == 0 || index_.size() == 0) {
            return hits;
        }

        auto matches = index_.search(query, k, index_dense_t::any_thread(), config_.exact_search);
        if (!matches) {
            throw IndexBuildError(std::string("USearch search failed: ") + matches.error.what());
        }

        hits.reserve(matches.size());
        for (std::size_t i = 0; i < matches.size(); ++i) {
            SearchHit hit;
            hit.chunk_id = static_cast<ChunkId>(matches[i].member.key);
            hit.score = 1.0f - matches[i].distance;
            hits.push_back(hit);
        }

        // USearch orders by distance only; make ties deterministic
        sort_hits(hits);
        return hits;
    }

    void save(const std::string& path) const {
        auto save_result = index_.save(path.c_str());
        if (!save_result) {
            LOGE("Failed to save USearch index: %s", save_result.error.what());
            throw StorageError(std::string("failed to save USearch index: ") +
                               save_result.error.what());
        }
    }

    void load(const std::string& path) {
        auto load_result = index_.load(path.c_str());
        if (!load_result) {
            LOGE("Failed to load USearch index: %s", load_result.error.what());
            throw StorageError(std::string("failed to load USearch index: ") +
                               load_result.error.what());
        }
        if (index_.dimensions() != dimension_) {
            throw StorageError("index file dimension " + std::to_string(index_.dimensions()) +
                               " does not match " + std::to_string(dimension_));
        }
        LOGI("Loaded USearch index from %s (%zu vectors)", path.c_str(), index_.size());
    }

    nlohmann::json statistics() const {
        nlohmann::json stats;
        stats["backend"] = "usearch";
        stats["num_vectors"] = index_.size();
        stats["dimension"] = dimension_;
        stats["memory_bytes"] = index_.memory_usage();
        stats["connectivity"] = config_.connectivity;
        stats["expansion_search"] = config_.expansion_search;
        stats["exact_search"] = config_.exact_search;
        return stats;
    }

private:
    size_t dimension_;
    USearchIndexConfig config_;
    index_dense_t index_;
};

// =============================================================================
// PUBLIC API
// =============================================================================

USearchVectorIndex::USearchVectorIndex(size_t dimension, const USearchIndexConfig& config)
    : impl_(std::make_unique<Impl>(dimension, config)) {
}

USearchVectorIndex::~USearchVectorIndex() = default;

size_t USearchVectorIndex::dimension() const noexcept {
    return impl_->dimension();
}

size_t USearchVectorIndex::size() const noexcept {
    return impl_->size();
}

void USearchVectorIndex::reserve(size_t capacity) {
    impl_->reserve(capacity);
}

void USearchVectorIndex::add(ChunkId id, const float* vector) {
    impl_->add(id, vector);
}

std::vector<SearchHit> USearchVectorIndex::search(const float* query, size_t k) const {
    return impl_->search(query, k);
}

void USearchVectorIndex::save(const std::string& path) const {
    impl_->save(path);
}

void USearchVectorIndex::load(const std::string& path) {
    impl_->load(path);
}

nlohmann::json USearchVectorIndex::statistics() const {
    return impl_->statistics();
}

std::unique_ptr<IVectorIndex> USearchVectorIndexFactory::create(size_t dimension) const {
    return std::make_unique<USearchVectorIndex>(dimension, config_);
}

} // namespace rag
} // namespace docindex
