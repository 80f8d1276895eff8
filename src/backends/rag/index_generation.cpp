/**
 * @file index_generation.cpp
 * @brief Index generations, candidate builds and generation persistence
 */

#include "index_generation.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_set>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"

#define LOG_TAG "RAG.IndexGeneration"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace fs = std::filesystem;

namespace {

// Cancellation is polled once per this many inserted vectors
constexpr size_t kCancelCheckInterval = 256;

std::string sidecar_path(const std::string& path) {
    return path + ".meta.json";
}

void replace_file(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw StorageError("failed to rename " + from + " to " + to + ": " + ec.message());
    }
}

void check_dimension(ChunkId id, const std::vector<float>& embedding, size_t dimension) {
    if (embedding.size() != dimension) {
        throw IntegrityError("chunk " + std::to_string(id) + " has embedding dimension " +
                             std::to_string(embedding.size()) + ", index expects " +
                             std::to_string(dimension));
    }
}

} // namespace

int64_t unix_time_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// =============================================================================
// IndexGeneration
// =============================================================================

IndexGeneration::IndexGeneration(uint64_t number, int64_t built_at,
                                 std::vector<ChunkId> chunk_ids,
                                 std::unique_ptr<IVectorIndex> index)
    : number_(number),
      built_at_(built_at),
      dimension_(index->dimension()),
      chunk_ids_(std::move(chunk_ids)),
      index_(std::move(index)) {
    if (chunk_ids_.size() != index_->size()) {
        throw IntegrityError("generation has " + std::to_string(chunk_ids_.size()) +
                             " chunk ids but " + std::to_string(index_->size()) + " vectors");
    }
}

uint64_t IndexGeneration::number() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return number_;
}

int64_t IndexGeneration::built_at() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return built_at_;
}

size_t IndexGeneration::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return chunk_ids_.size();
}

size_t IndexGeneration::vector_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_->size();
}

std::vector<ChunkId> IndexGeneration::chunk_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return chunk_ids_;
}

uint64_t IndexGeneration::checksum() const {
    return chunk_set_checksum(chunk_ids());
}

std::vector<SearchHit> IndexGeneration::search(const std::vector<float>& query, size_t k) const {
    if (query.size() != dimension_) {
        throw ValidationError("query dimension " + std::to_string(query.size()) +
                              " does not match index dimension " + std::to_string(dimension_));
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_->search(query.data(), std::min(k, chunk_ids_.size()));
}

void IndexGeneration::append(const EmbeddingEntries& entries, uint64_t new_number) {
    if (!supports_append()) {
        throw IndexBuildError(std::string(backend_name()) + " index does not support appends");
    }
    for (const auto& entry : entries) {
        check_dimension(entry.first, entry.second, dimension_);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    index_->reserve(chunk_ids_.size() + entries.size());
    for (const auto& entry : entries) {
        index_->add(entry.first, entry.second.data());
        chunk_ids_.push_back(entry.first);
    }
    number_ = new_number;
    built_at_ = unix_time_now();
}

void IndexGeneration::save(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const std::string index_tmp = path + ".tmp";
    const std::string meta_path = sidecar_path(path);
    const std::string meta_tmp = meta_path + ".tmp";

    index_->save(index_tmp);

    nlohmann::json meta;
    meta["generation"] = number_;
    meta["built_at"] = built_at_;
    meta["dimension"] = dimension_;
    meta["backend"] = index_->backend_name();
    meta["checksum"] = std::to_string(chunk_set_checksum(chunk_ids_));
    meta["chunk_ids"] = chunk_ids_;

    {
        std::ofstream meta_file(meta_tmp, std::ios::trunc);
        if (!meta_file) {
            throw StorageError("failed to open " + meta_tmp);
        }
        meta_file << meta.dump();
        meta_file.flush();
        if (!meta_file) {
            throw StorageError("failed writing " + meta_tmp);
        }
    }

    // The sidecar is renamed last: a crash in between leaves a count or
    // checksum mismatch that open() repairs with a rebuild
    replace_file(index_tmp, path);
    replace_file(meta_tmp, meta_path);

    LOGI("Saved generation %llu (%zu vectors) to %s",
         static_cast<unsigned long long>(number_), chunk_ids_.size(), path.c_str());
}

std::shared_ptr<IndexGeneration> IndexGeneration::load(const std::string& path,
                                                       const IVectorIndexFactory& factory,
                                                       size_t dimension) {
    const std::string meta_path = sidecar_path(path);
    std::ifstream meta_file(meta_path);
    if (!meta_file) {
        throw StorageError("missing generation sidecar " + meta_path);
    }

    nlohmann::json meta;
    uint64_t number = 0;
    int64_t built_at = 0;
    std::vector<ChunkId> chunk_ids;
    try {
        meta_file >> meta;
        number = meta.at("generation").get<uint64_t>();
        built_at = meta.at("built_at").get<int64_t>();
        chunk_ids = meta.at("chunk_ids").get<std::vector<ChunkId>>();

        if (meta.at("dimension").get<size_t>() != dimension) {
            throw StorageError("persisted generation dimension does not match configuration");
        }
        if (meta.at("backend").get<std::string>() != factory.backend_name()) {
            throw StorageError("persisted generation was built by backend " +
                               meta.at("backend").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("malformed generation sidecar " + meta_path + ": " + e.what());
    }

    std::unordered_set<ChunkId> unique(chunk_ids.begin(), chunk_ids.end());
    if (unique.size() != chunk_ids.size()) {
        throw StorageError("generation sidecar lists duplicate chunk ids");
    }

    auto index = factory.create(dimension);
    index->load(path);
    if (index->size() != chunk_ids.size()) {
        throw StorageError("persisted index has " + std::to_string(index->size()) +
                           " vectors but sidecar lists " + std::to_string(chunk_ids.size()));
    }

    return std::make_shared<IndexGeneration>(number, built_at, std::move(chunk_ids),
                                             std::move(index));
}

nlohmann::json IndexGeneration::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    nlohmann::json stats = index_->statistics();
    stats["generation"] = number_;
    stats["built_at"] = built_at_;
    stats["num_chunks"] = chunk_ids_.size();
    return stats;
}

// =============================================================================
// IndexBuilder
// =============================================================================

IndexBuilder::IndexBuilder(std::shared_ptr<IVectorIndexFactory> factory, size_t dimension)
    : factory_(std::move(factory)), dimension_(dimension) {
    if (!factory_) {
        throw ValidationError("index factory is required");
    }
}

std::shared_ptr<IndexGeneration> IndexBuilder::build(uint64_t number,
                                                     const EmbeddingEntries& entries,
                                                     const CancellationToken* cancel) const {
    std::unique_ptr<IVectorIndex> index;
    std::vector<ChunkId> chunk_ids;
    chunk_ids.reserve(entries.size());

    try {
        index = factory_->create(dimension_);
        index->reserve(entries.size());

        for (size_t i = 0; i < entries.size(); ++i) {
            if (cancel != nullptr && i % kCancelCheckInterval == 0) {
                cancel->throw_if_cancelled("index build");
            }
            const auto& entry = entries[i];
            check_dimension(entry.first, entry.second, dimension_);
            index->add(entry.first, entry.second.data());
            chunk_ids.push_back(entry.first);
        }
    } catch (const RagError&) {
        throw;
    } catch (const std::exception& e) {
        throw IndexBuildError(std::string("index build failed: ") + e.what());
    }

    if (cancel != nullptr) {
        cancel->throw_if_cancelled("index build");
    }

    LOGI("Built generation %llu with %zu vectors (%s)",
         static_cast<unsigned long long>(number), chunk_ids.size(), index->backend_name());
    return std::make_shared<IndexGeneration>(number, unix_time_now(), std::move(chunk_ids),
                                             std::move(index));
}

} // namespace rag
} // namespace docindex
