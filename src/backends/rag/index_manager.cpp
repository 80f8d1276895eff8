/**
 * @file index_manager.cpp
 * @brief Add/delete/rebuild/reset orchestration and generation swaps
 */

#include "index_manager.h"

#include <algorithm>
#include <filesystem>
#include <unordered_set>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"

#define LOG_TAG "RAG.IndexManager"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

const RAGBackendConfig& validated(const RAGBackendConfig& config) {
    config.validate();
    return config;
}

ChunkerConfig chunker_config(const RAGBackendConfig& config) {
    ChunkerConfig chunker;
    chunker.chunk_size = config.chunk_size;
    chunker.chunk_overlap = config.chunk_overlap;
    chunker.min_chunk_size = config.min_chunk_size;
    chunker.chars_per_token = config.chars_per_token;
    return chunker;
}

std::shared_ptr<IVectorIndexFactory> select_factory(std::shared_ptr<IVectorIndexFactory> factory,
                                                    const RAGBackendConfig& config) {
    return factory ? std::move(factory) : make_vector_index_factory(config);
}

// Publishes the token of the running mutation so cancel_active() can reach it
class ActiveCancelScope {
public:
    ActiveCancelScope(std::mutex& mutex, std::unique_ptr<CancellationToken>& slot,
                      const CancellationToken& token)
        : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = std::make_unique<CancellationToken>(token);
    }

    ~ActiveCancelScope() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_.reset();
    }

    ActiveCancelScope(const ActiveCancelScope&) = delete;
    ActiveCancelScope& operator=(const ActiveCancelScope&) = delete;

private:
    std::mutex& mutex_;
    std::unique_ptr<CancellationToken>& slot_;
};

} // namespace

const char* to_string(ManagerState state) noexcept {
    switch (state) {
        case ManagerState::kEmpty:
            return "EMPTY";
        case ManagerState::kReady:
            return "READY";
        case ManagerState::kRebuilding:
            return "REBUILDING";
    }
    return "UNKNOWN";
}

// =============================================================================
// LIFECYCLE
// =============================================================================

IndexManager::IndexManager(const RAGBackendConfig& config,
                           std::shared_ptr<MetadataStore> store,
                           std::shared_ptr<IEmbeddingProvider> embedder,
                           std::shared_ptr<IVectorIndexFactory> factory)
    : config_(validated(config)),
      store_(std::move(store)),
      embedder_(std::move(embedder)),
      builder_(select_factory(std::move(factory), config_), config_.embedding_dimension),
      chunker_(chunker_config(config_)) {
    if (!store_) {
        throw ValidationError("metadata store is required");
    }
    if (!embedder_) {
        throw ValidationError("embedding provider is required");
    }
    if (embedder_->dimension() != config_.embedding_dimension) {
        throw ValidationError("embedding provider dimension " +
                              std::to_string(embedder_->dimension()) +
                              " does not match configured dimension " +
                              std::to_string(config_.embedding_dimension));
    }
    embedding_ = std::make_unique<EmbeddingWorker>(embedder_);

    recover();

    LOGI("Index manager ready: backend=%s, dim=%zu, state=%s, generation=%llu",
         builder_.factory().backend_name().c_str(), config_.embedding_dimension,
         to_string(state()), static_cast<unsigned long long>(last_generation_.load()));
}

IndexManager::~IndexManager() {
    cancel_active();
}

void IndexManager::recover() {
    for (const auto& doc : store_->documents_with_status(DocumentStatus::kPending)) {
        LOGW("Document %s was left pending by an interrupted add; marking failed",
             doc.id.c_str());
        fail_document(doc.id);
    }

    auto persisted = store_->load_index_state();
    if (persisted) {
        last_generation_ = persisted->generation;
    }

    std::vector<ChunkId> ids = store_->all_chunk_ids();
    if (ids.empty()) {
        swap_generation(nullptr);
        if (persisted) {
            store_->clear_index_state();
        }
        remove_persisted_files();
        return;
    }

    const uint64_t expected = chunk_set_checksum(ids);
    if (!config_.index_path.empty()) {
        try {
            auto loaded = IndexGeneration::load(config_.index_path, builder_.factory(),
                                                config_.embedding_dimension);
            bool matches = loaded->size() == ids.size() && loaded->checksum() == expected;
            if (matches && persisted) {
                matches = persisted->checksum == expected && persisted->chunk_count == ids.size();
            }
            if (matches) {
                last_generation_ = std::max(last_generation_.load(), loaded->number());
                swap_generation(loaded);
                LOGI("Loaded generation %llu with %zu vectors",
                     static_cast<unsigned long long>(loaded->number()), loaded->size());
                return;
            }
            LOGW("Persisted generation holds %zu chunks, metadata holds %zu or checksum "
                 "differs; rebuilding", loaded->size(), ids.size());
        } catch (const StorageError& e) {
            LOGW("Persisted generation unusable (%s); rebuilding", e.what());
        }
    }

    do_rebuild(nullptr);
}

// =============================================================================
// MUTATIONS
// =============================================================================

template <typename Fn>
void IndexManager::run_mutation(const char* name, Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutation_mutex_);

    if (halted_.load()) {
        throw MutationsHaltedError(std::string(name) +
                                   " rejected: mutations halted after an integrity error");
    }

    CancellationToken token;
    ActiveCancelScope scope(cancel_mutex_, active_cancel_, token);

    try {
        fn(token);
    } catch (const MutationsHaltedError&) {
        throw;
    } catch (const IntegrityError& e) {
        halted_ = true;
        LOGE("%s failed with an integrity error, halting mutations: %s", name, e.what());
        throw;
    }
}

AddResult IndexManager::add_document(const DocumentInput& input) {
    AddResult result;
    result.document_id = input.id;
    run_mutation("add_document", [&](const CancellationToken& cancel) {
        do_add(input, cancel, result);
    });
    return result;
}

std::vector<AddResult> IndexManager::add_documents(const std::vector<DocumentInput>& inputs) {
    std::vector<AddResult> results;
    results.reserve(inputs.size());

    for (const auto& input : inputs) {
        try {
            results.push_back(add_document(input));
        } catch (const IntegrityError&) {
            throw;
        } catch (const RagError& e) {
            LOGW("Document %s failed: %s", input.id.c_str(), e.what());
            AddResult failed;
            failed.document_id = input.id;
            failed.status = DocumentStatus::kFailed;
            failed.code = e.code();
            failed.error = e.what();
            results.push_back(std::move(failed));
        }
    }
    return results;
}

void IndexManager::delete_document(const std::string& document_id) {
    run_mutation("delete_document", [&](const CancellationToken& cancel) {
        do_delete(document_id, cancel);
    });
}

void IndexManager::rebuild() {
    run_mutation("rebuild", [&](const CancellationToken& cancel) {
        do_rebuild(&cancel);
    });
}

void IndexManager::reset() {
    run_mutation("reset", [&](const CancellationToken&) {
        do_reset();
    });
}

void IndexManager::cancel_active() {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if (active_cancel_) {
        LOGI("Cancelling active mutation");
        active_cancel_->cancel();
    }
}

void IndexManager::resume_mutations() {
    if (halted_.exchange(false)) {
        LOGW("Mutations resumed after integrity halt");
    }
}

void IndexManager::do_add(const DocumentInput& input, const CancellationToken& cancel,
                          AddResult& result) {
    if (input.id.empty()) {
        throw ValidationError("document id is required");
    }
    if (input.text.empty()) {
        throw ValidationError("document text is empty: " + input.id);
    }

    if (auto existing = store_->find_document(input.id)) {
        if (existing->status != DocumentStatus::kFailed) {
            throw ValidationError("document already exists: " + input.id);
        }
        LOGI("Replacing failed document %s", input.id.c_str());
        store_->delete_document(input.id);
    }

    Document doc;
    doc.id = input.id;
    doc.filename = input.filename.empty() ? input.id : input.filename;
    doc.title = input.title.empty() ? derive_title(doc.filename) : input.title;
    doc.uploaded_at = unix_time_now();
    doc.byte_size = static_cast<int64_t>(input.text.size());
    doc.status = DocumentStatus::kPending;
    store_->create_document(doc);

    // Chunk and embed without holding anything readers wait on
    std::vector<TextChunk> pieces = chunker_.chunk_document(input.text);
    std::vector<std::string> texts;
    texts.reserve(pieces.size());
    for (const auto& piece : pieces) {
        texts.push_back(piece.text);
    }

    std::vector<std::vector<float>> embeddings;
    try {
        embeddings = embedding_->embed_texts(texts, embed_options(), &cancel);
        cancel.throw_if_cancelled("embedding");
    } catch (const IntegrityError&) {
        throw;
    } catch (const RagError& e) {
        LOGE("Embedding failed for %s: %s", input.id.c_str(), e.what());
        fail_document(input.id);
        throw;
    }

    std::vector<NewChunk> new_chunks;
    new_chunks.reserve(pieces.size());
    for (size_t i = 0; i < pieces.size(); ++i) {
        NewChunk chunk;
        chunk.text = std::move(texts[i]);
        chunk.source_offset = static_cast<int64_t>(pieces[i].start_position);
        chunk.embedding = embeddings[i];
        new_chunks.push_back(std::move(chunk));
    }
    std::vector<ChunkId> ids = store_->create_chunks(input.id, new_chunks);

    EmbeddingEntries entries;
    entries.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        entries.emplace_back(ids[i], std::move(embeddings[i]));
    }

    auto previous = snapshot();
    try {
        if (previous && previous->supports_append()) {
            std::vector<ChunkId> before = previous->chunk_ids();
            try {
                previous->append(entries, last_generation_ + 1);
            } catch (const IntegrityError&) {
                throw;
            } catch (const RagError& e) {
                // A partial append leaves vectors of a document about to be
                // marked failed; replace the generation with the old set
                LOGE("Append failed for %s: %s; restoring previous chunk set",
                     input.id.c_str(), e.what());
                try {
                    publish(build_candidate(store_->get_embeddings(before), nullptr));
                } catch (const IntegrityError&) {
                    throw;
                } catch (const RagError& restore_error) {
                    throw IntegrityError(std::string("could not restore index after failed "
                                                     "append: ") + restore_error.what());
                }
                throw;
            }
            last_generation_ = previous->number();
            persist(previous);
        } else {
            EmbeddingEntries all;
            if (previous) {
                all = store_->get_embeddings(previous->chunk_ids());
            }
            all.reserve(all.size() + entries.size());
            all.insert(all.end(), entries.begin(), entries.end());
            publish(build_candidate(all, &cancel));
        }
    } catch (const IntegrityError&) {
        throw;
    } catch (const RagError& e) {
        LOGE("Indexing failed for %s: %s", input.id.c_str(), e.what());
        fail_document(input.id);
        throw;
    }

    store_->set_document_status(input.id, DocumentStatus::kProcessed);

    result.status = DocumentStatus::kProcessed;
    result.chunk_count = ids.size();
    result.code = DIX_SUCCESS;
    LOGI("Added document %s: %zu chunks, generation %llu", input.id.c_str(), ids.size(),
         static_cast<unsigned long long>(last_generation_.load()));
}

void IndexManager::do_delete(const std::string& document_id, const CancellationToken& cancel) {
    Document doc = store_->get_document(document_id);
    std::vector<ChunkId> doomed = store_->chunk_ids_by_document(document_id);

    auto previous = snapshot();
    if (!doomed.empty() && previous) {
        std::unordered_set<ChunkId> drop(doomed.begin(), doomed.end());
        std::vector<ChunkId> survivors;
        for (ChunkId id : previous->chunk_ids()) {
            if (drop.count(id) == 0) {
                survivors.push_back(id);
            }
        }

        if (survivors.empty()) {
            publish(nullptr);
        } else {
            publish(build_candidate(store_->get_embeddings(survivors), &cancel));
        }
    }

    // Only after the swap: a crash before this point leaves the old,
    // consistent generation and the document's metadata in place
    store_->delete_document(document_id);

    LOGI("Deleted document %s (%zu chunks)", doc.id.c_str(), doomed.size());
}

void IndexManager::do_rebuild(const CancellationToken* cancel) {
    std::vector<Chunk> chunks = store_->get_all_chunks();

    EmbeddingEntries entries;
    entries.reserve(chunks.size());

    if (config_.reembed_on_rebuild && !chunks.empty()) {
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            texts.push_back(chunk.text);
        }
        auto embeddings = embedding_->embed_texts(texts, embed_options(), cancel);
        for (size_t i = 0; i < chunks.size(); ++i) {
            entries.emplace_back(chunks[i].id, std::move(embeddings[i]));
        }
    } else {
        for (auto& chunk : chunks) {
            if (chunk.embedding.empty()) {
                throw IntegrityError("chunk " + std::to_string(chunk.id) +
                                     " has no stored embedding");
            }
            entries.emplace_back(chunk.id, std::move(chunk.embedding));
        }
    }

    if (entries.empty()) {
        publish(nullptr);
        LOGI("Rebuild: no chunks, index is empty");
        return;
    }

    auto candidate = build_candidate(entries, cancel);

    // Store the new vectors before anything can persist a generation built
    // from them
    if (config_.reembed_on_rebuild) {
        try {
            store_->update_embeddings(entries);
        } catch (const std::exception&) {
            restore_state();
            throw;
        }
    }

    publish(candidate);
    LOGI("Rebuilt generation %llu with %zu chunks",
         static_cast<unsigned long long>(last_generation_.load()), entries.size());
}

void IndexManager::do_reset() {
    // Unpublish first: a query never searches vectors whose chunks are gone
    auto previous = snapshot();
    swap_generation(nullptr);
    try {
        store_->delete_all();
    } catch (const std::exception&) {
        swap_generation(previous);
        throw;
    }
    remove_persisted_files();
    LOGI("Index reset");
}

void IndexManager::fail_document(const std::string& document_id) {
    store_->delete_chunks_by_document(document_id);
    store_->set_document_status(document_id, DocumentStatus::kFailed);
}

// =============================================================================
// GENERATIONS
// =============================================================================

std::shared_ptr<IndexGeneration> IndexManager::build_candidate(const EmbeddingEntries& entries,
                                                               const CancellationToken* cancel) {
    state_ = ManagerState::kRebuilding;
    try {
        return builder_.build(last_generation_ + 1, entries, cancel);
    } catch (const std::exception&) {
        restore_state();
        throw;
    }
}

void IndexManager::publish(const std::shared_ptr<IndexGeneration>& candidate) {
    swap_generation(candidate);
    if (candidate) {
        last_generation_ = candidate->number();
    }
    persist(candidate);
}

void IndexManager::swap_generation(std::shared_ptr<IndexGeneration> next) {
    std::shared_ptr<IndexGeneration> retired;
    {
        std::lock_guard<std::mutex> lock(generation_mutex_);
        retired = std::move(current_);
        current_ = std::move(next);
        state_ = current_ ? ManagerState::kReady : ManagerState::kEmpty;
    }
    // retired is freed here, or by the last reader still holding it
}

void IndexManager::restore_state() {
    std::lock_guard<std::mutex> lock(generation_mutex_);
    state_ = current_ ? ManagerState::kReady : ManagerState::kEmpty;
}

std::shared_ptr<IndexGeneration> IndexManager::snapshot() const {
    std::lock_guard<std::mutex> lock(generation_mutex_);
    return current_;
}

std::shared_ptr<const IndexGeneration> IndexManager::current_generation() const {
    return snapshot();
}

void IndexManager::persist(const std::shared_ptr<IndexGeneration>& generation) {
    try {
        if (!generation) {
            remove_persisted_files();
            store_->clear_index_state();
            return;
        }
        if (!config_.index_path.empty()) {
            generation->save(config_.index_path);
        }
        IndexState state;
        state.generation = generation->number();
        state.chunk_count = generation->size();
        state.checksum = generation->checksum();
        state.dimension = generation->dimension();
        state.built_at = generation->built_at();
        store_->save_index_state(state);
    } catch (const StorageError& e) {
        // The in-memory generation is consistent. Whatever is on disk no
        // longer matches it, so drop it and let the next open rebuild
        LOGE("Failed to persist generation: %s", e.what());
        remove_persisted_files();
    }
}

void IndexManager::remove_persisted_files() {
    if (config_.index_path.empty()) {
        return;
    }
    for (const std::string& path : {config_.index_path, config_.index_path + ".meta.json"}) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOGW("Failed to remove %s: %s", path.c_str(), ec.message().c_str());
        }
    }
}

// =============================================================================
// STATISTICS
// =============================================================================

std::vector<float> IndexManager::embed_query(const std::string& text) const {
    return embedding_->embed_query(text, embed_options());
}

EmbedOptions IndexManager::embed_options() const {
    EmbedOptions options;
    options.dimension = config_.embedding_dimension;
    options.batch_size = config_.embed_batch_size;
    options.timeout = std::chrono::milliseconds(config_.embed_timeout_ms);
    return options;
}

IndexStats IndexManager::stats() const {
    auto generation = snapshot();

    IndexStats stats;
    stats.document_count = store_->count_documents();
    stats.chunk_count = store_->count();
    stats.vector_count = generation ? generation->vector_count() : 0;
    stats.dimension = config_.embedding_dimension;
    stats.generation = generation ? generation->number() : last_generation_.load();
    stats.state = to_string(state());
    stats.backend = builder_.factory().backend_name();
    stats.embedding_model = config_.embedding_model_name;
    stats.index_path = config_.index_path;
    return stats;
}

nlohmann::json IndexManager::statistics() const {
    nlohmann::json stats = this->stats();

    auto generation = snapshot();
    if (generation) {
        stats["index"] = generation->statistics();
    }
    stats["mutations_halted"] = mutations_halted();
    stats["embedding_provider"] = embedder_->name();
    stats["config"] = {
        {"embedding_dimension", config_.embedding_dimension},
        {"top_k", config_.top_k},
        {"chunk_size", config_.chunk_size},
        {"chunk_overlap", config_.chunk_overlap},
        {"min_chunk_size", config_.min_chunk_size}
    };
    return stats;
}

} // namespace rag
} // namespace docindex
