/**
 * @file dix_rag_index.cpp
 * @brief Document Index C API Implementation
 */

#include "dix/features/rag/dix_rag_index.h"

#include "callback_embedding_provider.h"
#include "inference_provider.h"
#include "rag_backend.h"
#include "rag_errors.h"

#include <cstring>
#include <memory>
#include <new>
#include <string>

#include "dix/core/dix_error.h"
#include "dix/core/dix_logger.h"
#include "dix/core/dix_types.h"

#define LOG_TAG "RAG.CApi"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)

using namespace docindex::rag;

// =============================================================================
// INDEX HANDLE
// =============================================================================

struct dix_rag_index {
    std::unique_ptr<RAGBackend> backend;
};

namespace {

RAGBackendConfig to_backend_config(const dix_rag_config_t& config) {
    RAGBackendConfig backend_config;
    if (config.metadata_path != nullptr) {
        backend_config.metadata_path = config.metadata_path;
    }
    if (config.index_path != nullptr) {
        backend_config.index_path = config.index_path;
    }
    if (config.embedding_model_name != nullptr) {
        backend_config.embedding_model_name = config.embedding_model_name;
    }
    backend_config.embedding_dimension = config.embedding_dimension;
    backend_config.embed_batch_size = config.embed_batch_size > 0 ? config.embed_batch_size : 32;
    backend_config.chunk_size = config.chunk_size;
    backend_config.chunk_overlap = config.chunk_overlap;
    backend_config.min_chunk_size = config.min_chunk_size;
    backend_config.top_k = config.top_k > 0 ? config.top_k : 5;
    backend_config.max_context_tokens =
        config.max_context_tokens > 0 ? config.max_context_tokens : 2048;
    backend_config.index_backend =
        config.index_backend == DIX_INDEX_BACKEND_FLAT ? "flat" : "usearch";
    backend_config.exact_search = config.exact_search != DIX_FALSE;
    backend_config.embed_timeout_ms = config.embed_timeout_ms;
    backend_config.chars_per_token = config.chars_per_token > 0 ? config.chars_per_token : 4;
    backend_config.reembed_on_rebuild = config.reembed_on_rebuild != DIX_FALSE;
    return backend_config;
}

dix_document_status_t to_c_status(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::kPending: return DIX_DOCUMENT_PENDING;
        case DocumentStatus::kProcessed: return DIX_DOCUMENT_PROCESSED;
        case DocumentStatus::kFailed: return DIX_DOCUMENT_FAILED;
    }
    return DIX_DOCUMENT_FAILED;
}

dix_index_state_t to_c_state(ManagerState state) {
    switch (state) {
        case ManagerState::kEmpty: return DIX_INDEX_STATE_EMPTY;
        case ManagerState::kReady: return DIX_INDEX_STATE_READY;
        case ManagerState::kRebuilding: return DIX_INDEX_STATE_REBUILDING;
    }
    return DIX_INDEX_STATE_EMPTY;
}

dix_result_t fail_with(dix_result_t code, const char* operation, const char* message) {
    LOGE("%s failed: %s", operation, message);
    dix_set_last_error_details(message);
    return code;
}

/**
 * Runs fn and converts whatever it throws into a result code. Nothing
 * crosses the C boundary as an exception.
 */
template <typename Fn>
dix_result_t guarded(const char* operation, Fn&& fn) {
    try {
        fn();
        dix_set_last_error_details(nullptr);
        return DIX_SUCCESS;
    } catch (const RagError& e) {
        return fail_with(e.code(), operation, e.what());
    } catch (const std::bad_alloc& e) {
        return fail_with(DIX_ERROR_OUT_OF_MEMORY, operation, e.what());
    } catch (const std::exception& e) {
        return fail_with(DIX_ERROR_PROCESSING_FAILED, operation, e.what());
    } catch (...) {
        return fail_with(DIX_ERROR_PROCESSING_FAILED, operation, "unknown exception");
    }
}

void create_index(const dix_rag_config_t& config,
                  std::shared_ptr<IEmbeddingProvider> provider,
                  dix_rag_index_t** out_index) {
    auto index = std::make_unique<dix_rag_index>();
    index->backend = std::make_unique<RAGBackend>(to_backend_config(config), std::move(provider));
    *out_index = index.release();
    LOGI("Document index opened: %s", config.metadata_path != nullptr ? config.metadata_path
                                                                      : "docindex.sqlite");
}

} // namespace

// =============================================================================
// PUBLIC API IMPLEMENTATION
// =============================================================================

extern "C" {

dix_result_t dix_rag_index_create(
    const dix_rag_config_t* config,
    dix_embed_fn embed_fn,
    void* user_data,
    dix_rag_index_t** out_index
) {
    if (config == nullptr || embed_fn == nullptr || out_index == nullptr) {
        LOGE("Null pointer in dix_rag_index_create");
        return DIX_ERROR_NULL_POINTER;
    }

    *out_index = nullptr;

    return guarded("dix_rag_index_create", [&] {
        std::string model_name = config->embedding_model_name != nullptr
            ? config->embedding_model_name : "callback";
        auto provider = std::make_shared<CallbackEmbeddingProvider>(
            embed_fn, user_data, config->embedding_dimension, model_name);
        create_index(*config, std::move(provider), out_index);
    });
}

dix_result_t dix_rag_index_create_onnx(
    const dix_rag_config_t* config,
    const char* model_path,
    dix_rag_index_t** out_index
) {
    if (config == nullptr || model_path == nullptr || out_index == nullptr) {
        LOGE("Null pointer in dix_rag_index_create_onnx");
        return DIX_ERROR_NULL_POINTER;
    }

    *out_index = nullptr;

#ifdef DIX_HAS_ONNX_PROVIDER
    return guarded("dix_rag_index_create_onnx", [&] {
        std::string provider_config =
            "{\"dimension\": " + std::to_string(config->embedding_dimension) + "}";
        std::shared_ptr<IEmbeddingProvider> provider =
            create_onnx_embedding_provider(model_path, provider_config);
        create_index(*config, std::move(provider), out_index);
    });
#else
    return fail_with(DIX_ERROR_NOT_SUPPORTED, "dix_rag_index_create_onnx",
                     "ONNX embedding provider not built");
#endif
}

dix_result_t dix_rag_add_document(
    dix_rag_index_t* index,
    const char* id,
    const char* filename,
    const char* text,
    dix_document_status_t* out_status
) {
    if (index == nullptr || id == nullptr || text == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    if (out_status != nullptr) {
        *out_status = DIX_DOCUMENT_FAILED;
    }

    dix_result_t result = guarded("dix_rag_add_document", [&] {
        AddResult added = index->backend->add_document(id, text,
                                                       filename != nullptr ? filename : "");
        if (out_status != nullptr) {
            *out_status = to_c_status(added.status);
        }
    });

    if (result != DIX_SUCCESS && out_status != nullptr && result != DIX_ERROR_VALIDATION &&
        result != DIX_ERROR_HALTED) {
        // The document may have been recorded before the failure
        try {
            *out_status = to_c_status(index->backend->get_document(id).status);
        } catch (const NotFoundError&) {
            *out_status = DIX_DOCUMENT_FAILED;
        } catch (const std::exception& e) {
            LOGW("Could not read status of %s: %s", id, e.what());
            *out_status = DIX_DOCUMENT_FAILED;
        }
    }
    return result;
}

dix_result_t dix_rag_delete_document(dix_rag_index_t* index, const char* id) {
    if (index == nullptr || id == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    return guarded("dix_rag_delete_document", [&] { index->backend->delete_document(id); });
}

dix_result_t dix_rag_rebuild(dix_rag_index_t* index) {
    if (index == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    return guarded("dix_rag_rebuild", [&] { index->backend->rebuild(); });
}

dix_result_t dix_rag_cancel_rebuild(dix_rag_index_t* index) {
    if (index == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    index->backend->cancel_rebuild();
    return DIX_SUCCESS;
}

dix_result_t dix_rag_reset(dix_rag_index_t* index) {
    if (index == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    return guarded("dix_rag_reset", [&] { index->backend->reset(); });
}

dix_result_t dix_rag_query(
    dix_rag_index_t* index,
    const char* text,
    size_t k,
    dix_rag_query_results_t* out_results
) {
    if (index == nullptr || text == nullptr || out_results == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    out_results->results = nullptr;
    out_results->count = 0;

    return guarded("dix_rag_query", [&] {
        auto results = index->backend->search(text, k);
        if (results.empty()) {
            return;
        }

        auto* items = static_cast<dix_rag_query_result_t*>(
            dix_alloc(sizeof(dix_rag_query_result_t) * results.size()));
        if (items == nullptr) {
            throw std::bad_alloc();
        }
        std::memset(items, 0, sizeof(dix_rag_query_result_t) * results.size());
        out_results->results = items;

        for (size_t i = 0; i < results.size(); ++i) {
            const auto& result = results[i];
            auto& item = items[i];
            item.chunk_id = result.chunk_id;
            item.position = result.position;
            item.score = result.score;
            item.document_id = dix_strdup(result.document_id.c_str());
            item.text = dix_strdup(result.text.c_str());
            item.title = dix_strdup(result.title.c_str());
            item.filename = dix_strdup(result.filename.c_str());
            out_results->count = i + 1;

            if (item.document_id == nullptr || item.text == nullptr ||
                item.title == nullptr || item.filename == nullptr) {
                dix_rag_query_results_free(out_results);
                throw std::bad_alloc();
            }
        }
    });
}

void dix_rag_query_results_free(dix_rag_query_results_t* results) {
    if (results == nullptr) {
        return;
    }

    if (results->results != nullptr) {
        for (size_t i = 0; i < results->count; ++i) {
            dix_free(results->results[i].document_id);
            dix_free(results->results[i].text);
            dix_free(results->results[i].title);
            dix_free(results->results[i].filename);
        }
        dix_free(results->results);
    }

    // The struct itself belongs to the caller
    std::memset(results, 0, sizeof(dix_rag_query_results_t));
}

dix_result_t dix_rag_get_stats(dix_rag_index_t* index, dix_rag_stats_t* out_stats) {
    if (index == nullptr || out_stats == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    return guarded("dix_rag_get_stats", [&] {
        IndexStats stats = index->backend->stats();
        out_stats->document_count = stats.document_count;
        out_stats->chunk_count = stats.chunk_count;
        out_stats->vector_count = stats.vector_count;
        out_stats->dimension = stats.dimension;
        out_stats->generation = stats.generation;
        out_stats->state = to_c_state(index->backend->index_manager().state());
    });
}

dix_result_t dix_rag_get_statistics_json(dix_rag_index_t* index, char** out_stats_json) {
    if (index == nullptr || out_stats_json == nullptr) {
        return DIX_ERROR_NULL_POINTER;
    }

    return guarded("dix_rag_get_statistics_json", [&] {
        std::string json_str = index->backend->get_statistics().dump();
        char* json_copy = dix_strdup(json_str.c_str());
        if (json_copy == nullptr) {
            throw std::bad_alloc();
        }
        *out_stats_json = json_copy;
    });
}

void dix_rag_index_destroy(dix_rag_index_t* index) {
    if (index == nullptr) {
        return;
    }

    LOGI("Destroying document index");
    delete index;
}

} // extern "C"
