/**
 * @file dix_rag_index.h
 * @brief DocIndex - Document Index Public API
 *
 * Persistent document index for retrieval:
 * - Document chunking and embedding
 * - Vector search with USearch (or an exact flat index)
 * - Metadata and embeddings stored in SQLite
 */

#ifndef DIX_RAG_INDEX_H
#define DIX_RAG_INDEX_H

#include "dix/core/dix_types.h"
#include "dix/core/dix_error.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// FORWARD DECLARATIONS
// =============================================================================

typedef struct dix_rag_index dix_rag_index_t;

// =============================================================================
// EMBEDDING CALLBACK
// =============================================================================

/**
 * @brief Host-supplied embedding function
 *
 * Writes exactly `dimension` floats for `text` into `out_vector`. Called on
 * one worker thread owned by the index, never concurrently, and never after
 * dix_rag_index_destroy returns.
 *
 * @return DIX_SUCCESS, or any error code to report the embedder unavailable
 */
typedef dix_result_t (*dix_embed_fn)(
    const char* text,
    float* out_vector,
    size_t dimension,
    void* user_data
);

// =============================================================================
// CONFIGURATION
// =============================================================================

typedef enum dix_index_backend {
    DIX_INDEX_BACKEND_USEARCH = 0,   /**< HNSW, incremental inserts */
    DIX_INDEX_BACKEND_FLAT = 1,      /**< Exact inner product, rebuild only */
} dix_index_backend_t;

/**
 * @brief Document index configuration
 */
typedef struct dix_rag_config {
    /** SQLite database holding documents, chunks and embeddings */
    const char* metadata_path;

    /** Generation file; NULL keeps the vector index in memory only */
    const char* index_path;

    /** Embedding dimension (default 384) */
    size_t embedding_dimension;

    /** Embedding model name recorded in stats (optional) */
    const char* embedding_model_name;

    /** Texts per embedder call (default 32) */
    size_t embed_batch_size;

    /** Chunk size in characters (default 1000) */
    size_t chunk_size;

    /** Overlap between consecutive chunks (default 200) */
    size_t chunk_overlap;

    /** Trailing chunks shorter than this are dropped (default 100) */
    size_t min_chunk_size;

    /** Default results per query (default 5) */
    size_t top_k;

    /** Context budget in tokens (default 2048) */
    size_t max_context_tokens;

    dix_index_backend_t index_backend;

    /** Rank exactly instead of through the HNSW graph */
    dix_bool_t exact_search;

    /**
     * Per-call embedding timeout in milliseconds; 0 waits indefinitely.
     * Until a timed-out call returns, further embedding fails with
     * DIX_ERROR_EMBEDDING_UNAVAILABLE.
     */
    size_t embed_timeout_ms;

    /** Characters per token when estimating context size (default 4) */
    size_t chars_per_token;

    /** Re-embed every stored chunk on rebuild instead of reusing stored vectors */
    dix_bool_t reembed_on_rebuild;
} dix_rag_config_t;

/**
 * @brief Default configuration
 */
static inline dix_rag_config_t dix_rag_config_default(void) {
    dix_rag_config_t config;
    config.metadata_path = "docindex.sqlite";
    config.index_path = NULL;
    config.embedding_dimension = 384;
    config.embedding_model_name = NULL;
    config.embed_batch_size = 32;
    config.chunk_size = 1000;
    config.chunk_overlap = 200;
    config.min_chunk_size = 100;
    config.top_k = 5;
    config.max_context_tokens = 2048;
    config.index_backend = DIX_INDEX_BACKEND_USEARCH;
    config.exact_search = DIX_FALSE;
    config.embed_timeout_ms = 0;
    config.chars_per_token = 4;
    config.reembed_on_rebuild = DIX_FALSE;
    return config;
}

// =============================================================================
// RESULT TYPES
// =============================================================================

typedef enum dix_document_status {
    DIX_DOCUMENT_PENDING = 0,
    DIX_DOCUMENT_PROCESSED = 1,
    DIX_DOCUMENT_FAILED = 2,
} dix_document_status_t;

typedef enum dix_index_state {
    DIX_INDEX_STATE_EMPTY = 0,
    DIX_INDEX_STATE_READY = 1,
    DIX_INDEX_STATE_REBUILDING = 2,
} dix_index_state_t;

/**
 * @brief One ranked chunk
 */
typedef struct dix_rag_query_result {
    int64_t chunk_id;
    char* document_id;           /**< Freed by dix_rag_query_results_free */
    size_t position;             /**< Chunk order within its document */
    char* text;                  /**< Freed by dix_rag_query_results_free */
    char* title;                 /**< Freed by dix_rag_query_results_free */
    char* filename;              /**< Freed by dix_rag_query_results_free */
    float score;                 /**< Cosine similarity */
} dix_rag_query_result_t;

typedef struct dix_rag_query_results {
    dix_rag_query_result_t* results;   /**< Highest score first */
    size_t count;
} dix_rag_query_results_t;

typedef struct dix_rag_stats {
    size_t document_count;
    size_t chunk_count;
    size_t vector_count;
    size_t dimension;
    uint64_t generation;
    dix_index_state_t state;
} dix_rag_stats_t;

// =============================================================================
// PUBLIC API
// =============================================================================

/**
 * @brief Open (or create) a document index using a host embedding function
 *
 * Recovers from an interrupted previous session before returning.
 *
 * @param config Index configuration
 * @param embed_fn Embedding function
 * @param user_data Passed through to embed_fn
 * @param out_index Pointer to receive the index handle
 * @return DIX_SUCCESS on success, error code otherwise
 */
DIX_API dix_result_t dix_rag_index_create(
    const dix_rag_config_t* config,
    dix_embed_fn embed_fn,
    void* user_data,
    dix_rag_index_t** out_index
);

/**
 * @brief Open (or create) a document index using the bundled ONNX embedder
 *
 * @param model_path Sentence-embedding model (.onnx); vocab.txt is read
 *                   from the same directory
 * @return DIX_ERROR_NOT_SUPPORTED if built without ONNX Runtime
 */
DIX_API dix_result_t dix_rag_index_create_onnx(
    const dix_rag_config_t* config,
    const char* model_path,
    dix_rag_index_t** out_index
);

/**
 * @brief Chunk, embed and index one document
 *
 * A document whose embedding or indexing fails is kept with status FAILED
 * (re-adding the same id replaces it) and the failure code is returned.
 *
 * @param filename Source filename (optional, defaults to id)
 * @param out_status Receives the final status (optional)
 * @return DIX_ERROR_VALIDATION for a duplicate id or empty text,
 *         DIX_ERROR_EMBEDDING_UNAVAILABLE or DIX_ERROR_INDEX_BUILD_FAILED
 *         when the document was marked FAILED
 */
DIX_API dix_result_t dix_rag_add_document(
    dix_rag_index_t* index,
    const char* id,
    const char* filename,
    const char* text,
    dix_document_status_t* out_status
);

/**
 * @brief Remove a document and its chunks
 *
 * @return DIX_ERROR_NOT_FOUND for an unknown id
 */
DIX_API dix_result_t dix_rag_delete_document(dix_rag_index_t* index, const char* id);

/**
 * @brief Rebuild the vector index from the stored chunks
 */
DIX_API dix_result_t dix_rag_rebuild(dix_rag_index_t* index);

/**
 * @brief Cancel the in-flight mutation; it fails with DIX_ERROR_CANCELLED
 */
DIX_API dix_result_t dix_rag_cancel_rebuild(dix_rag_index_t* index);

/**
 * @brief Delete every document, chunk and index generation. Irreversible.
 */
DIX_API dix_result_t dix_rag_reset(dix_rag_index_t* index);

/**
 * @brief Retrieve the k chunks most similar to text
 *
 * An empty index yields DIX_SUCCESS with zero results.
 *
 * @param k Number of results; must be positive (0 gives DIX_ERROR_VALIDATION)
 * @param out_results Receives the results (free with dix_rag_query_results_free)
 */
DIX_API dix_result_t dix_rag_query(
    dix_rag_index_t* index,
    const char* text,
    size_t k,
    dix_rag_query_results_t* out_results
);

/**
 * @brief Free query results
 *
 * Frees the contents and zeroes the struct; the struct itself belongs to
 * the caller.
 */
DIX_API void dix_rag_query_results_free(dix_rag_query_results_t* results);

DIX_API dix_result_t dix_rag_get_stats(dix_rag_index_t* index, dix_rag_stats_t* out_stats);

/**
 * @brief Get index statistics as JSON
 *
 * @param out_stats_json Pointer to receive JSON stats string (free with dix_free)
 */
DIX_API dix_result_t dix_rag_get_statistics_json(dix_rag_index_t* index, char** out_stats_json);

/**
 * @brief Destroy the index handle. Stored data stays on disk.
 */
DIX_API void dix_rag_index_destroy(dix_rag_index_t* index);

#ifdef __cplusplus
}
#endif

#endif // DIX_RAG_INDEX_H
