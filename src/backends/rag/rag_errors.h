/**
 * @file rag_errors.h
 * @brief Exception taxonomy of the document index
 *
 * Every exception carries the dix_result_t the C API reports for it.
 */

#ifndef DOCINDEX_RAG_ERRORS_H
#define DOCINDEX_RAG_ERRORS_H

#include <stdexcept>
#include <string>

#include "dix/core/dix_error.h"

namespace docindex {
namespace rag {

class RagError : public std::runtime_error {
public:
    RagError(dix_result_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    dix_result_t code() const noexcept { return code_; }

private:
    dix_result_t code_;
};

/** Unknown document or chunk identifier */
class NotFoundError : public RagError {
public:
    explicit NotFoundError(const std::string& message)
        : RagError(DIX_ERROR_NOT_FOUND, message) {}
};

/** Invariant violation; never retried */
class IntegrityError : public RagError {
public:
    explicit IntegrityError(const std::string& message)
        : RagError(DIX_ERROR_INTEGRITY, message) {}

protected:
    IntegrityError(dix_result_t code, const std::string& message)
        : RagError(code, message) {}
};

/** Raised for every mutation while the queue is halted */
class MutationsHaltedError : public IntegrityError {
public:
    explicit MutationsHaltedError(const std::string& message)
        : IntegrityError(DIX_ERROR_HALTED, message) {}
};

/** Embedding collaborator failed or timed out */
class EmbeddingUnavailable : public RagError {
public:
    explicit EmbeddingUnavailable(const std::string& message)
        : RagError(DIX_ERROR_EMBEDDING_UNAVAILABLE, message) {}
};

/** Building a candidate generation failed; the current one is preserved */
class IndexBuildError : public RagError {
public:
    explicit IndexBuildError(const std::string& message)
        : RagError(DIX_ERROR_INDEX_BUILD_FAILED, message) {}
};

/** Bad argument (k, empty text, configuration) */
class ValidationError : public RagError {
public:
    explicit ValidationError(const std::string& message)
        : RagError(DIX_ERROR_VALIDATION, message) {}
};

/** Caller cancelled an in-flight build */
class OperationCancelled : public RagError {
public:
    explicit OperationCancelled(const std::string& message)
        : RagError(DIX_ERROR_CANCELLED, message) {}
};

/** SQLite or filesystem failure */
class StorageError : public RagError {
public:
    explicit StorageError(const std::string& message)
        : RagError(DIX_ERROR_STORAGE, message) {}
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RAG_ERRORS_H
