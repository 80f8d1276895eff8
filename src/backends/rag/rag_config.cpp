/**
 * @file rag_config.cpp
 */

#include "rag_config.h"

#include <fstream>

#include "rag_errors.h"

namespace docindex {
namespace rag {

void RAGBackendConfig::validate() const {
    if (embedding_dimension == 0) {
        throw ValidationError("embedding_dimension must be positive");
    }
    if (chunk_size == 0) {
        throw ValidationError("chunk_size must be positive");
    }
    if (chunk_overlap >= chunk_size) {
        throw ValidationError("chunk_overlap must be smaller than chunk_size");
    }
    if (embed_batch_size == 0) {
        throw ValidationError("embed_batch_size must be positive");
    }
    if (chars_per_token == 0) {
        throw ValidationError("chars_per_token must be positive");
    }
    if (index_backend != "usearch" && index_backend != "flat") {
        throw ValidationError("unknown index_backend: " + index_backend);
    }
    if (metadata_path.empty()) {
        throw ValidationError("metadata_path is required");
    }
}

void to_json(nlohmann::json& j, const RAGBackendConfig& config) {
    j = nlohmann::json{
        {"embedding_dimension", config.embedding_dimension},
        {"embed_batch_size", config.embed_batch_size},
        {"embed_timeout_ms", config.embed_timeout_ms},
        {"embedding_model_name", config.embedding_model_name},
        {"chunk_size", config.chunk_size},
        {"chunk_overlap", config.chunk_overlap},
        {"min_chunk_size", config.min_chunk_size},
        {"top_k", config.top_k},
        {"max_context_tokens", config.max_context_tokens},
        {"chars_per_token", config.chars_per_token},
        {"prompt_template", config.prompt_template},
        {"index_backend", config.index_backend},
        {"connectivity", config.connectivity},
        {"expansion_add", config.expansion_add},
        {"expansion_search", config.expansion_search},
        {"exact_search", config.exact_search},
        {"metadata_path", config.metadata_path},
        {"index_path", config.index_path},
        {"reembed_on_rebuild", config.reembed_on_rebuild}
    };
}

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

RAGBackendConfig config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("configuration must be a JSON object");
    }

    RAGBackendConfig config;
    try {
        read_field(j, "embedding_dimension", config.embedding_dimension);
        read_field(j, "embed_batch_size", config.embed_batch_size);
        read_field(j, "embed_timeout_ms", config.embed_timeout_ms);
        read_field(j, "embedding_model_name", config.embedding_model_name);
        read_field(j, "chunk_size", config.chunk_size);
        read_field(j, "chunk_overlap", config.chunk_overlap);
        read_field(j, "min_chunk_size", config.min_chunk_size);
        read_field(j, "top_k", config.top_k);
        read_field(j, "max_context_tokens", config.max_context_tokens);
        read_field(j, "chars_per_token", config.chars_per_token);
        read_field(j, "prompt_template", config.prompt_template);
        read_field(j, "index_backend", config.index_backend);
        read_field(j, "connectivity", config.connectivity);
        read_field(j, "expansion_add", config.expansion_add);
        read_field(j, "expansion_search", config.expansion_search);
        read_field(j, "exact_search", config.exact_search);
        read_field(j, "metadata_path", config.metadata_path);
        read_field(j, "index_path", config.index_path);
        read_field(j, "reembed_on_rebuild", config.reembed_on_rebuild);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("invalid configuration: ") + e.what());
    }

    config.validate();
    return config;
}

RAGBackendConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("malformed configuration file " + path + ": " + e.what());
    }
    return config_from_json(j);
}

} // namespace rag
} // namespace docindex
