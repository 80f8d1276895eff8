/**
 * @file rag_types.cpp
 */

#include "rag_types.h"

#include <cctype>

#include "rag_errors.h"

namespace docindex {
namespace rag {

const char* to_string(DocumentStatus status) noexcept {
    switch (status) {
        case DocumentStatus::kPending: return "pending";
        case DocumentStatus::kProcessed: return "processed";
        case DocumentStatus::kFailed: return "failed";
    }
    return "pending";
}

DocumentStatus parse_document_status(const std::string& value) {
    if (value == "pending") return DocumentStatus::kPending;
    if (value == "processed") return DocumentStatus::kProcessed;
    if (value == "failed") return DocumentStatus::kFailed;
    throw IntegrityError("unknown document status: " + value);
}

void to_json(nlohmann::json& j, const IndexStats& stats) {
    j = nlohmann::json{
        {"document_count", stats.document_count},
        {"chunk_count", stats.chunk_count},
        {"vector_count", stats.vector_count},
        {"dimension", stats.dimension},
        {"generation", stats.generation},
        {"state", stats.state},
        {"backend", stats.backend},
        {"embedding_model", stats.embedding_model},
        {"index_path", stats.index_path}
    };
}

void to_json(nlohmann::json& j, const Document& document) {
    j = nlohmann::json{
        {"id", document.id},
        {"filename", document.filename},
        {"title", document.title},
        {"uploaded_at", document.uploaded_at},
        {"byte_size", document.byte_size},
        {"status", to_string(document.status)},
        {"total_chunks", document.chunk_count},
        {"total_length", document.total_length},
        {"avg_chunk_length",
         document.chunk_count > 0 ? document.total_length / document.chunk_count : 0}
    };
}

namespace {

bool is_year_at(const std::string& s, size_t i) {
    if (i + 4 > s.size()) {
        return false;
    }
    bool century = (s[i] == '1' && s[i + 1] == '9') || (s[i] == '2' && s[i + 1] == '0');
    if (!century || !std::isdigit(static_cast<unsigned char>(s[i + 2])) ||
        !std::isdigit(static_cast<unsigned char>(s[i + 3]))) {
        return false;
    }
    // Word boundaries on both sides
    bool left = i == 0 || !std::isalnum(static_cast<unsigned char>(s[i - 1]));
    bool right = i + 4 == s.size() || !std::isalnum(static_cast<unsigned char>(s[i + 4]));
    return left && right;
}

} // namespace

std::string derive_title(const std::string& filename) {
    std::string stem = filename;
    size_t slash = stem.find_last_of("/\\");
    if (slash != std::string::npos) {
        stem = stem.substr(slash + 1);
    }
    size_t dot = stem.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        stem = stem.substr(0, dot);
    }

    for (char& c : stem) {
        if (c == '_' || c == '-') {
            c = ' ';
        }
    }

    std::string without_years;
    without_years.reserve(stem.size());
    for (size_t i = 0; i < stem.size();) {
        if (is_year_at(stem, i)) {
            i += 4;
            continue;
        }
        without_years.push_back(stem[i++]);
    }

    std::string title;
    title.reserve(without_years.size());
    bool pending_space = false;
    for (char c : without_years) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !title.empty();
            continue;
        }
        if (pending_space) {
            title.push_back(' ');
            pending_space = false;
        }
        title.push_back(c);
    }
    return title;
}

} // namespace rag
} // namespace docindex
