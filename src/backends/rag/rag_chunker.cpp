/**
 * @file rag_chunker.cpp
 * @brief Document Chunking Implementation
 */

#include "rag_chunker.h"

#include <algorithm>

#include "rag_errors.h"

namespace docindex {
namespace rag {

namespace {

// Byte offsets of the UTF-8 code points in text. Continuation bytes
// (10xxxxxx) never start a character; stray ones count as their own.
std::vector<size_t> code_point_offsets(const std::string& text) {
    std::vector<size_t> offsets;
    offsets.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80 || offsets.empty()) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

} // namespace

ChunkCursor::ChunkCursor(const std::string& text, const ChunkerConfig& config)
    : text_(text), config_(config), offsets_(code_point_offsets(text)) {
    done_ = text.empty();
}

bool ChunkCursor::next(TextChunk& out) {
    if (done_) {
        return false;
    }

    const size_t length = offsets_.size() - 1;   // characters
    const size_t step = config_.chunk_size - config_.chunk_overlap;
    const size_t start = next_index_ * step;
    if (start >= length) {
        done_ = true;
        return false;
    }

    const size_t end = std::min(start + config_.chunk_size, length);
    const bool last = end == length;
    if (last) {
        done_ = true;
        if (end - start < config_.min_chunk_size && next_index_ > 0) {
            return false;
        }
    }

    out.start_position = offsets_[start];
    out.end_position = offsets_[end];
    out.text = text_.substr(out.start_position, out.end_position - out.start_position);
    out.chunk_index = next_index_++;
    return true;
}

DocumentChunker::DocumentChunker(const ChunkerConfig& config) : config_(config) {
    if (config_.chunk_size == 0) {
        throw ValidationError("chunk_size must be positive");
    }
    if (config_.chunk_overlap >= config_.chunk_size) {
        throw ValidationError("chunk_overlap must be smaller than chunk_size");
    }
    if (config_.chars_per_token == 0) {
        config_.chars_per_token = 1;
    }
}

std::vector<TextChunk> DocumentChunker::chunk_document(const std::string& text) const {
    std::vector<TextChunk> chunks;
    ChunkCursor chunk_cursor(text, config_);
    TextChunk chunk;
    while (chunk_cursor.next(chunk)) {
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

ChunkCursor DocumentChunker::cursor(const std::string& text) const {
    return ChunkCursor(text, config_);
}

size_t DocumentChunker::estimate_tokens(const std::string& text) const {
    return text.length() / config_.chars_per_token;
}

} // namespace rag
} // namespace docindex
