/**
 * @file rag_chunker.h
 * @brief Document Chunking for the index
 *
 * Splits document text into overlapping fixed-size windows.
 */

#ifndef DOCINDEX_RAG_CHUNKER_H
#define DOCINDEX_RAG_CHUNKER_H

#include <string>
#include <vector>

namespace docindex {
namespace rag {

/**
 * @brief Document chunk with position information
 */
struct TextChunk {
    std::string text;
    size_t start_position;   // byte offset, inclusive
    size_t end_position;     // byte offset, exclusive
    size_t chunk_index;
};

/**
 * @brief Chunking configuration
 *
 * Sizes are counted in characters (UTF-8 code points).
 */
struct ChunkerConfig {
    size_t chunk_size = 1000;
    size_t chunk_overlap = 200;
    size_t min_chunk_size = 100;
    size_t chars_per_token = 4;    // Rough estimate for token counting
};

/**
 * @brief Lazy producer of the chunks of one text
 *
 * Segment i starts at character i * (chunk_size - chunk_overlap). The last
 * segment is dropped when it is shorter than min_chunk_size, unless it is
 * the only one. The text must outlive the cursor.
 */
class ChunkCursor {
public:
    ChunkCursor(const std::string& text, const ChunkerConfig& config);

    /**
     * @brief Produce the next chunk
     * @return false once the sequence is exhausted
     */
    bool next(TextChunk& out);

private:
    const std::string& text_;
    ChunkerConfig config_;
    std::vector<size_t> offsets_;   // byte offset of every code point, plus end sentinel
    size_t next_index_ = 0;
    bool done_ = false;
};

/**
 * @brief Document chunker
 */
class DocumentChunker {
public:
    /**
     * @throws ValidationError if chunk_size is 0 or overlap >= chunk_size
     */
    explicit DocumentChunker(const ChunkerConfig& config = ChunkerConfig{});

    /**
     * @brief Split document into chunks
     *
     * Deterministic; returns an empty vector for empty input.
     */
    std::vector<TextChunk> chunk_document(const std::string& text) const;

    /**
     * @brief Lazy variant of chunk_document
     */
    ChunkCursor cursor(const std::string& text) const;

    /**
     * @brief Estimate token count for text
     */
    size_t estimate_tokens(const std::string& text) const;

    const ChunkerConfig& config() const { return config_; }

private:
    ChunkerConfig config_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_RAG_CHUNKER_H
