/**
 * @file context_assembler.cpp
 * @brief Turns retrieved chunks into LLM context and a prompt
 */

#include "context_assembler.h"

#include "dix/core/dix_logger.h"

#define LOG_TAG "RAG.Context"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

constexpr const char* kNoResults = "No relevant documents found.";
constexpr size_t kRuleWidth = 50;

// Largest prefix length <= limit that does not split a UTF-8 sequence
size_t utf8_prefix(const std::string& text, size_t limit) {
    if (limit >= text.size()) {
        return text.size();
    }
    size_t end = limit;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return end;
}

std::string format_block(size_t number, const RetrievalResult& result) {
    const std::string title = result.title.empty() ? "Unknown" : result.title;
    const std::string filename = result.filename.empty() ? "Unknown" : result.filename;
    return "Document " + std::to_string(number) + " (from " + title + " - " + filename +
           "):\n" + result.text + "\n";
}

} // namespace

ContextAssembler::ContextAssembler(const RAGBackendConfig& config)
    : max_context_chars_(config.max_context_tokens * config.chars_per_token),
      prompt_template_(config.prompt_template) {
}

std::string ContextAssembler::build_context(const std::vector<RetrievalResult>& results) const {
    if (results.empty()) {
        return kNoResults;
    }

    std::string blocks;
    size_t used = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        std::string block = format_block(i + 1, results[i]);
        size_t needed = block.size() + (i > 0 ? 1 : 0);

        if (used + needed > max_context_chars_) {
            if (i == 0) {
                blocks = block.substr(0, utf8_prefix(block, max_context_chars_));
                used = blocks.size();
            }
            LOGI("Context budget reached after %zu of %zu results", i == 0 ? 1 : i,
                 results.size());
            break;
        }

        if (i > 0) {
            blocks += "\n";
        }
        blocks += block;
        used += needed;
    }

    return "\n" + std::string(kRuleWidth, '=') + "\n" + blocks;
}

std::string ContextAssembler::format_prompt(const std::string& query,
                                            const std::string& context) const {
    static const std::string kContextKey = "{context}";
    static const std::string kQueryKey = "{query}";

    // Single pass so placeholder text inside the context or query is kept
    std::string prompt;
    prompt.reserve(prompt_template_.size() + context.size() + query.size());
    size_t pos = 0;
    while (pos < prompt_template_.size()) {
        if (prompt_template_.compare(pos, kContextKey.size(), kContextKey) == 0) {
            prompt += context;
            pos += kContextKey.size();
        } else if (prompt_template_.compare(pos, kQueryKey.size(), kQueryKey) == 0) {
            prompt += query;
            pos += kQueryKey.size();
        } else {
            prompt += prompt_template_[pos];
            ++pos;
        }
    }
    return prompt;
}

} // namespace rag
} // namespace docindex
