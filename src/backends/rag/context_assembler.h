/**
 * @file context_assembler.h
 * @brief Turns retrieved chunks into LLM context and a prompt
 */

#ifndef DOCINDEX_CONTEXT_ASSEMBLER_H
#define DOCINDEX_CONTEXT_ASSEMBLER_H

#include <string>
#include <vector>

#include "rag_config.h"
#include "retrieval_engine.h"

namespace docindex {
namespace rag {

class ContextAssembler {
public:
    explicit ContextAssembler(const RAGBackendConfig& config);

    /**
     * @brief Numbered, attributed context blocks in rank order
     *
     * Each block reads "Document i (from <title> - <filename>):\n<text>\n".
     * Blocks are added until max_context_tokens * chars_per_token bytes;
     * the first block is truncated on a character boundary if it alone is
     * too long. Returns "No relevant documents found." for no results.
     */
    std::string build_context(const std::vector<RetrievalResult>& results) const;

    /**
     * @brief Substitute {context} and {query} in the prompt template
     */
    std::string format_prompt(const std::string& query, const std::string& context) const;

    size_t max_context_chars() const noexcept { return max_context_chars_; }

private:
    size_t max_context_chars_;
    std::string prompt_template_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_CONTEXT_ASSEMBLER_H
