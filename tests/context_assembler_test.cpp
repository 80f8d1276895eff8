/**
 * @file context_assembler_test.cpp
 * @brief Unit tests for context formatting and prompt substitution
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "context_assembler.h"
#include "rag_config.h"

namespace docindex::rag {

namespace {

const std::string kRule = "\n" + std::string(50, '=') + "\n";

RetrievalResult result(const std::string& text, const std::string& title,
                       const std::string& filename, float score) {
    RetrievalResult r;
    r.text = text;
    r.title = title;
    r.filename = filename;
    r.score = score;
    return r;
}

} // namespace

TEST(ContextAssemblerTest, NoResultsMessage) {
    ContextAssembler assembler{RAGBackendConfig{}};
    EXPECT_EQ(assembler.build_context({}), "No relevant documents found.");
}

TEST(ContextAssemblerTest, NumbersAndAttributesBlocksInRankOrder) {
    ContextAssembler assembler{RAGBackendConfig{}};
    std::string context = assembler.build_context({
        result("first chunk", "Guide", "guide.pdf", 0.9f),
        result("second chunk", "Notes", "notes.md", 0.5f),
    });

    EXPECT_EQ(context, kRule +
                       "Document 1 (from Guide - guide.pdf):\nfirst chunk\n" +
                       "\n" +
                       "Document 2 (from Notes - notes.md):\nsecond chunk\n");
}

TEST(ContextAssemblerTest, MissingAttributionReadsUnknown) {
    ContextAssembler assembler{RAGBackendConfig{}};
    std::string context = assembler.build_context({result("text", "", "", 1.0f)});
    EXPECT_NE(context.find("Document 1 (from Unknown - Unknown):"), std::string::npos);
}

TEST(ContextAssemblerTest, StopsAtBudget) {
    RAGBackendConfig config;
    config.max_context_tokens = 20;
    config.chars_per_token = 4;    // 80 characters
    ContextAssembler assembler(config);
    EXPECT_EQ(assembler.max_context_chars(), 80ul);

    std::string context = assembler.build_context({
        result(std::string(30, 'a'), "A", "a", 0.9f),
        result(std::string(30, 'b'), "B", "b", 0.8f),
    });

    EXPECT_NE(context.find("Document 1"), std::string::npos);
    EXPECT_EQ(context.find("Document 2"), std::string::npos);
}

TEST(ContextAssemblerTest, OversizedFirstBlockIsTruncatedOnCharacterBoundary) {
    RAGBackendConfig config;
    config.max_context_tokens = 10;
    config.chars_per_token = 4;    // 40 bytes
    ContextAssembler assembler(config);

    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "\xC3\xA9";
    }
    std::string context = assembler.build_context({result(text, "T", "f", 1.0f)});

    std::string body = context.substr(kRule.size());
    EXPECT_LE(body.size(), 40ul);
    EXPECT_EQ(body.rfind("Document 1 (from T - f):\n", 0), 0ul);
    auto last = static_cast<unsigned char>(body.back());
    EXPECT_TRUE(last == 0xA9 || last == '\n') << "truncated inside a character";
}

TEST(ContextAssemblerTest, FormatPromptSubstitutesPlaceholders) {
    RAGBackendConfig config;
    config.prompt_template = "Context:\n{context}\nQuestion: {query}\nAnswer:";
    ContextAssembler assembler(config);

    EXPECT_EQ(assembler.format_prompt("why?", "because"),
              "Context:\nbecause\nQuestion: why?\nAnswer:");
}

TEST(ContextAssemblerTest, PlaceholdersInsideValuesAreNotExpanded) {
    RAGBackendConfig config;
    config.prompt_template = "{context}|{query}";
    ContextAssembler assembler(config);

    EXPECT_EQ(assembler.format_prompt("{context}", "{query}"), "{query}|{context}");
}

} // namespace docindex::rag
