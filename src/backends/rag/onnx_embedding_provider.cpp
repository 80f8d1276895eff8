/**
 * @file onnx_embedding_provider.cpp
 * @brief ONNX embedding provider implementation
 */

#include "onnx_embedding_provider.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include <onnxruntime_c_api.h>

#include "dix/core/dix_logger.h"
#include "ort_guards.h"
#include "rag_errors.h"
#include "vector_math.h"

#define LOG_TAG "RAG.ONNXEmbedding"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

constexpr size_t kMaxWordChars = 100;

// =============================================================================
// WORDPIECE TOKENIZER
// =============================================================================

struct Encoding {
    std::vector<int64_t> ids;
};

class WordPieceTokenizer {
public:
    /**
     * @throws EmbeddingUnavailable if the vocabulary is missing or empty
     */
    explicit WordPieceTokenizer(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) {
            throw EmbeddingUnavailable("tokenizer vocab not found: " + vocab_path);
        }

        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            vocab_.emplace(line, id++);
        }
        if (vocab_.empty()) {
            throw EmbeddingUnavailable("tokenizer vocab is empty: " + vocab_path);
        }

        cls_id_ = lookup("[CLS]", cls_id_);
        sep_id_ = lookup("[SEP]", sep_id_);
        pad_id_ = lookup("[PAD]", pad_id_);
        unk_id_ = lookup("[UNK]", unk_id_);
    }

    /**
     * @brief [CLS] tokens... [SEP], truncated to max_length, unpadded
     */
    Encoding encode(const std::string& text, size_t max_length) const {
        Encoding out;
        out.ids.push_back(cls_id_);

        for (const auto& word : basic_tokenize(text)) {
            for (int64_t id : wordpiece(word)) {
                if (out.ids.size() + 1 >= max_length) {
                    out.ids.push_back(sep_id_);
                    return out;
                }
                out.ids.push_back(id);
            }
        }

        out.ids.push_back(sep_id_);
        return out;
    }

    int64_t pad_id() const { return pad_id_; }

private:
    static bool is_ascii_punct(unsigned char ch) {
        return (ch >= 33 && ch <= 47) || (ch >= 58 && ch <= 64) ||
               (ch >= 91 && ch <= 96) || (ch >= 123 && ch <= 126);
    }

    static bool is_ascii_space(unsigned char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    }

    // Lowercase, split on whitespace, punctuation becomes its own token
    static std::vector<std::string> basic_tokenize(const std::string& text) {
        std::vector<std::string> words;
        std::string current;

        auto flush = [&]() {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        };

        for (unsigned char ch : text) {
            if (is_ascii_space(ch)) {
                flush();
            } else if (is_ascii_punct(ch)) {
                flush();
                words.emplace_back(1, static_cast<char>(ch));
            } else if (ch >= 'A' && ch <= 'Z') {
                current.push_back(static_cast<char>(ch + ('a' - 'A')));
            } else {
                current.push_back(static_cast<char>(ch));
            }
        }
        flush();
        return words;
    }

    // Greedy longest-match-first
    std::vector<int64_t> wordpiece(const std::string& word) const {
        if (word.size() > kMaxWordChars) {
            return {unk_id_};
        }

        std::vector<int64_t> ids;
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t match = -1;
            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) {
                    piece.insert(0, "##");
                }
                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    match = it->second;
                    break;
                }
                --end;
            }
            if (match < 0) {
                return {unk_id_};
            }
            ids.push_back(match);
            start = end;
        }
        return ids;
    }

    int64_t lookup(const std::string& token, int64_t fallback) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : fallback;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = 101;
    int64_t sep_id_ = 102;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = 100;
};

std::string resolve_vocab_path(const std::string& model_path, const nlohmann::json& config) {
    if (config.contains("vocab_path")) {
        return config.at("vocab_path").get<std::string>();
    }
    std::filesystem::path model_file(model_path);
    return (model_file.parent_path() / "vocab.txt").string();
}

} // namespace

// =============================================================================
// PIMPL IMPLEMENTATION
// =============================================================================

class ONNXEmbeddingProvider::Impl {
public:
    Impl(const std::string& model_path, const std::string& config_json)
        : config_(parse_config(config_json)),
          tokenizer_(resolve_vocab_path(model_path, config_)),
          ort_api_(acquire_api()),
          env_(ort_api_),
          session_(ort_api_) {
        embedding_dim_ = config_.value("dimension", embedding_dim_);
        max_seq_length_ = config_.value("max_seq_length", max_seq_length_);
        int intra_op_threads = config_.value("intra_op_threads", 4);

        OrtStatusGuard status(ort_api_);
        status.reset(ort_api_->CreateEnv(ORT_LOGGING_LEVEL_WARNING, "DocIndexEmbedding",
                                         env_.ptr()));
        check(status, "CreateEnv");

        OrtSessionOptionsGuard options(ort_api_);
        status.reset(ort_api_->CreateSessionOptions(options.ptr()));
        check(status, "CreateSessionOptions");
        status.reset(ort_api_->SetIntraOpNumThreads(options.get(), intra_op_threads));
        check(status, "SetIntraOpNumThreads");
        status.reset(ort_api_->SetSessionGraphOptimizationLevel(options.get(), ORT_ENABLE_ALL));
        check(status, "SetSessionGraphOptimizationLevel");

        status.reset(ort_api_->CreateSession(env_.get(), model_path.c_str(), options.get(),
                                             session_.ptr()));
        check(status, "CreateSession");

        LOGI("ONNX embedding provider initialized: %s (dim=%zu, max_seq_length=%zu)",
             model_path.c_str(), embedding_dim_, max_seq_length_);
    }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const {
        if (texts.empty()) {
            return {};
        }

        // 1. Tokenize and pad to the longest sequence in the batch
        std::vector<Encoding> encodings;
        encodings.reserve(texts.size());
        size_t seq_length = 0;
        for (const auto& text : texts) {
            encodings.push_back(tokenizer_.encode(text, max_seq_length_));
            seq_length = std::max(seq_length, encodings.back().ids.size());
        }

        const size_t batch = texts.size();
        std::vector<int64_t> input_ids(batch * seq_length, tokenizer_.pad_id());
        std::vector<int64_t> attention_mask(batch * seq_length, 0);
        std::vector<int64_t> token_type_ids(batch * seq_length, 0);
        for (size_t b = 0; b < batch; ++b) {
            const auto& ids = encodings[b].ids;
            std::copy(ids.begin(), ids.end(), input_ids.begin() + b * seq_length);
            std::fill_n(attention_mask.begin() + b * seq_length, ids.size(), 1);
        }

        // 2. Wrap the buffers as tensors
        std::vector<int64_t> shape = {static_cast<int64_t>(batch),
                                      static_cast<int64_t>(seq_length)};
        OrtStatusGuard status(ort_api_);
        OrtMemoryInfoGuard memory_info(ort_api_);
        status.reset(ort_api_->CreateCpuMemoryInfo(OrtArenaAllocator, OrtMemTypeDefault,
                                                   memory_info.ptr()));
        check(status, "CreateCpuMemoryInfo");

        OrtValueGuard ids_tensor(ort_api_);
        OrtValueGuard mask_tensor(ort_api_);
        OrtValueGuard type_tensor(ort_api_);
        make_tensor(memory_info.get(), input_ids, shape, ids_tensor);
        make_tensor(memory_info.get(), attention_mask, shape, mask_tensor);
        make_tensor(memory_info.get(), token_type_ids, shape, type_tensor);

        // 3. Run inference
        const char* input_names[] = {"input_ids", "attention_mask", "token_type_ids"};
        const OrtValue* inputs[] = {ids_tensor.get(), mask_tensor.get(), type_tensor.get()};
        const char* output_names[] = {"last_hidden_state"};
        OrtValueGuard output(ort_api_);

        status.reset(ort_api_->Run(session_.get(), nullptr, input_names, inputs, 3,
                                   output_names, 1, output.ptr()));
        check(status, "Run");

        // 4. Check the output shape [batch, seq, hidden]
        OrtTensorInfoGuard shape_info(ort_api_);
        status.reset(ort_api_->GetTensorTypeAndShape(output.get(), shape_info.ptr()));
        check(status, "GetTensorTypeAndShape");

        size_t dim_count = 0;
        status.reset(ort_api_->GetDimensionsCount(shape_info.get(), &dim_count));
        check(status, "GetDimensionsCount");
        if (dim_count != 3) {
            throw EmbeddingUnavailable("unexpected output rank " + std::to_string(dim_count));
        }
        int64_t dims[3] = {0, 0, 0};
        status.reset(ort_api_->GetDimensions(shape_info.get(), dims, 3));
        check(status, "GetDimensions");
        if (static_cast<size_t>(dims[2]) != embedding_dim_) {
            throw EmbeddingUnavailable("model hidden size " + std::to_string(dims[2]) +
                                       " differs from configured dimension " +
                                       std::to_string(embedding_dim_));
        }

        float* hidden = nullptr;
        status.reset(ort_api_->GetTensorMutableData(output.get(),
                                                    reinterpret_cast<void**>(&hidden)));
        check(status, "GetTensorMutableData");
        if (hidden == nullptr) {
            throw EmbeddingUnavailable("output tensor data pointer is null");
        }

        // 5. Mean pooling over real tokens, then L2 normalisation
        std::vector<std::vector<float>> out;
        out.reserve(batch);
        for (size_t b = 0; b < batch; ++b) {
            std::vector<float> pooled(embedding_dim_, 0.0f);
            size_t valid = 0;
            for (size_t t = 0; t < seq_length; ++t) {
                if (attention_mask[b * seq_length + t] == 0) {
                    continue;
                }
                const float* row = hidden + (b * seq_length + t) * embedding_dim_;
                for (size_t d = 0; d < embedding_dim_; ++d) {
                    pooled[d] += row[d];
                }
                ++valid;
            }
            if (valid > 0) {
                for (float& value : pooled) {
                    value /= static_cast<float>(valid);
                }
            }
            if (!normalize_vector(pooled)) {
                throw EmbeddingUnavailable("model produced a zero embedding");
            }
            out.push_back(std::move(pooled));
        }
        return out;
    }

    size_t dimension() const noexcept { return embedding_dim_; }

private:
    static nlohmann::json parse_config(const std::string& config_json) {
        if (config_json.empty()) {
            return nlohmann::json::object();
        }
        try {
            return nlohmann::json::parse(config_json);
        } catch (const nlohmann::json::exception& e) {
            throw EmbeddingUnavailable(std::string("invalid embedding config JSON: ") + e.what());
        }
    }

    static const OrtApi* acquire_api() {
        const OrtApiBase* base = OrtGetApiBase();
        const OrtApi* api = base != nullptr ? base->GetApi(ORT_API_VERSION) : nullptr;
        if (api == nullptr) {
            LOGE("Failed to get ONNX Runtime API (ORT_API_VERSION=%d, runtime=%s)",
                 ORT_API_VERSION, base != nullptr ? base->GetVersionString() : "unknown");
            throw EmbeddingUnavailable("ONNX Runtime API unavailable");
        }
        return api;
    }

    static void check(const OrtStatusGuard& status, const char* what) {
        if (status.is_error()) {
            LOGE("%s failed: %s", what, status.error_message());
            throw EmbeddingUnavailable(std::string(what) + " failed: " + status.error_message());
        }
    }

    void make_tensor(const OrtMemoryInfo* memory_info, std::vector<int64_t>& data,
                     const std::vector<int64_t>& shape, OrtValueGuard& tensor) const {
        OrtStatusGuard status(ort_api_);
        status.reset(ort_api_->CreateTensorWithDataAsOrtValue(
            memory_info, data.data(), data.size() * sizeof(int64_t), shape.data(), shape.size(),
            ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64, tensor.ptr()));
        check(status, "CreateTensorWithDataAsOrtValue");
    }

    nlohmann::json config_;
    WordPieceTokenizer tokenizer_;

    const OrtApi* ort_api_;
    OrtEnvGuard env_;
    OrtSessionGuard session_;

    size_t embedding_dim_ = 384;     // all-MiniLM-L6-v2
    size_t max_seq_length_ = 256;
};

// =============================================================================
// PUBLIC API
// =============================================================================

ONNXEmbeddingProvider::ONNXEmbeddingProvider(
    const std::string& model_path,
    const std::string& config_json
) : impl_(std::make_unique<Impl>(model_path, config_json)) {
}

ONNXEmbeddingProvider::~ONNXEmbeddingProvider() = default;

std::vector<float> ONNXEmbeddingProvider::embed(const std::string& text) {
    auto vectors = impl_->embed_batch({text});
    return std::move(vectors.front());
}

std::vector<std::vector<float>> ONNXEmbeddingProvider::embed_batch(
    const std::vector<std::string>& texts) {
    return impl_->embed_batch(texts);
}

size_t ONNXEmbeddingProvider::dimension() const noexcept {
    return impl_->dimension();
}

bool ONNXEmbeddingProvider::is_ready() const noexcept {
    return true;
}

const char* ONNXEmbeddingProvider::name() const noexcept {
    return "ONNX-Embedding";
}

// =============================================================================
// FACTORY FUNCTION
// =============================================================================

std::unique_ptr<IEmbeddingProvider> create_onnx_embedding_provider(
    const std::string& model_path,
    const std::string& config_json
) {
    return std::make_unique<ONNXEmbeddingProvider>(model_path, config_json);
}

} // namespace rag
} // namespace docindex
