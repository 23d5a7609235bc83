#pragma once

#include <namesake/ml/provider.h>
#include <namesake/ml/wordpiece_tokenizer.h>

#include <memory>
#include <mutex>

namespace namesake::ml {

/**
 * Sentence-transformer embedder backed by ONNX Runtime (MiniLM-style models).
 * Inputs are WordPiece ids; the output is mean-pooled over the attention mask and
 * L2-normalized. Only available when built with NAMESAKE_USE_ONNX_RUNTIME.
 */
class OnnxEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit OnnxEmbeddingProvider(const EmbeddingConfig& config);
    ~OnnxEmbeddingProvider() override;

    Result<Embedding> generateEmbedding(const std::string& text) override;
    std::vector<Result<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override;
    std::string getProviderName() const override { return "ONNX"; }
    size_t getEmbeddingDimension() const override;
    size_t getMaxSequenceLength() const override { return config_.max_sequence_length; }

    Result<void> initialize() override;
    void shutdown() override;

private:
    class Impl;

    EmbeddingConfig config_;
    WordPieceTokenizer tokenizer_;
    std::unique_ptr<Impl> pImpl;
    mutable std::mutex mutex_;
};

} // namespace namesake::ml
