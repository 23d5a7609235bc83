#pragma once

#include <namesake/ml/nickname_table.h>
#include <namesake/ml/provider.h>

#include <atomic>
#include <string>
#include <vector>

namespace namesake::ml {

/**
 * Deterministic local name embedder.
 *
 * Each name is case-folded and split on whitespace and punctuation. Every token contributes a
 * word feature for its canonical form (nickname table applied) and its padded character
 * trigrams; features are hashed (FNV-1a) into a fixed number of buckets. Output is
 * non-negative and L2-normalized, so cosine similarity between two outputs lies in [0, 1].
 *
 * Tokens sharing a canonical form ("Bob", "Bobby", "Robert") land on the same word
 * feature; spelling variants and OCR noise still share most trigrams.
 */
class NgramEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit NgramEmbeddingProvider(const EmbeddingConfig& config = {});
    ~NgramEmbeddingProvider() override;

    Result<Embedding> generateEmbedding(const std::string& text) override;
    std::vector<Result<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "NameNgram"; }
    size_t getEmbeddingDimension() const override { return config_.embedding_dim; }
    size_t getMaxSequenceLength() const override { return 0; }

    Result<void> initialize() override;
    void shutdown() override;

    // Lower-cased tokens of a name as used for featurization
    static std::vector<std::string> tokenize(const std::string& text);

private:
    Result<Embedding> embedUnchecked(const std::string& text) const;

    EmbeddingConfig config_;
    NicknameTable nicknames_;
    std::atomic<bool> initialized_{false};
};

} // namespace namesake::ml
