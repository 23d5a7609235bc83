#pragma once

#include <namesake/ml/provider.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace namesake::test_support {

/**
 * Provider with scripted behaviour for failure-path tests.
 *
 * Known names return their registered vector; names in `failing` return EmbeddingFailure;
 * names in `flaky` fail with Timeout a set number of times before succeeding; any other name
 * gets a one-hot vector derived from its length. A batch containing `poison` throws.
 */
class ScriptedEmbeddingProvider : public ml::IEmbeddingProvider {
public:
    explicit ScriptedEmbeddingProvider(size_t dim = 4) : dim_(dim) {}

    std::unordered_map<std::string, Embedding> vectors;
    std::vector<std::string> failing;
    std::unordered_map<std::string, int> flaky;
    std::string poison;
    size_t wrongDimensionFor = 0; // names of this length get dim_ + 1 values when non-zero

    std::atomic<int> batchCalls{0};
    std::atomic<int> singleCalls{0};

    Result<Embedding> generateEmbedding(const std::string& text) override {
        singleCalls.fetch_add(1);
        return embedOne(text);
    }

    std::vector<Result<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        batchCalls.fetch_add(1);
        std::vector<Result<Embedding>> out;
        for (const auto& t : texts) {
            if (!poison.empty() && t == poison) {
                throw std::runtime_error("poisoned batch");
            }
        }
        for (const auto& t : texts) {
            out.push_back(embedOne(t));
        }
        return out;
    }

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "Scripted"; }
    size_t getEmbeddingDimension() const override { return dim_; }
    size_t getMaxSequenceLength() const override { return 0; }
    Result<void> initialize() override { return Result<void>(); }
    void shutdown() override {}

private:
    Result<Embedding> embedOne(const std::string& text) {
        for (const auto& f : failing) {
            if (f == text) {
                return Error{ErrorCode::EmbeddingFailure, "scripted failure for " + text};
            }
        }
        if (auto it = flaky.find(text); it != flaky.end() && it->second > 0) {
            --it->second;
            return Error{ErrorCode::Timeout, "scripted timeout for " + text};
        }
        if (wrongDimensionFor != 0 && text.size() == wrongDimensionFor) {
            return Embedding(dim_ + 1, 1.0f);
        }
        if (auto it = vectors.find(text); it != vectors.end()) {
            return it->second;
        }
        Embedding v(dim_, 0.0f);
        v[text.size() % dim_] = 1.0f;
        return v;
    }

    size_t dim_;
};

} // namespace namesake::test_support
