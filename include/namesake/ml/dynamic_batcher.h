#pragma once

#include <namesake/ml/batch_metrics.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace namesake::ml {

struct DynamicBatcherConfig {
    std::size_t maxSequenceLengthTokens{128};
    double safetyFactor{0.9};
    std::size_t minTokens{64};
    std::size_t maxTokens{65536};
    std::size_t initialTokens{0};  // if 0, computed from maxSequenceLengthTokens * 8 * safetyFactor
    std::size_t advisoryDocCap{0}; // optional hard cap on names per batch
};

// Cheap token estimator: chars/4
inline std::size_t estimate_tokens_cheap(const std::string& s) {
    return std::max<std::size_t>(1, s.size() / 4);
}

/**
 * Splits a run of names into provider batches under an adaptive token budget.
 * The budget grows by 10% after each successful batch and halves after a failed one.
 * Not thread-safe; callers serialize access.
 */
class DynamicBatcher {
public:
    explicit DynamicBatcher(const DynamicBatcherConfig& cfg) : cfg_(cfg) {
        std::size_t base =
            cfg_.initialTokens
                ? cfg_.initialTokens
                : static_cast<std::size_t>(cfg_.maxSequenceLengthTokens * 8 * cfg_.safetyFactor);
        budgetTokens_ = std::clamp(base, cfg_.minTokens, cfg_.maxTokens);
        batchmetrics::set_effective_tokens(budgetTokens_);
    }

    std::size_t currentBudgetTokens() const { return budgetTokens_; }

    // Returns the number of texts, starting at startIdx, that fit in the next batch.
    // At least one text is always selected while any remain.
    std::size_t packByTokens(const std::vector<std::string>& texts, std::size_t startIdx) const {
        std::size_t used = 0;
        std::size_t count = 0;
        for (std::size_t i = startIdx; i < texts.size(); ++i) {
            std::size_t est = estimate_tokens_cheap(texts[i]);
            if (count > 0 && used + est > budgetTokens_) {
                break;
            }
            used += est;
            ++count;
            if (cfg_.advisoryDocCap > 0 && count >= cfg_.advisoryDocCap) {
                break;
            }
        }
        return count;
    }

    void onSuccess(std::size_t namesInBatch) {
        // AIMD: linear increase (10%), cap at maxTokens
        std::size_t inc = std::max<std::size_t>(1, budgetTokens_ / 10);
        budgetTokens_ = std::min(cfg_.maxTokens, budgetTokens_ + inc);
        batchmetrics::set_effective_tokens(budgetTokens_);
        batchmetrics::record_success(namesInBatch);
    }

    void onFailure() {
        // AIMD: multiplicative decrease (halve)
        budgetTokens_ = std::max(cfg_.minTokens, budgetTokens_ / 2);
        batchmetrics::set_effective_tokens(budgetTokens_);
        batchmetrics::record_failure();
        batchmetrics::record_backoff();
    }

private:
    DynamicBatcherConfig cfg_;
    std::size_t budgetTokens_;
};

} // namespace namesake::ml
