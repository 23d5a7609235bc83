#pragma once

#include <atomic>
#include <cstdint>

namespace namesake::ml::batchmetrics {

struct Metrics {
    std::atomic<std::uint64_t> effectiveTokens{0};
    std::atomic<std::uint64_t> recentAvgDocs{0};
    std::atomic<std::uint64_t> successes{0};
    std::atomic<std::uint64_t> failures{0};
    std::atomic<std::uint64_t> backoffs{0};
    std::atomic<std::uint64_t> itemFallbacks{0};
    std::atomic<std::uint64_t> retries{0};
};

// Process-wide batch counters
Metrics& get();

inline void set_effective_tokens(std::uint64_t t) {
    get().effectiveTokens.store(t);
}
inline void record_success(std::uint64_t names_in_batch) {
    auto& m = get();
    m.successes.fetch_add(1);
    // Exponential moving average with alpha=0.2
    auto prev = m.recentAvgDocs.load();
    std::uint64_t next = static_cast<std::uint64_t>(prev * 0.8 + names_in_batch * 0.2);
    if (next == 0)
        next = names_in_batch;
    m.recentAvgDocs.store(next);
}
inline void record_failure() {
    get().failures.fetch_add(1);
}
inline void record_backoff() {
    get().backoffs.fetch_add(1);
}
inline void record_item_fallback() {
    get().itemFallbacks.fetch_add(1);
}
inline void record_retry() {
    get().retries.fetch_add(1);
}

} // namespace namesake::ml::batchmetrics
