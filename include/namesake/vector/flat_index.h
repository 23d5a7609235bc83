#pragma once

#include <namesake/vector/vector_index.h>

#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace namesake::vector {

/**
 * Exact brute-force cosine scan. Used as the recall reference for HnswIndex and for small
 * corpora where a graph is not worth building.
 */
class FlatIndex : public VectorIndex {
public:
    explicit FlatIndex(const IndexConfig& config);

    Result<void> initialize() override;
    bool isInitialized() const override { return initialized_.load(std::memory_order_acquire); }

    Result<void> upsert(const IndexEntry& entry) override;
    Result<void> remove(const std::string& id) override;
    Result<QueryResult> query(const Embedding& query, const QueryParams& params) override;

    Result<IndexEntry> get(const std::string& id) const override;
    bool contains(const std::string& id) const override;
    size_t size() const override;
    void forEachEntry(const std::function<void(const IndexEntry&)>& fn) const override;
    IndexStats getStats() const override;

private:
    struct Stored {
        std::string label;
        Embedding vec;
        float norm = 0.0f;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Stored> entries_;
    std::atomic<bool> initialized_{false};

    std::atomic<size_t> totalInserts_{0};
    std::atomic<size_t> totalUpdates_{0};
    std::atomic<size_t> totalSearches_{0};
    std::atomic<size_t> truncatedSearches_{0};
};

} // namespace namesake::vector
