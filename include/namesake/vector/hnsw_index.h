#pragma once

#include <namesake/vector/vector_index.h>

#include <array>
#include <atomic>
#include <mutex>
#include <random>
#include <unordered_map>

namespace namesake::vector {

/**
 * Layered proximity graph (HNSW) over cosine distance.
 *
 * Nodes live in preallocated slots and are never moved or freed while the index exists.
 * Replacing an identifier links a fresh node and then retires the old one; retired nodes keep
 * routing traffic but never appear in results. Each node carries its own mutex and at most
 * one node mutex is held at a time, so inserts for different identifiers proceed in parallel
 * with each other and with queries.
 */
class HnswIndex : public VectorIndex {
public:
    explicit HnswIndex(const IndexConfig& config);
    ~HnswIndex() override;

    Result<void> initialize() override;
    bool isInitialized() const override { return initialized_.load(std::memory_order_acquire); }

    Result<void> upsert(const IndexEntry& entry) override;
    Result<void> remove(const std::string& id) override;
    Result<QueryResult> query(const Embedding& query, const QueryParams& params) override;

    Result<IndexEntry> get(const std::string& id) const override;
    bool contains(const std::string& id) const override;
    size_t size() const override { return liveCount_.load(); }
    void forEachEntry(const std::function<void(const IndexEntry&)>& fn) const override;
    IndexStats getStats() const override;

private:
    struct Node;
    using Scored = std::pair<float, uint32_t>; // (distance, slot)

    static constexpr size_t kShardCount = 64;
    struct IdShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, uint32_t> slots;
    };

    IdShard& shardFor(const std::string& id) const;
    size_t maxConnections(size_t layer) const;
    int randomLevel();

    float distance(const Embedding& q, float qnorm, uint32_t slot) const;
    float distance(uint32_t a, uint32_t b) const;

    Scored greedyClosest(const Embedding& q, float qnorm, Scored ep, int fromLayer, int toLayer,
                         const Deadline* deadline, bool& expired) const;
    std::vector<Scored> searchLayer(const Embedding& q, float qnorm, Scored ep, size_t ef,
                                    size_t layer, const Deadline* deadline, bool& expired) const;
    std::vector<uint32_t> selectNeighbors(std::vector<Scored> candidates, size_t m) const;
    void linkNode(uint32_t slot);
    void addLink(uint32_t from, uint32_t to, size_t layer);

    std::vector<std::unique_ptr<Node>> nodes_;
    std::atomic<uint32_t> nextSlot_{0};
    std::atomic<bool> initialized_{false};

    mutable std::array<IdShard, kShardCount> shards_;

    // Entry point of the top layer
    mutable std::mutex entryMutex_;
    bool hasEntry_ = false;
    uint32_t entry_ = 0;
    int maxLevel_ = 0;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;
    double levelMult_;

    std::atomic<size_t> liveCount_{0};
    std::atomic<size_t> deadCount_{0};
    std::atomic<size_t> totalInserts_{0};
    std::atomic<size_t> totalUpdates_{0};
    std::atomic<size_t> totalSearches_{0};
    std::atomic<size_t> truncatedSearches_{0};
    std::atomic<uint64_t> searchNanos_{0};
};

} // namespace namesake::vector
