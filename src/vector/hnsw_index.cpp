#include <namesake/vector/hnsw_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <queue>
#include <unordered_set>

namespace namesake::vector {

struct HnswIndex::Node {
    std::string id;
    std::string label;
    Embedding vec;
    float norm = 0.0f;
    int level = 0;

    // links[layer] guarded by mutex
    std::vector<std::vector<uint32_t>> links;
    mutable std::mutex mutex;
    std::atomic<bool> live{false};
};

namespace {

// Epoch-stamped visited marks, reused across searches on the same thread
struct VisitedMarks {
    std::vector<uint32_t> seen;
    uint32_t epoch = 0;

    void reset() {
        if (++epoch == 0) {
            std::fill(seen.begin(), seen.end(), 0u);
            epoch = 1;
        }
    }

    // Returns true if slot was not yet visited in this epoch
    bool mark(uint32_t slot) {
        if (slot >= seen.size()) {
            seen.resize(static_cast<size_t>(slot) + 1024, 0u);
        }
        if (seen[slot] == epoch) {
            return false;
        }
        seen[slot] = epoch;
        return true;
    }
};

constexpr size_t kDeadlineCheckInterval = 16;

bool deadlinePassed(const Deadline* deadline) {
    return deadline != nullptr && std::chrono::steady_clock::now() >= *deadline;
}

} // namespace

HnswIndex::HnswIndex(const IndexConfig& config)
    : VectorIndex(config), rng_(config.hnsw_seed),
      levelMult_(1.0 / std::log(static_cast<double>(std::max<size_t>(config.hnsw_m, 2)))) {
    config_.type = IndexType::HNSW;
}

HnswIndex::~HnswIndex() = default;

Result<void> HnswIndex::initialize() {
    if (isInitialized()) {
        return Result<void>();
    }
    if (config_.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "Index dimension must be positive"};
    }
    if (config_.hnsw_m < 2) {
        return Error{ErrorCode::InvalidArgument, "HNSW M must be at least 2"};
    }
    if (config_.max_elements == 0 || config_.max_elements > UINT32_MAX) {
        return Error{ErrorCode::InvalidArgument, "max_elements out of range"};
    }

    nodes_.resize(config_.max_elements);
    initialized_.store(true, std::memory_order_release);
    spdlog::info("[HNSW] Initialized (dim={}, M={}, ef_construction={}, ef_search={}, "
                 "capacity={})",
                 config_.dimension, config_.hnsw_m, config_.hnsw_ef_construction,
                 config_.hnsw_ef_search, config_.max_elements);
    return Result<void>();
}

HnswIndex::IdShard& HnswIndex::shardFor(const std::string& id) const {
    return shards_[std::hash<std::string>{}(id) % kShardCount];
}

size_t HnswIndex::maxConnections(size_t layer) const {
    return layer == 0 ? config_.hnsw_m * 2 : config_.hnsw_m;
}

int HnswIndex::randomLevel() {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double u;
    {
        std::lock_guard<std::mutex> lock(rngMutex_);
        u = 1.0 - uniform(rng_); // (0, 1]
    }
    return static_cast<int>(std::floor(-std::log(u) * levelMult_));
}

float HnswIndex::distance(const Embedding& q, float qnorm, uint32_t slot) const {
    const Node& n = *nodes_[slot];
    return 1.0f - vector_utils::cosineSimilarity(q, qnorm, n.vec, n.norm);
}

float HnswIndex::distance(uint32_t a, uint32_t b) const {
    const Node& na = *nodes_[a];
    return distance(na.vec, na.norm, b);
}

HnswIndex::Scored HnswIndex::greedyClosest(const Embedding& q, float qnorm, Scored ep,
                                           int fromLayer, int toLayer, const Deadline* deadline,
                                           bool& expired) const {
    for (int layer = fromLayer; layer > toLayer; --layer) {
        bool changed = true;
        while (changed) {
            if (deadlinePassed(deadline)) {
                expired = true;
                return ep;
            }
            changed = false;
            std::vector<uint32_t> neighbors;
            {
                const Node& n = *nodes_[ep.second];
                std::lock_guard<std::mutex> lock(n.mutex);
                neighbors = n.links[static_cast<size_t>(layer)];
            }
            for (uint32_t candidate : neighbors) {
                float d = distance(q, qnorm, candidate);
                if (d < ep.first) {
                    ep = {d, candidate};
                    changed = true;
                }
            }
        }
    }
    return ep;
}

std::vector<HnswIndex::Scored> HnswIndex::searchLayer(const Embedding& q, float qnorm, Scored ep,
                                                      size_t ef, size_t layer,
                                                      const Deadline* deadline,
                                                      bool& expired) const {
    thread_local VisitedMarks visited;
    visited.reset();

    // candidates: min-heap on distance; nearest: max-heap holding the best ef so far
    std::priority_queue<Scored, std::vector<Scored>, std::greater<>> candidates;
    std::priority_queue<Scored> nearest;

    visited.mark(ep.second);
    candidates.push(ep);
    nearest.push(ep);

    size_t expansions = 0;
    while (!candidates.empty()) {
        if (++expansions % kDeadlineCheckInterval == 0 && deadlinePassed(deadline)) {
            expired = true;
            break;
        }

        Scored current = candidates.top();
        if (current.first > nearest.top().first && nearest.size() >= ef) {
            break;
        }
        candidates.pop();

        std::vector<uint32_t> neighbors;
        {
            const Node& n = *nodes_[current.second];
            std::lock_guard<std::mutex> lock(n.mutex);
            neighbors = n.links[layer];
        }

        for (uint32_t neighbor : neighbors) {
            if (!visited.mark(neighbor)) {
                continue;
            }
            float d = distance(q, qnorm, neighbor);
            if (nearest.size() < ef || d < nearest.top().first) {
                candidates.emplace(d, neighbor);
                nearest.emplace(d, neighbor);
                if (nearest.size() > ef) {
                    nearest.pop();
                }
            }
        }
    }

    std::vector<Scored> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<uint32_t> HnswIndex::selectNeighbors(std::vector<Scored> candidates, size_t m) const {
    std::sort(candidates.begin(), candidates.end());
    std::vector<uint32_t> selected;
    selected.reserve(m);
    for (const auto& [d, slot] : candidates) {
        if (selected.size() >= m) {
            break;
        }
        // Keep a candidate only if it is closer to the base than to every kept neighbour
        bool keep = true;
        for (uint32_t kept : selected) {
            if (distance(slot, kept) < d) {
                keep = false;
                break;
            }
        }
        if (keep) {
            selected.push_back(slot);
        }
    }
    return selected;
}

void HnswIndex::addLink(uint32_t from, uint32_t to, size_t layer) {
    Node& n = *nodes_[from];
    std::lock_guard<std::mutex> lock(n.mutex);
    auto& links = n.links[layer];
    if (std::find(links.begin(), links.end(), to) != links.end()) {
        return;
    }
    links.push_back(to);

    const size_t cap = maxConnections(layer);
    if (links.size() > cap) {
        std::vector<Scored> scored;
        scored.reserve(links.size());
        for (uint32_t other : links) {
            scored.emplace_back(distance(n.vec, n.norm, other), other);
        }
        links = selectNeighbors(std::move(scored), cap);
    }
}

void HnswIndex::linkNode(uint32_t slot) {
    Node& node = *nodes_[slot];
    Scored ep;
    int top;
    {
        std::lock_guard<std::mutex> lock(entryMutex_);
        if (!hasEntry_) {
            hasEntry_ = true;
            entry_ = slot;
            maxLevel_ = node.level;
            return;
        }
        ep = {0.0f, entry_};
        top = maxLevel_;
    }
    ep.first = distance(node.vec, node.norm, ep.second);

    bool expired = false;
    ep = greedyClosest(node.vec, node.norm, ep, top, node.level, nullptr, expired);

    for (int layer = std::min(top, node.level); layer >= 0; --layer) {
        const auto l = static_cast<size_t>(layer);
        auto nearest = searchLayer(node.vec, node.norm, ep, config_.hnsw_ef_construction, l,
                                   nullptr, expired);
        nearest.erase(std::remove_if(nearest.begin(), nearest.end(),
                                     [slot](const Scored& s) { return s.second == slot; }),
                      nearest.end());
        if (nearest.empty()) {
            continue;
        }
        ep = nearest.front();

        auto selected = selectNeighbors(nearest, config_.hnsw_m);
        for (uint32_t neighbor : selected) {
            addLink(slot, neighbor, l);
        }
        for (uint32_t neighbor : selected) {
            addLink(neighbor, slot, l);
        }
    }

    if (node.level > top) {
        std::lock_guard<std::mutex> lock(entryMutex_);
        if (node.level > maxLevel_) {
            maxLevel_ = node.level;
            entry_ = slot;
        }
    }
}

Result<void> HnswIndex::upsert(const IndexEntry& entry) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "HNSW index not initialized"};
    }
    auto norm = vector_utils::validate(entry.vector, config_.dimension);
    if (!norm) {
        return norm.error();
    }

    IdShard& shard = shardFor(entry.id);
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (auto it = shard.slots.find(entry.id); it != shard.slots.end()) {
            const Node& existing = *nodes_[it->second];
            if (existing.label == entry.label && existing.vec == entry.vector) {
                return Result<void>();
            }
        }
    }

    const uint32_t slot = nextSlot_.fetch_add(1);
    if (slot >= config_.max_elements) {
        return Error{ErrorCode::ResourceExhausted,
                     "HNSW index full (" + std::to_string(config_.max_elements) + " nodes)"};
    }

    auto node = std::make_unique<Node>();
    node->id = entry.id;
    node->label = entry.label;
    node->vec = entry.vector;
    node->norm = norm.value();
    node->level = randomLevel();
    node->links.resize(static_cast<size_t>(node->level) + 1);
    for (size_t l = 0; l < node->links.size(); ++l) {
        node->links[l].reserve(maxConnections(l) + 1);
    }
    nodes_[slot] = std::move(node);

    linkNode(slot);

    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto [it, inserted] = shard.slots.try_emplace(entry.id, slot);
        if (!inserted) {
            nodes_[it->second]->live.store(false, std::memory_order_release);
            it->second = slot;
            replaced = true;
        }
        nodes_[slot]->live.store(true, std::memory_order_release);
    }

    if (replaced) {
        deadCount_.fetch_add(1);
        totalUpdates_.fetch_add(1);
    } else {
        liveCount_.fetch_add(1);
        totalInserts_.fetch_add(1);
    }
    return Result<void>();
}

Result<void> HnswIndex::remove(const std::string& id) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "HNSW index not initialized"};
    }
    IdShard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.slots.find(id);
    if (it == shard.slots.end()) {
        return Error{ErrorCode::NotFound, "No entry for id " + id};
    }
    nodes_[it->second]->live.store(false, std::memory_order_release);
    shard.slots.erase(it);
    liveCount_.fetch_sub(1);
    deadCount_.fetch_add(1);
    return Result<void>();
}

Result<QueryResult> HnswIndex::query(const Embedding& query, const QueryParams& params) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "HNSW index not initialized"};
    }
    auto norm = vector_utils::validate(query, config_.dimension);
    if (!norm) {
        return norm.error();
    }
    const Deadline* deadline = params.deadline ? &*params.deadline : nullptr;
    if (deadlinePassed(deadline)) {
        return Error{ErrorCode::Timeout, "Query deadline expired before traversal"};
    }

    QueryResult result;
    if (params.limit == 0) {
        return result;
    }

    const auto started = std::chrono::steady_clock::now();
    Scored ep;
    int top;
    {
        std::lock_guard<std::mutex> lock(entryMutex_);
        if (!hasEntry_) {
            return result;
        }
        ep = {0.0f, entry_};
        top = maxLevel_;
    }
    const float qnorm = norm.value();
    ep.first = distance(query, qnorm, ep.second);

    bool expired = false;
    ep = greedyClosest(query, qnorm, ep, top, 0, deadline, expired);
    std::vector<Scored> nearest;
    if (expired) {
        nearest.push_back(ep);
    } else {
        const size_t ef = std::max(config_.hnsw_ef_search, params.limit);
        nearest = searchLayer(query, qnorm, ep, ef, 0, deadline, expired);
    }

    std::unordered_set<std::string> seen;
    for (const auto& [d, slot] : nearest) {
        const Node& n = *nodes_[slot];
        if (!n.live.load(std::memory_order_acquire)) {
            continue;
        }
        const float similarity = vector_utils::cosineSimilarity(query, qnorm, n.vec, n.norm);
        if (!(similarity >= params.threshold) || !seen.insert(n.id).second) {
            continue;
        }
        result.hits.push_back(QueryHit{n.id, n.label, similarity});
    }
    std::sort(result.hits.begin(), result.hits.end(), [](const QueryHit& a, const QueryHit& b) {
        return a.similarity != b.similarity ? a.similarity > b.similarity : a.id < b.id;
    });
    if (result.hits.size() > params.limit) {
        result.hits.resize(params.limit);
    }
    result.truncated = expired;

    totalSearches_.fetch_add(1);
    if (expired) {
        truncatedSearches_.fetch_add(1);
        spdlog::debug("[HNSW] Query deadline hit, returning {} partial hits", result.hits.size());
    }
    searchNanos_.fetch_add(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() -
                                                             started)
            .count()));
    return result;
}

Result<IndexEntry> HnswIndex::get(const std::string& id) const {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "HNSW index not initialized"};
    }
    IdShard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.slots.find(id);
    if (it == shard.slots.end()) {
        return Error{ErrorCode::NotFound, "No entry for id " + id};
    }
    const Node& n = *nodes_[it->second];
    return IndexEntry{n.id, n.label, n.vec};
}

bool HnswIndex::contains(const std::string& id) const {
    IdShard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.slots.count(id) != 0;
}

void HnswIndex::forEachEntry(const std::function<void(const IndexEntry&)>& fn) const {
    for (auto& shard : shards_) {
        std::vector<IndexEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(shard.mutex);
            snapshot.reserve(shard.slots.size());
            for (const auto& [id, slot] : shard.slots) {
                const Node& n = *nodes_[slot];
                snapshot.push_back(IndexEntry{n.id, n.label, n.vec});
            }
        }
        for (const auto& entry : snapshot) {
            fn(entry);
        }
    }
}

IndexStats HnswIndex::getStats() const {
    IndexStats stats;
    stats.type = IndexType::HNSW;
    stats.dimension = config_.dimension;
    stats.capacity = config_.max_elements;
    stats.num_vectors = liveCount_.load();
    stats.dead_nodes = deadCount_.load();
    stats.total_inserts = totalInserts_.load();
    stats.total_updates = totalUpdates_.load();
    stats.total_searches = totalSearches_.load();
    stats.truncated_searches = truncatedSearches_.load();
    if (stats.total_searches > 0) {
        stats.avg_search_time_ms = static_cast<double>(searchNanos_.load()) / 1e6 /
                                   static_cast<double>(stats.total_searches);
    }
    {
        std::lock_guard<std::mutex> lock(entryMutex_);
        stats.max_level = hasEntry_ ? static_cast<size_t>(maxLevel_) : 0;
    }

    for (auto& shard : shards_) {
        std::vector<uint32_t> slots;
        {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& [id, slot] : shard.slots) {
                slots.push_back(slot);
            }
        }
        for (uint32_t slot : slots) {
            const Node& n = *nodes_[slot];
            std::lock_guard<std::mutex> lock(n.mutex);
            for (const auto& layer : n.links) {
                stats.edge_count += layer.size();
            }
        }
    }
    return stats;
}

} // namespace namesake::vector
