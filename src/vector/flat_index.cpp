#include <namesake/vector/flat_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <mutex>

namespace namesake::vector {

FlatIndex::FlatIndex(const IndexConfig& config) : VectorIndex(config) {
    config_.type = IndexType::FLAT;
}

Result<void> FlatIndex::initialize() {
    if (config_.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "Index dimension must be positive"};
    }
    {
        std::unique_lock lock(mutex_);
        entries_.reserve(std::min<size_t>(config_.max_elements, 65536));
    }
    initialized_.store(true, std::memory_order_release);
    spdlog::debug("[Flat] Initialized (dim={})", config_.dimension);
    return Result<void>();
}

Result<void> FlatIndex::upsert(const IndexEntry& entry) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "Flat index not initialized"};
    }
    auto norm = vector_utils::validate(entry.vector, config_.dimension);
    if (!norm) {
        return norm.error();
    }

    std::unique_lock lock(mutex_);
    auto it = entries_.find(entry.id);
    if (it == entries_.end()) {
        if (entries_.size() >= config_.max_elements) {
            return Error{ErrorCode::ResourceExhausted, "Flat index full"};
        }
        entries_.emplace(entry.id, Stored{entry.label, entry.vector, norm.value()});
        totalInserts_.fetch_add(1);
    } else {
        it->second = Stored{entry.label, entry.vector, norm.value()};
        totalUpdates_.fetch_add(1);
    }
    return Result<void>();
}

Result<void> FlatIndex::remove(const std::string& id) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "Flat index not initialized"};
    }
    std::unique_lock lock(mutex_);
    if (entries_.erase(id) == 0) {
        return Error{ErrorCode::NotFound, "No entry for id " + id};
    }
    return Result<void>();
}

Result<QueryResult> FlatIndex::query(const Embedding& query, const QueryParams& params) {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "Flat index not initialized"};
    }
    auto norm = vector_utils::validate(query, config_.dimension);
    if (!norm) {
        return norm.error();
    }
    if (params.deadline && std::chrono::steady_clock::now() >= *params.deadline) {
        return Error{ErrorCode::Timeout, "Query deadline expired before scan"};
    }

    QueryResult result;
    if (params.limit == 0) {
        return result;
    }

    {
        std::shared_lock lock(mutex_);
        size_t scanned = 0;
        for (const auto& [id, stored] : entries_) {
            if (params.deadline && (++scanned % 1024) == 0 &&
                std::chrono::steady_clock::now() >= *params.deadline) {
                result.truncated = true;
                break;
            }
            float similarity =
                vector_utils::cosineSimilarity(query, norm.value(), stored.vec, stored.norm);
            if (similarity >= params.threshold) {
                result.hits.push_back(QueryHit{id, stored.label, similarity});
            }
        }
    }

    auto byScore = [](const QueryHit& a, const QueryHit& b) {
        return a.similarity != b.similarity ? a.similarity > b.similarity : a.id < b.id;
    };
    if (result.hits.size() > params.limit) {
        std::partial_sort(result.hits.begin(),
                          result.hits.begin() + static_cast<std::ptrdiff_t>(params.limit),
                          result.hits.end(), byScore);
        result.hits.resize(params.limit);
    } else {
        std::sort(result.hits.begin(), result.hits.end(), byScore);
    }

    totalSearches_.fetch_add(1);
    if (result.truncated) {
        truncatedSearches_.fetch_add(1);
    }
    return result;
}

Result<IndexEntry> FlatIndex::get(const std::string& id) const {
    if (!isInitialized()) {
        return Error{ErrorCode::IndexUnavailable, "Flat index not initialized"};
    }
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "No entry for id " + id};
    }
    return IndexEntry{id, it->second.label, it->second.vec};
}

bool FlatIndex::contains(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return entries_.count(id) != 0;
}

size_t FlatIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void FlatIndex::forEachEntry(const std::function<void(const IndexEntry&)>& fn) const {
    std::vector<IndexEntry> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [id, stored] : entries_) {
            snapshot.push_back(IndexEntry{id, stored.label, stored.vec});
        }
    }
    for (const auto& entry : snapshot) {
        fn(entry);
    }
}

IndexStats FlatIndex::getStats() const {
    IndexStats stats;
    stats.type = IndexType::FLAT;
    stats.dimension = config_.dimension;
    stats.capacity = config_.max_elements;
    stats.num_vectors = size();
    stats.total_inserts = totalInserts_.load();
    stats.total_updates = totalUpdates_.load();
    stats.total_searches = totalSearches_.load();
    stats.truncated_searches = truncatedSearches_.load();
    return stats;
}

} // namespace namesake::vector
