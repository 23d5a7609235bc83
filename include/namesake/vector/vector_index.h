#pragma once

#include <namesake/core/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace namesake::vector {

/**
 * Types of vector indices supported
 */
enum class IndexType {
    FLAT, // Exact brute-force search
    HNSW  // Hierarchical Navigable Small World
};

/**
 * Configuration for vector index
 */
struct IndexConfig {
    IndexType type = IndexType::HNSW;
    size_t dimension = DEFAULT_EMBEDDING_DIM;

    // HNSW parameters
    size_t hnsw_m = 16;                // Number of connections per node (2*M at layer 0)
    size_t hnsw_ef_construction = 200; // Construction time accuracy
    size_t hnsw_ef_search = 100;       // Search time accuracy
    size_t hnsw_seed = 100;            // Random seed for level assignment

    size_t max_elements = 1000000; // Maximum capacity (including replaced nodes)
};

/**
 * (identifier, canonical name, embedding) triple held by an index
 */
struct IndexEntry {
    std::string id;
    std::string label;
    Embedding vector;
};

struct QueryParams {
    float threshold = 0.75f; // minimum cosine similarity, inclusive
    size_t limit = 10;
    std::optional<Deadline> deadline;
};

struct QueryHit {
    std::string id;
    std::string label;
    float similarity = 0.0f;
};

/**
 * Hits in descending similarity order. `truncated` is set when the deadline expired during
 * traversal and the hits are the best found so far.
 */
struct QueryResult {
    std::vector<QueryHit> hits;
    bool truncated = false;
};

/**
 * Statistics for vector index
 */
struct IndexStats {
    IndexType type = IndexType::FLAT;
    size_t dimension = 0;
    size_t num_vectors = 0; // live entries
    size_t dead_nodes = 0;  // replaced or removed nodes still used for routing
    size_t capacity = 0;
    size_t max_level = 0;
    size_t edge_count = 0;

    size_t total_inserts = 0;
    size_t total_updates = 0;
    size_t total_searches = 0;
    size_t truncated_searches = 0;
    double avg_search_time_ms = 0.0;
};

/**
 * Base class for vector indices.
 *
 * Similarity is cosine on the raw vectors. Every operation validates dimension and rejects
 * zero-norm or non-finite vectors. All operations may be called concurrently.
 */
class VectorIndex {
public:
    explicit VectorIndex(const IndexConfig& config) : config_(config) {}
    virtual ~VectorIndex() = default;

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Allocates storage; operations before this return IndexUnavailable
    virtual Result<void> initialize() = 0;
    virtual bool isInitialized() const = 0;

    /**
     * Insert or replace the entry for entry.id. Re-inserting an identical (label, vector)
     * pair is a no-op.
     */
    virtual Result<void> upsert(const IndexEntry& entry) = 0;
    virtual Result<void> remove(const std::string& id) = 0;

    virtual Result<QueryResult> query(const Embedding& query, const QueryParams& params) = 0;

    virtual Result<IndexEntry> get(const std::string& id) const = 0;
    virtual bool contains(const std::string& id) const = 0;

    // Number of live entries
    virtual size_t size() const = 0;

    // Visits a snapshot of all live entries, in no particular order
    virtual void forEachEntry(const std::function<void(const IndexEntry&)>& fn) const = 0;

    virtual IndexStats getStats() const = 0;

    size_t dimension() const { return config_.dimension; }
    IndexType type() const { return config_.type; }
    const IndexConfig& getConfig() const { return config_; }

protected:
    IndexConfig config_;
};

/**
 * Factory function for creating specific index types
 */
std::unique_ptr<VectorIndex> createVectorIndex(const IndexConfig& config);

std::string indexTypeToString(IndexType type);

/**
 * Utility functions for vector operations
 */
namespace vector_utils {

// Accumulates in double so large or tiny components neither overflow nor flush to zero
double dot(const float* a, const float* b, size_t n);
float norm(const Embedding& v);

/**
 * Cosine similarity from precomputed norms; both norms must be non-zero.
 * Computed in double and clamped to [-1, 1].
 */
float cosineSimilarity(const Embedding& a, float normA, const Embedding& b, float normB);
float cosineSimilarity(const Embedding& a, const Embedding& b);

/**
 * Checks length against `dimension` and rejects zero, subnormal or non-finite norms.
 * Returns the norm on success.
 */
Result<float> validate(const Embedding& v, size_t dimension);

} // namespace vector_utils

} // namespace namesake::vector
