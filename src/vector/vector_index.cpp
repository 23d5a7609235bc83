#include <namesake/vector/flat_index.h>
#include <namesake/vector/hnsw_index.h>
#include <namesake/vector/vector_index.h>

#include <algorithm>
#include <cmath>

namespace namesake::vector {

std::unique_ptr<VectorIndex> createVectorIndex(const IndexConfig& config) {
    switch (config.type) {
        case IndexType::FLAT:
            return std::make_unique<FlatIndex>(config);
        case IndexType::HNSW:
            return std::make_unique<HnswIndex>(config);
    }
    return nullptr;
}

std::string indexTypeToString(IndexType type) {
    switch (type) {
        case IndexType::FLAT:
            return "FLAT";
        case IndexType::HNSW:
            return "HNSW";
    }
    return "UNKNOWN";
}

namespace vector_utils {

double dot(const float* a, const float* b, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return sum;
}

float norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

float cosineSimilarity(const Embedding& a, float normA, const Embedding& b, float normB) {
    const double cosine = dot(a.data(), b.data(), std::min(a.size(), b.size())) /
                          (static_cast<double>(normA) * static_cast<double>(normB));
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

float cosineSimilarity(const Embedding& a, const Embedding& b) {
    const float na = norm(a);
    const float nb = norm(b);
    if (na == 0.0f || nb == 0.0f) {
        return 0.0f;
    }
    return cosineSimilarity(a, na, b, nb);
}

Result<float> validate(const Embedding& v, size_t dimension) {
    if (v.size() != dimension) {
        return Error{ErrorCode::DimensionMismatch, "Expected " + std::to_string(dimension) +
                                                       " dimensions, got " +
                                                       std::to_string(v.size())};
    }
    const float n = norm(v);
    // Subnormal norms lose too much precision to divide by
    if (!std::isnormal(n)) {
        return Error{ErrorCode::DegenerateVector, "Vector has zero, subnormal or non-finite norm"};
    }
    return n;
}

} // namespace vector_utils

} // namespace namesake::vector
