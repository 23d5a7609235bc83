#pragma once

#include <namesake/vector/vector_index.h>

namespace namesake::vector {

struct RecallReport {
    size_t queries = 0;
    size_t k = 0;
    double mean_recall = 0.0;
    double min_recall = 1.0;
};

/**
 * recall@k of `candidate` against `reference` (normally a FlatIndex over the same entries).
 * Queries run with threshold -1 so only the ranking is compared. Queries for which the
 * reference returns nothing are skipped.
 */
Result<RecallReport> measureRecall(VectorIndex& candidate, VectorIndex& reference,
                                   const std::vector<Embedding>& queries, size_t k);

} // namespace namesake::vector
