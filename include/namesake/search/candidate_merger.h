#pragma once

#include <namesake/search/candidate.h>
#include <namesake/vector/vector_index.h>

#include <vector>

namespace namesake::search {

/**
 * Union of an exact candidate set with semantic index hits, keyed by identifier.
 *
 * An identifier found by both generators becomes Both and keeps its semantic score. Hits for
 * identifiers not in the exact set are added as Semantic. When an identifier is hit more
 * than once the highest score is kept. Merging with no hits returns the exact set unchanged.
 */
class CandidateMerger {
public:
    static CandidateSet merge(const CandidateSet& exact,
                              const std::vector<vector::QueryHit>& semantic);
};

} // namespace namesake::search
