#include <namesake/search/candidate_merger.h>

#include <algorithm>

namespace namesake::search {

CandidateSet CandidateMerger::merge(const CandidateSet& exact,
                                    const std::vector<vector::QueryHit>& semantic) {
    CandidateSet merged = exact;
    for (const auto& hit : semantic) {
        const Candidate* existing = merged.find(hit.id);
        if (existing == nullptr) {
            merged.put(Candidate{hit.id, Provenance::Semantic, hit.similarity});
            continue;
        }

        Candidate updated = *existing;
        if (updated.provenance == Provenance::Exact) {
            updated.provenance = Provenance::Both;
        }
        updated.similarity = updated.similarity ? std::max(*updated.similarity, hit.similarity)
                                                : hit.similarity;
        merged.put(std::move(updated));
    }
    return merged;
}

} // namespace namesake::search
