#include <namesake/search/candidate.h>

namespace namesake::search {

std::string_view provenanceToString(Provenance p) {
    switch (p) {
        case Provenance::Exact:
            return "exact";
        case Provenance::Semantic:
            return "semantic";
        case Provenance::Both:
            return "both";
    }
    return "unknown";
}

CandidateSet CandidateSet::fromExact(const std::vector<std::string>& ids) {
    CandidateSet set;
    for (const auto& id : ids) {
        set.candidates_.try_emplace(id, Candidate{id, Provenance::Exact, std::nullopt});
    }
    return set;
}

void CandidateSet::put(Candidate candidate) {
    auto key = candidate.id;
    candidates_.insert_or_assign(std::move(key), std::move(candidate));
}

const Candidate* CandidateSet::find(const std::string& id) const {
    auto it = candidates_.find(id);
    return it == candidates_.end() ? nullptr : &it->second;
}

size_t CandidateSet::count(Provenance p) const {
    size_t n = 0;
    for (const auto& [id, c] : candidates_) {
        if (c.provenance == p) {
            ++n;
        }
    }
    return n;
}

} // namespace namesake::search
