#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace namesake::search {

/**
 * Which candidate generator proposed an identifier
 */
enum class Provenance { Exact, Semantic, Both };

std::string_view provenanceToString(Provenance p);

struct Candidate {
    std::string id;
    Provenance provenance = Provenance::Exact;
    std::optional<float> similarity; // semantic cosine score, absent for exact-only

    bool operator==(const Candidate&) const = default;
};

/**
 * Candidates keyed by identifier. Iteration order is by identifier and carries no ranking.
 */
class CandidateSet {
public:
    using Container = std::map<std::string, Candidate>;
    using const_iterator = Container::const_iterator;

    CandidateSet() = default;

    // Set of exact/phonetic candidates, one per distinct identifier
    static CandidateSet fromExact(const std::vector<std::string>& ids);

    // Inserts or replaces the candidate stored under candidate.id
    void put(Candidate candidate);

    const Candidate* find(const std::string& id) const;
    bool contains(const std::string& id) const { return candidates_.count(id) != 0; }
    size_t size() const { return candidates_.size(); }
    bool empty() const { return candidates_.empty(); }

    const_iterator begin() const { return candidates_.begin(); }
    const_iterator end() const { return candidates_.end(); }

    size_t count(Provenance p) const;

    bool operator==(const CandidateSet&) const = default;

private:
    Container candidates_;
};

} // namespace namesake::search
