#pragma once

#include <namesake/core/types.h>
#include <namesake/search/candidate.h>

#include <string>
#include <vector>

namespace namesake::search {

struct Match {
    std::string id;
    double score = 0.0;
    std::string reason; // engine-specific explanation, e.g. the rule that fired
};

/**
 * External entity-resolution scorer. Receives the merged candidate set of one search and
 * decides which candidates resolve to the searched entity.
 */
class IResolutionEngine {
public:
    virtual ~IResolutionEngine() = default;

    virtual Result<std::vector<Match>> scoreCandidates(const CandidateSet& candidates) = 0;
};

} // namespace namesake::search
