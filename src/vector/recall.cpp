#include <namesake/vector/recall.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace namesake::vector {

Result<RecallReport> measureRecall(VectorIndex& candidate, VectorIndex& reference,
                                   const std::vector<Embedding>& queries, size_t k) {
    if (k == 0) {
        return Error{ErrorCode::InvalidArgument, "k must be positive"};
    }

    QueryParams params;
    params.threshold = -1.0f;
    params.limit = k;

    RecallReport report;
    report.k = k;
    double total = 0.0;

    for (const auto& q : queries) {
        auto truth = reference.query(q, params);
        if (!truth) {
            return truth.error();
        }
        if (truth.value().hits.empty()) {
            continue;
        }
        auto approx = candidate.query(q, params);
        if (!approx) {
            return approx.error();
        }

        std::unordered_set<std::string> expected;
        for (const auto& hit : truth.value().hits) {
            expected.insert(hit.id);
        }
        size_t found = 0;
        for (const auto& hit : approx.value().hits) {
            found += expected.count(hit.id);
        }

        const double recall = static_cast<double>(found) / static_cast<double>(expected.size());
        total += recall;
        report.min_recall = std::min(report.min_recall, recall);
        ++report.queries;
    }

    if (report.queries > 0) {
        report.mean_recall = total / static_cast<double>(report.queries);
    }
    spdlog::info("[Recall] recall@{} over {} queries: mean={:.4f} min={:.4f}", k,
                 report.queries, report.mean_recall, report.min_recall);
    return report;
}

} // namespace namesake::vector
