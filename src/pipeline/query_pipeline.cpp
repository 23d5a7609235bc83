#include <namesake/pipeline/index_retry.h>
#include <namesake/pipeline/query_pipeline.h>
#include <namesake/search/candidate_merger.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace namesake::pipeline {

namespace {

constexpr size_t kNoSlot = static_cast<size_t>(-1);

} // namespace

QueryPipeline::QueryPipeline(std::shared_ptr<ml::EmbeddingService> embeddings,
                             std::shared_ptr<vector::VectorIndex> index, QueryConfig query,
                             PipelineConfig config, extraction::NameExtractor extractor)
    : embeddings_(std::move(embeddings)), index_(std::move(index)), query_(query),
      config_(config), extractor_(extractor) {
    size_t threads = config_.worker_threads;
    if (threads == 0) {
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads);
}

QueryPipeline::~QueryPipeline() {
    if (pool_) {
        pool_->join();
    }
}

SearchOutcome QueryPipeline::search(const SearchRequest& request) {
    return std::move(searchBatch({request}).front());
}

std::vector<SearchOutcome> QueryPipeline::searchBatch(const std::vector<SearchRequest>& requests) {
    std::vector<SearchOutcome> outcomes(requests.size());
    std::vector<size_t> vectorSlot(requests.size(), kNoSlot);
    std::vector<std::string> names;

    for (size_t i = 0; i < requests.size(); ++i) {
        auto& outcome = outcomes[i];
        outcome.key = requests[i].record.key;
        outcome.candidates = requests[i].exact;

        std::optional<std::string> name;
        if (requests[i].record.root) {
            name = extractor_.extract(*requests[i].record.root);
        }
        if (!name) {
            outcome.state = PipelineState::NoNameSkip;
            continue;
        }
        outcome.state = PipelineState::NameExtracted;
        outcome.canonicalName = name;
        vectorSlot[i] = names.size();
        names.push_back(std::move(*name));
    }

    auto vectors = embeddings_->embedBatch(names);

    std::vector<std::future<void>> pending;
    for (size_t i = 0; i < requests.size(); ++i) {
        if (vectorSlot[i] == kNoSlot) {
            continue;
        }
        auto& outcome = outcomes[i];
        const auto& v = vectors[vectorSlot[i]];
        if (!v) {
            outcome.state = PipelineState::EmbedFailed;
            outcome.error = v.error();
            spdlog::warn("[Query] Embedding failed for {} ('{}'): {}", outcome.key.str(),
                         *outcome.canonicalName, v.error().message);
            continue;
        }
        outcome.state = PipelineState::Embedded;

        auto task = std::make_shared<std::packaged_task<void()>>(
            [this, &request = requests[i], &outcome, &embedding = v.value()]() {
                runQuery(request, outcome, embedding);
            });
        pending.push_back(task->get_future());
        boost::asio::post(*pool_, [task]() { (*task)(); });
    }
    for (auto& f : pending) {
        f.get();
    }
    return outcomes;
}

void QueryPipeline::runQuery(const SearchRequest& request, SearchOutcome& outcome,
                             const Embedding& embedding) {
    vector::QueryParams params;
    params.threshold = request.threshold.value_or(query_.threshold);
    params.limit = request.limit.value_or(query_.limit);
    if (request.deadline) {
        params.deadline = request.deadline;
    } else if (query_.timeout_ms > 0) {
        params.deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(query_.timeout_ms);
    }

    const std::string id = outcome.key.str();
    auto result = withIndexRetry(config_, id, [&]() { return index_->query(embedding, params); });
    if (!result) {
        outcome.state = PipelineState::QueryFailed;
        outcome.error = result.error();
        spdlog::warn("[Query] Index query failed for {}: {}", id, result.error().message);
        return;
    }

    const auto& hits = result.value().hits;
    outcome.truncated = result.value().truncated;
    outcome.candidates = search::CandidateMerger::merge(request.exact, hits);
    outcome.state = PipelineState::Merged;
    spdlog::debug("[Query] {} '{}': {} semantic hits, {} candidates{}", id,
                  *outcome.canonicalName, hits.size(), outcome.candidates.size(),
                  outcome.truncated ? " (truncated)" : "");
}

Result<Resolution> QueryPipeline::resolve(const SearchRequest& request,
                                          search::IResolutionEngine& engine) {
    Resolution resolution;
    resolution.outcome = search(request);
    auto matches = engine.scoreCandidates(resolution.outcome.candidates);
    if (!matches) {
        return Error{matches.error().code, "Resolution engine failed for " +
                                               resolution.outcome.key.str() + ": " +
                                               matches.error().message};
    }
    resolution.matches = std::move(matches).value();
    return resolution;
}

} // namespace namesake::pipeline
