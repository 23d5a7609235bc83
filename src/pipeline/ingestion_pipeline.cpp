#include <namesake/pipeline/index_retry.h>
#include <namesake/pipeline/ingestion_pipeline.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <thread>
#include <unordered_map>

namespace namesake::pipeline {

namespace {

constexpr size_t kNoSlot = static_cast<size_t>(-1);

} // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<ml::EmbeddingService> embeddings,
                                     std::shared_ptr<vector::VectorIndex> index,
                                     PipelineConfig config, extraction::NameExtractor extractor,
                                     std::shared_ptr<storage::IDurableStore> store)
    : embeddings_(std::move(embeddings)), index_(std::move(index)), config_(config),
      extractor_(extractor), store_(std::move(store)) {
    size_t threads = config_.worker_threads;
    if (threads == 0) {
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads);
    spdlog::debug("[Ingest] Pipeline ready with {} workers", threads);
}

IngestionPipeline::~IngestionPipeline() {
    if (pool_) {
        pool_->join();
    }
}

IngestOutcome IngestionPipeline::ingest(const record::Record& record) {
    return std::move(ingestBatch({record}).front());
}

std::vector<IngestOutcome>
IngestionPipeline::ingestBatch(const std::vector<record::Record>& records) {
    std::vector<IngestOutcome> outcomes(records.size());
    std::vector<size_t> vectorSlot(records.size(), kNoSlot);
    std::vector<std::string> names;

    for (size_t i = 0; i < records.size(); ++i) {
        auto& outcome = outcomes[i];
        outcome.key = records[i].key;
        outcome.state = PipelineState::Received;

        std::optional<std::string> name;
        if (records[i].root) {
            name = extractor_.extract(*records[i].root);
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
    for (size_t i = 0; i < records.size(); ++i) {
        if (vectorSlot[i] == kNoSlot) {
            continue;
        }
        const auto& v = vectors[vectorSlot[i]];
        if (v) {
            outcomes[i].state = PipelineState::Embedded;
        } else {
            outcomes[i].state = PipelineState::EmbedFailed;
            outcomes[i].error = v.error();
            spdlog::warn("[Ingest] Embedding failed for {} ('{}'): {}", outcomes[i].key.str(),
                         *outcomes[i].canonicalName, v.error().message);
        }
    }

    // Items touching the same identifier run in submission order on one worker
    std::unordered_map<std::string, size_t> groupOf;
    std::vector<std::vector<size_t>> groups;
    for (size_t i = 0; i < records.size(); ++i) {
        if (outcomes[i].state != PipelineState::Embedded &&
            outcomes[i].state != PipelineState::NoNameSkip) {
            continue;
        }
        auto [it, inserted] = groupOf.try_emplace(outcomes[i].key.str(), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(i);
    }

    std::vector<std::future<void>> pending;
    pending.reserve(groups.size());
    for (const auto& group : groups) {
        auto task = std::make_shared<std::packaged_task<void()>>([&, group]() {
            applyGroup(group, records, outcomes, vectors, vectorSlot);
        });
        pending.push_back(task->get_future());
        boost::asio::post(*pool_, [task]() { (*task)(); });
    }
    for (auto& f : pending) {
        f.get();
    }

    for (const auto& outcome : outcomes) {
        account(outcome);
    }
    return outcomes;
}

void IngestionPipeline::applyGroup(const std::vector<size_t>& items,
                                   const std::vector<record::Record>& records,
                                   std::vector<IngestOutcome>& outcomes,
                                   std::vector<Result<Embedding>>& vectors,
                                   const std::vector<size_t>& vectorSlot) {
    for (size_t i : items) {
        auto& outcome = outcomes[i];
        const std::string id = records[i].key.str();

        if (outcome.state == PipelineState::NoNameSkip) {
            if (!index_->contains(id)) {
                continue;
            }
            auto removed = withIndexRetry(config_, id, [&]() { return index_->remove(id); });
            if (!removed && removed.error().code != ErrorCode::NotFound) {
                outcome.state = PipelineState::IndexFailed;
                outcome.error = removed.error();
                spdlog::warn("[Ingest] Could not drop stale entry {}: {}", id,
                             removed.error().message);
                continue;
            }
            if (store_) {
                if (auto r = store_->appendRemoval(id); !r) {
                    outcome.state = PipelineState::StoreFailed;
                    outcome.error = r.error();
                    spdlog::warn("[Ingest] Entry store removal failed for {}: {}", id,
                                 r.error().message);
                }
            }
            continue;
        }

        vector::IndexEntry entry{id, *outcome.canonicalName,
                                 std::move(vectors[vectorSlot[i]]).value()};
        auto inserted = withIndexRetry(config_, id, [&]() { return index_->upsert(entry); });
        if (!inserted) {
            outcome.state = PipelineState::IndexFailed;
            outcome.error = inserted.error();
            spdlog::warn("[Ingest] Index insert failed for {}: {}", id, inserted.error().message);
            continue;
        }
        outcome.state = PipelineState::Indexed;

        if (store_) {
            if (auto r = store_->append(entry); !r) {
                outcome.state = PipelineState::StoreFailed;
                outcome.error = r.error();
                spdlog::warn("[Ingest] Entry store append failed for {}: {}", id,
                             r.error().message);
            }
        }
    }
}

void IngestionPipeline::account(const IngestOutcome& outcome) {
    switch (outcome.state) {
        case PipelineState::Indexed:
            indexed_.fetch_add(1);
            break;
        case PipelineState::NoNameSkip:
            skipped_.fetch_add(1);
            break;
        case PipelineState::EmbedFailed:
            embedFailed_.fetch_add(1);
            break;
        case PipelineState::IndexFailed:
            indexFailed_.fetch_add(1);
            break;
        case PipelineState::StoreFailed:
            storeFailed_.fetch_add(1);
            break;
        default:
            break;
    }
    const size_t n = received_.fetch_add(1) + 1;
    if (n % PROGRESS_INTERVAL == 0) {
        spdlog::info("[Ingest] {} records processed ({} indexed, {} skipped, {} failed)", n,
                     indexed_.load(), skipped_.load(),
                     embedFailed_.load() + indexFailed_.load() + storeFailed_.load());
    }
}

IngestStats IngestionPipeline::stats() const {
    IngestStats s;
    s.received = received_.load();
    s.indexed = indexed_.load();
    s.skipped = skipped_.load();
    s.embed_failed = embedFailed_.load();
    s.index_failed = indexFailed_.load();
    s.store_failed = storeFailed_.load();
    return s;
}

} // namespace namesake::pipeline
