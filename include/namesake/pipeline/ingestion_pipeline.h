#pragma once

#include <namesake/extraction/name_extractor.h>
#include <namesake/ml/embedding_service.h>
#include <namesake/pipeline/pipeline_types.h>
#include <namesake/storage/entry_store.h>
#include <namesake/vector/vector_index.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <memory>
#include <vector>

namespace namesake::pipeline {

struct IngestStats {
    size_t received = 0;
    size_t indexed = 0;
    size_t skipped = 0; // NoNameSkip
    size_t embed_failed = 0;
    size_t index_failed = 0;
    size_t store_failed = 0;
};

/**
 * Record ingestion: extract the canonical name, embed it and upsert (id, name, embedding)
 * into the vector index.
 *
 * Ingestion is idempotent per record identifier. Within one batch, items sharing an
 * identifier are applied in submission order; different identifiers are indexed in
 * parallel. A record that no longer yields a name removes any earlier entry for its id.
 * Failures are reported per item and never affect sibling items.
 */
class IngestionPipeline {
public:
    IngestionPipeline(std::shared_ptr<ml::EmbeddingService> embeddings,
                      std::shared_ptr<vector::VectorIndex> index, PipelineConfig config = {},
                      extraction::NameExtractor extractor = extraction::NameExtractor{},
                      std::shared_ptr<storage::IDurableStore> store = nullptr);
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    IngestOutcome ingest(const record::Record& record);

    // One outcome per record, in input order
    std::vector<IngestOutcome> ingestBatch(const std::vector<record::Record>& records);

    IngestStats stats() const;

private:
    void applyGroup(const std::vector<size_t>& items, const std::vector<record::Record>& records,
                    std::vector<IngestOutcome>& outcomes, std::vector<Result<Embedding>>& vectors,
                    const std::vector<size_t>& vectorSlot);
    void account(const IngestOutcome& outcome);

    std::shared_ptr<ml::EmbeddingService> embeddings_;
    std::shared_ptr<vector::VectorIndex> index_;
    PipelineConfig config_;
    extraction::NameExtractor extractor_;
    std::shared_ptr<storage::IDurableStore> store_;
    std::unique_ptr<boost::asio::thread_pool> pool_;

    std::atomic<size_t> received_{0};
    std::atomic<size_t> indexed_{0};
    std::atomic<size_t> skipped_{0};
    std::atomic<size_t> embedFailed_{0};
    std::atomic<size_t> indexFailed_{0};
    std::atomic<size_t> storeFailed_{0};
};

} // namespace namesake::pipeline
