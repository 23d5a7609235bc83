#pragma once

#include <namesake/extraction/name_extractor.h>
#include <namesake/ml/embedding_service.h>
#include <namesake/pipeline/pipeline_types.h>
#include <namesake/search/resolution_engine.h>
#include <namesake/vector/vector_index.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <vector>

namespace namesake::pipeline {

struct Resolution {
    SearchOutcome outcome;
    std::vector<search::Match> matches;
};

/**
 * Search requests: extract the canonical name, embed it, query the vector index and merge the
 * hits into the caller's exact candidate set.
 *
 * The outcome always carries the exact candidates. When no name can be derived, or the
 * embedding or index stage fails, the exact set is returned as is together with the
 * terminal state and error.
 */
class QueryPipeline {
public:
    QueryPipeline(std::shared_ptr<ml::EmbeddingService> embeddings,
                  std::shared_ptr<vector::VectorIndex> index, QueryConfig query = {},
                  PipelineConfig config = {},
                  extraction::NameExtractor extractor = extraction::NameExtractor{});
    ~QueryPipeline();

    QueryPipeline(const QueryPipeline&) = delete;
    QueryPipeline& operator=(const QueryPipeline&) = delete;

    SearchOutcome search(const SearchRequest& request);

    // One outcome per request, in input order; requests are queried in parallel
    std::vector<SearchOutcome> searchBatch(const std::vector<SearchRequest>& requests);

    /**
     * Run the search and hand the merged candidate set to the resolution engine.
     */
    Result<Resolution> resolve(const SearchRequest& request, search::IResolutionEngine& engine);

    const QueryConfig& getQueryConfig() const { return query_; }

private:
    void runQuery(const SearchRequest& request, SearchOutcome& outcome, const Embedding& embedding);

    std::shared_ptr<ml::EmbeddingService> embeddings_;
    std::shared_ptr<vector::VectorIndex> index_;
    QueryConfig query_;
    PipelineConfig config_;
    extraction::NameExtractor extractor_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace namesake::pipeline
