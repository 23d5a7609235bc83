#pragma once

#include <namesake/core/types.h>
#include <namesake/record/record.h>
#include <namesake/search/candidate.h>

#include <optional>
#include <string>
#include <string_view>

namespace namesake::pipeline {

/**
 * Per-item progress: Received -> NameExtracted | NoNameSkip -> Embedded | EmbedFailed ->
 * Indexed | IndexFailed | StoreFailed (ingestion) or Merged | QueryFailed (query).
 *
 * StoreFailed means the index accepted the entry but the durable store did not, so the entry
 * will be missing after a rebuild. A NoNameSkip item whose stale entry cannot be dropped ends
 * in IndexFailed.
 */
enum class PipelineState {
    Received,
    NameExtracted,
    NoNameSkip,
    Embedded,
    EmbedFailed,
    Indexed,
    IndexFailed,
    StoreFailed,
    Merged,
    QueryFailed
};

std::string_view stateToString(PipelineState state);

// True for states that end an item's processing
bool isTerminal(PipelineState state);

struct PipelineConfig {
    size_t worker_threads = 0;      // 0 = hardware concurrency
    size_t index_retries = 3;       // retries of IndexUnavailable
    size_t retry_backoff_ms = 50;   // doubled per retry
};

struct QueryConfig {
    float threshold = 0.75f;
    size_t limit = 10;
    size_t timeout_ms = 0; // 0 = no deadline
};

struct IngestOutcome {
    record::RecordKey key;
    PipelineState state = PipelineState::Received;
    std::optional<std::string> canonicalName;
    std::optional<Error> error; // set for EmbedFailed, IndexFailed and StoreFailed
};

struct SearchRequest {
    record::Record record;
    search::CandidateSet exact;
    std::optional<float> threshold;
    std::optional<size_t> limit;
    std::optional<Deadline> deadline;
};

struct SearchOutcome {
    record::RecordKey key;
    PipelineState state = PipelineState::Received;
    std::optional<std::string> canonicalName;
    search::CandidateSet candidates; // always contains the exact set
    bool truncated = false;          // semantic stage hit its deadline
    std::optional<Error> error;      // set for EmbedFailed and QueryFailed
};

} // namespace namesake::pipeline
