#pragma once

#include <namesake/core/types.h>
#include <namesake/pipeline/pipeline_types.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace namesake::pipeline {

/**
 * Runs an index operation, retrying with exponential backoff while the index reports
 * IndexUnavailable. Any other error is returned immediately.
 */
template <typename Fn>
auto withIndexRetry(const PipelineConfig& config, const std::string& id, Fn&& op)
    -> decltype(op()) {
    auto result = op();
    auto backoff = std::chrono::milliseconds(config.retry_backoff_ms);
    for (size_t attempt = 0; attempt < config.index_retries; ++attempt) {
        if (result || result.error().code != ErrorCode::IndexUnavailable) {
            break;
        }
        spdlog::debug("[Pipeline] Index unavailable for {}, retry {}/{} in {}ms", id, attempt + 1,
                      config.index_retries, backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
        result = op();
    }
    return result;
}

} // namespace namesake::pipeline
