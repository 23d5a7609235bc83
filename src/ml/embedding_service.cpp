#include <namesake/ml/embedding_service.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace namesake::ml {

namespace {

DynamicBatcherConfig batcherConfigFor(const EmbeddingConfig& config) {
    DynamicBatcherConfig cfg;
    cfg.maxSequenceLengthTokens = std::max<size_t>(config.max_sequence_length, 16);
    cfg.advisoryDocCap = config.batch_size;
    return cfg;
}

bool isTransient(const Error& error) {
    return error.code == ErrorCode::Timeout || error.code == ErrorCode::ResourceExhausted ||
           error.code == ErrorCode::InternalError;
}

} // namespace

Result<std::unique_ptr<EmbeddingService>> EmbeddingService::create(const EmbeddingConfig& config) {
    auto provider = createEmbeddingProvider(config);
    if (!provider) {
        return Error{ErrorCode::NotSupported, "Unknown embedding provider: " + config.provider};
    }
    auto service = std::make_unique<EmbeddingService>(std::move(provider), config);
    if (auto r = service->start(); !r) {
        return r.error();
    }
    return service;
}

EmbeddingService::EmbeddingService(std::unique_ptr<IEmbeddingProvider> provider,
                                   const EmbeddingConfig& config)
    : config_(config), provider_(std::move(provider)), dimension_(config.embedding_dim),
      batcher_(batcherConfigFor(config)) {
    size_t threads = config_.threads;
    if (threads == 0) {
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads);
}

EmbeddingService::~EmbeddingService() {
    if (pool_) {
        pool_->join();
    }
    if (provider_ && started_) {
        provider_->shutdown();
    }
}

Result<void> EmbeddingService::start() {
    if (started_) {
        return Result<void>();
    }
    if (!provider_) {
        return Error{ErrorCode::NotInitialized, "No embedding provider"};
    }
    if (auto r = provider_->initialize(); !r) {
        spdlog::error("[Embedding] Failed to initialize provider '{}': {}",
                      provider_->getProviderName(), r.error().message);
        return r;
    }
    dimension_ = provider_->getEmbeddingDimension();
    started_ = true;
    spdlog::info("[Embedding] Provider '{}' ready (dim={}, batch={})",
                 provider_->getProviderName(), dimension_, config_.batch_size);
    return Result<void>();
}

std::string EmbeddingService::providerName() const {
    return provider_ ? provider_->getProviderName() : std::string{};
}

Result<Embedding> EmbeddingService::checkDimension(Result<Embedding> result) const {
    if (!result) {
        return result;
    }
    const auto& v = result.value();
    if (v.size() != dimension_) {
        return Error{ErrorCode::DimensionMismatch, "Provider returned " + std::to_string(v.size()) +
                                                       " dimensions, expected " +
                                                       std::to_string(dimension_)};
    }
    for (float x : v) {
        if (!std::isfinite(x)) {
            return Error{ErrorCode::EmbeddingFailure, "Provider returned non-finite values"};
        }
    }
    return result;
}

Result<Embedding> EmbeddingService::runSingle(const std::string& name) {
    Result<Embedding> result = Error{ErrorCode::EmbeddingFailure};
    for (size_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            batchmetrics::record_retry();
        }
        try {
            result = checkDimension(provider_->generateEmbedding(name));
        } catch (const std::exception& e) {
            result = Error{ErrorCode::InternalError, std::string("Provider threw: ") + e.what()};
        }
        if (result || !isTransient(result.error())) {
            break;
        }
    }
    return result;
}

std::vector<Result<Embedding>> EmbeddingService::runBatch(const std::vector<std::string>& names) {
    std::vector<Result<Embedding>> out;
    bool wholeBatchFailed = false;
    try {
        out = provider_->generateBatchEmbeddings(names);
        wholeBatchFailed = out.size() != names.size();
    } catch (const std::exception& e) {
        spdlog::warn("[Embedding] Batch of {} failed: {}", names.size(), e.what());
        wholeBatchFailed = true;
    }

    if (wholeBatchFailed) {
        {
            std::lock_guard<std::mutex> lock(batcherMutex_);
            batcher_.onFailure();
        }
        batchmetrics::record_item_fallback();
        out.clear();
        out.reserve(names.size());
        for (const auto& name : names) {
            out.push_back(runSingle(name));
        }
        return out;
    }

    {
        std::lock_guard<std::mutex> lock(batcherMutex_);
        batcher_.onSuccess(names.size());
    }
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i]) {
            out[i] = checkDimension(std::move(out[i]));
        } else if (isTransient(out[i].error())) {
            out[i] = runSingle(names[i]);
        }
    }
    return out;
}

Result<Embedding> EmbeddingService::embed(const std::string& name) {
    if (!started_) {
        return Error{ErrorCode::NotInitialized, "Embedding service not started"};
    }
    return runSingle(name);
}

std::vector<Result<Embedding>> EmbeddingService::embedBatch(const std::vector<std::string>& names) {
    std::vector<Result<Embedding>> results;
    results.reserve(names.size());
    if (!started_) {
        for (size_t i = 0; i < names.size(); ++i) {
            results.emplace_back(Error{ErrorCode::NotInitialized, "Embedding service not started"});
        }
        return results;
    }

    std::vector<std::future<std::vector<Result<Embedding>>>> pending;
    size_t start = 0;
    while (start < names.size()) {
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(batcherMutex_);
            count = batcher_.packByTokens(names, start);
        }
        std::vector<std::string> chunk(names.begin() + static_cast<std::ptrdiff_t>(start),
                                       names.begin() + static_cast<std::ptrdiff_t>(start + count));
        auto task = std::make_shared<std::packaged_task<std::vector<Result<Embedding>>()>>(
            [this, chunk = std::move(chunk)]() { return runBatch(chunk); });
        pending.push_back(task->get_future());
        boost::asio::post(*pool_, [task]() { (*task)(); });
        start += count;
    }

    for (auto& future : pending) {
        for (auto& r : future.get()) {
            results.push_back(std::move(r));
        }
    }
    spdlog::debug("[Embedding] Embedded {} names in {} batches", names.size(), pending.size());
    return results;
}

} // namespace namesake::ml
