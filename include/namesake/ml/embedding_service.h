#pragma once

#include <namesake/core/types.h>
#include <namesake/ml/dynamic_batcher.h>
#include <namesake/ml/provider.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace namesake::ml {

/**
 * Batched embedding front-end over one provider.
 *
 * Names are packed into provider batches by a DynamicBatcher and the batches run on a
 * dedicated worker pool. The result vector always has one slot per input, in input order:
 * a name that cannot be embedded yields an error in its own slot and never affects its
 * neighbours. When a provider call fails as a whole the batch is retried name by name.
 */
class EmbeddingService {
public:
    /**
     * Create the provider named in config.provider and initialize it.
     */
    static Result<std::unique_ptr<EmbeddingService>> create(const EmbeddingConfig& config);

    EmbeddingService(std::unique_ptr<IEmbeddingProvider> provider, const EmbeddingConfig& config);
    ~EmbeddingService();

    EmbeddingService(const EmbeddingService&) = delete;
    EmbeddingService& operator=(const EmbeddingService&) = delete;

    // Initializes the provider; must succeed before any embed call
    Result<void> start();

    Result<Embedding> embed(const std::string& name);
    std::vector<Result<Embedding>> embedBatch(const std::vector<std::string>& names);

    size_t dimension() const { return dimension_; }
    std::string providerName() const;
    bool isRunning() const { return started_; }

private:
    std::vector<Result<Embedding>> runBatch(const std::vector<std::string>& names);
    Result<Embedding> runSingle(const std::string& name);
    Result<Embedding> checkDimension(Result<Embedding> result) const;

    EmbeddingConfig config_;
    std::unique_ptr<IEmbeddingProvider> provider_;
    size_t dimension_;
    bool started_ = false;

    std::mutex batcherMutex_;
    DynamicBatcher batcher_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace namesake::ml
