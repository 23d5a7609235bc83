#pragma once

#include <namesake/core/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace namesake::ml {

/**
 * Configuration shared by embedding providers
 */
struct EmbeddingConfig {
    std::string provider = "NameNgram";
    size_t embedding_dim = DEFAULT_EMBEDDING_DIM;
    size_t batch_size = DEFAULT_BATCH_SIZE;
    size_t threads = 0; // 0 = hardware concurrency
    size_t max_retries = 2;
    bool normalize_embeddings = true;

    // NameNgram provider
    float word_weight = 4.0f;
    float trigram_weight = 1.0f;
    std::string nickname_file; // optional JSON file extending the built-in nickname table

    // ONNX provider
    std::string model_path = "models/all-MiniLM-L6-v2/model.onnx";
    std::string vocab_path = "models/all-MiniLM-L6-v2/vocab.txt";
    size_t max_sequence_length = 128;
};

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 *
 * A provider owns its model resource between initialize() and shutdown(). Batch calls return
 * one slot per input, in input order; a failed slot carries an error and does not affect
 * the others.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<Embedding> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts
     * @param texts Input texts to embed
     * @return One result per input text, same order
     */
    virtual std::vector<Result<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    /**
     * Get the name of this provider (e.g., "NameNgram", "ONNX")
     */
    virtual std::string getProviderName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;

    /**
     * Get maximum sequence length
     * @return Max sequence length or 0 if unlimited
     */
    virtual size_t getMaxSequenceLength() const = 0;

    virtual Result<void> initialize() = 0;

    virtual void shutdown() = 0;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

using EmbeddingProviderFactory =
    std::function<std::unique_ptr<IEmbeddingProvider>(const EmbeddingConfig&)>;

/**
 * Create the named embedding provider. An empty name selects config.provider.
 * Returns nullptr when no provider with that name is registered.
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const EmbeddingConfig& config,
                                                            const std::string& name = "");

/**
 * Register an embedding provider factory
 */
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

/**
 * Get list of registered embedding providers
 */
std::vector<std::string> getRegisteredEmbeddingProviders();

} // namespace namesake::ml
