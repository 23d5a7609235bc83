#include <namesake/ml/ngram_embedding_provider.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>

namespace namesake::ml {

namespace {

std::uint64_t fnv1a(std::string_view prefix, std::string_view s) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : prefix) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    for (unsigned char c : s) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace

NgramEmbeddingProvider::NgramEmbeddingProvider(const EmbeddingConfig& config)
    : config_(config), nicknames_(NicknameTable::withDefaults()) {
    spdlog::debug("NgramEmbeddingProvider created with dimension {}", config_.embedding_dim);
}

NgramEmbeddingProvider::~NgramEmbeddingProvider() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> NgramEmbeddingProvider::initialize() {
    if (initialized_) {
        return Result<void>();
    }
    if (config_.embedding_dim == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }
    if (!config_.nickname_file.empty()) {
        if (auto r = nicknames_.loadFromFile(config_.nickname_file); !r) {
            return r;
        }
    }

    spdlog::info("Initializing NameNgram embedding provider (dim={}, nicknames={})",
                 config_.embedding_dim, nicknames_.size());
    initialized_ = true;
    return Result<void>();
}

void NgramEmbeddingProvider::shutdown() {
    if (!initialized_) {
        return;
    }
    spdlog::info("Shutting down NameNgram embedding provider");
    initialized_ = false;
}

std::vector<std::string> NgramEmbeddingProvider::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        // Bytes >= 0x80 belong to UTF-8 sequences and are kept as part of the token
        if (c >= 0x80 || std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

Result<Embedding> NgramEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "NameNgram provider not initialized"};
    }
    return embedUnchecked(text);
}

std::vector<Result<Embedding>>
NgramEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<Result<Embedding>> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(generateEmbedding(text));
    }
    return out;
}

Result<Embedding> NgramEmbeddingProvider::embedUnchecked(const std::string& text) const {
    const size_t dim = config_.embedding_dim;
    Embedding embedding(dim, 0.0f);

    auto tokens = tokenize(text);
    if (tokens.empty()) {
        return Error{ErrorCode::EmbeddingFailure, "Name has no embeddable tokens: '" + text + "'"};
    }

    for (const auto& token : tokens) {
        embedding[fnv1a("w:", nicknames_.canonical(token)) % dim] += config_.word_weight;

        std::string padded = "  " + token + "  ";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            embedding[fnv1a("t:", std::string_view(padded).substr(i, 3)) % dim] +=
                config_.trigram_weight;
        }
    }

    if (config_.normalize_embeddings) {
        double norm = 0.0;
        for (float v : embedding) {
            norm += static_cast<double>(v) * v;
        }
        norm = std::sqrt(norm);
        if (norm <= 0.0) {
            return Error{ErrorCode::EmbeddingFailure, "Name produced a zero vector: '" + text + "'"};
        }
        for (float& v : embedding) {
            v = static_cast<float>(v / norm);
        }
    }
    return embedding;
}

} // namespace namesake::ml
