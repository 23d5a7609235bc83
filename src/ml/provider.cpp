#include <namesake/ml/ngram_embedding_provider.h>
#include <namesake/ml/provider.h>

#ifdef NAMESAKE_USE_ONNX_RUNTIME
#include <namesake/ml/onnx_embedding_provider.h>
#endif

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>

namespace namesake::ml {

namespace {

std::mutex& registryMutex() {
    static std::mutex m;
    return m;
}

std::map<std::string, EmbeddingProviderFactory>& registry() {
    static std::map<std::string, EmbeddingProviderFactory> providers = [] {
        std::map<std::string, EmbeddingProviderFactory> builtin;
        builtin["NameNgram"] = [](const EmbeddingConfig& config) {
            return std::make_unique<NgramEmbeddingProvider>(config);
        };
#ifdef NAMESAKE_USE_ONNX_RUNTIME
        builtin["ONNX"] = [](const EmbeddingConfig& config) {
            return std::make_unique<OnnxEmbeddingProvider>(config);
        };
#endif
        return builtin;
    }();
    return providers;
}

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[name] = std::move(factory);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    std::lock_guard<std::mutex> lock(registryMutex());
    std::vector<std::string> names;
    for (const auto& [name, _] : registry()) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const EmbeddingConfig& config,
                                                            const std::string& name) {
    const std::string& wanted = name.empty() ? config.provider : name;
    EmbeddingProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto it = registry().find(wanted);
        if (it == registry().end()) {
            spdlog::warn("Embedding provider '{}' not found", wanted);
            return nullptr;
        }
        factory = it->second;
    }
    return factory(config);
}

} // namespace namesake::ml
