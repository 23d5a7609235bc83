#include <namesake/ml/onnx_embedding_provider.h>

#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace namesake::ml {

class OnnxEmbeddingProvider::Impl {
public:
    Impl() : env_(ORT_LOGGING_LEVEL_WARNING, "namesake") {
        options_.SetIntraOpNumThreads(1);
        options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
    }

    void load(const std::string& modelPath) {
        session_ = std::make_unique<Ort::Session>(env_, modelPath.c_str(), options_);

        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            inputNames_.push_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        outputName_ = session_->GetOutputNameAllocated(0, allocator).get();
    }

    // Runs a [batch, seq] padded batch and mean-pools the [batch, seq, hidden] output
    std::vector<Embedding> run(const std::vector<std::vector<int64_t>>& batch, int64_t padId) {
        size_t seqLen = 0;
        for (const auto& ids : batch) {
            seqLen = std::max(seqLen, ids.size());
        }
        const size_t rows = batch.size();

        std::vector<int64_t> ids(rows * seqLen, padId);
        std::vector<int64_t> mask(rows * seqLen, 0);
        std::vector<int64_t> types(rows * seqLen, 0);
        for (size_t r = 0; r < rows; ++r) {
            for (size_t t = 0; t < batch[r].size(); ++t) {
                ids[r * seqLen + t] = batch[r][t];
                mask[r * seqLen + t] = 1;
            }
        }

        std::vector<int64_t> shape{static_cast<int64_t>(rows), static_cast<int64_t>(seqLen)};
        auto mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> inNames;
        for (const auto& name : inputNames_) {
            std::vector<int64_t>* source = &ids;
            if (name.find("mask") != std::string::npos) {
                source = &mask;
            } else if (name.find("type") != std::string::npos) {
                source = &types;
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                mem, source->data(), source->size(), shape.data(), shape.size()));
            inNames.push_back(name.c_str());
        }
        const char* outNames[1] = {outputName_.c_str()};

        auto outputs = session_->Run(Ort::RunOptions{nullptr}, inNames.data(), inputs.data(),
                                     inputs.size(), outNames, 1);
        auto outShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (outShape.size() != 3) {
            throw std::runtime_error("Unexpected ONNX output rank " +
                                     std::to_string(outShape.size()));
        }
        const auto hidden = static_cast<size_t>(outShape[2]);
        const float* data = outputs[0].GetTensorData<float>();

        std::vector<Embedding> result(rows, Embedding(hidden, 0.0f));
        for (size_t r = 0; r < rows; ++r) {
            double count = 0.0;
            for (size_t t = 0; t < seqLen; ++t) {
                if (mask[r * seqLen + t] == 0) {
                    continue;
                }
                count += 1.0;
                const float* row = data + (r * seqLen + t) * hidden;
                for (size_t j = 0; j < hidden; ++j) {
                    result[r][j] += row[j];
                }
            }
            double ss = 0.0;
            for (float& v : result[r]) {
                v = static_cast<float>(v / std::max(count, 1.0));
                ss += static_cast<double>(v) * v;
            }
            if (ss > 0.0) {
                const double inv = 1.0 / std::sqrt(ss);
                for (float& v : result[r]) {
                    v = static_cast<float>(v * inv);
                }
            }
        }
        hidden_ = hidden;
        return result;
    }

    bool loaded() const { return session_ != nullptr; }
    size_t hidden() const { return hidden_; }

private:
    Ort::Env env_;
    Ort::SessionOptions options_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> inputNames_;
    std::string outputName_;
    size_t hidden_ = 0;
};

OnnxEmbeddingProvider::OnnxEmbeddingProvider(const EmbeddingConfig& config) : config_(config) {}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() {
    shutdown();
}

Result<void> OnnxEmbeddingProvider::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pImpl && pImpl->loaded()) {
        return Result<void>();
    }
    if (!std::filesystem::exists(config_.model_path)) {
        return Error{ErrorCode::FileNotFound, "Model file not found: " + config_.model_path};
    }
    if (auto r = tokenizer_.loadVocab(config_.vocab_path); !r) {
        return r;
    }

    try {
        auto impl = std::make_unique<Impl>();
        impl->load(config_.model_path);
        pImpl = std::move(impl);
    } catch (const Ort::Exception& e) {
        return Error{ErrorCode::InternalError,
                     std::string("Failed to load ONNX model: ") + e.what()};
    }
    spdlog::info("[ONNX] Loaded model {} (vocab={} tokens)", config_.model_path,
                 tokenizer_.vocabSize());
    return Result<void>();
}

void OnnxEmbeddingProvider::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pImpl) {
        spdlog::info("[ONNX] Releasing model session");
        pImpl.reset();
    }
}

bool OnnxEmbeddingProvider::isAvailable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pImpl && pImpl->loaded();
}

size_t OnnxEmbeddingProvider::getEmbeddingDimension() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pImpl && pImpl->hidden() > 0 ? pImpl->hidden() : config_.embedding_dim;
}

Result<Embedding> OnnxEmbeddingProvider::generateEmbedding(const std::string& text) {
    auto results = generateBatchEmbeddings({text});
    return std::move(results.front());
}

std::vector<Result<Embedding>>
OnnxEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Result<Embedding>> out;
    out.reserve(texts.size());
    if (!pImpl) {
        for (size_t i = 0; i < texts.size(); ++i) {
            out.emplace_back(Error{ErrorCode::NotInitialized, "ONNX provider not initialized"});
        }
        return out;
    }

    std::vector<std::vector<int64_t>> batch;
    batch.reserve(texts.size());
    for (const auto& text : texts) {
        batch.push_back(tokenizer_.encode(text, config_.max_sequence_length));
    }

    try {
        for (auto& embedding : pImpl->run(batch, tokenizer_.padId())) {
            out.emplace_back(std::move(embedding));
        }
    } catch (const std::exception& e) {
        spdlog::warn("[ONNX] Batch inference failed: {}", e.what());
        out.clear();
        for (size_t i = 0; i < texts.size(); ++i) {
            out.emplace_back(Error{ErrorCode::EmbeddingFailure,
                                   std::string("ONNX inference failed: ") + e.what()});
        }
    }
    return out;
}

} // namespace namesake::ml
