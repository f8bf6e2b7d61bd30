#include <modelflux/vector/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>
#include <functional>
#include <random>

namespace modelflux::vector {

// ============================================================================
// Hash embedding backend
// ============================================================================

namespace {

class HashEmbeddingRuntime : public IEmbeddingRuntime {
public:
    explicit HashEmbeddingRuntime(std::size_t dimension) : dimension_(dimension) {}

    Result<Embedding> embed(const std::string& text) override {
        std::hash<std::string> hasher;
        std::mt19937 gen(static_cast<std::mt19937::result_type>(hasher(text)));
        std::normal_distribution<float> dist(0.0f, 1.0f);

        Embedding embedding(dimension_);
        for (auto& v : embedding) {
            v = dist(gen);
        }

        float norm = 0.0f;
        for (float v : embedding) {
            norm += v * v;
        }
        norm = std::sqrt(norm);
        if (norm > 0) {
            for (float& v : embedding) {
                v /= norm;
            }
        }
        return embedding;
    }

    std::size_t dimension() const override { return dimension_; }

private:
    std::size_t dimension_;
};

class HashEmbeddingBackend : public IEmbeddingBackend {
public:
    explicit HashEmbeddingBackend(std::size_t dimension) : dimension_(dimension) {}

    std::string providerId() const override { return "hash"; }
    bool requiresDownload() const override { return false; }

    Result<std::unique_ptr<IEmbeddingRuntime>> load(const std::string& modelId,
                                                    const EmbeddingModelFiles&) override {
        spdlog::debug("[HashEmbedding] Loaded '{}' with dimension {}", modelId, dimension_);
        return std::unique_ptr<IEmbeddingRuntime>(std::make_unique<HashEmbeddingRuntime>(dimension_));
    }

private:
    std::size_t dimension_;
};

} // namespace

std::unique_ptr<IEmbeddingBackend> makeHashEmbeddingBackend(std::size_t dimension) {
    return std::make_unique<HashEmbeddingBackend>(dimension);
}

// ============================================================================
// EmbeddingProvider
// ============================================================================

EmbeddingProvider::EmbeddingProvider(
    std::shared_ptr<IEmbeddingBackend> backend,
    std::shared_ptr<const downloader::IDownloadStatusProvider> downloads, std::string modelId,
    std::size_t expectedDimension)
    : backend_(std::move(backend)), downloads_(std::move(downloads)), modelId_(std::move(modelId)),
      expectedDimension_(expectedDimension) {}

EmbeddingIdentity EmbeddingProvider::identity() const {
    return EmbeddingIdentity{backend_ ? backend_->providerId() : std::string{}, modelId_};
}

ProviderSnapshot EmbeddingProvider::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.snapshot();
}

std::size_t EmbeddingProvider::dimension() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.dimension();
}

Result<void> EmbeddingProvider::ensureReady() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fsm_.isReady() && runtime_)
        return {};
    return loadLocked();
}

Result<void> EmbeddingProvider::loadLocked() {
    if (!backend_) {
        return Error{ErrorCode::NotInitialized, "No embedding backend configured"};
    }

    EmbeddingModelFiles files;
    if (backend_->requiresDownload()) {
        auto record = downloads_ ? downloads_->findRecord(modelId_) : std::nullopt;
        if (!record || !record->isReady()) {
            fsm_.dispatch(LoadFailureEvent{"Embedding model not downloaded"});
            return Error{ErrorCode::ModelNotDownloaded,
                         "Embedding model '" + modelId_ + "' is not downloaded"};
        }
        auto modelPath = record->localPath(FileRole::Model);
        if (!modelPath) {
            fsm_.dispatch(LoadFailureEvent{"Embedding model file missing"});
            return Error{ErrorCode::ModelNotDownloaded,
                         "Embedding model '" + modelId_ + "' has no local model file"};
        }
        files.modelPath = *modelPath;
        files.tokenizerPath = record->localPath(FileRole::Tokenizer);
        files.tokenizerConfigPath = record->localPath(FileRole::TokenizerConfig);
    }

    fsm_.dispatch(ModelLoadStartedEvent{modelId_});
    Result<std::unique_ptr<IEmbeddingRuntime>> loaded{
        Error{ErrorCode::LoadFailed, "Embedding backend returned no runtime"}};
    try {
        loaded = backend_->load(modelId_, files);
    } catch (const std::exception& e) {
        loaded = Error{ErrorCode::LoadFailed, e.what()};
    }
    if (loaded && !loaded.value()) {
        loaded = Error{ErrorCode::LoadFailed, "Embedding backend returned no runtime"};
    }
    if (!loaded) {
        spdlog::error("[EmbeddingProvider] Failed to load '{}': {}", modelId_,
                      loaded.error().message);
        fsm_.dispatch(LoadFailureEvent{loaded.error().message});
        return Error{ErrorCode::LoadFailed, loaded.error().message};
    }

    const auto dim = loaded.value()->dimension();
    if (dim == 0 || (expectedDimension_ != 0 && dim != expectedDimension_)) {
        const auto msg = "Embedding model '" + modelId_ + "' reports dimension " +
                         std::to_string(dim) + ", expected " + std::to_string(expectedDimension_);
        fsm_.dispatch(LoadFailureEvent{msg});
        return Error{ErrorCode::InvalidData, msg};
    }

    runtime_ = std::move(loaded).value();
    fsm_.dispatch(ModelLoadedEvent{modelId_, dim});
    spdlog::info("[EmbeddingProvider] '{}' ready ({} dims)", identity().toString(), dim);
    return {};
}

Result<Embedding> EmbeddingProvider::embed(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fsm_.isReady() || !runtime_) {
        auto r = loadLocked();
        if (!r)
            return r.error();
    }

    Result<Embedding> out{Error{ErrorCode::EmbeddingFailed, "Embedding runtime failed"}};
    try {
        out = runtime_->embed(text);
    } catch (const std::exception& e) {
        return Error{ErrorCode::EmbeddingFailed, e.what()};
    }
    if (!out) {
        return Error{ErrorCode::EmbeddingFailed, out.error().message};
    }
    if (out.value().size() != fsm_.dimension()) {
        return Error{ErrorCode::EmbeddingFailed,
                     "Embedding has " + std::to_string(out.value().size()) +
                         " dimensions, expected " + std::to_string(fsm_.dimension())};
    }
    return out;
}

void EmbeddingProvider::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    runtime_.reset();
    fsm_.dispatch(ModelUnloadedEvent{});
}

// ============================================================================
// Catalog
// ============================================================================

const std::vector<ModelDescriptor>& embeddingCatalog() {
    static const std::vector<ModelDescriptor> kCatalog = [] {
        std::vector<ModelDescriptor> out;

        ModelDescriptor minilm;
        minilm.id = "all-minilm-l6-v2";
        minilm.name = "all-MiniLM-L6-v2";
        minilm.provider = "local";
        minilm.type = ModelType::Embedding;
        minilm.embeddingDimension = 384;
        minilm.sizeEstimate = 91ull * 1024ull * 1024ull;
        minilm.files = {
            {FileRole::Model,
             "https://huggingface.co/sentence-transformers/all-MiniLM-L6-v2/resolve/main/onnx/"
             "model.onnx",
             "model.onnx", std::nullopt, std::nullopt},
            {FileRole::Tokenizer,
             "https://huggingface.co/sentence-transformers/all-MiniLM-L6-v2/resolve/main/"
             "tokenizer.json",
             "tokenizer.json", std::nullopt, std::nullopt},
        };
        out.push_back(std::move(minilm));

        ModelDescriptor bge;
        bge.id = "bge-small-en-v1.5";
        bge.name = "BGE Small EN v1.5";
        bge.provider = "local";
        bge.type = ModelType::Embedding;
        bge.embeddingDimension = 384;
        bge.sizeEstimate = 133ull * 1024ull * 1024ull;
        bge.files = {
            {FileRole::Model,
             "https://huggingface.co/BAAI/bge-small-en-v1.5/resolve/main/onnx/model.onnx",
             "model.onnx", std::nullopt, std::nullopt},
            {FileRole::Tokenizer,
             "https://huggingface.co/BAAI/bge-small-en-v1.5/resolve/main/tokenizer.json",
             "tokenizer.json", std::nullopt, std::nullopt},
        };
        out.push_back(std::move(bge));
        return out;
    }();
    return kCatalog;
}

std::optional<ModelDescriptor> findEmbeddingModel(const std::string& modelId) {
    for (const auto& d : embeddingCatalog()) {
        if (d.id == modelId)
            return d;
    }
    return std::nullopt;
}

} // namespace modelflux::vector
