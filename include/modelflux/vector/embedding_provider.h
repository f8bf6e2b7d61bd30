#pragma once

#include <modelflux/core/model_descriptor.h>
#include <modelflux/core/types.h>
#include <modelflux/downloader/download_registry.h>
#include <modelflux/vector/embedding_provider_fsm.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::vector {

/**
 * (provider, model) pair that identifies which embedding model produced a vector.
 */
struct EmbeddingIdentity {
    std::string providerId;
    std::string modelId;

    bool operator==(const EmbeddingIdentity& other) const {
        return providerId == other.providerId && modelId == other.modelId;
    }
    bool operator!=(const EmbeddingIdentity& other) const { return !(*this == other); }

    std::string toString() const { return providerId + "/" + modelId; }
};

struct EmbeddingModelFiles {
    std::filesystem::path modelPath;
    std::optional<std::filesystem::path> tokenizerPath;
    std::optional<std::filesystem::path> tokenizerConfigPath;
};

/**
 * A loaded embedding model with fixed output dimensionality.
 */
class IEmbeddingRuntime {
public:
    virtual ~IEmbeddingRuntime() = default;
    virtual Result<Embedding> embed(const std::string& text) = 0;
    [[nodiscard]] virtual std::size_t dimension() const = 0;
};

/**
 * Loads IEmbeddingRuntime instances for one provider.
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    [[nodiscard]] virtual std::string providerId() const = 0;
    /// Whether models of this provider are downloaded files that must be Ready first
    [[nodiscard]] virtual bool requiresDownload() const { return true; }

    virtual Result<std::unique_ptr<IEmbeddingRuntime>> load(const std::string& modelId,
                                                            const EmbeddingModelFiles& files) = 0;
};

/**
 * Deterministic, download-free backend: vectors are derived from a hash of the text.
 * Identical text always maps to the same unit vector.
 */
std::unique_ptr<IEmbeddingBackend> makeHashEmbeddingBackend(std::size_t dimension = 384);

/**
 * Embedding model wrapper used read-only by ingestion and retrieval. Mirrors the chat
 * model lifecycle: download check, load, then Ready or Failed. Loading is lazy.
 */
class EmbeddingProvider {
public:
    EmbeddingProvider(std::shared_ptr<IEmbeddingBackend> backend,
                      std::shared_ptr<const downloader::IDownloadStatusProvider> downloads,
                      std::string modelId, std::size_t expectedDimension = 0);

    Result<void> ensureReady();
    Result<Embedding> embed(const std::string& text);
    void unload();

    [[nodiscard]] EmbeddingIdentity identity() const;
    [[nodiscard]] ProviderSnapshot snapshot() const;
    [[nodiscard]] std::size_t dimension() const;

private:
    Result<void> loadLocked();

    std::shared_ptr<IEmbeddingBackend> backend_;
    std::shared_ptr<const downloader::IDownloadStatusProvider> downloads_;
    const std::string modelId_;
    const std::size_t expectedDimension_;

    mutable std::mutex mutex_;
    EmbeddingProviderFsm fsm_;
    std::unique_ptr<IEmbeddingRuntime> runtime_;
};

/// Built-in embedding catalog (all 384-dimensional sentence encoders)
const std::vector<ModelDescriptor>& embeddingCatalog();
std::optional<ModelDescriptor> findEmbeddingModel(const std::string& modelId);

} // namespace modelflux::vector
