#pragma once

#include <modelflux/core/types.h>
#include <modelflux/downloader/download_registry.h>
#include <modelflux/vector/document_chunker.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/ingestion_pipeline.h>
#include <modelflux/vector/rag_store.h>
#include <modelflux/vector/retrieval_orchestrator.h>
#include <modelflux/vector/staleness_tracker.h>
#include <modelflux/vector/vector_index.h>

#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::vector {

enum class RagStatus { Uninitialized, Initializing, Ready, Stale, Error };

const char* ragStatusName(RagStatus status);

struct RagRuntimeConfig {
    std::filesystem::path databasePath; // ":memory:" for a private in-memory store
    ChunkingConfig chunking;
    std::size_t topK{5};
};

/**
 * Owns the RAG stack (store, index, staleness, pipeline, retrieval) and brings it up
 * lazily on first use. Concurrent initialize() calls share one in-flight attempt; a failed
 * attempt is retried by the next call.
 */
class RagRuntime {
public:
    using StatusCallback = std::function<void(RagStatus status, const std::string& error)>;
    using SubscriptionId = std::uint64_t;

    RagRuntime(RagRuntimeConfig config, std::shared_ptr<IEmbeddingBackend> backend,
               std::shared_ptr<const downloader::IDownloadStatusProvider> downloads,
               std::string embeddingModelId);
    ~RagRuntime();

    RagRuntime(const RagRuntime&) = delete;
    RagRuntime& operator=(const RagRuntime&) = delete;

    std::shared_future<Result<void>> initialize();
    Result<void> ensureInitialized();

    /// Switch the active embedding model; the index turns Stale until reprocessAll()
    void setEmbeddingModel(std::shared_ptr<IEmbeddingBackend> backend, std::string modelId);

    Result<Source> addSource(const SourceFile& file);
    Result<Source> addText(const std::string& name, const std::string& text);
    Result<std::size_t> deleteSource(const std::string& sourceId);
    Result<std::size_t> reprocessAll(const ReindexProgressCallback& onProgress = {});
    Result<std::vector<Source>> listSources();

    Result<std::vector<SearchHit>> retrieve(const std::string& query,
                                            std::optional<RetrievalOptions> options = {});

    /// Retrieve for `message` and wrap it with the formatted context; returns `message`
    /// unchanged when nothing relevant is available
    Result<std::string> augment(const std::string& message,
                                std::optional<RetrievalOptions> options = {});

    [[nodiscard]] RagStatus status() const;
    [[nodiscard]] std::string lastError() const;
    [[nodiscard]] bool isStale() const;
    [[nodiscard]] EmbeddingIdentity activeIdentity() const;

    SubscriptionId subscribe(StatusCallback callback);
    void unsubscribe(SubscriptionId id);

private:
    Result<void> doInitialize();
    void refreshStatus();
    void setStatus(RagStatus status, std::string error = {});
    std::shared_ptr<EmbeddingProvider> makeProvider() const;

    RagRuntimeConfig config_;
    std::shared_ptr<const downloader::IDownloadStatusProvider> downloads_;

    mutable std::mutex providerMutex_;
    std::shared_ptr<IEmbeddingBackend> backend_;
    std::string modelId_;
    std::shared_ptr<EmbeddingProvider> embedder_;

    std::shared_ptr<RagStore> store_;
    std::shared_ptr<VectorIndex> index_;
    std::shared_ptr<StalenessTracker> staleness_;
    std::unique_ptr<DocumentIngestionPipeline> pipeline_;
    std::unique_ptr<RetrievalOrchestrator> retrieval_;

    std::mutex initMutex_;
    std::optional<std::shared_future<Result<void>>> initFuture_;

    mutable std::mutex statusMutex_;
    RagStatus status_{RagStatus::Uninitialized};
    std::string lastError_;

    std::mutex subscribersMutex_;
    std::map<SubscriptionId, StatusCallback> subscribers_;
    SubscriptionId nextSubscription_{1};

    boost::asio::thread_pool initPool_{1};
};

} // namespace modelflux::vector
