#pragma once

#include <modelflux/app/remote_provider.h>
#include <modelflux/config/core_config.h>
#include <modelflux/core/model_descriptor.h>
#include <modelflux/core/types.h>
#include <modelflux/downloader/model_download_manager.h>
#include <modelflux/model/inference_runtime.h>
#include <modelflux/model/model_lifecycle_manager.h>
#include <modelflux/model/thinking_parser.h>
#include <modelflux/vector/rag_runtime.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::app {

inline constexpr const char* kLocalProvider = "local";

struct PromptRequest {
    std::string message;
    bool useContext{true};
    std::optional<vector::RetrievalOptions> retrieval;
    /// Called after every fragment with the response parsed so far
    std::function<void(const model::ParsedResponse&)> onUpdate;
};

struct ChatResponse {
    std::string raw;
    std::string thinking;
    std::string message;
    std::string provider;
    std::string modelId;
    bool usedContext{false};
};

/**
 * Entry point for the UI layer: routes prompts to the on-device model or a registered
 * remote provider, augments them with document context, and exposes downloads, model
 * lifecycle and the RAG library.
 */
class ChatEngine {
public:
    struct Dependencies {
        std::shared_ptr<model::INativeRuntime> nativeRuntime;
        std::shared_ptr<downloader::IHttpAdapter> http; // null = libcurl
        std::vector<std::shared_ptr<vector::IEmbeddingBackend>> embeddingBackends;
    };

    ChatEngine(config::CoreConfig config, Dependencies deps);
    ~ChatEngine();

    ChatEngine(const ChatEngine&) = delete;
    ChatEngine& operator=(const ChatEngine&) = delete;

    /**
     * Apply the log level, open the download registry and resume interrupted downloads.
     * Only the first call does any work.
     */
    Result<void> bootstrap();

    // Catalog and downloads
    void registerModel(ModelDescriptor descriptor);
    [[nodiscard]] std::vector<ModelDescriptor> models() const;
    Result<downloader::DownloadHandle> downloadModel(const std::string& modelId);
    Result<void> pauseDownload(const std::string& modelId);
    Result<downloader::DownloadHandle> resumeDownload(const std::string& modelId);
    Result<void> cancelDownload(const std::string& modelId);
    Result<void> removeModel(const std::string& modelId);

    // Routing and generation
    void registerRemoteProvider(std::shared_ptr<IRemoteProvider> provider);
    Result<void> selectModel(const std::string& modelId,
                             const std::string& provider = kLocalProvider,
                             model::SelectOptions options = {});
    Result<ChatResponse> sendPrompt(const PromptRequest& request);
    void stopGeneration();
    void updateGenerationConfig(const std::string& modelId, model::GenerationConfig config);

    // Document library
    Result<vector::Source> addSource(const vector::SourceFile& file);
    Result<std::size_t> deleteSource(const std::string& sourceId);
    Result<std::size_t> reprocessAll(const vector::ReindexProgressCallback& onProgress = {});
    Result<std::vector<vector::Source>> sources();
    Result<void> setEmbeddingModel(const std::string& providerId, const std::string& modelId);

    // Subscriptions
    downloader::SubscriptionId subscribeDownloadProgress(const std::string& modelId,
                                                         downloader::DownloadProgressCallback cb);
    void unsubscribeDownloadProgress(downloader::SubscriptionId id);
    model::LifecycleSubscriptionId subscribeGenerationState(model::LifecycleCallback cb);
    void unsubscribeGenerationState(model::LifecycleSubscriptionId id);
    vector::RagRuntime::SubscriptionId subscribeRagStatus(vector::RagRuntime::StatusCallback cb);
    void unsubscribeRagStatus(vector::RagRuntime::SubscriptionId id);

    [[nodiscard]] model::LifecycleSnapshot generationState() const;
    [[nodiscard]] vector::RagStatus ragStatus() const;
    [[nodiscard]] const config::CoreConfig& config() const { return config_; }

    downloader::ModelDownloadManager& downloads() { return *downloads_; }
    model::ModelLifecycleManager& lifecycle() { return *lifecycle_; }
    vector::RagRuntime& rag() { return *rag_; }

private:
    std::string buildPrompt(const PromptRequest& request, bool& usedContext);
    Result<ChatResponse> generateLocal(const std::string& prompt, const PromptRequest& request);
    Result<ChatResponse> generateRemote(IRemoteProvider& provider, const std::string& prompt,
                                        const PromptRequest& request);
    std::shared_ptr<vector::IEmbeddingBackend> backendFor(const std::string& providerId) const;

    config::CoreConfig config_;

    std::shared_ptr<downloader::ModelDownloadManager> downloads_;
    std::unique_ptr<model::ModelLifecycleManager> lifecycle_;
    std::unique_ptr<vector::RagRuntime> rag_;
    std::map<std::string, std::shared_ptr<vector::IEmbeddingBackend>> embeddingBackends_;

    mutable std::mutex mutex_;
    std::map<std::string, ModelDescriptor> catalog_;
    std::map<std::string, std::shared_ptr<IRemoteProvider>> remoteProviders_;
    std::string activeProvider_;
    std::string activeModel_;

    std::mutex bootstrapMutex_;
    bool bootstrapped_{false};
};

/// Configure spdlog's default logger from a level name ("trace" ... "off")
void applyLogLevel(const std::string& level);

/**
 * Process bootstrap: resolve CoreConfig from the environment and config file, build the
 * engine and run bootstrap() once.
 */
Result<std::unique_ptr<ChatEngine>> bootstrapChatEngine(ChatEngine::Dependencies deps);

} // namespace modelflux::app
