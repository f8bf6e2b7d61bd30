#pragma once

#include <modelflux/core/types.h>
#include <modelflux/downloader/download_registry.h>
#include <modelflux/model/end_detector.h>
#include <modelflux/model/generation_session.h>
#include <modelflux/model/inference_runtime.h>
#include <modelflux/model/lifecycle_fsm.h>
#include <modelflux/model/model_types.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace modelflux::model {

using LifecycleCallback = std::function<void(const LifecycleSnapshot&)>;
using LifecycleSubscriptionId = std::uint64_t;

/**
 * Owns the single live native inference handle.
 *
 * Every native operation (load, unload, generate) runs on one dedicated executor thread,
 * so a select() issued while an unload is pending always waits for it. interrupt() is the
 * only call forwarded to the handle from other threads.
 */
class ModelLifecycleManager {
public:
    ModelLifecycleManager(std::shared_ptr<INativeRuntime> runtime,
                          std::shared_ptr<const downloader::IDownloadStatusProvider> downloads);
    ~ModelLifecycleManager();

    ModelLifecycleManager(const ModelLifecycleManager&) = delete;
    ModelLifecycleManager& operator=(const ModelLifecycleManager&) = delete;

    /**
     * Make `modelId` the loaded model. No-op when it is already Ready, unless
     * options.hardReload is set. Otherwise any in-flight generation is interrupted and the
     * current handle unloaded before the new load starts.
     */
    std::future<Result<void>> selectAsync(const std::string& modelId, SelectOptions options = {});
    Result<void> select(const std::string& modelId, SelectOptions options = {});

    /// Load unconditionally, replacing whatever is loaded
    std::future<Result<void>> loadAsync(const std::string& modelId);
    Result<void> load(const std::string& modelId);

    /// Safe when nothing is loaded
    std::future<Result<void>> unloadAsync();
    Result<void> unload();

    /// Requires Ready; fails with OperationInProgress while another session is generating
    Result<std::shared_ptr<GenerationSession>> startGeneration(const std::string& prompt);

    /// Interrupt the active session, if any
    void interrupt();

    void updateConfig(const std::string& modelId, GenerationConfig config);
    [[nodiscard]] GenerationConfig configFor(const std::string& modelId) const;

    [[nodiscard]] LifecycleSnapshot snapshot() const;
    [[nodiscard]] std::shared_ptr<GenerationSession> activeSession() const;

    LifecycleSubscriptionId subscribe(LifecycleCallback callback);
    void unsubscribe(LifecycleSubscriptionId id);

private:
    template <typename Fn> std::future<Result<void>> submit(Fn&& fn);

    Result<void> doSelect(const std::string& modelId, bool force);
    Result<void> doUnload();
    void runGeneration(const std::shared_ptr<GenerationSession>& session, const std::string& prompt,
                       const GenerationConfig& config);
    void onSessionFinished(std::uint64_t sessionId, const Result<void>& outcome);
    void interruptActive();
    template <typename Event> void apply(const Event& event);
    void notify(const LifecycleSnapshot& snap);

    std::shared_ptr<INativeRuntime> runtime_;
    std::shared_ptr<const downloader::IDownloadStatusProvider> downloads_;

    mutable std::mutex mutex_;
    LifecycleFsm fsm_;
    std::map<std::string, GenerationConfig> configs_;
    std::shared_ptr<GenerationSession> activeSession_;
    std::uint64_t nextSessionId_{1};

    // Guards handle_ for cross-thread interrupt(); all other use is on the executor
    mutable std::mutex handleMutex_;
    std::unique_ptr<INativeHandle> handle_;

    std::mutex subscribersMutex_;
    std::map<LifecycleSubscriptionId, LifecycleCallback> subscribers_;
    std::atomic<LifecycleSubscriptionId> nextSubscription_{1};

    std::atomic<bool> stopping_{false};
    boost::asio::thread_pool executor_{1};
};

} // namespace modelflux::model
