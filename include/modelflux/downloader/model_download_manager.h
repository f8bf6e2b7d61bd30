#pragma once

#include <modelflux/core/model_descriptor.h>
#include <modelflux/core/types.h>
#include <modelflux/downloader/download_registry.h>
#include <modelflux/downloader/downloader.hpp>
#include <modelflux/downloader/file_fetcher.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::downloader {

struct DownloadManagerConfig {
    std::filesystem::path modelsDir;   // <dataDir>/models
    std::filesystem::path stagingDir;  // <dataDir>/staging/downloader
    std::filesystem::path registryPath; // <dataDir>/downloads.json
    std::size_t concurrency{2};
    FileFetcher::Options fetch{};
    std::chrono::milliseconds persistInterval{1000};
    bool verifyChecksumsOnOpen{false};
};

struct DownloadProgress {
    std::string modelId;
    DownloadStatus status{DownloadStatus::NotDownloaded};
    double fraction{0.0};
    std::uint64_t bytesDownloaded{0};
    std::uint64_t bytesTotal{0};
    std::string error;
};

using DownloadProgressCallback = std::function<void(const DownloadProgress&)>;
using SubscriptionId = std::uint64_t;

namespace detail {
struct DownloadJob;
}

/**
 * Observer of one model's download. Copyable; all copies observe the same job.
 */
class DownloadHandle {
public:
    DownloadHandle() = default;
    explicit DownloadHandle(std::shared_ptr<detail::DownloadJob> job) : job_(std::move(job)) {}

    [[nodiscard]] bool valid() const { return job_ != nullptr; }
    [[nodiscard]] std::string modelId() const;
    [[nodiscard]] DownloadStatus status() const;
    [[nodiscard]] double progress() const;
    [[nodiscard]] DownloadRecord record() const;

    /// Block until the job reaches a terminal state (Ready, Paused, Error, NotDownloaded)
    DownloadStatus wait() const;
    std::optional<DownloadStatus> waitFor(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<detail::DownloadJob> job_;
};

/**
 * Fetches model manifests into <modelsDir>/<modelId>/ with pause, resume, cancel and
 * restart recovery. Jobs run on a bounded boost::asio::thread_pool; state is persisted
 * through DownloadRegistry so an interrupted download continues after reattach().
 */
class ModelDownloadManager : public IDownloadStatusProvider {
public:
    ModelDownloadManager(DownloadManagerConfig config, std::shared_ptr<IHttpAdapter> http,
                         std::shared_ptr<IDiskWriter> disk = nullptr);
    ~ModelDownloadManager() override;

    ModelDownloadManager(const ModelDownloadManager&) = delete;
    ModelDownloadManager& operator=(const ModelDownloadManager&) = delete;

    /// Load the registry and demote Ready records whose files no longer check out
    Result<void> open();

    /**
     * Begin (or continue) downloading a model. Idempotent: a Ready model yields a handle
     * that is already complete; an active download yields a handle to the running job.
     */
    Result<DownloadHandle> start(const ModelDescriptor& descriptor);

    Result<void> pause(const std::string& modelId);
    Result<DownloadHandle> resume(const std::string& modelId);

    /// Stop and delete partial data; the record returns to NotDownloaded
    Result<void> cancel(const std::string& modelId);

    /// Delete a downloaded model's files and forget its record
    Result<void> remove(const std::string& modelId);

    /**
     * Resume every record persisted as Downloading that has no running job.
     * Returns the number of jobs started; calling again starts none.
     */
    std::size_t reattach();

    [[nodiscard]] std::optional<DownloadRecord>
    findRecord(const std::string& modelId) const override;
    [[nodiscard]] std::vector<DownloadRecord> records() const;
    [[nodiscard]] bool isReady(const std::string& modelId) const;

    SubscriptionId subscribe(const std::string& modelId, DownloadProgressCallback callback);
    void unsubscribe(SubscriptionId id);

    /// Stop all jobs, leaving in-flight records as Downloading for the next reattach()
    void shutdown();

    [[nodiscard]] const DownloadManagerConfig& config() const { return config_; }

private:
    struct Subscriber {
        std::string modelId;
        DownloadProgressCallback callback;
    };

    std::shared_ptr<detail::DownloadJob> launchLocked(DownloadRecord record);
    void runJob(const std::shared_ptr<detail::DownloadJob>& job, DownloadRecord record);
    void finishJob(const std::shared_ptr<detail::DownloadJob>& job, const DownloadRecord& record);
    void publish(detail::DownloadJob& job, const DownloadRecord& record);
    void purgeModelFiles(const DownloadRecord& record);
    FetchRequest requestFor(const DownloadRecord& record, const DownloadedFile& file) const;
    void persist(const DownloadRecord& record);

    DownloadManagerConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IResumeStore> resume_;
    DownloadRegistry registry_;
    std::unique_ptr<FileFetcher> fetcher_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<detail::DownloadJob>> active_;

    std::mutex subscribersMutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    std::atomic<SubscriptionId> nextSubscription_{1};

    std::atomic<bool> shuttingDown_{false};
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace modelflux::downloader
