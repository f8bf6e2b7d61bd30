/*
 * model_download_manager.cpp
 *
 * Per-model download jobs on a bounded boost::asio::thread_pool.
 * - Files of a manifest are fetched sequentially through FileFetcher
 * - Progress is aggregated over the manifest and published monotonically
 * - Pause keeps staged bytes, cancel purges them, shutdown leaves the record as
 *   Downloading so reattach() picks it up on the next start
 * - Registry writes during a transfer are throttled to persistInterval
 */

#include <modelflux/downloader/model_download_manager.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace modelflux::downloader {

namespace fs = std::filesystem;

namespace detail {

enum class StopReason { None, Pause, Cancel, Shutdown };

struct DownloadJob {
    explicit DownloadJob(std::string id) : modelId(std::move(id)) {}

    const std::string modelId;
    std::atomic<StopReason> stop{StopReason::None};

    mutable std::mutex mutex;
    std::condition_variable cv;
    DownloadStatus status{DownloadStatus::Downloading};
    double fraction{0.0};
    bool done{false};
    DownloadRecord snapshot;

    // touched only by the worker running this job
    std::chrono::steady_clock::time_point lastPersist{};

    bool requestStop(StopReason reason) {
        auto expected = StopReason::None;
        return stop.compare_exchange_strong(expected, reason);
    }
};

} // namespace detail

using detail::DownloadJob;
using detail::StopReason;

namespace {

bool isTerminal(DownloadStatus status) {
    return status != DownloadStatus::Downloading;
}

bool isSafePathComponent(const std::string& s) {
    if (s.empty() || s == "." || s == "..")
        return false;
    return s.find('/') == std::string::npos && s.find('\\') == std::string::npos;
}

std::shared_ptr<DownloadJob> makeFinishedJob(const DownloadRecord& record) {
    auto job = std::make_shared<DownloadJob>(record.modelId);
    job->status = record.status;
    job->fraction = record.progress;
    job->done = true;
    job->snapshot = record;
    return job;
}

bool fileOnDisk(const DownloadedFile& file) {
    if (!file.complete || file.localPath.empty())
        return false;
    std::error_code ec;
    if (!fs::is_regular_file(file.localPath, ec))
        return false;
    const auto size = fs::file_size(file.localPath, ec);
    return !ec && (!file.sizeBytes || size == *file.sizeBytes);
}

bool sameManifest(const DownloadRecord& a, const DownloadRecord& b) {
    if (a.files.size() != b.files.size())
        return false;
    for (std::size_t i = 0; i < a.files.size(); ++i) {
        if (a.files[i].url != b.files[i].url || a.files[i].fileName != b.files[i].fileName ||
            a.files[i].sha256 != b.files[i].sha256)
            return false;
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// DownloadHandle
// ---------------------------------------------------------------------------

std::string DownloadHandle::modelId() const {
    return job_ ? job_->modelId : std::string{};
}

DownloadStatus DownloadHandle::status() const {
    if (!job_)
        return DownloadStatus::NotDownloaded;
    std::lock_guard<std::mutex> lock(job_->mutex);
    return job_->status;
}

double DownloadHandle::progress() const {
    if (!job_)
        return 0.0;
    std::lock_guard<std::mutex> lock(job_->mutex);
    return job_->fraction;
}

DownloadRecord DownloadHandle::record() const {
    if (!job_)
        return DownloadRecord{};
    std::lock_guard<std::mutex> lock(job_->mutex);
    return job_->snapshot;
}

DownloadStatus DownloadHandle::wait() const {
    if (!job_)
        return DownloadStatus::NotDownloaded;
    std::unique_lock<std::mutex> lock(job_->mutex);
    job_->cv.wait(lock, [this] { return job_->done; });
    return job_->status;
}

std::optional<DownloadStatus> DownloadHandle::waitFor(std::chrono::milliseconds timeout) const {
    if (!job_)
        return DownloadStatus::NotDownloaded;
    std::unique_lock<std::mutex> lock(job_->mutex);
    if (!job_->cv.wait_for(lock, timeout, [this] { return job_->done; }))
        return std::nullopt;
    return job_->status;
}

// ---------------------------------------------------------------------------
// ModelDownloadManager
// ---------------------------------------------------------------------------

ModelDownloadManager::ModelDownloadManager(DownloadManagerConfig config,
                                           std::shared_ptr<IHttpAdapter> http,
                                           std::shared_ptr<IDiskWriter> disk)
    : config_(std::move(config)), http_(std::move(http)), disk_(std::move(disk)),
      registry_(config_.registryPath) {
    if (!http_)
        http_ = makeCurlHttpAdapter();
    if (!disk_)
        disk_ = makeDiskWriter();
    resume_ = makeJsonResumeStore(config_.stagingDir / "resume.json");
    fetcher_ = std::make_unique<FileFetcher>(http_, disk_, resume_, config_.fetch);
    pool_ = std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(1, config_.concurrency));
}

ModelDownloadManager::~ModelDownloadManager() {
    shutdown();
}

Result<void> ModelDownloadManager::open() {
    std::error_code ec;
    fs::create_directories(config_.modelsDir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create models directory " + config_.modelsDir.string() + ": " +
                         ec.message()};
    }
    fs::create_directories(config_.stagingDir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create staging directory " + config_.stagingDir.string() + ": " +
                         ec.message()};
    }

    auto loaded = registry_.load();
    if (!loaded) {
        if (loaded.error().code != ErrorCode::CorruptedData)
            return loaded.error();
        // Staged bytes and final files remain; models simply show as not downloaded
        spdlog::warn("[DownloadManager] {}; starting with an empty registry",
                     loaded.error().message);
    }

    auto demoted = registry_.verifyReady(config_.verifyChecksumsOnOpen);
    if (!demoted.empty()) {
        spdlog::info("[DownloadManager] {} model(s) demoted after verification", demoted.size());
    }
    return {};
}

FetchRequest ModelDownloadManager::requestFor(const DownloadRecord& record,
                                              const DownloadedFile& file) const {
    FetchRequest req;
    req.url = file.url;
    req.stagingPath = config_.stagingDir / record.modelId / (file.fileName + ".part");
    req.finalPath = config_.modelsDir / record.modelId / file.fileName;
    req.expectedSize = file.sizeBytes;
    req.expectedSha256 = file.sha256;
    return req;
}

void ModelDownloadManager::persist(const DownloadRecord& record) {
    auto r = registry_.put(record);
    if (!r) {
        spdlog::warn("[DownloadManager] Failed to persist record for '{}': {}", record.modelId,
                     r.error().message);
    }
}

Result<DownloadHandle> ModelDownloadManager::start(const ModelDescriptor& descriptor) {
    if (shuttingDown_.load()) {
        return Error{ErrorCode::InvalidState, "Download manager is shutting down"};
    }
    if (!isSafePathComponent(descriptor.id)) {
        return Error{ErrorCode::InvalidArgument, "Invalid model id '" + descriptor.id + "'"};
    }
    const auto* main = descriptor.file(FileRole::Model);
    if (!main || main->url.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Model '" + descriptor.id + "' has no model file in its manifest"};
    }
    auto fresh = DownloadRecord::fromDescriptor(descriptor);
    for (const auto& f : fresh.files) {
        if (f.url.empty() || !isSafePathComponent(f.fileName)) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid manifest entry for model '" + descriptor.id + "'"};
        }
    }

    for (;;) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = active_.find(descriptor.id);
        if (it != active_.end()) {
            auto job = it->second;
            if (job->stop.load() == StopReason::None)
                return DownloadHandle(job);
            // A paused or cancelled job is still unwinding; wait for it before restarting
            lock.unlock();
            DownloadHandle(job).wait();
            continue;
        }

        auto existing = registry_.get(descriptor.id);
        if (existing && existing->status == DownloadStatus::Ready) {
            return DownloadHandle(makeFinishedJob(*existing));
        }
        if (existing && sameManifest(*existing, fresh)) {
            fresh.files = existing->files;
        }
        spdlog::info("[DownloadManager] Starting download of '{}'", descriptor.id);
        return DownloadHandle(launchLocked(std::move(fresh)));
    }
}

std::shared_ptr<DownloadJob> ModelDownloadManager::launchLocked(DownloadRecord record) {
    record.status = DownloadStatus::Downloading;
    record.error.clear();
    persist(record);

    auto job = std::make_shared<DownloadJob>(record.modelId);
    job->fraction = record.progress;
    job->snapshot = record;
    active_[record.modelId] = job;
    boost::asio::post(*pool_, [this, job, record = std::move(record)]() mutable {
        runJob(job, std::move(record));
    });
    return job;
}

void ModelDownloadManager::runJob(const std::shared_ptr<DownloadJob>& job, DownloadRecord record) {
    const auto shouldCancel = [job] { return job->stop.load() != StopReason::None; };

    std::uint64_t total = 0;
    bool allSizesKnown = true;
    for (const auto& f : record.files) {
        if (f.sizeBytes)
            total += *f.sizeBytes;
        else
            allSizesKnown = false;
    }
    if (!allSizesKnown)
        total = std::max(total, record.bytesTotal);
    record.bytesTotal = total;

    std::optional<Error> failure;
    std::uint64_t completedBytes = 0;
    for (auto& file : record.files) {
        if (shouldCancel())
            break;
        if (fileOnDisk(file)) {
            std::error_code ec;
            completedBytes += fs::file_size(file.localPath, ec);
            continue;
        }
        file.complete = false;
        file.localPath.clear();

        const auto request = requestFor(record, file);
        auto fetched = fetcher_->fetch(
            request, shouldCancel,
            [&](std::uint64_t bytes, std::optional<std::uint64_t> fileTotal) {
                record.bytesDownloaded = completedBytes + bytes;
                if (!file.sizeBytes && fileTotal)
                    record.bytesTotal = std::max(record.bytesTotal, completedBytes + *fileTotal);
                record.bytesTotal = std::max(record.bytesTotal, record.bytesDownloaded);
                record.progress = record.bytesTotal > 0
                                      ? static_cast<double>(record.bytesDownloaded) /
                                            static_cast<double>(record.bytesTotal)
                                      : 0.0;
                publish(*job, record);
                const auto now = std::chrono::steady_clock::now();
                if (now - job->lastPersist >= config_.persistInterval) {
                    job->lastPersist = now;
                    persist(record);
                }
            });
        if (!fetched) {
            failure = fetched.error();
            break;
        }
        file.complete = true;
        file.localPath = fetched.value().path;
        if (!file.sizeBytes)
            file.sizeBytes = fetched.value().sizeBytes;
        if (!file.sha256)
            file.sha256 = fetched.value().sha256;
        completedBytes += fetched.value().sizeBytes;
        record.bytesDownloaded = completedBytes;
        persist(record);
    }

    const auto reason = job->stop.load();
    const bool allComplete = std::all_of(record.files.begin(), record.files.end(),
                                         [](const DownloadedFile& f) { return f.complete; });

    if (reason == StopReason::Cancel) {
        purgeModelFiles(record);
        for (auto& f : record.files) {
            f.complete = false;
            f.localPath.clear();
        }
        record.status = DownloadStatus::NotDownloaded;
        record.progress = 0.0;
        record.bytesDownloaded = 0;
        record.error.clear();
        spdlog::info("[DownloadManager] Cancelled '{}'", record.modelId);
    } else if (allComplete && !failure) {
        record.status = DownloadStatus::Ready;
        record.progress = 1.0;
        record.bytesDownloaded = completedBytes;
        record.bytesTotal = std::max(record.bytesTotal, completedBytes);
        record.error.clear();
        spdlog::info("[DownloadManager] '{}' ready ({} bytes)", record.modelId, completedBytes);
    } else if (reason == StopReason::Pause) {
        record.status = DownloadStatus::Paused;
        spdlog::info("[DownloadManager] Paused '{}' at {:.1f}%", record.modelId,
                     record.progress * 100.0);
    } else if (reason == StopReason::Shutdown) {
        // Keep Downloading so the next reattach() resumes from the staged prefix
        record.status = DownloadStatus::Downloading;
        spdlog::debug("[DownloadManager] Suspended '{}' for shutdown", record.modelId);
    } else {
        record.status = DownloadStatus::Error;
        record.error = failure ? failure->message : std::string("Download incomplete");
        if (failure && failure->code == ErrorCode::StorageFull) {
            // The fetcher dropped the staged bytes; only finished files still count
            record.bytesDownloaded = completedBytes;
            record.progress = record.bytesTotal > 0
                                  ? static_cast<double>(completedBytes) /
                                        static_cast<double>(record.bytesTotal)
                                  : 0.0;
        }
        spdlog::error("[DownloadManager] Download of '{}' failed: {}", record.modelId,
                      record.error);
    }

    persist(record);
    finishJob(job, record);
}

void ModelDownloadManager::finishJob(const std::shared_ptr<DownloadJob>& job,
                                     const DownloadRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(job->modelId);
        if (it != active_.end() && it->second == job)
            active_.erase(it);
    }
    publish(*job, record);
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->done = true;
    }
    job->cv.notify_all();
}

void ModelDownloadManager::publish(DownloadJob& job, const DownloadRecord& record) {
    DownloadProgress event;
    event.modelId = record.modelId;
    event.status = record.status;
    event.bytesDownloaded = record.bytesDownloaded;
    event.bytesTotal = record.bytesTotal;
    event.error = record.error;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        if (isTerminal(record.status) && record.status != DownloadStatus::Paused) {
            job.fraction = record.progress;
        } else {
            job.fraction = std::max(job.fraction, record.progress);
        }
        job.status = record.status;
        job.snapshot = record;
        job.snapshot.progress = job.fraction;
        event.fraction = job.fraction;
    }

    std::vector<DownloadProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        for (const auto& [id, sub] : subscribers_) {
            if (sub.modelId == record.modelId)
                callbacks.push_back(sub.callback);
        }
    }
    for (const auto& cb : callbacks) {
        cb(event);
    }
}

void ModelDownloadManager::purgeModelFiles(const DownloadRecord& record) {
    for (const auto& f : record.files) {
        fetcher_->discard(requestFor(record, f));
    }
    std::error_code ec;
    fs::remove_all(config_.stagingDir / record.modelId, ec);
    if (ec) {
        spdlog::warn("[DownloadManager] Cannot remove staging for '{}': {}", record.modelId,
                     ec.message());
    }
    fs::remove_all(config_.modelsDir / record.modelId, ec);
    if (ec) {
        spdlog::warn("[DownloadManager] Cannot remove files of '{}': {}", record.modelId,
                     ec.message());
    }
}

Result<void> ModelDownloadManager::pause(const std::string& modelId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(modelId);
    if (it != active_.end()) {
        it->second->requestStop(StopReason::Pause);
        return {};
    }
    auto record = registry_.get(modelId);
    if (!record) {
        return Error{ErrorCode::NotFound, "No download for model '" + modelId + "'"};
    }
    if (record->status == DownloadStatus::Downloading) {
        record->status = DownloadStatus::Paused;
        persist(*record);
    }
    return {};
}

Result<DownloadHandle> ModelDownloadManager::resume(const std::string& modelId) {
    if (shuttingDown_.load()) {
        return Error{ErrorCode::InvalidState, "Download manager is shutting down"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(modelId);
    if (it != active_.end()) {
        return DownloadHandle(it->second);
    }
    auto record = registry_.get(modelId);
    if (!record) {
        return Error{ErrorCode::NotFound, "No download for model '" + modelId + "'"};
    }
    if (record->status == DownloadStatus::Ready) {
        return DownloadHandle(makeFinishedJob(*record));
    }
    spdlog::info("[DownloadManager] Resuming '{}' from {:.1f}%", modelId,
                 record->progress * 100.0);
    return DownloadHandle(launchLocked(std::move(*record)));
}

Result<void> ModelDownloadManager::cancel(const std::string& modelId) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = active_.find(modelId);
    if (it != active_.end()) {
        // Cancel overrides a pending pause
        it->second->stop.store(StopReason::Cancel);
        return {};
    }
    auto record = registry_.get(modelId);
    if (!record || record->status == DownloadStatus::Ready ||
        record->status == DownloadStatus::NotDownloaded) {
        return {};
    }
    purgeModelFiles(*record);
    for (auto& f : record->files) {
        f.complete = false;
        f.localPath.clear();
    }
    record->status = DownloadStatus::NotDownloaded;
    record->progress = 0.0;
    record->bytesDownloaded = 0;
    record->error.clear();
    persist(*record);
    lock.unlock();

    auto job = makeFinishedJob(*record);
    publish(*job, *record);
    return {};
}

Result<void> ModelDownloadManager::remove(const std::string& modelId) {
    std::shared_ptr<DownloadJob> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(modelId);
        if (it != active_.end()) {
            running = it->second;
            running->stop.store(StopReason::Cancel);
        }
    }
    if (running) {
        DownloadHandle(running).wait();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto record = registry_.get(modelId);
    if (!record) {
        return Error{ErrorCode::NotFound, "No download for model '" + modelId + "'"};
    }
    purgeModelFiles(*record);
    auto erased = registry_.erase(modelId);
    if (!erased)
        return erased.error();
    spdlog::info("[DownloadManager] Removed '{}'", modelId);
    return {};
}

std::size_t ModelDownloadManager::reattach() {
    if (shuttingDown_.load())
        return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t started = 0;
    for (auto& record : registry_.list()) {
        if (record.status != DownloadStatus::Downloading)
            continue;
        if (active_.count(record.modelId) != 0)
            continue;
        spdlog::info("[DownloadManager] Reattaching '{}' at {:.1f}%", record.modelId,
                     record.progress * 100.0);
        launchLocked(std::move(record));
        ++started;
    }
    return started;
}

std::optional<DownloadRecord> ModelDownloadManager::findRecord(const std::string& modelId) const {
    return registry_.get(modelId);
}

std::vector<DownloadRecord> ModelDownloadManager::records() const {
    return registry_.list();
}

bool ModelDownloadManager::isReady(const std::string& modelId) const {
    auto record = registry_.get(modelId);
    return record && record->status == DownloadStatus::Ready;
}

SubscriptionId ModelDownloadManager::subscribe(const std::string& modelId,
                                               DownloadProgressCallback callback) {
    const auto id = nextSubscription_.fetch_add(1);
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.emplace(id, Subscriber{modelId, std::move(callback)});
    return id;
}

void ModelDownloadManager::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.erase(id);
}

void ModelDownloadManager::shutdown() {
    if (shuttingDown_.exchange(true))
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, job] : active_) {
            job->requestStop(StopReason::Shutdown);
        }
    }
    if (pool_) {
        pool_->join();
    }
}

} // namespace modelflux::downloader
