#pragma once

#include <modelflux/downloader/download_registry.h>
#include <modelflux/model/inference_runtime.h>

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace modelflux::tests {

/**
 * Ordered log of native calls ("load:a", "unload:a", "generate:a", "interrupt:a").
 */
class NativeEventLog {
public:
    void add(std::string event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    std::size_t count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count(events_.begin(), events_.end(), event));
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/**
 * What the next generate() call does.
 */
struct GenerationScript {
    std::vector<std::string> tokens{"Hello", ",", " world", "!"};
    bool completionEvents{true};
    bool holdUntilInterrupt{false}; // emit tokens, then block until interrupt()
    bool emitFromWorkerThread{false};
    std::optional<Error> failWith; // complete with this error after the tokens
    std::uint64_t tokenCountBase{0}; // counter value before the first token
    std::optional<std::size_t> counterResetAfter; // counter restarts at 0 after N tokens
};

class FakeNativeHandle : public model::INativeHandle {
public:
    FakeNativeHandle(std::string modelId, std::shared_ptr<NativeEventLog> log,
                     GenerationScript script)
        : modelId_(std::move(modelId)), log_(std::move(log)), script_(std::move(script)) {}

    ~FakeNativeHandle() override { joinWorker(); }

    void generate(const std::string&, const model::GenerationConfig&,
                  model::TokenCallback onToken, model::CompletionCallback onComplete) override {
        log_->add("generate:" + modelId_);
        joinWorker();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = false;
        }
        auto body = [this, onToken, onComplete, script = script_]() {
            std::uint64_t count = script.tokenCountBase;
            std::size_t emitted = 0;
            for (const auto& tok : script.tokens) {
                if (script.counterResetAfter && emitted++ == *script.counterResetAfter)
                    count = 0;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (interrupted_)
                        break;
                }
                onToken(model::TokenEvent{tok, ++count});
            }
            if (script.holdUntilInterrupt) {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return interrupted_; });
            }
            if (script.completionEvents) {
                if (script.failWith)
                    onComplete(*script.failWith);
                else
                    onComplete({});
            }
        };
        if (script_.emitFromWorkerThread) {
            worker_ = std::thread(body);
        } else {
            body();
        }
    }

    void interrupt() override {
        log_->add("interrupt:" + modelId_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    Result<void> unload() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
        joinWorker();
        log_->add("unload:" + modelId_);
        return {};
    }

    bool supportsCompletionEvent() const override { return script_.completionEvents; }

private:
    void joinWorker() {
        if (worker_.joinable())
            worker_.join();
    }

    std::string modelId_;
    std::shared_ptr<NativeEventLog> log_;
    GenerationScript script_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_{false};
    std::thread worker_;
};

class FakeNativeRuntime : public model::INativeRuntime {
public:
    FakeNativeRuntime() : log_(std::make_shared<NativeEventLog>()) {}

    Result<std::unique_ptr<model::INativeHandle>> load(const model::LoadManifest& manifest,
                                                       const model::GenerationConfig&,
                                                       model::LoadProgressCallback onProgress) override {
        log_->add("load:" + manifest.modelId);
        GenerationScript script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastManifest_ = manifest;
            auto it = loadFailures_.find(manifest.modelId);
            if (it != loadFailures_.end()) {
                return Error{ErrorCode::LoadFailed, it->second};
            }
            script = script_;
        }
        if (onProgress) {
            onProgress(0.5);
            onProgress(1.0);
        }
        return std::unique_ptr<model::INativeHandle>(
            std::make_unique<FakeNativeHandle>(manifest.modelId, log_, script));
    }

    void setScript(GenerationScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    void failLoad(const std::string& modelId, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        loadFailures_[modelId] = std::move(message);
    }

    std::optional<model::LoadManifest> lastManifest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastManifest_;
    }

    NativeEventLog& log() { return *log_; }

private:
    std::shared_ptr<NativeEventLog> log_;
    mutable std::mutex mutex_;
    GenerationScript script_;
    std::map<std::string, std::string> loadFailures_;
    std::optional<model::LoadManifest> lastManifest_;
};

class MockNativeHandle : public model::INativeHandle {
public:
    MOCK_METHOD(void, generate,
                (const std::string&, const model::GenerationConfig&, model::TokenCallback,
                 model::CompletionCallback),
                (override));
    MOCK_METHOD(void, interrupt, (), (override));
    MOCK_METHOD(Result<void>, unload, (), (override));
    MOCK_METHOD(bool, supportsCompletionEvent, (), (const, override));
};

class MockNativeRuntime : public model::INativeRuntime {
public:
    MOCK_METHOD((Result<std::unique_ptr<model::INativeHandle>>), load,
                (const model::LoadManifest&, const model::GenerationConfig&,
                 model::LoadProgressCallback),
                (override));
};

/**
 * Download state where chosen models are Ready with a model file under `root`.
 */
class StaticDownloadStatus : public downloader::IDownloadStatusProvider {
public:
    explicit StaticDownloadStatus(std::filesystem::path root) : root_(std::move(root)) {}

    void markReady(const std::string& modelId) {
        downloader::DownloadRecord r;
        r.modelId = modelId;
        r.name = modelId;
        r.status = downloader::DownloadStatus::Ready;
        r.progress = 1.0;
        downloader::DownloadedFile f;
        f.role = FileRole::Model;
        f.url = "https://example.invalid/" + modelId + ".gguf";
        f.fileName = modelId + ".gguf";
        f.localPath = root_ / modelId / f.fileName;
        f.complete = true;
        r.files.push_back(f);
        std::lock_guard<std::mutex> lock(mutex_);
        records_[modelId] = r;
    }

    std::optional<downloader::DownloadRecord>
    findRecord(const std::string& modelId) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(modelId);
        if (it == records_.end())
            return std::nullopt;
        return it->second;
    }

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, downloader::DownloadRecord> records_;
};

} // namespace modelflux::tests
