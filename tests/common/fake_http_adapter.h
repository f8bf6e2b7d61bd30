#pragma once

#include <modelflux/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace modelflux::tests {

/**
 * In-memory HTTP server for downloader tests. Serves fixed bodies per URL and can inject
 * a one-shot or persistent network failure, a one-shot stall (blocks until the transfer is
 * cancelled), or behave like a server that ignores Range requests.
 */
class FakeHttpAdapter : public downloader::IHttpAdapter {
public:
    void serve(const std::string& url, std::string body, std::string etag = "\"v1\"") {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url] = Object{std::move(body), std::move(etag)};
    }

    void setIgnoreRange(bool ignore) { ignoreRange_ = ignore; }
    void setSliceSize(std::size_t size) { sliceSize_ = std::max<std::size_t>(1, size); }

    void failOnceAfter(const std::string& url, std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url].failAt = bytes;
    }

    // Every request for `url` drops after `bytes` bytes of the body
    void failAlwaysAfter(const std::string& url, std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url].failAt = bytes;
        objects_[url].failPersistent = true;
    }

    void stallOnceAfter(const std::string& url, std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url].stallAt = bytes;
    }

    bool waitForStall(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stalled_; });
    }

    std::vector<std::uint64_t> requestedOffsets(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(url);
        return it == objects_.end() ? std::vector<std::uint64_t>{} : it->second.offsets;
    }

    std::uint64_t bytesServed(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(url);
        return it == objects_.end() ? 0 : it->second.served;
    }

    Result<downloader::ProbeResult> probe(std::string_view url,
                                          const downloader::TransferOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(std::string(url));
        if (it == objects_.end()) {
            return downloader::httpStatusError(404);
        }
        downloader::ProbeResult pr;
        pr.resumeSupported = !ignoreRange_;
        pr.contentLength = it->second.body.size();
        pr.etag = it->second.etag;
        return pr;
    }

    Result<void> fetchRange(std::string_view url, std::uint64_t offset,
                            const downloader::TransferOptions&,
                            const downloader::ResponseStart& onStart,
                            const downloader::ByteSink& sink,
                            const downloader::ShouldCancel& shouldCancel) override {
        std::string body;
        std::optional<std::uint64_t> failAt;
        std::optional<std::uint64_t> stallAt;
        bool failPersistent = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = objects_.find(std::string(url));
            if (it == objects_.end()) {
                return downloader::httpStatusError(404);
            }
            auto& obj = it->second;
            obj.offsets.push_back(offset);
            body = obj.body;
            failAt = obj.failAt;
            stallAt = obj.stallAt;
            failPersistent = obj.failPersistent;
        }

        const std::uint64_t start = ignoreRange_ ? 0 : offset;
        if (start > body.size()) {
            return downloader::httpStatusError(416);
        }
        if (onStart) {
            auto r = onStart(start, static_cast<std::uint64_t>(body.size()));
            if (!r)
                return r;
        }

        std::uint64_t pos = start;
        while (pos < body.size()) {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
            }
            if (stallAt && pos >= *stallAt) {
                clearStall(std::string(url));
                while (!(shouldCancel && shouldCancel())) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
                return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
            }
            if (failAt && pos >= *failAt) {
                if (!failPersistent)
                    clearFailure(std::string(url));
                return Error{ErrorCode::NetworkError, "Connection reset by peer"};
            }

            std::uint64_t end = std::min<std::uint64_t>(body.size(), pos + sliceSize_);
            if (stallAt && pos < *stallAt)
                end = std::min(end, *stallAt);
            if (failAt && pos < *failAt)
                end = std::min(end, *failAt);

            auto r = sink(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(body.data() + pos), end - pos));
            if (!r)
                return r;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                objects_[std::string(url)].served += end - pos;
            }
            pos = end;
        }
        return {};
    }

private:
    struct Object {
        std::string body;
        std::string etag;
        std::optional<std::uint64_t> failAt;
        std::optional<std::uint64_t> stallAt;
        bool failPersistent{false};
        std::vector<std::uint64_t> offsets;
        std::uint64_t served{0};
    };

    void clearStall(const std::string& url) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            objects_[url].stallAt.reset();
            stalled_ = true;
        }
        cv_.notify_all();
    }

    void clearFailure(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url].failAt.reset();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Object> objects_;
    std::atomic<bool> ignoreRange_{false};
    std::atomic<std::size_t> sliceSize_{1024};
    bool stalled_{false};
};

} // namespace modelflux::tests
