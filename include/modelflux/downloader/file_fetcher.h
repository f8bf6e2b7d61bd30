#pragma once

#include <modelflux/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace modelflux::downloader {

/**
 * One file to fetch: source URL, where partial bytes are staged, and where the verified
 * file ends up.
 */
struct FetchRequest {
    std::string url;
    std::filesystem::path stagingPath;
    std::filesystem::path finalPath;
    std::optional<std::uint64_t> expectedSize;
    std::optional<std::string> expectedSha256;
};

struct FetchedFile {
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
    std::string sha256;
};

// (bytes in staging so far, total if known); may move backwards when a server ignores Range
using FetchProgressCallback =
    std::function<void(std::uint64_t bytes, std::optional<std::uint64_t> total)>;

/**
 * Resumable single-file transfer with bounded retries.
 *
 * Each attempt probes the server, resumes from the contiguous prefix recorded in the resume
 * store when validators (ETag/Last-Modified/size) still match, re-hashes the staged prefix,
 * streams the remainder, verifies size and SHA-256, and renames the staging file into place.
 *
 * Failure policy:
 * - transient errors (network, timeout, 5xx/408/429) retry with exponential backoff
 * - checksum or size mismatch deletes the partial file and its resume state, no retry
 * - StorageFull deletes the partial file and its resume state, no retry
 * - other terminal errors return immediately, keeping the partial
 * - cancellation returns OperationCancelled, keeping the partial for a later resume
 */
class FileFetcher {
public:
    struct Options {
        TransferOptions transfer{};
        RetryPolicy retry{};
        std::uint64_t persistIntervalBytes{4ull * 1024ull * 1024ull};
    };

    FileFetcher(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<IDiskWriter> disk,
                std::shared_ptr<IResumeStore> resume, Options options);

    Result<FetchedFile> fetch(const FetchRequest& request, const ShouldCancel& shouldCancel,
                              const FetchProgressCallback& onProgress = {});

    // Drop staged bytes and resume state for a request
    void discard(const FetchRequest& request);

    [[nodiscard]] const Options& options() const { return options_; }

private:
    Result<FetchedFile> attemptOnce(const FetchRequest& request, const ShouldCancel& shouldCancel,
                                    const FetchProgressCallback& onProgress);

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IResumeStore> resume_;
    Options options_;
};

} // namespace modelflux::downloader
