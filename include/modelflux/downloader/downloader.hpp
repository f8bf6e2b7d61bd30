#pragma once

/*
 * ModelFlux Downloader - Transfer Types and Component Interfaces (C++20)
 *
 * Building blocks used by the model download manager to fetch large model files:
 * - IHttpAdapter: HEAD probe and ranged GET (libcurl implementation)
 * - IIntegrityVerifier: streaming SHA-256 (OpenSSL EVP implementation)
 * - IDiskWriter / IStagingFile: staging files with positional writes and atomic finalize
 * - IResumeStore: persisted per-URL validators and completed byte ranges
 *
 * Partial bytes always live in a staging file on the same filesystem as the final
 * model directory so finalize is a rename.
 */

#include <modelflux/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelflux::downloader {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Retry/backoff policy for transient transfer failures.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    // Delay before retry number `attempt` (1-based: the wait after the first failure is attempt 1)
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const;
};

/**
 * Per-request transfer options.
 */
struct TransferOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{0}; // 0 = no overall limit
    std::chrono::milliseconds connectTimeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Server metadata returned by a probe.
 */
struct ProbeResult {
    bool resumeSupported{false};
    std::optional<std::uint64_t> contentLength;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
};

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

/**
 * Called once before the first body byte. `effectiveOffset` is the offset the server
 * actually honored: the requested offset for a 206 response, 0 when the server ignored
 * the Range header and is sending the whole object.
 */
using ResponseStart =
    std::function<Result<void>(std::uint64_t effectiveOffset, std::optional<std::uint64_t> total)>;
using ByteSink = std::function<Result<void>(std::span<const std::byte>)>;

/**
 * Transient failures worth retrying: connection problems, timeouts, 5xx/408/429.
 */
[[nodiscard]] inline bool isTransient(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::ServerError;
}

/**
 * Maps an HTTP status >= 400 to an error. 5xx, 408 and 429 map to ServerError (transient).
 */
Error httpStatusError(long status);

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata (HEAD preferred) for resume capability and content length.
     */
    virtual Result<ProbeResult> probe(std::string_view url, const TransferOptions& options) = 0;

    /**
     * Stream [offset, EOF) to `sink`. `onStart` reports the offset the server honored
     * before any bytes reach the sink. Cancellation returns OperationCancelled.
     */
    virtual Result<void> fetchRange(std::string_view url, std::uint64_t offset,
                                    const TransferOptions& options, const ResponseStart& onStart,
                                    const ByteSink& sink, const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming SHA-256).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    // Lower-case hex digest; empty on failure. Resets for reuse.
    virtual std::string finalize() = 0;
};

/**
 * An open staging file. Writes are positional; the file is closed on destruction.
 */
class IStagingFile {
public:
    virtual ~IStagingFile() = default;
    [[nodiscard]] virtual const std::filesystem::path& path() const = 0;
    [[nodiscard]] virtual std::uint64_t size() const = 0;
    // ENOSPC maps to StorageFull
    virtual Result<void> writeAt(std::uint64_t offset, std::span<const std::byte> data) = 0;
    virtual Result<void> truncate(std::uint64_t size) = 0;
    virtual Result<void> sync() = 0;
};

/**
 * Disk writer for staging and finalize.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create (0600) or reopen a staging file. Parent directories are created privately.
     */
    virtual Result<std::unique_ptr<IStagingFile>>
    openStaging(const std::filesystem::path& stagingPath) = 0;

    /**
     * Move the staging file to `finalPath`. Atomic rename; on EXDEV falls back to
     * copy + fsync + rename.
     */
    virtual Result<std::filesystem::path> finalize(const std::filesystem::path& stagingPath,
                                                   const std::filesystem::path& finalPath) = 0;

    /**
     * Best-effort cleanup of a staging file.
     */
    virtual void cleanup(const std::filesystem::path& stagingPath) noexcept = 0;
};

/**
 * Resume persistence for partial downloads (validators + completed ranges).
 */
class IResumeStore {
public:
    struct State {
        std::optional<std::string> etag;
        std::optional<std::string> lastModified;
        std::vector<std::pair<std::uint64_t, std::uint64_t>> completedRanges; // [offset, length]
        std::uint64_t totalBytes{0};                                          // 0 if unknown
    };

    virtual ~IResumeStore() = default;

    virtual Result<std::optional<State>> load(std::string_view key) = 0;
    virtual Result<void> save(std::string_view key, const State& state) = 0;
    virtual void remove(std::string_view key) noexcept = 0;
};

using ByteRange = std::pair<std::uint64_t, std::uint64_t>;

// Sort and merge overlapping/adjacent ranges; drops empty ones
void normalizeRanges(std::vector<ByteRange>& ranges);
// Append a range, merging with the last one when contiguous
void appendRange(std::vector<ByteRange>& ranges, std::uint64_t offset, std::uint64_t length);
// Bytes covered from offset 0 without a gap
std::uint64_t contiguousPrefixLength(const std::vector<ByteRange>& ranges);

// Streaming SHA-256 of a file prefix (or the whole file when limit is nullopt)
Result<std::string> sha256File(const std::filesystem::path& path,
                               std::optional<std::uint64_t> limit = std::nullopt);

// Factories
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IIntegrityVerifier> makeSha256Verifier();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IResumeStore> makeJsonResumeStore(const std::filesystem::path& file);

} // namespace modelflux::downloader
