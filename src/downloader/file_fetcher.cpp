/*
 * file_fetcher.cpp
 *
 * Single-file resumable transfer:
 * - Probe server for range support, size and validators
 * - Resume from the persisted contiguous prefix when validators match, else restart
 * - Re-seed SHA-256 from the staged prefix so the final digest covers the whole file
 * - Stream the remainder through the staging file, persisting resume state periodically
 * - Verify size and checksum, then atomically rename into place
 * - Retry transient failures with exponential backoff
 */

#include <modelflux/downloader/file_fetcher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <thread>
#include <vector>

namespace modelflux::downloader {

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    const double scaled = static_cast<double>(initialBackoff.count()) *
                          std::pow(multiplier, static_cast<double>(attempt - 1));
    const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

namespace {

bool isCancelled(const ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

// Sleep in short slices so pause/cancel does not wait out a long backoff
bool sleepUnlessCancelled(std::chrono::milliseconds total, const ShouldCancel& shouldCancel) {
    constexpr auto kSlice = std::chrono::milliseconds(25);
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        if (isCancelled(shouldCancel))
            return false;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            kSlice, deadline - std::chrono::steady_clock::now()));
    }
    return !isCancelled(shouldCancel);
}

bool validatorsMatch(const IResumeStore::State& prior, const ProbeResult& probe) {
    if (prior.etag || probe.etag) {
        return prior.etag && probe.etag && *prior.etag == *probe.etag;
    }
    if (prior.lastModified || probe.lastModified) {
        if (!(prior.lastModified && probe.lastModified && *prior.lastModified == *probe.lastModified))
            return false;
    }
    if (prior.totalBytes != 0 && probe.contentLength) {
        return prior.totalBytes == *probe.contentLength;
    }
    return true;
}

Result<void> hashPrefix(const std::filesystem::path& path, std::uint64_t length,
                        IIntegrityVerifier& verifier) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot reopen staging file " + path.string()};
    }
    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    std::uint64_t remaining = length;
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
        in.read(buffer.data(), want);
        const auto got = in.gcount();
        if (got <= 0) {
            return Error{ErrorCode::CorruptedData, "Staging file shorter than resume state"};
        }
        verifier.update(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        remaining -= static_cast<std::uint64_t>(got);
    }
    return {};
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

FileFetcher::FileFetcher(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<IDiskWriter> disk,
                         std::shared_ptr<IResumeStore> resume, Options options)
    : http_(std::move(http)), disk_(std::move(disk)), resume_(std::move(resume)),
      options_(std::move(options)) {
    if (!disk_)
        disk_ = makeDiskWriter();
}

Result<FetchedFile> FileFetcher::fetch(const FetchRequest& request,
                                       const ShouldCancel& shouldCancel,
                                       const FetchProgressCallback& onProgress) {
    if (request.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "No HTTP adapter configured"};
    }

    const int maxAttempts = std::max(1, options_.retry.maxAttempts);
    for (int attempt = 1;; ++attempt) {
        auto result = attemptOnce(request, shouldCancel, onProgress);
        if (result) {
            return result;
        }
        const auto& err = result.error();
        if (err.code == ErrorCode::StorageFull) {
            // A partial that filled the disk is never worth resuming
            spdlog::error("[FileFetcher] Disk full while fetching {}; discarding partial",
                          request.url);
            discard(request);
            return result;
        }
        if (err.code == ErrorCode::OperationCancelled || !isTransient(err.code)) {
            return result;
        }
        if (attempt >= maxAttempts) {
            spdlog::error("[FileFetcher] Giving up on {} after {} attempts: {}", request.url,
                          attempt, err.message);
            return Error{err.code, "Failed after " + std::to_string(attempt) +
                                       " attempts: " + err.message};
        }
        const auto delay = options_.retry.delayFor(attempt);
        spdlog::warn("[FileFetcher] Attempt {}/{} for {} failed ({}), retrying in {} ms", attempt,
                     maxAttempts, request.url, err.message, delay.count());
        if (!sleepUnlessCancelled(delay, shouldCancel)) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled during backoff"};
        }
    }
}

void FileFetcher::discard(const FetchRequest& request) {
    disk_->cleanup(request.stagingPath);
    if (resume_)
        resume_->remove(request.url);
}

Result<FetchedFile> FileFetcher::attemptOnce(const FetchRequest& request,
                                             const ShouldCancel& shouldCancel,
                                             const FetchProgressCallback& onProgress) {
    if (isCancelled(shouldCancel)) {
        return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
    }

    auto pr = http_->probe(request.url, options_.transfer);
    if (!pr) {
        return pr.error();
    }
    const ProbeResult probe = pr.value();
    if (probe.contentLength && request.expectedSize && *probe.contentLength != *request.expectedSize) {
        discard(request);
        return Error{ErrorCode::HashMismatch,
                     "Remote size " + std::to_string(*probe.contentLength) +
                         " does not match manifest size " + std::to_string(*request.expectedSize)};
    }

    std::optional<IResumeStore::State> priorState;
    if (resume_) {
        auto lr = resume_->load(request.url);
        if (lr) {
            priorState = lr.value();
        } else {
            spdlog::warn("[FileFetcher] Resume state unavailable for {}: {}", request.url,
                         lr.error().message);
        }
    }

    auto staged = disk_->openStaging(request.stagingPath);
    if (!staged) {
        return staged.error();
    }
    std::unique_ptr<IStagingFile> file = std::move(staged).value();

    std::vector<ByteRange> completedRanges;
    std::uint64_t resumeOffset = 0;
    const bool canResume =
        probe.resumeSupported && priorState && validatorsMatch(*priorState, probe);
    if (canResume) {
        completedRanges = priorState->completedRanges;
        normalizeRanges(completedRanges);
        resumeOffset = std::min(contiguousPrefixLength(completedRanges), file->size());
    } else if (file->size() > 0) {
        spdlog::info("[FileFetcher] Discarding {} staged bytes for {} (validators changed or "
                     "range unsupported)",
                     file->size(), request.url);
    }
    if (file->size() != resumeOffset) {
        auto tr = file->truncate(resumeOffset);
        if (!tr)
            return tr.error();
    }
    completedRanges.clear();
    appendRange(completedRanges, 0, resumeOffset);

    auto verifier = makeSha256Verifier();
    if (resumeOffset > 0) {
        auto hr = hashPrefix(file->path(), resumeOffset, *verifier);
        if (!hr) {
            spdlog::warn("[FileFetcher] {}; restarting {}", hr.error().message, request.url);
            auto tr = file->truncate(0);
            if (!tr)
                return tr.error();
            verifier->reset();
            resumeOffset = 0;
            completedRanges.clear();
        } else {
            spdlog::info("[FileFetcher] Resuming {} from offset {}", request.url, resumeOffset);
        }
    }

    std::uint64_t written = resumeOffset;
    std::optional<std::uint64_t> totalBytes =
        probe.contentLength ? probe.contentLength : request.expectedSize;

    IResumeStore::State resumeState;
    resumeState.etag = probe.etag;
    resumeState.lastModified = probe.lastModified;
    const bool persistResume = resume_ && probe.resumeSupported;
    std::uint64_t lastPersisted = written;
    auto persistState = [&](bool force) {
        if (!persistResume)
            return;
        if (!force && written < lastPersisted + options_.persistIntervalBytes)
            return;
        resumeState.completedRanges = completedRanges;
        resumeState.totalBytes = totalBytes.value_or(0);
        auto sr = resume_->save(request.url, resumeState);
        if (!sr) {
            spdlog::warn("[FileFetcher] Failed to persist resume state for {}: {}", request.url,
                         sr.error().message);
        } else {
            lastPersisted = written;
        }
    };

    if (onProgress) {
        onProgress(written, totalBytes);
    }

    const bool alreadyComplete = totalBytes && *totalBytes > 0 && written == *totalBytes;
    if (!alreadyComplete) {
        auto onStart = [&](std::uint64_t effectiveOffset,
                           std::optional<std::uint64_t> objectSize) -> Result<void> {
            if (objectSize) {
                totalBytes = objectSize;
            }
            if (effectiveOffset == written) {
                return {};
            }
            // Server ignored the Range header: start the file over
            spdlog::warn("[FileFetcher] Server ignored range request for {}; restarting at 0",
                         request.url);
            auto tr = file->truncate(0);
            if (!tr)
                return tr;
            verifier->reset();
            completedRanges.clear();
            written = 0;
            lastPersisted = 0;
            return {};
        };

        auto sink = [&](std::span<const std::byte> data) -> Result<void> {
            const std::uint64_t chunkStart = written;
            auto wr = file->writeAt(chunkStart, data);
            if (!wr) {
                return wr;
            }
            verifier->update(data);
            written += static_cast<std::uint64_t>(data.size());
            appendRange(completedRanges, chunkStart, static_cast<std::uint64_t>(data.size()));
            persistState(false);
            if (onProgress) {
                onProgress(written, totalBytes);
            }
            return {};
        };

        auto fr =
            http_->fetchRange(request.url, written, options_.transfer, onStart, sink, shouldCancel);
        if (!fr) {
            persistState(true);
            return fr.error();
        }
    }

    auto fail = [&](Error err) -> Result<FetchedFile> {
        file.reset();
        discard(request);
        return err;
    };

    const std::optional<std::uint64_t> expected =
        request.expectedSize ? request.expectedSize : totalBytes;
    if (expected && written < *expected) {
        // Connection closed early without a transport error; keep the prefix and retry
        persistState(true);
        return Error{ErrorCode::NetworkError, "Short transfer: got " + std::to_string(written) +
                                                  " of " + std::to_string(*expected) + " bytes"};
    }
    if (expected && written > *expected) {
        spdlog::error("[FileFetcher] Size mismatch for {}: expected {}, got {}", request.url,
                      *expected, written);
        return fail(Error{ErrorCode::HashMismatch, "Size mismatch (expected " +
                                                       std::to_string(*expected) + " bytes, got " +
                                                       std::to_string(written) + ")"});
    }

    auto sr = file->sync();
    if (!sr) {
        persistState(true);
        return sr.error();
    }

    const std::string digest = verifier->finalize();
    if (digest.empty()) {
        return fail(Error{ErrorCode::InternalError, "Failed to finalize checksum"});
    }
    if (request.expectedSha256 && toLower(*request.expectedSha256) != digest) {
        spdlog::error("[FileFetcher] Checksum mismatch for {}: expected {}, got {}", request.url,
                      *request.expectedSha256, digest);
        return fail(Error{ErrorCode::HashMismatch, "Checksum mismatch (expected " +
                                                       *request.expectedSha256 + ", got " +
                                                       digest + ")"});
    }

    file.reset();
    auto finalRes = disk_->finalize(request.stagingPath, request.finalPath);
    if (!finalRes) {
        return finalRes.error();
    }
    if (resume_) {
        resume_->remove(request.url);
    }

    FetchedFile out;
    out.path = finalRes.value();
    out.sizeBytes = written;
    out.sha256 = digest;
    return out;
}

} // namespace modelflux::downloader
