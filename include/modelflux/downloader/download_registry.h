#pragma once

#include <modelflux/core/model_descriptor.h>
#include <modelflux/core/types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelflux::downloader {

enum class DownloadStatus { NotDownloaded, Downloading, Paused, Ready, Error };

const char* downloadStatusName(DownloadStatus status);
std::optional<DownloadStatus> parseDownloadStatus(std::string_view name);

/**
 * A manifest file and where it lives locally once complete.
 */
struct DownloadedFile {
    FileRole role{FileRole::Model};
    std::string url;
    std::string fileName;
    std::optional<std::uint64_t> sizeBytes;
    std::optional<std::string> sha256;
    std::filesystem::path localPath; // empty until the file is finalized
    bool complete{false};
};

/**
 * Persisted download state of one model. Survives process restart; a record left in
 * Downloading status is picked up again by reattach().
 */
struct DownloadRecord {
    std::string modelId;
    std::string name;
    DownloadStatus status{DownloadStatus::NotDownloaded};
    double progress{0.0}; // [0,1]
    std::vector<DownloadedFile> files;
    std::string error;
    std::uint64_t bytesDownloaded{0};
    std::uint64_t bytesTotal{0};
    std::int64_t updatedAt{0}; // unix seconds

    [[nodiscard]] std::optional<std::filesystem::path> localPath(FileRole role) const;
    [[nodiscard]] bool isReady() const { return status == DownloadStatus::Ready; }

    static DownloadRecord fromDescriptor(const ModelDescriptor& descriptor);
};

/**
 * Read-only view of download state, consumed by components that must refuse to load
 * a model whose files are not all on disk.
 */
class IDownloadStatusProvider {
public:
    virtual ~IDownloadStatusProvider() = default;
    [[nodiscard]] virtual std::optional<DownloadRecord>
    findRecord(const std::string& modelId) const = 0;
};

/**
 * JSON-backed registry of DownloadRecords (downloads.json). Every mutation is written
 * through with temp-file + rename.
 */
class DownloadRegistry {
public:
    explicit DownloadRegistry(std::filesystem::path file);

    Result<void> load();

    [[nodiscard]] std::optional<DownloadRecord> get(const std::string& modelId) const;
    [[nodiscard]] std::vector<DownloadRecord> list() const;

    Result<void> put(DownloadRecord record);
    Result<void> erase(const std::string& modelId);

    /**
     * Re-check Ready records against the filesystem: every file must exist with the
     * recorded size, and with `deep` also the recorded SHA-256. Failing records are
     * demoted to NotDownloaded. Returns the demoted model ids.
     */
    std::vector<std::string> verifyReady(bool deep);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    Result<void> persistLocked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, DownloadRecord> records_;
};

} // namespace modelflux::downloader
