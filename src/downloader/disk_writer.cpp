/*
 * disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging files opened once per transfer with restrictive permissions (0600)
 * - Positional writes (pwrite); ENOSPC/EDQUOT surface as StorageFull so the caller aborts
 *   without retrying
 * - Atomic rename into the model directory; EXDEV fallback copies, fsyncs and renames
 */

#include <modelflux/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace modelflux::downloader {

namespace fs = std::filesystem;

namespace {

Error errnoError(int err, const std::string& what) {
    const std::string msg = what + ": " + std::strerror(err);
    if (err == ENOSPC || err == EDQUOT) {
        return Error{ErrorCode::StorageFull, msg};
    }
    if (err == EACCES || err == EPERM || err == EROFS) {
        return Error{ErrorCode::PermissionDenied, msg};
    }
    return Error{ErrorCode::IoError, msg};
}

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return errnoError(errno, "open() failed for fsync " + p.string());
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return errnoError(err, "fsync() failed for " + p.string());
    }
    ::close(fd);
    return {};
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return errnoError(errno, "open(O_DIRECTORY) failed for " + dir.string());
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return errnoError(err, "fsync(dir) failed for " + dir.string());
    }
    ::close(fd);
    return {};
}

void ensure_private_dir(const fs::path& dir) {
    std::error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("[DiskWriter] Failed to set permissions for dir {}: {}", dir.string(),
                      ec.message());
    }
}

class PosixStagingFile final : public IStagingFile {
public:
    PosixStagingFile(fs::path path, int fd, std::uint64_t size)
        : path_(std::move(path)), fd_(fd), size_(size) {}

    ~PosixStagingFile() override {
        if (fd_ >= 0)
            ::close(fd_);
    }

    PosixStagingFile(const PosixStagingFile&) = delete;
    PosixStagingFile& operator=(const PosixStagingFile&) = delete;

    const fs::path& path() const override { return path_; }
    std::uint64_t size() const override { return size_; }

    Result<void> writeAt(std::uint64_t offset, std::span<const std::byte> data) override {
        const auto* p = reinterpret_cast<const char*>(data.data());
        std::size_t left = data.size();
        auto pos = static_cast<off_t>(offset);
        while (left > 0) {
            ssize_t n = ::pwrite(fd_, p, left, pos);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return errnoError(errno, "write failed on " + path_.string());
            }
            p += n;
            pos += n;
            left -= static_cast<std::size_t>(n);
        }
        size_ = std::max<std::uint64_t>(size_, offset + data.size());
        return {};
    }

    Result<void> truncate(std::uint64_t size) override {
        if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
            return errnoError(errno, "ftruncate failed on " + path_.string());
        }
        size_ = size;
        return {};
    }

    Result<void> sync() override {
        if (::fsync(fd_) != 0) {
            return errnoError(errno, "fsync() failed for " + path_.string());
        }
        return fsync_dir(path_.parent_path());
    }

private:
    fs::path path_;
    int fd_{-1};
    std::uint64_t size_{0};
};

// Copy file contents and ensure durability (fsync destination and dir)
Result<void> copy_file_fsync(const fs::path& src, const fs::path& dst) {
    {
        std::ifstream is(src, std::ios::binary);
        if (!is.good()) {
            return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
        }
        std::ofstream os(dst, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "copy: failed to open destination: " + dst.string()};
        }
        std::vector<char> buffer(1 << 20);
        while (is.good()) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = is.gcount();
            if (got > 0) {
                os.write(buffer.data(), got);
                if (!os.good()) {
                    return Error{ErrorCode::StorageFull,
                                 "copy: write failed for destination: " + dst.string()};
                }
            }
        }
        if (!is.eof()) {
            return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
        }
    }
    auto rf = fsync_file(dst);
    if (!rf)
        return rf;
    return fsync_dir(dst.parent_path());
}

class DiskWriter final : public IDiskWriter {
public:
    Result<std::unique_ptr<IStagingFile>> openStaging(const fs::path& stagingPath) override {
        std::error_code ec;
        fs::create_directories(stagingPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create staging dir " + stagingPath.parent_path().string() +
                             ": " + ec.message()};
        }
        ensure_private_dir(stagingPath.parent_path());

        int fd = ::open(stagingPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0) {
            return errnoError(errno, "Failed to open staging file " + stagingPath.string());
        }
        struct stat st {};
        if (::fstat(fd, &st) != 0) {
            int err = errno;
            ::close(fd);
            return errnoError(err, "fstat failed on " + stagingPath.string());
        }
        std::unique_ptr<IStagingFile> file = std::make_unique<PosixStagingFile>(
            stagingPath, fd, static_cast<std::uint64_t>(st.st_size));
        return file;
    }

    Result<fs::path> finalize(const fs::path& stagingPath, const fs::path& finalPath) override {
        std::error_code ec;
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create model dir: " + finalPath.parent_path().string()};
        }

        auto r = fsync_file(stagingPath);
        if (!r)
            return r.error();

        std::error_code ren_ec;
        fs::rename(stagingPath, finalPath, ren_ec);
        if (ren_ec) {
            if (ren_ec != std::errc::cross_device_link) {
                return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() +
                                                     ") from " + stagingPath.string() + " to " +
                                                     finalPath.string()};
            }
            spdlog::warn("[DiskWriter] Cross-device rename; copying {} to {}",
                         stagingPath.string(), finalPath.string());
            fs::path tmp = finalPath;
            tmp += ".tmp";
            auto copied = copy_file_fsync(stagingPath, tmp);
            if (!copied) {
                cleanup(tmp);
                return copied.error();
            }
            fs::rename(tmp, finalPath, ren_ec);
            if (ren_ec) {
                cleanup(tmp);
                return Error{ErrorCode::IoError, "rename() failed after copy: " + ren_ec.message()};
            }
            cleanup(stagingPath);
        }

        auto rd = fsync_dir(finalPath.parent_path());
        if (!rd) {
            spdlog::debug("[DiskWriter] fsync on model dir failed (continuing): {}",
                          rd.error().message);
        }
        return finalPath;
    }

    void cleanup(const fs::path& stagingPath) noexcept override {
        std::error_code ec;
        fs::remove(stagingPath, ec);
        if (ec) {
            spdlog::debug("[DiskWriter] cleanup: failed to remove {}: {}", stagingPath.string(),
                          ec.message());
        }
    }
};

} // namespace

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace modelflux::downloader
