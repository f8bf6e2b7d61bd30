#include <modelflux/downloader/download_registry.h>
#include <modelflux/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

namespace modelflux::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr int kRegistryVersion = 1;

std::int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

json fileToJson(const DownloadedFile& f) {
    json j = json::object();
    j["role"] = fileRoleName(f.role);
    j["url"] = f.url;
    j["file_name"] = f.fileName;
    if (f.sizeBytes)
        j["size_bytes"] = *f.sizeBytes;
    if (f.sha256)
        j["sha256"] = *f.sha256;
    if (!f.localPath.empty())
        j["local_path"] = f.localPath.string();
    j["complete"] = f.complete;
    return j;
}

std::optional<DownloadedFile> fileFromJson(const json& j) {
    if (!j.is_object() || !j.contains("url") || !j["url"].is_string())
        return std::nullopt;
    DownloadedFile f;
    f.url = j["url"].get<std::string>();
    f.role = parseFileRole(j.value("role", std::string("model"))).value_or(FileRole::Model);
    f.fileName = j.value("file_name", std::string{});
    if (j.contains("size_bytes") && j["size_bytes"].is_number_unsigned())
        f.sizeBytes = j["size_bytes"].get<std::uint64_t>();
    if (j.contains("sha256") && j["sha256"].is_string())
        f.sha256 = j["sha256"].get<std::string>();
    if (j.contains("local_path") && j["local_path"].is_string())
        f.localPath = j["local_path"].get<std::string>();
    f.complete = j.value("complete", false);
    return f;
}

json recordToJson(const DownloadRecord& r) {
    json j = json::object();
    j["name"] = r.name;
    j["status"] = downloadStatusName(r.status);
    j["progress"] = r.progress;
    j["error"] = r.error;
    j["bytes_downloaded"] = r.bytesDownloaded;
    j["bytes_total"] = r.bytesTotal;
    j["updated_at"] = r.updatedAt;
    j["files"] = json::array();
    for (const auto& f : r.files) {
        j["files"].push_back(fileToJson(f));
    }
    return j;
}

std::optional<DownloadRecord> recordFromJson(const std::string& id, const json& j) {
    if (!j.is_object())
        return std::nullopt;
    DownloadRecord r;
    r.modelId = id;
    r.name = j.value("name", std::string{});
    r.status = parseDownloadStatus(j.value("status", std::string{}))
                   .value_or(DownloadStatus::NotDownloaded);
    r.progress = j.value("progress", 0.0);
    r.error = j.value("error", std::string{});
    r.bytesDownloaded = j.value("bytes_downloaded", std::uint64_t{0});
    r.bytesTotal = j.value("bytes_total", std::uint64_t{0});
    r.updatedAt = j.value("updated_at", std::int64_t{0});
    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& fj : j["files"]) {
            if (auto f = fileFromJson(fj))
                r.files.push_back(std::move(*f));
        }
    }
    return r;
}

} // namespace

const char* downloadStatusName(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::NotDownloaded:
            return "not_downloaded";
        case DownloadStatus::Downloading:
            return "downloading";
        case DownloadStatus::Paused:
            return "paused";
        case DownloadStatus::Ready:
            return "ready";
        case DownloadStatus::Error:
            return "error";
    }
    return "not_downloaded";
}

std::optional<DownloadStatus> parseDownloadStatus(std::string_view name) {
    if (name == "not_downloaded")
        return DownloadStatus::NotDownloaded;
    if (name == "downloading")
        return DownloadStatus::Downloading;
    if (name == "paused")
        return DownloadStatus::Paused;
    if (name == "ready")
        return DownloadStatus::Ready;
    if (name == "error")
        return DownloadStatus::Error;
    return std::nullopt;
}

std::optional<fs::path> DownloadRecord::localPath(FileRole role) const {
    for (const auto& f : files) {
        if (f.role == role && f.complete && !f.localPath.empty())
            return f.localPath;
    }
    return std::nullopt;
}

DownloadRecord DownloadRecord::fromDescriptor(const ModelDescriptor& descriptor) {
    DownloadRecord r;
    r.modelId = descriptor.id;
    r.name = descriptor.name;
    for (const auto& mf : descriptor.files) {
        DownloadedFile f;
        f.role = mf.role;
        f.url = mf.url;
        f.fileName = mf.fileName.empty() ? fs::path(mf.url).filename().string() : mf.fileName;
        f.sizeBytes = mf.sizeBytes;
        f.sha256 = mf.sha256;
        if (mf.sizeBytes)
            r.bytesTotal += *mf.sizeBytes;
        r.files.push_back(std::move(f));
    }
    if (r.bytesTotal == 0)
        r.bytesTotal = descriptor.sizeEstimate;
    return r;
}

DownloadRegistry::DownloadRegistry(fs::path file) : path_(std::move(file)) {}

Result<void> DownloadRegistry::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return {};
    }
    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot read download registry " + path_.string()};
    }
    json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        return Error{ErrorCode::CorruptedData, "Download registry is not valid JSON: " +
                                                   path_.string()};
    }
    if (root.value("version", kRegistryVersion) > kRegistryVersion) {
        return Error{ErrorCode::NotSupported, "Download registry written by a newer version"};
    }
    if (root.contains("models") && root["models"].is_object()) {
        for (auto it = root["models"].begin(); it != root["models"].end(); ++it) {
            if (auto r = recordFromJson(it.key(), it.value())) {
                records_.emplace(it.key(), std::move(*r));
            } else {
                spdlog::warn("[DownloadRegistry] Skipping malformed record '{}'", it.key());
            }
        }
    }
    spdlog::debug("[DownloadRegistry] Loaded {} records from {}", records_.size(),
                  path_.string());
    return {};
}

std::optional<DownloadRecord> DownloadRegistry::get(const std::string& modelId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(modelId);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<DownloadRecord> DownloadRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, r] : records_) {
        out.push_back(r);
    }
    return out;
}

Result<void> DownloadRegistry::put(DownloadRecord record) {
    if (record.modelId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Download record without model id"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    record.updatedAt = nowSeconds();
    records_[record.modelId] = std::move(record);
    return persistLocked();
}

Result<void> DownloadRegistry::erase(const std::string& modelId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(modelId) == 0)
        return {};
    return persistLocked();
}

std::vector<std::string> DownloadRegistry::verifyReady(bool deep) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> demoted;
    for (auto& [id, record] : records_) {
        if (record.status != DownloadStatus::Ready)
            continue;
        std::string problem;
        for (const auto& f : record.files) {
            std::error_code ec;
            if (!f.complete || f.localPath.empty() || !fs::is_regular_file(f.localPath, ec)) {
                problem = "missing " + std::string(fileRoleName(f.role)) + " file";
                break;
            }
            const auto size = fs::file_size(f.localPath, ec);
            if (ec || (f.sizeBytes && size != *f.sizeBytes)) {
                problem = "size mismatch for " + f.localPath.filename().string();
                break;
            }
            if (deep && f.sha256) {
                auto digest = sha256File(f.localPath);
                if (!digest || digest.value() != *f.sha256) {
                    problem = "checksum mismatch for " + f.localPath.filename().string();
                    break;
                }
            }
        }
        if (!problem.empty()) {
            spdlog::warn("[DownloadRegistry] Model '{}' no longer ready: {}", id, problem);
            record.status = DownloadStatus::NotDownloaded;
            record.progress = 0.0;
            record.bytesDownloaded = 0;
            record.error = problem;
            for (auto& f : record.files) {
                f.complete = false;
                f.localPath.clear();
            }
            record.updatedAt = nowSeconds();
            demoted.push_back(id);
        }
    }
    if (!demoted.empty()) {
        auto pr = persistLocked();
        if (!pr) {
            spdlog::warn("[DownloadRegistry] Failed to persist demotions: {}", pr.error().message);
        }
    }
    return demoted;
}

Result<void> DownloadRegistry::persistLocked() const {
    json root = json::object();
    root["version"] = kRegistryVersion;
    root["models"] = json::object();
    for (const auto& [id, r] : records_) {
        root["models"][id] = recordToJson(r);
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Cannot write download registry " + tmp.string()};
        }
        out << root.dump(2);
        if (!out.good()) {
            return Error{ErrorCode::StorageFull, "Failed writing download registry"};
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot replace download registry: " + ec.message()};
    }
    return {};
}

} // namespace modelflux::downloader
