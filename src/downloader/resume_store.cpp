/*
 * resume_store.cpp
 *
 * Persistent JSON ResumeStore (sidecar under the staging directory).
 * File layout (JSON object keyed by file URL):
 * {
 *   "https://example.com/model.gguf": {
 *     "etag": "abc123",
 *     "last_modified": "Tue, 19 Aug 2025 09:00:00 GMT",
 *     "total_bytes": 1048576,
 *     "completed_ranges": [[0,524288]]
 *   }
 * }
 * Writes go to a temp file that is renamed over the sidecar so a crash mid-write never
 * leaves a truncated document behind.
 */

#include <modelflux/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>

namespace modelflux::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

void normalizeRanges(std::vector<ByteRange>& ranges) {
    if (ranges.empty())
        return;
    std::sort(ranges.begin(), ranges.end(),
              [](const ByteRange& a, const ByteRange& b) { return a.first < b.first; });
    std::vector<ByteRange> merged;
    merged.reserve(ranges.size());
    for (const auto& [offset, length] : ranges) {
        if (length == 0)
            continue;
        if (merged.empty()) {
            merged.emplace_back(offset, length);
            continue;
        }
        auto& back = merged.back();
        const auto backEnd = back.first + back.second;
        const auto currentEnd = offset + length;
        if (offset <= backEnd) {
            if (currentEnd > backEnd) {
                back.second = currentEnd - back.first;
            }
        } else {
            merged.emplace_back(offset, length);
        }
    }
    ranges.swap(merged);
}

void appendRange(std::vector<ByteRange>& ranges, std::uint64_t offset, std::uint64_t length) {
    if (length == 0)
        return;
    if (!ranges.empty()) {
        auto& back = ranges.back();
        const auto backEnd = back.first + back.second;
        const auto currentEnd = offset + length;
        if (offset <= backEnd && offset >= back.first) {
            if (currentEnd > backEnd) {
                back.second = currentEnd - back.first;
            }
            return;
        }
    }
    ranges.emplace_back(offset, length);
}

std::uint64_t contiguousPrefixLength(const std::vector<ByteRange>& ranges) {
    std::uint64_t cursor = 0;
    for (const auto& [offset, length] : ranges) {
        if (offset > cursor)
            break;
        const auto end = offset + length;
        if (end > cursor) {
            cursor = end;
        }
    }
    return cursor;
}

namespace {

class JsonResumeStore final : public IResumeStore {
public:
    explicit JsonResumeStore(fs::path path) : path_(std::move(path)) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("[ResumeStore] Cannot create {}: {}", path_.parent_path().string(),
                         ec.message());
        }
    }

    Result<std::optional<State>> load(std::string_view key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto jr = loadFile();
        if (!jr)
            return jr.error();
        const auto& root = jr.value();
        auto it = root.find(std::string(key));
        if (it == root.end() || !it->is_object())
            return std::optional<State>{std::nullopt};
        const auto& entry = *it;
        State st;
        if (entry.contains("etag") && entry["etag"].is_string()) {
            st.etag = entry["etag"].get<std::string>();
        }
        if (entry.contains("last_modified") && entry["last_modified"].is_string()) {
            st.lastModified = entry["last_modified"].get<std::string>();
        }
        if (entry.contains("total_bytes") && entry["total_bytes"].is_number_unsigned()) {
            st.totalBytes = entry["total_bytes"].get<std::uint64_t>();
        }
        if (entry.contains("completed_ranges") && entry["completed_ranges"].is_array()) {
            for (const auto& r : entry["completed_ranges"]) {
                if (r.is_array() && r.size() == 2 && r[0].is_number_unsigned() &&
                    r[1].is_number_unsigned()) {
                    st.completedRanges.emplace_back(r[0].get<std::uint64_t>(),
                                                    r[1].get<std::uint64_t>());
                }
            }
        }
        normalizeRanges(st.completedRanges);
        return std::optional<State>{st};
    }

    Result<void> save(std::string_view key, const State& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto jr = loadFile();
        if (!jr)
            return jr.error();
        auto& root = jr.value();

        json entry = json::object();
        if (state.etag)
            entry["etag"] = *state.etag;
        if (state.lastModified)
            entry["last_modified"] = *state.lastModified;
        entry["total_bytes"] = state.totalBytes;
        entry["completed_ranges"] = json::array();
        for (const auto& [off, len] : state.completedRanges) {
            entry["completed_ranges"].push_back(json::array({off, len}));
        }
        root[std::string(key)] = entry;
        return writeFile(root);
    }

    void remove(std::string_view key) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto jr = loadFile();
        if (!jr)
            return;
        auto& root = jr.value();
        if (root.erase(std::string(key)) == 0)
            return;
        auto wr = writeFile(root);
        if (!wr) {
            spdlog::warn("[ResumeStore] Failed to drop entry: {}", wr.error().message);
        }
    }

private:
    Result<json> loadFile() const {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return json::object();
        }
        std::ifstream in(path_);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open resume JSON for read"};
        }
        json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded() || !root.is_object()) {
            // Corrupt sidecar: partial files restart from zero
            spdlog::warn("[ResumeStore] Ignoring unreadable resume state at {}", path_.string());
            return json::object();
        }
        return root;
    }

    Result<void> writeFile(const json& root) const {
        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to open resume JSON for write"};
            }
            out << root.dump(2);
            if (!out.good()) {
                return Error{ErrorCode::StorageFull, "Failed to write resume JSON"};
            }
        }
        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to replace resume JSON: " + ec.message()};
        }
        return {};
    }

    fs::path path_;
    mutable std::mutex mutex_;
};

} // namespace

std::unique_ptr<IResumeStore> makeJsonResumeStore(const fs::path& file) {
    return std::make_unique<JsonResumeStore>(file);
}

} // namespace modelflux::downloader
