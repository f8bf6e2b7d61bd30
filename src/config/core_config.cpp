#include <spdlog/spdlog.h>
#include <modelflux/config/config_helpers.h>
#include <modelflux/config/core_config.h>

namespace modelflux::config {

namespace {

std::string lookup(const std::filesystem::path& path, const std::string& section,
                   const std::string& key, const char* envName) {
    if (envName) {
        if (const char* env = std::getenv(envName); env && *env) {
            return env;
        }
    }
    if (path.empty())
        return {};
    return parse_config_value(path, section, key);
}

template <typename T>
void applyInt(const std::string& raw, T& target, const char* name) {
    if (raw.empty())
        return;
    if (auto v = parse_int(raw); v && *v >= 0) {
        target = static_cast<T>(*v);
    } else {
        spdlog::warn("[Config] Ignoring invalid value for {}: '{}'", name, raw);
    }
}

void applyMs(const std::string& raw, std::chrono::milliseconds& target, const char* name) {
    if (raw.empty())
        return;
    if (auto v = parse_int(raw); v && *v >= 0) {
        target = std::chrono::milliseconds(*v);
    } else {
        spdlog::warn("[Config] Ignoring invalid value for {}: '{}'", name, raw);
    }
}

} // namespace

CoreConfig loadCoreConfig() {
    return loadCoreConfig(resolve_config_path());
}

CoreConfig loadCoreConfig(const std::filesystem::path& configPath) {
    CoreConfig cfg;
    std::filesystem::path path = configPath;
    std::error_code ec;
    if (!path.empty() && !std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] No config file at {}, using defaults", path.string());
        path.clear();
    }

    if (const char* env = std::getenv("MODELFLUX_DATA_DIR"); env && *env) {
        cfg.dataDir = expand_tilde(env);
    } else if (auto v = path.empty() ? std::string{} : parse_config_value(path, "core", "data_dir");
               !v.empty()) {
        cfg.dataDir = expand_tilde(v);
    } else {
        cfg.dataDir = get_data_dir();
    }

    if (auto v = lookup(path, "core", "log_level", "MODELFLUX_LOG_LEVEL"); !v.empty()) {
        cfg.logLevel = v;
    }

    auto& dl = cfg.downloads;
    applyInt(lookup(path, "downloads", "concurrency", nullptr), dl.concurrency,
             "downloads.concurrency");
    applyInt(lookup(path, "downloads", "max_attempts", nullptr), dl.maxAttempts,
             "downloads.max_attempts");
    applyMs(lookup(path, "downloads", "initial_backoff_ms", nullptr), dl.initialBackoff,
            "downloads.initial_backoff_ms");
    applyMs(lookup(path, "downloads", "max_backoff_ms", nullptr), dl.maxBackoff,
            "downloads.max_backoff_ms");
    applyMs(lookup(path, "downloads", "request_timeout_ms", nullptr), dl.requestTimeout,
            "downloads.request_timeout_ms");
    applyMs(lookup(path, "downloads", "connect_timeout_ms", nullptr), dl.connectTimeout,
            "downloads.connect_timeout_ms");
    if (auto raw = lookup(path, "downloads", "backoff_multiplier", nullptr); !raw.empty()) {
        if (auto m = parse_double(raw); m && *m >= 1.0) {
            dl.backoffMultiplier = *m;
        } else {
            spdlog::warn("[Config] Ignoring invalid downloads.backoff_multiplier: '{}'", raw);
        }
    }
    dl.proxy = lookup(path, "downloads", "proxy", "MODELFLUX_PROXY");
    if (auto raw = lookup(path, "downloads", "tls_insecure", nullptr); !raw.empty()) {
        dl.tlsInsecure = parse_bool(raw).value_or(false);
    }
    if (dl.concurrency < 1)
        dl.concurrency = 1;
    if (dl.maxAttempts < 1)
        dl.maxAttempts = 1;

    auto& rag = cfg.rag;
    applyInt(lookup(path, "rag", "chunk_size", nullptr), rag.chunkSize, "rag.chunk_size");
    applyInt(lookup(path, "rag", "chunk_overlap", nullptr), rag.chunkOverlap, "rag.chunk_overlap");
    applyInt(lookup(path, "rag", "top_k", nullptr), rag.topK, "rag.top_k");
    if (auto v = lookup(path, "rag", "embedding_provider", nullptr); !v.empty()) {
        rag.embeddingProvider = v;
    }
    if (auto v = lookup(path, "rag", "embedding_model", "MODELFLUX_EMBEDDING_MODEL"); !v.empty()) {
        rag.embeddingModel = v;
    }
    if (rag.chunkSize == 0 || rag.chunkOverlap >= rag.chunkSize) {
        spdlog::warn("[Config] Invalid chunk geometry size={} overlap={}, using 1000/100",
                     rag.chunkSize, rag.chunkOverlap);
        rag.chunkSize = 1000;
        rag.chunkOverlap = 100;
    }

    return cfg;
}

} // namespace modelflux::config
