#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace modelflux::config {

struct DownloadSettings {
    int concurrency{2};
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double backoffMultiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
    std::chrono::milliseconds requestTimeout{0}; // 0 = no overall transfer timeout
    std::chrono::milliseconds connectTimeout{30000};
    std::string proxy;
    bool tlsInsecure{false};
};

struct RagSettings {
    std::size_t chunkSize{1000};
    std::size_t chunkOverlap{100};
    std::size_t topK{5};
    std::string embeddingProvider{"local"};
    std::string embeddingModel{"all-minilm-l6-v2"};
};

/**
 * Settings for the on-device model core, resolved from (in order of precedence)
 * MODELFLUX_* environment variables, config.toml, and built-in defaults.
 *
 * config.toml layout:
 *   [core]      data_dir, log_level
 *   [downloads] concurrency, max_attempts, initial_backoff_ms, backoff_multiplier,
 *               max_backoff_ms, request_timeout_ms, connect_timeout_ms, proxy, tls_insecure
 *   [rag]       chunk_size, chunk_overlap, top_k, embedding_provider, embedding_model
 */
struct CoreConfig {
    std::filesystem::path dataDir;
    std::string logLevel{"info"};
    DownloadSettings downloads;
    RagSettings rag;

    [[nodiscard]] std::filesystem::path modelsDir() const { return dataDir / "models"; }
    [[nodiscard]] std::filesystem::path stagingDir() const { return dataDir / "staging"; }
    [[nodiscard]] std::filesystem::path registryPath() const { return dataDir / "downloads.json"; }
    [[nodiscard]] std::filesystem::path ragDatabasePath() const { return dataDir / "rag.db"; }
};

// Load from the resolved config file (MODELFLUX_CONFIG or XDG path)
CoreConfig loadCoreConfig();

// Load from an explicit config file; missing keys keep their defaults
CoreConfig loadCoreConfig(const std::filesystem::path& configPath);

} // namespace modelflux::config
