#include <gtest/gtest.h>
#include <modelflux/config/config_helpers.h>
#include <modelflux/config/core_config.h>

#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace modelflux::config;
using modelflux::tests::TempDir;
using modelflux::tests::write_file;

namespace {

class CoreConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnv) {
            ::unsetenv(name);
        }
    }
    void TearDown() override {
        for (const char* name : kEnv) {
            ::unsetenv(name);
        }
    }

    static constexpr const char* kEnv[] = {"MODELFLUX_DATA_DIR", "MODELFLUX_LOG_LEVEL",
                                           "MODELFLUX_PROXY", "MODELFLUX_EMBEDDING_MODEL",
                                           "MODELFLUX_CONFIG"};
    TempDir tmp_;
};

} // namespace

TEST_F(CoreConfigTest, DefaultsWithoutConfigFile) {
    ::setenv("MODELFLUX_DATA_DIR", tmp_.path().c_str(), 1);
    auto cfg = loadCoreConfig(tmp_.path() / "missing.toml");

    EXPECT_EQ(cfg.dataDir, tmp_.path());
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_EQ(cfg.downloads.concurrency, 2);
    EXPECT_EQ(cfg.downloads.maxAttempts, 5);
    EXPECT_EQ(cfg.rag.chunkSize, 1000u);
    EXPECT_EQ(cfg.rag.chunkOverlap, 100u);
    EXPECT_EQ(cfg.rag.topK, 5u);
    EXPECT_EQ(cfg.rag.embeddingModel, "all-minilm-l6-v2");
    EXPECT_EQ(cfg.modelsDir(), tmp_.path() / "models");
    EXPECT_EQ(cfg.registryPath(), tmp_.path() / "downloads.json");
    EXPECT_EQ(cfg.ragDatabasePath(), tmp_.path() / "rag.db");
}

TEST_F(CoreConfigTest, ReadsSectionsFromToml) {
    auto file = write_file(tmp_.path() / "config.toml", R"(
# modelflux settings
[core]
data_dir = ")" + (tmp_.path() / "data").string() + R"("
log_level = "debug"

[downloads]
concurrency = 4
max_attempts = 3
initial_backoff_ms = 50
backoff_multiplier = 1.5
proxy = "http://proxy.local:3128"
tls_insecure = true

[rag]
chunk_size = 800
chunk_overlap = 80
top_k = 7
embedding_model = "bge-small-en-v1.5"
)");
    auto cfg = loadCoreConfig(file);

    EXPECT_EQ(cfg.dataDir, tmp_.path() / "data");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.downloads.concurrency, 4);
    EXPECT_EQ(cfg.downloads.maxAttempts, 3);
    EXPECT_EQ(cfg.downloads.initialBackoff.count(), 50);
    EXPECT_DOUBLE_EQ(cfg.downloads.backoffMultiplier, 1.5);
    EXPECT_EQ(cfg.downloads.proxy, "http://proxy.local:3128");
    EXPECT_TRUE(cfg.downloads.tlsInsecure);
    EXPECT_EQ(cfg.rag.chunkSize, 800u);
    EXPECT_EQ(cfg.rag.chunkOverlap, 80u);
    EXPECT_EQ(cfg.rag.topK, 7u);
    EXPECT_EQ(cfg.rag.embeddingModel, "bge-small-en-v1.5");
}

TEST_F(CoreConfigTest, EnvironmentOverridesFile) {
    auto file = write_file(tmp_.path() / "config.toml", "[core]\nlog_level = \"warn\"\n"
                                                        "[rag]\nembedding_model = \"a\"\n");
    ::setenv("MODELFLUX_DATA_DIR", tmp_.path().c_str(), 1);
    ::setenv("MODELFLUX_LOG_LEVEL", "trace", 1);
    ::setenv("MODELFLUX_EMBEDDING_MODEL", "b", 1);

    auto cfg = loadCoreConfig(file);
    EXPECT_EQ(cfg.logLevel, "trace");
    EXPECT_EQ(cfg.rag.embeddingModel, "b");
}

TEST_F(CoreConfigTest, InvalidValuesKeepDefaults) {
    ::setenv("MODELFLUX_DATA_DIR", tmp_.path().c_str(), 1);
    auto file = write_file(tmp_.path() / "config.toml", "[downloads]\nconcurrency = many\n"
                                                        "backoff_multiplier = 0.5\n"
                                                        "[rag]\nchunk_size = 100\n"
                                                        "chunk_overlap = 200\n");
    auto cfg = loadCoreConfig(file);
    EXPECT_EQ(cfg.downloads.concurrency, 2);
    EXPECT_DOUBLE_EQ(cfg.downloads.backoffMultiplier, 2.0);
    EXPECT_EQ(cfg.rag.chunkSize, 1000u);
    EXPECT_EQ(cfg.rag.chunkOverlap, 100u);
}

TEST(ConfigHelpersTest, ParsesScalars) {
    EXPECT_EQ(parse_int(" 42 "), 42);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_EQ(parse_bool("On"), true);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
    EXPECT_EQ(unquote("  'abc' "), "abc");
}

TEST(ConfigHelpersTest, DottedKeysAreAccepted) {
    TempDir tmp;
    auto file = write_file(tmp.path() / "c.toml", "rag.top_k = 9\n[core]\nlog_level = error\n");
    EXPECT_EQ(parse_config_value(file, "rag", "top_k"), "9");
    EXPECT_EQ(parse_config_value(file, "core", "log_level"), "error");
    EXPECT_EQ(parse_config_value(file, "core", "data_dir"), "");
}
