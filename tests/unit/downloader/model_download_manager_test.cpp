#include <gtest/gtest.h>
#include <modelflux/downloader/model_download_manager.h>

#include "../../common/fake_disk_writer.h"
#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers.h"

#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace modelflux;
using namespace modelflux::downloader;
using modelflux::tests::FakeHttpAdapter;
using modelflux::tests::make_payload;
using modelflux::tests::QuotaDiskWriter;
using modelflux::tests::read_file;
using modelflux::tests::TempDir;
using modelflux::tests::write_file;

namespace {

std::string sha256Of(const std::string& data) {
    auto v = makeSha256Verifier();
    v->update({reinterpret_cast<const std::byte*>(data.data()), data.size()});
    return v->finalize();
}

class ModelDownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<FakeHttpAdapter>();
        modelBody_ = make_payload(64 * 1024, 21);
        tokenizerBody_ = "{\"vocab\": {}}";
        http_->serve(kModelUrl, modelBody_);
        http_->serve(kTokenizerUrl, tokenizerBody_);
    }

    DownloadManagerConfig config() const {
        DownloadManagerConfig cfg;
        cfg.modelsDir = tmp_.path() / "models";
        cfg.stagingDir = tmp_.path() / "staging" / "downloader";
        cfg.registryPath = tmp_.path() / "downloads.json";
        cfg.concurrency = 2;
        cfg.fetch.retry.maxAttempts = 2;
        cfg.fetch.retry.initialBackoff = 1ms;
        cfg.fetch.persistIntervalBytes = 4096;
        cfg.persistInterval = 0ms;
        return cfg;
    }

    std::unique_ptr<ModelDownloadManager> makeManager() const {
        auto m = std::make_unique<ModelDownloadManager>(config(), http_);
        auto opened = m->open();
        EXPECT_TRUE(opened);
        return m;
    }

    ModelDescriptor descriptor(bool withTokenizer = true) const {
        ModelDescriptor d;
        d.id = "tiny-llm";
        d.name = "Tiny LLM";
        d.provider = "local";
        d.files.push_back(ModelFile{FileRole::Model, kModelUrl, "tiny.gguf", modelBody_.size(),
                                    sha256Of(modelBody_)});
        if (withTokenizer) {
            d.files.push_back(ModelFile{FileRole::Tokenizer, kTokenizerUrl, "tokenizer.json",
                                        tokenizerBody_.size(), std::nullopt});
        }
        return d;
    }

    static constexpr const char* kModelUrl = "https://models.example/tiny/tiny.gguf";
    static constexpr const char* kTokenizerUrl = "https://models.example/tiny/tokenizer.json";

    TempDir tmp_;
    std::shared_ptr<FakeHttpAdapter> http_;
    std::string modelBody_;
    std::string tokenizerBody_;
};

} // namespace

TEST_F(ModelDownloadManagerTest, DownloadsWholeManifest) {
    auto mgr = makeManager();
    auto h = mgr->start(descriptor());
    ASSERT_TRUE(h) << h.error().message;
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);

    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->isReady());
    EXPECT_DOUBLE_EQ(rec->progress, 1.0);
    auto modelPath = rec->localPath(FileRole::Model);
    auto tokPath = rec->localPath(FileRole::Tokenizer);
    ASSERT_TRUE(modelPath && tokPath);
    EXPECT_EQ(*modelPath, tmp_.path() / "models" / "tiny-llm" / "tiny.gguf");
    EXPECT_EQ(read_file(*modelPath), modelBody_);
    EXPECT_EQ(read_file(*tokPath), tokenizerBody_);
    EXPECT_TRUE(mgr->isReady("tiny-llm"));
}

TEST_F(ModelDownloadManagerTest, ProgressIsMonotonicAndEndsReady) {
    http_->setSliceSize(4096);
    auto mgr = makeManager();
    std::mutex m;
    std::vector<DownloadProgress> events;
    mgr->subscribe("tiny-llm", [&](const DownloadProgress& p) {
        std::lock_guard<std::mutex> lock(m);
        events.push_back(p);
    });
    auto h = mgr->start(descriptor());
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);

    std::lock_guard<std::mutex> lock(m);
    ASSERT_GE(events.size(), 3u);
    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].fraction, events[i - 1].fraction);
    }
    EXPECT_EQ(events.back().status, DownloadStatus::Ready);
    EXPECT_DOUBLE_EQ(events.back().fraction, 1.0);
}

TEST_F(ModelDownloadManagerTest, StartIsIdempotent) {
    http_->stallOnceAfter(kModelUrl, 16 * 1024);
    auto mgr = makeManager();
    auto first = mgr->start(descriptor());
    ASSERT_TRUE(first);
    ASSERT_TRUE(http_->waitForStall());
    auto second = mgr->start(descriptor());
    ASSERT_TRUE(second);
    EXPECT_EQ(http_->requestedOffsets(kModelUrl).size(), 1u);

    ASSERT_TRUE(mgr->pause("tiny-llm"));
    EXPECT_EQ(second.value().waitFor(5s), DownloadStatus::Paused);

    auto resumed = mgr->resume("tiny-llm");
    ASSERT_TRUE(resumed);
    ASSERT_EQ(resumed.value().waitFor(10s), DownloadStatus::Ready);

    // A Ready model yields a completed handle without touching the network
    const auto requests = http_->requestedOffsets(kModelUrl).size();
    auto again = mgr->start(descriptor());
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().status(), DownloadStatus::Ready);
    EXPECT_EQ(http_->requestedOffsets(kModelUrl).size(), requests);
}

TEST_F(ModelDownloadManagerTest, PauseKeepsPartialAndResumeContinues) {
    http_->stallOnceAfter(kModelUrl, 20000);
    auto mgr = makeManager();
    auto h = mgr->start(descriptor());
    ASSERT_TRUE(h);
    ASSERT_TRUE(http_->waitForStall());
    ASSERT_TRUE(mgr->pause("tiny-llm"));
    ASSERT_EQ(h.value().waitFor(5s), DownloadStatus::Paused);

    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, DownloadStatus::Paused);
    EXPECT_GT(rec->progress, 0.0);
    EXPECT_LT(rec->progress, 1.0);
    EXPECT_TRUE(fs::exists(tmp_.path() / "staging" / "downloader" / "tiny-llm" / "tiny.gguf.part"));

    auto resumed = mgr->resume("tiny-llm");
    ASSERT_TRUE(resumed);
    ASSERT_EQ(resumed.value().waitFor(10s), DownloadStatus::Ready);
    auto offsets = http_->requestedOffsets(kModelUrl);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 20000u);
    EXPECT_EQ(http_->bytesServed(kModelUrl), modelBody_.size());
}

TEST_F(ModelDownloadManagerTest, CancelPurgesPartialData) {
    http_->stallOnceAfter(kModelUrl, 8192);
    auto mgr = makeManager();
    auto h = mgr->start(descriptor());
    ASSERT_TRUE(h);
    ASSERT_TRUE(http_->waitForStall());
    ASSERT_TRUE(mgr->cancel("tiny-llm"));
    ASSERT_EQ(h.value().waitFor(5s), DownloadStatus::NotDownloaded);

    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, DownloadStatus::NotDownloaded);
    EXPECT_DOUBLE_EQ(rec->progress, 0.0);
    EXPECT_FALSE(fs::exists(tmp_.path() / "staging" / "downloader" / "tiny-llm"));
    EXPECT_FALSE(fs::exists(tmp_.path() / "models" / "tiny-llm"));
}

TEST_F(ModelDownloadManagerTest, CancelOnReadyModelIsNoOp) {
    auto mgr = makeManager();
    auto h = mgr->start(descriptor(false));
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);
    ASSERT_TRUE(mgr->cancel("tiny-llm"));
    EXPECT_TRUE(mgr->isReady("tiny-llm"));
}

TEST_F(ModelDownloadManagerTest, RemoveDeletesFilesAndRecord) {
    auto mgr = makeManager();
    auto h = mgr->start(descriptor());
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);
    ASSERT_TRUE(mgr->remove("tiny-llm"));
    EXPECT_FALSE(mgr->findRecord("tiny-llm").has_value());
    EXPECT_FALSE(fs::exists(tmp_.path() / "models" / "tiny-llm"));

    auto missing = mgr->remove("tiny-llm");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(ModelDownloadManagerTest, ChecksumFailureEndsInError) {
    auto d = descriptor(false);
    d.files[0].sha256 = std::string(64, 'f');
    auto mgr = makeManager();
    auto h = mgr->start(d);
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Error);
    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_NE(rec->error.find("Checksum mismatch"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp_.path() / "models" / "tiny-llm" / "tiny.gguf"));
}

TEST_F(ModelDownloadManagerTest, RetryExhaustionEndsInError) {
    http_->failAlwaysAfter(kModelUrl, 4096);
    auto mgr = makeManager();
    auto h = mgr->start(descriptor(false));
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Error);

    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, DownloadStatus::Error);
    EXPECT_NE(rec->error.find("Failed after 2 attempts"), std::string::npos) << rec->error;
    EXPECT_EQ(http_->requestedOffsets(kModelUrl).size(), 2u);
    EXPECT_FALSE(fs::exists(tmp_.path() / "models" / "tiny-llm" / "tiny.gguf"));
}

TEST_F(ModelDownloadManagerTest, DiskFullEndsInErrorAndDropsPartial) {
    auto disk = std::make_shared<QuotaDiskWriter>(1024);
    auto mgr = std::make_unique<ModelDownloadManager>(config(), http_, disk);
    ASSERT_TRUE(mgr->open());

    auto h = mgr->start(descriptor(false));
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Error);

    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->error, "No space left on device");
    EXPECT_EQ(rec->bytesDownloaded, 0u);
    EXPECT_DOUBLE_EQ(rec->progress, 0.0);
    EXPECT_EQ(disk->rejectedWrites(), 1);
    EXPECT_EQ(http_->requestedOffsets(kModelUrl).size(), 1u);
    EXPECT_FALSE(fs::exists(tmp_.path() / "staging" / "downloader" / "tiny-llm" / "tiny.gguf.part"));
    EXPECT_FALSE(fs::exists(tmp_.path() / "models" / "tiny-llm" / "tiny.gguf"));
}

TEST_F(ModelDownloadManagerTest, RejectsUnsafeModelIds) {
    auto mgr = makeManager();
    auto d = descriptor();
    d.id = "../escape";
    auto h = mgr->start(d);
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ModelDownloadManagerTest, ResumesAfterRestart) {
    http_->stallOnceAfter(kModelUrl, 20000);
    {
        auto mgr = makeManager();
        auto h = mgr->start(descriptor());
        ASSERT_TRUE(h);
        ASSERT_TRUE(http_->waitForStall());
        mgr->shutdown();
        EXPECT_EQ(h.value().status(), DownloadStatus::Downloading);
    }

    auto mgr = makeManager();
    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, DownloadStatus::Downloading);

    EXPECT_EQ(mgr->reattach(), 1u);
    EXPECT_EQ(mgr->reattach(), 0u);
    auto h = mgr->resume("tiny-llm");
    ASSERT_TRUE(h);
    ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);

    auto done = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(done.has_value());
    auto digest = sha256File(*done->localPath(FileRole::Model));
    ASSERT_TRUE(digest);
    EXPECT_EQ(digest.value(), sha256Of(modelBody_));

    auto offsets = http_->requestedOffsets(kModelUrl);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_GT(offsets[1], 0u);
}

TEST_F(ModelDownloadManagerTest, CorruptRegistryDoesNotBlockStartup) {
    write_file(tmp_.path() / "downloads.json", "][");
    ModelDownloadManager mgr(config(), http_);
    ASSERT_TRUE(mgr.open());
    EXPECT_TRUE(mgr.records().empty());
    auto h = mgr.start(descriptor(false));
    ASSERT_TRUE(h);
    EXPECT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);
}

TEST_F(ModelDownloadManagerTest, MissingFileIsDemotedOnOpen) {
    {
        auto mgr = makeManager();
        auto h = mgr->start(descriptor(false));
        ASSERT_TRUE(h);
        ASSERT_EQ(h.value().waitFor(10s), DownloadStatus::Ready);
    }
    fs::remove(tmp_.path() / "models" / "tiny-llm" / "tiny.gguf");
    auto mgr = makeManager();
    EXPECT_FALSE(mgr->isReady("tiny-llm"));
    auto rec = mgr->findRecord("tiny-llm");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, DownloadStatus::NotDownloaded);
}
