#include <gtest/gtest.h>
#include <modelflux/downloader/file_fetcher.h>

#include "../../common/fake_disk_writer.h"
#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace modelflux;
using namespace modelflux::downloader;
using modelflux::tests::FakeHttpAdapter;
using modelflux::tests::make_payload;
using modelflux::tests::QuotaDiskWriter;
using modelflux::tests::read_file;
using modelflux::tests::TempDir;

namespace {

std::string sha256Of(const std::string& data) {
    auto v = makeSha256Verifier();
    v->update({reinterpret_cast<const std::byte*>(data.data()), data.size()});
    return v->finalize();
}

class FileFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<FakeHttpAdapter>();
        resume_ = makeJsonResumeStore(tmp_.path() / "staging" / "resume.json");
        FileFetcher::Options opts;
        opts.retry.maxAttempts = 3;
        opts.retry.initialBackoff = std::chrono::milliseconds(1);
        opts.retry.maxBackoff = std::chrono::milliseconds(5);
        opts.persistIntervalBytes = 1024;
        fetcher_ = std::make_unique<FileFetcher>(http_, makeDiskWriter(), resume_, opts);
    }

    std::unique_ptr<FileFetcher> fetcherWithDisk(std::shared_ptr<IDiskWriter> disk) const {
        return std::make_unique<FileFetcher>(http_, std::move(disk), resume_, fetcher_->options());
    }

    FetchRequest request(const std::string& body) const {
        FetchRequest r;
        r.url = kUrl;
        r.stagingPath = tmp_.path() / "staging" / "m" / "model.gguf.part";
        r.finalPath = tmp_.path() / "models" / "m" / "model.gguf";
        r.expectedSize = body.size();
        r.expectedSha256 = sha256Of(body);
        return r;
    }

    static constexpr const char* kUrl = "https://models.example/m/model.gguf";
    TempDir tmp_;
    std::shared_ptr<FakeHttpAdapter> http_;
    std::shared_ptr<IResumeStore> resume_;
    std::unique_ptr<FileFetcher> fetcher_;
};

} // namespace

TEST_F(FileFetcherTest, DownloadsVerifiesAndFinalizes) {
    const auto body = make_payload(10 * 1024);
    http_->serve(kUrl, body);
    std::uint64_t lastProgress = 0;
    auto r = fetcher_->fetch(request(body), {}, [&](std::uint64_t bytes, auto) {
        EXPECT_GE(bytes, lastProgress);
        lastProgress = bytes;
    });
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().sizeBytes, body.size());
    EXPECT_EQ(r.value().sha256, sha256Of(body));
    EXPECT_EQ(read_file(r.value().path), body);
    EXPECT_FALSE(fs::exists(request(body).stagingPath));
    EXPECT_EQ(lastProgress, body.size());
}

TEST_F(FileFetcherTest, TransientFailureResumesFromStagedPrefix) {
    const auto body = make_payload(8 * 1024, 3);
    http_->serve(kUrl, body);
    http_->failOnceAfter(kUrl, 5000);

    auto r = fetcher_->fetch(request(body), {});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(read_file(r.value().path), body);

    auto offsets = http_->requestedOffsets(kUrl);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 5000u);
    EXPECT_EQ(http_->bytesServed(kUrl), body.size());
}

TEST_F(FileFetcherTest, ServerIgnoringRangeRestartsFromZero) {
    const auto body = make_payload(6 * 1024, 5);
    http_->serve(kUrl, body);
    http_->setIgnoreRange(true);
    http_->failOnceAfter(kUrl, 4096);

    auto r = fetcher_->fetch(request(body), {});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().sha256, sha256Of(body));
    EXPECT_EQ(read_file(r.value().path), body);
    EXPECT_EQ(http_->bytesServed(kUrl), 4096u + body.size());
}

TEST_F(FileFetcherTest, ChecksumMismatchDeletesPartial) {
    const auto body = make_payload(2048, 9);
    http_->serve(kUrl, body);
    auto req = request(body);
    req.expectedSha256 = std::string(64, '0');

    auto r = fetcher_->fetch(req, {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::HashMismatch);
    EXPECT_FALSE(fs::exists(req.stagingPath));
    EXPECT_FALSE(fs::exists(req.finalPath));
    EXPECT_EQ(http_->requestedOffsets(kUrl).size(), 1u);
}

TEST_F(FileFetcherTest, SizeMismatchWithManifestFailsBeforeTransfer) {
    const auto body = make_payload(2048);
    http_->serve(kUrl, body);
    auto req = request(body);
    req.expectedSize = 4096;

    auto r = fetcher_->fetch(req, {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::HashMismatch);
    EXPECT_TRUE(http_->requestedOffsets(kUrl).empty());
}

TEST_F(FileFetcherTest, MissingObjectIsNotRetried) {
    auto r = fetcher_->fetch(request("x"), {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(http_->requestedOffsets(kUrl).empty());
}

TEST_F(FileFetcherTest, CancellationKeepsPartialForLaterResume) {
    const auto body = make_payload(16 * 1024, 11);
    http_->serve(kUrl, body);
    http_->stallOnceAfter(kUrl, 8192);

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        http_->waitForStall();
        cancel = true;
    });
    auto r = fetcher_->fetch(request(body), [&] { return cancel.load(); });
    canceller.join();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_TRUE(fs::exists(request(body).stagingPath));

    auto resumed = fetcher_->fetch(request(body), {});
    ASSERT_TRUE(resumed) << resumed.error().message;
    EXPECT_EQ(read_file(resumed.value().path), body);
    auto offsets = http_->requestedOffsets(kUrl);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 8192u);
}

TEST_F(FileFetcherTest, ChangedEtagDiscardsStagedBytes) {
    const auto v1 = make_payload(4096, 1);
    http_->serve(kUrl, v1, "\"v1\"");
    http_->stallOnceAfter(kUrl, 2048);
    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        http_->waitForStall();
        cancel = true;
    });
    auto first = fetcher_->fetch(request(v1), [&] { return cancel.load(); });
    canceller.join();
    ASSERT_FALSE(first);

    const auto v2 = make_payload(4096, 2);
    http_->serve(kUrl, v2, "\"v2\"");
    auto r = fetcher_->fetch(request(v2), {});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(read_file(r.value().path), v2);
}

TEST_F(FileFetcherTest, PersistentNetworkFailureGivesUpAfterMaxAttempts) {
    const auto body = make_payload(8 * 1024, 13);
    http_->serve(kUrl, body);
    http_->failAlwaysAfter(kUrl, 2048);

    auto req = request(body);
    auto r = fetcher_->fetch(req, {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(r.error().message.rfind("Failed after 3 attempts", 0), 0u) << r.error().message;

    auto offsets = http_->requestedOffsets(kUrl);
    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 2048u);
    EXPECT_EQ(offsets[2], 2048u);
    // Transient failures keep the prefix for a later resume
    ASSERT_TRUE(fs::exists(req.stagingPath));
    EXPECT_EQ(fs::file_size(req.stagingPath), 2048u);
    EXPECT_FALSE(fs::exists(req.finalPath));
}

TEST_F(FileFetcherTest, DiskFullAbortsWithoutRetryAndDeletesPartial) {
    const auto body = make_payload(8 * 1024, 17);
    http_->serve(kUrl, body);
    auto disk = std::make_shared<QuotaDiskWriter>(1024);
    auto fetcher = fetcherWithDisk(disk);

    auto req = request(body);
    auto r = fetcher->fetch(req, {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StorageFull);
    EXPECT_EQ(disk->bytesWritten(), 1024u);
    EXPECT_EQ(disk->rejectedWrites(), 1);
    EXPECT_EQ(http_->requestedOffsets(kUrl).size(), 1u);
    EXPECT_FALSE(fs::exists(req.stagingPath));
    EXPECT_FALSE(fs::exists(req.finalPath));

    auto state = resume_->load(kUrl);
    ASSERT_TRUE(state);
    EXPECT_FALSE(state.value().has_value());
}
