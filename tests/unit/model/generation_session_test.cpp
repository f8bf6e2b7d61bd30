#include <gtest/gtest.h>
#include <modelflux/model/generation_session.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace modelflux;
using namespace modelflux::model;

namespace {

std::shared_ptr<GenerationSession> makeSession(GenerationSession::Hooks hooks = {}) {
    auto s = std::make_shared<GenerationSession>(1, "tiny", std::move(hooks));
    s->begin();
    return s;
}

} // namespace

TEST(GenerationSessionTest, FragmentsConcatenateInOrder) {
    auto s = makeSession();
    EXPECT_EQ(s->phase(), GenerationPhase::Generating);
    EXPECT_TRUE(s->deliver({"Hel", 1}));
    EXPECT_TRUE(s->deliver({"lo", 2}));
    s->complete({});

    auto r = s->wait();
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "Hello");
    EXPECT_EQ(s->tokenCount(), 2u);
    EXPECT_EQ(s->phase(), GenerationPhase::Completed);

    EXPECT_EQ(s->next(), "Hel");
    EXPECT_EQ(s->next(), "lo");
    EXPECT_FALSE(s->next().has_value());
}

TEST(GenerationSessionTest, PullConsumerSeesLiveFragments) {
    auto s = makeSession();
    std::thread producer([s] {
        for (int i = 0; i < 50; ++i) {
            s->deliver({std::to_string(i) + ",", static_cast<std::uint64_t>(i + 1)});
        }
        s->complete({});
    });
    std::string joined;
    while (auto f = s->next()) {
        joined += *f;
    }
    producer.join();
    EXPECT_EQ(joined, s->bufferedText());
}

TEST(GenerationSessionTest, LateSubscriberGetsReplayThenLiveFragments) {
    auto s = makeSession();
    s->deliver({"a", 1});
    s->deliver({"b", 2});
    std::vector<std::string> seen;
    s->onFragment([&](const std::string& f) { seen.push_back(f); });
    s->deliver({"c", 3});
    s->complete({});

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "ab");
    EXPECT_EQ(seen[1], "c");
}

TEST(GenerationSessionTest, InterruptStopsDeliveryAndKeepsBuffer) {
    std::atomic<int> nativeInterrupts{0};
    std::atomic<int> finished{0};
    GenerationSession::Hooks hooks;
    hooks.interruptNative = [&] { ++nativeInterrupts; };
    hooks.onFinished = [&](const Result<void>& r) {
        EXPECT_FALSE(r);
        ++finished;
    };
    auto s = makeSession(std::move(hooks));
    s->deliver({"partial", 1});
    s->interrupt();
    s->interrupt();

    EXPECT_FALSE(s->deliver({" more", 2}));
    EXPECT_EQ(s->bufferedText(), "partial");
    EXPECT_EQ(s->phase(), GenerationPhase::Interrupted);
    EXPECT_EQ(nativeInterrupts.load(), 1);
    EXPECT_EQ(finished.load(), 1);

    auto r = s->wait();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);

    // completion arriving after the interrupt changes nothing
    s->complete({});
    EXPECT_EQ(s->phase(), GenerationPhase::Interrupted);
}

TEST(GenerationSessionTest, PullingAfterInterruptDrainsWhatWasBuffered) {
    auto s = makeSession();
    s->deliver({"Hel", 1});
    s->deliver({"lo", 2});
    s->interrupt();
    EXPECT_FALSE(s->deliver({" world", 3}));

    std::string pulled;
    while (auto fragment = s->next()) {
        pulled += *fragment;
    }
    EXPECT_EQ(pulled, "Hello");
    EXPECT_EQ(pulled, s->bufferedText());
}

TEST(GenerationSessionTest, ErrorOutcomeIsReturnedFromWait) {
    auto s = makeSession();
    s->deliver({"x", 1});
    s->complete(Error{ErrorCode::GenerationFailed, "decode failed"});
    auto r = s->wait();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::GenerationFailed);
    EXPECT_EQ(s->bufferedText(), "x");
}

TEST(GenerationSessionTest, WaitForTimesOutWhileRunning) {
    auto s = makeSession();
    EXPECT_FALSE(s->waitFor(10ms).has_value());
    s->complete({});
    auto done = s->waitFor(10ms);
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(*done);
}

TEST(GenerationSessionTest, DetachedSessionDoesNotCallOwner) {
    std::atomic<int> calls{0};
    GenerationSession::Hooks hooks;
    hooks.interruptNative = [&] { ++calls; };
    hooks.onFinished = [&](const Result<void>&) { ++calls; };
    auto s = makeSession(std::move(hooks));
    s->detach();
    s->interrupt();
    EXPECT_EQ(calls.load(), 0);
    EXPECT_TRUE(s->finished());
}

TEST(GenerationSessionTest, NotDeliveringBeforeBegin) {
    GenerationSession s(7, "tiny", {});
    EXPECT_EQ(s.phase(), GenerationPhase::Idle);
    EXPECT_FALSE(s.deliver({"x", 1}));
    EXPECT_EQ(s.id(), 7u);
    EXPECT_EQ(s.modelId(), "tiny");
}
