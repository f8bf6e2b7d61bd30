#pragma once

#include <modelflux/core/types.h>
#include <modelflux/model/inference_runtime.h>
#include <modelflux/model/model_types.h>
#include <modelflux/model/token_channel.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::model {

/**
 * One streamed generation. Fragments are appended in emission order and can be consumed
 * either by pulling (next()) or by push callbacks (onFragment()); both observe the same
 * sequence. A session is not restartable.
 *
 * After interrupt() no further fragments are accepted and wait() returns OperationCancelled.
 * Fragments received before the interrupt stay in bufferedText() and can still be drained
 * through next(), so a pulling consumer ends with the same text.
 */
class GenerationSession {
public:
    using FragmentCallback = std::function<void(const std::string&)>;

    struct Hooks {
        std::function<void()> interruptNative;
        std::function<void(const Result<void>&)> onFinished;
    };

    GenerationSession(std::uint64_t id, std::string modelId, Hooks hooks);

    GenerationSession(const GenerationSession&) = delete;
    GenerationSession& operator=(const GenerationSession&) = delete;

    [[nodiscard]] std::uint64_t id() const { return id_; }
    [[nodiscard]] const std::string& modelId() const { return modelId_; }
    [[nodiscard]] GenerationPhase phase() const;
    [[nodiscard]] std::string bufferedText() const;
    [[nodiscard]] std::uint64_t tokenCount() const;
    [[nodiscard]] bool finished() const;

    std::optional<std::string> next();

    /// Registers a push consumer; text buffered so far is replayed as one fragment
    void onFragment(FragmentCallback callback);

    Result<std::string> wait() const;
    std::optional<Result<std::string>> waitFor(std::chrono::milliseconds timeout) const;

    void interrupt();

    /// Drop the owner's hooks; later interrupt()/complete() only affect this session
    void detach();

    // Producer side, driven by ModelLifecycleManager
    void begin();
    bool deliver(const TokenEvent& event);
    void complete(const Result<void>& outcome);

private:
    Result<std::string> resultLocked() const;

    const std::uint64_t id_;
    const std::string modelId_;
    Hooks hooks_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    GenerationPhase phase_{GenerationPhase::Idle};
    std::string buffer_;
    std::uint64_t tokenCount_{0};
    std::optional<Error> error_;

    // Held across callback invocation so replay and live delivery never interleave
    std::mutex callbackMutex_;
    std::vector<FragmentCallback> callbacks_;

    TokenChannel channel_;
};

} // namespace modelflux::model
