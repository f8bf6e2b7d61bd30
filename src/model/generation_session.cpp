#include <modelflux/model/generation_session.h>

#include <spdlog/spdlog.h>

namespace modelflux::model {

GenerationSession::GenerationSession(std::uint64_t id, std::string modelId, Hooks hooks)
    : id_(id), modelId_(std::move(modelId)), hooks_(std::move(hooks)) {}

GenerationPhase GenerationSession::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

std::string GenerationSession::bufferedText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

std::uint64_t GenerationSession::tokenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokenCount_;
}

bool GenerationSession::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == GenerationPhase::Completed || phase_ == GenerationPhase::Interrupted;
}

std::optional<std::string> GenerationSession::next() {
    return channel_.next();
}

void GenerationSession::onFragment(FragmentCallback callback) {
    if (!callback)
        return;
    std::lock_guard<std::mutex> cbLock(callbackMutex_);
    std::string replay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replay = buffer_;
        callbacks_.push_back(callback);
    }
    if (!replay.empty())
        callback(replay);
}

Result<std::string> GenerationSession::resultLocked() const {
    if (error_)
        return *error_;
    return buffer_;
}

Result<std::string> GenerationSession::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
        return phase_ == GenerationPhase::Completed || phase_ == GenerationPhase::Interrupted;
    });
    return resultLocked();
}

std::optional<Result<std::string>>
GenerationSession::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool done = cv_.wait_for(lock, timeout, [this] {
        return phase_ == GenerationPhase::Completed || phase_ == GenerationPhase::Interrupted;
    });
    if (!done)
        return std::nullopt;
    return resultLocked();
}

void GenerationSession::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == GenerationPhase::Idle)
        phase_ = GenerationPhase::Generating;
}

bool GenerationSession::deliver(const TokenEvent& event) {
    std::lock_guard<std::mutex> cbLock(callbackMutex_);
    std::vector<FragmentCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != GenerationPhase::Generating)
            return false;
        buffer_ += event.text;
        tokenCount_ = event.tokenCount > tokenCount_ ? event.tokenCount : tokenCount_ + 1;
        channel_.push(event.text);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(event.text);
    }
    return true;
}

void GenerationSession::complete(const Result<void>& outcome) {
    Hooks hooks;
    std::uint64_t tokens = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != GenerationPhase::Generating)
            return;
        phase_ = GenerationPhase::Completed;
        if (!outcome)
            error_ = outcome.error();
        hooks = hooks_;
        tokens = tokenCount_;
    }
    spdlog::debug("[GenerationSession] Session {} completed ({} tokens)", id_, tokens);
    // The owner is back to Ready before any waiter wakes up
    if (hooks.onFinished)
        hooks.onFinished(outcome);
    channel_.close();
    cv_.notify_all();
}

void GenerationSession::interrupt() {
    Hooks hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != GenerationPhase::Generating)
            return;
        phase_ = GenerationPhase::Interrupted;
        error_ = Error{ErrorCode::OperationCancelled, "Generation interrupted"};
        hooks = hooks_;
    }
    spdlog::debug("[GenerationSession] Session {} interrupted", id_);
    if (hooks.interruptNative)
        hooks.interruptNative();
    if (hooks.onFinished)
        hooks.onFinished(Error{ErrorCode::OperationCancelled, "Generation interrupted"});
    // Fragments queued before the interrupt stay pullable; nothing is queued after it
    channel_.close();
    cv_.notify_all();
}

void GenerationSession::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_ = Hooks{};
}

} // namespace modelflux::model
