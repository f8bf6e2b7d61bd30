/*
 * model_lifecycle_manager.cpp
 *
 * Single-owner management of the native inference handle:
 * - select/load/unload are posted to a one-thread executor and return futures
 * - a select() first interrupts the running session so the executor drains, then
 *   unloads the old handle before loading the new one
 * - generation runs on the same executor; fragments flow into the GenerationSession
 * - runtimes without completion events fall back to TokenCountEndDetector
 */

#include <modelflux/model/model_lifecycle_manager.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace modelflux::model {

namespace {

bool isFatalGenerationError(const Error& error) {
    return error.code == ErrorCode::GenerationFailed || error.code == ErrorCode::InternalError;
}

std::future<Result<void>> readyFuture(Result<void> value) {
    std::promise<Result<void>> p;
    p.set_value(std::move(value));
    return p.get_future();
}

bool holdsModel(const LifecycleSnapshot& snap, const std::string& modelId) {
    return snap.modelId == modelId &&
           (snap.state == LifecycleState::Ready || snap.state == LifecycleState::Generating);
}

} // namespace

ModelLifecycleManager::ModelLifecycleManager(
    std::shared_ptr<INativeRuntime> runtime,
    std::shared_ptr<const downloader::IDownloadStatusProvider> downloads)
    : runtime_(std::move(runtime)), downloads_(std::move(downloads)) {}

ModelLifecycleManager::~ModelLifecycleManager() {
    stopping_.store(true);
    interruptActive();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (activeSession_) {
            activeSession_->detach();
            activeSession_.reset();
        }
    }
    boost::asio::post(executor_, [this] {
        auto r = doUnload();
        if (!r) {
            spdlog::warn("[ModelLifecycle] Unload during shutdown failed: {}", r.error().message);
        }
    });
    executor_.join();
}

template <typename Fn> std::future<Result<void>> ModelLifecycleManager::submit(Fn&& fn) {
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();
    boost::asio::post(executor_, [promise, fn = std::forward<Fn>(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError, e.what()});
        }
    });
    return future;
}

template <typename Event> void ModelLifecycleManager::apply(const Event& event) {
    LifecycleSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fsm_.dispatch(event);
        snap = fsm_.snapshot();
    }
    notify(snap);
}

void ModelLifecycleManager::notify(const LifecycleSnapshot& snap) {
    std::vector<LifecycleCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, cb] : subscribers_) {
            callbacks.push_back(cb);
        }
    }
    for (const auto& cb : callbacks) {
        cb(snap);
    }
}

std::future<Result<void>> ModelLifecycleManager::selectAsync(const std::string& modelId,
                                                             SelectOptions options) {
    if (stopping_.load()) {
        return readyFuture(Error{ErrorCode::InvalidState, "Lifecycle manager is shutting down"});
    }
    if (modelId.empty()) {
        return readyFuture(Error{ErrorCode::InvalidArgument, "Model id is empty"});
    }
    if (!options.hardReload && holdsModel(snapshot(), modelId)) {
        spdlog::debug("[ModelLifecycle] '{}' already loaded; select is a no-op", modelId);
        return readyFuture(Result<void>{});
    }
    interruptActive();
    return submit([this, modelId, force = options.hardReload] { return doSelect(modelId, force); });
}

Result<void> ModelLifecycleManager::select(const std::string& modelId, SelectOptions options) {
    return selectAsync(modelId, options).get();
}

std::future<Result<void>> ModelLifecycleManager::loadAsync(const std::string& modelId) {
    if (stopping_.load()) {
        return readyFuture(Error{ErrorCode::InvalidState, "Lifecycle manager is shutting down"});
    }
    if (modelId.empty()) {
        return readyFuture(Error{ErrorCode::InvalidArgument, "Model id is empty"});
    }
    interruptActive();
    return submit([this, modelId] { return doSelect(modelId, true); });
}

Result<void> ModelLifecycleManager::load(const std::string& modelId) {
    return loadAsync(modelId).get();
}

std::future<Result<void>> ModelLifecycleManager::unloadAsync() {
    if (stopping_.load()) {
        return readyFuture(Result<void>{});
    }
    interruptActive();
    return submit([this] { return doUnload(); });
}

Result<void> ModelLifecycleManager::unload() {
    return unloadAsync().get();
}

Result<void> ModelLifecycleManager::doSelect(const std::string& modelId, bool force) {
    if (!force) {
        // Another select for the same model may have completed while this one was queued
        std::lock_guard<std::mutex> hl(handleMutex_);
        if (handle_ && holdsModel(snapshot(), modelId))
            return {};
    }

    auto record = downloads_ ? downloads_->findRecord(modelId) : std::nullopt;
    if (!record || !record->isReady()) {
        spdlog::warn("[ModelLifecycle] Refusing to load '{}': not downloaded", modelId);
        return Error{ErrorCode::ModelNotDownloaded, "Model '" + modelId + "' is not downloaded"};
    }
    auto modelPath = record->localPath(FileRole::Model);
    if (!modelPath) {
        return Error{ErrorCode::ModelNotDownloaded,
                     "Model '" + modelId + "' has no local model file"};
    }

    LoadManifest manifest;
    manifest.modelId = modelId;
    manifest.modelPath = *modelPath;
    manifest.tokenizerPath = record->localPath(FileRole::Tokenizer);
    manifest.tokenizerConfigPath = record->localPath(FileRole::TokenizerConfig);
    manifest.projectorPath = record->localPath(FileRole::Projector);

    auto unloaded = doUnload();
    if (!unloaded) {
        spdlog::warn("[ModelLifecycle] Previous handle reported: {}", unloaded.error().message);
    }

    apply(LoadStartedEvent{modelId});
    const auto config = configFor(modelId);
    spdlog::info("[ModelLifecycle] Loading '{}' (ctx={}, gpu_layers={})", modelId,
                 config.contextLength, config.gpuLayers);

    Result<std::unique_ptr<INativeHandle>> loaded{
        Error{ErrorCode::LoadFailed, "Native runtime unavailable"}};
    if (runtime_) {
        try {
            loaded = runtime_->load(manifest, config,
                                    [this](double fraction) { apply(LoadProgressEvent{fraction}); });
        } catch (const std::exception& e) {
            loaded = Error{ErrorCode::LoadFailed, e.what()};
        }
    }
    if (loaded && !loaded.value()) {
        loaded = Error{ErrorCode::LoadFailed, "Native runtime returned no handle"};
    }
    if (!loaded) {
        const std::string message = loaded.error().message;
        spdlog::error("[ModelLifecycle] Failed to load '{}': {}", modelId, message);
        apply(LoadFailedEvent{message});
        return Error{ErrorCode::LoadFailed, message};
    }

    {
        std::lock_guard<std::mutex> hl(handleMutex_);
        handle_ = std::move(loaded).value();
    }
    apply(LoadedEvent{modelId});
    spdlog::info("[ModelLifecycle] '{}' ready", modelId);
    return {};
}

Result<void> ModelLifecycleManager::doUnload() {
    std::unique_ptr<INativeHandle> old;
    {
        std::lock_guard<std::mutex> hl(handleMutex_);
        old = std::move(handle_);
    }
    if (!old) {
        if (snapshot().state != LifecycleState::Unloaded)
            apply(UnloadedEvent{});
        return {};
    }

    const auto previous = snapshot().modelId;
    Result<void> result;
    try {
        result = old->unload();
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }
    old.reset();
    apply(UnloadedEvent{});
    spdlog::info("[ModelLifecycle] Unloaded '{}'", previous);
    return result;
}

Result<std::shared_ptr<GenerationSession>>
ModelLifecycleManager::startGeneration(const std::string& prompt) {
    if (stopping_.load()) {
        return Error{ErrorCode::InvalidState, "Lifecycle manager is shutting down"};
    }
    std::shared_ptr<GenerationSession> session;
    GenerationConfig config;
    LifecycleSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fsm_.isGenerating()) {
            return Error{ErrorCode::OperationInProgress, "A generation is already running"};
        }
        if (!fsm_.isReady()) {
            return Error{ErrorCode::InvalidState,
                         std::string("No model ready (state: ") +
                             lifecycleStateName(fsm_.state()) + ")"};
        }
        auto it = configs_.find(fsm_.modelId());
        if (it != configs_.end())
            config = it->second;

        const auto sessionId = nextSessionId_++;
        GenerationSession::Hooks hooks;
        hooks.interruptNative = [this] {
            std::lock_guard<std::mutex> hl(handleMutex_);
            if (handle_)
                handle_->interrupt();
        };
        hooks.onFinished = [this, sessionId](const Result<void>& outcome) {
            onSessionFinished(sessionId, outcome);
        };
        session = std::make_shared<GenerationSession>(sessionId, fsm_.modelId(), std::move(hooks));
        session->begin();
        activeSession_ = session;
        fsm_.dispatch(GenerationStartedEvent{});
        snap = fsm_.snapshot();
    }
    notify(snap);

    boost::asio::post(executor_, [this, session, prompt, config] {
        runGeneration(session, prompt, config);
    });
    return session;
}

void ModelLifecycleManager::runGeneration(const std::shared_ptr<GenerationSession>& session,
                                          const std::string& prompt,
                                          const GenerationConfig& config) {
    if (session->finished())
        return;

    INativeHandle* handle = nullptr;
    {
        std::lock_guard<std::mutex> hl(handleMutex_);
        handle = handle_.get();
    }
    if (!handle) {
        session->complete(Error{ErrorCode::InvalidState, "Model handle is not loaded"});
        return;
    }

    const bool explicitEnd = handle->supportsCompletionEvent();
    auto detector = std::make_shared<TokenCountEndDetector>();
    auto nativeDone = std::make_shared<std::promise<void>>();
    auto doneSignalled = std::make_shared<std::atomic<bool>>(false);
    auto nativeFinished = nativeDone->get_future();
    auto markDone = [nativeDone, doneSignalled] {
        if (!doneSignalled->exchange(true))
            nativeDone->set_value();
    };

    TokenCallback onToken = [session, detector, explicitEnd](const TokenEvent& ev) {
        if (!explicitEnd && ev.tokenCount > 0 &&
            detector->observe(ev.tokenCount) == TokenCountEndDetector::Signal::NewGeneration) {
            spdlog::debug("[ModelLifecycle] Token counter reset; closing session {}",
                          session->id());
            session->complete({});
            return;
        }
        session->deliver(ev);
    };
    CompletionCallback onComplete = [session, markDone](Result<void> outcome) {
        session->complete(outcome);
        markDone();
    };

    try {
        handle->generate(prompt, config, onToken, onComplete);
    } catch (const std::exception& e) {
        session->complete(Error{ErrorCode::GenerationFailed, e.what()});
        markDone();
    }

    if (explicitEnd) {
        // Keep the executor occupied until the runtime reports the end
        nativeFinished.wait();
    } else {
        session->complete({});
    }
}

void ModelLifecycleManager::onSessionFinished(std::uint64_t sessionId,
                                              const Result<void>& outcome) {
    LifecycleSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!activeSession_ || activeSession_->id() != sessionId)
            return;
        activeSession_.reset();
        if (!outcome && isFatalGenerationError(outcome.error())) {
            spdlog::error("[ModelLifecycle] Generation fault: {}", outcome.error().message);
            fsm_.dispatch(GenerationFaultEvent{outcome.error().message});
        } else {
            if (!outcome && outcome.error().code != ErrorCode::OperationCancelled) {
                spdlog::warn("[ModelLifecycle] Generation ended with error: {}",
                             outcome.error().message);
            }
            fsm_.dispatch(GenerationEndedEvent{});
        }
        snap = fsm_.snapshot();
    }
    notify(snap);
}

void ModelLifecycleManager::interruptActive() {
    std::shared_ptr<GenerationSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = activeSession_;
    }
    if (session)
        session->interrupt();
}

void ModelLifecycleManager::interrupt() {
    interruptActive();
}

void ModelLifecycleManager::updateConfig(const std::string& modelId, GenerationConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[modelId] = std::move(config);
}

GenerationConfig ModelLifecycleManager::configFor(const std::string& modelId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(modelId);
    return it != configs_.end() ? it->second : GenerationConfig{};
}

LifecycleSnapshot ModelLifecycleManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.snapshot();
}

std::shared_ptr<GenerationSession> ModelLifecycleManager::activeSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeSession_;
}

LifecycleSubscriptionId ModelLifecycleManager::subscribe(LifecycleCallback callback) {
    const auto id = nextSubscription_.fetch_add(1);
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void ModelLifecycleManager::unsubscribe(LifecycleSubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.erase(id);
}

} // namespace modelflux::model
