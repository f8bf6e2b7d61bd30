/*
 * chat_engine.cpp
 *
 * Wires the downloader, the model lifecycle manager and the RAG runtime together and
 * routes prompts to the on-device model or a remote provider.
 */

#include <modelflux/app/chat_engine.h>
#include <modelflux/vector/retrieval_orchestrator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace modelflux::app {

void applyLogLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("[ChatEngine] Unknown log level '{}', keeping current level", level);
    }
}

namespace {

downloader::DownloadManagerConfig downloadConfigFrom(const config::CoreConfig& cfg) {
    downloader::DownloadManagerConfig dm;
    dm.modelsDir = cfg.modelsDir();
    dm.stagingDir = cfg.stagingDir() / "downloader";
    dm.registryPath = cfg.registryPath();
    dm.concurrency = static_cast<std::size_t>(std::max(1, cfg.downloads.concurrency));
    dm.fetch.retry.maxAttempts = cfg.downloads.maxAttempts;
    dm.fetch.retry.initialBackoff = cfg.downloads.initialBackoff;
    dm.fetch.retry.multiplier = cfg.downloads.backoffMultiplier;
    dm.fetch.retry.maxBackoff = cfg.downloads.maxBackoff;
    dm.fetch.transfer.timeout = cfg.downloads.requestTimeout;
    dm.fetch.transfer.connectTimeout = cfg.downloads.connectTimeout;
    dm.fetch.transfer.tls.insecure = cfg.downloads.tlsInsecure;
    if (!cfg.downloads.proxy.empty())
        dm.fetch.transfer.proxy = cfg.downloads.proxy;
    return dm;
}

vector::RagRuntimeConfig ragConfigFrom(const config::CoreConfig& cfg) {
    vector::RagRuntimeConfig rc;
    rc.databasePath = cfg.ragDatabasePath();
    rc.chunking.chunkSize = cfg.rag.chunkSize;
    rc.chunking.overlap = cfg.rag.chunkOverlap;
    rc.topK = cfg.rag.topK;
    return rc;
}

} // namespace

ChatEngine::ChatEngine(config::CoreConfig config, Dependencies deps) : config_(std::move(config)) {
    std::shared_ptr<vector::IEmbeddingBackend> hash = vector::makeHashEmbeddingBackend();
    embeddingBackends_[hash->providerId()] = hash;
    for (auto& backend : deps.embeddingBackends) {
        if (backend)
            embeddingBackends_[backend->providerId()] = backend;
    }

    downloads_ = std::make_shared<downloader::ModelDownloadManager>(downloadConfigFrom(config_),
                                                                    std::move(deps.http));
    lifecycle_ =
        std::make_unique<model::ModelLifecycleManager>(std::move(deps.nativeRuntime), downloads_);
    rag_ = std::make_unique<vector::RagRuntime>(ragConfigFrom(config_),
                                                backendFor(config_.rag.embeddingProvider),
                                                downloads_, config_.rag.embeddingModel);

    for (const auto& descriptor : vector::embeddingCatalog()) {
        catalog_.emplace(descriptor.id, descriptor);
    }
}

ChatEngine::~ChatEngine() {
    lifecycle_.reset();
    rag_.reset();
    if (downloads_)
        downloads_->shutdown();
}

std::shared_ptr<vector::IEmbeddingBackend>
ChatEngine::backendFor(const std::string& providerId) const {
    auto it = embeddingBackends_.find(providerId);
    if (it != embeddingBackends_.end())
        return it->second;
    spdlog::warn("[ChatEngine] No embedding backend '{}', falling back to 'hash'", providerId);
    return embeddingBackends_.at("hash");
}

Result<void> ChatEngine::bootstrap() {
    std::lock_guard<std::mutex> lock(bootstrapMutex_);
    if (bootstrapped_)
        return {};

    applyLogLevel(config_.logLevel);
    auto opened = downloads_->open();
    if (!opened) {
        spdlog::error("[ChatEngine] Download registry unavailable: {}", opened.error().message);
        return opened;
    }
    const auto resumed = downloads_->reattach();
    if (resumed > 0) {
        spdlog::info("[ChatEngine] Resumed {} interrupted download(s)", resumed);
    }
    bootstrapped_ = true;
    return {};
}

void ChatEngine::registerModel(ModelDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    catalog_[descriptor.id] = std::move(descriptor);
}

std::vector<ModelDescriptor> ChatEngine::models() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelDescriptor> out;
    out.reserve(catalog_.size());
    for (const auto& [_, d] : catalog_) {
        out.push_back(d);
    }
    return out;
}

Result<downloader::DownloadHandle> ChatEngine::downloadModel(const std::string& modelId) {
    ModelDescriptor descriptor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = catalog_.find(modelId);
        if (it == catalog_.end()) {
            return Error{ErrorCode::NotFound, "Unknown model: " + modelId};
        }
        descriptor = it->second;
    }
    return downloads_->start(descriptor);
}

Result<void> ChatEngine::pauseDownload(const std::string& modelId) {
    return downloads_->pause(modelId);
}

Result<downloader::DownloadHandle> ChatEngine::resumeDownload(const std::string& modelId) {
    return downloads_->resume(modelId);
}

Result<void> ChatEngine::cancelDownload(const std::string& modelId) {
    return downloads_->cancel(modelId);
}

Result<void> ChatEngine::removeModel(const std::string& modelId) {
    if (lifecycle_->snapshot().modelId == modelId) {
        auto unloaded = lifecycle_->unload();
        if (!unloaded)
            return unloaded;
    }
    return downloads_->remove(modelId);
}

void ChatEngine::registerRemoteProvider(std::shared_ptr<IRemoteProvider> provider) {
    if (!provider)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    remoteProviders_[provider->id()] = std::move(provider);
}

Result<void> ChatEngine::selectModel(const std::string& modelId, const std::string& provider,
                                     model::SelectOptions options) {
    if (provider != kLocalProvider) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remoteProviders_.count(provider) == 0) {
            return Error{ErrorCode::NotFound, "Unknown provider: " + provider};
        }
        activeProvider_ = provider;
        activeModel_ = modelId;
        spdlog::info("[ChatEngine] Routing prompts to {}/{}", provider, modelId);
        return {};
    }

    auto selected = lifecycle_->select(modelId, options);
    if (!selected)
        return selected;
    std::lock_guard<std::mutex> lock(mutex_);
    activeProvider_ = kLocalProvider;
    activeModel_ = modelId;
    return {};
}

std::string ChatEngine::buildPrompt(const PromptRequest& request, bool& usedContext) {
    usedContext = false;
    if (!request.useContext)
        return request.message;

    auto augmented = rag_->augment(request.message, request.retrieval);
    if (!augmented) {
        spdlog::warn("[ChatEngine] Context retrieval failed, sending without context: {}",
                     augmented.error().message);
        return request.message;
    }
    if (augmented.value() == request.message)
        return request.message;
    usedContext = true;
    return std::string(vector::kContextInstruction) + "\n" + augmented.value();
}

Result<ChatResponse> ChatEngine::sendPrompt(const PromptRequest& request) {
    std::string provider;
    std::string modelId;
    std::shared_ptr<IRemoteProvider> remote;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = activeProvider_;
        modelId = activeModel_;
        if (provider != kLocalProvider) {
            auto it = remoteProviders_.find(provider);
            if (it != remoteProviders_.end())
                remote = it->second;
        }
    }
    if (provider.empty()) {
        return Error{ErrorCode::InvalidState, "No model selected"};
    }

    bool usedContext = false;
    const auto prompt = buildPrompt(request, usedContext);

    auto response = remote ? generateRemote(*remote, prompt, request)
                           : generateLocal(prompt, request);
    if (!response)
        return response;
    auto out = std::move(response).value();
    out.provider = provider;
    out.modelId = modelId;
    out.usedContext = usedContext;
    return out;
}

Result<ChatResponse> ChatEngine::generateLocal(const std::string& prompt,
                                               const PromptRequest& request) {
    auto session = lifecycle_->startGeneration(prompt);
    if (!session)
        return session.error();

    // Shared with the fragment callback, which may still run on the producer thread
    // while an interrupted wait() returns here
    struct StreamState {
        std::mutex mutex;
        model::ThinkingParser parser;
        std::function<void(const model::ParsedResponse&)> onUpdate;
    };
    auto state = std::make_shared<StreamState>();
    state->onUpdate = request.onUpdate;
    session.value()->onFragment([state](const std::string& fragment) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->parser.append(fragment);
        if (state->onUpdate)
            state->onUpdate(state->parser.current());
    });

    auto text = session.value()->wait();
    if (!text)
        return text.error();

    const auto parsed = model::ThinkingParser::parse(text.value());
    ChatResponse out;
    out.raw = text.value();
    out.thinking = parsed.thinking;
    out.message = parsed.message;
    return out;
}

Result<ChatResponse> ChatEngine::generateRemote(IRemoteProvider& provider, const std::string& prompt,
                                                const PromptRequest& request) {
    model::ThinkingParser parser;
    Result<std::string> text = std::string{};
    try {
        text = provider.stream(prompt, [&](const std::string& fragment) {
            parser.append(fragment);
            if (request.onUpdate)
                request.onUpdate(parser.current());
        });
    } catch (const std::exception& e) {
        return Error{ErrorCode::NetworkError, "Remote provider '" + provider.id() + "': " + e.what()};
    }
    if (!text)
        return text.error();

    const auto parsed = model::ThinkingParser::parse(text.value());
    ChatResponse out;
    out.raw = text.value();
    out.thinking = parsed.thinking;
    out.message = parsed.message;
    return out;
}

void ChatEngine::stopGeneration() {
    lifecycle_->interrupt();
}

void ChatEngine::updateGenerationConfig(const std::string& modelId, model::GenerationConfig config) {
    lifecycle_->updateConfig(modelId, std::move(config));
}

Result<vector::Source> ChatEngine::addSource(const vector::SourceFile& file) {
    return rag_->addSource(file);
}

Result<std::size_t> ChatEngine::deleteSource(const std::string& sourceId) {
    return rag_->deleteSource(sourceId);
}

Result<std::size_t> ChatEngine::reprocessAll(const vector::ReindexProgressCallback& onProgress) {
    return rag_->reprocessAll(onProgress);
}

Result<std::vector<vector::Source>> ChatEngine::sources() {
    return rag_->listSources();
}

Result<void> ChatEngine::setEmbeddingModel(const std::string& providerId,
                                           const std::string& modelId) {
    auto it = embeddingBackends_.find(providerId);
    if (it == embeddingBackends_.end()) {
        return Error{ErrorCode::NotFound, "Unknown embedding provider: " + providerId};
    }
    rag_->setEmbeddingModel(it->second, modelId);
    return {};
}

downloader::SubscriptionId
ChatEngine::subscribeDownloadProgress(const std::string& modelId,
                                      downloader::DownloadProgressCallback cb) {
    return downloads_->subscribe(modelId, std::move(cb));
}

void ChatEngine::unsubscribeDownloadProgress(downloader::SubscriptionId id) {
    downloads_->unsubscribe(id);
}

model::LifecycleSubscriptionId ChatEngine::subscribeGenerationState(model::LifecycleCallback cb) {
    return lifecycle_->subscribe(std::move(cb));
}

void ChatEngine::unsubscribeGenerationState(model::LifecycleSubscriptionId id) {
    lifecycle_->unsubscribe(id);
}

vector::RagRuntime::SubscriptionId
ChatEngine::subscribeRagStatus(vector::RagRuntime::StatusCallback cb) {
    return rag_->subscribe(std::move(cb));
}

void ChatEngine::unsubscribeRagStatus(vector::RagRuntime::SubscriptionId id) {
    rag_->unsubscribe(id);
}

model::LifecycleSnapshot ChatEngine::generationState() const {
    return lifecycle_->snapshot();
}

vector::RagStatus ChatEngine::ragStatus() const {
    return rag_->status();
}

Result<std::unique_ptr<ChatEngine>> bootstrapChatEngine(ChatEngine::Dependencies deps) {
    config::CoreConfig cfg;
    try {
        cfg = config::loadCoreConfig();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Failed to load configuration: ") + e.what()};
    }
    auto engine = std::make_unique<ChatEngine>(std::move(cfg), std::move(deps));
    auto r = engine->bootstrap();
    if (!r)
        return r.error();
    return std::move(engine);
}

} // namespace modelflux::app
