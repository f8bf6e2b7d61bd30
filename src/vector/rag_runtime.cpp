#include <modelflux/vector/rag_runtime.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <chrono>
#include <exception>
#include <unordered_map>

namespace modelflux::vector {

const char* ragStatusName(RagStatus status) {
    switch (status) {
        case RagStatus::Uninitialized:
            return "uninitialized";
        case RagStatus::Initializing:
            return "initializing";
        case RagStatus::Ready:
            return "ready";
        case RagStatus::Stale:
            return "stale";
        case RagStatus::Error:
            return "error";
    }
    return "unknown";
}

RagRuntime::RagRuntime(RagRuntimeConfig config, std::shared_ptr<IEmbeddingBackend> backend,
                       std::shared_ptr<const downloader::IDownloadStatusProvider> downloads,
                       std::string embeddingModelId)
    : config_(std::move(config)), downloads_(std::move(downloads)), backend_(std::move(backend)),
      modelId_(std::move(embeddingModelId)) {
    embedder_ = makeProvider();
}

RagRuntime::~RagRuntime() {
    initPool_.join();
    std::lock_guard<std::mutex> lock(providerMutex_);
    if (embedder_)
        embedder_->unload();
}

std::shared_ptr<EmbeddingProvider> RagRuntime::makeProvider() const {
    const auto descriptor = findEmbeddingModel(modelId_);
    const std::size_t dim = descriptor ? descriptor->embeddingDimension : 0;
    return std::make_shared<EmbeddingProvider>(backend_, downloads_, modelId_, dim);
}

std::shared_future<Result<void>> RagRuntime::initialize() {
    std::lock_guard<std::mutex> lock(initMutex_);
    if (initFuture_) {
        const auto& fut = *initFuture_;
        if (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return fut;
        }
        if (fut.get()) {
            return fut;
        }
        spdlog::info("[RagRuntime] Retrying initialization after failure");
    }

    auto promise = std::make_shared<std::promise<Result<void>>>();
    std::shared_future<Result<void>> fut = promise->get_future().share();
    initFuture_ = fut;
    setStatus(RagStatus::Initializing);

    boost::asio::post(initPool_, [this, promise]() {
        Result<void> r;
        try {
            r = doInitialize();
        } catch (const std::exception& e) {
            r = Error{ErrorCode::InternalError, std::string("RAG initialization: ") + e.what()};
        }
        if (r) {
            refreshStatus();
        } else {
            spdlog::error("[RagRuntime] Initialization failed: {}", r.error().message);
            setStatus(RagStatus::Error, r.error().message);
        }
        promise->set_value(r);
    });
    return fut;
}

Result<void> RagRuntime::ensureInitialized() {
    return initialize().get();
}

Result<void> RagRuntime::doInitialize() {
    const auto dbPath = config_.databasePath.string();
    if (dbPath != ":memory:" && config_.databasePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.databasePath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create " +
                                                 config_.databasePath.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    auto store = std::make_shared<RagStore>();
    auto opened = store->open(config_.databasePath.string());
    if (!opened)
        return opened;

    auto index = std::make_shared<VectorIndex>(store);
    auto loaded = index->load();
    if (!loaded)
        return loaded;

    auto staleness = std::make_shared<StalenessTracker>(store);
    auto st = staleness->load();
    if (!st)
        return st;

    std::lock_guard<std::mutex> lock(providerMutex_);
    store_ = store;
    index_ = index;
    staleness_ = staleness;
    pipeline_ = std::make_unique<DocumentIngestionPipeline>(store_, index_, staleness_, embedder_,
                                                            config_.chunking);
    retrieval_ = std::make_unique<RetrievalOrchestrator>(index_, staleness_, embedder_);
    spdlog::info("[RagRuntime] Ready: {} chunks, embedding model {}", index_->size(),
                 embedder_->identity().toString());
    return {};
}

void RagRuntime::setEmbeddingModel(std::shared_ptr<IEmbeddingBackend> backend,
                                   std::string modelId) {
    {
        std::lock_guard<std::mutex> lock(providerMutex_);
        auto previous = embedder_;
        backend_ = std::move(backend);
        modelId_ = std::move(modelId);
        embedder_ = makeProvider();
        if (pipeline_)
            pipeline_->setEmbeddingProvider(embedder_);
        if (retrieval_)
            retrieval_->setEmbeddingProvider(embedder_);
        if (previous)
            previous->unload();
        spdlog::info("[RagRuntime] Active embedding model is now {}",
                     embedder_->identity().toString());
    }
    const auto current = status();
    if (current == RagStatus::Ready || current == RagStatus::Stale)
        refreshStatus();
}

EmbeddingIdentity RagRuntime::activeIdentity() const {
    std::lock_guard<std::mutex> lock(providerMutex_);
    return embedder_->identity();
}

bool RagRuntime::isStale() const {
    std::shared_ptr<StalenessTracker> staleness;
    {
        std::lock_guard<std::mutex> lock(providerMutex_);
        staleness = staleness_;
    }
    return staleness && staleness->isStale(activeIdentity());
}

void RagRuntime::refreshStatus() {
    setStatus(isStale() ? RagStatus::Stale : RagStatus::Ready);
}

Result<Source> RagRuntime::addSource(const SourceFile& file) {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    auto r = pipeline_->addSource(file);
    refreshStatus();
    return r;
}

Result<Source> RagRuntime::addText(const std::string& name, const std::string& text) {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    auto r = pipeline_->addText(name, text);
    refreshStatus();
    return r;
}

Result<std::size_t> RagRuntime::deleteSource(const std::string& sourceId) {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    return pipeline_->deleteSource(sourceId);
}

Result<std::size_t> RagRuntime::reprocessAll(const ReindexProgressCallback& onProgress) {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    auto r = pipeline_->reindexAllSources(onProgress);
    if (r) {
        refreshStatus();
    } else {
        spdlog::error("[RagRuntime] Reprocessing failed: {}", r.error().message);
    }
    return r;
}

Result<std::vector<Source>> RagRuntime::listSources() {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    return pipeline_->listSources();
}

Result<std::vector<SearchHit>> RagRuntime::retrieve(const std::string& query,
                                                    std::optional<RetrievalOptions> options) {
    auto init = ensureInitialized();
    if (!init)
        return init.error();
    RetrievalOptions opts;
    opts.k = config_.topK;
    if (options)
        opts = *options;
    return retrieval_->retrieve(query, opts);
}

Result<std::string> RagRuntime::augment(const std::string& message,
                                        std::optional<RetrievalOptions> options) {
    auto hits = retrieve(message, std::move(options));
    if (!hits) {
        if (hits.error().code == ErrorCode::IndexNotReady) {
            spdlog::debug("[RagRuntime] No index yet; sending message without context");
            return message;
        }
        return hits.error();
    }
    if (hits.value().empty())
        return message;

    std::unordered_map<std::string, std::string> names;
    auto sources = pipeline_->listSources();
    if (sources) {
        for (const auto& s : sources.value()) {
            names.emplace(s.id, s.name);
        }
    }
    const auto context = RetrievalOrchestrator::buildContext(hits.value(), names);
    return RetrievalOrchestrator::wrapMessageWithContext(message, context);
}

RagStatus RagRuntime::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

std::string RagRuntime::lastError() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastError_;
}

RagRuntime::SubscriptionId RagRuntime::subscribe(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    const auto id = nextSubscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void RagRuntime::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.erase(id);
}

void RagRuntime::setStatus(RagStatus status, std::string error) {
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (status_ == status && lastError_ == error)
            return;
        status_ = status;
        lastError_ = error;
    }
    spdlog::debug("[RagRuntime] Status -> {}", ragStatusName(status));
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        for (const auto& [_, cb] : subscribers_) {
            callbacks.push_back(cb);
        }
    }
    for (const auto& cb : callbacks) {
        cb(status, error);
    }
}

} // namespace modelflux::vector
