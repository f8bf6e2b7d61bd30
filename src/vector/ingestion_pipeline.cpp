#include <modelflux/common/utf8_utils.h>
#include <modelflux/vector/ingestion_pipeline.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <random>

namespace modelflux::vector {

std::string generateSourceId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "src-%016llx", static_cast<unsigned long long>(rng()));
    return buf;
}

DocumentIngestionPipeline::DocumentIngestionPipeline(
    std::shared_ptr<RagStore> store, std::shared_ptr<VectorIndex> index,
    std::shared_ptr<StalenessTracker> staleness, std::shared_ptr<EmbeddingProvider> embedder,
    ChunkingConfig chunking, const extraction::TextExtractorFactory* extractors)
    : store_(std::move(store)), index_(std::move(index)), staleness_(std::move(staleness)),
      chunker_(chunking),
      extractors_(extractors ? extractors : &extraction::TextExtractorFactory::instance()),
      embedder_(std::move(embedder)) {}

void DocumentIngestionPipeline::setEmbeddingProvider(std::shared_ptr<EmbeddingProvider> embedder) {
    std::lock_guard<std::mutex> lock(embedderMutex_);
    embedder_ = std::move(embedder);
}

std::shared_ptr<EmbeddingProvider> DocumentIngestionPipeline::embeddingProvider() const {
    std::lock_guard<std::mutex> lock(embedderMutex_);
    return embedder_;
}

Result<std::vector<Source>> DocumentIngestionPipeline::listSources() const {
    return store_->listSources();
}

Result<Source> DocumentIngestionPipeline::addSource(const SourceFile& file) {
    const auto mime =
        file.mimeType.empty() ? extraction::guessMimeType(file.path) : file.mimeType;
    auto extracted = extraction::extractText(*extractors_, file.path, mime);
    if (!extracted) {
        spdlog::warn("[Ingestion] Extraction failed for {}: {}", file.path.string(),
                     extracted.error().message);
        return extracted.error();
    }

    Source source;
    source.id = generateSourceId();
    source.uri = file.path.string();
    source.name = file.name.empty() ? file.path.filename().string() : file.name;
    std::error_code ec;
    const auto size = std::filesystem::file_size(file.path, ec);
    source.sizeBytes = ec ? 0 : static_cast<std::uint64_t>(size);
    source.mimeType = mime;
    return ingest(std::move(source), extracted.value().text);
}

Result<Source> DocumentIngestionPipeline::addText(const std::string& name, const std::string& text,
                                                  const std::string& mimeType,
                                                  const std::string& uri) {
    Source source;
    source.id = generateSourceId();
    source.uri = uri;
    source.name = name;
    source.sizeBytes = text.size();
    source.mimeType = mimeType;
    return ingest(std::move(source), common::sanitizeUtf8(text));
}

Result<Source> DocumentIngestionPipeline::ingest(Source source, const std::string& text) {
    if (common::isBlank(text)) {
        return Error{ErrorCode::EmptyDocument, "Document '" + source.name + "' contains no text"};
    }
    auto embedder = embeddingProvider();
    if (!embedder) {
        return Error{ErrorCode::NotInitialized, "No embedding model configured"};
    }

    std::shared_lock<std::shared_mutex> reindexLock(reindexMutex_);
    auto sourceLock = index_->lockSource(source.id);

    source.isProcessing = true;
    source.createdAt = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    auto stored = store_->upsertSource(source, text);
    if (!stored)
        return stored.error();

    const auto fail = [&](const Error& err) -> Error {
        source.isProcessing = false;
        source.lastError = err.message;
        auto r = store_->updateSourceStatus(source.id, false, err.message);
        if (!r) {
            spdlog::warn("[Ingestion] Could not record failure for {}: {}", source.id,
                         r.error().message);
        }
        spdlog::error("[Ingestion] '{}' failed: {}", source.name, err.message);
        return err;
    };

    auto chunks = embedChunks(*embedder, source.id, text);
    if (!chunks)
        return fail(chunks.error());

    const auto chunkCount = chunks.value().size();
    auto inserted = index_->insert(source.id, std::move(chunks).value());
    if (!inserted)
        return fail(inserted.error());

    auto recorded = staleness_->recordIfAbsent(embedder->identity());
    if (!recorded) {
        spdlog::warn("[Ingestion] Could not record index provenance: {}",
                     recorded.error().message);
    }

    source.isProcessing = false;
    source.lastError.clear();
    auto status = store_->updateSourceStatus(source.id, false, "");
    if (!status)
        return status.error();

    spdlog::info("[Ingestion] Added '{}' ({} chunks)", source.name, chunkCount);
    return source;
}

Result<std::vector<Chunk>> DocumentIngestionPipeline::embedChunks(EmbeddingProvider& embedder,
                                                                  const std::string& sourceId,
                                                                  const std::string& text) const {
    auto pieces = chunker_.chunk(text);
    if (!pieces)
        return pieces.error();

    std::vector<Chunk> out;
    out.reserve(pieces.value().size());
    for (auto& piece : pieces.value()) {
        auto vec = embedder.embed(piece.content);
        if (!vec) {
            return Error{ErrorCode::EmbeddingFailed,
                         "Chunk " + std::to_string(piece.index) + ": " + vec.error().message};
        }
        Chunk c;
        c.sourceId = sourceId;
        c.index = piece.index;
        c.text = std::move(piece.content);
        c.vector = std::move(vec).value();
        out.push_back(std::move(c));
    }
    return out;
}

Result<std::size_t> DocumentIngestionPipeline::deleteSource(const std::string& sourceId) {
    std::shared_lock<std::shared_mutex> reindexLock(reindexMutex_);
    auto sourceLock = index_->lockSource(sourceId);

    auto existing = store_->getSource(sourceId);
    if (!existing)
        return existing.error();
    if (!existing.value()) {
        return Error{ErrorCode::NotFound, "Source not found: " + sourceId};
    }
    auto removed = index_->removeSource(sourceId);
    if (!removed)
        return removed;
    spdlog::info("[Ingestion] Deleted '{}' ({} chunks)", existing.value()->name, removed.value());
    return removed;
}

Result<std::size_t>
DocumentIngestionPipeline::reindexAllSources(const ReindexProgressCallback& onProgress) {
    auto embedder = embeddingProvider();
    if (!embedder) {
        return Error{ErrorCode::NotInitialized, "No embedding model configured"};
    }
    std::unique_lock<std::shared_mutex> reindexLock(reindexMutex_);

    auto sources = store_->listSources();
    if (!sources)
        return sources.error();

    const auto total = sources.value().size();
    const auto identity = embedder->identity();
    spdlog::info("[Ingestion] Reindexing {} sources with {}", total, identity.toString());

    std::vector<Chunk> all;
    std::size_t current = 0;
    for (const auto& source : sources.value()) {
        auto content = store_->sourceContent(source.id);
        if (!content)
            return content.error();
        if (!common::isBlank(content.value())) {
            auto chunks = embedChunks(*embedder, source.id, content.value());
            if (!chunks) {
                spdlog::error("[Ingestion] Reindex aborted at '{}': {}", source.name,
                              chunks.error().message);
                return chunks.error();
            }
            for (auto& c : chunks.value()) {
                all.push_back(std::move(c));
            }
        }
        ++current;
        if (onProgress)
            onProgress(current, total);
    }

    const auto chunkCount = all.size();
    auto rebuilt = index_->rebuild(std::move(all), identity);
    if (!rebuilt)
        return rebuilt.error();
    staleness_->noteRebuilt(identity);

    for (const auto& source : sources.value()) {
        if (!source.lastError.empty() || source.isProcessing) {
            auto r = store_->updateSourceStatus(source.id, false, "");
            if (!r)
                return r.error();
        }
    }
    return chunkCount;
}

} // namespace modelflux::vector
