#pragma once

#include <modelflux/core/types.h>
#include <modelflux/extraction/text_extractor.h>
#include <modelflux/vector/document_chunker.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/rag_store.h>
#include <modelflux/vector/rag_types.h>
#include <modelflux/vector/staleness_tracker.h>
#include <modelflux/vector/vector_index.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace modelflux::vector {

/**
 * A document the user picked. Empty `name` defaults to the file name, empty `mimeType`
 * is guessed from the extension.
 */
struct SourceFile {
    std::filesystem::path path;
    std::string name;
    std::string mimeType;
};

using ReindexProgressCallback = std::function<void(std::size_t current, std::size_t total)>;

/**
 * Extract -> chunk -> embed -> index for user documents.
 *
 * Ingestion and deletion share the pipeline; a full reindex excludes both, so its atomic
 * swap never drops a concurrently added source.
 */
class DocumentIngestionPipeline {
public:
    DocumentIngestionPipeline(std::shared_ptr<RagStore> store, std::shared_ptr<VectorIndex> index,
                              std::shared_ptr<StalenessTracker> staleness,
                              std::shared_ptr<EmbeddingProvider> embedder,
                              ChunkingConfig chunking = {},
                              const extraction::TextExtractorFactory* extractors = nullptr);

    /**
     * Ingest a file. Fails with NotSupported or EmptyDocument before any Source is
     * created; an embedding failure leaves the Source recorded with lastError set and
     * returns EmbeddingFailed.
     */
    Result<Source> addSource(const SourceFile& file);

    /// Ingest already-extracted text under `name`
    Result<Source> addText(const std::string& name, const std::string& text,
                           const std::string& mimeType = "text/plain",
                           const std::string& uri = {});

    /// Delete a source and all of its chunks; returns the number of chunks removed
    Result<std::size_t> deleteSource(const std::string& sourceId);

    /**
     * Re-embed every stored source with the current embedding model and swap the rebuilt
     * index in atomically, then record the model as the index provenance. Returns the
     * number of chunks in the new index.
     */
    Result<std::size_t> reindexAllSources(const ReindexProgressCallback& onProgress = {});

    Result<std::vector<Source>> listSources() const;

    void setEmbeddingProvider(std::shared_ptr<EmbeddingProvider> embedder);
    [[nodiscard]] std::shared_ptr<EmbeddingProvider> embeddingProvider() const;

private:
    Result<Source> ingest(Source source, const std::string& text);
    Result<std::vector<Chunk>> embedChunks(EmbeddingProvider& embedder,
                                           const std::string& sourceId,
                                           const std::string& text) const;

    std::shared_ptr<RagStore> store_;
    std::shared_ptr<VectorIndex> index_;
    std::shared_ptr<StalenessTracker> staleness_;
    DocumentChunker chunker_;
    const extraction::TextExtractorFactory* extractors_;

    mutable std::mutex embedderMutex_;
    std::shared_ptr<EmbeddingProvider> embedder_;

    std::shared_mutex reindexMutex_;
};

std::string generateSourceId();

} // namespace modelflux::vector
