#pragma once

#include <modelflux/core/types.h>
#include <modelflux/storage/database.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/rag_types.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelflux::vector {

/**
 * SQLite persistence for the RAG library (rag.db):
 *   sources  - source metadata and extracted text
 *   chunks   - chunk text and float32 vectors, cascading on source deletion
 *   rag_meta - key/value pairs (staleness record, index-built flag)
 * Every mutating call runs in one transaction.
 */
class RagStore {
public:
    RagStore() = default;

    /// Opens (creating if needed) the database; ":memory:" gives a private in-memory store
    Result<void> open(const std::string& path);
    void close();

    Result<void> upsertSource(const Source& source, const std::string& content);
    Result<void> updateSourceStatus(const std::string& sourceId, bool isProcessing,
                                    const std::string& lastError);
    Result<std::vector<Source>> listSources();
    Result<std::optional<Source>> getSource(const std::string& sourceId);
    Result<std::string> sourceContent(const std::string& sourceId);

    /// Deletes the source row and all of its chunks; returns the number of chunks removed
    Result<std::size_t> deleteSource(const std::string& sourceId);

    /// Replace the chunks of one source; assigns chunkId on each element
    Result<void> replaceChunks(const std::string& sourceId, std::vector<Chunk>& chunks);

    /// Replace every chunk and write the staleness record in one transaction
    Result<void> replaceAllChunks(std::vector<Chunk>& chunks, const EmbeddingIdentity& identity);

    Result<std::vector<Chunk>> loadChunks();

    Result<std::optional<EmbeddingIdentity>> stalenessRecord();
    Result<void> setStalenessRecord(const EmbeddingIdentity& identity);

    Result<std::optional<std::string>> getMeta(const std::string& key);
    Result<void> setMeta(const std::string& key, const std::string& value);

private:
    Result<void> createSchema();
    Result<void> insertChunksLocked(std::vector<Chunk>& chunks);
    Result<void> setMetaLocked(const std::string& key, const std::string& value);

    std::mutex mutex_;
    storage::Database db_;
};

} // namespace modelflux::vector
