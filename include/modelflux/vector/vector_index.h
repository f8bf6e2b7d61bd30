#pragma once

#include <modelflux/core/types.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/rag_store.h>
#include <modelflux/vector/rag_types.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace modelflux::vector {

/**
 * In-memory cosine kNN over chunk vectors, grouped by source.
 *
 * Readers take an immutable Snapshot; writers build a new snapshot, persist the change in
 * one SQLite transaction and only then publish it, so a reader sees either the old or the
 * new state of a source, never a mix.
 */
class VectorIndex {
public:
    struct Snapshot {
        std::vector<Chunk> chunks; // ordered by sequence
        bool built{false};
    };

    /// `store` may be null for a memory-only index
    explicit VectorIndex(std::shared_ptr<RagStore> store);

    Result<void> load();

    /// Replace all chunks of `sourceId`; assigns sequence numbers in the given order
    Result<void> insert(const std::string& sourceId, std::vector<Chunk> chunks);

    /// Remove every chunk of `sourceId`; returns how many were removed
    Result<std::size_t> removeSource(const std::string& sourceId);

    /// Replace the whole index and write the provenance record atomically
    Result<void> rebuild(std::vector<Chunk> chunks, const EmbeddingIdentity& identity);

    /**
     * Top-k chunks by descending cosine similarity; ties go to the lower sequence.
     * With `sourceFilter` only chunks of those sources are considered.
     */
    Result<std::vector<SearchHit>>
    query(const Embedding& vector, std::size_t k,
          const std::optional<std::set<std::string>>& sourceFilter = std::nullopt) const;

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;
    [[nodiscard]] bool built() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t countForSource(const std::string& sourceId) const;

    /**
     * Exclusive hold on one source id, released on destruction. The table entry behind it
     * is dropped once no holder or waiter is left.
     */
    class SourceLock {
    public:
        ~SourceLock();
        SourceLock(const SourceLock&) = delete;
        SourceLock& operator=(const SourceLock&) = delete;

    private:
        friend class VectorIndex;
        SourceLock(VectorIndex& index, std::string sourceId);

        VectorIndex& index_;
        std::string sourceId_;
    };

    /// Serializes writers touching the same source across ingestion and deletion
    [[nodiscard]] SourceLock lockSource(const std::string& sourceId);

    /// Source ids that currently have a holder or waiter
    [[nodiscard]] std::size_t lockedSourceCount() const;

private:
    struct SourceLockEntry {
        std::mutex mutex;
        std::size_t users{0};
    };


    void publish(std::shared_ptr<const Snapshot> next);

    std::shared_ptr<RagStore> store_;

    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const Snapshot> snapshot_;

    std::mutex writeMutex_;
    std::atomic<std::uint64_t> nextSequence_{1};

    mutable std::mutex sourceLocksMutex_;
    std::map<std::string, SourceLockEntry> sourceLocks_;
};

float cosineSimilarity(const Embedding& a, const Embedding& b);

} // namespace modelflux::vector
