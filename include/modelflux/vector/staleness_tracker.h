#pragma once

#include <modelflux/core/types.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/rag_store.h>

#include <memory>
#include <mutex>
#include <optional>

namespace modelflux::vector {

/**
 * Remembers which (provider, model) built the vector index and compares it with the
 * active embedding model. Only a full reindex moves the record to a different model.
 */
class StalenessTracker {
public:
    explicit StalenessTracker(std::shared_ptr<RagStore> store);

    Result<void> load();

    /// True iff a record exists and differs from `active`
    [[nodiscard]] bool isStale(const EmbeddingIdentity& active) const;

    [[nodiscard]] std::optional<EmbeddingIdentity> record() const;

    /// Write `identity` only when no record exists yet (first successful ingestion)
    Result<void> recordIfAbsent(const EmbeddingIdentity& identity);

    /// Persist `identity` as the current record
    Result<void> update(const EmbeddingIdentity& identity);

    /// Adopt `identity` after the store already persisted it (atomic rebuild)
    void noteRebuilt(const EmbeddingIdentity& identity);

private:
    std::shared_ptr<RagStore> store_;
    mutable std::mutex mutex_;
    std::optional<EmbeddingIdentity> record_;
};

} // namespace modelflux::vector
