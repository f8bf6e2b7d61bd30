#pragma once

#include <modelflux/core/types.h>
#include <modelflux/vector/embedding_provider.h>
#include <modelflux/vector/rag_types.h>
#include <modelflux/vector/staleness_tracker.h>
#include <modelflux/vector/vector_index.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelflux::vector {

/// Instruction placed ahead of a context-wrapped message
extern const char* const kContextInstruction;

struct RetrievalOptions {
    std::size_t k{5};
    std::optional<std::set<std::string>> sourceFilter;
};

/**
 * Embeds a query with the active embedding model and returns the nearest chunks.
 *
 * A stale index yields no results rather than vectors from a different embedding space;
 * callers surface staleness through StalenessTracker.
 */
class RetrievalOrchestrator {
public:
    RetrievalOrchestrator(std::shared_ptr<VectorIndex> index,
                          std::shared_ptr<StalenessTracker> staleness,
                          std::shared_ptr<EmbeddingProvider> embedder);

    Result<std::vector<SearchHit>> retrieve(const std::string& query,
                                            const RetrievalOptions& options = {});

    void setEmbeddingProvider(std::shared_ptr<EmbeddingProvider> embedder);

    /**
     * Numbered source blocks with relevance percentages, e.g.
     *   "\n --- Source 1: notes.txt (Relevance: 87.5%) --- \n <text> \n --- End of Source 1 ---"
     * `sourceNames` maps source ids to display names; unknown ids print the id.
     */
    static std::string buildContext(const std::vector<SearchHit>& hits,
                                    const std::unordered_map<std::string, std::string>& sourceNames);

    /// "<context>" + context + "</context>\n" + message, or `message` when context is empty
    static std::string wrapMessageWithContext(const std::string& message,
                                              const std::string& context);

private:
    std::shared_ptr<VectorIndex> index_;
    std::shared_ptr<StalenessTracker> staleness_;

    mutable std::mutex mutex_;
    std::shared_ptr<EmbeddingProvider> embedder_;
};

} // namespace modelflux::vector
