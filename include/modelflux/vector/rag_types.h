#pragma once

#include <modelflux/core/types.h>

#include <cstdint>
#include <string>

namespace modelflux::vector {

/**
 * A user document added to the RAG library.
 */
struct Source {
    std::string id;
    std::string uri;
    std::string name;
    std::uint64_t sizeBytes{0};
    std::string mimeType;
    bool isProcessing{false};
    std::string lastError;
    std::int64_t createdAt{0}; // unix seconds
};

/**
 * One embedded chunk of a source. `sequence` is a global insertion counter used to
 * break similarity ties in favour of older chunks.
 */
struct Chunk {
    std::int64_t chunkId{0};
    std::string sourceId;
    std::size_t index{0};
    std::string text;
    Embedding vector;
    std::uint64_t sequence{0};
};

struct SearchHit {
    Chunk chunk;
    float similarity{0.0f};
};

} // namespace modelflux::vector
