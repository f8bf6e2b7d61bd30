#pragma once

#include <modelflux/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modelflux::vector {

/**
 * Sliding-window chunking over Unicode code points.
 */
struct ChunkingConfig {
    std::size_t chunkSize = 1000; // code points per chunk (max)
    std::size_t overlap = 100;    // code points shared with the previous chunk
};

struct DocumentChunk {
    std::size_t index = 0;       // position in document (0-based)
    std::string content;         // UTF-8 text
    std::size_t startOffset = 0; // code point offsets into the document
    std::size_t endOffset = 0;

    std::size_t length() const { return endOffset - startOffset; }
};

class DocumentChunker {
public:
    explicit DocumentChunker(ChunkingConfig config = {});

    static Result<void> validate(const ChunkingConfig& config);

    /**
     * Split text into windows of chunkSize code points, each starting `overlap` code points
     * before the end of its predecessor. A text of L code points (L > overlap) yields
     * ceil((L - overlap) / (chunkSize - overlap)) chunks; the last may be shorter.
     * Malformed UTF-8 is sanitized first.
     */
    Result<std::vector<DocumentChunk>> chunk(std::string_view text) const;

    static std::size_t expectedChunkCount(std::size_t length, const ChunkingConfig& config);

    const ChunkingConfig& config() const { return config_; }

private:
    ChunkingConfig config_;
};

} // namespace modelflux::vector
