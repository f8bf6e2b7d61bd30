#include <modelflux/common/utf8_utils.h>
#include <modelflux/vector/document_chunker.h>

#include <algorithm>

namespace modelflux::vector {

DocumentChunker::DocumentChunker(ChunkingConfig config) : config_(config) {}

Result<void> DocumentChunker::validate(const ChunkingConfig& config) {
    if (config.chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "Chunk size must be positive"};
    }
    if (config.overlap >= config.chunkSize) {
        return Error{ErrorCode::InvalidArgument, "Chunk overlap must be smaller than chunk size"};
    }
    return {};
}

std::size_t DocumentChunker::expectedChunkCount(std::size_t length, const ChunkingConfig& config) {
    if (length == 0)
        return 0;
    if (length <= config.chunkSize)
        return 1;
    const auto stride = config.chunkSize - config.overlap;
    return (length - config.overlap + stride - 1) / stride;
}

Result<std::vector<DocumentChunk>> DocumentChunker::chunk(std::string_view text) const {
    if (auto v = validate(config_); !v)
        return v.error();

    const std::string clean = common::sanitizeUtf8(text);
    const auto offsets = common::codePointOffsets(clean);
    const std::size_t length = offsets.size() - 1;

    std::vector<DocumentChunk> chunks;
    if (length == 0)
        return chunks;
    chunks.reserve(expectedChunkCount(length, config_));

    std::size_t start = 0;
    for (;;) {
        const std::size_t end = std::min(start + config_.chunkSize, length);
        DocumentChunk c;
        c.index = chunks.size();
        c.startOffset = start;
        c.endOffset = end;
        c.content = clean.substr(offsets[start], offsets[end] - offsets[start]);
        chunks.push_back(std::move(c));
        if (end == length)
            break;
        start = end - config_.overlap;
    }
    return chunks;
}

} // namespace modelflux::vector
