#pragma once

#include <modelflux/extraction/text_extractor.h>

namespace modelflux::extraction {

/**
 * @brief Extractor for text/* documents (plain text, markdown, source code, CSV ...)
 *
 * A UTF-8 byte order mark is stripped and malformed sequences are replaced, so the
 * returned text is always valid UTF-8. Buffers that look binary are rejected.
 */
class PlainTextExtractor : public ITextExtractor {
public:
    PlainTextExtractor() = default;
    ~PlainTextExtractor() override = default;

    Result<ExtractionResult> extract(const std::filesystem::path& path,
                                     const ExtractionConfig& config = {}) override;

    Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                               const ExtractionConfig& config = {}) override;

    std::vector<std::string> supportedExtensions() const override;

    std::string name() const override { return "Plain Text Extractor"; }

    /**
     * @brief Check if data is likely binary (NUL bytes or >30% control characters)
     */
    static bool isBinary(std::span<const std::byte> data);
};

} // namespace modelflux::extraction
