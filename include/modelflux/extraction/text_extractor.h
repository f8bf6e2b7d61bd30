#pragma once

#include <modelflux/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelflux::extraction {

/**
 * @brief Result of text extraction from a document
 */
struct ExtractionResult {
    std::string text;                  // UTF-8 text content
    std::string mimeType;              // MIME type the text was extracted as
    std::vector<std::string> warnings; // Non-fatal warnings
    std::string extractionMethod;      // Method used for extraction
};

/**
 * @brief Configuration for text extraction
 */
struct ExtractionConfig {
    std::size_t maxFileSize = 100 * 1024 * 1024; // 100MB default limit
};

/**
 * @brief Base interface for text extractors
 */
class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;

    /**
     * @brief Extract text from a file
     * @param path Path to the file to extract
     * @param config Extraction configuration
     * @return Extraction result, or an error when the file cannot be read or parsed
     */
    virtual Result<ExtractionResult> extract(const std::filesystem::path& path,
                                             const ExtractionConfig& config = {}) = 0;

    /**
     * @brief Extract text from memory buffer
     */
    virtual Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                                       const ExtractionConfig& config = {}) = 0;

    /**
     * @brief Get supported file extensions (e.g. ".txt")
     */
    virtual std::vector<std::string> supportedExtensions() const = 0;

    /**
     * @brief Get extractor name
     */
    virtual std::string name() const = 0;

    /**
     * @brief Check if a file is supported
     */
    virtual bool canExtract(const std::filesystem::path& path) const {
        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        auto supported = supportedExtensions();
        return std::find(supported.begin(), supported.end(), ext) != supported.end();
    }
};

/**
 * @brief Maps file extensions and MIME types to extractors.
 *
 * The plain-text extractor is registered for text/* on construction; other formats are
 * provided by callers through registerExtractor().
 */
class TextExtractorFactory {
public:
    using ExtractorCreator = std::function<std::unique_ptr<ITextExtractor>()>;

    TextExtractorFactory();

    /**
     * @brief Process-wide instance
     */
    static TextExtractorFactory& instance();

    /**
     * @brief Create an extractor for a given file extension, or nullptr if unsupported
     */
    std::unique_ptr<ITextExtractor> create(const std::string& extension) const;

    /**
     * @brief Pick an extractor by MIME type first, then by the file's extension
     */
    std::unique_ptr<ITextExtractor> createFor(const std::filesystem::path& path,
                                              const std::string& mimeType) const;

    void registerExtractor(const std::vector<std::string>& extensions, ExtractorCreator creator);
    void registerMimeType(const std::string& mimeType, ExtractorCreator creator);

    std::vector<std::string> supportedExtensions() const;
    bool isSupported(const std::string& extension) const;

private:
    std::unordered_map<std::string, ExtractorCreator> extractors_;
    std::unordered_map<std::string, ExtractorCreator> mimeExtractors_;
    ExtractorCreator textFallback_;
    mutable std::mutex mutex_;
};

/**
 * @brief Best-effort MIME type from the file extension; unknown types give
 * "application/octet-stream".
 */
std::string guessMimeType(const std::filesystem::path& path);

/**
 * @brief Extract text from `path` with the extractor `factory` selects for it.
 * Fails with NotSupported when no extractor handles the format.
 */
Result<ExtractionResult> extractText(const TextExtractorFactory& factory,
                                     const std::filesystem::path& path,
                                     const std::string& mimeType,
                                     const ExtractionConfig& config = {});

} // namespace modelflux::extraction
