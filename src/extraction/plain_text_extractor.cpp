#include <modelflux/common/utf8_utils.h>
#include <modelflux/extraction/plain_text_extractor.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string_view>

namespace modelflux::extraction {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

ExtractionResult fromText(std::string_view raw, const char* method) {
    ExtractionResult result;
    result.extractionMethod = method;
    if (raw.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        raw.remove_prefix(kUtf8Bom.size());
    }
    result.text = common::sanitizeUtf8(raw);
    if (result.text != raw) {
        result.warnings.push_back("Replaced malformed UTF-8 sequences");
    }
    return result;
}

} // namespace

Result<ExtractionResult> PlainTextExtractor::extract(const std::filesystem::path& path,
                                                     const ExtractionConfig& config) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File does not exist: " + path.string()};
    }
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + path.string() + ": " + ec.message()};
    }
    if (fileSize > config.maxFileSize) {
        return Error{ErrorCode::InvalidArgument,
                     "File too large: " + std::to_string(fileSize) + " bytes"};
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Error{ErrorCode::PermissionDenied, "Failed to open file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    auto bytes = std::span<const std::byte>(reinterpret_cast<const std::byte*>(content.data()),
                                            content.size());
    if (isBinary(bytes)) {
        return Error{ErrorCode::NotSupported, "File appears to be binary: " + path.string()};
    }

    auto result = fromText(content, "plain_text");
    spdlog::debug("[PlainTextExtractor] Extracted {} bytes from {}", result.text.size(),
                  path.filename().string());
    return result;
}

Result<ExtractionResult> PlainTextExtractor::extractFromBuffer(std::span<const std::byte> data,
                                                               const ExtractionConfig& config) {
    if (data.size() > config.maxFileSize) {
        return Error{ErrorCode::InvalidArgument,
                     "Buffer too large: " + std::to_string(data.size()) + " bytes"};
    }
    if (isBinary(data)) {
        return Error{ErrorCode::NotSupported, "Buffer appears to contain binary data"};
    }
    return fromText(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()),
                    "plain_text_buffer");
}

std::vector<std::string> PlainTextExtractor::supportedExtensions() const {
    return {".txt", ".md",   ".markdown", ".log", ".csv",  ".tsv", ".json", ".xml",
            ".yml", ".yaml", ".toml",     ".ini", ".rst",  ".tex", ".c",    ".h",
            ".cpp", ".hpp",  ".cc",       ".py",  ".js",   ".ts",  ".java", ".go",
            ".rs",  ".sh",   ".css",      ".sql", ".html", ".htm"};
}

bool PlainTextExtractor::isBinary(std::span<const std::byte> data) {
    const std::size_t checkSize = std::min(data.size(), std::size_t(8192));
    if (checkSize == 0)
        return false;

    std::size_t nonPrintable = 0;
    for (std::size_t i = 0; i < checkSize; ++i) {
        const auto byte = static_cast<std::uint8_t>(data[i]);
        if (byte == 0) {
            return true;
        }
        if (byte < 32 && byte != '\t' && byte != '\n' && byte != '\r' && byte != '\f') {
            nonPrintable++;
        }
    }
    return (nonPrintable * 100 / checkSize) > 30;
}

} // namespace modelflux::extraction
