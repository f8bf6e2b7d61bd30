#include <modelflux/extraction/plain_text_extractor.h>
#include <modelflux/extraction/text_extractor.h>

#include <spdlog/spdlog.h>

namespace modelflux::extraction {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::unordered_map<std::string, std::string>& mimeByExtension() {
    static const std::unordered_map<std::string, std::string> table = {
        {".txt", "text/plain"},        {".log", "text/plain"},
        {".md", "text/markdown"},      {".markdown", "text/markdown"},
        {".csv", "text/csv"},          {".tsv", "text/tab-separated-values"},
        {".html", "text/html"},        {".htm", "text/html"},
        {".xml", "text/xml"},          {".json", "application/json"},
        {".yml", "text/yaml"},         {".yaml", "text/yaml"},
        {".toml", "text/x-toml"},      {".ini", "text/plain"},
        {".rst", "text/x-rst"},        {".tex", "text/x-tex"},
        {".c", "text/x-c"},            {".h", "text/x-c"},
        {".cpp", "text/x-c++"},        {".hpp", "text/x-c++"},
        {".cc", "text/x-c++"},         {".py", "text/x-python"},
        {".js", "text/javascript"},    {".ts", "text/x-typescript"},
        {".java", "text/x-java"},      {".go", "text/x-go"},
        {".rs", "text/x-rust"},        {".sh", "text/x-shellscript"},
        {".css", "text/css"},          {".sql", "text/x-sql"},
        {".pdf", "application/pdf"},   {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".epub", "application/epub+zip"},
        {".png", "image/png"},         {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
    };
    return table;
}

bool isTextMime(const std::string& mime) {
    return mime.rfind("text/", 0) == 0 || mime == "application/json";
}

} // namespace

TextExtractorFactory::TextExtractorFactory() {
    auto creator = []() { return std::make_unique<PlainTextExtractor>(); };
    PlainTextExtractor probe;
    registerExtractor(probe.supportedExtensions(), creator);
    textFallback_ = creator;
    spdlog::debug("[TextExtractorFactory] Registered {} for {} extensions", probe.name(),
                  extractors_.size());
}

TextExtractorFactory& TextExtractorFactory::instance() {
    static TextExtractorFactory instance;
    return instance;
}

std::unique_ptr<ITextExtractor> TextExtractorFactory::create(const std::string& extension) const {
    const auto ext = lower(extension);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extractors_.find(ext);
    if (it != extractors_.end()) {
        return it->second();
    }
    return nullptr;
}

std::unique_ptr<ITextExtractor> TextExtractorFactory::createFor(const std::filesystem::path& path,
                                                                const std::string& mimeType) const {
    const auto mime = lower(mimeType);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mimeExtractors_.find(mime);
        if (it != mimeExtractors_.end()) {
            return it->second();
        }
        if (isTextMime(mime) && textFallback_) {
            return textFallback_();
        }
    }
    // An explicit non-text MIME type is authoritative
    if (!mime.empty() && mime != "application/octet-stream") {
        return nullptr;
    }
    return create(path.extension().string());
}

void TextExtractorFactory::registerExtractor(const std::vector<std::string>& extensions,
                                             ExtractorCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ext : extensions) {
        extractors_[lower(ext)] = creator;
    }
}

void TextExtractorFactory::registerMimeType(const std::string& mimeType, ExtractorCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    mimeExtractors_[lower(mimeType)] = std::move(creator);
}

std::vector<std::string> TextExtractorFactory::supportedExtensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> extensions;
    extensions.reserve(extractors_.size());
    for (const auto& [ext, _] : extractors_) {
        extensions.push_back(ext);
    }
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

bool TextExtractorFactory::isSupported(const std::string& extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractors_.count(lower(extension)) > 0;
}

std::string guessMimeType(const std::filesystem::path& path) {
    const auto ext = lower(path.extension().string());
    const auto& table = mimeByExtension();
    auto it = table.find(ext);
    if (it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

Result<ExtractionResult> extractText(const TextExtractorFactory& factory,
                                     const std::filesystem::path& path,
                                     const std::string& mimeType, const ExtractionConfig& config) {
    const auto mime = mimeType.empty() ? guessMimeType(path) : mimeType;
    auto extractor = factory.createFor(path, mime);
    if (!extractor) {
        return Error{ErrorCode::NotSupported,
                     "Unsupported document format: " + mime + " (" + path.filename().string() + ")"};
    }
    auto result = extractor->extract(path, config);
    if (!result)
        return result;
    auto out = std::move(result).value();
    if (out.mimeType.empty())
        out.mimeType = mime;
    return out;
}

} // namespace modelflux::extraction
