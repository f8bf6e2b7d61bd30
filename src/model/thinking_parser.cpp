#include <modelflux/model/thinking_parser.h>

namespace modelflux::model {

namespace {
constexpr std::string_view kOpenTag = "<think>";
constexpr std::string_view kCloseTag = "</think>";
} // namespace

ParsedResponse ThinkingParser::parse(std::string_view raw) {
    ParsedResponse out;
    if (raw.size() < kOpenTag.size() && kOpenTag.substr(0, raw.size()) == raw) {
        // Could still become an opening tag
        return out;
    }
    if (raw.substr(0, kOpenTag.size()) != kOpenTag) {
        out.message = std::string(raw);
        return out;
    }
    const auto body = raw.substr(kOpenTag.size());
    const auto close = body.find(kCloseTag);
    if (close == std::string_view::npos) {
        out.thinking = std::string(body);
        out.thinkingOpen = true;
        return out;
    }
    out.thinking = std::string(body.substr(0, close));
    out.message = std::string(body.substr(close + kCloseTag.size()));
    return out;
}

void ThinkingParser::append(std::string_view fragment) {
    raw_.append(fragment);
    parsed_ = parse(raw_);
}

void ThinkingParser::reset() {
    raw_.clear();
    parsed_ = ParsedResponse{};
}

} // namespace modelflux::model
