#pragma once

#include <string>
#include <string_view>

namespace modelflux::model {

struct ParsedResponse {
    std::string thinking;
    std::string message;
    bool thinkingOpen{false}; // <think> seen, </think> not yet
};

/**
 * Splits a streamed response into the leading <think>...</think> reasoning block and
 * the message that follows. Only a block at the very start of the response counts.
 */
class ThinkingParser {
public:
    void append(std::string_view fragment);
    void reset();

    [[nodiscard]] const std::string& raw() const { return raw_; }
    [[nodiscard]] const ParsedResponse& current() const { return parsed_; }

    static ParsedResponse parse(std::string_view raw);

private:
    std::string raw_;
    ParsedResponse parsed_;
};

} // namespace modelflux::model
