#pragma once

#include <modelflux/core/types.h>

#include <functional>
#include <string>

namespace modelflux::app {

/**
 * A hosted model reached over the network. Implementations stream the completion for
 * `prompt` through `onToken` in order and return the full text.
 */
class IRemoteProvider {
public:
    using TokenCallback = std::function<void(const std::string& fragment)>;

    virtual ~IRemoteProvider() = default;

    [[nodiscard]] virtual std::string id() const = 0;
    virtual Result<std::string> stream(const std::string& prompt, const TokenCallback& onToken) = 0;
};

} // namespace modelflux::app
