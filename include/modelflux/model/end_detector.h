#pragma once

#include <cstdint>
#include <optional>

namespace modelflux::model {

/**
 * Fallback end-of-generation signal for runtimes without a completion callback.
 *
 * The runtime's per-generation token counter grows by at least one per emitted token.
 * A reading that does not exceed the previous one means the counter was reset, i.e. the
 * previous generation ended and a new one began. A new generation whose first reading
 * already exceeds the last reading of the previous one (batched emission, or a counter
 * that is never reset) is not detected.
 */
class TokenCountEndDetector {
public:
    enum class Signal { Continue, NewGeneration };

    Signal observe(std::uint64_t tokenCount);
    void reset() { last_.reset(); }
    [[nodiscard]] std::optional<std::uint64_t> lastCount() const { return last_; }

private:
    std::optional<std::uint64_t> last_;
};

} // namespace modelflux::model
