#pragma once

#include <modelflux/core/types.h>
#include <modelflux/model/model_types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace modelflux::model {

/**
 * Local files handed to the native runtime for one model.
 */
struct LoadManifest {
    std::string modelId;
    std::filesystem::path modelPath;
    std::optional<std::filesystem::path> tokenizerPath;
    std::optional<std::filesystem::path> tokenizerConfigPath;
    std::optional<std::filesystem::path> projectorPath;
};

struct TokenEvent {
    std::string text;
    std::uint64_t tokenCount{0}; // tokens generated so far in the current generation
};

using LoadProgressCallback = std::function<void(double)>;
using TokenCallback = std::function<void(const TokenEvent&)>;
using CompletionCallback = std::function<void(Result<void>)>;

/**
 * A loaded model. Instances are owned exclusively by ModelLifecycleManager.
 *
 * generate() may block until the generation ends or return early and keep emitting
 * from a runtime thread. When supportsCompletionEvent() is true, onComplete is invoked
 * exactly once per generate() call. interrupt() must be callable from any thread.
 */
class INativeHandle {
public:
    virtual ~INativeHandle() = default;

    virtual void generate(const std::string& prompt, const GenerationConfig& config,
                          TokenCallback onToken, CompletionCallback onComplete) = 0;
    virtual void interrupt() = 0;
    virtual Result<void> unload() = 0;
    [[nodiscard]] virtual bool supportsCompletionEvent() const = 0;
};

class INativeRuntime {
public:
    virtual ~INativeRuntime() = default;

    virtual Result<std::unique_ptr<INativeHandle>> load(const LoadManifest& manifest,
                                                        const GenerationConfig& config,
                                                        LoadProgressCallback onProgress) = 0;
};

} // namespace modelflux::model
