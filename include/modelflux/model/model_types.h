#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modelflux::model {

inline const std::vector<std::string>& defaultStopWords() {
    static const std::vector<std::string> kStopWords = {
        "</s>",          "<|end|>",         "<|eot_id|>",           "<|end_of_text|>",
        "<|im_end|>",    "<|EOT|>",         "<|END_OF_TURN_TOKEN|>", "<|end_of_turn|>",
        "<|endoftext|>",
    };
    return kStopWords;
}

/**
 * Per-model generation settings. Load-time fields (contextLength, gpuLayers, useMlock,
 * batchSize) take effect on the next load; the rest apply to every generation.
 */
struct GenerationConfig {
    double temperature{0.7};
    double topP{0.9};
    int contextLength{2048};
    int gpuLayers{99};
    bool useMlock{true};
    int batchSize{512};
    int maxTokens{-1}; // -1: runtime default
    std::vector<std::string> stopSequences{defaultStopWords()};
};

enum class LifecycleState { Unloaded, Loading, Ready, Generating, Error };

inline constexpr const char* lifecycleStateName(LifecycleState s) {
    switch (s) {
        case LifecycleState::Unloaded:
            return "Unloaded";
        case LifecycleState::Loading:
            return "Loading";
        case LifecycleState::Ready:
            return "Ready";
        case LifecycleState::Generating:
            return "Generating";
        case LifecycleState::Error:
            return "Error";
    }
    return "Unknown";
}

struct LifecycleSnapshot {
    LifecycleState state{LifecycleState::Unloaded};
    std::string modelId;
    std::string lastError;
    double loadProgress{0.0};
};

enum class GenerationPhase { Idle, Generating, Interrupted, Completed };

struct SelectOptions {
    bool hardReload{false};
};

} // namespace modelflux::model
