#pragma once

#include <cstddef>
#include <string>

namespace modelflux::vector {

enum class EmbeddingProviderState { Unavailable, ModelLoading, ModelReady, Failed };

struct ProviderSnapshot {
    EmbeddingProviderState state{EmbeddingProviderState::Unavailable};
    std::string modelId;
    std::string lastError;
    std::size_t embeddingDimension{0};
};

struct ModelLoadStartedEvent {
    std::string modelId;
};
struct ModelLoadedEvent {
    std::string modelId;
    std::size_t dimension;
};
struct LoadFailureEvent {
    std::string error;
};
struct ModelUnloadedEvent {};

class EmbeddingProviderFsm {
public:
    ProviderSnapshot snapshot() const { return snap_; }

    void dispatch(const ModelLoadStartedEvent& ev) {
        snap_.modelId = ev.modelId;
        snap_.lastError.clear();
        transitionTo(EmbeddingProviderState::ModelLoading);
    }
    void dispatch(const ModelLoadedEvent& ev) {
        snap_.modelId = ev.modelId;
        snap_.embeddingDimension = ev.dimension;
        transitionTo(EmbeddingProviderState::ModelReady);
    }
    void dispatch(const LoadFailureEvent& ev) {
        snap_.lastError = ev.error;
        transitionTo(EmbeddingProviderState::Failed);
    }
    void dispatch(const ModelUnloadedEvent&) { transitionTo(EmbeddingProviderState::Unavailable); }

    bool isReady() const { return snap_.state == EmbeddingProviderState::ModelReady; }
    bool isFailed() const { return snap_.state == EmbeddingProviderState::Failed; }
    std::size_t dimension() const { return snap_.embeddingDimension; }

private:
    void transitionTo(EmbeddingProviderState next) { snap_.state = next; }

    ProviderSnapshot snap_{};
};

} // namespace modelflux::vector
