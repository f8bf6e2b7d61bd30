#pragma once

#include <modelflux/model/model_types.h>

#include <string>

namespace modelflux::model {

struct LoadStartedEvent {
    std::string modelId;
};
struct LoadProgressEvent {
    double fraction;
};
struct LoadedEvent {
    std::string modelId;
};
struct LoadFailedEvent {
    std::string error;
};
struct GenerationStartedEvent {};
struct GenerationEndedEvent {};
struct GenerationFaultEvent {
    std::string error;
};
struct UnloadedEvent {};

class LifecycleFsm {
public:
    LifecycleSnapshot snapshot() const { return snap_; }

    void dispatch(const LoadStartedEvent& ev) {
        snap_.modelId = ev.modelId;
        snap_.lastError.clear();
        snap_.loadProgress = 0.0;
        transitionTo(LifecycleState::Loading);
    }
    void dispatch(const LoadProgressEvent& ev) {
        if (snap_.state == LifecycleState::Loading && ev.fraction > snap_.loadProgress)
            snap_.loadProgress = ev.fraction;
    }
    void dispatch(const LoadedEvent& ev) {
        snap_.modelId = ev.modelId;
        snap_.loadProgress = 1.0;
        transitionTo(LifecycleState::Ready);
    }
    void dispatch(const LoadFailedEvent& ev) {
        snap_.lastError = ev.error;
        transitionTo(LifecycleState::Error);
    }
    void dispatch(const GenerationStartedEvent&) {
        if (snap_.state == LifecycleState::Ready)
            transitionTo(LifecycleState::Generating);
    }
    void dispatch(const GenerationEndedEvent&) {
        if (snap_.state == LifecycleState::Generating)
            transitionTo(LifecycleState::Ready);
    }
    void dispatch(const GenerationFaultEvent& ev) {
        snap_.lastError = ev.error;
        transitionTo(LifecycleState::Error);
    }
    void dispatch(const UnloadedEvent&) {
        snap_.modelId.clear();
        snap_.loadProgress = 0.0;
        transitionTo(LifecycleState::Unloaded);
    }

    LifecycleState state() const { return snap_.state; }
    bool isReady() const { return snap_.state == LifecycleState::Ready; }
    bool isGenerating() const { return snap_.state == LifecycleState::Generating; }
    const std::string& modelId() const { return snap_.modelId; }

private:
    void transitionTo(LifecycleState next) { snap_.state = next; }

    LifecycleSnapshot snap_{};
};

} // namespace modelflux::model
