#include <modelflux/vector/staleness_tracker.h>

#include <spdlog/spdlog.h>

namespace modelflux::vector {

StalenessTracker::StalenessTracker(std::shared_ptr<RagStore> store) : store_(std::move(store)) {}

Result<void> StalenessTracker::load() {
    if (!store_)
        return {};
    auto rec = store_->stalenessRecord();
    if (!rec)
        return rec.error();
    std::lock_guard<std::mutex> lock(mutex_);
    record_ = rec.value();
    if (record_) {
        spdlog::debug("[Staleness] Index built with {}", record_->toString());
    }
    return {};
}

bool StalenessTracker::isStale(const EmbeddingIdentity& active) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.has_value() && *record_ != active;
}

std::optional<EmbeddingIdentity> StalenessTracker::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

Result<void> StalenessTracker::recordIfAbsent(const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record_)
        return {};
    if (store_) {
        auto r = store_->setStalenessRecord(identity);
        if (!r)
            return r;
    }
    record_ = identity;
    spdlog::info("[Staleness] Recorded index provenance {}", identity.toString());
    return {};
}

Result<void> StalenessTracker::update(const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        auto r = store_->setStalenessRecord(identity);
        if (!r)
            return r;
    }
    record_ = identity;
    return {};
}

void StalenessTracker::noteRebuilt(const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_ = identity;
}

} // namespace modelflux::vector
