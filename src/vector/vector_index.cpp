/*
 * vector_index.cpp
 *
 * Copy-on-write chunk index. Writers hold writeMutex_, derive the next snapshot from the
 * current one, persist through RagStore and publish; readers copy the snapshot pointer and
 * scan without further locking.
 */

#include <modelflux/vector/vector_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace modelflux::vector {

namespace {
constexpr const char* kIndexBuiltKey = "index.built";
} // namespace

float cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty())
        return 0.0f;
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0)
        return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

VectorIndex::VectorIndex(std::shared_ptr<RagStore> store)
    : store_(std::move(store)), snapshot_(std::make_shared<const Snapshot>()) {}

Result<void> VectorIndex::load() {
    if (!store_)
        return {};
    std::lock_guard<std::mutex> wl(writeMutex_);
    auto chunks = store_->loadChunks();
    if (!chunks)
        return chunks.error();
    auto builtFlag = store_->getMeta(kIndexBuiltKey);
    if (!builtFlag)
        return builtFlag.error();

    auto next = std::make_shared<Snapshot>();
    next->chunks = std::move(chunks).value();
    next->built = (builtFlag.value() && *builtFlag.value() == "1") || !next->chunks.empty();
    std::uint64_t maxSeq = 0;
    for (const auto& c : next->chunks) {
        maxSeq = std::max(maxSeq, c.sequence);
    }
    nextSequence_.store(maxSeq + 1);
    spdlog::debug("[VectorIndex] Loaded {} chunks (built={})", next->chunks.size(), next->built);
    publish(std::move(next));
    return {};
}

void VectorIndex::publish(std::shared_ptr<const Snapshot> next) {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = std::move(next);
}

std::shared_ptr<const VectorIndex::Snapshot> VectorIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

bool VectorIndex::built() const {
    return snapshot()->built;
}

std::size_t VectorIndex::size() const {
    return snapshot()->chunks.size();
}

std::size_t VectorIndex::countForSource(const std::string& sourceId) const {
    const auto snap = snapshot();
    return static_cast<std::size_t>(
        std::count_if(snap->chunks.begin(), snap->chunks.end(),
                      [&](const Chunk& c) { return c.sourceId == sourceId; }));
}

VectorIndex::SourceLock::SourceLock(VectorIndex& index, std::string sourceId)
    : index_(index), sourceId_(std::move(sourceId)) {
    SourceLockEntry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(index_.sourceLocksMutex_);
        entry = &index_.sourceLocks_[sourceId_];
        ++entry->users;
    }
    // std::map nodes are stable and the entry stays while users > 0
    entry->mutex.lock();
}

VectorIndex::SourceLock::~SourceLock() {
    std::lock_guard<std::mutex> lock(index_.sourceLocksMutex_);
    auto it = index_.sourceLocks_.find(sourceId_);
    it->second.mutex.unlock();
    if (--it->second.users == 0)
        index_.sourceLocks_.erase(it);
}

VectorIndex::SourceLock VectorIndex::lockSource(const std::string& sourceId) {
    return SourceLock(*this, sourceId);
}

std::size_t VectorIndex::lockedSourceCount() const {
    std::lock_guard<std::mutex> lock(sourceLocksMutex_);
    return sourceLocks_.size();
}

Result<void> VectorIndex::insert(const std::string& sourceId, std::vector<Chunk> chunks) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    for (auto& c : chunks) {
        c.sourceId = sourceId;
        c.sequence = nextSequence_.fetch_add(1);
    }
    if (store_) {
        auto r = store_->replaceChunks(sourceId, chunks);
        if (!r)
            return r;
        if (!snapshot()->built) {
            auto m = store_->setMeta(kIndexBuiltKey, "1");
            if (!m)
                return m;
        }
    }

    const auto current = snapshot();
    auto next = std::make_shared<Snapshot>();
    next->built = true;
    next->chunks.reserve(current->chunks.size() + chunks.size());
    for (const auto& c : current->chunks) {
        if (c.sourceId != sourceId)
            next->chunks.push_back(c);
    }
    for (auto& c : chunks) {
        next->chunks.push_back(std::move(c));
    }
    publish(std::move(next));
    return {};
}

Result<std::size_t> VectorIndex::removeSource(const std::string& sourceId) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    const auto current = snapshot();
    auto next = std::make_shared<Snapshot>();
    next->built = current->built;
    next->chunks.reserve(current->chunks.size());
    std::size_t removed = 0;
    for (const auto& c : current->chunks) {
        if (c.sourceId == sourceId) {
            ++removed;
        } else {
            next->chunks.push_back(c);
        }
    }
    if (store_) {
        auto r = store_->deleteSource(sourceId);
        if (!r)
            return r.error();
    }
    publish(std::move(next));
    return removed;
}

Result<void> VectorIndex::rebuild(std::vector<Chunk> chunks, const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    for (auto& c : chunks) {
        c.sequence = nextSequence_.fetch_add(1);
    }
    if (store_) {
        auto r = store_->replaceAllChunks(chunks, identity);
        if (!r)
            return r;
        auto m = store_->setMeta(kIndexBuiltKey, "1");
        if (!m)
            return m;
    }
    auto next = std::make_shared<Snapshot>();
    next->built = true;
    next->chunks = std::move(chunks);
    publish(std::move(next));
    spdlog::info("[VectorIndex] Rebuilt with {} chunks for {}", size(), identity.toString());
    return {};
}

Result<std::vector<SearchHit>>
VectorIndex::query(const Embedding& vector, std::size_t k,
                   const std::optional<std::set<std::string>>& sourceFilter) const {
    const auto snap = snapshot();
    if (!snap->built) {
        return Error{ErrorCode::IndexNotReady, "Vector index has not been built"};
    }
    if (vector.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query vector is empty"};
    }

    struct Candidate {
        const Chunk* chunk;
        float score;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(snap->chunks.size());
    for (const auto& c : snap->chunks) {
        if (sourceFilter && sourceFilter->count(c.sourceId) == 0)
            continue;
        if (c.vector.size() != vector.size())
            continue;
        candidates.push_back({&c, cosineSimilarity(vector, c.vector)});
    }

    const auto better = [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.chunk->sequence < b.chunk->sequence;
    };
    const auto take = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(take),
                      candidates.end(), better);

    std::vector<SearchHit> hits;
    hits.reserve(take);
    for (std::size_t i = 0; i < take; ++i) {
        hits.push_back(SearchHit{*candidates[i].chunk, candidates[i].score});
    }
    return hits;
}

} // namespace modelflux::vector
