#include <modelflux/vector/rag_store.h>

#include <spdlog/spdlog.h>

#include <cstring>

namespace modelflux::vector {

namespace {

constexpr const char* kStalenessProviderKey = "staleness.provider_id";
constexpr const char* kStalenessModelKey = "staleness.model_id";

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS sources (
    id            TEXT PRIMARY KEY,
    uri           TEXT NOT NULL,
    name          TEXT NOT NULL,
    size_bytes    INTEGER NOT NULL DEFAULT 0,
    mime_type     TEXT NOT NULL DEFAULT '',
    is_processing INTEGER NOT NULL DEFAULT 0,
    last_error    TEXT NOT NULL DEFAULT '',
    created_at    INTEGER NOT NULL,
    content       TEXT NOT NULL DEFAULT ''
);
CREATE TABLE IF NOT EXISTS chunks (
    chunk_id    INTEGER PRIMARY KEY AUTOINCREMENT,
    source_id   TEXT NOT NULL REFERENCES sources(id) ON DELETE CASCADE,
    chunk_index INTEGER NOT NULL,
    text        TEXT NOT NULL,
    vector      BLOB NOT NULL,
    sequence    INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_chunks_source ON chunks(source_id);
CREATE TABLE IF NOT EXISTS rag_meta (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)SQL";

std::span<const std::byte> vectorBytes(const Embedding& v) {
    return {reinterpret_cast<const std::byte*>(v.data()), v.size() * sizeof(float)};
}

Embedding vectorFromBlob(const std::vector<std::byte>& blob) {
    Embedding out(blob.size() / sizeof(float));
    if (!out.empty())
        std::memcpy(out.data(), blob.data(), out.size() * sizeof(float));
    return out;
}

Source readSource(const storage::Statement& stmt) {
    Source s;
    s.id = stmt.columnText(0);
    s.uri = stmt.columnText(1);
    s.name = stmt.columnText(2);
    s.sizeBytes = static_cast<std::uint64_t>(stmt.columnInt64(3));
    s.mimeType = stmt.columnText(4);
    s.isProcessing = stmt.columnInt64(5) != 0;
    s.lastError = stmt.columnText(6);
    s.createdAt = stmt.columnInt64(7);
    return s;
}

constexpr const char* kSelectSource =
    "SELECT id, uri, name, size_bytes, mime_type, is_processing, last_error, created_at "
    "FROM sources";

} // namespace

Result<void> RagStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = db_.open(path);
    if (!r) {
        spdlog::error("[RagStore] Cannot open {}: {}", path, r.error().message);
        return r;
    }
    return createSchema();
}

void RagStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.close();
}

Result<void> RagStore::createSchema() {
    return db_.transaction([&]() -> Result<void> { return db_.execute(kSchema); });
}

Result<void> RagStore::upsertSource(const Source& source, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO sources (id, uri, name, size_bytes, mime_type, is_processing, last_error, "
        "created_at, content) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET uri = excluded.uri, name = excluded.name, "
        "size_bytes = excluded.size_bytes, mime_type = excluded.mime_type, "
        "is_processing = excluded.is_processing, last_error = excluded.last_error, "
        "content = excluded.content");
    if (!stmt)
        return stmt.error();
    auto& s = stmt.value();
    auto b = s.bindAll(source.id, source.uri, source.name,
                       static_cast<int64_t>(source.sizeBytes), source.mimeType,
                       source.isProcessing ? 1 : 0, source.lastError,
                       static_cast<int64_t>(source.createdAt), content);
    if (!b)
        return b;
    return s.execute();
}

Result<void> RagStore::updateSourceStatus(const std::string& sourceId, bool isProcessing,
                                          const std::string& lastError) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("UPDATE sources SET is_processing = ?, last_error = ? WHERE id = ?");
    if (!stmt)
        return stmt.error();
    auto b = stmt.value().bindAll(isProcessing ? 1 : 0, lastError, sourceId);
    if (!b)
        return b;
    return stmt.value().execute();
}

Result<std::vector<Source>> RagStore::listSources() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(std::string(kSelectSource) + " ORDER BY created_at, id");
    if (!stmt)
        return stmt.error();
    std::vector<Source> out;
    for (;;) {
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        out.push_back(readSource(stmt.value()));
    }
    return out;
}

Result<std::optional<Source>> RagStore::getSource(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(std::string(kSelectSource) + " WHERE id = ?");
    if (!stmt)
        return stmt.error();
    auto b = stmt.value().bind(1, sourceId);
    if (!b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<Source>{};
    return std::optional<Source>{readSource(stmt.value())};
}

Result<std::string> RagStore::sourceContent(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT content FROM sources WHERE id = ?");
    if (!stmt)
        return stmt.error();
    auto b = stmt.value().bind(1, sourceId);
    if (!b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value())
        return Error{ErrorCode::NotFound, "Source not found: " + sourceId};
    return stmt.value().columnText(0);
}

Result<std::size_t> RagStore::deleteSource(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    auto r = db_.transaction([&]() -> Result<void> {
        auto chunks = db_.prepare("DELETE FROM chunks WHERE source_id = ?");
        if (!chunks)
            return chunks.error();
        auto b = chunks.value().bind(1, sourceId);
        if (!b)
            return b;
        auto e = chunks.value().execute();
        if (!e)
            return e;
        removed = static_cast<std::size_t>(db_.changes());

        auto src = db_.prepare("DELETE FROM sources WHERE id = ?");
        if (!src)
            return src.error();
        b = src.value().bind(1, sourceId);
        if (!b)
            return b;
        return src.value().execute();
    });
    if (!r)
        return r.error();
    return removed;
}

Result<void> RagStore::insertChunksLocked(std::vector<Chunk>& chunks) {
    auto stmt = db_.prepare("INSERT INTO chunks (source_id, chunk_index, text, vector, sequence) "
                            "VALUES (?, ?, ?, ?, ?)");
    if (!stmt)
        return stmt.error();
    auto& s = stmt.value();
    for (auto& c : chunks) {
        auto b = s.bindAll(c.sourceId, static_cast<int64_t>(c.index), c.text, vectorBytes(c.vector),
                           static_cast<int64_t>(c.sequence));
        if (!b)
            return b;
        auto e = s.execute();
        if (!e)
            return e;
        c.chunkId = db_.lastInsertRowId();
    }
    return {};
}

Result<void> RagStore::replaceChunks(const std::string& sourceId, std::vector<Chunk>& chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        auto del = db_.prepare("DELETE FROM chunks WHERE source_id = ?");
        if (!del)
            return del.error();
        auto b = del.value().bind(1, sourceId);
        if (!b)
            return b;
        auto e = del.value().execute();
        if (!e)
            return e;
        return insertChunksLocked(chunks);
    });
}

Result<void> RagStore::replaceAllChunks(std::vector<Chunk>& chunks,
                                        const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        auto e = db_.execute("DELETE FROM chunks");
        if (!e)
            return e;
        auto ins = insertChunksLocked(chunks);
        if (!ins)
            return ins;
        auto p = setMetaLocked(kStalenessProviderKey, identity.providerId);
        if (!p)
            return p;
        return setMetaLocked(kStalenessModelKey, identity.modelId);
    });
}

Result<std::vector<Chunk>> RagStore::loadChunks() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT chunk_id, source_id, chunk_index, text, vector, sequence "
                            "FROM chunks ORDER BY sequence");
    if (!stmt)
        return stmt.error();
    std::vector<Chunk> out;
    for (;;) {
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        const auto& s = stmt.value();
        Chunk c;
        c.chunkId = s.columnInt64(0);
        c.sourceId = s.columnText(1);
        c.index = static_cast<std::size_t>(s.columnInt64(2));
        c.text = s.columnText(3);
        c.vector = vectorFromBlob(s.columnBlob(4));
        c.sequence = static_cast<std::uint64_t>(s.columnInt64(5));
        out.push_back(std::move(c));
    }
    return out;
}

Result<std::optional<EmbeddingIdentity>> RagStore::stalenessRecord() {
    auto provider = getMeta(kStalenessProviderKey);
    if (!provider)
        return provider.error();
    auto model = getMeta(kStalenessModelKey);
    if (!model)
        return model.error();
    if (!provider.value() || !model.value())
        return std::optional<EmbeddingIdentity>{};
    return std::optional<EmbeddingIdentity>{EmbeddingIdentity{*provider.value(), *model.value()}};
}

Result<void> RagStore::setStalenessRecord(const EmbeddingIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        auto p = setMetaLocked(kStalenessProviderKey, identity.providerId);
        if (!p)
            return p;
        return setMetaLocked(kStalenessModelKey, identity.modelId);
    });
}

Result<std::optional<std::string>> RagStore::getMeta(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT value FROM rag_meta WHERE key = ?");
    if (!stmt)
        return stmt.error();
    auto b = stmt.value().bind(1, key);
    if (!b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<std::string>{};
    return std::optional<std::string>{stmt.value().columnText(0)};
}

Result<void> RagStore::setMeta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return setMetaLocked(key, value);
}

Result<void> RagStore::setMetaLocked(const std::string& key, const std::string& value) {
    auto stmt = db_.prepare("INSERT INTO rag_meta (key, value) VALUES (?, ?) "
                            "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    if (!stmt)
        return stmt.error();
    auto b = stmt.value().bindAll(key, value);
    if (!b)
        return b;
    return stmt.value().execute();
}

} // namespace modelflux::vector
