/**
 * @file metadata_store.cpp
 * @brief SQLite metadata store
 */

#include "metadata_store.h"

#include <cstring>
#include <mutex>

#include <sqlite3.h>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"

#define LOG_TAG "RAG.MetadataStore"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

constexpr int kBusyTimeoutMs = 5000;

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS documents ("
    "  id TEXT PRIMARY KEY,"
    "  filename TEXT NOT NULL,"
    "  title TEXT NOT NULL,"
    "  uploaded_at INTEGER NOT NULL,"
    "  byte_size INTEGER NOT NULL,"
    "  status TEXT NOT NULL CHECK (status IN ('pending', 'processed', 'failed'))"
    ");"
    "CREATE TABLE IF NOT EXISTS chunks ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  document_id TEXT NOT NULL REFERENCES documents(id) ON DELETE CASCADE,"
    "  position INTEGER NOT NULL,"
    "  text TEXT NOT NULL,"
    "  source_offset INTEGER,"
    "  embedding BLOB,"
    "  UNIQUE (document_id, position)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);"
    "CREATE TABLE IF NOT EXISTS index_state ("
    "  id INTEGER PRIMARY KEY CHECK (id = 1),"
    "  generation INTEGER NOT NULL,"
    "  chunk_count INTEGER NOT NULL,"
    "  checksum TEXT NOT NULL,"
    "  dimension INTEGER NOT NULL,"
    "  built_at INTEGER NOT NULL"
    ");";

// RAII guard for a prepared statement
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

    void bind_null(int index) { sqlite3_bind_null(stmt_, index); }

    void bind_blob(int index, const std::vector<float>& values) {
        if (values.empty()) {
            sqlite3_bind_null(stmt_, index);
            return;
        }
        sqlite3_bind_blob(stmt_, index, values.data(),
                          static_cast<int>(values.size() * sizeof(float)), SQLITE_TRANSIENT);
    }

    /**
     * @return true while rows are available
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        int extended = sqlite3_extended_errcode(db_);
        std::string message = sqlite3_errmsg(db_);
        if ((extended & 0xFF) == SQLITE_CONSTRAINT) {
            throw IntegrityError("constraint violation: " + message);
        }
        throw StorageError("sqlite step failed: " + message);
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(stmt_, column);
        return value != nullptr ? reinterpret_cast<const char*>(value) : std::string();
    }

    int64_t int64(int column) const { return sqlite3_column_int64(stmt_, column); }

    bool is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

    std::vector<float> floats(int column) const {
        const void* data = sqlite3_column_blob(stmt_, column);
        int bytes = sqlite3_column_bytes(stmt_, column);
        std::vector<float> out;
        if (data != nullptr && bytes > 0) {
            out.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(out.data(), data, out.size() * sizeof(float));
        }
        return out;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err != nullptr ? err : "unknown";
        sqlite3_free(err);
        throw StorageError(std::string("sqlite exec failed (") + sql + "): " + message);
    }
}

// Rolls back unless commit() was called
class Transaction {
public:
    Transaction(sqlite3* db, const char* begin_sql) : db_(db) {
        exec(db_, begin_sql);
    }

    ~Transaction() {
        if (!done_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

sqlite3* open_connection(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db != nullptr) {
            sqlite3_close(db);
        }
        throw StorageError("failed to open SQLite database " + path + ": " + message);
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    return db;
}

Document read_document_row(const Statement& st) {
    Document doc;
    doc.id = st.text(0);
    doc.filename = st.text(1);
    doc.title = st.text(2);
    doc.uploaded_at = st.int64(3);
    doc.byte_size = st.int64(4);
    doc.status = parse_document_status(st.text(5));
    doc.chunk_count = static_cast<size_t>(st.int64(6));
    doc.total_length = static_cast<size_t>(st.int64(7));
    return doc;
}

const char* kDocumentColumns =
    "SELECT d.id, d.filename, d.title, d.uploaded_at, d.byte_size, d.status,"
    "       COUNT(c.id), COALESCE(SUM(LENGTH(c.text)), 0)"
    "  FROM documents d LEFT JOIN chunks c ON c.document_id = d.id ";

} // namespace

// =============================================================================
// IMPLEMENTATION
// =============================================================================

class MetadataStore::Impl {
public:
    explicit Impl(const std::string& path) : path_(path) {
        writer_ = open_connection(path_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                             SQLITE_OPEN_FULLMUTEX);
        try {
            exec(writer_, "PRAGMA journal_mode=WAL;");
            exec(writer_, "PRAGMA synchronous=FULL;");
            exec(writer_, "PRAGMA foreign_keys=ON;");
            exec(writer_, kSchema);
        } catch (...) {
            sqlite3_close(writer_);
            writer_ = nullptr;
            throw;
        }
        LOGI("Opened metadata store: %s", path_.c_str());
    }

    ~Impl() {
        for (sqlite3* reader : readers_) {
            sqlite3_close(reader);
        }
        if (writer_ != nullptr) {
            sqlite3_close(writer_);
        }
    }

    // Read connection borrowed from the pool for the duration of one call
    class ReadLease {
    public:
        explicit ReadLease(const Impl& owner) : owner_(owner), db_(owner.acquire_reader()) {}
        ~ReadLease() { owner_.release_reader(db_); }

        ReadLease(const ReadLease&) = delete;
        ReadLease& operator=(const ReadLease&) = delete;

        sqlite3* get() const { return db_; }

    private:
        const Impl& owner_;
        sqlite3* db_;
    };

    // Serializes write transactions on the single writer connection
    std::unique_lock<std::mutex> lock_writer() const {
        return std::unique_lock<std::mutex>(write_mutex_);
    }

    sqlite3* writer() const { return writer_; }

    const std::string& path() const { return path_; }

private:
    sqlite3* acquire_reader() const {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!readers_.empty()) {
                sqlite3* db = readers_.back();
                readers_.pop_back();
                return db;
            }
        }
        return open_connection(path_, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
    }

    void release_reader(sqlite3* db) const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        readers_.push_back(db);
    }

    std::string path_;
    sqlite3* writer_ = nullptr;
    mutable std::mutex write_mutex_;
    mutable std::mutex pool_mutex_;
    mutable std::vector<sqlite3*> readers_;
};

// =============================================================================
// PUBLIC API
// =============================================================================

MetadataStore::MetadataStore(const std::string& db_path)
    : impl_(std::make_unique<Impl>(db_path)) {
}

MetadataStore::~MetadataStore() = default;

const std::string& MetadataStore::path() const {
    return impl_->path();
}

void MetadataStore::create_document(const Document& document) {
    auto lock = impl_->lock_writer();
    Statement st(impl_->writer(),
                 "INSERT INTO documents (id, filename, title, uploaded_at, byte_size, status) "
                 "VALUES (?, ?, ?, ?, ?, ?)");
    st.bind(1, document.id);
    st.bind(2, document.filename);
    st.bind(3, document.title);
    st.bind(4, document.uploaded_at);
    st.bind(5, document.byte_size);
    st.bind(6, std::string(to_string(document.status)));
    st.step();
}

std::optional<Document> MetadataStore::find_document(const std::string& document_id) const {
    Impl::ReadLease lease(*impl_);
    std::string sql = std::string(kDocumentColumns) + "WHERE d.id = ? GROUP BY d.id";
    Statement st(lease.get(), sql.c_str());
    st.bind(1, document_id);
    if (!st.step()) {
        return std::nullopt;
    }
    return read_document_row(st);
}

Document MetadataStore::get_document(const std::string& document_id) const {
    auto doc = find_document(document_id);
    if (!doc) {
        throw NotFoundError("document not found: " + document_id);
    }
    return *doc;
}

std::vector<Document> MetadataStore::list_documents() const {
    Impl::ReadLease lease(*impl_);
    std::string sql = std::string(kDocumentColumns) + "GROUP BY d.id ORDER BY d.uploaded_at, d.id";
    Statement st(lease.get(), sql.c_str());
    std::vector<Document> out;
    while (st.step()) {
        out.push_back(read_document_row(st));
    }
    return out;
}

std::vector<Document> MetadataStore::documents_with_status(DocumentStatus status) const {
    Impl::ReadLease lease(*impl_);
    std::string sql = std::string(kDocumentColumns) +
                      "WHERE d.status = ? GROUP BY d.id ORDER BY d.uploaded_at, d.id";
    Statement st(lease.get(), sql.c_str());
    st.bind(1, std::string(to_string(status)));
    std::vector<Document> out;
    while (st.step()) {
        out.push_back(read_document_row(st));
    }
    return out;
}

void MetadataStore::set_document_status(const std::string& document_id, DocumentStatus status) {
    auto lock = impl_->lock_writer();
    Statement st(impl_->writer(), "UPDATE documents SET status = ? WHERE id = ?");
    st.bind(1, std::string(to_string(status)));
    st.bind(2, document_id);
    st.step();
    if (sqlite3_changes(impl_->writer()) == 0) {
        throw NotFoundError("document not found: " + document_id);
    }
}

std::vector<ChunkId> MetadataStore::delete_document(const std::string& document_id) {
    auto lock = impl_->lock_writer();
    Transaction txn(impl_->writer(), "BEGIN IMMEDIATE");

    std::vector<ChunkId> removed;
    {
        Statement ids(impl_->writer(), "SELECT id FROM chunks WHERE document_id = ? ORDER BY id");
        ids.bind(1, document_id);
        while (ids.step()) {
            removed.push_back(ids.int64(0));
        }
    }

    Statement st(impl_->writer(), "DELETE FROM documents WHERE id = ?");
    st.bind(1, document_id);
    st.step();
    if (sqlite3_changes(impl_->writer()) == 0) {
        throw NotFoundError("document not found: " + document_id);
    }

    txn.commit();
    return removed;
}

size_t MetadataStore::count_documents() const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(), "SELECT COUNT(*) FROM documents");
    st.step();
    return static_cast<size_t>(st.int64(0));
}

std::vector<ChunkId> MetadataStore::create_chunks(const std::string& document_id,
                                                  const std::vector<NewChunk>& chunks) {
    auto lock = impl_->lock_writer();
    Transaction txn(impl_->writer(), "BEGIN IMMEDIATE");

    int64_t next_position = 0;
    {
        Statement exists(impl_->writer(),
                         "SELECT (SELECT COUNT(*) FROM documents WHERE id = ?1),"
                         "       (SELECT COALESCE(MAX(position) + 1, 0) FROM chunks"
                         "         WHERE document_id = ?1)");
        exists.bind(1, document_id);
        exists.step();
        if (exists.int64(0) == 0) {
            throw NotFoundError("document not found: " + document_id);
        }
        next_position = exists.int64(1);
    }

    std::vector<ChunkId> ids;
    ids.reserve(chunks.size());

    Statement insert(impl_->writer(),
                     "INSERT INTO chunks (document_id, position, text, source_offset, embedding) "
                     "VALUES (?, ?, ?, ?, ?)");
    for (const auto& chunk : chunks) {
        insert.reset();
        insert.bind(1, document_id);
        insert.bind(2, next_position++);
        insert.bind(3, chunk.text);
        if (chunk.source_offset) {
            insert.bind(4, *chunk.source_offset);
        } else {
            insert.bind_null(4);
        }
        insert.bind_blob(5, chunk.embedding);
        insert.step();
        ids.push_back(sqlite3_last_insert_rowid(impl_->writer()));
    }

    txn.commit();
    return ids;
}

std::vector<ChunkId> MetadataStore::create_chunks(const std::string& document_id,
                                                  const std::vector<std::string>& texts) {
    std::vector<NewChunk> chunks;
    chunks.reserve(texts.size());
    for (const auto& text : texts) {
        NewChunk chunk;
        chunk.text = text;
        chunks.push_back(std::move(chunk));
    }
    return create_chunks(document_id, chunks);
}

std::vector<Chunk> MetadataStore::get_chunks_by_ids(const std::vector<ChunkId>& ids,
                                                    bool with_embeddings) const {
    Impl::ReadLease lease(*impl_);
    Transaction snapshot(lease.get(), "BEGIN");

    Statement st(lease.get(),
                 "SELECT id, document_id, position, text, source_offset, embedding "
                 "FROM chunks WHERE id = ?");
    std::vector<Chunk> out;
    out.reserve(ids.size());
    for (ChunkId id : ids) {
        st.reset();
        st.bind(1, id);
        if (!st.step()) {
            continue;
        }
        Chunk chunk;
        chunk.id = st.int64(0);
        chunk.document_id = st.text(1);
        chunk.position = static_cast<size_t>(st.int64(2));
        chunk.text = st.text(3);
        if (!st.is_null(4)) {
            chunk.source_offset = st.int64(4);
        }
        if (with_embeddings) {
            chunk.embedding = st.floats(5);
        }
        out.push_back(std::move(chunk));
    }

    snapshot.commit();
    return out;
}

std::vector<ChunkRecord> MetadataStore::resolve_chunks(const std::vector<ChunkId>& ids) const {
    Impl::ReadLease lease(*impl_);
    Transaction snapshot(lease.get(), "BEGIN");

    Statement st(lease.get(),
                 "SELECT c.id, c.document_id, c.position, c.text, d.title, d.filename "
                 "FROM chunks c JOIN documents d ON d.id = c.document_id WHERE c.id = ?");
    std::vector<ChunkRecord> out;
    out.reserve(ids.size());
    for (ChunkId id : ids) {
        st.reset();
        st.bind(1, id);
        if (!st.step()) {
            continue;
        }
        ChunkRecord record;
        record.id = st.int64(0);
        record.document_id = st.text(1);
        record.position = static_cast<size_t>(st.int64(2));
        record.text = st.text(3);
        record.title = st.text(4);
        record.filename = st.text(5);
        out.push_back(std::move(record));
    }

    snapshot.commit();
    return out;
}

std::vector<Chunk> MetadataStore::get_chunks_by_document(const std::string& document_id,
                                                         bool with_embeddings) const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(),
                 "SELECT id, document_id, position, text, source_offset, embedding "
                 "FROM chunks WHERE document_id = ? ORDER BY position");
    st.bind(1, document_id);

    std::vector<Chunk> out;
    while (st.step()) {
        Chunk chunk;
        chunk.id = st.int64(0);
        chunk.document_id = st.text(1);
        chunk.position = static_cast<size_t>(st.int64(2));
        chunk.text = st.text(3);
        if (!st.is_null(4)) {
            chunk.source_offset = st.int64(4);
        }
        if (with_embeddings) {
            chunk.embedding = st.floats(5);
        }
        out.push_back(std::move(chunk));
    }
    return out;
}

std::vector<ChunkId> MetadataStore::chunk_ids_by_document(const std::string& document_id) const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(), "SELECT id FROM chunks WHERE document_id = ? ORDER BY id");
    st.bind(1, document_id);
    std::vector<ChunkId> out;
    while (st.step()) {
        out.push_back(st.int64(0));
    }
    return out;
}

std::vector<ChunkId> MetadataStore::all_chunk_ids() const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(), "SELECT id FROM chunks ORDER BY id");
    std::vector<ChunkId> out;
    while (st.step()) {
        out.push_back(st.int64(0));
    }
    return out;
}

std::vector<Chunk> MetadataStore::get_all_chunks() const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(),
                 "SELECT id, document_id, position, text, source_offset, embedding "
                 "FROM chunks ORDER BY id");
    std::vector<Chunk> out;
    while (st.step()) {
        Chunk chunk;
        chunk.id = st.int64(0);
        chunk.document_id = st.text(1);
        chunk.position = static_cast<size_t>(st.int64(2));
        chunk.text = st.text(3);
        if (!st.is_null(4)) {
            chunk.source_offset = st.int64(4);
        }
        chunk.embedding = st.floats(5);
        out.push_back(std::move(chunk));
    }
    return out;
}

std::vector<std::pair<ChunkId, std::vector<float>>> MetadataStore::get_embeddings(
    const std::vector<ChunkId>& ids) const {
    Impl::ReadLease lease(*impl_);
    Transaction snapshot(lease.get(), "BEGIN");

    Statement st(lease.get(), "SELECT embedding FROM chunks WHERE id = ?");
    std::vector<std::pair<ChunkId, std::vector<float>>> out;
    out.reserve(ids.size());
    for (ChunkId id : ids) {
        st.reset();
        st.bind(1, id);
        if (!st.step()) {
            throw IntegrityError("chunk " + std::to_string(id) + " missing from metadata store");
        }
        auto embedding = st.floats(0);
        if (embedding.empty()) {
            throw IntegrityError("chunk " + std::to_string(id) + " has no stored embedding");
        }
        out.emplace_back(id, std::move(embedding));
    }

    snapshot.commit();
    return out;
}

void MetadataStore::update_embeddings(
    const std::vector<std::pair<ChunkId, std::vector<float>>>& embeddings) {
    auto lock = impl_->lock_writer();
    Transaction txn(impl_->writer(), "BEGIN IMMEDIATE");

    Statement st(impl_->writer(), "UPDATE chunks SET embedding = ? WHERE id = ?");
    for (const auto& entry : embeddings) {
        st.reset();
        st.bind_blob(1, entry.second);
        st.bind(2, entry.first);
        st.step();
    }

    txn.commit();
}

size_t MetadataStore::delete_chunks_by_document(const std::string& document_id) {
    auto lock = impl_->lock_writer();
    Statement st(impl_->writer(), "DELETE FROM chunks WHERE document_id = ?");
    st.bind(1, document_id);
    st.step();
    return static_cast<size_t>(sqlite3_changes(impl_->writer()));
}

size_t MetadataStore::count() const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(), "SELECT COUNT(*) FROM chunks");
    st.step();
    return static_cast<size_t>(st.int64(0));
}

void MetadataStore::delete_all() {
    auto lock = impl_->lock_writer();
    Transaction txn(impl_->writer(), "BEGIN IMMEDIATE");
    exec(impl_->writer(), "DELETE FROM chunks;");
    exec(impl_->writer(), "DELETE FROM documents;");
    exec(impl_->writer(), "DELETE FROM index_state;");
    txn.commit();
    LOGI("Deleted all documents and chunks");
}

void MetadataStore::save_index_state(const IndexState& state) {
    auto lock = impl_->lock_writer();
    Statement st(impl_->writer(),
                 "INSERT OR REPLACE INTO index_state "
                 "(id, generation, chunk_count, checksum, dimension, built_at) "
                 "VALUES (1, ?, ?, ?, ?, ?)");
    st.bind(1, static_cast<int64_t>(state.generation));
    st.bind(2, static_cast<int64_t>(state.chunk_count));
    st.bind(3, std::to_string(state.checksum));
    st.bind(4, static_cast<int64_t>(state.dimension));
    st.bind(5, state.built_at);
    st.step();
}

std::optional<IndexState> MetadataStore::load_index_state() const {
    Impl::ReadLease lease(*impl_);
    Statement st(lease.get(),
                 "SELECT generation, chunk_count, checksum, dimension, built_at "
                 "FROM index_state WHERE id = 1");
    if (!st.step()) {
        return std::nullopt;
    }

    IndexState state;
    state.generation = static_cast<uint64_t>(st.int64(0));
    state.chunk_count = static_cast<size_t>(st.int64(1));
    try {
        state.checksum = std::stoull(st.text(2));
    } catch (const std::exception&) {
        LOGW("Unreadable index checksum '%s'", st.text(2).c_str());
        state.checksum = 0;
    }
    state.dimension = static_cast<size_t>(st.int64(3));
    state.built_at = st.int64(4);
    return state;
}

void MetadataStore::clear_index_state() {
    auto lock = impl_->lock_writer();
    exec(impl_->writer(), "DELETE FROM index_state;");
}

} // namespace rag
} // namespace docindex
