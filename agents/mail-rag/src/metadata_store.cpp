#include "../include/metadata_store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace {
struct StmtReset {
    sqlite3_stmt* st;
    explicit StmtReset(sqlite3_stmt* s) : st(s) { sqlite3_reset(st); sqlite3_clear_bindings(st); }
    ~StmtReset() { sqlite3_reset(st); }
};
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    auto blob = encode_embedding(v);
    sqlite3_bind_blob(st, idx, blob.data(), (int)blob.size(), SQLITE_TRANSIENT);
}

static void bind_handle(sqlite3_stmt* st, int idx, std::int64_t handle) {
    if (handle > 0) sqlite3_bind_int64(st, idx, handle);
    else sqlite3_bind_null(st, idx);
}

static std::string col_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

static const char* kColumns =
    "id, source_id, sender, cc, subject, timestamp, body_text, summary, embedding, insertion_sequence, created_at, "
    "index_handle";

MetadataStore::MetadataStore(const std::string& db_path, int busy_timeout_ms) {
    std::filesystem::path p(db_path);
    if (db_path != ":memory:" && p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreFailure("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

MetadataStore::~MetadataStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void MetadataStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS emails (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  source_id TEXT NOT NULL UNIQUE,\n"
         "  sender TEXT,\n"
         "  cc TEXT,\n"
         "  subject TEXT,\n"
         "  timestamp TEXT,\n"
         "  body_text TEXT,\n"
         "  summary TEXT,\n"
         "  embedding BLOB,\n"
         "  insertion_sequence INTEGER NOT NULL UNIQUE,\n"
         "  created_at TEXT DEFAULT CURRENT_TIMESTAMP,\n"
         "  index_handle INTEGER\n"
         ");");
    migrate();
    exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_emails_index_handle ON emails(index_handle);");
    exec("CREATE TABLE IF NOT EXISTS app_metadata (\n"
         "  key TEXT PRIMARY KEY,\n"
         "  value TEXT,\n"
         "  updated_at TEXT DEFAULT CURRENT_TIMESTAMP\n"
         ");");
}

// Databases created before index handles had their own column.
void MetadataStore::migrate() {
    sqlite3_stmt* st = prepare("PRAGMA table_info(emails);");
    bool has_handle = false;
    while (sqlite3_step(st) == SQLITE_ROW) {
        if (col_text(st, 1) == "index_handle") has_handle = true;
    }
    sqlite3_finalize(st);
    if (!has_handle) exec("ALTER TABLE emails ADD COLUMN index_handle INTEGER;");
}

void MetadataStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreFailure("SQLite error: " + msg);
    }
}

sqlite3_stmt* MetadataStore::prepare(const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw StoreFailure(std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }
    return st;
}

void MetadataStore::prepare_statements() {
    const std::string cols = kColumns;
    insert_stmt_ = prepare("INSERT INTO emails \n"
                           "(source_id, sender, cc, subject, timestamp, body_text, summary, embedding, insertion_sequence, \n"
                           " index_handle) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    exists_stmt_ = prepare("SELECT 1 FROM emails WHERE source_id = ?;");
    by_source_stmt_ = prepare(("SELECT " + cols + " FROM emails WHERE source_id = ?;").c_str());
    recent_stmt_ = prepare(("SELECT " + cols + " FROM emails WHERE embedding IS NOT NULL "
                            "ORDER BY insertion_sequence DESC LIMIT ?;").c_str());
    max_seq_stmt_ = prepare("SELECT COALESCE(MAX(insertion_sequence), 0) FROM emails;");
    count_stmt_ = prepare("SELECT COUNT(*) FROM emails;");
    links_stmt_ = prepare("SELECT source_id, COALESCE(index_handle, 0) FROM emails ORDER BY insertion_sequence;");
    set_handle_stmt_ = prepare("UPDATE emails SET index_handle = ? WHERE source_id = ?;");
    get_meta_stmt_ = prepare("SELECT value FROM app_metadata WHERE key = ?;");
    set_meta_stmt_ = prepare("INSERT INTO app_metadata (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP) \n"
                             "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = CURRENT_TIMESTAMP;");
}

void MetadataStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &exists_stmt_, &by_source_stmt_, &recent_stmt_,
                              &max_seq_stmt_, &count_stmt_, &links_stmt_, &set_handle_stmt_,
                              &get_meta_stmt_, &set_meta_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

MetadataStore::Transaction::Transaction(MetadataStore& store) : store_(store) {
    store_.exec("BEGIN IMMEDIATE;");
}

MetadataStore::Transaction::~Transaction() {
    if (!done_) sqlite3_exec(store_.db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

void MetadataStore::Transaction::commit() {
    store_.exec("COMMIT;");
    done_ = true;
}

VectorRecord MetadataStore::read_row(sqlite3_stmt* st) {
    VectorRecord r;
    r.id = sqlite3_column_int64(st, 0);
    r.source_id = col_text(st, 1);
    r.sender = col_text(st, 2);
    r.cc = col_text(st, 3);
    r.subject = col_text(st, 4);
    r.timestamp = parse_iso8601(col_text(st, 5)).value_or(epoch());
    r.body_text = col_text(st, 6);
    r.summary = col_text(st, 7);
    if (sqlite3_column_type(st, 8) == SQLITE_BLOB) {
        r.embedding = decode_embedding(sqlite3_column_blob(st, 8), (size_t)sqlite3_column_bytes(st, 8));
    }
    r.insertion_sequence = sqlite3_column_int64(st, 9);
    r.created_at = col_text(st, 10);
    r.index_handle = sqlite3_column_int64(st, 11);
    return r;
}

bool MetadataStore::contains(const std::string& source_id) {
    StmtReset guard(exists_stmt_);
    bind_text(exists_stmt_, 1, source_id);
    int rc = sqlite3_step(exists_stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SearchFailure(std::string("exists query failed: ") + sqlite3_errmsg(db_));
}

std::int64_t MetadataStore::insert(const VectorRecord& rec) {
    StmtReset guard(insert_stmt_);
    bind_text(insert_stmt_, 1, rec.source_id);
    bind_text(insert_stmt_, 2, rec.sender);
    bind_text(insert_stmt_, 3, rec.cc);
    bind_text(insert_stmt_, 4, rec.subject);
    bind_text(insert_stmt_, 5, format_iso8601(rec.timestamp));
    bind_text(insert_stmt_, 6, rec.body_text);
    bind_text(insert_stmt_, 7, rec.summary);
    bind_blob(insert_stmt_, 8, rec.embedding);
    sqlite3_bind_int64(insert_stmt_, 9, rec.insertion_sequence);
    bind_handle(insert_stmt_, 10, rec.index_handle);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        throw StoreFailure("insert " + rec.source_id + " failed: " + sqlite3_errmsg(db_));
    }
    return sqlite3_last_insert_rowid(db_);
}

std::optional<VectorRecord> MetadataStore::find_by_source_id(const std::string& source_id) {
    StmtReset guard(by_source_stmt_);
    bind_text(by_source_stmt_, 1, source_id);
    int rc = sqlite3_step(by_source_stmt_);
    if (rc == SQLITE_ROW) return read_row(by_source_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw SearchFailure(std::string("lookup by source_id failed: ") + sqlite3_errmsg(db_));
}

std::vector<VectorRecord> MetadataStore::recent(int limit) {
    std::vector<VectorRecord> out;
    StmtReset guard(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    int rc;
    while ((rc = sqlite3_step(recent_stmt_)) == SQLITE_ROW) {
        out.push_back(read_row(recent_stmt_));
    }
    if (rc != SQLITE_DONE) throw SearchFailure(std::string("recent query failed: ") + sqlite3_errmsg(db_));
    return out;
}

std::int64_t MetadataStore::max_sequence() {
    StmtReset guard(max_seq_stmt_);
    if (sqlite3_step(max_seq_stmt_) != SQLITE_ROW) {
        throw SearchFailure(std::string("max sequence query failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_column_int64(max_seq_stmt_, 0);
}

std::int64_t MetadataStore::count() {
    StmtReset guard(count_stmt_);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) {
        throw SearchFailure(std::string("count query failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_column_int64(count_stmt_, 0);
}

std::vector<IndexLink> MetadataStore::index_links() {
    std::vector<IndexLink> out;
    StmtReset guard(links_stmt_);
    int rc;
    while ((rc = sqlite3_step(links_stmt_)) == SQLITE_ROW) {
        out.push_back({col_text(links_stmt_, 0), sqlite3_column_int64(links_stmt_, 1)});
    }
    if (rc != SQLITE_DONE) throw SearchFailure(std::string("index link scan failed: ") + sqlite3_errmsg(db_));
    return out;
}

void MetadataStore::set_index_handle(const std::string& source_id, std::int64_t handle) {
    StmtReset guard(set_handle_stmt_);
    bind_handle(set_handle_stmt_, 1, handle);
    bind_text(set_handle_stmt_, 2, source_id);
    if (sqlite3_step(set_handle_stmt_) != SQLITE_DONE) {
        throw StoreFailure("index handle update for " + source_id + " failed: " + sqlite3_errmsg(db_));
    }
}

std::optional<std::string> MetadataStore::get_meta(const std::string& key) {
    StmtReset guard(get_meta_stmt_);
    bind_text(get_meta_stmt_, 1, key);
    int rc = sqlite3_step(get_meta_stmt_);
    if (rc == SQLITE_ROW) return col_text(get_meta_stmt_, 0);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw SearchFailure(std::string("metadata read failed: ") + sqlite3_errmsg(db_));
}

void MetadataStore::set_meta(const std::string& key, const std::string& value) {
    StmtReset guard(set_meta_stmt_);
    bind_text(set_meta_stmt_, 1, key);
    bind_text(set_meta_stmt_, 2, value);
    if (sqlite3_step(set_meta_stmt_) != SQLITE_DONE) {
        throw StoreFailure(std::string("metadata write failed: ") + sqlite3_errmsg(db_));
    }
}
