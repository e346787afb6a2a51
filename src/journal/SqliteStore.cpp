#include "cutline/journal/SqliteStore.hpp"

#include "cutline/journal/Reducer.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace cutline::journal {

namespace {

constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS edit_events(
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    event_id TEXT NOT NULL UNIQUE,
    type TEXT NOT NULL,
    scope TEXT NOT NULL DEFAULT '',
    ts INTEGER NOT NULL DEFAULT 0,
    author TEXT NOT NULL DEFAULT '',
    parents_json TEXT NOT NULL DEFAULT '[]',
    schema_v INTEGER NOT NULL DEFAULT 1,
    payload_v INTEGER NOT NULL DEFAULT 1,
    payload_json TEXT NOT NULL DEFAULT '{}'
);
CREATE TABLE IF NOT EXISTS tl_segments(
    segment_id TEXT PRIMARY KEY,
    clip_id TEXT NOT NULL,
    track_id TEXT NOT NULL,
    t_in INTEGER NOT NULL,
    t_out INTEGER NOT NULL,
    src_in INTEGER NOT NULL,
    src_out INTEGER NOT NULL,
    seg_order INTEGER NOT NULL DEFAULT 0,
    CHECK (t_out - t_in = src_out - src_in)
);
CREATE INDEX IF NOT EXISTS idx_tl_segments_track ON tl_segments(track_id, t_in);
CREATE TABLE IF NOT EXISTS tl_clips(
    clip_id TEXT PRIMARY KEY,
    source_url TEXT NOT NULL,
    backend_type TEXT NOT NULL,
    duration_frames INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS tl_meta(
    id INTEGER PRIMARY KEY CHECK (id = 1),
    fps REAL NOT NULL,
    total_frames INTEGER NOT NULL,
    last_seq INTEGER NOT NULL DEFAULT 0,
    track_ids_json TEXT NOT NULL DEFAULT '[]'
);
)SQL";

}  // namespace

sqlite3* open_db(const std::string& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("Failed to open SQLite database at " + path + ": " + message);
    }

    exec_sql(db, "PRAGMA journal_mode=WAL;");
    exec_sql(db, "PRAGMA synchronous=NORMAL;");
    exec_sql(db, "PRAGMA foreign_keys=ON;");
    return db;
}

void close_db(sqlite3* db) {
    if (db != nullptr) {
        sqlite3_close(db);
    }
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQLite exec failed: " + message);
    }
}

void ensure_schema(sqlite3* db) {
    exec_sql(db, kSchemaSql);
}

void append_event(sqlite3* db, const Event& event) {
    exec_sql(db, "BEGIN IMMEDIATE;");
    try {
        const std::string sql =
            "INSERT INTO edit_events(event_id,type,scope,ts,author,parents_json,schema_v,payload_v,payload_json)"
            " VALUES(?,?,?,?,?,?,?,?,?);";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("append_event prepare failed: ") + sqlite3_errmsg(db));
        }
        const std::string parents = nlohmann::json(event.parents).dump();
        const std::string payload = event.payloadJson.empty() ? "{}" : event.payloadJson;
        sqlite3_bind_text(stmt, 1, event.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, event.type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, event.scope.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, event.timestampMs);
        sqlite3_bind_text(stmt, 5, event.author.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, parents.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 7, event.schemaVersion);
        sqlite3_bind_int(stmt, 8, event.payloadVersion);
        sqlite3_bind_text(stmt, 9, payload.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            throw std::runtime_error("append_event insert failed: " + message);
        }
        sqlite3_finalize(stmt);

        SegmentReducer reducer;
        reducer.apply(db, event);
        exec_sql(db, "COMMIT;");
    } catch (const std::exception&) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::int64_t event_count(sqlite3* db) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM edit_events;", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("event_count prepare failed: ") + sqlite3_errmsg(db));
    }
    std::int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

}  // namespace cutline::journal
