#include "cutline/journal/Reducer.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace cutline::journal {

namespace {

using json = nlohmann::json;

void beginTransaction(sqlite3* db) {
    exec_sql(db, "BEGIN IMMEDIATE;");
}

void commitTransaction(sqlite3* db) {
    exec_sql(db, "COMMIT;");
}

sqlite3_stmt* prepareOrThrow(sqlite3* db, const std::string& sql, const std::string& context) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(context + " prepare failed: " + sqlite3_errmsg(db));
    }
    return stmt;
}

void finalizeOrThrow(sqlite3_stmt* stmt, const std::string& error_message) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        sqlite3_finalize(stmt);
        throw std::runtime_error(error_message);
    }
    sqlite3_finalize(stmt);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

void SegmentReducer::apply(sqlite3* db, const Event& event) {
    if (event.type != "EditCommitted") {
        return;
    }
    upsertClips(db, event.payloadJson);
    removeSegments(db, event.payloadJson);
    upsertSegments(db, event.payloadJson);
    updateMeta(db, event.payloadJson);
}

void SegmentReducer::upsertClips(sqlite3* db, const std::string& payloadJson) {
    json payload = json::parse(payloadJson);
    if (!payload.contains("clips")) {
        return;
    }
    const std::string sql =
        "INSERT OR REPLACE INTO tl_clips(clip_id,source_url,backend_type,duration_frames) VALUES(?,?,?,?);";
    for (const auto& clip : payload.at("clips")) {
        sqlite3_stmt* stmt = prepareOrThrow(db, sql, "SegmentReducer::upsertClips");
        sqlite3_bind_text(stmt, 1, clip.at("id").get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, clip.at("sourceUrl").get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, clip.value("backendType", "html5").c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, clip.at("durationFrames").get<long long>());
        finalizeOrThrow(stmt, "SegmentReducer::upsertClips step failed");
    }
}

void SegmentReducer::upsertSegments(sqlite3* db, const std::string& payloadJson) {
    json payload = json::parse(payloadJson);
    if (!payload.contains("upserted")) {
        return;
    }
    const std::string sql =
        "INSERT OR REPLACE INTO tl_segments(segment_id,clip_id,track_id,t_in,t_out,src_in,src_out,seg_order)"
        " VALUES(?,?,?,?,?,?,?,?);";
    for (const auto& segment : payload.at("upserted")) {
        sqlite3_stmt* stmt = prepareOrThrow(db, sql, "SegmentReducer::upsertSegments");
        const auto t_in = segment.at("timelineStart").get<long long>();
        const auto src_in = segment.at("sourceIn").get<long long>();
        const auto src_out = segment.at("sourceOut").get<long long>();
        sqlite3_bind_text(stmt, 1, segment.at("id").get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, segment.at("clipId").get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, segment.at("trackId").get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, t_in);
        sqlite3_bind_int64(stmt, 5, t_in + (src_out - src_in));
        sqlite3_bind_int64(stmt, 6, src_in);
        sqlite3_bind_int64(stmt, 7, src_out);
        sqlite3_bind_int(stmt, 8, segment.value("order", 0));
        finalizeOrThrow(stmt, "SegmentReducer::upsertSegments step failed");
    }
}

void SegmentReducer::removeSegments(sqlite3* db, const std::string& payloadJson) {
    json payload = json::parse(payloadJson);
    if (!payload.contains("removed")) {
        return;
    }
    const std::string sql = "DELETE FROM tl_segments WHERE segment_id=?;";
    for (const auto& id : payload.at("removed")) {
        sqlite3_stmt* stmt = prepareOrThrow(db, sql, "SegmentReducer::removeSegments");
        sqlite3_bind_text(stmt, 1, id.get<std::string>().c_str(), -1, SQLITE_TRANSIENT);
        finalizeOrThrow(stmt, "SegmentReducer::removeSegments step failed");
    }
}

void SegmentReducer::updateMeta(sqlite3* db, const std::string& payloadJson) {
    json payload = json::parse(payloadJson);
    const std::string sql =
        "INSERT INTO tl_meta(id,fps,total_frames,last_seq,track_ids_json) VALUES(1,?,?,?,?)"
        " ON CONFLICT(id) DO UPDATE SET fps=excluded.fps, total_frames=excluded.total_frames,"
        " last_seq=excluded.last_seq, track_ids_json=excluded.track_ids_json;";
    sqlite3_stmt* stmt = prepareOrThrow(db, sql, "SegmentReducer::updateMeta");
    const std::string tracks = payload.value("tracks", json::array()).dump();
    sqlite3_bind_double(stmt, 1, payload.at("fps").get<double>());
    sqlite3_bind_int64(stmt, 2, payload.at("totalFrames").get<long long>());
    sqlite3_bind_int64(stmt, 3, payload.value("sequence", 0LL));
    sqlite3_bind_text(stmt, 4, tracks.c_str(), -1, SQLITE_TRANSIENT);
    finalizeOrThrow(stmt, "SegmentReducer::updateMeta step failed");
}

void foldLog(sqlite3* db, const std::string& logPath) {
    SegmentReducer reducer;
    std::ifstream input(logPath);
    if (!input) {
        throw std::runtime_error("Failed to open log file: " + logPath);
    }
    beginTransaction(db);
    try {
        std::string line;
        while (std::getline(input, line)) {
            if (line.empty()) {
                continue;
            }
            Event event = parseEventJsonLine(line);
            reducer.apply(db, event);
        }
        commitTransaction(db);
    } catch (const std::exception&) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::string computeReadModelChecksum(sqlite3* db) {
    auto checksum_for_query = [&](const char* sql) -> std::string {
        sqlite3_stmt* stmt = prepareOrThrow(db, sql, "computeReadModelChecksum");
        std::string accumulator;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            int cols = sqlite3_column_count(stmt);
            for (int i = 0; i < cols; ++i) {
                accumulator.append(columnText(stmt, i));
                accumulator.push_back('|');
            }
            accumulator.push_back('\n');
        }
        sqlite3_finalize(stmt);
        return sha256Hex(accumulator);
    };

    std::string segment_sum = checksum_for_query(
        "SELECT segment_id,clip_id,track_id,t_in,t_out,src_in,src_out,seg_order FROM tl_segments"
        " ORDER BY track_id,t_in,segment_id;");
    std::string clip_sum = checksum_for_query(
        "SELECT clip_id,source_url,backend_type,duration_frames FROM tl_clips ORDER BY clip_id;");
    std::string meta_sum = checksum_for_query("SELECT fps,total_frames,track_ids_json FROM tl_meta WHERE id=1;");

    return sha256Hex(segment_sum + clip_sum + meta_sum);
}

std::vector<SegmentRow> loadTimelineRows(sqlite3* db) {
    sqlite3_stmt* stmt = prepareOrThrow(
        db,
        "SELECT segment_id,clip_id,track_id,t_in,t_out,src_in,src_out,seg_order FROM tl_segments"
        " ORDER BY track_id,t_in,segment_id;",
        "loadTimelineRows");
    std::vector<SegmentRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SegmentRow row;
        row.segmentId = columnText(stmt, 0);
        row.clipId = columnText(stmt, 1);
        row.trackId = columnText(stmt, 2);
        row.timelineStart = sqlite3_column_int64(stmt, 3);
        row.timelineEnd = sqlite3_column_int64(stmt, 4);
        row.sourceIn = sqlite3_column_int64(stmt, 5);
        row.sourceOut = sqlite3_column_int64(stmt, 6);
        row.order = sqlite3_column_int(stmt, 7);
        rows.push_back(row);
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::vector<ClipRow> loadClipRows(sqlite3* db) {
    sqlite3_stmt* stmt = prepareOrThrow(
        db, "SELECT clip_id,source_url,backend_type,duration_frames FROM tl_clips ORDER BY clip_id;", "loadClipRows");
    std::vector<ClipRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ClipRow row;
        row.clipId = columnText(stmt, 0);
        row.sourceUrl = columnText(stmt, 1);
        row.backendType = columnText(stmt, 2);
        row.durationFrames = sqlite3_column_int64(stmt, 3);
        rows.push_back(row);
    }
    sqlite3_finalize(stmt);
    return rows;
}

TimelineMetaRow loadTimelineMeta(sqlite3* db) {
    sqlite3_stmt* stmt = prepareOrThrow(
        db, "SELECT fps,total_frames,last_seq,track_ids_json FROM tl_meta WHERE id=1;", "loadTimelineMeta");
    TimelineMetaRow meta;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        meta.fps = sqlite3_column_double(stmt, 0);
        meta.totalFrames = sqlite3_column_int64(stmt, 1);
        meta.lastSequence = sqlite3_column_int64(stmt, 2);
        meta.trackIds = json::parse(columnText(stmt, 3)).get<std::vector<std::string>>();
    }
    sqlite3_finalize(stmt);
    return meta;
}

}  // namespace cutline::journal
