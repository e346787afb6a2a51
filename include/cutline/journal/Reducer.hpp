#pragma once

#include "cutline/journal/Event.hpp"
#include "cutline/journal/SqliteStore.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

namespace cutline::journal {

struct SegmentRow {
    std::string segmentId;
    std::string clipId;
    std::string trackId;
    std::int64_t timelineStart{0};
    std::int64_t timelineEnd{0};
    std::int64_t sourceIn{0};
    std::int64_t sourceOut{0};
    int order{0};
};

struct ClipRow {
    std::string clipId;
    std::string sourceUrl;
    std::string backendType;
    std::int64_t durationFrames{0};
};

struct TimelineMetaRow {
    double fps{0.0};
    std::int64_t totalFrames{0};
    std::int64_t lastSequence{0};
    std::vector<std::string> trackIds;
};

// Folds EditCommitted events into tl_segments / tl_clips / tl_meta.
class SegmentReducer {
public:
    void apply(sqlite3* db, const Event& event);

private:
    void upsertClips(sqlite3* db, const std::string& payloadJson);
    void upsertSegments(sqlite3* db, const std::string& payloadJson);
    void removeSegments(sqlite3* db, const std::string& payloadJson);
    void updateMeta(sqlite3* db, const std::string& payloadJson);
};

// Replay an event log file into the supplied read-model database.
void foldLog(sqlite3* db, const std::string& logPath);

// Compute a deterministic checksum of the read-model tables.
std::string computeReadModelChecksum(sqlite3* db);

// Read-model rows ordered by track, start and id.
std::vector<SegmentRow> loadTimelineRows(sqlite3* db);
std::vector<ClipRow> loadClipRows(sqlite3* db);
TimelineMetaRow loadTimelineMeta(sqlite3* db);

}  // namespace cutline::journal
