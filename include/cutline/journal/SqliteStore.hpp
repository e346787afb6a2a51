#pragma once

#include "cutline/journal/Event.hpp"

#include <sqlite3.h>

#include <string>

namespace cutline::journal {

sqlite3* open_db(const std::string& path);

void close_db(sqlite3* db);

void exec_sql(sqlite3* db, const std::string& sql);

// Creates the event table and the timeline read-model tables if missing.
void ensure_schema(sqlite3* db);

// Stores the event and folds it into the read model in one transaction.
// Throws std::runtime_error on failure; nothing is written in that case.
void append_event(sqlite3* db, const Event& event);

// Number of events stored in edit_events.
std::int64_t event_count(sqlite3* db);

}  // namespace cutline::journal
