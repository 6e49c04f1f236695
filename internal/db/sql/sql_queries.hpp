#pragma once

namespace runlens::db::sql {

/*
  Canonical SQL for the activities table.

  IMPORTANT:
  The hash / filename / date / json_data / session_id layout is shared
  with databases written by earlier releases; keep the column names.
*/

static constexpr const char* CREATE_ACTIVITIES =
    "CREATE TABLE IF NOT EXISTS activities ("
    " hash TEXT PRIMARY KEY,"
    " filename TEXT,"
    " date TEXT,"
    " json_data TEXT,"
    " session_id INTEGER);";

static constexpr const char* CREATE_ACTIVITIES_DATE_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_activities_date ON activities(date);";

static constexpr const char* CREATE_ACTIVITIES_SESSION_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_activities_session ON activities(session_id);";

static constexpr const char* UPSERT_ACTIVITY =
    "INSERT OR REPLACE INTO activities(hash,filename,date,json_data,session_id)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* EXISTS_ACTIVITY =
    "SELECT 1 FROM activities WHERE hash=?;";

static constexpr const char* SELECT_ACTIVITY =
    "SELECT hash,filename,date,json_data,session_id"
    " FROM activities WHERE hash=?;";

static constexpr const char* DELETE_ACTIVITY =
    "DELETE FROM activities WHERE hash=?;";

static constexpr const char* COUNT_ACTIVITIES =
    "SELECT COUNT(*) FROM activities;";

// Unused filters bind NULL: (?1 IS NULL OR date >= ?1)
static constexpr const char* LIST_ACTIVITIES =
    "SELECT hash,filename,date,json_data,session_id FROM activities"
    " WHERE (?1 IS NULL OR date >= ?1)"
    " AND (?2 IS NULL OR session_id = ?2)"
    " ORDER BY date DESC, filename ASC, hash ASC;";

} // namespace runlens::db::sql
