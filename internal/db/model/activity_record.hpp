#pragma once

#include <cstdint>
#include <string>

namespace runlens::db::model {

/*
  Persistent activity row.

  IMPORTANT:
  - hash is the primary key (64-char lowercase hex SHA-256 of the file).
  - date is the calendar day "YYYY-MM-DD"; ordering relies on it.
  - json is the serialized ActivityMetrics payload, opaque at this layer.
*/

struct ActivityRecord {
  std::string hash;

  std::string filename;

  std::string date;

  // batch token shared by every file of one import
  int64_t session_id = 0;

  std::string json;
};

} // namespace runlens::db::model
