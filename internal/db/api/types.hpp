#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace runlens::db {

/*
  Row filter for window queries.

  Unset fields do not constrain. Both set means AND.
*/
struct ActivityFilter {
  // inclusive lower bound, "YYYY-MM-DD"
  std::optional<std::string> min_date;

  std::optional<int64_t> session_id;
};

} // namespace runlens::db
