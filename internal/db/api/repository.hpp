#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/activity_record.hpp"

namespace runlens::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - UpsertActivity replaces the whole row atomically
  - DeleteActivity is idempotent

  Rows are returned exactly as stored; decoding json/date is the
  caller's job so one bad row never fails a list.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Activities
  // ---------------------------------------------------------------------

  virtual Result ActivityExists(Transaction&, const std::string& hash, bool& exists) = 0;

  virtual Result UpsertActivity(Transaction&, const model::ActivityRecord&) = 0;

  virtual Result DeleteActivity(Transaction&, const std::string& hash) = 0;

  virtual Result CountActivities(Transaction&, uint64_t& count) = 0;

  // An absent row is Ok with out left empty.
  virtual Result GetActivity(Transaction&, const std::string& hash, std::optional<model::ActivityRecord>& out) = 0;

  // Newest date first; ties by filename then hash.
  virtual Result ListActivities(Transaction&, const ActivityFilter& filter, std::vector<model::ActivityRecord>& out) = 0;
};

} // namespace runlens::db
