#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace runlens::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result ActivityExists(Transaction&, const std::string& hash, bool& exists) override;
  Result UpsertActivity(Transaction&, const model::ActivityRecord&) override;
  Result DeleteActivity(Transaction&, const std::string& hash) override;
  Result CountActivities(Transaction&, uint64_t& count) override;
  Result GetActivity(Transaction&, const std::string& hash, std::optional<model::ActivityRecord>& out) override;
  Result ListActivities(Transaction&, const ActivityFilter& filter,
                        std::vector<model::ActivityRecord>& out) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
