#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace runlens::db::memory {

class MemoryTransaction;

/*
  In-process backend; state lives only as long as the object.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::ActivityRecord> activities;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
