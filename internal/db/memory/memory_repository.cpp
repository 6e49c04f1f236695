#include "memory_repository.hpp"

#include <algorithm>
#include <cstddef>

#include "memory_tx.hpp"

namespace runlens::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::ActivityExists(Transaction& t, const std::string& hash, bool& exists) {
  exists = TX(t).View().activities.contains(hash);
  return Result::Ok();
}

Result MemoryRepository::UpsertActivity(Transaction& t, const model::ActivityRecord& r) {
  TX(t).Mutable().activities[r.hash] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteActivity(Transaction& t, const std::string& hash) {
  TX(t).Mutable().activities.erase(hash);
  return Result::Ok();
}

Result MemoryRepository::CountActivities(Transaction& t, uint64_t& count) {
  count = TX(t).View().activities.size();
  return Result::Ok();
}

Result MemoryRepository::GetActivity(Transaction& t, const std::string& hash, std::optional<model::ActivityRecord>& out) {
  const auto& s  = TX(t).View();
  auto        it = s.activities.find(hash);
  out.reset();
  if (it != s.activities.end()) out = it->second;
  return Result::Ok();
}

Result MemoryRepository::ListActivities(Transaction& t, const ActivityFilter& filter, std::vector<model::ActivityRecord>& out) {
  const auto& s     = TX(t).View();
  const auto  first = out.size();
  for (const auto& [_, record] : s.activities) {
    if (filter.min_date && record.date < *filter.min_date) continue;
    if (filter.session_id && record.session_id != *filter.session_id) continue;
    out.push_back(record);
  }

  std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end(), [](const model::ActivityRecord& a, const model::ActivityRecord& b) {
    if (a.date != b.date) return a.date > b.date;
    if (a.filename != b.filename) return a.filename < b.filename;
    return a.hash < b.hash;
  });
  return Result::Ok();
}

} // namespace runlens::db::memory
