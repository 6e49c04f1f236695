#include "internal/ingest/import_scheduler.hpp"

#include "internal/util/errors.hpp"

namespace runlens::ingest {

void ImportScheduler::Enqueue(ImportJob job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidArgument("import scheduler is shut down");
    }
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
}

std::optional<ImportJob> ImportScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ImportJob job = std::move(queue_.front());
  queue_.pop_front();
  return job;
}

void ImportScheduler::CancelPending() {
  std::lock_guard lock(mutex_);
  for (auto& job : queue_) {
    job.cancel->store(true);
  }
}

void ImportScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace runlens::ingest
