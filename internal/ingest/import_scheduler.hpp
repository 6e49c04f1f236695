#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/ingest/import_controller.hpp"

namespace runlens::ingest {

/*
  A queued import batch and the promise its submitter waits on.
*/
struct ImportJob {
  std::vector<std::string> files;
  ProgressFn               progress;

  std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false);
  std::promise<ImportReport>         done;
};

/*
  Thread-safe blocking queue for the import worker.
*/
class ImportScheduler {
 public:
  void Enqueue(ImportJob job);

  // blocking wait; nullopt once shut down and drained
  std::optional<ImportJob> Dequeue();

  // flags every queued job as cancelled; they still complete
  void CancelPending();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<ImportJob>   queue_;
  bool                    shutdown_ = false;
};

} // namespace runlens::ingest
