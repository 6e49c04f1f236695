#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/ingest/import_scheduler.hpp"

namespace runlens::ingest {

class ImportController;

/*
  Background thread that runs import batches one at a time.

  Submit never blocks on the import itself; the returned future carries
  the report, or the exception that aborted the batch.
*/
class ImportWorker {
 public:
  ImportWorker(std::shared_ptr<ImportScheduler> scheduler, std::shared_ptr<ImportController> controller);
  ~ImportWorker();

  void Start();

  // Cancels the running and queued batches, then joins.
  void Stop();

  std::future<ImportReport> Submit(std::vector<std::string> files, ProgressFn progress = {});

  // Abandons the running batch at the next file boundary.
  void CancelCurrent();

 private:
  void Run();

  std::shared_ptr<ImportScheduler>  scheduler_;
  std::shared_ptr<ImportController> controller_;

  std::mutex                         current_mutex_;
  std::shared_ptr<std::atomic<bool>> current_cancel_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace runlens::ingest
