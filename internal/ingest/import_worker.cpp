#include "internal/ingest/import_worker.hpp"

#include "internal/ingest/import_controller.hpp"
#include "internal/observability/logging.hpp"

namespace runlens::ingest {

using runlens::observability::StringField;

ImportWorker::ImportWorker(std::shared_ptr<ImportScheduler> scheduler, std::shared_ptr<ImportController> controller)
    : scheduler_(std::move(scheduler)), controller_(std::move(controller)) {
}

ImportWorker::~ImportWorker() {
  Stop();
}

void ImportWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ImportWorker::Run, this);
}

void ImportWorker::Stop() {
  scheduler_->CancelPending();
  CancelCurrent();
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

std::future<ImportReport> ImportWorker::Submit(std::vector<std::string> files, ProgressFn progress) {
  ImportJob job;
  job.files    = std::move(files);
  job.progress = std::move(progress);

  auto future = job.done.get_future();
  scheduler_->Enqueue(std::move(job));
  return future;
}

void ImportWorker::CancelCurrent() {
  std::lock_guard lock(current_mutex_);
  if (current_cancel_) current_cancel_->store(true);
}

void ImportWorker::Run() {
  while (true) {
    auto job = scheduler_->Dequeue();
    if (!job) break;

    {
      std::lock_guard lock(current_mutex_);
      current_cancel_ = job->cancel;
    }

    try {
      job->done.set_value(controller_->ImportBatch(job->files, job->progress, job->cancel.get()));
    } catch (const std::exception& e) {
      RUNLENS_LOG_ERROR("import batch aborted", {StringField("error", e.what())});
      job->done.set_exception(std::current_exception());
    }

    std::lock_guard lock(current_mutex_);
    current_cancel_.reset();
  }
}

} // namespace runlens::ingest
