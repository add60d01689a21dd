#include "periodic_worker.hpp"

#include "internal/observability/logging.hpp"

namespace taskorch::runtime {

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> pass)
    : name_(std::move(name)), interval_(interval), pass_(std::move(pass)) {
}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PeriodicWorker::Run, this);
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PeriodicWorker::RunOnce() {
  try {
    pass_();
  } catch (const std::exception& e) {
    TASKORCH_LOG_ERROR("Background pass failed", {observability::StringField("worker", name_), observability::StringField("error", e.what())});
  }
}

void PeriodicWorker::Run() {
  TASKORCH_LOG_INFO("Background worker started", {observability::StringField("worker", name_),
                                                  observability::IntField("interval_ms", interval_.count())});
  while (running_) {
    RunOnce();

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace taskorch::runtime
