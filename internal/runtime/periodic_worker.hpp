#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace taskorch::runtime {

class BackgroundWorker {
 public:
  virtual ~BackgroundWorker() = default;

  virtual void Start() = 0;
  virtual void Stop()  = 0;
};

/*
  Runs a pass every interval on its own thread.

  A pass that throws is logged and the loop continues. Stop()
  wakes the sleeping thread and joins it.
*/
class PeriodicWorker : public BackgroundWorker {
 public:
  PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> pass);
  ~PeriodicWorker() override;

  PeriodicWorker(const PeriodicWorker&)            = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;

  void Start() override;
  void Stop() override;

  // One pass on the caller's thread.
  void RunOnce();

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     pass_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace taskorch::runtime
