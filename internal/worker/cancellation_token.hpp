#pragma once

#include <atomic>

namespace taskorch::worker {

/*
  Pause/resume/stop flags shared between signal handlers and the
  worker loop. Lock-free atomics only, so setting them is safe from
  a handler.
*/
class CancellationToken {
 public:
  void RequestStop() noexcept {
    stop_.store(true);
  }
  void RequestPause() noexcept {
    pause_.store(true);
  }
  void RequestResume() noexcept {
    pause_.store(false);
  }

  bool StopRequested() const noexcept {
    return stop_.load();
  }
  bool PauseRequested() const noexcept {
    return pause_.load();
  }

 private:
  std::atomic<bool> stop_{false};
  std::atomic<bool> pause_{false};

  static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace taskorch::worker
