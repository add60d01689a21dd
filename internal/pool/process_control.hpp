#pragma once

#include <cstdint>

namespace taskorch::pool {

/*
  OS process seam.

  Production uses kill(2); tests substitute a fake so no real
  signals are sent.
*/
class ProcessControl {
 public:
  virtual ~ProcessControl() = default;

  // kill(pid, 0) semantics: true while the process exists.
  virtual bool IsAlive(int64_t pid) = 0;

  // Returns false when the process could not be signalled.
  virtual bool Signal(int64_t pid, int signal) = 0;
};

class PosixProcessControl final : public ProcessControl {
 public:
  bool IsAlive(int64_t pid) override;
  bool Signal(int64_t pid, int signal) override;
};

} // namespace taskorch::pool
