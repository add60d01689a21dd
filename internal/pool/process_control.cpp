#include "process_control.hpp"

#include <cerrno>
#include <csignal>
#include <sys/types.h>

namespace taskorch::pool {

bool PosixProcessControl::IsAlive(int64_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // exists but owned by someone else
  return errno == EPERM;
}

bool PosixProcessControl::Signal(int64_t pid, int signal) {
  if (pid <= 0) {
    return false;
  }
  return ::kill(static_cast<pid_t>(pid), signal) == 0;
}

} // namespace taskorch::pool
