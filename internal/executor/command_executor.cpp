#include "command_executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::executor {

namespace {

constexpr const char* kCostMarker = "TASKORCH_COST_USD=";

// Closes on scope exit; -1 means nothing held.
class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {
  }
  ~Fd() {
    Close();
  }
  Fd(const Fd&)            = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const {
    return fd_;
  }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

void MakePipe(Fd& read_end, Fd& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::ExecutorError(std::string("pipe failed: ") + std::strerror(errno));
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
}

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

double ParseCost(const std::string& diagnostics) {
  const auto pos = diagnostics.rfind(kCostMarker);
  if (pos == std::string::npos) {
    return 0.0;
  }
  try {
    return std::stod(diagnostics.substr(pos + std::strlen(kCostMarker)));
  } catch (const std::exception& e) {
    TASKORCH_LOG_WARN("Unparseable executor cost", {observability::StringField("error", e.what())});
    return 0.0;
  }
}

std::string Tail(const std::string& text, size_t max_bytes = 512) {
  return text.size() <= max_bytes ? text : text.substr(text.size() - max_bytes);
}

} // namespace

CommandExecutor::CommandExecutor(std::map<std::string, std::string> commands) : commands_(std::move(commands)) {
}

Execution CommandExecutor::Execute(const std::string& capability, const std::string& prompt, std::chrono::milliseconds timeout) {
  const auto it = commands_.find(capability);
  if (it == commands_.end()) {
    throw util::ExecutorError("no command configured for capability " + capability);
  }

  Fd stdin_read, stdin_write, stdout_read, stdout_write, stderr_read, stderr_write;
  MakePipe(stdin_read, stdin_write);
  MakePipe(stdout_read, stdout_write);
  MakePipe(stderr_read, stderr_write);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::ExecutorError(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ::dup2(stdin_read.Get(), STDIN_FILENO);
    ::dup2(stdout_write.Get(), STDOUT_FILENO);
    ::dup2(stderr_write.Get(), STDERR_FILENO);
    ::execl("/bin/sh", "sh", "-c", it->second.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }

  stdin_read.Close();
  stdout_write.Close();
  stderr_write.Close();
  SetNonBlocking(stdin_write.Get());
  SetNonBlocking(stdout_read.Get());
  SetNonBlocking(stderr_read.Get());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string out;
  std::string err;
  size_t      written = 0;
  if (prompt.empty()) {
    stdin_write.Close();
  }

  std::array<char, 4096> buffer{};
  while (stdout_read.Get() >= 0 || stderr_read.Get() >= 0) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw util::ExecutorTimeout(capability + " timed out after " + std::to_string(timeout.count()) + "ms");
    }

    std::array<pollfd, 3> fds{{{stdout_read.Get(), POLLIN, 0}, {stderr_read.Get(), POLLIN, 0}, {stdin_write.Get(), POLLOUT, 0}}};
    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw util::ExecutorError(std::string("poll failed: ") + std::strerror(errno));
    }

    if (stdin_write.Get() >= 0 && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP))) {
      const ssize_t n = ::write(stdin_write.Get(), prompt.data() + written, prompt.size() - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
      }
      // EPIPE: child stopped reading
      if (written == prompt.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
        stdin_write.Close();
      }
    }

    for (int i = 0; i < 2; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      Fd&           source = i == 0 ? stdout_read : stderr_read;
      std::string&  sink   = i == 0 ? out : err;
      const ssize_t n      = ::read(source.Get(), buffer.data(), buffer.size());
      if (n > 0) {
        sink.append(buffer.data(), static_cast<size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        source.Close();
      }
    }
  }
  stdin_write.Close();

  int status = 0;
  if (::waitpid(pid, &status, 0) < 0) {
    throw util::ExecutorError(std::string("waitpid failed: ") + std::strerror(errno));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw util::ExecutorError(capability + " exited with " + std::to_string(code) + ": " + Tail(err));
  }

  return Execution{out, ParseCost(err)};
}

} // namespace taskorch::executor
