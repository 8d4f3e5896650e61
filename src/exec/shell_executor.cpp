#include "shellguard/exec/executor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shellguard::exec {

namespace {

class CappedBuffer {
public:
  explicit CappedBuffer(const std::size_t cap) : cap_(cap) {}

  void append(const char *data, const std::size_t size) {
    const std::size_t remaining = cap_ > text_.size() ? cap_ - text_.size() : 0;
    const std::size_t to_copy = std::min(remaining, size);
    text_.append(data, to_copy);
    if (to_copy < size) {
      truncated_ = true;
    }
  }

  [[nodiscard]] bool truncated() const { return truncated_; }

  std::string take() {
    if (truncated_) {
      text_ += TRUNCATION_NOTICE;
    }
    return std::move(text_);
  }

private:
  std::size_t cap_;
  std::string text_;
  bool truncated_ = false;
};

// Reads what is available; returns false once the pipe hit EOF.
bool drain_fd(const int fd, CappedBuffer &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
}

int decode_exit_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void close_pair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

[[noreturn]] void exec_shell(const ExecRequest &request) {
  if (!request.working_dir.empty() && chdir(request.working_dir.c_str()) != 0) {
    _exit(126);
  }
  execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char *>(nullptr));
  _exit(127);
}

} // namespace

std::string truncate_output(const std::string &text, const std::size_t cap, bool *truncated) {
  CappedBuffer buffer(cap);
  buffer.append(text.data(), text.size());
  if (truncated != nullptr) {
    *truncated = buffer.truncated();
  }
  return buffer.take();
}

common::Result<ExecResult> ShellExecutor::run(const ExecRequest &request) {
  if (request.command.empty()) {
    return common::Result<ExecResult>::failure(common::ErrorCode::InvalidArgument,
                                               "empty command");
  }
  return request.background ? run_background(request) : run_foreground(request);
}

common::Result<ExecResult> ShellExecutor::run_foreground(const ExecRequest &request) {
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return common::Result<ExecResult>::failure(common::ErrorCode::ExecutionFailed,
                                               std::string("Failed to create pipe: ") +
                                                   std::strerror(errno));
  }
  if (pipe(err_pipe) != 0) {
    close_pair(out_pipe);
    return common::Result<ExecResult>::failure(common::ErrorCode::ExecutionFailed,
                                               std::string("Failed to create pipe: ") +
                                                   std::strerror(errno));
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(out_pipe);
    close_pair(err_pipe);
    return common::Result<ExecResult>::failure(common::ErrorCode::ExecutionFailed,
                                               std::string("Failed to fork: ") +
                                                   std::strerror(errno));
  }

  if (pid == 0) {
    setpgid(0, 0);
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[1]);
    close(err_pipe[1]);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    exec_shell(request);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  for (const int fd : {out_pipe[0], err_pipe[0]}) {
    const int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  CappedBuffer out(request.output_cap);
  CappedBuffer err(request.output_cap);
  bool out_open = true;
  bool err_open = true;
  bool timed_out = false;
  bool exited = false;
  int status = 0;

  while (!exited || out_open || err_open) {
    if (std::chrono::steady_clock::now() - started > request.timeout) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      timed_out = true;
      break;
    }

    std::array<pollfd, 2> fds{{{.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
                               {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0}}};
    (void)poll(fds.data(), fds.size(), 50);

    if (out_open) {
      out_open = drain_fd(out_pipe[0], out);
    }
    if (err_open) {
      err_open = drain_fd(err_pipe[0], err);
    }

    if (!exited) {
      const pid_t done = waitpid(pid, &status, WNOHANG);
      if (done == pid) {
        exited = true;
      }
    } else {
      // Output handed to background grandchildren stays open; stop once the
      // shell is gone and nothing more is waiting.
      if ((fds[0].revents | fds[1].revents) == 0) {
        break;
      }
    }
  }

  if (out_open) {
    (void)drain_fd(out_pipe[0], out);
  }
  if (err_open) {
    (void)drain_fd(err_pipe[0], err);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);
  if (!exited) {
    waitpid(pid, &status, 0);
  }

  ExecResult result;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.timed_out = timed_out;
  result.truncated = out.truncated() || err.truncated();
  result.stdout_text = out.take();
  result.stderr_text = err.take();
  result.exit_code = timed_out ? -1 : decode_exit_status(status);
  if (timed_out) {
    result.stderr_text += "\n[command timed out after " +
                          std::to_string(request.timeout.count()) + "s]";
  }
  return common::Result<ExecResult>::success(std::move(result));
}

common::Result<ExecResult> ShellExecutor::run_background(const ExecRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ExecResult>::failure(common::ErrorCode::ExecutionFailed,
                                               std::string("Failed to fork: ") +
                                                   std::strerror(errno));
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    exec_shell(request);
  }

  int status = 0;
  bool timed_out = false;
  while (true) {
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0 && errno != EINTR) {
      return common::Result<ExecResult>::failure(common::ErrorCode::ExecutionFailed,
                                                 std::string("waitpid failed: ") +
                                                     std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() - started > request.timeout) {
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      timed_out = true;
      break;
    }
    (void)poll(nullptr, 0, 10);
  }

  ExecResult result;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.timed_out = timed_out;
  result.exit_code = timed_out ? -1 : decode_exit_status(status);
  result.stdout_text = "[started in background]";
  return common::Result<ExecResult>::success(std::move(result));
}

} // namespace shellguard::exec
