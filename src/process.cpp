/**
 * @file process.cpp
 * @brief External process execution implementation
 *
 * @details fork/execvp with a stderr pipe polled in 100ms slices so the
 *          cancellation token is observed while the child runs.
 */

#include "crf_target/process.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "crf_target/logging.hpp"

namespace crf_target {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

/// Decode a waitpid() status into an exit code
int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// Terminate the child's process group and reap it
int terminate_child(pid_t pid, std::chrono::milliseconds grace) {
  ::kill(-pid, SIGTERM);

  int status = 0;
  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return decode_wait_status(status);
    if (r < 0)
      return -1;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  LOG_WARN("Process {} ignored SIGTERM, sending SIGKILL", pid);
  ::kill(-pid, SIGKILL);
  if (::waitpid(pid, &status, 0) == pid)
    return decode_wait_status(status);
  return -1;
}

/// Child side of fork(): wire up fds and exec. Never returns.
/// Only async-signal-safe calls here; argv is built by the parent.
[[noreturn]] void exec_child(char *const *argv, int stderr_write_fd,
                             const char *stdout_path) {
  /// Own process group so cancellation reaches grandchildren too
  ::setpgid(0, 0);

  int devnull = ::open("/dev/null", O_RDWR);
  if (devnull >= 0)
    ::dup2(devnull, STDIN_FILENO);

  int out_fd = devnull;
  if (stdout_path != nullptr) {
    out_fd = ::open(stdout_path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (out_fd < 0)
      ::_exit(126);
  }
  if (out_fd >= 0)
    ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(stderr_write_fd, STDERR_FILENO);

  ::execvp(argv[0], argv);
  ::_exit(127);
}

} // anonymous namespace

std::string ProcessResult::tail_text() const {
  std::string out;
  for (const auto &line : stderr_tail) {
    if (!out.empty())
      out += " | ";
    out += line;
  }
  return out;
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (const auto &a : argv) {
    if (!cmd.empty())
      cmd += ' ';
    if (a.find(' ') != std::string::npos)
      cmd += fmt::format("\"{}\"", a);
    else
      cmd += a;
  }
  return cmd;
}

std::vector<std::string> split_args(const std::string &params) {
  std::vector<std::string> out;
  std::istringstream in(params);
  std::string word;
  while (in >> word)
    out.push_back(word);
  return out;
}

Status run_process(const std::vector<std::string> &argv,
                   const LineCallback &on_line, const CancelTokenPtr &token,
                   ProcessResult &result, const ProcessOptions &options) {
  result = ProcessResult();

  if (argv.empty())
    return Status(ErrorCode::InvalidArgument, "empty command line");

  if (token && token->is_cancelled()) {
    result.cancelled = true;
    return Status(ErrorCode::Cancelled, "cancelled before start");
  }

  LOG_DEBUG("exec: {}", format_command(argv));

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);
  const char *stdout_path =
      options.stdout_path.empty() ? nullptr : options.stdout_path.c_str();

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return Status(ErrorCode::ProcessFailed,
                  fmt::format("pipe failed: {}", std::strerror(errno)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return Status(ErrorCode::ProcessFailed,
                  fmt::format("fork failed: {}", std::strerror(errno)));
  }
  if (pid == 0) {
    exec_child(cargv.data(), fds[1], stdout_path);
  }

  /// Parent: also set the group here to close the race with an early kill
  ::setpgid(pid, pid);
  ::close(fds[1]);
  int read_fd = fds[0];

  std::string pending;
  auto emit_line = [&](std::string line) {
    if (line.empty())
      return;
    if (on_line)
      on_line(line);
    result.stderr_tail.push_back(std::move(line));
    while (result.stderr_tail.size() > options.tail_lines)
      result.stderr_tail.pop_front();
  };

  char buf[4096];
  bool eof = false;
  while (!eof) {
    if (token && token->is_cancelled()) {
      ::close(read_fd);
      result.exit_code = terminate_child(pid, options.kill_grace);
      result.cancelled = true;
      return Status(ErrorCode::Cancelled,
                    fmt::format("{} terminated on cancellation", argv[0]));
    }

    struct pollfd pfd = {read_fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, POLL_INTERVAL_MS);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (pr == 0)
      continue;

    ssize_t n = ::read(read_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (n == 0) {
      eof = true;
      break;
    }

    for (ssize_t i = 0; i < n; ++i) {
      char c = buf[i];
      if (c == '\n' || c == '\r') {
        emit_line(std::move(pending));
        pending.clear();
      } else {
        pending += c;
      }
    }
  }
  emit_line(std::move(pending));
  ::close(read_fd);

  /// stderr closed; the child is exiting. Keep honouring the token while
  /// waiting in case it lingers.
  int status = 0;
  for (;;) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      result.exit_code = decode_wait_status(status);
      break;
    }
    if (r < 0) {
      result.exit_code = -1;
      break;
    }
    if (token && token->is_cancelled()) {
      result.exit_code = terminate_child(pid, options.kill_grace);
      result.cancelled = true;
      return Status(ErrorCode::Cancelled,
                    fmt::format("{} terminated on cancellation", argv[0]));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
  }

  if (result.exit_code == 127) {
    return Status(ErrorCode::ProcessFailed,
                  fmt::format("{} could not be executed", argv[0]));
  }
  if (result.exit_code != 0) {
    return Status(ErrorCode::ProcessFailed,
                  fmt::format("{} exited with code {}: {}", argv[0],
                              result.exit_code, result.tail_text()));
  }
  return Status::ok();
}

} // namespace crf_target
