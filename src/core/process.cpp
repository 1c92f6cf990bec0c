#include "core/process.hpp"

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
#include <system_error>
#include <thread>

namespace ov_bench::core {
namespace {

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool set_nonblocking(const int fd) noexcept {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Returns false once the descriptor reached EOF or failed.
bool drain(int& fd, std::string& sink) {
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      sink.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }

    if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }

    close_fd(fd);
    return false;
  }
}

int decode_status(const int status) noexcept {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw std::invalid_argument("run_process requires a non-empty argv");
  }

  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);

  // Close-on-exec so children forked concurrently by other workers never
  // inherit these write ends; dup2 clears the flag on stdout/stderr.
  int out_fds[2]{-1, -1};
  int err_fds[2]{-1, -1};
  if (pipe2(out_fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  if (pipe2(err_fds, O_CLOEXEC) != 0) {
    const int saved = errno;
    close(out_fds[0]);
    close(out_fds[1]);
    throw std::system_error(saved, std::generic_category(), "pipe");
  }

  const auto start = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    for (int fd : {out_fds[0], out_fds[1], err_fds[0], err_fds[1]}) {
      close(fd);
    }
    throw std::system_error(saved, std::generic_category(), "fork");
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    dup2(out_fds[1], STDOUT_FILENO);
    dup2(err_fds[1], STDERR_FILENO);
    close(out_fds[0]);
    close(out_fds[1]);
    close(err_fds[0]);
    close(err_fds[1]);

    execvp(exec_argv[0], exec_argv.data());
    const char* reason = std::strerror(errno);
    (void)!write(STDERR_FILENO, "exec failed: ", 13);
    (void)!write(STDERR_FILENO, reason, std::strlen(reason));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(127);
  }

  setpgid(pid, pid);
  close(out_fds[1]);
  close(err_fds[1]);
  int out_fd = out_fds[0];
  int err_fd = err_fds[0];
  set_nonblocking(out_fd);
  set_nonblocking(err_fd);

  const bool bounded = timeout.count() > 0;
  const auto deadline = start + timeout;

  ProcessResult result{};
  while (out_fd >= 0 || err_fd >= 0) {
    int wait_ms = -1;
    if (bounded) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out_fd >= 0) {
      fds[count++] = pollfd{out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
      fds[count++] = pollfd{err_fd, POLLIN, 0};
    }

    const int ready = poll(fds.data(), count, wait_ms);
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready < 0) {
      break;
    }

    if (out_fd >= 0) {
      drain(out_fd, result.stdout_text);
    }
    if (err_fd >= 0) {
      drain(err_fd, result.stderr_text);
    }
  }

  int status = 0;
  if (!result.timed_out) {
    // Output is closed; the child may still be exiting.
    while (true) {
      const pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        result.exit_code = decode_status(status);
        break;
      }
      if (waited < 0 && errno != EINTR) {
        break;
      }
      if (bounded && std::chrono::steady_clock::now() >= deadline) {
        result.timed_out = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  if (result.timed_out) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    result.exit_code = -1;
  }

  close_fd(out_fd);
  close_fd(err_fd);

  result.duration_s =
      std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start).count();
  return result;
}

std::string shell_quote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (const char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string join_shell_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += shell_quote(arg);
  }
  return out;
}

}  // namespace ov_bench::core
