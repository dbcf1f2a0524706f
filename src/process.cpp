/**
 * @file process.cpp
 * @brief fork/execvp process runner with captured output
 *
 * @details stdout and stderr are read through two pipes multiplexed with
 *          poll(2), so a tool that fills one pipe while the other is idle
 *          cannot deadlock the parent.
 */

#include "transcode_watchdog/process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace transcode_watchdog {

namespace {

/// Close both ends of a pipe that are still open
void close_pipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

/// Read whatever is available on fd; false on EOF or error
bool drain(int fd, std::string &out) {
  char buf[4096];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && errno == EINTR)
    return true;
  return false;
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &argv) {
  ProcessResult result;
  if (argv.empty())
    return result;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    result.stderr_text = std::strerror(errno);
    return result;
  }
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    result.stderr_text = std::strerror(errno);
    close_pipe(out_pipe);
    return result;
  }

  /// Build argv before fork; the child must not allocate
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    result.stderr_text = std::strerror(errno);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    return result;
  }

  if (pid == 0) {
    /// Child: stdin from /dev/null, stdout/stderr into the pipes
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      dup2(devnull, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(out_pipe[1]);
  out_pipe[1] = -1;
  close(err_pipe[1]);
  err_pipe[1] = -1;

  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  int open_fds = 2;
  while (open_fds > 0) {
    int ready = poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      std::string &sink = (i == 0) ? result.stdout_text : result.stderr_text;
      if (!drain(fds[i].fd, sink)) {
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  close_pipe(out_pipe);
  close_pipe(err_pipe);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string quote_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    const std::string &a = argv[i];
    bool plain = !a.empty() &&
                 a.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                                     "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                     "0123456789@%+=:,./_-") == std::string::npos;
    if (plain) {
      out += a;
      continue;
    }
    out += '\'';
    for (char c : a) {
      if (c == '\'')
        out += "'\"'\"'";
      else
        out += c;
    }
    out += '\'';
  }
  return out;
}

} // namespace transcode_watchdog
