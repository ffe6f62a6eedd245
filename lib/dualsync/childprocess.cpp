/**
 * @file childprocess.cpp
 * @brief Implementation of the fork/exec wrapper
 */

#include "childprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace {

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

ChildProcess ChildProcess::spawnPiped(const std::vector<std::string> &argv) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  return spawn(argv, fds[1], fds[0], false);
}

ChildProcess ChildProcess::spawnToFile(const std::vector<std::string> &argv,
                                       const std::string &log_file) {
  int fd = ::open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                  0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "open " + log_file);
  }
  return spawn(argv, fd, -1, true);
}

/**
 * @brief Forks and executes @p argv
 *
 * Everything the child needs is prepared before fork(); between fork() and
 * exec the child only calls async-signal-safe functions. An exec failure is
 * written as an errno value into a close-on-exec pipe; a successful exec
 * closes that pipe, so the parent reads EOF.
 *
 * @param out_fd Write end that becomes the child's stdout and stderr;
 *        closed in the parent
 * @param read_fd Read end kept by the parent (-1 for file output)
 * @param new_session Detach the child into its own session
 */
ChildProcess ChildProcess::spawn(const std::vector<std::string> &argv,
                                 int out_fd, int read_fd, bool new_session) {
  if (argv.empty()) {
    closeFd(out_fd);
    closeFd(read_fd);
    throw std::system_error(EINVAL, std::generic_category(), "empty command");
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  int err_pipe[2];
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    closeFd(out_fd);
    closeFd(read_fd);
    throw std::system_error(err, std::generic_category(), "pipe");
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    closeFd(out_fd);
    closeFd(read_fd);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // Child
    if (new_session) {
      ::setsid();
    } else {
      ::setpgid(0, 0);
    }

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
      ::close(null_fd);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(out_fd, STDERR_FILENO);

    ::execvp(args[0], args.data());

    int err = errno;
    ssize_t ignored = ::write(err_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  // Parent
  ::close(err_pipe[1]);
  closeFd(out_fd);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(err_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    closeFd(read_fd);
    throw std::system_error(child_errno, std::generic_category(),
                            "exec " + argv[0]);
  }

  return ChildProcess(pid, read_fd);
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : m_pid(other.m_pid), m_output_fd(other.m_output_fd),
      m_reaped(other.m_reaped) {
  other.m_pid = -1;
  other.m_output_fd = -1;
  other.m_reaped = true;
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    closeFd(m_output_fd);
    m_pid = other.m_pid;
    m_output_fd = other.m_output_fd;
    m_reaped = other.m_reaped;
    other.m_pid = -1;
    other.m_output_fd = -1;
    other.m_reaped = true;
  }
  return *this;
}

ChildProcess::~ChildProcess() {
  closeFd(m_output_fd);
  if (!m_reaped && m_pid > 0) {
    // Reap if it already exited; a still running detached child is left to
    // init once we exit
    int status = 0;
    ::waitpid(m_pid, &status, WNOHANG);
  }
}

void ChildProcess::readLines(const LineCallback &on_line) {
  if (m_output_fd < 0)
    return;

  std::string pending;
  char buf[4096];

  for (;;) {
    ssize_t n = ::read(m_output_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (n == 0)
      break;

    for (ssize_t i = 0; i < n; ++i) {
      char c = buf[i];
      if (c == '\n' || c == '\r') {
        if (!pending.empty()) {
          on_line(pending);
          pending.clear();
        }
      } else {
        pending.push_back(c);
      }
    }
  }

  if (!pending.empty())
    on_line(pending);

  closeFd(m_output_fd);
}

int ChildProcess::wait(const std::function<void()> &before_reap) {
  if (m_reaped || m_pid <= 0)
    return -1;

  // Wait for exit without reaping so the pid stays reserved
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  while (::waitid(P_PID, static_cast<id_t>(m_pid), &info, WEXITED | WNOWAIT) <
             0 &&
         errno == EINTR) {
  }

  if (before_reap)
    before_reap();

  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(m_pid, &status, 0);
  } while (r < 0 && errno == EINTR);
  m_reaped = true;

  if (r < 0)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

void ChildProcess::terminate() {
  if (!m_reaped && m_pid > 0) {
    signalGroup(m_pid, SIGTERM);
  }
}

int ChildProcess::signalGroup(pid_t pid, int sig) {
  // The child leads its own process group; helpers it started go too
  if (::kill(-pid, sig) == 0)
    return 0;
  return ::kill(pid, sig);
}
