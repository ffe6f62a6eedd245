/**
 * @file childprocess.hpp
 * @brief fork/exec wrapper for the external transfer tool
 */

#ifndef CHILDPROCESS_HPP
#define CHILDPROCESS_HPP

#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * @class ChildProcess
 * @brief One running instance of an external program
 *
 * Output handling depends on how the process was spawned:
 * - spawnPiped(): stdout and stderr share one pipe read by readLines()
 * - spawnToFile(): stdout and stderr are appended to a file, the child runs
 *   in its own session so it outlives this program
 *
 * A failed exec is detected in the parent through a close-on-exec pipe and
 * reported as std::system_error from the spawn call, never as a child that
 * exits with a made-up status.
 *
 * The object is move-only and owns the read end of the pipe. wait() must be
 * called to reap the child.
 */
class ChildProcess {
public:
  using LineCallback = std::function<void(const std::string &)>;

  /** @throws std::system_error if pipe/fork/exec fails */
  static ChildProcess spawnPiped(const std::vector<std::string> &argv);

  /** @throws std::system_error if the log file cannot be opened or exec fails */
  static ChildProcess spawnToFile(const std::vector<std::string> &argv,
                                  const std::string &log_file);

  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ~ChildProcess();

  pid_t pid() const { return m_pid; }

  /**
   * @brief Reads the output pipe until EOF, splitting on '\n' and '\r'
   *
   * Empty lines are skipped. Does nothing for file-backed processes.
   */
  void readLines(const LineCallback &on_line);

  /**
   * @brief Waits for the child to exit and reaps it
   *
   * @param before_reap Called after the child has exited but before its pid
   *        is released, so a concurrent terminate() through a shared handle
   *        can never hit a recycled pid
   * @return Exit code, or 128 + signal number if it was killed
   */
  int wait(const std::function<void()> &before_reap = nullptr);

  /** @brief Sends SIGTERM to the child (no-op once it was reaped) */
  void terminate();

  /**
   * @brief Sends @p sig to the process group led by @p pid, falling back
   * to the process alone
   * @return 0 on success, -1 with errno set otherwise
   */
  static int signalGroup(pid_t pid, int sig);

private:
  ChildProcess(pid_t pid, int output_fd) : m_pid(pid), m_output_fd(output_fd) {}

  static ChildProcess spawn(const std::vector<std::string> &argv, int out_fd,
                            int read_fd, bool new_session);

  pid_t m_pid = -1;
  int m_output_fd = -1;
  bool m_reaped = false;
};

#endif // CHILDPROCESS_HPP
