/**
 * @file transfercoordinator.hpp
 * @brief Lifecycle of copy/move jobs run by the external transfer tool
 */

#ifndef TRANSFERCOORDINATOR_HPP
#define TRANSFERCOORDINATOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "notifications.hpp"
#include "transfercommand.hpp"
#include "transfertypes.hpp"

/**
 * @struct TransferJob
 * @brief State of one copy/move job as seen by the session loop
 *
 * Attached and detached jobs share this record and the same state machine:
 * Pending → Running → Succeeded | Failed | Cancelled.
 */
struct TransferJob {
  int id = 0;
  std::vector<std::string> sources;
  std::string destination;
  TransferMode mode = TransferMode::Copy;
  RunMode run_mode = RunMode::Attached;
  OutputMode output_mode = OutputMode::Progress;
  JobState state = JobState::Pending;
  std::optional<TransferFailure> failure;
  ProgressInfo progress;
  std::size_t invocations_started = 0;
  std::size_t invocations_total = 0;
  std::string current_command;
  /** @brief Where a detached job writes its output */
  std::string log_file;
};

/**
 * @class TransferCoordinator
 * @brief Validates requests, launches the tool and tracks jobs
 *
 * Every job runs on its own worker thread which spawns one tool process per
 * source and reports through the session queue. Job records are only
 * changed by apply(), which the session calls on the loop thread.
 *
 * The process handle lives in a control block shared between the loop
 * thread and the worker, so cancel() can signal the running child while
 * the worker waits for it.
 *
 * @see TransferCommand
 * @see ChildProcess
 */
class TransferCoordinator {
public:
  /**
   * @struct StartResult
   * @brief Outcome of start(): a job id or the reason nothing was launched
   */
  struct StartResult {
    int job_id = 0;
    std::optional<TransferError> error;
    std::string message;
    /** @brief Non-blocking safety notice (e.g. removable media) */
    std::string warning;

    bool ok() const { return !error.has_value(); }
  };

  /**
   * @param command Command builder holding the tool path
   * @param detached_log File receiving the output of detached jobs
   * @param queue Session queue the workers report to
   */
  TransferCoordinator(TransferCommand command, std::string detached_log,
                      std::shared_ptr<SessionQueue> queue);

  /**
   * @brief Cancels and joins attached jobs; detached jobs keep running
   */
  ~TransferCoordinator();

  TransferCoordinator(const TransferCoordinator &) = delete;
  TransferCoordinator &operator=(const TransferCoordinator &) = delete;

  /**
   * @brief Validates a request and launches its job
   *
   * Refused with NothingSelected (no sources), Busy (an attached job has
   * not finished yet) or InvalidTarget (safety check failed). Nothing is
   * launched in those cases.
   */
  StartResult start(const TransferRequest &request);

  /**
   * @brief Forwards SIGTERM to the running process of an attached job
   * @return false unless the job is attached and Running
   */
  bool cancel(int job_id);

  /** @brief Applies a worker notification; returns the updated job */
  const TransferJob *apply(const TransferStarted &started);
  const TransferJob *apply(const TransferOutput &output);
  const TransferJob *apply(const TransferFinished &finished);

  /**
   * @brief Releases the worker and process handle of a terminal job
   *
   * The job record itself is kept for display.
   */
  void acknowledge(int job_id);

  const TransferJob *job(int job_id) const;

  /** @brief Id of the attached job that has not finished yet, if any */
  std::optional<int> attachedActive() const;

  std::size_t detachedRunning() const;

  const TransferCommand &command() const { return m_command; }
  const std::string &detachedLog() const { return m_detached_log; }

private:
  struct JobControl {
    std::mutex mutex;
    pid_t pid = -1;
    bool cancel_requested = false;
    // Set when the coordinator goes away while a detached waiter runs on;
    // the waiter then stops logging
    bool orphaned = false;
  };

  struct JobRuntime {
    TransferJob job;
    std::shared_ptr<JobControl> control;
    std::thread worker;
  };

  static void runJob(int job_id, std::vector<Invocation> invocations,
                     RunMode run_mode, OutputMode output_mode,
                     std::string log_file,
                     std::shared_ptr<JobControl> control,
                     std::shared_ptr<SessionQueue> queue);

  TransferJob *find(int job_id);

  TransferCommand m_command;
  std::string m_detached_log;
  std::shared_ptr<SessionQueue> m_queue;
  std::map<int, JobRuntime> m_jobs;
  int m_next_id = 1;
};

#endif // TRANSFERCOORDINATOR_HPP
