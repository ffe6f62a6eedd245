/**
 * @file transfercoordinator.cpp
 * @brief Implementation of job validation, launching and tracking
 */

#include "transfercoordinator.hpp"
#include "childprocess.hpp"
#include "transfersafety.hpp"

#include <chrono>
#include <exception>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
  std::time_t now = std::time(nullptr);
  char buf[32];
  std::tm local{};
  localtime_r(&now, &local);
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

} // namespace

TransferCoordinator::TransferCoordinator(TransferCommand command,
                                         std::string detached_log,
                                         std::shared_ptr<SessionQueue> queue)
    : m_command(std::move(command)), m_detached_log(std::move(detached_log)),
      m_queue(std::move(queue)) {}

TransferCoordinator::~TransferCoordinator() {
  for (auto &[id, runtime] : m_jobs) {
    if (!runtime.worker.joinable())
      continue;

    if (runtime.job.run_mode == RunMode::Attached) {
      {
        std::lock_guard<std::mutex> lock(runtime.control->mutex);
        runtime.control->cancel_requested = true;
        if (runtime.control->pid > 0)
          ChildProcess::signalGroup(runtime.control->pid, SIGTERM);
      }
      runtime.worker.join();
    } else {
      // The child runs in its own session and outlives us; the waiter only
      // holds shared state, so it may finish on its own
      {
        std::lock_guard<std::mutex> lock(runtime.control->mutex);
        runtime.control->orphaned = true;
      }
      runtime.worker.detach();
    }
  }
}

/**
 * @brief Validates a request and launches its job
 *
 * Validation order:
 * 1. At least one source
 * 2. No attached job still pending or running
 * 3. TransferSafety::checkTransfer()
 *
 * On success the job is recorded as Pending and a worker thread starts the
 * first tool process. The job becomes Running when the worker reports the
 * process start.
 */
TransferCoordinator::StartResult
TransferCoordinator::start(const TransferRequest &request) {
  StartResult result;

  if (request.sources.empty()) {
    result.error = TransferError::NothingSelected;
    result.message = describe(TransferError::NothingSelected);
    return result;
  }

  if (attachedActive()) {
    result.error = TransferError::Busy;
    result.message = describe(TransferError::Busy);
    return result;
  }

  auto check = TransferSafety::checkTransfer(request.sources,
                                             request.destination, request.mode);
  if (check.blocked()) {
    result.error = TransferError::InvalidTarget;
    result.message = TransferSafety::getStatusMessage(check.status, check.path);
    spdlog::warn("Transfer refused: {}", result.message);
    return result;
  }
  if (check.status == TransferSafety::TransferStatus::WarningRemovableMedia) {
    result.warning = TransferSafety::getStatusMessage(check.status, check.path);
  }

  std::vector<Invocation> invocations = m_command.build(request);

  const int id = m_next_id++;
  JobRuntime &runtime = m_jobs[id];
  runtime.job.id = id;
  runtime.job.sources = request.sources;
  runtime.job.destination = request.destination;
  runtime.job.mode = request.mode;
  runtime.job.run_mode = request.run_mode;
  runtime.job.output_mode = request.output_mode;
  runtime.job.state = JobState::Pending;
  runtime.job.invocations_total = invocations.size();
  if (request.run_mode == RunMode::Detached)
    runtime.job.log_file = m_detached_log;
  runtime.control = std::make_shared<JobControl>();

  spdlog::info("Job {}: {} {} item(s) to {} ({}, {})", id,
               toString(request.mode), request.sources.size(),
               request.destination, toString(request.run_mode),
               toString(request.output_mode));

  runtime.worker = std::thread(&TransferCoordinator::runJob, id,
                               std::move(invocations), request.run_mode,
                               request.output_mode, runtime.job.log_file,
                               runtime.control, m_queue);

  result.job_id = id;
  return result;
}

bool TransferCoordinator::cancel(int job_id) {
  auto it = m_jobs.find(job_id);
  if (it == m_jobs.end())
    return false;

  JobRuntime &runtime = it->second;
  if (runtime.job.run_mode != RunMode::Attached ||
      runtime.job.state != JobState::Running)
    return false;

  std::lock_guard<std::mutex> lock(runtime.control->mutex);
  runtime.control->cancel_requested = true;
  if (runtime.control->pid > 0) {
    ChildProcess::signalGroup(runtime.control->pid, SIGTERM);
  }
  spdlog::info("Job {}: cancellation requested", job_id);
  return true;
}

const TransferJob *TransferCoordinator::apply(const TransferStarted &started) {
  TransferJob *job = find(started.job_id);
  if (!job || isTerminal(job->state))
    return job;

  job->state = JobState::Running;
  job->invocations_started = started.invocation + 1;
  job->current_command = started.command_line;
  return job;
}

const TransferJob *TransferCoordinator::apply(const TransferOutput &output) {
  TransferJob *job = find(output.job_id);
  if (job && output.progress)
    job->progress = *output.progress;
  return job;
}

const TransferJob *
TransferCoordinator::apply(const TransferFinished &finished) {
  TransferJob *job = find(finished.job_id);
  if (!job)
    return nullptr;

  job->state = finished.state;
  job->failure = finished.failure;

  if (finished.state == JobState::Succeeded) {
    spdlog::info("Job {}: succeeded", job->id);
  } else if (finished.state == JobState::Cancelled) {
    spdlog::info("Job {}: cancelled", job->id);
  } else {
    spdlog::warn("Job {}: failed: {}", job->id,
                 job->failure ? job->failure->message : "unknown reason");
  }
  return job;
}

void TransferCoordinator::acknowledge(int job_id) {
  auto it = m_jobs.find(job_id);
  if (it == m_jobs.end() || !isTerminal(it->second.job.state))
    return;

  // The worker posts its last message right before returning
  if (it->second.worker.joinable())
    it->second.worker.join();
  it->second.control.reset();
}

const TransferJob *TransferCoordinator::job(int job_id) const {
  auto it = m_jobs.find(job_id);
  return it == m_jobs.end() ? nullptr : &it->second.job;
}

std::optional<int> TransferCoordinator::attachedActive() const {
  for (const auto &[id, runtime] : m_jobs) {
    if (runtime.job.run_mode == RunMode::Attached &&
        !isTerminal(runtime.job.state))
      return id;
  }
  return std::nullopt;
}

std::size_t TransferCoordinator::detachedRunning() const {
  std::size_t count = 0;
  for (const auto &[id, runtime] : m_jobs) {
    if (runtime.job.run_mode == RunMode::Detached &&
        !isTerminal(runtime.job.state))
      ++count;
  }
  return count;
}

TransferJob *TransferCoordinator::find(int job_id) {
  auto it = m_jobs.find(job_id);
  return it == m_jobs.end() ? nullptr : &it->second.job;
}

// ============================================================================
// WORKER
// ============================================================================

/**
 * @brief Worker body of one job
 *
 * Runs the invocations one after another and stops at the first one that
 * fails. For each invocation:
 * 1. Honour a cancellation that arrived between processes
 * 2. Spawn the tool (pipe for attached jobs, log file for detached ones)
 * 3. Publish the pid in the control block and announce the start
 * 4. Attached: stream output lines, parsed in Progress mode
 * 5. Wait; the pid is withdrawn from the control block before it is reaped
 *
 * Exactly one TransferFinished is posted, and it is the last message.
 */
void TransferCoordinator::runJob(int job_id,
                                 std::vector<Invocation> invocations,
                                 RunMode run_mode, OutputMode output_mode,
                                 std::string log_file,
                                 std::shared_ptr<JobControl> control,
                                 std::shared_ptr<SessionQueue> queue) {
  TransferFinished finished;
  finished.job_id = job_id;
  finished.state = JobState::Succeeded;

  ProgressParser parser;

  auto cancelRequested = [&control]() {
    std::lock_guard<std::mutex> lock(control->mutex);
    return control->cancel_requested;
  };

  // Logging happens under the control lock so it cannot overlap the
  // coordinator's teardown
  auto report = [&control](auto &&write) {
    std::lock_guard<std::mutex> lock(control->mutex);
    if (!control->orphaned)
      write();
  };

  for (std::size_t i = 0; i < invocations.size(); ++i) {
    const Invocation &inv = invocations[i];

    if (cancelRequested()) {
      finished.state = JobState::Cancelled;
      break;
    }

    std::optional<ChildProcess> child;
    try {
      if (run_mode == RunMode::Attached) {
        child.emplace(ChildProcess::spawnPiped(inv.argv));
      } else {
        std::error_code ec;
        fs::create_directories(fs::path(log_file).parent_path(), ec);
        {
          std::ofstream header(log_file, std::ios::app);
          header << "=== " << timestamp() << " job " << job_id << ": "
                 << inv.commandLine() << "\n";
        }
        child.emplace(ChildProcess::spawnToFile(inv.argv, log_file));
      }
    } catch (const std::system_error &e) {
      report([&] {
        spdlog::error("Job {}: cannot launch '{}': {}", job_id,
                      inv.commandLine(), e.what());
      });
      finished.state = JobState::Failed;
      finished.failure = TransferFailure{TransferError::LaunchFailed, 0,
                                         describe(TransferError::LaunchFailed) +
                                             ": " + e.what()};
      break;
    }

    bool cancel_now = false;
    {
      std::lock_guard<std::mutex> lock(control->mutex);
      control->pid = child->pid();
      cancel_now = control->cancel_requested;
    }
    if (cancel_now)
      child->terminate();

    report([&] {
      spdlog::info("Job {}: started pid {}: {}", job_id, child->pid(),
                   inv.commandLine());
    });
    queue->push(TransferStarted{job_id, i, inv.commandLine()});

    if (run_mode == RunMode::Attached) {
      child->readLines([&](const std::string &line) {
        TransferOutput out;
        out.job_id = job_id;
        out.line = line;
        if (output_mode == OutputMode::Progress) {
          try {
            auto kind = parser.feed(line);
            if (kind != ProgressParser::LineKind::Other)
              out.progress = parser.current();
            out.is_stats = (kind == ProgressParser::LineKind::Stats);
          } catch (const std::exception &e) {
            // Unparsable figures: keep the line as plain output
            report([&] {
              spdlog::debug("Job {}: cannot parse '{}': {}", job_id, line,
                            e.what());
            });
            out.progress.reset();
            out.is_stats = false;
          }
        }
        queue->push(std::move(out));
      });
    }

    int code = child->wait([&control]() {
      std::lock_guard<std::mutex> lock(control->mutex);
      control->pid = -1;
    });

    if (cancelRequested()) {
      finished.state = JobState::Cancelled;
      break;
    }

    if (code != 0) {
      report([&] {
        spdlog::warn("Job {}: '{}' exited with {}", job_id, inv.commandLine(),
                     code);
      });
      finished.state = JobState::Failed;
      finished.failure = TransferFailure{
          TransferError::ExternalToolExitNonZero, code,
          describe(TransferError::ExternalToolExitNonZero) + " (exit " +
              std::to_string(code) + ") for " + inv.source};
      break;
    }
  }

  queue->push(std::move(finished));
}
