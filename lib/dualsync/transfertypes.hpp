/**
 * @file transfertypes.hpp
 * @brief Modes, states and errors of copy/move jobs
 */

#ifndef TRANSFERTYPES_HPP
#define TRANSFERTYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TransferMode { Copy, Move };

/** @brief Structured progress or raw log lines */
enum class OutputMode { Progress, Log };

/** @brief Attached jobs block command dispatch; detached jobs do not */
enum class RunMode { Attached, Detached };

enum class JobState { Pending, Running, Succeeded, Failed, Cancelled };

/**
 * @enum TransferError
 * @brief Why a transfer was refused or failed
 */
enum class TransferError {
  NothingSelected,
  InvalidTarget,
  Busy,
  LaunchFailed,
  ExternalToolExitNonZero
};

/**
 * @struct TransferFailure
 * @brief Reason retained for display when a job did not succeed
 */
struct TransferFailure {
  TransferError error = TransferError::LaunchFailed;
  int exit_code = 0;
  std::string message;
};

/**
 * @struct ProgressInfo
 * @brief Last progress figures parsed from the tool's statistics output
 */
struct ProgressInfo {
  std::uint64_t bytes_done = 0;
  std::uint64_t bytes_total = 0;
  int percent = 0;
  std::string rate;
  std::string eta;
  std::string current_file;
};

/**
 * @struct TransferRequest
 * @brief A confirmed copy/move request as gathered by the Session
 */
struct TransferRequest {
  std::vector<std::string> sources;
  std::string destination;
  TransferMode mode = TransferMode::Copy;
  RunMode run_mode = RunMode::Attached;
  OutputMode output_mode = OutputMode::Progress;
};

inline const char *toString(TransferMode mode) {
  return mode == TransferMode::Copy ? "copy" : "move";
}

inline const char *toString(OutputMode mode) {
  return mode == OutputMode::Progress ? "progress" : "log";
}

inline const char *toString(RunMode mode) {
  return mode == RunMode::Attached ? "attached" : "detached";
}

inline const char *toString(JobState state) {
  switch (state) {
  case JobState::Pending:
    return "pending";
  case JobState::Running:
    return "running";
  case JobState::Succeeded:
    return "succeeded";
  case JobState::Failed:
    return "failed";
  case JobState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

inline bool isTerminal(JobState state) {
  return state == JobState::Succeeded || state == JobState::Failed ||
         state == JobState::Cancelled;
}

/** @brief Human-readable text for a transfer error */
inline std::string describe(TransferError error) {
  switch (error) {
  case TransferError::NothingSelected:
    return "Nothing selected";
  case TransferError::InvalidTarget:
    return "Invalid target";
  case TransferError::Busy:
    return "A foreground transfer is already running";
  case TransferError::LaunchFailed:
    return "Could not start the transfer tool";
  case TransferError::ExternalToolExitNonZero:
    return "Transfer tool exited with an error";
  }
  return "Transfer error";
}

#endif // TRANSFERTYPES_HPP
