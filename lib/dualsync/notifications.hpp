/**
 * @file notifications.hpp
 * @brief Messages posted by background workers to the session loop
 */

#ifndef NOTIFICATIONS_HPP
#define NOTIFICATIONS_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "notificationqueue.hpp"
#include "pathlister.hpp"
#include "sizeaggregator.hpp"
#include "transfertypes.hpp"

enum class PanelSide { Left, Right };

/** @brief A directory listing requested by a panel has finished */
struct ListingDone {
  PanelSide side = PanelSide::Left;
  std::string target;
  std::uint64_t ticket = 0;
  ListResult result;
};

/** @brief A tool process of a job has been started */
struct TransferStarted {
  int job_id = 0;
  std::size_t invocation = 0;
  std::string command_line;
};

/** @brief One output line of an attached job */
struct TransferOutput {
  int job_id = 0;
  std::string line;
  /** @brief Set when the line was a statistics line (Progress mode) */
  std::optional<ProgressInfo> progress;
  bool is_stats = false;
};

/** @brief A job reached a terminal state */
struct TransferFinished {
  int job_id = 0;
  JobState state = JobState::Succeeded;
  std::optional<TransferFailure> failure;
};

using Notification = std::variant<SizeUpdate, ListingDone, TransferStarted,
                                  TransferOutput, TransferFinished>;

using SessionQueue = NotificationQueue<Notification>;

#endif // NOTIFICATIONS_HPP
