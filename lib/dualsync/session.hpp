/**
 * @file session.hpp
 * @brief The dual-panel session: both panels, the modes, the jobs and the
 * render snapshot
 *
 * The Session is the only owner of mutable UI-facing state. Background
 * workers (listings, size walks, transfer processes) report through the
 * session queue and pollNotifications() applies their results on the
 * calling thread.
 *
 * @see Panel
 * @see TransferCoordinator
 * @see SizeAggregator
 */

#ifndef SESSION_HPP
#define SESSION_HPP

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "command.hpp"
#include "notifications.hpp"
#include "panel.hpp"
#include "sizeaggregator.hpp"
#include "transfercoordinator.hpp"
#include "transfersafety.hpp"

/**
 * @struct SessionOptions
 * @brief Start-up parameters of a Session
 */
struct SessionOptions {
  std::string left_path;
  std::string right_path;
  /** @brief External transfer tool (argv[0]) */
  std::string tool = "rclone";
  /** @brief File receiving the output of detached jobs */
  std::string detached_log;
  /** @brief Capacity of the output pane buffer */
  std::size_t output_lines = 2000;
  /** @brief List directories on a worker; false lists inline (tests) */
  bool async_listing = true;
};

/** @brief One row of a panel as drawn */
struct EntryView {
  std::string display_name;
  std::string path;
  EntryKind kind = EntryKind::File;
  std::string size_label;
  int color_code = 7;
  bool selected = false;
  bool under_cursor = false;
};

/**
 * @struct PanelView
 * @brief Visible window of a panel plus its header and footer data
 *
 * entries holds at most the requested number of rows starting at
 * first_index, positioned so the cursor stays visible.
 */
struct PanelView {
  std::string path;
  bool active = false;
  std::vector<EntryView> entries;
  int first_index = 0;
  int cursor = 0;
  std::size_t total_entries = 0;
  Panel::NavState nav_state = Panel::NavState::Idle;
  std::string error_message;
  std::string footer_label;
};

/** @brief Display data of the job shown in the status bar */
struct TransferView {
  int job_id = 0;
  TransferMode mode = TransferMode::Copy;
  RunMode run_mode = RunMode::Attached;
  OutputMode output_mode = OutputMode::Progress;
  JobState state = JobState::Pending;
  ProgressInfo progress;
  std::size_t invocations_started = 0;
  std::size_t invocations_total = 0;
  std::string command;
  std::string failure;
};

/**
 * @struct SessionSnapshot
 * @brief Everything the rendering layer needs for one frame
 */
struct SessionSnapshot {
  PanelView left;
  PanelView right;
  PanelSide active = PanelSide::Left;

  TransferMode transfer_mode = TransferMode::Copy;
  OutputMode output_mode = OutputMode::Progress;
  RunMode run_mode = RunMode::Attached;

  std::optional<TransferView> transfer;
  std::size_t detached_running = 0;

  /** @brief Selection of the active panel */
  Panel::SelectionSummary selection;
  std::string selection_label;

  /** @brief Visible output lines, oldest first */
  std::vector<std::string> output;
  int output_scroll = 0;
  std::size_t output_total = 0;

  std::string status;
  bool blocked = false;
  bool busy = false;
};

/**
 * @class Session
 * @brief Mediates commands between the panels and the transfer coordinator
 *
 * Command dispatch is refused while an attached job has not finished,
 * except for CancelTransfer and ScrollOutput; snapshots and notification
 * polling keep working so buffered output is still drawn.
 *
 * Members are declared so that the listing workers are joined first and the
 * queue they report to is destroyed last.
 */
class Session {
public:
  enum class DispatchOutcome { Applied, Ignored, Blocked, Quit };

  explicit Session(const SessionOptions &options);
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /**
   * @brief Executes one operator command
   *
   * @return Blocked while an attached job runs, Quit for the Quit command,
   *         Ignored when the command had nothing to act on
   */
  DispatchOutcome dispatch(const Command &command);

  /**
   * @brief Applies every queued worker notification
   * @return Number of notifications applied
   */
  std::size_t pollNotifications();

  /** @brief Blocks until a notification is queued or @p timeout expires */
  bool waitForNotifications(std::chrono::milliseconds timeout);

  /**
   * @brief Installs a callback run on the worker thread after each push
   *
   * Used by the front end to wake its event loop. Cleared on destruction.
   */
  void setWakeHook(std::function<void()> hook);

  // ===== Transfers =====

  /**
   * @brief What ConfirmTransfer would launch right now
   *
   * Sources are the active panel's selection in listing order, or the entry
   * under the cursor when nothing is selected; the destination is the other
   * panel's path.
   */
  TransferRequest pendingRequest() const;

  /** @brief Safety verdict for pendingRequest(), for confirmation dialogs */
  TransferSafety::TransferCheck previewCheck() const;

  /** @brief Validates and launches pendingRequest() */
  TransferCoordinator::StartResult requestTransfer();

  /** @brief Cancels the attached job; false if none is running */
  bool cancelTransfer();

  /** @brief Most recently launched job, kept after it finished */
  const TransferJob *activeTransfer() const;

  /** @brief True while an attached job has not reached a terminal state */
  bool isBlocked() const;

  /** @brief True while listings, size walks or jobs are running */
  bool hasWorkInFlight() const;

  // ===== Modes and panels =====

  TransferMode transferMode() const { return m_transfer_mode; }
  OutputMode outputMode() const { return m_output_mode; }
  RunMode runMode() const { return m_run_mode; }

  PanelSide activeSide() const { return m_active; }
  Panel &panel(PanelSide side);
  const Panel &panel(PanelSide side) const;
  Panel &activePanel() { return panel(m_active); }
  const Panel &activePanel() const { return panel(m_active); }
  const Panel &otherPanel() const;

  SizeAggregator &sizes() { return m_sizes; }
  const TransferCoordinator &coordinator() const { return m_coordinator; }

  // ===== Output pane =====

  const std::deque<std::string> &output() const { return m_output; }

  /** @brief Lines scrolled back from the newest line; 0 follows the tail */
  int outputScroll() const { return m_output_scroll; }

  const std::string &statusMessage() const { return m_status; }

  /**
   * @brief Builds the render snapshot
   * @param visible_rows Panel rows the caller can draw
   * @param output_rows Output pane rows the caller can draw
   */
  SessionSnapshot snapshot(int visible_rows = 100, int output_rows = 8) const;

private:
  void navigate(PanelSide side, const std::string &target);
  void startListing(PanelSide side, const Panel::NavRequest &request);
  void refreshPanel(PanelSide side);

  void apply(SizeUpdate &update);
  void apply(ListingDone &done);
  void apply(TransferStarted &started);
  void apply(TransferOutput &output);
  void apply(TransferFinished &finished);

  void refreshAfterJob(const TransferJob &job);
  void appendOutput(std::string line);
  void scrollOutput(int delta);

  PanelView makePanelView(PanelSide side, int visible_rows) const;

  SessionOptions m_options;
  std::shared_ptr<SessionQueue> m_queue;
  SizeAggregator m_sizes;
  Panel m_left;
  Panel m_right;
  TransferCoordinator m_coordinator;

  PanelSide m_active = PanelSide::Left;
  TransferMode m_transfer_mode = TransferMode::Copy;
  OutputMode m_output_mode = OutputMode::Progress;
  RunMode m_run_mode = RunMode::Attached;
  std::optional<int> m_active_job;

  std::deque<std::string> m_output;
  int m_output_scroll = 0;
  std::string m_status = "Ready.";

  std::array<std::future<void>, 2> m_listings;
};

#endif // SESSION_HPP
