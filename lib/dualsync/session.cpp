/**
 * @file session.cpp
 * @brief Implementation of command dispatch, notification handling and
 * snapshots
 */

#include "session.hpp"
#include "pathutils.hpp"
#include "utils.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

Session::Session(const SessionOptions &options)
    : m_options(options), m_queue(std::make_shared<SessionQueue>()),
      m_sizes([queue = m_queue](const SizeUpdate &update) {
        queue->push(update);
      }),
      m_left(options.left_path, m_sizes), m_right(options.right_path, m_sizes),
      m_coordinator(TransferCommand(options.tool), options.detached_log,
                    m_queue) {
  spdlog::info("Session started: left={} right={} tool={}", m_left.path(),
               m_right.path(), options.tool);
  navigate(PanelSide::Left, m_left.path());
  navigate(PanelSide::Right, m_right.path());
}

Session::~Session() {
  m_queue->setWakeHook(nullptr);
  for (auto &listing : m_listings) {
    if (listing.valid())
      listing.wait();
  }
}

Panel &Session::panel(PanelSide side) {
  return side == PanelSide::Left ? m_left : m_right;
}

const Panel &Session::panel(PanelSide side) const {
  return side == PanelSide::Left ? m_left : m_right;
}

const Panel &Session::otherPanel() const {
  return m_active == PanelSide::Left ? m_right : m_left;
}

// ============================================================================
// COMMANDS
// ============================================================================

/**
 * @brief Executes one operator command
 *
 * While an attached job is pending or running only CancelTransfer and
 * ScrollOutput are accepted; everything else reports Blocked and leaves the
 * state untouched.
 */
Session::DispatchOutcome Session::dispatch(const Command &command) {
  if (isBlocked() && command.type != CommandType::CancelTransfer &&
      command.type != CommandType::ScrollOutput) {
    return DispatchOutcome::Blocked;
  }

  Panel &active = activePanel();

  switch (command.type) {
  case CommandType::MoveCursor:
    if (active.entries().empty())
      return DispatchOutcome::Ignored;
    active.moveCursor(command.delta);
    return DispatchOutcome::Applied;

  case CommandType::NavigateInto: {
    const Entry *entry = active.currentEntry();
    if (!entry)
      return DispatchOutcome::Ignored;
    auto target = active.intoTarget(*entry);
    if (!target)
      return DispatchOutcome::Ignored;
    navigate(m_active, *target);
    return DispatchOutcome::Applied;
  }

  case CommandType::NavigateUp: {
    auto target = active.upTarget();
    if (!target)
      return DispatchOutcome::Ignored;
    navigate(m_active, *target);
    return DispatchOutcome::Applied;
  }

  case CommandType::ToggleSelection:
    return active.toggleSelection() ? DispatchOutcome::Applied
                                    : DispatchOutcome::Ignored;

  case CommandType::SetTransferMode:
    m_transfer_mode = command.transfer_mode;
    m_status = std::string("Operation: ") + toString(m_transfer_mode);
    return DispatchOutcome::Applied;

  case CommandType::SetOutputMode:
    m_output_mode = command.output_mode;
    m_status = std::string("Output: ") + toString(m_output_mode);
    return DispatchOutcome::Applied;

  case CommandType::SetRunMode:
    m_run_mode = command.run_mode;
    m_status = std::string("Run mode: ") + toString(m_run_mode);
    return DispatchOutcome::Applied;

  case CommandType::ConfirmTransfer:
    return requestTransfer().ok() ? DispatchOutcome::Applied
                                  : DispatchOutcome::Ignored;

  case CommandType::SwitchActivePanel:
    m_active = (m_active == PanelSide::Left) ? PanelSide::Right
                                             : PanelSide::Left;
    return DispatchOutcome::Applied;

  case CommandType::ActivatePanel:
    if (m_active == command.side)
      return DispatchOutcome::Ignored;
    m_active = command.side;
    return DispatchOutcome::Applied;

  case CommandType::CancelTransfer:
    return cancelTransfer() ? DispatchOutcome::Applied
                            : DispatchOutcome::Ignored;

  case CommandType::ScrollOutput:
    scrollOutput(command.delta);
    return DispatchOutcome::Applied;

  case CommandType::RefreshPanel:
    m_sizes.invalidateTree(active.path());
    refreshPanel(m_active);
    return DispatchOutcome::Applied;

  case CommandType::Quit:
    return DispatchOutcome::Quit;
  }

  return DispatchOutcome::Ignored;
}

// ============================================================================
// NAVIGATION
// ============================================================================

void Session::navigate(PanelSide side, const std::string &target) {
  Panel &p = panel(side);

  if (!m_options.async_listing) {
    if (!p.navigateTo(target) && p.lastError()) {
      m_status = PathLister::describe(*p.lastError(), p.lastErrorTarget());
    }
    return;
  }

  if (auto request = p.requestNavigation(target))
    startListing(side, *request);
}

/**
 * @brief Lists a directory on a worker and posts the result as ListingDone
 *
 * A panel has at most one listing outstanding, so the previous worker of
 * this side has already posted its result; replacing its future only waits
 * for the thread to return.
 */
void Session::startListing(PanelSide side, const Panel::NavRequest &request) {
  auto &slot = m_listings[side == PanelSide::Left ? 0 : 1];
  if (slot.valid())
    slot.wait();

  slot = std::async(std::launch::async, [queue = m_queue, side, request]() {
    ListingDone done;
    done.side = side;
    done.target = request.target;
    done.ticket = request.ticket;
    done.result = PathLister::list(request.target);
    queue->push(std::move(done));
  });
}

void Session::refreshPanel(PanelSide side) { navigate(side, panel(side).path()); }

// ============================================================================
// NOTIFICATIONS
// ============================================================================

std::size_t Session::pollNotifications() {
  auto messages = m_queue->drain();
  for (auto &message : messages) {
    std::visit([this](auto &msg) { apply(msg); }, message);
  }
  return messages.size();
}

bool Session::waitForNotifications(std::chrono::milliseconds timeout) {
  return m_queue->waitFor(timeout);
}

void Session::setWakeHook(std::function<void()> hook) {
  m_queue->setWakeHook(std::move(hook));
}

void Session::apply(SizeUpdate &update) {
  m_left.applySizeUpdate(update);
  m_right.applySizeUpdate(update);
}

void Session::apply(ListingDone &done) {
  Panel &p = panel(done.side);
  auto next = p.completeNavigation(Panel::NavRequest{done.target, done.ticket},
                                   std::move(done.result));
  if (next) {
    startListing(done.side, *next);
    return;
  }

  if (p.navState() == Panel::NavState::Error && p.lastError() &&
      p.lastErrorTarget() == done.target) {
    m_status = PathLister::describe(*p.lastError(), done.target);
  }
}

void Session::apply(TransferStarted &started) {
  const TransferJob *job = m_coordinator.apply(started);
  if (!job)
    return;
  appendOutput("[job " + std::to_string(job->id) + "] $ " +
               started.command_line);
}

/**
 * @brief Routes one output line of an attached job
 *
 * Log mode keeps every line. Progress mode folds statistics lines into the
 * job's progress figures and keeps the remaining lines (file notices,
 * errors) in the output pane.
 */
void Session::apply(TransferOutput &output) {
  const TransferJob *job = m_coordinator.apply(output);
  if (!job)
    return;

  if (job->output_mode == OutputMode::Log || !output.is_stats)
    appendOutput(std::move(output.line));
}

void Session::apply(TransferFinished &finished) {
  const TransferJob *job = m_coordinator.apply(finished);
  if (!job)
    return;

  const std::string prefix = "Job " + std::to_string(job->id) + " ";
  switch (job->state) {
  case JobState::Succeeded:
    m_status = prefix + "finished: " + toString(job->mode) + " to " +
               job->destination + " succeeded";
    break;
  case JobState::Cancelled:
    m_status = prefix + "cancelled";
    break;
  default:
    m_status = prefix + "failed: " +
               (job->failure ? job->failure->message : "unknown reason");
    break;
  }
  appendOutput(m_status);

  refreshAfterJob(*job);
  m_coordinator.acknowledge(job->id);
}

/**
 * @brief Invalidates sizes and re-lists panels affected by a finished job
 *
 * The destination changed in every case, even a failed job may have written
 * part of the data. Sources only changed after a successful move.
 *
 * A panel is re-listed when its path is the destination, lies below it or
 * above it, or (after a move) is the parent of a source or lies inside one.
 * Panels elsewhere are left alone; they see fresh contents when they next
 * list.
 */
void Session::refreshAfterJob(const TransferJob &job) {
  const std::string destination = normalizePath(job.destination);
  m_sizes.invalidateTree(destination);

  if (job.state != JobState::Succeeded)
    return;

  std::vector<std::string> source_parents;
  if (job.mode == TransferMode::Move) {
    for (const auto &source : job.sources) {
      std::string parent = parentPath(normalizePath(source));
      m_sizes.invalidateTree(parent);
      source_parents.push_back(parent);
    }
  }

  for (PanelSide side : {PanelSide::Left, PanelSide::Right}) {
    const std::string &path = panel(side).path();
    bool affected = isSameOrDescendant(path, destination) ||
                    isSameOrDescendant(destination, path);

    if (job.mode == TransferMode::Move) {
      for (std::size_t i = 0; i < job.sources.size() && !affected; ++i) {
        affected = path == source_parents[i] ||
                   isSameOrDescendant(path, normalizePath(job.sources[i]));
      }
    }

    if (affected) {
      spdlog::debug("Re-listing {} after job {}", path, job.id);
      refreshPanel(side);
    }
  }
}

// ============================================================================
// TRANSFERS
// ============================================================================

TransferRequest Session::pendingRequest() const {
  TransferRequest request;
  const Panel &source = activePanel();

  request.sources = source.selectedPaths();
  if (request.sources.empty()) {
    if (const Entry *entry = source.currentEntry())
      request.sources.push_back(entry->getPath());
  }

  request.destination = otherPanel().path();
  request.mode = m_transfer_mode;
  request.run_mode = m_run_mode;
  request.output_mode = m_output_mode;
  return request;
}

TransferSafety::TransferCheck Session::previewCheck() const {
  TransferRequest request = pendingRequest();
  if (request.sources.empty())
    return {};
  return TransferSafety::checkTransfer(request.sources, request.destination,
                                       request.mode);
}

/**
 * @brief Validates and launches pendingRequest()
 *
 * A refused request leaves every piece of state as it was apart from the
 * status message; in particular the active transfer is not replaced.
 */
TransferCoordinator::StartResult Session::requestTransfer() {
  TransferRequest request = pendingRequest();
  auto result = m_coordinator.start(request);

  if (!result.ok()) {
    m_status = result.message;
    appendOutput("Transfer refused: " + result.message);
    return result;
  }

  m_active_job = result.job_id;
  m_output_scroll = 0;
  m_status = "Job " + std::to_string(result.job_id) + ": " +
             toString(request.mode) + " " +
             std::to_string(request.sources.size()) + " item(s) to " +
             request.destination;
  if (request.run_mode == RunMode::Detached)
    m_status += " (output: " + m_coordinator.detachedLog() + ")";
  if (!result.warning.empty()) {
    m_status += " | " + result.warning;
    appendOutput("Warning: " + result.warning);
  }
  return result;
}

bool Session::cancelTransfer() {
  auto id = m_coordinator.attachedActive();
  if (!id || !m_coordinator.cancel(*id)) {
    m_status = "No foreground transfer to cancel";
    return false;
  }
  m_status = "Cancelling job " + std::to_string(*id) + "...";
  return true;
}

const TransferJob *Session::activeTransfer() const {
  if (!m_active_job)
    return nullptr;
  return m_coordinator.job(*m_active_job);
}

bool Session::isBlocked() const {
  return m_coordinator.attachedActive().has_value();
}

bool Session::hasWorkInFlight() const {
  return m_left.navState() == Panel::NavState::Listing ||
         m_right.navState() == Panel::NavState::Listing ||
         m_sizes.inFlightCount() > 0 || isBlocked() ||
         m_coordinator.detachedRunning() > 0;
}

// ============================================================================
// OUTPUT PANE
// ============================================================================

void Session::appendOutput(std::string line) {
  m_output.push_back(std::move(line));
  while (m_output.size() > m_options.output_lines && !m_output.empty())
    m_output.pop_front();

  // Keep a scrolled-back view on the same lines while output streams in
  if (m_output_scroll > 0)
    scrollOutput(1);
}

void Session::scrollOutput(int delta) {
  const int max_scroll =
      std::max(0, static_cast<int>(m_output.size()) - 1);
  long long next = static_cast<long long>(m_output_scroll) + delta;
  m_output_scroll = static_cast<int>(std::clamp<long long>(next, 0, max_scroll));
}

// ============================================================================
// SNAPSHOT
// ============================================================================

/**
 * @brief Builds the visible window of one panel
 *
 * Same windowing as a virtualized list: the cursor is centred where
 * possible and the window is shifted back at the end of the listing.
 */
PanelView Session::makePanelView(PanelSide side, int visible_rows) const {
  const Panel &p = panel(side);
  PanelView view;
  view.path = p.path();
  view.active = (side == m_active);
  view.cursor = p.cursor();
  view.total_entries = p.entries().size();
  view.nav_state = p.navState();
  if (p.navState() == Panel::NavState::Error && p.lastError())
    view.error_message = PathLister::describe(*p.lastError(), p.lastErrorTarget());

  const int total = static_cast<int>(p.entries().size());
  const int rows = std::max(1, visible_rows);
  int start = std::max(0, p.cursor() - rows / 2);
  int end = std::min(start + rows, total);
  if (end == total)
    start = std::max(0, end - rows);
  view.first_index = start;

  view.entries.reserve(static_cast<std::size_t>(end - start));
  for (int i = start; i < end; ++i) {
    const Entry &entry = p.entries()[static_cast<std::size_t>(i)];
    EntryView row;
    row.display_name = entry.getDisplayName();
    row.path = entry.getPath();
    row.kind = entry.getKind();
    row.size_label = entry.getSizeFormatted();
    row.color_code = entry.getColorCode();
    row.selected = p.isSelected(entry);
    row.under_cursor = (i == p.cursor());
    view.entries.push_back(std::move(row));
  }

  if (!p.entries().empty()) {
    view.footer_label = formatSizeLabel(
        p.footerSize(), p.footerState() == SizeState::Calculating,
        p.footerState() == SizeState::Error);
  }
  return view;
}

SessionSnapshot Session::snapshot(int visible_rows, int output_rows) const {
  SessionSnapshot snap;
  snap.left = makePanelView(PanelSide::Left, visible_rows);
  snap.right = makePanelView(PanelSide::Right, visible_rows);
  snap.active = m_active;
  snap.transfer_mode = m_transfer_mode;
  snap.output_mode = m_output_mode;
  snap.run_mode = m_run_mode;

  if (const TransferJob *job = activeTransfer()) {
    TransferView view;
    view.job_id = job->id;
    view.mode = job->mode;
    view.run_mode = job->run_mode;
    view.output_mode = job->output_mode;
    view.state = job->state;
    view.progress = job->progress;
    view.invocations_started = job->invocations_started;
    view.invocations_total = job->invocations_total;
    view.command = job->current_command;
    if (job->failure)
      view.failure = job->failure->message;
    snap.transfer = std::move(view);
  }
  snap.detached_running = m_coordinator.detachedRunning();

  snap.selection = activePanel().selectionSummary();
  switch (snap.selection.state) {
  case SizeState::Known:
    snap.selection_label = formatBytes(snap.selection.knownBytes);
    break;
  case SizeState::Error:
    snap.selection_label =
        formatSizeLabel(snap.selection.knownBytes, false, true);
    break;
  default:
    snap.selection_label = formatSizeLabel(std::nullopt, true, false);
    break;
  }

  const int total = static_cast<int>(m_output.size());
  const int rows = std::max(0, output_rows);
  const int end = std::max(0, total - m_output_scroll);
  const int start = std::max(0, end - rows);
  for (int i = start; i < end; ++i)
    snap.output.push_back(m_output[static_cast<std::size_t>(i)]);
  snap.output_scroll = m_output_scroll;
  snap.output_total = m_output.size();

  snap.status = m_status;
  snap.blocked = isBlocked();
  snap.busy = hasWorkInFlight();
  return snap;
}
