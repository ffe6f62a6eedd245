/**
 * @file dualpanelui.cpp
 * @brief Implementation of the DualPanelUI class
 *
 * Key implementation areas:
 * - Session wiring (wake hook, notification draining)
 * - Panel, output pane, legend and status bar rendering
 * - Keyboard handling and the transfer confirmation dialog
 * - Animation thread management
 *
 * @see DualPanelUI
 * @see dualpanelui.hpp
 */

#include "dualpanelui.hpp"
#include "utils.hpp"

#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

SessionOptions toSessionOptions(const AppConfig &config) {
  SessionOptions options;
  options.left_path = config.left_path;
  options.right_path = config.right_path;
  options.tool = config.tool;
  options.detached_log = config.detached_log;
  options.output_lines = config.output_lines;
  options.async_listing = true;
  return options;
}

Color colorFor(int code) {
  switch (code) {
  case 1:
    return Color::Red;
  case 2:
    return Color::Green;
  case 4:
    return Color::Blue;
  default:
    return Color::White;
  }
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

const std::vector<std::string> &spinnerFrames() {
  static const std::vector<std::string> frames = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                  "⠴", "⠦", "⠧", "⠇", "⠏"};
  return frames;
}

} // namespace

DualPanelUI::DualPanelUI(const AppConfig &config)
    : m_session(toSessionOptions(config)) {}

DualPanelUI::~DualPanelUI() {
  stopAnimation();

  // FTXUI leaves the last frame on screen; print where background output
  // goes so it is not lost
  if (m_session.coordinator().detachedRunning() > 0) {
    std::cout << "Background transfers still running, output: "
              << m_session.coordinator().detachedLog() << std::endl;
  }
}

// ============================================================================
// SETUP AND MAIN LOOP
// ============================================================================

/**
 * @brief Builds the component tree and installs the wake hook
 *
 * The hook runs on worker threads; PostEvent is the thread-safe way into
 * the screen loop.
 */
void DualPanelUI::initialize() {
  m_session.setWakeHook([this] { m_screen.PostEvent(Event::Custom); });

  auto renderer = Renderer([this] { return render(); });
  m_document = CatchEvent(renderer, [this](Event event) {
    bool handled = handleEvent(event);
    updateAnimation();
    return handled;
  });
}

void DualPanelUI::run() {
  // Listings started by the Session constructor may have finished already
  m_session.pollNotifications();
  updateAnimation();
  m_screen.Loop(m_document);
}

// ============================================================================
// INPUT
// ============================================================================

bool DualPanelUI::handleEvent(Event event) {
  if (event == Event::Custom) {
    m_session.pollNotifications();
    return true;
  }

  // Commands act on the newest state
  m_session.pollNotifications();

  if (m_dialog_active)
    return handleDialogEvent(event);

  if (event == Event::ArrowUp) {
    dispatch(Command::moveCursor(-1));
  } else if (event == Event::ArrowDown) {
    dispatch(Command::moveCursor(1));
  } else if (event == Event::ArrowLeft) {
    dispatch(Command::activatePanel(PanelSide::Left));
  } else if (event == Event::ArrowRight) {
    dispatch(Command::activatePanel(PanelSide::Right));
  } else if (event == Event::Tab) {
    dispatch(Command::switchActivePanel());
  } else if (event == Event::Return) {
    dispatch(Command::navigateInto());
  } else if (event == Event::Backspace) {
    dispatch(Command::navigateUp());
  } else if (event == Event::PageUp) {
    dispatch(Command::scrollOutput(5));
  } else if (event == Event::PageDown) {
    dispatch(Command::scrollOutput(-5));
  } else if (event.is_character() && event.character().size() == 1) {
    return handleShortcut(event.character()[0]);
  } else {
    return false;
  }
  return true;
}

void DualPanelUI::dispatch(const Command &command) {
  if (m_session.dispatch(command) == Session::DispatchOutcome::Quit)
    m_screen.Exit();
}

/**
 * @brief Maps a character shortcut to a command
 *
 * Supported shortcuts are listed in ActionMap. 'r' opens the confirmation
 * dialog instead of dispatching ConfirmTransfer directly.
 */
bool DualPanelUI::handleShortcut(char key) {
  ActionID action;
  if (!findAction(key, action))
    return false;

  switch (action) {
  case ActionID::ToggleSelection:
    dispatch(Command::toggleSelection());
    break;
  case ActionID::SelectCopy:
    dispatch(Command::setTransferMode(TransferMode::Copy));
    break;
  case ActionID::SelectMove:
    dispatch(Command::setTransferMode(TransferMode::Move));
    break;
  case ActionID::SelectProgress:
    dispatch(Command::setOutputMode(OutputMode::Progress));
    break;
  case ActionID::SelectLog:
    dispatch(Command::setOutputMode(OutputMode::Log));
    break;
  case ActionID::SelectAttached:
    dispatch(Command::setRunMode(RunMode::Attached));
    break;
  case ActionID::SelectDetached:
    dispatch(Command::setRunMode(RunMode::Detached));
    break;
  case ActionID::RunTransfer:
    if (!m_session.isBlocked())
      showTransferConfirmation();
    break;
  case ActionID::CancelTransfer:
    dispatch(Command::cancelTransfer());
    break;
  case ActionID::Refresh:
    dispatch(Command::refreshPanel());
    break;
  case ActionID::Quit:
    dispatch(Command::quit());
    break;
  }
  return true;
}

void DualPanelUI::showTransferConfirmation() {
  m_dialog_request = m_session.pendingRequest();
  m_dialog_check = m_session.previewCheck();

  if (m_dialog_request.sources.empty() || m_dialog_check.blocked()) {
    dispatch(Command::confirmTransfer());
    return;
  }

  m_dialog_size = m_session.snapshot(1, 0).selection_label;
  if (m_session.activePanel().selectedPaths().empty()) {
    // Cursor fallback: the footer holds the size of that entry
    const Panel &panel = m_session.activePanel();
    m_dialog_size =
        formatSizeLabel(panel.footerSize(),
                        panel.footerState() == SizeState::Calculating,
                        panel.footerState() == SizeState::Error);
  }
  m_dialog_active = true;
}

bool DualPanelUI::handleDialogEvent(const Event &event) {
  if (event == Event::Character('y') || event == Event::Character('Y')) {
    m_dialog_active = false;
    dispatch(Command::confirmTransfer());
    return true;
  }
  if (event == Event::Character('n') || event == Event::Character('N') ||
      event == Event::Escape) {
    m_dialog_active = false;
    return true;
  }
  // Modal: swallow everything else
  return true;
}

// ============================================================================
// RENDERING
// ============================================================================

/**
 * @brief Renders one frame
 *
 * Layout (top to bottom): both panels side by side (about two thirds of
 * the height), output pane, legend, status bar. The confirmation dialog is
 * drawn on top when open.
 */
Element DualPanelUI::render() {
  const int height = Terminal::Size().dimy;
  const int panel_height = std::max(10, height * 2 / 3);
  const int panel_rows = std::max(3, panel_height - 6);
  const int output_rows = std::max(1, height - panel_height - 4);

  SessionSnapshot snap = m_session.snapshot(panel_rows, output_rows);
  if (snap.busy)
    m_frame = (m_frame + 1) % spinnerFrames().size();

  auto panels =
      hbox({renderPanel(snap.left, "Left", panel_rows) | flex,
            renderPanel(snap.right, "Right", panel_rows) | flex}) |
      size(HEIGHT, EQUAL, panel_height);

  auto document = vbox({panels, renderOutput(snap, output_rows) | flex,
                        renderLegend(), renderStatusBar(snap)});

  if (m_dialog_active)
    return dbox({document, renderDialog() | clear_under | center});
  return document;
}

/**
 * @brief Renders one panel column
 *
 * Rows show the selection marker, the display name coloured by kind and
 * the size label right-aligned. The cursor row is inverted in the active
 * panel and underlined in the other one.
 */
Element DualPanelUI::renderPanel(const PanelView &view,
                                 const std::string &title, int rows) {
  std::string path_display = title + ": " + view.path;
  if (view.total_entries > static_cast<std::size_t>(rows)) {
    path_display += " [" + std::to_string(view.cursor + 1) + "/" +
                    std::to_string(view.total_entries) + "]";
  }

  Elements lines;
  if (view.nav_state == Panel::NavState::Listing) {
    lines.push_back(hbox({text(spinnerFrames()[m_frame]) | color(Color::Cyan),
                          text(" Listing...") | color(Color::GrayLight)}));
  }

  for (const auto &entry : view.entries) {
    auto name = text(std::string(entry.selected ? "*" : " ") + " " +
                     entry.display_name) |
                color(colorFor(entry.color_code));
    auto row = hbox({name | flex, text(" "),
                     text(entry.size_label) | color(Color::GrayLight)});
    if (entry.under_cursor)
      row = view.active ? (row | inverted | bold) : (row | underlined);
    lines.push_back(row);
  }

  if (view.entries.empty() && view.nav_state != Panel::NavState::Listing)
    lines.push_back(text("(empty)") | dim);

  Elements footer;
  if (!view.error_message.empty())
    footer.push_back(text(view.error_message) | color(Color::Red));
  footer.push_back(text("Size: " + view.footer_label));

  auto title_element = text(path_display) | bold;
  if (view.active)
    title_element = title_element | color(Color::Green);

  return vbox({title_element, separator(),
               vbox(std::move(lines)) | frame | size(HEIGHT, EQUAL, rows),
               filler(), separator(), vbox(std::move(footer))}) |
         (view.active ? borderStyled(BorderStyle::HEAVY) : border);
}

Element DualPanelUI::renderOutput(const SessionSnapshot &snap, int rows) {
  Elements lines;
  for (const auto &line : snap.output)
    lines.push_back(text(line));
  while (static_cast<int>(lines.size()) < rows)
    lines.push_back(text(""));

  std::string title = " Output ";
  if (snap.output_scroll > 0)
    title += "(-" + std::to_string(snap.output_scroll) + ") ";
  return window(text(title), vbox(std::move(lines)));
}

Element DualPanelUI::renderLegend() {
  Elements items = {text("Controls: ") | bold};
  auto entries = getLegendEntries();
  for (std::size_t i = 0; i < entries.size(); ++i) {
    items.push_back(text(entries[i].first) | bold);
    items.push_back(text(";"));
    items.push_back(text(entries[i].second) | color(Color::Cyan));
    if (i + 1 != entries.size())
      items.push_back(text(" | "));
  }
  return hbox(std::move(items));
}

/**
 * @brief Renders the status bar
 *
 * First line: selection count and size, operation (green copy / red move),
 * output mode, run mode, the shown job and the number of background jobs.
 * Second line: the session's status message, or a hint while input is
 * blocked by a foreground transfer.
 */
Element DualPanelUI::renderStatusBar(const SessionSnapshot &snap) {
  Elements items = {
      text("Selected: " + std::to_string(snap.selection.count) +
           " | Total size: " + snap.selection_label + " | "),
      text("Op: " + upper(toString(snap.transfer_mode)) + " ") |
          color(snap.transfer_mode == TransferMode::Copy ? Color::Green
                                                         : Color::Red),
      text("| Out: " + upper(toString(snap.output_mode)) + " ") |
          color(Color::Cyan),
      text("| Mode: " + upper(toString(snap.run_mode))) |
          color(Color::Yellow)};

  if (snap.transfer) {
    const TransferView &job = *snap.transfer;
    std::string label = " | Job " + std::to_string(job.job_id) + ": " +
                        toString(job.state);
    if (job.state == JobState::Running) {
      if (job.invocations_total > 1) {
        label += " [" + std::to_string(job.invocations_started) + "/" +
                 std::to_string(job.invocations_total) + "]";
      }
      if (job.output_mode == OutputMode::Progress &&
          job.progress.bytes_total > 0) {
        label += " " + std::to_string(job.progress.percent) + "% " +
                 formatBytes(job.progress.bytes_done) + "/" +
                 formatBytes(job.progress.bytes_total);
        if (!job.progress.rate.empty())
          label += " " + job.progress.rate;
        if (!job.progress.eta.empty())
          label += " ETA " + job.progress.eta;
      }
    }
    items.push_back(text(label) | color(job.state == JobState::Failed
                                            ? Color::Red
                                            : Color::White));
  }

  if (snap.detached_running > 0)
    items.push_back(text(" | BG: " + std::to_string(snap.detached_running)) |
                    color(Color::Magenta));

  if (snap.busy)
    items.push_back(text(" " + spinnerFrames()[m_frame]) | color(Color::Cyan));

  std::string status = snap.status;
  if (snap.blocked)
    status = "Foreground transfer running, press 'x' to cancel. " + status;

  return vbox({hbox(std::move(items)),
               text("STATUS: " + status) | color(Color::GrayLight)});
}

/**
 * @brief Renders the transfer confirmation dialog
 *
 * Dialog contents:
 * - Operation and item count (green copy / red move)
 * - Up to five source paths (yellow), then a count of the rest
 * - Destination, size, output and run mode
 * - Removable media warning (magenta) if applicable
 * - Instructions: 'y' to confirm, 'n' or ESC to cancel
 */
Element DualPanelUI::renderDialog() {
  const TransferRequest &req = m_dialog_request;
  const bool copy = (req.mode == TransferMode::Copy);
  std::string headline = upper(toString(req.mode)) + " " +
                         std::to_string(req.sources.size()) + " ITEM(S)?";

  Elements content = {
      text(headline) | bold | color(copy ? Color::Green : Color::Red) |
          hcenter,
      separator()};

  const std::size_t shown = std::min<std::size_t>(req.sources.size(), 5);
  for (std::size_t i = 0; i < shown; ++i)
    content.push_back(text("From: " + req.sources[i]) | color(Color::Yellow));
  if (req.sources.size() > shown) {
    content.push_back(
        text("      ... and " + std::to_string(req.sources.size() - shown) +
             " more"));
  }

  content.push_back(text("To:   " + req.destination) | color(Color::Yellow));
  content.push_back(text("Size: " + m_dialog_size));
  content.push_back(text(std::string("Output: ") + toString(req.output_mode) +
                         ", " + toString(req.run_mode)));

  if (m_dialog_check.status ==
      TransferSafety::TransferStatus::WarningRemovableMedia) {
    content.push_back(separator());
    content.push_back(text(TransferSafety::getStatusMessage(
                          m_dialog_check.status, m_dialog_check.path)) |
                      color(Color::Magenta) | bold);
  }

  content.push_back(separator());
  content.push_back(
      hbox({text("Press ") | color(Color::GrayLight),
            text("'y'") | bold | color(Color::Green),
            text(" to confirm, ") | color(Color::GrayLight),
            text("'n'") | bold | color(Color::Red),
            text(" or ") | color(Color::GrayLight), text("ESC") | bold,
            text(" to cancel") | color(Color::GrayLight)}) |
      hcenter);

  return vbox(std::move(content)) | border;
}

// ============================================================================
// ANIMATION THREAD
// ============================================================================

void DualPanelUI::updateAnimation() {
  bool busy = m_session.hasWorkInFlight();
  if (busy && !m_animating)
    startAnimation();
  else if (!busy && m_animating)
    stopAnimation();
}

/**
 * @brief Starts the animation thread
 *
 * The thread requests a frame every 80ms so the spinner turns while
 * nothing else wakes the screen.
 */
void DualPanelUI::startAnimation() {
  if (m_animating)
    return;

  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(80));
      if (m_animating) {
        m_screen.RequestAnimationFrame();
      }
    }
  });
}

void DualPanelUI::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable()) {
    m_animation_thread.join();
  }

  // Redraw once more so the last spinner frame does not stay visible
  m_screen.RequestAnimationFrame();
}
