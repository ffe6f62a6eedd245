/**
 * @file dualpanelui.hpp
 * @brief Dual-panel terminal front end using FTXUI
 *
 * This header defines the DualPanelUI class which draws a Session snapshot
 * and turns key presses into Session commands.
 *
 * Key features:
 * - Two panel columns with selection markers and size labels
 * - Output pane for transfer output, scrollable with PgUp/PgDn
 * - Legend and status bar (selection, modes, job progress)
 * - Confirmation dialog before a transfer is started
 * - Spinner animation while listings, size walks or jobs are running
 *
 * @see Session
 * @see UIControl
 */

#ifndef DUALPANELUI_HPP
#define DUALPANELUI_HPP

#include "config.hpp"
#include "session.hpp"
#include "uicontrol.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace ftxui;

/**
 * @class DualPanelUI
 * @brief Fullscreen FTXUI application around one Session
 *
 * Architecture:
 * - Worker notifications wake the screen loop with Event::Custom; the loop
 *   thread drains them through Session::pollNotifications()
 * - Every frame renders a fresh SessionSnapshot sized to the terminal
 * - The screen is declared before the session so the session (and with it
 *   the wake hook) is gone before the screen is destroyed
 */
class DualPanelUI {
private:
  // ===== Screen and Session =====

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  Session m_session;

  /** @brief Root component: renderer plus key handler */
  Component m_document;

  // ===== Dialog State =====

  /** @brief A transfer confirmation dialog is shown */
  bool m_dialog_active = false;

  /** @brief Request captured when the dialog was opened */
  TransferRequest m_dialog_request;

  /** @brief Safety verdict of m_dialog_request */
  TransferSafety::TransferCheck m_dialog_check;

  /** @brief Selection size label captured when the dialog was opened */
  std::string m_dialog_size;

  // ===== Animation Thread =====

  /** @brief Background thread requesting frames while work is running */
  std::thread m_animation_thread;

  /** @brief Thread-safe flag indicating if animation is currently running */
  std::atomic<bool> m_animating{false};

  /** @brief Spinner frame, advanced once per rendered frame while busy */
  std::size_t m_frame = 0;

  // ===== Rendering =====

  Element render();
  Element renderPanel(const PanelView &view, const std::string &title,
                      int rows);
  Element renderOutput(const SessionSnapshot &snap, int rows);
  Element renderLegend();
  Element renderStatusBar(const SessionSnapshot &snap);
  Element renderDialog();

  // ===== Input =====

  /**
   * @brief Handles every event reaching the root component
   * @return true if the event was consumed
   */
  bool handleEvent(Event event);

  /** @brief Forwards a command and reacts to Quit */
  void dispatch(const Command &command);

  /** @brief Maps a character shortcut to a command */
  bool handleShortcut(char key);

  /**
   * @brief Opens the confirmation dialog for the pending transfer
   *
   * Requests that cannot start (nothing selected, blocked by a safety
   * check) are dispatched right away so the refusal is reported the usual
   * way, without a dialog.
   */
  void showTransferConfirmation();

  /** @brief Handles keys while the confirmation dialog is open */
  bool handleDialogEvent(const Event &event);

  // ===== Animation =====

  /** @brief Starts or stops the spinner to match the session's work */
  void updateAnimation();
  void startAnimation();
  void stopAnimation();

public:
  explicit DualPanelUI(const AppConfig &config);

  /**
   * @brief Stops the animation thread; the session then cancels any
   * attached job while detached jobs keep running
   */
  ~DualPanelUI();

  DualPanelUI(const DualPanelUI &) = delete;
  DualPanelUI &operator=(const DualPanelUI &) = delete;

  /** @brief Builds the component tree and installs the wake hook */
  void initialize();

  /** @brief Runs the screen loop until the operator quits */
  void run();
};

#endif // DUALPANELUI_HPP
