/**
 * @file uicontrol.hpp
 * @brief Keyboard shortcut mappings and legend of the dual-panel UI
 *
 * Character shortcuts are kept in one table (ActionMap) that drives both
 * key handling and the legend line. Navigation keys without a character
 * (arrows, Enter, ...) only appear in the legend.
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Shortcut key and legend text of one action
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut for this action */
  char m_shortcut;

  /** @brief Legend text, e.g. "Copy" */
  std::string m_menu_title;
};

/**
 * @enum ActionID
 * @brief Actions reachable through a character key
 *
 * Shortcuts are case-sensitive: 'r' runs a transfer, 'R' refreshes.
 */
enum class ActionID {
  /** @brief Add/remove the entry under the cursor (shortcut: ' ') */
  ToggleSelection,

  /** @brief Operation copy (shortcut: 'c') */
  SelectCopy,

  /** @brief Operation move (shortcut: 'm') */
  SelectMove,

  /** @brief Structured progress output (shortcut: 'p') */
  SelectProgress,

  /** @brief Raw log output (shortcut: 'l') */
  SelectLog,

  /** @brief Foreground transfers (shortcut: 'a') */
  SelectAttached,

  /** @brief Background transfers (shortcut: 'd') */
  SelectDetached,

  /** @brief Confirm and start a transfer (shortcut: 'r') */
  RunTransfer,

  /** @brief Cancel the foreground transfer (shortcut: 'x') */
  CancelTransfer,

  /** @brief Re-list the active panel (shortcut: 'R') */
  Refresh,

  /** @brief Quit the application (shortcut: 'q') */
  Quit
};

inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::ToggleSelection, {' ', "Select"}},
    {ActionID::SelectCopy, {'c', "Copy"}},
    {ActionID::SelectMove, {'m', "Move"}},
    {ActionID::SelectProgress, {'p', "Progress"}},
    {ActionID::SelectLog, {'l', "Log"}},
    {ActionID::SelectAttached, {'a', "Attached"}},
    {ActionID::SelectDetached, {'d', "Detached"}},
    {ActionID::RunTransfer, {'r', "Run"}},
    {ActionID::CancelTransfer, {'x', "Cancel"}},
    {ActionID::Refresh, {'R', "Refresh"}},
    {ActionID::Quit, {'q', "Quit"}}};

/**
 * @brief Looks up the action bound to a character
 * @return true and sets @p id if @p key is a shortcut
 */
inline bool findAction(char key, ActionID &id) {
  for (const auto &[action, info] : ActionMap) {
    if (info.m_shortcut == key) {
      id = action;
      return true;
    }
  }
  return false;
}

/**
 * @brief Legend entries as (key, action) pairs, navigation keys first
 */
inline std::vector<std::pair<std::string, std::string>> getLegendEntries() {
  std::vector<std::pair<std::string, std::string>> entries = {
      {"↑↓", "Navigate"}, {"←→/Tab", "Switch"}, {"Enter", "Open"},
      {"Backspace", "Up"}, {"PgUp/PgDn", "Scroll"}};
  entries.reserve(entries.size() + ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    std::string key = info.m_shortcut == ' ' ? std::string("Space")
                                             : std::string(1, info.m_shortcut);
    entries.emplace_back(key, info.m_menu_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
