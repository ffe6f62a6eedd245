/**
 * @file command.hpp
 * @brief Discrete operator commands accepted by the Session
 *
 * The input loop translates key presses into Command values; the Session is
 * the only place that interprets them.
 *
 * @see Session::dispatch()
 */

#ifndef COMMAND_HPP
#define COMMAND_HPP

#include "notifications.hpp"
#include "transfertypes.hpp"

/**
 * @enum CommandType
 * @brief All commands of the input contract
 */
enum class CommandType {
  MoveCursor,
  NavigateInto,
  NavigateUp,
  ToggleSelection,
  SetTransferMode,
  SetOutputMode,
  SetRunMode,
  ConfirmTransfer,
  SwitchActivePanel,
  ActivatePanel,
  CancelTransfer,
  ScrollOutput,
  RefreshPanel,
  Quit
};

/**
 * @struct Command
 * @brief A command and its argument
 *
 * Only the field matching the type is meaningful: delta for MoveCursor and
 * ScrollOutput, the mode fields for the Set*Mode commands, side for
 * ActivatePanel.
 */
struct Command {
  CommandType type = CommandType::Quit;
  int delta = 0;
  TransferMode transfer_mode = TransferMode::Copy;
  OutputMode output_mode = OutputMode::Progress;
  RunMode run_mode = RunMode::Attached;
  PanelSide side = PanelSide::Left;

  static Command moveCursor(int delta) {
    Command c{CommandType::MoveCursor};
    c.delta = delta;
    return c;
  }

  static Command navigateInto() { return Command{CommandType::NavigateInto}; }
  static Command navigateUp() { return Command{CommandType::NavigateUp}; }

  static Command toggleSelection() {
    return Command{CommandType::ToggleSelection};
  }

  static Command setTransferMode(TransferMode mode) {
    Command c{CommandType::SetTransferMode};
    c.transfer_mode = mode;
    return c;
  }

  static Command setOutputMode(OutputMode mode) {
    Command c{CommandType::SetOutputMode};
    c.output_mode = mode;
    return c;
  }

  static Command setRunMode(RunMode mode) {
    Command c{CommandType::SetRunMode};
    c.run_mode = mode;
    return c;
  }

  static Command confirmTransfer() {
    return Command{CommandType::ConfirmTransfer};
  }

  static Command switchActivePanel() {
    return Command{CommandType::SwitchActivePanel};
  }

  static Command activatePanel(PanelSide side) {
    Command c{CommandType::ActivatePanel};
    c.side = side;
    return c;
  }

  static Command cancelTransfer() {
    return Command{CommandType::CancelTransfer};
  }

  static Command scrollOutput(int delta) {
    Command c{CommandType::ScrollOutput};
    c.delta = delta;
    return c;
  }

  static Command refreshPanel() { return Command{CommandType::RefreshPanel}; }
  static Command quit() { return Command{CommandType::Quit}; }
};

#endif // COMMAND_HPP
