/**
 * @file config.hpp
 * @brief Command-line and environment configuration of the application
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @struct AppConfig
 * @brief Resolved start-up settings
 *
 * Every path is filled in after parseArguments(); empty values never reach
 * the Session.
 */
struct AppConfig {
  std::string left_path;
  std::string right_path;
  std::string tool;
  std::string detached_log;
  std::string log_file;
  std::size_t output_lines = 2000;
  bool verbose = false;
  bool show_help = false;
};

/**
 * @brief Invalid command line (unknown flag, missing or malformed value)
 */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** @brief Environment accessor, replaceable in tests */
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

/** @brief Reads the process environment */
std::optional<std::string> processEnv(const std::string &name);

/**
 * @brief Directory for logs: $XDG_STATE_HOME/dualsync, else
 * $HOME/.local/state/dualsync, else /tmp/dualsync
 */
std::string stateDirectory(const EnvLookup &env);

/**
 * @brief Parses the arguments after the program name
 *
 * Flags:
 * - `-l, --left PATH`, `-r, --right PATH`: start paths (default: current
 *   directory)
 * - `-t, --tool PATH`: transfer tool (default $DUALSYNC_TOOL, else rclone)
 * - `--detached-log FILE`: output of detached jobs
 * - `--log FILE`: diagnostics log
 * - `--output-lines N`: output pane capacity, N > 0
 * - `-v, --verbose`, `-h, --help`
 *
 * @throws ConfigError on unknown flags or bad values
 */
AppConfig parseArguments(const std::vector<std::string> &args,
                         const EnvLookup &env = processEnv);

/** @brief Help text printed for -h and usage errors */
std::string usage(const std::string &program);

#endif // CONFIG_HPP
