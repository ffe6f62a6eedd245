/**
 * @file config.cpp
 * @brief Implementation of the argument parser
 */

#include "config.hpp"

#include <cstdlib>
#include <filesystem>

namespace {

std::string requireValue(const std::vector<std::string> &args, std::size_t &i) {
  if (i + 1 >= args.size() || args[i + 1].empty())
    throw ConfigError("option " + args[i] + " requires a value");
  return args[++i];
}

std::size_t parseCount(const std::string &flag, const std::string &text) {
  std::size_t pos = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &pos);
  } catch (const std::exception &) {
    throw ConfigError("option " + flag + " expects a number, got '" + text +
                      "'");
  }
  if (pos != text.size() || value == 0 || text[0] == '-')
    throw ConfigError("option " + flag + " expects a positive number, got '" +
                      text + "'");
  return static_cast<std::size_t>(value);
}

} // namespace

std::optional<std::string> processEnv(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (!value || *value == '\0')
    return std::nullopt;
  return std::string(value);
}

std::string stateDirectory(const EnvLookup &env) {
  if (auto state = env("XDG_STATE_HOME"))
    return (std::filesystem::path(*state) / "dualsync").string();
  if (auto home = env("HOME"))
    return (std::filesystem::path(*home) / ".local" / "state" / "dualsync")
        .string();
  return "/tmp/dualsync";
}

AppConfig parseArguments(const std::vector<std::string> &args,
                         const EnvLookup &env) {
  AppConfig config;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-l" || arg == "--left") {
      config.left_path = requireValue(args, i);
    } else if (arg == "-r" || arg == "--right") {
      config.right_path = requireValue(args, i);
    } else if (arg == "-t" || arg == "--tool") {
      config.tool = requireValue(args, i);
    } else if (arg == "--detached-log") {
      config.detached_log = requireValue(args, i);
    } else if (arg == "--log") {
      config.log_file = requireValue(args, i);
    } else if (arg == "--output-lines") {
      config.output_lines = parseCount(arg, requireValue(args, i));
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      config.show_help = true;
    } else {
      throw ConfigError("unknown option '" + arg + "'");
    }
  }

  if (config.left_path.empty() || config.right_path.empty()) {
    std::error_code ec;
    std::string cwd = std::filesystem::current_path(ec).string();
    if (ec)
      cwd = "/";
    if (config.left_path.empty())
      config.left_path = cwd;
    if (config.right_path.empty())
      config.right_path = cwd;
  }

  if (config.tool.empty())
    config.tool = env("DUALSYNC_TOOL").value_or("rclone");

  const std::string state_dir = stateDirectory(env);
  if (config.detached_log.empty())
    config.detached_log = state_dir + "/transfers.log";
  if (config.log_file.empty())
    config.log_file = state_dir + "/dualsync.log";

  return config;
}

std::string usage(const std::string &program) {
  return "Usage: " + program +
         " [options]\n"
         "\n"
         "  -l, --left PATH         start directory of the left panel\n"
         "  -r, --right PATH        start directory of the right panel\n"
         "  -t, --tool PATH         transfer tool (default: $DUALSYNC_TOOL "
         "or rclone)\n"
         "      --detached-log FILE output of background transfers\n"
         "      --log FILE          diagnostics log\n"
         "      --output-lines N    lines kept in the output pane (default "
         "2000)\n"
         "  -v, --verbose           debug logging\n"
         "  -h, --help              show this help\n";
}
