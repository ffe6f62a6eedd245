#include "config.hpp"
#include "dualpanelui.hpp"
#include "logging.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "dualsync-tui";

  AppConfig config;
  try {
    config = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const ConfigError &e) {
    std::cerr << program << ": " << e.what() << "\n\n" << usage(program);
    return 2;
  }

  if (config.show_help) {
    std::cout << usage(program);
    return 0;
  }

  if (!initLogging(config.log_file, config.verbose)) {
    std::cerr << program << ": cannot open log file " << config.log_file
              << ", logging disabled" << std::endl;
  }

  try {
    DualPanelUI ui(config);
    ui.initialize();
    ui.run();
  } catch (const std::exception &e) {
    // The screen has been restored by the time the exception gets here
    spdlog::critical("Terminated: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  spdlog::info("Session ended");
  spdlog::shutdown();
  return 0;
}
