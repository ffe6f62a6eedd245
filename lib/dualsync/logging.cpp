/**
 * @file logging.cpp
 * @brief Implementation of the logger set-up
 */

#include "logging.hpp"

#include <filesystem>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

bool initLogging(const std::string &log_file, bool verbose) {
  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  std::shared_ptr<spdlog::logger> logger;
  bool to_file = true;

  try {
    std::error_code ec;
    auto parent = std::filesystem::path(log_file).parent_path();
    if (!parent.empty())
      std::filesystem::create_directories(parent, ec);

    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    logger = std::make_shared<spdlog::logger>("dualsync", std::move(sink));
  } catch (const spdlog::spdlog_ex &) {
    logger = std::make_shared<spdlog::logger>(
        "dualsync", std::make_shared<spdlog::sinks::null_sink_mt>());
    to_file = false;
  }

  logger->set_level(level);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return to_file;
}
