/**
 * @file logging.hpp
 * @brief Set-up of the diagnostics logger
 *
 * The terminal belongs to the UI, so diagnostics never go to stdout or
 * stderr while it runs. The default spdlog logger is replaced by one that
 * writes to a file.
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

/**
 * @brief Installs the default logger
 *
 * Creates the parent directory of @p log_file if needed. When the file
 * cannot be opened a logger with a null sink is installed instead and
 * false is returned; logging problems never stop the program.
 *
 * @param log_file Diagnostics log, appended to
 * @param verbose Log level debug instead of info
 * @return true if logging to the file
 */
bool initLogging(const std::string &log_file, bool verbose);

#endif // LOGGING_HPP
