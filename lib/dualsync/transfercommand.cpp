/**
 * @file transfercommand.cpp
 * @brief Implementation of command-line building and progress parsing
 */

#include "transfercommand.hpp"
#include "pathutils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <regex>

namespace fs = std::filesystem;

std::string Invocation::commandLine() const {
  std::string line;
  for (const auto &arg : argv) {
    if (!line.empty())
      line += ' ';
    if (arg.find(' ') != std::string::npos)
      line += "'" + arg + "'";
    else
      line += arg;
  }
  return line;
}

std::vector<Invocation>
TransferCommand::build(const TransferRequest &request) const {
  std::vector<Invocation> invocations;
  invocations.reserve(request.sources.size());
  for (const auto &source : request.sources) {
    invocations.push_back(buildOne(source, request.destination, request.mode,
                                   request.output_mode));
  }
  return invocations;
}

/**
 * @brief Builds a single invocation
 *
 * The source kind decides the target: a directory is copied into a
 * directory of the same name below the destination, a file directly into
 * the destination.
 */
Invocation TransferCommand::buildOne(const std::string &source,
                                     const std::string &destination,
                                     TransferMode mode,
                                     OutputMode output) const {
  std::error_code ec;
  const bool is_dir = fs::is_directory(source, ec);

  Invocation inv;
  inv.source = normalizePath(source);
  inv.target = is_dir ? normalizePath(fs::path(destination) /
                                      fs::path(inv.source).filename())
                      : normalizePath(destination);

  inv.argv = {m_tool, toString(mode), inv.source, inv.target};

  if (output == OutputMode::Progress) {
    inv.argv.push_back("--stats=1s");
    inv.argv.push_back("--stats-one-line");
    inv.argv.push_back("-v");
  } else {
    inv.argv.push_back("-vv");
  }

  if (mode == TransferMode::Move && is_dir) {
    inv.argv.push_back("--delete-empty-src-dirs");
  }

  return inv;
}

// ============================================================================
// PROGRESS PARSING
// ============================================================================

ProgressParser::LineKind ProgressParser::feed(const std::string &line) {
  // Stats figures directly follow "Transferred:" or the log level prefix
  static const std::regex stats_re(
      R"((?:^\s*Transferred:|(?:INFO|NOTICE)\s*:)\s*)"
      R"(([0-9.]+\s*[KMGTPE]?i?B)\s*/\s*([0-9.]+\s*[KMGTPE]?i?B),\s*(-|[0-9]+)%?)"
      R"((?:,\s*([^,]+?/s))?(?:,\s*ETA\s*(\S+))?)");
  static const std::regex copied_re(
      R"((?:INFO|NOTICE)\s*:\s*(.+?):\s+(?:Copied|Moved))");
  static const std::regex file_line_re(R"(^\s*\*\s+(.+?):\s+[0-9]+%)");

  std::smatch m;
  if (std::regex_search(line, m, copied_re)) {
    m_current.current_file = m[1].str();
    return LineKind::FileNotice;
  }

  if (std::regex_search(line, m, file_line_re)) {
    m_current.current_file = m[1].str();
    return LineKind::FileNotice;
  }

  if (std::regex_search(line, m, stats_re)) {
    auto done = parseSize(m[1].str());
    auto total = parseSize(m[2].str());
    if (!done || !total)
      return LineKind::Other;

    m_current.bytes_done = *done;
    m_current.bytes_total = *total;
    m_current.percent = 0;
    if (m[3].str() != "-") {
      long percent = std::strtol(m[3].str().c_str(), nullptr, 10);
      m_current.percent = static_cast<int>(std::clamp(percent, 0L, 100L));
    }
    m_current.rate = m[4].matched ? m[4].str() : "";
    m_current.eta = m[5].matched ? m[5].str() : "";
    return LineKind::Stats;
  }

  return LineKind::Other;
}

std::optional<std::uint64_t> ProgressParser::parseSize(const std::string &text) {
  static const std::regex size_re(R"(^\s*([0-9]+(?:\.[0-9]+)?)\s*([KMGTPEkmgtpe]?)(i?)([Bb]?)\s*$)");

  std::smatch m;
  if (!std::regex_match(text, m, size_re))
    return std::nullopt;

  double value = std::strtod(m[1].str().c_str(), nullptr);
  int exponent = 0;
  if (m[2].matched && !m[2].str().empty()) {
    switch (std::toupper(static_cast<unsigned char>(m[2].str()[0]))) {
    case 'K':
      exponent = 1;
      break;
    case 'M':
      exponent = 2;
      break;
    case 'G':
      exponent = 3;
      break;
    case 'T':
      exponent = 4;
      break;
    case 'P':
      exponent = 5;
      break;
    case 'E':
      exponent = 6;
      break;
    default:
      break;
    }
  }

  double bytes = value * std::pow(1024.0, exponent);
  if (!std::isfinite(bytes) ||
      bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
    return std::nullopt;
  return static_cast<std::uint64_t>(std::llround(bytes));
}
