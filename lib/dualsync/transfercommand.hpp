/**
 * @file transfercommand.hpp
 * @brief Translation of a transfer request into tool invocations, and
 * parsing of the tool's statistics output
 */

#ifndef TRANSFERCOMMAND_HPP
#define TRANSFERCOMMAND_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "transfertypes.hpp"

/**
 * @struct Invocation
 * @brief One run of the external tool: argv[0] is the tool
 */
struct Invocation {
  std::string source;
  std::string target;
  std::vector<std::string> argv;

  /** @brief argv joined with spaces, for logs and the output pane */
  std::string commandLine() const;
};

/**
 * @class TransferCommand
 * @brief Builds rclone-style command lines
 *
 * One invocation per source:
 * `<tool> copy|move <source> <target> <flags>` where target is
 * destination/basename(source) for directories (the directory name is
 * preserved) and the destination itself for files.
 *
 * Flags:
 * - Progress: `--stats=1s --stats-one-line -v`
 * - Log: `-vv`
 * - Moving a directory: `--delete-empty-src-dirs`
 */
class TransferCommand {
public:
  explicit TransferCommand(std::string tool) : m_tool(std::move(tool)) {}

  const std::string &tool() const { return m_tool; }

  std::vector<Invocation> build(const TransferRequest &request) const;

  Invocation buildOne(const std::string &source, const std::string &destination,
                      TransferMode mode, OutputMode output) const;

private:
  std::string m_tool;
};

/**
 * @class ProgressParser
 * @brief Extracts progress figures from the tool's output lines
 *
 * Recognized forms:
 * - one-line stats: `... INFO  :  1.500 MiB / 10 MiB, 15%, 512 KiB/s, ETA 16s`
 * - stats block: `Transferred:   1.500 MiB / 10 MiB, 15%, 512 KiB/s, ETA 16s`
 * - per-file notices: `... INFO  : dir/file.bin: Copied (new)`
 *
 * The parser keeps the last figures, so a file notice and a stats line
 * combine into one ProgressInfo.
 */
class ProgressParser {
public:
  enum class LineKind { Other, Stats, FileNotice };

  /**
   * @brief Feeds one line
   * @return What the line was; Other leaves the figures untouched
   */
  LineKind feed(const std::string &line);

  const ProgressInfo &current() const { return m_current; }

  /**
   * @brief Parses sizes like "1.5 MiB", "10 GiB", "512 B", "3.2k"
   * @return Byte count, or nullopt for unparsable text
   */
  static std::optional<std::uint64_t> parseSize(const std::string &text);

private:
  ProgressInfo m_current;
};

#endif // TRANSFERCOMMAND_HPP
