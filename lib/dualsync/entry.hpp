#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "utils.hpp"

/**
 * @enum EntryKind
 * @brief Classification of a listed directory child
 *
 * Symlinks are classified by their target; a dangling link is a File.
 */
enum class EntryKind { File, Directory, Executable };

/**
 * @enum SizeState
 * @brief Lifecycle of a size value shown for an entry or a panel footer
 *
 * - Unknown: never requested (directories before the cursor reaches them)
 * - Calculating: a background computation is in flight
 * - Known: size is exact
 * - Error: size could not be determined completely; any value present is a
 *   lower bound
 */
enum class SizeState { Unknown, Calculating, Known, Error };

/**
 * @class Entry
 * @brief One immediate child of a panel's current directory
 *
 * Entries are recreated whenever a panel lists its path. The identity of an
 * entry (used for selection) is its full path; the displayed name is the
 * name of the link itself when the child is a symlink.
 */
class Entry {
private:
  std::string m_path;
  std::string m_name;
  EntryKind m_kind;
  std::optional<std::uint64_t> m_size;
  SizeState m_size_state;

public:
  Entry(const std::string &path, EntryKind kind,
        std::optional<std::uint64_t> size = std::nullopt)
      : m_path(path),
        m_name(std::filesystem::path(path).filename().string()),
        m_kind(kind), m_size(size),
        m_size_state(size ? SizeState::Known : SizeState::Unknown) {}

  const std::string &getPath() const { return m_path; }
  const std::string &getName() const { return m_name; }
  EntryKind getKind() const { return m_kind; }
  bool isDirectory() const { return m_kind == EntryKind::Directory; }
  bool isExecutable() const { return m_kind == EntryKind::Executable; }

  const std::optional<std::uint64_t> &getSize() const { return m_size; }
  SizeState getSizeState() const { return m_size_state; }

  void setSize(SizeState state, std::optional<std::uint64_t> size) {
    m_size_state = state;
    m_size = size;
  }

  /** @brief Name with a kind suffix: "dir/", "tool*", "file.txt" */
  std::string getDisplayName() const {
    if (m_kind == EntryKind::Directory)
      return m_name + "/";
    if (m_kind == EntryKind::Executable)
      return m_name + "*";
    return m_name;
  }

  int getColorCode() const {
    if (m_size_state == SizeState::Error)
      return 1; // Red: unreadable
    if (m_kind == EntryKind::Directory)
      return 4; // Blue: Directories
    if (m_kind == EntryKind::Executable)
      return 2; // Green: Executables
    return 7;   // White: Normal
  }

  std::string getSizeFormatted() const {
    if (m_kind == EntryKind::Directory && m_size_state == SizeState::Unknown)
      return "<DIR>";
    return formatSizeLabel(m_size, m_size_state == SizeState::Calculating,
                           m_size_state == SizeState::Error);
  }
};

#endif // ENTRY_HPP
