/**
 * @file pathlister.hpp
 * @brief Non-recursive directory listing for a panel
 *
 * This header defines the PathLister class which reads the immediate children
 * of a directory, classifies them and returns them in display order.
 */

#ifndef PATHLISTER_HPP
#define PATHLISTER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "entry.hpp"

/**
 * @enum ListError
 * @brief Reasons a directory cannot be listed
 */
enum class ListError { NotFound, PermissionDenied, NotADirectory };

/**
 * @struct ListResult
 * @brief Outcome of PathLister::list(): either the entries or an error
 */
struct ListResult {
  std::vector<Entry> entries;
  std::optional<ListError> error;

  bool ok() const { return !error.has_value(); }
};

/**
 * @class PathLister
 * @brief Lists the immediate children of a directory
 *
 * Key features:
 * - Never recurses
 * - Classifies children as Directory, Executable or File, following
 *   symlinks for the classification while keeping the link's own name
 * - Reports file sizes directly; directory sizes are left Unknown for the
 *   SizeAggregator
 * - Sorted output: directories first, then case-insensitive alphabetical
 *
 * @see Entry
 * @see SizeAggregator
 */
class PathLister {
public:
  /**
   * @brief Lists a directory
   *
   * @param dir_path Directory to list
   * @return ListResult Sorted entries, or NotFound / PermissionDenied /
   *         NotADirectory
   *
   * @note Filesystem exceptions never escape; they are mapped to ListError
   */
  static ListResult list(const std::filesystem::path &dir_path);

  /**
   * @brief Human-readable message for a listing error
   */
  static std::string describe(ListError error, const std::string &path);

  /**
   * @brief Sorts entries in display order
   *
   * Order: directories before everything else, then by name ignoring case,
   * ties broken by the exact byte order of the name.
   */
  static void sortEntries(std::vector<Entry> &entries);

private:
  static Entry makeEntry(const std::filesystem::directory_entry &entry);
};

#endif // PATHLISTER_HPP
