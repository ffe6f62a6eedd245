/**
 * @file pathlister.cpp
 * @brief Implementation of non-recursive directory listing
 */

#include "pathlister.hpp"
#include "pathutils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

ListError toListError(const std::error_code &ec) {
  if (ec == std::errc::no_such_file_or_directory)
    return ListError::NotFound;
  if (ec == std::errc::not_a_directory)
    return ListError::NotADirectory;
  // Anything else that prevents opening the directory means we cannot read it
  return ListError::PermissionDenied;
}

std::string lowered(const std::string &s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

/**
 * @brief Lists a directory
 *
 * The path itself is resolved through symlinks before it is checked, so a
 * link to a directory can be listed. Errors while reading individual
 * children do not abort the listing; such children are reported with size
 * state Error.
 *
 * @param dir_path Directory to list
 * @return ListResult Sorted entries or the error that prevented listing
 */
ListResult PathLister::list(const fs::path &dir_path) {
  ListResult result;
  std::error_code ec;

  fs::file_status status = fs::status(dir_path, ec);
  if (ec || !fs::exists(status)) {
    result.error = (ec && ec != std::errc::no_such_file_or_directory)
                       ? toListError(ec)
                       : ListError::NotFound;
    return result;
  }
  if (!fs::is_directory(status)) {
    result.error = ListError::NotADirectory;
    return result;
  }

  fs::directory_iterator it(dir_path, ec);
  if (ec) {
    result.error = toListError(ec);
    spdlog::warn("Cannot list {}: {}", dir_path.string(), ec.message());
    return result;
  }

  const std::string base = normalizePath(dir_path);
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      spdlog::warn("Listing of {} stopped early: {}", base, ec.message());
      break;
    }
    result.entries.push_back(makeEntry(*it));
  }

  sortEntries(result.entries);
  return result;
}

std::string PathLister::describe(ListError error, const std::string &path) {
  switch (error) {
  case ListError::NotFound:
    return "No such directory: " + path;
  case ListError::PermissionDenied:
    return "Permission denied: " + path;
  case ListError::NotADirectory:
    return "Not a directory: " + path;
  }
  return "Cannot list " + path;
}

/**
 * @brief Builds an Entry from a directory entry
 *
 * Classification follows symlinks (status()), the name stays the link's
 * name. A dangling link or an unstatable child becomes a File with size
 * state Error.
 */
Entry PathLister::makeEntry(const fs::directory_entry &entry) {
  const std::string path = normalizePath(entry.path());
  std::error_code ec;

  fs::file_status status = entry.status(ec);
  if (ec || !fs::exists(status)) {
    Entry broken(path, EntryKind::File);
    broken.setSize(SizeState::Error, std::nullopt);
    return broken;
  }

  if (fs::is_directory(status))
    return Entry(path, EntryKind::Directory);

  std::optional<std::uint64_t> size;
  if (fs::is_regular_file(status)) {
    auto bytes = fs::file_size(entry.path(), ec);
    if (!ec)
      size = bytes;
  } else {
    size = 0; // devices, fifos, sockets carry no data of their own
  }

  const fs::perms exec_bits =
      fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
  EntryKind kind = (status.permissions() & exec_bits) != fs::perms::none
                       ? EntryKind::Executable
                       : EntryKind::File;

  Entry result(path, kind, size);
  if (!size)
    result.setSize(SizeState::Error, std::nullopt);
  return result;
}

void PathLister::sortEntries(std::vector<Entry> &entries) {
  std::sort(entries.begin(), entries.end(),
            [](const Entry &a, const Entry &b) {
              // Directories before files
              if (a.isDirectory() != b.isDirectory()) {
                return a.isDirectory();
              }

              std::string la = lowered(a.getName());
              std::string lb = lowered(b.getName());
              if (la != lb)
                return la < lb;
              return a.getName() < b.getName();
            });
}
