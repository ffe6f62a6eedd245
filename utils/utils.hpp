/**
 * @file utils.hpp
 * @brief Utility functions and helpers shared by the library and the TUI
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable byte formatting
 * - formatSizeLabel: Size label for an entry/footer including the
 *   "calculating..." state
 *
 * @see safe_at()
 * @see formatBytes()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef> // size_t
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * Returns nullptr if the index is out of bounds instead of invoking
 * undefined behavior. Used wherever an index comes from a cursor.
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (can be negative or out of bounds)
 *
 * @return const T* Pointer to the element, or nullptr if out of bounds
 *
 * Example usage:
 * @code
 * const Entry *entry = safe_at(entries, cursor);
 * if (entry) {
 *     std::cout << entry->getPath();
 * }
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) and one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 *
 * @param bytes The number of bytes to format
 * @return std::string Formatted size (e.g. "1.5 KB", "3.2 MB")
 */
inline std::string formatBytes(std::uint64_t bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 5) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Builds the label shown for a size that may still be in flight
 *
 * @param size Known (or partial) byte count, if any
 * @param calculating True while a background computation is pending
 * @param partial True when the size is only a lower bound
 * @return "calculating...", ">= 1.2 MB", "1.2 MB" or "?"
 */
inline std::string formatSizeLabel(const std::optional<std::uint64_t> &size,
                                   bool calculating, bool partial) {
  if (calculating)
    return "calculating...";
  if (!size)
    return "?";
  return partial ? ">= " + formatBytes(*size) : formatBytes(*size);
}

#endif // UTILS_HPP
