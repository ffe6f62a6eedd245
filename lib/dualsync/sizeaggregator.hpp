/**
 * @file sizeaggregator.hpp
 * @brief Background computation and caching of recursive directory sizes
 *
 * Directory sizes are the most expensive thing the file manager shows. They
 * are never computed on the loop thread: requestSize() answers from the
 * cache or schedules a worker and reports Calculating, and the worker
 * announces its result through a callback.
 */

#ifndef SIZEAGGREGATOR_HPP
#define SIZEAGGREGATOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "entry.hpp"

/**
 * @struct SizeCacheEntry
 * @brief Cached recursive size of one directory
 *
 * An entry is fresh while the directory's own modification time is not newer
 * than sourceMTime. Entries never expire by age.
 */
struct SizeCacheEntry {
  std::string path;
  std::uint64_t size = 0;
  std::chrono::system_clock::time_point computedAt;
  std::filesystem::file_time_type sourceMTime;
  /** @brief Some subtree could not be read; size is a lower bound */
  bool partial = false;
};

/**
 * @struct SizeQuery
 * @brief Immediate answer of SizeAggregator::requestSize()
 */
struct SizeQuery {
  SizeState state = SizeState::Unknown;
  std::optional<std::uint64_t> size;
};

/**
 * @struct SizeUpdate
 * @brief Completion notice of a background computation
 */
struct SizeUpdate {
  std::string path;
  SizeState state = SizeState::Known;
  std::uint64_t size = 0;
};

/**
 * @struct WalkResult
 * @brief Outcome of a depth-first size walk
 */
struct WalkResult {
  std::uint64_t bytes = 0;
  std::uint64_t files = 0;
  bool partial = false;
  bool cancelled = false;
};

/**
 * @class SizeAggregator
 * @brief Process-wide cache of directory sizes with asynchronous refresh
 *
 * Concurrency model:
 * - One mutex guards the cache, the in-flight set and the invalidation
 *   epochs. Walks run outside the lock.
 * - At most one computation per path is in flight. A second request for the
 *   same path observes the in-flight state and gets Calculating.
 * - Only workers write cache entries.
 * - An invalidation that arrives while a walk is running makes the worker
 *   walk again before it publishes.
 *
 * @see SizeQuery
 * @see SizeUpdate
 */
class SizeAggregator {
public:
  using UpdateCallback = std::function<void(const SizeUpdate &)>;

  /**
   * @param on_update Invoked from the worker thread after the cache has
   *        been written. Must be thread-safe (typically pushes into a
   *        NotificationQueue).
   */
  explicit SizeAggregator(UpdateCallback on_update);

  /** @brief Cancels running walks and waits for the workers */
  ~SizeAggregator();

  SizeAggregator(const SizeAggregator &) = delete;
  SizeAggregator &operator=(const SizeAggregator &) = delete;

  /**
   * @brief Returns the cached size or schedules a computation
   *
   * @param path Directory whose recursive size is wanted
   * @return Known/Error with the size when a fresh cache entry exists,
   *         Calculating otherwise, Error without size if the directory
   *         itself is gone
   */
  SizeQuery requestSize(const std::filesystem::path &path);

  /** @brief Cached entry for @p path, regardless of freshness */
  std::optional<SizeCacheEntry> lookup(const std::filesystem::path &path) const;

  /** @brief True while a computation for @p path is running */
  bool isCalculating(const std::filesystem::path &path) const;

  /** @brief Number of computations currently running */
  std::size_t inFlightCount() const;

  /**
   * @brief Drops cached sizes for @p path, its ancestors and descendants
   *
   * Used after transfers and on explicit refresh, where contents changed
   * deeper than a directory's own mtime can show.
   */
  void invalidateTree(const std::filesystem::path &path);

  /**
   * @brief Sums regular file sizes below @p root, depth first
   *
   * Symlinks are not followed. Unreadable subdirectories set partial and are
   * skipped.
   *
   * @param root Directory to walk
   * @param cancel Checked between entries; the walk stops when set
   */
  static WalkResult walk(const std::filesystem::path &root,
                         const std::atomic<bool> &cancel);

private:
  void compute(std::string key);
  void reapFinished();

  UpdateCallback m_on_update;

  mutable std::mutex m_mutex;
  std::map<std::string, SizeCacheEntry> m_cache;
  std::set<std::string> m_in_flight;
  std::map<std::string, std::uint64_t> m_epochs;
  std::vector<std::future<void>> m_workers;

  std::atomic<bool> m_cancel{false};
};

#endif // SIZEAGGREGATOR_HPP
