/**
 * @file sizeaggregator.cpp
 * @brief Implementation of the background directory size cache
 */

#include "sizeaggregator.hpp"
#include "pathutils.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

SizeAggregator::SizeAggregator(UpdateCallback on_update)
    : m_on_update(std::move(on_update)) {}

SizeAggregator::~SizeAggregator() {
  m_cancel = true;

  std::vector<std::future<void>> workers;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    workers.swap(m_workers);
  }
  for (auto &worker : workers) {
    if (worker.valid())
      worker.wait();
  }
}

/**
 * @brief Returns the cached size or schedules a computation
 *
 * Freshness rule: the cached entry is used when the directory's current
 * mtime is not newer than the mtime recorded when the walk started.
 * The directory's mtime is read before taking the lock so the loop thread
 * never waits on disk I/O while holding it.
 */
SizeQuery SizeAggregator::requestSize(const fs::path &path) {
  const std::string key = normalizePath(path);

  std::error_code ec;
  auto mtime = fs::last_write_time(key, ec);

  std::lock_guard<std::mutex> lock(m_mutex);
  reapFinished();

  if (m_in_flight.count(key) > 0) {
    return {SizeState::Calculating, std::nullopt};
  }

  if (ec) {
    // The directory is gone or unreadable at the top level
    m_cache.erase(key);
    return {SizeState::Error, std::nullopt};
  }

  auto it = m_cache.find(key);
  if (it != m_cache.end() && mtime <= it->second.sourceMTime) {
    return {it->second.partial ? SizeState::Error : SizeState::Known,
            it->second.size};
  }

  m_in_flight.insert(key);
  m_workers.push_back(
      std::async(std::launch::async, [this, key]() { compute(key); }));

  spdlog::debug("Size computation scheduled for {}", key);
  return {SizeState::Calculating, std::nullopt};
}

std::optional<SizeCacheEntry>
SizeAggregator::lookup(const fs::path &path) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_cache.find(normalizePath(path));
  if (it == m_cache.end())
    return std::nullopt;
  return it->second;
}

bool SizeAggregator::isCalculating(const fs::path &path) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_in_flight.count(normalizePath(path)) > 0;
}

std::size_t SizeAggregator::inFlightCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_in_flight.size();
}

void SizeAggregator::invalidateTree(const fs::path &path) {
  const fs::path key(normalizePath(path));

  std::lock_guard<std::mutex> lock(m_mutex);
  for (auto it = m_cache.begin(); it != m_cache.end();) {
    fs::path cached(it->first);
    if (isSameOrDescendant(cached, key) || isSameOrDescendant(key, cached)) {
      it = m_cache.erase(it);
    } else {
      ++it;
    }
  }

  // Running walks over an affected path have to start over
  for (const auto &running : m_in_flight) {
    fs::path p(running);
    if (isSameOrDescendant(p, key) || isSameOrDescendant(key, p)) {
      ++m_epochs[running];
    }
  }
}

/**
 * @brief Worker body: walks, publishes, notifies
 *
 * Runs on a std::async thread. The cache entry is written under the lock
 * and the in-flight mark removed in the same critical section, so a
 * requestSize() that follows the notification always hits the new entry.
 */
void SizeAggregator::compute(std::string key) {
  SizeUpdate update;
  update.path = key;

  try {
    for (;;) {
      std::uint64_t epoch = 0;
      {
        std::lock_guard<std::mutex> lock(m_mutex);
        epoch = m_epochs[key];
      }

      std::error_code ec;
      auto mtime = fs::last_write_time(key, ec);
      WalkResult result = walk(key, m_cancel);

      std::lock_guard<std::mutex> lock(m_mutex);
      if (result.cancelled) {
        m_in_flight.erase(key);
        return;
      }
      if (m_epochs[key] != epoch) {
        continue; // invalidated while walking
      }

      update.size = result.bytes;
      if (ec) {
        m_cache.erase(key);
        update.state = SizeState::Error;
      } else {
        SizeCacheEntry entry;
        entry.path = key;
        entry.size = result.bytes;
        entry.computedAt = std::chrono::system_clock::now();
        entry.sourceMTime = mtime;
        entry.partial = result.partial;
        m_cache[key] = entry;
        update.state = result.partial ? SizeState::Error : SizeState::Known;
      }
      m_epochs.erase(key);
      m_in_flight.erase(key);

      if (result.partial) {
        spdlog::warn("Size of {} is partial ({} bytes in {} files readable)",
                     key, result.bytes, result.files);
      } else {
        spdlog::debug("Size of {}: {} bytes in {} files", key, result.bytes,
                      result.files);
      }
      break;
    }
  } catch (const std::exception &e) {
    spdlog::error("Size computation for {} failed: {}", key, e.what());
    std::lock_guard<std::mutex> lock(m_mutex);
    m_epochs.erase(key);
    m_in_flight.erase(key);
    update.state = SizeState::Error;
  }

  if (m_on_update)
    m_on_update(update);
}

void SizeAggregator::reapFinished() {
  for (auto it = m_workers.begin(); it != m_workers.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it->get();
      it = m_workers.erase(it);
    } else {
      ++it;
    }
  }
}

WalkResult SizeAggregator::walk(const fs::path &root,
                                const std::atomic<bool> &cancel) {
  WalkResult result;
  std::vector<fs::path> pending{root};

  while (!pending.empty()) {
    if (cancel) {
      result.cancelled = true;
      return result;
    }

    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      result.partial = true;
      continue;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) {
        result.partial = true;
        break;
      }
      if (cancel) {
        result.cancelled = true;
        return result;
      }

      fs::file_status status = it->symlink_status(ec);
      if (ec) {
        result.partial = true;
        continue;
      }

      if (fs::is_symlink(status)) {
        continue;
      }
      if (fs::is_directory(status)) {
        pending.push_back(it->path());
      } else if (fs::is_regular_file(status)) {
        auto bytes = it->file_size(ec);
        if (ec) {
          result.partial = true;
        } else {
          result.bytes += bytes;
          ++result.files;
        }
      }
    }
  }

  return result;
}
