/**
 * @file panel.cpp
 * @brief Implementation of panel navigation, cursor, selection and sizes
 */

#include "panel.hpp"
#include "pathutils.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

/**
 * @brief Creates an empty panel positioned at @p path
 *
 * Nothing is listed yet; the owner starts the first navigation.
 */
Panel::Panel(const std::string &path, SizeAggregator &sizes)
    : m_sizes(sizes), m_path(normalizePath(path)) {}

// ============================================================================
// NAVIGATION
// ============================================================================

std::optional<Panel::NavRequest>
Panel::requestNavigation(const std::string &target) {
  const std::string normalized = normalizePath(target);

  if (m_nav_state == NavState::Listing) {
    // Latest wins: replaces any target remembered earlier
    m_queued = normalized;
    return std::nullopt;
  }

  return beginListing(normalized);
}

Panel::NavRequest Panel::beginListing(const std::string &target) {
  m_nav_state = NavState::Listing;
  m_listing_target = target;
  ++m_ticket;
  return NavRequest{target, m_ticket};
}

std::optional<Panel::NavRequest>
Panel::completeNavigation(const NavRequest &request, ListResult result) {
  if (m_nav_state != NavState::Listing || request.ticket != m_ticket) {
    return std::nullopt; // stale result
  }

  if (m_queued) {
    // Superseded: drop this result and list the newest target instead
    std::string next = *m_queued;
    m_queued.reset();
    return beginListing(next);
  }

  if (!result.ok()) {
    m_nav_state = NavState::Error;
    m_last_error = result.error;
    m_last_error_target = request.target;
    spdlog::warn("Navigation failed: {}",
                 PathLister::describe(*result.error, request.target));
    return std::nullopt;
  }

  const bool same_path = (request.target == m_path);
  m_path = request.target;
  m_entries = std::move(result.entries);

  if (same_path) {
    std::set<std::string> still_listed;
    for (const auto &entry : m_entries) {
      if (m_selected.count(entry.getPath()) > 0)
        still_listed.insert(entry.getPath());
    }
    m_selected.swap(still_listed);
    m_cursor = std::clamp(m_cursor, 0,
                          std::max(0, static_cast<int>(m_entries.size()) - 1));
  } else {
    m_selected.clear();
    m_cursor = 0;
  }

  m_nav_state = NavState::Idle;
  m_last_error.reset();
  m_last_error_target.clear();

  loadCachedSizes();
  updateFooter();
  return std::nullopt;
}

bool Panel::runInline(std::optional<NavRequest> request) {
  if (!request)
    return false; // queued behind a listing that is still in flight

  while (request) {
    request = completeNavigation(*request, PathLister::list(request->target));
  }
  return m_nav_state == NavState::Idle;
}

bool Panel::navigateTo(const std::string &target) {
  return runInline(requestNavigation(target));
}

bool Panel::navigateInto(const Entry &entry) {
  auto target = intoTarget(entry);
  if (!target)
    return false;
  return navigateTo(*target);
}

bool Panel::navigateInto() {
  const Entry *entry = currentEntry();
  if (!entry)
    return false;
  return navigateInto(*entry);
}

bool Panel::navigateUp() {
  auto target = upTarget();
  if (!target)
    return false;
  return navigateTo(*target);
}

bool Panel::refresh() { return navigateTo(m_path); }

std::optional<std::string> Panel::intoTarget(const Entry &entry) const {
  if (!entry.isDirectory())
    return std::nullopt;
  return normalizePath(fs::path(m_path) / entry.getName());
}

std::optional<std::string> Panel::upTarget() const {
  std::string parent = parentPath(m_path);
  if (parent == m_path)
    return std::nullopt;
  return parent;
}

// ============================================================================
// CURSOR AND SELECTION
// ============================================================================

void Panel::moveCursor(int delta) {
  if (m_entries.empty()) {
    m_cursor = 0;
    return;
  }

  const int last = static_cast<int>(m_entries.size()) - 1;
  // Widen before adding so huge page jumps cannot overflow
  long long next = static_cast<long long>(m_cursor) + delta;
  m_cursor = static_cast<int>(std::clamp<long long>(next, 0, last));
  updateFooter();
}

bool Panel::toggleSelection() {
  if (static_cast<size_t>(m_cursor) >= m_entries.size())
    return false;

  Entry &entry = m_entries[static_cast<size_t>(m_cursor)];
  auto it = m_selected.find(entry.getPath());
  if (it != m_selected.end()) {
    m_selected.erase(it);
    return true;
  }

  m_selected.insert(entry.getPath());
  if (entry.isDirectory()) {
    SizeQuery query = m_sizes.requestSize(entry.getPath());
    entry.setSize(query.state, query.size);
  }
  return true;
}

Panel::SelectionSummary Panel::selectionSummary() const {
  SelectionSummary summary;
  bool calculating = false;
  bool error = false;

  for (const auto &entry : m_entries) {
    if (m_selected.count(entry.getPath()) == 0)
      continue;

    ++summary.count;
    switch (entry.getSizeState()) {
    case SizeState::Known:
      summary.knownBytes += entry.getSize().value_or(0);
      break;
    case SizeState::Error:
      summary.knownBytes += entry.getSize().value_or(0);
      error = true;
      break;
    case SizeState::Calculating:
    case SizeState::Unknown:
      calculating = true;
      break;
    }
  }

  if (calculating)
    summary.state = SizeState::Calculating;
  else if (error)
    summary.state = SizeState::Error;
  else
    summary.state = SizeState::Known;
  return summary;
}

std::vector<std::string> Panel::selectedPaths() const {
  std::vector<std::string> paths;
  paths.reserve(m_selected.size());
  for (const auto &entry : m_entries) {
    if (m_selected.count(entry.getPath()) > 0)
      paths.push_back(entry.getPath());
  }
  return paths;
}

bool Panel::isSelected(const Entry &entry) const {
  return m_selected.count(entry.getPath()) > 0;
}

void Panel::clearSelection() { m_selected.clear(); }

const Entry *Panel::currentEntry() const { return safe_at(m_entries, m_cursor); }

// ============================================================================
// SIZES
// ============================================================================

bool Panel::applySizeUpdate(const SizeUpdate &update) {
  bool touched = false;

  for (auto &entry : m_entries) {
    if (entry.getPath() == update.path) {
      entry.setSize(update.state, update.size);
      touched = true;
    }
  }

  if (!m_footer_path.empty() && m_footer_path == update.path) {
    m_footer_state = update.state;
    m_footer_size = update.size;
    touched = true;
  }

  return touched;
}

/**
 * @brief Re-reads the footer for the entry under the cursor
 *
 * Directories go through the SizeAggregator (which may schedule a walk and
 * answer Calculating); files report the size from the listing.
 */
void Panel::updateFooter() {
  if (static_cast<size_t>(m_cursor) >= m_entries.size()) {
    m_footer_path.clear();
    m_footer_size.reset();
    m_footer_state = SizeState::Unknown;
    return;
  }

  Entry &entry = m_entries[static_cast<size_t>(m_cursor)];
  m_footer_path = entry.getPath();

  if (entry.isDirectory()) {
    SizeQuery query = m_sizes.requestSize(entry.getPath());
    entry.setSize(query.state, query.size);
  }

  m_footer_state = entry.getSizeState();
  m_footer_size = entry.getSize();
}

/**
 * @brief Shows sizes already cached for listed directories
 *
 * Only reads the cache; nothing is scheduled for entries the operator has
 * not looked at.
 */
void Panel::loadCachedSizes() {
  for (auto &entry : m_entries) {
    if (!entry.isDirectory())
      continue;
    if (auto cached = m_sizes.lookup(entry.getPath())) {
      entry.setSize(cached->partial ? SizeState::Error : SizeState::Known,
                    cached->size);
    } else if (m_sizes.isCalculating(entry.getPath())) {
      entry.setSize(SizeState::Calculating, std::nullopt);
    }
  }
}
