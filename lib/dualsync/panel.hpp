/**
 * @file panel.hpp
 * @brief Navigation and selection state of one side of the dual view
 */

#ifndef PANEL_HPP
#define PANEL_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "entry.hpp"
#include "pathlister.hpp"
#include "sizeaggregator.hpp"

/**
 * @class Panel
 * @brief One side's current path, listing, cursor, selection and footer
 *
 * Navigation is a small state machine:
 *
 *   Idle ──request──▶ Listing ──ok──▶ Idle
 *                        │
 *                        └──error──▶ Error ──request──▶ Listing
 *
 * Only one listing is outstanding per panel. A request made while listing
 * is remembered as the next target, replacing any earlier remembered one;
 * when the outstanding listing completes its result is discarded and the
 * remembered target is listed instead (latest wins).
 *
 * The two phases (requestNavigation/completeNavigation) let the session run
 * listings on a worker. navigateTo() and friends run both phases inline.
 *
 * Invariants:
 * - cursor is a valid index into entries, or 0 when entries is empty
 * - selected only holds paths of the current listing; it is cleared when
 *   the panel moves to another path and pruned when the same path is
 *   listed again
 *
 * @see PathLister
 * @see SizeAggregator
 */
class Panel {
public:
  enum class NavState { Idle, Listing, Error };

  /** @brief A listing the caller has to perform and hand back */
  struct NavRequest {
    std::string target;
    std::uint64_t ticket = 0;
  };

  /**
   * @struct SelectionSummary
   * @brief Count and aggregate size of the selected entries
   *
   * state is Known only if every selected size is known; knownBytes then
   * is the exact total. Otherwise knownBytes is what is known so far.
   */
  struct SelectionSummary {
    std::size_t count = 0;
    std::uint64_t knownBytes = 0;
    SizeState state = SizeState::Known;

    std::optional<std::uint64_t> totalSize() const {
      if (state == SizeState::Known)
        return knownBytes;
      return std::nullopt;
    }
  };

  Panel(const std::string &path, SizeAggregator &sizes);

  // ===== Navigation =====

  /**
   * @brief Starts a navigation to @p target
   * @return The listing to perform, or nullopt if it was queued behind the
   *         listing already in flight
   */
  std::optional<NavRequest> requestNavigation(const std::string &target);

  /**
   * @brief Applies a finished listing
   *
   * Success replaces path and entries. Moving to another path resets the
   * cursor and clears the selection; listing the same path again clamps
   * the cursor and drops selections that are no longer listed. Failure
   * keeps path, entries, cursor and selection and enters Error.
   *
   * @return The next listing to perform if a newer request was queued
   */
  std::optional<NavRequest> completeNavigation(const NavRequest &request,
                                               ListResult result);

  /** @brief Lists @p target inline; false if listing failed */
  bool navigateTo(const std::string &target);

  /** @brief Enters a directory entry; no-op for files */
  bool navigateInto(const Entry &entry);

  /** @brief Enters the entry under the cursor */
  bool navigateInto();

  /** @brief Goes to the parent directory; no-op at the root */
  bool navigateUp();

  /** @brief Lists the current path again */
  bool refresh();

  /** @brief Target of navigateInto(entry), nullopt for non-directories */
  std::optional<std::string> intoTarget(const Entry &entry) const;

  /** @brief Target of navigateUp(), nullopt at the root */
  std::optional<std::string> upTarget() const;

  // ===== Cursor and selection =====

  /** @brief Moves the cursor by @p delta, clamped to the listing */
  void moveCursor(int delta);

  /**
   * @brief Adds or removes the entry under the cursor from the selection
   *
   * Selecting a directory asks the SizeAggregator for its size.
   *
   * @return false if there is no entry under the cursor
   */
  bool toggleSelection();

  SelectionSummary selectionSummary() const;

  /** @brief Selected paths in listing order */
  std::vector<std::string> selectedPaths() const;

  bool isSelected(const Entry &entry) const;

  /** @brief Forgets the whole selection */
  void clearSelection();

  // ===== Sizes =====

  /**
   * @brief Applies a finished size computation
   * @return true if an entry or the footer showed that path
   */
  bool applySizeUpdate(const SizeUpdate &update);

  /** @brief Re-reads the footer size for the entry under the cursor */
  void updateFooter();

  // ===== Accessors =====

  const std::string &path() const { return m_path; }
  const std::vector<Entry> &entries() const { return m_entries; }
  int cursor() const { return m_cursor; }
  const Entry *currentEntry() const;

  NavState navState() const { return m_nav_state; }
  const std::optional<ListError> &lastError() const { return m_last_error; }
  const std::string &lastErrorTarget() const { return m_last_error_target; }
  const std::optional<std::string> &queuedTarget() const { return m_queued; }

  const std::optional<std::uint64_t> &footerSize() const {
    return m_footer_size;
  }
  SizeState footerState() const { return m_footer_state; }

private:
  NavRequest beginListing(const std::string &target);
  bool runInline(std::optional<NavRequest> request);
  void loadCachedSizes();

  SizeAggregator &m_sizes;

  std::string m_path;
  std::vector<Entry> m_entries;
  int m_cursor = 0;
  std::set<std::string> m_selected;

  std::optional<std::uint64_t> m_footer_size;
  SizeState m_footer_state = SizeState::Unknown;
  std::string m_footer_path;

  NavState m_nav_state = NavState::Idle;
  std::uint64_t m_ticket = 0;
  std::string m_listing_target;
  std::optional<std::string> m_queued;
  std::optional<ListError> m_last_error;
  std::string m_last_error_target;
};

#endif // PANEL_HPP
