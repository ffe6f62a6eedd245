/**
 * @file test_session.cpp
 * @brief Integration tests for the Session class
 *
 * Sessions run against temporary trees and the fake transfer tool. Listings
 * are performed inline (async_listing = false) except where the asynchronous
 * path itself is under test.
 *
 * ## Test Coverage
 *
 * ### Transfers (9 tests)
 * - CopyOfSelectionRefreshesDestination
 * - MoveRefreshesBothPanels
 * - SamePathOnBothSidesIsRefused
 * - AttachedJobBlocksCommands: everything but cancel/scroll is Blocked
 * - CancelEndsAttachedJob
 * - DetachedJobDoesNotBlock
 * - FailureIsReportedAndSourcesKept
 * - ProgressModeFoldsStatistics / LogModeKeepsEverything
 * - TransferUsesCursorWhenNothingSelected
 *
 * ### Panels (6 tests)
 * - SwitchingPanelsSwapsSourceAndDestination
 * - DirectorySizeArrivesWhileCursorMoves
 * - AsyncNavigationLatestWins
 * - NavigationErrorSetsStatus
 * - RefreshPicksUpNewEntries
 * - QuitIsReported
 *
 * ### Snapshot and output (2 tests)
 * - SnapshotKeepsCursorVisible
 * - OutputBufferIsBounded
 *
 * @see Session
 */

#include <gtest/gtest.h>
#include "pathutils.hpp"
#include "session.hpp"
#include "testhelpers.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using Outcome = Session::DispatchOutcome;

/**
 * @class SessionTest
 * @brief Fixture with a source and a destination directory
 *
 * Tree:
 * - a/foo/inner.txt (30 bytes)
 * - a/bar.txt (120 bytes)
 * - b/
 */
class SessionTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path tool_dir;
  SessionOptions options;
  std::unique_ptr<Session> session;

  void SetUp() override {
    test_dir = makeTestDir("session");
    tool_dir = test_dir / "tool";
    createFile(test_dir / "a" / "foo" / "inner.txt", 30);
    createFile(test_dir / "a" / "bar.txt", 120);
    createDir(test_dir / "b");

    options.left_path = (test_dir / "a").string();
    options.right_path = (test_dir / "b").string();
    options.tool = writeFakeTool(tool_dir);
    options.detached_log = (test_dir / "logs" / "transfers.log").string();
    options.async_listing = false;
  }

  void TearDown() override {
    session.reset();
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  Session &start() {
    session = std::make_unique<Session>(options);
    return *session;
  }

  std::string p(const std::string &relative) const {
    return normalizePath(test_dir / relative);
  }

  static std::vector<std::string> names(const Panel &panel) {
    std::vector<std::string> out;
    for (const auto &entry : panel.entries())
      out.push_back(entry.getName());
    return out;
  }

  bool jobFinished() {
    const TransferJob *job = session->activeTransfer();
    return job && isTerminal(job->state);
  }

  bool jobRunning() {
    const TransferJob *job = session->activeTransfer();
    return job && job->state == JobState::Running;
  }

  bool outputContains(const std::string &needle) const {
    for (const auto &line : session->output()) {
      if (line.find(needle) != std::string::npos)
        return true;
    }
    return false;
  }

  /** @brief Selects foo/ and bar.txt in the active panel */
  void selectBoth(Session &s) {
    ASSERT_EQ(s.dispatch(Command::toggleSelection()), Outcome::Applied);
    ASSERT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
    ASSERT_EQ(s.dispatch(Command::toggleSelection()), Outcome::Applied);
  }
};

TEST_F(SessionTest, CopyOfSelectionRefreshesDestination) {
  Session &s = start();
  ASSERT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"foo", "bar.txt"}));
  EXPECT_TRUE(s.panel(PanelSide::Right).entries().empty());

  selectBoth(s);
  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);

  const TransferJob *job = s.activeTransfer();
  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->mode, TransferMode::Copy);
  EXPECT_EQ(job->destination, p("b"));
  EXPECT_EQ(job->sources,
            (std::vector<std::string>{p("a/foo"), p("a/bar.txt")}));

  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));
  EXPECT_EQ(s.activeTransfer()->state, JobState::Succeeded);
  EXPECT_NE(s.statusMessage().find("succeeded"), std::string::npos);
  EXPECT_FALSE(s.isBlocked());

  EXPECT_EQ(names(s.panel(PanelSide::Right)),
            (std::vector<std::string>{"foo", "bar.txt"}));
  EXPECT_TRUE(fs::exists(test_dir / "b" / "foo" / "inner.txt"));

  // The source side is untouched, selection included
  EXPECT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"foo", "bar.txt"}));
  EXPECT_EQ(s.panel(PanelSide::Left).selectedPaths().size(), 2u);
}

TEST_F(SessionTest, MoveRefreshesBothPanels) {
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::setTransferMode(TransferMode::Move)),
            Outcome::Applied);
  selectBoth(s);
  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);

  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));
  ASSERT_EQ(s.activeTransfer()->state, JobState::Succeeded);

  EXPECT_TRUE(s.panel(PanelSide::Left).entries().empty());
  EXPECT_TRUE(s.panel(PanelSide::Left).selectedPaths().empty());
  EXPECT_EQ(names(s.panel(PanelSide::Right)),
            (std::vector<std::string>{"foo", "bar.txt"}));
  EXPECT_FALSE(fs::exists(test_dir / "a" / "bar.txt"));
  EXPECT_TRUE(fs::exists(test_dir / "b" / "bar.txt"));

  auto calls = fakeToolCalls(tool_dir);
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_NE(calls[0].find("--delete-empty-src-dirs"), std::string::npos);
}

TEST_F(SessionTest, SamePathOnBothSidesIsRefused) {
  options.right_path = options.left_path;
  Session &s = start();

  EXPECT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Ignored);
  EXPECT_EQ(s.activeTransfer(), nullptr);
  EXPECT_FALSE(s.isBlocked());
  EXPECT_NE(s.statusMessage().find(p("a/foo")), std::string::npos);
  EXPECT_TRUE(outputContains("Transfer refused"));
  EXPECT_FALSE(fs::exists(tool_dir / "calls.log"));

  auto check = s.previewCheck();
  EXPECT_TRUE(check.blocked());
}

TEST_F(SessionTest, AttachedJobBlocksCommands) {
  writeText(tool_dir / "sleep", "30");
  Session &s = start();

  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  EXPECT_TRUE(s.isBlocked());

  EXPECT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Blocked);
  EXPECT_EQ(s.dispatch(Command::switchActivePanel()), Outcome::Blocked);
  EXPECT_EQ(s.dispatch(Command::setTransferMode(TransferMode::Move)),
            Outcome::Blocked);
  EXPECT_EQ(s.dispatch(Command::quit()), Outcome::Blocked);
  EXPECT_EQ(s.dispatch(Command::scrollOutput(1)), Outcome::Applied);

  EXPECT_EQ(s.panel(PanelSide::Left).cursor(), 0);
  EXPECT_EQ(s.activeSide(), PanelSide::Left);
  EXPECT_EQ(s.transferMode(), TransferMode::Copy);

  auto second = s.requestTransfer();
  ASSERT_TRUE(second.error.has_value());
  EXPECT_EQ(*second.error, TransferError::Busy);
  EXPECT_EQ(s.activeTransfer()->id, 1);

  EXPECT_TRUE(s.snapshot().blocked);

  ASSERT_TRUE(pumpUntil(s, [&] { return jobRunning(); }));
  EXPECT_EQ(s.dispatch(Command::cancelTransfer()), Outcome::Applied);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));
  EXPECT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
}

TEST_F(SessionTest, CancelEndsAttachedJob) {
  writeText(tool_dir / "sleep", "30");
  Session &s = start();
  selectBoth(s);

  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobRunning(); }));
  ASSERT_TRUE(
      pumpUntil(s, [&] { return fakeToolCalls(tool_dir).size() == 1u; }));

  auto before = std::chrono::steady_clock::now();
  ASSERT_EQ(s.dispatch(Command::cancelTransfer()), Outcome::Applied);
  EXPECT_NE(s.statusMessage().find("Cancelling"), std::string::npos);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));
  EXPECT_LT(std::chrono::steady_clock::now() - before, 10s);

  EXPECT_EQ(s.activeTransfer()->state, JobState::Cancelled);
  EXPECT_EQ(s.statusMessage(), "Job 1 cancelled");
  EXPECT_FALSE(s.isBlocked());
  EXPECT_EQ(fakeToolCalls(tool_dir).size(), 1u);

  // Nothing left to cancel
  EXPECT_EQ(s.dispatch(Command::cancelTransfer()), Outcome::Ignored);
}

TEST_F(SessionTest, DetachedJobDoesNotBlock) {
  writeText(tool_dir / "sleep", "1");
  Session &s = start();

  ASSERT_EQ(s.dispatch(Command::setRunMode(RunMode::Detached)),
            Outcome::Applied);
  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  EXPECT_NE(s.statusMessage().find(options.detached_log), std::string::npos);

  EXPECT_FALSE(s.isBlocked());
  EXPECT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
  EXPECT_EQ(s.snapshot().detached_running, 1u);
  EXPECT_EQ(s.dispatch(Command::cancelTransfer()), Outcome::Ignored);

  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));
  EXPECT_EQ(s.activeTransfer()->state, JobState::Succeeded);
  EXPECT_EQ(s.snapshot().detached_running, 0u);
  EXPECT_TRUE(fs::exists(test_dir / "b" / "foo" / "inner.txt"));
  EXPECT_NE(readText(options.detached_log).find("Copied"), std::string::npos);
}

TEST_F(SessionTest, FailureIsReportedAndSourcesKept) {
  writeText(tool_dir / "exit_code", "3");
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::setTransferMode(TransferMode::Move)),
            Outcome::Applied);
  selectBoth(s);

  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));

  const TransferJob *job = s.activeTransfer();
  EXPECT_EQ(job->state, JobState::Failed);
  ASSERT_TRUE(job->failure.has_value());
  EXPECT_EQ(job->failure->exit_code, 3);
  EXPECT_NE(s.statusMessage().find("failed"), std::string::npos);

  SessionSnapshot snap = s.snapshot();
  ASSERT_TRUE(snap.transfer.has_value());
  EXPECT_EQ(snap.transfer->state, JobState::Failed);
  EXPECT_FALSE(snap.transfer->failure.empty());
  EXPECT_TRUE(outputContains("simulated failure"));

  EXPECT_TRUE(fs::exists(test_dir / "a" / "foo" / "inner.txt"));
  EXPECT_TRUE(fs::exists(test_dir / "a" / "bar.txt"));
  EXPECT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"foo", "bar.txt"}));
  EXPECT_EQ(s.panel(PanelSide::Left).selectedPaths().size(), 2u);
}

TEST_F(SessionTest, ProgressModeFoldsStatistics) {
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));

  EXPECT_TRUE(outputContains("[job 1] $ "));
  EXPECT_TRUE(outputContains("Copied"));
  EXPECT_FALSE(outputContains("Transferred:"));
  EXPECT_EQ(s.activeTransfer()->progress.percent, 100);
}

TEST_F(SessionTest, LogModeKeepsEverything) {
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::setOutputMode(OutputMode::Log)),
            Outcome::Applied);
  ASSERT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
  ASSERT_EQ(s.dispatch(Command::confirmTransfer()), Outcome::Applied);
  ASSERT_TRUE(pumpUntil(s, [&] { return jobFinished(); }));

  EXPECT_TRUE(outputContains("Copied"));
  EXPECT_TRUE(outputContains("Transferred:"));
  EXPECT_NE(fakeToolCalls(tool_dir).at(0).find("-vv"), std::string::npos);
}

TEST_F(SessionTest, TransferUsesCursorWhenNothingSelected) {
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);

  TransferRequest request = s.pendingRequest();
  ASSERT_EQ(request.sources.size(), 1u);
  EXPECT_EQ(request.sources[0], p("a/bar.txt"));
  EXPECT_EQ(request.destination, p("b"));
}

TEST_F(SessionTest, SwitchingPanelsSwapsSourceAndDestination) {
  createFile(test_dir / "b" / "other.txt", 5);
  Session &s = start();

  ASSERT_EQ(s.dispatch(Command::switchActivePanel()), Outcome::Applied);
  EXPECT_EQ(s.activeSide(), PanelSide::Right);

  TransferRequest request = s.pendingRequest();
  ASSERT_EQ(request.sources.size(), 1u);
  EXPECT_EQ(request.sources[0], p("b/other.txt"));
  EXPECT_EQ(request.destination, p("a"));

  EXPECT_EQ(s.dispatch(Command::activatePanel(PanelSide::Right)),
            Outcome::Ignored);
  EXPECT_EQ(s.dispatch(Command::activatePanel(PanelSide::Left)),
            Outcome::Applied);
  EXPECT_EQ(s.activeSide(), PanelSide::Left);
}

TEST_F(SessionTest, DirectorySizeArrivesWhileCursorMoves) {
  for (int i = 0; i < 300; ++i) {
    createFile(test_dir / "a" / "foo" / ("chunk" + std::to_string(i)), 100);
  }
  Session &s = start();

  // Cursor starts on foo/; its size is computed off the loop thread
  const Entry &foo = s.panel(PanelSide::Left).entries()[0];
  EXPECT_NE(foo.getSizeState(), SizeState::Unknown);

  EXPECT_EQ(s.dispatch(Command::moveCursor(1)), Outcome::Applied);
  EXPECT_EQ(s.dispatch(Command::moveCursor(-1)), Outcome::Applied);

  ASSERT_TRUE(pumpUntil(s, [&] {
    return s.panel(PanelSide::Left).entries()[0].getSizeState() ==
           SizeState::Known;
  }));
  EXPECT_EQ(s.panel(PanelSide::Left).entries()[0].getSize().value_or(0),
            30030u);
  EXPECT_EQ(s.snapshot().left.footer_label, formatBytes(30030));
}

TEST_F(SessionTest, AsyncNavigationLatestWins) {
  options.async_listing = true;
  Session &s = start();

  ASSERT_TRUE(pumpUntil(s, [&] {
    return s.panel(PanelSide::Left).navState() == Panel::NavState::Idle &&
           s.panel(PanelSide::Right).navState() == Panel::NavState::Idle;
  }));
  ASSERT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"foo", "bar.txt"}));

  // Both requests are made before any listing result is applied
  EXPECT_EQ(s.dispatch(Command::navigateInto()), Outcome::Applied);
  EXPECT_EQ(s.panel(PanelSide::Left).navState(), Panel::NavState::Listing);
  EXPECT_EQ(s.dispatch(Command::navigateUp()), Outcome::Applied);
  EXPECT_TRUE(s.snapshot().busy);

  ASSERT_TRUE(pumpUntil(s, [&] {
    return s.panel(PanelSide::Left).navState() == Panel::NavState::Idle;
  }));
  EXPECT_EQ(s.panel(PanelSide::Left).path(), normalizePath(test_dir));
  EXPECT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"a", "b", "tool"}));
}

TEST_F(SessionTest, NavigationErrorSetsStatus) {
  Session &s = start();
  fs::remove_all(test_dir / "a" / "foo");

  EXPECT_EQ(s.dispatch(Command::navigateInto()), Outcome::Applied);
  EXPECT_EQ(s.panel(PanelSide::Left).path(), p("a"));
  EXPECT_EQ(s.panel(PanelSide::Left).navState(), Panel::NavState::Error);
  EXPECT_NE(s.statusMessage().find("No such directory"), std::string::npos);
  EXPECT_FALSE(s.snapshot().left.error_message.empty());
}

TEST_F(SessionTest, RefreshPicksUpNewEntries) {
  Session &s = start();
  createFile(test_dir / "a" / "new.txt", 1);

  EXPECT_EQ(s.dispatch(Command::refreshPanel()), Outcome::Applied);
  EXPECT_EQ(names(s.panel(PanelSide::Left)),
            (std::vector<std::string>{"foo", "bar.txt", "new.txt"}));
}

TEST_F(SessionTest, QuitIsReported) {
  Session &s = start();
  EXPECT_EQ(s.dispatch(Command::quit()), Outcome::Quit);
}

TEST_F(SessionTest, SnapshotKeepsCursorVisible) {
  for (int i = 0; i < 50; ++i) {
    char name[16];
    std::snprintf(name, sizeof(name), "f%02d.txt", i);
    createFile(test_dir / "b" / name, 1);
  }
  Session &s = start();
  ASSERT_EQ(s.dispatch(Command::switchActivePanel()), Outcome::Applied);
  ASSERT_EQ(s.dispatch(Command::moveCursor(25)), Outcome::Applied);

  SessionSnapshot snap = s.snapshot(10, 4);
  EXPECT_EQ(snap.active, PanelSide::Right);
  EXPECT_TRUE(snap.right.active);
  EXPECT_EQ(snap.right.total_entries, 50u);
  EXPECT_EQ(snap.right.first_index, 20);
  ASSERT_EQ(snap.right.entries.size(), 10u);
  EXPECT_TRUE(snap.right.entries[5].under_cursor);
  EXPECT_EQ(snap.right.entries[5].display_name, "f25.txt");

  ASSERT_EQ(s.dispatch(Command::moveCursor(100)), Outcome::Applied);
  snap = s.snapshot(10, 4);
  EXPECT_EQ(snap.right.first_index, 40);
  EXPECT_TRUE(snap.right.entries.back().under_cursor);
}

TEST_F(SessionTest, OutputBufferIsBounded) {
  options.output_lines = 5;
  options.right_path = options.left_path;
  Session &s = start();

  for (int i = 0; i < 12; ++i) {
    s.dispatch(Command::confirmTransfer());
  }
  EXPECT_EQ(s.output().size(), 5u);

  EXPECT_EQ(s.dispatch(Command::scrollOutput(3)), Outcome::Applied);
  EXPECT_EQ(s.outputScroll(), 3);
  s.dispatch(Command::scrollOutput(100));
  EXPECT_EQ(s.outputScroll(), 4);

  SessionSnapshot snap = s.snapshot(10, 2);
  EXPECT_EQ(snap.output_total, 5u);
  EXPECT_EQ(snap.output.size(), 1u);

  s.dispatch(Command::scrollOutput(-100));
  snap = s.snapshot(10, 2);
  EXPECT_EQ(snap.output_scroll, 0);
  EXPECT_EQ(snap.output.size(), 2u);
}
