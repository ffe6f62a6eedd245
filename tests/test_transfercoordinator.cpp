/**
 * @file test_transfercoordinator.cpp
 * @brief Unit tests for the TransferCoordinator class
 *
 * The external tool is replaced by a shell script (see writeFakeTool()) that
 * performs the copy/move with cp and rm and prints rclone-like output.
 *
 * ## Test Coverage
 *
 * ### Refusals (4 tests)
 * - RefusesEmptyRequest: NothingSelected
 * - RefusesInvalidTarget: nothing is launched
 * - RefusesSecondAttachedJob: Busy
 * - ReportsLaunchFailure: missing tool fails the job with LaunchFailed
 *
 * ### Lifecycle (4 tests)
 * - CopySucceeds: Pending, Running, Succeeded; files arrive
 * - ProgressLinesAreParsed
 * - NonZeroExitStopsAtFirstFailure
 * - CancelStopsRunningJob
 *
 * ### Robustness (1 test)
 * - SurvivesMalformedProgressOutput: odd lines stay plain output
 *
 * ### Detached jobs (2 tests)
 * - DetachedJobWritesToLogFile
 * - DetachedJobOutlivesCoordinator: no logging after teardown
 *
 * @see TransferCoordinator
 */

#include <gtest/gtest.h>
#include "pathutils.hpp"
#include "testhelpers.hpp"
#include "transfercoordinator.hpp"

#include <chrono>
#include <filesystem>
#include <memory>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

/**
 * @class TransferCoordinatorTest
 * @brief Fixture with a fake tool, a source tree and a destination
 *
 * Tree:
 * - a/foo/inner.txt (30 bytes)
 * - a/bar.txt (120 bytes)
 * - b/
 */
class TransferCoordinatorTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path tool_dir;
  std::shared_ptr<SessionQueue> queue;
  std::unique_ptr<TransferCoordinator> coordinator;
  std::vector<TransferOutput> outputs;

  void SetUp() override {
    test_dir = makeTestDir("transfercoordinator");
    tool_dir = test_dir / "tool";
    createFile(test_dir / "a" / "foo" / "inner.txt", 30);
    createFile(test_dir / "a" / "bar.txt", 120);
    createDir(test_dir / "b");

    queue = std::make_shared<SessionQueue>();
    makeCoordinator(writeFakeTool(tool_dir));
  }

  void TearDown() override {
    coordinator.reset();
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  void makeCoordinator(const std::string &tool) {
    coordinator = std::make_unique<TransferCoordinator>(
        TransferCommand(tool), (test_dir / "logs" / "transfers.log").string(),
        queue);
  }

  std::string p(const std::string &relative) const {
    return normalizePath(test_dir / relative);
  }

  TransferRequest request(std::vector<std::string> sources,
                          const std::string &destination) const {
    TransferRequest req;
    for (const auto &source : sources)
      req.sources.push_back(p(source));
    req.destination = p(destination);
    return req;
  }

  /** @brief Applies queued notifications until @p done holds */
  bool pump(const std::function<bool()> &done,
            std::chrono::milliseconds timeout = 10000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
      if (std::chrono::steady_clock::now() > deadline)
        return false;
      queue->waitFor(20ms);
      for (auto &message : queue->drain()) {
        if (auto *started = std::get_if<TransferStarted>(&message)) {
          coordinator->apply(*started);
        } else if (auto *output = std::get_if<TransferOutput>(&message)) {
          coordinator->apply(*output);
          outputs.push_back(*output);
        } else if (auto *finished = std::get_if<TransferFinished>(&message)) {
          coordinator->apply(*finished);
          coordinator->acknowledge(finished->job_id);
        }
      }
    }
    return true;
  }

  bool pumpUntilState(int id, JobState state) {
    return pump([&] { return coordinator->job(id)->state == state; });
  }

  bool pumpUntilFinished(int id) {
    return pump([&] { return isTerminal(coordinator->job(id)->state); });
  }
};

TEST_F(TransferCoordinatorTest, RefusesEmptyRequest) {
  auto result = coordinator->start(TransferRequest{});

  EXPECT_FALSE(result.ok());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, TransferError::NothingSelected);
  EXPECT_FALSE(coordinator->attachedActive().has_value());
}

TEST_F(TransferCoordinatorTest, RefusesInvalidTarget) {
  auto result = coordinator->start(request({"a"}, "a/foo"));

  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, TransferError::InvalidTarget);
  EXPECT_NE(result.message.find(p("a")), std::string::npos);

  EXPECT_EQ(coordinator->job(1), nullptr);
  EXPECT_FALSE(coordinator->attachedActive().has_value());
  EXPECT_FALSE(fs::exists(tool_dir / "calls.log"));
}

TEST_F(TransferCoordinatorTest, RefusesSecondAttachedJob) {
  writeText(tool_dir / "sleep", "30");

  auto first = coordinator->start(request({"a/foo"}, "b"));
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(coordinator->attachedActive().value_or(0), first.job_id);

  auto second = coordinator->start(request({"a/bar.txt"}, "b"));
  ASSERT_TRUE(second.error.has_value());
  EXPECT_EQ(*second.error, TransferError::Busy);

  ASSERT_TRUE(pumpUntilState(first.job_id, JobState::Running));
  EXPECT_TRUE(coordinator->cancel(first.job_id));
  ASSERT_TRUE(pumpUntilFinished(first.job_id));
}

TEST_F(TransferCoordinatorTest, ReportsLaunchFailure) {
  makeCoordinator((test_dir / "no" / "such" / "tool").string());

  auto result = coordinator->start(request({"a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(pumpUntilFinished(result.job_id));

  const TransferJob *job = coordinator->job(result.job_id);
  EXPECT_EQ(job->state, JobState::Failed);
  ASSERT_TRUE(job->failure.has_value());
  EXPECT_EQ(job->failure->error, TransferError::LaunchFailed);
  EXPECT_FALSE(job->failure->message.empty());
}

TEST_F(TransferCoordinatorTest, CopySucceeds) {
  auto result = coordinator->start(request({"a/foo", "a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.warning.empty());

  const TransferJob *job = coordinator->job(result.job_id);
  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->state, JobState::Pending);
  EXPECT_EQ(job->invocations_total, 2u);

  bool saw_running = false;
  ASSERT_TRUE(pump([&] {
    saw_running = saw_running || job->state == JobState::Running;
    return isTerminal(job->state);
  }));

  EXPECT_TRUE(saw_running);
  EXPECT_EQ(job->state, JobState::Succeeded);
  EXPECT_FALSE(job->failure.has_value());
  EXPECT_EQ(job->invocations_started, 2u);

  EXPECT_TRUE(fs::exists(test_dir / "b" / "foo" / "inner.txt"));
  EXPECT_TRUE(fs::exists(test_dir / "b" / "bar.txt"));
  EXPECT_TRUE(fs::exists(test_dir / "a" / "foo"));

  auto calls = fakeToolCalls(tool_dir);
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].rfind("copy " + p("a/foo") + " " + p("b/foo"), 0), 0u);
  EXPECT_EQ(calls[1].rfind("copy " + p("a/bar.txt") + " " + p("b"), 0), 0u);
  EXPECT_FALSE(coordinator->attachedActive().has_value());
}

TEST_F(TransferCoordinatorTest, ProgressLinesAreParsed) {
  auto result = coordinator->start(request({"a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(pumpUntilFinished(result.job_id));

  bool saw_stats = false;
  bool saw_notice = false;
  for (const auto &out : outputs) {
    if (out.is_stats) {
      saw_stats = true;
      ASSERT_TRUE(out.progress.has_value());
      EXPECT_EQ(out.progress->percent, 100);
    } else if (out.line.find("Copied") != std::string::npos) {
      saw_notice = true;
    }
  }
  EXPECT_TRUE(saw_stats);
  EXPECT_TRUE(saw_notice);
  EXPECT_EQ(coordinator->job(result.job_id)->progress.bytes_total, 1024u);
}

TEST_F(TransferCoordinatorTest, NonZeroExitStopsAtFirstFailure) {
  writeText(tool_dir / "exit_code", "7");

  auto result = coordinator->start(request({"a/foo", "a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(pumpUntilFinished(result.job_id));

  const TransferJob *job = coordinator->job(result.job_id);
  EXPECT_EQ(job->state, JobState::Failed);
  ASSERT_TRUE(job->failure.has_value());
  EXPECT_EQ(job->failure->error, TransferError::ExternalToolExitNonZero);
  EXPECT_EQ(job->failure->exit_code, 7);
  EXPECT_NE(job->failure->message.find("7"), std::string::npos);

  EXPECT_EQ(fakeToolCalls(tool_dir).size(), 1u);
  EXPECT_TRUE(fs::exists(test_dir / "a" / "bar.txt"));
}

TEST_F(TransferCoordinatorTest, CancelStopsRunningJob) {
  writeText(tool_dir / "sleep", "30");

  auto result = coordinator->start(request({"a/foo", "a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  // Not running yet from the loop's point of view
  EXPECT_FALSE(coordinator->cancel(result.job_id));

  ASSERT_TRUE(pumpUntilState(result.job_id, JobState::Running));
  // Wait until the first invocation is inside the tool
  ASSERT_TRUE(pump([&] { return fakeToolCalls(tool_dir).size() == 1u; }));

  auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(coordinator->cancel(result.job_id));
  ASSERT_TRUE(pumpUntilFinished(result.job_id));
  EXPECT_LT(std::chrono::steady_clock::now() - before, 10s);

  const TransferJob *job = coordinator->job(result.job_id);
  EXPECT_EQ(job->state, JobState::Cancelled);
  // The second source was never started
  EXPECT_EQ(fakeToolCalls(tool_dir).size(), 1u);
  EXPECT_FALSE(coordinator->cancel(result.job_id));
}

TEST_F(TransferCoordinatorTest, DetachedJobWritesToLogFile) {
  writeText(tool_dir / "sleep", "1");

  TransferRequest req = request({"a/foo"}, "b");
  req.run_mode = RunMode::Detached;

  auto result = coordinator->start(req);
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(coordinator->attachedActive().has_value());
  EXPECT_EQ(coordinator->detachedRunning(), 1u);

  ASSERT_TRUE(pumpUntilState(result.job_id, JobState::Running));
  EXPECT_FALSE(coordinator->cancel(result.job_id));

  ASSERT_TRUE(pumpUntilFinished(result.job_id));
  const TransferJob *job = coordinator->job(result.job_id);
  EXPECT_EQ(job->state, JobState::Succeeded);
  EXPECT_EQ(job->log_file, (test_dir / "logs" / "transfers.log").string());
  EXPECT_EQ(coordinator->detachedRunning(), 0u);

  std::string log = readText(test_dir / "logs" / "transfers.log");
  EXPECT_NE(log.find("=== "), std::string::npos);
  EXPECT_NE(log.find("Copied"), std::string::npos);
  // Output went to the file, not to the queue
  EXPECT_TRUE(outputs.empty());
  EXPECT_TRUE(fs::exists(test_dir / "b" / "foo" / "inner.txt"));
}

TEST_F(TransferCoordinatorTest, SurvivesMalformedProgressOutput) {
  auto script = tool_dir / "noisy_tool.sh";
  writeText(script, R"SH(#!/bin/sh
echo "2024/01/01 10:00:00 INFO  : a 1 B/2 B, 99999999999 x/f.txt: Copied (new)"
echo "Transferred:   1 KiB / 1 KiB, 99999999999%, 1 KiB/s, ETA 0s"
exit 0
)SH");
  fs::permissions(script, fs::perms::owner_all);
  makeCoordinator(script.string());

  auto result = coordinator->start(request({"a/bar.txt"}, "b"));
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(pumpUntilFinished(result.job_id));

  EXPECT_EQ(coordinator->job(result.job_id)->state, JobState::Succeeded);
  ASSERT_EQ(outputs.size(), 2u);
  EXPECT_FALSE(outputs[0].is_stats);
  EXPECT_NE(outputs[0].line.find("Copied"), std::string::npos);
  EXPECT_TRUE(outputs[1].is_stats);
  ASSERT_TRUE(outputs[1].progress.has_value());
  EXPECT_EQ(outputs[1].progress->percent, 100);
}

TEST_F(TransferCoordinatorTest, DetachedJobOutlivesCoordinator) {
  writeText(tool_dir / "sleep", "1");
  writeText(tool_dir / "exit_code", "3");

  TransferRequest req = request({"a/foo"}, "b");
  req.run_mode = RunMode::Detached;
  auto result = coordinator->start(req);
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(pumpUntilState(result.job_id, JobState::Running));

  // Tear down the way the program exits: coordinator first, then logging
  coordinator.reset();
  spdlog::shutdown();

  bool finished = false;
  auto deadline = std::chrono::steady_clock::now() + 10s;
  while (!finished && std::chrono::steady_clock::now() < deadline) {
    queue->waitFor(20ms);
    for (auto &message : queue->drain()) {
      if (auto *done = std::get_if<TransferFinished>(&message)) {
        EXPECT_EQ(done->state, JobState::Failed);
        finished = true;
      }
    }
  }

  spdlog::set_default_logger(std::make_shared<spdlog::logger>(
      "test", std::make_shared<spdlog::sinks::null_sink_mt>()));
  EXPECT_TRUE(finished);
}
