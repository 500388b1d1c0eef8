#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "TestUtils.h"
#include "core/ticket/GenerationJob.h"

using testutil::TempPath;

namespace {

GenerationRequest makeRequest(const std::string& path, std::size_t count = 20, std::size_t length = 5) {
  GenerationRequest request;
  request.alphabet = "ABCDEFGH23456789";
  request.file_path = path;
  request.token_count = count;
  request.token_length = length;
  request.seed = 2024u;
  return request;
}

std::optional<GenerationOutcome> pollUntilDone(GenerationJob& job) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto outcome = job.poll()) {
      return outcome;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return std::nullopt;
}

} // namespace

TEST(GenerationJobTest, IdleJobHasNothingToReport) {
  GenerationJob job;
  EXPECT_FALSE(job.isBusy());
  EXPECT_FALSE(job.poll().has_value());
  EXPECT_FALSE(job.wait().has_value());
}

TEST(GenerationJobTest, SuccessfulRunReportsOnceAndWritesFile) {
  TempPath tmp;
  GenerationJob job;
  ASSERT_TRUE(job.start(makeRequest(tmp.str())));

  const auto outcome = pollUntilDone(job);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->success);
  EXPECT_EQ(outcome->message, "Successfully wrote to CSV");

  EXPECT_FALSE(job.isBusy());
  EXPECT_FALSE(job.poll().has_value());
  EXPECT_EQ(testutil::readSingleColumn(tmp.path()).size(), 20u);
}

TEST(GenerationJobTest, FailureIsReportedAsMessage) {
  TempPath dir("");
  GenerationJob job;
  ASSERT_TRUE(job.start(makeRequest((dir.path() / "missing" / "out.csv").string())));

  const auto outcome = job.wait();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->success);
  EXPECT_NE(outcome->message.find("Failed to create file"), std::string::npos) << outcome->message;
}

TEST(GenerationJobTest, TokenSpaceExhaustionIsReportedAsMessage) {
  TempPath tmp;
  GenerationRequest request = makeRequest(tmp.str(), 3, 1);
  request.alphabet = "AB";

  GenerationJob job;
  ASSERT_TRUE(job.start(request));
  const auto outcome = job.wait();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->success);
  EXPECT_NE(outcome->message.find("exhausted token space"), std::string::npos) << outcome->message;
  EXPECT_FALSE(std::filesystem::exists(tmp.path()));
}

TEST(GenerationJobTest, RefusesSecondRunWhileFirstIsInFlight) {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> runs{0};

  GenerationJob job([gate, &runs](const GenerationRequest&) {
    ++runs;
    gate.wait();
  });

  ASSERT_TRUE(job.start(makeRequest("first.csv")));
  EXPECT_TRUE(job.isBusy());
  EXPECT_FALSE(job.start(makeRequest("second.csv")));
  EXPECT_FALSE(job.poll().has_value());

  release.set_value();
  const auto outcome = job.wait();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->success);
  EXPECT_EQ(runs.load(), 1);
}

TEST(GenerationJobTest, UnconsumedOutcomeStillBlocksNewRun) {
  GenerationJob job([](const GenerationRequest&) {});
  ASSERT_TRUE(job.start(makeRequest("a.csv")));

  // 结果未被取走前，界面仍视为运行中
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(job.start(makeRequest("b.csv")));

  ASSERT_TRUE(job.wait().has_value());
  EXPECT_TRUE(job.start(makeRequest("c.csv")));
  ASSERT_TRUE(job.wait().has_value());
}

TEST(GenerationJobTest, RunnerExceptionBecomesFailedOutcome) {
  GenerationJob job([](const GenerationRequest&) { throw std::runtime_error("Failed to write to file: disk full"); });
  ASSERT_TRUE(job.start(makeRequest("x.csv")));
  const auto outcome = job.wait();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->success);
  EXPECT_EQ(outcome->message, "Failed to write to file: disk full");
}

TEST(GenerationJobTest, WorkerRunsOffCallingThread) {
  std::thread::id workerId;
  GenerationJob job([&workerId](const GenerationRequest&) { workerId = std::this_thread::get_id(); });
  ASSERT_TRUE(job.start(makeRequest("y.csv")));
  ASSERT_TRUE(job.wait().has_value());
  EXPECT_NE(workerId, std::this_thread::get_id());
}
