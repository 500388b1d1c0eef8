#include "core/ticket/GenerationJob.h"

#include <chrono>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/ticket/TicketBuilder.h"

namespace {

const char* const kSuccessMessage = "Successfully wrote to CSV";

GenerationOutcome runGuarded(const GenerationJob::Runner& runner, const GenerationRequest& request) {
  try {
    runner(request);
    return {true, kSuccessMessage};
  } catch (const std::exception& ex) {
    spdlog::error("Ticket generation into {} failed: {}", request.file_path, ex.what());
    return {false, ex.what()};
  }
}

} // namespace

GenerationJob::GenerationJob()
    : runner_([](const GenerationRequest& request) { writeTickets(request); }) {}

GenerationJob::GenerationJob(Runner runner) : runner_(std::move(runner)) {}

GenerationJob::~GenerationJob() {
  if (pending_.valid()) {
    pending_.wait();
  }
}

bool GenerationJob::start(GenerationRequest request) {
  if (pending_.valid()) {
    spdlog::debug("Generation already in progress, ignoring new request");
    return false;
  }
  // 请求按值移入工作线程，运行期间不与界面层共享可变状态
  pending_ = std::async(std::launch::async, [runner = runner_, request = std::move(request)]() {
    return runGuarded(runner, request);
  });
  return true;
}

std::optional<GenerationOutcome> GenerationJob::poll() {
  if (!pending_.valid()) {
    return std::nullopt;
  }
  if (pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    return std::nullopt;
  }
  return pending_.get();
}

std::optional<GenerationOutcome> GenerationJob::wait() {
  if (!pending_.valid()) {
    return std::nullopt;
  }
  return pending_.get();
}
