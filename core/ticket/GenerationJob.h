#pragma once

#include <functional>
#include <future>
#include <optional>

#include "core/ticket/GenerationRequest.h"

/**
 * @file GenerationJob.h
 * @brief 后台生成任务：同一时刻只允许一个任务运行，结束状态通过 future 回传一次。
 */
class GenerationJob {
public:
  /// 实际执行生成的函数，默认为 writeTickets。
  using Runner = std::function<void(const GenerationRequest&)>;

  GenerationJob();
  explicit GenerationJob(Runner runner);
  /// 析构时等待未完成的任务。
  ~GenerationJob();

  GenerationJob(const GenerationJob&) = delete;
  GenerationJob& operator=(const GenerationJob&) = delete;

  /**
   * @brief 在独立工作线程上启动生成。
   * @return 已有任务运行中或其结果尚未被取走时返回 false。
   */
  bool start(GenerationRequest request);

  /// 有任务运行中，或其结果尚未被 poll/wait 取走。
  bool isBusy() const { return pending_.valid(); }

  /**
   * @brief 非阻塞地取走已结束任务的状态；未结束或无任务时返回空。
   */
  std::optional<GenerationOutcome> poll();

  /**
   * @brief 阻塞等待当前任务结束并取走状态；无任务时返回空。
   */
  std::optional<GenerationOutcome> wait();

private:
  Runner runner_;
  std::future<GenerationOutcome> pending_;
};
