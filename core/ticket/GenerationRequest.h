#pragma once

#include <cstddef>
#include <optional>
#include <string>

/**
 * @file GenerationRequest.h
 * @brief 单次生成任务的参数与结果。
 */

/// 经过校验的一次性生成参数，提交时由表单状态构建，运行结束即丢弃。
struct GenerationRequest {
  std::string alphabet;
  std::string file_path;
  std::size_t token_count{0};
  std::size_t token_length{0};
  std::optional<unsigned int> seed; ///< 为空时使用随机种子。
};

/// 一次生成任务的结束状态，message 为展示给用户的唯一状态文本。
struct GenerationOutcome {
  bool success{false};
  std::string message;
};
