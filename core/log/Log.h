#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/**
 * @file Log.h
 * @brief 日志初始化工具。
 */

/// 日志文件名，默认放在配置目录下。
inline constexpr char kLogFileName[] = "ticket-randomizer.log";

/**
 * @brief 初始化全局日志器（幂等）。
 *
 * 同时输出到控制台和 logFile；logFile 所在目录不可用时仅输出到控制台。
 * @param logFile 日志文件路径，每次启动截断。
 */
inline void initLogging(const std::filesystem::path& logFile = kLogFileName) {
  if (spdlog::get("multi_sink")) {
    return;
  }
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
  std::vector<spdlog::sink_ptr> sinks{console_sink};

  std::string fileError;
  try {
    if (logFile.has_parent_path()) {
      std::filesystem::create_directories(logFile.parent_path());
    }
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);
  } catch (const std::exception& ex) {
    fileError = ex.what();
  }

  auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::info);
  spdlog::set_default_logger(logger);

  if (!fileError.empty()) {
    spdlog::warn("File logging disabled, cannot open {}: {}", logFile.string(), fileError);
  }
}
