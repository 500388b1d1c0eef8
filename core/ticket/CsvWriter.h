#pragma once

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

/**
 * @file CsvWriter.h
 * @brief 单列 CSV 输出，遵循标准引号规则。
 */

/**
 * @brief CSV 文件创建或写入失败。
 */
class CsvError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief 对单个字段做 CSV 转义。
 *
 * 字段包含逗号、双引号、\\r 或 \\n 时整体加引号，内部双引号成对转义。
 */
std::string escapeCsvField(const std::string& field);

/**
 * @brief 单字段记录的 CSV 写入器，构造时创建（或截断）目标文件。
 */
class CsvWriter {
public:
  /// @throws CsvError 无法创建文件。
  explicit CsvWriter(const std::string& path);

  CsvWriter(const CsvWriter&) = delete;
  CsvWriter& operator=(const CsvWriter&) = delete;

  /**
   * @brief 写入一条仅含 field 的记录，以 \\n 结尾。
   * @throws CsvError 写入失败。
   */
  void writeRecord(const std::string& field);

  /// @throws CsvError 刷新失败。
  void flush();

  std::size_t recordsWritten() const { return records_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  std::ofstream out_;
  std::size_t records_{0};
};
