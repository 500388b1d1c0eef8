#pragma once

#include <string>

/**
 * @file Alphabet.h
 * @brief 票据字符集的字符类别定义与构建。
 */

namespace charset {
inline constexpr char kCapitals[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr char kLowercase[] = "abcdefghijklmnopqrstuvwxyz";
inline constexpr char kDigits[] = "0123456789";
inline constexpr char kSpecials[] = ",.;:\"'!%#";
} // namespace charset

/// 字符类别开关与排除字符。
struct AlphabetOptions {
  bool capitals{false};   ///< 大写字母 A-Z。
  bool lowercase{false};  ///< 小写字母 a-z。
  bool digits{false};     ///< 数字 0-9。
  bool specials{false};   ///< 特殊符号 ,.;:"'!%#
  std::string excluded;   ///< 需要从结果中剔除的字符（逐字符匹配）。
};

/**
 * @brief 按“大写、小写、数字、特殊符号”的固定顺序拼接已启用类别，再剔除排除字符。
 * @return 可能为空；调用方需在生成前检查。
 */
std::string buildAlphabet(const AlphabetOptions& options);

/**
 * @brief 从 chars 中移除所有出现在 excluded 中的字符，保持原有顺序。
 */
std::string filterExcluded(const std::string& chars, const std::string& excluded);
