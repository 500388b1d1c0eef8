#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/ticket/Alphabet.h"
#include "core/ticket/GenerationRequest.h"

/**
 * @file TicketForm.h
 * @brief 界面可编辑的表单状态，以及提交时到 GenerationRequest 的校验转换。
 */

/**
 * @brief 解析非负十进制整数：忽略首尾空白，允许前导 '+'，溢出视为失败。
 */
std::optional<std::size_t> parseCount(const std::string& text);

/**
 * @brief 票据表单状态，由界面层持有并随用户输入修改。
 */
struct TicketForm {
  AlphabetOptions charset;
  std::size_t ticketCount{0};
  std::size_t ticketLength{0};
  std::optional<std::string> filePath; ///< 未选择目标文件时为空。

  /// 当前勾选与排除条件下的字符集。
  std::string alphabet() const { return buildAlphabet(charset); }

  /**
   * @brief 校验并生成一次性请求。
   * @return 缺少目标文件、字符集为空、数量或长度为 0 时返回空，不视为错误。
   */
  std::optional<GenerationRequest> toRequest() const;

  /**
   * @brief 以文本更新票据数量；解析失败时保留原值并返回 false。
   */
  bool setTicketCountText(const std::string& text);

  /**
   * @brief 以文本更新票据长度；解析失败时保留原值并返回 false。
   */
  bool setTicketLengthText(const std::string& text);
};
