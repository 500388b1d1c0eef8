#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "core/ticket/TicketForm.h"

/**
 * @brief 存储应用程序的所有配置项。
 *
 * 仅保存表单的默认值与上次使用的目录；目标文件本身不持久化。
 */
struct Settings {
  bool capitals{true};      ///< 默认勾选大写字母。
  bool lowercase{false};    ///< 默认勾选小写字母。
  bool digits{true};        ///< 默认勾选数字。
  bool specials{false};     ///< 默认勾选特殊符号。
  std::string excludedChars; ///< 默认排除字符。
  std::size_t ticketCount{100};  ///< 默认票据数量。
  std::size_t ticketLength{8};   ///< 默认票据长度。
  std::string lastDirectory; ///< 上次保存 CSV 的目录，用作文件对话框起始位置。

  /**
   * @brief 从指定路径加载配置，若文件不存在或损坏则写入默认值。
   */
  static Settings loadFrom(const std::filesystem::path& path);

  /**
   * @brief 将当前配置保存到默认路径。
   * @return 写入是否成功。
   */
  bool save() const;

  /**
   * @brief 将当前配置保存到指定路径，必要时创建父目录。
   * @return 写入是否成功。
   */
  bool saveTo(const std::filesystem::path& path) const;

  /// 以当前配置初始化表单状态（不含目标文件）。
  TicketForm toForm() const;

  /// 记录表单中的可持久化字段。
  void updateFromForm(const TicketForm& form);

  /**
   * @brief 获取默认配置文件路径（跨平台）。
   * @return 配置文件路径。
   */
  static std::filesystem::path defaultSettingsPath();
};
