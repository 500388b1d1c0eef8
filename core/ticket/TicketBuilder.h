#pragma once

#include <cstddef>

#include "core/ticket/GenerationRequest.h"

/**
 * @file TicketBuilder.h
 * @brief 按请求生成不重复票据并逐行写入 CSV。
 */

/**
 * @brief 执行一次完整的生成与写入。
 *
 * 先校验票据空间是否足够，再创建文件；每个票据写入成功后才加入去重集合。
 * 失败时立即中止，已写入的行保留在文件中。
 *
 * @return 实际写入的行数（等于 request.token_count）。
 * @throws TokenSpaceError 票据空间不足以容纳 token_count 个不重复票据。
 * @throws CsvError 文件创建或写入失败。
 * @throws std::invalid_argument 字符集为空或长度为 0。
 */
std::size_t writeTickets(const GenerationRequest& request);
