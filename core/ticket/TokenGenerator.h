#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>

/**
 * @file TokenGenerator.h
 * @brief 基于拒绝采样的定长随机票据生成器。
 */

/**
 * @brief 票据空间耗尽：无法再生成不重复的票据。
 */
class TokenSpaceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief 计算 alphabetSize^length，溢出时饱和为 size_t 最大值。
 */
std::size_t tokenSpaceSize(std::size_t alphabetSize, std::size_t length);

/**
 * @brief 从字符集中逐位均匀抽取字符组成票据，与已生成集合重复时整体重抽。
 *
 * 每个票据的重抽次数上限为 max(maxAttempts, kAttemptScale * capacity / 剩余数)，
 * 票据空间接近填满时随之放大；空间确实用尽或超过上限时抛出 TokenSpaceError。
 */
class TokenGenerator {
public:
  static constexpr std::size_t kDefaultMaxAttempts = 1000000;
  static constexpr std::size_t kAttemptScale = 64;

  /**
   * @param alphabet 非空字符集。
   * @param tokenLength 票据长度，必须大于 0。
   * @param seed 指定种子以复现结果；为空时使用 std::random_device。
   * @param maxAttempts 单个票据抽取次数上限的下界。
   * @throws std::invalid_argument 字符集为空、长度为 0 或 maxAttempts 为 0。
   */
  TokenGenerator(std::string alphabet,
                 std::size_t tokenLength,
                 std::optional<unsigned int> seed = std::nullopt,
                 std::size_t maxAttempts = kDefaultMaxAttempts);

  /// 抽取一个票据，不做去重。
  std::string draw();

  /**
   * @brief 生成一个不在 taken 中的票据。
   * @throws TokenSpaceError taken 已占满票据空间，或抽取次数超过 attemptBudget()。
   */
  std::string next(const std::unordered_set<std::string>& taken);

  /// 已占用 takenCount 个票据时 next() 的抽取次数上限；空间已满时为 0。
  std::size_t attemptBudget(std::size_t takenCount) const;

  /// 当前字符集与长度可组成的票据总数（饱和）。
  std::size_t capacity() const;

  const std::string& alphabet() const { return alphabet_; }
  std::size_t tokenLength() const { return tokenLength_; }

private:
  std::string alphabet_;
  std::size_t tokenLength_;
  std::size_t maxAttempts_;
  std::mt19937 rng_;
  std::uniform_int_distribution<std::size_t> pick_;
};
