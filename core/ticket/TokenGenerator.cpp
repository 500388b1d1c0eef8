#include "core/ticket/TokenGenerator.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace {

std::mt19937 makeEngine(const std::optional<unsigned int>& seed) {
  if (seed) {
    return std::mt19937(*seed);
  }
  std::random_device device;
  return std::mt19937(device());
}

} // namespace

std::size_t tokenSpaceSize(std::size_t alphabetSize, std::size_t length) {
  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
  if (alphabetSize == 0) {
    return length == 0 ? 1 : 0;
  }
  std::size_t total = 1;
  for (std::size_t i = 0; i < length; ++i) {
    if (total > kMax / alphabetSize) {
      return kMax;
    }
    total *= alphabetSize;
  }
  return total;
}

TokenGenerator::TokenGenerator(std::string alphabet,
                               std::size_t tokenLength,
                               std::optional<unsigned int> seed,
                               std::size_t maxAttempts)
    : alphabet_(std::move(alphabet)),
      tokenLength_(tokenLength),
      maxAttempts_(maxAttempts),
      rng_(makeEngine(seed)) {
  if (alphabet_.empty()) {
    throw std::invalid_argument("token alphabet must not be empty");
  }
  if (tokenLength_ == 0) {
    throw std::invalid_argument("token length must be greater than zero");
  }
  if (maxAttempts_ == 0) {
    throw std::invalid_argument("max attempts must be greater than zero");
  }
  pick_ = std::uniform_int_distribution<std::size_t>(0, alphabet_.size() - 1);
}

std::string TokenGenerator::draw() {
  std::string buf;
  buf.reserve(tokenLength_);
  for (std::size_t i = 0; i < tokenLength_; ++i) {
    buf.push_back(alphabet_[pick_(rng_)]);
  }
  return buf;
}

std::size_t TokenGenerator::attemptBudget(std::size_t takenCount) const {
  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
  const std::size_t total = capacity();
  if (takenCount >= total) {
    return 0;
  }
  // 单次命中概率为 free/total，预算按期望抽取次数的 kAttemptScale 倍放大
  const std::size_t expected = total / (total - takenCount);
  const std::size_t scaled = expected > kMax / kAttemptScale ? kMax : expected * kAttemptScale;
  return std::max(maxAttempts_, scaled);
}

std::string TokenGenerator::next(const std::unordered_set<std::string>& taken) {
  const std::size_t budget = attemptBudget(taken.size());
  if (budget == 0) {
    throw TokenSpaceError("exhausted token space: all " + std::to_string(capacity()) + " tokens taken");
  }
  for (std::size_t attempt = 0; attempt < budget; ++attempt) {
    std::string candidate = draw();
    if (taken.count(candidate) == 0) {
      return candidate;
    }
  }
  throw TokenSpaceError("no unused token found after " + std::to_string(budget) + " attempts (" +
                        std::to_string(taken.size()) + " of " + std::to_string(capacity()) + " tokens taken)");
}

std::size_t TokenGenerator::capacity() const {
  return tokenSpaceSize(alphabet_.size(), tokenLength_);
}
