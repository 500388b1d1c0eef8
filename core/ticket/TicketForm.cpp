#include "core/ticket/TicketForm.h"

#include <cctype>
#include <limits>
#include <utility>

std::optional<std::size_t> parseCount(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  if (begin < end && text[begin] == '+') {
    ++begin;
  }
  if (begin == end) {
    return std::nullopt;
  }

  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
  std::size_t value = 0;
  for (std::size_t i = begin; i < end; ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (!std::isdigit(c)) {
      return std::nullopt;
    }
    const std::size_t digit = static_cast<std::size_t>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

std::optional<GenerationRequest> TicketForm::toRequest() const {
  if (!filePath || filePath->empty()) {
    return std::nullopt;
  }
  std::string chars = alphabet();
  if (chars.empty()) {
    return std::nullopt;
  }
  if (ticketLength == 0 || ticketCount == 0) {
    return std::nullopt;
  }

  GenerationRequest request;
  request.alphabet = std::move(chars);
  request.file_path = *filePath;
  request.token_count = ticketCount;
  request.token_length = ticketLength;
  return request;
}

bool TicketForm::setTicketCountText(const std::string& text) {
  const auto parsed = parseCount(text);
  if (!parsed) {
    return false;
  }
  ticketCount = *parsed;
  return true;
}

bool TicketForm::setTicketLengthText(const std::string& text) {
  const auto parsed = parseCount(text);
  if (!parsed) {
    return false;
  }
  ticketLength = *parsed;
  return true;
}
