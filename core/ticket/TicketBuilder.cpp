#include "core/ticket/TicketBuilder.h"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/ticket/CsvWriter.h"
#include "core/ticket/TokenGenerator.h"

namespace {

constexpr std::size_t kMaxReserve = 1u << 20;

} // namespace

std::size_t writeTickets(const GenerationRequest& request) {
  TokenGenerator generator(request.alphabet, request.token_length, request.seed);

  const std::size_t capacity = generator.capacity();
  if (request.token_count > capacity) {
    throw TokenSpaceError("exhausted token space: " + std::to_string(request.alphabet.size()) +
                          " characters at length " + std::to_string(request.token_length) + " allow only " +
                          std::to_string(capacity) + " unique tokens, " + std::to_string(request.token_count) +
                          " requested");
  }

  CsvWriter writer(request.file_path);
  spdlog::info("Generating {} tickets of length {} from {} characters into {}", request.token_count,
               request.token_length, request.alphabet.size(), request.file_path);

  std::unordered_set<std::string> generated;
  generated.reserve(std::min<std::size_t>(request.token_count, kMaxReserve));
  for (std::size_t i = 0; i < request.token_count; ++i) {
    std::string token = generator.next(generated);
    writer.writeRecord(token);
    generated.insert(std::move(token));
  }
  writer.flush();

  spdlog::info("Wrote {} tickets to {}", writer.recordsWritten(), request.file_path);
  return writer.recordsWritten();
}
