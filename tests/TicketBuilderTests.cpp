#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "TestUtils.h"
#include "core/ticket/Alphabet.h"
#include "core/ticket/CsvWriter.h"
#include "core/ticket/TicketBuilder.h"
#include "core/ticket/TokenGenerator.h"

using testutil::TempPath;

namespace {

GenerationRequest makeRequest(const std::string& alphabet,
                              const std::string& path,
                              std::size_t count,
                              std::size_t length,
                              unsigned int seed = 1234u) {
  GenerationRequest request;
  request.alphabet = alphabet;
  request.file_path = path;
  request.token_count = count;
  request.token_length = length;
  request.seed = seed;
  return request;
}

void expectValidTickets(const std::vector<std::string>& tokens,
                        const std::string& alphabet,
                        std::size_t count,
                        std::size_t length) {
  ASSERT_EQ(tokens.size(), count);
  std::set<std::string> unique(tokens.begin(), tokens.end());
  EXPECT_EQ(unique.size(), count);
  for (const auto& token : tokens) {
    ASSERT_EQ(token.size(), length) << token;
    for (char c : token) {
      EXPECT_NE(alphabet.find(c), std::string::npos) << token;
    }
  }
}

} // namespace

TEST(TicketBuilderTest, WritesRequestedNumberOfUniqueTickets) {
  TempPath tmp;
  const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  const auto written = writeTickets(makeRequest(alphabet, tmp.str(), 500, 6));
  EXPECT_EQ(written, 500u);
  expectValidTickets(testutil::readSingleColumn(tmp.path()), alphabet, 500, 6);
}

TEST(TicketBuilderTest, CapitalsAndDigitsWithVowelsExcluded) {
  AlphabetOptions options;
  options.capitals = true;
  options.digits = true;
  options.excluded = "AEIOU0";
  const std::string alphabet = buildAlphabet(options);

  TempPath tmp;
  writeTickets(makeRequest(alphabet, tmp.str(), 3, 4));

  const auto tokens = testutil::readSingleColumn(tmp.path());
  expectValidTickets(tokens, alphabet, 3, 4);
  for (const auto& token : tokens) {
    EXPECT_EQ(token.find_first_of("AEIOU0"), std::string::npos) << token;
  }
}

TEST(TicketBuilderTest, FillsTokenSpaceExactly) {
  TempPath tmp;
  writeTickets(makeRequest("xy", tmp.str(), 4, 2));
  const auto tokens = testutil::readSingleColumn(tmp.path());
  EXPECT_EQ(std::set<std::string>(tokens.begin(), tokens.end()),
            (std::set<std::string>{"xx", "xy", "yx", "yy"}));
}

TEST(TicketBuilderTest, FillsLargerTokenSpaceExactly) {
  const std::string alphabet = "ABCDEFGHIJ";
  const std::size_t capacity = tokenSpaceSize(alphabet.size(), 5);
  TempPath tmp;
  EXPECT_EQ(writeTickets(makeRequest(alphabet, tmp.str(), capacity, 5, 6u)), capacity);
  expectValidTickets(testutil::readSingleColumn(tmp.path()), alphabet, capacity, 5);
}

TEST(TicketBuilderTest, InsufficientTokenSpaceFailsBeforeCreatingFile) {
  TempPath tmp;
  try {
    writeTickets(makeRequest("AB", tmp.str(), 3, 1));
    FAIL() << "expected TokenSpaceError";
  } catch (const TokenSpaceError& ex) {
    EXPECT_NE(std::string(ex.what()).find("exhausted token space"), std::string::npos);
  }
  EXPECT_FALSE(std::filesystem::exists(tmp.path()));
}

TEST(TicketBuilderTest, SpecialCharactersRoundTripInOrder) {
  const std::string alphabet = ",\"";
  TempPath tmp;
  writeTickets(makeRequest(alphabet, tmp.str(), 8, 3, 99u));

  const std::string raw = testutil::readFile(tmp.path());
  const auto tokens = testutil::readSingleColumn(tmp.path());
  expectValidTickets(tokens, alphabet, 8, 3);

  std::string expected;
  for (const auto& token : tokens) {
    expected += escapeCsvField(token) + "\n";
  }
  EXPECT_EQ(raw, expected);
}

TEST(TicketBuilderTest, SameSeedProducesSameFile) {
  TempPath first;
  TempPath second;
  writeTickets(makeRequest("abcdef012345", first.str(), 50, 5, 77u));
  writeTickets(makeRequest("abcdef012345", second.str(), 50, 5, 77u));
  EXPECT_EQ(testutil::readFile(first.path()), testutil::readFile(second.path()));
}

TEST(TicketBuilderTest, UnwritableDestinationReportsCreateFailure) {
  TempPath dir("");
  const auto target = dir.path() / "missing" / "tickets.csv";
  try {
    writeTickets(makeRequest("ABC", target.string(), 2, 2));
    FAIL() << "expected CsvError";
  } catch (const CsvError& ex) {
    EXPECT_NE(std::string(ex.what()).find("Failed to create file"), std::string::npos);
  }
}

#ifdef __linux__
TEST(TicketBuilderTest, WriteFailureAbortsRunWithOsError) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  try {
    writeTickets(makeRequest("ABCDEFGH", "/dev/full", 20, 4));
    FAIL() << "expected CsvError";
  } catch (const CsvError& ex) {
    const std::string message = ex.what();
    EXPECT_NE(message.find("Failed to write to file"), std::string::npos) << message;
    EXPECT_NE(message.find("No space left on device"), std::string::npos) << message;
  }
}
#endif
