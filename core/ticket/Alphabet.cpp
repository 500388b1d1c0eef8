#include "core/ticket/Alphabet.h"

#include <algorithm>
#include <iterator>

std::string buildAlphabet(const AlphabetOptions& options) {
  std::string buf;
  if (options.capitals) {
    buf += charset::kCapitals;
  }
  if (options.lowercase) {
    buf += charset::kLowercase;
  }
  if (options.digits) {
    buf += charset::kDigits;
  }
  if (options.specials) {
    buf += charset::kSpecials;
  }
  return filterExcluded(buf, options.excluded);
}

std::string filterExcluded(const std::string& chars, const std::string& excluded) {
  if (excluded.empty()) {
    return chars;
  }
  std::string result;
  result.reserve(chars.size());
  std::copy_if(chars.begin(), chars.end(), std::back_inserter(result),
               [&excluded](char c) { return excluded.find(c) == std::string::npos; });
  return result;
}
