#include "core/ticket/CsvWriter.h"

#include <cerrno>
#include <system_error>

namespace {

std::string lastOsError() {
  const int code = errno;
  if (code == 0) {
    return "unknown error";
  }
  return std::error_code(code, std::generic_category()).message();
}

bool needsQuotes(const std::string& field) {
  return field.find_first_of(",\"\r\n") != std::string::npos;
}

} // namespace

std::string escapeCsvField(const std::string& field) {
  // 单列记录中的空字段写成 "" 以免读回时被当作空行
  if (field.empty()) {
    return "\"\"";
  }
  if (!needsQuotes(field)) {
    return field;
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

CsvWriter::CsvWriter(const std::string& path) : path_(path) {
  errno = 0;
  out_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out_.is_open()) {
    throw CsvError("Failed to create file " + path_ + ": " + lastOsError());
  }
}

void CsvWriter::writeRecord(const std::string& field) {
  errno = 0;
  out_ << escapeCsvField(field) << '\n';
  if (!out_) {
    throw CsvError("Failed to write to file: " + lastOsError());
  }
  ++records_;
}

void CsvWriter::flush() {
  errno = 0;
  out_.flush();
  if (!out_) {
    throw CsvError("Failed to write to file: " + lastOsError());
  }
}
