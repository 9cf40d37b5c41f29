// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace custody {
namespace util {

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  // std::stoll skips leading whitespace; reject it explicitly
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int64_t>(value);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::string ToLower(std::string_view str) {
  std::string out(str);
  for (char &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string Trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::vector<std::string> SplitList(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string_view::npos) {
      next = str.size();
    }
    std::string part = Trim(str.substr(pos, next - pos));
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
    pos = next + 1;
  }
  return parts;
}

std::string MediaType(std::string_view content_type) {
  return ToLower(Trim(content_type.substr(0, content_type.find(';'))));
}

namespace {

int Base64Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-' || c == '+') return 62;
  if (c == '_' || c == '/') return 63;
  return -1;
}

} // namespace

std::optional<std::vector<uint8_t>> Base64UrlDecode(std::string_view input) {
  while (!input.empty() && input.back() == '=') {
    input.remove_suffix(1);
  }
  // A single trailing sextet cannot encode a whole byte
  if (input.size() % 4 == 1) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(input.size() * 3 / 4);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : input) {
    int v = Base64Value(c);
    if (v < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
    }
  }
  return out;
}

} // namespace util
} // namespace custody
