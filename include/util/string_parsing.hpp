// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Parsing helpers for untrusted input (command line, configuration files,
 HTTP headers, message envelopes). None of them throw: malformed input
 yields std::nullopt (or an empty result) and the caller decides how to
 report it.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace custody {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * The whole string must be consumed and the value must lie in [min, max].
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("42x", 0, 100) -> std::nullopt
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse int64_t string with bounds checking (same rules as SafeParseInt)
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * Parse TCP port (1-65535)
 *
 *   SafeParsePort("8020") -> 8020
 *   SafeParsePort("0") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

// ASCII lower-case copy
std::string ToLower(std::string_view str);

// Copy with leading/trailing ASCII whitespace removed
std::string Trim(std::string_view str);

/**
 * Split on a single-character delimiter, trimming each part and dropping
 * empty parts.
 *
 *   SplitList("network, session,,tenant", ',') -> {"network","session","tenant"}
 */
std::vector<std::string> SplitList(std::string_view str, char delimiter);

/**
 * Media type of a Content-Type header value: the part before the first ';',
 * trimmed and lower-cased.
 *
 *   MediaType("Application/JSON; charset=utf-8") -> "application/json"
 */
std::string MediaType(std::string_view content_type);

/**
 * Decode base64url (RFC 4648 section 5). Padding is optional; standard
 * base64 characters '+' and '/' are accepted as well.
 *
 * @return decoded bytes, or std::nullopt on an invalid character or length
 */
std::optional<std::vector<uint8_t>> Base64UrlDecode(std::string_view input);

} // namespace util
} // namespace custody
