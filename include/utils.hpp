#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Utility functions
std::string trim(const std::string &str);
std::string to_lower(std::string value);

// Decodes %XX escapes in a URL path segment ('+' stays literal). Returns nullopt on a broken escape.
std::optional<std::string> url_decode(std::string_view encoded);

// Strict base-10 parse of a non-negative integer; no sign, no whitespace, no overflow.
std::optional<uint64_t> parse_u64(std::string_view text);
