#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util {

// RFC 1123 date, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
std::string rfc1123_gmt(std::int64_t epoch_seconds);
std::int64_t unix_now_seconds();

// Percent-decode (URL decoding). Returns std::nullopt on malformed encoding.
std::optional<std::string> percent_decode(std::string_view in);

// Percent-encode a URL path component.
// If encode_slash is false, '/' is left as-is.
std::string percent_encode(std::string_view in, bool encode_slash);

// Parse query string "a=b&c=d" into vector of (k,v). Decodes percent-encoding.
std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query);

// Build "a=b&c=d" from (k,v) pairs, percent-encoding both sides. Order is kept.
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

// Trim and collapse runs of whitespace into a single space.
std::string trim_and_collapse_ws(std::string_view s);

// Drop leading and trailing whitespace only.
std::string trim_ws(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);
std::string to_lower(std::string_view s);

// Cryptography helpers
std::vector<std::uint8_t> sha256_bin(std::string_view data);
std::string hex_lower(const std::vector<std::uint8_t>& bytes);
std::string md5_hex(std::string_view data);

// Base64 for continuation tokens
std::string base64_encode(std::string_view in);
std::optional<std::string> base64_decode(std::string_view in);

// Base-58 with the Bitcoin alphabet.
std::string base58_encode(std::string_view in);
std::optional<std::string> base58_decode(std::string_view in);

// Base-58 check encoding: version byte, payload, 4 byte double SHA-256 checksum.
std::string base58_check_encode(std::string_view payload, std::uint8_t version);

struct CheckDecoded {
  std::string payload;
  std::uint8_t version = 0;
};

// Returns std::nullopt on invalid characters, short input or checksum mismatch.
std::optional<CheckDecoded> base58_check_decode(std::string_view in);

std::string html_escape(std::string_view s);

// Human readable base-10 size, e.g. "0 B", "512 B", "1.5 KB", "2.0 MB".
std::string format_size_base10(std::int64_t size);

// Lexically clean a slash separated path: collapse "//", drop ".", resolve "..".
// The result is rooted ("/" for an empty path).
std::string clean_path(std::string_view path);

// Guess a MIME type from the extension of the last key segment.
std::string content_type_for_key(std::string_view key);

} // namespace util
