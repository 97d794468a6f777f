#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Base-1024 display strings: "0 B/s", "512 B/s", "1.00 KB/s", "1.50 MB/s", ...
std::string format_rate(uint64_t bytes_per_sec);
std::string format_size(uint64_t bytes); // up to TB

// Inverse of format_rate for ordering only. Lossy: "1.00 MB/s" comes back
// as exactly 1 MiB whatever the original rate was. Unparsable text is 0.
uint64_t parse_rate(const std::string& text);

// User input such as "5m", "500 KB/s", "1g", "unlimited". A bare number is
// MB/s; 0, empty, "unlimited" and "none" mean no limit (0).
std::optional<uint64_t> parse_speed_limit(const std::string& input);
std::string             format_speed_limit(uint64_t bytes_per_sec);

std::string truncate_text(const std::string& text, size_t max_len);

// Number of set bits in a hex string such as aria2's piece bitfield.
// Characters that are not hex digits count as zero.
uint32_t count_set_bits_hex(const std::string& hex);

// Percent-decoding with '+' as space; malformed escapes are kept literally.
std::string url_decode(const std::string& s);

// Name shown for a freshly added transfer before the daemon reports files:
// the magnet dn= parameter, or the last path segment of a URL or file path.
std::string display_name_for(const std::string& source);
