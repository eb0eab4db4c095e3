#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace locqa {

// Seconds since epoch rounded down to the start of the UTC day.
std::int64_t day_epoch_now();

// Accepts an integer epoch value or a YYYY-MM-DD date.
std::optional<std::int64_t> parse_day_epoch(const std::string &s);

// YYYYmmdd_HHMMSS in local time, used in backup names.
std::string compact_timestamp();

// Random RFC 4122 version 4 style identifier.
std::string random_id();

std::string xxh3_64_hex(const std::string &s);

// Number of code points in the first byte_pos bytes of a UTF-8 string.
std::size_t utf8_offset(const std::string &text, std::size_t byte_pos);

std::string trim(const std::string &s);
std::string to_lower_ascii(std::string s);

// Escapes the five markup characters. CR is always written as a character
// reference; whitespace-only values are written entirely as references so a
// parser cannot drop them.
std::string escape_xml(const std::string &s, bool attribute = false);
std::string unescape_xml(const std::string &s);

// Throw locqa::Error (MissingResource / IOError).
std::string read_file(const std::filesystem::path &p);
void write_file(const std::filesystem::path &p, const std::string &data);

} // namespace locqa
