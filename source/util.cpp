#include <locqa/error.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <xxhash.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace locqa {

std::int64_t day_epoch_now() {
  using namespace std::chrono;
  auto secs =
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  return static_cast<std::int64_t>(secs) / 86400 * 86400;
}

std::optional<std::int64_t> parse_day_epoch(const std::string &raw) {
  std::string s = trim(raw);
  if (s.empty())
    return std::nullopt;

  bool digits = std::all_of(s.begin(), s.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  });
  if (digits) {
    try {
      return static_cast<std::int64_t>(std::stoll(s));
    } catch (const std::out_of_range &) {
      return std::nullopt;
    }
  }

  int y = 0, m = 0, d = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3)
    return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || d > 31)
    return std::nullopt;
  std::tm tm{};
  tm.tm_year = y - 1900;
  tm.tm_mon = m - 1;
  tm.tm_mday = d;
  return static_cast<std::int64_t>(timegm(&tm));
}

std::string compact_timestamp() {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf);
}

std::string random_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uint64_t hi = rng();
  std::uint64_t lo = rng();
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL; // variant 10
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<std::uint32_t>(hi >> 32),
                     static_cast<std::uint32_t>((hi >> 16) & 0xffff),
                     static_cast<std::uint32_t>(hi & 0xffff),
                     static_cast<std::uint32_t>(lo >> 48),
                     lo & 0xffffffffffffULL);
}

std::string xxh3_64_hex(const std::string &s) {
  auto h = XXH3_64bits(s.data(), s.size());
  std::ostringstream oss;
  oss << std::hex << h;
  return oss.str();
}

std::size_t utf8_offset(const std::string &text, std::size_t byte_pos) {
  byte_pos = std::min(byte_pos, text.size());
  std::size_t n = 0;
  for (std::size_t i = 0; i < byte_pos; ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

std::string trim(const std::string &s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1])))
    --j;
  return s.substr(i, j - i);
}

std::string to_lower_ascii(std::string s) {
  for (auto &ch : s)
    ch = (char)std::tolower((unsigned char)ch);
  return s;
}

static bool is_xml_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string escape_xml(const std::string &s, bool attribute) {
  const bool blank = !s.empty() && std::all_of(s.begin(), s.end(), is_xml_space);
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '&': o += "&amp;"; break;
    case '<': o += "&lt;"; break;
    case '>': o += "&gt;"; break;
    case '"': o += "&quot;"; break;
    case '\'': o += "&apos;"; break;
    case '\r': o += "&#xD;"; break;
    case '\n':
      if (blank || attribute) o += "&#xA;";
      else o += c;
      break;
    case '\t':
      if (blank || attribute) o += "&#x9;";
      else o += c;
      break;
    case ' ':
      if (blank) o += "&#x20;";
      else o += c;
      break;
    default:
      o += c;
    }
  }
  return o;
}

static void append_utf8(std::string &out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string unescape_xml(const std::string &s) {
  std::string o;
  o.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] != '&') {
      o += s[i++];
      continue;
    }
    auto semi = s.find(';', i);
    if (semi == std::string::npos) {
      o += s[i++];
      continue;
    }
    std::string ent = s.substr(i + 1, semi - i - 1);
    if (ent == "amp") o += '&';
    else if (ent == "lt") o += '<';
    else if (ent == "gt") o += '>';
    else if (ent == "quot") o += '"';
    else if (ent == "apos") o += '\'';
    else if (ent.size() > 1 && ent[0] == '#') {
      char *end = nullptr;
      unsigned long cp = (ent[1] == 'x' || ent[1] == 'X')
                             ? std::strtoul(ent.c_str() + 2, &end, 16)
                             : std::strtoul(ent.c_str() + 1, &end, 10);
      if (end && *end == '\0') append_utf8(o, cp);
      else o += s.substr(i, semi - i + 1);
    } else {
      o += s.substr(i, semi - i + 1);
    }
    i = semi + 1;
  }
  return o;
}

std::string read_file(const fs::path &p) {
  std::error_code ec;
  if (!fs::exists(p, ec))
    throw Error(ErrorKind::MissingResource, "no such file: " + p.string());
  std::ifstream f(p, std::ios::binary);
  if (!f.is_open())
    throw Error(ErrorKind::IOError, "open failed: " + p.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad())
    throw Error(ErrorKind::IOError, "read failed: " + p.string());
  return ss.str();
}

void write_file(const fs::path &p, const std::string &data) {
  std::error_code ec;
  if (p.has_parent_path() && !fs::exists(p.parent_path(), ec)) {
    fs::create_directories(p.parent_path(), ec);
    if (ec)
      throw Error(ErrorKind::IOError, "mkdir failed: " +
                                          p.parent_path().string() + ": " +
                                          ec.message());
  }
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  if (!f.is_open())
    throw Error(ErrorKind::IOError, "open failed: " + p.string());
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!f.good())
    throw Error(ErrorKind::IOError, "write failed: " + p.string());
}

} // namespace locqa
