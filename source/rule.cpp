#include <locqa/error.hpp>
#include <locqa/rule.hpp>

#include <fmt/format.h>

#include <cctype>

namespace locqa {

namespace {

// Plain, once-escaped and twice-escaped inline tags. Entities are allowed
// inside escaped tags.
const std::regex &tag_regex() {
  static const std::regex re(
      R"(<[^<>]*>|&lt;(?:[^&]|&[a-zA-Z]+;|&#\d+;)*?&gt;|&amp;lt;(?:[^&]|&(?:amp|quot|lt|gt|#\d+);)*?&amp;gt;)");
  return re;
}

} // namespace

static std::regex::flag_type flags_for(bool case_sensitive) {
  auto f = std::regex::ECMAScript;
  if (!case_sensitive)
    f |= std::regex::icase;
  return f;
}

std::string normalize_backrefs(const std::string &r) {
  std::string out;
  out.reserve(r.size());
  for (size_t i = 0; i < r.size(); ++i) {
    char c = r[i];
    if (c == '\\' && i + 1 < r.size()) {
      char n = r[i + 1];
      if (std::isdigit(static_cast<unsigned char>(n))) {
        out += '$';
        out += n;
        ++i;
        continue;
      }
      if (n == '\\') {
        out += '\\';
        ++i;
        continue;
      }
    }
    out += c;
  }
  return out;
}

std::optional<std::string> validate_pattern(const std::string &pattern,
                                            bool case_sensitive) {
  if (pattern.empty())
    return std::nullopt;
  try {
    std::regex re(pattern, flags_for(case_sensitive));
    (void)re;
  } catch (const std::regex_error &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

InlineText InlineText::split(const std::string &text) {
  InlineText in;
  auto add_run = [&](std::size_t b, std::size_t e) {
    if (e <= b)
      return;
    in.runs.push_back({in.plain.size(), b, e - b});
    in.plain.append(text, b, e - b);
  };

  std::size_t last = 0;
  auto it = std::sregex_iterator(text.begin(), text.end(), tag_regex());
  for (; it != std::sregex_iterator(); ++it) {
    auto b = static_cast<std::size_t>(it->position(0));
    add_run(last, b);
    last = b + static_cast<std::size_t>(it->length(0));
  }
  add_run(last, text.size());
  return in;
}

InlineText InlineText::whole(const std::string &text) {
  InlineText in;
  in.plain = text;
  if (!text.empty())
    in.runs.push_back({0, 0, text.size()});
  return in;
}

std::size_t InlineText::map_begin(std::size_t p) const {
  for (const auto &r : runs)
    if (p >= r.plain_begin && p < r.plain_begin + r.size)
      return r.orig_begin + (p - r.plain_begin);
  if (runs.empty())
    return 0;
  return runs.back().orig_begin + runs.back().size;
}

std::size_t InlineText::map_end(std::size_t p) const {
  for (const auto &r : runs)
    if (p > r.plain_begin && p <= r.plain_begin + r.size)
      return r.orig_begin + (p - r.plain_begin);
  return map_begin(p);
}

bool InlineText::crosses_tag(std::size_t b, std::size_t e) const {
  for (std::size_t i = 1; i < runs.size(); ++i) {
    const auto k = runs[i].plain_begin;
    if (b < k && k < e)
      return true;
  }
  return false;
}

CompiledRule CompiledRule::compile(const PatternRule &rule, bool protect_tags) {
  CompiledRule cr(rule);
  cr.protect_tags_ = protect_tags;
  const auto flags = flags_for(rule.case_sensitive);

  if (!rule.pattern.empty()) {
    try {
      cr.re_.emplace(rule.pattern, flags);
    } catch (const std::regex_error &e) {
      throw Error(ErrorKind::InvalidPattern,
                  fmt::format("rule '{}' (order {}): pattern '{}': {}",
                              rule.name, rule.order, rule.pattern, e.what()));
    }
  }
  if (!rule.exclude_pattern.empty()) {
    try {
      cr.exclude_.emplace(rule.exclude_pattern, flags);
    } catch (const std::regex_error &e) {
      throw Error(ErrorKind::InvalidPattern,
                  fmt::format("rule '{}' (order {}): exclude pattern '{}': {}",
                              rule.name, rule.order, rule.exclude_pattern,
                              e.what()));
    }
  }
  cr.format_ = normalize_backrefs(rule.replacement);
  return cr;
}

InlineText CompiledRule::prepare(const std::string &text) const {
  return protect_tags_ ? InlineText::split(text) : InlineText::whole(text);
}

std::vector<CompiledRule::Span>
CompiledRule::exclusion_spans(const InlineText &in) const {
  std::vector<Span> out;
  if (!exclude_)
    return out;
  auto it = std::sregex_iterator(in.plain.begin(), in.plain.end(), *exclude_);
  for (; it != std::sregex_iterator(); ++it) {
    auto b = static_cast<std::size_t>(it->position(0));
    auto e = b + static_cast<std::size_t>(it->length(0));
    // zero-width exclusions never suppress
    if (e > b)
      out.push_back({in.map_begin(b), in.map_end(e)});
  }
  return out;
}

bool CompiledRule::suppressed(const std::vector<Span> &ex, std::size_t b,
                              std::size_t e) {
  for (const auto &x : ex) {
    if (b == e) {
      if (x.begin <= b && b < x.end)
        return true;
    } else if (x.begin < e && b < x.end) {
      return true;
    }
  }
  return false;
}

std::vector<RuleMatch> CompiledRule::scan(const InlineText &in) const {
  std::vector<RuleMatch> out;
  if (!re_)
    return out;

  const auto ex = exclusion_spans(in);
  auto it = std::sregex_iterator(in.plain.begin(), in.plain.end(), *re_);
  for (; it != std::sregex_iterator(); ++it) {
    const auto &m = *it;
    auto b = static_cast<std::size_t>(m.position(0));
    auto e = b + static_cast<std::size_t>(m.length(0));
    if (in.crosses_tag(b, e))
      continue;
    const auto ob = in.map_begin(b);
    const auto oe = e > b ? in.map_end(e) : ob;
    if (suppressed(ex, ob, oe))
      continue;
    out.push_back(RuleMatch{ob, oe, m.str(0), m.format(format_)});
  }
  return out;
}

std::vector<RuleMatch> CompiledRule::find(const std::string &text) const {
  return scan(prepare(text));
}

std::size_t CompiledRule::replace(const std::string &text,
                                  std::string &out) const {
  const auto found = scan(prepare(text));
  if (found.empty()) {
    out = text;
    return 0;
  }

  std::string res;
  res.reserve(text.size());
  std::size_t last = 0;
  for (const auto &m : found) {
    res.append(text, last, m.begin - last);
    res += m.expanded;
    last = m.end;
  }
  res.append(text, last, std::string::npos);
  out = std::move(res);
  return found.size();
}

} // namespace locqa
