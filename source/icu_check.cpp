#include <locqa/icu_check.hpp>
#include <locqa/rule.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <regex>
#include <set>

namespace locqa {

namespace {

const char *const kArgKeywords[] = {"plural", "select", "selectordinal"};
const char *const kCategories[] = {"zero", "one", "two", "few", "many", "other"};

struct IcuPatterns {
  std::regex argument;
  std::regex argument_like;
  std::regex variable;
  std::vector<std::pair<std::string, std::regex>> keywords;
  std::vector<std::pair<std::string, std::regex>> categories;

  IcuPatterns()
      : argument(R"(\{[^}]+,\s*(plural|select|selectordinal))",
                 std::regex::ECMAScript | std::regex::icase),
        argument_like(R"(\{[^}]+,\s*\w+,.*?\w+\s*\{)",
                      std::regex::ECMAScript | std::regex::icase),
        variable(R"(\{(\w+)\s*,)") {
    for (const char *k : kArgKeywords)
      keywords.emplace_back(
          k, std::regex(std::string(R"(\{[^}]+,\s*)") + k + R"(\b)",
                        std::regex::ECMAScript | std::regex::icase));
    for (const char *c : kCategories)
      categories.emplace_back(c,
                              std::regex(std::string(R"(\b)") + c + R"(\s*\{)"));
  }
};

const IcuPatterns &patterns() {
  static const IcuPatterns p;
  return p;
}

std::size_t count(const std::string &text, const std::regex &re) {
  return static_cast<std::size_t>(
      std::distance(std::sregex_iterator(text.begin(), text.end(), re),
                    std::sregex_iterator()));
}

std::size_t count_char(const std::string &text, char c) {
  return static_cast<std::size_t>(std::count(text.begin(), text.end(), c));
}

bool contains(const std::string &text, const char *needle) {
  return text.find(needle) != std::string::npos;
}

std::vector<std::string> variables(const std::string &text) {
  std::vector<std::string> out;
  const auto &re = patterns().variable;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
       it != std::sregex_iterator(); ++it)
    out.push_back((*it)[1].str());
  return out;
}

// Source variables that no longer appear in the target, sorted.
std::vector<std::string> changed_variables(const std::vector<std::string> &src,
                                           const std::vector<std::string> &tgt) {
  std::vector<std::string> out;
  if (src.empty() || tgt.empty())
    return out;
  std::set<std::string> s(src.begin(), src.end());
  std::set<std::string> t(tgt.begin(), tgt.end());
  std::set_difference(s.begin(), s.end(), t.begin(), t.end(),
                      std::back_inserter(out));
  return out;
}

} // namespace

bool has_icu_syntax(const std::string &text) {
  const auto &p = patterns();
  return std::regex_search(text, p.argument) ||
         std::regex_search(text, p.argument_like);
}

std::vector<std::string> check_icu_segment(const std::string &source,
                                           const std::string &target) {
  std::vector<std::string> errors;
  if (target.empty())
    return errors;
  const auto &p = patterns();

  for (const auto &[keyword, re] : p.keywords) {
    const auto s = count(source, re);
    const auto t = count(target, re);
    if (s > 0 && t == 0)
      errors.push_back(fmt::format("ICU keyword \"{}\" is missing or translated "
                                   "in target (must stay \"{}\")",
                                   keyword, keyword));
    else if (s != t)
      errors.push_back(fmt::format(
          "ICU keyword \"{}\" count mismatch (source: {}, target: {})", keyword,
          s, t));
  }

  for (const auto &[category, re] : p.categories) {
    const auto s = count(source, re);
    const auto t = count(target, re);
    if (s > 0 && t == 0)
      errors.push_back(fmt::format("Category \"{}\" is missing or translated "
                                   "in target (must stay \"{}\")",
                                   category, category));
    else if (s != t)
      errors.push_back(fmt::format(
          "Category \"{}\" count mismatch (source: {}, target: {})", category,
          s, t));
  }

  const auto so = count_char(source, '{');
  const auto sc = count_char(source, '}');
  const auto to = count_char(target, '{');
  const auto tc = count_char(target, '}');
  if (to > tc)
    errors.push_back(
        fmt::format("Missing {} closing brace(s) }} in target", to - tc));
  else if (tc > to)
    errors.push_back(
        fmt::format("Missing {} opening brace(s) {{ in target", tc - to));
  else if (to != so || tc != sc)
    errors.push_back(fmt::format(
        "Brace count differs from source (source: {} pairs, target: {} pairs)",
        so, to));

  const auto sv = variables(source);
  const auto tv = variables(target);
  const auto changed = changed_variables(sv, tv);
  if (!changed.empty())
    errors.push_back(fmt::format(
        "Variable name(s) changed: {} (must not be translated)",
        fmt::join(changed, ", ")));
  if (sv.size() != tv.size())
    errors.push_back("Variable/comma pattern mismatch (check commas after "
                     "variable names)");

  if (contains(source, "offset:") && !contains(target, "offset:"))
    errors.push_back("\"offset:\" is missing in target");

  const auto sh = count_char(source, '#');
  const auto th = count_char(target, '#');
  if (sh > 0 && sh != th)
    errors.push_back(fmt::format(
        "Hash (#) count mismatch (source: {}, target: {})", sh, th));

  return errors;
}

std::string icu_fix_hint(const std::string &source, const std::string &target) {
  std::vector<std::string> parts;

  const auto changed = changed_variables(variables(source), variables(target));
  if (!changed.empty())
    parts.push_back(fmt::format("Variable names must match source: {}",
                                fmt::join(changed, ", ")));

  for (const char *k : kArgKeywords)
    if (contains(source, k) && !contains(target, k))
      parts.push_back(fmt::format("Restore ICU keyword \"{}\"", k));

  for (const auto &[category, re] : patterns().categories)
    if (std::regex_search(source, re) && !std::regex_search(target, re))
      parts.push_back(fmt::format("Restore category keyword \"{}\"", category));

  if (contains(source, "offset:") && !contains(target, "offset:"))
    parts.push_back("Restore \"offset:\"");

  const auto to = count_char(target, '{');
  const auto tc = count_char(target, '}');
  if (to > tc)
    parts.push_back(fmt::format("Add {} closing brace(s) }}", to - tc));
  else if (tc > to)
    parts.push_back(fmt::format("Add {} opening brace(s) {{", tc - to));

  const auto sh = count_char(source, '#');
  const auto th = count_char(target, '#');
  if (sh > th)
    parts.push_back(fmt::format("Restore {} hash symbol(s) #", sh - th));

  return fmt::format("{}", fmt::join(parts, "; "));
}

IcuReport validate_icu(const Records &records, const std::string &source) {
  IcuReport rep;
  rep.source = source;
  for (const auto &rec : records) {
    ++rep.records_checked;
    const auto src = InlineText::split(rec.source).plain;
    const auto tgt = InlineText::split(rec.target).plain;
    if (!has_icu_syntax(src) && !has_icu_syntax(tgt))
      continue;
    ++rep.records_with_icu;

    auto errors = check_icu_segment(src, tgt);
    if (errors.empty())
      continue;
    ++rep.records_failed;
    spdlog::debug("[icu] record {}: {} problems", rec.id, errors.size());
    for (auto &e : errors)
      rep.diagnostics.push_back({ErrorKind::MessageFormat, rec.id, std::move(e)});
    auto hint = icu_fix_hint(src, tgt);
    if (!hint.empty())
      rep.hints.emplace_back(rec.id, std::move(hint));
  }
  spdlog::info("[icu] {}: records={} with_icu={} failing={}", source,
               rep.records_checked, rep.records_with_icu, rep.records_failed);
  return rep;
}

} // namespace locqa
