#include <locqa/report.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <map>
#include <set>

namespace locqa {

std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if ((unsigned char)c < 0x20) {
        char b[8];
        std::snprintf(b, sizeof(b), "\\u%04x", c);
        o += b;
      } else {
        o += c;
      }
    }
  }
  return o;
}

static std::string diagnostics_json(const Diagnostics &ds) {
  std::string o = "[";
  for (std::size_t i = 0; i < ds.size(); ++i) {
    if (i)
      o += ",";
    o += fmt::format("{{\"kind\":\"{}\",\"subject\":\"{}\",\"message\":\"{}\"}}",
                     to_string(ds[i].kind), json_escape(ds[i].subject),
                     json_escape(ds[i].message));
  }
  return o + "]";
}

FindSummary summarize(const BatchFindResult &res) {
  FindSummary s;
  s.profile_name = res.profile_name;
  s.source = res.source;
  s.total_matches = res.total_matches;

  std::map<std::pair<int, std::string>, std::size_t> slot;
  std::set<std::pair<std::size_t, std::string>> hits; // (rule slot, record)
  std::set<std::string> records;
  for (const auto &m : res.matches) {
    auto key = std::make_pair(m.rule_order, m.rule_name);
    auto it = slot.find(key);
    if (it == slot.end()) {
      it = slot.emplace(key, s.rules.size()).first;
      s.rules.push_back({m.rule_order, m.rule_name, m.category, 0, 0});
    }
    auto &t = s.rules[it->second];
    ++t.matches;
    if (hits.emplace(it->second, m.record_id).second)
      ++t.records_hit;
    records.insert(m.record_id);
  }
  s.records_with_matches = records.size();

  std::stable_sort(s.rules.begin(), s.rules.end(),
                   [](const RuleTally &a, const RuleTally &b) {
                     return a.order < b.order;
                   });
  for (const auto &t : s.rules) {
    auto it = std::find_if(s.categories.begin(), s.categories.end(),
                           [&](const auto &c) { return c.first == t.category; });
    if (it == s.categories.end())
      s.categories.emplace_back(t.category, t.matches);
    else
      it->second += t.matches;
  }
  return s;
}

std::string to_json(const BatchFindResult &res) {
  std::string o = "{\n";
  o += fmt::format("  \"profile_name\":\"{}\",\n", json_escape(res.profile_name));
  o += fmt::format("  \"source\":\"{}\",\n", json_escape(res.source));
  o += fmt::format("  \"fingerprint\":\"{}\",\n", json_escape(res.fingerprint));
  o += fmt::format("  \"total_matches\":{},\n", res.total_matches);
  o += "  \"matches\":[\n";
  for (std::size_t i = 0; i < res.matches.size(); ++i) {
    const auto &m = res.matches[i];
    if (i)
      o += ",\n";
    o += fmt::format(
        "    {{\"record_id\":\"{}\",\"rule_name\":\"{}\",\"rule_order\":{},"
        "\"category\":\"{}\",\"rule_description\":\"{}\","
        "\"source_text\":\"{}\",\"target_text\":\"{}\",\"matched\":\"{}\","
        "\"start\":{},\"end\":{},\"pattern\":\"{}\",\"replacement\":\"{}\","
        "\"replacement_preview\":\"{}\"}}",
        json_escape(m.record_id), json_escape(m.rule_name), m.rule_order,
        json_escape(m.category), json_escape(m.rule_description),
        json_escape(m.source_text), json_escape(m.target_text),
        json_escape(m.matched), m.start, m.end, json_escape(m.pattern),
        json_escape(m.replacement), json_escape(m.replacement_preview));
  }
  o += "\n  ],\n";
  o += fmt::format("  \"diagnostics\":{}\n}}\n", diagnostics_json(res.diagnostics));
  return o;
}

std::string to_json(const BatchReplaceResult &res) {
  return fmt::format("{{\n  \"success\":{},\n  \"modified_records\":{},\n"
                     "  \"total_replacements\":{},\n  \"output_location\":\"{}\",\n"
                     "  \"diagnostics\":{}\n}}\n",
                     res.success ? "true" : "false", res.modified_records,
                     res.total_replacements, json_escape(res.output_location),
                     diagnostics_json(res.diagnostics));
}

std::string to_json(const FindSummary &s) {
  std::string o = "{\n";
  o += fmt::format("  \"profile_name\":\"{}\",\n", json_escape(s.profile_name));
  o += fmt::format("  \"source\":\"{}\",\n", json_escape(s.source));
  o += fmt::format("  \"total_matches\":{},\n", s.total_matches);
  o += fmt::format("  \"records_with_matches\":{},\n", s.records_with_matches);
  o += "  \"rules\":[\n";
  for (std::size_t i = 0; i < s.rules.size(); ++i) {
    const auto &t = s.rules[i];
    if (i)
      o += ",\n";
    o += fmt::format("    {{\"order\":{},\"name\":\"{}\",\"category\":\"{}\","
                     "\"matches\":{},\"records_hit\":{}}}",
                     t.order, json_escape(t.name), json_escape(t.category),
                     t.matches, t.records_hit);
  }
  o += "\n  ],\n  \"categories\":{";
  for (std::size_t i = 0; i < s.categories.size(); ++i) {
    if (i)
      o += ",";
    o += fmt::format("\"{}\":{}", json_escape(s.categories[i].first),
                     s.categories[i].second);
  }
  o += "}\n}\n";
  return o;
}

std::string to_json(const XliffStatistics &s) {
  return fmt::format("{{\"total_units\":{},\"translated\":{},\"untranslated\":{}}}\n",
                     s.total_units, s.translated, s.untranslated);
}

std::string render_text(const BatchFindResult &res) {
  std::string o = fmt::format("Profile: {}\nSource:  {}\n\n", res.profile_name,
                              res.source);
  for (const auto &m : res.matches) {
    o += fmt::format("[{}] #{} {} ({}) at {}-{}: '{}' -> '{}'\n", m.record_id,
                     m.rule_order, m.rule_name, m.category, m.start, m.end,
                     m.matched, m.replacement_preview);
  }
  for (const auto &d : res.diagnostics)
    o += fmt::format("! {} [{}]: {}\n", to_string(d.kind), d.subject, d.message);
  o += fmt::format("\nTotal matches: {}\n", res.total_matches);
  return o;
}

std::string render_text(const FindSummary &s) {
  std::string o = fmt::format("Profile: {}\nSource:  {}\n", s.profile_name,
                              s.source);
  o += fmt::format("Matches: {} in {} records\n\n", s.total_matches,
                   s.records_with_matches);
  o += fmt::format("{:>6}  {:<40} {:>8} {:>8}\n", "order", "rule", "matches",
                   "records");
  for (const auto &t : s.rules)
    o += fmt::format("{:>6}  {:<40} {:>8} {:>8}\n", t.order, t.name, t.matches,
                     t.records_hit);
  if (!s.categories.empty()) {
    o += "\nBy category:\n";
    for (const auto &c : s.categories)
      o += fmt::format("  {:<40} {:>8}\n", c.first, c.second);
  }
  return o;
}

std::string render_text(const BatchReplaceResult &res) {
  std::string o = fmt::format("Modified records:   {}\nTotal replacements: {}\n",
                              res.modified_records, res.total_replacements);
  if (!res.output_location.empty())
    o += fmt::format("Output:             {}\n", res.output_location);
  for (const auto &d : res.diagnostics)
    o += fmt::format("! {} [{}]: {}\n", to_string(d.kind), d.subject, d.message);
  return o;
}

std::string to_json(const IcuReport &rep) {
  std::string hints = "[";
  for (std::size_t i = 0; i < rep.hints.size(); ++i) {
    if (i)
      hints += ",";
    hints += fmt::format("{{\"record_id\":\"{}\",\"hint\":\"{}\"}}",
                         json_escape(rep.hints[i].first),
                         json_escape(rep.hints[i].second));
  }
  hints += "]";
  return fmt::format("{{\n  \"source\":\"{}\",\n  \"records_checked\":{},\n"
                     "  \"records_with_icu\":{},\n  \"records_failed\":{},\n"
                     "  \"diagnostics\":{},\n  \"hints\":{}\n}}\n",
                     json_escape(rep.source), rep.records_checked,
                     rep.records_with_icu, rep.records_failed,
                     diagnostics_json(rep.diagnostics), hints);
}

std::string render_text(const IcuReport &rep) {
  std::string o = fmt::format("Source: {}\n\n", rep.source);
  for (const auto &d : rep.diagnostics)
    o += fmt::format("[{}] {}\n", d.subject, d.message);
  for (const auto &h : rep.hints)
    o += fmt::format("[{}] hint: {}\n", h.first, h.second);
  o += fmt::format("\nICU records: {} of {}, failing: {}\n",
                   rep.records_with_icu, rep.records_checked,
                   rep.records_failed);
  return o;
}

} // namespace locqa
