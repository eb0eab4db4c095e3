#include <locqa/error.hpp>
#include <locqa/util.hpp>
#include <locqa/xbench.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <cstring>
#include <initializer_list>

namespace fs = std::filesystem;

namespace locqa {

namespace {

using tinyxml2::XMLElement;

const XMLElement *find_descendant(const XMLElement *el, const char *name) {
  for (auto *c = el->FirstChildElement(); c; c = c->NextSiblingElement()) {
    if (std::strcmp(c->Name(), name) == 0)
      return c;
    if (auto *d = find_descendant(c, name))
      return d;
  }
  return nullptr;
}

bool is_item(const XMLElement *el) {
  for (const char *n : {"ChecklistItem", "PowerSearchItem", "Item", "QAItem"})
    if (std::strcmp(el->Name(), n) == 0)
      return true;
  return false;
}

void collect_items(const XMLElement *el, std::vector<const XMLElement *> &out) {
  for (auto *c = el->FirstChildElement(); c; c = c->NextSiblingElement()) {
    if (is_item(c))
      out.push_back(c);
    else
      collect_items(c, out);
  }
}

std::string text_field(const XMLElement *el,
                       std::initializer_list<const char *> names) {
  for (const char *n : names) {
    if (auto *child = find_descendant(el, n)) {
      const char *t = child->GetText();
      if (t && *t)
        return trim(t);
    }
    const char *attr = el->Attribute(n);
    if (attr && *attr)
      return trim(attr);
  }
  return {};
}

bool truthy(const char *v) {
  const auto s = to_lower_ascii(trim(v ? v : ""));
  return s == "true" || s == "1" || s == "yes" || s == "on";
}

bool bool_field(const XMLElement *el, std::initializer_list<const char *> names,
                bool def = false) {
  for (const char *n : names) {
    if (auto *child = find_descendant(el, n))
      return truthy(child->GetText());
    const char *attr = el->Attribute(n);
    if (attr && *attr)
      return truthy(attr);
  }
  return def;
}

} // namespace

ChecklistStatistics Checklist::statistics() const {
  ChecklistStatistics s;
  s.total_items = items.size();
  for (const auto &i : items) {
    if (i.is_regex)
      ++s.regex_items;
    if (i.enabled)
      ++s.enabled_items;
    if (!i.replace_text.empty())
      ++s.with_replacement;
  }
  return s;
}

Checklist parse_checklist(const std::string &xml, const std::string &origin) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw Error(ErrorKind::ParseError,
                fmt::format("{}: {}", origin, doc.ErrorStr()),
                doc.ErrorLineNum());
  }
  const auto *root = doc.RootElement();
  if (!root)
    throw Error(ErrorKind::ParseError, origin + ": empty document");

  Checklist list;
  if (auto *n = find_descendant(root, "ChecklistName"); n && n->GetText())
    list.name = n->GetText();

  std::vector<const XMLElement *> elems;
  collect_items(root, elems);
  for (const auto *el : elems) {
    ChecklistItem item;
    item.search_text = text_field(
        el, {"SearchText", "Search", "Pattern", "FindText", "SourceText"});
    if (item.search_text.empty()) {
      spdlog::debug("{}: item at line {} has no search text, skipped", origin,
                    el->GetLineNum());
      continue;
    }
    const char *id = el->Attribute("id");
    if (!id || !*id)
      id = el->Attribute("ID");
    item.id = (id && *id) ? id : fmt::format("item_{}", list.items.size());
    item.name = text_field(el, {"Name", "Description", "Text"});
    if (item.name.empty())
      item.name = "Unnamed Item";
    item.replace_text =
        text_field(el, {"ReplaceText", "Replace", "Replacement", "TargetText"});
    item.is_regex = bool_field(
        el, {"IsRegEx", "IsRegex", "RegEx", "UseRegex", "RegularExpression"});
    item.case_sensitive =
        bool_field(el, {"CaseSensitive", "MatchCase", "CaseMatching"});
    item.search_in_source =
        bool_field(el, {"SearchInSource", "CheckSource", "Source"}, true);
    item.search_in_target =
        bool_field(el, {"SearchInTarget", "CheckTarget", "Target"}, true);
    item.enabled = bool_field(el, {"Enabled", "Active", "IsEnabled"}, true);
    item.category = text_field(el, {"Category", "Group", "Type"});
    item.description =
        text_field(el, {"Description", "Comment", "Notes", "Help"});
    list.items.push_back(std::move(item));
  }
  return list;
}

Checklist load_checklist(const fs::path &path) {
  auto list = parse_checklist(read_file(path), path.string());
  auto s = list.statistics();
  spdlog::info("checklist {}: {} items, {} regex, {} enabled", path.string(),
               s.total_items, s.regex_items, s.enabled_items);
  return list;
}

Profile profile_from_checklist(const Checklist &list,
                               const std::string &fallback_name) {
  Profile p;
  p.name = list.name.empty() ? fallback_name : list.name;
  int order = 0;
  for (const auto &item : list.items) {
    if (!item.enabled || !item.is_regex || !item.search_in_target) {
      spdlog::debug("checklist item '{}' not imported (enabled={} regex={} "
                    "target={})",
                    item.name, item.enabled, item.is_regex,
                    item.search_in_target);
      continue;
    }
    PatternRule r;
    r.order = ++order;
    r.name = item.name;
    r.description = item.description;
    r.category = item.category.empty() ? "Uncategorized" : item.category;
    r.pattern = item.search_text;
    r.replacement = item.replace_text;
    r.case_sensitive = item.case_sensitive;
    if (auto err = validate_pattern(r.pattern, r.case_sensitive))
      spdlog::warn("checklist item '{}': pattern does not compile: {}",
                   item.name, *err);
    p.rules.push_back(std::move(r));
  }
  p.description = fmt::format("Imported from Xbench checklist ({} of {} items)",
                              p.rules.size(), list.items.size());
  touch(p);
  return p;
}

} // namespace locqa
