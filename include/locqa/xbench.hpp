#pragma once
#include <locqa/profile.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace locqa {

// One check from an Xbench checklist (.xbckl).
struct ChecklistItem {
  std::string id;
  std::string name;
  std::string search_text;
  std::string replace_text;
  bool is_regex = false;
  bool case_sensitive = false;
  bool search_in_source = true;
  bool search_in_target = true;
  bool enabled = true;
  std::string category;
  std::string description;
};

struct ChecklistStatistics {
  std::size_t total_items = 0;
  std::size_t regex_items = 0;
  std::size_t enabled_items = 0;
  std::size_t with_replacement = 0;
};

struct Checklist {
  std::string name;
  std::vector<ChecklistItem> items;

  ChecklistStatistics statistics() const;
};

// Items are ChecklistItem, PowerSearchItem, Item or QAItem elements at any
// depth. Each field is read from the first descendant element or attribute
// among several spellings; items without search text are skipped.
Checklist parse_checklist(const std::string &xml, const std::string &origin);
Checklist load_checklist(const std::filesystem::path &path);

// Enabled regex items that search the target become rules, in checklist
// order. The profile is named after the checklist, or `fallback_name`.
Profile profile_from_checklist(const Checklist &list,
                               const std::string &fallback_name);

} // namespace locqa
