#pragma once
#include <locqa/rule.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace locqa {

struct SnippetEntry {
  std::string id;
  std::string name;
  std::string description;
  std::string pattern;
  std::string replacement;
  std::string category;
};

struct SnippetCategory {
  std::string name;
  std::vector<SnippetEntry> entries;
};

// Categories keep document order; equal names are separate categories.
struct SnippetLibrary {
  std::vector<SnippetCategory> categories;

  std::size_t entry_count() const;

  // Case-insensitive substring search over name, description and pattern.
  std::vector<SnippetEntry> find_entries(const std::string &query) const;

  // Appends to the first category called `category`, creating it at the end
  // when absent. Returns the id of the stored entry (generated when empty).
  std::string add_entry(const std::string &category, SnippetEntry entry);

  // False when no entry carries `id`.
  bool remove_entry(const std::string &id);

  void merge(const SnippetLibrary &other);
};

// The bootstrap library: four named, empty categories.
SnippetLibrary default_library();

SnippetLibrary parse_library(const std::string &xml, const std::string &origin);
std::string serialize_library(const SnippetLibrary &lib);

SnippetLibrary import_library(const std::filesystem::path &path);
void export_library(const SnippetLibrary &lib,
                    const std::filesystem::path &path);

PatternRule rule_from_snippet(const SnippetEntry &e, int order);

// The user's library at a fixed location.
class LibraryStore {
public:
  explicit LibraryStore(std::filesystem::path default_path);

  const std::filesystem::path &path() const { return path_; }

  // default_library() when the file does not exist yet.
  SnippetLibrary load() const;
  void save(const SnippetLibrary &lib) const;

private:
  std::filesystem::path path_;
};

} // namespace locqa
