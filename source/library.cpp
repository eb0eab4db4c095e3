#include <locqa/error.hpp>
#include <locqa/library.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string_view>
#include <unordered_map>

namespace fs = std::filesystem;

namespace locqa {

namespace {

const char *kUncategorized = "Uncategorized";

enum class Elem { Root, Category, Entry, Name, Description, Pattern, Replace, Unknown };

Elem classify(const char *tag) {
  static const std::unordered_map<std::string_view, Elem> table = {
      {"regex-library", Elem::Root}, {"category", Elem::Category},
      {"entry", Elem::Entry},        {"name", Elem::Name},
      {"description", Elem::Description}, {"pattern", Elem::Pattern},
      {"replace", Elem::Replace},
  };
  auto it = table.find(tag);
  return it == table.end() ? Elem::Unknown : it->second;
}

class LibraryReader : public tinyxml2::XMLVisitor {
public:
  explicit LibraryReader(SnippetLibrary &out) : out_(out) {}

  bool VisitEnter(const tinyxml2::XMLElement &el,
                  const tinyxml2::XMLAttribute *) override {
    ++depth_;
    switch (classify(el.Name())) {
    case Elem::Category: {
      const char *name = el.Attribute("name");
      out_.categories.push_back({name ? name : kUncategorized, {}});
      open_categories_.push_back(out_.categories.size() - 1);
      category_depths_.push_back(depth_);
      break;
    }
    case Elem::Entry:
      if (!in_entry_) {
        entry_ = SnippetEntry{};
        const char *id = el.Attribute("id");
        entry_.id = (id && *id) ? id : random_id();
        entry_depth_ = depth_;
        in_entry_ = true;
      }
      break;
    case Elem::Name: bind(&entry_.name); break;
    case Elem::Description: bind(&entry_.description); break;
    case Elem::Pattern: bind(&entry_.pattern); break;
    case Elem::Replace: bind(&entry_.replacement); break;
    default: break;
    }
    return true;
  }

  bool VisitExit(const tinyxml2::XMLElement &) override {
    if (target_ && depth_ == field_depth_) {
      target_ = nullptr;
      field_depth_ = 0;
    }
    if (in_entry_ && depth_ == entry_depth_) {
      store_entry();
      in_entry_ = false;
    }
    if (!category_depths_.empty() && category_depths_.back() == depth_) {
      category_depths_.pop_back();
      open_categories_.pop_back();
    }
    --depth_;
    return true;
  }

  bool Visit(const tinyxml2::XMLText &text) override {
    if (target_ && depth_ == field_depth_)
      target_->append(text.Value());
    return true;
  }

private:
  void bind(std::string *field) {
    if (!in_entry_ || target_)
      return;
    target_ = field;
    target_->clear();
    field_depth_ = depth_;
  }

  void store_entry() {
    SnippetCategory *cat = nullptr;
    if (!open_categories_.empty()) {
      cat = &out_.categories[open_categories_.back()];
    } else {
      auto it = std::find_if(
          out_.categories.begin(), out_.categories.end(),
          [](const SnippetCategory &c) { return c.name == kUncategorized; });
      if (it == out_.categories.end()) {
        out_.categories.push_back({kUncategorized, {}});
        cat = &out_.categories.back();
      } else {
        cat = &*it;
      }
    }
    entry_.category = cat->name;
    cat->entries.push_back(std::move(entry_));
  }

  SnippetLibrary &out_;
  int depth_{0};
  std::vector<std::size_t> open_categories_;
  std::vector<int> category_depths_;
  SnippetEntry entry_;
  bool in_entry_{false};
  int entry_depth_{0};
  std::string *target_{nullptr};
  int field_depth_{0};
};

bool icontains(const std::string &hay, const std::string &needle_lower) {
  return to_lower_ascii(hay).find(needle_lower) != std::string::npos;
}

} // namespace

std::size_t SnippetLibrary::entry_count() const {
  std::size_t n = 0;
  for (const auto &c : categories)
    n += c.entries.size();
  return n;
}

std::vector<SnippetEntry>
SnippetLibrary::find_entries(const std::string &query) const {
  const auto q = to_lower_ascii(query);
  std::vector<SnippetEntry> out;
  for (const auto &c : categories)
    for (const auto &e : c.entries)
      if (icontains(e.name, q) || icontains(e.description, q) ||
          icontains(e.pattern, q))
        out.push_back(e);
  return out;
}

std::string SnippetLibrary::add_entry(const std::string &category,
                                      SnippetEntry entry) {
  if (entry.id.empty())
    entry.id = random_id();
  entry.category = category;

  auto it = std::find_if(categories.begin(), categories.end(),
                         [&](const SnippetCategory &c) { return c.name == category; });
  if (it == categories.end()) {
    categories.push_back({category, {}});
    it = std::prev(categories.end());
  }
  it->entries.push_back(std::move(entry));
  return it->entries.back().id;
}

bool SnippetLibrary::remove_entry(const std::string &id) {
  for (auto &c : categories) {
    auto it = std::find_if(c.entries.begin(), c.entries.end(),
                           [&](const SnippetEntry &e) { return e.id == id; });
    if (it != c.entries.end()) {
      c.entries.erase(it);
      return true;
    }
  }
  return false;
}

void SnippetLibrary::merge(const SnippetLibrary &other) {
  categories.insert(categories.end(), other.categories.begin(),
                    other.categories.end());
}

SnippetLibrary default_library() {
  SnippetLibrary lib;
  for (const char *name :
       {"Tegnsetting", "Harde mellomrom", "Tall/tallformatering", "Spesialtegn"})
    lib.categories.push_back({name, {}});
  return lib;
}

SnippetLibrary parse_library(const std::string &xml, const std::string &origin) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw Error(ErrorKind::ParseError,
                fmt::format("{}: {}", origin, doc.ErrorStr()),
                doc.ErrorLineNum());
  }
  const auto *root = doc.RootElement();
  if (!root || std::strcmp(root->Name(), "regex-library") != 0) {
    throw Error(ErrorKind::ParseError,
                origin + ": root element is not <regex-library>",
                root ? root->GetLineNum() : 0);
  }

  SnippetLibrary lib;
  LibraryReader reader(lib);
  root->Accept(&reader);
  return lib;
}

std::string serialize_library(const SnippetLibrary &lib) {
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<regex-library>\n";
  for (const auto &c : lib.categories) {
    xml += fmt::format("  <category name=\"{}\">\n", escape_xml(c.name, true));
    for (const auto &e : c.entries) {
      xml += fmt::format("    <entry id=\"{}\">\n", escape_xml(e.id, true));
      xml += fmt::format("      <name>{}</name>\n", escape_xml(e.name));
      xml += fmt::format("      <description>{}</description>\n",
                         escape_xml(e.description));
      xml += fmt::format("      <pattern>{}</pattern>\n", escape_xml(e.pattern));
      xml += fmt::format("      <replace>{}</replace>\n",
                         escape_xml(e.replacement));
      xml += "    </entry>\n";
    }
    xml += "  </category>\n";
  }
  xml += "</regex-library>\n";
  return xml;
}

SnippetLibrary import_library(const fs::path &path) {
  auto lib = parse_library(read_file(path), path.string());
  spdlog::info("imported library {} ({} categories, {} entries)",
               path.string(), lib.categories.size(), lib.entry_count());
  return lib;
}

void export_library(const SnippetLibrary &lib, const fs::path &path) {
  write_file(path, serialize_library(lib));
  spdlog::info("exported library to {}", path.string());
}

PatternRule rule_from_snippet(const SnippetEntry &e, int order) {
  PatternRule r;
  r.order = order;
  r.name = e.name;
  r.description = e.description;
  r.category = e.category;
  r.pattern = e.pattern;
  r.replacement = e.replacement;
  return r;
}

LibraryStore::LibraryStore(fs::path default_path)
    : path_(std::move(default_path)) {}

SnippetLibrary LibraryStore::load() const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    spdlog::debug("no library at {}, using defaults", path_.string());
    return default_library();
  }
  return parse_library(read_file(path_), path_.string());
}

void LibraryStore::save(const SnippetLibrary &lib) const {
  write_file(path_, serialize_library(lib));
  spdlog::debug("library saved to {}", path_.string());
}

} // namespace locqa
