#include <locqa/error.hpp>
#include <locqa/profile.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

namespace fs = std::filesystem;

namespace locqa {

namespace {

enum class Elem {
  Root,
  Metadata,
  Checks,
  Check,
  Name,
  Description,
  Language,
  Created,
  Modified,
  Pattern,
  Replacement,
  Category,
  CaseSensitive,
  ExcludePattern,
  Unknown,
};

Elem classify(const char *tag) {
  static const std::unordered_map<std::string_view, Elem> table = {
      {"qa_profile", Elem::Root},
      {"metadata", Elem::Metadata},
      {"checks", Elem::Checks},
      {"check", Elem::Check},
      {"name", Elem::Name},
      {"description", Elem::Description},
      {"language", Elem::Language},
      {"created", Elem::Created},
      {"modified", Elem::Modified},
      {"pattern", Elem::Pattern},
      {"replacement", Elem::Replacement},
      {"category", Elem::Category},
      {"case_sensitive", Elem::CaseSensitive},
      {"exclude_pattern", Elem::ExcludePattern},
  };
  auto it = table.find(tag);
  return it == table.end() ? Elem::Unknown : it->second;
}

// Walks <qa_profile>. Element depth decides the section; the field element
// currently open owns `target_`, which receives the text events under it.
class ProfileReader : public tinyxml2::XMLVisitor {
public:
  ProfileReader(Profile &out, std::string origin)
      : out_(out), origin_(std::move(origin)) {}

  const std::optional<Error> &error() const { return error_; }

  bool VisitEnter(const tinyxml2::XMLElement &el,
                  const tinyxml2::XMLAttribute *) override {
    ++depth_;
    const Elem kind = classify(el.Name());
    if (depth_ == 2) {
      if (kind == Elem::Metadata)
        section_ = Section::Metadata;
      else if (kind == Elem::Checks)
        section_ = Section::Checks;
    } else if (depth_ == 3 && section_ == Section::Metadata) {
      bind_metadata_field(kind);
    } else if (depth_ == 3 && section_ == Section::Checks &&
               kind == Elem::Check) {
      begin_check(el);
    } else if (depth_ == 4 && section_ == Section::Check) {
      bind_check_field(kind);
    }
    return !error_;
  }

  bool VisitExit(const tinyxml2::XMLElement &) override {
    if (target_ && depth_ == field_depth_)
      finish_field();
    if (depth_ == 3 && section_ == Section::Check) {
      out_.rules.push_back(std::move(rule_));
      section_ = Section::Checks;
    } else if (depth_ == 2) {
      section_ = Section::None;
    }
    --depth_;
    return !error_;
  }

  bool Visit(const tinyxml2::XMLText &text) override {
    if (target_ && depth_ == field_depth_)
      target_->append(text.Value());
    return true;
  }

private:
  enum class Section { None, Metadata, Checks, Check };

  void bind(std::string *target, Elem kind) {
    target_ = target;
    target_->clear();
    field_kind_ = kind;
    field_depth_ = depth_;
  }

  void bind_metadata_field(Elem kind) {
    switch (kind) {
    case Elem::Name: bind(&out_.name, kind); break;
    case Elem::Description: bind(&out_.description, kind); break;
    case Elem::Language: bind(&out_.language, kind); break;
    case Elem::Created:
    case Elem::Modified: bind(&scalar_, kind); break;
    default: break;
    }
  }

  void bind_check_field(Elem kind) {
    switch (kind) {
    case Elem::Name: bind(&rule_.name, kind); break;
    case Elem::Description: bind(&rule_.description, kind); break;
    case Elem::Pattern: bind(&rule_.pattern, kind); break;
    case Elem::Replacement: bind(&rule_.replacement, kind); break;
    case Elem::Category: bind(&rule_.category, kind); break;
    case Elem::ExcludePattern: bind(&rule_.exclude_pattern, kind); break;
    case Elem::CaseSensitive: bind(&scalar_, kind); break;
    default: break;
    }
  }

  void finish_field() {
    switch (field_kind_) {
    case Elem::CaseSensitive:
      rule_.case_sensitive = to_lower_ascii(trim(scalar_)) == "true";
      break;
    case Elem::Created:
      out_.created = parse_day_epoch(scalar_).value_or(0);
      break;
    case Elem::Modified:
      out_.modified = parse_day_epoch(scalar_).value_or(0);
      break;
    default:
      break;
    }
    target_ = nullptr;
    field_depth_ = 0;
    field_kind_ = Elem::Unknown;
  }

  void begin_check(const tinyxml2::XMLElement &el) {
    rule_ = PatternRule{};
    rule_.category = "Custom";
    section_ = Section::Check;

    if (const char *o = el.Attribute("order")) {
      std::string s = trim(o);
      try {
        size_t pos = 0;
        rule_.order = std::stoi(s, &pos);
        if (pos != s.size())
          throw std::invalid_argument(s);
      } catch (const std::logic_error &) {
        error_.emplace(ErrorKind::ParseError,
                       fmt::format("{}: check order '{}' is not an integer",
                                   origin_, o),
                       el.GetLineNum());
      }
    }
    if (const char *en = el.Attribute("enabled"))
      rule_.enabled = to_lower_ascii(trim(en)) == "true";
  }

  Profile &out_;
  std::string origin_;
  PatternRule rule_;
  Section section_{Section::None};
  int depth_{0};
  std::string *target_{nullptr};
  int field_depth_{0};
  Elem field_kind_{Elem::Unknown};
  std::string scalar_;
  std::optional<Error> error_;
};

bool ends_with(const std::string &s, const std::string &suf) {
  if (s.size() < suf.size())
    return false;
  return std::equal(suf.rbegin(), suf.rend(), s.rbegin());
}

std::optional<std::string> extract_tag(const std::string &xml,
                                       const std::string &tag) {
  const std::string open = "<" + tag + ">";
  const std::string close = "</" + tag + ">";
  auto b = xml.find(open);
  if (b == std::string::npos)
    return std::nullopt;
  b += open.size();
  auto e = xml.find(close, b);
  if (e == std::string::npos)
    return std::nullopt;
  return unescape_xml(trim(xml.substr(b, e - b)));
}

} // namespace

std::string Profile::fingerprint() const {
  std::string canon;
  for (const auto &r : rules) {
    canon += fmt::format("{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1e",
                         r.order, r.enabled ? 1 : 0, r.name, r.description,
                         r.category, r.pattern, r.replacement,
                         r.case_sensitive ? 1 : 0, r.exclude_pattern);
  }
  return xxh3_64_hex(canon);
}

void sort_rules(Profile &p) {
  std::stable_sort(p.rules.begin(), p.rules.end(),
                   [](const PatternRule &a, const PatternRule &b) {
                     return a.order < b.order;
                   });
}

std::vector<PatternRule> enabled_rules(const Profile &p) {
  std::vector<PatternRule> out;
  for (const auto &r : p.rules)
    if (r.enabled)
      out.push_back(r);
  std::stable_sort(out.begin(), out.end(),
                   [](const PatternRule &a, const PatternRule &b) {
                     return a.order < b.order;
                   });
  return out;
}

void touch(Profile &p) {
  auto today = day_epoch_now();
  if (p.created == 0)
    p.created = today;
  p.modified = today;
}

Profile parse_profile(const std::string &xml, const std::string &origin) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw Error(ErrorKind::ParseError,
                fmt::format("{}: {}", origin, doc.ErrorStr()),
                doc.ErrorLineNum());
  }
  const auto *root = doc.RootElement();
  if (!root || std::strcmp(root->Name(), "qa_profile") != 0) {
    throw Error(ErrorKind::ParseError,
                origin + ": root element is not <qa_profile>",
                root ? root->GetLineNum() : 0);
  }

  Profile p;
  p.name = "Untitled Profile";
  ProfileReader reader(p, origin);
  root->Accept(&reader);
  if (reader.error())
    throw *reader.error();

  sort_rules(p);
  for (size_t i = 1; i < p.rules.size(); ++i) {
    if (p.rules[i].order == p.rules[i - 1].order) {
      spdlog::warn("[profile={}] duplicate check order {} ('{}' and '{}')",
                   p.name, p.rules[i].order, p.rules[i - 1].name,
                   p.rules[i].name);
    }
  }
  return p;
}

std::string serialize_profile(const Profile &p) {
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<qa_profile>\n";

  xml += "    <metadata>\n";
  xml += fmt::format("        <name>{}</name>\n", escape_xml(p.name));
  xml += fmt::format("        <description>{}</description>\n",
                     escape_xml(p.description));
  xml += fmt::format("        <language>{}</language>\n", escape_xml(p.language));
  xml += fmt::format("        <created>{}</created>\n", p.created);
  xml += fmt::format("        <modified>{}</modified>\n", p.modified);
  xml += "    </metadata>\n";

  xml += "    <checks>\n";
  for (const auto &c : p.rules) {
    xml += fmt::format("        <check order=\"{}\" enabled=\"{}\">\n", c.order,
                       c.enabled ? "true" : "false");
    xml += fmt::format("            <name>{}</name>\n", escape_xml(c.name));
    xml += fmt::format("            <description>{}</description>\n",
                       escape_xml(c.description));
    xml += fmt::format("            <pattern>{}</pattern>\n", escape_xml(c.pattern));
    xml += fmt::format("            <replacement>{}</replacement>\n",
                       escape_xml(c.replacement));
    xml += fmt::format("            <category>{}</category>\n",
                       escape_xml(c.category));
    xml += fmt::format("            <case_sensitive>{}</case_sensitive>\n",
                       c.case_sensitive ? "true" : "false");
    xml += fmt::format("            <exclude_pattern>{}</exclude_pattern>\n",
                       escape_xml(c.exclude_pattern));
    xml += "        </check>\n";
  }
  xml += "    </checks>\n";
  xml += "</qa_profile>\n";
  return xml;
}

Profile load_profile(const fs::path &path) {
  auto xml = read_file(path);
  auto p = parse_profile(xml, path.string());
  spdlog::debug("loaded profile '{}' from {} ({} checks)", p.name,
                path.string(), p.rules.size());
  return p;
}

void save_profile(const Profile &p, const fs::path &path) {
  write_file(path, serialize_profile(p));
  spdlog::debug("saved profile '{}' to {}", p.name, path.string());
}

// ---------------------------------------------------------------------------

ProfileCatalog::ProfileCatalog(fs::path dir) : dir_(std::move(dir)) {}

std::string ProfileCatalog::file_name_for(const std::string &profile_name) {
  std::string stem = to_lower_ascii(trim(profile_name));
  std::replace(stem.begin(), stem.end(), ' ', '_');
  std::replace(stem.begin(), stem.end(), '/', '_');
  if (stem.empty())
    stem = fmt::format("imported_profile_{}", day_epoch_now());
  return stem + kSuffix;
}

std::vector<ProfileInfo> ProfileCatalog::list() const {
  std::vector<ProfileInfo> out;
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) {
    spdlog::warn("profiles directory not found: {}", dir_.string());
    return out;
  }

  for (const auto &e : fs::directory_iterator(dir_, ec)) {
    std::error_code ec2;
    if (!e.is_regular_file(ec2))
      continue;
    const auto fname = e.path().filename().string();
    if (!ends_with(fname, kSuffix))
      continue;

    std::string raw;
    try {
      raw = read_file(e.path());
    } catch (const Error &err) {
      spdlog::warn("skipping unreadable profile {}: {}", e.path().string(),
                   err.what());
      continue;
    }

    ProfileInfo info;
    info.path = e.path();
    try {
      auto p = parse_profile(raw, e.path().string());
      info.name = p.name;
      info.description = p.description;
      info.language = p.language;
      info.rule_count = p.rules.size();
      info.valid = true;
    } catch (const Error &err) {
      spdlog::warn("could not parse {}: {}", e.path().string(), err.what());
      info.error = err.what();
      info.name = extract_tag(raw, "name").value_or(e.path().stem().string());
      info.description = extract_tag(raw, "description").value_or("");
      info.language = extract_tag(raw, "language").value_or("");
    }
    out.push_back(std::move(info));
  }
  if (ec)
    spdlog::warn("listing {} failed: {}", dir_.string(), ec.message());

  std::sort(out.begin(), out.end(),
            [](const ProfileInfo &a, const ProfileInfo &b) {
              return a.path < b.path;
            });
  return out;
}

fs::path ProfileCatalog::save_as(const Profile &p,
                                 const std::string &file_name) const {
  std::string fname = file_name;
  if (!ends_with(fname, kSuffix))
    fname += kSuffix;
  auto dest = dir_ / fname;
  save_profile(p, dest);
  spdlog::info("profile '{}' saved as {}", p.name, dest.string());
  return dest;
}

fs::path ProfileCatalog::import_profile(const fs::path &src) const {
  auto raw = read_file(src);
  // refuse documents that would not load later
  auto p = parse_profile(raw, src.string());
  auto dest = dir_ / file_name_for(p.name);
  write_file(dest, raw);
  spdlog::info("profile '{}' imported as {}", p.name, dest.string());
  return dest;
}

void ProfileCatalog::export_profile(const fs::path &src,
                                    const fs::path &dest) const {
  write_file(dest, read_file(src));
  spdlog::info("profile {} exported to {}", src.string(), dest.string());
}

void ProfileCatalog::remove(const fs::path &p) const {
  std::error_code ec;
  if (!fs::exists(p, ec))
    throw Error(ErrorKind::MissingResource, "no such profile: " + p.string());
  if (!fs::remove(p, ec) || ec)
    throw Error(ErrorKind::IOError,
                "failed to delete profile " + p.string() + ": " + ec.message());
  spdlog::info("profile {} deleted", p.string());
}

} // namespace locqa
