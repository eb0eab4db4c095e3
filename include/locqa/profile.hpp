#pragma once
#include <locqa/rule.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace locqa {

struct Profile {
  std::string name;
  std::string description;
  std::string language;
  std::vector<PatternRule> rules;
  std::int64_t created = 0;  // day-aligned epoch seconds
  std::int64_t modified = 0;

  // xxh3 over the canonical rule list; identifies the rule set in reports
  std::string fingerprint() const;
};

// Stable sort by order; equal orders keep declaration order.
void sort_rules(Profile &p);

// Enabled rules in ascending order.
std::vector<PatternRule> enabled_rules(const Profile &p);

// Stamps modified (and created, when unset) with today's date.
void touch(Profile &p);

Profile parse_profile(const std::string &xml, const std::string &origin);
std::string serialize_profile(const Profile &p);

// Throw locqa::Error: MissingResource, IOError or ParseError.
Profile load_profile(const std::filesystem::path &path);
void save_profile(const Profile &p, const std::filesystem::path &path);

struct ProfileInfo {
  std::filesystem::path path;
  std::string name;
  std::string description;
  std::string language;
  std::size_t rule_count = 0;
  bool valid = false;  // false: metadata came from best-effort extraction
  std::string error;
};

// Profile documents kept in one directory, recognised by file name suffix.
class ProfileCatalog {
public:
  static constexpr const char *kSuffix = "_qa_profile.xml";

  explicit ProfileCatalog(std::filesystem::path dir);

  const std::filesystem::path &dir() const { return dir_; }

  std::vector<ProfileInfo> list() const;

  std::filesystem::path save_as(const Profile &p,
                                const std::string &file_name) const;
  std::filesystem::path import_profile(const std::filesystem::path &src) const;
  void export_profile(const std::filesystem::path &src,
                      const std::filesystem::path &dest) const;
  void remove(const std::filesystem::path &p) const;

  static std::string file_name_for(const std::string &profile_name);

private:
  std::filesystem::path dir_;
};

} // namespace locqa
