#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace locqa {

// One unit of localized text. The engine only reads `source` and only
// rewrites `target`; `metadata` travels through untouched.
struct TextRecord {
  std::string id;
  std::string source;
  std::string target;
  std::map<std::string, std::string> metadata;
};

using Records = std::vector<TextRecord>;

class RecordStore {
public:
  virtual ~RecordStore() = default;

  // Records in document order.
  virtual Records list() const = 0;

  // Writes the records' targets back; returns where they ended up.
  virtual std::filesystem::path persist(const Records &records,
                                        const std::filesystem::path &location) = 0;

  // Human-readable identifier used in reports.
  virtual std::string identifier() const = 0;
};

} // namespace locqa
