#pragma once
#include <locqa/record.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
} // namespace tinyxml2

namespace locqa {

struct XliffStatistics {
  std::size_t total_units = 0;
  std::size_t translated = 0;
  std::size_t untranslated = 0;
};

// XLIFF 1.2 <trans-unit> and 2.x <unit>/<segment> documents. Record text is
// the inner markup of <source>/<target>; rules skip the inline tags in it.
class XliffStore : public RecordStore {
public:
  // Throws locqa::Error (MissingResource, IOError, ParseError).
  explicit XliffStore(std::filesystem::path path);
  ~XliffStore() override;

  Records list() const override;

  // Rewrites targets of the listed ids and saves to `location` (the source
  // file when empty). Unknown ids are ignored.
  std::filesystem::path persist(const Records &records,
                                const std::filesystem::path &location) override;

  std::string identifier() const override { return path_.string(); }

  XliffStatistics statistics() const;

private:
  struct Unit {
    std::string id;
    tinyxml2::XMLElement *container = nullptr; // trans-unit or segment
    tinyxml2::XMLElement *source = nullptr;
    tinyxml2::XMLElement *target = nullptr;
    std::string state;
    std::string approved;
  };

  void collect(tinyxml2::XMLElement *el);
  void set_target(Unit &u, const std::string &text);

  std::filesystem::path path_;
  std::unique_ptr<tinyxml2::XMLDocument> doc_;
  std::vector<Unit> units_;
};

// True when the extension is one of the XLIFF flavours the store reads.
bool is_xliff_path(const std::filesystem::path &p);

} // namespace locqa
