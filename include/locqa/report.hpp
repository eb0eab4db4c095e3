#pragma once
#include <locqa/edits.hpp>
#include <locqa/engine.hpp>
#include <locqa/icu_check.hpp>
#include <locqa/xliff_store.hpp>

#include <string>
#include <utility>
#include <vector>

namespace locqa {

struct RuleTally {
  int order = 0;
  std::string name;
  std::string category;
  std::size_t matches = 0;
  std::size_t records_hit = 0;
};

struct FindSummary {
  std::string profile_name;
  std::string source;
  std::size_t total_matches = 0;
  std::size_t records_with_matches = 0;
  std::vector<RuleTally> rules;                               // rule order
  std::vector<std::pair<std::string, std::size_t>> categories; // first seen
};

FindSummary summarize(const BatchFindResult &res);

std::string json_escape(const std::string &s);

std::string to_json(const BatchFindResult &res);
std::string to_json(const BatchReplaceResult &res);
std::string to_json(const FindSummary &s);
std::string to_json(const XliffStatistics &s);
std::string to_json(const IcuReport &rep);

std::string render_text(const BatchFindResult &res);
std::string render_text(const FindSummary &s);
std::string render_text(const BatchReplaceResult &res);
std::string render_text(const IcuReport &rep);

} // namespace locqa
