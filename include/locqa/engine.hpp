#pragma once
#include <locqa/error.hpp>
#include <locqa/profile.hpp>
#include <locqa/record.hpp>
#include <locqa/rule.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace locqa {

// One accepted match. start/end are code-point offsets into the target text
// as it was before any replacement.
struct MatchReport {
  std::string record_id;
  std::string rule_name;
  int rule_order = 0;
  std::string category;
  std::string rule_description;
  std::string source_text;
  std::string target_text;
  std::string matched;
  std::size_t start = 0;
  std::size_t end = 0;
  std::string pattern;
  std::string replacement;
  std::string replacement_preview;
};

struct BatchFindResult {
  std::string profile_name;
  std::string source;
  std::string fingerprint;
  std::size_t total_matches = 0;
  std::vector<MatchReport> matches; // record order, then rule order
  Diagnostics diagnostics;
};

struct BatchReplaceResult {
  bool success = false;
  std::size_t modified_records = 0;
  std::size_t total_replacements = 0;
  std::string output_location; // set by whoever persists the records
  Diagnostics diagnostics;
};

struct ReplaceOutcome {
  Records records;
  BatchReplaceResult result;
};

struct EngineOptions {
  unsigned threads = 1; // <= 1 runs on the calling thread
  bool protect_tags = true; // inline markup is left alone by every rule
};

class Engine {
public:
  explicit Engine(EngineOptions opts = {});

  BatchFindResult find(const Profile &profile, const Records &records,
                       const std::string &source) const;

  // `records` is left untouched; the rewritten copy comes back whole.
  ReplaceOutcome replace(const Profile &profile, const Records &records) const;

private:
  struct RuleSet {
    std::vector<CompiledRule> rules;
    Diagnostics diagnostics;
  };

  RuleSet compile(const Profile &profile) const;

  // Calls fn(i) for every i in [0, n), spread over the worker pool.
  template <class Fn> void for_each_index(std::size_t n, Fn &&fn) const;

  EngineOptions opts_;
};

} // namespace locqa
