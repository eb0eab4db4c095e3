#pragma once
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace locqa {

struct PatternRule {
  int order = 0;
  bool enabled = true;
  std::string name;
  std::string description;
  std::string category;
  std::string pattern;
  std::string replacement;
  bool case_sensitive = false;
  std::string exclude_pattern; // empty: no exclusion
};

// A record's text with inline tags cut out. Recognised tags are XML tags and
// tags escaped once (&lt;b&gt;) or twice (&amp;lt;b&amp;gt;). Each run is a
// stretch of text between two tags.
struct InlineText {
  struct Run {
    std::size_t plain_begin;
    std::size_t orig_begin;
    std::size_t size;
  };

  std::string plain;
  std::vector<Run> runs;

  static InlineText split(const std::string &text);
  // One run covering the whole text; tags are treated as text.
  static InlineText whole(const std::string &text);

  // Plain offset to offset in the original text. map_begin puts a position on
  // a tag boundary after the tag, map_end before it.
  std::size_t map_begin(std::size_t p) const;
  std::size_t map_end(std::size_t p) const;

  // True when a tag sits strictly inside the plain range [b, e).
  bool crosses_tag(std::size_t b, std::size_t e) const;
};

// One accepted occurrence. Offsets are byte offsets into the original text,
// tags included.
struct RuleMatch {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::string text;
  std::string expanded; // replacement with back-references resolved
};

// Rewrites \1..\9 back-references to the $n form std::regex expects.
std::string normalize_backrefs(const std::string &replacement);

// Empty optional when the pattern compiles, the regex error text otherwise.
std::optional<std::string> validate_pattern(const std::string &pattern,
                                            bool case_sensitive = false);

// A rule with its regexes built once. Immutable after compile(), so one
// instance may be scanned from several threads at the same time.
class CompiledRule {
public:
  // Throws locqa::Error(InvalidPattern) when pattern or exclusion is invalid.
  // With protect_tags, inline tags are never matched or rewritten.
  static CompiledRule compile(const PatternRule &rule, bool protect_tags = true);

  const PatternRule &rule() const { return rule_; }
  bool is_noop() const { return !re_.has_value(); }

  // Leftmost-first, non-overlapping matches minus the excluded ones and
  // those that would swallow a tag. May throw std::regex_error when the engine hits its complexity limit.
  std::vector<RuleMatch> find(const std::string &text) const;

  // Replaces every accepted match; returns the number of spans replaced.
  std::size_t replace(const std::string &text, std::string &out) const;

private:
  struct Span {
    std::size_t begin;
    std::size_t end;
  };

  explicit CompiledRule(PatternRule rule) : rule_(std::move(rule)) {}

  InlineText prepare(const std::string &text) const;
  std::vector<Span> exclusion_spans(const InlineText &in) const;
  // Accepted matches as original-text spans plus their expansion.
  std::vector<RuleMatch> scan(const InlineText &in) const;
  static bool suppressed(const std::vector<Span> &ex, std::size_t b,
                         std::size_t e);

  PatternRule rule_;
  std::optional<std::regex> re_;
  std::optional<std::regex> exclude_;
  std::string format_;
  bool protect_tags_ = true;
};

} // namespace locqa
