#pragma once
#include <locqa/error.hpp>
#include <locqa/record.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace locqa {

// True when text holds an ICU MessageFormat argument ({n, plural, ...}) or
// something shaped like one with a mistranslated keyword.
bool has_icu_syntax(const std::string &text);

// Ways the target breaks the ICU structure of the source. Empty target or a
// consistent target gives an empty list.
std::vector<std::string> check_icu_segment(const std::string &source,
                                           const std::string &target);

// Short repair hint for a broken target, empty when there is nothing to say.
std::string icu_fix_hint(const std::string &source, const std::string &target);

struct IcuReport {
  std::string source;
  std::size_t records_checked = 0;
  std::size_t records_with_icu = 0;
  std::size_t records_failed = 0;
  Diagnostics diagnostics; // MessageFormat, subject is the record id
  std::vector<std::pair<std::string, std::string>> hints; // record id, hint
};

// Checks every record whose source or target uses ICU syntax. Inline tags
// are stripped first.
IcuReport validate_icu(const Records &records, const std::string &source);

} // namespace locqa
