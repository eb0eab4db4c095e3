#include <catch2/catch_all.hpp>

#include <locqa/icu_check.hpp>

#include <string>
#include <vector>

using namespace locqa;

static const std::string kSource = "{count, plural, one {# item} other {# items}}";

static bool mentions(const std::vector<std::string> &errors,
                     const std::string &needle) {
  for (const auto &e : errors)
    if (e.find(needle) != std::string::npos)
      return true;
  return false;
}

TEST_CASE("ICU arguments are recognised") {
  REQUIRE(has_icu_syntax(kSource));
  REQUIRE(has_icu_syntax("{n, SELECT, male {he} other {they}}"));
  REQUIRE(has_icu_syntax("{count, flertall, one {x} other {y}}"));
  REQUIRE_FALSE(has_icu_syntax("Hello {name}"));
  REQUIRE_FALSE(has_icu_syntax("Price: 10 EUR"));
}

TEST_CASE("A faithful translation passes") {
  REQUIRE(check_icu_segment(kSource,
                            "{count, plural, one {# element} other {# elementer}}")
              .empty());
  REQUIRE(check_icu_segment(kSource, "").empty());
}

TEST_CASE("Translated keywords, categories and variables are reported") {
  auto keyword = check_icu_segment(
      kSource, "{count, flertall, one {# element} other {# elementer}}");
  REQUIRE(keyword.size() == 1);
  REQUIRE(mentions(keyword, "\"plural\""));

  auto renamed = check_icu_segment(
      kSource, "{antall, plural, en {# element} other {# elementer}}");
  REQUIRE(mentions(renamed, "Category \"one\""));
  REQUIRE(mentions(renamed, "Variable name(s) changed: count"));
}

TEST_CASE("Brace and hash counts are compared") {
  auto open = check_icu_segment(
      kSource, "{count, plural, one {# element} other {# elementer}");
  REQUIRE(mentions(open, "Missing 1 closing brace(s) } in target"));

  auto hash = check_icu_segment(
      kSource, "{count, plural, one {ett element} other {# elementer}}");
  REQUIRE(mentions(hash, "Hash (#) count mismatch (source: 2, target: 1)"));
  REQUIRE(icu_fix_hint(kSource,
                       "{count, plural, one {ett element} other {# elementer}}") ==
          "Restore 1 hash symbol(s) #");

  auto offset = check_icu_segment("{n, plural, offset:1 one {#} other {#}}",
                                  "{n, plural, one {#} other {#}}");
  REQUIRE(mentions(offset, "\"offset:\" is missing"));
}

TEST_CASE("Records are validated with tags stripped") {
  Records recs = {
      {"ok", kSource, "<x id=\"#1\"/>{count, plural, one {# fil} other {# filer}}", {}},
      {"bad", kSource, "{count, flertall, one {# fil} other {# filer}}", {}},
      {"plain", "Hello", "Hei", {}},
  };
  auto rep = validate_icu(recs, "job.xlf");
  REQUIRE(rep.source == "job.xlf");
  REQUIRE(rep.records_checked == 3);
  REQUIRE(rep.records_with_icu == 2);
  REQUIRE(rep.records_failed == 1);
  REQUIRE_FALSE(rep.diagnostics.empty());
  for (const auto &d : rep.diagnostics) {
    REQUIRE(d.kind == ErrorKind::MessageFormat);
    REQUIRE(d.subject == "bad");
  }
  REQUIRE(rep.hints.size() == 1);
  REQUIRE(rep.hints[0].second == "Restore ICU keyword \"plural\"");
}
