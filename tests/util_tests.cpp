#include <catch2/catch_all.hpp>

#include <locqa/util.hpp>

using namespace locqa;

TEST_CASE("XML escaping round-trips markup and whitespace") {
  REQUIRE(escape_xml("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");
  REQUIRE(escape_xml("  ") == "&#x20;&#x20;");
  REQUIRE(escape_xml(" x ") == " x ");
  REQUIRE(escape_xml("a\r\nb") == "a&#xD;\nb");
  REQUIRE(escape_xml("a\tb", true) == "a&#x9;b");

  REQUIRE(unescape_xml("&lt;&amp;&gt;&quot;&apos;") == "<&>\"'");
  REQUIRE(unescape_xml("&#x20;&#65;&#xC5;") == " A\xC3\x85");
  REQUIRE(unescape_xml("a & b") == "a & b");
  REQUIRE(unescape_xml("&unknown;") == "&unknown;");
}

TEST_CASE("Day epochs") {
  REQUIRE(parse_day_epoch("1704067200").value_or(-1) == 1704067200);
  REQUIRE(parse_day_epoch(" 2024-01-02 ").value_or(-1) == 1704153600);
  REQUIRE_FALSE(parse_day_epoch("").has_value());
  REQUIRE_FALSE(parse_day_epoch("yesterday").has_value());
  REQUIRE(day_epoch_now() % 86400 == 0);
}

TEST_CASE("Identifiers and hashes") {
  auto a = random_id();
  auto b = random_id();
  REQUIRE(a != b);
  REQUIRE(a.size() == 36);
  REQUIRE(a[8] == '-');
  REQUIRE(a[14] == '4');

  REQUIRE(xxh3_64_hex("abc") == xxh3_64_hex("abc"));
  REQUIRE(xxh3_64_hex("abc") != xxh3_64_hex("abd"));
}

TEST_CASE("UTF-8 offsets and trimming") {
  const std::string s = "\xC3\x86x\xE2\x80\xA6y";
  REQUIRE(utf8_offset(s, 0) == 0);
  REQUIRE(utf8_offset(s, 2) == 1);
  REQUIRE(utf8_offset(s, 3) == 2);
  REQUIRE(utf8_offset(s, 6) == 3);
  REQUIRE(utf8_offset(s, 100) == 4);

  REQUIRE(trim("  a b \n") == "a b");
  REQUIRE(to_lower_ascii("TrUe") == "true");
}
