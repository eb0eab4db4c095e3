#include <catch2/catch_all.hpp>

#include <locqa/error.hpp>
#include <locqa/xliff_store.hpp>

#include <filesystem>
#include <fstream>

using namespace locqa;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("locqa_xliff_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static const char *kXliff12 = R"(<?xml version="1.0" encoding="UTF-8"?>
<xliff version="1.2" xmlns="urn:oasis:names:tc:xliff:document:1.2">
  <file source-language="en" target-language="nb" datatype="plaintext" original="x">
    <body>
      <trans-unit id="1" approved="yes">
        <source>Price: 10  EUR</source>
        <target state="translated">Pris: 10  EUR</target>
      </trans-unit>
      <trans-unit id="2">
        <source>Hello <g id="b">world</g></source>
      </trans-unit>
    </body>
  </file>
</xliff>
)";

static const char *kXliff20 = R"(<?xml version="1.0" encoding="UTF-8"?>
<xliff version="2.0" xmlns="urn:oasis:names:tc:xliff:document:2.0" srcLang="en" trgLang="nb">
  <file id="f1">
    <unit id="u1">
      <segment state="initial"><source>One</source></segment>
    </unit>
    <unit id="u2">
      <segment id="s1"><source>A</source><target>B</target></segment>
      <segment id="s2"><source>C</source></segment>
    </unit>
  </file>
</xliff>
)";

TEST_CASE("XLIFF 1.2 units become records") {
  auto dir = mkd("v12");
  std::ofstream(dir / "a.xlf") << kXliff12;

  XliffStore store(dir / "a.xlf");
  auto recs = store.list();
  REQUIRE(recs.size() == 2);

  REQUIRE(recs[0].id == "1");
  REQUIRE(recs[0].source == "Price: 10  EUR");
  REQUIRE(recs[0].target == "Pris: 10  EUR");
  REQUIRE(recs[0].metadata.at("state") == "translated");
  REQUIRE(recs[0].metadata.at("approved") == "yes");

  REQUIRE(recs[1].id == "2");
  REQUIRE(recs[1].source == "Hello <g id=\"b\">world</g>");
  REQUIRE(recs[1].target.empty());
  REQUIRE(recs[1].metadata.at("has_target") == "false");

  auto st = store.statistics();
  REQUIRE(st.total_units == 2);
  REQUIRE(st.translated == 1);
  REQUIRE(st.untranslated == 1);
}

TEST_CASE("Persisted targets read back identically") {
  auto dir = mkd("persist");
  std::ofstream(dir / "a.xlf") << kXliff12;

  XliffStore store(dir / "a.xlf");
  auto recs = store.list();
  recs[0].target = "Pris: 10 EUR & mer";
  recs[1].target = "Hei <g id=\"b\">verden</g>";

  auto out = store.persist(recs, dir / "out" / "b.xlf");
  REQUIRE(out.string() == (dir / "out" / "b.xlf").string());

  XliffStore again(out);
  auto back = again.list();
  REQUIRE(back.size() == 2);
  REQUIRE(back[0].target == "Pris: 10 EUR &amp; mer");
  REQUIRE(back[1].target == "Hei <g id=\"b\">verden</g>");
  REQUIRE(back[1].source == "Hello <g id=\"b\">world</g>");
  REQUIRE(again.statistics().translated == 2);

  // the original file is untouched when an output path is given
  REQUIRE(XliffStore(dir / "a.xlf").list()[0].target == "Pris: 10  EUR");
}

TEST_CASE("XLIFF 2 segments become records") {
  auto dir = mkd("v20");
  std::ofstream(dir / "a.xliff") << kXliff20;

  XliffStore store(dir / "a.xliff");
  auto recs = store.list();
  REQUIRE(recs.size() == 3);
  REQUIRE(recs[0].id == "u1");
  REQUIRE(recs[0].metadata.at("state") == "initial");
  REQUIRE(recs[1].id == "u2:s1");
  REQUIRE(recs[1].target == "B");
  REQUIRE(recs[2].id == "u2:s2");

  recs[2].target = "D";
  store.persist(recs, {});

  auto back = XliffStore(dir / "a.xliff").list();
  REQUIRE(back[2].target == "D");
  REQUIRE(back[0].target.empty());
}

TEST_CASE("XLIFF errors and extensions") {
  auto dir = mkd("errors");
  std::ofstream(dir / "bad.xlf") << "<xliff><file>";
  std::ofstream(dir / "other.xlf") << "<qa_profile/>";

  REQUIRE_THROWS_AS(XliffStore(dir / "missing.xlf"), Error);
  try {
    XliffStore s(dir / "bad.xlf");
    FAIL("expected an exception");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::ParseError);
  }
  try {
    XliffStore s(dir / "other.xlf");
    FAIL("expected an exception");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::ParseError);
  }

  REQUIRE(is_xliff_path("a.XLF"));
  REQUIRE(is_xliff_path("a.sdlxliff"));
  REQUIRE_FALSE(is_xliff_path("a.txt"));
}
