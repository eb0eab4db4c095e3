#include <catch2/catch_all.hpp>

#include <locqa/error.hpp>
#include <locqa/library.hpp>
#include <locqa/util.hpp>

#include <filesystem>
#include <fstream>

using namespace locqa;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("locqa_library_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("Default library is four empty categories") {
  auto lib = default_library();
  REQUIRE(lib.categories.size() == 4);
  REQUIRE(lib.categories[0].name == "Tegnsetting");
  REQUIRE(lib.categories[1].name == "Harde mellomrom");
  REQUIRE(lib.categories[2].name == "Tall/tallformatering");
  REQUIRE(lib.categories[3].name == "Spesialtegn");
  REQUIRE(lib.entry_count() == 0);
}

TEST_CASE("Store falls back to defaults and persists changes") {
  auto dir = mkd("store");
  LibraryStore store(dir / "nested" / "library.xml");

  auto lib = store.load();
  REQUIRE(lib.categories.size() == 4);

  SnippetEntry e;
  e.name = "Ellipsis";
  e.description = "three dots <to> one & more";
  e.pattern = "\\.\\.\\.";
  e.replacement = "\xE2\x80\xA6";
  auto id = lib.add_entry("Tegnsetting", e);
  REQUIRE_FALSE(id.empty());
  store.save(lib);

  auto again = store.load();
  REQUIRE(again.categories.size() == 4);
  REQUIRE(again.categories[0].entries.size() == 1);
  const auto &got = again.categories[0].entries[0];
  REQUIRE(got.id == id);
  REQUIRE(got.name == "Ellipsis");
  REQUIRE(got.description == e.description);
  REQUIRE(got.pattern == e.pattern);
  REQUIRE(got.replacement == e.replacement);
  REQUIRE(got.category == "Tegnsetting");
}

TEST_CASE("Import assigns ids, categories and keeps duplicates") {
  auto dir = mkd("import");
  std::ofstream(dir / "lib.xml") << R"(<?xml version="1.0"?>
<regex-library>
  <category name="Dup">
    <entry id="fixed"><name>one</name><pattern>a</pattern><replace>b</replace></entry>
    <entry><name>two</name><pattern>c</pattern></entry>
  </category>
  <category name="Dup">
    <entry><name>three</name><pattern>d</pattern><replace> </replace></entry>
  </category>
  <entry><name>loose</name><pattern>e</pattern></entry>
</regex-library>
)";

  auto lib = import_library(dir / "lib.xml");
  REQUIRE(lib.categories.size() == 3);
  REQUIRE(lib.categories[0].name == "Dup");
  REQUIRE(lib.categories[1].name == "Dup");
  REQUIRE(lib.categories[2].name == "Uncategorized");

  const auto &c0 = lib.categories[0].entries;
  REQUIRE(c0.size() == 2);
  REQUIRE(c0[0].id == "fixed");
  REQUIRE(c0[0].replacement == "b");
  REQUIRE_FALSE(c0[1].id.empty());
  REQUIRE(c0[1].id != lib.categories[1].entries[0].id);
  REQUIRE(c0[1].category == "Dup");

  REQUIRE(lib.categories[2].entries[0].name == "loose");
  REQUIRE(lib.categories[2].entries[0].category == "Uncategorized");

  // import never touches the user's library
  LibraryStore store(dir / "default.xml");
  REQUIRE_FALSE(fs::exists(store.path()));

  export_library(lib, dir / "out.xml");
  auto back = import_library(dir / "out.xml");
  REQUIRE(back.categories.size() == 3);
  REQUIRE(back.categories[0].entries[1].id == c0[1].id);
}

TEST_CASE("Search, removal, merge") {
  auto lib = default_library();
  SnippetEntry nbsp;
  nbsp.name = "NBSP before percent";
  nbsp.pattern = "(\\d) %";
  nbsp.replacement = "$1\xC2\xA0%";
  auto id = lib.add_entry("Harde mellomrom", nbsp);

  SnippetEntry quote;
  quote.name = "Straight quotes";
  quote.description = "Use guillemets";
  quote.pattern = "\"";
  lib.add_entry("Nye", quote);

  REQUIRE(lib.categories.size() == 5);
  REQUIRE(lib.find_entries("percent").size() == 1);
  REQUIRE(lib.find_entries("GUILLEMETS").size() == 1);
  REQUIRE(lib.find_entries("\\d").size() == 1);
  REQUIRE(lib.find_entries("nothing").empty());

  REQUIRE(lib.remove_entry(id));
  REQUIRE_FALSE(lib.remove_entry(id));
  REQUIRE(lib.entry_count() == 1);

  auto other = default_library();
  lib.merge(other);
  REQUIRE(lib.categories.size() == 9);
}

TEST_CASE("Snippet becomes a profile rule") {
  SnippetEntry e{"id-1", "Name", "Desc", "a+", "b", "Cat"};
  auto r = rule_from_snippet(e, 7);
  REQUIRE(r.order == 7);
  REQUIRE(r.enabled);
  REQUIRE(r.name == "Name");
  REQUIRE(r.description == "Desc");
  REQUIRE(r.pattern == "a+");
  REQUIRE(r.replacement == "b");
  REQUIRE(r.category == "Cat");
  REQUIRE_FALSE(r.case_sensitive);
}

TEST_CASE("Library errors") {
  auto dir = mkd("errors");
  try {
    import_library(dir / "absent.xml");
    FAIL("expected an exception");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::MissingResource);
  }
  std::ofstream(dir / "bad.xml") << "<qa_profile/>";
  try {
    import_library(dir / "bad.xml");
    FAIL("expected an exception");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::ParseError);
  }
}
