#include <catch2/catch_all.hpp>

#include <locqa/error.hpp>
#include <locqa/xbench.hpp>

#include <filesystem>
#include <fstream>

using namespace locqa;
namespace fs = std::filesystem;

static const char *kChecklist = R"(<?xml version="1.0" encoding="UTF-8"?>
<Checklist>
  <ChecklistName>Norsk QA</ChecklistName>
  <Items>
    <ChecklistItem id="c1">
      <Name>Double space</Name>
      <SearchText> {2,}</SearchText>
      <ReplaceText> </ReplaceText>
      <IsRegEx>true</IsRegEx>
      <Category>Tegnsetting</Category>
      <Comment>Collapse runs of spaces</Comment>
    </ChecklistItem>
    <PowerSearchItem Name="Literal EUR" SearchText="EUR" IsRegEx="false"/>
    <QAItem>
      <Name>Disabled</Name>
      <SearchText>\d+</SearchText>
      <IsRegEx>1</IsRegEx>
      <Enabled>no</Enabled>
    </QAItem>
    <Item>
      <Name>Source only</Name>
      <SearchText>foo</SearchText>
      <IsRegEx>yes</IsRegEx>
      <SearchInTarget>false</SearchInTarget>
    </Item>
    <Item>
      <Name>No search text</Name>
    </Item>
    <Item ID="c5">
      <SearchText>(\w+)@(\w+)</SearchText>
      <ReplaceText>$2 at $1</ReplaceText>
      <IsRegEx>on</IsRegEx>
      <MatchCase>true</MatchCase>
    </Item>
  </Items>
</Checklist>
)";

TEST_CASE("Checklist items are read from elements and attributes") {
  auto list = parse_checklist(kChecklist, "test.xbckl");
  REQUIRE(list.name == "Norsk QA");
  REQUIRE(list.items.size() == 5);

  const auto &first = list.items[0];
  REQUIRE(first.id == "c1");
  REQUIRE(first.name == "Double space");
  REQUIRE(first.search_text == "{2,}");
  REQUIRE(first.is_regex);
  REQUIRE(first.category == "Tegnsetting");
  REQUIRE(first.description == "Collapse runs of spaces");

  const auto &literal = list.items[1];
  REQUIRE(literal.name == "Literal EUR");
  REQUIRE(literal.search_text == "EUR");
  REQUIRE_FALSE(literal.is_regex);
  REQUIRE(literal.id == "item_1");

  REQUIRE_FALSE(list.items[2].enabled);
  REQUIRE_FALSE(list.items[3].search_in_target);

  const auto &last = list.items[4];
  REQUIRE(last.id == "c5");
  REQUIRE(last.name == "Unnamed Item");
  REQUIRE(last.case_sensitive);
  REQUIRE(last.replace_text == "$2 at $1");

  auto s = list.statistics();
  REQUIRE(s.total_items == 5);
  REQUIRE(s.regex_items == 4);
  REQUIRE(s.enabled_items == 4);
  REQUIRE(s.with_replacement == 1);
}

TEST_CASE("Enabled target regex items become profile rules") {
  auto list = parse_checklist(kChecklist, "test.xbckl");
  auto p = profile_from_checklist(list, "fallback");
  REQUIRE(p.name == "Norsk QA");
  REQUIRE(p.rules.size() == 2);
  REQUIRE(p.rules[0].order == 1);
  REQUIRE(p.rules[0].name == "Double space");
  REQUIRE(p.rules[0].category == "Tegnsetting");
  REQUIRE(p.rules[1].order == 2);
  REQUIRE(p.rules[1].category == "Uncategorized");
  REQUIRE(p.rules[1].case_sensitive);
  REQUIRE(p.modified > 0);

  list.name.clear();
  REQUIRE(profile_from_checklist(list, "fallback").name == "fallback");
}

TEST_CASE("Broken checklists raise ParseError") {
  REQUIRE_THROWS_AS(parse_checklist("<Checklist><Item>", "bad.xbckl"), Error);
  try {
    parse_checklist("<Checklist>\n<Item>\n</Checklist>", "bad.xbckl");
    FAIL("expected an exception");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::ParseError);
  }
}

TEST_CASE("Checklists load from disk") {
  auto dir = fs::temp_directory_path() / "locqa_xbench_load";
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::ofstream(dir / "list.xbckl") << kChecklist;
  REQUIRE(load_checklist(dir / "list.xbckl").items.size() == 5);
  REQUIRE_THROWS_AS(load_checklist(dir / "missing.xbckl"), Error);
}
