#include <catch2/catch_all.hpp>

#include <locqa/engine.hpp>
#include <locqa/thread_pool.hpp>

#include <atomic>
#include <stdexcept>

using namespace locqa;

static PatternRule rule(int order, const std::string &name,
                        const std::string &pattern,
                        const std::string &replacement = "") {
  PatternRule r;
  r.order = order;
  r.name = name;
  r.category = "Tegnsetting";
  r.pattern = pattern;
  r.replacement = replacement;
  return r;
}

static Records records(std::initializer_list<std::pair<const char *, const char *>> rs) {
  Records out;
  for (const auto &r : rs)
    out.push_back(TextRecord{r.first, std::string("src ") + r.first, r.second, {}});
  return out;
}

TEST_CASE("Price scenario in find and replace mode") {
  Profile p;
  p.name = "nb";
  p.rules = {rule(1, "double space", " {2,}", " ")};
  auto recs = records({{"1", "Price: 10  EUR"}});
  Engine engine;

  auto found = engine.find(p, recs, "file.xlf");
  REQUIRE(found.total_matches == 1);
  REQUIRE(found.matches.size() == 1);
  const auto &m = found.matches[0];
  REQUIRE(m.record_id == "1");
  REQUIRE(m.rule_name == "double space");
  REQUIRE(m.rule_order == 1);
  REQUIRE(m.category == "Tegnsetting");
  REQUIRE(m.source_text == "src 1");
  REQUIRE(m.target_text == "Price: 10  EUR");
  REQUIRE(m.matched == "  ");
  REQUIRE(m.start == 9);
  REQUIRE(m.end == 11);
  REQUIRE(m.pattern == " {2,}");
  REQUIRE(m.replacement == " ");
  REQUIRE(m.replacement_preview == " ");
  REQUIRE(found.source == "file.xlf");
  REQUIRE(found.profile_name == "nb");
  REQUIRE(found.fingerprint == p.fingerprint());

  auto out = engine.replace(p, recs);
  REQUIRE(out.result.success);
  REQUIRE(out.result.total_replacements == 1);
  REQUIRE(out.result.modified_records == 1);
  REQUIRE(out.records[0].target == "Price: 10 EUR");
  REQUIRE(out.records[0].source == "src 1");
  REQUIRE(recs[0].target == "Price: 10  EUR");
}

TEST_CASE("Rules apply by order value, each on the previous output") {
  Profile p;
  p.rules = {rule(2, "strip", "^ ", ""), rule(1, "collapse", " {2,}", " ")};
  auto out = Engine().replace(p, records({{"1", "  hello"}}));
  REQUIRE(out.records[0].target == "hello");
  REQUIRE(out.result.total_replacements == 2);
  REQUIRE(out.result.modified_records == 1);

  Profile swapped;
  swapped.rules = {rule(1, "strip", "^ ", ""), rule(2, "collapse", " {2,}", " ")};
  auto out2 = Engine().replace(swapped, records({{"1", "  hello"}}));
  REQUIRE(out2.records[0].target == " hello");
}

TEST_CASE("Disabled and no-op rules leave records alone") {
  Profile p;
  p.rules = {rule(1, "a", "a", "b"), rule(2, "empty", "", "x")};
  p.rules[0].enabled = false;
  auto recs = records({{"1", "banana"}, {"2", ""}});

  auto out = Engine().replace(p, recs);
  REQUIRE(out.result.total_replacements == 0);
  REQUIRE(out.result.modified_records == 0);
  REQUIRE(out.records[0].target == "banana");

  auto found = Engine().find(p, recs, "x");
  REQUIRE(found.total_matches == 0);
  REQUIRE(found.matches.empty());
}

TEST_CASE("Replacement that reproduces the text counts spans, not modifications") {
  Profile p;
  p.rules = {rule(1, "same", "a", "a")};
  auto out = Engine().replace(p, records({{"1", "banana"}}));
  REQUIRE(out.result.total_replacements == 3);
  REQUIRE(out.result.modified_records == 0);
}

TEST_CASE("Find reports in record order then rule order, and is repeatable") {
  Profile p;
  p.rules = {rule(2, "digits", "\\d+"), rule(1, "spaces", " {2,}")};
  auto recs = records({{"a", "1  2"}, {"b", ""}, {"c", "x  y 3"}});
  Engine engine;

  auto first = engine.find(p, recs, "src");
  REQUIRE(first.total_matches == first.matches.size());
  REQUIRE(first.matches.size() == 5);
  REQUIRE(first.matches[0].record_id == "a");
  REQUIRE(first.matches[0].rule_name == "spaces");
  REQUIRE(first.matches[1].rule_name == "digits");
  REQUIRE(first.matches[1].matched == "1");
  REQUIRE(first.matches[2].matched == "2");
  REQUIRE(first.matches[3].record_id == "c");
  REQUIRE(first.matches[3].rule_name == "spaces");
  REQUIRE(first.matches[4].matched == "3");

  auto second = engine.find(p, recs, "src");
  REQUIRE(second.matches.size() == first.matches.size());
  for (size_t i = 0; i < first.matches.size(); ++i) {
    REQUIRE(second.matches[i].record_id == first.matches[i].record_id);
    REQUIRE(second.matches[i].start == first.matches[i].start);
    REQUIRE(second.matches[i].rule_order == first.matches[i].rule_order);
  }
  REQUIRE(recs[0].target == "1  2");
}

TEST_CASE("Offsets count code points") {
  Profile p;
  p.rules = {rule(1, "double space", " {2,}", " ")};
  auto found = Engine().find(p, records({{"1", "\xC3\x86\xC3\xB8\xC3\xA5  x"}}), "s");
  REQUIRE(found.matches.size() == 1);
  REQUIRE(found.matches[0].start == 3);
  REQUIRE(found.matches[0].end == 5);
}

TEST_CASE("An invalid pattern is reported and skipped") {
  Profile p;
  p.name = "broken";
  p.rules = {rule(1, "bad", "(unclosed"), rule(2, "good", " {2,}", " ")};
  auto recs = records({{"1", "a  b"}});

  auto found = Engine().find(p, recs, "s");
  REQUIRE(found.diagnostics.size() == 1);
  REQUIRE(found.diagnostics[0].kind == ErrorKind::InvalidPattern);
  REQUIRE(found.diagnostics[0].subject == "bad");
  REQUIRE(found.total_matches == 1);

  auto out = Engine().replace(p, recs);
  REQUIRE(out.result.success);
  REQUIRE(out.result.diagnostics.size() == 1);
  REQUIRE(out.records[0].target == "a b");
}

TEST_CASE("Worker count does not change results") {
  Profile p;
  p.rules = {rule(1, "collapse", " {2,}", " "), rule(2, "digits", "(\\d+)", "<$1>"),
             rule(3, "strip", "^ ", "")};
  Records recs;
  for (int i = 0; i < 300; ++i) {
    std::string t(static_cast<size_t>(i % 4), ' ');
    t += "item " + std::to_string(i) + "   end";
    recs.push_back(TextRecord{"r" + std::to_string(i), "", t, {}});
  }

  Engine serial(EngineOptions{1});
  Engine pooled(EngineOptions{6});

  auto f1 = serial.find(p, recs, "s");
  auto f6 = pooled.find(p, recs, "s");
  REQUIRE(f1.total_matches == f6.total_matches);
  for (size_t i = 0; i < f1.matches.size(); ++i) {
    REQUIRE(f1.matches[i].record_id == f6.matches[i].record_id);
    REQUIRE(f1.matches[i].rule_order == f6.matches[i].rule_order);
    REQUIRE(f1.matches[i].start == f6.matches[i].start);
  }

  auto r1 = serial.replace(p, recs);
  auto r6 = pooled.replace(p, recs);
  REQUIRE(r1.result.total_replacements == r6.result.total_replacements);
  REQUIRE(r1.result.modified_records == r6.result.modified_records);
  REQUIRE(r1.result.modified_records == 300);
  for (size_t i = 0; i < recs.size(); ++i)
    REQUIRE(r1.records[i].target == r6.records[i].target);
  REQUIRE(r1.records[5].target == "item <5> end");
}

TEST_CASE("Thread pool waits for running tasks and surfaces failures") {
  ThreadPool pool(4);
  std::atomic<int> done{0};
  for (int i = 0; i < 100; ++i)
    pool.submit([&done] { ++done; });
  pool.wait_idle();
  REQUIRE(done.load() == 100);

  pool.submit([] { throw std::runtime_error("boom"); });
  REQUIRE_THROWS_AS(pool.wait_idle(), std::runtime_error);

  pool.submit([&done] { ++done; });
  pool.wait_idle();
  REQUIRE(done.load() == 101);
}

TEST_CASE("Match offsets after an inline tag are code points in the target") {
  Profile p;
  p.rules = {rule(1, "double space", " {2,}", " ")};
  auto recs = records({{"1", "<ph id=\"1\"/>Pr\xC3\xA8s: 10  EUR"}});
  Engine engine;

  auto found = engine.find(p, recs, "f");
  REQUIRE(found.total_matches == 1);
  REQUIRE(found.matches[0].start == 20);
  REQUIRE(found.matches[0].end == 22);

  auto out = engine.replace(p, recs);
  REQUIRE(out.records[0].target == "<ph id=\"1\"/>Pr\xC3\xA8s: 10 EUR");
}

TEST_CASE("Number rules leave tag ids alone in replace mode") {
  Profile p;
  p.rules = {rule(1, "digits", "\\d+", "N")};
  auto recs = records({{"1", "<g id=\"1\">10</g> &amp; 20"}});

  auto out = Engine{}.replace(p, recs);
  REQUIRE(out.result.total_replacements == 2);
  REQUIRE(out.records[0].target == "<g id=\"1\">N</g> &amp; N");

  EngineOptions raw;
  raw.protect_tags = false;
  auto loose = Engine{raw}.replace(p, recs);
  REQUIRE(loose.result.total_replacements == 3);
}
