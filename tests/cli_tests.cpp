#include <catch2/catch_all.hpp>

#include <locqa/cli.hpp>

#include <string>
#include <vector>

using namespace locqa;

static ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "locqa");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("No arguments shows help") {
  auto r = parse({});
  REQUIRE(r.cmd.has_value());
  REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
}

TEST_CASE("batch-replace with options and globals in any position") {
  auto r = parse({"--threads", "4", "batch-replace", "job.xlf", "nb", "-o",
                  "out.xlf", "--no-backup", "--verbose", "--json"});
  REQUIRE(r.error.empty());
  REQUIRE(r.cmd.has_value());
  auto *c = std::get_if<CmdBatchReplace>(&*r.cmd);
  REQUIRE(c);
  REQUIRE(c->file == "job.xlf");
  REQUIRE(c->profile == "nb");
  REQUIRE(c->output == "out.xlf");
  REQUIRE(c->no_backup);
  REQUIRE(c->json);
  REQUIRE(r.globals.threads.value_or(0) == 4);
  REQUIRE(r.globals.verbose);
}

TEST_CASE("find takes its pattern after --") {
  auto r = parse({"find", "job.xlf", "--exclude=\\d", "--", "-{2,}"});
  REQUIRE(r.error.empty());
  auto *c = std::get_if<CmdFind>(&*r.cmd);
  REQUIRE(c);
  REQUIRE(c->pattern == "-{2,}");
  REQUIRE(c->exclude == "\\d");
  REQUIRE_FALSE(c->case_sensitive);
}

TEST_CASE("Subcommands") {
  auto lib = parse({"library", "add", "Tegnsetting", "Ellipsis", "\\.\\.\\.",
                    "-r", "x", "--library", "/tmp/lib.xml"});
  REQUIRE(lib.error.empty());
  auto *add = std::get_if<CmdLibraryAdd>(&*lib.cmd);
  REQUIRE(add);
  REQUIRE(add->category == "Tegnsetting");
  REQUIRE(add->pattern == "\\.\\.\\.");
  REQUIRE(add->replacement == "x");
  REQUIRE(lib.globals.library.value_or("") == "/tmp/lib.xml");

  auto keep = parse({"backup", "cleanup", "job.xlf", "--keep", "3"});
  auto *cl = std::get_if<CmdBackupCleanup>(&*keep.cmd);
  REQUIRE(cl);
  REQUIRE(cl->keep == 3);

  auto profiles = parse({"profiles", "--dir", "p"});
  REQUIRE(std::holds_alternative<CmdProfiles>(*profiles.cmd));
  REQUIRE(profiles.globals.profiles_dir.value_or("") == "p");

  auto add_rule = parse({"profile", "add-rule", "nb", "id-1", "--order", "7"});
  auto *ar = std::get_if<CmdProfileAddRule>(&*add_rule.cmd);
  REQUIRE(ar);
  REQUIRE(ar->order.value_or(0) == 7);
}

TEST_CASE("Usage errors") {
  auto unknown = parse({"frobnicate"});
  REQUIRE_FALSE(unknown.cmd.has_value());
  REQUIRE(unknown.error == "unknown command: frobnicate");

  auto missing = parse({"batch-find", "job.xlf"});
  REQUIRE_FALSE(missing.cmd.has_value());
  REQUIRE_FALSE(missing.error.empty());

  auto bad_opt = parse({"stats", "job.xlf", "--bogus"});
  REQUIRE_FALSE(bad_opt.cmd.has_value());
  REQUIRE(bad_opt.error == "unknown option: --bogus");

  auto bad_threads = parse({"--threads", "many", "stats", "job.xlf"});
  REQUIRE_FALSE(bad_threads.cmd.has_value());
  REQUIRE_FALSE(bad_threads.error.empty());

  auto bad_keep = parse({"backup", "cleanup", "job.xlf", "--keep", "-1"});
  REQUIRE_FALSE(bad_keep.cmd.has_value());
}

TEST_CASE("replace, validate and xbench parse their options") {
  auto rep = parse({"replace", "job.xlf", "\\d+", "N", "-x", "2024", "-o",
                    "out.xlf", "--include-tags", "--case-sensitive"});
  REQUIRE(rep.error.empty());
  auto *c = std::get_if<CmdReplace>(&*rep.cmd);
  REQUIRE(c);
  REQUIRE(c->pattern == "\\d+");
  REQUIRE(c->replacement == "N");
  REQUIRE(c->exclude == "2024");
  REQUIRE(c->output == "out.xlf");
  REQUIRE(c->include_tags);
  REQUIRE(c->case_sensitive);
  REQUIRE_FALSE(c->no_backup);

  auto missing = parse({"replace", "job.xlf", "\\d+"});
  REQUIRE_FALSE(missing.cmd.has_value());
  REQUIRE(missing.error.rfind("usage: locqa replace", 0) == 0);

  auto val = parse({"validate", "job.xlf", "--json"});
  auto *v = std::get_if<CmdValidate>(&*val.cmd);
  REQUIRE(v);
  REQUIRE(v->json);

  auto xb = parse({"xbench", "list.xbckl", "--save", "--name", "Norsk"});
  auto *x = std::get_if<CmdXbench>(&*xb.cmd);
  REQUIRE(x);
  REQUIRE(x->save);
  REQUIRE(x->name == "Norsk");
}
