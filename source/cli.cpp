#include <locqa/cli.hpp>

#include <algorithm>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string_view>

namespace locqa {

namespace {

struct Args {
  std::vector<std::string> pos;
  std::vector<std::string> switches;
  std::map<std::string, std::string> values;

  bool has(std::string_view s) const {
    return std::find(switches.begin(), switches.end(), s) != switches.end();
  }
  std::string value(const std::string &k, const std::string &def = {}) const {
    auto it = values.find(k);
    return it == values.end() ? def : it->second;
  }
};

ParseResult fail(ParseResult r, const std::string &error) {
  r.cmd.reset();
  r.error = error;
  return r;
}

bool in(std::string_view a, std::initializer_list<const char *> names) {
  for (const char *n : names)
    if (a == n)
      return true;
  return false;
}

// Sorts command arguments into positionals, switches and valued options.
// Valued options may be given as "-o X" or "--output=X"; aliases map to the
// first spelling. "--" ends option parsing.
std::string split(const std::vector<std::string> &in_args, std::size_t from,
                  std::initializer_list<const char *> switches,
                  std::initializer_list<std::pair<const char *, const char *>> valued,
                  Args &out) {
  bool options = true;
  for (std::size_t i = from; i < in_args.size(); ++i) {
    const std::string &a = in_args[i];
    if (options && a == "--") {
      options = false;
      continue;
    }
    if (!options || a.size() < 2 || a[0] != '-') {
      out.pos.push_back(a);
      continue;
    }
    if (in(a, switches)) {
      out.switches.push_back(a);
      continue;
    }
    std::string key = a, val;
    bool inline_val = false;
    if (auto eq = a.find('='); eq != std::string::npos) {
      key = a.substr(0, eq);
      val = a.substr(eq + 1);
      inline_val = true;
    }
    bool matched = false;
    for (const auto &v : valued) {
      if (key == v.first || (v.second && key == v.second)) {
        if (!inline_val) {
          if (i + 1 >= in_args.size())
            return key + ": value required";
          val = in_args[++i];
        }
        out.values[v.first] = val;
        matched = true;
        break;
      }
    }
    if (!matched)
      return "unknown option: " + a;
  }
  return {};
}

bool to_int(const std::string &s, int &out) {
  try {
    std::size_t pos = 0;
    out = std::stoi(s, &pos);
    return pos == s.size();
  } catch (const std::logic_error &) {
    return false;
  }
}

// Pulls global flags out of argv; everything else is returned in order.
std::string take_globals(int argc, char **argv, GlobalOptions &g,
                         std::vector<std::string> &rest) {
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto next = [&](std::string &dst) -> bool {
      if (i + 1 >= argc)
        return false;
      dst = argv[++i];
      return true;
    };
    std::string v;
    if (a == "--verbose" || a == "-v") {
      g.verbose = true;
    } else if (a == "--threads") {
      int n = 0;
      if (!next(v) || !to_int(v, n) || n < 0)
        return "--threads: non-negative number required";
      g.threads = static_cast<unsigned>(n);
    } else if (a == "--log-file") {
      if (!next(v))
        return "--log-file: path required";
      g.log_file = v;
    } else if (a == "--profiles-dir") {
      if (!next(v))
        return "--profiles-dir: directory required";
      g.profiles_dir = v;
    } else if (a == "--library") {
      if (!next(v))
        return "--library: path required";
      g.library = v;
    } else if (a == "--backup-dir") {
      if (!next(v))
        return "--backup-dir: directory required";
      g.backup_dir = v;
    } else {
      rest.emplace_back(a);
    }
  }
  return {};
}

ParseResult need(ParseResult r, const Args &a, std::size_t n,
                 const std::string &usage) {
  if (a.pos.size() != n) {
    r.cmd.reset();
    r.error = "usage: locqa " + usage;
  }
  return r;
}

ParseResult parse_profile_cmd(const std::vector<std::string> &v, ParseResult r) {
  if (v.size() < 2) {
    r.error = "profile: import|export|delete|add-rule required";
    return r;
  }
  const std::string &sub = v[1];
  Args a;
  if (sub == "import") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdProfileImport{a.pos[0]};
    return need(r, a, 1, "profile import <file>");
  }
  if (sub == "export") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 2)
      r.cmd = CmdProfileExport{a.pos[0], a.pos[1]};
    return need(r, a, 2, "profile export <profile> <dest>");
  }
  if (sub == "delete") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdProfileDelete{a.pos[0]};
    return need(r, a, 1, "profile delete <profile>");
  }
  if (sub == "add-rule") {
    if (auto e = split(v, 2, {}, {{"--order", nullptr}}, a); !e.empty())
      return fail(r, e);
    CmdProfileAddRule c;
    if (a.values.count("--order")) {
      int n = 0;
      if (!to_int(a.value("--order"), n))
        return fail(r, "--order: number required");
      c.order = n;
    }
    if (a.pos.size() == 2) {
      c.profile = a.pos[0];
      c.snippet_id = a.pos[1];
      r.cmd = c;
    }
    return need(r, a, 2, "profile add-rule <profile> <snippet-id> [--order N]");
  }
  r.error = "profile: unknown subcommand " + sub;
  return r;
}

ParseResult parse_library_cmd(const std::vector<std::string> &v, ParseResult r) {
  if (v.size() < 2) {
    r.error = "library: list|search|import|export|add|remove required";
    return r;
  }
  const std::string &sub = v[1];
  Args a;
  if (sub == "list") {
    r.cmd = CmdLibraryList{};
    return r;
  }
  if (sub == "search") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdLibrarySearch{a.pos[0]};
    return need(r, a, 1, "library search <query>");
  }
  if (sub == "import") {
    if (auto e = split(v, 2, {"--replace"}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdLibraryImport{a.pos[0], a.has("--replace")};
    return need(r, a, 1, "library import <file> [--replace]");
  }
  if (sub == "export") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdLibraryExport{a.pos[0]};
    return need(r, a, 1, "library export <dest>");
  }
  if (sub == "add") {
    if (auto e = split(v, 2, {},
                       {{"--replacement", "-r"}, {"--description", "-d"}}, a);
        !e.empty())
      return fail(r, e);
    if (a.pos.size() == 3)
      r.cmd = CmdLibraryAdd{a.pos[0], a.pos[1], a.pos[2],
                            a.value("--replacement"), a.value("--description")};
    return need(r, a, 3,
                "library add <category> <name> <pattern> [-r REPLACEMENT] "
                "[-d DESCRIPTION]");
  }
  if (sub == "remove") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdLibraryRemove{a.pos[0]};
    return need(r, a, 1, "library remove <id>");
  }
  r.error = "library: unknown subcommand " + sub;
  return r;
}

ParseResult parse_backup_cmd(const std::vector<std::string> &v, ParseResult r) {
  if (v.size() < 2) {
    r.error = "backup: list|cleanup|restore required";
    return r;
  }
  const std::string &sub = v[1];
  Args a;
  if (sub == "list") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdBackupList{a.pos[0]};
    return need(r, a, 1, "backup list <file>");
  }
  if (sub == "cleanup") {
    if (auto e = split(v, 2, {}, {{"--keep", nullptr}}, a); !e.empty())
      return fail(r, e);
    CmdBackupCleanup c;
    if (a.values.count("--keep") &&
        (!to_int(a.value("--keep"), c.keep) || c.keep < 0))
      return fail(r, "--keep: non-negative number required");
    if (a.pos.size() == 1) {
      c.file = a.pos[0];
      r.cmd = c;
    }
    return need(r, a, 1, "backup cleanup <file> [--keep N]");
  }
  if (sub == "restore") {
    if (auto e = split(v, 2, {}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1 || a.pos.size() == 2) {
      r.cmd = CmdBackupRestore{a.pos[0], a.pos.size() == 2 ? a.pos[1] : ""};
      return r;
    }
    r.error = "usage: locqa backup restore <backup> [target]";
    return r;
  }
  r.error = "backup: unknown subcommand " + sub;
  return r;
}

} // namespace

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  std::vector<std::string> v;
  if (auto e = take_globals(argc, argv, r.globals, v); !e.empty()) {
    r.error = e;
    return r;
  }
  if (v.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string &cmd = v[0];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  Args a;
  if (cmd == "find") {
    if (auto e = split(v, 1, {"--case-sensitive", "--json", "--include-tags"},
                       {{"--exclude", "-x"}}, a);
        !e.empty())
      return fail(r, e);
    if (a.pos.size() == 2)
      r.cmd = CmdFind{a.pos[0], a.pos[1], a.value("--exclude"),
                      a.has("--case-sensitive"), a.has("--json"),
                      a.has("--include-tags")};
    return need(r, a, 2,
                "find <file> <pattern> [--exclude P] [--case-sensitive] "
                "[--include-tags] [--json]");
  }
  if (cmd == "replace") {
    if (auto e = split(v, 1,
                       {"--case-sensitive", "--include-tags", "--no-backup",
                        "--json"},
                       {{"--exclude", "-x"}, {"--output", "-o"}}, a);
        !e.empty())
      return fail(r, e);
    if (a.pos.size() == 3) {
      CmdReplace c;
      c.file = a.pos[0];
      c.pattern = a.pos[1];
      c.replacement = a.pos[2];
      c.exclude = a.value("--exclude");
      c.output = a.value("--output");
      c.case_sensitive = a.has("--case-sensitive");
      c.include_tags = a.has("--include-tags");
      c.no_backup = a.has("--no-backup");
      c.json = a.has("--json");
      r.cmd = c;
    }
    return need(r, a, 3,
                "replace <file> <pattern> <replacement> [--exclude P] "
                "[--case-sensitive] [--include-tags] [-o OUT] [--no-backup] "
                "[--json]");
  }
  if (cmd == "batch-find") {
    if (auto e = split(v, 1, {"--json", "--summary"}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 2)
      r.cmd = CmdBatchFind{a.pos[0], a.pos[1], a.has("--json"),
                           a.has("--summary")};
    return need(r, a, 2, "batch-find <file> <profile> [--json] [--summary]");
  }
  if (cmd == "batch-replace") {
    if (auto e = split(v, 1, {"--no-backup", "--json"}, {{"--output", "-o"}}, a);
        !e.empty())
      return fail(r, e);
    if (a.pos.size() == 2)
      r.cmd = CmdBatchReplace{a.pos[0], a.pos[1], a.value("--output"),
                              a.has("--no-backup"), a.has("--json")};
    return need(r, a, 2,
                "batch-replace <file> <profile> [-o OUT] [--no-backup] [--json]");
  }
  if (cmd == "apply-edits") {
    if (auto e = split(v, 1, {"--no-backup"}, {{"--output", "-o"}}, a);
        !e.empty())
      return fail(r, e);
    if (a.pos.size() == 2)
      r.cmd = CmdApplyEdits{a.pos[0], a.pos[1], a.value("--output"),
                            a.has("--no-backup")};
    return need(r, a, 2, "apply-edits <file> <edits.xml> [-o OUT] [--no-backup]");
  }
  if (cmd == "stats") {
    if (auto e = split(v, 1, {"--json"}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdStats{a.pos[0], a.has("--json")};
    return need(r, a, 1, "stats <file> [--json]");
  }
  if (cmd == "validate") {
    if (auto e = split(v, 1, {"--json"}, {}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdValidate{a.pos[0], a.has("--json")};
    return need(r, a, 1, "validate <file> [--json]");
  }
  if (cmd == "xbench") {
    if (auto e = split(v, 1, {"--save"}, {{"--name", nullptr}}, a); !e.empty())
      return fail(r, e);
    if (a.pos.size() == 1)
      r.cmd = CmdXbench{a.pos[0], a.has("--save"), a.value("--name")};
    return need(r, a, 1, "xbench <checklist.xbckl> [--save] [--name NAME]");
  }
  if (cmd == "profiles") {
    if (auto e = split(v, 1, {}, {{"--dir", nullptr}}, a); !e.empty())
      return fail(r, e);
    if (a.values.count("--dir"))
      r.globals.profiles_dir = a.value("--dir");
    r.cmd = CmdProfiles{};
    return need(r, a, 0, "profiles [--dir DIR]");
  }
  if (cmd == "profile")
    return parse_profile_cmd(v, r);
  if (cmd == "library")
    return parse_library_cmd(v, r);
  if (cmd == "backup")
    return parse_backup_cmd(v, r);

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace locqa
