#include <locqa/app.hpp>
#include <locqa/backup.hpp>
#include <locqa/cli.hpp>
#include <locqa/config.hpp>
#include <locqa/edits.hpp>
#include <locqa/engine.hpp>
#include <locqa/icu_check.hpp>
#include <locqa/library.hpp>
#include <locqa/profile.hpp>
#include <locqa/report.hpp>
#include <locqa/xbench.hpp>
#include <locqa/xliff_store.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>

#ifndef LOCQA_VERSION
#define LOCQA_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace locqa {

static void print_help() {
  std::cout <<
      R"(locqa - rule-driven QA for localized text

Usage:
  locqa find <file> <pattern> [--exclude P] [--case-sensitive] [--include-tags] [--json]
  locqa replace <file> <pattern> <replacement> [--exclude P] [--case-sensitive]
                [--include-tags] [-o OUT] [--no-backup] [--json]
  locqa batch-find <file> <profile> [--json] [--summary]
  locqa batch-replace <file> <profile> [-o OUT] [--no-backup] [--json]
  locqa apply-edits <file> <edits.xml> [-o OUT] [--no-backup]
  locqa stats <file> [--json]
  locqa validate <file> [--json]
  locqa xbench <checklist.xbckl> [--save] [--name NAME]

  locqa profiles [--dir DIR]
  locqa profile import <file>
  locqa profile export <profile> <dest>
  locqa profile delete <profile>
  locqa profile add-rule <profile> <snippet-id> [--order N]

  locqa library list
  locqa library search <query>
  locqa library import <file> [--replace]
  locqa library export <dest>
  locqa library add <category> <name> <pattern> [-r REPLACEMENT] [-d DESCRIPTION]
  locqa library remove <id>

  locqa backup list <file>
  locqa backup cleanup <file> [--keep N]
  locqa backup restore <backup> [target]

Global options:
  --threads N  --log-file PATH  --verbose
  --profiles-dir DIR  --library PATH  --backup-dir DIR
)";
}

static void setup_logging(const Config &cfg) {
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      auto logger = std::make_shared<spdlog::logger>("locqa", sink);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex &ex) {
      spdlog::warn("failed to initialize rotating log sink ({}), logging to "
                   "stderr",
                   ex.what());
    }
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);
}

static Config merge_globals(Config cfg, const GlobalOptions &g) {
  if (g.threads)
    cfg.threads = *g.threads;
  if (g.log_file)
    cfg.log_file = fs::path(*g.log_file);
  if (g.profiles_dir)
    cfg.profiles_dir = *g.profiles_dir;
  if (g.library)
    cfg.library_path = *g.library;
  if (g.backup_dir)
    cfg.backup_dir = *g.backup_dir;
  cfg.verbose = cfg.verbose || g.verbose;
  return cfg;
}

// A path as given, or a name looked up in the profiles directory.
static fs::path resolve_profile(const Config &cfg, const std::string &arg) {
  fs::path p(arg);
  if (fs::exists(p))
    return p;
  for (auto cand : {cfg.profiles_dir / (arg + ProfileCatalog::kSuffix),
                    cfg.profiles_dir / arg}) {
    if (fs::exists(cand))
      return cand;
  }
  return p;
}

static XliffStore open_store(const std::string &file) {
  if (!is_xliff_path(file))
    spdlog::warn("{} does not have an XLIFF extension, reading anyway", file);
  return XliffStore(file);
}

// A one-rule profile for the ad-hoc find and replace commands.
static Profile single_rule(const std::string &pattern,
                           const std::string &replacement,
                           const std::string &exclude, bool case_sensitive) {
  Profile p;
  p.name = "ad-hoc";
  PatternRule r;
  r.order = 1;
  r.name = pattern;
  r.category = "Custom";
  r.pattern = pattern;
  r.replacement = replacement;
  r.exclude_pattern = exclude;
  r.case_sensitive = case_sensitive;
  p.rules.push_back(r);
  return p;
}

// Both regexes of an ad-hoc rule, checked before the file is read.
static bool patterns_valid(const Profile &p) {
  const auto &r = p.rules.front();
  for (const auto *pat : {&r.pattern, &r.exclude_pattern}) {
    if (auto err = validate_pattern(*pat, r.case_sensitive)) {
      spdlog::error("invalid pattern '{}': {}", *pat, *err);
      return false;
    }
  }
  return true;
}

// Writes replaced records back unless nothing changed and no output was
// requested. Overwriting the input makes a backup first.
static void write_back(RecordStore &store, ReplaceOutcome &out,
                       const std::string &file, const std::string &output,
                       bool no_backup, const BackupManager &backups) {
  if (out.result.modified_records == 0 && output.empty()) {
    spdlog::info("no record changed, {} left as is", file);
    return;
  }
  if (!no_backup && output.empty())
    backups.create(file);
  out.result.output_location = store.persist(out.records, output).string();
}

static void print_library(const SnippetLibrary &lib) {
  for (const auto &c : lib.categories) {
    std::cout << fmt::format("{} ({})\n", c.name, c.entries.size());
    for (const auto &e : c.entries)
      std::cout << fmt::format("  [{}] {}: {} -> {}\n", e.id, e.name,
                               e.pattern, e.replacement);
  }
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  const Config cfg = merge_globals(config_from_env(), pr.globals);
  setup_logging(cfg);
  const Engine engine(EngineOptions{effective_threads(cfg)});
  const BackupManager backups(cfg.backup_dir);

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("locqa {}\n", LOCQA_VERSION);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdFind>) {
            auto p = single_rule(c.pattern, "", c.exclude, c.case_sensitive);
            if (!patterns_valid(p))
              return 1;
            auto store = open_store(c.file);
            const Engine adhoc(
                EngineOptions{effective_threads(cfg), !c.include_tags});
            auto res = adhoc.find(p, store.list(), store.identifier());
            std::cout << (c.json ? to_json(res) : render_text(res));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdReplace>) {
            auto p = single_rule(c.pattern, c.replacement, c.exclude,
                                 c.case_sensitive);
            if (!patterns_valid(p))
              return 1;
            auto store = open_store(c.file);
            const Engine adhoc(
                EngineOptions{effective_threads(cfg), !c.include_tags});
            auto out = adhoc.replace(p, store.list());
            write_back(store, out, c.file, c.output, c.no_backup, backups);
            std::cout << (c.json ? to_json(out.result)
                                 : render_text(out.result));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdBatchFind>) {
            auto store = open_store(c.file);
            auto profile = load_profile(resolve_profile(cfg, c.profile));
            auto res = engine.find(profile, store.list(), store.identifier());
            if (c.summary) {
              auto s = summarize(res);
              std::cout << (c.json ? to_json(s) : render_text(s));
            } else {
              std::cout << (c.json ? to_json(res) : render_text(res));
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdBatchReplace>) {
            auto store = open_store(c.file);
            auto profile = load_profile(resolve_profile(cfg, c.profile));
            auto out = engine.replace(profile, store.list());
            write_back(store, out, c.file, c.output, c.no_backup, backups);
            std::cout << (c.json ? to_json(out.result)
                                 : render_text(out.result));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdApplyEdits>) {
            auto edits = load_edits(c.edits);
            auto store = open_store(c.file);
            auto out = apply_edits(store.list(), edits);
            if (!c.no_backup && c.output.empty())
              backups.create(c.file);
            auto where = store.persist(out.records, c.output);
            std::cout << fmt::format("Applied {} of {} edits -> {}\n",
                                     out.applied, edits.size(), where.string());
            for (const auto &e : out.errors)
              std::cout << fmt::format("! {}: {}\n", to_string(e.kind),
                                       e.message);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStats>) {
            auto s = open_store(c.file).statistics();
            if (c.json)
              std::cout << to_json(s);
            else
              std::cout << fmt::format(
                  "Total units:  {}\nTranslated:   {}\nUntranslated: {}\n",
                  s.total_units, s.translated, s.untranslated);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdValidate>) {
            auto store = open_store(c.file);
            auto rep = validate_icu(store.list(), store.identifier());
            std::cout << (c.json ? to_json(rep) : render_text(rep));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdXbench>) {
            auto list = load_checklist(c.file);
            for (const auto &item : list.items)
              std::cout << fmt::format("[{}] {}{}: {}{}\n", item.id, item.name,
                                       item.is_regex ? " (regex)" : "",
                                       item.search_text,
                                       item.replace_text.empty()
                                           ? ""
                                           : " -> " + item.replace_text);
            const auto st = list.statistics();
            std::cout << fmt::format("\nItems: {}  regex: {}  enabled: {}  "
                                     "with replacement: {}\n",
                                     st.total_items, st.regex_items,
                                     st.enabled_items, st.with_replacement);
            if (c.save) {
              auto name = c.name.empty() ? fs::path(c.file).stem().string()
                                         : c.name;
              auto profile = profile_from_checklist(list, name);
              ProfileCatalog catalog(cfg.profiles_dir);
              auto dest = catalog.save_as(
                  profile, ProfileCatalog::file_name_for(profile.name));
              std::cout << fmt::format("{} rules saved to {}\n",
                                       profile.rules.size(), dest.string());
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfiles>) {
            ProfileCatalog catalog(cfg.profiles_dir);
            for (const auto &info : catalog.list()) {
              std::cout << fmt::format("{:<32} {:>4} rules  {:<6} {}{}\n",
                                       info.name, info.rule_count,
                                       info.language, info.path.string(),
                                       info.valid ? "" : "  (unreadable)");
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileImport>) {
            ProfileCatalog catalog(cfg.profiles_dir);
            std::cout << catalog.import_profile(c.path).string() << "\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileExport>) {
            ProfileCatalog catalog(cfg.profiles_dir);
            catalog.export_profile(resolve_profile(cfg, c.profile), c.dest);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileDelete>) {
            ProfileCatalog catalog(cfg.profiles_dir);
            catalog.remove(resolve_profile(cfg, c.profile));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileAddRule>) {
            auto lib = LibraryStore(cfg.library_path).load();
            const SnippetEntry *entry = nullptr;
            for (const auto &cat : lib.categories)
              for (const auto &e : cat.entries)
                if (!entry && e.id == c.snippet_id)
                  entry = &e;
            if (!entry) {
              spdlog::error("no snippet with id '{}'", c.snippet_id);
              return 1;
            }
            const auto path = resolve_profile(cfg, c.profile);
            auto profile = load_profile(path);
            int order = 1;
            for (const auto &r : profile.rules)
              order = std::max(order, r.order + 1);
            profile.rules.push_back(rule_from_snippet(*entry, c.order.value_or(order)));
            sort_rules(profile);
            touch(profile);
            save_profile(profile, path);
            spdlog::info("added '{}' to {}", entry->name, path.string());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibraryList>) {
            print_library(LibraryStore(cfg.library_path).load());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibrarySearch>) {
            for (const auto &e :
                 LibraryStore(cfg.library_path).load().find_entries(c.query))
              std::cout << fmt::format("[{}] {} / {}: {} -> {}\n", e.id,
                                       e.category, e.name, e.pattern,
                                       e.replacement);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibraryImport>) {
            LibraryStore store(cfg.library_path);
            auto imported = import_library(c.path);
            if (c.replace) {
              store.save(imported);
            } else {
              auto lib = store.load();
              lib.merge(imported);
              store.save(lib);
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibraryExport>) {
            export_library(LibraryStore(cfg.library_path).load(), c.dest);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibraryAdd>) {
            if (auto err = validate_pattern(c.pattern)) {
              spdlog::error("invalid pattern '{}': {}", c.pattern, *err);
              return 1;
            }
            LibraryStore store(cfg.library_path);
            auto lib = store.load();
            SnippetEntry e;
            e.name = c.name;
            e.description = c.description;
            e.pattern = c.pattern;
            e.replacement = c.replacement;
            std::cout << lib.add_entry(c.category, e) << "\n";
            store.save(lib);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLibraryRemove>) {
            LibraryStore store(cfg.library_path);
            auto lib = store.load();
            if (!lib.remove_entry(c.id)) {
              spdlog::error("no snippet with id '{}'", c.id);
              return 1;
            }
            store.save(lib);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdBackupList>) {
            for (const auto &b : backups.list(c.file))
              std::cout << b.string() << "\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdBackupCleanup>) {
            auto n = backups.cleanup(c.file, static_cast<std::size_t>(c.keep));
            std::cout << fmt::format("Deleted {} old backups\n", n);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdBackupRestore>) {
            std::cout << backups.restore(c.backup, c.target).string() << "\n";
            return 0;
          }
          return 2;
        },
        *pr.cmd);
  } catch (const Error &e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace locqa
