#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace locqa {

// Flags accepted anywhere on the command line; they override Config.
struct GlobalOptions {
  std::optional<unsigned> threads;
  std::optional<std::string> log_file;
  bool verbose = false;
  std::optional<std::string> profiles_dir;
  std::optional<std::string> library;
  std::optional<std::string> backup_dir;
};

struct CmdFind {
  std::string file;
  std::string pattern;
  std::string exclude;
  bool case_sensitive = false;
  bool json = false;
  bool include_tags = false;
};
struct CmdReplace {
  std::string file;
  std::string pattern;
  std::string replacement;
  std::string exclude;
  std::string output;
  bool case_sensitive = false;
  bool include_tags = false;
  bool no_backup = false;
  bool json = false;
};
struct CmdBatchFind {
  std::string file;
  std::string profile;
  bool json = false;
  bool summary = false;
};
struct CmdBatchReplace {
  std::string file;
  std::string profile;
  std::string output;
  bool no_backup = false;
  bool json = false;
};
struct CmdApplyEdits {
  std::string file;
  std::string edits;
  std::string output;
  bool no_backup = false;
};
struct CmdStats {
  std::string file;
  bool json = false;
};
struct CmdValidate {
  std::string file;
  bool json = false;
};
struct CmdXbench {
  std::string file;
  bool save = false; // store the converted profile in the profiles directory
  std::string name;  // profile name when the checklist carries none
};

struct CmdProfiles {};
struct CmdProfileImport {
  std::string path;
};
struct CmdProfileExport {
  std::string profile;
  std::string dest;
};
struct CmdProfileDelete {
  std::string profile;
};
struct CmdProfileAddRule {
  std::string profile;
  std::string snippet_id;
  std::optional<int> order;
};

struct CmdLibraryList {};
struct CmdLibrarySearch {
  std::string query;
};
struct CmdLibraryImport {
  std::string path;
  bool replace = false; // default merges into the current library
};
struct CmdLibraryExport {
  std::string dest;
};
struct CmdLibraryAdd {
  std::string category;
  std::string name;
  std::string pattern;
  std::string replacement;
  std::string description;
};
struct CmdLibraryRemove {
  std::string id;
};

struct CmdBackupList {
  std::string file;
};
struct CmdBackupCleanup {
  std::string file;
  int keep = 10;
};
struct CmdBackupRestore {
  std::string backup;
  std::string target;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdFind, CmdReplace, CmdBatchFind, CmdBatchReplace,
                 CmdApplyEdits, CmdStats, CmdValidate, CmdXbench, CmdProfiles, CmdProfileImport, CmdProfileExport,
                 CmdProfileDelete, CmdProfileAddRule, CmdLibraryList,
                 CmdLibrarySearch, CmdLibraryImport, CmdLibraryExport,
                 CmdLibraryAdd, CmdLibraryRemove, CmdBackupList,
                 CmdBackupCleanup, CmdBackupRestore, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  GlobalOptions globals;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace locqa
