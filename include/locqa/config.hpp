#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace locqa {

struct Config {
  std::filesystem::path profiles_dir = "profiles";
  std::filesystem::path library_path; // see default_library_path()
  std::filesystem::path backup_dir;   // empty: next to the original file
  std::optional<std::filesystem::path> log_file;
  std::size_t log_rotate_max = 10 * 1024 * 1024;
  std::size_t log_rotate_files = 3;
  unsigned threads = 0; // 0: hardware concurrency
  bool verbose = false;
};

// $HOME/.locqa/library.xml, or .locqa/library.xml when HOME is unset.
std::filesystem::path default_library_path();

// Defaults overridden by LOCQA_PROFILES_DIR, LOCQA_LIBRARY, LOCQA_THREADS,
// LOCQA_BACKUP_DIR and LOCQA_LOG_FILE.
Config config_from_env();

unsigned effective_threads(const Config &cfg);

} // namespace locqa
