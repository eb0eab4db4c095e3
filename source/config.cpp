#include <locqa/config.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <thread>

namespace fs = std::filesystem;

namespace locqa {

fs::path default_library_path() {
  const char *home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
  return base / ".locqa" / "library.xml";
}

Config config_from_env() {
  Config cfg;
  cfg.library_path = default_library_path();
  if (const char *e = std::getenv("LOCQA_PROFILES_DIR"))
    cfg.profiles_dir = e;
  if (const char *e = std::getenv("LOCQA_LIBRARY"))
    cfg.library_path = e;
  if (const char *e = std::getenv("LOCQA_BACKUP_DIR"))
    cfg.backup_dir = e;
  if (const char *e = std::getenv("LOCQA_LOG_FILE"))
    cfg.log_file = fs::path(e);
  if (const char *e = std::getenv("LOCQA_THREADS")) {
    int n = std::atoi(e);
    if (n < 0)
      spdlog::warn("LOCQA_THREADS={} ignored", e);
    cfg.threads = static_cast<unsigned>(std::max(0, n));
  }
  return cfg;
}

unsigned effective_threads(const Config &cfg) {
  if (cfg.threads)
    return cfg.threads;
  return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace locqa
