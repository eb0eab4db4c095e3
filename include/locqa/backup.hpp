#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace locqa {

// Timestamped copies named <stem>_backup_<YYYYmmdd_HHMMSS>[_n]<ext>, kept in
// `dir` or, when it is empty, next to the original.
class BackupManager {
public:
  explicit BackupManager(std::filesystem::path dir = {});

  // Throws locqa::Error (MissingResource, IOError).
  std::filesystem::path create(const std::filesystem::path &file) const;

  // Newest first.
  std::vector<std::filesystem::path> list(const std::filesystem::path &file) const;

  // Copies `backup` over `target` (derived from the backup name when empty),
  // backing up the current target first. Returns the restored path.
  std::filesystem::path restore(const std::filesystem::path &backup,
                                const std::filesystem::path &target = {}) const;

  // Deletes all but the newest `keep`; returns how many were removed.
  std::size_t cleanup(const std::filesystem::path &file, std::size_t keep) const;

private:
  std::filesystem::path location_for(const std::filesystem::path &file) const;

  std::filesystem::path dir_;
};

} // namespace locqa
