#include <locqa/backup.hpp>
#include <locqa/error.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace fs = std::filesystem;

namespace locqa {

namespace {

const std::string kMarker = "_backup_";

// "<stamp>" or "<stamp>_<n>" out of a backup file name; false if the name
// does not belong to `file`.
bool backup_key(const fs::path &file, const fs::path &candidate,
                std::string &stamp, int &n) {
  const std::string prefix = file.stem().string() + kMarker;
  const std::string ext = file.extension().string();
  const std::string name = candidate.filename().string();
  if (name.size() <= prefix.size() + ext.size() ||
      name.compare(0, prefix.size(), prefix) != 0 ||
      name.compare(name.size() - ext.size(), ext.size(), ext) != 0)
    return false;

  std::string rest =
      name.substr(prefix.size(), name.size() - prefix.size() - ext.size());
  if (rest.size() < 15)
    return false;
  stamp = rest.substr(0, 15);
  n = 0;
  if (rest.size() > 15) {
    if (rest[15] != '_')
      return false;
    try {
      n = std::stoi(rest.substr(16));
    } catch (const std::logic_error &) {
      return false;
    }
  }
  return true;
}

} // namespace

BackupManager::BackupManager(fs::path dir) : dir_(std::move(dir)) {}

fs::path BackupManager::location_for(const fs::path &file) const {
  if (!dir_.empty())
    return dir_;
  return file.has_parent_path() ? file.parent_path() : fs::path(".");
}

fs::path BackupManager::create(const fs::path &file) const {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec))
    throw Error(ErrorKind::MissingResource, "no such file: " + file.string());

  const auto where = location_for(file);
  fs::create_directories(where, ec);
  if (ec)
    throw Error(ErrorKind::IOError,
                "mkdir failed: " + where.string() + ": " + ec.message());

  const std::string base =
      file.stem().string() + kMarker + compact_timestamp();
  const std::string ext = file.extension().string();
  fs::path dest = where / (base + ext);
  for (int n = 2; fs::exists(dest, ec); ++n)
    dest = where / fmt::format("{}_{}{}", base, n, ext);

  fs::copy_file(file, dest, fs::copy_options::none, ec);
  if (ec)
    throw Error(ErrorKind::IOError, "backup of " + file.string() +
                                        " failed: " + ec.message());
  spdlog::info("[backup] {} -> {}", file.string(), dest.string());
  return dest;
}

std::vector<fs::path> BackupManager::list(const fs::path &file) const {
  struct Item {
    std::string stamp;
    int n;
    fs::path path;
  };
  std::vector<Item> items;

  std::error_code ec;
  const auto where = location_for(file);
  if (!fs::is_directory(where, ec))
    return {};
  for (const auto &e : fs::directory_iterator(where, ec)) {
    Item it;
    if (backup_key(file, e.path(), it.stamp, it.n)) {
      it.path = e.path();
      items.push_back(std::move(it));
    }
  }
  std::sort(items.begin(), items.end(), [](const Item &a, const Item &b) {
    return std::tie(a.stamp, a.n) > std::tie(b.stamp, b.n);
  });

  std::vector<fs::path> out;
  for (auto &i : items)
    out.push_back(std::move(i.path));
  return out;
}

fs::path BackupManager::restore(const fs::path &backup,
                                const fs::path &target) const {
  std::error_code ec;
  if (!fs::is_regular_file(backup, ec))
    throw Error(ErrorKind::MissingResource, "no such backup: " + backup.string());

  fs::path dest = target;
  if (dest.empty()) {
    const auto stem = backup.stem().string();
    auto pos = stem.rfind(kMarker);
    if (pos == std::string::npos)
      throw Error(ErrorKind::ParseError,
                  "cannot derive original name from " + backup.string());
    dest = backup.parent_path() /
           (stem.substr(0, pos) + backup.extension().string());
  }

  if (fs::exists(dest, ec))
    create(dest);
  fs::copy_file(backup, dest, fs::copy_options::overwrite_existing, ec);
  if (ec)
    throw Error(ErrorKind::IOError, "restore to " + dest.string() +
                                        " failed: " + ec.message());
  spdlog::info("[backup] restored {} -> {}", backup.string(), dest.string());
  return dest;
}

std::size_t BackupManager::cleanup(const fs::path &file, std::size_t keep) const {
  auto backups = list(file);
  std::size_t removed = 0;
  for (std::size_t i = keep; i < backups.size(); ++i) {
    std::error_code ec;
    if (fs::remove(backups[i], ec)) {
      ++removed;
    } else {
      spdlog::warn("[backup] could not delete {}: {}", backups[i].string(),
                   ec.message());
    }
  }
  if (removed)
    spdlog::info("[backup] removed {} old backups of {}", removed, file.string());
  return removed;
}

} // namespace locqa
