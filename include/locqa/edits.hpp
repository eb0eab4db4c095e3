#pragma once
#include <locqa/error.hpp>
#include <locqa/record.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace locqa {

struct Edit {
  std::string id;
  std::string text;
};

struct EditOutcome {
  Records records;
  std::size_t applied = 0;
  Diagnostics errors; // one UnknownRecordId per edit that matched nothing
};

// Overwrites targets by id. Never pattern-matches; later edits to the same
// id win.
EditOutcome apply_edits(const Records &records, const std::vector<Edit> &edits);

// <edits><edit id="...">text</edit>...</edits>. Edit text keeps inline markup.
std::vector<Edit> load_edits(const std::filesystem::path &path);

} // namespace locqa
