#include <locqa/edits.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <cstring>
#include <unordered_map>

namespace fs = std::filesystem;

namespace locqa {

EditOutcome apply_edits(const Records &records, const std::vector<Edit> &edits) {
  EditOutcome out;
  out.records = records;

  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < out.records.size(); ++i)
    index.emplace(out.records[i].id, i);

  for (const auto &e : edits) {
    auto it = index.find(e.id);
    if (it == index.end()) {
      spdlog::warn("[edits] unknown record id '{}'", e.id);
      out.errors.push_back({ErrorKind::UnknownRecordId, e.id,
                            fmt::format("no record with id '{}'", e.id)});
      continue;
    }
    out.records[it->second].target = e.text;
    ++out.applied;
  }
  spdlog::info("[edits] applied {}/{} edits", out.applied, edits.size());
  return out;
}

std::vector<Edit> load_edits(const fs::path &path) {
  auto raw = read_file(path);
  tinyxml2::XMLDocument doc;
  if (doc.Parse(raw.data(), raw.size()) != tinyxml2::XML_SUCCESS) {
    throw Error(ErrorKind::ParseError,
                fmt::format("{}: {}", path.string(), doc.ErrorStr()),
                doc.ErrorLineNum());
  }
  const auto *root = doc.RootElement();
  if (!root || std::strcmp(root->Name(), "edits") != 0) {
    throw Error(ErrorKind::ParseError,
                path.string() + ": root element is not <edits>",
                root ? root->GetLineNum() : 0);
  }

  std::vector<Edit> edits;
  for (const auto *el = root->FirstChildElement("edit"); el;
       el = el->NextSiblingElement("edit")) {
    const char *id = el->Attribute("id");
    if (!id) {
      throw Error(ErrorKind::ParseError,
                  path.string() + ": <edit> without id", el->GetLineNum());
    }
    tinyxml2::XMLPrinter printer(nullptr, true);
    for (const auto *n = el->FirstChild(); n; n = n->NextSibling())
      n->Accept(&printer);
    edits.push_back({id, printer.CStr()});
  }
  return edits;
}

} // namespace locqa
