#include <locqa/error.hpp>
#include <locqa/util.hpp>
#include <locqa/xliff_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <algorithm>
#include <cstring>
#include <string_view>
#include <unordered_map>

namespace fs = std::filesystem;
using tinyxml2::XMLElement;

namespace locqa {

namespace {

std::string_view local_name(const char *name) {
  std::string_view n(name);
  auto colon = n.find(':');
  return colon == std::string_view::npos ? n : n.substr(colon + 1);
}

XMLElement *child_named(XMLElement *el, std::string_view name) {
  for (auto *c = el->FirstChildElement(); c; c = c->NextSiblingElement())
    if (local_name(c->Name()) == name)
      return c;
  return nullptr;
}

std::string attr(const XMLElement *el, const char *name) {
  if (!el)
    return {};
  const char *v = el->Attribute(name);
  return v ? v : "";
}

std::string inner_markup(const XMLElement *el) {
  if (!el)
    return {};
  tinyxml2::XMLPrinter printer(nullptr, true);
  for (auto *n = el->FirstChild(); n; n = n->NextSibling())
    n->Accept(&printer);
  return printer.CStr();
}

} // namespace

bool is_xliff_path(const fs::path &p) {
  static const char *exts[] = {".xliff", ".xlf", ".mxliff", ".mqxliff",
                               ".sdlxliff"};
  auto ext = to_lower_ascii(p.extension().string());
  return std::any_of(std::begin(exts), std::end(exts),
                     [&](const char *e) { return ext == e; });
}

XliffStore::XliffStore(fs::path path)
    : path_(std::move(path)), doc_(std::make_unique<tinyxml2::XMLDocument>()) {
  auto raw = read_file(path_);
  if (doc_->Parse(raw.data(), raw.size()) != tinyxml2::XML_SUCCESS) {
    throw Error(ErrorKind::ParseError,
                fmt::format("{}: {}", path_.string(), doc_->ErrorStr()),
                doc_->ErrorLineNum());
  }
  auto *root = doc_->RootElement();
  if (!root || local_name(root->Name()) != "xliff") {
    throw Error(ErrorKind::ParseError,
                path_.string() + ": root element is not <xliff>",
                root ? root->GetLineNum() : 0);
  }
  collect(root);
  spdlog::debug("[xliff] {}: {} units (version {})", path_.string(),
                units_.size(), attr(root, "version"));
}

XliffStore::~XliffStore() = default;

void XliffStore::collect(XMLElement *el) {
  for (auto *c = el->FirstChildElement(); c; c = c->NextSiblingElement()) {
    const auto name = local_name(c->Name());
    if (name == "trans-unit") {
      Unit u;
      u.id = attr(c, "id");
      u.container = c;
      u.source = child_named(c, "source");
      u.target = child_named(c, "target");
      if (!u.source)
        continue;
      u.state = attr(u.target, "state");
      u.approved = attr(c, "approved");
      units_.push_back(u);
    } else if (name == "unit") {
      const std::string unit_id = attr(c, "id");
      std::vector<XMLElement *> segments;
      for (auto *s = c->FirstChildElement(); s; s = s->NextSiblingElement())
        if (local_name(s->Name()) == "segment")
          segments.push_back(s);

      for (std::size_t i = 0; i < segments.size(); ++i) {
        auto *seg = segments[i];
        Unit u;
        if (segments.size() == 1) {
          u.id = unit_id;
        } else {
          auto sid = attr(seg, "id");
          u.id = fmt::format("{}:{}", unit_id, sid.empty() ? std::to_string(i + 1) : sid);
        }
        u.container = seg;
        u.source = child_named(seg, "source");
        u.target = child_named(seg, "target");
        if (!u.source)
          continue;
        u.state = attr(seg, "state");
        u.approved = attr(c, "approved");
        units_.push_back(u);
      }
    } else {
      collect(c);
    }
  }
}

Records XliffStore::list() const {
  Records out;
  out.reserve(units_.size());
  for (const auto &u : units_) {
    TextRecord r;
    r.id = u.id;
    r.source = inner_markup(u.source);
    r.target = inner_markup(u.target);
    if (!u.state.empty())
      r.metadata["state"] = u.state;
    if (!u.approved.empty())
      r.metadata["approved"] = u.approved;
    r.metadata["has_target"] = u.target ? "true" : "false";
    out.push_back(std::move(r));
  }
  return out;
}

void XliffStore::set_target(Unit &u, const std::string &text) {
  if (!u.target) {
    std::string name = u.source->Name();
    name.replace(name.size() - std::strlen("source"), std::string::npos, "target");
    u.target = doc_->NewElement(name.c_str());
    u.container->InsertAfterChild(u.source, u.target);
  }
  u.target->DeleteChildren();

  // Inline tags survive when the text is a well-formed fragment.
  tinyxml2::XMLDocument frag;
  const std::string wrapped = "<temp>" + text + "</temp>";
  if (frag.Parse(wrapped.data(), wrapped.size()) == tinyxml2::XML_SUCCESS &&
      (frag.RootElement()->FirstChild() || text.empty())) {
    for (auto *n = frag.RootElement()->FirstChild(); n; n = n->NextSibling())
      u.target->InsertEndChild(n->DeepClone(doc_.get()));
  } else {
    u.target->SetText(text.c_str());
  }
}

fs::path XliffStore::persist(const Records &records, const fs::path &location) {
  std::unordered_map<std::string, const TextRecord *> by_id;
  for (const auto &r : records)
    by_id.emplace(r.id, &r);

  std::size_t written = 0;
  for (auto &u : units_) {
    auto it = by_id.find(u.id);
    if (it == by_id.end())
      continue;
    const auto &text = it->second->target;
    if (!u.target && text.empty())
      continue;
    if (u.target && inner_markup(u.target) == text)
      continue;
    set_target(u, text);
    ++written;
  }

  const fs::path out = location.empty() ? path_ : location;
  tinyxml2::XMLPrinter printer;
  doc_->Print(&printer);
  write_file(out, std::string(printer.CStr(), printer.CStrSize() - 1));
  spdlog::info("[xliff] wrote {} ({} targets updated)", out.string(), written);
  return out;
}

XliffStatistics XliffStore::statistics() const {
  XliffStatistics s;
  s.total_units = units_.size();
  for (const auto &u : units_) {
    if (u.target)
      ++s.translated;
    else
      ++s.untranslated;
  }
  return s;
}

} // namespace locqa
