#include <locqa/engine.hpp>
#include <locqa/thread_pool.hpp>
#include <locqa/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <regex>

namespace locqa {

namespace {

struct FindSlot {
  std::vector<MatchReport> matches;
  Diagnostics diagnostics;
};

struct ReplaceSlot {
  std::size_t replacements = 0;
  bool modified = false;
  Diagnostics diagnostics;
};

Diagnostic scan_failure(const CompiledRule &rule, const TextRecord &rec,
                        const std::regex_error &e) {
  return {ErrorKind::InvalidPattern,
          fmt::format("{} (record {})", rule.rule().name, rec.id),
          fmt::format("pattern '{}' failed on record '{}': {}",
                      rule.rule().pattern, rec.id, e.what())};
}

void append(Diagnostics &into, Diagnostics &from) {
  into.insert(into.end(), std::make_move_iterator(from.begin()),
              std::make_move_iterator(from.end()));
}

} // namespace

Engine::Engine(EngineOptions opts) : opts_(opts) {}

Engine::RuleSet Engine::compile(const Profile &profile) const {
  RuleSet set;
  for (const auto &r : enabled_rules(profile)) {
    try {
      set.rules.push_back(CompiledRule::compile(r, opts_.protect_tags));
    } catch (const Error &e) {
      spdlog::warn("[profile={}] skipping rule: {}", profile.name, e.what());
      set.diagnostics.push_back({e.kind(), r.name, e.what()});
    }
  }
  return set;
}

template <class Fn>
void Engine::for_each_index(std::size_t n, Fn &&fn) const {
  if (opts_.threads <= 1 || n < 2) {
    for (std::size_t i = 0; i < n; ++i)
      fn(i);
    return;
  }

  const std::size_t workers = std::min<std::size_t>(opts_.threads, n);
  const std::size_t chunk = (n + workers - 1) / workers;
  ThreadPool pool(static_cast<unsigned>(workers));
  for (std::size_t b = 0; b < n; b += chunk) {
    const std::size_t e = std::min(n, b + chunk);
    pool.submit([&fn, b, e] {
      for (std::size_t i = b; i < e; ++i)
        fn(i);
    });
  }
  pool.wait_idle();
}

BatchFindResult Engine::find(const Profile &profile, const Records &records,
                             const std::string &source) const {
  auto t0 = std::chrono::steady_clock::now();
  auto set = compile(profile);

  BatchFindResult res;
  res.profile_name = profile.name;
  res.source = source;
  res.fingerprint = profile.fingerprint();
  res.diagnostics = std::move(set.diagnostics);

  std::vector<FindSlot> slots(records.size());
  for_each_index(records.size(), [&](std::size_t i) {
    const auto &rec = records[i];
    auto &slot = slots[i];
    for (const auto &rule : set.rules) {
      std::vector<RuleMatch> found;
      try {
        found = rule.find(rec.target);
      } catch (const std::regex_error &e) {
        slot.diagnostics.push_back(scan_failure(rule, rec, e));
        continue;
      }
      for (auto &m : found) {
        MatchReport r;
        r.record_id = rec.id;
        r.rule_name = rule.rule().name;
        r.rule_order = rule.rule().order;
        r.category = rule.rule().category;
        r.rule_description = rule.rule().description;
        r.source_text = rec.source;
        r.target_text = rec.target;
        r.start = utf8_offset(rec.target, m.begin);
        r.end = utf8_offset(rec.target, m.end);
        r.matched = std::move(m.text);
        r.pattern = rule.rule().pattern;
        r.replacement = rule.rule().replacement;
        r.replacement_preview = std::move(m.expanded);
        slot.matches.push_back(std::move(r));
      }
    }
    if (!slot.matches.empty())
      spdlog::debug("[find] record {}: {} matches", rec.id, slot.matches.size());
  });

  for (auto &slot : slots) {
    res.matches.insert(res.matches.end(),
                       std::make_move_iterator(slot.matches.begin()),
                       std::make_move_iterator(slot.matches.end()));
    append(res.diagnostics, slot.diagnostics);
  }
  res.total_matches = res.matches.size();

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0)
                .count();
  spdlog::info("[find] profile='{}' rules={} fingerprint={} records={} "
               "matches={} ({} ms)",
               profile.name, set.rules.size(), res.fingerprint, records.size(),
               res.total_matches, ms);
  return res;
}

ReplaceOutcome Engine::replace(const Profile &profile,
                               const Records &records) const {
  auto t0 = std::chrono::steady_clock::now();
  auto set = compile(profile);

  ReplaceOutcome out;
  out.records = records;
  out.result.diagnostics = std::move(set.diagnostics);

  std::vector<ReplaceSlot> slots(records.size());
  for_each_index(out.records.size(), [&](std::size_t i) {
    auto &rec = out.records[i];
    auto &slot = slots[i];
    std::string text = rec.target;
    for (const auto &rule : set.rules) {
      std::string next;
      try {
        slot.replacements += rule.replace(text, next);
      } catch (const std::regex_error &e) {
        slot.diagnostics.push_back(scan_failure(rule, rec, e));
        continue;
      }
      text = std::move(next);
    }
    if (text != rec.target) {
      slot.modified = true;
      spdlog::debug("[replace] record {} modified", rec.id);
      rec.target = std::move(text);
    }
  });

  for (auto &slot : slots) {
    out.result.total_replacements += slot.replacements;
    if (slot.modified)
      ++out.result.modified_records;
    append(out.result.diagnostics, slot.diagnostics);
  }
  out.result.success = true;

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0)
                .count();
  spdlog::info("[replace] profile='{}' rules={} records={} modified={} "
               "replacements={} ({} ms)",
               profile.name, set.rules.size(), records.size(),
               out.result.modified_records, out.result.total_replacements, ms);
  return out;
}

} // namespace locqa
