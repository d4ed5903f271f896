#include "word_store.hpp"
#include "logging.hpp"

size_t WordStore::load(std::vector<WordEntry> entries) {
  std::vector<WordEntry> kept;
  std::unordered_map<std::string, size_t> idx;
  kept.reserve(entries.size());
  size_t dupes = 0;
  for (auto& e : entries) {
    if (e.term.empty()) { dupes++; continue; }
    if (idx.count(e.term)) {
      WT_LOGW("STORE", "duplicate term skipped: %s", e.term.c_str());
      dupes++;
      continue;
    }
    idx.emplace(e.term, kept.size());
    kept.push_back(std::move(e));
  }
  ProgressMap next;
  next.reserve(kept.size());
  for (const auto& e : kept) {
    auto it = progress_.find(e.term);
    next.emplace(e.term, it != progress_.end() ? it->second : Progress{});
  }
  entries_ = std::move(kept);
  index_ = std::move(idx);
  progress_ = std::move(next);
  return dupes;
}

size_t WordStore::restore_progress(const ProgressMap& saved) {
  size_t applied = 0;
  for (const auto& [term, p] : saved) {
    auto it = progress_.find(term);
    if (it == progress_.end()) continue;
    it->second = p;
    applied++;
  }
  return applied;
}

std::vector<std::string> WordStore::terms() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.term);
  return out;
}

const WordEntry* WordStore::find(const std::string& term) const {
  auto it = index_.find(term);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second];
}

const Progress* WordStore::progress(const std::string& term) const {
  auto it = progress_.find(term);
  return it == progress_.end() ? nullptr : &it->second;
}

bool WordStore::record_judgment(const std::string& term, Judgment j, bool count_seen) {
  auto it = progress_.find(term);
  if (it == progress_.end()) return false;
  Progress& p = it->second;
  if (j == Judgment::Known) p.known++; else p.unknown++;
  if (count_seen) p.seen++;
  return true;
}

bool WordStore::toggle_star(const std::string& term) {
  auto it = progress_.find(term);
  if (it == progress_.end()) return false;
  it->second.starred = !it->second.starred;
  return true;
}

bool WordStore::in_mistake_set(const std::string& term) const {
  const Progress* p = progress(term);
  return p && (p->starred || p->unknown > 0);
}

std::vector<std::string> WordStore::mistake_set() const {
  std::vector<std::string> out;
  for (const auto& e : entries_) {
    if (in_mistake_set(e.term)) out.push_back(e.term);
  }
  return out;
}

Stats WordStore::stats() const {
  Stats s;
  s.total = static_cast<unsigned>(entries_.size());
  for (const auto& e : entries_) {
    const Progress& p = progress_.at(e.term);
    if (p.seen > 0) s.seen++;
    if (p.known > 0) s.known++;
    if (p.unknown > 0) s.unknown++;
    if (p.starred) s.starred++;
  }
  return s;
}
