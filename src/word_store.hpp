#pragma once
/*
 * WordStore
 *
 * Purpose: in-memory vocabulary table plus one Progress record per term.
 * Invariant: every loaded term has a Progress record; records of removed
 * terms are dropped on load.
 * Note: stats() and mistake_set() always scan; nothing is cached.
 */
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class WordStore {
public:
  // Replaces the table. Returns the number of entries skipped (empty or
  // duplicate term; the first occurrence wins).
  size_t load(std::vector<WordEntry> entries);
  // Applies persisted records to loaded terms; unknown terms are ignored.
  size_t restore_progress(const ProgressMap& saved);

  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }
  const std::vector<WordEntry>& entries() const { return entries_; }
  std::vector<std::string> terms() const;
  const WordEntry* find(const std::string& term) const;
  const Progress* progress(const std::string& term) const;
  const ProgressMap& progress_map() const { return progress_; }

  bool record_judgment(const std::string& term, Judgment j, bool count_seen);
  bool toggle_star(const std::string& term);

  std::vector<std::string> mistake_set() const;
  bool in_mistake_set(const std::string& term) const;
  Stats stats() const;

private:
  std::vector<WordEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
  ProgressMap progress_;
};
