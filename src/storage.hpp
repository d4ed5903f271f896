#pragma once
/*
 * Storage
 *
 * Purpose: persistence collaborator for the word list (CSV) and the progress
 * file (JSON).
 * Format: CSV header `word,meaning,phonetic,example` (any order, extra
 * columns ignored, quoted fields, optional BOM); progress JSON maps term ->
 * {seen, known, unknown, starred}.
 * Note: failures return false with a message; callers keep going in memory.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

class Storage {
public:
  Storage(std::filesystem::path words_file, std::filesystem::path progress_file);

  bool words_exist() const;
  bool load_words(std::vector<WordEntry>& out, std::string& msg) const;
  // A record with a bad counter is skipped; msg then says how many.
  bool load_progress(ProgressMap& out, std::string& msg) const;
  bool save_progress(const ProgressMap& progress, std::string& msg) const;
  bool create_sample_words(std::string& msg) const;

  const std::filesystem::path& words_file() const { return words_file_; }
  const std::filesystem::path& progress_file() const { return progress_file_; }

private:
  std::filesystem::path words_file_;
  std::filesystem::path progress_file_;
};

// Exposed for tests.
std::vector<std::vector<std::string>> parse_csv(const std::string& text);
std::vector<WordEntry> words_from_csv(const std::string& text, std::string& msg);
std::string csv_escape(const std::string& field);
