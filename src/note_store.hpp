#pragma once
/*
 * NoteStore
 *
 * Purpose: INoteStore on a directory of Markdown files, one `<term>.md` per
 * term. Writes go through write_file_atomic.
 */
#include <filesystem>
#include "note_generator.hpp"

class NoteStore : public INoteStore {
public:
  explicit NoteStore(std::filesystem::path dir) : dir_(std::move(dir)) {}
  bool note_exists(const std::string& term) const override;
  bool save_note(const std::string& term, const std::string& text, std::string& msg) override;
  bool load_note(const std::string& term, std::string& text, std::string& msg) const override;

  std::filesystem::path path_for(const std::string& term) const;
  const std::filesystem::path& dir() const { return dir_; }

private:
  std::filesystem::path dir_;
};
