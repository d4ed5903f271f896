#include "note_store.hpp"
#include "file_io.hpp"

std::filesystem::path NoteStore::path_for(const std::string& term) const {
  std::string name = term;
  for (char& c : name) {
    if (c == '/' || c == '\\' || c == '\0') c = '_';
  }
  if (name.empty() || name == "." || name == "..") name = "_" + name;
  return dir_ / (name + ".md");
}

bool NoteStore::note_exists(const std::string& term) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(term), ec);
}

bool NoteStore::save_note(const std::string& term, const std::string& text, std::string& msg) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) { msg = "can not create note directory: " + dir_.string(); return false; }
  return write_file_atomic(path_for(term), text, msg);
}

bool NoteStore::load_note(const std::string& term, std::string& text, std::string& msg) const {
  return mmap_read_file(path_for(term), text, msg);
}
