#pragma once
/*
 * Note generation collaborators
 *
 * Purpose: the AI-explanation boundary the session talks to.
 *   INoteGenerator: entry -> Markdown note (may block, may fail).
 *   INoteStore:     one saved note per term.
 * Note: explain() can run on a batch worker thread; implementations must not
 * touch session state.
 */
#include <string>
#include "types.hpp"

enum class SearchMode { Auto, Provider, Offline };

enum class GenerationError { None, Timeout, AuthFailure, NetworkFailure, ProviderError };

struct GenerateOptions {
  SearchMode search = SearchMode::Auto;
  bool plain = false;
};

struct Generation {
  bool ok = false;
  std::string text;
  GenerationError error = GenerationError::None;
  std::string detail;

  static Generation success(std::string t) { Generation g; g.ok = true; g.text = std::move(t); return g; }
  static Generation failure(GenerationError e, std::string d) { Generation g; g.error = e; g.detail = std::move(d); return g; }
};

const char* generation_error_name(GenerationError e);
const char* search_mode_name(SearchMode m);
bool parse_search_mode(const std::string& s, SearchMode& out);
// "Timeout: no answer after 60s"
std::string describe_failure(const Generation& g);
// Drops leading '#' heading markers, like a plain-text rendering of the note.
std::string strip_markdown_headings(const std::string& md);

class INoteGenerator {
public:
  virtual ~INoteGenerator() = default;
  virtual Generation explain(const WordEntry& entry, const GenerateOptions& opts) const = 0;
};

class INoteStore {
public:
  virtual ~INoteStore() = default;
  virtual bool note_exists(const std::string& term) const = 0;
  virtual bool save_note(const std::string& term, const std::string& text, std::string& msg) = 0;
  virtual bool load_note(const std::string& term, std::string& text, std::string& msg) const = 0;
};
