#include "offline_note_generator.hpp"
#include "boss_overlay.hpp"
#include <algorithm>
#include <ctime>
#include <sstream>

Generation OfflineNoteGenerator::explain(const WordEntry& entry, const GenerateOptions& opts) const {
  if (entry.term.empty()) return Generation::failure(GenerationError::ProviderError, "empty term");
  const std::string& w = entry.term;
  std::ostringstream md;
  md << "# " << w << "\n";
  md << "> offline note (" << format_log_stamp(std::time(nullptr)).substr(0, 16) << ")\n\n";
  if (entry.phonetic && !entry.phonetic->empty()) {
    md << "## Pronunciation\n- " << *entry.phonetic << "\n\n";
  }
  md << "## Meaning\n- " << entry.meaning << "\n\n";
  if (entry.example && !entry.example->empty()) {
    md << "## Example from your word list\n- " << *entry.example << "\n\n";
  }
  const std::string templates[] = {
    "I used the word '" + w + "' in a simple sentence.",
    "The meaning of '" + w + "' depends on the context.",
    "People often learn '" + w + "' through examples and practice.",
    "Here is another example that clarifies '" + w + "'.",
    "This phrase with '" + w + "' is common in daily speech.",
  };
  int n = std::clamp(sentences_, 1, 5);
  md << "## Example templates\n";
  for (int i = 0; i < n; ++i) md << (i + 1) << ". " << templates[i] << "\n";
  md << "\n## Practice\n";
  md << "1) Cloze: write a sentence that leaves a gap for **" << w << "** and fill it in.\n";
  md << "2) Recall: cover the meaning above and say it aloud.\n";
  md << "3) Translate: make your own sentence with **" << w << "** and translate it.\n";
  std::string text = md.str();
  if (opts.plain) text = strip_markdown_headings(text);
  return Generation::success(std::move(text));
}
