#include "file_io.hpp"
#include "note_store.hpp"
#include "storage.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path temp_dir(const char* tag) {
  auto d = fs::temp_directory_path() / (std::string("wordtui_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void csv_parsing() {
  auto rows = parse_csv("\xEF\xBB\xBFword,meaning\r\n\"a, b\",\"say \"\"hi\"\"\"\n\n\"multi\nline\",x\n");
  assert(rows.size() == 3);
  assert(rows[0][0] == "word");
  assert(rows[1][0] == "a, b");
  assert(rows[1][1] == "say \"hi\"");
  assert(rows[2][0] == "multi\nline");

  std::string msg;
  auto w = words_from_csv("meaning,Word,example\n苹果,apple,\n,,\n香蕉,banana,I like bananas.\n", msg);
  assert(w.size() == 2);
  assert(w[0].term == "apple" && w[0].meaning == "苹果");
  assert(!w[0].phonetic && !w[0].example);
  assert(w[1].example && *w[1].example == "I like bananas.");

  assert(words_from_csv("term,definition\na,b\n", msg).empty());
  assert(msg.find("meaning") != std::string::npos);

  assert(csv_escape("plain") == "plain");
  assert(csv_escape("a,b") == "\"a,b\"");
  assert(csv_escape("say \"x\"") == "\"say \"\"x\"\"\"");
}

static void words_and_progress() {
  auto d = temp_dir("store");
  Storage st(d / "words.csv", d / "progress.json");
  std::string msg;
  assert(!st.words_exist());
  assert(st.create_sample_words(msg));
  assert(st.words_exist());
  std::vector<WordEntry> words;
  assert(st.load_words(words, msg));
  assert(words.size() == 8);
  assert(words[0].term == "apple");
  assert(words[0].phonetic.has_value());

  ProgressMap empty;
  assert(st.load_progress(empty, msg)); // no file yet
  assert(empty.empty());

  ProgressMap p;
  p["apple"] = Progress{2, 1, 1, true};
  p["banana"] = Progress{1, 1, 0, false};
  assert(st.save_progress(p, msg));
  assert(!fs::exists(d / "progress.json.tmp"));
  ProgressMap back;
  assert(st.load_progress(back, msg));
  assert(back.size() == 2);
  assert(back["apple"].seen == 2 && back["apple"].unknown == 1 && back["apple"].starred);
  assert(back["banana"].known == 1 && !back["banana"].starred);

  std::string text;
  assert(mmap_read_file(d / "progress.json", text, msg));
  assert(text.find("\"apple\"") < text.find("\"banana\""));

  { std::ofstream f(d / "progress.json"); f << "{ not json"; }
  ProgressMap bad;
  assert(!st.load_progress(bad, msg));
  assert(bad.empty());
  assert(msg.find("bad progress file") != std::string::npos);

  {
    std::ofstream f(d / "progress.json");
    f << R"({"apple": {"seen": 3, "known": 1, "unknown": -1},)"
      << R"( "banana": {"seen": 2.9, "known": 0, "unknown": 0},)"
      << R"( "cherry": {"seen": 1, "unknown": 5000000000},)"
      << R"( "grape": {"known": 4, "starred": true}})";
  }
  ProgressMap partial;
  assert(st.load_progress(partial, msg));
  assert(partial.size() == 1);
  assert(partial.count("grape") && partial["grape"].known == 4 && partial["grape"].seen == 0 && partial["grape"].starred);
  assert(msg.find("3 progress record(s)") != std::string::npos);

  Storage missing(d / "nope.csv", d / "p.json");
  assert(!missing.load_words(words, msg));
  fs::remove_all(d);
}

static void note_store() {
  auto d = temp_dir("notes");
  NoteStore ns(d / "ai_notes");
  std::string msg, text;
  assert(!ns.note_exists("apple"));
  assert(!ns.load_note("apple", text, msg));
  assert(ns.save_note("apple", "# apple\n", msg));
  assert(ns.note_exists("apple"));
  assert(ns.load_note("apple", text, msg));
  assert(text == "# apple\n");
  assert(ns.path_for("apple") == d / "ai_notes" / "apple.md");
  assert(ns.path_for("a/b").filename() == "a_b.md");
  assert(ns.path_for("..").filename() == "_...md");
  assert(ns.save_note("AC/DC", "rock", msg));
  assert(ns.note_exists("AC/DC"));
  fs::remove_all(d);
}

int main() {
  csv_parsing();
  words_and_progress();
  note_store();
  return 0;
}
