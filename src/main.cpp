#include "app.hpp"
#include "command_note_generator.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "note_store.hpp"
#include "offline_note_generator.hpp"
#include "storage.hpp"
#include "terminal.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <unistd.h>

static void usage(const char* prog) {
  std::fprintf(stderr, "usage: %s [-c rcfile] [words.csv]\n", prog);
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> rc_path;
  int opt;
  while ((opt = getopt(argc, argv, "c:h")) != -1) {
    switch (opt) {
      case 'c': rc_path = std::filesystem::path(optarg); break;
      case 'h': usage(argv[0]); return 0;
      default: usage(argv[0]); return 2;
    }
  }

  AppConfig cfg;
  std::vector<std::string> problems;
  std::string msg;
  if (auto rc = find_rc_file(rc_path)) {
    ConfigLoader loader(cfg);
    if (!loader.load_file(*rc, problems, msg)) {
      if (rc_path) { std::fprintf(stderr, "wordtui: %s\n", msg.c_str()); return 1; }
      problems.push_back(msg);
    }
  }
  if (optind < argc) cfg.words_file = argv[optind];

  if (!log_open(cfg.log_file, cfg.log_level, msg)) {
    std::fprintf(stderr, "wordtui: %s (logging off)\n", msg.c_str());
  }
  WT_LOGI("MAIN", "words=%s progress=%s notes=%s", cfg.words_file.string().c_str(),
          cfg.progress_file.string().c_str(), cfg.notes_dir.string().c_str());

  Storage storage(cfg.words_file, cfg.progress_file);
  std::string notice;
  if (!storage.words_exist()) {
    if (!storage.create_sample_words(msg)) {
      std::fprintf(stderr, "wordtui: %s\n", msg.c_str());
      WT_LOGE("MAIN", "%s", msg.c_str());
      log_close();
      return 1;
    }
    notice = msg;
  }
  std::vector<WordEntry> entries;
  if (!storage.load_words(entries, msg)) {
    std::fprintf(stderr, "wordtui: %s: %s\n", cfg.words_file.string().c_str(), msg.c_str());
    WT_LOGE("MAIN", "no words: %s", msg.c_str());
    log_close();
    return 1;
  }
  WordStore words;
  size_t skipped = words.load(std::move(entries));
  if (skipped) WT_LOGW("MAIN", "%zu duplicate or empty words skipped", skipped);

  ProgressMap saved;
  bool progress_ok = storage.load_progress(saved, msg);
  if (progress_ok) {
    words.restore_progress(saved);
    if (!msg.empty()) problems.push_back(msg);
  } else {
    WT_LOGW("MAIN", "%s", msg.c_str());
    problems.push_back("progress not loaded: " + msg);
  }

  ThemeRegistry themes;
  if (!cfg.theme.empty()) themes.select(cfg.theme);
  NoteStore notes(cfg.notes_dir);
  std::unique_ptr<INoteGenerator> gen;
  if (cfg.gen.search == SearchMode::Offline || cfg.ai_command.empty()) {
    gen = std::make_unique<OfflineNoteGenerator>();
    WT_LOGI("MAIN", "offline note generator");
  } else {
    gen = std::make_unique<CommandNoteGenerator>(cfg.ai_command, cfg.ai_timeout);
    WT_LOGI("MAIN", "note command: %s (timeout %ds)", cfg.ai_command.c_str(), cfg.ai_timeout);
  }

  {
    Terminal terminal;
    NcursesTerminal term;
    TermSize sz = term.getSize();
    SessionOptions so;
    so.gen = cfg.gen;
    so.boss_style = cfg.boss_style;
    so.boss_quit = cfg.boss_quit;
    so.seed = cfg.seed;
    so.rows = sz.rows;
    so.cols = sz.cols;
    Session session(words, cfg.keys, themes, *gen, notes, so);
    session.set_save_callback([&storage](const ProgressMap& p, std::string& m) {
      return storage.save_progress(p, m);
    });
    if (!problems.empty()) session.set_status(problems.front(), true);
    else if (!notice.empty()) session.set_status(notice);
    App app(term, session, cfg.tick_ms);
    app.run();
  }
  log_close();
  return 0;
}
