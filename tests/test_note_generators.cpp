#include "command_note_generator.hpp"
#include "offline_note_generator.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path script(const fs::path& dir, const char* name, const std::string& body) {
  auto p = dir / name;
  { std::ofstream f(p); f << "#!/bin/sh\n" << body << "\n"; }
  fs::permissions(p, fs::perms::owner_all);
  return p;
}

static void helpers() {
  assert(strip_markdown_headings("# Title\n## Sub\ntext # not heading\n") == "Title\nSub\ntext # not heading\n");
  Generation g = Generation::failure(GenerationError::Timeout, "no answer after 5s");
  assert(describe_failure(g) == "Timeout: no answer after 5s");
  SearchMode m;
  assert(parse_search_mode("tavily", m) && m == SearchMode::Provider);
  assert(parse_search_mode("off", m) && m == SearchMode::Offline);
  assert(!parse_search_mode("bing", m));
}

static void offline() {
  OfflineNoteGenerator gen;
  WordEntry e{"apple", "n. 苹果", std::string("/ˈæpəl/"), std::string("An apple a day.")};
  Generation g = gen.explain(e, GenerateOptions{});
  assert(g.ok);
  assert(g.text.rfind("# apple\n", 0) == 0);
  assert(g.text.find("苹果") != std::string::npos);
  assert(g.text.find("An apple a day.") != std::string::npos);

  GenerateOptions plain;
  plain.plain = true;
  Generation p = gen.explain(e, plain);
  assert(p.ok && p.text.find('#') == std::string::npos);

  Generation bad = gen.explain(WordEntry{}, GenerateOptions{});
  assert(!bad.ok && bad.error == GenerationError::ProviderError);
}

static void command() {
  assert(CommandNoteGenerator::classify_exit(0) == GenerationError::None);
  assert(CommandNoteGenerator::classify_exit(77) == GenerationError::AuthFailure);
  assert(CommandNoteGenerator::classify_exit(69) == GenerationError::NetworkFailure);
  assert(CommandNoteGenerator::classify_exit(75) == GenerationError::NetworkFailure);
  assert(CommandNoteGenerator::classify_exit(1) == GenerationError::ProviderError);

  GenerateOptions opts;
  opts.search = SearchMode::Offline;
  opts.plain = true;
  CommandNoteGenerator argv_gen("python3  word_ai.py", 5);
  auto args = argv_gen.build_argv("ice cream", opts);
  assert(args.size() == 6);
  assert(args[0] == "python3" && args[1] == "word_ai.py");
  assert(args[2] == "--search" && args[3] == "off" && args[4] == "--plain");
  assert(args[5] == "ice cream");

  auto dir = fs::temp_directory_path() / ("wordtui_gen_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  WordEntry e{"apple", "苹果", std::nullopt, std::nullopt};

  CommandNoteGenerator echo(script(dir, "ok.sh", "echo \"# note for $3\"").string(), 5);
  Generation g = echo.explain(e, GenerateOptions{});
  assert(g.ok);
  assert(g.text == "# note for apple\n");

  CommandNoteGenerator auth(script(dir, "auth.sh", "echo 'missing API key' >&2\nexit 77").string(), 5);
  g = auth.explain(e, GenerateOptions{});
  assert(!g.ok && g.error == GenerationError::AuthFailure);
  assert(g.detail == "missing API key");

  CommandNoteGenerator net(script(dir, "net.sh", "exit 69").string(), 5);
  g = net.explain(e, GenerateOptions{});
  assert(!g.ok && g.error == GenerationError::NetworkFailure);

  CommandNoteGenerator empty(script(dir, "empty.sh", "exit 0").string(), 5);
  g = empty.explain(e, GenerateOptions{});
  assert(!g.ok && g.error == GenerationError::ProviderError);

  CommandNoteGenerator slow(script(dir, "slow.sh", "exec sleep 10").string(), 1);
  g = slow.explain(e, GenerateOptions{});
  assert(!g.ok && g.error == GenerationError::Timeout);

  CommandNoteGenerator missing((dir / "does_not_exist").string(), 5);
  g = missing.explain(e, GenerateOptions{});
  assert(!g.ok && g.error == GenerationError::ProviderError);
  assert(g.detail.find("can not run") != std::string::npos);

  fs::remove_all(dir);
}

int main() {
  helpers();
  offline();
  command();
  return 0;
}
