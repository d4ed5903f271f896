#include "word_store.hpp"
#include "rng.hpp"
#include <algorithm>
#include <cassert>
#include <set>

static std::vector<WordEntry> words(std::initializer_list<const char*> terms) {
  std::vector<WordEntry> v;
  for (const char* t : terms) v.push_back({t, std::string("m-") + t, std::nullopt, std::nullopt});
  return v;
}

static std::set<std::string> mistakes_by_definition(const WordStore& ws) {
  std::set<std::string> out;
  for (const auto& [term, p] : ws.progress_map()) {
    if (p.starred || p.unknown > 0) out.insert(term);
  }
  return out;
}

int main() {
  WordStore ws;
  size_t skipped = ws.load(words({"apple", "banana", "apple", ""}));
  assert(skipped == 2);
  assert(ws.size() == 2);
  assert(ws.find("apple")->meaning == "m-apple");
  assert(ws.progress("banana")->seen == 0);
  assert(!ws.find("cherry"));

  // seen only moves with count_seen
  assert(ws.record_judgment("apple", Judgment::Known, true));
  assert(ws.record_judgment("apple", Judgment::Unknown, false));
  assert(ws.record_judgment("apple", Judgment::Known, false));
  const Progress* p = ws.progress("apple");
  assert(p->seen == 1);
  assert(p->known + p->unknown == 3);
  assert(!ws.record_judgment("cherry", Judgment::Known, true));

  // reload keeps progress of surviving terms, drops removed ones
  ws.load(words({"apple", "cherry"}));
  assert(ws.progress("apple")->known == 2);
  assert(ws.progress("cherry")->seen == 0);
  assert(!ws.progress("banana"));

  ProgressMap saved;
  saved["cherry"] = Progress{3, 1, 2, true};
  saved["ghost"] = Progress{1, 1, 0, false};
  assert(ws.restore_progress(saved) == 1);
  assert(ws.progress("cherry")->starred);
  assert(!ws.progress("ghost"));

  // mistake set matches its definition after random interleavings
  WordStore m;
  m.load(words({"a", "b", "c", "d", "e", "f"}));
  std::uint64_t rng = 42;
  auto terms = m.terms();
  for (int i = 0; i < 300; ++i) {
    const std::string& t = terms[rand_int(rng, 0, (int)terms.size() - 1)];
    switch (rand_int(rng, 0, 2)) {
      case 0: m.toggle_star(t); break;
      case 1: m.record_judgment(t, Judgment::Known, false); break;
      default: m.record_judgment(t, Judgment::Unknown, false); break;
    }
    auto ms = m.mistake_set();
    assert(std::set<std::string>(ms.begin(), ms.end()) == mistakes_by_definition(m));
  }

  // stats counts terms, not judgments
  WordStore s;
  s.load(words({"x", "y", "z"}));
  s.record_judgment("x", Judgment::Known, true);
  s.record_judgment("x", Judgment::Known, false);
  s.record_judgment("y", Judgment::Unknown, true);
  s.toggle_star("z");
  Stats st = s.stats();
  assert(st.total == 3 && st.seen == 2 && st.known == 1 && st.unknown == 1 && st.starred == 1);
  auto ms = s.mistake_set();
  assert(ms.size() == 2 && ms[0] == "y" && ms[1] == "z");
  return 0;
}
