#include "storage.hpp"
#include "file_io.hpp"
#include "logging.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

Storage::Storage(std::filesystem::path words_file, std::filesystem::path progress_file)
  : words_file_(std::move(words_file)), progress_file_(std::move(progress_file)) {}

std::vector<std::vector<std::string>> parse_csv(const std::string& text) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_data = false;
  size_t i = 0;
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
  auto end_field = [&]() { row.push_back(field); field.clear(); row_has_data = true; };
  auto end_row = [&]() {
    if (row_has_data || !field.empty()) { end_field(); rows.push_back(row); }
    row.clear(); field.clear(); row_has_data = false;
  };
  for (; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') { field.push_back('"'); ++i; }
        else in_quotes = false;
      } else {
        field.push_back(c);
      }
      continue;
    }
    switch (c) {
      case '"': in_quotes = true; row_has_data = true; break;
      case ',': end_field(); break;
      case '\r': break;
      case '\n': end_row(); break;
      default: field.push_back(c); break;
    }
  }
  end_row();
  return rows;
}

std::vector<WordEntry> words_from_csv(const std::string& text, std::string& msg) {
  std::vector<WordEntry> out;
  auto rows = parse_csv(text);
  if (rows.empty()) { msg = "word list is empty"; return out; }
  int c_word = -1, c_meaning = -1, c_phonetic = -1, c_example = -1;
  const auto& header = rows[0];
  for (size_t i = 0; i < header.size(); ++i) {
    std::string h = ascii_lower(trim(header[i]));
    if (h == "word" || h == "term") c_word = static_cast<int>(i);
    else if (h == "meaning") c_meaning = static_cast<int>(i);
    else if (h == "phonetic") c_phonetic = static_cast<int>(i);
    else if (h == "example") c_example = static_cast<int>(i);
  }
  if (c_word < 0 || c_meaning < 0) { msg = "word list needs 'word' and 'meaning' columns"; return out; }
  auto cell = [](const std::vector<std::string>& r, int c) -> std::string {
    if (c < 0 || c >= static_cast<int>(r.size())) return std::string();
    return trim(r[c]);
  };
  size_t skipped = 0;
  for (size_t r = 1; r < rows.size(); ++r) {
    WordEntry e;
    e.term = cell(rows[r], c_word);
    if (e.term.empty()) { skipped++; continue; }
    e.meaning = cell(rows[r], c_meaning);
    std::string ph = cell(rows[r], c_phonetic);
    std::string ex = cell(rows[r], c_example);
    if (!ph.empty()) e.phonetic = ph;
    if (!ex.empty()) e.example = ex;
    out.push_back(std::move(e));
  }
  msg = "loaded " + std::to_string(out.size()) + " words";
  if (skipped) msg += " (" + std::to_string(skipped) + " rows without a word)";
  return out;
}

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += "\"";
  return out;
}

bool Storage::words_exist() const {
  std::error_code ec;
  return std::filesystem::exists(words_file_, ec);
}

bool Storage::load_words(std::vector<WordEntry>& out, std::string& msg) const {
  std::string text;
  if (!mmap_read_file(words_file_, text, msg)) return false;
  std::string m;
  out = words_from_csv(text, m);
  msg = m;
  if (out.empty()) return false;
  WT_LOGI("STORE", "%s from %s", msg.c_str(), words_file_.string().c_str());
  return true;
}

// Missing counters read as 0; negative, fractional or oversized ones are bad.
static bool read_counter(const nlohmann::json& v, const char* key, unsigned& out) {
  auto it = v.find(key);
  if (it == v.end()) { out = 0; return true; }
  if (!it->is_number_unsigned()) return false;
  auto n = it->get<std::uint64_t>();
  if (n > std::numeric_limits<unsigned>::max()) return false;
  out = static_cast<unsigned>(n);
  return true;
}

bool Storage::load_progress(ProgressMap& out, std::string& msg) const {
  out.clear();
  msg.clear();
  std::error_code ec;
  if (!std::filesystem::exists(progress_file_, ec)) return true; // first run
  std::string text;
  if (!mmap_read_file(progress_file_, text, msg)) return false;
  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) { msg = "progress file is not an object: " + progress_file_.string(); return false; }
    size_t skipped = 0;
    for (auto it = j.begin(); it != j.end(); ++it) {
      const auto& v = it.value();
      if (!v.is_object()) continue;
      Progress p;
      if (!read_counter(v, "seen", p.seen) || !read_counter(v, "known", p.known) ||
          !read_counter(v, "unknown", p.unknown)) {
        WT_LOGW("STORE", "progress for '%s' has a bad counter, skipped", it.key().c_str());
        skipped++;
        continue;
      }
      p.starred = v.value("starred", false);
      out.emplace(it.key(), p);
    }
    if (skipped) msg = std::to_string(skipped) + " progress record(s) with bad counters skipped";
  } catch (const nlohmann::json::exception& e) {
    msg = std::string("bad progress file: ") + e.what();
    out.clear();
    return false;
  }
  return true;
}

bool Storage::save_progress(const ProgressMap& progress, std::string& msg) const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  std::vector<std::string> keys;
  keys.reserve(progress.size());
  for (const auto& kv : progress) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  for (const auto& k : keys) {
    const Progress& p = progress.at(k);
    j[k] = {{"seen", p.seen}, {"known", p.known}, {"unknown", p.unknown}, {"starred", p.starred}};
  }
  return write_file_atomic(progress_file_, j.dump(2) + "\n", msg);
}

bool Storage::create_sample_words(std::string& msg) const {
  static const WordEntry samples[] = {
    {"apple", "n. 苹果", "/ˈæpəl/", "I like to eat an apple every day."},
    {"beautiful", "adj. 美丽的，漂亮的", "/ˈbjuːtɪfəl/", "She is a beautiful girl."},
    {"computer", "n. 计算机，电脑", "/kəmˈpjuːtər/", "I use my computer for work and entertainment."},
    {"difficult", "adj. 困难的，艰难的", "/ˈdɪfɪkəlt/", "This math problem is very difficult."},
    {"environment", "n. 环境", "/ɪnˈvaɪrənmənt/", "We should protect our environment."},
    {"fantastic", "adj. 极好的，了不起的", "/fænˈtæstɪk/", "The movie was fantastic!"},
    {"government", "n. 政府", "/ˈɡʌvərnmənt/", "The government made a new policy."},
    {"happiness", "n. 幸福，快乐", "/ˈhæpɪnəs/", "Money cannot buy happiness."},
  };
  std::string text = "word,meaning,phonetic,example\n";
  for (const auto& w : samples) {
    text += csv_escape(w.term) + "," + csv_escape(w.meaning) + "," +
            csv_escape(w.phonetic.value_or("")) + "," + csv_escape(w.example.value_or("")) + "\n";
  }
  if (!write_file_atomic(words_file_, text, msg)) return false;
  msg = "created sample word list: " + words_file_.string();
  return true;
}
