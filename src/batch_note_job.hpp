#pragma once
/*
 * BatchNoteJob
 *
 * Purpose: generate notes for every mistake-set term that has none yet,
 * strictly in the order captured at job start.
 * Threading: the generator call runs on a std::async worker; results are
 * harvested (note saved, log line, counters) on the caller's thread by pump().
 * A pump either harvests or starts an item, never both, so every item
 * boundary goes back through the host loop where a cancel is observed.
 * Cancellation: cooperative; the in-flight item finishes and is recorded.
 */
#include <cstddef>
#include <deque>
#include <future>
#include <string>
#include <vector>
#include "note_generator.hpp"
#include "word_store.hpp"

class BatchNoteJob {
public:
  BatchNoteJob(std::vector<std::string> pending,
               const WordStore& words,
               const INoteGenerator& gen,
               INoteStore& notes,
               GenerateOptions opts);
  BatchNoteJob(const BatchNoteJob&) = delete;
  BatchNoteJob& operator=(const BatchNoteJob&) = delete;

  // Mistake-set terms (word-table order) without a saved note.
  static std::vector<std::string> collect_pending(const WordStore& words, const INoteStore& notes);

  // Returns true if anything changed. `wait` blocks on the in-flight item.
  bool pump(bool wait = false);
  void cancel();

  bool cancelled() const { return cancelled_; }
  bool busy() const { return in_flight_; }
  bool finished() const { return !in_flight_ && (cancelled_ || pending_.empty()); }
  size_t total() const { return total_; }
  size_t completed() const { return completed_; }
  size_t failed() const { return failed_; }
  size_t remaining() const { return pending_.size(); }
  double fraction() const { return total_ == 0 ? 1.0 : static_cast<double>(completed_) / static_cast<double>(total_); }
  const std::string& current_term() const { return in_flight_term_; }
  const std::vector<std::string>& log() const { return log_; }

private:
  void start_next();
  void harvest();

  const WordStore& words_;
  const INoteGenerator& gen_;
  INoteStore& notes_;
  GenerateOptions opts_;
  std::deque<std::string> pending_;
  size_t total_ = 0;
  size_t completed_ = 0;
  size_t failed_ = 0;
  bool cancelled_ = false;
  bool in_flight_ = false;
  std::string in_flight_term_;
  std::future<Generation> future_;
  std::vector<std::string> log_;
};
