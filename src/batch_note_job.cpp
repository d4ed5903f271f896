#include "batch_note_job.hpp"
#include "logging.hpp"
#include <chrono>

BatchNoteJob::BatchNoteJob(std::vector<std::string> pending,
                           const WordStore& words,
                           const INoteGenerator& gen,
                           INoteStore& notes,
                           GenerateOptions opts)
  : words_(words), gen_(gen), notes_(notes), opts_(opts),
    pending_(pending.begin(), pending.end()), total_(pending.size()) {
  if (total_ == 0) log_.push_back("nothing to do: every mistake-set word already has a note");
  else log_.push_back("queued " + std::to_string(total_) + " words");
  WT_LOGI("BATCH", "job created, %zu pending", total_);
}

std::vector<std::string> BatchNoteJob::collect_pending(const WordStore& words, const INoteStore& notes) {
  std::vector<std::string> out;
  for (const auto& term : words.mistake_set()) {
    if (!notes.note_exists(term)) out.push_back(term);
  }
  return out;
}

bool BatchNoteJob::pump(bool wait) {
  if (in_flight_) {
    if (!wait && future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
    harvest();
    return true;
  }
  if (cancelled_ || pending_.empty()) return false;
  start_next();
  return true;
}

void BatchNoteJob::cancel() {
  if (cancelled_ || finished()) return;
  cancelled_ = true;
  log_.push_back(in_flight_ ? "cancel requested, finishing '" + in_flight_term_ + "'"
                            : std::string("cancelled"));
  WT_LOGI("BATCH", "cancel requested, %zu left", pending_.size());
}

void BatchNoteJob::start_next() {
  std::string term = pending_.front();
  pending_.pop_front();
  const WordEntry* e = words_.find(term);
  if (!e) {
    failed_++;
    log_.push_back("[fail] " + term + ": not in word list");
    return;
  }
  WordEntry copy = *e; // the worker never touches the store
  const INoteGenerator* gen = &gen_;
  GenerateOptions opts = opts_;
  future_ = std::async(std::launch::async, [gen, copy, opts]() { return gen->explain(copy, opts); });
  in_flight_ = true;
  in_flight_term_ = term;
}

void BatchNoteJob::harvest() {
  Generation g = future_.get();
  in_flight_ = false;
  std::string term = std::move(in_flight_term_);
  in_flight_term_.clear();
  if (!g.ok) {
    failed_++;
    log_.push_back("[fail] " + term + ": " + describe_failure(g));
    WT_LOGW("BATCH", "'%s' failed: %s", term.c_str(), describe_failure(g).c_str());
  } else {
    std::string msg;
    if (notes_.save_note(term, g.text, msg)) {
      completed_++;
      log_.push_back("[ok] " + term);
      WT_LOGD("BATCH", "'%s' saved", term.c_str());
    } else {
      failed_++;
      log_.push_back("[fail] " + term + ": " + msg);
      WT_LOGW("BATCH", "'%s' not saved: %s", term.c_str(), msg.c_str());
    }
  }
  if (cancelled_) log_.push_back("cancelled, " + std::to_string(pending_.size()) + " left");
  else if (pending_.empty()) log_.push_back("done: " + std::to_string(completed_) + " ok, " + std::to_string(failed_) + " failed");
}
