#include "app.hpp"
#include "logging.hpp"
#include <chrono>

App::App(ITerminal& term, Session& session, int tick_ms)
  : term_(term), session_(session), tick_ms_(tick_ms < 50 ? 50 : tick_ms) {}

int App::run(int max_events) {
  using clock = std::chrono::steady_clock;
  TermSize sz = term_.getSize();
  Frame f = session_.handle(Event::resize(sz.rows, sz.cols));
  renderer_.render(term_, f);
  auto next_tick = clock::now() + std::chrono::milliseconds(tick_ms_);
  int handled = 0;
  WT_LOGI("APP", "loop start, tick %d ms", tick_ms_);
  while (!f.quit) {
    if (max_events > 0 && handled >= max_events) break;
    auto now = clock::now();
    int wait = 0;
    if (next_tick > now) {
      wait = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now).count());
    }
    Event ev;
    if (wait > 0 && term_.read_event(wait, ev)) {
      f = session_.handle(ev);
    } else {
      f = session_.handle(Event::tick());
      next_tick = clock::now() + std::chrono::milliseconds(tick_ms_);
    }
    handled++;
    if (f.flush_input) term_.flush_input();
    if (!f.quit) renderer_.render(term_, f);
  }
  WT_LOGI("APP", "loop end after %d events", handled);
  return 0;
}
