#pragma once
/*
 * App
 *
 * Purpose: host loop. Reads an event or lets the tick deadline pass, feeds
 * the Session and draws the returned Frame.
 * Note: ticks are scheduled on a steady clock, so a stream of keys does not
 * starve the boss screen or the batch job.
 */
#include "iterminal.hpp"
#include "renderer.hpp"
#include "session.hpp"

class App {
public:
  App(ITerminal& term, Session& session, int tick_ms);
  // Returns when the session asks to quit. `max_events` > 0 bounds the loop (tests).
  int run(int max_events = 0);
private:
  ITerminal& term_;
  Session& session_;
  Renderer renderer_;
  int tick_ms_;
};
