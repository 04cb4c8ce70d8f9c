#pragma once
/*
 * App
 *
 * Purpose: the render/poll loop; owns the Session and drives Renderer and input.
 * States: RUNNING (render, poll TT_POLL_MS, dispatch) until Esc sets quit.
 * Errors from the terminal propagate out of run() unchanged.
 */
#include "types.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"

class App {
public:
  explicit App(ITerminal& term);
  App(ITerminal& term, Session session);
  void run();
  const Session& session() const { return session_; }
private:
  void render();
  ITerminal& term_;
  Renderer renderer_;
  Session session_;
};
