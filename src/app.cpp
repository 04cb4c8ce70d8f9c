#include "app.hpp"
#include <utility>
#include "input.hpp"

App::App(ITerminal& term) : term_(term) {}

App::App(ITerminal& term, Session session)
  : term_(term), session_(std::move(session)) {}

void App::run() {
  while (true) {
    render();
    if (session_.quit) break;
    int ch = term_.read_key(TT_POLL_MS);
    if (ch != NO_KEY) handle_key(session_, ch);
  }
}

void App::render() {
  renderer_.render(term_, session_, Clock::now());
}
