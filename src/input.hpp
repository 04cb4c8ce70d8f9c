#pragma once
/*
 * Input
 *
 * Purpose: apply one getch() key code to the Session.
 * Keys: Esc quits, Backspace deletes, printable ASCII types; the rest is ignored.
 * Note: no I/O here; `now` is injected so the clock start is testable.
 */
#include "types.hpp"

bool is_quit_key(int ch);
bool is_backspace_key(int ch);
bool is_printable_key(int ch);

// marks the session finished when typed text matches the sample exactly
void try_finish(Session& s);

void handle_key(Session& s, int ch, TimePoint now = Clock::now());
