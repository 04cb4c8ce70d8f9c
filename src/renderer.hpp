#pragma once
/*
 * Renderer
 *
 * Purpose: draw the two panels ("Type this" and "Stats") for a Session.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; reads the Session, never writes it.
 */
#include <cstddef>
#include <string>
#include "types.hpp"
#include "iterminal.hpp"

enum class CharState { Correct, Error, Untyped };

// state of sample position `i` against what has been typed there
CharState classify_char(const Session& s, size_t i);
int color_for(CharState st);
std::string stats_text(const Session& s, TimePoint now);

class Renderer {
public:
  void render(ITerminal& term, const Session& s, TimePoint now);
private:
  void render_sample(ITerminal& term, const Session& s, const Rect& inner);
  void render_stats(ITerminal& term, const Session& s, TimePoint now, const Rect& inner);
};
