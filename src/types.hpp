#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Session and its clock).
 * Principle: carry simple state; the input handler is the only writer.
 */
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include "config.hpp"

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

struct Session {
  Session() : sample(TT_SAMPLE_TEXT) {}
  explicit Session(std::string text) : sample(std::move(text)) {}

  std::string sample;
  std::string typed;
  std::optional<TimePoint> start_time; // set by the first printable key, never cleared
  bool finished = false;               // monotonic
  bool quit = false;
};
