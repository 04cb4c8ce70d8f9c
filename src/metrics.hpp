#pragma once
/*
 * Metrics
 *
 * Purpose: derived numbers over a Session snapshot (elapsed, WPM, accuracy).
 * Constraint: stateless; recomputed from current state on every frame.
 */
#include <cstddef>
#include <optional>
#include <string>
#include "types.hpp"

std::optional<double> elapsed_seconds(const Session& s, TimePoint now);
size_t word_count(const std::string& text);
std::optional<double> words_per_minute(const Session& s, TimePoint now);
double accuracy(const Session& s);
