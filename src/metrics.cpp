#include "metrics.hpp"
#include <algorithm>

std::optional<double> elapsed_seconds(const Session& s, TimePoint now) {
  if (!s.start_time) return std::nullopt;
  std::chrono::duration<double> d = now - *s.start_time;
  return d.count();
}

// rough count: runs of spaces are not collapsed, edges are not trimmed
size_t word_count(const std::string& text) {
  return static_cast<size_t>(std::count(text.begin(), text.end(), ' ')) + 1;
}

std::optional<double> words_per_minute(const Session& s, TimePoint now) {
  if (!s.finished) return std::nullopt;
  auto secs = elapsed_seconds(s, now);
  if (!secs || *secs <= 0.0) return std::nullopt;
  return static_cast<double>(word_count(s.sample)) / (*secs / 60.0);
}

double accuracy(const Session& s) {
  if (s.typed.empty()) return 100.0;
  size_t n = std::min(s.typed.size(), s.sample.size());
  size_t correct = 0;
  for (size_t i = 0; i < n; ++i) if (s.typed[i] == s.sample[i]) correct++;
  return static_cast<double>(correct) / static_cast<double>(s.typed.size()) * 100.0;
}
