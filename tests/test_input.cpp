#include "input.hpp"
#include <ncurses.h>
#include <cassert>
#include <chrono>
#include <string>

static void type(Session& s, const std::string& text, TimePoint now) {
  for (char c : text) handle_key(s, static_cast<unsigned char>(c), now);
}

static void test_first_char_starts_clock() {
  Session s;
  TimePoint t0 = Clock::now();
  assert(!s.start_time);
  handle_key(s, 'T', t0);
  assert(s.start_time && *s.start_time == t0);
  handle_key(s, 'h', t0 + std::chrono::seconds(3));
  handle_key(s, KEY_BACKSPACE, t0 + std::chrono::seconds(4));
  handle_key(s, 'x', t0 + std::chrono::seconds(5));
  assert(*s.start_time == t0);
  assert(s.typed == "Tx");
}

static void test_backspace_on_empty_is_noop() {
  Session s;
  handle_key(s, KEY_BACKSPACE);
  handle_key(s, 127);
  assert(s.typed.empty());
  assert(!s.start_time);
  assert(!s.finished);
  assert(!s.quit);
}

static void test_backspace_variants() {
  Session s("abcd");
  type(s, "abx", Clock::now());
  handle_key(s, 127);
  assert(s.typed == "ab");
  handle_key(s, 'H' - 64);
  assert(s.typed == "a");
  handle_key(s, KEY_BACKSPACE);
  assert(s.typed.empty());
  assert(!s.finished);
}

static void test_non_printable_ignored() {
  Session s;
  int keys[] = {KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT, KEY_F(1), KEY_MOUSE, KEY_RESIZE, '\n', '\t', 200};
  for (int k : keys) handle_key(s, k);
  assert(s.typed.empty());
  assert(!s.start_time);
  assert(!s.quit);
}

static void test_escape_quits_without_typing() {
  Session s;
  handle_key(s, 27);
  assert(s.quit);
  assert(s.typed.empty());
  assert(!s.start_time);

  Session done("a");
  handle_key(done, 'a');
  assert(done.finished);
  handle_key(done, 27);
  assert(done.quit);
}

static void test_exact_match_finishes() {
  Session s("cat");
  TimePoint t0 = Clock::now();
  type(s, "ca", t0);
  assert(!s.finished);
  handle_key(s, 't', t0);
  assert(s.finished);
  assert(s.typed == "cat");
}

static void test_overshoot_never_finishes() {
  Session s("cat");
  type(s, "cax", Clock::now());
  assert(!s.finished);
  type(s, "t", Clock::now());
  assert(s.typed == "caxt");
  assert(!s.finished);
}

static void test_backspace_back_to_match_finishes() {
  Session s("cat");
  type(s, "caxs", Clock::now());
  assert(!s.finished);
  handle_key(s, KEY_BACKSPACE);
  handle_key(s, KEY_BACKSPACE);
  assert(s.typed == "ca");
  assert(!s.finished);
  handle_key(s, 't');
  assert(s.typed == "cat");
  assert(s.finished);
}

// the matching character is the one that finishes; nothing can follow it
static void test_no_typing_past_a_match() {
  Session s("cat");
  type(s, "cats", Clock::now());
  assert(s.finished);
  assert(s.typed == "cat");
  handle_key(s, KEY_BACKSPACE);
  assert(s.typed == "ca");
  assert(s.finished);
}

static void test_typing_locked_after_finish() {
  Session s;
  TimePoint t0 = Clock::now();
  type(s, s.sample, t0);
  assert(s.finished);
  std::string before = s.typed;
  type(s, "more text", t0 + std::chrono::seconds(1));
  assert(s.typed == before);
  assert(s.finished);
  assert(*s.start_time == t0);
}

static void test_backspace_after_finish_keeps_flag() {
  Session s("dog");
  type(s, "dog", Clock::now());
  assert(s.finished);
  handle_key(s, KEY_BACKSPACE);
  assert(s.typed == "do");
  assert(s.finished);
  handle_key(s, 'g');
  assert(s.typed == "do");
}

int main() {
  assert(is_quit_key(27));
  assert(is_printable_key(' ') && is_printable_key('~') && !is_printable_key(127));
  test_first_char_starts_clock();
  test_backspace_on_empty_is_noop();
  test_backspace_variants();
  test_non_printable_ignored();
  test_escape_quits_without_typing();
  test_exact_match_finishes();
  test_overshoot_never_finishes();
  test_backspace_back_to_match_finishes();
  test_no_typing_past_a_match();
  test_typing_locked_after_finish();
  test_backspace_after_finish_keeps_flag();
  return 0;
}
