#pragma once

/*compile-time settings; override with -D at configure time*/

#ifndef TT_SAMPLE_TEXT
#define TT_SAMPLE_TEXT "The quick brown fox jumps over the lazy dog."
#endif

// input poll timeout, also the idle redraw period
#ifndef TT_POLL_MS
#define TT_POLL_MS 100
#endif

// blank cells around the two panels
#ifndef TT_MARGIN
#define TT_MARGIN 2
#endif

#ifndef TT_ESCDELAY_MS
#define TT_ESCDELAY_MS 25
#endif
