// builtin_cards.cpp
// Explicit registration of all built-in cards.
//
// Each card .cpp under cards/builtin/ exposes a make_<n>_card() factory.
// When those TUs are compiled into the static library, nothing but this file
// references them, so register_builtin_cards() is what keeps them linked.
//
// ADDING A NEW BUILT-IN CARD
// --------------------------
//   1. Add its .cpp to CMakeLists.txt as usual.
//   2. Add a make_<n>_card() factory at the bottom of that .cpp.
//   3. Forward-declare it here and add the register_one() call below.

#include "card_api.h"

// ---------------------------------------------------------------------------
// Forward declarations of per-card factory functions.
// ---------------------------------------------------------------------------

CardPtr make_thru_card();
CardPtr make_invert_card();
CardPtr make_octave_up_card();
CardPtr make_note_to_midi_card();
CardPtr make_clock_divider_card();

static void register_one(CardFactory factory) {
    CardRegistry::add({ factory()->id(), factory });
}

// ---------------------------------------------------------------------------
// Public entry point: call once before any registry query.
// ---------------------------------------------------------------------------

void register_builtin_cards() {
    register_one(make_thru_card);
    register_one(make_invert_card);
    register_one(make_octave_up_card);
    register_one(make_note_to_midi_card);
    register_one(make_clock_divider_card);
}
