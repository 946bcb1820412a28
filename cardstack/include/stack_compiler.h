#pragma once
// stack_compiler.h
// Reduces a Stack to one executable card for the processing pipeline.
//
// The compiler does not validate: composing mismatched signatures yields a
// card whose runtime behaviour is not guaranteed. Run validate_stack() first
// if that matters to the caller.

#include "stack.h"

/// Compiles the stack's active entries (see get_active_entries()):
///   no active entries  identity card (input returned unchanged)
///   serial             left fold of the active cards with card_compose()
///   parallel           every active entry on the same input; output is the
///                      array of results in entry order
///   layer              as parallel, each result tagged {"mix", "output"}
///   tabs               the selected tab if active, else the first active
///                      entry; its result is returned directly
/// Each entry's own state is handed to its card; compiled cards never share
/// state between entries. The compiled card's state holds every entry's
/// slice (nested card_compose() pairs for serial, {entry_id: slice} for the
/// other modes) and its initial_state() is built from the entries' states.
/// Pass the returned state into the next call to carry entries across blocks.
CardPtr stack_to_card(const Stack& stack);
