#pragma once
// stack.h
// Stacks: ordered card entries composed under one mode.
//
// A Stack is a persistent value. Entries are held through shared pointers to
// immutable StackEntry objects, so every operation below returns a new Stack
// that shares all untouched entries with its input. Retaining old Stack
// values is how structural undo works; it costs one pointer per entry.
//
// The signature is derived: the constructor always computes it with
// infer_stack_ports(), and there is no way to set it by hand.

#include "card_api.h"
#include "id_generator.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Mode
// ---------------------------------------------------------------------------

enum class StackMode {
    Serial,     // chain: each entry feeds the next
    Parallel,   // fan-out: every entry sees the same input, outputs concatenated
    Layer,      // parallel with a per-entry mix weight
    Tabs,       // one entry active at a time
};

const char* stack_mode_name(StackMode mode);
std::optional<StackMode> parse_stack_mode(const std::string& name);

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

struct StackEntry {
    std::string              id;
    CardPtr                  card;
    bool                     bypassed = false;
    bool                     solo     = false;
    float                    mix      = 1.0f;   // [0, 1]
    std::optional<CardState> state;             // owned by this entry only
};

using StackEntryPtr = std::shared_ptr<const StackEntry>;

/// Fresh entry: not bypassed, not solo, mix 1, state = the card's initial state.
StackEntryPtr make_stack_entry(CardPtr card, IdGenerator& ids);

// ---------------------------------------------------------------------------
// Stack
// ---------------------------------------------------------------------------

struct StackMeta {
    std::string                name;
    std::string                description;
    std::optional<std::string> selected_tab;   // Tabs mode: entry to run when active
};

class Stack {
public:
    Stack(std::string id, StackMode mode, std::vector<StackEntryPtr> entries,
          StackMeta meta = {});

    const std::string&                id()        const { return id_; }
    StackMode                         mode()      const { return mode_; }
    const std::vector<StackEntryPtr>& entries()   const { return entries_; }
    const CardSignature&              signature() const { return signature_; }
    const StackMeta&                  meta()      const { return meta_; }

    size_t size()  const { return entries_.size(); }
    bool   empty() const { return entries_.empty(); }

    /// nullptr if no entry has this id.
    const StackEntry* find_entry(const std::string& entry_id) const;

    /// -1 if no entry has this id.
    int index_of(const std::string& entry_id) const;

private:
    std::string                id_;
    StackMode                  mode_;
    std::vector<StackEntryPtr> entries_;
    CardSignature              signature_;
    StackMeta                  meta_;
};

/// Visible signature of a composite:
///   serial          inputs of the first entry, outputs of the last
///   parallel/layer  inputs of the first entry, every entry's outputs in order
///   tabs            every entry's inputs, every entry's outputs
/// Zero entries give the empty signature in every mode.
CardSignature infer_stack_ports(const std::vector<StackEntryPtr>& entries, StackMode mode);

Stack create_stack(const std::vector<CardPtr>& cards, StackMode mode, IdGenerator& ids,
                   StackMeta meta = {});

// ---------------------------------------------------------------------------
// Structural operations
// ---------------------------------------------------------------------------

/// position is clamped to [0, size].
Stack stack_insert_card(const Stack& stack, CardPtr card, int position, IdGenerator& ids);
Stack stack_remove_card(const Stack& stack, const std::string& entry_id);

/// Moves the entry at `from` to `to`. Out-of-range indices leave the order unchanged.
Stack stack_reorder_cards(const Stack& stack, int from, int to);

Stack stack_set_mode(const Stack& stack, StackMode mode);

// ---------------------------------------------------------------------------
// Control operations
//
// Unknown entry ids are a no-op: the result equals the input.
// ---------------------------------------------------------------------------

Stack stack_bypass_card(const Stack& stack, const std::string& entry_id);   // toggle
Stack stack_solo_card(const Stack& stack, const std::string& entry_id);     // toggle
/// mix is clamped to [0, 1]; NaN and infinities leave the stack unchanged.
Stack stack_set_mix(const Stack& stack, const std::string& entry_id, float mix);
Stack stack_set_entry_state(const Stack& stack, const std::string& entry_id,
                            std::optional<CardState> state);
Stack stack_select_tab(const Stack& stack, std::optional<std::string> entry_id);

// ---------------------------------------------------------------------------
// Bypass / solo resolution
// ---------------------------------------------------------------------------

/// The single owner of the active-entry rule: if any entry is solo, the
/// active set is the solo entries that are not bypassed; otherwise it is
/// every entry that is not bypassed. Order follows the stack.
std::vector<StackEntryPtr> get_active_entries(const Stack& stack);
