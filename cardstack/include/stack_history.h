#pragma once
// stack_history.h
// Undo support: control-state snapshots, structural diff and merge.
//
// Structural undo works by retaining whole prior Stack values. Snapshots are
// the lightweight complement: they capture only bypass/solo/mix, so toggling
// a control can be undone without also undoing an unrelated structural edit.

#include "stack.h"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct EntryControlState {
    bool  bypassed = false;
    bool  solo     = false;
    float mix      = 1.0f;
};

bool operator==(const EntryControlState& a, const EntryControlState& b);
bool operator!=(const EntryControlState& a, const EntryControlState& b);

struct StackSnapshot {
    std::string                              id;
    int64_t                                  timestamp_ms = 0;   // ms since the Unix epoch
    std::vector<std::string>                 entry_order;
    std::map<std::string, EntryControlState> states;             // entry id → controls
};

StackSnapshot stack_snapshot(const Stack& stack, IdGenerator& ids);

/// Writes the snapshot's control state onto entries that still exist.
/// Entries added since the snapshot are untouched, entries removed since are
/// ignored, and the structure (order, cards, mode) never changes.
Stack stack_restore(const Stack& stack, const StackSnapshot& snapshot);

enum class ControlField {
    Bypassed,
    Solo,
    Mix,
};

const char* control_field_name(ControlField field);

struct StackDiff {
    std::vector<std::string>                         added;      // in `after` order
    std::vector<std::string>                         removed;    // in `before` order
    bool                                             reordered = false;
    std::map<std::string, std::vector<ControlField>> state_changes;   // only ids with changes

    bool empty() const {
        return added.empty() && removed.empty() && !reordered && state_changes.empty();
    }
};

/// `reordered` is true iff the relative order of the ids present in both
/// stacks differs.
StackDiff stack_diff(const Stack& before, const Stack& after);

/// a's entries then b's, ids preserved (callers must avoid collisions), under
/// `mode` or a's mode. The result gets a new stack id and a's metadata.
Stack stack_merge(const Stack& a, const Stack& b, std::optional<StackMode> mode, IdGenerator& ids);

// ---------------------------------------------------------------------------
// JSON (for hosts that persist undo history)
// ---------------------------------------------------------------------------

nlohmann::json stack_snapshot_to_json(const StackSnapshot& snapshot);

/// Returns nullopt on parse error and fills error_out.
std::optional<StackSnapshot> stack_snapshot_from_json(const std::string& json, std::string& error_out);
