// stack.cpp
// Stack construction, signature inference and the pure stack operations.

#include "stack.h"
#include "debug.h"

#include <algorithm>
#include <cmath>
#include <utility>

// ---------------------------------------------------------------------------
// Mode names
// ---------------------------------------------------------------------------

const char* stack_mode_name(StackMode mode) {
    switch (mode) {
        case StackMode::Serial:   return "serial";
        case StackMode::Parallel: return "parallel";
        case StackMode::Layer:    return "layer";
        case StackMode::Tabs:     return "tabs";
    }
    return "serial";
}

std::optional<StackMode> parse_stack_mode(const std::string& name) {
    if (name == "serial")   return StackMode::Serial;
    if (name == "parallel") return StackMode::Parallel;
    if (name == "layer")    return StackMode::Layer;
    if (name == "tabs")     return StackMode::Tabs;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Stack
// ---------------------------------------------------------------------------

StackEntryPtr make_stack_entry(CardPtr card, IdGenerator& ids) {
    auto e = std::make_shared<StackEntry>();
    e->id    = ids.next("entry");
    e->state = card->initial_state();
    e->card  = std::move(card);
    return e;
}

Stack::Stack(std::string id, StackMode mode, std::vector<StackEntryPtr> entries,
             StackMeta meta)
    : id_(std::move(id)),
      mode_(mode),
      entries_(std::move(entries)),
      signature_(infer_stack_ports(entries_, mode)),
      meta_(std::move(meta)) {}

const StackEntry* Stack::find_entry(const std::string& entry_id) const {
    for (auto& e : entries_)
        if (e->id == entry_id) return e.get();
    return nullptr;
}

int Stack::index_of(const std::string& entry_id) const {
    for (size_t i = 0; i < entries_.size(); ++i)
        if (entries_[i]->id == entry_id) return static_cast<int>(i);
    return -1;
}

// ---------------------------------------------------------------------------
// Signature inference
// ---------------------------------------------------------------------------

CardSignature infer_stack_ports(const std::vector<StackEntryPtr>& entries, StackMode mode) {
    if (entries.empty()) return {};

    const CardSignature& first = entries.front()->card->signature();
    std::vector<Port> inputs, outputs;

    switch (mode) {
        case StackMode::Serial:
            inputs  = first.inputs;
            outputs = entries.back()->card->signature().outputs;
            break;

        // Layer differs from parallel only in the compiled card (mix weights).
        case StackMode::Parallel:
        case StackMode::Layer:
            inputs = first.inputs;
            for (auto& e : entries) {
                auto& outs = e->card->signature().outputs;
                outputs.insert(outputs.end(), outs.begin(), outs.end());
            }
            break;

        // Any tab may become active, so the compound presents the superset.
        case StackMode::Tabs:
            for (auto& e : entries) {
                auto& sig = e->card->signature();
                inputs.insert(inputs.end(), sig.inputs.begin(), sig.inputs.end());
                outputs.insert(outputs.end(), sig.outputs.begin(), sig.outputs.end());
            }
            break;
    }

    return create_signature(std::move(inputs), std::move(outputs));
}

Stack create_stack(const std::vector<CardPtr>& cards, StackMode mode, IdGenerator& ids,
                   StackMeta meta) {
    std::vector<StackEntryPtr> entries;
    entries.reserve(cards.size());
    for (auto& c : cards) entries.push_back(make_stack_entry(c, ids));
    return Stack(ids.next("stack"), mode, std::move(entries), std::move(meta));
}

// ---------------------------------------------------------------------------
// Structural operations
// ---------------------------------------------------------------------------

Stack stack_insert_card(const Stack& stack, CardPtr card, int position, IdGenerator& ids) {
    auto entries = stack.entries();
    int pos = std::clamp(position, 0, static_cast<int>(entries.size()));
    entries.insert(entries.begin() + pos, make_stack_entry(std::move(card), ids));
    return Stack(stack.id(), stack.mode(), std::move(entries), stack.meta());
}

Stack stack_remove_card(const Stack& stack, const std::string& entry_id) {
    std::vector<StackEntryPtr> entries;
    entries.reserve(stack.size());
    for (auto& e : stack.entries())
        if (e->id != entry_id) entries.push_back(e);

    StackMeta meta = stack.meta();
    if (meta.selected_tab && *meta.selected_tab == entry_id) meta.selected_tab.reset();
    return Stack(stack.id(), stack.mode(), std::move(entries), std::move(meta));
}

Stack stack_reorder_cards(const Stack& stack, int from, int to) {
    auto entries = stack.entries();
    const int n = static_cast<int>(entries.size());
    if (from < 0 || from >= n || to < 0 || to >= n || from == to) {
        return Stack(stack.id(), stack.mode(), std::move(entries), stack.meta());
    }
    StackEntryPtr moved = entries[from];
    entries.erase(entries.begin() + from);
    entries.insert(entries.begin() + to, std::move(moved));
    // Serial first/last may have changed; the constructor re-infers.
    return Stack(stack.id(), stack.mode(), std::move(entries), stack.meta());
}

Stack stack_set_mode(const Stack& stack, StackMode mode) {
    return Stack(stack.id(), mode, stack.entries(), stack.meta());
}

// ---------------------------------------------------------------------------
// Control operations
// ---------------------------------------------------------------------------

// Replaces one entry with an edited copy; every other entry keeps identity.
template <typename Edit>
static Stack with_entry(const Stack& stack, const std::string& entry_id, Edit edit) {
    auto entries = stack.entries();
    for (auto& e : entries) {
        if (e->id != entry_id) continue;
        auto copy = std::make_shared<StackEntry>(*e);
        edit(*copy);
        e = std::move(copy);
        return Stack(stack.id(), stack.mode(), std::move(entries), stack.meta());
    }
    CS_LOG("stack", "no entry %s in stack %s", entry_id.c_str(), stack.id().c_str());
    return stack;
}

Stack stack_bypass_card(const Stack& stack, const std::string& entry_id) {
    return with_entry(stack, entry_id, [](StackEntry& e) { e.bypassed = !e.bypassed; });
}

Stack stack_solo_card(const Stack& stack, const std::string& entry_id) {
    return with_entry(stack, entry_id, [](StackEntry& e) { e.solo = !e.solo; });
}

Stack stack_set_mix(const Stack& stack, const std::string& entry_id, float mix) {
    if (!std::isfinite(mix)) {
        CS_LOG("stack", "ignoring non-finite mix for entry %s", entry_id.c_str());
        return stack;
    }
    float m = std::clamp(mix, 0.0f, 1.0f);
    return with_entry(stack, entry_id, [m](StackEntry& e) { e.mix = m; });
}

Stack stack_set_entry_state(const Stack& stack, const std::string& entry_id,
                            std::optional<CardState> state) {
    return with_entry(stack, entry_id,
                      [&state](StackEntry& e) { e.state = std::move(state); });
}

Stack stack_select_tab(const Stack& stack, std::optional<std::string> entry_id) {
    StackMeta meta = stack.meta();
    meta.selected_tab = std::move(entry_id);
    return Stack(stack.id(), stack.mode(), stack.entries(), std::move(meta));
}

// ---------------------------------------------------------------------------
// Bypass / solo resolution
// ---------------------------------------------------------------------------

std::vector<StackEntryPtr> get_active_entries(const Stack& stack) {
    const auto& entries = stack.entries();
    bool any_solo = std::any_of(entries.begin(), entries.end(),
                                [](const StackEntryPtr& e) { return e->solo; });

    std::vector<StackEntryPtr> active;
    for (auto& e : entries) {
        if (e->bypassed) continue;
        if (any_solo && !e->solo) continue;
        active.push_back(e);
    }
    return active;
}
