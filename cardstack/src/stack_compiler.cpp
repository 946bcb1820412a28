// stack_compiler.cpp
#include "stack_compiler.h"
#include "debug.h"

#include <utility>

// A card bound to its entry's state: callers that hold no state of their own
// get the entry's.
static CardPtr entry_card(const StackEntryPtr& entry) {
    if (!entry->state) return entry->card;
    CardPtr   card  = entry->card;
    CardState state = *entry->state;
    return std::make_shared<const Card>(card->meta(), card->signature(),
        [card, state](const CardValue& input, const CardContext& ctx, const CardState* s) {
            return card->process(input, ctx, s ? s : &state);
        },
        state);
}

static CardMeta compiled_meta(const Stack& stack) {
    CardMeta m;
    m.id       = stack.id() + ":" + stack_mode_name(stack.mode());
    m.name     = stack.meta().name.empty() ? stack.id() : stack.meta().name;
    m.category = CardCategory::Routing;
    m.description = stack.meta().description;
    return m;
}

static CardPtr compile_serial(const std::vector<StackEntryPtr>& active) {
    CS_ASSERT(!active.empty(), "serial fold over no active entries");
    CardPtr card = entry_card(active.front());
    for (size_t i = 1; i < active.size(); ++i)
        card = card_compose(card, entry_card(active[i]));
    return card;
}

// ---------------------------------------------------------------------------
// Entry-keyed state
//
// Fan-out and tabs cards keep one slice per entry, {entry_id: slice}. Slices
// of entries that are currently inactive are carried through untouched, so
// bypassing or switching away from an entry does not reset it.
// ---------------------------------------------------------------------------

static std::optional<CardState> entry_slice(const StackEntry& e, const CardState* state) {
    if (state && state->value.is_object()) {
        auto it = state->value.find(e.id);
        if (it != state->value.end()) return card_state_from_json(*it);
    }
    return e.state;
}

static std::optional<CardState> keyed_initial_state(const Stack& stack) {
    CardValue slices = CardValue::object();
    for (auto& e : stack.entries())
        if (e->state) slices[e->id] = card_state_to_json(e->state);
    if (slices.empty()) return std::nullopt;
    return CardState{ std::move(slices), 0 };
}

// Runs one entry with its slice and records the slice it leaves behind.
static CardResult run_entry(const StackEntry& e, const CardValue& input, const CardContext& ctx,
                            const CardState* state, CardValue& slices) {
    std::optional<CardState> slice = entry_slice(e, state);
    CardResult r = e.card->process(input, ctx, slice ? &*slice : nullptr);
    if (r.state) slice = r.state;
    if (slice) slices[e.id] = card_state_to_json(slice);
    return r;
}

static std::optional<CardState> keyed_result_state(CardValue slices, const CardState* state) {
    if (slices.empty()) return std::nullopt;
    return CardState{ std::move(slices), (state ? state->version : 0) + 1 };
}

static CardValue incoming_slices(const CardState* state) {
    return state && state->value.is_object() ? state->value : CardValue::object();
}

static CardPtr compile_fan_out(const Stack& stack) {
    const bool layer = stack.mode() == StackMode::Layer;
    return std::make_shared<const Card>(compiled_meta(stack), stack.signature(),
        [stack, layer](const CardValue& input, const CardContext& ctx, const CardState* state) {
            CardValue slices = incoming_slices(state);
            CardResult r;
            r.output = CardValue::array();
            for (auto& e : get_active_entries(stack)) {
                CardResult er = run_entry(*e, input, ctx, state, slices);
                if (layer)
                    r.output.push_back({{"mix", e->mix}, {"output", std::move(er.output)}});
                else
                    r.output.push_back(std::move(er.output));
                r.errors.insert(r.errors.end(), er.errors.begin(), er.errors.end());
            }
            r.state = keyed_result_state(std::move(slices), state);
            return r;
        },
        keyed_initial_state(stack));
}

static CardPtr compile_tabs(const Stack& stack) {
    return std::make_shared<const Card>(compiled_meta(stack), stack.signature(),
        [stack](const CardValue& input, const CardContext& ctx, const CardState* state) {
            auto active = get_active_entries(stack);
            if (active.empty()) {
                CardResult r;
                r.output = input;
                return r;
            }
            StackEntryPtr chosen = active.front();
            if (const auto& sel = stack.meta().selected_tab) {
                for (auto& e : active)
                    if (e->id == *sel) { chosen = e; break; }
            }
            CardValue slices = incoming_slices(state);
            CardResult r = run_entry(*chosen, input, ctx, state, slices);
            r.state = keyed_result_state(std::move(slices), state);
            return r;
        },
        keyed_initial_state(stack));
}

CardPtr stack_to_card(const Stack& stack) {
    auto active = get_active_entries(stack);
    if (active.empty()) {
        CS_LOG("compiler", "stack %s: no active entries, identity", stack.id().c_str());
        return identity_card(stack.id() + ":identity", stack.signature());
    }

    CS_LOG("compiler", "stack %s: %s over %zu active entries", stack.id().c_str(),
           stack_mode_name(stack.mode()), active.size());

    switch (stack.mode()) {
        case StackMode::Serial:   return compile_serial(active);
        case StackMode::Parallel:
        case StackMode::Layer:    return compile_fan_out(stack);
        case StackMode::Tabs:     return compile_tabs(stack);
    }
    return identity_card(stack.id() + ":identity", stack.signature());
}
