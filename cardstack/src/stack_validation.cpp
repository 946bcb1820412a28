// stack_validation.cpp

#include "stack_validation.h"
#include "debug.h"

#include <unordered_set>

static std::string card_label(const StackEntry& e) {
    const auto& name = e.card->meta().name;
    return "'" + (name.empty() ? e.card->id() : name) + "'";
}

static void check_serial(const Stack& stack, StackValidation& v) {
    const auto& entries = stack.entries();
    for (size_t i = 0; i + 1 < entries.size(); ++i) {
        const StackEntry& a = *entries[i];
        const StackEntry& b = *entries[i + 1];
        const auto& outs = a.card->signature().outputs;
        const auto& ins  = b.card->signature().inputs;

        if (outs.empty()) {
            if (!ins.empty())
                v.errors.push_back({ a.id, card_label(a) + " has no outputs but "
                                         + card_label(b) + " expects input" });
            continue;
        }
        if (ins.empty()) continue;

        const Port& from = outs.front();
        const Port& to   = ins.front();
        auto compat = get_port_compatibility(from.type, to.type);
        if (!compat) {
            v.errors.push_back({ b.id, "cannot connect " + card_label(a) + "." + from.name
                                     + " (" + from.type.id() + ") to " + card_label(b) + "."
                                     + to.name + " (" + to.type.id() + ")" });
        } else if (compat->requires_adapter) {
            v.warnings.push_back({ b.id, card_label(a) + " -> " + card_label(b)
                                       + " needs adapter '" + compat->adapter_name + "'" });
        }
    }
}

static void check_parallel(const Stack& stack, StackValidation& v) {
    const auto& entries = stack.entries();
    const size_t expected = entries.front()->card->signature().inputs.size();
    for (size_t i = 1; i < entries.size(); ++i) {
        const size_t n = entries[i]->card->signature().inputs.size();
        if (n != expected)
            v.warnings.push_back({ entries[i]->id, card_label(*entries[i]) + " has "
                                       + std::to_string(n) + " inputs, first entry has "
                                       + std::to_string(expected) });
    }
}

static void check_layer(const Stack& stack, StackValidation& v) {
    for (auto& e : get_active_entries(stack))
        if (e->mix <= 0.0f)
            v.warnings.push_back({ e->id, card_label(*e) + " is active with mix 0" });
}

static void check_tabs(const Stack& stack, StackValidation& v) {
    const auto& selected = stack.meta().selected_tab;
    if (selected && !stack.find_entry(*selected))
        v.warnings.push_back({ *selected, "selected tab is not in the stack" });
}

StackValidation validate_stack(const Stack& stack) {
    StackValidation v;
    if (stack.empty()) {
        v.warnings.push_back({ {}, "stack is empty" });
        return v;
    }

    std::unordered_set<std::string> seen;
    for (auto& e : stack.entries())
        if (!seen.insert(e->id).second)
            v.errors.push_back({ e->id, "duplicate entry id" });

    switch (stack.mode()) {
        case StackMode::Serial:   check_serial(stack, v);   break;
        case StackMode::Parallel: check_parallel(stack, v); break;
        case StackMode::Layer:    check_layer(stack, v);    break;
        case StackMode::Tabs:     check_tabs(stack, v);     break;
    }

    v.valid = v.errors.empty();
    CS_LOG("validate", "stack %s: %zu errors, %zu warnings", stack.id().c_str(),
           v.errors.size(), v.warnings.size());
    return v;
}
