// stack_history.cpp
#include "stack_history.h"
#include "debug.h"

#include <chrono>
#include <unordered_map>

using json = nlohmann::json;

bool operator==(const EntryControlState& a, const EntryControlState& b) {
    return a.bypassed == b.bypassed && a.solo == b.solo && a.mix == b.mix;
}

bool operator!=(const EntryControlState& a, const EntryControlState& b) { return !(a == b); }

static EntryControlState controls_of(const StackEntry& e) {
    return { e.bypassed, e.solo, e.mix };
}

const char* control_field_name(ControlField field) {
    switch (field) {
        case ControlField::Bypassed: return "bypassed";
        case ControlField::Solo:     return "solo";
        case ControlField::Mix:      return "mix";
    }
    return "bypassed";
}

// ---------------------------------------------------------------------------
// Snapshot / restore
// ---------------------------------------------------------------------------

StackSnapshot stack_snapshot(const Stack& stack, IdGenerator& ids) {
    StackSnapshot s;
    s.id = ids.next("snapshot");
    s.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    for (auto& e : stack.entries()) {
        s.entry_order.push_back(e->id);
        s.states[e->id] = controls_of(*e);
    }
    return s;
}

Stack stack_restore(const Stack& stack, const StackSnapshot& snapshot) {
    auto entries = stack.entries();
    int restored = 0;
    for (auto& e : entries) {
        auto it = snapshot.states.find(e->id);
        if (it == snapshot.states.end() || controls_of(*e) == it->second) continue;
        auto copy = std::make_shared<StackEntry>(*e);
        copy->bypassed = it->second.bypassed;
        copy->solo     = it->second.solo;
        copy->mix      = it->second.mix;
        e = std::move(copy);
        ++restored;
    }
    CS_LOG("history", "restore %s onto %s: %d entries changed",
           snapshot.id.c_str(), stack.id().c_str(), restored);
    return Stack(stack.id(), stack.mode(), std::move(entries), stack.meta());
}

// ---------------------------------------------------------------------------
// Diff / merge
// ---------------------------------------------------------------------------

StackDiff stack_diff(const Stack& before, const Stack& after) {
    StackDiff d;

    std::unordered_map<std::string, const StackEntry*> before_by_id, after_by_id;
    for (auto& e : before.entries()) before_by_id.emplace(e->id, e.get());
    for (auto& e : after.entries())  after_by_id.emplace(e->id, e.get());

    std::vector<std::string> common_before, common_after;
    for (auto& e : before.entries()) {
        if (after_by_id.count(e->id)) common_before.push_back(e->id);
        else                          d.removed.push_back(e->id);
    }
    for (auto& e : after.entries()) {
        if (before_by_id.count(e->id)) common_after.push_back(e->id);
        else                           d.added.push_back(e->id);
    }
    d.reordered = common_before != common_after;

    for (auto& id : common_after) {
        const StackEntry& a = *before_by_id[id];
        const StackEntry& b = *after_by_id[id];
        std::vector<ControlField> fields;
        if (a.bypassed != b.bypassed) fields.push_back(ControlField::Bypassed);
        if (a.solo     != b.solo)     fields.push_back(ControlField::Solo);
        if (a.mix      != b.mix)      fields.push_back(ControlField::Mix);
        if (!fields.empty()) d.state_changes.emplace(id, std::move(fields));
    }
    return d;
}

Stack stack_merge(const Stack& a, const Stack& b, std::optional<StackMode> mode, IdGenerator& ids) {
    std::vector<StackEntryPtr> entries = a.entries();
    entries.insert(entries.end(), b.entries().begin(), b.entries().end());
    CS_LOG("history", "merge %s + %s", a.id().c_str(), b.id().c_str());
    return Stack(ids.next("stack"), mode.value_or(a.mode()), std::move(entries), a.meta());
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

json stack_snapshot_to_json(const StackSnapshot& snapshot) {
    json states = json::object();
    for (auto& [id, c] : snapshot.states)
        states[id] = {{"bypassed", c.bypassed}, {"solo", c.solo}, {"mix", c.mix}};
    return {
        {"id",          snapshot.id},
        {"timestamp",   snapshot.timestamp_ms},
        {"entry_order", snapshot.entry_order},
        {"states",      states},
    };
}

std::optional<StackSnapshot> stack_snapshot_from_json(const std::string& j_str, std::string& err) {
    StackSnapshot s;
    try {
        json j = json::parse(j_str);
        s.id           = j.value("id", "");
        s.timestamp_ms = j.value("timestamp", int64_t{0});
        s.entry_order  = j.value("entry_order", std::vector<std::string>{});
        json states = j.value("states", json::object());
        for (auto& [id, jc] : states.items()) {
            EntryControlState c;
            c.bypassed = jc.value("bypassed", false);
            c.solo     = jc.value("solo", false);
            c.mix      = jc.value("mix", 1.0f);
            s.states[id] = c;
        }
    } catch (const std::exception& e) {
        err = std::string("snapshot JSON error: ") + e.what();
        return std::nullopt;
    }
    return s;
}
