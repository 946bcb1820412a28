// test/test_validation.cpp
// Advisory validation: errors and warnings per mode.

#include "stack_validation.h"
#include "test_helpers.h"

#include <iostream>
#include <cassert>

static CardPtr audio_fx(const std::string& id) {
    return make_shape_card(id, { create_port("in", port_types::AUDIO) },
                               { create_port("out", port_types::AUDIO) });
}

int main() {
    std::cout << "=== test_validation ===\n";
    SequentialIdGenerator ids;

    // --- Empty ---
    auto v = validate_stack(create_stack({}, StackMode::Serial, ids));
    assert(v.valid && v.errors.empty() && v.warnings.size() == 1);
    std::cout << "PASS: empty stack is valid with a warning\n";

    // --- Serial, clean ---
    v = validate_stack(create_stack({ audio_fx("a"), audio_fx("b") }, StackMode::Serial, ids));
    assert(v.valid && v.errors.empty() && v.warnings.empty());
    std::cout << "PASS: matching serial chain\n";

    // --- Serial dead end ---
    auto sink = make_shape_card("sink", { create_port("in", port_types::AUDIO) }, {});
    Stack dead = create_stack({ sink, audio_fx("b") }, StackMode::Serial, ids);
    v = validate_stack(dead);
    assert(!v.valid && v.errors.size() == 1);
    assert(v.errors[0].entry_id == dead.entries()[0]->id);

    // A source after a sink is fine: nothing is expected.
    auto source = make_shape_card("source", {}, { create_port("out", port_types::AUDIO) });
    v = validate_stack(create_stack({ sink, source }, StackMode::Serial, ids));
    assert(v.valid);
    std::cout << "PASS: dead end between neighbours\n";

    // --- Serial type mismatch / adapter ---
    auto midi_in = make_shape_card("synth", { create_port("midi", port_types::MIDI) },
                                            { create_port("out", port_types::AUDIO) });
    Stack mismatch = create_stack({ audio_fx("a"), midi_in }, StackMode::Serial, ids);
    v = validate_stack(mismatch);
    assert(!v.valid && v.errors.size() == 1);
    assert(v.errors[0].entry_id == mismatch.entries()[1]->id);

    auto notes_out = make_shape_card("seq", {}, { create_port("notes", port_types::NOTES) });
    Stack adapted = create_stack({ notes_out, midi_in }, StackMode::Serial, ids);
    v = validate_stack(adapted);
    assert(v.valid && v.warnings.size() == 1);
    assert(v.warnings[0].message.find("notes-to-midi") != std::string::npos);
    std::cout << "PASS: serial port types checked\n";

    // Same problems are not errors outside serial mode.
    assert(validate_stack(stack_set_mode(mismatch, StackMode::Tabs)).valid);

    // --- Parallel ---
    auto two_in = make_shape_card("two", { create_port("l", port_types::AUDIO),
                                           create_port("r", port_types::AUDIO) },
                                         { create_port("out", port_types::AUDIO) });
    Stack par = create_stack({ audio_fx("a"), two_in, audio_fx("c") }, StackMode::Parallel, ids);
    v = validate_stack(par);
    assert(v.valid && v.warnings.size() == 1);
    assert(v.warnings[0].entry_id == par.entries()[1]->id);
    std::cout << "PASS: heterogeneous parallel inputs warn\n";

    // --- Layer ---
    Stack layer = create_stack({ audio_fx("a"), audio_fx("b") }, StackMode::Layer, ids);
    assert(validate_stack(layer).warnings.empty());
    Stack muted = stack_set_mix(layer, layer.entries()[1]->id, 0.0f);
    v = validate_stack(muted);
    assert(v.valid && v.warnings.size() == 1);
    // Bypassed entries are not active, so their mix does not matter.
    assert(validate_stack(stack_bypass_card(muted, layer.entries()[1]->id)).warnings.empty());
    std::cout << "PASS: silent layer warns\n";

    // --- Tabs ---
    Stack tabs = create_stack({ audio_fx("a"), audio_fx("b") }, StackMode::Tabs, ids);
    assert(validate_stack(stack_select_tab(tabs, tabs.entries()[0]->id)).warnings.empty());
    v = validate_stack(stack_select_tab(tabs, std::string("entry-missing")));
    assert(v.valid && v.warnings.size() == 1);
    std::cout << "PASS: unknown selected tab warns\n";

    // --- Duplicate ids ---
    auto e = make_stack_entry(audio_fx("a"), ids);
    Stack dup("dup", StackMode::Parallel, { e, e });
    v = validate_stack(dup);
    assert(!v.valid && v.errors.size() == 1);
    std::cout << "PASS: duplicate entry ids\n";

    std::cout << "All validation tests passed.\n";
    return 0;
}
