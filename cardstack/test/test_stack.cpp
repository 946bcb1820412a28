// test/test_stack.cpp
// Stack construction, signature inference per mode, the structural and
// control operations, and the active-entry rule.

#include "stack.h"
#include "test_helpers.h"

#include <iostream>
#include <cmath>
#include <cassert>

// The signature must always match a fresh inference over the same entries.
static void check_signature(const Stack& s) {
    assert(s.signature() == infer_stack_ports(s.entries(), s.mode()));
}

static std::vector<std::string> ids_of(const Stack& s) {
    std::vector<std::string> out;
    for (auto& e : s.entries()) out.push_back(e->id);
    return out;
}

int main() {
    std::cout << "=== test_stack ===\n";
    SequentialIdGenerator ids;

    auto a = make_shape_card("a", { create_port("a_in", port_types::AUDIO) },
                                  { create_port("a_out", port_types::AUDIO) });
    auto b = make_shape_card("b", { create_port("b_in", port_types::AUDIO),
                                    create_port("b_side", port_types::CONTROL) },
                                  { create_port("b_out", port_types::MIDI) });
    auto c = make_shape_card("c", { create_port("c_in", port_types::MIDI) },
                                  { create_port("c_out", port_types::NOTES) });

    // --- Mode names ---
    for (StackMode m : { StackMode::Serial, StackMode::Parallel, StackMode::Layer, StackMode::Tabs })
        assert(parse_stack_mode(stack_mode_name(m)) == m);
    assert(!parse_stack_mode("stacked"));
    std::cout << "PASS: mode names\n";

    // --- Construction ---
    Stack s = create_stack({ a, b, c }, StackMode::Serial, ids, { "Chain", "", std::nullopt });
    assert(s.size() == 3);
    assert(s.id().rfind("stack-", 0) == 0);
    assert(s.meta().name == "Chain");
    for (auto& e : s.entries()) {
        assert(e->id.rfind("entry-", 0) == 0);
        assert(!e->bypassed && !e->solo && e->mix == 1.0f);
    }
    assert(s.entries()[1]->card == b);
    assert(s.find_entry(s.entries()[2]->id)->card == c);
    assert(s.index_of(s.entries()[2]->id) == 2);
    assert(!s.find_entry("nope") && s.index_of("nope") == -1);
    std::cout << "PASS: create_stack\n";

    // --- Inference per mode ---
    const auto& sig = s.signature();
    assert(sig.inputs.size() == 1 && sig.inputs[0].name == "a_in");
    assert(sig.outputs.size() == 1 && sig.outputs[0].name == "c_out");

    Stack par = stack_set_mode(s, StackMode::Parallel);
    assert(par.signature().inputs.size() == 1 && par.signature().inputs[0].name == "a_in");
    assert(par.signature().outputs.size() == 3);
    assert(par.signature().outputs[1].name == "b_out");
    assert(stack_set_mode(s, StackMode::Layer).signature() == par.signature());

    Stack tabs = stack_set_mode(s, StackMode::Tabs);
    assert(tabs.signature().inputs.size() == 4);
    assert(tabs.signature().inputs[2].name == "b_side");
    assert(tabs.signature().outputs.size() == 3);

    for (StackMode m : { StackMode::Serial, StackMode::Parallel, StackMode::Layer, StackMode::Tabs })
        assert(create_stack({}, m, ids).signature().empty());
    std::cout << "PASS: signature inference\n";

    // --- Structural ops keep the signature derived ---
    Stack ins = stack_insert_card(s, c, 0, ids);
    check_signature(ins);
    assert(ins.size() == 4 && ins.entries()[0]->card == c);
    assert(ins.signature().inputs[0].name == "c_in");
    assert(ins.entries()[1] == s.entries()[0]);            // untouched entries are shared

    Stack ins_end = stack_insert_card(s, a, 99, ids);
    check_signature(ins_end);
    assert(ins_end.entries().back()->card == a);
    assert(stack_insert_card(s, a, -5, ids).entries().front()->card == a);

    Stack rem = stack_remove_card(s, s.entries()[2]->id);
    check_signature(rem);
    assert(rem.size() == 2 && rem.signature().outputs[0].name == "b_out");
    assert(stack_remove_card(s, "nope").size() == 3);

    Stack reo = stack_reorder_cards(s, 2, 0);
    check_signature(reo);
    assert(reo.entries()[0] == s.entries()[2]);
    assert(reo.entries()[1] == s.entries()[0]);
    assert(reo.signature().inputs[0].name == "c_in");
    assert(ids_of(stack_reorder_cards(s, 0, 7)) == ids_of(s));
    assert(ids_of(stack_reorder_cards(s, -1, 1)) == ids_of(s));

    Stack moded = stack_set_mode(reo, StackMode::Tabs);
    check_signature(moded);
    assert(moded.id() == s.id());

    // Input stack is never modified.
    assert(s.size() == 3 && s.signature().outputs[0].name == "c_out");
    std::cout << "PASS: structural operations\n";

    // --- Bypass toggle ---
    const std::string e0 = s.entries()[0]->id;
    const std::string e1 = s.entries()[1]->id;
    const std::string e2 = s.entries()[2]->id;

    Stack byp = stack_bypass_card(s, e1);
    assert(byp.find_entry(e1)->bypassed);
    assert(!s.find_entry(e1)->bypassed);
    assert(byp.entries()[0] == s.entries()[0]);
    Stack byp2 = stack_bypass_card(byp, e1);
    assert(!byp2.find_entry(e1)->bypassed);
    assert(ids_of(stack_bypass_card(s, "nope")) == ids_of(s));
    std::cout << "PASS: bypass is a self-inverse toggle\n";

    // --- Active entries ---
    assert(get_active_entries(s).size() == 3);
    auto active = get_active_entries(byp);
    assert(active.size() == 2 && active[0]->id == e0 && active[1]->id == e2);

    Stack solo = stack_solo_card(s, e1);
    active = get_active_entries(solo);
    assert(active.size() == 1 && active[0]->id == e1);

    // Solo and bypassed: excluded, and the solo still silences everyone else.
    Stack solo_byp = stack_bypass_card(solo, e1);
    assert(get_active_entries(solo_byp).empty());

    Stack two_solo = stack_solo_card(solo, e2);
    active = get_active_entries(two_solo);
    assert(active.size() == 2 && active[0]->id == e1 && active[1]->id == e2);
    assert(get_active_entries(stack_solo_card(solo, e1)).size() == 3);
    std::cout << "PASS: bypass/solo resolution\n";

    // --- Mix ---
    assert(stack_set_mix(s, e0, 0.25f).find_entry(e0)->mix == 0.25f);
    assert(stack_set_mix(s, e0, 3.0f).find_entry(e0)->mix == 1.0f);
    assert(stack_set_mix(s, e0, -1.0f).find_entry(e0)->mix == 0.0f);
    Stack half = stack_set_mix(s, e0, 0.5f);
    assert(stack_set_mix(half, e0, std::nanf("")).find_entry(e0)->mix == 0.5f);
    assert(stack_set_mix(half, e0, INFINITY).find_entry(e0)->mix == 0.5f);
    assert(stack_set_mix(half, e0, -INFINITY).find_entry(e0)->mix == 0.5f);
    std::cout << "PASS: mix is clamped to [0, 1]\n";

    // --- Entry state ---
    CardMeta cm;
    cm.id = "counter";
    auto counter = stateful_card(cm, {}, CardValue(0),
        [](const CardValue& in, const CardContext&, const CardValue& st) {
            return CardStep{ in, st.get<int>() + 1 };
        });
    Stack st = create_stack({ counter, counter }, StackMode::Serial, ids);
    assert(st.entries()[0]->state && st.entries()[0]->state->value == CardValue(0));
    const std::string c0 = st.entries()[0]->id;
    Stack st2 = stack_set_entry_state(st, c0, CardState{ CardValue(7), 3 });
    assert(st2.find_entry(c0)->state->value == CardValue(7));
    assert(st2.entries()[1]->state->value == CardValue(0));   // same card, separate state
    assert(st.find_entry(c0)->state->value == CardValue(0));
    std::cout << "PASS: entry state is per entry\n";

    // --- Tab selection ---
    Stack sel = stack_select_tab(tabs, tabs.entries()[1]->id);
    assert(sel.meta().selected_tab == tabs.entries()[1]->id);
    check_signature(sel);
    Stack sel_removed = stack_remove_card(sel, tabs.entries()[1]->id);
    assert(!sel_removed.meta().selected_tab);
    assert(!stack_select_tab(sel, std::nullopt).meta().selected_tab);
    std::cout << "PASS: tab selection\n";

    // --- Ids ---
    SequentialIdGenerator seq;
    assert(seq.next("entry") == "entry-1");
    assert(seq.next("stack") == "stack-2");
    RandomIdGenerator r1(42), r2(42);
    std::string id1 = r1.next("entry");
    assert(id1 == r2.next("entry"));
    assert(id1.size() == std::string("entry-").size() + 16);
    assert(r1.next("entry") != id1);
    std::cout << "PASS: id generators\n";

    std::cout << "All stack tests passed.\n";
    return 0;
}
