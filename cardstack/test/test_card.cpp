// test/test_card.cpp
// Card construction, the pure/stateful factories, serial composition and
// card_to_json. No stacks involved.

#include "card_api.h"
#include "test_helpers.h"
#include "nlohmann/json.hpp"

#include <iostream>
#include <cassert>

using json = nlohmann::json;

int main() {
    std::cout << "=== test_card ===\n";
    CardContext ctx;

    // --- Signature ---
    auto sig = create_signature({ create_port("in", port_types::AUDIO, PortDirection::Out) },
                                { create_port("out", port_types::AUDIO) });
    assert(sig.inputs.front().direction == PortDirection::In);
    assert(sig.outputs.front().direction == PortDirection::Out);
    assert(sig == create_signature({ create_port("in", port_types::AUDIO) },
                                   { create_port("out", port_types::AUDIO) }));
    assert(sig != create_signature({ create_port("in", port_types::MIDI) },
                                   { create_port("out", port_types::AUDIO) }));
    assert(CardSignature{}.empty());
    std::cout << "PASS: create_signature stamps directions\n";

    // --- Pure card ---
    auto dbl = make_double_card();
    CardResult r = dbl->process(5.0, ctx);
    assert(r.output.get<double>() == 10.0);
    assert(!r.state);
    assert(r.errors.empty());
    assert(!dbl->initial_state());
    std::cout << "PASS: pure card\n";

    // --- Missing process function ---
    CardMeta empty_meta;
    empty_meta.id = "empty";
    auto broken = create_card(empty_meta, {}, nullptr);
    r = broken->process(json{1, 2}, ctx);
    assert(r.output == json({1, 2}));
    assert(r.errors.size() == 1);
    std::cout << "PASS: card without process passes input through with an error\n";

    // --- Stateful card ---
    CardMeta acc_meta;
    acc_meta.id = "accumulate";
    auto acc = stateful_card(acc_meta, {}, json(0),
        [](const CardValue& in, const CardContext&, const CardValue& state) {
            double sum = state.get<double>() + in.get<double>();
            return CardStep{ sum, sum };
        });
    assert(acc->initial_state());
    assert(acc->initial_state()->value == json(0));
    assert(acc->initial_state()->version == 0);

    r = acc->process(3.0, ctx);                       // no state: starts from initial
    assert(r.output.get<double>() == 3.0);
    assert(r.state && r.state->version == 1);
    CardState s1 = *r.state;
    r = acc->process(4.0, ctx, &s1);
    assert(r.output.get<double>() == 7.0);
    assert(r.state->version == 2);
    // The card itself is unchanged: the same call gives the same answer.
    r = acc->process(4.0, ctx, &s1);
    assert(r.output.get<double>() == 7.0);
    std::cout << "PASS: stateful card threads state\n";

    CardState st{ json("a"), 4 };
    CardState st2 = update_card_state(st, json("b"));
    assert(st2.value == json("b") && st2.version == 5);
    assert(st.value == json("a"));
    std::cout << "PASS: update_card_state\n";

    // --- Identity ---
    auto id = identity_card("ident", sig);
    r = id->process(json{{"k", 1}}, ctx);
    assert(r.output == json({{"k", 1}}));
    assert(id->signature() == sig);
    std::cout << "PASS: identity card\n";

    // --- Compose ---
    auto inc = make_increment_card();
    auto composed = card_compose(dbl, inc);
    assert(composed->id() == "double>increment");
    assert(composed->signature().inputs  == dbl->signature().inputs);
    assert(composed->signature().outputs == inc->signature().outputs);
    assert(composed->process(5.0, ctx).output.get<double>() == 11.0);
    assert(card_compose(inc, dbl)->process(5.0, ctx).output.get<double>() == 12.0);

    // Errors from both sides are kept, first card's first.
    CardMeta bad_meta;
    bad_meta.id = "bad";
    auto bad = create_card(bad_meta, {},
        [](const CardValue& in, const CardContext&, const CardState*) {
            CardResult br;
            br.output = in;
            br.errors.push_back("bad");
            return br;
        });
    r = card_compose(bad, card_compose(dbl, bad))->process(1.0, ctx);
    assert(r.output.get<double>() == 2.0);
    assert(r.errors.size() == 2);

    assert(!composed->initial_state());
    assert(!composed->process(5.0, ctx).state);
    std::cout << "PASS: card_compose\n";

    // --- Composite state ---
    // Each side keeps its own slice; feeding the state back continues both.
    auto acc_then_dbl = card_compose(acc, dbl);
    assert(acc_then_dbl->initial_state());
    assert(acc_then_dbl->initial_state()->value.size() == 2);
    assert(acc_then_dbl->initial_state()->value[1].is_null());
    r = acc_then_dbl->process(2.0, ctx);
    assert(r.output.get<double>() == 4.0);           // (0 + 2) * 2
    assert(r.state && r.state->version == 1);
    CardState composite = *r.state;
    r = acc_then_dbl->process(3.0, ctx, &composite);
    assert(r.output.get<double>() == 10.0);          // (2 + 3) * 2
    assert(card_state_from_json(r.state->value[0])->value.get<double>() == 5.0);

    auto dbl_then_acc = card_compose(dbl, acc);
    r = dbl_then_acc->process(2.0, ctx);
    assert(r.output.get<double>() == 4.0);
    composite = *r.state;
    r = dbl_then_acc->process(3.0, ctx, &composite);
    assert(r.output.get<double>() == 10.0);          // 4 + 3 * 2
    assert(r.state->value[0].is_null());

    // Two stateful cards never swap slices.
    auto acc_twice = card_compose(acc, acc);
    r = acc_twice->process(1.0, ctx);                // 1, then 0 + 1
    composite = *r.state;
    r = acc_twice->process(1.0, ctx, &composite);    // 1 + 1 = 2, then 1 + 2 = 3
    assert(r.output.get<double>() == 3.0);
    assert(card_state_from_json(r.state->value[0])->value.get<double>() == 2.0);
    assert(card_state_from_json(r.state->value[1])->value.get<double>() == 3.0);

    // A nested composite keeps the inner pair in the first slot.
    auto chain = card_compose(card_compose(acc, dbl), acc);
    r = chain->process(1.0, ctx);                    // acc 1, dbl 2, acc 2
    composite = *r.state;
    r = chain->process(1.0, ctx, &composite);        // acc 2, dbl 4, acc 6
    assert(r.output.get<double>() == 6.0);

    assert(!card_state_from_json(json(nullptr)));
    assert(!card_state_from_json(json{{"version", 2}}));
    assert(card_state_from_json(card_state_to_json(CardState{ json("x"), 4 }))->version == 4);
    std::cout << "PASS: composite state round-trips through process\n";

    // --- Parallel ---
    auto both = card_parallel(dbl, acc);
    assert(both->id() == "double||accumulate");
    assert(both->signature().outputs.size() == 1);   // acc declares no ports
    r = both->process(3.0, ctx);
    assert(r.output == json::array({ 6.0, 3.0 }));
    composite = *r.state;
    r = both->process(3.0, ctx, &composite);
    assert(r.output == json::array({ 6.0, 6.0 }));
    assert(card_parallel(dbl, inc)->process(1.0, ctx).output == json::array({ 2.0, 2.0 }));
    std::cout << "PASS: card_parallel\n";

    // --- JSON ---
    CardMeta m;
    m.id          = "tagged";
    m.name        = "Tagged";
    m.category    = CardCategory::Effects;
    m.tags        = { "a", "b" };
    m.description = "desc";
    auto tagged = pure_card(m, sig, [](const CardValue& in, const CardContext&) { return in; });
    json j = card_to_json(*tagged);
    assert(j["id"] == "tagged");
    assert(j["category"] == "effects");
    assert(j["tags"] == json({"a", "b"}));
    assert(j["description"] == "desc");
    assert(!j.contains("author"));
    assert(!j.contains("stateful"));
    assert(j["signature"]["inputs"][0]["type"] == "audio");
    assert(j["signature"]["inputs"][0]["direction"] == "in");
    assert(j["signature"]["outputs"][0]["direction"] == "out");
    assert(card_to_json(*acc)["stateful"] == true);
    std::cout << "PASS: card_to_json\n";

    assert(std::string(card_category_name(CardCategory::Routing)) == "routing");

    std::cout << "All card tests passed.\n";
    return 0;
}
