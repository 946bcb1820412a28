// clock_divider_card.cpp
// Divides a clock by two: passes every other tick.
//
// Input is an array of tick beats for this block. The tick counter lives in
// the card state so division stays phase-correct across blocks.

#include "card_api.h"

CardPtr make_clock_divider_card() {
    CardMeta m;
    m.id          = "builtin.clock_divider";
    m.name        = "Clock Divider";
    m.category    = CardCategory::Utilities;
    m.tags        = { "clock", "tempo" };
    m.description = "Emits every second clock tick.";
    m.author      = "builtin";

    auto sig = create_signature(
        { create_port("clock_in",  port_types::CLOCK) },
        { create_port("clock_out", port_types::CLOCK) });

    return stateful_card(std::move(m), std::move(sig), CardValue{{"count", 0}},
        [](const CardValue& input, const CardContext&, const CardValue& state) {
            long long count = state.value("count", 0LL);
            CardValue out = CardValue::array();
            if (input.is_array()) {
                for (auto& tick : input) {
                    if (count % 2 == 0) out.push_back(tick);
                    ++count;
                }
            }
            return CardStep{ out, CardValue{{"count", count}} };
        });
}
