// thru_card.cpp
// Audio pass-through. Useful as a placeholder slot in a stack.

#include "card_api.h"

CardPtr make_thru_card() {
    CardMeta m;
    m.id          = "builtin.thru";
    m.name        = "Thru";
    m.category    = CardCategory::Utilities;
    m.description = "Passes audio through unchanged.";
    m.author      = "builtin";

    auto sig = create_signature(
        { create_port("in",  port_types::AUDIO) },
        { create_port("out", port_types::AUDIO) });

    return pure_card(std::move(m), std::move(sig),
        [](const CardValue& input, const CardContext&) { return input; });
}
