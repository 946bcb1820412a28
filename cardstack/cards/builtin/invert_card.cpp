// invert_card.cpp
// Polarity inverter: negates every sample of an audio block.
//
// Input is either a single sample (number) or a block (array of numbers).
// Anything else is passed through and reported in CardResult::errors.

#include "card_api.h"

CardPtr make_invert_card() {
    CardMeta m;
    m.id          = "builtin.invert";
    m.name        = "Invert";
    m.category    = CardCategory::Effects;
    m.tags        = { "polarity", "phase" };
    m.description = "Inverts the polarity of an audio block.";
    m.author      = "builtin";

    auto sig = create_signature(
        { create_port("in",  port_types::AUDIO) },
        { create_port("out", port_types::AUDIO) });

    return create_card(std::move(m), std::move(sig),
        [](const CardValue& input, const CardContext&, const CardState*) {
            CardResult r;
            if (input.is_number()) {
                r.output = -input.get<double>();
                return r;
            }
            if (input.is_array()) {
                r.output = CardValue::array();
                for (auto& s : input) {
                    if (s.is_number()) {
                        r.output.push_back(-s.get<double>());
                    } else {
                        r.output.push_back(s);
                        r.errors.push_back("invert: non-numeric sample left untouched");
                    }
                }
                return r;
            }
            r.output = input;
            r.errors.push_back("invert: expected a sample or an array of samples");
            return r;
        });
}
