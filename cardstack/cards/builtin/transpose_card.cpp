// transpose_card.cpp
// Shifts the pitch of symbolic notes.
//
// Notes are objects {"pitch", "velocity", "start", "duration", "channel"};
// only "pitch" is touched. Results are clamped to the MIDI range 0..127.

#include "card_api.h"

#include <algorithm>
#include <string>

static CardPtr make_transpose_card(int semitones, const std::string& id, const std::string& name) {
    CardMeta m;
    m.id          = id;
    m.name        = name;
    m.category    = CardCategory::Transforms;
    m.tags        = { "pitch" };
    m.description = "Transposes notes by " + std::to_string(semitones) + " semitones.";
    m.author      = "builtin";

    auto sig = create_signature(
        { create_port("notes_in",  port_types::NOTES) },
        { create_port("notes_out", port_types::NOTES) });

    return create_card(std::move(m), std::move(sig),
        [semitones](const CardValue& input, const CardContext&, const CardState*) {
            CardResult r;
            if (!input.is_array()) {
                r.output = input;
                r.errors.push_back("transpose: expected an array of notes");
                return r;
            }
            r.output = input;
            for (auto& note : r.output) {
                if (!note.is_object() || !note.contains("pitch") || !note["pitch"].is_number()) continue;
                int pitch = note["pitch"].get<int>() + semitones;
                note["pitch"] = std::clamp(pitch, 0, 127);
            }
            return r;
        });
}

CardPtr make_octave_up_card() {
    return make_transpose_card(12, "builtin.octave_up", "Octave Up");
}
