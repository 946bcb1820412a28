// note_to_midi_card.cpp
// Renders symbolic notes to MIDI events. This is the card behind the
// "notes-to-midi" adapter.
//
// Each note {"pitch", "velocity", "start", "duration", "channel"} becomes a
// note-on at start and a note-off at start + duration. Events are
// {"beat", "status", "data1", "data2"}, sorted by beat with note-offs ahead
// of note-ons on the same beat (same priority as the engine's scheduler).

#include "card_api.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace {

struct MidiEventOut {
    double  beat;
    uint8_t status;
    uint8_t data1;
    uint8_t data2;
};

} // namespace

CardPtr make_note_to_midi_card() {
    CardMeta m;
    m.id          = "builtin.note_to_midi";
    m.name        = "Notes to MIDI";
    m.category    = CardCategory::Routing;
    m.tags        = { "adapter", "midi" };
    m.description = "Converts note events into MIDI note-on/note-off messages.";
    m.author      = "builtin";

    auto sig = create_signature(
        { create_port("notes_in", port_types::NOTES) },
        { create_port("midi_out", port_types::MIDI) });

    return create_card(std::move(m), std::move(sig),
        [](const CardValue& input, const CardContext&, const CardState*) {
            CardResult r;
            r.output = CardValue::array();
            if (!input.is_array()) {
                r.errors.push_back("note_to_midi: expected an array of notes");
                return r;
            }

            std::vector<MidiEventOut> events;
            for (auto& note : input) {
                if (!note.is_object() || !note.contains("pitch") || !note["pitch"].is_number()) {
                    r.errors.push_back("note_to_midi: skipped a note without pitch");
                    continue;
                }
                int    pitch    = std::clamp(note["pitch"].get<int>(), 0, 127);
                int    velocity = std::clamp(note.value("velocity", 100), 1, 127);
                int    channel  = std::clamp(note.value("channel", 0), 0, 15);
                double start    = note.value("start", 0.0);
                double duration = std::max(0.0, note.value("duration", 1.0));

                events.push_back({ start, static_cast<uint8_t>(0x90 | channel),
                                   static_cast<uint8_t>(pitch), static_cast<uint8_t>(velocity) });
                events.push_back({ start + duration, static_cast<uint8_t>(0x80 | channel),
                                   static_cast<uint8_t>(pitch), 0 });
            }

            std::stable_sort(events.begin(), events.end(),
                [](const MidiEventOut& a, const MidiEventOut& b) {
                    if (a.beat != b.beat) return a.beat < b.beat;
                    return (a.status & 0xF0) < (b.status & 0xF0);   // off (0x80) < on (0x90)
                });

            for (auto& e : events) {
                r.output.push_back({
                    {"beat", e.beat}, {"status", e.status},
                    {"data1", e.data1}, {"data2", e.data2},
                });
            }
            return r;
        });
}
