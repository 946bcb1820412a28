// card.cpp
// Card construction, the card factories and serial composition.

#include "card_api.h"
#include "debug.h"

#include <utility>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Signature
// ---------------------------------------------------------------------------

bool operator==(const CardSignature& a, const CardSignature& b) {
    return a.inputs == b.inputs && a.outputs == b.outputs;
}

bool operator!=(const CardSignature& a, const CardSignature& b) { return !(a == b); }

CardSignature create_signature(std::vector<Port> inputs, std::vector<Port> outputs) {
    for (auto& p : inputs)  p.direction = PortDirection::In;
    for (auto& p : outputs) p.direction = PortDirection::Out;
    return CardSignature{ std::move(inputs), std::move(outputs) };
}

const char* card_category_name(CardCategory category) {
    switch (category) {
        case CardCategory::Generators: return "generators";
        case CardCategory::Effects:    return "effects";
        case CardCategory::Transforms: return "transforms";
        case CardCategory::Filters:    return "filters";
        case CardCategory::Routing:    return "routing";
        case CardCategory::Analysis:   return "analysis";
        case CardCategory::Utilities:  return "utilities";
        case CardCategory::Custom:     return "custom";
    }
    return "custom";
}

CardState update_card_state(const CardState& state, CardValue value) {
    return CardState{ std::move(value), state.version + 1 };
}

CardValue card_state_to_json(const std::optional<CardState>& state) {
    if (!state) return nullptr;
    return {{"value", state->value}, {"version", state->version}};
}

std::optional<CardState> card_state_from_json(const CardValue& j) {
    if (!j.is_object() || !j.contains("value")) return std::nullopt;
    int version = 0;
    auto it = j.find("version");
    if (it != j.end() && it->is_number_integer()) version = it->get<int>();
    return CardState{ j["value"], version };
}

// ---------------------------------------------------------------------------
// Card
// ---------------------------------------------------------------------------

Card::Card(CardMeta meta, CardSignature signature, CardProcess process,
           std::optional<CardState> initial_state)
    : meta_(std::move(meta)),
      signature_(std::move(signature)),
      process_(std::move(process)),
      initial_state_(std::move(initial_state)) {}

CardResult Card::process(const CardValue& input, const CardContext& ctx,
                         const CardState* state) const {
    if (!process_) {
        CardResult r;
        r.output = input;
        r.errors.push_back("card '" + meta_.id + "' has no process function");
        return r;
    }
    return process_(input, ctx, state);
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

CardPtr create_card(CardMeta meta, CardSignature signature, CardProcess process,
                    std::optional<CardValue> initial_state) {
    std::optional<CardState> state;
    if (initial_state) state = CardState{ std::move(*initial_state), 0 };
    return std::make_shared<const Card>(std::move(meta), std::move(signature),
                                        std::move(process), std::move(state));
}

CardPtr pure_card(CardMeta meta, CardSignature signature, CardTransform transform) {
    return create_card(std::move(meta), std::move(signature),
        [transform = std::move(transform)](const CardValue& input, const CardContext& ctx,
                                           const CardState*) {
            CardResult r;
            r.output = transform(input, ctx);
            return r;
        });
}

CardPtr stateful_card(CardMeta meta, CardSignature signature,
                      CardValue initial_state, CardStepFn step) {
    CardValue initial = initial_state;
    return create_card(std::move(meta), std::move(signature),
        [step = std::move(step), initial](const CardValue& input, const CardContext& ctx,
                                          const CardState* state) {
            const CardState current = state ? *state : CardState{ initial, 0 };
            CardStep next = step(input, ctx, current.value);
            CardResult r;
            r.output = std::move(next.output);
            r.state  = update_card_state(current, std::move(next.next_state));
            return r;
        },
        std::move(initial_state));
}

CardPtr identity_card(const std::string& id, CardSignature signature) {
    CardMeta meta;
    meta.id       = id;
    meta.name     = "Identity";
    meta.category = CardCategory::Routing;
    return create_card(std::move(meta), std::move(signature),
        [](const CardValue& input, const CardContext&, const CardState*) {
            CardResult r;
            r.output = input;
            return r;
        });
}

// ---------------------------------------------------------------------------
// Composition
// ---------------------------------------------------------------------------

namespace {

// Children's state slices of a two-card composite.
struct StatePair {
    std::optional<CardState> first;
    std::optional<CardState> second;
};

StatePair split_state(const CardState* state) {
    StatePair p;
    if (state && state->value.is_array() && state->value.size() == 2) {
        p.first  = card_state_from_json(state->value[0]);
        p.second = card_state_from_json(state->value[1]);
    }
    return p;
}

std::optional<CardState> join_state(const StatePair& p, int version) {
    if (!p.first && !p.second) return std::nullopt;
    return CardState{ CardValue::array({ card_state_to_json(p.first),
                                         card_state_to_json(p.second) }), version };
}

const CardState* state_ptr(const std::optional<CardState>& s) { return s ? &*s : nullptr; }

CardPtr make_pair_card(CardMeta meta, CardSignature signature, const CardPtr& first,
                       const CardPtr& second, CardProcess process) {
    auto initial = join_state({ first->initial_state(), second->initial_state() }, 0);
    return std::make_shared<const Card>(std::move(meta), std::move(signature),
                                        std::move(process), std::move(initial));
}

} // namespace

CardPtr card_compose(const CardPtr& first, const CardPtr& second) {
    CardMeta meta;
    meta.id       = first->id() + ">" + second->id();
    meta.name     = first->meta().name + " → " + second->meta().name;
    meta.category = CardCategory::Routing;

    auto signature = create_signature(first->signature().inputs, second->signature().outputs);

    CS_LOG("card", "compose %s", meta.id.c_str());

    return make_pair_card(std::move(meta), std::move(signature), first, second,
        [first, second](const CardValue& input, const CardContext& ctx, const CardState* state) {
            StatePair slices = split_state(state);
            CardResult a = first->process(input, ctx, state_ptr(slices.first));
            CardResult b = second->process(a.output, ctx, state_ptr(slices.second));
            if (a.state) slices.first  = std::move(a.state);
            if (b.state) slices.second = std::move(b.state);

            CardResult r;
            r.output = std::move(b.output);
            r.state  = join_state(slices, (state ? state->version : 0) + 1);
            r.errors = std::move(a.errors);
            r.errors.insert(r.errors.end(), b.errors.begin(), b.errors.end());
            return r;
        });
}

CardPtr card_parallel(const CardPtr& first, const CardPtr& second) {
    CardMeta meta;
    meta.id       = first->id() + "||" + second->id();
    meta.name     = first->meta().name + " ‖ " + second->meta().name;
    meta.category = CardCategory::Routing;

    auto outputs = first->signature().outputs;
    const auto& more = second->signature().outputs;
    outputs.insert(outputs.end(), more.begin(), more.end());
    auto signature = create_signature(first->signature().inputs, std::move(outputs));

    return make_pair_card(std::move(meta), std::move(signature), first, second,
        [first, second](const CardValue& input, const CardContext& ctx, const CardState* state) {
            StatePair slices = split_state(state);
            CardResult a = first->process(input, ctx, state_ptr(slices.first));
            CardResult b = second->process(input, ctx, state_ptr(slices.second));
            if (a.state) slices.first  = std::move(a.state);
            if (b.state) slices.second = std::move(b.state);

            CardResult r;
            r.output = CardValue::array({ std::move(a.output), std::move(b.output) });
            r.state  = join_state(slices, (state ? state->version : 0) + 1);
            r.errors = std::move(a.errors);
            r.errors.insert(r.errors.end(), b.errors.begin(), b.errors.end());
            return r;
        });
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

static json port_to_json(const Port& p) {
    json j = {
        {"name",      p.name},
        {"type",      p.type.id()},
        {"direction", port_direction_name(p.direction)},
    };
    if (p.optional)        j["optional"] = true;
    if (!p.label.empty())  j["label"]    = p.label;
    if (!p.doc.empty())    j["doc"]      = p.doc;
    return j;
}

json card_to_json(const Card& card) {
    const auto& m = card.meta();
    json inputs  = json::array();
    json outputs = json::array();
    for (auto& p : card.signature().inputs)  inputs.push_back(port_to_json(p));
    for (auto& p : card.signature().outputs) outputs.push_back(port_to_json(p));

    json j = {
        {"id",        m.id},
        {"name",      m.name},
        {"category",  card_category_name(m.category)},
        {"version",   m.version},
        {"signature", {{"inputs", inputs}, {"outputs", outputs}}},
    };
    if (!m.tags.empty())        j["tags"]        = m.tags;
    if (!m.description.empty()) j["description"] = m.description;
    if (!m.author.empty())      j["author"]      = m.author;
    if (card.initial_state())   j["stateful"]    = true;
    return j;
}
