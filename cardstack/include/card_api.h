#pragma once
// card_api.h
// ==========================================================================
// Cardstack: Card API
// ==========================================================================
//
// A card is an immutable, typed processing unit: metadata, a port signature
// and a process function, shared as CardPtr across any number of stacks.
// Values are CardValue (nlohmann::json); process() is not checked against
// the signature. process() is const and may run concurrently as long as the
// card's own process function is reentrant.
//
// ==========================================================================

#include "port_types.h"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>

using CardValue = nlohmann::json;

// ==========================================================================
// Signature
// ==========================================================================

/// Ordered input and output ports. Compared by content.
struct CardSignature {
    std::vector<Port> inputs;
    std::vector<Port> outputs;

    bool empty() const { return inputs.empty() && outputs.empty(); }
};

bool operator==(const CardSignature& a, const CardSignature& b);
bool operator!=(const CardSignature& a, const CardSignature& b);

/// Plain value construction. Stamps PortDirection::In / Out on the ports.
CardSignature create_signature(std::vector<Port> inputs, std::vector<Port> outputs);

// ==========================================================================
// Metadata
// ==========================================================================

enum class CardCategory {
    Generators,
    Effects,
    Transforms,
    Filters,
    Routing,
    Analysis,
    Utilities,
    Custom,
};

const char* card_category_name(CardCategory category);

struct CardMeta {
    std::string              id;            ///< Unique id, e.g. "builtin.invert"
    std::string              name;          ///< Shown in menus, e.g. "Invert"
    CardCategory             category = CardCategory::Custom;
    std::vector<std::string> tags;
    std::string              description;
    std::string              author;
    int                      version = 1;
};

// ==========================================================================
// Process-time data structures
// ==========================================================================

/// Opaque per-instance state threaded through process().
struct CardState {
    CardValue value;
    int       version = 0;      ///< Incremented on every update.
};

CardState update_card_state(const CardState& state, CardValue value);

/// {"value": ..., "version": n}, or null for no state. Composite cards keep
/// their children's states in this form.
CardValue card_state_to_json(const std::optional<CardState>& state);
std::optional<CardState> card_state_from_json(const CardValue& j);

/// Timing and transport context for one process call.
struct CardContext {
    int    block_size       = 512;
    float  sample_rate      = 44100.0f;
    float  bpm              = 120.0f;
    double beat_position    = 0.0;      ///< Beat at start of this block.
    double beats_per_sample = 120.0 / 60.0 / 44100.0;
    bool   playing          = false;
};

struct CardResult {
    CardValue                output;
    std::optional<CardState> state;    ///< Set by stateful cards.
    std::vector<std::string> errors;   ///< Recoverable problems, in call order.
};

/// state is nullptr when the caller holds no state for this card.
using CardProcess = std::function<CardResult(const CardValue& input,
                                             const CardContext& ctx,
                                             const CardState* state)>;

// ==========================================================================
// Card
// ==========================================================================

class Card {
public:
    Card(CardMeta meta, CardSignature signature, CardProcess process,
         std::optional<CardState> initial_state = std::nullopt);

    const std::string&              id()            const { return meta_.id; }
    const CardMeta&                 meta()          const { return meta_; }
    const CardSignature&            signature()     const { return signature_; }
    const std::optional<CardState>& initial_state() const { return initial_state_; }

    CardResult process(const CardValue& input, const CardContext& ctx,
                       const CardState* state = nullptr) const;

private:
    CardMeta                 meta_;
    CardSignature            signature_;
    CardProcess              process_;
    std::optional<CardState> initial_state_;
};

using CardPtr = std::shared_ptr<const Card>;

// ==========================================================================
// Factories and composition
// ==========================================================================

CardPtr create_card(CardMeta meta, CardSignature signature, CardProcess process,
                    std::optional<CardValue> initial_state = std::nullopt);

using CardTransform = std::function<CardValue(const CardValue& input, const CardContext& ctx)>;

/// Stateless card: output = transform(input, ctx).
CardPtr pure_card(CardMeta meta, CardSignature signature, CardTransform transform);

struct CardStep {
    CardValue output;
    CardValue next_state;
};

using CardStepFn = std::function<CardStep(const CardValue& input, const CardContext& ctx,
                                          const CardValue& state)>;

/// Stateful card: step sees the caller's state (or initial_state) and the
/// result carries the next state with its version incremented.
CardPtr stateful_card(CardMeta meta, CardSignature signature,
                      CardValue initial_state, CardStepFn step);

/// Returns its input unchanged.
CardPtr identity_card(const std::string& id, CardSignature signature = {});

/// Serial composition: input of `first`, output of `second`, and process
/// pipes first's output into second. Port types are NOT checked here;
/// validate_stack() is the place for that.
///
/// The composed state is [first_state, second_state] (card_state_to_json
/// form). Each slice goes to its own card and the result carries both
/// updated slices, so feeding the returned state back continues both cards.
CardPtr card_compose(const CardPtr& first, const CardPtr& second);

/// Both cards on the same input; output is [first_output, second_output].
/// State is composite, as for card_compose().
CardPtr card_parallel(const CardPtr& first, const CardPtr& second);

/// Metadata and signature only; the process function is never serialized.
nlohmann::json card_to_json(const Card& card);

// ==========================================================================
// Card registry
// ==========================================================================

/// Factory function type: returns a new card instance.
using CardFactory = CardPtr(*)();

/// Registration entry, one per card id.
struct CardRegistration {
    std::string id;
    CardFactory factory = nullptr;
};

/// Resolves a card id to a card; returns nullptr when unknown.
using CardResolver = std::function<CardPtr(const std::string& card_id)>;

/// Global card registry. Cards are built lazily on first find() and the
/// same CardPtr is shared by every later lookup.
class CardRegistry {
public:
    /// Add or replace a registration.
    static void add(CardRegistration reg);

    /// Registered ids in registration order.
    static std::vector<std::string> ids();

    /// Returns nullptr if not found.
    static CardPtr find(const std::string& id);

    /// A resolver backed by find(), for graph_to_stack().
    static CardResolver resolver();
};

/// Registers every builtin card. Call once before the first registry query;
/// repeated calls are harmless.
void register_builtin_cards();
