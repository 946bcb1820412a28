// card_registry.cpp
// Implements the global card registry singleton.

#include "card_api.h"
#include "debug.h"

#include <mutex>
#include <unordered_map>

// ---------------------------------------------------------------------------
// Registry singleton
// ---------------------------------------------------------------------------

namespace {

struct RegistryState {
    std::mutex                                mutex;
    std::vector<CardRegistration>             entries;
    // Cards built on first access; shared by every later lookup.
    std::unordered_map<std::string, CardPtr>  cache;
};

RegistryState& registry_state() {
    static RegistryState state;
    return state;
}

} // namespace

void CardRegistry::add(CardRegistration reg) {
    auto& r = registry_state();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.cache.erase(reg.id);
    for (auto& e : r.entries) {
        if (e.id == reg.id) {
            e = std::move(reg);
            return;
        }
    }
    CS_LOG("registry", "card %s", reg.id.c_str());
    r.entries.push_back(std::move(reg));
}

std::vector<std::string> CardRegistry::ids() {
    auto& r = registry_state();
    std::lock_guard<std::mutex> lock(r.mutex);
    std::vector<std::string> out;
    out.reserve(r.entries.size());
    for (auto& e : r.entries) out.push_back(e.id);
    return out;
}

CardPtr CardRegistry::find(const std::string& id) {
    auto& r = registry_state();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.cache.find(id);
    if (it != r.cache.end()) return it->second;

    // Build on first access
    for (auto& e : r.entries) {
        if (e.id != id || !e.factory) continue;
        CardPtr card = e.factory();
        CS_WARN(card, "registry", "factory for %s returned no card", id.c_str());
        if (!card) return nullptr;
        r.cache.emplace(id, card);
        return card;
    }
    return nullptr;
}

CardResolver CardRegistry::resolver() {
    return [](const std::string& card_id) { return CardRegistry::find(card_id); };
}
