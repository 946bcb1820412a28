// port_types.cpp
// Port vocabulary, compatibility matrix and the port type registry.

#include "port_types.h"
#include "debug.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <tuple>
#include <utility>

// ---------------------------------------------------------------------------
// Vocabulary
// ---------------------------------------------------------------------------

static const char* const CANONICAL_TYPES[] = {
    port_types::AUDIO,   port_types::MIDI,  port_types::NOTES, port_types::CONTROL,
    port_types::TRIGGER, port_types::GATE,  port_types::CLOCK, port_types::TRANSPORT,
};

bool is_canonical_port_type(const std::string& type) {
    for (const char* t : CANONICAL_TYPES)
        if (type == t) return true;
    return false;
}

bool is_namespaced_port_type(const std::string& type) {
    auto colon = type.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= type.size())
        return false;
    if (type.find(':', colon + 1) != std::string::npos)
        return false;
    return std::none_of(type.begin(), type.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; });
}

bool PortType::is_canonical() const  { return is_canonical_port_type(id_); }
bool PortType::is_namespaced() const { return is_namespaced_port_type(id_); }

// ---------------------------------------------------------------------------
// Ports
// ---------------------------------------------------------------------------

const char* port_direction_name(PortDirection dir) {
    switch (dir) {
        case PortDirection::In:  return "in";
        case PortDirection::Out: return "out";
    }
    return "in";
}

bool operator==(const Port& a, const Port& b) {
    return a.name == b.name && a.type == b.type
        && a.direction == b.direction && a.optional == b.optional;
}

bool operator!=(const Port& a, const Port& b) { return !(a == b); }

Port create_port(const std::string& name, const PortType& type, PortDirection direction) {
    Port p;
    p.name      = name;
    p.type      = type;
    p.direction = direction;
    return p;
}

// ---------------------------------------------------------------------------
// Registry storage
// ---------------------------------------------------------------------------

namespace {

struct AdapterKey {
    std::string from;
    std::string to;
    bool operator<(const AdapterKey& o) const {
        return std::tie(from, to) < std::tie(o.from, o.to);
    }
};

struct CanonicalAdapter {
    const char* from;
    const char* to;
    const char* name;
};

// The fixed cross-type allow-list. Extensions cannot add to it.
const CanonicalAdapter CANONICAL_ADAPTERS[] = {
    { port_types::NOTES,     port_types::MIDI,      "notes-to-midi"      },
    { port_types::TRIGGER,   port_types::GATE,      "trigger-to-gate"    },
    { port_types::GATE,      port_types::TRIGGER,   "gate-to-trigger"    },
    { port_types::CLOCK,     port_types::TRANSPORT, "clock-to-transport" },
    { port_types::TRANSPORT, port_types::CLOCK,     "transport-to-clock" },
};

struct RegistryState {
    std::mutex                               mutex;
    std::map<std::string, PortTypeInfo>      types;
    std::map<AdapterKey, std::string>        adapters;
};

RegistryState& registry() {
    static RegistryState state;
    static const bool seeded = [] {
        const PortTypeInfo builtin[] = {
            { port_types::AUDIO,     "Audio",     "Audio signal",         "#4CAF50", "waveform"  },
            { port_types::MIDI,      "MIDI",      "MIDI data",            "#2196F3", "midi"      },
            { port_types::NOTES,     "Notes",     "Symbolic note events", "#9C27B0", "notes"     },
            { port_types::CONTROL,   "Control",   "Control signal",       "#FF9800", "knob"      },
            { port_types::TRIGGER,   "Trigger",   "Trigger signal",       "#F44336", "bolt"      },
            { port_types::GATE,      "Gate",      "Gate signal",          "#E53935", "gate"      },
            { port_types::CLOCK,     "Clock",     "Clock signal",         "#00ACC1", "clock"     },
            { port_types::TRANSPORT, "Transport", "Transport control",    "#039BE5", "transport" },
        };
        for (const auto& info : builtin) state.types[info.type] = info;
        return true;
    }();
    (void)seeded;
    return state;
}

const char* find_canonical_adapter(const std::string& from, const std::string& to) {
    for (const auto& a : CANONICAL_ADAPTERS)
        if (from == a.from && to == a.to) return a.name;
    return nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// PortTypeRegistry
// ---------------------------------------------------------------------------

std::string PortTypeRegistry::register_port_type(const PortTypeInfo& info) {
    if (!is_canonical_port_type(info.type) && !is_namespaced_port_type(info.type)) {
        CS_LOG("ports", "rejected port type '%s'", info.type.c_str());
        return "Custom port type '" + info.type
             + "' must use a namespaced id (e.g. 'my-pack:" + info.type + "')";
    }
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.types[info.type] = info;
    return {};
}

std::optional<PortTypeInfo> PortTypeRegistry::find(const std::string& type) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.types.find(type);
    if (it == r.types.end()) return std::nullopt;
    return it->second;
}

std::vector<PortTypeInfo> PortTypeRegistry::all() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    std::vector<PortTypeInfo> out;
    out.reserve(r.types.size());
    for (const char* t : CANONICAL_TYPES) {
        auto it = r.types.find(t);
        if (it != r.types.end()) out.push_back(it->second);
    }
    for (auto& [id, info] : r.types)
        if (!is_canonical_port_type(id)) out.push_back(info);
    return out;
}

std::string PortTypeRegistry::register_adapter(const PortType& from, const PortType& to,
                                               const std::string& adapter_name) {
    if (!from.is_valid() || !to.is_valid())
        return "Adapter endpoints must be canonical or namespaced port types";
    if (!from.is_namespaced() && !to.is_namespaced())
        return "Adapters between canonical types are fixed; '" + from.id()
             + "' -> '" + to.id() + "' cannot be registered";
    if (from == to)
        return "A port type is already compatible with itself";
    if (adapter_name.empty())
        return "Adapter name must not be empty";

    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto [it, inserted] = r.adapters.emplace(AdapterKey{from.id(), to.id()}, adapter_name);
    if (!inserted && it->second != adapter_name)
        return "Adapter '" + it->second + "' is already registered for '"
             + from.id() + "' -> '" + to.id() + "'";
    CS_LOG("ports", "adapter %s: %s -> %s", adapter_name.c_str(),
           from.id().c_str(), to.id().c_str());
    return {};
}

std::optional<std::string> PortTypeRegistry::find_adapter(const PortType& from, const PortType& to) {
    if (const char* name = find_canonical_adapter(from.id(), to.id()))
        return std::string(name);
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.adapters.find(AdapterKey{from.id(), to.id()});
    if (it == r.adapters.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Compatibility
// ---------------------------------------------------------------------------

std::optional<PortCompatibility> get_port_compatibility(const PortType& from, const PortType& to) {
    if (!from.is_valid() || !to.is_valid()) return std::nullopt;
    if (from == to) return PortCompatibility{};

    auto adapter = PortTypeRegistry::find_adapter(from, to);
    if (!adapter) return std::nullopt;
    return PortCompatibility{ true, *adapter };
}

bool can_connect(const PortType& from_type, PortDirection from_dir,
                 const PortType& to_type,   PortDirection to_dir) {
    if (from_dir != PortDirection::Out || to_dir != PortDirection::In)
        return false;
    return get_port_compatibility(from_type, to_type).has_value();
}
