#pragma once
// port_types.h
// Port type vocabulary: canonical signal kinds, namespaced extension kinds,
// the compatibility matrix and the port type / adapter registry.
//
// A port type is identified by a string. Canonical kinds are the eight
// lower-case names in port_types:: below. Extension kinds use a namespaced
// id, "vendor:kind". Legacy un-namespaced ids ("number", "any", ...) are not
// part of the vocabulary and are compatible with nothing.
//
// Connections always run from an output port to an input port.

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace port_types {

constexpr const char* AUDIO     = "audio";
constexpr const char* MIDI      = "midi";
constexpr const char* NOTES     = "notes";
constexpr const char* CONTROL   = "control";
constexpr const char* TRIGGER   = "trigger";
constexpr const char* GATE      = "gate";
constexpr const char* CLOCK     = "clock";
constexpr const char* TRANSPORT = "transport";

} // namespace port_types

/// An immutable port type id. Implicitly constructible from a string so
/// ports can be written as create_port("in", port_types::AUDIO).
class PortType {
public:
    PortType() = default;
    PortType(std::string id) : id_(std::move(id)) {}
    PortType(const char* id) : id_(id) {}

    const std::string& id() const { return id_; }

    bool is_canonical()  const;
    bool is_namespaced() const;
    bool is_valid()      const { return is_canonical() || is_namespaced(); }

    bool operator==(const PortType& o) const { return id_ == o.id_; }
    bool operator!=(const PortType& o) const { return id_ != o.id_; }

private:
    std::string id_;
};

bool is_canonical_port_type(const std::string& type);

/// True for "namespace:name" with both parts non-empty, exactly one colon
/// and no whitespace.
bool is_namespaced_port_type(const std::string& type);

// ---------------------------------------------------------------------------
// Ports
// ---------------------------------------------------------------------------

enum class PortDirection {
    In,
    Out,
};

const char* port_direction_name(PortDirection dir);

struct Port {
    std::string   name;
    PortType      type;
    PortDirection direction = PortDirection::In;
    bool          optional  = false;
    std::string   label;        ///< Human-readable label (may be empty).
    std::string   doc;          ///< Tooltip / help text (may be empty).
};

// Label and doc are presentation only and do not take part in comparison.
bool operator==(const Port& a, const Port& b);
bool operator!=(const Port& a, const Port& b);

Port create_port(const std::string& name, const PortType& type,
                 PortDirection direction = PortDirection::In);

// ---------------------------------------------------------------------------
// Compatibility
// ---------------------------------------------------------------------------

struct PortCompatibility {
    bool        requires_adapter = false;
    std::string adapter_name;   ///< Empty when no adapter is needed.
};

/// nullopt when a value of type `from` can never reach a port of type `to`.
/// Identical types need no adapter; the fixed canonical pairs
/// (notes→midi, trigger↔gate, clock↔transport) and extension-registered
/// pairs need the named adapter; everything else is incompatible.
std::optional<PortCompatibility> get_port_compatibility(const PortType& from, const PortType& to);

/// Type compatibility plus connector polarity: only out→in is allowed.
bool can_connect(const PortType& from_type, PortDirection from_dir,
                 const PortType& to_type,   PortDirection to_dir);

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

/// Display metadata for a port type.
struct PortTypeInfo {
    std::string type;
    std::string display_name;
    std::string description;
    std::string color;          ///< UI colour, "#RRGGBB".
    std::string icon;           ///< UI icon identifier.
};

/// Process-wide registry of port type metadata and extension adapters.
/// The canonical kinds are pre-registered. All members are thread-safe.
class PortTypeRegistry {
public:
    /// Register or replace metadata for a port type. Non-canonical types must
    /// be namespaced. Returns an error string, empty on success.
    static std::string register_port_type(const PortTypeInfo& info);

    static std::optional<PortTypeInfo> find(const std::string& type);

    /// Canonical kinds first (vocabulary order), then extensions by id.
    static std::vector<PortTypeInfo> all();

    /// Register a named adapter for an extension pair. At least one side must
    /// be namespaced; the canonical matrix is fixed. Returns an error string,
    /// empty on success.
    static std::string register_adapter(const PortType& from, const PortType& to,
                                        const std::string& adapter_name);

    /// Adapter registered for (from, to), canonical table included.
    static std::optional<std::string> find_adapter(const PortType& from, const PortType& to);
};
