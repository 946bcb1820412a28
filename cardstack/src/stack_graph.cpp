// stack_graph.cpp
#include "stack_graph.h"
#include "debug.h"
#include "nlohmann/json.hpp"

#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// stack_to_graph
// ---------------------------------------------------------------------------

StackGraph stack_to_graph(const Stack& stack) {
    StackGraph g;
    g.id = stack.id();

    const auto& entries = stack.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        StackGraphNode n;
        n.id      = entries[i]->id;
        n.card_id = entries[i]->card->id();
        n.x       = static_cast<float>(i) * GRAPH_NODE_SPACING_X;
        n.y       = 0.0f;
        g.nodes.push_back(std::move(n));
    }

    switch (stack.mode()) {
        case StackMode::Serial:
            for (size_t i = 0; i + 1 < entries.size(); ++i) {
                const auto& outs = entries[i]->card->signature().outputs;
                const auto& ins  = entries[i + 1]->card->signature().inputs;

                StackGraphEdge e;
                e.source      = entries[i]->id;
                e.target      = entries[i + 1]->id;
                e.source_port = outs.empty() ? DEFAULT_OUT_PORT : outs.front().name;
                e.target_port = ins.empty()  ? DEFAULT_IN_PORT  : ins.front().name;
                e.id          = e.source + "->" + e.target;
                g.edges.push_back(std::move(e));
            }
            break;

        // Not linearizable as a chain: nodes only.
        case StackMode::Parallel:
        case StackMode::Layer:
        case StackMode::Tabs:
            break;
    }
    return g;
}

// ---------------------------------------------------------------------------
// graph_to_stack
// ---------------------------------------------------------------------------

static std::optional<Stack> fail(GraphConversionError* error_out, GraphConversionErrorKind kind,
                                 const std::string& node_id, const std::string& message) {
    CS_LOG("graph", "graph_to_stack: %s", message.c_str());
    if (error_out) *error_out = { kind, node_id, message };
    return std::nullopt;
}

std::optional<Stack> graph_to_stack(const StackGraph& graph, const CardResolver& get_card,
                                    IdGenerator& ids, GraphConversionError* error_out) {
    constexpr auto Topology = GraphConversionErrorKind::Topology;

    // --- Degrees ---
    std::unordered_map<std::string, int>         in_degree;
    std::unordered_map<std::string, std::string> next;   // single successor
    std::unordered_map<std::string, const StackGraphNode*> by_id;

    for (auto& n : graph.nodes) {
        if (!by_id.emplace(n.id, &n).second)
            return fail(error_out, Topology, n.id, "duplicate node id '" + n.id + "'");
        in_degree[n.id] = 0;
    }

    for (auto& e : graph.edges) {
        if (!by_id.count(e.source) || !by_id.count(e.target))
            return fail(error_out, Topology, by_id.count(e.source) ? e.target : e.source,
                        "edge '" + e.id + "' references an unknown node");
        // Branching: a second outgoing edge.
        if (!next.emplace(e.source, e.target).second)
            return fail(error_out, Topology, e.source,
                        "node '" + e.source + "' has more than one outgoing edge");
        in_degree[e.target]++;
    }

    // --- Unique start ---
    std::string start;
    int starts = 0;
    for (auto& n : graph.nodes) {
        if (in_degree[n.id] != 0) continue;
        if (starts++ == 0) start = n.id;
    }
    if (starts != 1)
        return fail(error_out, Topology, {},
                    starts == 0 ? "graph has no start node"
                                : "graph has " + std::to_string(starts) + " start nodes");

    // --- Walk ---
    std::vector<const StackGraphNode*> order;
    std::unordered_set<std::string>    visited;
    std::string current = start;
    for (;;) {
        if (!visited.insert(current).second)
            return fail(error_out, Topology, current, "cycle through node '" + current + "'");
        order.push_back(by_id[current]);
        auto it = next.find(current);
        if (it == next.end()) break;
        current = it->second;
    }
    // Nodes the walk never reached sit on a cycle of their own.
    if (order.size() != graph.nodes.size())
        return fail(error_out, Topology, {}, "graph contains a cycle unreachable from the start node");

    // --- Resolve cards (all or nothing) ---
    std::vector<CardPtr> cards;
    cards.reserve(order.size());
    for (auto* n : order) {
        CardPtr card = get_card ? get_card(n->card_id) : nullptr;
        if (!card)
            return fail(error_out, GraphConversionErrorKind::UnresolvedCard, n->id,
                        "no card '" + n->card_id + "' for node '" + n->id + "'");
        cards.push_back(std::move(card));
    }

    return create_stack(cards, StackMode::Serial, ids);
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string stack_graph_to_json(const StackGraph& graph) {
    json j;
    j["id"]    = graph.id;
    j["nodes"] = json::array();
    j["edges"] = json::array();
    for (auto& n : graph.nodes) {
        j["nodes"].push_back({
            {"id",       n.id},
            {"card_id",  n.card_id},
            {"position", {{"x", n.x}, {"y", n.y}}},
        });
    }
    for (auto& e : graph.edges) {
        j["edges"].push_back({
            {"id",          e.id},
            {"source",      e.source},
            {"target",      e.target},
            {"source_port", e.source_port},
            {"target_port", e.target_port},
        });
    }
    return j.dump();
}

std::optional<StackGraph> stack_graph_from_json(const std::string& j_str, std::string& err) {
    StackGraph g;
    try {
        json j = json::parse(j_str);
        if (!j.is_object()) {
            err = "graph JSON must be an object";
            return std::nullopt;
        }
        g.id = j.value("id", "");

        for (auto& jn : j.value("nodes", json::array())) {
            StackGraphNode n;
            n.id      = jn.value("id", "");
            n.card_id = jn.value("card_id", "");
            if (jn.contains("position")) {
                n.x = jn["position"].value("x", 0.0f);
                n.y = jn["position"].value("y", 0.0f);
            }
            if (n.id.empty()) {
                err = "graph node without id";
                return std::nullopt;
            }
            g.nodes.push_back(std::move(n));
        }

        for (auto& je : j.value("edges", json::array())) {
            StackGraphEdge e;
            e.id          = je.value("id", "");
            e.source      = je.value("source", "");
            e.target      = je.value("target", "");
            e.source_port = je.value("source_port", DEFAULT_OUT_PORT);
            e.target_port = je.value("target_port", DEFAULT_IN_PORT);
            if (e.id.empty()) e.id = e.source + "->" + e.target;
            g.edges.push_back(std::move(e));
        }
    } catch (const std::exception& e) {
        err = std::string("graph JSON error: ") + e.what();
        return std::nullopt;
    }
    return g;
}
