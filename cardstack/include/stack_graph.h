#pragma once
// stack_graph.h
// Visual graph projection of a Stack, and the way back.
//
// Serial stacks map to a chain of nodes and edges; other modes give nodes
// only. Converting back accepts nothing but a simple path: the editor
// simplifies the diagram first, and no partial or guessed stack is produced.

#include "stack.h"

#include <optional>
#include <string>
#include <vector>

// Default port names used when a card declares no ports on that side.
constexpr const char* DEFAULT_OUT_PORT = "out";
constexpr const char* DEFAULT_IN_PORT  = "in";

// Layout spacing for stack_to_graph(): entries run left to right.
constexpr float GRAPH_NODE_SPACING_X = 200.0f;

struct StackGraphNode {
    std::string id;         // entry id
    std::string card_id;
    float       x = 0.0f;
    float       y = 0.0f;
};

struct StackGraphEdge {
    std::string id;
    std::string source;
    std::string target;
    std::string source_port;
    std::string target_port;
};

struct StackGraph {
    std::string                 id;
    std::vector<StackGraphNode> nodes;
    std::vector<StackGraphEdge> edges;
};

enum class GraphConversionErrorKind {
    Topology,           // not a simple path
    UnresolvedCard,     // the resolver had no card for a node
};

struct GraphConversionError {
    GraphConversionErrorKind kind = GraphConversionErrorKind::Topology;
    std::string              node_id;   // offending node, when there is one
    std::string              message;
};

StackGraph stack_to_graph(const Stack& stack);

/// Returns nullopt on any failure; if error_out is given it says why.
/// The result is a new serial stack with fresh entry ids, in walk order.
std::optional<Stack> graph_to_stack(const StackGraph& graph, const CardResolver& get_card,
                                    IdGenerator& ids, GraphConversionError* error_out = nullptr);

// ---------------------------------------------------------------------------
// JSON interchange with the graph editor
// ---------------------------------------------------------------------------
//
// StackGraph = {
//   "id": str,
//   "nodes": [{"id": str, "card_id": str, "position": {"x": float, "y": float}}, ...],
//   "edges": [{"id": str, "source": str, "target": str,
//              "source_port": str, "target_port": str}, ...]
// }

std::string stack_graph_to_json(const StackGraph& graph);

/// Returns nullopt on parse error and fills error_out.
std::optional<StackGraph> stack_graph_from_json(const std::string& json, std::string& error_out);
