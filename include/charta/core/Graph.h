#pragma once

#include "Types.h"
#include "charta/layout/config/LayoutEnums.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace charta {

struct NodeRecord {
    NodeId index = INVALID_NODE;   ///< Dense index assigned by Graph
    std::string id;                ///< Unique key from the diagram source
    std::string label;             ///< Display text; empty means "show the id"
    NodeShape shape = NodeShape::Rectangle;

    NodeRecord() = default;
    NodeRecord(std::string id_, std::string label_, NodeShape shape_ = NodeShape::Rectangle)
        : id(std::move(id_)), label(std::move(label_)), shape(shape_) {}

    const std::string& displayLabel() const { return label.empty() ? id : label; }
};

struct EdgeRecord {
    EdgeId index = INVALID_EDGE;
    std::string from;
    std::string to;
    EdgeKind kind = EdgeKind::Arrow;
    std::optional<std::string> label;

    // Resolved endpoints; INVALID_NODE while the id is unknown
    NodeId fromNode = INVALID_NODE;
    NodeId toNode = INVALID_NODE;

    EdgeRecord() = default;
    EdgeRecord(std::string f, std::string t, EdgeKind k = EdgeKind::Arrow)
        : from(std::move(f)), to(std::move(t)), kind(k) {}

    bool isResolved() const { return fromNode != INVALID_NODE && toNode != INVALID_NODE; }
    bool isSelfLoop() const { return from == to; }
};

/// Single-level node grouping
struct Subgraph {
    std::string id;                    ///< "subgraph_N"
    std::string title;
    std::vector<std::string> members;  ///< Node ids; unknown ids are ignored
};

/// Graph model handed to layout by the diagram parser.
///
/// Edges may be added before their endpoints; they are wired into the
/// adjacency lists once both endpoints exist. validate() reports any
/// edge still naming a missing node.
class Graph {
public:
    Graph() = default;
    explicit Graph(Direction direction) : direction_(direction) {}

    // Node operations
    NodeId addNode(const std::string& id);
    NodeId addNode(const std::string& id, const std::string& label);
    NodeId addNode(const std::string& id, const std::string& label, NodeShape shape);
    NodeId addNode(const NodeRecord& record);

    bool hasNode(NodeId index) const { return index < nodes_.size(); }
    bool hasNode(const std::string& id) const { return nodeIndex_.count(id) > 0; }
    std::optional<NodeId> findNode(const std::string& id) const;

    // Node access API:
    // - getNode(): throws std::out_of_range for unknown index or id.
    // - tryGetNode(): returns a copy or std::nullopt.
    const NodeRecord& getNode(NodeId index) const;
    const NodeRecord& getNode(const std::string& id) const;
    std::optional<NodeRecord> tryGetNode(const std::string& id) const;

    void setNodeLabel(const std::string& id, const std::string& label);
    void setNodeShape(const std::string& id, NodeShape shape);

    // Edge operations
    EdgeId addEdge(const std::string& from, const std::string& to);
    EdgeId addEdge(const std::string& from, const std::string& to, EdgeKind kind);
    EdgeId addEdge(const std::string& from, const std::string& to, EdgeKind kind,
                   const std::string& label);
    EdgeId addEdge(const EdgeRecord& record);

    bool hasEdge(EdgeId index) const { return index < edges_.size(); }
    const EdgeRecord& getEdge(EdgeId index) const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    std::vector<NodeId> nodes() const;
    std::vector<EdgeId> edges() const;

    /// Resolved edges only, in insertion order
    const std::vector<EdgeId>& outEdges(NodeId index) const;
    const std::vector<EdgeId>& inEdges(NodeId index) const;
    std::vector<NodeId> successors(NodeId index) const;
    std::vector<NodeId> predecessors(NodeId index) const;

    size_t inDegree(NodeId index) const { return inEdges(index).size(); }
    size_t outDegree(NodeId index) const { return outEdges(index).size(); }

    // Grouping
    /// @return Generated id "subgraph_N"
    std::string addSubgraph(const std::string& title, const std::vector<std::string>& members);
    const std::vector<Subgraph>& subgraphs() const { return subgraphs_; }

    /// Index of the first subgraph listing the node, if any
    std::optional<size_t> subgraphOf(const std::string& id) const;

    Direction direction() const { return direction_; }
    void setDirection(Direction direction) { direction_ = direction; }

    /// Throws DanglingReferenceError for the first edge naming a missing node
    void validate() const;

    void clear();

private:
    void attachEdge(EdgeId index);
    const NodeRecord& nodeAt(NodeId index) const;

    std::vector<NodeRecord> nodes_;
    std::unordered_map<std::string, NodeId> nodeIndex_;
    std::vector<EdgeRecord> edges_;
    std::vector<std::vector<EdgeId>> outEdges_;
    std::vector<std::vector<EdgeId>> inEdges_;
    std::unordered_map<std::string, std::vector<EdgeId>> pendingEdges_;
    std::vector<Subgraph> subgraphs_;
    Direction direction_ = Direction::TopDown;
};

}  // namespace charta
