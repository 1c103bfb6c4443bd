#include "charta/core/Graph.h"
#include "charta/core/Errors.h"
#include "charta/common/Logger.h"

#include <algorithm>

namespace charta {

NodeId Graph::addNode(const std::string& id) {
    return addNode(NodeRecord{id, ""});
}

NodeId Graph::addNode(const std::string& id, const std::string& label) {
    return addNode(NodeRecord{id, label});
}

NodeId Graph::addNode(const std::string& id, const std::string& label, NodeShape shape) {
    return addNode(NodeRecord{id, label, shape});
}

NodeId Graph::addNode(const NodeRecord& record) {
    if (record.id.empty()) {
        throw std::invalid_argument("Node id must not be empty");
    }
    if (hasNode(record.id)) {
        throw std::invalid_argument("Duplicate node id: " + record.id);
    }

    NodeId index = static_cast<NodeId>(nodes_.size());
    NodeRecord node = record;
    node.index = index;
    nodes_.push_back(std::move(node));
    nodeIndex_.emplace(record.id, index);
    outEdges_.emplace_back();
    inEdges_.emplace_back();

    // Wire up edges that were added before this node existed
    auto pending = pendingEdges_.find(record.id);
    if (pending != pendingEdges_.end()) {
        for (EdgeId edgeId : pending->second) {
            EdgeRecord& edge = edges_[edgeId];
            if (edge.from == record.id) edge.fromNode = index;
            if (edge.to == record.id) edge.toNode = index;
            if (edge.isResolved()) {
                attachEdge(edgeId);
            }
        }
        pendingEdges_.erase(pending);
    }

    return index;
}

std::optional<NodeId> Graph::findNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const NodeRecord& Graph::nodeAt(NodeId index) const {
    if (!hasNode(index)) {
        throw std::out_of_range("Invalid node index: " + std::to_string(index));
    }
    return nodes_[index];
}

const NodeRecord& Graph::getNode(NodeId index) const {
    return nodeAt(index);
}

const NodeRecord& Graph::getNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    return nodes_[it->second];
}

std::optional<NodeRecord> Graph::tryGetNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        return std::nullopt;
    }
    return nodes_[it->second];
}

void Graph::setNodeLabel(const std::string& id, const std::string& label) {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    nodes_[it->second].label = label;
}

void Graph::setNodeShape(const std::string& id, NodeShape shape) {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    nodes_[it->second].shape = shape;
}

EdgeId Graph::addEdge(const std::string& from, const std::string& to) {
    return addEdge(EdgeRecord{from, to});
}

EdgeId Graph::addEdge(const std::string& from, const std::string& to, EdgeKind kind) {
    return addEdge(EdgeRecord{from, to, kind});
}

EdgeId Graph::addEdge(const std::string& from, const std::string& to, EdgeKind kind,
                      const std::string& label) {
    EdgeRecord record{from, to, kind};
    if (!label.empty()) {
        record.label = label;
    }
    return addEdge(record);
}

EdgeId Graph::addEdge(const EdgeRecord& record) {
    EdgeId index = static_cast<EdgeId>(edges_.size());
    EdgeRecord edge = record;
    edge.index = index;
    edge.fromNode = findNode(edge.from).value_or(INVALID_NODE);
    edge.toNode = findNode(edge.to).value_or(INVALID_NODE);
    edges_.push_back(std::move(edge));

    const EdgeRecord& stored = edges_.back();
    if (stored.isResolved()) {
        attachEdge(index);
    } else {
        if (stored.fromNode == INVALID_NODE) {
            pendingEdges_[stored.from].push_back(index);
        }
        if (stored.toNode == INVALID_NODE && stored.to != stored.from) {
            pendingEdges_[stored.to].push_back(index);
        }
    }
    return index;
}

void Graph::attachEdge(EdgeId index) {
    const EdgeRecord& edge = edges_[index];
    auto insertSorted = [index](std::vector<EdgeId>& list) {
        list.insert(std::lower_bound(list.begin(), list.end(), index), index);
    };
    insertSorted(outEdges_[edge.fromNode]);
    insertSorted(inEdges_[edge.toNode]);
}

const EdgeRecord& Graph::getEdge(EdgeId index) const {
    if (!hasEdge(index)) {
        throw std::out_of_range("Invalid edge index: " + std::to_string(index));
    }
    return edges_[index];
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> result(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        result[i] = static_cast<NodeId>(i);
    }
    return result;
}

std::vector<EdgeId> Graph::edges() const {
    std::vector<EdgeId> result(edges_.size());
    for (size_t i = 0; i < edges_.size(); ++i) {
        result[i] = static_cast<EdgeId>(i);
    }
    return result;
}

const std::vector<EdgeId>& Graph::outEdges(NodeId index) const {
    nodeAt(index);
    return outEdges_[index];
}

const std::vector<EdgeId>& Graph::inEdges(NodeId index) const {
    nodeAt(index);
    return inEdges_[index];
}

std::vector<NodeId> Graph::successors(NodeId index) const {
    std::vector<NodeId> result;
    for (EdgeId edgeId : outEdges(index)) {
        result.push_back(edges_[edgeId].toNode);
    }
    return result;
}

std::vector<NodeId> Graph::predecessors(NodeId index) const {
    std::vector<NodeId> result;
    for (EdgeId edgeId : inEdges(index)) {
        result.push_back(edges_[edgeId].fromNode);
    }
    return result;
}

std::string Graph::addSubgraph(const std::string& title, const std::vector<std::string>& members) {
    Subgraph subgraph;
    subgraph.id = "subgraph_" + std::to_string(subgraphs_.size());
    subgraph.title = title;
    subgraph.members = members;
    subgraphs_.push_back(std::move(subgraph));
    return subgraphs_.back().id;
}

std::optional<size_t> Graph::subgraphOf(const std::string& id) const {
    for (size_t i = 0; i < subgraphs_.size(); ++i) {
        const auto& members = subgraphs_[i].members;
        if (std::find(members.begin(), members.end(), id) != members.end()) {
            return i;
        }
    }
    return std::nullopt;
}

void Graph::validate() const {
    for (const EdgeRecord& edge : edges_) {
        if (edge.isResolved()) continue;

        const std::string& missing = edge.fromNode == INVALID_NODE ? edge.from : edge.to;
        LOG_ERROR("Edge {} ({} -> {}) references unknown node '{}'",
                  edge.index, edge.from, edge.to, missing);
        throw DanglingReferenceError(edge.index, edge.from, edge.to, missing);
    }
}

void Graph::clear() {
    nodes_.clear();
    nodeIndex_.clear();
    edges_.clear();
    outEdges_.clear();
    inEdges_.clear();
    pendingEdges_.clear();
    subgraphs_.clear();
}

}  // namespace charta
