#include "charta/layout/config/LayoutResult.h"
#include "charta/layout/util/LayoutSerializer.h"
#include "charta/core/TextUtils.h"

#include <algorithm>

namespace charta {

int PositionedEdge::pathLength() const {
    int length = 0;
    forEachSegment([&length](const GridPoint& a, const GridPoint& b) {
        length += a.manhattan(b);
    });
    return length;
}

// ========== Node Operations ==========

void LayoutResult::addNode(const PositionedNode& node) {
    auto it = nodeIndex_.find(node.id);
    if (it != nodeIndex_.end()) {
        nodes_[it->second] = node;
        return;
    }
    nodeIndex_.emplace(node.id, nodes_.size());
    nodes_.push_back(node);
}

const PositionedNode* LayoutResult::getNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    return it != nodeIndex_.end() ? &nodes_[it->second] : nullptr;
}

PositionedNode* LayoutResult::getNode(const std::string& id) {
    auto it = nodeIndex_.find(id);
    return it != nodeIndex_.end() ? &nodes_[it->second] : nullptr;
}

// ========== Edge Operations ==========

void LayoutResult::addEdge(const PositionedEdge& edge) {
    edges_.push_back(edge);
}

const PositionedEdge* LayoutResult::getEdge(EdgeId index) const {
    if (index < edges_.size() && edges_[index].index == index) {
        return &edges_[index];
    }
    for (const auto& edge : edges_) {
        if (edge.index == index) return &edge;
    }
    return nullptr;
}

std::vector<const PositionedEdge*> LayoutResult::edgesFrom(const std::string& id) const {
    std::vector<const PositionedEdge*> result;
    for (const auto& edge : edges_) {
        if (edge.fromId == id) result.push_back(&edge);
    }
    return result;
}

std::vector<const PositionedEdge*> LayoutResult::edgesTo(const std::string& id) const {
    std::vector<const PositionedEdge*> result;
    for (const auto& edge : edges_) {
        if (edge.toId == id) result.push_back(&edge);
    }
    return result;
}

// ========== Geometry ==========

Rect commitLabelBounds(const PositionedNode& node, Direction direction) {
    if (node.lines.empty()) return {};
    const int width = text::displayWidth(node.lines.front());
    const GridPoint glyph = node.center();
    if (isVertical(direction)) {
        return {glyph.x + 2, glyph.y, width, 1};
    }
    return {glyph.x - width / 2, glyph.y + 1, width, 1};
}

Rect LayoutResult::computeBounds() const {
    Rect bounds;
    auto include = [&bounds](const Rect& r) { bounds = bounds.united(r); };
    auto includePoint = [&include](const GridPoint& p) { include({p.x, p.y, 1, 1}); };

    for (const auto& node : nodes_) {
        include(node.bounds());
        if (node.shape == NodeShape::Commit) {
            Rect label = commitLabelBounds(node, direction_);
            if (!label.empty()) include(label);
        }
    }
    for (const auto& edge : edges_) {
        for (const auto& p : edge.waypoints) includePoint(p);
        if (edge.junction) includePoint(*edge.junction);
        if (edge.label && edge.labelPosition) {
            int w = std::max(1, text::displayWidth(*edge.label));
            include({edge.labelPosition->x - w / 2, edge.labelPosition->y, w, 1});
        }
    }
    for (const auto& group : groups_) {
        include(group.bounds);
    }
    return bounds;
}

void LayoutResult::translate(int dx, int dy) {
    const GridPoint offset{dx, dy};
    for (auto& node : nodes_) {
        node.x += dx;
        node.y += dy;
    }
    for (auto& edge : edges_) {
        for (auto& p : edge.waypoints) p = p + offset;
        if (edge.junction) edge.junction = *edge.junction + offset;
        if (edge.labelPosition) edge.labelPosition = *edge.labelPosition + offset;
    }
    for (auto& group : groups_) {
        group.bounds.x += dx;
        group.bounds.y += dy;
    }
}

void LayoutResult::fitToPadding(int padding) {
    Rect bounds = computeBounds();
    translate(padding - bounds.x, padding - bounds.y);
    setSize(bounds.width + 2 * padding, bounds.height + 2 * padding);
}

void LayoutResult::clear() {
    nodes_.clear();
    nodeIndex_.clear();
    edges_.clear();
    groups_.clear();
    warnings_.clear();
    width_ = 0;
    height_ = 0;
    layerCount_ = 0;
}

// ========== JSON Serialization ==========

std::string LayoutResult::toJson() const {
    return LayoutSerializer::toJson(*this);
}

LayoutResult LayoutResult::fromJson(const std::string& json) {
    return LayoutSerializer::layoutResultFromJson(json);
}

}  // namespace charta
