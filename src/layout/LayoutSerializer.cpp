#include "charta/layout/util/LayoutSerializer.h"
#include "charta/layout/config/LayoutResult.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace charta {

namespace {

json pointToJson(const GridPoint& p) {
    return {{"x", p.x}, {"y", p.y}};
}

GridPoint pointFromJson(const json& j) {
    return {j.at("x").get<int>(), j.at("y").get<int>()};
}

}  // namespace

std::string LayoutSerializer::nodeEdgeToString(NodeEdge edge) {
    switch (edge) {
        case NodeEdge::Top: return "top";
        case NodeEdge::Bottom: return "bottom";
        case NodeEdge::Left: return "left";
        case NodeEdge::Right: return "right";
    }
    return "bottom";
}

NodeEdge LayoutSerializer::stringToNodeEdge(const std::string& str) {
    if (str == "top") return NodeEdge::Top;
    if (str == "bottom") return NodeEdge::Bottom;
    if (str == "left") return NodeEdge::Left;
    if (str == "right") return NodeEdge::Right;
    return NodeEdge::Bottom;
}

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["version"] = FORMAT_VERSION;
    j["direction"] = directionName(result.direction());
    j["width"] = result.width();
    j["height"] = result.height();
    j["layerCount"] = result.layerCount();

    json nodes = json::array();
    for (const auto& node : result.nodes()) {
        nodes.push_back({
            {"index", node.index},
            {"id", node.id},
            {"lines", node.lines},
            {"shape", shapeName(node.shape)},
            {"x", node.x},
            {"y", node.y},
            {"width", node.width},
            {"height", node.height},
            {"layer", node.layer},
            {"order", node.order}
        });
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : result.edges()) {
        json edgeJson;
        edgeJson["index"] = edge.index;
        edgeJson["from"] = edge.fromId;
        edgeJson["to"] = edge.toId;
        edgeJson["kind"] = edgeKindName(edge.kind);
        edgeJson["sourceEdge"] = nodeEdgeToString(edge.sourceEdge);
        edgeJson["targetEdge"] = nodeEdgeToString(edge.targetEdge);
        edgeJson["excluded"] = edge.excluded;

        json waypoints = json::array();
        for (const auto& p : edge.waypoints) {
            waypoints.push_back(pointToJson(p));
        }
        edgeJson["waypoints"] = waypoints;

        if (edge.label) edgeJson["label"] = *edge.label;
        if (edge.labelPosition) edgeJson["labelPosition"] = pointToJson(*edge.labelPosition);
        if (edge.junction) edgeJson["junction"] = pointToJson(*edge.junction);
        if (edge.groupIndex) edgeJson["groupIndex"] = *edge.groupIndex;
        if (edge.groupSize) edgeJson["groupSize"] = *edge.groupSize;

        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    json groups = json::array();
    for (const auto& group : result.groups()) {
        groups.push_back({
            {"id", group.id},
            {"title", group.title},
            {"members", group.members},
            {"x", group.bounds.x},
            {"y", group.bounds.y},
            {"width", group.bounds.width},
            {"height", group.bounds.height}
        });
    }
    j["groups"] = groups;

    json warnings = json::array();
    for (const auto& warning : result.warnings()) {
        warnings.push_back({
            {"kind", "cycle-excluded"},
            {"edge", warning.edge},
            {"from", warning.from},
            {"to", warning.to},
            {"message", warning.message}
        });
    }
    j["warnings"] = warnings;

    return j.dump(2);
}

LayoutResult LayoutSerializer::layoutResultFromJson(const std::string& jsonStr) {
    LayoutResult result;

    try {
        json j = json::parse(jsonStr);

        if (auto direction = parseDirection(j.value("direction", "TD"))) {
            result.setDirection(*direction);
        }
        result.setSize(j.value("width", 0), j.value("height", 0));
        result.setLayerCount(j.value("layerCount", 0));

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                PositionedNode node;
                node.index = nodeJson.value("index", INVALID_NODE);
                node.id = nodeJson.at("id").get<std::string>();
                node.lines = nodeJson.value("lines", std::vector<std::string>{});
                node.shape = parseNodeShape(nodeJson.value("shape", "rectangle"))
                                 .value_or(NodeShape::Rectangle);
                node.x = nodeJson.at("x").get<int>();
                node.y = nodeJson.at("y").get<int>();
                node.width = nodeJson.at("width").get<int>();
                node.height = nodeJson.at("height").get<int>();
                node.layer = nodeJson.value("layer", 0);
                node.order = nodeJson.value("order", 0);
                result.addNode(node);
            }
        }

        if (j.contains("edges")) {
            for (const auto& edgeJson : j["edges"]) {
                PositionedEdge edge;
                edge.index = edgeJson.value("index", INVALID_EDGE);
                edge.fromId = edgeJson.at("from").get<std::string>();
                edge.toId = edgeJson.at("to").get<std::string>();
                edge.kind = parseEdgeKind(edgeJson.value("kind", "arrow")).value_or(EdgeKind::Arrow);
                edge.sourceEdge = stringToNodeEdge(edgeJson.value("sourceEdge", "bottom"));
                edge.targetEdge = stringToNodeEdge(edgeJson.value("targetEdge", "top"));
                edge.excluded = edgeJson.value("excluded", false);

                if (edgeJson.contains("waypoints")) {
                    for (const auto& p : edgeJson["waypoints"]) {
                        edge.waypoints.push_back(pointFromJson(p));
                    }
                }
                if (edgeJson.contains("label")) {
                    edge.label = edgeJson["label"].get<std::string>();
                }
                if (edgeJson.contains("labelPosition")) {
                    edge.labelPosition = pointFromJson(edgeJson["labelPosition"]);
                }
                if (edgeJson.contains("junction")) {
                    edge.junction = pointFromJson(edgeJson["junction"]);
                }
                if (edgeJson.contains("groupIndex")) {
                    edge.groupIndex = edgeJson["groupIndex"].get<int>();
                }
                if (edgeJson.contains("groupSize")) {
                    edge.groupSize = edgeJson["groupSize"].get<int>();
                }
                result.addEdge(edge);
            }
        }

        if (j.contains("groups")) {
            for (const auto& groupJson : j["groups"]) {
                PositionedGroup group;
                group.id = groupJson.at("id").get<std::string>();
                group.title = groupJson.value("title", "");
                group.members = groupJson.value("members", std::vector<std::string>{});
                group.bounds = {groupJson.at("x").get<int>(), groupJson.at("y").get<int>(),
                                groupJson.at("width").get<int>(), groupJson.at("height").get<int>()};
                result.addGroup(group);
            }
        }

        if (j.contains("warnings")) {
            for (const auto& warningJson : j["warnings"]) {
                LayoutWarning warning;
                warning.edge = warningJson.value("edge", INVALID_EDGE);
                warning.from = warningJson.value("from", "");
                warning.to = warningJson.value("to", "");
                warning.message = warningJson.value("message", "");
                result.addWarning(warning);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse LayoutResult JSON: ") + e.what());
    }

    return result;
}

bool LayoutSerializer::saveToFile(const LayoutResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(result);
    return static_cast<bool>(file);
}

LayoutResult LayoutSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open layout file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return layoutResultFromJson(buffer.str());
}

}  // namespace charta
