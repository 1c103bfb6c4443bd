#include <gtest/gtest.h>
#include <charta/charta.h>
#include "../../src/layout/sugiyama/phases/CycleRemoval.h"

#include <algorithm>
#include <memory>

using namespace charta;

// ============================================================================
// SugiyamaLayoutTest - 전체 레이아웃 파이프라인 테스트
// ============================================================================

namespace {

bool isRectilinear(const PositionedEdge& edge) {
    for (size_t i = 1; i < edge.waypoints.size(); ++i) {
        const GridPoint& a = edge.waypoints[i - 1];
        const GridPoint& b = edge.waypoints[i];
        if (a.x != b.x && a.y != b.y) return false;
    }
    return true;
}

Graph makeFlowchart() {
    Graph graph;
    graph.addNode("start", "Start");
    graph.addNode("check", "Valid input?", NodeShape::Diamond);
    graph.addNode("save", "Save record");
    graph.addNode("fail", "Show error", NodeShape::Rounded);
    graph.addNode("db", "Database", NodeShape::Cylinder);
    graph.addNode("done", "Done");
    graph.addEdge("start", "check");
    graph.addEdge("check", "save", EdgeKind::Arrow, "yes");
    graph.addEdge("check", "fail", EdgeKind::Arrow, "no");
    graph.addEdge("save", "db", EdgeKind::DottedArrow);
    graph.addEdge("db", "done");
    graph.addEdge("fail", "start");
    return graph;
}

/// Wraps the default cycle removal and counts calls
class CountingCycleRemoval : public algorithms::ICycleRemoval {
public:
    algorithms::CycleRemovalResult findExcludedEdges(const Graph& graph) const override {
        ++calls;
        return inner_.findExcludedEdges(graph);
    }
    bool hasCycles(const Graph& graph) const override { return inner_.hasCycles(graph); }
    const char* algorithmName() const override { return "Counting"; }

    mutable int calls = 0;

private:
    algorithms::CycleRemoval inner_;
};

}  // namespace

// --- Basic geometry ---

TEST(SugiyamaLayoutTest, TwoNodes_TargetBelowWithRankGap) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* a = result.getNode("A");
    const PositionedNode* b = result.getNode("B");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    EXPECT_EQ(b->y, a->y + a->height + 4);
    EXPECT_EQ(a->center().x, b->center().x);

    const PositionedEdge& edge = result.edges()[0];
    ASSERT_EQ(edge.waypoints.size(), 2u);
    EXPECT_EQ(edge.waypoints.front(), GridPoint(a->center().x, a->y + a->height));
    EXPECT_EQ(edge.waypoints.back(), GridPoint(a->center().x, b->y - 1));
}

TEST(SugiyamaLayoutTest, Padding_ShiftsDrawingToMargin) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* a = result.getNode("A");
    EXPECT_EQ(a->x, 1);
    EXPECT_EQ(a->y, 1);
    EXPECT_EQ(result.width(), 5 + 2);
    EXPECT_EQ(result.height(), 3 + 4 + 3 + 2);
}

TEST(SugiyamaLayoutTest, FanOut_JunctionBelowDecision) {
    Graph graph;
    graph.addNode("D");
    graph.addNode("Y");
    graph.addNode("N");
    graph.addEdge("D", "Y");
    graph.addEdge("D", "N");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* d = result.getNode("D");
    const PositionedNode* y = result.getNode("Y");
    const PositionedNode* n = result.getNode("N");
    EXPECT_LT(y->x, n->x);
    EXPECT_EQ(y->y, n->y);

    GridPoint expected{d->center().x, d->y + d->height + 1};
    for (const auto& edge : result.edges()) {
        ASSERT_TRUE(edge.junction.has_value());
        EXPECT_EQ(*edge.junction, expected);
        EXPECT_EQ(edge.groupSize, 2);
    }
    EXPECT_EQ(result.edges()[0].groupIndex, 0);
    EXPECT_EQ(result.edges()[1].groupIndex, 1);
}

// --- Invariants ---

TEST(SugiyamaLayoutTest, NodesNeverOverlap) {
    for (Direction dir : {Direction::TopDown, Direction::BottomUp,
                          Direction::LeftRight, Direction::RightLeft}) {
        for (bool grouped : {false, true}) {
            Graph graph = makeFlowchart();
            if (grouped) {
                graph.addSubgraph("Persist", {"save", "done"});
            }
            LayoutResult result = SugiyamaLayout(LayoutOptions::forDirection(dir)).layout(graph);

            const auto& nodes = result.nodes();
            for (size_t i = 0; i < nodes.size(); ++i) {
                for (size_t j = i + 1; j < nodes.size(); ++j) {
                    EXPECT_FALSE(nodes[i].bounds().intersects(nodes[j].bounds()))
                        << directionName(dir) << (grouped ? " grouped " : " ")
                        << nodes[i].id << " overlaps " << nodes[j].id;
                }
            }
        }
    }
}

TEST(SugiyamaLayoutTest, AllEdges_AreRectilinear) {
    for (Direction dir : {Direction::TopDown, Direction::BottomUp,
                          Direction::LeftRight, Direction::RightLeft}) {
        Graph graph = makeFlowchart();
        LayoutResult result = SugiyamaLayout(LayoutOptions::forDirection(dir)).layout(graph);

        for (const auto& edge : result.edges()) {
            EXPECT_TRUE(isRectilinear(edge)) << directionName(dir) << " " << edge.fromId
                                             << " -> " << edge.toId;
        }
    }
}

TEST(SugiyamaLayoutTest, EveryCoordinate_InsideCanvas) {
    Graph graph = makeFlowchart();
    LayoutResult result = SugiyamaLayout().layout(graph);
    Rect canvas{0, 0, result.width(), result.height()};

    for (const auto& node : result.nodes()) {
        EXPECT_TRUE(canvas.contains(node.bounds().position()));
        EXPECT_LE(node.bounds().right(), result.width());
        EXPECT_LE(node.bounds().bottom(), result.height());
    }
    for (const auto& edge : result.edges()) {
        for (const auto& p : edge.waypoints) {
            EXPECT_TRUE(canvas.contains(p)) << p.x << "," << p.y;
        }
    }
}

TEST(SugiyamaLayoutTest, SameLayer_SameHeight) {
    Graph graph;
    graph.addNode("root");
    graph.addNode("short", "one");
    graph.addNode("tall", "one\ntwo\nthree");
    graph.addEdge("root", "short");
    graph.addEdge("root", "tall");

    LayoutResult result = SugiyamaLayout().layout(graph);

    EXPECT_EQ(result.getNode("short")->height, result.getNode("tall")->height);
    EXPECT_EQ(result.getNode("short")->y, result.getNode("tall")->y);
}

TEST(SugiyamaLayoutTest, Horizontal_SameLayerSameWidth) {
    Graph graph(Direction::LeftRight);
    graph.addNode("root");
    graph.addNode("a", "x");
    graph.addNode("b", "a much longer label");
    graph.addEdge("root", "a");
    graph.addEdge("root", "b");

    LayoutResult result = SugiyamaLayout().layout(graph);

    EXPECT_EQ(result.getNode("a")->width, result.getNode("b")->width);
    EXPECT_EQ(result.getNode("a")->x, result.getNode("b")->x);
}

// --- Directions ---

TEST(SugiyamaLayoutTest, BottomUp_SourceBelowTarget) {
    Graph graph(Direction::BottomUp);
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* a = result.getNode("A");
    const PositionedNode* b = result.getNode("B");
    EXPECT_GT(a->y, b->y + b->height);
    EXPECT_EQ(result.edges()[0].sourceEdge, NodeEdge::Top);
    EXPECT_EQ(result.edges()[0].targetEdge, NodeEdge::Bottom);
    EXPECT_EQ(result.edges()[0].waypoints.back().y, b->y + b->height);
}

TEST(SugiyamaLayoutTest, LeftRight_TargetToTheRight) {
    Graph graph(Direction::LeftRight);
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* a = result.getNode("A");
    const PositionedNode* b = result.getNode("B");
    EXPECT_GT(b->x, a->x + a->width);
    EXPECT_EQ(a->center().y, b->center().y);
    EXPECT_EQ(result.edges()[0].waypoints.back(), GridPoint(b->x - 1, b->center().y));
    EXPECT_EQ(result.edges()[0].sourceEdge, NodeEdge::Right);
}

TEST(SugiyamaLayoutTest, RightLeft_TargetToTheLeft) {
    Graph graph(Direction::RightLeft);
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout().layout(graph);

    const PositionedNode* a = result.getNode("A");
    const PositionedNode* b = result.getNode("B");
    EXPECT_GT(a->x, b->x + b->width);
    EXPECT_EQ(result.edges()[0].waypoints.back().x, b->x + b->width);
}

TEST(SugiyamaLayoutTest, OptionsDirection_OverridesGraph) {
    Graph graph(Direction::LeftRight);
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout(LayoutOptions().setDirection(Direction::TopDown)).layout(graph);

    EXPECT_EQ(result.direction(), Direction::TopDown);
    EXPECT_GT(result.getNode("B")->y, result.getNode("A")->y);
}

// --- Cycles ---

TEST(SugiyamaLayoutTest, Cycle_ReportsWarningAndKeepsEdge) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addNode("C");
    graph.addEdge("A", "B");
    graph.addEdge("B", "C");
    EdgeId closing = graph.addEdge("C", "A");

    Logger::clearCapturedLogs();
    Logger::enableCapture(true);
    LayoutResult result = SugiyamaLayout().layout(graph);
    auto warnLogs = Logger::getCapturedLogs("[warn]");
    Logger::enableCapture(false);
    Logger::clearCapturedLogs();

    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_EQ(result.warnings()[0].edge, closing);
    EXPECT_EQ(result.warnings()[0].kind, LayoutWarningKind::CycleExcluded);
    EXPECT_EQ(result.warnings()[0].from, "C");

    ASSERT_EQ(result.edgeCount(), 3u);
    const PositionedEdge* back = result.getEdge(closing);
    ASSERT_NE(back, nullptr);
    EXPECT_TRUE(back->excluded);
    EXPECT_FALSE(back->waypoints.empty());
    EXPECT_TRUE(isRectilinear(*back));

    ASSERT_EQ(warnLogs.size(), 1u);
    EXPECT_NE(warnLogs[0].find("excluded from layering"), std::string::npos);
}

TEST(SugiyamaLayoutTest, SelfLoop_Warned) {
    Graph graph;
    graph.addNode("A");
    graph.addEdge("A", "A");

    LayoutResult result = SugiyamaLayout().layout(graph);

    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_NE(result.warnings()[0].message.find("Self-loop"), std::string::npos);
    EXPECT_EQ(result.layerCount(), 1);
}

// --- Errors and edge cases ---

TEST(SugiyamaLayoutTest, EmptyGraph_ZeroSizedResult) {
    Graph graph;
    LayoutResult result = SugiyamaLayout().layout(graph);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.width(), 0);
    EXPECT_EQ(result.height(), 0);
    EXPECT_EQ(result.layerCount(), 0);
}

TEST(SugiyamaLayoutTest, SingleNode_NoEdges) {
    Graph graph;
    graph.addNode("only", "Only");

    LayoutResult result = SugiyamaLayout().layout(graph);

    EXPECT_EQ(result.nodeCount(), 1u);
    EXPECT_EQ(result.width(), 8 + 2);
    EXPECT_EQ(result.height(), 3 + 2);
}

TEST(SugiyamaLayoutTest, DanglingEdge_Throws) {
    Graph graph;
    graph.addNode("A");
    graph.addEdge("A", "missing");

    EXPECT_THROW(SugiyamaLayout().layout(graph), DanglingReferenceError);
}

TEST(SugiyamaLayoutTest, InvalidOptions_Throw) {
    EXPECT_THROW(SugiyamaLayout::validateOptions(LayoutOptions().setNodeSpacing(-1)),
                 std::invalid_argument);
    EXPECT_THROW({ SugiyamaLayout invalid(LayoutOptions().setMinNodeSize(0, 3)); },
                 std::invalid_argument);

    SugiyamaLayout layout;
    EXPECT_THROW(layout.setOptions(LayoutOptions().setPadding(-2)), std::invalid_argument);
    EXPECT_EQ(layout.options().padding, 1);
}

TEST(SugiyamaLayoutTest, SmallRankSpacing_RaisedToMinimum) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");

    LayoutResult result = SugiyamaLayout(LayoutOptions().setRankSpacing(1)).layout(graph);

    EXPECT_EQ(result.getNode("B")->y - result.getNode("A")->y - 3, MIN_RANK_SPACING);
}

// --- Determinism and stats ---

TEST(SugiyamaLayoutTest, SameInput_IdenticalLayout) {
    Graph first = makeFlowchart();
    Graph second = makeFlowchart();

    std::string a = SugiyamaLayout().layout(first).toJson();
    std::string b = SugiyamaLayout().layout(second).toJson();

    EXPECT_EQ(a, b);
}

TEST(SugiyamaLayoutTest, LastStats_Reported) {
    Graph graph;
    graph.addNode("D");
    graph.addNode("Y");
    graph.addNode("N");
    graph.addEdge("D", "Y");
    graph.addEdge("D", "N");
    graph.addEdge("N", "D");

    SugiyamaLayout layout;
    layout.layout(graph);

    EXPECT_EQ(layout.lastStats().layerCount, 2);
    EXPECT_EQ(layout.lastStats().maxLayerWidth, 2);
    EXPECT_EQ(layout.lastStats().excludedEdges, 1);
    EXPECT_EQ(layout.lastStats().edgeCrossings, 0);
}

TEST(SugiyamaLayoutTest, InjectedCycleRemoval_IsUsed) {
    auto counting = std::make_shared<CountingCycleRemoval>();

    SugiyamaLayout layout;
    layout.setCycleRemoval(counting);
    layout.setCycleRemoval(nullptr);

    Graph graph = makeFlowchart();
    layout.layout(graph);

    EXPECT_EQ(counting->calls, 1);
}

// --- Groups ---

TEST(SugiyamaLayoutTest, Subgraph_BoundsSurroundMembers) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addNode("C");
    graph.addEdge("A", "B");
    graph.addEdge("A", "C");
    graph.addSubgraph("Backend", {"B", "ghost"});

    LayoutResult result = SugiyamaLayout().layout(graph);

    ASSERT_EQ(result.groups().size(), 1u);
    const PositionedGroup& group = result.groups()[0];
    EXPECT_EQ(group.title, "Backend");
    ASSERT_EQ(group.members.size(), 1u);

    Rect member = result.getNode("B")->bounds();
    EXPECT_EQ(group.bounds, member.expanded(1));
    EXPECT_FALSE(group.bounds.intersects(result.getNode("C")->bounds()));
}

TEST(SugiyamaLayoutTest, GroupSpanningLayers_ExcludesOutsiders) {
    for (Direction dir : {Direction::TopDown, Direction::BottomUp,
                          Direction::LeftRight, Direction::RightLeft}) {
        Graph graph;
        graph.addNode("A");
        graph.addNode("B", "Outsider");
        graph.addNode("C");
        graph.addEdge("A", "B");
        graph.addEdge("B", "C");
        graph.addSubgraph("grp", {"A", "C"});

        LayoutResult result = SugiyamaLayout(LayoutOptions::forDirection(dir)).layout(graph);

        ASSERT_EQ(result.groups().size(), 1u);
        const Rect& bounds = result.groups()[0].bounds;
        EXPECT_FALSE(bounds.intersects(result.getNode("B")->bounds())) << directionName(dir);
        EXPECT_TRUE(bounds.contains(result.getNode("A")->bounds().position()));
        EXPECT_TRUE(bounds.contains(result.getNode("C")->bounds().position()));
    }
}

TEST(SugiyamaLayoutTest, Groups_NeverCoverNonMembers) {
    for (Direction dir : {Direction::TopDown, Direction::BottomUp,
                          Direction::LeftRight, Direction::RightLeft}) {
        Graph graph = makeFlowchart();
        // "db" sits in the layer between the two members
        graph.addSubgraph("Persist", {"save", "done"});

        LayoutResult result = SugiyamaLayout(LayoutOptions::forDirection(dir)).layout(graph);

        ASSERT_EQ(result.groups().size(), 1u);
        const PositionedGroup& group = result.groups()[0];
        for (const PositionedNode& node : result.nodes()) {
            bool member = std::find(group.members.begin(), group.members.end(), node.id) !=
                          group.members.end();
            if (member) continue;
            EXPECT_FALSE(group.bounds.intersects(node.bounds()))
                << directionName(dir) << " " << group.title << " covers " << node.id;
        }
    }
}
