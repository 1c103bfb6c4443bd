#include <gtest/gtest.h>
#include <charta/charta.h>

#include <string>

using namespace charta;

// ============================================================================
// CommitGraphLayoutTest - 커밋 그래프 레인 배치 테스트
// ============================================================================

namespace {

/// main: c1 - c2 - c3 - c4, feature branch f1 off c2 merged into c4
Graph makeHistory(Direction direction = Direction::LeftRight) {
    Graph graph(direction);
    graph.addNode("c1");
    graph.addNode("c2");
    graph.addNode("c3");
    graph.addNode("f1");
    graph.addNode("c4", "merge");
    graph.addEdge("c1", "c2");
    graph.addEdge("c2", "c3");
    graph.addEdge("c2", "f1");
    graph.addEdge("c3", "c4");
    graph.addEdge("f1", "c4");
    return graph;
}

bool isRectilinear(const PositionedEdge& edge) {
    for (size_t i = 1; i < edge.waypoints.size(); ++i) {
        const GridPoint& a = edge.waypoints[i - 1];
        const GridPoint& b = edge.waypoints[i];
        if (a.x != b.x && a.y != b.y) return false;
    }
    return true;
}

int countOf(const std::string& haystack, const std::string& needle) {
    int count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

// --- Placement ---

TEST(CommitGraphLayoutTest, Commits_AreSingleCells) {
    LayoutResult result = CommitGraphLayout().layout(makeHistory());

    ASSERT_EQ(result.nodeCount(), 5u);
    for (const PositionedNode& node : result.nodes()) {
        EXPECT_EQ(node.shape, NodeShape::Commit) << node.id;
        EXPECT_EQ(node.width, 1) << node.id;
        EXPECT_EQ(node.height, 1) << node.id;
    }
    EXPECT_EQ(result.getNode("c4")->lines, std::vector<std::string>{"merge"});
    EXPECT_TRUE(result.warnings().empty());
}

TEST(CommitGraphLayoutTest, LeftRight_HistoryAdvancesToTheRight) {
    LayoutResult result = CommitGraphLayout().layout(makeHistory());

    const PositionedNode* c1 = result.getNode("c1");
    const PositionedNode* c2 = result.getNode("c2");
    const PositionedNode* c3 = result.getNode("c3");
    const PositionedNode* f1 = result.getNode("f1");
    const PositionedNode* c4 = result.getNode("c4");

    EXPECT_LT(c1->x, c2->x);
    EXPECT_LT(c2->x, c3->x);
    EXPECT_LT(c3->x, f1->x);
    EXPECT_LT(f1->x, c4->x);

    // Main line continues on one lane, the branch opens the next one
    EXPECT_EQ(c1->y, c2->y);
    EXPECT_EQ(c2->y, c3->y);
    EXPECT_EQ(c3->y, c4->y);
    EXPECT_GT(f1->y, c1->y);
    EXPECT_EQ(f1->order, 1);
    EXPECT_EQ(c4->order, 0);
}

TEST(CommitGraphLayoutTest, BranchAndMerge_TurnNextToTheirLaneChange) {
    LayoutResult result = CommitGraphLayout().layout(makeHistory());

    const PositionedNode* c2 = result.getNode("c2");
    const PositionedNode* f1 = result.getNode("f1");
    const PositionedNode* c4 = result.getNode("c4");

    const PositionedEdge* branch = result.edgesTo("f1").front();
    ASSERT_GE(branch->waypoints.size(), 3u);
    EXPECT_EQ(branch->waypoints.front(), (GridPoint{c2->x + 1, c2->y}));
    EXPECT_EQ(branch->waypoints.back(), (GridPoint{f1->x - 1, f1->y}));
    // Drops onto the branch lane before reaching the next main commit
    EXPECT_LT(branch->waypoints[1].x, result.getNode("c3")->x);

    const PositionedEdge* merge = nullptr;
    for (const PositionedEdge* edge : result.edgesTo("c4")) {
        if (edge->fromId == "f1") merge = edge;
    }
    ASSERT_NE(merge, nullptr);
    EXPECT_EQ(merge->waypoints.front(), (GridPoint{f1->x + 1, f1->y}));
    EXPECT_EQ(merge->waypoints.back(), (GridPoint{c4->x - 1, c4->y}));

    for (const PositionedEdge& edge : result.edges()) {
        EXPECT_TRUE(isRectilinear(edge)) << edge.fromId << "->" << edge.toId;
        EXPECT_FALSE(hasArrowHead(edge.kind)) << edge.fromId << "->" << edge.toId;
        EXPECT_EQ(edge.sourceEdge, NodeEdge::Right);
        EXPECT_EQ(edge.targetEdge, NodeEdge::Left);
    }
}

TEST(CommitGraphLayoutTest, Labels_NeverCoverOtherCommits) {
    for (Direction dir : {Direction::TopDown, Direction::BottomUp,
                          Direction::LeftRight, Direction::RightLeft}) {
        SCOPED_TRACE(directionName(dir));
        LayoutResult result = CommitGraphLayout().layout(makeHistory(dir));
        Rect bounds = result.computeBounds();

        for (const PositionedNode& node : result.nodes()) {
            Rect label = commitLabelBounds(node, dir);
            ASSERT_FALSE(label.empty()) << node.id;
            EXPECT_TRUE(label.x >= bounds.x && label.right() <= bounds.right()) << node.id;
            for (const PositionedNode& other : result.nodes()) {
                if (other.id == node.id) continue;
                EXPECT_FALSE(label.intersects(other.bounds())) << node.id << " / " << other.id;
                EXPECT_FALSE(label.intersects(commitLabelBounds(other, dir)))
                    << node.id << " / " << other.id;
            }
        }
    }
}

TEST(CommitGraphLayoutTest, DottedLink_KeepsLineStyle) {
    EXPECT_EQ(CommitGraphLayout::linkKind(EdgeKind::Arrow), EdgeKind::Line);
    EXPECT_EQ(CommitGraphLayout::linkKind(EdgeKind::DottedArrow), EdgeKind::DottedLine);
    EXPECT_EQ(CommitGraphLayout::linkKind(EdgeKind::ThickArrow), EdgeKind::ThickLine);
    EXPECT_EQ(CommitGraphLayout::linkKind(EdgeKind::Invisible), EdgeKind::Invisible);
}

// --- Cycles ---

TEST(CommitGraphLayoutTest, Cycle_ReportedAndLeftUndrawn) {
    Graph graph(Direction::LeftRight);
    graph.addNode("a");
    graph.addNode("b");
    graph.addEdge("a", "b");
    graph.addEdge("b", "a");

    LayoutResult result = CommitGraphLayout().layout(graph);

    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_EQ(result.warnings()[0].kind, LayoutWarningKind::CycleExcluded);
    const PositionedEdge* back = result.getEdge(1);
    ASSERT_NE(back, nullptr);
    EXPECT_TRUE(back->excluded);
    EXPECT_TRUE(back->waypoints.empty());
    EXPECT_LT(result.getNode("a")->x, result.getNode("b")->x);
}

TEST(CommitGraphLayoutTest, EmptyGraph_EmptyResult) {
    LayoutResult result = CommitGraphLayout().layout(Graph());
    EXPECT_TRUE(result.empty());
}

TEST(CommitGraphLayoutTest, DanglingEdge_Throws) {
    Graph graph;
    graph.addNode("a");
    graph.addEdge("a", "ghost");
    EXPECT_THROW(CommitGraphLayout().layout(graph), DanglingReferenceError);
}

// --- Rendering ---

TEST(CommitGraphLayoutTest, Render_OneGlyphPerCommit) {
    LayoutResult result = CommitGraphLayout().layout(makeHistory());

    std::string unicode = TextExport().exportToString(result);
    EXPECT_EQ(countOf(unicode, "○"), 5);
    EXPECT_NE(unicode.find("merge"), std::string::npos);

    std::string ascii = TextExport(RenderOptions::forStyle(CharacterSet::Ascii)).exportToString(result);
    EXPECT_EQ(countOf(ascii, "*"), 5);
    EXPECT_EQ(ascii.find('>'), std::string::npos);
}
