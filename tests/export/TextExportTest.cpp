#include <gtest/gtest.h>
#include <charta/charta.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace charta;

// ============================================================================
// TextExportTest - 텍스트 렌더링 테스트 (ASCII / Unicode)
// ============================================================================

namespace {

LayoutResult layoutPair(EdgeKind kind = EdgeKind::Arrow, const std::string& label = "") {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B", kind, label);
    return SugiyamaLayout().layout(graph);
}

LayoutResult layoutDecision() {
    Graph graph;
    graph.addNode("D");
    graph.addNode("Y");
    graph.addNode("N");
    graph.addEdge("D", "Y");
    graph.addEdge("D", "N");
    return SugiyamaLayout().layout(graph);
}

Graph makeMixedGraph() {
    Graph graph;
    graph.addNode("start", "Start", NodeShape::Rounded);
    graph.addNode("check", "Valid?", NodeShape::Diamond);
    graph.addNode("save", "Save", NodeShape::Subroutine);
    graph.addNode("db", "Store", NodeShape::Cylinder);
    graph.addNode("fail", "Fail", NodeShape::Hexagon);
    graph.addNode("note", "Note", NodeShape::Asymmetric);
    graph.addNode("io", "Input", NodeShape::Parallelogram);
    graph.addNode("trap", "Trap", NodeShape::Trapezoid);
    graph.addNode("c", "C", NodeShape::Circle);
    graph.addEdge("start", "check");
    graph.addEdge("check", "save", EdgeKind::Arrow, "yes");
    graph.addEdge("check", "fail", EdgeKind::DottedArrow, "no");
    graph.addEdge("save", "db", EdgeKind::ThickArrow);
    graph.addEdge("fail", "start");
    graph.addEdge("fail", "note", EdgeKind::Line);
    graph.addEdge("io", "trap", EdgeKind::OpenArrow);
    graph.addEdge("trap", "c", EdgeKind::CrossArrow);
    graph.addSubgraph("Storage", {"save", "db"});
    return graph;
}

bool isSevenBit(const std::string& text) {
    for (unsigned char c : text) {
        if (c >= 0x80) return false;
    }
    return true;
}

}  // namespace

// --- Exact output ---

TEST(TextExportTest, TwoNodes_Unicode) {
    std::string out = TextExport().exportToString(layoutPair());

    EXPECT_EQ(out,
              "\n"
              " ┌───┐\n"
              " │ A │\n"
              " └───┘\n"
              "   │\n"
              "   │\n"
              "   │\n"
              "   ▼\n"
              " ┌───┐\n"
              " │ B │\n"
              " └───┘");
}

TEST(TextExportTest, TwoNodes_Ascii) {
    TextExport exporter(RenderOptions::forStyle(CharacterSet::Ascii));
    std::string out = exporter.exportToString(layoutPair());

    EXPECT_EQ(out,
              "\n"
              " +---+\n"
              " | A |\n"
              " +---+\n"
              "   |\n"
              "   |\n"
              "   |\n"
              "   v\n"
              " +---+\n"
              " | B |\n"
              " +---+");
}

// --- Style invariants ---

TEST(TextExportTest, Ascii_EmitsOnlySevenBit) {
    Graph graph = makeMixedGraph();
    LayoutResult result = SugiyamaLayout().layout(graph);

    std::string ascii = TextExport(RenderOptions::forStyle(CharacterSet::Ascii)).exportToString(result);
    std::string unicode = TextExport().exportToString(result);

    EXPECT_TRUE(isSevenBit(ascii));
    EXPECT_NE(unicode.find("┌"), std::string::npos);
    EXPECT_NE(unicode.find("╔"), std::string::npos);
}

TEST(TextExportTest, EveryStyle_RendersMixedGraph) {
    Graph graph = makeMixedGraph();
    LayoutResult result = SugiyamaLayout().layout(graph);

    for (CharacterSet style : {CharacterSet::Ascii, CharacterSet::Unicode,
                               CharacterSet::UnicodeMath, CharacterSet::Compact}) {
        std::string out;
        EXPECT_NO_THROW(out = TextExport(RenderOptions::forStyle(style)).exportToString(result))
            << characterSetName(style);
        EXPECT_NE(out.find("Start"), std::string::npos) << characterSetName(style);
    }
}

TEST(TextExportTest, Output_NoTrailingNewlineOrSpaces) {
    Graph graph = makeMixedGraph();
    std::string out = TextExport().exportToString(SugiyamaLayout().layout(graph));

    ASSERT_FALSE(out.empty());
    EXPECT_NE(out.back(), '\n');

    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            EXPECT_NE(line.back(), ' ');
        }
    }
}

// --- Edges ---

TEST(TextExportTest, FanOutJunction_IsTee) {
    LayoutResult result = layoutDecision();
    const GridPoint junction = *result.edges()[0].junction;

    Canvas unicode = TextExport().renderCanvas(result);
    EXPECT_EQ(unicode.at(junction.x, junction.y), U'┴');
    EXPECT_NE(unicode.at(junction.x, junction.y), U'│');

    Canvas ascii = TextExport(RenderOptions::forStyle(CharacterSet::Ascii)).renderCanvas(result);
    EXPECT_EQ(ascii.at(junction.x, junction.y), U'+');
}

TEST(TextExportTest, FanOutBranches_TurnDownwardAtTargets) {
    LayoutResult result = layoutDecision();
    Canvas canvas = TextExport().renderCanvas(result);

    const PositionedNode* y = result.getNode("Y");
    const PositionedNode* n = result.getNode("N");
    const int row = result.edges()[0].junction->y;

    EXPECT_EQ(canvas.at(y->center().x, row), U'┌');
    EXPECT_EQ(canvas.at(n->center().x, row), U'┐');
    EXPECT_EQ(canvas.at(y->center().x, y->y - 1), U'▼');
    EXPECT_EQ(canvas.at(n->center().x, n->y - 1), U'▼');
}

TEST(TextExportTest, DottedAndThickLines) {
    Canvas dotted = TextExport().renderCanvas(layoutPair(EdgeKind::DottedLine));
    Canvas thick = TextExport().renderCanvas(layoutPair(EdgeKind::ThickArrow));

    EXPECT_EQ(dotted.at(3, 5), U'┆');
    EXPECT_EQ(thick.at(3, 5), U'┃');
    EXPECT_EQ(thick.at(3, 7), U'▼');
}

TEST(TextExportTest, LineKind_HasNoHead) {
    Canvas canvas = TextExport().renderCanvas(layoutPair(EdgeKind::Line));

    EXPECT_EQ(canvas.at(3, 7), U'│');
}

TEST(TextExportTest, OpenAndCrossHeads) {
    Canvas open = TextExport().renderCanvas(layoutPair(EdgeKind::OpenArrow));
    Canvas cross = TextExport().renderCanvas(layoutPair(EdgeKind::CrossArrow));

    EXPECT_EQ(open.at(3, 7), U'○');
    EXPECT_EQ(cross.at(3, 7), U'×');
}

TEST(TextExportTest, InvisibleEdge_NotDrawn) {
    std::string out = TextExport().exportToString(layoutPair(EdgeKind::Invisible, "hidden"));

    EXPECT_EQ(out.find("│\n   │"), std::string::npos);
    EXPECT_EQ(out.find("hidden"), std::string::npos);
}

TEST(TextExportTest, EdgeLabel_DrawnAtMidpoint) {
    LayoutResult result = layoutPair(EdgeKind::Arrow, "yes");
    const GridPoint at = *result.edges()[0].labelPosition;

    Canvas canvas = TextExport().renderCanvas(result);
    EXPECT_EQ(canvas.at(at.x - 1, at.y), U'y');
    EXPECT_EQ(canvas.at(at.x, at.y), U'e');
    EXPECT_EQ(canvas.at(at.x + 1, at.y), U's');

    std::string without =
        TextExport(RenderOptions().setDrawEdgeLabels(false)).exportToString(result);
    EXPECT_EQ(without.find("yes"), std::string::npos);
}

TEST(TextExportTest, BackEdge_DrawnAroundNodes) {
    Graph graph;
    graph.addNode("A");
    graph.addNode("B");
    graph.addEdge("A", "B");
    graph.addEdge("B", "A");

    LayoutResult result = SugiyamaLayout().layout(graph);
    Canvas canvas = TextExport().renderCanvas(result);

    const PositionedNode* a = result.getNode("A");
    EXPECT_EQ(canvas.at(a->center().x, a->y - 1), U'▼');
    // Node interiors stay clean
    EXPECT_EQ(canvas.at(a->center().x, a->center().y), U'A');
}

// --- Groups ---

TEST(TextExportTest, GroupTitle_AvoidsEdgeCrossings) {
    Graph graph;
    graph.addNode("client", "Client");
    graph.addNode("db", "Primary database");
    graph.addEdge("client", "db");
    graph.addSubgraph("Data", {"db"});

    LayoutResult result = SugiyamaLayout().layout(graph);
    Canvas canvas = TextExport().renderCanvas(result);
    std::string out = canvas.toString();

    const PositionedGroup& group = result.groups()[0];
    EXPECT_EQ(canvas.at(group.bounds.x, group.bounds.y), U'╔');
    EXPECT_NE(out.find(" Data "), std::string::npos) << out;

    // The arrow into the member survives on the border row
    const PositionedNode* db = result.getNode("db");
    EXPECT_EQ(canvas.at(db->center().x, db->y - 1), U'▼');
}

TEST(TextExportTest, GroupBorder_Ascii) {
    Graph graph;
    graph.addNode("A");
    graph.addSubgraph("G", {"A"});

    LayoutResult result = SugiyamaLayout().layout(graph);
    Canvas canvas = TextExport(RenderOptions::forStyle(CharacterSet::Ascii)).renderCanvas(result);

    const Rect& bounds = result.groups()[0].bounds;
    EXPECT_EQ(canvas.at(bounds.x, bounds.y), U'#');
    EXPECT_EQ(canvas.at(bounds.x, bounds.y + 1), U'#');
    EXPECT_EQ(canvas.at(bounds.x + 1, bounds.y + bounds.height - 1), U'=');
}

// --- Shapes ---

TEST(TextExportTest, RoundedAndDiamondShapes) {
    Graph graph;
    graph.addNode("r", "R", NodeShape::Rounded);
    graph.addNode("d", "D", NodeShape::Diamond);
    graph.addEdge("r", "d");

    LayoutResult result = SugiyamaLayout().layout(graph);
    Canvas canvas = TextExport().renderCanvas(result);

    const PositionedNode* r = result.getNode("r");
    EXPECT_EQ(canvas.at(r->x, r->y), U'╭');
    EXPECT_EQ(canvas.at(r->x + r->width - 1, r->y + r->height - 1), U'╯');

    const PositionedNode* d = result.getNode("d");
    EXPECT_EQ(canvas.at(d->x, d->center().y), U'<');
    EXPECT_EQ(canvas.at(d->x + d->width - 1, d->center().y), U'>');
}

TEST(TextExportTest, TerminalMarkers_StartAndEnd) {
    Graph graph;
    graph.addNode("s", "", NodeShape::Terminal);
    graph.addNode("A");
    graph.addNode("e", "", NodeShape::Terminal);
    graph.addEdge("s", "A");
    graph.addEdge("A", "e");

    LayoutResult result = SugiyamaLayout().layout(graph);
    Canvas canvas = TextExport().renderCanvas(result);

    GridPoint start = result.getNode("s")->center();
    GridPoint end = result.getNode("e")->center();
    EXPECT_EQ(canvas.at(start.x, start.y), U'●');
    EXPECT_EQ(canvas.at(end.x, end.y), U'○');
}

TEST(TextExportTest, WideLabel_RendersBothCells) {
    Graph graph;
    graph.addNode("k", "한글");

    LayoutResult result = SugiyamaLayout().layout(graph);
    std::string out = TextExport().exportToString(result);

    EXPECT_NE(out.find("│ 한글 │"), std::string::npos) << out;
}

// --- Glyph tables ---

TEST(TextExportTest, CustomTableMissingRole_Throws) {
    GlyphTable table = GlyphTable::builtin(CharacterSet::Unicode);
    table.unset(GlyphRole::ArrowDown);

    TextExport exporter(RenderOptions().setGlyphs(table));
    EXPECT_THROW(exporter.exportToString(layoutPair()), GlyphUnmappedError);
}

TEST(TextExportTest, CustomTableMissingUnusedRole_Renders) {
    GlyphTable table = GlyphTable::builtin(CharacterSet::Unicode);
    table.unset(GlyphRole::CrossHead);

    TextExport exporter(RenderOptions().setGlyphs(table));
    EXPECT_NO_THROW(exporter.exportToString(layoutPair()));
}

TEST(TextExportTest, CustomGlyph_Overrides) {
    GlyphTable table = GlyphTable::builtin(CharacterSet::Ascii);
    table.set(GlyphRole::ArrowDown, U'V');

    Canvas canvas = TextExport(RenderOptions().setGlyphs(table)).renderCanvas(layoutPair());
    EXPECT_EQ(canvas.at(3, 7), U'V');
}

// --- Exporter interface ---

TEST(TextExportTest, EmptyLayout_EmptyString) {
    EXPECT_EQ(TextExport().exportToString(LayoutResult{}), "");
}

TEST(TextExportTest, ExporterMetadata) {
    TextExport exporter;
    EXPECT_EQ(exporter.fileExtension(), "txt");
    EXPECT_EQ(exporter.mimeType(), "text/plain; charset=utf-8");
}

TEST(TextExportTest, ExportToStream_MatchesString) {
    LayoutResult result = layoutPair();
    TextExport exporter;

    std::ostringstream out;
    exporter.exportToStream(result, out);
    EXPECT_EQ(out.str(), exporter.exportToString(result));
}

TEST(TextExportTest, ExportToFile_WritesText) {
    LayoutResult result = layoutPair();
    TextExport exporter;
    auto path = std::filesystem::temp_directory_path() / "charta_text_export_test.txt";

    ASSERT_TRUE(exporter.exportToFile(result, path.string()));

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();
    std::remove(path.string().c_str());

    EXPECT_EQ(buffer.str(), exporter.exportToString(result));
}

TEST(TextExportTest, ExportToFile_BadPathFails) {
    EXPECT_FALSE(TextExport().exportToFile(layoutPair(), "/nonexistent/charta/out.txt"));
}
