#include <charta/charta.h>
#include <iostream>

int main(int argc, char** argv) {
    using namespace charta;

    CharacterSet style = CharacterSet::Unicode;
    if (argc > 1) {
        auto parsed = parseCharacterSet(argv[1]);
        if (!parsed) {
            std::cerr << "Unknown style '" << argv[1]
                      << "' (ascii, unicode, unicode-math, compact)\n";
            return 1;
        }
        style = *parsed;
    }

    // 1. Decision flowchart with a loop
    {
        Graph graph(Direction::TopDown);
        graph.addNode("start", "Start", NodeShape::Rounded);
        graph.addNode("check", "Ready?", NodeShape::Diamond);
        graph.addNode("work", "Do work");
        graph.addNode("wait", "Wait", NodeShape::Hexagon);
        graph.addNode("db", "Store", NodeShape::Cylinder);

        graph.addEdge("start", "check");
        graph.addEdge("check", "work", EdgeKind::Arrow, "yes");
        graph.addEdge("check", "wait", EdgeKind::DottedArrow, "no");
        graph.addEdge("wait", "check");
        graph.addEdge("work", "db", EdgeKind::ThickArrow);

        Diagram diagram(DiagramKind::Flowchart);
        LayoutResult result = diagram.layout(graph);
        std::cout << diagram.render(result, style) << "\n\n";
    }

    // 2. State machine, left to right, with a subgraph
    {
        Graph graph(Direction::LeftRight);
        graph.addNode("s0", "", NodeShape::Terminal);
        graph.addNode("idle", "Idle");
        graph.addNode("run", "Running");
        graph.addNode("done", "", NodeShape::Terminal);

        graph.addEdge("s0", "idle");
        graph.addEdge("idle", "run", EdgeKind::Arrow, "go");
        graph.addEdge("run", "done");
        graph.addSubgraph("active", {"idle", "run"});

        Diagram diagram(DiagramKind::State);
        std::cout << diagram.draw(graph, style) << "\n\n";
    }

    // 3. Dangling reference
    {
        Graph graph;
        graph.addNode("A");
        graph.addEdge("A", "Ghost");

        try {
            std::cout << Diagram().draw(graph, style) << '\n';
        } catch (const DanglingReferenceError& e) {
            std::cerr << "error: " << e.what() << '\n';
        }
    }

    return 0;
}
