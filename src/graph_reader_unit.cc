#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "graph_reader.hh"
#include "shortest_path.hh"
#include "unit.hh"

typedef adj_graph<int, double> graph;
typedef route_map<int, double> rmap;

void graph_reader_test() {
    std::cout <<"graph_reader_test\n";
    std::istringstream in(
        "Node\nid 1\n"
        "Node\nid 2\n"
        "Node\nid 3\n"
        "Edge\nsource 1\ntarget 2\nlength 1.5\noneway False\n"
        "Edge\nsource 2\ntarget 3\nlength 2\noneway True\n"
        "\n");
    graph g;
    read_counts n = read_graph(in, g);
    CHECK(n.nodes == 3 && n.edges == 2);
    CHECK(g.num_vertices() == 3 && g.num_edges() == 2);
    vertex v1 = g.vertex_by_label(1), v2 = g.vertex_by_label(2);
    vertex v3 = g.vertex_by_label(3);
    CHECK(g.get_edge(v2, v1) == g.get_edge(v1, v2));
    CHECK(g.get_edge(v1, v2)->element() == 1.5);
    CHECK(g.get_edge(v2, v3) != nullptr && g.get_edge(v3, v2) == nullptr);

    shortest_path<graph> sp;
    CHECK(sp.run(g, 1) == 3);
    CHECK(sp.dist(v3) == 3.5);

    std::istringstream in_map(
        "Node\r\nid 10\r\ncoords 53.1 -6.2\r\n"
        "Node\nid 11\ncoords 53.2 -6.3\n"
        "Edge\nsource 10\ntarget 11\nlength 900\ntime 42.5\noneway false\n");
    rmap m;
    n = read_route_map(in_map, m);
    CHECK(n.nodes == 2 && n.edges == 1);
    CHECK(m.coords(m.vertex_by_label(11)).second == -6.3);
    CHECK(m.path(11, 10)[0].cost == 42.5);

    const char *bad[] = {
        "Node\nid x\n",
        "Node\nid 1\nEdge\nsource 1\ntarget 2\nlength 1\noneway False\n",
        "Node\nid 1\nEdge\nsource 1\ntarget 1\nlength 1\n",
        "Node\nid 1\nEdge\nsource 1\ntarget 1\nlength 1\noneway maybe\n",
        "Node\nid 1\nNode\nnumber 2\n",
        "Node\nid 1\nFoo\n",
    };
    for (const char *text : bad) {
        std::istringstream bin(text);
        graph h;
        CHECK_THROWS(read_graph(bin, h), parse_error);
    }

    std::istringstream no_coords("Node\nid 1\ncoords 53\n");
    CHECK_THROWS(read_route_map(no_coords, m), parse_error);

    std::istringstream unknown("Node\nid 1\nEdge\nsource 1\ntarget 7\n");
    graph h;
    try {
        read_graph(unknown, h);
        CHECK(false);
    } catch (const parse_error &e) {
        CHECK(e.line == 5);
    }
}
