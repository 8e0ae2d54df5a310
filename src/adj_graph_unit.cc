#include <stdlib.h>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "adj_graph.hh"
#include "unit.hh"

typedef adj_graph<std::string, int> graph;

void adj_graph_basic_test() {
    std::cout <<"adj_graph_basic_test\n";
    graph g;
    vertex a = g.add_vertex("A"), b = g.add_vertex("B");
    vertex a2 = g.add_vertex("A");
    CHECK(a != a2); // same element, distinct vertices
    CHECK(g.num_vertices() == 3);
    CHECK(g.add_vertex_if_new("A") == a);
    vertex c = g.add_vertex_if_new("C");
    CHECK(g.num_vertices() == 4);
    CHECK(g.element(c) == "C");
    CHECK(g.find_vertex("B") == b);
    CHECK( ! g.find_vertex("Z").valid());
    CHECK_THROWS(g.vertex_by_label("Z"), vertex_not_found);

    // two-way edge: same edge from both ends
    graph::edge_type ab = g.add_edge(a, b, 1);
    CHECK(ab.start() == a && ab.end() == b);
    const graph::edge_type *e1 = g.get_edge(a, b), *e2 = g.get_edge(b, a);
    CHECK(e1 != nullptr && e1 == e2);
    CHECK(e1->element() == 1);
    CHECK(e1->opposite(a) == b && e1->opposite(b) == a);
    CHECK_THROWS(e1->opposite(c), vertex_not_found);

    // one-way edge: only from its start
    g.add_edge(b, c, 2, true);
    CHECK(g.get_edge(b, c) != nullptr);
    CHECK(g.get_edge(c, b) == nullptr);
    CHECK(g.degree(b) == 2 && g.degree(c) == 0);

    // self-loop
    g.add_edge(c, c, 3);
    CHECK(g.degree(c) == 1);
    CHECK(g.get_edge(c, c)->opposite(c) == c);
    CHECK(g.num_edges() == 3);
    CHECK(g.edges().size() == 3);

    // one-way edge over half of a two-way edge: the other half stays
    g.add_edge(b, a, 7, true);
    CHECK(g.get_edge(a, b)->element() == 1);
    CHECK(g.get_edge(b, a)->element() == 7);
    CHECK(g.get_edge(a, b)->opposite(a) == b);
    CHECK(g.num_edges() == 4);
    CHECK(g.edges().size() == 4);
    g.add_edge(a, b, 8);
    CHECK(g.get_edge(a, b) == g.get_edge(b, a));
    CHECK(g.get_edge(b, a)->element() == 8);
    CHECK(g.num_edges() == 3);
    CHECK(g.edges().size() == 3);

    // same, overwriting the half at the start of the two-way edge
    graph k;
    vertex x1 = k.add_vertex("X"), y1 = k.add_vertex("Y");
    k.add_edge(x1, y1, 1);
    k.add_edge(x1, y1, 2, true);
    CHECK(k.get_edge(y1, x1)->element() == 1);
    CHECK(k.get_edge(x1, y1)->element() == 2);
    CHECK(k.num_edges() == 2);
    CHECK(k.edges().size() == 2);
    CHECK(k.degree(x1) == 1 && k.degree(y1) == 1);

    // absent vertices
    graph h;
    vertex x = h.add_vertex("X");
    vertex absent(17);
    CHECK_THROWS(g.add_edge(a, absent, 1), vertex_not_found);
    CHECK_THROWS(g.add_edge(vertex(), a, 1), vertex_not_found);
    CHECK_THROWS(g.degree(absent), vertex_not_found);
    CHECK_THROWS(g.get_edges(absent), vertex_not_found);
    CHECK(g.get_edge(a, absent) == nullptr);
    CHECK(h.get_edges(x).empty());
    CHECK(g.num_edges() == 3);

    std::ostringstream s;
    s << h;
    CHECK(s.str() == "|V| = 1; |E| = 0\nVertices: X-\nEdges: ");
    h.add_edge(x, h.add_vertex("Y"), 4);
    s.str("");
    s << h;
    CHECK(s.str() == "|V| = 2; |E| = 1\nVertices: X-Y-\nEdges: (X--Y : 4) ");
}

// k two-way and m one-way edges between distinct pairs: k + m edges.
void adj_graph_test(int n, int deg) {
    std::cout <<"adj_graph_test: "<< n <<" "<< deg <<"\n";
    graph g;
    for (int u = 0; u < n; ++u) g.add_vertex(std::to_string(u));
    std::vector<vertex> vs = g.vertices();
    size_t k = 0, m = 0;
    for (int u = 0; u < n; ++u) {
        for (int d = 1; d <= deg && u + d < n; ++d) {
            bool oneway = rand() % 2 == 0;
            g.add_edge(vs[u], vs[u + d], u, oneway);
            if (oneway) ++m; else ++k;
        }
    }
    CHECK(g.num_edges() == k + m);
    CHECK(g.edges().size() == k + m);
    size_t sum_deg = 0;
    for (vertex u : vs) sum_deg += g.degree(u);
    CHECK(sum_deg == 2 * k + m);
    for (const graph::edge_type *e : g.edges()) {
        CHECK(g.get_edge(e->start(), e->end()) == e);
        const graph::edge_type *r = g.get_edge(e->end(), e->start());
        CHECK(r == nullptr || r == e);
    }

    std::vector<std::pair<vertex, vertex> > pairs;
    for (int u = 0; u + 1 < n; u += 2) pairs.push_back(std::make_pair(vs[u], vs[u+1]));
    g.add_edge_pairs(pairs);
    for (const auto &p : pairs) {
        CHECK(g.get_edge(p.first, p.second) == g.get_edge(p.second, p.first));
        CHECK(g.get_edge(p.first, p.second)->element() == 0);
    }
}
