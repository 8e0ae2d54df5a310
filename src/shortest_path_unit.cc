#include <stdlib.h>
#include <climits>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "adj_graph.hh"
#include "shortest_path.hh"
#include "unit.hh"

typedef adj_graph<std::string, double> sgraph;
typedef adj_graph<int, int> igraph;

void shortest_path_basic_test() {
    std::cout <<"shortest_path_basic_test\n";
    sgraph g;
    vertex a = g.add_vertex("A"), b = g.add_vertex("B"), c = g.add_vertex("C");
    vertex d = g.add_vertex("D");
    g.add_edge(a, b, 1.);
    g.add_edge(b, c, 2.);
    g.add_edge(a, c, 4.);

    shortest_path<sgraph> sp;
    CHECK(sp.run(g, "A") == 3);
    CHECK(sp.source() == a);
    CHECK(sp.dist(a) == 0. && sp.dist(b) == 1. && sp.dist(c) == 3.);
    CHECK(sp.parent(c) == b && sp.parent(b) == a);
    CHECK( ! sp.parent(a).valid());
    CHECK( ! sp.finalized(d));
    CHECK_THROWS(sp.dist(d), unreachable);

    sp_table<std::string, double> t = sp.table(g);
    CHECK(t.size() == 3);
    CHECK(t.distance("A") == 0. && t.distance("B") == 1.);
    CHECK(t.distance("C") == 3.);
    CHECK(t.at("C").has_pred && t.at("C").pred == "B");
    CHECK( ! t.at("A").has_pred);
    CHECK( ! t.contains("D"));
    CHECK_THROWS(t.at("D"), unreachable);
    CHECK( ! t.finalize("C", 0.)); // final entries stay
    CHECK(t.distance("C") == 3.);

    std::ostringstream s;
    t.print(s);
    CHECK(s.str() ==
          "Destination vertex:A  Path length:0   Previous vertex:None\n"
          "Destination vertex:B  Path length:1   Previous vertex:A\n"
          "Destination vertex:C  Path length:3   Previous vertex:B\n");

    // one-way edges are followed forward only
    sgraph h;
    vertex x = h.add_vertex("X"), y = h.add_vertex("Y");
    h.add_edge(x, y, 5., true);
    CHECK(sp.run(h, y) == 1);
    CHECK( ! sp.finalized(x));
    CHECK(sp.run(h, x) == 2);
    CHECK(sp.dist(y) == 5.);

    CHECK_THROWS(sp.run(h, "nowhere"), vertex_not_found);
    CHECK_THROWS(sp.run(h, vertex(5)), vertex_not_found);

    h.add_edge(y, h.add_vertex("Z"), -1.);
    CHECK_THROWS(sp.run(h, x), negative_weight);

    // a negative edge into an already finalized vertex
    sgraph n;
    vertex na = n.add_vertex("A"), nb = n.add_vertex("B");
    vertex nc = n.add_vertex("C");
    n.add_edge(na, nb, 1., true);
    n.add_edge(na, nc, 5., true);
    n.add_edge(nc, nb, -10., true);
    CHECK_THROWS(sp.run(n, "A"), negative_weight);

    // what is left of a two-way edge replaced one way still leads forward
    sgraph r;
    vertex rx = r.add_vertex("X"), ry = r.add_vertex("Y");
    r.add_edge(rx, ry, 1.);
    r.add_edge(ry, rx, 7., true);
    CHECK(sp.run(r, rx) == 2);
    CHECK(sp.dist(ry) == 1.);
    CHECK(sp.run(r, ry) == 2);
    CHECK(sp.dist(rx) == 7.);
}

// Distances by Bellman-Ford relaxation, INT_MAX when unreachable.
static std::vector<int> relax_all(const igraph &g, vertex s) {
    std::vector<int> dist(g.num_vertices(), INT_MAX);
    dist[s.id()] = 0;
    for (bool changed = true; changed; ) {
        changed = false;
        for (vertex u : g.vertices()) {
            if (dist[u.id()] == INT_MAX) continue;
            for (const igraph::edge_type *e : g.get_edges(u)) {
                vertex v = e->opposite(u);
                if (dist[u.id()] + e->element() < dist[v.id()]) {
                    dist[v.id()] = dist[u.id()] + e->element();
                    changed = true;
                }
            }
        }
    }
    return dist;
}

void shortest_path_test(int n, int deg) {
    std::cout <<"shortest_path_test: "<< n <<" "<< deg <<"\n";
    igraph g;
    for (int u = 0; u < n; ++u) g.add_vertex(u);
    std::vector<vertex> vs = g.vertices();
    for (int u = 0; u < n; ++u) {
        for (int d = 0; d < deg; ++d) {
            g.add_edge(vs[u], vs[rand() % n], rand() % 20, rand() % 3 == 0);
        }
    }
    shortest_path<igraph> sp;
    for (int i = 0; i < 5 && i < n; ++i) {
        vertex s = vs[rand() % n];
        int nvis = sp.run(g, s);
        std::vector<int> dist = relax_all(g, s);
        int nreach = 0;
        for (vertex v : vs) {
            if (dist[v.id()] == INT_MAX) {
                CHECK( ! sp.finalized(v));
                continue;
            }
            ++nreach;
            CHECK(sp.finalized(v));
            CHECK(sp.dist(v) == dist[v.id()]);
            if (v == s) {
                CHECK( ! sp.parent(v).valid());
            } else {
                vertex p = sp.parent(v);
                const igraph::edge_type *e = g.get_edge(p, v);
                CHECK(e != nullptr);
                CHECK(sp.dist(p) + e->element() == sp.dist(v));
            }
        }
        CHECK(nvis == nreach);
        // finalized by non decreasing distance
        for (int j = 1; j < nvis; ++j) {
            CHECK(sp.dist(sp.visit(j-1)) <= sp.dist(sp.visit(j)));
        }
    }
}
