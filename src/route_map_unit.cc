#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "route_map.hh"
#include "unit.hh"

typedef route_map<int, double> rmap;

void route_map_test() {
    std::cout <<"route_map_test\n";
    rmap m;
    vertex a = m.add_vertex(1, 53.5, -6.25);
    vertex b = m.add_vertex(2, 53.25, -6.5);
    vertex c = m.add_vertex(3, 53., -6.75);
    vertex d = m.add_vertex(4, 52., -7.);
    vertex e = m.add_vertex(5);
    m.add_edge(a, b, 1.);
    m.add_edge(b, c, 2.);
    m.add_edge(a, c, 4.);
    m.add_edge(d, a, 1., true);

    CHECK(m.find_vertex(3) == c);
    CHECK( ! m.find_vertex(9).valid());
    CHECK(m.add_vertex_if_new(4) == d);
    CHECK(m.num_vertices() == 5);
    CHECK(m.coords(b).first == 53.25 && m.coords(b).second == -6.5);
    CHECK(std::isnan(m.coords(e).first));
    CHECK_THROWS(m.coords(vertex(12)), vertex_not_found);

    std::vector<rmap::hop> hops = m.path(1, 3);
    CHECK(hops.size() == 2);
    CHECK(hops[0].label == 3 && hops[0].cost == 3.);
    CHECK(hops[1].label == 2 && hops[1].cost == 1.);
    CHECK(hops[0].type == 'W' && hops[0].lat == 53. && hops[0].lon == -6.75);

    std::ostringstream s;
    write_route_csv(s, hops);
    CHECK(s.str() ==
          "Type,Latitude,Longitude,element,cost\n"
          "W,53,-6.75,3,3\n"
          "W,53.25,-6.5,2,1\n");

    // the source is never a hop of its own route
    CHECK(m.path(2, 2).empty());
    CHECK(m.path(2, 1).size() == 1 && m.path(2, 1)[0].label == 1);

    // 4 --> 1 is one-way: 4 is not reachable from 1
    CHECK_THROWS(m.path(1, 4), unreachable);
    CHECK(m.path(4, 3).size() == 3);
    CHECK_THROWS(m.path(1, 5), unreachable);
    CHECK_THROWS(m.path(1, 9), vertex_not_found);
    CHECK_THROWS(m.path(9, 1), vertex_not_found);

    // a table whose predecessor chain is broken fails instead of looping
    sp_table<int, double> broken;
    broken.finalize(3, 3., 2);
    broken.finalize(2, 1., 3);
    CHECK_THROWS(m.path(broken, 1, 3), unreachable);
    sp_table<int, double> cut;
    cut.finalize(3, 3., 2);
    CHECK_THROWS(m.path(cut, 1, 3), unreachable);

    std::ostringstream p;
    p << m;
    CHECK(p.str().find("|V| = 5; |E| = 4\nVertices: 1-2-3-4-5-") == 0);
    rmap big;
    for (int i = 0; i < 100; ++i) big.add_vertex(i, 0., 0.);
    p.str("");
    p << big;
    CHECK(p.str() == "|V| = 100; |E| = 0 (too many entries to be listed)");
}
