#ifndef ROUTE_MAP_HH
#define ROUTE_MAP_HH

#include <stddef.h>
#include <limits>
#include <unordered_map>
#include <vector>
#include <utility>
#include <sstream>
#include <iostream>

#include "adj_graph.hh"
#include "shortest_path.hh"
#include "errors.hh"

/** One step of a route: where the vertex is, its label, and the cost of
 *  reaching it from the source. */
template<typename L, typename WL>
struct route_hop {
    char type; // 'W' for waypoint
    double lat, lon;
    L label;
    WL cost;
};


/**
 * Graph of a road map: every vertex has coordinates and labels are
 * hashed, so that finding a vertex by label is O(1) instead of a scan.
 * Labels are expected to be unique; adding a label again re-points the
 * index to the new vertex.
 *
 * Example:
 *   route_map<int, double> m;
 *   vertex a = m.add_vertex(10, 52.1, -6.2), b = m.add_vertex(11, 52.2, -6.3);
 *   m.add_edge(a, b, 30.);
 *   write_route_csv(std::cout, m.path(10, 11));
 */
template<typename L, typename W>
class route_map : public adj_graph<L, W> {
public:
    typedef adj_graph<L, W> graph;
    typedef route_hop<L, W> hop;
    typedef std::pair<double, double> coordinates;

private:
    std::vector<coordinates> coords_; // by vertex id, written once
    std::unordered_map<L, vertex> index_;

public:

    // Vertex without known coordinates (NaN).
    vertex add_vertex(const L &e) override {
        double nan = std::numeric_limits<double>::quiet_NaN();
        return add_vertex(e, nan, nan);
    }

    vertex add_vertex(const L &e, double lat, double lon) {
        vertex v = graph::add_vertex(e);
        coords_.push_back(coordinates(lat, lon));
        index_[e] = v;
        return v;
    }

    vertex find_vertex(const L &e) const override {
        auto it = index_.find(e);
        if (it == index_.end()) return vertex();
        return it->second;
    }

    const coordinates &coords(vertex v) const {
        this->check_vertex(v, "coords");
        return coords_[v.id()];
    }

    /** Shortest route from label [s] to label [t], listed from [t] back to
     *  the hop after [s]: the source itself is not a hop, so the route from
     *  [s] to [s] is empty. Throws unreachable if [t] cannot be reached
     *  from [s]. */
    std::vector<hop> path(const L &s, const L &t) const {
        vertex vs = this->vertex_by_label(s);
        if ( ! this->find_vertex(t).valid()) {
            std::ostringstream msg;
            msg << "route_map.path(): no vertex with label " << t;
            throw vertex_not_found(msg.str());
        }
        shortest_path<route_map> sp;
        sp.run(*this, vs);
        return path(sp.table(*this), s, t);
    }

    // Walks predecessors in [closed] from [t] to [s].
    std::vector<hop> path(const sp_table<L, W> &closed,
                          const L &s, const L &t) const {
        std::vector<hop> hops;
        L w = t;
        // a simple path visits each closed vertex at most once
        for (size_t step = 0; step < closed.size(); ++step) {
            const typename sp_table<L, W>::closed &c = closed.at(w);
            if (w == s) return hops;
            const coordinates &xy = coords(this->vertex_by_label(w));
            hop h = { 'W', xy.first, xy.second, w, c.dist };
            hops.push_back(h);
            if ( ! c.has_pred) break;
            w = c.pred;
        }
        std::ostringstream msg;
        msg << "route_map.path(): no route from " << s << " to " << t;
        throw unreachable(msg.str());
    }

    void print(std::ostream &os) const override {
        if (this->num_vertices() < 100) graph::print(os);
        else os << "|V| = " << this->num_vertices()
                << "; |E| = " << this->num_edges()
                << " (too many entries to be listed)";
    }

}; // route_map


template<typename L, typename WL>
void write_route_csv(std::ostream &os,
                     const std::vector<route_hop<L, WL> > &hops) {
    std::streamsize prec = os.precision(12);
    os << "Type,Latitude,Longitude,element,cost\n";
    for (const route_hop<L, WL> &h : hops) {
        os << h.type <<","<< h.lat <<","<< h.lon
           <<","<< h.label <<","<< h.cost <<"\n";
    }
    os.precision(prec);
}

#endif // ROUTE_MAP_HH
