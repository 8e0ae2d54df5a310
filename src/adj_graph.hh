#ifndef ADJ_GRAPH_HH
#define ADJ_GRAPH_HH

#include <stddef.h>
#include <map>
#include <vector>
#include <string>
#include <sstream>
#include <utility>
#include <iostream>

#include "edge.hh"
#include "errors.hh"

/**
 * Graph as an adjacency map: each vertex maps its neighbors to the edge
 * joining them. Vertices and edges live in arenas owned by the graph and
 * are never reclaimed.
 *
 * A two-way edge is the same edge (same arena index) in the maps of both
 * endpoints, a one-way edge or a self-loop is only in the map of its start.
 * Adding an edge only overwrites the map entries it occupies: what remains
 * of a replaced two-way edge is a one-way edge the other way.
 *
 * Example:
 *   typedef adj_graph<int, double> graph;
 *   graph g;
 *   vertex a = g.add_vertex(1), b = g.add_vertex(2);
 *   g.add_edge(a, b, 3.5);        // a -- b
 *   g.add_edge(b, a, 1., true);   // b --> a costs 1, a --> b still 3.5
 *   for (vertex u : g.vertices())
 *      for (const graph::edge_type *e : g.get_edges(u))
 *         std::cout << g.element(e->opposite(u)) <<" "<< e->element() <<"\n";
 */

template<typename L, // vertex element (label) type
         typename W> // edge element (weight) type
class adj_graph {
public:
    typedef L label;
    typedef W weight;
    typedef ::edge<W> edge_type;

private:
    std::vector<L> elts_;                    // vertex arena
    std::vector<edge_type> edg_;             // edge arena
    std::vector<std::map<int, size_t> > adj_; // neighbor id -> edge index

public:
    adj_graph() {}
    virtual ~adj_graph() {}

    size_t num_vertices() const { return elts_.size(); }

    // Each distinct edge counts once, one-way edges included.
    size_t num_edges() const {
        size_t m = 0;
        for (size_t u = 0; u < adj_.size(); ++u) {
            for (const auto &we : adj_[u]) {
                if (listed_at(u, we.second)) ++m;
            }
        }
        return m;
    }

    bool has_vertex(vertex v) const {
        return v.valid() && (size_t) v.id() < elts_.size();
    }

    const L &element(vertex v) const {
        check_vertex(v, "element");
        return elts_[v.id()];
    }

    std::vector<vertex> vertices() const {
        std::vector<vertex> vs;
        vs.reserve(elts_.size());
        for (size_t u = 0; u < elts_.size(); ++u) vs.push_back(vertex(u));
        return vs;
    }

    /** Always creates a new vertex, even if another has an equal element. */
    virtual vertex add_vertex(const L &e) {
        vertex v(elts_.size());
        elts_.push_back(e);
        adj_.push_back(std::map<int, size_t>());
        return v;
    }

    vertex add_vertex_if_new(const L &e) {
        vertex v = find_vertex(e);
        if (v.valid()) return v;
        return add_vertex(e);
    }

    /** First vertex whose element equals [e], or vertex() if none.
     *  Linear scan, subclasses may index labels. */
    virtual vertex find_vertex(const L &e) const {
        for (size_t u = 0; u < elts_.size(); ++u) {
            if (elts_[u] == e) return vertex(u);
        }
        return vertex();
    }

    vertex vertex_by_label(const L &e) const {
        vertex v = find_vertex(e);
        if ( ! v.valid())
            throw vertex_not_found("adj_graph: no vertex with label "
                                   + to_text(e));
        return v;
    }

    /** Add and return the edge v --> w (and w --> v unless [oneway]).
     *  Edges previously added from v to w (and from w to v unless
     *  [oneway]) are replaced. */
    edge_type add_edge(vertex v, vertex w, const W &e, bool oneway = false) {
        check_vertex(v, "add_edge");
        check_vertex(w, "add_edge");
        size_t i = edg_.size();
        edg_.push_back(edge_type(v, w, e));
        adj_[v.id()][w.id()] = i;
        if ( ! oneway && v != w) {
            adj_[w.id()][v.id()] = i;
        }
        return edg_[i];
    }

    void add_edge_pairs(const std::vector<std::pair<vertex, vertex> > &pairs,
                        const W &e = W()) {
        for (const auto &vw : pairs) add_edge(vw.first, vw.second, e);
    }

    // nullptr if there is no edge from v to w.
    const edge_type *get_edge(vertex v, vertex w) const {
        if ( ! has_vertex(v) || ! has_vertex(w)) return nullptr;
        auto it = adj_[v.id()].find(w.id());
        if (it == adj_[v.id()].end()) return nullptr;
        return &edg_[it->second];
    }

    std::vector<const edge_type *> get_edges(vertex v) const {
        check_vertex(v, "get_edges");
        std::vector<const edge_type *> es;
        es.reserve(adj_[v.id()].size());
        for (const auto &we : adj_[v.id()]) es.push_back(&edg_[we.second]);
        return es;
    }

    size_t degree(vertex v) const {
        check_vertex(v, "degree");
        return adj_[v.id()].size();
    }

    // Each edge is listed once, under its start vertex when it is there.
    std::vector<const edge_type *> edges() const {
        std::vector<const edge_type *> es;
        for (size_t u = 0; u < adj_.size(); ++u) {
            for (const auto &we : adj_[u]) {
                if (listed_at(u, we.second)) es.push_back(&edg_[we.second]);
            }
        }
        return es;
    }

    virtual void print(std::ostream &os) const {
        os << "|V| = " << num_vertices() << "; |E| = " << num_edges();
        os << "\nVertices: ";
        for (const L &e : elts_) os << e << "-";
        os << "\nEdges: ";
        for (const edge_type *e : edges()) {
            os << "(" << element(e->start()) << "--" << element(e->end())
               << " : " << e->element() << ") ";
        }
    }

protected:

    void check_vertex(vertex v, const char *what) const {
        if ( ! has_vertex(v))
            throw vertex_not_found(std::string("adj_graph.") + what
                                   + "(): not a vertex: "
                                   + std::to_string(v.id()));
    }

    template<typename T>
    static std::string to_text(const T &x) {
        std::ostringstream s;
        s << x;
        return s.str();
    }

private:

    // Edge [i] in the map of [u] is counted there, unless its start also
    // holds it (a two-way edge seen from its end).
    bool listed_at(size_t u, size_t i) const {
        const edge_type &e = edg_[i];
        int s = e.start().id();
        if (s == (int) u) return true;
        auto it = adj_[s].find(e.end().id());
        return it == adj_[s].end() || it->second != i;
    }

}; // adj_graph

template<typename L, typename W>
std::ostream &operator<<(std::ostream &os, const adj_graph<L, W> &g) {
    g.print(os);
    return os;
}

#endif // ADJ_GRAPH_HH
