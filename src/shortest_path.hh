#ifndef SHORTEST_PATH_HH
#define SHORTEST_PATH_HH

#include <stddef.h>
#include <map>
#include <vector>
#include <string>
#include <utility>
#include <sstream>
#include <iostream>

#include "apq.hh"
#include "edge.hh"
#include "errors.hh"

/**
 * Closed set of a shortest path search: for each finalized label, its
 * distance from the source and the label of its predecessor (none for the
 * source). Entries are never modified once inserted.
 */
template<typename L, typename WL>
class sp_table {
public:
    struct closed {
        WL dist;
        bool has_pred;
        L pred;
    };
    typedef std::map<L, closed> map_type;
    typedef typename map_type::const_iterator const_iterator;

private:
    map_type closed_;

public:
    size_t size() const { return closed_.size(); }
    bool contains(const L &v) const { return closed_.count(v) > 0; }

    const closed &at(const L &v) const {
        auto it = closed_.find(v);
        if (it == closed_.end()) {
            std::ostringstream s;
            s << "sp_table: " << v << " was not reached";
            throw unreachable(s.str());
        }
        return it->second;
    }

    WL distance(const L &v) const { return at(v).dist; }

    // Returns false if the label is already final.
    bool finalize(const L &v, WL d) {
        closed c = { d, false, L() };
        return closed_.insert(std::make_pair(v, c)).second;
    }

    bool finalize(const L &v, WL d, const L &p) {
        closed c = { d, true, p };
        return closed_.insert(std::make_pair(v, c)).second;
    }

    const_iterator begin() const { return closed_.begin(); }
    const_iterator end() const { return closed_.end(); }

    void print(std::ostream &os) const {
        for (const auto &vc : closed_) {
            os << "Destination vertex:" << vc.first
               << "  Path length:" << vc.second.dist
               << "   Previous vertex:";
            if (vc.second.has_pred) os << vc.second.pred;
            else os << "None";
            os << "\n";
        }
    }
};


/**
 * Dijkstra's algorithm over an adj_graph (or a subclass), with an
 * adaptable heap keyed by tentative distance: a vertex enters the queue
 * once, and later improvements lower its key through its handle.
 *
 * Edge elements are the costs and must not be negative.
 *
 * Example :
 *    typedef adj_graph<std::string, double> graph;
 *    shortest_path<graph> sp;
 *    sp.run(g, "A");
 *    double d = sp.dist(g.vertex_by_label("C"));
 *    sp_table<std::string, double> t = sp.table(g);
 */
template<typename G,  // graph type, adj_graph<L, W> or derived
         typename WL = typename G::weight> // distance type
class shortest_path {
public:
    typedef typename G::label L;
    typedef typename G::weight W;
    typedef typename G::edge_type edge_type;
    typedef apq<WL, vertex> queue;
    typedef sp_table<L, WL> table_type;

private:
    std::vector<WL> dist_;
    std::vector<vertex> parent_;
    std::vector<bool> finalized_, in_queue_;
    std::vector<typename queue::handle> loc_; // handles of queued vertices
    std::vector<vertex> visit_; // finalization order
    queue queue_;
    vertex src_;

public:

    shortest_path() {}

    int nvis() const { return visit_.size(); }
    vertex visit(int i) const { return visit_[i]; }
    vertex source() const { return src_; }
    bool finalized(vertex v) const {
        return v.valid() && (size_t) v.id() < finalized_.size()
            && finalized_[v.id()];
    }

    WL dist(vertex v) const {
        check_finalized(v);
        return dist_[v.id()];
    }

    // vertex() for the source.
    vertex parent(vertex v) const {
        check_finalized(v);
        return parent_[v.id()];
    }

    int run(const G &g, const L &s) { return run(g, g.vertex_by_label(s)); }

    // returns number of finalized vertices
    int run(const G &g, vertex s) {
        if ( ! g.has_vertex(s))
            throw vertex_not_found("shortest_path.run(): not a vertex: "
                                   + std::to_string(s.id()));
        clear(g.num_vertices());
        src_ = s;
        in_queue_[s.id()] = true;
        loc_[s.id()] = queue_.add(WL(), s);

        while ( ! queue_.empty()) {
            typename queue::item it = queue_.remove_min();
            WL du = it.first;
            vertex u = it.second;
            in_queue_[u.id()] = false;
            finalized_[u.id()] = true;
            dist_[u.id()] = du;
            visit_.push_back(u);
            for (const edge_type *e : g.get_edges(u)) {
                // also into finalized vertices, whose distance it would break
                if (e->element() < W()) {
                    std::ostringstream msg;
                    msg << "shortest_path.run(): negative cost "
                        << e->element() << " on an edge of "
                        << g.element(u);
                    throw negative_weight(msg.str());
                }
                vertex w = e->opposite(u);
                if (finalized_[w.id()]) continue;
                WL dw = du + (WL) e->element();
                if ( ! in_queue_[w.id()]) {
                    in_queue_[w.id()] = true;
                    parent_[w.id()] = u;
                    loc_[w.id()] = queue_.add(dw, w);
                } else if (dw < queue_.get_key(loc_[w.id()])) {
                    parent_[w.id()] = u;
                    queue_.update_key(loc_[w.id()], dw);
                }
            }
        }
        return nvis();
    }

    /** The closed set by labels. When labels repeat, the vertex finalized
     *  first keeps the label. */
    table_type table(const G &g) const {
        table_type t;
        for (vertex u : visit_) {
            vertex p = parent_[u.id()];
            if (p.valid()) t.finalize(g.element(u), dist_[u.id()], g.element(p));
            else t.finalize(g.element(u), dist_[u.id()]);
        }
        return t;
    }

    void clear(size_t n) {
        queue_.clear();
        dist_.assign(n, WL());
        parent_.assign(n, vertex());
        finalized_.assign(n, false);
        in_queue_.assign(n, false);
        loc_.assign(n, typename queue::handle());
        visit_.clear();
        src_ = vertex();
    }

private:

    void check_finalized(vertex v) const {
        if ( ! finalized(v))
            throw unreachable("shortest_path: vertex "
                              + std::to_string(v.id()) + " not reached");
    }

}; // shortest_path

#endif // SHORTEST_PATH_HH
