#ifndef EDGE_HH
#define EDGE_HH

#include <iostream>

#include "errors.hh"

static const int not_vertex = -1;

/** Identity of a vertex: its index in the vertex arena of a graph.
 *  Two vertices are equal iff they are the same arena slot, whatever
 *  their elements. */
class vertex {
    int id_;
public:
    vertex() : id_(not_vertex) {}
    explicit vertex(int id) : id_(id) {}

    int id() const { return id_; }
    bool valid() const { return id_ != not_vertex; }

    bool operator==(const vertex &o) const { return id_ == o.id_; }
    bool operator!=(const vertex &o) const { return id_ != o.id_; }
    bool operator<(const vertex &o) const { return id_ < o.id_; }
};

inline std::ostream &operator<<(std::ostream &os, const vertex &v) {
    return os << "#" << v.id();
}


/** Ordered pair (start, end) with an element (weight or label). */
template<typename W> // edge element type
class edge {
    vertex src_, dst_;
    W elt_;
public:
    typedef W element_type;

    edge(vertex v, vertex w, const W &e) : src_(v), dst_(w), elt_(e) {}

    vertex start() const { return src_; }
    vertex end() const { return dst_; }
    const W &element() const { return elt_; }

    vertex opposite(vertex v) const {
        if (v == src_) return dst_;
        if (v == dst_) return src_;
        throw vertex_not_found("edge.opposite(): vertex "
                               + std::to_string(v.id()) + " not an endpoint");
    }
};

#endif // EDGE_HH
