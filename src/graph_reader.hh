#ifndef GRAPH_READER_HH
#define GRAPH_READER_HH

#include <stddef.h>
#include <string>
#include <vector>
#include <sstream>
#include <iostream>

#include "adj_graph.hh"
#include "route_map.hh"
#include "errors.hh"

/**
 * Readers for the text format of graphs: blocks of lines, each block a
 * 'Node' or 'Edge' line followed by one 'key value...' line per field.
 * All Node blocks come first.
 *
 *   Node            Edge
 *   id 1            source 1
 *   coords 53 -6    target 2
 *                   length 120.5
 *                   time 14.2
 *                   oneway False
 *
 * Plain graphs have no 'coords' nor 'time' line and weigh edges by length,
 * route maps weigh them by time.
 */

struct read_counts {
    size_t nodes, edges;
};


class record_reader {
    std::istream &in_;
    int line_;
public:
    record_reader(std::istream &in) : in_(in), line_(0) {}

    int line() const { return line_; }

    // Next non blank line into [s], false at end of input.
    bool next(std::string &s) {
        while (std::getline(in_, s)) {
            ++line_;
            size_t e = s.find_last_not_of(" \t\r");
            if (e == std::string::npos) continue;
            size_t b = s.find_first_not_of(" \t");
            s = s.substr(b, e + 1 - b);
            return true;
        }
        return false;
    }

    // Values of the next line, which must be [key] followed by [n] values.
    std::vector<std::string> field(const std::string &key, size_t n = 1) {
        std::string s;
        if ( ! next(s)) throw parse_error("missing '" + key + "' line", line_);
        std::istringstream ss(s);
        std::string k, tok;
        ss >> k;
        if (k != key)
            throw parse_error("expected '" + key + "', got '" + k + "'", line_);
        std::vector<std::string> vals;
        while (ss >> tok) vals.push_back(tok);
        if (vals.size() < n)
            throw parse_error("'" + key + "' needs " + std::to_string(n)
                              + " value(s)", line_);
        return vals;
    }

    template<typename T>
    T parse(const std::string &tok) {
        std::istringstream ss(tok);
        T x;
        if ( ! (ss >> x) || ! (ss >> std::ws).eof())
            throw parse_error("bad value '" + tok + "'", line_);
        return x;
    }

    bool parse_bool(const std::string &tok) {
        if (tok == "True" || tok == "true" || tok == "1") return true;
        if (tok == "False" || tok == "false" || tok == "0") return false;
        throw parse_error("bad boolean '" + tok + "'", line_);
    }

    template<typename G>
    vertex endpoint(const G &g, const std::string &key) {
        typename G::label l = parse<typename G::label>(field(key)[0]);
        vertex v = g.find_vertex(l);
        if ( ! v.valid())
            throw parse_error(key + " " + field_text(l) + " is not a node",
                              line_);
        return v;
    }

private:
    template<typename T>
    static std::string field_text(const T &x) {
        std::ostringstream s;
        s << x;
        return s.str();
    }
};


template<typename L, typename W>
read_counts read_graph(std::istream &in, adj_graph<L, W> &g) {
    typedef adj_graph<L, W> graph;
    record_reader r(in);
    read_counts n = { 0, 0 };
    std::string tag;
    bool more = r.next(tag);
    for ( ; more && tag == "Node"; more = r.next(tag)) {
        g.add_vertex(r.parse<L>(r.field("id")[0]));
        ++n.nodes;
    }
    for ( ; more && tag == "Edge"; more = r.next(tag)) {
        vertex s = r.endpoint<graph>(g, "source");
        vertex t = r.endpoint<graph>(g, "target");
        W len = r.parse<W>(r.field("length")[0]);
        bool oneway = r.parse_bool(r.field("oneway")[0]);
        g.add_edge(s, t, len, oneway);
        ++n.edges;
    }
    if (more) throw parse_error("unexpected '" + tag + "'", r.line());
    return n;
}


template<typename L, typename W>
read_counts read_route_map(std::istream &in, route_map<L, W> &m) {
    typedef route_map<L, W> graph;
    record_reader r(in);
    read_counts n = { 0, 0 };
    std::string tag;
    bool more = r.next(tag);
    for ( ; more && tag == "Node"; more = r.next(tag)) {
        L id = r.parse<L>(r.field("id")[0]);
        std::vector<std::string> xy = r.field("coords", 2);
        m.add_vertex(id, r.parse<double>(xy[0]), r.parse<double>(xy[1]));
        ++n.nodes;
    }
    for ( ; more && tag == "Edge"; more = r.next(tag)) {
        vertex s = r.endpoint<graph>(m, "source");
        vertex t = r.endpoint<graph>(m, "target");
        r.field("length");
        W time = r.parse<W>(r.field("time")[0]);
        bool oneway = r.parse_bool(r.field("oneway")[0]);
        m.add_edge(s, t, time, oneway);
        ++n.edges;
    }
    if (more) throw parse_error("unexpected '" + tag + "'", r.line());
    return n;
}

#endif // GRAPH_READER_HH
