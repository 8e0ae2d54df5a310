#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#include "adj_graph.hh"
#include "route_map.hh"
#include "shortest_path.hh"
#include "graph_reader.hh"
#include "logging.hh"

typedef adj_graph<int, double> graph;
typedef route_map<int, double> rmap;

void usage_exit (char **argv) {
    auto paragraph = [](std::string s, int width=80) -> std::string {
        std::string acc;
        while (s.size() > 0) {
            int pos = s.size();
            if (pos > width) pos = s.rfind(' ', width);
            std::string line = s.substr(0, pos);
            acc += line + "\n";
            s = s.substr(pos);
        }
        return acc;
    };

    std::cerr <<"Usage: "<< argv[0] <<" [-q] [command] [graph] [args]\n"
              << paragraph (
        "With command 'stats', it reads the graph in file [graph] and "
        "prints its number of vertices and edges followed by the list "
        "of vertices and the list of edges." )
              << paragraph (
        "With command 'dijkstra' and [args] = [source], it computes "
        "shortest paths from vertex [source] and prints, for each "
        "reachable vertex, its distance and its predecessor." )
              << paragraph (
        "With command 'path' and [args] = [source] [destination], "
        "[graph] is a route map and it prints the shortest route from "
        "[destination] back to, but not including, [source] as CSV lines "
        "'W,[latitude],[longitude],[id],[cost]'." )
              <<
        "Option -q silences progress messages.\n"
        "A '-' for [graph] stands for standard input.\n"
        " Graph format: blocks 'Node' / 'id [id]' then blocks 'Edge' /\n"
        "   'source [id]' / 'target [id]' / 'length [l]' / 'oneway [bool]'.\n"
        " Route map format: 'coords [lat] [lon]' follows each 'id' line and\n"
        "   'time [t]' follows each 'length' line; edges weigh their time.\n";
    exit(1);
}

template<typename G>
read_counts load(const char *file, G &g,
                 read_counts (*reader)(std::istream &, G &)) {
    if (std::string("-") == file) return reader(std::cin, g);
    std::ifstream in(file);
    if ( ! in) throw std::runtime_error(std::string("cannot open ") + file);
    return reader(in, g);
}

int main (int argc, char **argv) {
    int a = 1;
    bool quiet = false;
    if (a < argc && strcmp(argv[a], "-q") == 0) { quiet = true; ++a; }
    logging main_log("--", quiet);

    // ------------------------ usage -------------------------
    std::string cmd(a < argc ? argv[a] : "");
    int nargs = argc - a - 2;
    if (nargs < 0
        || ! ((cmd == "stats" && nargs == 0)
              || (cmd == "dijkstra" && nargs == 1)
              || (cmd == "path" && nargs == 2))) {
        usage_exit(argv);
    }
    const char *file = argv[a+1];
    char **args = argv + a + 2;

    main_log.cerr() << "start\n";
    double t = main_log.lap();

    try {
        if (cmd == "path") {
            rmap m;
            read_counts n = load<rmap>(file, m, &read_route_map<int, double>);
            main_log.cerr(t) << "loaded route map with n=" << n.nodes
                             << " nodes, m=" << n.edges << " edges\n";
            t = main_log.lap();
            int s = std::stoi(args[0]), d = std::stoi(args[1]);
            std::vector<rmap::hop> hops = m.path(s, d);
            main_log.cerr(t) << "route of "<< hops.size() <<" hops\n";
            write_route_csv(std::cout, hops);
        } else {
            graph g;
            read_counts n = load<graph>(file, g, &read_graph<int, double>);
            main_log.cerr(t) << "loaded graph with n=" << n.nodes
                             << " nodes, m=" << n.edges << " edges\n";
            t = main_log.lap();
            if (cmd == "stats") {
                std::cout << g << "\n";
            } else {
                shortest_path<graph> sp;
                int nvis = sp.run(g, std::stoi(args[0]));
                main_log.cerr(t) << "dijkstra finalized "<< nvis <<" nodes\n";
                sp.table(g).print(std::cout);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << argv[0] <<": "<< e.what() <<"\n";
        return 2;
    }

    main_log.cerr() << "end\n";
    return 0;
}
