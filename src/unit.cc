#include <stdlib.h>
#include <initializer_list>

void apq_basic_test();
void apq_test(int, int);
void adj_graph_basic_test();
void adj_graph_test(int, int);
void shortest_path_basic_test();
void shortest_path_test(int, int);
void route_map_test();
void graph_reader_test();

int main (int argc, char **argv) {
    srand(argc > 1 ? atoi(argv[1]) : 1);
    apq_basic_test();
    for (int n : {0, 1, 2, 3, 5, 20, 60, 500})
        for (int r : {2, 5, 1000}) apq_test(n, r);
    adj_graph_basic_test();
    for (int n : {1, 5, 10, 20, 60})
        for (int d : {1, 2, 3, 5}) adj_graph_test(n, d);
    shortest_path_basic_test();
    for (int n : {1, 5, 10, 20, 60, 200})
        for (int d : {1, 2, 3, 5}) shortest_path_test(n, d);
    route_map_test();
    graph_reader_test();
}
