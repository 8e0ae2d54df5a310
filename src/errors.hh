#ifndef ERRORS_HH
#define ERRORS_HH

#include <stdexcept>
#include <string>

/** Failures reported by graphs, queues, searches and readers. */

struct vertex_not_found : public std::invalid_argument {
    vertex_not_found(const std::string &what) : std::invalid_argument(what) {}
};

struct queue_empty : public std::out_of_range {
    queue_empty(const std::string &what) : std::out_of_range(what) {}
};

// Operation on a handle whose entry left the queue.
struct invalid_handle : public std::invalid_argument {
    invalid_handle(const std::string &what) : std::invalid_argument(what) {}
};

struct unreachable : public std::runtime_error {
    unreachable(const std::string &what) : std::runtime_error(what) {}
};

struct negative_weight : public std::invalid_argument {
    negative_weight(const std::string &what) : std::invalid_argument(what) {}
};

struct parse_error : public std::runtime_error {
    const int line;
    parse_error(const std::string &what, int line)
        : std::runtime_error("line " + std::to_string(line) + ": " + what),
          line(line) {}
};

#endif // ERRORS_HH
