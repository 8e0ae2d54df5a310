#pragma once

#include <cstdlib>
#include <iostream>

#define CHECK(x)                                                            \
    do { if (!(x)) {                                                        \
            std::cerr <<"CHECK failed: "<< #x <<"\n"                        \
                      <<" at: " << __FILE__ <<":" << __LINE__ << "\n"       \
                      << " in function: " << __func__ << "\n"               \
                      << std::flush;                                        \
            std::abort();                                                   \
        } } while (0)

// [stmt] must throw an exception of type [exn].
#define CHECK_THROWS(stmt, exn)                                             \
    do { bool thrown = false;                                               \
        try { stmt; } catch (const exn &) { thrown = true; }                \
        if (!thrown) {                                                      \
            std::cerr <<"CHECK_THROWS failed: "<< #stmt                     \
                      <<" did not throw " << #exn <<"\n"                    \
                      <<" at: " << __FILE__ <<":" << __LINE__ << "\n"       \
                      << " in function: " << __func__ << "\n"               \
                      << std::flush;                                        \
            std::abort();                                                   \
        } } while (0)
