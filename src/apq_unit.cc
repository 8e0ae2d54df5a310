#include <stdlib.h>
#include <climits>
#include <iostream>
#include <vector>

#include "apq.hh"
#include "unit.hh"

typedef apq<int, int> queue;

void apq_basic_test() {
    std::cout <<"apq_basic_test\n";
    queue q;
    CHECK(q.empty());
    CHECK_THROWS(q.min(), queue_empty);
    CHECK_THROWS(q.remove_min(), queue_empty);

    queue::handle h = q.add(5, 42);
    CHECK(q.size() == 1);
    CHECK(q.get_key(q.min()) == 5);
    queue::item it = q.remove_min();
    CHECK(it.first == 5 && it.second == 42);
    CHECK(q.empty());
    CHECK( ! q.contains(h));
    CHECK_THROWS(q.get_key(h), invalid_handle);
    CHECK_THROWS(q.update_key(h, 1), invalid_handle);
    CHECK_THROWS(q.remove(h), invalid_handle);
    CHECK_THROWS(q.get_key(queue::handle()), invalid_handle);

    // decrease and increase through handles
    queue::handle a = q.add(10, 1), b = q.add(20, 2), c = q.add(30, 3);
    CHECK(q.value(q.min()) == 1);
    q.update_key(c, 5);
    CHECK(q.get_key(q.min()) == 5 && q.value(q.min()) == 3);
    q.update_key(c, 5); // same key
    CHECK(q.value(q.min()) == 3);
    q.update_key(c, 40);
    CHECK(q.get_key(q.min()) == 10 && q.value(q.min()) == 1);
    CHECK(q.check_invariants());

    // remove from the middle, then reuse of its slot
    it = q.remove(b);
    CHECK(it.first == 20 && it.second == 2);
    CHECK_THROWS(q.update_key(b, 0), invalid_handle);
    queue::handle d = q.add(15, 4);
    CHECK( ! q.contains(b));
    CHECK(q.contains(d));
    CHECK_THROWS(q.value(b), invalid_handle);
    CHECK(q.value(d) == 4);
    CHECK(q.check_invariants());

    CHECK(q.remove_min().second == 1);
    CHECK(q.remove_min().second == 4);
    CHECK(q.remove_min().second == 3);
    CHECK(q.empty());
    CHECK( ! q.contains(a) && ! q.contains(c) && ! q.contains(d));

    q.add(1, 1);
    q.add(2, 2);
    q.clear();
    CHECK(q.empty());
    CHECK(q.check_invariants());
}

// Random operations, the heap and the slots of its entries are checked
// after each one.
void apq_test(int n, int rnd = 1000) {
    std::cout <<"apq_test:";
    queue q;
    std::vector<queue::handle> hdl;
    std::vector<int> key;
    std::vector<bool> in(n, false);
    for (int i = 0; i < n; ++i) {
        key.push_back(rand() % rnd);
        hdl.push_back(q.add(key[i], i));
        in[i] = true;
        CHECK(q.check_invariants());
        for (int k = 0; k < 3 && i > 0; ++k) {
            int j = rand() % i;
            if ( ! in[j]) {
                CHECK_THROWS(q.update_key(hdl[j], 0), invalid_handle);
                continue;
            }
            int min_before = q.get_key(q.min());
            int kj = rand() % rnd;
            bool decr = kj < key[j];
            key[j] = kj;
            q.update_key(hdl[j], kj);
            CHECK(q.check_invariants());
            CHECK(q.get_key(hdl[j]) == kj);
            if (decr) CHECK(q.get_key(q.min()) <= min_before);
            else CHECK(q.get_key(q.min()) >= min_before
                       || q.get_key(q.min()) == kj);
        }
        if (i % 5 == 4) {
            int j = rand() % i;
            if (in[j]) {
                queue::item it = q.remove(hdl[j]);
                CHECK(it.first == key[j] && it.second == j);
                in[j] = false;
                CHECK(q.check_invariants());
                CHECK_THROWS(q.get_key(hdl[j]), invalid_handle);
            }
        }
        if (i % 7 == 6) {
            queue::item it = q.remove_min();
            CHECK(key[it.second] == it.first);
            in[it.second] = false;
            CHECK(q.check_invariants());
        }
    }
    int last = INT_MIN;
    while ( ! q.empty()) {
        queue::item it = q.remove_min();
        std::cout <<" "<< it.first;
        CHECK(q.check_invariants());
        CHECK(last <= it.first);
        CHECK(in[it.second] && key[it.second] == it.first);
        in[it.second] = false;
        last = it.first;
    }
    for (int i = 0; i < n; ++i) CHECK( ! in[i]);
    std::cout <<"\n";
}
