#ifndef APQ_HH
#define APQ_HH

#include <stddef.h>
#include <vector>
#include <string>
#include <utility>
#include <iostream>

#include "errors.hh"

/** Adaptable priority queue: a binary min-heap of (key, value) entries
 *  where each entry knows its current slot in the heap. Insertion returns
 *  a handle through which the key can later be updated or the entry
 *  removed in O(log n), without searching for it.
 *
 *  Entries live in an arena, the heap holds arena indices. A handle is
 *  valid until its entry is removed; using it afterwards throws
 *  invalid_handle (arena slots are recycled, a generation count tells
 *  a stale handle from the slot's new occupant).
 *
 *  Example:
 *    apq<double, int> q;
 *    apq<double, int>::handle h = q.add(3.5, 7);
 *    q.add(2., 8);
 *    q.update_key(h, 1.);
 *    q.remove_min(); // (1., 7)
 */

static const int not_pos = -1;


template<typename K, // key type, ordered by operator<
         typename T> // value type
class apq {
public:

    class handle {
        int id_;
        unsigned gen_;
        friend class apq<K, T>;
        handle(int id, unsigned gen) : id_(id), gen_(gen) {}
    public:
        handle() : id_(not_pos), gen_(0) {}
    };

    typedef std::pair<K, T> item;

private:

    struct entry {
        K key;
        T value;
        int index;    // slot in heap_, not_pos when detached
        unsigned gen; // incremented on each detach
        entry(const K &k, const T &v)
            : key(k), value(v), index(not_pos), gen(0) {}
    };

    std::vector<entry> ents_;
    std::vector<int> heap_; // arena indices in heap order
    std::vector<int> free_; // recyclable arena slots

public:

    apq(size_t n = 0) {
        ents_.reserve(n);
        heap_.reserve(n);
    }

    bool empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

    handle add(const K &key, const T &value) {
        int id;
        if (free_.empty()) {
            id = ents_.size();
            ents_.push_back(entry(key, value));
        } else {
            id = free_.back();
            free_.pop_back();
            ents_[id].key = key;
            ents_[id].value = value;
        }
        ents_[id].index = heap_.size();
        heap_.push_back(id);
        move_up(ents_[id].index);
        return handle(id, ents_[id].gen);
    }

    handle min() const {
        if (heap_.empty()) throw queue_empty("apq.min(): empty queue");
        int id = heap_[0];
        return handle(id, ents_[id].gen);
    }

    /** Remove the entry of smallest key, and return its key and value
     *  (its handle is no longer valid). */
    item remove_min() {
        if (heap_.empty()) throw queue_empty("apq.remove_min(): empty queue");
        return detach(0);
    }

    item remove(const handle &h) {
        return detach(attached(h, "remove").index);
    }

    void update_key(const handle &h, const K &key) {
        entry &e = attached(h, "update_key");
        if (key < e.key) {
            e.key = key;
            move_up(e.index);
        } else if (e.key < key) {
            e.key = key;
            move_down(e.index);
        }
    }

    const K &get_key(const handle &h) const {
        return attached(h, "get_key").key;
    }

    const T &value(const handle &h) const {
        return attached(h, "value").value;
    }

    bool contains(const handle &h) const {
        return h.id_ >= 0 && (size_t) h.id_ < ents_.size()
            && ents_[h.id_].gen == h.gen_ && ents_[h.id_].index != not_pos;
    }

    void clear() {
        for (int id : heap_) {
            ents_[id].index = not_pos;
            ++ents_[id].gen;
            free_.push_back(id);
        }
        heap_.clear();
    }

    /** Heap order holds and every entry in the heap records its slot. */
    bool check_invariants() const {
        for (size_t i = 0; i < heap_.size(); ++i) {
            if (ents_[heap_[i]].index != (int) i) return false;
            if (i > 0 && key_at(i) < key_at((i - 1) / 2)) return false;
        }
        size_t n_attached = 0;
        for (const entry &e : ents_) if (e.index != not_pos) ++n_attached;
        return n_attached == heap_.size();
    }

    void print(std::ostream &cout) const {
        for (int id : heap_) cout << ents_[id].key <<" ";
        cout << "\n";
    }

private:

    const K &key_at(size_t i) const { return ents_[heap_[i]].key; }

    // Arena index of the entry of [h], which must be in the queue.
    int slot(const handle &h, const char *what) const {
        if ( ! contains(h))
            throw invalid_handle(std::string("apq.") + what
                                 + "(): entry not in queue");
        return h.id_;
    }

    const entry &attached(const handle &h, const char *what) const {
        return ents_[slot(h, what)];
    }

    entry &attached(const handle &h, const char *what) {
        return ents_[slot(h, what)];
    }

    // Both entries get their new slot.
    void swap_slots(size_t i, size_t j) {
        std::swap(heap_[i], heap_[j]);
        ents_[heap_[i]].index = i;
        ents_[heap_[j]].index = j;
    }

    // Take the entry at slot i out of the heap, the last entry fills the
    // hole and moves in whichever direction restores the order.
    item detach(size_t i) {
        int id = heap_[i];
        size_t j = heap_.size() - 1;
        if (i != j) swap_slots(i, j);
        heap_.pop_back();
        entry &e = ents_[id];
        item removed(e.key, e.value);
        e.index = not_pos;
        ++e.gen;
        free_.push_back(id);
        if (i < heap_.size() && ! move_up(i)) {
            move_down(i);
        }
        return removed;
    }

    bool move_up(size_t i) {
        bool goes_up = false;
        while (i > 0) {
            size_t p = (i - 1) / 2; // parent
            if ( ! (key_at(i) < key_at(p))) break;
            swap_slots(i, p);
            i = p;
            goes_up = true;
        }
        return goes_up;
    }

    void move_down(size_t i) {
        size_t size = heap_.size();
        while (true) {
            size_t c1 = 2*i + 1, c2 = 2*i + 2; // children
            if (c1 >= size) { break; }
            size_t cmin = c1;
            if (c2 < size && key_at(c2) < key_at(c1)) { cmin = c2; }
            if (key_at(cmin) < key_at(i)) {
                swap_slots(i, cmin);
                i = cmin;
            } else { break; }
        }
    }

}; // apq

#endif // APQ_HH
