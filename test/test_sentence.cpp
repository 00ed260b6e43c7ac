#include <cassert>
#include <iostream>
#include "Errors.h"
#include "Sentence.h"

void test_safe_trivial() {
    // (0,0),(0,1),(1,0) with no mines: all three are safe.
    Sentence s({{0,0}, {0,1}, {1,0}}, 0);
    assert(s.isSafeTrivial());
    assert((s.knownSafes() == CellSet{{0,0}, {0,1}, {1,0}}));
    assert(s.knownMines().empty());

    assert(s.resolveTrivial());
    assert(s.empty());
    assert(s.count() == 0);
    assert((s.knownSafes() == CellSet{{0,0}, {0,1}, {1,0}}));
    std::cout << "PASSED: test_safe_trivial\n";
}

void test_mine_trivial() {
    Sentence s({{6,6}, {6,7}}, 2);
    assert(s.isMineTrivial());
    assert(s.knownSafes().empty());
    assert((s.knownMines() == CellSet{{6,6}, {6,7}}));

    assert(s.resolveTrivial());
    assert(s.empty());
    assert(s.count() == 0);
    assert((s.knownMines() == CellSet{{6,6}, {6,7}}));
    std::cout << "PASSED: test_mine_trivial\n";
}

void test_non_trivial_yields_nothing() {
    Sentence s({{3,3}, {3,4}, {3,5}}, 1);
    assert(!s.isSafeTrivial());
    assert(!s.isMineTrivial());
    assert(s.knownSafes().empty());
    assert(s.knownMines().empty());
    assert(!s.resolveTrivial());
    assert(s.cells().size() == 3);
    std::cout << "PASSED: test_non_trivial_yields_nothing\n";
}

void test_mark_mine() {
    Sentence s({{1,1}, {2,2}}, 1);
    s.markMine({1,1});
    assert(!s.contains({1,1}));
    assert(s.count() == 0);
    assert(s.knownMines().count({1,1}) == 1);
    // The remainder is now safe-trivial.
    assert(s.knownSafes().count({2,2}) == 1);

    // A mine outside the sentence is recorded but does not touch the count.
    s.markMine({5,5});
    assert(s.count() == 0);
    assert(s.knownMines().count({5,5}) == 1);
    std::cout << "PASSED: test_mark_mine\n";
}

void test_mark_safe() {
    Sentence s({{1,1}, {2,2}}, 1);
    s.markSafe({2,2});
    assert(!s.contains({2,2}));
    assert(s.count() == 1);
    assert(s.knownSafes().count({2,2}) == 1);
    // {(1,1)} = 1 is mine-trivial now.
    assert(s.isMineTrivial());
    assert(s.knownMines().count({1,1}) == 1);
    std::cout << "PASSED: test_mark_safe\n";
}

void test_mark_mine_underflow_is_inconsistent() {
    Sentence s({{0,0}, {0,1}}, 0);
    s.markMine({0,0});
    assert(s.count() == -1);
    assert(!s.consistent());
    bool thrown = false;
    try {
        s.checkConsistent();
    } catch (const ContradictionError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_mark_mine_underflow_is_inconsistent\n";
}

void test_count_above_size_is_inconsistent() {
    Sentence s({{0,0}}, 2);
    assert(!s.consistent());
    bool thrown = false;
    try {
        s.checkConsistent();
    } catch (const ContradictionError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_count_above_size_is_inconsistent\n";
}

void test_subset_reduction() {
    // A = {x,y,z} = 1 and B = {x,y} = 1 imply {z} = 0.
    Cell x{0,0}, y{0,1}, z{0,2};
    Sentence a({x, y, z}, 1);
    Sentence b({x, y}, 1);
    assert(b.isSubsetOf(a));
    assert(!a.isSubsetOf(b));

    assert(b.reduceWith(a));
    assert((a.cells() == CellSet{z}));
    assert(a.count() == 0);
    assert((b.cells() == CellSet{x, y}));
    assert(b.count() == 1);
    assert(a.resolveTrivial());
    assert(a.knownSafes().count(z) == 1);
    std::cout << "PASSED: test_subset_reduction\n";
}

void test_subset_reduction_symmetric() {
    Cell x{2,2}, y{2,3}, z{3,3};
    Sentence big({x, y, z}, 2);
    Sentence small({x}, 1);
    // The superset is the receiver this time.
    assert(big.reduceWith(small));
    assert((big.cells() == CellSet{y, z}));
    assert(big.count() == 1);
    assert((small.cells() == CellSet{x}));
    std::cout << "PASSED: test_subset_reduction_symmetric\n";
}

void test_reduce_disjoint_and_overlapping() {
    Sentence a({{0,0}, {0,1}}, 1);
    Sentence b({{0,1}, {0,2}}, 1);
    Sentence c({{5,5}}, 0);
    assert(!a.reduceWith(b));
    assert(!a.reduceWith(c));
    assert(a.cells().size() == 2 && b.cells().size() == 2);
    std::cout << "PASSED: test_reduce_disjoint_and_overlapping\n";
}

void test_empty_sentence_is_inert() {
    Sentence empty(CellSet{}, 0);
    Sentence other({{1,1}, {1,2}}, 1);
    assert(!empty.isSubsetOf(other));
    assert(!empty.reduceWith(other));
    assert(!other.reduceWith(empty));
    assert(other.cells().size() == 2 && other.count() == 1);
    assert(!empty.resolveTrivial());
    assert(empty.consistent());
    std::cout << "PASSED: test_empty_sentence_is_inert\n";
}

void test_equality() {
    Sentence a({{0,0}, {0,1}}, 1);
    Sentence b({{0,1}, {0,0}}, 1);
    Sentence c({{0,0}, {0,1}}, 2);
    assert(a == b);
    assert(a != c);
    // Bookkeeping does not affect equality.
    b.markSafe({9,9});
    assert(a == b);
    std::cout << "PASSED: test_equality\n";
}

void test_to_string() {
    Sentence s({{1,0}, {0,1}}, 1);
    assert(s.toString() == "{(0,1), (1,0)} = 1");
    std::cout << "PASSED: test_to_string\n";
}

int main() {
    test_safe_trivial();
    test_mine_trivial();
    test_non_trivial_yields_nothing();
    test_mark_mine();
    test_mark_safe();
    test_mark_mine_underflow_is_inconsistent();
    test_count_above_size_is_inconsistent();
    test_subset_reduction();
    test_subset_reduction_symmetric();
    test_reduce_disjoint_and_overlapping();
    test_empty_sentence_is_inert();
    test_equality();
    test_to_string();

    std::cout << "\nAll sentence tests passed!\n";
    return 0;
}
