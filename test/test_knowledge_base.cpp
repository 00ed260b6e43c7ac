#include <cassert>
#include <iostream>
#include "Errors.h"
#include "KnowledgeBase.h"

// Helper: true if every cell of @p part is in @p whole.
bool contains_all(const CellSet& whole, const CellSet& part) {
    for (const auto& c : part) {
        if (whole.count(c) == 0) return false;
    }
    return true;
}

void test_zero_count_clears_neighbors() {
    KnowledgeBase kb(3, 3, 1);
    kb.addKnowledge({1,1}, 0);
    assert(kb.safes().size() == 9);
    assert(kb.mines().empty());
    assert(kb.sentences().empty());
    assert((kb.movesMade() == CellSet{{1,1}}));

    Cell next;
    assert(kb.safeMove(next));
    assert(next == (Cell{0,0}));
    std::cout << "PASSED: test_zero_count_clears_neighbors\n";
}

void test_corner_mine_trivial() {
    // 1x3 board: (0,0) sees only (0,1).
    KnowledgeBase kb(1, 3, 1);
    kb.addKnowledge({0,0}, 1);
    assert((kb.mines() == CellSet{{0,1}}));
    assert(kb.sentences().empty());

    // (0,2) also sees only the known mine; its sentence is empty on arrival.
    kb.addKnowledge({0,2}, 1);
    assert((kb.mines() == CellSet{{0,1}}));
    assert((kb.safes() == CellSet{{0,0}, {0,2}}));
    assert(kb.sentences().empty());
    std::cout << "PASSED: test_corner_mine_trivial\n";
}

void test_subset_inference_finds_safes() {
    // 2x3 board
    //   (0,0) (0,1) (0,2)
    //   (1,0) (1,1) (1,2)
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);  // {(0,0),(0,1),(1,1)} = 1
    assert(kb.sentences().size() == 1);
    assert(kb.safes().size() == 1);

    // {(0,0),(0,1),(0,2),(1,2)} = 1 and, with (1,1) now safe, {(0,0),(0,1)} = 1,
    // so (0,2) and (1,2) are safe.
    kb.addKnowledge({1,1}, 1);
    assert((kb.safes() == CellSet{{0,2}, {1,0}, {1,1}, {1,2}}));
    assert(kb.mines().empty());
    assert(kb.sentences().size() == 1);
    assert((kb.sentences()[0].cells() == CellSet{{0,0}, {0,1}}));
    assert(kb.sentences()[0].count() == 1);

    Cell next;
    assert(kb.safeMove(next));
    assert(next == (Cell{0,2}));
    std::cout << "PASSED: test_subset_inference_finds_safes\n";
}

void test_chained_inference_finds_mine() {
    // 2x3 board with a single mine at (0,0).
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);  // {(0,0),(0,1),(1,1)} = 1
    kb.addKnowledge({1,1}, 1);  // leaves {(0,0),(0,1)} = 1; (0,2),(1,2) safe
    kb.addKnowledge({0,2}, 0);  // (0,1) safe -> (0,0) is the mine
    assert((kb.mines() == CellSet{{0,0}}));
    assert(kb.safes().count({0,1}) == 1);
    assert(kb.sentences().empty());
    assert(kb.safes().size() + kb.mines().size() == 6);
    std::cout << "PASSED: test_chained_inference_finds_mine\n";
}

void test_duplicate_observation_is_absorbed() {
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);
    kb.addKnowledge({1,0}, 1);
    assert(kb.sentences().size() == 1);
    assert(kb.movesMade().size() == 1);
    std::cout << "PASSED: test_duplicate_observation_is_absorbed\n";
}

void test_safe_move_order_and_exhaustion() {
    KnowledgeBase kb(2, 2, 1);
    kb.addKnowledge({1,1}, 0);
    Cell next;
    assert(kb.safeMove(next) && next == (Cell{0,0}));
    kb.addKnowledge({0,0}, 0);
    assert(kb.safeMove(next) && next == (Cell{0,1}));
    kb.addKnowledge({0,1}, 0);
    assert(kb.safeMove(next) && next == (Cell{1,0}));
    kb.addKnowledge({1,0}, 0);
    assert(!kb.safeMove(next));
    assert(!kb.randomMove(next));
    std::cout << "PASSED: test_safe_move_order_and_exhaustion\n";
}

void test_random_move_avoids_moves_and_mines() {
    KnowledgeBase kb(3, 3, 7);
    kb.addKnowledge({0,0}, 0);     // (0,1),(1,0),(1,1) safe
    kb.markMine({2,2});
    for (int i = 0; i < 200; ++i) {
        Cell c;
        assert(kb.randomMove(c));
        assert(kb.movesMade().count(c) == 0);
        assert(kb.mines().count(c) == 0);
    }
    std::cout << "PASSED: test_random_move_avoids_moves_and_mines\n";
}

void test_no_move_when_board_covered() {
    KnowledgeBase kb(1, 3, 1);
    kb.addKnowledge({0,0}, 1);
    kb.addKnowledge({0,2}, 1);
    Cell c;
    assert(!kb.safeMove(c));
    assert(!kb.randomMove(c));
    std::cout << "PASSED: test_no_move_when_board_covered\n";
}

void test_queries_do_not_mutate() {
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);
    kb.addKnowledge({1,1}, 1);
    const CellSet safes = kb.safes();
    const CellSet mines = kb.mines();
    const CellSet moves = kb.movesMade();
    const size_t sentences = kb.sentences().size();
    Cell c;
    kb.safeMove(c);
    kb.randomMove(c);
    assert(kb.safes() == safes);
    assert(kb.mines() == mines);
    assert(kb.movesMade() == moves);
    assert(kb.sentences().size() == sentences);
    std::cout << "PASSED: test_queries_do_not_mutate\n";
}

void test_closure_is_idempotent() {
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);
    kb.addKnowledge({1,1}, 1);
    const CellSet safes = kb.safes();
    const CellSet mines = kb.mines();
    const size_t sentences = kb.sentences().size();
    assert(!kb.infer());
    assert(kb.lastPassCount() == 1);
    assert(kb.safes() == safes);
    assert(kb.mines() == mines);
    assert(kb.sentences().size() == sentences);
    std::cout << "PASSED: test_closure_is_idempotent\n";
}

void test_monotonic_growth() {
    KnowledgeBase kb(4, 4, 3);
    const Cell moves[] = {{0,0}, {0,1}, {1,0}, {3,3}};
    const int counts[] = {0, 0, 0, 1};
    CellSet prevSafes, prevMines, prevMoves;
    for (int i = 0; i < 4; ++i) {
        kb.addKnowledge(moves[i], counts[i]);
        assert(contains_all(kb.safes(), prevSafes));
        assert(contains_all(kb.mines(), prevMines));
        assert(contains_all(kb.movesMade(), prevMoves));
        prevSafes = kb.safes();
        prevMines = kb.mines();
        prevMoves = kb.movesMade();
    }
    std::cout << "PASSED: test_monotonic_growth\n";
}

void test_external_marks_propagate() {
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);  // {(0,0),(0,1),(1,1)} = 1
    kb.markSafe({1,1});
    kb.markSafe({0,1});
    // {(0,0)} = 1 resolves.
    assert((kb.mines() == CellSet{{0,0}}));
    assert(kb.sentences().empty());

    KnowledgeBase other(4, 4, 1);
    other.markMine({1,1});
    assert(other.mines().count({1,1}) == 1);
    // Independent instances share nothing.
    assert(kb.mines().count({1,1}) == 0);
    std::cout << "PASSED: test_external_marks_propagate\n";
}

void test_contradiction_safe_and_mine() {
    KnowledgeBase kb(1, 3, 1);
    kb.addKnowledge({0,0}, 1);  // (0,1) is a mine
    bool thrown = false;
    try {
        kb.addKnowledge({0,1}, 0);
    } catch (const ContradictionError& e) {
        thrown = true;
        assert(e.hasCell());
        assert(e.cell() == (Cell{0,1}));
    }
    assert(thrown);
    std::cout << "PASSED: test_contradiction_safe_and_mine\n";
}

void test_contradiction_count_out_of_range() {
    {
        KnowledgeBase kb(1, 3, 1);
        bool thrown = false;
        try { kb.addKnowledge({0,0}, 2); } catch (const ContradictionError&) { thrown = true; }
        assert(thrown);
    }
    {
        KnowledgeBase kb(3, 3, 1);
        bool thrown = false;
        try { kb.addKnowledge({1,1}, -1); } catch (const ContradictionError&) { thrown = true; }
        assert(thrown);
    }
    {
        // (0,1) known safe, then (0,2) claims a mine among {(0,1)}.
        KnowledgeBase kb(1, 3, 1);
        kb.addKnowledge({0,0}, 0);
        bool thrown = false;
        try { kb.addKnowledge({0,2}, 1); } catch (const ContradictionError&) { thrown = true; }
        assert(thrown);
    }
    std::cout << "PASSED: test_contradiction_count_out_of_range\n";
}

void test_contradiction_conflicting_sentences() {
    KnowledgeBase kb(2, 3, 1);
    kb.addKnowledge({1,0}, 1);   // {(0,0),(0,1),(1,1)} = 1
    bool thrown = false;
    try {
        // {(0,0),(0,1),(0,2),(1,2)} = 0 makes (0,0),(0,1) safe, leaving {} = 1 once (1,1) is safe.
        kb.addKnowledge({1,1}, 0);
    } catch (const ContradictionError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_contradiction_conflicting_sentences\n";
}

void test_out_of_bounds_rejected() {
    KnowledgeBase kb(3, 3, 1);
    const Cell bad[] = {{3,0}, {0,3}, {-1,0}, {0,-1}};
    for (const auto& c : bad) {
        bool thrown = false;
        try {
            kb.addKnowledge(c, 0);
        } catch (const OutOfBoundsCell& e) {
            thrown = true;
            assert(e.cell() == c);
        }
        assert(thrown);
    }
    assert(kb.movesMade().empty());
    assert(kb.safes().empty());
    std::cout << "PASSED: test_out_of_bounds_rejected\n";
}

int main() {
    test_zero_count_clears_neighbors();
    test_corner_mine_trivial();
    test_subset_inference_finds_safes();
    test_chained_inference_finds_mine();
    test_duplicate_observation_is_absorbed();
    test_safe_move_order_and_exhaustion();
    test_random_move_avoids_moves_and_mines();
    test_no_move_when_board_covered();
    test_queries_do_not_mutate();
    test_closure_is_idempotent();
    test_monotonic_growth();
    test_external_marks_propagate();
    test_contradiction_safe_and_mine();
    test_contradiction_count_out_of_range();
    test_contradiction_conflicting_sentences();
    test_out_of_bounds_rejected();

    std::cout << "\nAll knowledge base tests passed!\n";
    return 0;
}
