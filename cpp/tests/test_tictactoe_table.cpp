#include "../include/table/q_table.hpp"
#include "fixtures/tictactoe_state.hpp"
#include <gtest/gtest.h>

using qtable::QTable;
using qtable::fixtures::Board;
using qtable::fixtures::TicTacToeState;

/**
 * Every legal tic-tac-toe position is reachable from the empty board,
 * counting positions where play stops because somebody won
 */
TEST(TicTacToeTableTest, DiscoversAllReachablePositions) {
    QTable<TicTacToeState> table(TicTacToeState(), std::nullopt, 0.01, std::mt19937(1));
    EXPECT_EQ(table.size(), 5478u);

    for (const auto& entry : table.table()) {
        const TicTacToeState& state = entry.first;
        EXPECT_EQ(entry.second.size(), state.get_legal_actions().size());
        for (const auto& action : entry.second) {
            EXPECT_FLOAT_EQ(action.second, 0.0f);
        }
        if (state.check_winner().has_value()) {
            EXPECT_TRUE(entry.second.empty());
        }
    }
}

TEST(TicTacToeTableTest, EmptyBoardHasNineMoves) {
    QTable<TicTacToeState> table(TicTacToeState(), std::nullopt, 0.01, std::mt19937(1));
    EXPECT_EQ(table.get_possible_actions(TicTacToeState()).size(), 9u);
}

/**
 * With no discounting, repeated episodes from a position with an immediate
 * win converge on the winning move
 */
TEST(TicTacToeTableTest, LearnsImmediateWin) {
    // X X .
    // O O .
    // . . .    X to move; cell 2 wins
    Board board = {1, 1, 0, -1, -1, 0, 0, 0, 0};
    TicTacToeState start(board, 1);
    QTable<TicTacToeState> table(TicTacToeState(), std::nullopt, 0.01, std::mt19937(2024));
    ASSERT_TRUE(table.contains(start));

    for (int episode = 0; episode < 300; episode++) {
        auto action = table.get_next_action(start, episode);
        TicTacToeState next = start.make_transition(action.first);
        table.update(start, action, next, 0.5f, 0.0f);
    }

    auto best = table.get_best_move(start);
    EXPECT_EQ(best.first, 2);
    EXPECT_GT(best.second, 0.9f);
    for (const auto& entry : table.get_possible_actions(start)) {
        if (entry.first != 2) {
            EXPECT_FLOAT_EQ(entry.second, 0.0f);
        }
    }
}

TEST(TicTacToeTableTest, WinningPositionIsTerminal) {
    Board board = {1, 1, 1, -1, -1, 0, 0, 0, 0};
    TicTacToeState won(board, -1);
    QTable<TicTacToeState> table(TicTacToeState(), std::nullopt, 0.01, std::mt19937(3));

    EXPECT_FLOAT_EQ(won.reward_for_last_move(), 1.0f);
    EXPECT_THROW(table.get_best_move(won), qtable::TerminalStateError);
}
