#pragma once
#include "../common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "exploration.hpp"
#include <deque>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qtable {

/**
 * Map from states to their legal actions and the estimated value of each.
 *
 * All values start at 0. A table works well when the state space is small
 * enough to enumerate; large or continuous spaces need an approximator instead.
 *
 * State requirements (no base class; signatures are static_asserted):
 *   - typename State::Action, hashable and equality comparable
 *   - std::vector<Action> get_legal_actions() const
 *   - State make_transition(const Action&) const
 *   - float reward_for_last_move() const
 *   - ActionValue<Action> select_best_action(const ActionValueList<Action>&, std::mt19937&) const
 *   - std::hash<State> and operator==
 * get_first_n_entries_with_nonzero_actions() additionally needs operator<<
 * for State and Action.
 *
 * The key set and each state's action set are fixed once constructed; only
 * the values change, through update(). Not thread-safe: one writer at a time.
 */
template <typename State>
class QTable {
public:
    using Action = typename State::Action;
    using ActionValues = std::unordered_map<Action, float>;
    using Table = std::unordered_map<State, ActionValues>;

    static_assert(std::is_same<decltype(std::declval<const State&>().get_legal_actions()),
                               std::vector<Action>>::value,
                  "State::get_legal_actions() const must return std::vector<Action>");
    static_assert(std::is_same<decltype(std::declval<const State&>().make_transition(
                                   std::declval<const Action&>())),
                               State>::value,
                  "State::make_transition(const Action&) const must return State");
    static_assert(std::is_convertible<decltype(std::declval<const State&>().reward_for_last_move()),
                                      float>::value,
                  "State::reward_for_last_move() const must return float");
    static_assert(std::is_convertible<decltype(std::declval<const State&>().select_best_action(
                                          std::declval<const ActionValueList<Action>&>(),
                                          std::declval<std::mt19937&>())),
                                      ActionValue<Action>>::value,
                  "State::select_best_action(const ActionValueList<Action>&, std::mt19937&) const "
                  "must return ActionValue<Action>");
    static_assert(std::is_convertible<decltype(std::declval<const State&>() == std::declval<const State&>()),
                                      bool>::value,
                  "State must be equality comparable");

    /**
     * Create a table.
     *
     * @param initial_state Starting state; all reachable states are discovered from it
     * @param table Prebuilt table to use instead of traversing from initial_state
     * @param epsilon Base rate of random (exploratory) moves
     * @param rng Random source, used for exploration and tie breaking
     */
    explicit QTable(const State& initial_state,
                    std::optional<Table> table = std::nullopt,
                    double epsilon = kDefaultEpsilon,
                    std::mt19937 rng = std::mt19937(std::random_device{}()))
        : epsilon_(epsilon), rng_(std::move(rng)) {
        QTableConfig{epsilon_, std::nullopt}.validate();
        init(initial_state, std::move(table));
    }

    QTable(const State& initial_state, std::optional<Table> table, const QTableConfig& config)
        : epsilon_(config.epsilon), rng_(config.make_engine()) {
        config.validate();
        init(initial_state, std::move(table));
    }

    // Best (action, value) for the state; ties broken by the state with our rng
    ActionValue<Action> get_best_move(const State& state) {
        ActionValueList<Action> actions = snapshot(lookup(state, "get_best_move"));
        if (actions.empty()) {
            throw TerminalStateError("get_best_move");
        }
        return state.select_best_action(actions, rng_);
    }

    ActionValueList<Action> get_possible_actions(const State& state) const {
        return snapshot(lookup(state, "get_possible_actions"));
    }

    /**
     * Epsilon-greedy selection.
     *
     * Explores with probability exploration_rate(epsilon, episode_number),
     * picking uniformly among the state's actions; otherwise returns the best
     * action as get_best_move() would.
     */
    ActionValue<Action> get_next_action(const State& state, int episode_number) {
        ActionValueList<Action> actions = snapshot(lookup(state, "get_next_action"));
        if (actions.empty()) {
            throw TerminalStateError("get_next_action");
        }

        double eps = exploration_rate(epsilon_, episode_number);
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng_) < eps) {
            std::uniform_int_distribution<size_t> pick(0, actions.size() - 1);
#if (QTABLE_DEBUG > 1)
            std::cout << "[QTable::get_next_action] Exploring (eps=" << eps << ")" << std::endl;
#endif
            return actions[pick(rng_)];
        }
#if (QTABLE_DEBUG > 1)
        std::cout << "[QTable::get_next_action] Exploiting (eps=" << eps << ")" << std::endl;
#endif
        return state.select_best_action(actions, rng_);
    }

    /**
     * One-step Q-learning update of (state, action):
     *   Q <- Q + learning_rate * (reward + discount * future - Q)
     * where reward is next_state's reward for the move that reached it and
     * future is the best value in next_state, or 0 if next_state is terminal.
     */
    void update(const State& state, const Action& action, const State& next_state,
                float learning_rate, float future_reward_discount = 1.0f) {
        // All keys resolve before any rng_ draw
        const ActionValues& next_actions = lookup(next_state, "update");
        ActionValues& values = lookup(state, "update");
        auto it = values.find(action);
        if (it == values.end()) {
            throw UnknownActionError("update");
        }

        float future_value = 0.0f;
        if (!next_actions.empty()) {
            future_value = next_state.select_best_action(snapshot(next_actions), rng_).second;
        }
        float reward = next_state.reward_for_last_move();

        float old_value = it->second;
        float delta = learning_rate * ((reward + future_reward_discount * future_value) - old_value);
        it->second = old_value + delta;

#if (QTABLE_DEBUG > 0)
        std::cout << "[QTable::update] Q: " << old_value << " (old) + " << delta
                  << " (delta) = " << it->second << std::endl;
#endif
    }

    // The value half of `action` is ignored; the stored value is used
    void update(const State& state, const ActionValue<Action>& action, const State& next_state,
                float learning_rate, float future_reward_discount = 1.0f) {
        update(state, action.first, next_state, learning_rate, future_reward_discount);
    }

    // Live action map for a state. Inspection only; write through update()
    ActionValues& get_actions(const State& state) { return lookup(state, "get_actions"); }
    const ActionValues& get_actions(const State& state) const { return lookup(state, "get_actions"); }

    /**
     * Render up to n entries whose action values sum to more than zero,
     * one per line, in discovery order. Diagnostic only.
     */
    std::string get_first_n_entries_with_nonzero_actions(size_t n) const {
        std::ostringstream out;
        size_t written = 0;
        for (const State& state : order_) {
            if (written >= n) {
                break;
            }
            const ActionValues& values = table_.at(state);
            float sum = 0.0f;
            for (const auto& entry : values) {
                sum += entry.second;
            }
            if (sum <= 0.0f) {
                continue;
            }

            if (written > 0) {
                out << "\n";
            }
            out << state << " -> {";
            bool first = true;
            for (const auto& entry : values) {
                out << (first ? "" : ", ") << entry.first << ": " << entry.second;
                first = false;
            }
            out << "}";
            written++;
        }
        return out.str();
    }

    bool contains(const State& state) const { return table_.count(state) > 0; }
    size_t size() const { return table_.size(); }
    double epsilon() const { return epsilon_; }
    const Table& table() const { return table_; }

    std::string to_string() const { return "numEntries=" + std::to_string(table_.size()); }

private:
    void init(const State& initial_state, std::optional<Table> table) {
        if (table.has_value()) {
            table_ = std::move(table.value());
            order_.reserve(table_.size());
            for (const auto& entry : table_) {
                order_.push_back(entry.first);
            }
        } else {
            traverse(initial_state);
        }
#if (QTABLE_DEBUG > 0)
        std::cout << "[QTable::QTable] " << to_string() << " (epsilon=" << epsilon_ << ")" << std::endl;
#endif
    }

    // Breadth-first discovery of every reachable state; each state expanded once
    void traverse(const State& initial_state) {
        std::deque<State> frontier;
        frontier.push_back(initial_state);

        while (!frontier.empty()) {
            State current = std::move(frontier.front());
            frontier.pop_front();
            if (table_.count(current) > 0) {
                continue;
            }

            std::vector<Action> legal = current.get_legal_actions();
            ActionValues moves;
            moves.reserve(legal.size());
            for (const Action& action : legal) {
                moves.emplace(action, 0.0f);
                State next = current.make_transition(action);
                if (table_.count(next) == 0) {
                    frontier.push_back(std::move(next));
                }
            }

            order_.push_back(current);
            table_.emplace(std::move(current), std::move(moves));
        }
    }

    ActionValues& lookup(const State& state, const char* operation) {
        auto it = table_.find(state);
        if (it == table_.end()) {
            throw UnknownStateError(operation);
        }
        return it->second;
    }

    const ActionValues& lookup(const State& state, const char* operation) const {
        auto it = table_.find(state);
        if (it == table_.end()) {
            throw UnknownStateError(operation);
        }
        return it->second;
    }

    static ActionValueList<Action> snapshot(const ActionValues& values) {
        return ActionValueList<Action>(values.begin(), values.end());
    }

    Table table_;
    std::vector<State> order_;  // Discovery order, for diagnostics
    double epsilon_;
    std::mt19937 rng_;
};

template <typename State>
std::ostream& operator<<(std::ostream& os, const QTable<State>& table) {
    return os << table.to_string();
}

} // namespace qtable
