#pragma once
#include <stdexcept>
#include <string>

namespace qtable {

// Lookup of a state that was never added to the table
class UnknownStateError : public std::out_of_range {
public:
    explicit UnknownStateError(const std::string& operation)
        : std::out_of_range(operation + ": state is not in the table") {}
};

// Action not present in a state's (fixed) action set
class UnknownActionError : public std::out_of_range {
public:
    explicit UnknownActionError(const std::string& operation)
        : std::out_of_range(operation + ": action is not legal in this state") {}
};

// Selection requested from a state with no legal actions
class TerminalStateError : public std::logic_error {
public:
    explicit TerminalStateError(const std::string& operation)
        : std::logic_error(operation + ": state has no legal actions") {}
};

} // namespace qtable
