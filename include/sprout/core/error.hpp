#pragma once
#include <stdexcept>
#include <string>

namespace sprout {

    // A state or transition refers to a state the automaton does not own
    class IntegrityError : public std::invalid_argument {
      public:
        explicit IntegrityError(const std::string &what) : std::invalid_argument(what) {}
    };

    // Dispatch started while no current state is defined. Only happens when the
    // executor does not run submitted work one unit at a time, in order.
    class DispatchError : public std::logic_error {
      public:
        explicit DispatchError(const std::string &what) : std::logic_error(what) {}
    };

    // A bounded executor refused new work
    class ExecutorRejected : public std::runtime_error {
      public:
        explicit ExecutorRejected(const std::string &what) : std::runtime_error(what) {}
    };

} // namespace sprout
