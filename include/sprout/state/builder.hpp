#pragma once
#include "../core/executor.hpp"
#include "event.hpp"
#include "machine.hpp"
#include "structure/state.hpp"
#include "structure/transition.hpp"
#include <concepts>
#include <initializer_list>
#include <memory>
#include <ranges>
#include <unordered_set>
#include <vector>

namespace sprout::state {

    // Accumulates states and transitions and freezes them into an Automaton.
    //
    // States must be added before the transitions and the initial state that
    // refer to them. Re-adding a state or transition instance is a no-op.
    // The state and transition builders returned by addState() and
    // addTransition() register what they build with this builder, so it must
    // outlive them.
    class Builder {
      public:
        Builder() = default;
        Builder(const Builder &) = delete;
        Builder &operator=(const Builder &) = delete;

        Builder &addState(StatePtr state);
        Builder &addStates(std::initializer_list<StatePtr> states);
        template <std::ranges::input_range R>
            requires std::convertible_to<std::ranges::range_value_t<R>, StatePtr>
        Builder &addStates(const R &states) {
            for (const auto &state : states) {
                addState(state);
            }
            return *this;
        }

        // New state, added when its build() is called
        State::Builder addState();

        Builder &addTransition(TransitionPtr transition);
        Builder &addTransitions(std::initializer_list<TransitionPtr> transitions);
        template <std::ranges::input_range R>
            requires std::convertible_to<std::ranges::range_value_t<R>, TransitionPtr>
        Builder &addTransitions(const R &transitions) {
            for (const auto &transition : transitions) {
                addTransition(transition);
            }
            return *this;
        }

        // New transition, added when its build() is called
        Transition::Builder<Event> addTransition();

        // Both may be set once
        Builder &initialState(StatePtr state);
        Builder &executor(core::ExecutorPtr executor);

        // Requires an initial state. Uses an InlineExecutor unless one was set.
        std::unique_ptr<Automaton> build();

      private:
        std::unordered_set<StatePtr> states_;
        std::vector<TransitionPtr> transitions_;
        std::unordered_set<TransitionPtr> registered_;
        StatePtr initialState_;
        core::ExecutorPtr executor_;
    };

} // namespace sprout::state
