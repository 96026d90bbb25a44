#include "sprout/state/builder.hpp"
#include "sprout/core/error.hpp"
#include <stdexcept>

namespace sprout::state {

    Builder &Builder::addState(StatePtr state) {
        if (!state) {
            throw std::invalid_argument("State must not be null!");
        }
        states_.insert(std::move(state));
        return *this;
    }

    Builder &Builder::addStates(std::initializer_list<StatePtr> states) {
        for (const auto &state : states) {
            addState(state);
        }
        return *this;
    }

    State::Builder Builder::addState() {
        return State::Builder([this](const StatePtr &state) { addState(state); });
    }

    Builder &Builder::addTransition(TransitionPtr transition) {
        if (!transition) {
            throw std::invalid_argument("Transition must not be null!");
        }
        if (!states_.contains(transition->source())) {
            throw IntegrityError("Source state must be in automaton states: " + transition->describe());
        }
        if (!states_.contains(transition->destination())) {
            throw IntegrityError("Destination state must be in automaton states: " + transition->describe());
        }
        if (registered_.insert(transition).second) {
            transitions_.push_back(std::move(transition));
        }
        return *this;
    }

    Builder &Builder::addTransitions(std::initializer_list<TransitionPtr> transitions) {
        for (const auto &transition : transitions) {
            addTransition(transition);
        }
        return *this;
    }

    Transition::Builder<Event> Builder::addTransition() {
        return Transition::Builder<Event>([this](const TransitionPtr &transition) { addTransition(transition); });
    }

    Builder &Builder::initialState(StatePtr state) {
        if (initialState_) {
            throw std::logic_error("Initial state already set!");
        }
        if (!state) {
            throw std::invalid_argument("Initial state must not be null!");
        }
        if (!states_.contains(state)) {
            throw IntegrityError("Initial state must be in automaton states!");
        }
        initialState_ = std::move(state);
        return *this;
    }

    Builder &Builder::executor(core::ExecutorPtr executor) {
        if (executor_) {
            throw std::logic_error("Executor already set!");
        }
        if (!executor) {
            throw std::invalid_argument("Executor must not be null!");
        }
        executor_ = std::move(executor);
        return *this;
    }

    std::unique_ptr<Automaton> Builder::build() {
        if (!initialState_) {
            throw std::invalid_argument("Initial state must not be null!");
        }
        core::ExecutorPtr executor = executor_ ? executor_ : std::make_shared<core::InlineExecutor>();
        return std::make_unique<Automaton>(initialState_, states_, transitions_, std::move(executor));
    }

} // namespace sprout::state
