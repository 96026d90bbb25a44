#include "sprout/state/machine.hpp"
#include "sprout/core/error.hpp"
#include <stdexcept>

namespace sprout::state {

    Automaton::Automaton(StatePtr initialState, std::unordered_set<StatePtr> states,
                         std::vector<TransitionPtr> transitions, core::ExecutorPtr executor)
        : initialState_(std::move(initialState)), states_(std::move(states)), transitions_(std::move(transitions)),
          log_(core::logger()), executor_(std::move(executor)) {
        if (!initialState_) {
            throw std::invalid_argument("Initial state must not be null!");
        }
        if (!states_.contains(initialState_)) {
            throw IntegrityError("Initial state must be in set of automaton states!");
        }
        if (!executor_) {
            throw std::invalid_argument("Executor must not be null!");
        }
        for (const auto &transition : transitions_) {
            if (!transition) {
                throw std::invalid_argument("Transition must not be null!");
            }
            if (!states_.contains(transition->source()) || !states_.contains(transition->destination())) {
                throw IntegrityError("Transition endpoints must be in set of automaton states: " +
                                     transition->describe());
            }
        }
    }

    Automaton::~Automaton() {
        std::unique_lock<std::mutex> lock(unitsMutex_);
        unitsDone_.wait(lock, [this] { return outstandingUnits_ == 0; });
    }

    void Automaton::schedule(core::Executor::Task unit) {
        {
            std::lock_guard<std::mutex> lock(unitsMutex_);
            ++outstandingUnits_;
        }
        try {
            executor_->execute([this, unit = std::move(unit)] {
                // Counts the unit as done even when it throws
                struct Finish {
                    Automaton *automaton;
                    ~Finish() { automaton->finishUnit(); }
                } finish{this};
                unit();
            });
        } catch (...) {
            finishUnit();
            throw;
        }
    }

    void Automaton::finishUnit() {
        std::lock_guard<std::mutex> lock(unitsMutex_);
        if (--outstandingUnits_ == 0) {
            unitsDone_.notify_all();
        }
    }

    StatePtr Automaton::currentState() const {
        std::lock_guard<std::mutex> lock(currentMutex_);
        return currentState_;
    }

    void Automaton::setCurrentState(StatePtr state) {
        std::lock_guard<std::mutex> lock(currentMutex_);
        currentState_ = std::move(state);
    }

    void Automaton::enable() {
        if (!states_.contains(initialState_)) {
            throw IntegrityError("Initial state must be in set of automaton states!");
        }
        if (enabled_.exchange(true)) {
            throw std::logic_error("Automaton already enabled!");
        }
        setCurrentState(initialState_);
        log_->debug("Automaton enabled, initial state '{}'", initialState_->name());

        StatePtr initial = initialState_;
        schedule([this, initial] {
            initial->onEnter();
            notifyDebug(DebugEvent::STATE_ENTERED, nullptr, initial, 0, true);
        });
    }

    void Automaton::post(Event event) {
        if (!enabled_.load()) {
            throw std::logic_error("Automaton must be enabled first!");
        }
        if (event.empty()) {
            throw std::invalid_argument("Event must not be empty!");
        }
        schedule([this, event = std::move(event)] { process(event); });
    }

    void Automaton::process(const Event &event) {
        StatePtr current = currentState();
        if (!current) {
            throw DispatchError("Current state is undefined! Automaton cannot process any events right now.");
        }

        for (const auto &transition : transitions_) {
            if (transition->source() != current) {
                continue;
            }
            if (!transition->accepts(event)) {
                log_->trace("{} skipped: event type {} does not match", transition->describe(), event.type().name());
                continue;
            }
            bool passed = transition->check(event);
            notifyDebug(DebugEvent::TRANSITION_EVALUATED, current, transition->destination(), transition->id(),
                        passed);
            if (!passed) {
                log_->trace("{} rejected by guard", transition->describe());
                notifyDebug(DebugEvent::TRANSITION_REJECTED, current, transition->destination(), transition->id(),
                            false);
                continue;
            }
            take(*transition, current, event);
            return;
        }

        log_->debug("Event of type {} discarded in state '{}'", event.type().name(), current->name());
        notifyDebug(DebugEvent::EVENT_DISCARDED, current, nullptr, 0, false);
    }

    void Automaton::take(const Transition &transition, const StatePtr &current, const Event &event) {
        const StatePtr &destination = transition.destination();
        log_->debug("Taking {}", transition.describe());
        notifyDebug(DebugEvent::TRANSITION_TAKEN, current, destination, transition.id(), true);

        if (destination == current) {
            transition.execute(event);
            return;
        }

        current->onExit();
        notifyDebug(DebugEvent::STATE_EXITED, current, destination, transition.id(), true);
        setCurrentState(nullptr);

        transition.execute(event);

        if (!states_.contains(destination)) {
            throw IntegrityError("Destination state must be in set of automaton states!");
        }
        setCurrentState(destination);
        destination->onEnter();
        notifyDebug(DebugEvent::STATE_ENTERED, current, destination, transition.id(), true);
    }

    void Automaton::notifyDebug(DebugEvent kind, const StatePtr &from, const StatePtr &to, std::uint64_t transitionId,
                                bool guardPassed) {
        if (!debugCallback_) {
            return;
        }
        DebugInfo info;
        info.event = kind;
        info.fromState = from ? from->name() : std::string();
        info.toState = to ? to->name() : std::string();
        info.transitionId = transitionId;
        info.timestamp = std::chrono::steady_clock::now();
        info.guardPassed = guardPassed;
        debugCallback_(info);
    }

} // namespace sprout::state
