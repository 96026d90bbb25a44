#pragma once
#include "../core/executor.hpp"
#include "../core/log.hpp"
#include "event.hpp"
#include "structure/state.hpp"
#include "structure/transition.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace sprout::state {

    // Debug event types
    enum class DebugEvent {
        STATE_ENTERED,
        STATE_EXITED,
        TRANSITION_EVALUATED,
        TRANSITION_TAKEN,
        TRANSITION_REJECTED,
        EVENT_DISCARDED
    };

    // Debug information structure
    struct DebugInfo {
        DebugEvent event;
        std::string fromState;
        std::string toState;
        std::uint64_t transitionId; // 0 when no transition is involved
        std::chrono::steady_clock::time_point timestamp;
        bool guardPassed;
    };

    // Automaton with a frozen set of states and an ordered sequence of
    // transitions, driven by posted events. Built by state::Builder.
    //
    // The graph never changes after construction; only the current state and
    // the enabled flag do. All deferred work runs on the executor, which must
    // run it one unit at a time in submission order. The engine does not
    // serialize dispatch itself.
    //
    // Destruction blocks until every unit this automaton submitted has run, so
    // an automaton must not be destroyed from inside its own actions, nor while
    // its executor is unable to run the remaining work.
    class Automaton {
      public:
        Automaton(StatePtr initialState, std::unordered_set<StatePtr> states, std::vector<TransitionPtr> transitions,
                  core::ExecutorPtr executor);

        ~Automaton();

        Automaton(const Automaton &) = delete;
        Automaton &operator=(const Automaton &) = delete;

        const StatePtr &initialState() const { return initialState_; }

        // Null while not enabled, and while a transition between two distinct
        // states is in flight (between exit and entry)
        StatePtr currentState() const;

        const std::unordered_set<StatePtr> &states() const { return states_; }
        const std::vector<TransitionPtr> &transitions() const { return transitions_; }
        const core::ExecutorPtr &executor() const { return executor_; }

        // May be true before the initial entry action has run
        bool isEnabled() const { return enabled_.load(); }

        // Sets the current state to the initial state and schedules its entry
        // action. Callable once. The automaton counts as enabled before the
        // entry action is submitted: if the executor rejects it, the exception
        // reaches the caller, the entry action never runs and enable() cannot
        // be retried.
        void enable();

        // Schedules dispatch of a non-empty event and returns without waiting
        // for it. Requires enable().
        void post(Event event);

        // Set before enable(); the callback is not synchronized
        using DebugCallback = std::function<void(const DebugInfo &)>;
        void setDebugCallback(DebugCallback callback) { debugCallback_ = std::move(callback); }
        void clearDebugCallback() { debugCallback_ = nullptr; }

      private:
        // Submits a unit of work and tracks it until it has run
        void schedule(core::Executor::Task unit);
        void finishUnit();

        void process(const Event &event);
        void take(const Transition &transition, const StatePtr &current, const Event &event);
        void setCurrentState(StatePtr state);
        void notifyDebug(DebugEvent kind, const StatePtr &from, const StatePtr &to, std::uint64_t transitionId,
                         bool guardPassed);

        const StatePtr initialState_;
        const std::unordered_set<StatePtr> states_;
        const std::vector<TransitionPtr> transitions_;
        std::shared_ptr<spdlog::logger> log_;

        mutable std::mutex currentMutex_;
        StatePtr currentState_;
        std::atomic<bool> enabled_{false};
        DebugCallback debugCallback_;

        std::mutex unitsMutex_;
        std::condition_variable unitsDone_;
        std::size_t outstandingUnits_ = 0;

        // Declared last so it is destroyed first: an executor owned only by this
        // automaton finishes pending work while the members above are alive.
        const core::ExecutorPtr executor_;
    };

} // namespace sprout::state
