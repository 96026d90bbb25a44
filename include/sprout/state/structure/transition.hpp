#pragma once
#include "../event.hpp"
#include "state.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace sprout::state {

    class Transition;
    using TransitionPtr = std::shared_ptr<const Transition>;

    // Edge between two states, gated by an event type filter and an optional
    // guard, carrying an optional action. Transitions compare by identity.
    //
    // Guard and action are typed on the filter's event type when built; the
    // transition stores them erased over Event and only ever calls them with
    // events that passed accepts().
    class Transition {
        // Restricts construction to Transition::Builder
        struct Key {
            explicit Key() = default;
        };

      public:
        using Matcher = std::function<bool(const Event &)>;
        using Guard = std::function<bool(const Event &)>;
        using Action = std::function<void(const Event &)>;

        // Receives every transition a builder produces
        using Sink = std::function<void(const TransitionPtr &)>;

        template <typename T> class Builder;

        Transition(Key, StatePtr source, StatePtr destination, std::type_index eventType, Matcher matcher,
                   Guard guard, Action action);
        Transition(const Transition &) = delete;
        Transition &operator=(const Transition &) = delete;

        const StatePtr &source() const { return source_; }
        const StatePtr &destination() const { return destination_; }
        bool isSelfTransition() const { return source_ == destination_; }

        // Filter type; typeid(Event) means any event
        std::type_index eventType() const { return eventType_; }

        bool accepts(const Event &event) const { return matcher_(event); }

        // Absent guard counts as satisfied
        bool check(const Event &event) const { return !guard_ || guard_(event); }

        void execute(const Event &event) const {
            if (action_)
                action_(event);
        }

        bool hasGuard() const { return static_cast<bool>(guard_); }
        bool hasAction() const { return static_cast<bool>(action_); }

        std::uint64_t id() const { return id_; }

        // e.g. "transition#4 (OFF -> ON)"
        std::string describe() const;

      private:
        // Untyped part of a builder, carried across on<T>()
        struct Draft {
            StatePtr source;
            StatePtr destination;
            bool typed = false;
            Sink sink;
        };

        static std::uint64_t nextId();

        std::uint64_t id_;
        StatePtr source_;
        StatePtr destination_;
        std::type_index eventType_;
        Matcher matcher_;
        Guard guard_;
        Action action_;
    };

    // Constant guards, usable with any event type
    struct Guards {
        static auto always(bool result) {
            return [result](const auto &) { return result; };
        }
        static auto pass() { return always(true); }
        static auto fail() { return always(false); }

        // Satisfied by events equal to expected
        template <typename V> static auto equals(V expected) {
            return [expected = std::move(expected)](const auto &event) {
                if constexpr (std::is_same_v<std::decay_t<decltype(event)>, Event>) {
                    return event.holds(expected);
                } else {
                    return event == expected;
                }
            };
        }
        static auto equals(const char *expected) { return equals(std::string(expected)); }
    };

    // Builds a transition whose guard and action receive events as const T &.
    // Starts as Builder<Event> (any event); on<T>() narrows the filter.
    template <typename T> class Transition::Builder {
      public:
        using TypedGuard = std::function<bool(const T &)>;
        using TypedAction = std::function<void(const T &)>;

        Builder() = default;
        explicit Builder(Sink sink) { draft_.sink = std::move(sink); }
        explicit Builder(Draft draft) : draft_(std::move(draft)) {}

        Builder &from(StatePtr state) {
            if (draft_.source) {
                throw std::logic_error("Source state already set!");
            }
            if (!state) {
                throw std::invalid_argument("Source state must not be null!");
            }
            draft_.source = std::move(state);
            return *this;
        }

        Builder &to(StatePtr state) {
            if (draft_.destination) {
                throw std::logic_error("Destination state already set!");
            }
            if (!state) {
                throw std::invalid_argument("Destination state must not be null!");
            }
            draft_.destination = std::move(state);
            return *this;
        }

        // Narrow the filter to events that are instances of X. Must precede
        // check() and execute(), whose callables are typed on X.
        template <typename X> Builder<X> on() {
            if (draft_.typed) {
                throw std::logic_error("Event type already set!");
            }
            if (guard_ || action_) {
                throw std::logic_error("Event type must be set before guard and action!");
            }
            draft_.typed = true;
            return Builder<X>(std::move(draft_));
        }

        Builder &check(TypedGuard guard) {
            if (guard_) {
                throw std::logic_error("Guard already set!");
            }
            if (!guard) {
                throw std::invalid_argument("Guard must not be empty!");
            }
            guard_ = std::move(guard);
            return *this;
        }

        Builder &execute(TypedAction action) {
            if (action_) {
                throw std::logic_error("Action already set!");
            }
            if (!action) {
                throw std::invalid_argument("Action must not be empty!");
            }
            action_ = std::move(action);
            return *this;
        }

        TransitionPtr build() {
            if (!draft_.source) {
                throw std::invalid_argument("Missing required field: source state");
            }
            if (!draft_.destination) {
                throw std::invalid_argument("Missing required field: destination state");
            }

            Matcher matcher = [](const Event &event) { return event.is<T>(); };
            Guard guard;
            if (guard_) {
                guard = [typed = guard_](const Event &event) { return typed(*event.get<T>()); };
            }
            Action action;
            if (action_) {
                action = [typed = action_](const Event &event) { typed(*event.get<T>()); };
            }

            TransitionPtr transition =
                std::make_shared<Transition>(Key{}, draft_.source, draft_.destination, std::type_index(typeid(T)),
                                             std::move(matcher), std::move(guard), std::move(action));
            if (draft_.sink) {
                draft_.sink(transition);
            }
            return transition;
        }

      private:
        Draft draft_;
        TypedGuard guard_;
        TypedAction action_;
    };

} // namespace sprout::state
