#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sprout::state {

    class State;
    using StatePtr = std::shared_ptr<const State>;

    // Node of an automaton. States compare by identity: two distinct instances
    // are never equal, whatever their actions.
    class State {
        // Restricts the action-carrying constructor to State::Builder
        struct Key {
            explicit Key() = default;
        };

      public:
        using Action = std::function<void()>;

        class Builder;

        virtual ~State() = default;
        State(const State &) = delete;
        State &operator=(const State &) = delete;

        // Called by an automaton entering or leaving this state
        virtual void onEnter() const {
            if (entryAction_)
                entryAction_();
        }

        virtual void onExit() const {
            if (exitAction_)
                exitAction_();
        }

        State(Key, std::optional<std::string> name, Action entryAction, Action exitAction);

        bool hasEntryAction() const { return static_cast<bool>(entryAction_); }
        bool hasExitAction() const { return static_cast<bool>(exitAction_); }

        std::uint64_t id() const { return id_; }
        const std::string &name() const { return name_; }

      protected:
        // For subclasses that override onEnter()/onExit() directly
        explicit State(std::optional<std::string> name = std::nullopt);

      private:
        std::uint64_t id_;
        std::string name_;
        Action entryAction_;
        Action exitAction_;
    };

    class State::Builder {
      public:
        // Receives every state this builder produces
        using Sink = std::function<void(const StatePtr &)>;

        Builder() = default;
        explicit Builder(Sink sink) : sink_(std::move(sink)) {}

        // Each setter may be called once per builder
        Builder &named(std::string name);
        Builder &whenEntered(Action action);
        Builder &whenExited(Action action);

        StatePtr build();

      private:
        std::optional<std::string> name_;
        Action entryAction_;
        Action exitAction_;
        Sink sink_;
    };

} // namespace sprout::state
