#include "sprout/state/structure/state.hpp"
#include <atomic>
#include <stdexcept>

namespace sprout::state {

    namespace {
        std::uint64_t nextStateId() {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }
    } // namespace

    State::State(std::optional<std::string> name) : State(Key{}, std::move(name), nullptr, nullptr) {}

    State::State(Key, std::optional<std::string> name, Action entryAction, Action exitAction)
        : id_(nextStateId()), entryAction_(std::move(entryAction)), exitAction_(std::move(exitAction)) {
        name_ = name ? std::move(*name) : "state#" + std::to_string(id_);
    }

    State::Builder &State::Builder::named(std::string name) {
        if (name_) {
            throw std::logic_error("State name already set!");
        }
        if (name.empty()) {
            throw std::invalid_argument("State name must not be empty!");
        }
        name_ = std::move(name);
        return *this;
    }

    State::Builder &State::Builder::whenEntered(Action action) {
        if (entryAction_) {
            throw std::logic_error("Entry action already set!");
        }
        if (!action) {
            throw std::invalid_argument("Entry action must not be empty!");
        }
        entryAction_ = std::move(action);
        return *this;
    }

    State::Builder &State::Builder::whenExited(Action action) {
        if (exitAction_) {
            throw std::logic_error("Exit action already set!");
        }
        if (!action) {
            throw std::invalid_argument("Exit action must not be empty!");
        }
        exitAction_ = std::move(action);
        return *this;
    }

    StatePtr State::Builder::build() {
        StatePtr state = std::make_shared<State>(Key{}, name_, entryAction_, exitAction_);
        if (sink_) {
            sink_(state);
        }
        return state;
    }

} // namespace sprout::state
