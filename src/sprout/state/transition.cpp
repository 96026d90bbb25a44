#include "sprout/state/structure/transition.hpp"
#include <atomic>

namespace sprout::state {

    Transition::Transition(Key, StatePtr source, StatePtr destination, std::type_index eventType, Matcher matcher,
                           Guard guard, Action action)
        : id_(nextId()), source_(std::move(source)), destination_(std::move(destination)), eventType_(eventType),
          matcher_(std::move(matcher)), guard_(std::move(guard)), action_(std::move(action)) {}

    std::uint64_t Transition::nextId() {
        static std::atomic<std::uint64_t> counter{0};
        return ++counter;
    }

    std::string Transition::describe() const {
        return "transition#" + std::to_string(id_) + " (" + source_->name() + " -> " + destination_->name() + ")";
    }

} // namespace sprout::state
