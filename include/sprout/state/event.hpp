#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace sprout::state {

    // Root for event class hierarchies. An event whose value derives from
    // EventBase also matches transitions filtered on any of its base classes.
    class EventBase {
      public:
        virtual ~EventBase() = default;
    };

    // Type-erased, immutable event value. Copies share the held value.
    //
    // Matching follows "is this value an instance of T": the exact stored type
    // always matches, and values derived from EventBase match their bases too.
    // String literals are stored as std::string. A null pointer, or a null C
    // string, makes an empty event.
    class Event {
        template <typename T>
        using stored_t = std::conditional_t<std::is_same_v<std::decay_t<T>, const char *> ||
                                                std::is_same_v<std::decay_t<T>, char *>,
                                            std::string, std::decay_t<T>>;

      public:
        Event() = default;
        Event(std::nullptr_t) {}

        template <typename T>
            requires(!std::is_same_v<std::decay_t<T>, Event> && !std::is_same_v<std::decay_t<T>, std::nullptr_t>)
        Event(T &&value) : holder_(hold(std::forward<T>(value))) {}

        bool empty() const { return !holder_; }
        explicit operator bool() const { return !empty(); }

        // Dynamic type of the held value; typeid(void) when empty
        std::type_index type() const { return holder_ ? holder_->type() : std::type_index(typeid(void)); }

        // Pointer to the held value viewed as T, or nullptr when it is not a T.
        // get<Event>() returns this event itself.
        template <typename T> const T *get() const {
            if (!holder_) {
                return nullptr;
            }
            if constexpr (std::is_same_v<T, Event>) {
                return this;
            } else {
                if (holder_->type() == std::type_index(typeid(T))) {
                    return static_cast<const T *>(holder_->data());
                }
                if constexpr (std::is_class_v<T>) {
                    if (const EventBase *base = holder_->base()) {
                        return dynamic_cast<const T *>(base);
                    }
                }
                return nullptr;
            }
        }

        template <typename T> bool is() const { return get<T>() != nullptr; }

        // True if the held value is a T equal to expected
        template <typename T> bool holds(const T &expected) const {
            const auto *value = get<stored_t<T>>();
            return value != nullptr && *value == expected;
        }

      private:
        struct Concept;

        template <typename T> static std::shared_ptr<const Concept> hold(T &&value) {
            if constexpr (std::is_pointer_v<std::remove_reference_t<T>> && std::is_same_v<stored_t<T>, std::string>) {
                if (value == nullptr) {
                    return nullptr;
                }
            }
            return std::make_shared<Holder<stored_t<T>>>(stored_t<T>(std::forward<T>(value)));
        }

        struct Concept {
            virtual ~Concept() = default;
            virtual std::type_index type() const = 0;
            virtual const void *data() const = 0;
            virtual const EventBase *base() const = 0;
        };

        template <typename T> struct Holder final : Concept {
            explicit Holder(T v) : value(std::move(v)) {}

            std::type_index type() const override { return std::type_index(typeid(T)); }
            const void *data() const override { return &value; }
            const EventBase *base() const override {
                if constexpr (std::is_base_of_v<EventBase, T>) {
                    return &value;
                } else {
                    return nullptr;
                }
            }

            T value;
        };

        std::shared_ptr<const Concept> holder_;
    };

} // namespace sprout::state
