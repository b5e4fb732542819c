/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef DISCPACK_EVENT_BUS_HPP
#define DISCPACK_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace discpack {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details PartExecutor broadcasts part lifecycle events without
     * knowing who is listening; the CLI, the report collector and the
     * DiscPack observer bridge subscribe to the types they care about.
     *
     * Subscriptions and publications are protected by a mutex. Handlers
     * must not subscribe from inside a handler.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., PartWriteCompleteEvent).
         * @param handler Function invoked with each published event of this type.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace discpack

#endif // DISCPACK_EVENT_BUS_HPP
