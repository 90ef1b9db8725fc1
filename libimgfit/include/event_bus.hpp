/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef IMGFIT_EVENT_BUS_HPP
#define IMGFIT_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace imgfit {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details The optimizer publishes progress (see events.hpp) without
     * knowing who listens; the ImageOptimizer facade and the tests
     * subscribe to the event types they care about.
     *
     * Subscriptions and publications may come from any thread. Handlers
     * run on the publishing thread, outside the bus lock, so a handler
     * may itself subscribe or publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., AttemptEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// @return True if at least one handler listens for Event.
        template <typename Event>
        [[nodiscard]] bool has_subscribers() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it != subscribers_.end() && !it->second.empty();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace imgfit

#endif // IMGFIT_EVENT_BUS_HPP
