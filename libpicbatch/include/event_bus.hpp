/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between BatchProcessor and its caller.
 */

#ifndef PICBATCH_EVENT_BUS_HPP
#define PICBATCH_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace picbatch {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details BatchProcessor publishes progress events without knowing
     * who listens; the CLI (or a test) subscribes to the event types it
     * cares about. Handlers run synchronously inside publish(), on the
     * publishing thread, in subscription order.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., ItemCompleteEvent).
         * @param handler Invoked with a const reference to each published event.
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
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            // handlers may subscribe further handlers, so call them unlocked
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// @return Number of handlers registered for @p Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace picbatch

#endif // PICBATCH_EVENT_BUS_HPP
