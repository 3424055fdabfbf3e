/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus for upload and initialization events
 *
 * WHY THIS FILE EXISTS:
 * The service facade reports what happened (chunk accepted, batch applied,
 * initialization failed) without knowing who is interested. Logging and
 * metrics attach as subscribers, so the core stays free of presentation code.
 *
 * WHAT IT DOES:
 * - Subscription keyed by the C++ type of the event
 * - Synchronous delivery in the emitting thread
 * - Unsubscription by handler id
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) { ... });
 * bus.emit(ChunkAcceptedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mload::events {

/**
 * @brief Type-erased event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe take an exclusive lock
 * - emit copies the handler list under a shared lock and calls handlers
 *   without holding it, so a handler may subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Handlers capture component pointers; copying would duplicate them
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Handler id for unsubscribe<EventType>()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; the remaining handlers still run and
     * the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            // Only ever stored under typeid(EventType)
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;

    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace mload::events
