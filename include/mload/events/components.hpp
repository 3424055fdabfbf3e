/**
 * @file components.hpp
 * @brief Event subscribers for logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every emitted event is now logged and counted
 *
 * Both components unsubscribe in their destructors, so they may be
 * destroyed before the bus.
 */

#pragma once

#include "mload/events/event_bus.hpp"
#include "mload/events/events.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mload::events {

/**
 * @brief Owns a set of subscriptions and drops them on destruction
 */
class Subscriptions {
public:
    explicit Subscriptions(EventBus& bus) : bus_(bus) {}
    ~Subscriptions() {
        for (auto& drop : unsubscribers_) {
            drop();
        }
    }

    Subscriptions(const Subscriptions&) = delete;
    Subscriptions& operator=(const Subscriptions&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Logs every service event through spdlog
 *
 * Per-chunk and per-batch events log at debug; session-level events at info,
 * rejections at warn and failures at error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);

private:
    void on_metadata_accepted(const ArtifactMetadataAcceptedEvent& e);
    void on_chunk_accepted(const ChunkAcceptedEvent& e);
    void on_chunk_rejected(const ChunkRejectedEvent& e);
    void on_upload_completed(const UploadCompletedEvent& e);
    void on_initialization_started(const InitializationStartedEvent& e);
    void on_batch_applied(const BatchAppliedEvent& e);
    void on_initialization_completed(const InitializationCompletedEvent& e);
    void on_initialization_failed(const InitializationFailedEvent& e);
    void on_integrity_checked(const IntegrityCheckedEvent& e);
    void on_server_started(const ServerStartedEvent& e);
    void on_server_shutdown(const ServerShuttingDownEvent& e);

    Subscriptions subscriptions_;
};

/**
 * @brief Counts service events for /api/metrics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * auto snapshot = metrics.snapshot();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_opened{0};
        std::atomic<std::uint64_t> chunks_accepted{0};
        std::atomic<std::uint64_t> chunks_replaced{0};
        std::atomic<std::uint64_t> chunks_rejected{0};
        std::atomic<std::uint64_t> bytes_accepted{0};
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> initializations_started{0};
        std::atomic<std::uint64_t> batches_applied{0};
        std::atomic<std::uint64_t> chunks_materialized{0};
        std::atomic<std::uint64_t> initializations_completed{0};
        std::atomic<std::uint64_t> initializations_failed{0};
        std::atomic<std::uint64_t> integrity_checks{0};
        std::atomic<std::uint64_t> integrity_mismatches{0};
    };

    /// Plain copy of Stats, safe to pass around
    struct Snapshot {
        std::uint64_t sessions_opened = 0;
        std::uint64_t chunks_accepted = 0;
        std::uint64_t chunks_replaced = 0;
        std::uint64_t chunks_rejected = 0;
        std::uint64_t bytes_accepted = 0;
        std::uint64_t uploads_completed = 0;
        std::uint64_t initializations_started = 0;
        std::uint64_t batches_applied = 0;
        std::uint64_t chunks_materialized = 0;
        std::uint64_t initializations_completed = 0;
        std::uint64_t initializations_failed = 0;
        std::uint64_t integrity_checks = 0;
        std::uint64_t integrity_mismatches = 0;
    };

    explicit MetricsComponent(EventBus& bus);

    const Stats& get_stats() const { return stats_; }
    Snapshot snapshot() const;
    void print_stats() const;

private:
    Stats stats_;
    Subscriptions subscriptions_;
};

} // namespace mload::events
