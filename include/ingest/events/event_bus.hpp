/**
 * @file event_bus.hpp
 * @brief Ordered publish/subscribe channel between the pipeline and its observers
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator publishes progress, completion and per-file outcomes
 * without knowing who listens: the CLI renders progress, the metrics
 * bridge counts files, the logger writes an audit trail.
 *
 * DELIVERY:
 * - Subscribers live in one list in subscription order; an event reaches
 *   the subscribers of its type in that order, on the emitting thread
 * - The owner picks the DeliveryPolicy when constructing the bus
 * - A failing subscriber is logged and counted, never rethrown into emit()
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ImportProgressEvent>([](const ImportProgressEvent& e) { ... }, "cli");
 * bus.emit(ImportProgressEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace ingest::events {

enum class DeliveryPolicy {
    /// A failing subscriber is skipped; later subscribers still get the event.
    Continue,
    /// The first failing subscriber ends delivery of that event.
    StopOnFailure
};

/**
 * @brief Ordered, type-filtered subscriber list
 *
 * THREAD SAFETY:
 * - Emit and subscribe may be called concurrently from any thread
 * - emit() delivers to a snapshot of the list, so a subscriber may
 *   subscribe or unsubscribe from inside its callback
 */
class EventBus {
public:
    explicit EventBus(DeliveryPolicy policy = DeliveryPolicy::Continue) : policy_(policy) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Appends a subscriber for EventType to the end of the list
     *
     * The name only appears in failure logs.
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler, std::string name = {}) {
        auto entry = std::make_shared<Subscriber>();
        entry->type = std::type_index(typeid(EventType));
        entry->name = std::move(name);
        entry->deliver = [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        entry->id = next_id_++;
        subscribers_.push_back(entry);
        return entry->id;
    }

    template<typename EventType>
    void unsubscribe(size_t subscription_id) {
        const auto type = std::type_index(typeid(EventType));
        std::unique_lock lock(mutex_);
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                [&](const std::shared_ptr<Subscriber>& s) { return s->id == subscription_id && s->type == type; }),
            subscribers_.end());
    }

    template<typename EventType>
    void emit(const EventType& event) {
        const auto type = std::type_index(typeid(EventType));
        std::vector<std::shared_ptr<Subscriber>> targets;
        {
            std::shared_lock lock(mutex_);
            for (const auto& subscriber : subscribers_) {
                if (subscriber->type == type) {
                    targets.push_back(subscriber);
                }
            }
        }

        for (const auto& subscriber : targets) {
            if (!deliver(*subscriber, &event) && policy_ == DeliveryPolicy::StopOnFailure) {
                spdlog::warn("[EventBus] Delivery of {} stopped after a failing subscriber", type.name());
                return;
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        const auto type = std::type_index(typeid(EventType));
        std::shared_lock lock(mutex_);
        return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
            [&type](const std::shared_ptr<Subscriber>& s) { return s->type == type; }));
    }

    /// Subscriber calls that threw since construction.
    size_t failed_deliveries() const noexcept { return failed_deliveries_.load(); }

    DeliveryPolicy policy() const noexcept { return policy_; }

    void clear() {
        std::unique_lock lock(mutex_);
        subscribers_.clear();
    }

private:
    struct Subscriber {
        size_t id = 0;
        std::type_index type = std::type_index(typeid(void));
        std::string name;
        std::function<void(const void*)> deliver;
    };

    bool deliver(const Subscriber& subscriber, const void* event) {
        try {
            subscriber.deliver(event);
            return true;
        } catch (const std::exception& e) {
            spdlog::error("[EventBus] Subscriber {} ({}) threw on {}: {}",
                          subscriber.id, subscriber.name.empty() ? "unnamed" : subscriber.name,
                          subscriber.type.name(), e.what());
        } catch (...) {
            spdlog::error("[EventBus] Subscriber {} ({}) threw a non-standard exception on {}",
                          subscriber.id, subscriber.name.empty() ? "unnamed" : subscriber.name,
                          subscriber.type.name());
        }
        ++failed_deliveries_;
        return false;
    }

    const DeliveryPolicy policy_;

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
    size_t next_id_ = 0;
    std::atomic<size_t> failed_deliveries_{0};
};

} // namespace ingest::events
