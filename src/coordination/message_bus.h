/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: message_bus.h

    Description:
        Typed event broadcast over the shared store's pub/sub.

        Events travel as JSON: {"type":"...","data":{...},"timestamp":ms}.
        Each channel or pattern holds one store subscription and any number
        of local handlers. Delivery calls every handler of the matching
        channel/pattern; a handler that throws is counted as failed and
        logged, and the remaining handlers still run. A payload that is not
        a valid event counts as one failure.

        Delivery is at-most-once per subscriber and not ordered across
        channels.

        Handler tables live in state shared with the store callbacks, which
        hold it weakly. A delivery already running when the bus is closed or
        destroyed finishes against that state; later events are dropped.
*******************************************************************************/

#ifndef MESSAGE_BUS_H
#define MESSAGE_BUS_H

#include "store/shared_store.h"

#include <json/json.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

struct BusEvent {
    std::string type;
    Json::Value data;
    int64_t timestamp_ms;

    BusEvent() : data(Json::objectValue), timestamp_ms(0) {}
    BusEvent(const std::string& t, const Json::Value& d, int64_t ts)
        : type(t), data(d), timestamp_ms(ts) {}

    Json::Value to_json() const;
    static std::optional<BusEvent> from_json(const Json::Value& json);
};

using EventHandler = std::function<void(const BusEvent& event, const std::string& channel)>;

struct EventStats {
    uint64_t published;
    uint64_t delivered;
    uint64_t failed;

    EventStats() : published(0), delivered(0), failed(0) {}
};

class MessageBus {
public:
    explicit MessageBus(SharedStore& store);
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /**
     * @return number of store subscriptions that received the event
     * @throws InvalidArgumentError if the event has no type
     */
    size_t publish(const std::string& channel, const BusEvent& event);

    void subscribe(const std::string& channel, EventHandler handler);
    void psubscribe(const std::string& pattern, EventHandler handler);

    /**
     * @brief Removes every handler of channel and its store subscription.
     */
    void unsubscribe(const std::string& channel);
    void punsubscribe(const std::string& pattern);

    size_t get_subscriber_count(const std::string& channel);

    EventStats get_event_stats() const;

    /**
     * @brief Drops every channel and pattern subscription, best-effort.
     * @return number of store unsubscribe calls that failed
     */
    size_t close();

private:
    struct HandlerSet {
        uint64_t subscription_id;
        std::vector<EventHandler> handlers;

        HandlerSet() : subscription_id(0) {}
    };

    struct HandlerTables {
        std::map<std::string, HandlerSet> channels;
        std::map<std::string, HandlerSet> patterns;
        std::mutex mutex;

        std::atomic<uint64_t> delivered;
        std::atomic<uint64_t> failed;

        HandlerTables() : delivered(0), failed(0) {}

        std::map<std::string, HandlerSet>& table(bool is_pattern) {
            return is_pattern ? patterns : channels;
        }
    };

    SharedStore& store_;
    std::shared_ptr<HandlerTables> tables_;
    std::atomic<uint64_t> published_;

    void add_handler(const std::string& target, bool is_pattern, EventHandler handler);
    void remove_target(const std::string& target, bool is_pattern);

    static void deliver(HandlerTables& tables, const std::string& target, bool is_pattern,
                        const std::string& channel, const std::string& payload);
};

} // namespace fleetwatch

#endif // MESSAGE_BUS_H
