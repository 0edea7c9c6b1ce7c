/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: message_bus.cpp
*******************************************************************************/

#include "coordination/message_bus.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"

#include <utility>

namespace fleetwatch {

Json::Value BusEvent::to_json() const {
    Json::Value json(Json::objectValue);
    json["type"] = type;
    json["data"] = data;
    json["timestamp"] = Json::Int64(timestamp_ms);
    return json;
}

std::optional<BusEvent> BusEvent::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["type"].isString()) return std::nullopt;

    BusEvent event;
    event.type = json["type"].asString();
    event.data = json.isMember("data") ? json["data"] : Json::Value(Json::objectValue);
    event.timestamp_ms = json["timestamp"].isIntegral() ? json["timestamp"].asInt64() : 0;
    return event;
}

MessageBus::MessageBus(SharedStore& store)
    : store_(store), tables_(std::make_shared<HandlerTables>()), published_(0) {}

MessageBus::~MessageBus() {
    close();
}

size_t MessageBus::publish(const std::string& channel, const BusEvent& event) {
    require_non_blank(channel, "Channel");
    if (event.type.empty()) {
        throw InvalidArgumentError("Event required for publish");
    }

    size_t receivers = store_.publish(channel, to_compact_json(event.to_json()));
    published_++;
    return receivers;
}

void MessageBus::subscribe(const std::string& channel, EventHandler handler) {
    require_non_blank(channel, "Channel");
    add_handler(channel, false, std::move(handler));
}

void MessageBus::psubscribe(const std::string& pattern, EventHandler handler) {
    require_non_blank(pattern, "Pattern");
    add_handler(pattern, true, std::move(handler));
}

void MessageBus::add_handler(const std::string& target, bool is_pattern, EventHandler handler) {
    {
        std::lock_guard<std::mutex> lock(tables_->mutex);
        auto& handlers = tables_->table(is_pattern);
        auto it = handlers.find(target);
        if (it != handlers.end()) {
            it->second.handlers.push_back(std::move(handler));
            return;
        }
        handlers[target].handlers.push_back(std::move(handler));
    }

    // First handler for this target: open the store subscription outside the lock.
    std::weak_ptr<HandlerTables> weak_tables = tables_;
    SubscriptionCallback callback = [weak_tables, target, is_pattern](const std::string& channel,
                                                                      const std::string& payload) {
        if (auto tables = weak_tables.lock()) {
            deliver(*tables, target, is_pattern, channel, payload);
        }
    };

    uint64_t id = 0;
    try {
        id = is_pattern ? store_.psubscribe(target, std::move(callback))
                        : store_.subscribe(target, std::move(callback));
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(tables_->mutex);
        tables_->table(is_pattern).erase(target);
        throw;
    }

    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(tables_->mutex);
        auto& handlers = tables_->table(is_pattern);
        auto it = handlers.find(target);
        if (it == handlers.end()) {
            orphaned = true;   // unsubscribed while the subscription was being opened
        } else {
            it->second.subscription_id = id;
        }
    }
    if (orphaned) store_.unsubscribe(id);

    Logger::debug(std::string(is_pattern ? "Pattern-subscribed to " : "Subscribed to ") + target);
}

void MessageBus::unsubscribe(const std::string& channel) {
    remove_target(channel, false);
}

void MessageBus::punsubscribe(const std::string& pattern) {
    remove_target(pattern, true);
}

void MessageBus::remove_target(const std::string& target, bool is_pattern) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(tables_->mutex);
        auto& handlers = tables_->table(is_pattern);
        auto it = handlers.find(target);
        if (it == handlers.end()) return;
        id = it->second.subscription_id;
        handlers.erase(it);
    }
    if (id != 0) store_.unsubscribe(id);
}

void MessageBus::deliver(HandlerTables& tables, const std::string& target, bool is_pattern,
                         const std::string& channel, const std::string& payload) {
    Json::Value json;
    std::string error;
    std::optional<BusEvent> event;
    if (parse_json(payload, json, &error)) {
        event = BusEvent::from_json(json);
    }
    if (!event) {
        tables.failed++;
        Logger::error("Failed to parse event on channel " + channel +
                      (error.empty() ? "" : ": " + error));
        return;
    }

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(tables.mutex);
        auto& entries = tables.table(is_pattern);
        auto it = entries.find(target);
        if (it == entries.end()) return;
        handlers = it->second.handlers;
    }

    for (auto& handler : handlers) {
        try {
            handler(*event, channel);
            tables.delivered++;
        } catch (const std::exception& e) {
            tables.failed++;
            Logger::error("Handler error for " + std::string(is_pattern ? "pattern " : "channel ") +
                          target + ": " + e.what());
        }
    }
}

size_t MessageBus::get_subscriber_count(const std::string& channel) {
    return store_.num_subscribers(channel);
}

EventStats MessageBus::get_event_stats() const {
    EventStats stats;
    stats.published = published_;
    stats.delivered = tables_->delivered;
    stats.failed = tables_->failed;
    return stats;
}

size_t MessageBus::close() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(tables_->mutex);
        for (const auto& [target, set] : tables_->channels) ids.push_back(set.subscription_id);
        for (const auto& [target, set] : tables_->patterns) ids.push_back(set.subscription_id);
        tables_->channels.clear();
        tables_->patterns.clear();
    }

    size_t failures = 0;
    for (uint64_t id : ids) {
        if (id == 0) continue;
        try {
            store_.unsubscribe(id);
        } catch (const std::exception& e) {
            ++failures;
            Logger::warning("Unsubscribe failed during bus close: " + std::string(e.what()));
        }
    }
    return failures;
}

} // namespace fleetwatch
