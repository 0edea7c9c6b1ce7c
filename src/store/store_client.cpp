/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: store_client.cpp

    Description:
        TCP client of the shared store daemon.
*******************************************************************************/

#include "store/store_client.h"
#include "common/errors.h"
#include "common/logger.h"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

namespace fleetwatch {

//==============================================================================
// SECTION 1: Connection management
//==============================================================================

StoreClient::StoreClient(const StoreClientConfig& config)
    : config_(config),
      command_socket_(-1),
      subscriber_socket_(-1),
      subscriber_alive_(false),
      next_request_id_(1),
      next_subscription_id_(1) {
}

StoreClient::~StoreClient() {
    close();
}

int StoreClient::open_socket() {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        Logger::error("Failed to resolve store host " + config_.host + ": " + gai_strerror(rc));
        return -1;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        freeaddrinfo(result);
        return -1;
    }

    // Non-blocking connect bounded by connect_timeout_ms.
    int flags = fcntl(socket_fd, F_GETFL, 0);
    fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(socket_fd, result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);

    if (rc < 0 && errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = socket_fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        rc = poll(&pfd, 1, config_.connect_timeout_ms);
        if (rc == 1) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            rc = so_error == 0 ? 0 : -1;
            errno = so_error;
        } else {
            if (rc == 0) errno = ETIMEDOUT;
            rc = -1;
        }
    }

    if (rc < 0) {
        Logger::error("Failed to connect to store at " + config_.host + ":" + port +
                      ": " + std::string(strerror(errno)));
        ::close(socket_fd);
        return -1;
    }

    fcntl(socket_fd, F_SETFL, flags);
    return socket_fd;
}

void StoreClient::configure_timeouts(int socket_fd, bool receive_timeout) {
    struct timeval tv;
    tv.tv_sec = config_.io_timeout_ms / 1000;
    tv.tv_usec = (config_.io_timeout_ms % 1000) * 1000;

    setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (receive_timeout) {
        setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
}

bool StoreClient::open_command() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (command_socket_ >= 0) return true;

    Logger::info("Connecting to store at " + config_.host + ":" + std::to_string(config_.port));

    int socket_fd = open_socket();
    if (socket_fd < 0) return false;

    configure_timeouts(socket_fd, true);
    command_socket_ = socket_fd;
    Logger::info("Connected to store");
    return true;
}

bool StoreClient::connect() {
    if (!open_command()) return false;

    try {
        restore_subscriptions();
    } catch (const UnavailableError& e) {
        Logger::warning(std::string("Subscriptions not restored: ") + e.what());
    }
    return true;
}

void StoreClient::restore_subscriptions() {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    if (subscriber_alive_) return;
    if (subscription_count() == 0) return;
    ensure_subscriber();
}

size_t StoreClient::subscription_count() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return callbacks_.size();
}

// Caller holds command_mutex_.
void StoreClient::disconnect_command() {
    int socket_fd = command_socket_.exchange(-1);
    if (socket_fd >= 0) {
        shutdown(socket_fd, SHUT_RDWR);
        ::close(socket_fd);
    }
}

void StoreClient::close() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (const auto& [id, sub] : callbacks_) ids.push_back(id);
    }
    for (uint64_t id : ids) {
        try {
            unsubscribe(id);
        } catch (const std::exception& e) {
            Logger::warning("Unsubscribe of " + std::to_string(id) +
                            " during close failed: " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(subscriber_mutex_);
        if (subscriber_socket_ >= 0) shutdown(subscriber_socket_, SHUT_RDWR);
        if (reader_thread_.joinable()) reader_thread_.join();
        if (subscriber_socket_ >= 0) {
            ::close(subscriber_socket_);
            subscriber_socket_ = -1;
        }
    }

    std::lock_guard<std::mutex> lock(command_mutex_);
    if (command_socket_ >= 0) {
        disconnect_command();
        Logger::info("Disconnected from store");
    }
}

//==============================================================================
// SECTION 2: Request/response
//==============================================================================

void StoreClient::check_reply(const StoreReplyMessage& reply, MessageType op) {
    if (!reply.ok) {
        throw ProtocolError(std::string("Store rejected ") + message_type_name(op) +
                            ": " + reply.error);
    }
}

StoreReplyMessage StoreClient::call(StoreRequestMessage& request) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (command_socket_ < 0) {
        throw UnavailableError("Not connected to store");
    }

    request.id = next_request_id_++;
    if (!send_message(command_socket_, request)) {
        disconnect_command();
        throw UnavailableError(std::string("Failed to send ") +
                               message_type_name(request.type) + " to store");
    }

    auto msg = receive_message(command_socket_);
    auto* reply = dynamic_cast<StoreReplyMessage*>(msg.get());
    if (!reply || reply->id != request.id) {
        disconnect_command();
        throw UnavailableError(std::string("No reply to ") +
                               message_type_name(request.type) + " from store");
    }

    check_reply(*reply, request.type);
    return *reply;
}

bool StoreClient::set_if_absent(const std::string& key, const std::string& value, int64_t ttl_ms) {
    StoreRequestMessage request(MessageType::SET_IF_ABSENT);
    request.key = key;
    request.value = value;
    request.ttl_ms = static_cast<uint64_t>(ttl_ms);
    return call(request).flag;
}

bool StoreClient::compare_and_delete(const std::string& key, const std::string& expected) {
    StoreRequestMessage request(MessageType::COMPARE_AND_DELETE);
    request.key = key;
    request.value = expected;
    return call(request).flag;
}

bool StoreClient::compare_and_expire(const std::string& key, const std::string& expected,
                                     int64_t ttl_ms) {
    StoreRequestMessage request(MessageType::COMPARE_AND_EXPIRE);
    request.key = key;
    request.value = expected;
    request.ttl_ms = ttl_ms > 0 ? static_cast<uint64_t>(ttl_ms) : 0;
    return call(request).flag;
}

bool StoreClient::compare_and_set(const std::string& key,
                                  const std::optional<std::string>& expected,
                                  const std::string& value, int64_t ttl_ms) {
    StoreRequestMessage request(MessageType::COMPARE_AND_SET);
    request.key = key;
    request.value = value;
    request.ttl_ms = ttl_ms > 0 ? static_cast<uint64_t>(ttl_ms) : 0;
    request.has_expected = expected.has_value();
    if (expected) request.expected = *expected;
    return call(request).flag;
}

std::optional<std::string> StoreClient::get(const std::string& key) {
    StoreRequestMessage request(MessageType::GET);
    request.key = key;
    StoreReplyMessage reply = call(request);
    if (!reply.has_value) return std::nullopt;
    return reply.value;
}

bool StoreClient::exists(const std::string& key) {
    StoreRequestMessage request(MessageType::EXISTS);
    request.key = key;
    return call(request).flag;
}

void StoreClient::set(const std::string& key, const std::string& value, int64_t ttl_ms) {
    StoreRequestMessage request(MessageType::SET);
    request.key = key;
    request.value = value;
    request.ttl_ms = ttl_ms > 0 ? static_cast<uint64_t>(ttl_ms) : 0;
    call(request);
}

bool StoreClient::del(const std::string& key) {
    StoreRequestMessage request(MessageType::DEL);
    request.key = key;
    return call(request).flag;
}

std::vector<std::string> StoreClient::keys_with_prefix(const std::string& prefix) {
    StoreRequestMessage request(MessageType::KEYS);
    request.key = prefix;
    return call(request).items;
}

size_t StoreClient::publish(const std::string& channel, const std::string& payload) {
    StoreRequestMessage request(MessageType::PUBLISH);
    request.key = channel;
    request.value = payload;
    return static_cast<size_t>(call(request).number);
}

size_t StoreClient::num_subscribers(const std::string& channel) {
    StoreRequestMessage request(MessageType::NUM_SUBSCRIBERS);
    request.key = channel;
    return static_cast<size_t>(call(request).number);
}

bool StoreClient::ping() {
    StoreRequestMessage request(MessageType::PING);
    return call(request).ok;
}

//==============================================================================
// SECTION 3: Subscriber connection
//==============================================================================

// Caller holds subscriber_mutex_.
void StoreClient::ensure_subscriber() {
    if (subscriber_alive_) return;

    if (reader_thread_.joinable()) reader_thread_.join();
    if (subscriber_socket_ >= 0) {
        ::close(subscriber_socket_);
        subscriber_socket_ = -1;
    }

    int socket_fd = open_socket();
    if (socket_fd < 0) {
        throw UnavailableError("Failed to open subscriber connection to store");
    }
    configure_timeouts(socket_fd, false);

    subscriber_socket_ = socket_fd;
    subscriber_alive_ = true;
    reader_thread_ = std::thread(&StoreClient::reader_loop, this);
    Logger::debug("Subscriber connection opened");

    resubscribe_all();
}

// Caller holds subscriber_mutex_ and a fresh subscriber connection.
void StoreClient::resubscribe_all() {
    std::vector<std::pair<uint64_t, Subscription>> existing;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (const auto& [id, sub] : callbacks_) existing.emplace_back(id, sub);
    }
    if (existing.empty()) return;

    for (const auto& [id, sub] : existing) {
        StoreRequestMessage request(sub.op);
        request.key = sub.target;
        request.ttl_ms = id;
        call_subscriber(request);
    }
    Logger::info("Restored " + std::to_string(existing.size()) + " subscriptions");
}

// Caller holds subscriber_mutex_.
StoreReplyMessage StoreClient::call_subscriber(StoreRequestMessage& request) {
    if (!subscriber_alive_) {
        throw UnavailableError("Subscriber connection to store is closed");
    }

    request.id = next_request_id_++;
    if (!send_message(subscriber_socket_, request)) {
        shutdown(subscriber_socket_, SHUT_RDWR);
        throw UnavailableError(std::string("Failed to send ") +
                               message_type_name(request.type) + " to store");
    }

    std::unique_lock<std::mutex> lock(replies_mutex_);
    bool arrived = replies_cv_.wait_for(
        lock, std::chrono::milliseconds(config_.io_timeout_ms),
        [this, &request] {
            return pending_replies_.count(request.id) > 0 || !subscriber_alive_;
        });

    auto it = pending_replies_.find(request.id);
    if (!arrived || it == pending_replies_.end()) {
        throw UnavailableError(std::string("No reply to ") +
                               message_type_name(request.type) + " from store");
    }

    StoreReplyMessage reply = std::move(it->second);
    pending_replies_.erase(it);
    check_reply(reply, request.type);
    return reply;
}

void StoreClient::reader_loop() {
    while (true) {
        auto msg = receive_message(subscriber_socket_);
        if (!msg) break;

        if (auto* event = dynamic_cast<PublishEventMessage*>(msg.get())) {
            SubscriptionCallback callback;
            {
                std::lock_guard<std::mutex> lock(callbacks_mutex_);
                auto it = callbacks_.find(event->subscription_id);
                if (it != callbacks_.end()) callback = it->second.callback;
            }
            if (!callback) continue;

            try {
                callback(event->channel, event->payload);
            } catch (const std::exception& e) {
                Logger::error("Subscriber callback on '" + event->channel +
                              "' failed: " + e.what());
            }
        } else if (auto* reply = dynamic_cast<StoreReplyMessage*>(msg.get())) {
            std::lock_guard<std::mutex> lock(replies_mutex_);
            pending_replies_[reply->id] = *reply;
            replies_cv_.notify_all();
        }
    }

    {
        std::lock_guard<std::mutex> lock(replies_mutex_);
        subscriber_alive_ = false;
    }
    replies_cv_.notify_all();

    size_t suspended = subscription_count();
    if (suspended > 0) {
        Logger::warning("Subscriber connection lost; " + std::to_string(suspended) +
                        " subscriptions wait for reconnect");
    } else {
        Logger::debug("Subscriber connection closed");
    }
}

uint64_t StoreClient::add_subscription(MessageType op, const std::string& target,
                                       SubscriptionCallback callback) {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    ensure_subscriber();

    uint64_t id = next_subscription_id_++;
    {
        // Registered before the request so an early event is not lost.
        std::lock_guard<std::mutex> cb_lock(callbacks_mutex_);
        callbacks_[id] = Subscription{op, target, std::move(callback)};
    }

    StoreRequestMessage request(op);
    request.key = target;
    request.ttl_ms = id;
    try {
        call_subscriber(request);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> cb_lock(callbacks_mutex_);
        callbacks_.erase(id);
        throw;
    }
    return id;
}

uint64_t StoreClient::subscribe(const std::string& channel, SubscriptionCallback callback) {
    return add_subscription(MessageType::SUBSCRIBE, channel, std::move(callback));
}

uint64_t StoreClient::psubscribe(const std::string& pattern, SubscriptionCallback callback) {
    return add_subscription(MessageType::PSUBSCRIBE, pattern, std::move(callback));
}

bool StoreClient::unsubscribe(uint64_t subscription_id) {
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        if (callbacks_.erase(subscription_id) == 0) return false;
    }

    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    if (!subscriber_alive_) {
        // The server already dropped every subscription of the closed connection.
        return true;
    }

    StoreRequestMessage request(MessageType::UNSUBSCRIBE);
    request.ttl_ms = subscription_id;
    return call_subscriber(request).flag;
}

} // namespace fleetwatch
