/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: store_client.h

    Description:
        SharedStore implementation that talks to fleetwatch_stored over TCP.

        Connections:
        - Command connection: opened by connect(). One request in flight at
          a time (command_mutex_), each reply matched by request id.
        - Subscriber connection: opened lazily by the first subscribe() or
          psubscribe(). A reader thread receives pushed PUBLISH_EVENT frames
          and the replies to (un)subscribe requests sent on it.

        Failure Semantics:
        - Any socket failure on the command connection closes it and throws
          UnavailableError. There is no implicit reconnect; callers decide
          whether to call connect() again.
        - A request the server rejects throws ProtocolError.

        Every subscription keeps its opcode and target. When the subscriber
        connection is lost the subscriptions stay registered but receive
        nothing; connect() and the next subscribe() open a new subscriber
        connection and re-issue all of them under their original ids.

        Subscription callbacks run on the reader thread. They may publish
        or read keys, but must not subscribe or unsubscribe: the reply to
        that request would be queued behind the running callback.
*******************************************************************************/

#ifndef STORE_CLIENT_H
#define STORE_CLIENT_H

#include "common/message.h"
#include "store/shared_store.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace fleetwatch {

struct StoreClientConfig {
    std::string host;
    uint16_t port;
    int connect_timeout_ms;
    int io_timeout_ms;

    StoreClientConfig()
        : host("localhost"), port(6390),
          connect_timeout_ms(1500), io_timeout_ms(5000) {}
};

class StoreClient : public SharedStore {
public:
    explicit StoreClient(const StoreClientConfig& config);
    ~StoreClient() override;

    StoreClient(const StoreClient&) = delete;
    StoreClient& operator=(const StoreClient&) = delete;

    /**
     * @brief Opens the command connection and restores subscriptions
     *        whose subscriber connection was lost.
     * @return false if the daemon could not be reached (logged)
     */
    bool connect();

    /**
     * @brief Re-issues every registered subscription on a fresh subscriber
     *        connection if the current one is gone. No-op otherwise.
     * @throws UnavailableError if the daemon cannot be reached
     */
    void restore_subscriptions();

    bool subscriber_connected() const { return subscriber_alive_; }
    size_t subscription_count();

    /**
     * @brief Unsubscribes everything best-effort, stops the reader thread
     *        and closes both connections. Idempotent.
     */
    void close();

    bool is_connected() const { return command_socket_ >= 0; }

    bool set_if_absent(const std::string& key, const std::string& value,
                       int64_t ttl_ms) override;
    bool compare_and_delete(const std::string& key, const std::string& expected) override;
    bool compare_and_expire(const std::string& key, const std::string& expected,
                            int64_t ttl_ms) override;
    bool compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                         const std::string& value, int64_t ttl_ms = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool exists(const std::string& key) override;
    void set(const std::string& key, const std::string& value, int64_t ttl_ms = 0) override;
    bool del(const std::string& key) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

    size_t publish(const std::string& channel, const std::string& payload) override;
    uint64_t subscribe(const std::string& channel, SubscriptionCallback callback) override;
    uint64_t psubscribe(const std::string& pattern, SubscriptionCallback callback) override;
    bool unsubscribe(uint64_t subscription_id) override;
    size_t num_subscribers(const std::string& channel) override;

    bool ping() override;

private:
    StoreClientConfig config_;

    std::atomic<int> command_socket_;
    std::mutex command_mutex_;

    int subscriber_socket_;
    std::atomic<bool> subscriber_alive_;
    std::thread reader_thread_;
    std::mutex subscriber_mutex_;          // serializes (un)subscribe requests
    std::mutex replies_mutex_;
    std::condition_variable replies_cv_;
    std::map<uint64_t, StoreReplyMessage> pending_replies_;

    struct Subscription {
        MessageType op;
        std::string target;
        SubscriptionCallback callback;
    };

    std::mutex callbacks_mutex_;
    std::map<uint64_t, Subscription> callbacks_;

    std::atomic<uint64_t> next_request_id_;
    std::atomic<uint64_t> next_subscription_id_;

    int open_socket();
    bool open_command();
    void configure_timeouts(int socket_fd, bool receive_timeout);

    StoreReplyMessage call(StoreRequestMessage& request);
    StoreReplyMessage call_subscriber(StoreRequestMessage& request);

    void ensure_subscriber();
    void resubscribe_all();
    void reader_loop();
    void disconnect_command();

    uint64_t add_subscription(MessageType op, const std::string& target,
                              SubscriptionCallback callback);

    static void check_reply(const StoreReplyMessage& reply, MessageType op);
};

} // namespace fleetwatch

#endif // STORE_CLIENT_H
