/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: store_server.h

    Description:
        TCP front end of the shared store daemon (fleetwatch_stored). It
        serves one KvEngine to any number of StoreClient connections.

        Concurrency Model:
        1. Accept Thread: accepts connections, spawns one handler per client
        2. Connection Threads: read request, execute on the engine, reply
        3. Sweep Thread: purges expired keys every sweep_interval_ms

        Subscriptions belong to the connection that created them. Pushed
        PUBLISH_EVENT frames and replies share the connection's write
        mutex so frames never interleave. When a connection closes, all
        of its subscriptions are dropped from the engine.
*******************************************************************************/

#ifndef STORE_SERVER_H
#define STORE_SERVER_H

#include "common/message.h"
#include "store/kv_engine.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace fleetwatch {

struct StoreServerConfig {
    uint16_t listen_port;      // 0 binds an ephemeral port, see StoreServer::port()
    int max_clients;
    int sweep_interval_ms;
    uint32_t max_frame_bytes;

    StoreServerConfig()
        : listen_port(6390), max_clients(64),
          sweep_interval_ms(1000), max_frame_bytes(1024 * 1024) {}
};

class StoreServer {
public:
    explicit StoreServer(const StoreServerConfig& config);
    ~StoreServer();

    StoreServer(const StoreServer&) = delete;
    StoreServer& operator=(const StoreServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Port actually bound (differs from the config when it was 0).
     */
    uint16_t port() const { return bound_port_; }

    size_t connection_count();
    uint64_t requests_served() const { return requests_served_; }

    KvEngine& engine() { return engine_; }

private:
    struct Connection {
        int socket_fd;
        std::mutex write_mutex;
        // client subscription id -> engine subscription id
        std::map<uint64_t, uint64_t> subscriptions;

        explicit Connection(int fd) : socket_fd(fd) {}
    };

    StoreServerConfig config_;
    KvEngine engine_;

    int server_socket_;
    uint16_t bound_port_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> requests_served_;

    std::thread accept_thread_;
    std::thread sweep_thread_;

    std::set<std::shared_ptr<Connection>> connections_;
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;

    bool setup_server_socket();
    void accept_connections();
    void handle_connection(std::shared_ptr<Connection> conn);
    void sweep_loop();

    StoreReplyMessage execute(const StoreRequestMessage& request,
                              const std::shared_ptr<Connection>& conn);
    uint64_t attach_subscription(const StoreRequestMessage& request,
                                 const std::shared_ptr<Connection>& conn);
    void drop_subscriptions(Connection& conn);

    static bool send_frame(Connection& conn, const Message& msg);
    static void close_socket(int& socket_fd);
};

} // namespace fleetwatch

#endif // STORE_SERVER_H
