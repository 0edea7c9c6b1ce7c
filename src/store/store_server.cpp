/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: store_server.cpp

    Description:
        Implementation of the store daemon's TCP server.

        Error Handling:
        - Socket errors: close that connection, drop its subscriptions
        - Invalid request (bad opcode, non-positive lock TTL): ERROR reply
          with ok=false, connection stays open
        - Setup failures: start() returns false
*******************************************************************************/

#include "store/store_server.h"
#include "common/errors.h"
#include "common/logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <utility>

namespace fleetwatch {

//==============================================================================
// SECTION 1: Lifecycle
//==============================================================================

StoreServer::StoreServer(const StoreServerConfig& config)
    : config_(config),
      server_socket_(-1),
      bound_port_(0),
      running_(false),
      requests_served_(0) {
}

StoreServer::~StoreServer() {
    stop();
}

bool StoreServer::start() {
    if (running_) {
        Logger::warning("Store server already running");
        return false;
    }

    if (!setup_server_socket()) {
        Logger::error("Failed to setup server socket");
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&StoreServer::accept_connections, this);
    sweep_thread_ = std::thread(&StoreServer::sweep_loop, this);

    Logger::info("Store server listening on port " + std::to_string(bound_port_));
    return true;
}

void StoreServer::stop() {
    if (!running_) return;

    Logger::info("Stopping store server...");
    running_ = false;
    sweep_cv_.notify_all();

    // Unblocks accept()
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
        close_socket(server_socket_);
    }

    if (accept_thread_.joinable()) accept_thread_.join();
    if (sweep_thread_.joinable()) sweep_thread_.join();

    // Connection threads are detached; wake them and wait for all to exit.
    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (const auto& conn : connections_) {
        std::lock_guard<std::mutex> write_lock(conn->write_mutex);
        if (conn->socket_fd >= 0) shutdown(conn->socket_fd, SHUT_RDWR);
    }
    connections_cv_.wait(lock, [this] { return connections_.empty(); });

    Logger::info("Store server stopped");
}

bool StoreServer::setup_server_socket() {
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::warning("Failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(config_.listen_port);

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Failed to bind socket: " + std::string(strerror(errno)));
        close_socket(server_socket_);
        return false;
    }

    if (listen(server_socket_, config_.max_clients) < 0) {
        Logger::error("Failed to listen: " + std::string(strerror(errno)));
        close_socket(server_socket_);
        return false;
    }

    socklen_t addr_len = sizeof(address);
    if (getsockname(server_socket_, (struct sockaddr*)&address, &addr_len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    } else {
        bound_port_ = config_.listen_port;
    }
    return true;
}

size_t StoreServer::connection_count() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

//==============================================================================
// SECTION 2: Connection handling
//==============================================================================

void StoreServer::accept_connections() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &addr_len);
        if (client_socket < 0) {
            if (running_ && errno != EINTR) {
                Logger::error("Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        char client_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, INET_ADDRSTRLEN);

        auto conn = std::make_shared<Connection>(client_socket);
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            if (static_cast<int>(connections_.size()) >= config_.max_clients) {
                Logger::warning("Rejecting " + std::string(client_ip) +
                                ": max_clients reached");
                close_socket(conn->socket_fd);
                continue;
            }
            connections_.insert(conn);
        }

        Logger::debug("Accepted store client " + std::string(client_ip) +
                      " on socket " + std::to_string(client_socket));
        std::thread(&StoreServer::handle_connection, this, conn).detach();
    }
}

void StoreServer::handle_connection(std::shared_ptr<Connection> conn) {
    int socket_fd = conn->socket_fd;

    try {
        while (running_) {
            auto msg = receive_message(socket_fd, config_.max_frame_bytes);
            if (!msg) break;

            auto* request = dynamic_cast<StoreRequestMessage*>(msg.get());
            if (!request) {
                Logger::warning(std::string("Unexpected frame from client: ") +
                                message_type_name(msg->type));
                continue;
            }

            StoreReplyMessage reply = execute(*request, conn);
            reply.id = request->id;
            requests_served_++;

            if (!send_frame(*conn, reply)) {
                Logger::warning("Failed to send reply on socket " + std::to_string(socket_fd));
                break;
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Exception in store connection handler: " + std::string(e.what()));
    }

    drop_subscriptions(*conn);
    {
        std::lock_guard<std::mutex> write_lock(conn->write_mutex);
        close_socket(conn->socket_fd);
    }
    Logger::debug("Store client on socket " + std::to_string(socket_fd) + " disconnected");

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(conn);
    connections_cv_.notify_all();
}

bool StoreServer::send_frame(Connection& conn, const Message& msg) {
    std::lock_guard<std::mutex> lock(conn.write_mutex);
    if (conn.socket_fd < 0) return false;
    return send_message(conn.socket_fd, msg);
}

void StoreServer::close_socket(int& socket_fd) {
    if (socket_fd >= 0) {
        close(socket_fd);
        socket_fd = -1;
    }
}

//==============================================================================
// SECTION 3: Request execution
//==============================================================================

StoreReplyMessage StoreServer::execute(const StoreRequestMessage& request,
                                       const std::shared_ptr<Connection>& conn) {
    StoreReplyMessage reply;
    int64_t ttl_ms = static_cast<int64_t>(request.ttl_ms);

    switch (request.type) {
        case MessageType::PING:
            break;

        case MessageType::SET_IF_ABSENT:
            if (ttl_ms <= 0) {
                reply.ok = false;
                reply.error = "SET_IF_ABSENT requires a positive ttl";
                break;
            }
            reply.flag = engine_.set_if_absent(request.key, request.value, ttl_ms);
            break;

        case MessageType::COMPARE_AND_DELETE:
            reply.flag = engine_.compare_and_delete(request.key, request.value);
            break;

        case MessageType::COMPARE_AND_EXPIRE:
            reply.flag = engine_.compare_and_expire(request.key, request.value, ttl_ms);
            break;

        case MessageType::COMPARE_AND_SET: {
            std::optional<std::string> expected;
            if (request.has_expected) expected = request.expected;
            reply.flag = engine_.compare_and_set(request.key, expected, request.value, ttl_ms);
            break;
        }

        case MessageType::GET: {
            auto value = engine_.get(request.key);
            reply.has_value = value.has_value();
            if (value) reply.value = *value;
            break;
        }

        case MessageType::EXISTS:
            reply.flag = engine_.exists(request.key);
            break;

        case MessageType::SET:
            engine_.set(request.key, request.value, ttl_ms);
            break;

        case MessageType::DEL:
            reply.flag = engine_.del(request.key);
            break;

        case MessageType::KEYS:
            reply.items = engine_.keys_with_prefix(request.key);
            reply.number = reply.items.size();
            break;

        case MessageType::PUBLISH:
            reply.number = engine_.publish(request.key, request.value);
            break;

        case MessageType::SUBSCRIBE:
        case MessageType::PSUBSCRIBE:
            reply.number = attach_subscription(request, conn);
            break;

        case MessageType::UNSUBSCRIBE: {
            uint64_t engine_id = 0;
            {
                std::lock_guard<std::mutex> lock(conn->write_mutex);
                auto it = conn->subscriptions.find(request.ttl_ms);
                if (it != conn->subscriptions.end()) {
                    engine_id = it->second;
                    conn->subscriptions.erase(it);
                }
            }
            reply.flag = engine_id != 0 && engine_.unsubscribe(engine_id);
            break;
        }

        case MessageType::NUM_SUBSCRIBERS:
            reply.number = engine_.num_subscribers(request.key);
            break;

        default:
            reply.ok = false;
            reply.error = std::string("Unsupported opcode ") + message_type_name(request.type);
            break;
    }
    return reply;
}

uint64_t StoreServer::attach_subscription(const StoreRequestMessage& request,
                                          const std::shared_ptr<Connection>& conn) {
    uint64_t client_id = request.ttl_ms;
    std::weak_ptr<Connection> weak_conn = conn;

    SubscriptionCallback push = [weak_conn, client_id](const std::string& channel,
                                                       const std::string& payload) {
        auto target = weak_conn.lock();
        if (!target) return;

        PublishEventMessage event;
        event.subscription_id = client_id;
        event.channel = channel;
        event.payload = payload;
        if (!send_frame(*target, event)) {
            Logger::warning("Dropped event on '" + channel + "' for closed subscriber");
        }
    };

    uint64_t engine_id = request.type == MessageType::PSUBSCRIBE
                             ? engine_.psubscribe(request.key, std::move(push))
                             : engine_.subscribe(request.key, std::move(push));

    uint64_t replaced = 0;
    {
        std::lock_guard<std::mutex> lock(conn->write_mutex);
        auto it = conn->subscriptions.find(client_id);
        if (it != conn->subscriptions.end()) replaced = it->second;
        conn->subscriptions[client_id] = engine_id;
    }
    if (replaced != 0) engine_.unsubscribe(replaced);

    Logger::debug("Socket " + std::to_string(conn->socket_fd) + " subscribed to '" +
                  request.key + "' as " + std::to_string(client_id));
    return client_id;
}

void StoreServer::drop_subscriptions(Connection& conn) {
    std::map<uint64_t, uint64_t> subscriptions;
    {
        std::lock_guard<std::mutex> lock(conn.write_mutex);
        subscriptions.swap(conn.subscriptions);
    }
    for (const auto& [client_id, engine_id] : subscriptions) {
        engine_.unsubscribe(engine_id);
    }
}

//==============================================================================
// SECTION 4: Expiry sweep
//==============================================================================

void StoreServer::sweep_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(sweep_mutex_);
            sweep_cv_.wait_for(lock, std::chrono::milliseconds(config_.sweep_interval_ms),
                               [this] { return !running_; });
        }
        if (!running_) break;

        size_t purged = engine_.purge_expired();
        if (purged > 0) {
            Logger::debug("Purged " + std::to_string(purged) + " expired keys");
        }
    }
}

} // namespace fleetwatch
