/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: message.cpp

    Description:
        Serialization of store protocol messages and the framed socket
        send/receive used by both StoreServer and StoreClient.
*******************************************************************************/

#include "common/message.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <cerrno>
#include <stdexcept>
#include <cstring>

namespace fleetwatch {

//==============================================================================
// SECTION 1: Encoding helpers
//==============================================================================

static void append_u8(std::vector<uint8_t>& buffer, uint8_t val) {
    buffer.push_back(val);
}

static void append_u32(std::vector<uint8_t>& buffer, uint32_t val) {
    uint32_t net = hton32(val);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

static void append_u64(std::vector<uint8_t>& buffer, uint64_t val) {
    uint64_t net = hton64(val);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 8);
}

static void serialize_string(std::vector<uint8_t>& buffer, const std::string& str) {
    append_u32(buffer, static_cast<uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

static uint8_t read_u8(const uint8_t*& ptr, const uint8_t* end) {
    if (ptr + 1 > end) throw ProtocolError("Buffer underflow reading byte");
    return *ptr++;
}

static uint32_t read_u32(const uint8_t*& ptr, const uint8_t* end) {
    if (ptr + 4 > end) throw ProtocolError("Buffer underflow reading u32");
    uint32_t val;
    std::memcpy(&val, ptr, 4);
    ptr += 4;
    return ntoh32(val);
}

static uint64_t read_u64(const uint8_t*& ptr, const uint8_t* end) {
    if (ptr + 8 > end) throw ProtocolError("Buffer underflow reading u64");
    uint64_t val;
    std::memcpy(&val, ptr, 8);
    ptr += 8;
    return ntoh64(val);
}

static std::string deserialize_string(const uint8_t*& ptr, const uint8_t* end) {
    uint32_t len = read_u32(ptr, end);
    if (static_cast<size_t>(end - ptr) < len) throw ProtocolError("Buffer underflow reading string data");

    std::string result(reinterpret_cast<const char*>(ptr), len);
    ptr += len;
    return result;
}

// Writes the 13-byte header with a zero size placeholder and returns the
// offset where the payload starts.
static size_t begin_frame(std::vector<uint8_t>& buffer, MessageType type, uint64_t id) {
    append_u8(buffer, static_cast<uint8_t>(type));
    append_u64(buffer, id);
    append_u32(buffer, 0);
    return buffer.size();
}

static void finish_frame(std::vector<uint8_t>& buffer, size_t payload_start) {
    uint32_t payload_size = static_cast<uint32_t>(buffer.size() - payload_start);
    uint32_t net_size = hton32(payload_size);
    std::memcpy(&buffer[payload_start - 4], &net_size, 4);
}

static const uint8_t* read_header(const uint8_t* data, size_t size, Message& msg) {
    if (size < 13) throw ProtocolError("Frame shorter than header");

    const uint8_t* ptr = data;
    const uint8_t* end = data + size;
    msg.type = static_cast<MessageType>(read_u8(ptr, end));
    msg.id = read_u64(ptr, end);
    msg.payload_size = read_u32(ptr, end);

    if (static_cast<size_t>(end - ptr) < msg.payload_size) {
        throw ProtocolError("Declared payload exceeds frame");
    }
    return ptr;
}

//==============================================================================
// SECTION 2: Type names
//==============================================================================

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::PING: return "PING";
        case MessageType::SET_IF_ABSENT: return "SET_IF_ABSENT";
        case MessageType::COMPARE_AND_DELETE: return "COMPARE_AND_DELETE";
        case MessageType::COMPARE_AND_EXPIRE: return "COMPARE_AND_EXPIRE";
        case MessageType::GET: return "GET";
        case MessageType::EXISTS: return "EXISTS";
        case MessageType::SET: return "SET";
        case MessageType::DEL: return "DEL";
        case MessageType::KEYS: return "KEYS";
        case MessageType::PUBLISH: return "PUBLISH";
        case MessageType::SUBSCRIBE: return "SUBSCRIBE";
        case MessageType::PSUBSCRIBE: return "PSUBSCRIBE";
        case MessageType::UNSUBSCRIBE: return "UNSUBSCRIBE";
        case MessageType::NUM_SUBSCRIBERS: return "NUM_SUBSCRIBERS";
        case MessageType::COMPARE_AND_SET: return "COMPARE_AND_SET";
        case MessageType::REPLY: return "REPLY";
        case MessageType::PUBLISH_EVENT: return "PUBLISH_EVENT";
        case MessageType::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

bool is_request_type(MessageType type) {
    uint8_t raw = static_cast<uint8_t>(type);
    return raw >= static_cast<uint8_t>(MessageType::PING) &&
           raw <= static_cast<uint8_t>(MessageType::COMPARE_AND_SET);
}

//==============================================================================
// SECTION 3: Message classes
//==============================================================================

std::vector<uint8_t> Message::serialize() const {
    std::vector<uint8_t> buffer;
    size_t payload_start = begin_frame(buffer, type, id);
    finish_frame(buffer, payload_start);
    return buffer;
}

std::vector<uint8_t> StoreRequestMessage::serialize() const {
    std::vector<uint8_t> buffer;
    size_t payload_start = begin_frame(buffer, type, id);

    serialize_string(buffer, key);
    serialize_string(buffer, value);
    append_u64(buffer, ttl_ms);
    append_u8(buffer, has_expected ? 1 : 0);
    serialize_string(buffer, expected);

    finish_frame(buffer, payload_start);
    return buffer;
}

std::unique_ptr<StoreRequestMessage> StoreRequestMessage::deserialize(const uint8_t* data, size_t size) {
    auto msg = std::make_unique<StoreRequestMessage>();
    const uint8_t* ptr = read_header(data, size, *msg);
    const uint8_t* end = ptr + msg->payload_size;

    if (!is_request_type(msg->type)) {
        throw ProtocolError("Not a request opcode: " +
                            std::to_string(static_cast<int>(msg->type)));
    }

    msg->key = deserialize_string(ptr, end);
    msg->value = deserialize_string(ptr, end);
    msg->ttl_ms = read_u64(ptr, end);
    msg->has_expected = read_u8(ptr, end) != 0;
    msg->expected = deserialize_string(ptr, end);
    return msg;
}

std::vector<uint8_t> StoreReplyMessage::serialize() const {
    std::vector<uint8_t> buffer;
    size_t payload_start = begin_frame(buffer, type, id);

    append_u8(buffer, ok ? 1 : 0);
    append_u8(buffer, flag ? 1 : 0);
    append_u64(buffer, number);
    append_u8(buffer, has_value ? 1 : 0);
    serialize_string(buffer, value);

    append_u32(buffer, static_cast<uint32_t>(items.size()));
    for (const auto& item : items) {
        serialize_string(buffer, item);
    }
    serialize_string(buffer, error);

    finish_frame(buffer, payload_start);
    return buffer;
}

std::unique_ptr<StoreReplyMessage> StoreReplyMessage::deserialize(const uint8_t* data, size_t size) {
    auto msg = std::make_unique<StoreReplyMessage>();
    const uint8_t* ptr = read_header(data, size, *msg);
    const uint8_t* end = ptr + msg->payload_size;

    msg->ok = read_u8(ptr, end) != 0;
    msg->flag = read_u8(ptr, end) != 0;
    msg->number = read_u64(ptr, end);
    msg->has_value = read_u8(ptr, end) != 0;
    msg->value = deserialize_string(ptr, end);

    uint32_t count = read_u32(ptr, end);
    // Each item needs at least its 4-byte length prefix.
    if (static_cast<size_t>(end - ptr) < static_cast<size_t>(count) * 4) {
        throw ProtocolError("Item count exceeds payload");
    }
    msg->items.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        msg->items.push_back(deserialize_string(ptr, end));
    }
    msg->error = deserialize_string(ptr, end);
    return msg;
}

std::vector<uint8_t> PublishEventMessage::serialize() const {
    std::vector<uint8_t> buffer;
    size_t payload_start = begin_frame(buffer, type, id);

    append_u64(buffer, subscription_id);
    serialize_string(buffer, channel);
    serialize_string(buffer, payload);

    finish_frame(buffer, payload_start);
    return buffer;
}

std::unique_ptr<PublishEventMessage> PublishEventMessage::deserialize(const uint8_t* data, size_t size) {
    auto msg = std::make_unique<PublishEventMessage>();
    const uint8_t* ptr = read_header(data, size, *msg);
    const uint8_t* end = ptr + msg->payload_size;

    msg->subscription_id = read_u64(ptr, end);
    msg->channel = deserialize_string(ptr, end);
    msg->payload = deserialize_string(ptr, end);
    return msg;
}

std::unique_ptr<Message> decode_message(const uint8_t* data, size_t size) {
    if (size == 0) throw ProtocolError("Empty frame");

    MessageType type = static_cast<MessageType>(data[0]);
    if (is_request_type(type)) {
        return StoreRequestMessage::deserialize(data, size);
    }
    switch (type) {
        case MessageType::REPLY:
            return StoreReplyMessage::deserialize(data, size);
        case MessageType::PUBLISH_EVENT:
            return PublishEventMessage::deserialize(data, size);
        default:
            throw ProtocolError("Unknown message type: " +
                                std::to_string(static_cast<int>(type)));
    }
}

//==============================================================================
// SECTION 4: Framed socket I/O
//==============================================================================

static bool send_all(int socket_fd, const uint8_t* data, size_t size) {
    size_t sent_total = 0;
    while (sent_total < size) {
        ssize_t sent = send(socket_fd, data + sent_total, size - sent_total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (sent == 0) return false;
        sent_total += static_cast<size_t>(sent);
    }
    return true;
}

static bool recv_all(int socket_fd, uint8_t* data, size_t size) {
    size_t received_total = 0;
    while (received_total < size) {
        ssize_t received = recv(socket_fd, data + received_total, size - received_total, 0);
        if (received < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (received == 0) return false;
        received_total += static_cast<size_t>(received);
    }
    return true;
}

bool send_message(int socket_fd, const Message& msg) {
    auto data = msg.serialize();

    std::vector<uint8_t> frame;
    frame.reserve(4 + data.size());
    uint32_t net_size = hton32(static_cast<uint32_t>(data.size()));
    const uint8_t* size_bytes = reinterpret_cast<const uint8_t*>(&net_size);
    frame.insert(frame.end(), size_bytes, size_bytes + 4);
    frame.insert(frame.end(), data.begin(), data.end());

    return send_all(socket_fd, frame.data(), frame.size());
}

std::unique_ptr<Message> receive_message(int socket_fd, uint32_t max_frame_bytes) {
    uint32_t size;
    if (!recv_all(socket_fd, reinterpret_cast<uint8_t*>(&size), sizeof(size))) {
        return nullptr;
    }
    size = ntoh32(size);

    if (size == 0 || size > max_frame_bytes) {
        Logger::error("Invalid frame size: " + std::to_string(size));
        return nullptr;
    }

    std::vector<uint8_t> data(size);
    if (!recv_all(socket_fd, data.data(), size)) {
        return nullptr;
    }

    try {
        return decode_message(data.data(), data.size());
    } catch (const ProtocolError& e) {
        Logger::error("Failed to decode frame: " + std::string(e.what()));
        return nullptr;
    }
}

} // namespace fleetwatch
