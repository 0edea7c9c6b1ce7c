/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: message.h

    Description:
        Wire protocol between StoreClient and the store daemon. Every
        frame on the socket is a 4-byte big-endian length followed by a
        serialized Message:

        Header (13 bytes, shared by all message classes):
            [1 byte : MessageType]
            [8 bytes: request id (client-chosen, echoed in the reply)]
            [4 bytes: payload size]

        StoreRequestMessage payload:
            [string key][string value][8 bytes: ttl_ms]
            [1 has_expected][string expected]
        StoreReplyMessage payload:
            [1 ok][1 flag][8 number][1 has_value][string value]
            [4 count][count x string items][string error]
        PublishEventMessage payload:
            [8 subscription id][string channel][string payload]

        Strings are [4-byte length][bytes]. All integers big-endian.

        One request produces exactly one reply with the same id.
        PUBLISH_EVENT frames are pushed by the server on subscriber
        connections and never answered. Subscription ids are chosen by the
        client, so an event can be routed even if it overtakes the reply
        to its SUBSCRIBE request.
*******************************************************************************/

#ifndef MESSAGE_H
#define MESSAGE_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstring>
#include <memory>

namespace fleetwatch {

enum class MessageType : uint8_t {
    PING = 1,
    SET_IF_ABSENT = 2,
    COMPARE_AND_DELETE = 3,
    COMPARE_AND_EXPIRE = 4,
    GET = 5,
    EXISTS = 6,
    SET = 7,
    DEL = 8,
    KEYS = 9,
    PUBLISH = 10,
    SUBSCRIBE = 11,
    PSUBSCRIBE = 12,
    UNSUBSCRIBE = 13,
    NUM_SUBSCRIBERS = 14,
    COMPARE_AND_SET = 15,

    REPLY = 64,
    PUBLISH_EVENT = 65,

    ERROR = 255
};

const char* message_type_name(MessageType type);

bool is_request_type(MessageType type);

class Message {
public:
    MessageType type;
    uint64_t id;
    uint32_t payload_size;

    Message(MessageType t = MessageType::ERROR)
        : type(t), id(0), payload_size(0) {}

    virtual ~Message() = default;

    virtual std::vector<uint8_t> serialize() const;
};

/**
 * @class StoreRequestMessage
 * @brief One store operation. The opcode is the header type.
 *
 * Field use per opcode:
 *   SET_IF_ABSENT       key, value (token), ttl_ms
 *   COMPARE_AND_DELETE  key, value (expected)
 *   COMPARE_AND_EXPIRE  key, value (expected), ttl_ms
 *   GET / EXISTS / DEL  key
 *   SET                 key, value, ttl_ms (0 = persistent)
 *   KEYS                key (prefix)
 *   PUBLISH             key (channel), value (payload)
 *   SUBSCRIBE           key (channel), ttl_ms (client subscription id)
 *   PSUBSCRIBE          key (glob pattern), ttl_ms (client subscription id)
 *   UNSUBSCRIBE         ttl_ms (client subscription id)
 *   NUM_SUBSCRIBERS     key (channel)
 *   COMPARE_AND_SET     key, value (new), ttl_ms, expected (absent when
 *                       has_expected is 0: the key must not exist)
 */
class StoreRequestMessage : public Message {
public:
    std::string key;
    std::string value;
    uint64_t ttl_ms;
    bool has_expected;
    std::string expected;

    explicit StoreRequestMessage(MessageType op = MessageType::PING)
        : Message(op), ttl_ms(0), has_expected(false) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<StoreRequestMessage> deserialize(const uint8_t* data, size_t size);
};

class StoreReplyMessage : public Message {
public:
    bool ok;
    bool flag;
    uint64_t number;
    bool has_value;
    std::string value;
    std::vector<std::string> items;
    std::string error;

    StoreReplyMessage()
        : Message(MessageType::REPLY), ok(true), flag(false),
          number(0), has_value(false) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<StoreReplyMessage> deserialize(const uint8_t* data, size_t size);
};

class PublishEventMessage : public Message {
public:
    uint64_t subscription_id;
    std::string channel;
    std::string payload;

    PublishEventMessage() : Message(MessageType::PUBLISH_EVENT), subscription_id(0) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<PublishEventMessage> deserialize(const uint8_t* data, size_t size);
};

/**
 * @brief Decodes any frame body by its leading type byte.
 * @throws ProtocolError on unknown type or truncated data
 */
std::unique_ptr<Message> decode_message(const uint8_t* data, size_t size);

/**
 * @brief Writes [u32 length][serialized message] to a connected socket.
 * @return false when the socket refused the full frame
 */
bool send_message(int socket_fd, const Message& msg);

/**
 * @brief Blocks for one complete frame and decodes it.
 * @return nullptr on EOF, socket error or an oversized/invalid frame
 */
std::unique_ptr<Message> receive_message(int socket_fd, uint32_t max_frame_bytes = 1024 * 1024);

inline uint16_t hton16(uint16_t val) {
    return ((val & 0xFF) << 8) | ((val >> 8) & 0xFF);
}

inline uint32_t hton32(uint32_t val) {
    return ((val & 0xFF) << 24) | ((val & 0xFF00) << 8) |
           ((val >> 8) & 0xFF00) | ((val >> 24) & 0xFF);
}

inline uint64_t hton64(uint64_t val) {
    return ((uint64_t)hton32(val & 0xFFFFFFFF) << 32) | hton32(val >> 32);
}

inline uint16_t ntoh16(uint16_t val) { return hton16(val); }
inline uint32_t ntoh32(uint32_t val) { return hton32(val); }
inline uint64_t ntoh64(uint64_t val) { return hton64(val); }

} // namespace fleetwatch

#endif // MESSAGE_H
