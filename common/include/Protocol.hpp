#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

constexpr uint16_t DEFAULT_PORT = 8745;
constexpr const char* DEFAULT_HOST = "localhost";

constexpr size_t USER_SIZE = 32;
// kind + operation + sequence + user + length
constexpr size_t HEADER_SIZE = 1 + 1 + 1 + USER_SIZE + 4;
constexpr size_t BUFFER_SIZE = 1024;
constexpr size_t MAX_BUFFER_SIZE = 65535;
constexpr uint32_t RESEND_TIMEOUT_SECONDS = 5;
constexpr uint32_t MAX_RESEND_TIMEOUT_SECONDS = 3600;

enum class MessageKind : uint8_t {
    CONTROL = 0x1,
    CHAT = 0x2
};

// SYN_ACK is the only combined value allowed on the wire.
enum class Operation : uint8_t {
    ERR = 0x1,
    SYN = 0x2,
    ACK = 0x4,
    SYN_ACK = 0x6,
    FIN = 0x8
};

enum class Sequence : uint8_t {
    RE = 0x1,
    NORE = 0x2
};

// user always holds exactly USER_SIZE bytes, NUL padded.
struct Header {
    MessageKind kind = MessageKind::CONTROL;
    Operation operation = Operation::ERR;
    Sequence sequence = Sequence::NORE;
    std::string user = std::string(USER_SIZE, '\0');
    uint32_t length = 0;
};

bool operator==(const Header& lhs, const Header& rhs);
bool operator!=(const Header& lhs, const Header& rhs);

const char* ToString(const MessageKind& kind);
const char* ToString(const Operation& operation);
const char* ToString(const Sequence& sequence);

#endif // PROTOCOL_HPP
