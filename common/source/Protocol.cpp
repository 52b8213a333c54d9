#include "Protocol.hpp"

bool operator==(const Header& lhs, const Header& rhs) {
    return lhs.kind == rhs.kind
        && lhs.operation == rhs.operation
        && lhs.sequence == rhs.sequence
        && lhs.user == rhs.user
        && lhs.length == rhs.length;
}

bool operator!=(const Header& lhs, const Header& rhs) {
    return !(lhs == rhs);
}

const char* ToString(const MessageKind& kind) {
    switch (kind) {
        case MessageKind::CONTROL: return "CONTROL";
        case MessageKind::CHAT:    return "CHAT";
    }
    return "UNKNOWN";
}

const char* ToString(const Operation& operation) {
    switch (operation) {
        case Operation::ERR:     return "ERR";
        case Operation::SYN:     return "SYN";
        case Operation::ACK:     return "ACK";
        case Operation::SYN_ACK: return "SYN|ACK";
        case Operation::FIN:     return "FIN";
    }
    return "UNKNOWN";
}

const char* ToString(const Sequence& sequence) {
    switch (sequence) {
        case Sequence::RE:   return "RE";
        case Sequence::NORE: return "NORE";
    }
    return "UNKNOWN";
}
