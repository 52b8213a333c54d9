#include "Codec.hpp"

#include <sstream>

namespace {

size_t SequenceLength(const uint8_t& lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

// Longest prefix of text, at most limit bytes, that ends on a code point boundary.
size_t Utf8Prefix(const std::string& text, const size_t& limit) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = SequenceLength(static_cast<uint8_t>(text[pos]));
        if (len == 0) {
            len = 1;
        }
        if (pos + len > limit) {
            break;
        }
        pos += len;
    }
    return pos;
}

} // namespace

std::string NormalizeUser(const std::string& user) {
    std::string normalized = user.substr(0, Utf8Prefix(user, USER_SIZE));
    normalized.resize(USER_SIZE, '\0');
    return normalized;
}

std::string DisplayUser(const std::string& user) {
    size_t end = user.find('\0');
    if (end == std::string::npos) {
        return user;
    }
    return user.substr(0, end);
}

bool IsValidUtf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[pos]);
        size_t len = SequenceLength(lead);
        if (len == 0 || pos + len > text.size()) {
            return false;
        }

        uint32_t code_point = (len == 1) ? lead : (lead & (0xFF >> (len + 1)));
        for (size_t i = 1; i < len; ++i) {
            uint8_t next = static_cast<uint8_t>(text[pos + i]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && code_point < 0x80) ||
            (len == 3 && code_point < 0x800) ||
            (len == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        pos += len;
    }
    return true;
}

MessageKind DecodeKind(const uint8_t& value) {
    switch (value) {
        case static_cast<uint8_t>(MessageKind::CONTROL):
            return MessageKind::CONTROL;
        case static_cast<uint8_t>(MessageKind::CHAT):
            return MessageKind::CHAT;
        default:
            throw InvalidEnumValue("kind", value);
    }
}

Operation DecodeOperation(const uint8_t& value) {
    switch (value) {
        case static_cast<uint8_t>(Operation::ERR):
            return Operation::ERR;
        case static_cast<uint8_t>(Operation::SYN):
            return Operation::SYN;
        case static_cast<uint8_t>(Operation::ACK):
            return Operation::ACK;
        case static_cast<uint8_t>(Operation::SYN_ACK):
            return Operation::SYN_ACK;
        case static_cast<uint8_t>(Operation::FIN):
            return Operation::FIN;
        default:
            throw InvalidEnumValue("operation", value);
    }
}

Sequence DecodeSequence(const uint8_t& value) {
    switch (value) {
        case static_cast<uint8_t>(Sequence::RE):
            return Sequence::RE;
        case static_cast<uint8_t>(Sequence::NORE):
            return Sequence::NORE;
        default:
            throw InvalidEnumValue("sequence", value);
    }
}

Bytes EncodeHeader(const Header& header) {
    Bytes buffer;
    buffer.reserve(HEADER_SIZE);
    buffer.push_back(static_cast<uint8_t>(header.kind));
    buffer.push_back(static_cast<uint8_t>(header.operation));
    buffer.push_back(static_cast<uint8_t>(header.sequence));

    std::string user = NormalizeUser(header.user);
    buffer.insert(buffer.end(), user.begin(), user.end());

    buffer.push_back(static_cast<uint8_t>((header.length >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((header.length >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((header.length >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(header.length & 0xFF));
    return buffer;
}

std::pair<Header, Bytes> DecodeHeader(const Bytes& data) {
    if (data.size() < HEADER_SIZE) {
        std::ostringstream oss;
        oss << "truncated header: " << data.size() << " of " << HEADER_SIZE << " bytes";
        throw DecodeError(oss.str());
    }

    Header header;
    size_t offset = 0;
    header.kind = DecodeKind(data[offset++]);
    header.operation = DecodeOperation(data[offset++]);
    header.sequence = DecodeSequence(data[offset++]);

    header.user.assign(data.begin() + offset, data.begin() + offset + USER_SIZE);
    offset += USER_SIZE;
    if (!IsValidUtf8(header.user)) {
        throw DecodeError("user field is not valid UTF-8");
    }

    header.length = (static_cast<uint32_t>(data[offset]) << 24) |
                    (static_cast<uint32_t>(data[offset + 1]) << 16) |
                    (static_cast<uint32_t>(data[offset + 2]) << 8) |
                    static_cast<uint32_t>(data[offset + 3]);
    offset += 4;

    return std::make_pair(header, Bytes(data.begin() + offset, data.end()));
}

Bytes EncodePayload(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string DecodePayload(const Bytes& data) {
    std::string text(data.begin(), data.end());
    if (!IsValidUtf8(text)) {
        throw DecodeError("payload is not valid UTF-8");
    }
    return text;
}

bool PayloadLengthMatches(const Header& header, const size_t& payload_size) {
    return header.length == payload_size;
}
