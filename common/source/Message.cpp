#include "Message.hpp"
#include "Codec.hpp"
#include "Errors.hpp"

#include <sstream>

Message::Message(const Header& header, const std::string& data)
    : header_(header)
    , data_(data) {}

Message Message::Chat(const std::string& user, const std::string& content, bool resend) {
    Header header;
    header.kind = MessageKind::CHAT;
    header.operation = Operation::ERR;
    header.sequence = resend ? Sequence::RE : Sequence::NORE;
    header.user = NormalizeUser(user);
    header.length = static_cast<uint32_t>(content.size());
    return Message(header, content);
}

Message Message::Control(const std::string& user, const Operation& operation,
                         bool resend, const std::string& text) {
    if (operation != Operation::ERR && !text.empty()) {
        throw ConstructionError(std::string("text can only be set for ERR operations, got ") +
                                ::ToString(operation));
    }

    Header header;
    header.kind = MessageKind::CONTROL;
    header.operation = operation;
    header.sequence = resend ? Sequence::RE : Sequence::NORE;
    header.user = NormalizeUser(user);
    header.length = static_cast<uint32_t>(text.size());
    return Message(header, text);
}

std::string Message::GetUser() const {
    return DisplayUser(header_.user);
}

Message Message::WithSequence(const Sequence& sequence) const {
    Message copy(*this);
    copy.header_.sequence = sequence;
    return copy;
}

Bytes Message::ToBytes() const {
    Bytes buffer = EncodeHeader(header_);
    Bytes payload = EncodePayload(data_);
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

std::pair<Message, Bytes> Message::FromBytes(const Bytes& data) {
    std::pair<Header, Bytes> decoded = DecodeHeader(data);
    Message message(decoded.first, DecodePayload(decoded.second));
    return std::make_pair(message, Bytes());
}

std::string Message::ToString() const {
    std::ostringstream oss;
    oss << ::ToString(header_.kind);
    if (IsControl()) {
        oss << " " << ::ToString(header_.operation);
    }
    oss << " [" << ::ToString(header_.sequence) << "]"
        << " user=" << GetUser()
        << " length=" << header_.length;
    if (!data_.empty()) {
        oss << " data=\"" << data_ << "\"";
    }
    return oss.str();
}

bool Message::operator==(const Message& other) const {
    return header_ == other.header_ && data_ == other.data_;
}
