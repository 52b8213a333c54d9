#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <string>
#include <utility>

#include "Protocol.hpp"

class Message {
public:
    Message() {}
    Message(const Header& header, const std::string& data);

    // Operation is set to ERR as a placeholder and carries no meaning.
    static Message Chat(const std::string& user, const std::string& content, bool resend = false);
    // Throws ConstructionError when text is given for anything but ERR.
    static Message Control(const std::string& user, const Operation& operation,
                           bool resend = false, const std::string& text = "");

    bool IsControl() const { return header_.kind == MessageKind::CONTROL; }
    bool IsChat() const { return header_.kind == MessageKind::CHAT; }
    bool IsResend() const { return header_.sequence == Sequence::RE; }
    MessageKind GetKind() const { return header_.kind; }
    Operation GetOperation() const { return header_.operation; }
    const Header& GetHeader() const { return header_; }
    const std::string& GetData() const { return data_; }
    std::string GetUser() const;

    Message WithSequence(const Sequence& sequence) const;

    Bytes ToBytes() const;
    // Payload is every byte after the header, see PayloadLengthMatches().
    static std::pair<Message, Bytes> FromBytes(const Bytes& data);

    std::string ToString() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
private:
    Header header_;
    std::string data_;
};

#endif // MESSAGE_HPP
