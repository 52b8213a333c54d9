#ifndef CODEC_HPP
#define CODEC_HPP

#include <string>
#include <utility>

#include "Protocol.hpp"
#include "Errors.hpp"

// Pads with NUL or truncates to exactly USER_SIZE bytes. Truncation never
// splits a UTF-8 sequence.
std::string NormalizeUser(const std::string& user);

// User field without its NUL padding, for printing.
std::string DisplayUser(const std::string& user);

bool IsValidUtf8(const std::string& text);

Bytes EncodeHeader(const Header& header);

// Consumes exactly HEADER_SIZE bytes and returns the header with whatever
// follows it. Throws DecodeError on a short buffer or a user field that is
// not UTF-8, InvalidEnumValue on an unknown flag byte.
std::pair<Header, Bytes> DecodeHeader(const Bytes& data);

Bytes EncodePayload(const std::string& text);
std::string DecodePayload(const Bytes& data);

// The declared length is not enforced on decode; callers may check it.
bool PayloadLengthMatches(const Header& header, const size_t& payload_size);

MessageKind DecodeKind(const uint8_t& value);
Operation DecodeOperation(const uint8_t& value);
Sequence DecodeSequence(const uint8_t& value);

#endif // CODEC_HPP
