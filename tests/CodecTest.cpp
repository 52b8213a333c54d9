#include <gtest/gtest.h>

#include "Codec.hpp"
#include "Message.hpp"

namespace {

Header MakeHeader(const std::string& user, const uint32_t& length) {
    Header header;
    header.kind = MessageKind::CONTROL;
    header.operation = Operation::SYN;
    header.sequence = Sequence::NORE;
    header.user = NormalizeUser(user);
    header.length = length;
    return header;
}

} // namespace

TEST(CodecTest, HeaderLayoutIsPositional) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));

    ASSERT_EQ(encoded.size(), HEADER_SIZE);
    EXPECT_EQ(encoded.size(), 39u);
    EXPECT_EQ(encoded[0], 0x1);
    EXPECT_EQ(encoded[1], 0x2);
    EXPECT_EQ(encoded[2], 0x2);
    EXPECT_EQ(std::string(encoded.begin() + 3, encoded.begin() + 8), "alice");
    for (size_t i = 8; i < 3 + USER_SIZE; ++i) {
        EXPECT_EQ(encoded[i], 0) << "padding byte " << i;
    }
    EXPECT_EQ(encoded[35], 0);
    EXPECT_EQ(encoded[38], 0);
}

TEST(CodecTest, LengthIsBigEndian) {
    Bytes encoded = EncodeHeader(MakeHeader("bob", 0x01020304));

    EXPECT_EQ(encoded[35], 0x01);
    EXPECT_EQ(encoded[36], 0x02);
    EXPECT_EQ(encoded[37], 0x03);
    EXPECT_EQ(encoded[38], 0x04);
}

TEST(CodecTest, SynAckIsEncodedAsCombinedFlags) {
    Header header = MakeHeader("bob", 0);
    header.operation = Operation::SYN_ACK;

    EXPECT_EQ(EncodeHeader(header)[1], 0x6);
}

TEST(CodecTest, HeaderRoundTripKeepsPadding) {
    Header header = MakeHeader("carol", 12);
    header.kind = MessageKind::CHAT;
    header.sequence = Sequence::RE;

    Bytes encoded = EncodeHeader(header);
    encoded.push_back('x');
    std::pair<Header, Bytes> decoded = DecodeHeader(encoded);

    EXPECT_EQ(decoded.first, header);
    EXPECT_EQ(decoded.first.user.size(), USER_SIZE);
    EXPECT_EQ(decoded.second, Bytes{'x'});
}

TEST(CodecTest, NormalizeUserPadsAndTruncates) {
    EXPECT_EQ(NormalizeUser("").size(), USER_SIZE);
    EXPECT_EQ(NormalizeUser("dave"), std::string("dave") + std::string(USER_SIZE - 4, '\0'));

    std::string long_name(40, 'z');
    EXPECT_EQ(NormalizeUser(long_name), std::string(USER_SIZE, 'z'));
}

TEST(CodecTest, NormalizeUserIsIdempotent) {
    const std::string names[] = {"", "eve", std::string(32, 'q'), std::string(50, 'w'), "j\xC3\xBCrgen"};
    for (const std::string& name : names) {
        std::string once = NormalizeUser(name);
        EXPECT_EQ(NormalizeUser(once), once);
        EXPECT_EQ(once.size(), USER_SIZE);
    }
}

TEST(CodecTest, NormalizeUserDoesNotSplitMultibyteCharacters) {
    // 31 ASCII bytes followed by a two byte character
    std::string name = std::string(31, 'a') + "\xC3\xA9";
    std::string normalized = NormalizeUser(name);

    EXPECT_EQ(normalized, std::string(31, 'a') + std::string(1, '\0'));
    EXPECT_TRUE(IsValidUtf8(normalized));
}

TEST(CodecTest, DisplayUserStripsPadding) {
    EXPECT_EQ(DisplayUser(NormalizeUser("frank")), "frank");
    EXPECT_EQ(DisplayUser("plain"), "plain");
}

TEST(CodecTest, UnknownKindIsRejected) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));
    encoded[0] = 0x7;

    try {
        DecodeHeader(encoded);
        FAIL() << "expected InvalidEnumValue";
    } catch (const InvalidEnumValue& e) {
        EXPECT_EQ(e.Field(), "kind");
        EXPECT_EQ(e.Value(), 0x7);
    }
}

TEST(CodecTest, UnknownOperationCombinationIsRejected) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));
    encoded[1] = 0x3;  // ERR|SYN

    EXPECT_THROW(DecodeHeader(encoded), InvalidEnumValue);

    encoded[1] = 0xC;  // ACK|FIN
    EXPECT_THROW(DecodeHeader(encoded), InvalidEnumValue);
}

TEST(CodecTest, UnknownSequenceIsRejected) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));
    encoded[2] = 0x0;

    EXPECT_THROW(DecodeHeader(encoded), InvalidEnumValue);
}

TEST(CodecTest, ShortBufferIsRejected) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));
    encoded.pop_back();

    EXPECT_THROW(DecodeHeader(encoded), DecodeError);
    EXPECT_THROW(DecodeHeader(Bytes()), DecodeError);
}

TEST(CodecTest, MalformedUserFieldIsRejected) {
    Bytes encoded = EncodeHeader(MakeHeader("alice", 0));
    encoded[3] = 0xFF;

    EXPECT_THROW(DecodeHeader(encoded), DecodeError);
}

TEST(CodecTest, MalformedPayloadIsRejected) {
    EXPECT_THROW(DecodePayload(Bytes{'o', 'k', 0xC3}), DecodeError);
    EXPECT_EQ(DecodePayload(Bytes{'o', 'k'}), "ok");
}

TEST(CodecTest, Utf8Validation) {
    EXPECT_TRUE(IsValidUtf8(""));
    EXPECT_TRUE(IsValidUtf8("h\xC3\xA9llo"));
    EXPECT_TRUE(IsValidUtf8("\xE2\x82\xAC"));
    EXPECT_TRUE(IsValidUtf8("\xF0\x9F\x98\x80"));
    EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(IsValidUtf8("\xE2\x82"));          // truncated
    EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));  // past U+10FFFF
}

TEST(CodecTest, DeclaredLengthIsNotEnforced) {
    Bytes encoded = Message::Chat("gina", "hello").ToBytes();
    encoded[38] = 2;

    std::pair<Message, Bytes> decoded = Message::FromBytes(encoded);

    EXPECT_EQ(decoded.first.GetData(), "hello");
    EXPECT_EQ(decoded.first.GetHeader().length, 2u);
    EXPECT_FALSE(PayloadLengthMatches(decoded.first.GetHeader(), decoded.first.GetData().size()));
}

TEST(CodecTest, TruncatedPayloadKeepsWhatArrived) {
    Bytes encoded = Message::Chat("gina", "hello").ToBytes();
    encoded.resize(HEADER_SIZE + 3);

    Message decoded = Message::FromBytes(encoded).first;

    EXPECT_EQ(decoded.GetData(), "hel");
    EXPECT_FALSE(PayloadLengthMatches(decoded.GetHeader(), decoded.GetData().size()));
}
