#include <gtest/gtest.h>

#include <kvcall/client/command_packet.h>
#include <kvcall/client/reply.h>
#include <kvcall/core/exceptions.h>

using namespace kvcall;
using namespace kvcall::client;

TEST(CommandPacketTest, RendersNameSubCommandAndArguments) {
    CommandPacket cmd("CLIENT", "SETNAME");
    cmd.arg("worker-1");
    EXPECT_EQ(cmd.toString(), "CLIENT SETNAME worker-1");

    CommandPacket set("SET");
    set.key("user:1").arg(codec::WireValue{std::int64_t{42}}).arg(nullptr).arg('c');
    EXPECT_EQ(set.toString(), "SET user:1 42 (nil) c");
}

TEST(CommandPacketTest, TracksKeyPositions) {
    CommandPacket cmd("MSET");
    cmd.key("a").arg("1").keys({"b", "c"});
    ASSERT_EQ(cmd.args().size(), 4u);
    EXPECT_TRUE(cmd.isKey(0));
    EXPECT_FALSE(cmd.isKey(1));
    EXPECT_TRUE(cmd.isKey(2));
    EXPECT_TRUE(cmd.isKey(3));
    EXPECT_FALSE(cmd.isKey(4));
}

TEST(CommandPacketTest, PrefixIsAppliedToKeysOnlyAndOnce) {
    CommandPacket cmd("SET");
    cmd.key("k").arg("v");
    EXPECT_FALSE(cmd.prefixApplied());

    cmd.applyPrefix("app:");
    cmd.applyPrefix("app:");
    EXPECT_TRUE(cmd.prefixApplied());
    EXPECT_EQ(cmd.toString(), "SET app:k v");
}

TEST(CommandPacketTest, EmptyPrefixLeavesKeysUntouched) {
    CommandPacket cmd("GET");
    cmd.key("k");
    cmd.applyPrefix("");
    EXPECT_EQ(cmd.toString(), "GET k");
    EXPECT_TRUE(cmd.prefixApplied());
}

TEST(CommandPacketTest, WriteHostStartsUnset) {
    CommandPacket cmd("PING");
    EXPECT_FALSE(cmd.writeHost().has_value());
    cmd.setWriteHost("10.0.0.5:6379");
    EXPECT_EQ(cmd.writeHost(), std::optional<std::string>("10.0.0.5:6379"));
}

TEST(CommandPacketTest, FrameUsesRequestedEncoding) {
    CommandPacket cmd("ECHO");
    cmd.arg("caf\xC3\xA9");
    auto frame = cmd.toFrame(codec::TextEncoding::Latin1);
    ASSERT_EQ(frame.size(), 2u);
    EXPECT_EQ(frame[0], codec::toBytes("ECHO"));
    ASSERT_EQ(frame[1].size(), 4u);
    EXPECT_EQ(frame[1][3], std::byte{0xE9});

    ByteVector raw{std::byte{0xFF}};
    CommandPacket bin("SET");
    bin.key("blob").arg(raw);
    auto binFrame = bin.toFrame(codec::TextEncoding::Ascii);
    ASSERT_EQ(binFrame.size(), 3u);
    EXPECT_EQ(binFrame[2], raw);
}

TEST(ReplyTest, PayloadCoversScalarKinds) {
    EXPECT_FALSE(Reply::nil().payload().has_value());
    EXPECT_EQ(Reply::status("OK").payload(), codec::toBytes("OK"));
    EXPECT_EQ(Reply::integer(-3).payload(), codec::toBytes("-3"));
    EXPECT_EQ(Reply::bulk(codec::toBytes("v")).payload(), codec::toBytes("v"));
    EXPECT_FALSE(Reply::array({Reply::integer(1)}).payload().has_value());
}

TEST(ReplyTest, ThrowOrValueRaisesServerErrorForErrorReplies) {
    auto ok = Reply::status("OK");
    EXPECT_EQ(ok.throwOrValue().text(), "OK");

    try {
        (void)Reply::error("ERR wrong type").throwOrValue();
        FAIL() << "expected ServerError";
    } catch (const ServerError& e) {
        EXPECT_STREQ(e.what(), "ERR wrong type");
        EXPECT_EQ(e.code(), ErrorCode::ServerError);
    }
}

TEST(ReplyTest, RendersLikeACommandLineClient) {
    auto reply = Reply::array({Reply::bulk(codec::toBytes("a")), Reply::nil(), Reply::integer(2)});
    EXPECT_EQ(reply.toString(), "[a, (nil), 2]");
    EXPECT_EQ(Reply::error("ERR x").toString(), "(error) ERR x");
}
