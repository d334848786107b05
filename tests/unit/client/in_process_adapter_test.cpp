#include <gtest/gtest.h>

#include <string>

#include <kvcall/client/in_process_adapter.h>
#include <kvcall/core/exceptions.h>

using namespace kvcall;
using namespace kvcall::client;

namespace {

Reply run(InProcessAdapter& adapter, CommandPacket cmd) {
    return adapter.execute(cmd);
}

CommandPacket command(std::string name, std::initializer_list<std::string> args = {}) {
    CommandPacket cmd(std::move(name));
    for (const auto& a : args)
        cmd.arg(codec::WireValue{a});
    return cmd;
}

} // namespace

TEST(InProcessAdapterTest, SetsWriteHostOnExecute) {
    InProcessAdapter::Options options;
    options.host = "loopback:1";
    InProcessAdapter adapter(options);

    CommandPacket cmd("PING");
    EXPECT_EQ(adapter.execute(cmd).text(), "PONG");
    EXPECT_EQ(cmd.writeHost(), std::optional<std::string>("loopback:1"));
}

TEST(InProcessAdapterTest, StoresAndReadsValues) {
    InProcessAdapter adapter;
    EXPECT_EQ(run(adapter, command("SET", {"k", "v"})).text(), "OK");
    EXPECT_EQ(run(adapter, command("get", {"k"})).toString(), "v");
    EXPECT_TRUE(run(adapter, command("GET", {"missing"})).isNil());
    EXPECT_EQ(run(adapter, command("MGET", {"k", "missing"})).toString(), "[v, (nil)]");
    EXPECT_EQ(run(adapter, command("EXISTS", {"k", "k", "missing"})).integer(), 2);
    EXPECT_EQ(run(adapter, command("DEL", {"k", "missing"})).integer(), 1);
    EXPECT_EQ(run(adapter, command("EXISTS", {"k"})).integer(), 0);
}

TEST(InProcessAdapterTest, IncrementsIntegers) {
    InProcessAdapter adapter;
    EXPECT_EQ(run(adapter, command("INCRBY", {"n", "5"})).integer(), 5);
    EXPECT_EQ(run(adapter, command("INCRBY", {"n", "-7"})).integer(), -2);
    EXPECT_EQ(run(adapter, command("GET", {"n"})).toString(), "-2");

    run(adapter, command("SET", {"s", "abc"}));
    EXPECT_TRUE(run(adapter, command("INCRBY", {"s", "1"})).isError());
    EXPECT_TRUE(run(adapter, command("INCRBY", {"n", "x"})).isError());

    run(adapter, command("SET", {"big", "9223372036854775807"}));
    auto overflow = run(adapter, command("INCRBY", {"big", "1"}));
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.text(), "ERR increment or decrement would overflow");
}

TEST(InProcessAdapterTest, SelectIsolatesDatabases) {
    InProcessAdapter adapter;
    run(adapter, command("SET", {"k", "db0"}));
    EXPECT_EQ(run(adapter, command("SELECT", {"3"})).text(), "OK");
    EXPECT_TRUE(run(adapter, command("GET", {"k"})).isNil());
    run(adapter, command("SELECT", {"0"}));
    EXPECT_EQ(run(adapter, command("GET", {"k"})).toString(), "db0");

    EXPECT_TRUE(run(adapter, command("SELECT", {"16"})).isError());
    EXPECT_TRUE(run(adapter, command("SELECT", {"-1"})).isError());
}

TEST(InProcessAdapterTest, StartsInConfiguredDatabase) {
    InProcessAdapter::Options options;
    options.database = 5;
    InProcessAdapter adapter(options);
    run(adapter, command("SET", {"k", "db5"}));
    run(adapter, command("SELECT", {"0"}));
    EXPECT_TRUE(run(adapter, command("GET", {"k"})).isNil());
    run(adapter, command("SELECT", {"5"}));
    EXPECT_EQ(run(adapter, command("GET", {"k"})).toString(), "db5");
}

TEST(InProcessAdapterTest, RejectsOutOfRangeInitialDatabase) {
    InProcessAdapter::Options options;
    options.database = 16;
    try {
        InProcessAdapter adapter(options);
        FAIL() << "expected KvError";
    } catch (const KvError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    options.database = -1;
    EXPECT_THROW(InProcessAdapter{options}, KvError);
}

TEST(InProcessAdapterTest, ReportsArityAndUnknownCommands) {
    InProcessAdapter adapter;
    auto arity = run(adapter, command("GET"));
    ASSERT_TRUE(arity.isError());
    EXPECT_EQ(arity.text(), "ERR wrong number of arguments for 'get' command");

    auto unknown = run(adapter, command("FLUSHALL"));
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.text(), "ERR unknown command 'FLUSHALL'");

    EXPECT_TRUE(run(adapter, command("SET", {"a", "b", "c"})).isError());
}

TEST(InProcessAdapterTest, EchoAndPingWithMessage) {
    InProcessAdapter adapter;
    EXPECT_EQ(run(adapter, command("ECHO", {"hi there"})).toString(), "hi there");
    EXPECT_EQ(run(adapter, command("PING", {"hey"})).toString(), "hey");
}

TEST(InProcessAdapterTest, ExecuteAfterDisposeThrows) {
    InProcessAdapter adapter;
    run(adapter, command("SET", {"k", "v"}));
    adapter.dispose();
    EXPECT_TRUE(adapter.disposed());
    EXPECT_EQ(adapter.disposeCount(), 1);

    try {
        run(adapter, command("GET", {"k"}));
        FAIL() << "expected KvError";
    } catch (const KvError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Disposed);
    }
}

TEST(InProcessAdapterTest, ReportsConfiguredUseType) {
    InProcessAdapter::Options options;
    options.useType = UseType::Cluster;
    InProcessAdapter adapter(options);
    EXPECT_EQ(adapter.useType(), UseType::Cluster);
    EXPECT_EQ(InProcessAdapter().useType(), UseType::SingleInside);
}
