#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "rk/store/resp_connection.hpp"
#include "support/mini_redis.hpp"
#include "support/resp_test_server.hpp"

using namespace rk::store;
using rk::foundation::ErrorCode;
using rk::test::MiniRedis;
using rk::test::RespTestServer;
using namespace std::chrono_literals;

namespace {

/// Port that had a listener a moment ago and now refuses connections.
uint16_t closedPort() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

} // namespace

class RespConnectionTest : public ::testing::Test {
protected:
    void startServer(std::string password = {}) {
        redis_ = std::make_unique<MiniRedis>(std::move(password));
        server_ = std::make_unique<RespTestServer>(
            [this](const std::vector<std::string>& args) -> std::optional<RespValue> {
                return redis_->handle(args);
            });
        ASSERT_NE(server_->port(), 0);
    }

    RespEndpoint endpoint() const {
        RespEndpoint ep;
        ep.host = "127.0.0.1";
        ep.port = server_->port();
        return ep;
    }

    std::unique_ptr<MiniRedis> redis_;
    std::unique_ptr<RespTestServer> server_;
};

TEST_F(RespConnectionTest, PingReturnsPong) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue()) << conn.error().message();
    EXPECT_TRUE(conn.value()->isHealthy());

    auto reply = conn.value()->execute({"PING"}, deadlineAfter(1s));
    ASSERT_TRUE(reply.hasValue());
    EXPECT_EQ(reply.value().type, RespValue::Type::SimpleString);
    EXPECT_EQ(reply.value().text, "PONG");
}

TEST_F(RespConnectionTest, CommandsShareOneConnection) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());

    auto set = conn.value()->execute({"SET", "k", "v", "PX", "10000"}, deadlineAfter(1s));
    ASSERT_TRUE(set.hasValue());
    auto get = conn.value()->execute({"GET", "k"}, deadlineAfter(1s));
    ASSERT_TRUE(get.hasValue());
    EXPECT_EQ(get.value().type, RespValue::Type::BulkString);
    EXPECT_EQ(get.value().text, "v");
    EXPECT_EQ(server_->acceptedConnections(), 1u);
}

TEST_F(RespConnectionTest, ServerErrorReplyKeepsConnectionHealthy) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());

    auto reply = conn.value()->execute({"BOGUS"}, deadlineAfter(1s));
    ASSERT_TRUE(reply.hasValue());
    EXPECT_TRUE(reply.value().isError());
    EXPECT_TRUE(conn.value()->isHealthy());
}

TEST_F(RespConnectionTest, AuthenticatesWithPassword) {
    startServer("secret");
    auto ep = endpoint();
    ep.password = "secret";
    ep.database = 2;

    auto conn = RespConnection::connect(ep, deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue()) << conn.error().message();
    // AUTH then SELECT.
    EXPECT_EQ(redis_->commandCount(), 2u);
}

TEST_F(RespConnectionTest, WrongPasswordIsRejected) {
    startServer("secret");
    auto ep = endpoint();
    ep.password = "guess";

    auto conn = RespConnection::connect(ep, deadlineAfter(1s));
    ASSERT_TRUE(conn.hasError());
    EXPECT_EQ(conn.error().code(), ErrorCode::StoreUnavailable);
}

TEST_F(RespConnectionTest, SilentServerTimesOutAndPoisonsConnection) {
    server_ = std::make_unique<RespTestServer>(
        [](const std::vector<std::string>&) -> std::optional<RespValue> { return std::nullopt; });
    ASSERT_NE(server_->port(), 0);

    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());

    auto reply = conn.value()->execute({"PING"}, deadlineAfter(50ms));
    ASSERT_TRUE(reply.hasError());
    EXPECT_EQ(reply.error().code(), ErrorCode::StoreTimeout);
    EXPECT_FALSE(conn.value()->isHealthy());

    auto again = conn.value()->execute({"PING"}, deadlineAfter(50ms));
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::StoreUnavailable);
}

TEST_F(RespConnectionTest, RefusedConnectionIsUnavailable) {
    RespEndpoint ep;
    ep.host = "127.0.0.1";
    ep.port = closedPort();

    auto conn = RespConnection::connect(ep, deadlineAfter(1s));
    ASSERT_TRUE(conn.hasError());
    EXPECT_EQ(conn.error().code(), ErrorCode::StoreUnavailable);
}

TEST_F(RespConnectionTest, FactoryProducesWorkingConnections) {
    startServer();
    auto factory = respConnectionFactory(endpoint());

    auto conn = factory(deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());
    auto reply = conn.value()->execute({"PING"}, deadlineAfter(1s));
    ASSERT_TRUE(reply.hasValue());
    EXPECT_EQ(reply.value().text, "PONG");
}

TEST_F(RespConnectionTest, ArgumentsAreBinarySafe) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());

    const std::string value("v1;tb;\0x\r\n$3", 12);
    ASSERT_TRUE(conn.value()->execute({"SET", "k", value, "PX", "10000"}, deadlineAfter(1s))
                    .hasValue());

    auto get = conn.value()->execute({"GET", "k"}, deadlineAfter(1s));
    ASSERT_TRUE(get.hasValue());
    EXPECT_EQ(get.value().text, value);
}

TEST_F(RespConnectionTest, MissingKeyIsNil) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());

    auto get = conn.value()->execute({"GET", "absent"}, deadlineAfter(1s));
    ASSERT_TRUE(get.hasValue());
    EXPECT_TRUE(get.value().isNil());
}

TEST_F(RespConnectionTest, PassedDeadlineFailsWithoutSending) {
    startServer();
    auto conn = RespConnection::connect(endpoint(), deadlineAfter(1s));
    ASSERT_TRUE(conn.hasValue());
    auto before = redis_->commandCount();

    auto reply = conn.value()->execute({"PING"}, std::chrono::steady_clock::now() - 1ms);
    ASSERT_TRUE(reply.hasError());
    EXPECT_EQ(reply.error().code(), ErrorCode::StoreTimeout);
    EXPECT_EQ(redis_->commandCount(), before);
}
