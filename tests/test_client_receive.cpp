// ---------------------------------------------------------------------------
// test_client_receive.cpp
//
// Connection 수신 정책 테스트.
//
// 스크립트로 동작하는 가짜 서버(블로킹 wire_io + std::thread)를 띄우고
// 실제 Connection 이 핸드셰이크, 오류 우선순위, 태그 불일치 처리,
// 타임아웃, 종료 이후 동작을 올바르게 처리하는지 확인한다.
// ---------------------------------------------------------------------------

#include "client/connection.hpp"
#include "client/connection_detail.hpp"
#include "engine/result_builder.hpp"
#include "protocol/wire_io.hpp"

#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace {

using boost::asio::ip::tcp;

// ---------------------------------------------------------------------------
// FakeServer
//   127.0.0.1 의 임의 포트에서 연결 하나를 받아 script 를 실행한다.
//   script 가 끝나면 소켓을 닫는다.
// ---------------------------------------------------------------------------
class FakeServer {
public:
    using Script = std::function<void(tcp::socket&)>;

    explicit FakeServer(Script script)
        : acceptor_{io_ctx_, tcp::endpoint{boost::asio::ip::make_address_v4("127.0.0.1"), 0}}
        , port_{acceptor_.local_endpoint().port()}
    {
        thread_ = std::thread{[this, script = std::move(script)] {
            tcp::socket sock{io_ctx_};
            boost::system::error_code ec;
            acceptor_.accept(sock, ec);
            if (ec) {
                return;
            }
            script(sock);
        }};
    }

    ~FakeServer() { join(); }

    // script 가 끝날 때까지 기다린다.
    void join()
    {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeServer(const FakeServer&)            = delete;
    FakeServer& operator=(const FakeServer&) = delete;

    [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_; }

private:
    boost::asio::io_context io_ctx_;
    tcp::acceptor           acceptor_;
    std::uint16_t           port_{0};
    std::thread             thread_;
};

// ---------------------------------------------------------------------------
// 스크립트 헬퍼
// ---------------------------------------------------------------------------

void send_greeting(tcp::socket& sock, std::string text = "welcome")
{
    auto sent = write_packet(sock, PacketType::kGreet,
                             Greeting{kProtocolVersion, std::move(text)}, kControlLimit);
    ASSERT_TRUE(sent.has_value());
}

// Login 을 읽어 돌려준다. 실패하면 빈 Login.
auto receive_login(tcp::socket& sock) -> Login
{
    auto tag = read_tag(sock);
    EXPECT_TRUE(tag.has_value());
    if (!tag || *tag != PacketType::kLogin) {
        ADD_FAILURE() << "expected Login tag";
        return {};
    }
    auto login = read_payload<Login>(sock, kControlLimit);
    EXPECT_TRUE(login.has_value());
    return login.value_or(Login{});
}

// Command 를 읽어 돌려준다. 연결이 끊겼으면 빈 Command 와 false.
auto receive_command(tcp::socket& sock, Command& out) -> bool
{
    auto tag = read_tag(sock);
    if (!tag || *tag != PacketType::kCommand) {
        return false;
    }
    auto cmd = read_payload<Command>(sock, kControlLimit);
    if (!cmd) {
        return false;
    }
    out = std::move(*cmd);
    return true;
}

// 인사 → 로그인 → 승인까지 진행한다.
void accept_login(tcp::socket& sock)
{
    send_greeting(sock);
    (void)receive_login(sock);
    ASSERT_TRUE(write_tag(sock, PacketType::kAccGranted).has_value());
}

// Command 하나를 읽고 Ok 로 답한다.
void answer_ok(tcp::socket& sock)
{
    Command cmd;
    ASSERT_TRUE(receive_command(sock, cmd));
    ASSERT_TRUE(write_tag(sock, PacketType::kOk).has_value());
}

auto one_int_result(std::int64_t value) -> ResultSet
{
    ResultSetBuilder builder{{Column{"n", ColumnType::kInt, 0}}};
    EXPECT_TRUE(builder.add_row({Value{value}}).has_value());
    return std::move(builder).build();
}

auto connect_to(const FakeServer& server, ClientOptions options = {})
    -> std::expected<Connection, WireError>
{
    return Connection::connect("127.0.0.1", server.port(), "alice", "pw", options);
}

}  // namespace

// ---------------------------------------------------------------------------
// 핸드셰이크
// ---------------------------------------------------------------------------
TEST(ClientHandshake, GreetingLoginGrantedThenQuit)
{
    Command quit_cmd;
    FakeServer server{[&](tcp::socket& sock) {
        send_greeting(sock, "hello uosql");
        (void)receive_login(sock);
        ASSERT_TRUE(write_tag(sock, PacketType::kAccGranted).has_value());
        ASSERT_TRUE(receive_command(sock, quit_cmd));
        ASSERT_TRUE(write_tag(sock, PacketType::kOk).has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    EXPECT_EQ(conn->state(), ClientState::kReady);
    EXPECT_EQ(conn->message(), "hello uosql");
    EXPECT_EQ(conn->version(), kProtocolVersion);
    EXPECT_EQ(conn->ip(), "127.0.0.1");
    EXPECT_EQ(conn->port(), server.port());
    EXPECT_EQ(conn->username(), "alice");

    auto bye = conn->quit();
    EXPECT_TRUE(bye.has_value());
    EXPECT_EQ(conn->state(), ClientState::kClosed);

    server.join();
    EXPECT_EQ(quit_cmd.type, CommandType::kQuit);
}

TEST(ClientHandshake, LoginCarriesCredentials)
{
    Login seen;
    FakeServer server{[&](tcp::socket& sock) {
        send_greeting(sock);
        seen = receive_login(sock);
        ASSERT_TRUE(write_tag(sock, PacketType::kAccGranted).has_value());
    }};

    {
        auto conn = Connection::connect("127.0.0.1", server.port(), "bob", "s3cret");
        ASSERT_TRUE(conn.has_value()) << to_string(conn.error());
    }
    server.join();
    EXPECT_EQ(seen.username, "bob");
    EXPECT_EQ(seen.password, "s3cret");
}

TEST(ClientHandshake, AccessDeniedIsAuthError)
{
    FakeServer server{[](tcp::socket& sock) {
        send_greeting(sock);
        (void)receive_login(sock);
        ASSERT_TRUE(write_tag(sock, PacketType::kAccDenied).has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, WireErrorCode::kAuth);
}

TEST(ClientHandshake, ErrorInsteadOfGreetingIsServerError)
{
    FakeServer server{[](tcp::socket& sock) {
        auto sent = write_packet(sock, PacketType::kError,
                                 ClientErrMsg::make(ServerErrorCode::kTooManyConnections,
                                                    "too many connections"),
                                 kBulkLimit);
        ASSERT_TRUE(sent.has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, WireErrorCode::kServer);
    EXPECT_EQ(conn.error().message, "too many connections");
    EXPECT_EQ(conn.error().server_code,
              static_cast<std::uint16_t>(ServerErrorCode::kTooManyConnections));
    EXPECT_EQ(to_string(conn.error()), "too many connections");
}

TEST(ClientHandshake, ErrorAsLoginAckIsServerError)
{
    FakeServer server{[](tcp::socket& sock) {
        send_greeting(sock);
        (void)receive_login(sock);
        auto sent = write_packet(sock, PacketType::kError,
                                 ClientErrMsg::make(ServerErrorCode::kInternal, "user table offline"),
                                 kBulkLimit);
        ASSERT_TRUE(sent.has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, WireErrorCode::kServer);
    EXPECT_EQ(conn.error().message, "user table offline");
    EXPECT_EQ(conn.error().server_code, static_cast<std::uint16_t>(ServerErrorCode::kInternal));
}

TEST(ClientHandshake, OkInsteadOfLoginAckIsUnexpectedPacket)
{
    FakeServer server{[](tcp::socket& sock) {
        send_greeting(sock);
        (void)receive_login(sock);
        ASSERT_TRUE(write_tag(sock, PacketType::kOk).has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, WireErrorCode::kUnexpectedPacket);
}

TEST(ClientHandshake, InvalidAddressIsAddrParse)
{
    for (const char* address : {"256.1.1.1", "localhost", "1.2.3", ""}) {
        auto conn = Connection::connect(address, 4242, "alice", "pw");
        ASSERT_FALSE(conn.has_value()) << address;
        EXPECT_EQ(conn.error().code, WireErrorCode::kAddrParse) << address;
    }
}

TEST(ClientHandshake, RefusedConnectionIsIoError)
{
    std::uint16_t port = 0;
    {
        boost::asio::io_context io_ctx;
        tcp::acceptor probe{io_ctx, tcp::endpoint{boost::asio::ip::make_address_v4("127.0.0.1"), 0}};
        port = probe.local_endpoint().port();
    }

    auto conn = Connection::connect("127.0.0.1", port, "alice", "pw");
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, WireErrorCode::kIo);
}

// ---------------------------------------------------------------------------
// 커맨드 응답 처리
// ---------------------------------------------------------------------------
TEST(ClientReceive, ExecuteReturnsDataSet)
{
    std::string seen_sql;
    FakeServer server{[&](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        seen_sql = cmd.query;
        ASSERT_TRUE(write_packet(sock, PacketType::kResponse, one_int_result(42), kBulkLimit)
                        .has_value());
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto rows = conn->execute("SELECT 42");
    ASSERT_TRUE(rows.has_value()) << to_string(rows.error());
    ASSERT_EQ(rows->row_count(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(rows->at(0, 0)), 42);

    EXPECT_TRUE(conn->quit().has_value());
    server.join();
    EXPECT_EQ(seen_sql, "SELECT 42");
}

TEST(ClientReceive, ErrorTakesPrecedenceOverExpectedTag)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        ASSERT_TRUE(write_packet(sock, PacketType::kError,
                                 ClientErrMsg::make(ServerErrorCode::kSyntaxError, "syntax error"),
                                 kBulkLimit)
                        .has_value());
        answer_ok(sock);
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto rows = conn->execute("BAD SQL");
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, WireErrorCode::kServer);
    EXPECT_EQ(rows.error().message, "syntax error");
    EXPECT_EQ(rows.error().server_code,
              static_cast<std::uint16_t>(ServerErrorCode::kSyntaxError));

    // 스트림이 정렬되어 있으므로 연결은 유지된다
    EXPECT_EQ(conn->state(), ClientState::kReady);
    EXPECT_TRUE(conn->ping().has_value());
    EXPECT_TRUE(conn->quit().has_value());
}

TEST(ClientReceive, MismatchedTagIsDrainedAndStreamStaysUsable)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        // Ok 를 기대하는 ping 에 Response 를 보낸다
        ASSERT_TRUE(write_packet(sock, PacketType::kResponse, one_int_result(7), kBulkLimit)
                        .has_value());
        answer_ok(sock);
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto pong = conn->ping();
    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kUnexpectedPacket);
    EXPECT_EQ(conn->state(), ClientState::kReady);

    EXPECT_TRUE(conn->ping().has_value());
    EXPECT_TRUE(conn->quit().has_value());
}

// Ok 를 기대하는 ping / quit 도 Error 가 오면 kServer 가 된다
TEST(ClientReceive, ErrorInsteadOfOkIsServerError)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        ASSERT_TRUE(write_packet(sock, PacketType::kError,
                                 ClientErrMsg::make(ServerErrorCode::kInternal, "busy"),
                                 kBulkLimit)
                        .has_value());
        answer_ok(sock);
        ASSERT_TRUE(receive_command(sock, cmd));
        ASSERT_TRUE(write_packet(sock, PacketType::kError,
                                 ClientErrMsg::make(ServerErrorCode::kInternal, "shutting down"),
                                 kBulkLimit)
                        .has_value());
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto pong = conn->ping();
    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kServer);
    EXPECT_EQ(pong.error().message, "busy");
    EXPECT_EQ(conn->state(), ClientState::kReady);

    EXPECT_TRUE(conn->ping().has_value());

    auto bye = conn->quit();
    ASSERT_FALSE(bye.has_value());
    EXPECT_EQ(bye.error().code, WireErrorCode::kServer);
    EXPECT_EQ(bye.error().message, "shutting down");
    EXPECT_EQ(conn->state(), ClientState::kClosed);
}

TEST(ClientReceive, MismatchedGreetingIsDrainedAndStreamStaysUsable)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        // 세션 도중 Greet + Greeting
        send_greeting(sock, "second greeting");
        Command query;
        ASSERT_TRUE(receive_command(sock, query));
        ASSERT_TRUE(write_packet(sock, PacketType::kResponse, one_int_result(5), kBulkLimit)
                        .has_value());
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto pong = conn->ping();
    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kUnexpectedPacket);
    EXPECT_EQ(conn->state(), ClientState::kReady);

    auto rows = conn->execute("SELECT 5");
    ASSERT_TRUE(rows.has_value()) << to_string(rows.error());
    EXPECT_EQ(std::get<std::int64_t>(rows->at(0, 0)), 5);

    EXPECT_TRUE(conn->quit().has_value());
}

TEST(ClientReceive, MovedFromConnectionIsClosed)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        answer_ok(sock);
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    Connection moved{std::move(*conn)};
    EXPECT_EQ(moved.state(), ClientState::kReady);
    EXPECT_EQ(conn->state(), ClientState::kClosed);

    auto stale = conn->ping();
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, WireErrorCode::kIo);
    EXPECT_EQ(stale.error().message, "connection is closed");

    EXPECT_TRUE(moved.ping().has_value());
    EXPECT_TRUE(moved.quit().has_value());
}

TEST(ClientReceive, PeerCloseIsIoErrorAndClosesConnection)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto pong = conn->ping();
    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kIo);
    EXPECT_EQ(conn->state(), ClientState::kClosed);
}

TEST(ClientReceive, SilentServerTimesOut)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        Command cmd;
        ASSERT_TRUE(receive_command(sock, cmd));
        // 응답하지 않는다. 클라이언트가 소켓을 닫으면 read_tag 가 끝난다.
        (void)read_tag(sock);
    }};

    ClientOptions options;
    options.io_timeout = std::chrono::milliseconds{200};

    auto conn = connect_to(server, options);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    const auto started = std::chrono::steady_clock::now();
    auto pong = conn->ping();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kIo);
    EXPECT_EQ(pong.error().message, "operation timed out");
    EXPECT_EQ(conn->state(), ClientState::kClosed);
    EXPECT_LT(elapsed, std::chrono::seconds{5});
}

TEST(ClientReceive, OperationsAfterQuitFail)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());
    ASSERT_TRUE(conn->quit().has_value());

    auto pong = conn->ping();
    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, WireErrorCode::kIo);
    EXPECT_EQ(pong.error().message, "connection is closed");

    auto rows = conn->execute("SELECT 1");
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, WireErrorCode::kIo);

    auto again = conn->quit();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, WireErrorCode::kIo);
}

TEST(ClientReceive, OversizedQueryIsEncodeErrorWithoutSending)
{
    FakeServer server{[](tcp::socket& sock) {
        accept_login(sock);
        answer_ok(sock);
    }};

    auto conn = connect_to(server);
    ASSERT_TRUE(conn.has_value()) << to_string(conn.error());

    auto rows = conn->execute(std::string(2000, 'x'));
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, WireErrorCode::kEncode);
    EXPECT_EQ(conn->state(), ClientState::kReady);

    EXPECT_TRUE(conn->quit().has_value());
}

// ---------------------------------------------------------------------------
// 로그인 응답 분류 (순수 함수)
// ---------------------------------------------------------------------------
TEST(LoginAckClassification, EveryTagHasAClass)
{
    using detail::LoginAck;
    using detail::classify_login_ack;

    EXPECT_EQ(classify_login_ack(PacketType::kAccGranted), LoginAck::kGranted);
    EXPECT_EQ(classify_login_ack(PacketType::kAccDenied), LoginAck::kDenied);
    EXPECT_EQ(classify_login_ack(PacketType::kError), LoginAck::kServerError);
    EXPECT_EQ(classify_login_ack(PacketType::kOk), LoginAck::kUnexpected);
    EXPECT_EQ(classify_login_ack(PacketType::kGreet), LoginAck::kUnexpected);
    EXPECT_EQ(classify_login_ack(PacketType::kResponse), LoginAck::kUnexpected);
}

TEST(LoginAckClassification, ServerErrorKeepsMessageVerbatim)
{
    const auto err = detail::server_error(ClientErrMsg{42, "disk on fire"});
    EXPECT_EQ(err.code, WireErrorCode::kServer);
    EXPECT_EQ(err.message, "disk on fire");
    EXPECT_EQ(err.server_code, 42);
}
