#include "client/connection.hpp"
#include "client/connection_detail.hpp"

#include "protocol/codec.hpp"
#include "protocol/wire_io.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <exception>
#include <optional>
#include <utility>

// ---------------------------------------------------------------------------
// Connection - 구현
//
// 모든 송수신은 wire_io 의 코루틴 버전으로 작성하고, 공개 API 는 연결 전용
// io_context 위에서 run_for(io_timeout) 으로 끝까지 구동한다. 시간 안에
// 끝나지 않으면 소켓을 닫아 진행 중인 연산을 취소한다.
// ---------------------------------------------------------------------------

namespace detail {

auto server_error(const ClientErrMsg& msg) -> WireError
{
    return WireError{
        WireErrorCode::kServer,
        msg.msg,
        fmt::format("server code={}", msg.code),
        msg.code
    };
}

auto unexpected_packet(PacketType expected, PacketType received) -> WireError
{
    return WireError{
        WireErrorCode::kUnexpectedPacket,
        "unexpected packet",
        fmt::format("expected={}, received={}",
                    packet_type_name(expected), packet_type_name(received))
    };
}

auto on_tag(boost::asio::ip::tcp::socket& sock, PacketType expected, PacketType received)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    // Error 는 기대 태그보다 우선한다
    if (received == PacketType::kError) {
        auto msg = co_await async_read_payload<ClientErrMsg>(sock, kBulkLimit);
        if (!msg) {
            co_return std::unexpected(msg.error());
        }
        co_return std::unexpected(server_error(*msg));
    }

    if (received != expected) {
        auto drained = co_await async_drain_payload(sock, received, kBulkLimit);
        if (!drained) {
            co_return std::unexpected(drained.error());
        }
        co_return std::unexpected(unexpected_packet(expected, received));
    }

    co_return std::expected<void, WireError>{};
}

auto receive(boost::asio::ip::tcp::socket& sock, PacketType expected)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    auto tag = co_await async_read_tag(sock);
    if (!tag) {
        co_return std::unexpected(tag.error());
    }
    co_return co_await on_tag(sock, expected, *tag);
}

auto receive_login_ack(boost::asio::ip::tcp::socket& sock)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    auto tag = co_await async_read_tag(sock);
    if (!tag) {
        co_return std::unexpected(tag.error());
    }

    if (classify_login_ack(*tag) == LoginAck::kDenied) {
        co_return std::unexpected(WireError{
            WireErrorCode::kAuth,
            "access denied",
            "server answered login with AccDenied"
        });
    }
    co_return co_await on_tag(sock, PacketType::kAccGranted, *tag);
}

}  // namespace detail

namespace {

auto state_name(ClientState state) noexcept -> std::string_view
{
    switch (state) {
        case ClientState::kConnecting:       return "connecting";
        case ClientState::kAwaitingGreeting: return "awaiting_greeting";
        case ClientState::kAwaitingLoginAck: return "awaiting_login_ack";
        case ClientState::kReady:            return "ready";
        case ClientState::kClosed:           return "closed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// run_blocking
//   op 를 io_ctx 위에서 완료될 때까지 실행한다.
//   timeout 이 지나면 sock 을 닫고, 취소된 op 가 끝나기를 기다린 뒤 kIo 를 반환한다.
// ---------------------------------------------------------------------------
template <typename T>
auto run_blocking(boost::asio::io_context&                            io_ctx,
                  boost::asio::ip::tcp::socket&                       sock,
                  std::chrono::milliseconds                           timeout,
                  boost::asio::awaitable<std::expected<T, WireError>> op)
    -> std::expected<T, WireError>
{
    std::optional<std::expected<T, WireError>> result;
    std::exception_ptr                         failure;

    boost::asio::co_spawn(
        io_ctx,
        std::move(op),
        [&result, &failure](std::exception_ptr eptr, std::expected<T, WireError> value) {
            if (eptr) {
                failure = eptr;
                return;
            }
            result.emplace(std::move(value));
        }
    );

    io_ctx.restart();
    if (timeout.count() > 0) {
        io_ctx.run_for(timeout);
    } else {
        io_ctx.run();
    }

    if (!result && !failure) {
        boost::system::error_code ec;
        sock.close(ec);
        io_ctx.restart();
        io_ctx.run();
        return std::unexpected(WireError{
            WireErrorCode::kIo,
            "operation timed out",
            fmt::format("timeout={}ms", timeout.count())
        });
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

// ---------------------------------------------------------------------------
// handshake
//   TCP connect → Greet/Greeting → Login → login ack.
//   state 는 실패 지점 로깅을 위해 갱신된다.
// ---------------------------------------------------------------------------
auto handshake(boost::asio::ip::tcp::socket&  sock,
               boost::asio::ip::tcp::endpoint endpoint,
               const Login&                   login,
               ClientState&                   state)
    -> boost::asio::awaitable<std::expected<Greeting, WireError>>
{
    boost::system::error_code ec;
    co_await sock.async_connect(
        endpoint,
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(WireError{
            WireErrorCode::kIo,
            "failed to connect",
            fmt::format("{}:{}: {}", endpoint.address().to_string(), endpoint.port(), ec.message())
        });
    }

    state = ClientState::kAwaitingGreeting;
    auto greet = co_await detail::receive(sock, PacketType::kGreet);
    if (!greet) {
        co_return std::unexpected(greet.error());
    }
    auto greeting = co_await async_read_payload<Greeting>(sock, kControlLimit);
    if (!greeting) {
        co_return std::unexpected(greeting.error());
    }

    auto sent = co_await async_write_packet(sock, PacketType::kLogin, login, kControlLimit);
    if (!sent) {
        co_return std::unexpected(sent.error());
    }

    state = ClientState::kAwaitingLoginAck;
    auto ack = co_await detail::receive_login_ack(sock);
    if (!ack) {
        co_return std::unexpected(ack.error());
    }

    state = ClientState::kReady;
    co_return std::move(*greeting);
}

}  // namespace

auto lib_version() noexcept -> std::uint8_t
{
    return kProtocolVersion;
}

// ---------------------------------------------------------------------------
// Connection::connect
// ---------------------------------------------------------------------------
auto Connection::connect(std::string_view address,
                         std::uint16_t    port,
                         std::string      username,
                         std::string      password,
                         ClientOptions    options)
    -> std::expected<Connection, WireError>
{
    ClientState state = ClientState::kConnecting;

    boost::system::error_code ec;
    const auto addr = boost::asio::ip::make_address_v4(std::string{address}, ec);
    if (ec) {
        return std::unexpected(WireError{
            WireErrorCode::kAddrParse,
            "invalid IPv4 address",
            std::string{address}
        });
    }

    auto io_ctx = std::make_unique<boost::asio::io_context>();
    boost::asio::ip::tcp::socket sock{*io_ctx};
    Login login{std::move(username), std::move(password)};

    auto greeting = run_blocking(
        *io_ctx, sock, options.io_timeout,
        handshake(sock, boost::asio::ip::tcp::endpoint{addr, port}, login, state)
    );

    if (!greeting) {
        spdlog::debug("[client] connect to {}:{} failed in state {}: {}",
                      addr.to_string(), port, state_name(state), to_string(greeting.error()));
        boost::system::error_code close_ec;
        sock.close(close_ec);
        return std::unexpected(greeting.error());
    }

    spdlog::debug("[client] connected to {}:{} as {} (protocol v{})",
                  addr.to_string(), port, login.username, greeting->protocol_version);

    return Connection{
        std::move(io_ctx),
        std::move(sock),
        options,
        std::move(*greeting),
        std::move(login),
        addr.to_string(),
        port
    };
}

Connection::Connection(std::unique_ptr<boost::asio::io_context> io_ctx,
                       boost::asio::ip::tcp::socket             socket,
                       ClientOptions                            options,
                       Greeting                                 greeting,
                       Login                                    login,
                       std::string                              ip,
                       std::uint16_t                            port)
    : io_ctx_{std::move(io_ctx)}
    , socket_{std::move(socket)}
    , options_{options}
    , greeting_{std::move(greeting)}
    , login_{std::move(login)}
    , ip_{std::move(ip)}
    , port_{port}
    , state_{ClientState::kReady}
{}

// 이동된 쪽은 kClosed 가 되어 이후 호출이 "connection is closed" 로 실패한다.
Connection::Connection(Connection&& other) noexcept
    : io_ctx_{std::move(other.io_ctx_)}
    , socket_{std::move(other.socket_)}
    , options_{other.options_}
    , greeting_{std::move(other.greeting_)}
    , login_{std::move(other.login_)}
    , ip_{std::move(other.ip_)}
    , port_{other.port_}
    , state_{std::exchange(other.state_, ClientState::kClosed)}
{}

Connection::~Connection()
{
    close();
}

// ---------------------------------------------------------------------------
// 커맨드
// ---------------------------------------------------------------------------
auto Connection::send_command(Command cmd, PacketType expected)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    auto sent = co_await async_write_packet(socket_, PacketType::kCommand, cmd, kControlLimit);
    if (!sent) {
        co_return std::unexpected(sent.error());
    }
    co_return co_await detail::receive(socket_, expected);
}

auto Connection::execute_async(std::string query)
    -> boost::asio::awaitable<std::expected<ResultSet, WireError>>
{
    Command cmd = Command::make_query(std::move(query));
    auto    ack = co_await send_command(std::move(cmd), PacketType::kResponse);
    if (!ack) {
        co_return std::unexpected(ack.error());
    }
    co_return co_await async_read_payload<ResultSet>(socket_, kBulkLimit);
}

auto Connection::ping() -> std::expected<void, WireError>
{
    if (auto open = ensure_open(); !open) {
        return open;
    }

    auto result = run_blocking(*io_ctx_, socket_, options_.io_timeout,
                               send_command(Command::ping(), PacketType::kOk));
    if (!result) {
        settle(result.error());
    }
    return result;
}

auto Connection::quit() -> std::expected<void, WireError>
{
    if (auto open = ensure_open(); !open) {
        return open;
    }

    auto result = run_blocking(*io_ctx_, socket_, options_.io_timeout,
                               send_command(Command::quit(), PacketType::kOk));
    close();
    return result;
}

auto Connection::execute(std::string_view query) -> std::expected<DataSet, WireError>
{
    if (auto open = ensure_open(); !open) {
        return std::unexpected(open.error());
    }

    auto rows = run_blocking(*io_ctx_, socket_, options_.io_timeout,
                             execute_async(std::string{query}));
    if (!rows) {
        settle(rows.error());
        return std::unexpected(rows.error());
    }
    return preprocess(*rows);
}

// ---------------------------------------------------------------------------
// 상태 관리
// ---------------------------------------------------------------------------
auto Connection::ensure_open() const -> std::expected<void, WireError>
{
    if (state_ == ClientState::kClosed) {
        return std::unexpected(WireError{
            WireErrorCode::kIo,
            "connection is closed",
            fmt::format("{}:{}", ip_, port_)
        });
    }
    return {};
}

void Connection::settle(const WireError& error)
{
    switch (error.code) {
        case WireErrorCode::kIo:
        case WireErrorCode::kDecode:
            spdlog::debug("[client] closing {}:{} after {}", ip_, port_, to_string(error));
            close();
            break;
        case WireErrorCode::kAddrParse:
        case WireErrorCode::kUnexpectedPacket:
        case WireErrorCode::kEncode:
        case WireErrorCode::kAuth:
        case WireErrorCode::kServer:
            break;
    }
}

void Connection::close() noexcept
{
    state_ = ClientState::kClosed;
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
auto Connection::version() const noexcept -> std::uint8_t
{
    return greeting_.protocol_version;
}

auto Connection::message() const noexcept -> const std::string&
{
    return greeting_.message;
}

auto Connection::ip() const noexcept -> const std::string&
{
    return ip_;
}

auto Connection::port() const noexcept -> std::uint16_t
{
    return port_;
}

auto Connection::username() const noexcept -> const std::string&
{
    return login_.username;
}

auto Connection::state() const noexcept -> ClientState
{
    return state_;
}
