#include "server/session.hpp"

#include "protocol/codec.hpp"
#include "protocol/wire_io.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// Session - 구현
//
// 흐름:
//   1. SessionContext 초기화 → logger_.log_connection("connect")
//   2. idle_timeout > 0 이면 유휴 감시 코루틴 spawn
//   3. handshake()
//        Greet 송신 → Login 태그/페이로드 수신 → Authenticator
//        AccGranted → kServing / AccDenied → 종료
//   4. serve_commands()
//        Ping  → Ok
//        Quit  → Ok 후 종료
//        Query → engine → Response 또는 Error
//   5. state_ = kClosed → 감시 타이머 취소 → log("disconnect") → 소켓 close
//
// 프로토콜 위반 처리:
//   기대와 다른 태그        : 페이로드를 버리고 Error{UnexpectedPacket}
//                             (핸드셰이크 중이면 종료, 커맨드 루프면 계속)
//   디코딩 실패 / 상한 초과 : Error{MalformedPacket} 후 종료
//                             (스트림 정렬을 더 이상 보장할 수 없다)
//   전송 오류               : 그 세션만 종료
// ---------------------------------------------------------------------------

namespace {

// 결과 행 수 (row_width 가 0 이면 0)
auto count_rows(const ResultSet& result) noexcept -> std::uint64_t
{
    const auto width = result.row_width();
    if (width == 0) {
        return 0;
    }
    return result.data.size() / width;
}

void log_session_exception(std::uint64_t session_id, std::exception_ptr eptr)
{
    if (eptr) {
        try { std::rethrow_exception(eptr); }
        catch (const std::exception& e) {
            spdlog::error("[session {}] idle watchdog exception: {}", session_id, e.what());
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Session 생성자
// ---------------------------------------------------------------------------
Session::Session(std::uint64_t                        session_id,
                 boost::asio::ip::tcp::socket         socket,
                 std::string                          greeting,
                 std::chrono::seconds                 idle_timeout,
                 std::shared_ptr<QueryEngine>         engine,
                 std::shared_ptr<const Authenticator> authenticator,
                 std::shared_ptr<StructuredLogger>    logger,
                 std::shared_ptr<StatsCollector>      stats)
    : session_id_{session_id}
    , socket_{std::move(socket)}
    , executor_{socket_.get_executor()}
    , greeting_{std::move(greeting)}
    , idle_timeout_{idle_timeout}
    , engine_{std::move(engine)}
    , authenticator_{std::move(authenticator)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
    , ctx_{}
    , state_{SessionState::kAwaitGreetingSend}
    , idle_timer_{executor_}
    , last_activity_{std::chrono::steady_clock::now()}
    , closing_{false}
{}

auto Session::state() const noexcept -> SessionState
{
    return state_;
}

auto Session::context() const noexcept -> const SessionContext&
{
    return ctx_;
}

auto Session::executor() const noexcept -> const boost::asio::any_io_executor&
{
    return executor_;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼
// ---------------------------------------------------------------------------
void Session::touch() noexcept
{
    last_activity_ = std::chrono::steady_clock::now();
}

void Session::shutdown_socket() noexcept
{
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void Session::log_event(const char* event)
{
    logger_->log_connection(ConnectionLog{
        .session_id  = session_id_,
        .event       = event,
        .client_ip   = ctx_.client_ip,
        .client_port = ctx_.client_port,
        .username    = ctx_.username,
        .timestamp   = std::chrono::system_clock::now(),
    });
}

auto Session::send_error(ServerErrorCode code, std::string_view msg)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    const ClientErrMsg reply = ClientErrMsg::make(code, std::string{msg});
    co_return co_await async_write_packet(socket_, PacketType::kError, reply, kBulkLimit);
}

auto Session::reject_tag(PacketType expected, PacketType received)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    spdlog::warn("[session {}] unexpected packet: expected={}, received={}",
                 session_id_, packet_type_name(expected), packet_type_name(received));

    // 클라이언트가 보내는 페이로드는 모두 control 크기다
    auto drained = co_await async_drain_payload(socket_, received, kControlLimit);
    if (!drained) {
        if (drained.error().code == WireErrorCode::kDecode) {
            const std::string reason = fmt::format("malformed {}", packet_type_name(received));
            auto sent = co_await send_error(ServerErrorCode::kMalformedPacket, reason);
            if (!sent) {
                spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
            }
        }
        co_return std::unexpected(drained.error());
    }

    const std::string reason = fmt::format("unexpected packet: expected {}, received {}",
                                           packet_type_name(expected),
                                           packet_type_name(received));
    co_return co_await send_error(ServerErrorCode::kUnexpectedPacket, reason);
}

// ---------------------------------------------------------------------------
// Session::close
// ---------------------------------------------------------------------------
void Session::close()
{
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    boost::asio::post(executor_, [self = shared_from_this()]() {
        self->idle_timer_.cancel();
        self->shutdown_socket();
    });
}

// ---------------------------------------------------------------------------
// Session::idle_watchdog
//   마지막 활동 시각 + idle_timeout 까지 기다렸다가, 그 사이 활동이 없었으면
//   소켓을 닫는다. 진행 중인 읽기가 kIo 로 끝나면서 run() 이 정리한다.
// ---------------------------------------------------------------------------
auto Session::idle_watchdog() -> boost::asio::awaitable<void>
{
    while (!closing_.load(std::memory_order_acquire)) {
        idle_timer_.expires_at(last_activity_ + idle_timeout_);

        boost::system::error_code ec;
        co_await idle_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (closing_.load(std::memory_order_acquire)) {
            break;
        }
        if (ec && ec != boost::asio::error::operation_aborted) {
            spdlog::warn("[session {}] idle timer error: {}", session_id_, ec.message());
            break;
        }
        if (std::chrono::steady_clock::now() - last_activity_ >= idle_timeout_) {
            spdlog::info("[session {}] idle for {}s, closing",
                         session_id_, idle_timeout_.count());
            closing_.store(true, std::memory_order_release);
            shutdown_socket();
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Session::handshake
// ---------------------------------------------------------------------------
auto Session::handshake() -> boost::asio::awaitable<bool>
{
    // -----------------------------------------------------------------------
    // 1. Greet 송신
    // -----------------------------------------------------------------------
    state_ = SessionState::kAwaitGreetingSend;
    const Greeting greeting{kProtocolVersion, greeting_};
    auto greeted = co_await async_write_packet(socket_, PacketType::kGreet, greeting, kControlLimit);
    if (!greeted) {
        spdlog::warn("[session {}] failed to send greeting: {}",
                     session_id_, to_string(greeted.error()));
        co_return false;
    }
    touch();

    // -----------------------------------------------------------------------
    // 2. Login 수신
    // -----------------------------------------------------------------------
    state_ = SessionState::kAwaitLogin;
    auto tag = co_await async_read_tag(socket_);
    if (!tag) {
        if (tag.error().code == WireErrorCode::kDecode) {
            auto sent = co_await send_error(ServerErrorCode::kMalformedPacket, "invalid packet tag");
            if (!sent) {
                spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
            }
        }
        spdlog::debug("[session {}] no login: {}", session_id_, to_string(tag.error()));
        co_return false;
    }
    touch();

    if (*tag != PacketType::kLogin) {
        auto rejected = co_await reject_tag(PacketType::kLogin, *tag);
        if (!rejected) {
            spdlog::debug("[session {}] {}", session_id_, to_string(rejected.error()));
        }
        co_return false;
    }

    auto login = co_await async_read_payload<Login>(socket_, kControlLimit);
    if (!login) {
        spdlog::warn("[session {}] malformed login: {}", session_id_, to_string(login.error()));
        if (login.error().code == WireErrorCode::kDecode) {
            auto sent = co_await send_error(ServerErrorCode::kMalformedPacket, "malformed Login");
            if (!sent) {
                spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
            }
        }
        co_return false;
    }
    touch();

    // -----------------------------------------------------------------------
    // 3. 인가 (연결당 한 번)
    // -----------------------------------------------------------------------
    state_         = SessionState::kAuthorizing;
    ctx_.username  = login->username;

    if (!authenticator_->authorize(*login)) {
        log_event("auth_denied");
        spdlog::info("[session {}] access denied for user '{}'", session_id_, ctx_.username);

        auto sent = co_await async_write_tag(socket_, PacketType::kAccDenied);
        if (!sent) {
            spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
        }
        co_return false;
    }

    auto granted = co_await async_write_tag(socket_, PacketType::kAccGranted);
    if (!granted) {
        spdlog::warn("[session {}] failed to send AccGranted: {}",
                     session_id_, to_string(granted.error()));
        co_return false;
    }
    touch();

    ctx_.authorized = true;
    state_          = SessionState::kServing;

    spdlog::info("[session {}] login ok, user={}", session_id_, ctx_.username);
    co_return true;
}

// ---------------------------------------------------------------------------
// Session::handle_query
// ---------------------------------------------------------------------------
auto Session::handle_query(const std::string& sql) -> boost::asio::awaitable<bool>
{
    const auto query_start = std::chrono::steady_clock::now();
    auto result            = engine_->execute(sql, ctx_);
    const auto duration    = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - query_start
    );

    QueryLog entry{
        .session_id = session_id_,
        .username   = ctx_.username,
        .client_ip  = ctx_.client_ip,
        .sql        = sql,
        .ok         = result.has_value(),
        .rows       = 0,
        .error_code = 0,
        .timestamp  = std::chrono::system_clock::now(),
        .duration   = duration,
    };

    std::expected<void, WireError> sent;
    if (result) {
        entry.rows = count_rows(*result);
        sent = co_await async_write_packet(socket_, PacketType::kResponse, *result, kBulkLimit);

        // 직렬화 실패는 아무것도 쓰지 않았으므로 Error 로 대신 응답할 수 있다
        if (!sent && sent.error().code == WireErrorCode::kEncode) {
            spdlog::error("[session {}] cannot encode result set: {}",
                          session_id_, to_string(sent.error()));
            entry.ok         = false;
            entry.error_code = static_cast<std::uint16_t>(ServerErrorCode::kInternal);
            sent = co_await send_error(ServerErrorCode::kInternal, "result set too large");
        }
    } else {
        entry.error_code = result.error().code;
        sent = co_await async_write_packet(socket_, PacketType::kError, result.error(), kBulkLimit);
    }

    stats_->on_query(!entry.ok);
    logger_->log_query(entry);

    if (!sent) {
        spdlog::warn("[session {}] failed to send query reply: {}",
                     session_id_, to_string(sent.error()));
        co_return false;
    }
    co_return true;
}

// ---------------------------------------------------------------------------
// Session::serve_commands
// ---------------------------------------------------------------------------
auto Session::serve_commands() -> boost::asio::awaitable<void>
{
    while (!closing_.load(std::memory_order_acquire)) {
        auto tag = co_await async_read_tag(socket_);
        if (!tag) {
            if (tag.error().code == WireErrorCode::kDecode) {
                spdlog::warn("[session {}] {}", session_id_, to_string(tag.error()));
                auto sent = co_await send_error(ServerErrorCode::kMalformedPacket, "invalid packet tag");
                if (!sent) {
                    spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
                }
            } else {
                spdlog::debug("[session {}] client disconnected: {}",
                              session_id_, to_string(tag.error()));
            }
            co_return;
        }
        touch();

        // Command 가 아닌 태그: 페이로드를 버리고 알린 뒤 계속 대기
        if (*tag != PacketType::kCommand) {
            auto rejected = co_await reject_tag(PacketType::kCommand, *tag);
            if (!rejected) {
                spdlog::warn("[session {}] {}", session_id_, to_string(rejected.error()));
                co_return;
            }
            continue;
        }

        auto command = co_await async_read_payload<Command>(socket_, kControlLimit);
        if (!command) {
            spdlog::warn("[session {}] malformed command: {}",
                         session_id_, to_string(command.error()));
            if (command.error().code == WireErrorCode::kDecode) {
                auto sent = co_await send_error(ServerErrorCode::kMalformedPacket, "malformed Command");
                if (!sent) {
                    spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
                }
            }
            co_return;
        }
        touch();

        switch (command->type) {
            case CommandType::kPing: {
                auto sent = co_await async_write_tag(socket_, PacketType::kOk);
                if (!sent) {
                    spdlog::warn("[session {}] {}", session_id_, to_string(sent.error()));
                    co_return;
                }
                break;
            }
            case CommandType::kQuit: {
                spdlog::debug("[session {}] Quit received", session_id_);
                auto sent = co_await async_write_tag(socket_, PacketType::kOk);
                if (!sent) {
                    spdlog::debug("[session {}] {}", session_id_, to_string(sent.error()));
                }
                co_return;
            }
            case CommandType::kQuery: {
                const bool keep_open = co_await handle_query(command->query);
                if (!keep_open) {
                    co_return;
                }
                break;
            }
        }
        touch();
    }
}

// ---------------------------------------------------------------------------
// Session::run
// ---------------------------------------------------------------------------
auto Session::run() -> boost::asio::awaitable<void>
{
    auto self = shared_from_this();

    // -----------------------------------------------------------------------
    // 1. SessionContext 초기화
    // -----------------------------------------------------------------------
    ctx_.session_id   = session_id_;
    ctx_.connected_at = std::chrono::system_clock::now();

    boost::system::error_code peer_ec;
    const auto remote_ep = socket_.remote_endpoint(peer_ec);
    if (!peer_ec) {
        ctx_.client_ip   = remote_ep.address().to_string();
        ctx_.client_port = remote_ep.port();
    }

    // 세션 종료 시 정리 보장을 위한 RAII guard
    struct StatsGuard {
        StatsCollector* stats;
        ~StatsGuard() { stats->on_connection_close(); }
    } stats_guard{stats_.get()};

    log_event("connect");
    spdlog::debug("[session {}] accepted {}:{}", session_id_, ctx_.client_ip, ctx_.client_port);

    // -----------------------------------------------------------------------
    // 2. 유휴 감시
    // -----------------------------------------------------------------------
    touch();
    if (idle_timeout_.count() > 0) {
        const auto sid = session_id_;
        boost::asio::co_spawn(
            executor_,
            [self]() { return self->idle_watchdog(); },
            [sid](std::exception_ptr eptr) { log_session_exception(sid, eptr); }
        );
    }

    // -----------------------------------------------------------------------
    // 3~4. 핸드셰이크 → 커맨드 루프
    // -----------------------------------------------------------------------
    const bool authorized = co_await handshake();
    if (authorized) {
        co_await serve_commands();
    }

    // -----------------------------------------------------------------------
    // 5. 세션 정리
    // -----------------------------------------------------------------------
    state_ = SessionState::kClosed;
    closing_.store(true, std::memory_order_release);
    idle_timer_.cancel();

    log_event("disconnect");
    spdlog::info("[session {}] closed", session_id_);

    shutdown_socket();

    // stats_guard 소멸 시 on_connection_close() 호출됨
}
