#include "server/server.hpp"

#include "protocol/codec.hpp"
#include "protocol/wire_io.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <csignal>
#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// Server - 구현
//
// start() 흐름:
//   1. 리슨 소켓 open/bind/listen (실패 시 예외)
//   2. accept 루프 co_spawn
//   3. worker_threads 개 스레드에서 io_ctx_.run()
//
// accept 루프:
//   연결마다 strand 를 만들어 그 위에서 소켓을 받는다.
//   StatsCollector::try_open_connection 실패 → Error{TooManyConnections}
//   성공 → Session 생성 + co_spawn(session->run())
//          완료 콜백에서 sessions_.erase()
//
// stop() 흐름:
//   1. stopping_ = true
//   2. (io_ctx_ 위에서) acceptor 닫기 → 시그널 대기 취소
//   3. 활성 세션 각각 session->close()
//   4. 세션 0개이면 io_ctx_.stop()
// ---------------------------------------------------------------------------

namespace {

void log_exception(const char* what, std::exception_ptr eptr)
{
    if (eptr) {
        try { std::rethrow_exception(eptr); }
        catch (const std::exception& e) {
            spdlog::error("[server] {} exception: {}", what, e.what());
        }
    }
}

// 한도 초과 연결에 Error 를 보내고 닫는다. 인자는 코루틴 프레임에 값으로 보관된다.
auto send_rejection(boost::asio::ip::tcp::socket socket, std::uint32_t limit)
    -> boost::asio::awaitable<void>
{
    const ClientErrMsg reply = ClientErrMsg::make(
        ServerErrorCode::kTooManyConnections,
        fmt::format("too many connections (limit {})", limit));
    auto sent = co_await async_write_packet(socket, PacketType::kError, reply, kBulkLimit);
    if (!sent) {
        spdlog::debug("[server] rejection not delivered: {}", to_string(sent.error()));
    }

    boost::system::error_code ec;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자 / 소멸자
// ---------------------------------------------------------------------------
Server::Server(ServerConfig                         config,
               std::shared_ptr<QueryEngine>         engine,
               std::shared_ptr<const Authenticator> authenticator)
    : config_{std::move(config)}
    , engine_{std::move(engine)}
    , authenticator_{std::move(authenticator)}
    , logger_{std::make_shared<StructuredLogger>(
          parse_log_level(config_.log_level).value_or(LogLevel::kInfo), config_.log_path)}
    , stats_{std::make_shared<StatsCollector>()}
    , io_ctx_{static_cast<int>(config_.worker_threads)}
    , acceptor_{io_ctx_}
{}

Server::~Server()
{
    stop();
    wait();
}

// ---------------------------------------------------------------------------
// Server::start
// ---------------------------------------------------------------------------
void Server::start()
{
    if (started_.exchange(true)) {
        return;
    }

    const auto listen_addr = boost::asio::ip::make_address_v4(config_.listen_address);
    const auto listen_ep   = boost::asio::ip::tcp::endpoint{listen_addr, config_.listen_port};

    acceptor_.open(listen_ep.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(listen_ep);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();

    spdlog::info("[server] listening on {}:{} (workers={}, max_connections={}, idle_timeout={}s)",
                 config_.listen_address, bound_port_, config_.worker_threads,
                 config_.max_connections, config_.idle_timeout_sec);

    boost::asio::co_spawn(
        io_ctx_,
        accept_loop(),
        [](std::exception_ptr eptr) { log_exception("accept loop", eptr); }
    );

    workers_.reserve(config_.worker_threads);
    for (std::uint32_t i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back([this]() {
            try {
                io_ctx_.run();
            } catch (const std::exception& e) {
                spdlog::error("[server] worker exception: {}", e.what());
            }
        });
    }
}

// ---------------------------------------------------------------------------
// Server::run
// ---------------------------------------------------------------------------
void Server::run()
{
    signals_ = std::make_unique<boost::asio::signal_set>(io_ctx_, SIGTERM, SIGINT);
    signals_->async_wait(
        [this](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                spdlog::info("[server] signal {} received", signum);
                stop();
            }
        }
    );

    start();
    wait();
}

// ---------------------------------------------------------------------------
// Server::accept_loop
// ---------------------------------------------------------------------------
auto Server::accept_loop() -> boost::asio::awaitable<void>
{
    while (!stopping_.load(std::memory_order_acquire)) {
        boost::asio::ip::tcp::socket client_sock{boost::asio::make_strand(io_ctx_)};

        boost::system::error_code ec;
        co_await acceptor_.async_accept(
            client_sock,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[server] acceptor closed");
                break;
            }
            if (!stopping_.load(std::memory_order_acquire)) {
                spdlog::warn("[server] accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_.load(std::memory_order_acquire)) {
            boost::system::error_code close_ec;
            client_sock.close(close_ec);
            break;
        }

        if (!stats_->try_open_connection(config_.max_connections)) {
            spawn_rejection(std::move(client_sock));
            continue;
        }

        spawn_session(std::move(client_sock));
    }
}

// ---------------------------------------------------------------------------
// Server::spawn_session
// ---------------------------------------------------------------------------
void Server::spawn_session(boost::asio::ip::tcp::socket socket)
{
    const std::uint64_t sid = next_session_id_.fetch_add(1, std::memory_order_relaxed);

    auto session = std::make_shared<Session>(
        sid,
        std::move(socket),
        config_.greeting,
        std::chrono::seconds{config_.idle_timeout_sec},
        engine_,
        authenticator_,
        logger_,
        stats_
    );

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(sid, session);
    }

    // stop() 이 세션 목록을 훑은 뒤에 추가된 세션도 닫히도록 한다
    if (stopping_.load(std::memory_order_acquire)) {
        session->close();
    }

    spdlog::debug("[server] new session {}", sid);

    boost::asio::co_spawn(
        session->executor(),
        session->run(),
        [this, sid](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[server] session {} exception: {}", sid, e.what());
                }
            }

            std::size_t remaining = 0;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                sessions_.erase(sid);
                remaining = sessions_.size();
            }
            spdlog::debug("[server] session {} removed (active: {})", sid, remaining);

            finish_if_drained();
        }
    );
}

// ---------------------------------------------------------------------------
// Server::spawn_rejection
// ---------------------------------------------------------------------------
void Server::spawn_rejection(boost::asio::ip::tcp::socket socket)
{
    const std::uint64_t sid = next_session_id_.fetch_add(1, std::memory_order_relaxed);

    ConnectionLog entry{
        .session_id = sid,
        .event      = "rejected",
        .timestamp  = std::chrono::system_clock::now(),
    };
    boost::system::error_code peer_ec;
    const auto remote_ep = socket.remote_endpoint(peer_ec);
    if (!peer_ec) {
        entry.client_ip   = remote_ep.address().to_string();
        entry.client_port = remote_ep.port();
    }
    logger_->log_connection(entry);

    spdlog::warn("[server] max_connections ({}) reached, rejecting {}:{}",
                 config_.max_connections, entry.client_ip, entry.client_port);

    const auto executor = socket.get_executor();
    boost::asio::co_spawn(
        executor,
        send_rejection(std::move(socket), config_.max_connections),
        [](std::exception_ptr eptr) { log_exception("rejection", eptr); }
    );
}

// ---------------------------------------------------------------------------
// Server::stop
// ---------------------------------------------------------------------------
void Server::stop()
{
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (!started_.load(std::memory_order_acquire)) {
        return;
    }

    spdlog::info("[server] stopping, active sessions: {}", session_count());

    // acceptor 와 signal_set 은 io_ctx_ 스레드에서만 만진다
    boost::asio::post(io_ctx_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (signals_) {
            signals_->cancel(ec);
        }

        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            live.reserve(sessions_.size());
            for (const auto& entry : sessions_) {
                live.push_back(entry.second);
            }
        }
        for (auto& session : live) {
            session->close();
        }

        finish_if_drained();
    });
}

void Server::finish_if_drained()
{
    if (!stopping_.load(std::memory_order_acquire)) {
        return;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.empty()) {
        spdlog::info("[server] all sessions closed, stopping io_context");
        io_ctx_.stop();
    }
}

// ---------------------------------------------------------------------------
// Server::wait
// ---------------------------------------------------------------------------
void Server::wait()
{
    bool joined = false;
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
            joined = true;
        }
    }
    workers_.clear();

    if (!joined) {
        return;
    }

    logger_->flush();

    const auto snap = stats_->snapshot();
    spdlog::info("[server] stopped: connections={}, rejected={}, queries={}, failed={}",
                 snap.total_connections, snap.rejected_connections,
                 snap.total_queries, snap.failed_queries);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
auto Server::bound_port() const noexcept -> std::uint16_t
{
    return bound_port_;
}

auto Server::stats() const noexcept -> StatsSnapshot
{
    return stats_->snapshot();
}

auto Server::session_count() const -> std::size_t
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}
