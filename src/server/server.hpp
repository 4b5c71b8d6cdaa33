#pragma once

#include "config/server_config.hpp"
#include "engine/query_engine.hpp"
#include "logger/structured_logger.hpp"
#include "server/authenticator.hpp"
#include "server/session.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// Server
//   TCP 리슨 → 세션 생성 → Graceful Shutdown 을 담당하는 메인 서버.
//
//   사용 예 (프로세스):
//     Server server(config, engine, authenticator);
//     server.run();          // SIGINT/SIGTERM 까지 블로킹
//
//   사용 예 (테스트):
//     server.start();        // 워커 스레드에서 구동, 즉시 반환
//     ... server.bound_port() 로 접속 ...
//     server.stop();
//     server.wait();
//
//   Graceful Shutdown:
//     stop() 호출 시 새 연결을 거부하고 기존 세션을 닫는다. 마지막 세션이
//     끝나면 io_context 를 중단한다.
// ---------------------------------------------------------------------------
class Server {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   config        : 서버 설정 (값으로 복사하여 소유)
    //   engine        : Query 커맨드 실행기
    //   authenticator : Login 판정기
    //
    //   감사 로그 파일을 열 수 없으면 std::runtime_error
    // -----------------------------------------------------------------------
    Server(ServerConfig                         config,
           std::shared_ptr<QueryEngine>         engine,
           std::shared_ptr<const Authenticator> authenticator);

    ~Server();

    // 복사/이동 금지
    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&)                 = delete;
    Server& operator=(Server&&)      = delete;

    // -----------------------------------------------------------------------
    // start
    //   리슨 소켓을 바인딩하고 accept 루프를 spawn 한 뒤 worker_threads 개의
    //   스레드에서 io_context 를 구동한다. 바인딩 실패 시
    //   boost::system::system_error 를 던진다.
    // -----------------------------------------------------------------------
    void start();

    // -----------------------------------------------------------------------
    // run
    //   SIGINT/SIGTERM 핸들러를 등록하고 start() 후 wait() 한다.
    // -----------------------------------------------------------------------
    void run();

    // -----------------------------------------------------------------------
    // stop
    //   Graceful Shutdown 을 시작한다. 어느 스레드에서든 호출할 수 있다.
    // -----------------------------------------------------------------------
    void stop();

    // wait: 워커 스레드가 모두 끝날 때까지 블로킹한다.
    void wait();

    // start() 이후 실제로 바인딩된 포트 (설정 포트가 0 이면 OS 가 할당)
    [[nodiscard]] auto bound_port() const noexcept -> std::uint16_t;

    [[nodiscard]] auto stats() const noexcept -> StatsSnapshot;
    [[nodiscard]] auto session_count() const -> std::size_t;

private:
    // accept_loop: TCP Accept 루프 코루틴
    auto accept_loop() -> boost::asio::awaitable<void>;

    // 세션 생성 + spawn. 완료 시 sessions_ 에서 제거한다.
    void spawn_session(boost::asio::ip::tcp::socket socket);

    // max_connections 초과: Greeting 대신 Error{TooManyConnections} 후 종료
    void spawn_rejection(boost::asio::ip::tcp::socket socket);

    // stopping_ 중 마지막 세션이 끝났으면 io_context 를 멈춘다.
    void finish_if_drained();

    ServerConfig                         config_;

    std::shared_ptr<QueryEngine>         engine_;
    std::shared_ptr<const Authenticator> authenticator_;
    std::shared_ptr<StructuredLogger>    logger_;
    std::shared_ptr<StatsCollector>      stats_;

    boost::asio::io_context              io_ctx_;
    boost::asio::ip::tcp::acceptor       acceptor_;
    std::unique_ptr<boost::asio::signal_set> signals_{};
    std::uint16_t                        bound_port_{0};

    std::atomic<bool>                    started_{false};
    std::atomic<bool>                    stopping_{false};
    std::atomic<std::uint64_t>           next_session_id_{1};

    mutable std::mutex                   sessions_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Session>> sessions_{};

    std::vector<std::thread>             workers_{};
};
