#pragma once

#include "common/types.hpp"
#include "engine/query_engine.hpp"
#include "logger/structured_logger.hpp"
#include "protocol/messages.hpp"
#include "protocol/packet_type.hpp"
#include "server/authenticator.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SessionState
//   Session 의 생명주기 상태를 나타낸다.
//
//   kAwaitGreetingSend : accept 직후, Greet 송신 전
//   kAwaitLogin        : Greet 송신 완료, Login 대기 중
//   kAuthorizing       : Login 수신, Authenticator 판정 중
//   kServing           : 승인 완료, 커맨드 수신 대기 중
//   kClosed            : 세션 완전 종료
// ---------------------------------------------------------------------------
enum class SessionState : std::uint8_t {
    kAwaitGreetingSend = 0,
    kAwaitLogin        = 1,
    kAuthorizing       = 2,
    kServing           = 3,
    kClosed            = 4,
};

// ---------------------------------------------------------------------------
// Session
//   클라이언트 연결 1개를 처리하는 서버 측 핸들러.
//
//   생명주기:
//     1. 생성자에서 소켓/의존성 주입
//     2. run() 코루틴으로 Greet → Login → 인가 → 커맨드 루프 수행
//     3. Quit, 프로토콜 위반, 전송 오류, 유휴 타임아웃, close() 중 하나로 kClosed
//
//   스레드 안전성:
//     소켓은 연결마다 만든 strand 위에서 생성된다. run() 과 유휴 감시 코루틴은
//     같은 executor 로 spawn 되므로 수동 락이 불필요하다. close() 만 다른
//     스레드에서 호출될 수 있으며 strand 로 post 한다.
//
//   통계:
//     서버가 StatsCollector::try_open_connection 에 성공한 연결에 대해서만
//     Session 을 만든다. run() 이 끝날 때 on_connection_close() 를 호출한다.
// ---------------------------------------------------------------------------
class Session : public std::enable_shared_from_this<Session> {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   session_id    : 프로세스 범위 유일 ID
    //   socket        : accept 된 클라이언트 소켓 (move 소유권 이전)
    //   greeting      : Greeting.message 로 보낼 문자열
    //   idle_timeout  : 0 이면 유휴 감시 비활성
    //   engine        : 쿼리 실행기 (shared 소유권)
    //   authenticator : 로그인 판정기 (shared 소유권)
    //   logger        : 구조화 로거 (shared 소유권)
    //   stats         : 통계 수집기 (shared 소유권)
    // -----------------------------------------------------------------------
    Session(std::uint64_t                        session_id,
            boost::asio::ip::tcp::socket         socket,
            std::string                          greeting,
            std::chrono::seconds                 idle_timeout,
            std::shared_ptr<QueryEngine>         engine,
            std::shared_ptr<const Authenticator> authenticator,
            std::shared_ptr<StructuredLogger>    logger,
            std::shared_ptr<StatsCollector>      stats);

    ~Session() = default;

    // 복사/이동 금지 (shared_ptr 로만 관리)
    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&)                 = delete;
    Session& operator=(Session&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   세션의 메인 코루틴. executor() 위에서 spawn 해야 한다.
    //   반환 시 세션은 kClosed 상태이고 소켓은 닫혀 있다.
    // -----------------------------------------------------------------------
    auto run() -> boost::asio::awaitable<void>;

    // -----------------------------------------------------------------------
    // close
    //   세션을 종료한다. 진행 중인 읽기/쓰기를 취소하고 run() 이 정리하도록
    //   한다. 어느 스레드에서든 호출할 수 있고, 두 번째 호출부터는 no-op.
    // -----------------------------------------------------------------------
    void close();

    // -----------------------------------------------------------------------
    // Accessors
    //   state() / context() 는 세션 executor 위에서만 일관된 값을 본다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto state()    const noexcept -> SessionState;
    [[nodiscard]] auto context()  const noexcept -> const SessionContext&;
    [[nodiscard]] auto executor() const noexcept -> const boost::asio::any_io_executor&;

private:
    // 핸드셰이크: Greet 송신 → Login 수신 → 인가. 승인되면 true.
    auto handshake() -> boost::asio::awaitable<bool>;

    // 커맨드 루프: Quit 또는 오류까지 반복
    auto serve_commands() -> boost::asio::awaitable<void>;

    // Query 1건 처리. 연결을 계속 쓸 수 있으면 true.
    auto handle_query(const std::string& sql) -> boost::asio::awaitable<bool>;

    // Error 태그 + ClientErrMsg 송신
    auto send_error(ServerErrorCode code, std::string_view msg)
        -> boost::asio::awaitable<std::expected<void, WireError>>;

    // 잘못된 태그 처리: 페이로드를 버리고 UnexpectedPacket 으로 응답한다.
    // 페이로드가 control 상한을 넘거나 깨져 있으면 MalformedPacket 후 오류.
    auto reject_tag(PacketType expected, PacketType received)
        -> boost::asio::awaitable<std::expected<void, WireError>>;

    // 유휴 감시 코루틴
    auto idle_watchdog() -> boost::asio::awaitable<void>;

    void touch() noexcept;
    void shutdown_socket() noexcept;
    void log_event(const char* event);

    std::uint64_t                                  session_id_;
    boost::asio::ip::tcp::socket                   socket_;
    boost::asio::any_io_executor                   executor_;
    std::string                                    greeting_;
    std::chrono::seconds                           idle_timeout_;

    std::shared_ptr<QueryEngine>                   engine_;
    std::shared_ptr<const Authenticator>           authenticator_;
    std::shared_ptr<StructuredLogger>              logger_;
    std::shared_ptr<StatsCollector>                stats_;

    SessionContext                                 ctx_;
    SessionState                                   state_{SessionState::kAwaitGreetingSend};

    // 유휴 감시: 마지막으로 패킷을 주고받은 시각
    boost::asio::steady_timer                      idle_timer_;
    std::chrono::steady_clock::time_point          last_activity_;

    // close() 중복 호출 방지용 atomic 플래그
    std::atomic<bool>                              closing_{false};
};
