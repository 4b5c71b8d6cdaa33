#pragma once

#include "common/types.hpp"
#include "protocol/dataset.hpp"
#include "protocol/messages.hpp"
#include "protocol/packet_type.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ClientState
//   클라이언트 연결 상태.
//
//   kConnecting       : 주소 해석 / TCP connect 진행 중
//   kAwaitingGreeting : Greet 대기
//   kAwaitingLoginAck : Login 전송 후 AccGranted 대기
//   kReady            : 커맨드 송수신 가능
//   kClosed           : quit() 또는 전송 오류 이후. 모든 연산이 kIo 로 실패한다.
// ---------------------------------------------------------------------------
enum class ClientState : std::uint8_t {
    kConnecting       = 0,
    kAwaitingGreeting = 1,
    kAwaitingLoginAck = 2,
    kReady            = 3,
    kClosed           = 4,
};

// ---------------------------------------------------------------------------
// ClientOptions
//   io_timeout : 요청 하나(송신 + 응답 수신)에 허용하는 최대 시간.
//                0 이면 무제한 대기. 초과 시 소켓을 닫고 kIo 를 반환한다.
// ---------------------------------------------------------------------------
struct ClientOptions {
    std::chrono::milliseconds io_timeout{std::chrono::seconds{30}};
};

// 이 라이브러리가 말하는 프로토콜 버전
[[nodiscard]] auto lib_version() noexcept -> std::uint8_t;

// ---------------------------------------------------------------------------
// Connection
//   서버와의 인증된 세션 하나. connect() 성공으로만 만들어진다.
//
//   사용 예:
//     auto conn = Connection::connect("127.0.0.1", 4242, "alice", "pw");
//     if (!conn) { ... conn.error() ... }
//     auto rows = conn->execute("SELECT 1");
//     conn->quit();
//
//   한 번에 하나의 요청만 처리한다. 스레드 안전하지 않다.
//
//   오류 이후 상태:
//     kServer / kUnexpectedPacket / kEncode : 스트림이 정렬되어 있으므로 kReady 유지
//     kIo / kDecode / 타임아웃              : kClosed
// ---------------------------------------------------------------------------
class Connection {
public:
    // -----------------------------------------------------------------------
    // connect
    //   address : IPv4 점 표기 주소
    //   port    : 서버 포트
    //
    //   순서: 주소 파싱(kAddrParse) → TCP connect(kIo) → Greet + Greeting 수신
    //         → Login 송신 → AccGranted / AccDenied(kAuth) / Error(kServer)
    //           / 그 외(kUnexpectedPacket)
    // -----------------------------------------------------------------------
    [[nodiscard]] static auto connect(std::string_view address,
                                      std::uint16_t    port,
                                      std::string      username,
                                      std::string      password,
                                      ClientOptions    options = {})
        -> std::expected<Connection, WireError>;

    ~Connection();

    Connection(Connection&&) noexcept;

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&)      = delete;

    // Command{Ping} 송신 후 Ok 를 기대한다.
    auto ping() -> std::expected<void, WireError>;

    // Command{Quit} 송신 후 Ok 를 기대한다. 결과와 무관하게 소켓을 닫는다.
    auto quit() -> std::expected<void, WireError>;

    // -----------------------------------------------------------------------
    // execute
    //   Command{Query} 송신 후 Response 를 기대하고 ResultSet 을 DataSet 으로
    //   변환한다. 쿼리 문자열은 제어 페이로드 상한(1024바이트)을 따른다.
    // -----------------------------------------------------------------------
    auto execute(std::string_view query) -> std::expected<DataSet, WireError>;

    // -----------------------------------------------------------------------
    // Accessors
    // -----------------------------------------------------------------------
    [[nodiscard]] auto version()  const noexcept -> std::uint8_t;
    [[nodiscard]] auto message()  const noexcept -> const std::string&;
    [[nodiscard]] auto ip()       const noexcept -> const std::string&;
    [[nodiscard]] auto port()     const noexcept -> std::uint16_t;
    [[nodiscard]] auto username() const noexcept -> const std::string&;
    [[nodiscard]] auto state()    const noexcept -> ClientState;

private:
    Connection(std::unique_ptr<boost::asio::io_context> io_ctx,
               boost::asio::ip::tcp::socket             socket,
               ClientOptions                            options,
               Greeting                                 greeting,
               Login                                    login,
               std::string                              ip,
               std::uint16_t                            port);

    // send_command
    //   Command 태그 + 페이로드를 보내고 expected 태그를 기다린다.
    auto send_command(Command cmd, PacketType expected)
        -> boost::asio::awaitable<std::expected<void, WireError>>;

    auto execute_async(std::string query)
        -> boost::asio::awaitable<std::expected<ResultSet, WireError>>;

    // kClosed 이면 kIo
    auto ensure_open() const -> std::expected<void, WireError>;

    // 연산 결과가 스트림 정렬을 깨뜨리는 오류이면 연결을 닫는다.
    void settle(const WireError& error);

    void close() noexcept;

    // io_ctx_ 는 socket_ 보다 먼저 선언되어 나중에 파괴된다.
    std::unique_ptr<boost::asio::io_context> io_ctx_;
    boost::asio::ip::tcp::socket             socket_;
    ClientOptions                            options_;

    Greeting      greeting_;
    Login         login_;
    std::string   ip_;
    std::uint16_t port_{0};
    ClientState   state_{ClientState::kReady};
};
