#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// messages.hpp
//
// 태그 뒤에 오는 페이로드 레코드 정의.
// 와이어 인코딩은 protocol/codec.hpp 가 담당한다.
// ---------------------------------------------------------------------------

// 이 라이브러리가 말하는 프로토콜 버전. Greeting 에 실려 전달될 뿐 협상하지 않는다.
inline constexpr std::uint8_t kProtocolVersion = 1;

// ---------------------------------------------------------------------------
// Greeting
//   accept 직후 서버가 한 번 보내는 인사 패킷. 생성 후 불변.
// ---------------------------------------------------------------------------
struct Greeting {
    std::uint8_t protocol_version{kProtocolVersion};
    std::string  message{};

    bool operator==(const Greeting&) const = default;
};

// ---------------------------------------------------------------------------
// Login
//   핸드셰이크 중 클라이언트가 한 번 보내는 인증 정보.
//   클라이언트는 연결 수명 동안 보관하고, 서버는 인가 판정 동안만 사용한다.
// ---------------------------------------------------------------------------
struct Login {
    std::string username{};
    std::string password{};

    bool operator==(const Login&) const = default;
};

// ---------------------------------------------------------------------------
// CommandType / Command
//   Command 태그 뒤에 항상 하나의 Command 페이로드가 온다.
//   query 는 kQuery 일 때만 의미가 있다.
// ---------------------------------------------------------------------------
enum class CommandType : std::uint8_t {
    kPing  = 0,
    kQuit  = 1,
    kQuery = 2,
};

struct Command {
    CommandType type{CommandType::kPing};
    std::string query{};

    static auto ping() -> Command { return Command{CommandType::kPing, {}}; }
    static auto quit() -> Command { return Command{CommandType::kQuit, {}}; }
    static auto make_query(std::string sql) -> Command
    {
        return Command{CommandType::kQuery, std::move(sql)};
    }

    bool operator==(const Command&) const = default;
};

// ---------------------------------------------------------------------------
// ServerErrorCode
//   ClientErrMsg::code 에 실리는 서버 오류 번호.
// ---------------------------------------------------------------------------
enum class ServerErrorCode : std::uint16_t {
    kUnexpectedPacket   = 1,
    kMalformedPacket    = 2,
    kTooManyConnections = 3,
    kSyntaxError        = 10,
    kExecutionError     = 11,
    kInternal           = 255,
};

// ---------------------------------------------------------------------------
// ClientErrMsg
//   Error 태그 뒤에 오는 페이로드. 프로토콜 어느 지점에서든 나타날 수 있고
//   원래 기대하던 페이로드보다 우선한다.
// ---------------------------------------------------------------------------
struct ClientErrMsg {
    std::uint16_t code{static_cast<std::uint16_t>(ServerErrorCode::kInternal)};
    std::string   msg{};

    static auto make(ServerErrorCode code, std::string msg) -> ClientErrMsg
    {
        return ClientErrMsg{static_cast<std::uint16_t>(code), std::move(msg)};
    }

    bool operator==(const ClientErrMsg&) const = default;
};

// ---------------------------------------------------------------------------
// ColumnType / Column / ResultSet
//   쿼리 엔진이 만들어 내는 행 지향 원시 결과.
//
//   data 는 고정 폭 행을 이어붙인 바이트열이다.
//     kInt  : 8바이트 int64 LE
//     kBool : 1바이트 (0 또는 1)
//     kChar : width 바이트, 남는 부분은 NUL 로 채움
// ---------------------------------------------------------------------------
enum class ColumnType : std::uint8_t {
    kInt  = 0,
    kBool = 1,
    kChar = 2,
};

struct Column {
    std::string   name{};
    ColumnType    type{ColumnType::kInt};
    std::uint32_t width{0};  // kChar 전용, 나머지는 타입 고유 폭을 사용

    bool operator==(const Column&) const = default;
};

// 컬럼 하나가 행 안에서 차지하는 바이트 수
[[nodiscard]] auto column_width(const Column& column) noexcept -> std::size_t;

struct ResultSet {
    std::vector<Column>       columns{};
    std::vector<std::uint8_t> data{};

    [[nodiscard]] auto row_width() const noexcept -> std::size_t;

    bool operator==(const ResultSet&) const = default;
};
