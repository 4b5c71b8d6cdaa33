#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ServerErrorCode 를 직접 include 하지 않는다.
// - error_code (uint16_t): 호출자가 ClientErrMsg::code 를 그대로 넣는다.
//
// [민감정보 취급 주의]
// - sql 은 원문 SQL 전체를 포함한다. 비밀번호는 어떤 로그에도 넣지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionLog
//   클라이언트 연결 생명주기 이벤트 로그.
//   event: "connect" | "disconnect" | "auth_denied" | "rejected"
//   username 은 로그인 이전 이벤트에서는 비어 있다.
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::uint64_t                              session_id{0};
    std::string                                event{};
    std::string                                client_ip{};
    std::uint16_t                              client_port{0};
    std::string                                username{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// QueryLog
//   Query 커맨드 실행 로그.
//
//   ok         : Response 로 응답했으면 true, Error 로 응답했으면 false
//   rows       : ok 일 때 결과 행 수
//   error_code : !ok 일 때 ClientErrMsg::code
// ---------------------------------------------------------------------------
struct QueryLog {
    std::uint64_t                              session_id{0};
    std::string                                username{};
    std::string                                client_ip{};
    std::string                                sql{};          // 원문 SQL (마스킹 주의)
    bool                                       ok{false};
    std::uint64_t                              rows{0};
    std::uint16_t                              error_code{0};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 엔진 실행 소요 시간
};
