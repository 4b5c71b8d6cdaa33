#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SessionContext
//   서버 측 연결 하나를 식별하는 컨텍스트.
//   server 레이어가 생성하고 engine/logger 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct SessionContext {
    std::uint64_t session_id{0};           // 프로세스 범위 내 유일 세션 ID
    std::string   client_ip{};             // 클라이언트 IPv4/IPv6 주소 문자열
    std::uint16_t client_port{0};          // 클라이언트 TCP 포트
    std::string   username{};              // 인증된 사용자 이름
    std::chrono::system_clock::time_point connected_at{};  // 연결 수립 시각
    bool          authorized{false};       // 로그인 승인 여부
};

// ---------------------------------------------------------------------------
// WireErrorCode
//   클라이언트가 관찰하는 통합 오류 분류.
//   호출자는 메시지 문자열이 아니라 이 값으로 분기해야 한다.
// ---------------------------------------------------------------------------
enum class WireErrorCode : std::uint8_t {
    kAddrParse        = 0,  // IPv4 주소 형식 오류
    kIo               = 1,  // 소켓 connect/read/write 실패
    kUnexpectedPacket = 2,  // 기대한 태그와 다른 태그 수신 (Error 제외)
    kEncode           = 3,  // 직렬화 실패 또는 크기 상한 초과
    kDecode           = 4,  // 역직렬화 실패, 잘림, 크기 상한 초과
    kAuth             = 5,  // AccDenied 수신
    kServer           = 6,  // 서버가 Error + ClientErrMsg 로 보고한 오류
};

// ---------------------------------------------------------------------------
// WireError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, WireError> 패턴과 함께 사용한다.
//
//   kServer 인 경우 message 는 서버가 보낸 문자열 그대로이며
//   server_code 에 ClientErrMsg::code 가 담긴다.
// ---------------------------------------------------------------------------
struct WireError {
    WireErrorCode code{WireErrorCode::kIo};
    std::string   message{};      // 사람이 읽을 수 있는 오류 설명
    std::string   context{};      // 오류가 발생한 위치/원인 (로깅용)
    std::uint16_t server_code{0}; // kServer 전용
};

// describe
//   오류 분류별 고정 설명 문자열.
[[nodiscard]] auto describe(WireErrorCode code) noexcept -> std::string_view;

// to_string
//   kServer 는 서버 메시지를 그대로, 나머지는 "설명: message (context)" 형태로 반환한다.
[[nodiscard]] auto to_string(const WireError& error) -> std::string;
