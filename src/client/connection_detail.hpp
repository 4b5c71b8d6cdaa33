#pragma once

// ---------------------------------------------------------------------------
// connection_detail.hpp - 테스트 전용 내부 인터페이스
//
// connection.cpp 내부 detail namespace 의 수신 정책 함수를 노출한다.
// 공개 API(connection.hpp)를 변경하지 않고 테스트 가능성만 확보한다.
// uosql-client 바이너리는 이 헤더를 포함하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "protocol/messages.hpp"
#include "protocol/packet_type.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <expected>

namespace detail {

// ---------------------------------------------------------------------------
// LoginAck
//   Login 전송 후 서버가 보낸 태그의 분류.
// ---------------------------------------------------------------------------
enum class LoginAck : std::uint8_t {
    kGranted,      // AccGranted - Ready 로 전이
    kDenied,       // AccDenied - kAuth
    kServerError,  // Error - ClientErrMsg 디코딩 후 kServer
    kUnexpected,   // 그 외 - 페이로드 소비 후 kUnexpectedPacket
};

// classify_login_ack
//   소켓과 무관한 순수 함수.
[[nodiscard]] constexpr auto classify_login_ack(PacketType tag) noexcept -> LoginAck
{
    switch (tag) {
        case PacketType::kAccGranted: return LoginAck::kGranted;
        case PacketType::kAccDenied:  return LoginAck::kDenied;
        case PacketType::kError:      return LoginAck::kServerError;
        case PacketType::kGreet:
        case PacketType::kLogin:
        case PacketType::kCommand:
        case PacketType::kOk:
        case PacketType::kResponse:
            return LoginAck::kUnexpected;
    }
    return LoginAck::kUnexpected;
}

// server_error
//   ClientErrMsg 를 kServer WireError 로 변환한다. msg 는 그대로 보존된다.
[[nodiscard]] auto server_error(const ClientErrMsg& msg) -> WireError;

// unexpected_packet
//   기대 태그와 실제 태그를 context 에 담은 kUnexpectedPacket 오류.
[[nodiscard]] auto unexpected_packet(PacketType expected, PacketType received) -> WireError;

// ---------------------------------------------------------------------------
// on_tag
//   이미 읽은 태그 하나에 수신 정책을 적용한다.
//
//   received == kError    -> ClientErrMsg 를 상한 없이 디코딩, kServer
//                            (expected 가 무엇이든 우선한다)
//   received != expected  -> received 의 페이로드를 끝까지 소비, kUnexpectedPacket
//   received == expected  -> 성공. 페이로드는 읽지 않는다.
// ---------------------------------------------------------------------------
auto on_tag(boost::asio::ip::tcp::socket& sock, PacketType expected, PacketType received)
    -> boost::asio::awaitable<std::expected<void, WireError>>;

// receive
//   태그 하나를 읽고 on_tag 를 적용한다.
auto receive(boost::asio::ip::tcp::socket& sock, PacketType expected)
    -> boost::asio::awaitable<std::expected<void, WireError>>;

// receive_login_ack
//   Login 전송 직후의 응답을 처리한다. AccDenied 는 kAuth.
auto receive_login_ack(boost::asio::ip::tcp::socket& sock)
    -> boost::asio::awaitable<std::expected<void, WireError>>;

}  // namespace detail
