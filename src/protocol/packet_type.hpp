#pragma once

#include "protocol/messages.hpp"

#include <cstdint>
#include <string_view>
#include <type_traits>

// ---------------------------------------------------------------------------
// PacketType
//   다음 페이로드의 종류를 알리는 1바이트 태그.
//   모든 페이로드 앞에는 정확히 하나의 태그가 온다.
//   kOk / kAccGranted / kAccDenied 는 페이로드가 없다.
// ---------------------------------------------------------------------------
enum class PacketType : std::uint8_t {
    kGreet      = 0,
    kLogin      = 1,
    kCommand    = 2,
    kOk         = 3,
    kError      = 4,
    kResponse   = 5,
    kAccGranted = 6,
    kAccDenied  = 7,
};

inline constexpr std::uint8_t kMaxPacketTag = static_cast<std::uint8_t>(PacketType::kAccDenied);

// ---------------------------------------------------------------------------
// PayloadKind
//   태그 → 페이로드 타입 매핑의 런타임 표현.
// ---------------------------------------------------------------------------
enum class PayloadKind : std::uint8_t {
    kNone,
    kGreeting,
    kLogin,
    kCommand,
    kErrorMessage,
    kResultSet,
};

// 페이로드가 없는 태그를 나타내는 빈 타입
struct NoPayload {};

// ---------------------------------------------------------------------------
// payload_kind
//   전체(total) 매핑. default 분기가 없으므로 태그가 추가되면
//   -Werror=switch 로 컴파일 단계에서 누락이 드러난다.
// ---------------------------------------------------------------------------
[[nodiscard]] constexpr auto payload_kind(PacketType tag) noexcept -> PayloadKind
{
    switch (tag) {
        case PacketType::kGreet:      return PayloadKind::kGreeting;
        case PacketType::kLogin:      return PayloadKind::kLogin;
        case PacketType::kCommand:    return PayloadKind::kCommand;
        case PacketType::kOk:         return PayloadKind::kNone;
        case PacketType::kError:      return PayloadKind::kErrorMessage;
        case PacketType::kResponse:   return PayloadKind::kResultSet;
        case PacketType::kAccGranted: return PayloadKind::kNone;
        case PacketType::kAccDenied:  return PayloadKind::kNone;
    }
    return PayloadKind::kNone;
}

[[nodiscard]] constexpr auto has_payload(PacketType tag) noexcept -> bool
{
    return payload_kind(tag) != PayloadKind::kNone;
}

// ---------------------------------------------------------------------------
// TagPayload<Tag>
//   같은 매핑의 타입 수준 표현. 특수화가 없는 태그는 인스턴스화 시 실패한다.
// ---------------------------------------------------------------------------
template <PacketType Tag>
struct TagPayload;

template <> struct TagPayload<PacketType::kGreet>      { using type = Greeting;     };
template <> struct TagPayload<PacketType::kLogin>      { using type = Login;        };
template <> struct TagPayload<PacketType::kCommand>    { using type = Command;      };
template <> struct TagPayload<PacketType::kOk>         { using type = NoPayload;    };
template <> struct TagPayload<PacketType::kError>      { using type = ClientErrMsg; };
template <> struct TagPayload<PacketType::kResponse>   { using type = ResultSet;    };
template <> struct TagPayload<PacketType::kAccGranted> { using type = NoPayload;    };
template <> struct TagPayload<PacketType::kAccDenied>  { using type = NoPayload;    };

template <PacketType Tag>
using tag_payload_t = typename TagPayload<Tag>::type;

static_assert(std::is_same_v<tag_payload_t<PacketType::kResponse>, ResultSet>);
static_assert(std::is_same_v<tag_payload_t<PacketType::kOk>, NoPayload>);
static_assert(payload_kind(PacketType::kError) == PayloadKind::kErrorMessage);

// ---------------------------------------------------------------------------
// visit_payload
//   런타임 태그를 해당 페이로드 타입으로 디스패치한다.
//   visitor 는 std::type_identity<P> 하나를 받는다.
// ---------------------------------------------------------------------------
template <typename Visitor>
constexpr decltype(auto) visit_payload(PacketType tag, Visitor&& visitor)
{
    switch (tag) {
        case PacketType::kGreet:
            return visitor(std::type_identity<tag_payload_t<PacketType::kGreet>>{});
        case PacketType::kLogin:
            return visitor(std::type_identity<tag_payload_t<PacketType::kLogin>>{});
        case PacketType::kCommand:
            return visitor(std::type_identity<tag_payload_t<PacketType::kCommand>>{});
        case PacketType::kOk:
            return visitor(std::type_identity<tag_payload_t<PacketType::kOk>>{});
        case PacketType::kError:
            return visitor(std::type_identity<tag_payload_t<PacketType::kError>>{});
        case PacketType::kResponse:
            return visitor(std::type_identity<tag_payload_t<PacketType::kResponse>>{});
        case PacketType::kAccGranted:
            return visitor(std::type_identity<tag_payload_t<PacketType::kAccGranted>>{});
        case PacketType::kAccDenied:
            return visitor(std::type_identity<tag_payload_t<PacketType::kAccDenied>>{});
    }
    // 열거형 범위 밖 값은 decode_tag 에서 이미 걸러진다
    return visitor(std::type_identity<NoPayload>{});
}

// 로그 출력용 태그 이름
[[nodiscard]] constexpr auto packet_type_name(PacketType tag) noexcept -> std::string_view
{
    switch (tag) {
        case PacketType::kGreet:      return "Greet";
        case PacketType::kLogin:      return "Login";
        case PacketType::kCommand:    return "Command";
        case PacketType::kOk:         return "Ok";
        case PacketType::kError:      return "Error";
        case PacketType::kResponse:   return "Response";
        case PacketType::kAccGranted: return "AccGranted";
        case PacketType::kAccDenied:  return "AccDenied";
    }
    return "Unknown";
}
