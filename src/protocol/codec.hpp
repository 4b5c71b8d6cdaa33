#pragma once

#include "common/types.hpp"
#include "protocol/messages.hpp"
#include "protocol/packet_type.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

// ---------------------------------------------------------------------------
// codec.hpp
//
// 태그와 페이로드를 바이트로 변환하는 코덱.
//
//   Wire 포맷:
//     [1바이트 tag]
//     tag 가 페이로드를 가지면 이어서 [4바이트 body length LE][body...]
//
//   body 인코딩:
//     정수      : little endian
//     text      : [4바이트 length LE][UTF-8 bytes]
//     Command   : [1바이트 kind] (+ kQuery 이면 text)
//
//   코덱은 값 하나를 디코딩하는 데 필요한 바이트만 다루며 다음 값을
//   미리 읽지 않는다. 소켓 I/O 는 protocol/wire_io.hpp 가 담당한다.
// ---------------------------------------------------------------------------

// ---------------------------------------------------------------------------
// SizeLimit
//   페이로드 body 크기 상한. 제어 페이로드는 bounded, 결과 집합과 서버
//   오류 메시지는 infinite 를 사용한다.
// ---------------------------------------------------------------------------
struct SizeLimit {
    std::optional<std::size_t> max_bytes{};

    [[nodiscard]] static constexpr auto bounded(std::size_t n) noexcept -> SizeLimit
    {
        return SizeLimit{n};
    }

    [[nodiscard]] static constexpr auto infinite() noexcept -> SizeLimit
    {
        return SizeLimit{};
    }

    [[nodiscard]] constexpr auto allows(std::size_t n) const noexcept -> bool
    {
        return !max_bytes.has_value() || n <= *max_bytes;
    }
};

// Greeting / Login / Command 에 적용되는 상한 (바이트)
inline constexpr std::size_t kControlPayloadLimit = 1024;

inline constexpr SizeLimit kControlLimit = SizeLimit::bounded(kControlPayloadLimit);
inline constexpr SizeLimit kBulkLimit    = SizeLimit::infinite();

// body length 헤더 크기
inline constexpr std::size_t kPayloadHeaderSize = 4;

// ---------------------------------------------------------------------------
// 태그 인코딩
// ---------------------------------------------------------------------------
[[nodiscard]] auto encode_tag(PacketType tag) noexcept -> std::uint8_t;

// 범위 밖 바이트는 kDecode
[[nodiscard]] auto decode_tag(std::uint8_t byte) -> std::expected<PacketType, WireError>;

// ---------------------------------------------------------------------------
// body 인코딩/디코딩 (헤더 없음)
//   decode_body 는 body 전체를 정확히 소비해야 성공한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto encode_body(const Greeting& value)     -> std::vector<std::uint8_t>;
[[nodiscard]] auto encode_body(const Login& value)        -> std::vector<std::uint8_t>;
[[nodiscard]] auto encode_body(const Command& value)      -> std::vector<std::uint8_t>;
[[nodiscard]] auto encode_body(const ClientErrMsg& value) -> std::vector<std::uint8_t>;
[[nodiscard]] auto encode_body(const ResultSet& value)    -> std::vector<std::uint8_t>;

auto decode_body(std::span<const std::uint8_t> body, Greeting& out)
    -> std::expected<void, WireError>;
auto decode_body(std::span<const std::uint8_t> body, Login& out)
    -> std::expected<void, WireError>;
auto decode_body(std::span<const std::uint8_t> body, Command& out)
    -> std::expected<void, WireError>;
auto decode_body(std::span<const std::uint8_t> body, ClientErrMsg& out)
    -> std::expected<void, WireError>;
auto decode_body(std::span<const std::uint8_t> body, ResultSet& out)
    -> std::expected<void, WireError>;

// ---------------------------------------------------------------------------
// 헤더 처리
// ---------------------------------------------------------------------------
[[nodiscard]] auto encode_payload_header(std::size_t body_size) noexcept
    -> std::array<std::uint8_t, kPayloadHeaderSize>;

[[nodiscard]] auto decode_payload_header(std::span<const std::uint8_t, kPayloadHeaderSize> header) noexcept
    -> std::uint32_t;

// check_payload_length
//   수신한 body length 가 limit 을 넘으면 body 를 읽기 전에 kDecode 로 실패한다.
auto check_payload_length(std::uint32_t body_size, SizeLimit limit)
    -> std::expected<void, WireError>;

// check_encoded_size
//   송신할 body 가 limit 또는 4바이트 length 필드를 넘으면 kEncode.
auto check_encoded_size(std::size_t body_size, SizeLimit limit)
    -> std::expected<void, WireError>;

// ---------------------------------------------------------------------------
// encode_payload
//   [length][body] 를 만든다.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] auto encode_payload(const T& value, SizeLimit limit)
    -> std::expected<std::vector<std::uint8_t>, WireError>
{
    const auto body = encode_body(value);
    if (auto size_ok = check_encoded_size(body.size(), limit); !size_ok) {
        return std::unexpected(size_ok.error());
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(kPayloadHeaderSize + body.size());
    const auto header = encode_payload_header(body.size());
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

// ---------------------------------------------------------------------------
// decode_payload
//   헤더를 제외한 body 를 T 로 디코딩한다.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] auto decode_payload(std::span<const std::uint8_t> body)
    -> std::expected<T, WireError>
{
    T value{};
    if (auto decoded = decode_body(body, value); !decoded) {
        return std::unexpected(decoded.error());
    }
    return value;
}
