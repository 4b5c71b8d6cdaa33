#pragma once

#include "common/types.hpp"
#include "protocol/codec.hpp"
#include "protocol/packet_type.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

// ---------------------------------------------------------------------------
// wire_io.hpp
//
// TCP 소켓 위에서 태그/페이로드를 주고받는 얇은 I/O 계층.
//
//   - 블로킹 버전 : 클라이언트(동기, 단일 스레드)가 사용한다.
//   - async_ 버전 : 서버 세션 코루틴이 사용한다.
//
// 오류 매핑:
//   태그를 읽기 전 소켓 오류/EOF          -> kIo
//   태그 이후 페이로드 도중의 EOF        -> kDecode (잘린 스트림)
//   페이로드 도중의 기타 소켓 오류       -> kIo
//   쓰기 실패                            -> kIo
//   인코딩 실패 / 크기 상한 초과(송신)   -> kEncode, 아무것도 쓰지 않는다
// ---------------------------------------------------------------------------

// encode_packet
//   [tag][length][body] 를 한 버퍼로 만든다.
template <typename T>
[[nodiscard]] auto encode_packet(PacketType tag, const T& payload, SizeLimit limit)
    -> std::expected<std::vector<std::uint8_t>, WireError>
{
    auto frame = encode_payload(payload, limit);
    if (!frame) {
        return std::unexpected(frame.error());
    }
    frame->insert(frame->begin(), encode_tag(tag));
    return std::move(*frame);
}

// ===========================================================================
// 블로킹 I/O
// ===========================================================================

auto write_bytes(boost::asio::ip::tcp::socket& sock, std::span<const std::uint8_t> bytes)
    -> std::expected<void, WireError>;

// 페이로드 없는 태그 하나를 보낸다.
auto write_tag(boost::asio::ip::tcp::socket& sock, PacketType tag)
    -> std::expected<void, WireError>;

// 태그와 페이로드를 한 번에 보낸다.
template <typename T>
auto write_packet(boost::asio::ip::tcp::socket& sock,
                  PacketType                    tag,
                  const T&                      payload,
                  SizeLimit                     limit) -> std::expected<void, WireError>
{
    auto bytes = encode_packet(tag, payload, limit);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return write_bytes(sock, *bytes);
}

auto read_tag(boost::asio::ip::tcp::socket& sock)
    -> std::expected<PacketType, WireError>;

// read_body
//   length 헤더를 읽고 limit 검사 후 body 를 읽는다.
auto read_body(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> std::expected<std::vector<std::uint8_t>, WireError>;

template <typename T>
auto read_payload(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> std::expected<T, WireError>
{
    auto body = read_body(sock, limit);
    if (!body) {
        return std::unexpected(body.error());
    }
    return decode_payload<T>(*body);
}

// ===========================================================================
// 코루틴 I/O
// ===========================================================================

auto async_write_bytes(boost::asio::ip::tcp::socket& sock, std::vector<std::uint8_t> bytes)
    -> boost::asio::awaitable<std::expected<void, WireError>>;

auto async_write_tag(boost::asio::ip::tcp::socket& sock, PacketType tag)
    -> boost::asio::awaitable<std::expected<void, WireError>>;

template <typename T>
auto async_write_packet(boost::asio::ip::tcp::socket& sock,
                        PacketType                    tag,
                        const T&                      payload,
                        SizeLimit                     limit)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    auto bytes = encode_packet(tag, payload, limit);
    if (!bytes) {
        co_return std::unexpected(bytes.error());
    }
    co_return co_await async_write_bytes(sock, std::move(*bytes));
}

auto async_read_tag(boost::asio::ip::tcp::socket& sock)
    -> boost::asio::awaitable<std::expected<PacketType, WireError>>;

auto async_read_body(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> boost::asio::awaitable<std::expected<std::vector<std::uint8_t>, WireError>>;

template <typename T>
auto async_read_payload(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> boost::asio::awaitable<std::expected<T, WireError>>
{
    auto body = co_await async_read_body(sock, limit);
    if (!body) {
        co_return std::unexpected(body.error());
    }
    co_return decode_payload<T>(*body);
}

// async_drain_payload
//   tag 가 가리키는 페이로드를 끝까지 읽어 버리고 형식을 확인한다. 페이로드가
//   없는 태그는 아무것도 읽지 않는다. 선언 길이가 limit 을 넘으면 body 를 읽지
//   않고 kDecode (이후 스트림 정렬은 보장되지 않는다).
//   서버는 클라이언트가 보낸 것을 kControlLimit 으로만 버린다.
auto async_drain_payload(boost::asio::ip::tcp::socket& sock, PacketType tag, SizeLimit limit)
    -> boost::asio::awaitable<std::expected<void, WireError>>;
