#include "protocol/wire_io.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <type_traits>

// ---------------------------------------------------------------------------
// wire_io - 구현
// ---------------------------------------------------------------------------

namespace {

auto io_error(std::string message, const boost::system::error_code& ec) -> WireError
{
    return WireError{WireErrorCode::kIo, std::move(message), ec.message()};
}

// 페이로드 도중 EOF 는 잘린 스트림(kDecode), 그 외는 전송 오류(kIo)
auto payload_read_error(const boost::system::error_code& ec) -> WireError
{
    if (ec == boost::asio::error::eof) {
        return WireError{WireErrorCode::kDecode, "truncated payload", ec.message()};
    }
    return io_error("failed to read payload", ec);
}

// 버려지는 페이로드도 태그가 약속한 타입으로 디코딩해 형식을 확인한다.
auto validate_payload(PacketType tag, std::span<const std::uint8_t> body)
    -> std::expected<void, WireError>
{
    return visit_payload(tag, [body]<typename P>(std::type_identity<P>)
        -> std::expected<void, WireError>
    {
        if constexpr (std::is_same_v<P, NoPayload>) {
            return {};
        } else {
            auto decoded = decode_payload<P>(body);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return {};
        }
    });
}

}  // namespace

// ===========================================================================
// 블로킹 I/O
// ===========================================================================

auto write_bytes(boost::asio::ip::tcp::socket& sock, std::span<const std::uint8_t> bytes)
    -> std::expected<void, WireError>
{
    boost::system::error_code ec;
    boost::asio::write(sock, boost::asio::buffer(bytes.data(), bytes.size()), ec);
    if (ec) {
        return std::unexpected(io_error("failed to write packet", ec));
    }
    return {};
}

auto write_tag(boost::asio::ip::tcp::socket& sock, PacketType tag)
    -> std::expected<void, WireError>
{
    const std::array<std::uint8_t, 1> byte{encode_tag(tag)};
    return write_bytes(sock, byte);
}

auto read_tag(boost::asio::ip::tcp::socket& sock)
    -> std::expected<PacketType, WireError>
{
    std::array<std::uint8_t, 1> byte{};
    boost::system::error_code ec;
    boost::asio::read(sock, boost::asio::buffer(byte), ec);
    if (ec) {
        return std::unexpected(io_error("failed to read packet tag", ec));
    }
    return decode_tag(byte[0]);
}

auto read_body(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> std::expected<std::vector<std::uint8_t>, WireError>
{
    std::array<std::uint8_t, kPayloadHeaderSize> header{};
    boost::system::error_code ec;
    boost::asio::read(sock, boost::asio::buffer(header), ec);
    if (ec) {
        return std::unexpected(payload_read_error(ec));
    }

    const std::uint32_t body_len = decode_payload_header(header);
    if (auto ok = check_payload_length(body_len, limit); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<std::uint8_t> body(body_len);
    if (body_len > 0) {
        boost::asio::read(sock, boost::asio::buffer(body), ec);
        if (ec) {
            return std::unexpected(payload_read_error(ec));
        }
    }
    return body;
}

// ===========================================================================
// 코루틴 I/O
// ===========================================================================

auto async_write_bytes(boost::asio::ip::tcp::socket& sock, std::vector<std::uint8_t> bytes)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    boost::system::error_code ec;
    co_await boost::asio::async_write(
        sock,
        boost::asio::buffer(bytes),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(io_error("failed to write packet", ec));
    }
    co_return std::expected<void, WireError>{};
}

auto async_write_tag(boost::asio::ip::tcp::socket& sock, PacketType tag)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    std::vector<std::uint8_t> bytes{encode_tag(tag)};
    co_return co_await async_write_bytes(sock, std::move(bytes));
}

auto async_read_tag(boost::asio::ip::tcp::socket& sock)
    -> boost::asio::awaitable<std::expected<PacketType, WireError>>
{
    std::array<std::uint8_t, 1> byte{};
    boost::system::error_code ec;
    co_await boost::asio::async_read(
        sock,
        boost::asio::buffer(byte),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(io_error("failed to read packet tag", ec));
    }
    co_return decode_tag(byte[0]);
}

auto async_read_body(boost::asio::ip::tcp::socket& sock, SizeLimit limit)
    -> boost::asio::awaitable<std::expected<std::vector<std::uint8_t>, WireError>>
{
    std::array<std::uint8_t, kPayloadHeaderSize> header{};
    boost::system::error_code ec;
    co_await boost::asio::async_read(
        sock,
        boost::asio::buffer(header),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(payload_read_error(ec));
    }

    const std::uint32_t body_len = decode_payload_header(header);
    if (auto ok = check_payload_length(body_len, limit); !ok) {
        co_return std::unexpected(ok.error());
    }

    std::vector<std::uint8_t> body(body_len);
    if (body_len > 0) {
        co_await boost::asio::async_read(
            sock,
            boost::asio::buffer(body),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );
        if (ec) {
            co_return std::unexpected(payload_read_error(ec));
        }
    }
    co_return body;
}

auto async_drain_payload(boost::asio::ip::tcp::socket& sock, PacketType tag, SizeLimit limit)
    -> boost::asio::awaitable<std::expected<void, WireError>>
{
    if (!has_payload(tag)) {
        co_return std::expected<void, WireError>{};
    }
    auto body = co_await async_read_body(sock, limit);
    if (!body) {
        co_return std::unexpected(body.error());
    }
    co_return validate_payload(tag, *body);
}
