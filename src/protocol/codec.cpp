#include "protocol/codec.hpp"

#include <spdlog/fmt/fmt.h>

#include <limits>
#include <string>

// ---------------------------------------------------------------------------
// codec - 구현
//
// ByteWriter 는 body 를 만들고, ByteReader 는 body 를 경계 검사와 함께
// 읽는다. 모든 디코딩 실패는 WireErrorCode::kDecode 로 수렴한다.
// ---------------------------------------------------------------------------

namespace {

class ByteWriter {
public:
    void put_u8(std::uint8_t v) { bytes_.push_back(v); }

    void put_u16(std::uint16_t v)
    {
        bytes_.push_back(static_cast<std::uint8_t>(v & 0xFFU));
        bytes_.push_back(static_cast<std::uint8_t>((v >> 8U) & 0xFFU));
    }

    void put_u32(std::uint32_t v)
    {
        for (unsigned shift = 0; shift < 32; shift += 8) {
            bytes_.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFU));
        }
    }

    void put_text(std::string_view text)
    {
        put_u32(static_cast<std::uint32_t>(text.size()));
        bytes_.insert(bytes_.end(), text.begin(), text.end());
    }

    void put_bytes(std::span<const std::uint8_t> data)
    {
        put_u32(static_cast<std::uint32_t>(data.size()));
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    [[nodiscard]] auto take() -> std::vector<std::uint8_t> { return std::move(bytes_); }

private:
    std::vector<std::uint8_t> bytes_{};
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) noexcept
        : data_{data}
    {}

    auto get_u8(std::uint8_t& out) -> std::expected<void, WireError>
    {
        if (auto ok = require(1, "u8"); !ok) {
            return ok;
        }
        out = data_[pos_++];
        return {};
    }

    auto get_u16(std::uint16_t& out) -> std::expected<void, WireError>
    {
        if (auto ok = require(2, "u16"); !ok) {
            return ok;
        }
        out = static_cast<std::uint16_t>(
            static_cast<unsigned>(data_[pos_])
            | (static_cast<unsigned>(data_[pos_ + 1]) << 8U));
        pos_ += 2;
        return {};
    }

    auto get_u32(std::uint32_t& out) -> std::expected<void, WireError>
    {
        if (auto ok = require(4, "u32"); !ok) {
            return ok;
        }
        out = static_cast<std::uint32_t>(data_[pos_])
            | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8U)
            | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16U)
            | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24U);
        pos_ += 4;
        return {};
    }

    auto get_text(std::string& out) -> std::expected<void, WireError>
    {
        std::uint32_t len = 0;
        if (auto ok = get_u32(len); !ok) {
            return ok;
        }
        if (auto ok = require(len, "text"); !ok) {
            return ok;
        }
        out.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return {};
    }

    auto get_bytes(std::vector<std::uint8_t>& out) -> std::expected<void, WireError>
    {
        std::uint32_t len = 0;
        if (auto ok = get_u32(len); !ok) {
            return ok;
        }
        if (auto ok = require(len, "bytes"); !ok) {
            return ok;
        }
        out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return {};
    }

    // body 를 전부 소비했는지 확인한다. 남은 바이트는 형식 오류로 본다.
    auto finish(std::string_view what) const -> std::expected<void, WireError>
    {
        if (pos_ != data_.size()) {
            return std::unexpected(WireError{
                WireErrorCode::kDecode,
                fmt::format("trailing bytes after {}", what),
                fmt::format("consumed={}, size={}", pos_, data_.size())
            });
        }
        return {};
    }

private:
    auto require(std::size_t n, std::string_view what) const -> std::expected<void, WireError>
    {
        if (n > data_.size() - pos_) {
            return std::unexpected(WireError{
                WireErrorCode::kDecode,
                fmt::format("truncated {}", what),
                fmt::format("need={}, remaining={}", n, data_.size() - pos_)
            });
        }
        return {};
    }

    std::span<const std::uint8_t> data_;
    std::size_t                   pos_{0};
};

auto invalid_value(std::string_view field, unsigned value) -> WireError
{
    return WireError{
        WireErrorCode::kDecode,
        fmt::format("invalid {} value", field),
        fmt::format("value={}", value)
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// 태그
// ---------------------------------------------------------------------------
auto encode_tag(PacketType tag) noexcept -> std::uint8_t
{
    return static_cast<std::uint8_t>(tag);
}

auto decode_tag(std::uint8_t byte) -> std::expected<PacketType, WireError>
{
    if (byte > kMaxPacketTag) {
        return std::unexpected(invalid_value("packet tag", byte));
    }
    return static_cast<PacketType>(byte);
}

// ---------------------------------------------------------------------------
// encode_body
// ---------------------------------------------------------------------------
auto encode_body(const Greeting& value) -> std::vector<std::uint8_t>
{
    ByteWriter w;
    w.put_u8(value.protocol_version);
    w.put_text(value.message);
    return w.take();
}

auto encode_body(const Login& value) -> std::vector<std::uint8_t>
{
    ByteWriter w;
    w.put_text(value.username);
    w.put_text(value.password);
    return w.take();
}

auto encode_body(const Command& value) -> std::vector<std::uint8_t>
{
    ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(value.type));
    if (value.type == CommandType::kQuery) {
        w.put_text(value.query);
    }
    return w.take();
}

auto encode_body(const ClientErrMsg& value) -> std::vector<std::uint8_t>
{
    ByteWriter w;
    w.put_u16(value.code);
    w.put_text(value.msg);
    return w.take();
}

auto encode_body(const ResultSet& value) -> std::vector<std::uint8_t>
{
    ByteWriter w;
    w.put_u32(static_cast<std::uint32_t>(value.columns.size()));
    for (const auto& column : value.columns) {
        w.put_text(column.name);
        w.put_u8(static_cast<std::uint8_t>(column.type));
        w.put_u32(column.width);
    }
    w.put_bytes(value.data);
    return w.take();
}

// ---------------------------------------------------------------------------
// decode_body
// ---------------------------------------------------------------------------
auto decode_body(std::span<const std::uint8_t> body, Greeting& out)
    -> std::expected<void, WireError>
{
    ByteReader r{body};
    if (auto ok = r.get_u8(out.protocol_version); !ok) { return ok; }
    if (auto ok = r.get_text(out.message); !ok)         { return ok; }
    return r.finish("greeting");
}

auto decode_body(std::span<const std::uint8_t> body, Login& out)
    -> std::expected<void, WireError>
{
    ByteReader r{body};
    if (auto ok = r.get_text(out.username); !ok) { return ok; }
    if (auto ok = r.get_text(out.password); !ok) { return ok; }
    return r.finish("login");
}

auto decode_body(std::span<const std::uint8_t> body, Command& out)
    -> std::expected<void, WireError>
{
    ByteReader r{body};
    std::uint8_t kind = 0;
    if (auto ok = r.get_u8(kind); !ok) {
        return ok;
    }

    switch (kind) {
        case static_cast<std::uint8_t>(CommandType::kPing):
            out = Command::ping();
            break;
        case static_cast<std::uint8_t>(CommandType::kQuit):
            out = Command::quit();
            break;
        case static_cast<std::uint8_t>(CommandType::kQuery): {
            std::string sql;
            if (auto ok = r.get_text(sql); !ok) {
                return ok;
            }
            out = Command::make_query(std::move(sql));
            break;
        }
        default:
            return std::unexpected(invalid_value("command kind", kind));
    }
    return r.finish("command");
}

auto decode_body(std::span<const std::uint8_t> body, ClientErrMsg& out)
    -> std::expected<void, WireError>
{
    ByteReader r{body};
    if (auto ok = r.get_u16(out.code); !ok) { return ok; }
    if (auto ok = r.get_text(out.msg); !ok)  { return ok; }
    return r.finish("error message");
}

auto decode_body(std::span<const std::uint8_t> body, ResultSet& out)
    -> std::expected<void, WireError>
{
    ByteReader r{body};
    std::uint32_t column_count = 0;
    if (auto ok = r.get_u32(column_count); !ok) {
        return ok;
    }

    // 컬럼 하나는 최소 9바이트(빈 이름 4 + type 1 + width 4)를 차지한다.
    // 선언된 개수가 남은 body 로 표현될 수 없으면 할당 전에 거부한다.
    if (static_cast<std::size_t>(column_count) * 9U > body.size()) {
        return std::unexpected(WireError{
            WireErrorCode::kDecode,
            "column count exceeds payload",
            fmt::format("columns={}, body_size={}", column_count, body.size())
        });
    }

    out.columns.clear();
    out.columns.reserve(column_count);
    for (std::uint32_t i = 0; i < column_count; ++i) {
        Column column;
        std::uint8_t type = 0;
        if (auto ok = r.get_text(column.name); !ok) { return ok; }
        if (auto ok = r.get_u8(type); !ok)          { return ok; }
        if (auto ok = r.get_u32(column.width); !ok) { return ok; }
        if (type > static_cast<std::uint8_t>(ColumnType::kChar)) {
            return std::unexpected(invalid_value("column type", type));
        }
        column.type = static_cast<ColumnType>(type);
        out.columns.push_back(std::move(column));
    }

    if (auto ok = r.get_bytes(out.data); !ok) {
        return ok;
    }
    return r.finish("result set");
}

// ---------------------------------------------------------------------------
// 헤더
// ---------------------------------------------------------------------------
auto encode_payload_header(std::size_t body_size) noexcept
    -> std::array<std::uint8_t, kPayloadHeaderSize>
{
    const auto len = static_cast<std::uint32_t>(body_size);
    return {
        static_cast<std::uint8_t>(len & 0xFFU),
        static_cast<std::uint8_t>((len >> 8U) & 0xFFU),
        static_cast<std::uint8_t>((len >> 16U) & 0xFFU),
        static_cast<std::uint8_t>((len >> 24U) & 0xFFU),
    };
}

auto decode_payload_header(std::span<const std::uint8_t, kPayloadHeaderSize> header) noexcept
    -> std::uint32_t
{
    return static_cast<std::uint32_t>(header[0])
        | (static_cast<std::uint32_t>(header[1]) << 8U)
        | (static_cast<std::uint32_t>(header[2]) << 16U)
        | (static_cast<std::uint32_t>(header[3]) << 24U);
}

auto check_payload_length(std::uint32_t body_size, SizeLimit limit)
    -> std::expected<void, WireError>
{
    if (!limit.allows(body_size)) {
        return std::unexpected(WireError{
            WireErrorCode::kDecode,
            "payload exceeds size limit",
            fmt::format("size={}, limit={}", body_size, limit.max_bytes.value_or(0))
        });
    }
    return {};
}

auto check_encoded_size(std::size_t body_size, SizeLimit limit)
    -> std::expected<void, WireError>
{
    if (!limit.allows(body_size)) {
        return std::unexpected(WireError{
            WireErrorCode::kEncode,
            "payload exceeds size limit",
            fmt::format("size={}, limit={}", body_size, limit.max_bytes.value_or(0))
        });
    }
    if (body_size > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(WireError{
            WireErrorCode::kEncode,
            "payload exceeds 32-bit length field",
            fmt::format("size={}", body_size)
        });
    }
    return {};
}
