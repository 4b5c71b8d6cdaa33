#include "protocol/dataset.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <utility>

DataSet::DataSet(std::vector<Column> columns, std::vector<std::vector<Value>> rows)
    : columns_{std::move(columns)}
    , rows_{std::move(rows)}
{}

auto DataSet::columns() const noexcept -> const std::vector<Column>&
{
    return columns_;
}

auto DataSet::rows() const noexcept -> const std::vector<std::vector<Value>>&
{
    return rows_;
}

auto DataSet::row_count() const noexcept -> std::size_t
{
    return rows_.size();
}

auto DataSet::column_count() const noexcept -> std::size_t
{
    return columns_.size();
}

auto DataSet::empty() const noexcept -> bool
{
    return rows_.empty();
}

auto DataSet::at(std::size_t row, std::size_t column) const -> const Value&
{
    return rows_.at(row).at(column);
}

auto DataSet::column_index(std::string_view name) const noexcept -> std::size_t
{
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) {
            return i;
        }
    }
    return columns_.size();
}

// ---------------------------------------------------------------------------
// preprocess
// ---------------------------------------------------------------------------
namespace {

auto read_cell(const Column& column, const std::uint8_t* cell)
    -> std::expected<Value, WireError>
{
    switch (column.type) {
        case ColumnType::kInt: {
            std::uint64_t raw = 0;
            for (unsigned i = 0; i < 8; ++i) {
                raw |= static_cast<std::uint64_t>(cell[i]) << (8U * i);
            }
            return Value{static_cast<std::int64_t>(raw)};
        }
        case ColumnType::kBool: {
            if (cell[0] > 1) {
                return std::unexpected(WireError{
                    WireErrorCode::kDecode,
                    "invalid bool cell",
                    fmt::format("column={}, value={}", column.name, cell[0])
                });
            }
            return Value{cell[0] == 1};
        }
        case ColumnType::kChar: {
            std::size_t len = 0;
            while (len < column.width && cell[len] != 0) {
                ++len;
            }
            return Value{std::string(reinterpret_cast<const char*>(cell), len)};
        }
    }
    return std::unexpected(WireError{
        WireErrorCode::kDecode,
        "unknown column type",
        column.name
    });
}

}  // namespace

auto preprocess(const ResultSet& rows) -> std::expected<DataSet, WireError>
{
    const std::size_t width = rows.row_width();

    if (width == 0) {
        if (!rows.data.empty()) {
            return std::unexpected(WireError{
                WireErrorCode::kDecode,
                "row data without columns",
                fmt::format("data_size={}", rows.data.size())
            });
        }
        return DataSet{rows.columns, {}};
    }

    if (rows.data.size() % width != 0) {
        return std::unexpected(WireError{
            WireErrorCode::kDecode,
            "row data is not a multiple of the row width",
            fmt::format("data_size={}, row_width={}", rows.data.size(), width)
        });
    }

    const std::size_t row_count = rows.data.size() / width;
    std::vector<std::vector<Value>> out;
    out.reserve(row_count);

    for (std::size_t r = 0; r < row_count; ++r) {
        const std::uint8_t* row = rows.data.data() + r * width;
        std::vector<Value> values;
        values.reserve(rows.columns.size());

        std::size_t offset = 0;
        for (const auto& column : rows.columns) {
            auto cell = read_cell(column, row + offset);
            if (!cell) {
                return std::unexpected(cell.error());
            }
            values.push_back(std::move(*cell));
            offset += column_width(column);
        }
        out.push_back(std::move(values));
    }

    return DataSet{rows.columns, std::move(out)};
}

auto to_display(const Value& value) -> std::string
{
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    return std::get<std::string>(value);
}
