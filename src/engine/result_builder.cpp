#include "engine/result_builder.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>
#include <variant>

ResultSetBuilder::ResultSetBuilder(std::vector<Column> columns)
{
    result_.columns = std::move(columns);
}

auto ResultSetBuilder::add_row(const std::vector<Value>& row) -> std::expected<void, ClientErrMsg>
{
    if (row.size() != result_.columns.size()) {
        return std::unexpected(ClientErrMsg::make(
            ServerErrorCode::kExecutionError,
            fmt::format("row has {} values, expected {}", row.size(), result_.columns.size())
        ));
    }

    std::vector<std::uint8_t> encoded;
    encoded.reserve(result_.row_width());

    for (std::size_t i = 0; i < row.size(); ++i) {
        const Column& column = result_.columns[i];
        const Value&  value  = row[i];

        switch (column.type) {
            case ColumnType::kInt: {
                const auto* v = std::get_if<std::int64_t>(&value);
                if (v == nullptr) {
                    return std::unexpected(ClientErrMsg::make(
                        ServerErrorCode::kExecutionError,
                        fmt::format("column '{}' expects an integer", column.name)
                    ));
                }
                const auto raw = static_cast<std::uint64_t>(*v);
                for (unsigned shift = 0; shift < 64; shift += 8) {
                    encoded.push_back(static_cast<std::uint8_t>((raw >> shift) & 0xFFU));
                }
                break;
            }
            case ColumnType::kBool: {
                const auto* v = std::get_if<bool>(&value);
                if (v == nullptr) {
                    return std::unexpected(ClientErrMsg::make(
                        ServerErrorCode::kExecutionError,
                        fmt::format("column '{}' expects a boolean", column.name)
                    ));
                }
                encoded.push_back(*v ? 1 : 0);
                break;
            }
            case ColumnType::kChar: {
                const auto* v = std::get_if<std::string>(&value);
                if (v == nullptr || v->size() > column.width) {
                    return std::unexpected(ClientErrMsg::make(
                        ServerErrorCode::kExecutionError,
                        fmt::format("column '{}' expects text of at most {} bytes",
                                    column.name, column.width)
                    ));
                }
                encoded.insert(encoded.end(), v->begin(), v->end());
                encoded.resize(encoded.size() + (column.width - v->size()), 0);
                break;
            }
        }
    }

    result_.data.insert(result_.data.end(), encoded.begin(), encoded.end());
    ++rows_;
    return {};
}

auto ResultSetBuilder::row_count() const noexcept -> std::size_t
{
    return rows_;
}

auto ResultSetBuilder::build() && -> ResultSet
{
    return std::move(result_);
}
