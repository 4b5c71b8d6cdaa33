#include "protocol/messages.hpp"

auto column_width(const Column& column) noexcept -> std::size_t
{
    switch (column.type) {
        case ColumnType::kInt:  return 8;
        case ColumnType::kBool: return 1;
        case ColumnType::kChar: return column.width;
    }
    return 0;
}

auto ResultSet::row_width() const noexcept -> std::size_t
{
    std::size_t width = 0;
    for (const auto& column : columns) {
        width += column_width(column);
    }
    return width;
}
