#pragma once

#include "common/types.hpp"
#include "protocol/messages.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// Value
//   DataSet 셀 하나. 컬럼 타입과 1:1 로 대응한다.
//     kInt  -> std::int64_t
//     kBool -> bool
//     kChar -> std::string (뒤쪽 NUL 패딩 제거)
// ---------------------------------------------------------------------------
using Value = std::variant<std::int64_t, bool, std::string>;

// ---------------------------------------------------------------------------
// DataSet
//   클라이언트가 ResultSet 을 행/열 단위로 재구성한 결과.
// ---------------------------------------------------------------------------
class DataSet {
public:
    DataSet() = default;
    DataSet(std::vector<Column> columns, std::vector<std::vector<Value>> rows);

    [[nodiscard]] auto columns()      const noexcept -> const std::vector<Column>&;
    [[nodiscard]] auto rows()         const noexcept -> const std::vector<std::vector<Value>>&;
    [[nodiscard]] auto row_count()    const noexcept -> std::size_t;
    [[nodiscard]] auto column_count() const noexcept -> std::size_t;
    [[nodiscard]] auto empty()        const noexcept -> bool;

    // at
    //   범위를 벗어나면 std::out_of_range
    [[nodiscard]] auto at(std::size_t row, std::size_t column) const -> const Value&;

    // 컬럼 이름으로 인덱스를 찾는다. 없으면 column_count() 를 반환한다.
    [[nodiscard]] auto column_index(std::string_view name) const noexcept -> std::size_t;

private:
    std::vector<Column>             columns_{};
    std::vector<std::vector<Value>> rows_{};
};

// ---------------------------------------------------------------------------
// preprocess
//   ResultSet -> DataSet 변환.
//
//   실패 조건 (모두 kDecode):
//     - data 길이가 행 폭의 배수가 아님
//     - 폭이 0 인 행에 데이터가 있음
//     - kBool 셀 값이 0/1 이 아님
// ---------------------------------------------------------------------------
auto preprocess(const ResultSet& rows) -> std::expected<DataSet, WireError>;

// 셀 값을 사람이 읽을 문자열로 바꾼다 (CLI 출력용).
[[nodiscard]] auto to_display(const Value& value) -> std::string;
