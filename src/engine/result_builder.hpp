#pragma once

#include "protocol/dataset.hpp"
#include "protocol/messages.hpp"

#include <cstdint>
#include <expected>
#include <vector>

// ---------------------------------------------------------------------------
// ResultSetBuilder
//   엔진이 행 단위로 값을 넣어 ResultSet 의 고정 폭 data 를 만든다.
//   preprocess() 의 역방향이다.
//
//   사용 예:
//     ResultSetBuilder builder{{Column{"id", ColumnType::kInt, 0}}};
//     builder.add_row({Value{std::int64_t{1}}});
//     ResultSet rows = std::move(builder).build();
// ---------------------------------------------------------------------------
class ResultSetBuilder {
public:
    explicit ResultSetBuilder(std::vector<Column> columns);

    // add_row
    //   값 개수, 타입, kChar 폭이 컬럼 정의와 맞지 않으면 kExecutionError.
    //   실패한 행은 추가되지 않는다.
    auto add_row(const std::vector<Value>& row) -> std::expected<void, ClientErrMsg>;

    [[nodiscard]] auto row_count() const noexcept -> std::size_t;

    [[nodiscard]] auto build() && -> ResultSet;

private:
    ResultSet   result_{};
    std::size_t rows_{0};
};
