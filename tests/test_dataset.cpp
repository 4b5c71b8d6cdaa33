// ---------------------------------------------------------------------------
// test_dataset.cpp
//
// preprocess(ResultSet) -> DataSet 단위 테스트.
//
// [테스트 범위]
// - Int / Bool / Char 셀 해석 (LE, 0/1, NUL 패딩 제거)
// - 여러 행, 빈 결과, 컬럼 없는 결과
// - 형식 오류: 행 폭 배수 불일치, 폭 0 인 데이터, Bool 값 2 이상
// - DataSet 접근자 (at, column_index)
// ---------------------------------------------------------------------------

#include "engine/result_builder.hpp"
#include "protocol/dataset.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

ResultSet make_rows(std::vector<Column> columns, const std::vector<std::vector<Value>>& rows)
{
    ResultSetBuilder builder{std::move(columns)};
    for (const auto& row : rows) {
        auto added = builder.add_row(row);
        EXPECT_TRUE(added.has_value()) << (added ? "" : added.error().msg);
    }
    return std::move(builder).build();
}

}  // namespace

// ---------------------------------------------------------------------------
// 셀 해석
// ---------------------------------------------------------------------------

TEST(Preprocess, SingleIntColumn) {
    ResultSet rs;
    rs.columns = {Column{"1", ColumnType::kInt, 0}};
    rs.data    = {1, 0, 0, 0, 0, 0, 0, 0};

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    ASSERT_EQ(ds->row_count(), 1u);
    ASSERT_EQ(ds->column_count(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(ds->at(0, 0)), 1);
}

TEST(Preprocess, NegativeAndExtremeIntegers) {
    const auto rs = make_rows(
        {Column{"a", ColumnType::kInt, 0}},
        {{Value{std::int64_t{-1}}},
         {Value{std::numeric_limits<std::int64_t>::min()}},
         {Value{std::numeric_limits<std::int64_t>::max()}}});

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    ASSERT_EQ(ds->row_count(), 3u);
    EXPECT_EQ(std::get<std::int64_t>(ds->at(0, 0)), -1);
    EXPECT_EQ(std::get<std::int64_t>(ds->at(1, 0)), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(std::get<std::int64_t>(ds->at(2, 0)), std::numeric_limits<std::int64_t>::max());
}

TEST(Preprocess, MixedColumnsAcrossRows) {
    const auto rs = make_rows(
        {Column{"id", ColumnType::kInt, 0},
         Column{"active", ColumnType::kBool, 0},
         Column{"name", ColumnType::kChar, 8}},
        {{Value{std::int64_t{1}}, Value{true},  Value{std::string{"alice"}}},
         {Value{std::int64_t{2}}, Value{false}, Value{std::string{"bob"}}}});

    EXPECT_EQ(rs.data.size(), 2u * (8 + 1 + 8));

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    ASSERT_EQ(ds->row_count(), 2u);

    EXPECT_EQ(std::get<std::int64_t>(ds->at(1, 0)), 2);
    EXPECT_TRUE(std::get<bool>(ds->at(0, 1)));
    EXPECT_FALSE(std::get<bool>(ds->at(1, 1)));
    EXPECT_EQ(std::get<std::string>(ds->at(0, 2)), "alice");
    EXPECT_EQ(std::get<std::string>(ds->at(1, 2)), "bob");
}

TEST(Preprocess, CharStopsAtFirstNul) {
    ResultSet rs;
    rs.columns = {Column{"c", ColumnType::kChar, 5}};
    rs.data    = {'a', 'b', 0, 'z', 0};

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(std::get<std::string>(ds->at(0, 0)), "ab");
}

TEST(Preprocess, CharFillingWholeWidthHasNoTerminator) {
    ResultSet rs;
    rs.columns = {Column{"c", ColumnType::kChar, 3}};
    rs.data    = {'x', 'y', 'z'};

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(std::get<std::string>(ds->at(0, 0)), "xyz");
}

TEST(Preprocess, NoRowsKeepsColumns) {
    ResultSet rs;
    rs.columns = {Column{"id", ColumnType::kInt, 0}};

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());
    EXPECT_TRUE(ds->empty());
    EXPECT_EQ(ds->column_count(), 1u);
}

TEST(Preprocess, NoColumnsNoData) {
    auto ds = preprocess(ResultSet{});
    ASSERT_TRUE(ds.has_value());
    EXPECT_TRUE(ds->empty());
    EXPECT_EQ(ds->column_count(), 0u);
}

// ---------------------------------------------------------------------------
// 형식 오류
// ---------------------------------------------------------------------------

TEST(Preprocess, PartialRowIsDecodeError) {
    ResultSet rs;
    rs.columns = {Column{"id", ColumnType::kInt, 0}};
    rs.data.assign(12, 0);

    auto ds = preprocess(rs);
    ASSERT_FALSE(ds.has_value());
    EXPECT_EQ(ds.error().code, WireErrorCode::kDecode);
}

TEST(Preprocess, DataWithoutWidthIsDecodeError) {
    ResultSet rs;
    rs.columns = {Column{"empty", ColumnType::kChar, 0}};
    rs.data    = {1};

    auto ds = preprocess(rs);
    ASSERT_FALSE(ds.has_value());
    EXPECT_EQ(ds.error().code, WireErrorCode::kDecode);
}

TEST(Preprocess, BoolOutOfRangeIsDecodeError) {
    ResultSet rs;
    rs.columns = {Column{"flag", ColumnType::kBool, 0}};
    rs.data    = {2};

    auto ds = preprocess(rs);
    ASSERT_FALSE(ds.has_value());
    EXPECT_EQ(ds.error().code, WireErrorCode::kDecode);
}

// ---------------------------------------------------------------------------
// 접근자
// ---------------------------------------------------------------------------

TEST(DataSetAccess, ColumnIndexAndBounds) {
    const auto rs = make_rows(
        {Column{"id", ColumnType::kInt, 0}, Column{"ok", ColumnType::kBool, 0}},
        {{Value{std::int64_t{7}}, Value{true}}});

    auto ds = preprocess(rs);
    ASSERT_TRUE(ds.has_value());

    EXPECT_EQ(ds->column_index("ok"), 1u);
    EXPECT_EQ(ds->column_index("missing"), ds->column_count());
    EXPECT_THROW((void)ds->at(1, 0), std::out_of_range);
    EXPECT_THROW((void)ds->at(0, 2), std::out_of_range);
}

TEST(DataSetAccess, DisplayText) {
    EXPECT_EQ(to_display(Value{std::int64_t{-5}}), "-5");
    EXPECT_EQ(to_display(Value{true}), "true");
    EXPECT_EQ(to_display(Value{false}), "false");
    EXPECT_EQ(to_display(Value{std::string{"abc"}}), "abc");
}
