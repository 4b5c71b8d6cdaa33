// ---------------------------------------------------------------------------
// literal_engine.cpp
//
// SELECT 리터럴 목록 평가기.
// 첫 번째 키워드로 구문을 분류한 뒤, SELECT 이면 선택 목록을 문자 단위
// 상태 머신으로 토큰화한다.
// ---------------------------------------------------------------------------

#include "engine/literal_engine.hpp"
#include "engine/result_builder.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

constexpr std::string_view kSyntaxError = "syntax error";

// 문자열을 대문자로 변환한다 (ASCII only).
std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// 문자열의 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

// 첫 번째 공백-구분 토큰을 대문자로 반환한다.
std::string extract_first_keyword(std::string_view sql) {
    const auto space_pos = sql.find_first_of(" \t\r\n");
    return to_upper(sql.substr(0, space_pos));
}

// 이 엔진이 실행하지 않는 구문의 첫 키워드
bool is_unsupported_statement(const std::string& keyword) {
    static const std::unordered_set<std::string> kKeywords = {
        "CREATE", "DROP", "ALTER", "UPDATE", "INSERT", "DELETE",
    };
    return kKeywords.contains(keyword);
}

bool is_identifier_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

auto syntax_error(std::string_view detail) -> ClientErrMsg {
    spdlog::debug("[engine] syntax error: {}", detail);
    return ClientErrMsg::make(ServerErrorCode::kSyntaxError, std::string(kSyntaxError));
}

// ---------------------------------------------------------------------------
// SelectItem
//   선택 목록의 항목 하나.
// ---------------------------------------------------------------------------
struct SelectItem {
    Column column{};
    Value  value{};
};

// ---------------------------------------------------------------------------
// SelectListScanner
//   "SELECT" 이후 문자열을 SelectItem 목록으로 변환한다.
// ---------------------------------------------------------------------------
class SelectListScanner {
public:
    explicit SelectListScanner(std::string_view text) noexcept
        : text_{text}
    {}

    auto scan() -> std::expected<std::vector<SelectItem>, ClientErrMsg> {
        std::vector<SelectItem> items;

        while (true) {
            skip_space();
            auto item = scan_literal();
            if (!item) {
                return std::unexpected(item.error());
            }

            skip_space();
            if (auto alias = scan_alias(); alias) {
                if (alias->empty()) {
                    return std::unexpected(syntax_error("AS without a name"));
                }
                item->column.name = std::move(*alias);
            }
            items.push_back(std::move(*item));

            skip_space();
            if (at_end()) {
                break;
            }
            if (text_[pos_] != ',') {
                return std::unexpected(syntax_error(
                    fmt::format("unexpected '{}' at offset {}", text_[pos_], pos_)));
            }
            ++pos_;
        }
        return items;
    }

private:
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    void skip_space() noexcept {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    auto scan_literal() -> std::expected<SelectItem, ClientErrMsg> {
        if (at_end()) {
            return std::unexpected(syntax_error("missing literal"));
        }

        const char c = text_[pos_];
        if (c == '\'') {
            return scan_string();
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
            return scan_integer();
        }
        return scan_boolean();
    }

    // '' 이스케이프를 처리한다. 닫는 따옴표가 없으면 syntax error.
    // char 셀은 첫 NUL 에서 끝나므로 NUL 을 포함한 리터럴도 syntax error.
    auto scan_string() -> std::expected<SelectItem, ClientErrMsg> {
        const std::size_t start = pos_;
        ++pos_;  // 여는 따옴표

        std::string value;
        while (true) {
            if (at_end()) {
                return std::unexpected(syntax_error("unterminated string literal"));
            }
            const char ch = text_[pos_++];
            if (ch == '\'') {
                if (!at_end() && text_[pos_] == '\'') {
                    value.push_back('\'');
                    ++pos_;
                    continue;
                }
                break;
            }
            if (ch == '\0') {
                return std::unexpected(syntax_error("NUL in string literal"));
            }
            value.push_back(ch);
        }

        const auto width = static_cast<std::uint32_t>(std::max<std::size_t>(value.size(), 1));
        return SelectItem{
            Column{std::string(text_.substr(start, pos_ - start)), ColumnType::kChar, width},
            Value{std::move(value)}
        };
    }

    auto scan_integer() -> std::expected<SelectItem, ClientErrMsg> {
        const std::size_t start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        while (!at_end() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
        if (!at_end() && is_identifier_char(text_[pos_])) {
            return std::unexpected(syntax_error("malformed number"));
        }

        const std::string_view digits = text_.substr(start, pos_ - start);
        std::int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return std::unexpected(syntax_error(fmt::format("invalid integer '{}'", digits)));
        }

        return SelectItem{
            Column{std::string(digits), ColumnType::kInt, 0},
            Value{value}
        };
    }

    auto scan_boolean() -> std::expected<SelectItem, ClientErrMsg> {
        const std::string_view word = scan_word();
        const std::string upper = to_upper(word);
        if (upper != "TRUE" && upper != "FALSE") {
            return std::unexpected(syntax_error(fmt::format("unknown literal '{}'", word)));
        }
        return SelectItem{
            Column{std::string(word), ColumnType::kBool, 0},
            Value{upper == "TRUE"}
        };
    }

    // AS <name> 이 있으면 name (없으면 빈 문자열), AS 가 아니면 nullopt
    auto scan_alias() -> std::optional<std::string> {
        const std::size_t saved = pos_;
        if (to_upper(scan_word()) != "AS") {
            pos_ = saved;
            return std::nullopt;
        }
        skip_space();
        return std::string(scan_word());
    }

    auto scan_word() noexcept -> std::string_view {
        const std::size_t start = pos_;
        while (!at_end() && is_identifier_char(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string_view text_;
    std::size_t      pos_{0};
};

// 끝의 ';' 하나만 제거한다. 나머지 ';' 는 선택 목록 스캔에서 syntax error 가 된다.
std::string_view strip_terminator(std::string_view sql) {
    if (!sql.empty() && sql.back() == ';') {
        return trim(sql.substr(0, sql.size() - 1));
    }
    return sql;
}

}  // namespace

// ---------------------------------------------------------------------------
// LiteralQueryEngine::execute
// ---------------------------------------------------------------------------
auto LiteralQueryEngine::execute(std::string_view sql, const SessionContext& ctx)
    -> std::expected<ResultSet, ClientErrMsg>
{
    // 1. 빈 입력 / 종결자 처리
    const auto statement = strip_terminator(trim(sql));
    if (statement.empty()) {
        return std::unexpected(syntax_error("empty statement"));
    }

    // 2. 첫 번째 키워드로 분류
    const std::string keyword = extract_first_keyword(statement);
    if (is_unsupported_statement(keyword)) {
        spdlog::debug("[engine] session {} unsupported statement: {}", ctx.session_id, keyword);
        return std::unexpected(ClientErrMsg::make(
            ServerErrorCode::kExecutionError,
            fmt::format("statement not supported: {}", keyword)
        ));
    }
    if (keyword != "SELECT") {
        return std::unexpected(syntax_error(fmt::format("unknown statement '{}'", keyword)));
    }

    // 3. 선택 목록 토큰화
    SelectListScanner scanner{statement.substr(keyword.size())};
    auto items = scanner.scan();
    if (!items) {
        return std::unexpected(items.error());
    }

    // 4. 한 행짜리 ResultSet 구성
    std::vector<Column> columns;
    std::vector<Value>  row;
    columns.reserve(items->size());
    row.reserve(items->size());
    for (auto& item : *items) {
        columns.push_back(std::move(item.column));
        row.push_back(std::move(item.value));
    }

    ResultSetBuilder builder{std::move(columns)};
    if (auto added = builder.add_row(row); !added) {
        return std::unexpected(added.error());
    }
    return std::move(builder).build();
}
