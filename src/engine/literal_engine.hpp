#pragma once

// ---------------------------------------------------------------------------
// literal_engine.hpp
//
// 저장소 없이 동작하는 최소 QueryEngine.
//
//   지원 구문:
//     SELECT <literal> [AS <name>] [, <literal> [AS <name>] ...] [;]
//
//   literal:
//     정수      : -?[0-9]+ (int64 범위)          -> kInt
//     불리언    : TRUE | FALSE (대소문자 무관)    -> kBool
//     문자열    : '...' ('' 는 작은따옴표 하나)   -> kChar(바이트 길이, 최소 1)
//
//   결과는 항상 한 행이다. 컬럼 이름은 alias 가 없으면 리터럴 원문이다.
//
//   오류:
//     알려진 다른 구문 (CREATE, INSERT, ...)  -> kExecutionError "statement not supported"
//     그 외 해석할 수 없는 입력               -> kSyntaxError "syntax error"
// ---------------------------------------------------------------------------

#include "engine/query_engine.hpp"

#include <expected>
#include <string_view>

class LiteralQueryEngine final : public QueryEngine {
public:
    LiteralQueryEngine()           = default;
    ~LiteralQueryEngine() override = default;

    // 복사/이동 허용 (stateless)
    LiteralQueryEngine(const LiteralQueryEngine&)            = default;
    LiteralQueryEngine& operator=(const LiteralQueryEngine&) = default;
    LiteralQueryEngine(LiteralQueryEngine&&)                 = default;
    LiteralQueryEngine& operator=(LiteralQueryEngine&&)      = default;

    [[nodiscard]] auto execute(std::string_view sql, const SessionContext& ctx)
        -> std::expected<ResultSet, ClientErrMsg> override;
};
