#pragma once

#include "common/types.hpp"
#include "protocol/messages.hpp"

#include <expected>
#include <string_view>

// ---------------------------------------------------------------------------
// QueryEngine
//   Query 커맨드의 SQL 문자열을 실행해 ResultSet 을 만드는 외부 협력자.
//
//   실패는 ClientErrMsg 로 반환하며 세션이 그대로 Error 패킷으로 전달한다.
//   세션 코루틴들이 여러 워커 스레드에서 동시에 호출할 수 있으므로
//   구현체는 스레드 안전해야 한다.
// ---------------------------------------------------------------------------
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    [[nodiscard]] virtual auto execute(std::string_view sql, const SessionContext& ctx)
        -> std::expected<ResultSet, ClientErrMsg> = 0;
};
