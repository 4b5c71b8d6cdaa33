#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 전역 레지스트리에 등록하지 않는다. 같은 프로세스에서 여러 인스턴스
//   (서버 여러 개, 테스트 픽스처)가 공존할 수 있다.
// - 프로세스 진단 로그는 spdlog 기본 로거를 쓰고, 이 로거는 감사 이벤트만
//   JSON 한 줄로 기록한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

// parse_log_level
//   "debug" | "info" | "warn" | "error" (대소문자 무관). 그 외는 nullopt.
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<LogLevel>;

// ---------------------------------------------------------------------------
// StructuredLogger
//   ConnectionLog / QueryLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   to_stdout : true 이면 stdout 에도 같은 줄을 쓴다.
    //
    //   파일을 열 수 없으면 std::runtime_error
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path,
                              bool                         to_stdout = false);

    ~StructuredLogger();

    // 복사/이동 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_connection
    //   연결 이벤트를 JSON 으로 기록한다. "rejected" / "auth_denied" 는 warn,
    //   나머지는 info 레벨이다.
    void log_connection(const ConnectionLog& entry);

    // log_query
    //   쿼리 실행 결과를 JSON 으로 기록한다. 실패한 쿼리는 warn 레벨이다.
    //   [고빈도 호출 경로] 불필요한 문자열 복사를 최소화할 것.
    void log_query(const QueryLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 버퍼에 남은 로그를 즉시 기록한다.
    void flush();

private:
    [[nodiscard]] auto enabled(LogLevel level) const noexcept -> bool;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_{};
};
