// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 UTC, 밀리초 (예: 2026-01-02T03:04:05.678Z)
// ---------------------------------------------------------------------------
std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;

    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    std::tm           utc{};
    gmtime_r(&secs, &utc);

    char date[32]{};
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03}Z", date, millis < 0 ? millis + 1000 : millis);
}

// 제어 문자 / 따옴표 / 역슬래시의 JSON 표기. 그대로 쓰면 되는 문자는 빈 view.
std::string_view json_escape_of(unsigned char ch) noexcept {
    switch (ch) {
        case '"':  return "\\\"";
        case '\\': return "\\\\";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        case '\b': return "\\b";
        case '\f': return "\\f";
        default:   return {};
    }
}

std::string escape_json_string(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (const unsigned char ch : text) {
        if (const auto esc = json_escape_of(ch); !esc.empty()) {
            out.append(esc);
        } else if (ch < 0x20) {
            out += fmt::format("\\u{:04x}", static_cast<unsigned>(ch));
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

auto parse_log_level(std::string_view text) -> std::optional<LogLevel>
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") { return LogLevel::kDebug; }
    if (lower == "info")  { return LogLevel::kInfo;  }
    if (lower == "warn")  { return LogLevel::kWarn;  }
    if (lower == "error") { return LogLevel::kError; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 로거 생성 (스레드 안전)
        logger_ = std::make_shared<spdlog::logger>("uosql-audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

auto StructuredLogger::enabled(LogLevel level) const noexcept -> bool {
    return logger_ != nullptr && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_connection: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_connection(const ConnectionLog& entry) {
    const bool     warn_event = entry.event == "rejected" || entry.event == "auth_denied";
    const LogLevel level      = warn_event ? LogLevel::kWarn : LogLevel::kInfo;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event) << R"(","session_id":)"
         << entry.session_id << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","client_port":)" << entry.client_port << R"(,"username":")"
         << escape_json_string(entry.username) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    if (warn_event) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_query: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_query(const QueryLog& entry) {
    const LogLevel level = entry.ok ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query","session_id":)" << entry.session_id << R"(,"username":")"
         << escape_json_string(entry.username) << R"(","client_ip":")"
         << escape_json_string(entry.client_ip) << R"(","sql":")"
         << escape_json_string(entry.sql) << R"(","ok":)" << (entry.ok ? "true" : "false")
         << R"(,"rows":)" << entry.rows
         << R"(,"error_code":)" << entry.error_code
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    if (entry.ok) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
