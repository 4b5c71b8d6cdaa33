#pragma once

// ---------------------------------------------------------------------------
// server_config.hpp
//
// 서버 설정 값과 YAML 로더.
//
// [우선순위]
//   구조체 기본값 < YAML 파일 < 환경변수 (apply_env_overrides)
//
// [보안 고려사항]
// - users 의 비밀번호는 평문이다. 파싱 실패 원인은 로깅하되 YAML 파일
//   내용이나 비밀번호를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

// ---------------------------------------------------------------------------
// ServerConfig
//
//   listen_address   : 바인딩할 IPv4 주소
//   listen_port      : 리슨 포트 (0 이면 OS 가 임의 포트를 할당)
//   greeting         : Greeting.message 로 보낼 문자열
//   worker_threads   : io_context 를 구동하는 스레드 수 (1 이상)
//   max_connections  : 동시 허용 최대 세션 수 (0 = 무제한)
//   idle_timeout_sec : 세션 유휴 타임아웃 (0 = 비활성)
//   log_path         : 감사 로그 파일 경로
//   log_level        : "debug" | "info" | "warn" | "error"
//   users            : 사용자 이름 → 비밀번호
// ---------------------------------------------------------------------------
struct ServerConfig {
    std::string   listen_address{"127.0.0.1"};
    std::uint16_t listen_port{4242};

    std::string   greeting{"Welcome to uosql"};

    std::uint32_t worker_threads{1};
    std::uint32_t max_connections{1000};
    std::uint32_t idle_timeout_sec{300};

    std::string   log_path{"/tmp/uosql/audit.log"};
    std::string   log_level{"info"};

    std::unordered_map<std::string, std::string> users{};
};

// ---------------------------------------------------------------------------
// ConfigLoader
//   load()  : 파일을 읽어 파싱한다. 파일 없음/파싱 오류/잘못된 값은 실패.
//   parse() : YAML 문자열을 파싱한다 (테스트 및 load 내부에서 사용).
//
//   누락된 키는 ServerConfig 기본값을 유지한다. 부분적으로 파싱된 설정을
//   반환하지 않는다.
//
//   YAML 스키마:
//     listen:
//       address: "127.0.0.1"
//       port: 4242
//     greeting: "Welcome to uosql"
//     worker_threads: 2
//     max_connections: 1000
//     idle_timeout: "300s"
//     log:
//       path: "/var/log/uosql/audit.log"
//       level: "info"
//     users:
//       - name: alice
//         password: pw
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    [[nodiscard]] static std::expected<ServerConfig, std::string>
    load(const std::filesystem::path& config_path);

    [[nodiscard]] static std::expected<ServerConfig, std::string>
    parse(std::string_view yaml_text);
};

// validate
//   값 범위와 조합을 검사한다. load/parse 가 마지막에 호출하며, 환경변수를
//   적용한 뒤 호출자가 다시 호출할 수 있다.
[[nodiscard]] auto validate(const ServerConfig& config) -> std::expected<void, std::string>;

// apply_env_overrides
//   UOSQL_LISTEN_ADDR, UOSQL_LISTEN_PORT, UOSQL_LOG_LEVEL, UOSQL_LOG_PATH,
//   UOSQL_MAX_CONNECTIONS 가 설정되어 있으면 덮어쓴다.
//   잘못된 값은 경고 로그 후 무시한다.
void apply_env_overrides(ServerConfig& config);
