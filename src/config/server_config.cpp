// ---------------------------------------------------------------------------
// server_config.cpp
//
// YAML 설정 파일을 ServerConfig 로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 타입이 맞지 않는 값은 기본값으로 대체하지 않고 실패시킨다. 잘못 적은
//   포트로 조용히 기본 포트에 바인딩하는 일을 막기 위함이다.
// ---------------------------------------------------------------------------

#include "config/server_config.hpp"

#include "logger/structured_logger.hpp"
#include "protocol/codec.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cstdlib>
#include <limits>

namespace {

constexpr std::uint32_t kMaxWorkerThreads = 256;

// ---------------------------------------------------------------------------
// 내부 헬퍼: "300s" / "300" → 300. 단위는 "s" 만 허용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::uint32_t, std::string>
parse_seconds(const std::string& raw, std::string_view key) {
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::uint32_t value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || (ptr != end && std::string_view(ptr, end) != "s")) {
        return std::unexpected(fmt::format("{}: cannot parse duration '{}'", key, raw));
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 스칼라 값을 읽는다.
// 노드가 없으면 fallback, 타입이 맞지 않으면 실패.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] std::expected<T, std::string>
read_scalar(const YAML::Node& node, const T& fallback, std::string_view key) {
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("{}: expected a scalar value", key));
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("{}: {}", key, e.what()));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: users 시퀀스 파싱
//   - name 은 필수, password 는 없으면 빈 문자열
//   - 같은 이름이 두 번 나오면 실패
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::unordered_map<std::string, std::string>, std::string>
parse_users(const YAML::Node& users_node) {
    std::unordered_map<std::string, std::string> users;
    if (!users_node || users_node.IsNull()) {
        return users;
    }
    if (!users_node.IsSequence()) {
        return std::unexpected(std::string("users: expected a sequence"));
    }

    for (std::size_t i = 0; i < users_node.size(); ++i) {
        const YAML::Node entry = users_node[i];
        if (!entry.IsMap()) {
            return std::unexpected(fmt::format("users[{}]: expected a map", i));
        }

        auto name = read_scalar<std::string>(entry["name"], "", "users.name");
        if (!name) {
            return std::unexpected(name.error());
        }
        if (name->empty()) {
            return std::unexpected(fmt::format("users[{}]: name is required", i));
        }

        auto password = read_scalar<std::string>(entry["password"], "", "users.password");
        if (!password) {
            return std::unexpected(password.error());
        }

        if (!users.emplace(*name, std::move(*password)).second) {
            return std::unexpected(fmt::format("users[{}]: duplicate user '{}'", i, *name));
        }
    }
    return users;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 루트 노드 → ServerConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ServerConfig, std::string> parse_root(const YAML::Node& root) {
    ServerConfig cfg{};

    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string("config root must be a map"));
    }

    // listen
    if (const YAML::Node listen = root["listen"]; listen) {
        if (!listen.IsMap()) {
            return std::unexpected(std::string("listen: expected a map"));
        }
        auto address = read_scalar<std::string>(listen["address"], cfg.listen_address, "listen.address");
        if (!address) {
            return std::unexpected(address.error());
        }
        cfg.listen_address = std::move(*address);

        auto port = read_scalar<std::uint32_t>(listen["port"], cfg.listen_port, "listen.port");
        if (!port) {
            return std::unexpected(port.error());
        }
        if (*port > std::numeric_limits<std::uint16_t>::max()) {
            return std::unexpected(fmt::format("listen.port: {} is out of range", *port));
        }
        cfg.listen_port = static_cast<std::uint16_t>(*port);
    }

    auto greeting = read_scalar<std::string>(root["greeting"], cfg.greeting, "greeting");
    if (!greeting) {
        return std::unexpected(greeting.error());
    }
    cfg.greeting = std::move(*greeting);

    auto workers = read_scalar<std::uint32_t>(root["worker_threads"], cfg.worker_threads, "worker_threads");
    if (!workers) {
        return std::unexpected(workers.error());
    }
    cfg.worker_threads = *workers;

    auto max_conn = read_scalar<std::uint32_t>(root["max_connections"], cfg.max_connections, "max_connections");
    if (!max_conn) {
        return std::unexpected(max_conn.error());
    }
    cfg.max_connections = *max_conn;

    // idle_timeout: "300s" → 300
    if (root["idle_timeout"]) {
        auto raw = read_scalar<std::string>(root["idle_timeout"], "", "idle_timeout");
        if (!raw) {
            return std::unexpected(raw.error());
        }
        auto seconds = parse_seconds(*raw, "idle_timeout");
        if (!seconds) {
            return std::unexpected(seconds.error());
        }
        cfg.idle_timeout_sec = *seconds;
    }

    // log
    if (const YAML::Node log = root["log"]; log) {
        if (!log.IsMap()) {
            return std::unexpected(std::string("log: expected a map"));
        }
        auto path = read_scalar<std::string>(log["path"], cfg.log_path, "log.path");
        if (!path) {
            return std::unexpected(path.error());
        }
        cfg.log_path = std::move(*path);

        auto level = read_scalar<std::string>(log["level"], cfg.log_level, "log.level");
        if (!level) {
            return std::unexpected(level.error());
        }
        cfg.log_level = std::move(*level);
    }

    auto users = parse_users(root["users"]);
    if (!users) {
        return std::unexpected(users.error());
    }
    cfg.users = std::move(*users);

    if (auto ok = validate(cfg); !ok) {
        return std::unexpected(ok.error());
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼 (없으면 nullptr)
// ---------------------------------------------------------------------------
const char* env_value(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return nullptr;
    }
    return val;
}

template <typename T>
std::optional<T> env_number(const char* name, T min_value, T max_value) {
    const char* val = env_value(name);
    if (val == nullptr) {
        return std::nullopt;
    }
    const std::string_view text{val};
    T parsed{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()
        || parsed < min_value || parsed > max_value) {
        spdlog::warn("[config] env {}: invalid value '{}', ignored", name, text);
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------
std::expected<ServerConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code fs_ec;
    if (!std::filesystem::exists(config_path, fs_ec)) {
        return std::unexpected(fmt::format("config file not found: {}", config_path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("{}: {}", config_path.string(), e.what()));
    }

    auto cfg = parse_root(root);
    if (!cfg) {
        return std::unexpected(fmt::format("{}: {}", config_path.string(), cfg.error()));
    }
    spdlog::info("[config] loaded {} ({} users)", config_path.string(), cfg->users.size());
    return cfg;
}

std::expected<ServerConfig, std::string>
ConfigLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return parse_root(root);
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------
auto validate(const ServerConfig& config) -> std::expected<void, std::string>
{
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(config.listen_address, ec);
    if (ec) {
        return std::unexpected(fmt::format("listen.address: '{}' is not an IPv4 address",
                                           config.listen_address));
    }

    if (config.worker_threads == 0 || config.worker_threads > kMaxWorkerThreads) {
        return std::unexpected(fmt::format("worker_threads: {} is not in 1..{}",
                                           config.worker_threads, kMaxWorkerThreads));
    }

    if (!parse_log_level(config.log_level)) {
        return std::unexpected(fmt::format("log.level: unknown level '{}'", config.log_level));
    }

    if (config.log_path.empty()) {
        return std::unexpected(std::string("log.path: must not be empty"));
    }

    // Greeting 은 제어 페이로드 상한 안에 들어가야 한다 (version 1 + 길이 4)
    if (config.greeting.size() + 5 > kControlPayloadLimit) {
        return std::unexpected(fmt::format("greeting: {} bytes exceeds the packet limit",
                                           config.greeting.size()));
    }

    return {};
}

// ---------------------------------------------------------------------------
// apply_env_overrides
// ---------------------------------------------------------------------------
void apply_env_overrides(ServerConfig& config)
{
    if (const char* addr = env_value("UOSQL_LISTEN_ADDR"); addr != nullptr) {
        config.listen_address = addr;
    }
    if (auto port = env_number<std::uint16_t>("UOSQL_LISTEN_PORT", 0, 65535); port) {
        config.listen_port = *port;
    }
    if (const char* level = env_value("UOSQL_LOG_LEVEL"); level != nullptr) {
        if (parse_log_level(level)) {
            config.log_level = level;
        } else {
            spdlog::warn("[config] env UOSQL_LOG_LEVEL: unknown level '{}', ignored", level);
        }
    }
    if (const char* path = env_value("UOSQL_LOG_PATH"); path != nullptr) {
        config.log_path = path;
    }
    if (auto max_conn = env_number<std::uint32_t>(
            "UOSQL_MAX_CONNECTIONS", 0, std::numeric_limits<std::uint32_t>::max());
        max_conn) {
        config.max_connections = *max_conn;
    }
}
