#include "config/server_config.hpp"
#include "engine/literal_engine.hpp"
#include "server/authenticator.hpp"
#include "server/server.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// uosql-server
//
//   uosql-server [--cfg=<file>]
//
//   설정 우선순위: 기본값 < YAML 파일 < 환경변수.
//   --cfg 를 주지 않았고 기본 경로에 파일이 없으면 기본값으로 시작한다.
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kDefaultConfigPath = "config/uosql.yaml";
constexpr std::string_view kConfigFlag        = "--cfg=";

void print_usage(const char* prog)
{
    spdlog::info("usage: {} [--cfg=<file>]", prog);
}

} // namespace

int main(int argc, char* argv[]) {

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    std::filesystem::path config_path{std::string{kDefaultConfigPath}};
    bool                  explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg.starts_with(kConfigFlag)) {
            config_path     = std::string{arg.substr(kConfigFlag.size())};
            explicit_config = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            spdlog::error("unknown argument: {}", arg);
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    ServerConfig config;
    std::error_code fs_ec;
    if (!explicit_config && !std::filesystem::exists(config_path, fs_ec)) {
        spdlog::warn("config file {} not found, using defaults", config_path.string());
    } else {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            spdlog::error("failed to load config: {}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    apply_env_overrides(config);
    if (auto valid = validate(config); !valid) {
        spdlog::error("invalid configuration: {}", valid.error());
        return EXIT_FAILURE;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    spdlog::info("Starting uosql server");
    spdlog::info("Listen: {}:{}", config.listen_address, config.listen_port);
    spdlog::info("Audit log: {} (level {})", config.log_path, config.log_level);
    if (config.users.empty()) {
        spdlog::warn("no users configured, every login will be denied");
    }

    // ── Server 생성 및 실행 ─────────────────────────────────────────────
    auto engine        = std::make_shared<LiteralQueryEngine>();
    auto authenticator = std::make_shared<UserTableAuthenticator>(config.users);

    try {
        Server server{std::move(config), std::move(engine), std::move(authenticator)};
        server.run();
    } catch (const std::exception& e) {
        spdlog::error("server failed: {}", e.what());
        return EXIT_FAILURE;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("uosql server stopped");

    return EXIT_SUCCESS;
}
