#include "client/connection.hpp"
#include "protocol/dataset.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <unistd.h>

#include <charconv>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// uosql-client
//
//   uosql-client <address> <port> <user> <password>
//
//   표준 입력에서 한 줄에 하나씩 문장을 읽는다.
//     :ping  → Ping
//     :quit  → Quit 후 종료 (EOF 도 동일)
//     그 외  → Query, 결과 행을 탭으로 구분해 출력
// ---------------------------------------------------------------------------
namespace {

auto trim(std::string_view s) -> std::string_view
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void print_dataset(const DataSet& rows)
{
    std::string line;
    for (std::size_t c = 0; c < rows.column_count(); ++c) {
        if (c > 0) {
            line += '\t';
        }
        line += rows.columns()[c].name;
    }
    fmt::print("{}\n", line);

    for (const auto& row : rows.rows()) {
        line.clear();
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                line += '\t';
            }
            line += to_display(row[c]);
        }
        fmt::print("{}\n", line);
    }
    fmt::print("({} row{})\n", rows.row_count(), rows.row_count() == 1 ? "" : "s");
}

} // namespace

int main(int argc, char* argv[]) {

    if (argc != 5) {
        fmt::print(stderr, "usage: {} <address> <port> <user> <password>\n", argv[0]);
        return EXIT_FAILURE;
    }

    const std::string_view port_arg{argv[2]};
    std::uint16_t port{0};
    auto [ptr, ec] = std::from_chars(port_arg.data(), port_arg.data() + port_arg.size(), port);
    if (ec != std::errc{} || ptr != port_arg.data() + port_arg.size()) {
        fmt::print(stderr, "invalid port: {}\n", port_arg);
        return EXIT_FAILURE;
    }

    // ── 접속 ────────────────────────────────────────────────────────────
    auto conn = Connection::connect(argv[1], port, argv[3], argv[4]);
    if (!conn) {
        fmt::print(stderr, "connect failed: {}\n", to_string(conn.error()));
        return EXIT_FAILURE;
    }

    fmt::print("{} (server protocol v{}, client protocol v{})\n",
               conn->message(), conn->version(), lib_version());
    fmt::print("connected to {}:{} as {}\n", conn->ip(), conn->port(), conn->username());

    // ── 문장 루프 ───────────────────────────────────────────────────────
    const bool interactive = ::isatty(STDIN_FILENO) != 0;
    std::string input;

    while (true) {
        if (interactive) {
            fmt::print("uosql> ");
            std::fflush(stdout);
        }
        if (!std::getline(std::cin, input)) {
            break;
        }

        const auto stmt = trim(input);
        if (stmt.empty()) {
            continue;
        }

        if (stmt == ":quit") {
            break;
        }

        if (stmt == ":ping") {
            if (auto pong = conn->ping(); pong) {
                fmt::print("pong\n");
            } else {
                fmt::print(stderr, "error: {}\n", to_string(pong.error()));
            }
        } else {
            auto rows = conn->execute(stmt);
            if (rows) {
                print_dataset(*rows);
            } else {
                fmt::print(stderr, "error: {}\n", to_string(rows.error()));
            }
        }

        if (conn->state() == ClientState::kClosed) {
            fmt::print(stderr, "connection lost\n");
            return EXIT_FAILURE;
        }
    }

    if (auto bye = conn->quit(); !bye) {
        spdlog::warn("quit failed: {}", to_string(bye.error()));
    }
    return EXIT_SUCCESS;
}
