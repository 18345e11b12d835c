#include "config/config_loader.hpp"
#include "db/ddev_runner.hpp"
#include "db/query_service.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

bool env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    const std::string_view v{val};
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    spdlog::warn("env {}: invalid boolean '{}', using default {}", name, v, default_val);
    return default_val;
}

std::string_view trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// 한 줄 처리
//   ":tables [db]"       → list_tables
//   ":databases"         → list_databases
//   ":describe <table>"  → describe_table
//   그 외                → SQL 로 execute
std::expected<std::string, QueryError> dispatch(QueryService& service, std::string_view line) {
    if (line == ":databases") {
        return service.list_databases();
    }
    if (line == ":tables") {
        return service.list_tables();
    }
    if (line.starts_with(":tables ")) {
        return service.list_tables(std::string(trim(line.substr(8))));
    }
    if (line.starts_with(":describe ")) {
        return service.describe_table(std::string(trim(line.substr(10))));
    }
    return service.execute(QueryRequest{std::string(line), {}});
}

} // namespace

// ---------------------------------------------------------------------------
// main
//   stdin 에서 한 줄에 하나씩 쿼리를 읽어 실행 결과를 stdout 에 출력한다.
//   진단 로그는 stderr, 감사 로그는 log_path 파일로 간다.
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 진단 로거 (stdout 은 결과 출력 전용) ─────────────────────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("querygate"));

    // ── 설정 로드 (파일 → 환경변수 덮어쓰기) ──────────────────────────────
    const std::string config_path = env_str("QUERYGATE_CONFIG", "config/querygate.yaml");

    GatewayConfig config;
    std::error_code exists_ec;
    if (std::filesystem::exists(config_path, exists_ec)) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            spdlog::critical("Failed to load config: {}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    } else {
        spdlog::warn("Config '{}' not found, using read-only defaults", config_path);
    }

    config.security.allow_write = env_bool("QUERYGATE_ALLOW_WRITE", config.security.allow_write);
    config.global.log_level     = env_str("QUERYGATE_LOG_LEVEL", config.global.log_level);
    config.global.log_path      = env_str("QUERYGATE_LOG_PATH",  config.global.log_path);
    const bool dry_run          = env_bool("QUERYGATE_DRY_RUN", false);

    spdlog::set_level(spdlog::level::from_str(config.global.log_level));

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::info("Starting querygate");
    spdlog::info("Database: {} ({})", database_type_name(config.database.type),
                 config.database.name.empty() ? "default" : config.database.name);
    spdlog::info("Mode: {}{}", config.security.allow_write ? "write" : "read-only",
                 dry_run ? ", dry-run" : "");
    spdlog::info("Audit log: {}", config.global.log_path);

    std::unique_ptr<StructuredLogger> audit;
    try {
        audit = std::make_unique<StructuredLogger>(
            parse_log_level(config.global.log_level), config.global.log_path);
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }

    // ── QueryService 생성 ───────────────────────────────────────────────
    DdevRunner   runner{config.ddev};
    QueryService service{config, runner, audit.get()};

    // ── 입력 루프 ───────────────────────────────────────────────────────
    int failures = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        const std::string_view query = trim(line);
        if (query.empty()) {
            continue;
        }

        if (dry_run) {
            const Classification result = service.classify(query);
            if (result.allowed()) {
                std::cout << "allowed\n";
            } else {
                std::cout << verdict_name(result.verdict) << ": " << result.reason << '\n';
                ++failures;
            }
            std::cout.flush();
            continue;
        }

        auto result = dispatch(service, query);
        if (result) {
            std::cout << *result << '\n';
        } else {
            std::cout << result.error().message << '\n';
            ++failures;
        }
        std::cout.flush();
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    audit->flush();
    spdlog::info("querygate stopped ({} failed request(s))", failures);

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
