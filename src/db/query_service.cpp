// ---------------------------------------------------------------------------
// query_service.cpp
// ---------------------------------------------------------------------------

#include "db/query_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "logger/structured_logger.hpp"

namespace {

QueryErrorCode to_query_error_code(QueryVerdict verdict) noexcept {
    return verdict == QueryVerdict::kCatastrophic ? QueryErrorCode::kCatastrophic
                                                  : QueryErrorCode::kDenied;
}

std::string_view mode_label(bool allow_write) noexcept {
    return allow_write ? "Write Mode" : "Read-Only Mode";
}

}  // namespace

// ---------------------------------------------------------------------------
// 자유 함수
// ---------------------------------------------------------------------------
bool is_plain_identifier(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '.' || c == '$';
    });
}

std::string shell_single_quote(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '\'';
    for (const char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

// ---------------------------------------------------------------------------
// QueryService
// ---------------------------------------------------------------------------
QueryService::QueryService(const GatewayConfig& config,
                           CommandRunner&       runner,
                           StructuredLogger*    logger)
    : config_(config)
    , runner_(runner)
    , logger_(logger)
    , classifier_(config.security.extra_catastrophic_patterns)
    , commands_(db_commands(config.database.type))
{}

Classification QueryService::classify(std::string_view query) {
    const auto started = std::chrono::steady_clock::now();
    Classification result = classifier_.validate(query, config_.security.allow_write);
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result.allowed()) {
        spdlog::warn("query_service: query blocked (rule={})", result.matched_rule);
    }

    if (logger_ != nullptr) {
        ValidationLog entry;
        entry.raw_sql      = std::string(query);
        entry.verdict      = result.verdict;
        entry.matched_rule = result.matched_rule;
        entry.reason       = result.reason;
        entry.allow_write  = config_.security.allow_write;
        entry.timestamp    = std::chrono::system_clock::now();
        entry.duration     = elapsed;
        logger_->log_validation(entry);
    }
    return result;
}

std::vector<std::string> QueryService::build_args(const std::string& query,
                                                  const std::string& database) const {
    std::vector<std::string> args;
    args.reserve(6);
    args.emplace_back("exec");
    args.emplace_back(commands_.client);
    if (!database.empty()) {
        args.emplace_back(commands_.database_flag);
        args.push_back(shell_single_quote(database));
    }
    args.emplace_back(commands_.command_flag);
    args.push_back(shell_single_quote(query));
    return args;
}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------
std::expected<std::string, QueryError> QueryService::execute(const QueryRequest& request) {
    // 1. 분류
    const Classification verdict = classify(request.query);
    if (!verdict.allowed()) {
        return std::unexpected(QueryError{
            to_query_error_code(verdict.verdict),
            fmt::format("Query not allowed: {}", verdict.reason),
            verdict.matched_rule,
        });
    }

    // 2. 대상 데이터베이스 (요청 > 설정)
    const std::string& database =
        request.database.empty() ? config_.database.name : request.database;
    if (!database.empty() && !is_plain_identifier(database)) {
        return std::unexpected(QueryError{
            QueryErrorCode::kInvalidInput,
            fmt::format("Invalid database name '{}'", database),
            "database",
        });
    }

    // 3. 실행
    const auto started = std::chrono::steady_clock::now();
    auto output = runner_.run(build_args(request.query, database));
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    const std::string_view type_name = database_type_name(config_.database.type);

    if (logger_ != nullptr) {
        ExecutionLog entry;
        entry.raw_sql       = request.query;
        entry.database_type = std::string(type_name);
        entry.database      = database;
        entry.success       = output.has_value();
        entry.exit_code     = output ? 0 : output.error().exit_code;
        entry.output_bytes  = output ? output->size() : 0;
        entry.timestamp     = std::chrono::system_clock::now();
        entry.duration      = elapsed;
        logger_->log_execution(entry);
    }

    if (!output) {
        spdlog::error("query_service: command failed: {}", output.error().message);
        return std::unexpected(QueryError{
            QueryErrorCode::kCommandFailed,
            fmt::format("DDEV command failed: {}", output.error().message),
            output.error().context,
        });
    }

    // 4. 결과 포맷
    return fmt::format("Query executed successfully ({}) [{}]:\n\n{}",
                       type_name, mode_label(config_.security.allow_write), *output);
}

std::expected<std::string, QueryError> QueryService::list_tables(const std::string& database) {
    return execute(QueryRequest{std::string(commands_.list_tables), database});
}

std::expected<std::string, QueryError> QueryService::list_databases() {
    return execute(QueryRequest{std::string(commands_.list_databases), {}});
}

std::expected<std::string, QueryError>
QueryService::describe_table(const std::string& table, const std::string& database) {
    if (!is_plain_identifier(table)) {
        return std::unexpected(QueryError{
            QueryErrorCode::kInvalidInput,
            fmt::format("Invalid table name '{}'", table),
            "table",
        });
    }
    return execute(QueryRequest{commands_.describe_table(table), database});
}
