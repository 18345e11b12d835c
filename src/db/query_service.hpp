#pragma once

// ---------------------------------------------------------------------------
// query_service.hpp
//
// 쿼리 실행 경계. 모든 SQL 은 QueryClassifier 를 통과해야만 CommandRunner
// 에 전달된다.
//
// [처리 흐름]
// 1. 분류 (config.security.allow_write 기준) 및 감사 로그
// 2. kAllowed 가 아니면 QueryError 반환, 러너는 호출하지 않는다
// 3. "exec <client> [<dbflag> <db>] <flag> '<query>'" 인자 구성
// 4. 러너 실행. 실패 시 kCommandFailed
// 5. 성공 시 "Query executed successfully (<db type>) [<mode>]:\n\n<output>"
//
// [소유권]
// config/runner/logger 는 호출자가 소유하며 QueryService 보다 오래 살아야 한다.
// logger 가 nullptr 이면 감사 로그를 생략한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "config/gateway_config.hpp"
#include "db/command_runner.hpp"
#include "db/db_dialect.hpp"
#include "policy/query_classifier.hpp"

class StructuredLogger;

// ---------------------------------------------------------------------------
// QueryRequest
//   database: 빈 문자열이면 config.database.name 을 사용한다.
// ---------------------------------------------------------------------------
struct QueryRequest {
    std::string query{};
    std::string database{};
};

class QueryService {
public:
    QueryService(const GatewayConfig& config,
                 CommandRunner&       runner,
                 StructuredLogger*    logger = nullptr);

    ~QueryService() = default;

    QueryService(const QueryService&)            = delete;
    QueryService& operator=(const QueryService&) = delete;

    // classify
    //   실행 없이 분류만 수행한다 (dry-run, 감사 로그 기록).
    [[nodiscard]] Classification classify(std::string_view query);

    [[nodiscard]] std::expected<std::string, QueryError> execute(const QueryRequest& request);

    [[nodiscard]] std::expected<std::string, QueryError> list_tables(const std::string& database = {});
    [[nodiscard]] std::expected<std::string, QueryError> list_databases();

    // describe_table
    //   table 은 [A-Za-z0-9_.$] 로만 구성되어야 한다. 위반 시 kInvalidInput.
    [[nodiscard]] std::expected<std::string, QueryError>
    describe_table(const std::string& table, const std::string& database = {});

    [[nodiscard]] bool allow_write() const noexcept { return config_.security.allow_write; }

private:
    [[nodiscard]] std::vector<std::string> build_args(const std::string& query,
                                                      const std::string& database) const;

    const GatewayConfig& config_;
    CommandRunner&       runner_;
    StructuredLogger*    logger_;
    QueryClassifier      classifier_;
    DbCommands           commands_;
};

// is_plain_identifier
//   비어 있지 않고 [A-Za-z0-9_.$] 로만 구성된 경우 true.
[[nodiscard]] bool is_plain_identifier(std::string_view name) noexcept;

// shell_single_quote
//   컨테이너 셸에 전달할 단일 인용 문자열. ' 는 '\'' 로 치환한다.
[[nodiscard]] std::string shell_single_quote(std::string_view text);
