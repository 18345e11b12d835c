// ---------------------------------------------------------------------------
// rule_table.cpp
//
// 순서 규칙 테이블 구현 및 내장 규칙 정의.
//
// [패턴 작성 규칙]
// - 입력은 정규화된 SQL 이다: 대문자, 공백은 스페이스 1칸, 앞뒤 공백 없음.
//   따라서 \s+ 대신 리터럴 ' ' 를, icase 없이 대문자 키워드를 쓴다.
// - *, + 같은 무한 반복 금지. 끝의 "\w+" 는 search 의미상 "\w" 하나와 같다.
// - 구간 건너뛰기(".*")는 sequence 세그먼트로 나눈다.
//
// [오탐/미탐 트레이드오프]
// - KILL, SHUTDOWN 등은 문자열 리터럴 안에 있어도 매칭된다 (차단 우선).
// - 선두 UNION SELECT 는 합법적 용도가 있어도 항상 차단한다.
// - CTE 거부 키워드는 WITH 이후 어디서든 단어 단위로 검사하므로
//   리터럴/별칭에 포함된 키워드도 차단된다 (false positive 허용).
// ---------------------------------------------------------------------------

#include "policy/rule_table.hpp"

#include <exception>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

struct RuleTable::CompiledRule {
    std::string               id;
    std::vector<std::regex>   sequence;
    std::optional<std::regex> forbid_after_first;
};

namespace {

using SvIterator = std::string_view::const_iterator;
using SvMatch    = std::match_results<SvIterator>;

constexpr auto kRegexFlags = std::regex_constants::ECMAScript | std::regex_constants::optimize;

// 첫 위치가 아니면 match_prev_avail 을 넘겨 ^ 가 중간에서 매칭되지 않고
// \b 가 직전 문자를 보도록 한다.
std::regex_constants::match_flag_type search_flags(SvIterator cursor, SvIterator begin) {
    return cursor == begin
        ? std::regex_constants::match_default
        : std::regex_constants::match_prev_avail;
}

// 예외: std::regex_error (엔진 복잡도/스택 한계) 는 호출자가 처리한다.
bool rule_matches(const std::vector<std::regex>&   sequence,
                  const std::optional<std::regex>& forbid,
                  std::string_view                 text) {
    const SvIterator begin = text.begin();
    const SvIterator end   = text.end();

    SvIterator cursor    = begin;
    SvIterator first_end = begin;

    for (std::size_t i = 0; i < sequence.size(); ++i) {
        SvMatch m;
        if (!std::regex_search(cursor, end, m, sequence[i], search_flags(cursor, begin))) {
            return false;
        }
        cursor = m[0].second;
        if (i == 0) {
            first_end = cursor;
        }
    }

    if (forbid) {
        SvMatch m;
        if (std::regex_search(first_end, end, m, *forbid, search_flags(first_end, begin))) {
            return false;
        }
    }

    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleTable 생성자
//   잘못된 패턴을 가진 규칙은 로그 후 건너뛴다. 나머지 규칙은 계속 적용된다.
// ---------------------------------------------------------------------------
RuleTable::RuleTable(std::vector<RuleDefinition> definitions, OnError on_error)
    : on_error_(on_error)
{
    rules_.reserve(definitions.size());

    for (auto& def : definitions) {
        if (def.sequence.empty()) {
            spdlog::warn("rule_table: rule '{}' has no pattern, skipping", def.id);
            continue;
        }
        try {
            CompiledRule rule;
            rule.id = def.id;
            rule.sequence.reserve(def.sequence.size());
            for (const auto& p : def.sequence) {
                rule.sequence.emplace_back(p, kRegexFlags);
            }
            if (!def.forbid_after_first.empty()) {
                rule.forbid_after_first.emplace(def.forbid_after_first, kRegexFlags);
            }
            rules_.push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            spdlog::warn("rule_table: invalid regex in rule '{}', skipping: {}",
                         def.id, e.what());
        }
    }

    if (rules_.empty()) {
        spdlog::error("rule_table: no valid rules loaded, every lookup falls back to {}",
                      on_error_ == OnError::kMatch ? "match (block)" : "no-match (deny)");
    }
}

RuleTable::~RuleTable() = default;
RuleTable::RuleTable(RuleTable&&) noexcept = default;
RuleTable& RuleTable::operator=(RuleTable&&) noexcept = default;

std::size_t RuleTable::size() const noexcept {
    return rules_.size();
}

// ---------------------------------------------------------------------------
// RuleTable::first_match
// ---------------------------------------------------------------------------
std::optional<std::string> RuleTable::first_match(std::string_view text) const noexcept {
    if (rules_.empty()) {
        if (on_error_ == OnError::kMatch) {
            return std::string(kEvaluationErrorRule);
        }
        return std::nullopt;
    }

    for (const auto& rule : rules_) {
        try {
            if (rule_matches(rule.sequence, rule.forbid_after_first, text)) {
                return rule.id;
            }
        } catch (const std::exception& e) {
            // regex 엔진 한계 초과 등. 판정 불가 시 테이블 정책대로 fail-close.
            spdlog::warn("rule_table: evaluation of rule '{}' failed on {}-byte input: {}",
                         rule.id, text.size(), e.what());
            if (on_error_ == OnError::kMatch) {
                return std::string(kEvaluationErrorRule);
            }
            return std::nullopt;
        }
    }

    return std::nullopt;
}

// ---------------------------------------------------------------------------
// 내장 규칙: catastrophic
// ---------------------------------------------------------------------------
std::vector<RuleDefinition> catastrophic_rule_definitions() {
    return {
        // 스키마 루트 파괴
        {"drop-database",  {R"(\bDROP (DATABASE|SCHEMA|TABLESPACE)\b)"}, {}},
        // 서버 생명주기
        {"server-shutdown", {R"(\bSHUTDOWN\b)"}, {}},
        {"kill-connection", {R"(\bKILL\b)"}, {}},
        {"pg-backend-signal",
         {R"(\b(PG_TERMINATE_BACKEND|PG_CANCEL_BACKEND)\b)"}, {}},
        // DB 엔진을 통한 파일 시스템 접근
        {"load-file",       {R"(\bLOAD_FILE\b)"}, {}},
        {"into-outfile",    {R"(\bINTO (OUTFILE|DUMPFILE)\b)"}, {}},
        {"load-data-infile",
         {R"(\bLOAD DATA (LOW_PRIORITY |CONCURRENT )?(LOCAL )?INFILE\b)"}, {}},
        {"server-file-function",
         {R"(\b(PG_READ_FILE|PG_READ_BINARY_FILE|PG_LS_DIR|LO_IMPORT|LO_EXPORT)\b)"}, {}},
        // 셸/프로그램 실행
        {"shell-escape",    {R"(\\!)"}, {}},
        {"copy-program",    {R"(\bCOPY\b)", R"(\b(FROM|TO) PROGRAM\b)"}, {}},
        // 권한 상승
        {"grant-privileges",
         {R"(\bGRANT (ALL|CREATE|DROP|ALTER|DELETE|INSERT|UPDATE|SELECT|SUPER|RELOAD|)"
          R"(LOCK TABLES|REPLICATION|BINLOG|PROCESS|FILE|REFERENCES|INDEX|SHUTDOWN|)"
          R"(EXECUTE|SHOW VIEW|EVENT|TRIGGER))"}, {}},
        {"create-user",     {R"(\bCREATE (USER|ROLE)\b)"}, {}},
        // 이후 구문의 동작을 바꿀 수 있는 세션/전역 설정 변경
        {"session-config",  {R"(\bSET (GLOBAL|SESSION|PERSIST|PERSIST_ONLY)\b)"}, {}},
        {"system-variable-assignment", {R"(\bSET ?@@)"}, {}},
        // 선두 UNION SELECT (인젝션 꼬리 형태)
        {"leading-union-select", {R"(^UNION SELECT\b)"}, {}},
        // 서버 내부 정보 노출
        {"server-path-disclosure",
         {R"(@@((GLOBAL|SESSION)\.)?(DATADIR|BASEDIR|TMPDIR|SECURE_FILE_PRIV|PLUGIN_DIR)\b)"}, {}},
        {"show-grants",     {R"(\bSHOW GRANTS\b)"}, {}},
    };
}

// ---------------------------------------------------------------------------
// 내장 규칙: read-only whitelist
// ---------------------------------------------------------------------------
const std::vector<std::string>& cte_deny_keywords() {
    static const std::vector<std::string> kKeywords = {
        "INSERT", "UPDATE", "DELETE", "CREATE", "DROP", "ALTER", "TRUNCATE",
        "REPLACE", "MERGE", "GRANT", "REVOKE", "SET", "RESET", "CALL",
        "EXECUTE", "EXEC", "COPY", "VACUUM", "ANALYZE", "CLUSTER", "REINDEX",
        "LOAD", "IMPORT", "FLUSH", "OPTIMIZE", "REPAIR", "CHECKSUM",
        "BEGIN", "START", "COMMIT", "ROLLBACK", "SAVEPOINT",
        "RENAME", "COMMENT", "HANDLER", "LOCK", "UNLOCK",
    };
    return kKeywords;
}

std::vector<RuleDefinition> read_only_rule_definitions() {
    std::string cte_forbid = R"(\b()";
    const auto& keywords = cte_deny_keywords();
    for (std::size_t i = 0; i < keywords.size(); ++i) {
        if (i > 0) {
            cte_forbid += '|';
        }
        cte_forbid += keywords[i];
    }
    cte_forbid += R"()\b)";

    return {
        {"select", {R"(^SELECT\b)"}, {}},
        {"show-inspection",
         {R"(^SHOW (TABLES|DATABASES|SCHEMAS|COLUMNS|INDEX|INDEXES|INDICES|STATUS|)"
          R"(VARIABLES|PROCESSLIST|FULL PROCESSLIST|ENGINES|STORAGE ENGINES|CHARSET|)"
          R"(CHARACTER SET|COLLATION|CREATE TABLE|CREATE DATABASE|CREATE VIEW|)"
          R"(TABLE STATUS|FULL TABLES|GRANTS|PRIVILEGES)\b)"}, {}},
        {"describe", {R"(^DESCRIBE\b)"}, {}},
        {"desc",     {R"(^DESC\b)"}, {}},
        {"explain",  {R"(^EXPLAIN\b)"}, {}},
        {"explain-options", {R"(^EXPLAIN (ANALYZE|VERBOSE|FORMAT)\b)"}, {}},
        // psql 메타 커맨드 (\dt, \l, \timing ...)
        {"psql-meta", {R"(^\\(DT|L|DN|DF|DV|DI|DU|DP|Z|TIMING)$)"}, {}},
        // \d <name>: 첫 식별자 문자 이후에 식별자가 아닌 문자가 있으면 불일치
        {"psql-describe", {R"(^\\D [\w.$])"}, R"([^\w.$])"},
        // WITH ... SELECT: WITH 이후 쓰기 키워드가 있으면 불일치
        {"cte-select", {R"(^WITH\b)", R"(\bSELECT\b)"}, cte_forbid},
        // 시스템 카탈로그 조회
        {"catalog-select",
         {R"(^SELECT\b)", R"(\bFROM (INFORMATION_SCHEMA|PERFORMANCE_SCHEMA|MYSQL|PG_CATALOG)\.\w)"},
         {}},
        {"pg-catalog-select", {R"(^SELECT\b)", R"(\bFROM PG_\w)"}, {}},
    };
}
