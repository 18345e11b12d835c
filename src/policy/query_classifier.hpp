#pragma once

// ---------------------------------------------------------------------------
// query_classifier.hpp
//
// 외부 에이전트가 보낸 SQL 을 실제 DB 연결에 닿기 전에
// Allowed / Denied / Catastrophic 으로 분류하는 보안 분류기.
//
// [평가 순서: 첫 매칭이 이긴다]
// A. 멀티 스테이트먼트 (';' 로 구분된 비어 있지 않은 구문 2개 이상) → kDenied
//    주석 제거본과 주석을 남긴 원문 중 어느 쪽에서 세어도 해당된다.
// B. catastrophic 규칙 (write 모드 무관)                              → kCatastrophic
//    주석 제거본과 주석을 남긴 원문(raw_text) 양쪽에 적용한다.
// C. write 모드면 kAllowed. 아니면 read-only whitelist 매칭 시 kAllowed,
//    불일치 시 kDenied (default deny)
//
// [fail-close 원칙]
// - 규칙 평가 중 regex 엔진 오류 → catastrophic 테이블은 매칭, whitelist 는
//   불일치로 처리한다. 어떤 경우에도 오류가 kAllowed 로 이어지지 않는다.
// - 빈 구문(주석/공백 전용)은 부작용이 없으므로 kAllowed.
//
// [reason 문자열 호환성]
// 호출자와 테스트가 "whitelist" / "catastrophic" 부분 문자열에 의존한다.
// catastrophic reason 에는 write 모드 안내를 넣지 않는다 (해제 불가).
//
// [스레드 안전성]
// classify/validate 는 const 이며 공유 가변 상태가 없다. 규칙 테이블은
// 생성 후 읽기 전용이므로 여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"                 // Classification
#include "parser/statement_normalizer.hpp"  // NormalizedStatement

class RuleTable;

inline constexpr std::string_view kStackedStatementReason =
    "Query rejected: multiple statements detected. Stacked queries are not in the "
    "whitelist of safe operations and are rejected in every mode.";

inline constexpr std::string_view kCatastrophicReason =
    "This operation is permanently blocked as it could be catastrophic to the system "
    "or expose sensitive data.";

inline constexpr std::string_view kWhitelistReason =
    "Query not in whitelist of safe read-only operations. Only SELECT, SHOW, DESCRIBE, "
    "EXPLAIN, and database introspection commands are allowed. Enable write mode "
    "(security.allow_write) to permit write operations.";

// matched_rule 식별자 (규칙 테이블 밖에서 내리는 판정)
inline constexpr std::string_view kRuleStackedStatements   = "stacked-statements";
inline constexpr std::string_view kRuleExecutableComment   = "mysql-executable-comment";
inline constexpr std::string_view kRuleEmptyStatement      = "empty-statement";
inline constexpr std::string_view kRuleWriteMode           = "write-mode";
inline constexpr std::string_view kRuleDefaultDeny         = "default-deny";

// ---------------------------------------------------------------------------
// QueryClassifier
// ---------------------------------------------------------------------------
class QueryClassifier {
public:
    // 내장 규칙만 사용. 규칙 테이블은 프로세스 내 모든 인스턴스가 공유한다.
    QueryClassifier();

    // 내장 catastrophic 규칙 뒤에 extra_catastrophic_patterns 를 추가한다.
    // 각 패턴은 단일 세그먼트 정규식이며 무한 반복(*, +)을 쓰지 않아야 한다.
    explicit QueryClassifier(const std::vector<std::string>& extra_catastrophic_patterns);

    ~QueryClassifier() = default;

    QueryClassifier(const QueryClassifier&)            = default;
    QueryClassifier& operator=(const QueryClassifier&) = default;
    QueryClassifier(QueryClassifier&&)                 = default;
    QueryClassifier& operator=(QueryClassifier&&)      = default;

    // classify
    //   정규화된 구문과 write 모드로 판정한다. 예외를 던지지 않는다.
    [[nodiscard]] Classification classify(const NormalizedStatement& statement,
                                          bool allow_write) const;

    // validate
    //   원문 SQL 을 정규화한 뒤 classify 한다.
    [[nodiscard]] Classification validate(std::string_view query, bool allow_write) const;

private:
    std::shared_ptr<const RuleTable> catastrophic_;
    std::shared_ptr<const RuleTable> read_only_;
};

// validate_query_security
//   내장 규칙을 쓰는 QueryClassifier 로 validate 하는 편의 함수.
[[nodiscard]] Classification validate_query_security(std::string_view query, bool allow_write);
