// ---------------------------------------------------------------------------
// query_classifier.cpp
//
// 보안 분류기 구현.
//
// [멀티 스테이트먼트 판정 위치]
// Stage A 는 write 모드 확인보다 먼저 수행된다. "SELECT 1; DROP TABLE x"
// 처럼 각 구문이 단독으로는 안전해 보여도 조합 자체를 차단한다.
//
// [MySQL/MariaDB 조건부 실행 주석]
// /*!50000 DROP DATABASE x */ 와 /*M! ... */ 는 정규화에서 내용이 사라지므로
// 정규화기가 남긴 플래그로 Stage B 에서 catastrophic 처리한다.
//
// [주석을 남긴 원문 검사]
// 정규화기의 주석 제거는 리터럴과 MySQL 의 '--' 규칙을 모른다.
// Stage A 와 Stage B 는 주석 제거본과 raw_text 양쪽에 적용하며,
// 어느 한쪽이라도 걸리면 차단한다.
// ---------------------------------------------------------------------------

#include "policy/query_classifier.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "policy/rule_table.hpp"

namespace {

std::shared_ptr<const RuleTable> builtin_catastrophic_table() {
    static const auto kTable = std::make_shared<const RuleTable>(
        catastrophic_rule_definitions(), RuleTable::OnError::kMatch);
    return kTable;
}

std::shared_ptr<const RuleTable> builtin_read_only_table() {
    static const auto kTable = std::make_shared<const RuleTable>(
        read_only_rule_definitions(), RuleTable::OnError::kNoMatch);
    return kTable;
}

Classification make_result(QueryVerdict verdict, std::string_view reason, std::string rule) {
    Classification c;
    c.verdict      = verdict;
    c.reason       = std::string(reason);
    c.matched_rule = std::move(rule);
    return c;
}

}  // namespace

QueryClassifier::QueryClassifier()
    : catastrophic_(builtin_catastrophic_table())
    , read_only_(builtin_read_only_table())
{}

QueryClassifier::QueryClassifier(const std::vector<std::string>& extra_catastrophic_patterns)
    : read_only_(builtin_read_only_table())
{
    if (extra_catastrophic_patterns.empty()) {
        catastrophic_ = builtin_catastrophic_table();
        return;
    }

    auto definitions = catastrophic_rule_definitions();
    definitions.reserve(definitions.size() + extra_catastrophic_patterns.size());
    for (std::size_t i = 0; i < extra_catastrophic_patterns.size(); ++i) {
        definitions.push_back(RuleDefinition{
            "custom-" + std::to_string(i + 1),
            {extra_catastrophic_patterns[i]},
            {}
        });
    }
    catastrophic_ = std::make_shared<const RuleTable>(std::move(definitions), RuleTable::OnError::kMatch);
}

// ---------------------------------------------------------------------------
// QueryClassifier::classify
// ---------------------------------------------------------------------------
Classification QueryClassifier::classify(const NormalizedStatement& statement,
                                         bool allow_write) const {
    // Stage A: 멀티 스테이트먼트
    if (statement.statement_count > 1 || statement.raw_statement_count > 1) {
        return make_result(QueryVerdict::kDenied, kStackedStatementReason,
                           std::string(kRuleStackedStatements));
    }

    // Stage B: catastrophic (write 모드로 우회 불가)
    if (statement.has_executable_comment) {
        return make_result(QueryVerdict::kCatastrophic, kCatastrophicReason,
                           std::string(kRuleExecutableComment));
    }
    if (!statement.empty()) {
        if (auto rule = catastrophic_->first_match(statement.text)) {
            return make_result(QueryVerdict::kCatastrophic, kCatastrophicReason,
                               std::move(*rule));
        }
    }
    if (!statement.raw_text.empty()) {
        if (auto rule = catastrophic_->first_match(statement.raw_text)) {
            return make_result(QueryVerdict::kCatastrophic, kCatastrophicReason,
                               std::move(*rule));
        }
    }

    // Stage C: whitelist
    if (allow_write) {
        return make_result(QueryVerdict::kAllowed, {}, std::string(kRuleWriteMode));
    }
    if (statement.empty()) {
        return make_result(QueryVerdict::kAllowed, {}, std::string(kRuleEmptyStatement));
    }
    if (auto rule = read_only_->first_match(statement.text)) {
        return make_result(QueryVerdict::kAllowed, {}, std::move(*rule));
    }

    return make_result(QueryVerdict::kDenied, kWhitelistReason, std::string(kRuleDefaultDeny));
}

Classification QueryClassifier::validate(std::string_view query, bool allow_write) const {
    return classify(normalize_statement(query), allow_write);
}

Classification validate_query_security(std::string_view query, bool allow_write) {
    static const QueryClassifier kClassifier;
    return kClassifier.validate(query, allow_write);
}
