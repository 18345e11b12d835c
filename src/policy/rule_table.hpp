#pragma once

// ---------------------------------------------------------------------------
// rule_table.hpp
//
// 순서가 있는 정규식 규칙 테이블. 첫 번째로 매칭된 규칙이 이긴다.
// 정규화된(대문자, 공백 1칸) SQL 을 대상으로 하므로 패턴은 대문자 키워드와
// 리터럴 스페이스로 작성한다.
//
// [규칙 구조]
// - sequence: 순서대로 탐색하는 정규식 목록. 두 번째 이후 세그먼트는 직전
//   세그먼트 매칭이 끝난 위치부터 탐색한다. "A.*B" 를 {"A", "B"} 로 표현한다.
// - forbid_after_first: 첫 세그먼트 매칭 이후 어디에서든 이 정규식이
//   매칭되면 규칙 전체가 불일치로 처리된다 (CTE 내부 쓰기 차단용).
//
// [스택 깊이 제한]
// libstdc++ std::regex 는 반복(*, +)이 입력을 먹는 만큼 재귀하므로 긴 입력에서
// 스택 오버플로가 날 수 있다. 내장 패턴은 무한 반복을 쓰지 않고, 구간 건너뛰기는
// 세그먼트 분할로 표현하여 재귀 깊이가 입력 길이가 아닌 패턴 길이에 묶이게 한다.
// 설정으로 추가되는 패턴도 같은 규칙을 따라야 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// RuleDefinition
//   컴파일 전 규칙 정의.
// ---------------------------------------------------------------------------
struct RuleDefinition {
    std::string              id{};
    std::vector<std::string> sequence{};
    std::string              forbid_after_first{};  // 빈 문자열 = 사용 안 함
};

// ---------------------------------------------------------------------------
// RuleTable
//   생성 시 RuleDefinition 목록을 컴파일하고 first_match() 에서 순서대로 평가한다.
//
//   [on_error]
//   정규식 엔진 오류(std::regex_error) 발생 시의 판정.
//   - kMatch  : 매칭된 것으로 처리 (차단 테이블용, fail-close)
//   - kNoMatch: 어떤 규칙도 매칭되지 않은 것으로 처리 (허용 테이블용, fail-close)
//   유효한 규칙이 하나도 없을 때도 같은 판정을 따른다.
// ---------------------------------------------------------------------------
class RuleTable {
public:
    enum class OnError : std::uint8_t {
        kMatch   = 0,
        kNoMatch = 1,
    };

    // 오류 시 반환되는 규칙 식별자 (OnError::kMatch)
    static constexpr std::string_view kEvaluationErrorRule = "rule-evaluation-error";

    RuleTable(std::vector<RuleDefinition> definitions, OnError on_error);
    ~RuleTable();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    RuleTable(const RuleTable&)            = delete;
    RuleTable& operator=(const RuleTable&) = delete;
    RuleTable(RuleTable&&) noexcept;
    RuleTable& operator=(RuleTable&&) noexcept;

    // first_match
    //   text 에 처음으로 매칭되는 규칙의 id 를 반환한다. 없으면 std::nullopt.
    //   예외를 던지지 않는다.
    [[nodiscard]] std::optional<std::string> first_match(std::string_view text) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct CompiledRule;
    std::vector<CompiledRule> rules_;
    OnError                   on_error_;
};

// ---------------------------------------------------------------------------
// 내장 규칙 정의
//   catastrophic_rule_definitions: write 모드와 무관하게 영구 차단.
//   read_only_rule_definitions   : write 모드가 꺼져 있을 때 허용되는 읽기 전용 형태.
//   cte_deny_keywords      : WITH ... SELECT 뒤에 나타나면 안 되는 키워드.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<RuleDefinition> catastrophic_rule_definitions();
[[nodiscard]] std::vector<RuleDefinition> read_only_rule_definitions();
[[nodiscard]] const std::vector<std::string>& cte_deny_keywords();
