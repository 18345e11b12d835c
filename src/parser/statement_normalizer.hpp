#pragma once

// ---------------------------------------------------------------------------
// statement_normalizer.hpp
//
// 보안 분류기 입력용 SQL 정규화기.
// 주석 제거 → 공백 축약 → trim → 대문자 변환 순서로 처리하고,
// ';' 기준 구문 개수를 함께 계산한다 (멀티 스테이트먼트 탐지용).
//
// [처리 순서가 중요한 이유]
// 주석 제거가 ';' 분할보다 먼저 수행되어야 주석 안의 ';' 를 구분자로
// 세지 않는다.
//
// [주석처럼 보이지만 서버가 실행하는 텍스트]
// 리터럴 안의 '--' / '/*', MySQL 의 공백 없는 '--' ('1--1' 은 산술식),
// MariaDB '/*M! ... */' 는 정규화 text 에서 사라지지만 서버는 실행한다.
// 그래서 주석을 남긴 raw_text 와 raw_statement_count 를 함께 만든다.
// 분류기는 catastrophic 규칙과 멀티 스테이트먼트 판정을 양쪽 모두에 적용한다.
//
// [알려진 한계]
// - 문자열 리터럴을 인식하지 않는다. 'a;b' 안의 ';' 도 구분자로 센다
//   (차단 우선: false positive 방향).
// - 대문자 변환은 ASCII 만 대상으로 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// NormalizedStatement
//   text: 정규화된 SQL. 빈 문자열이면 주석/공백 전용 입력이다.
//   statement_count: ';' 로 분할한 뒤 비어 있지 않은 구문 수.
//   raw_text: 주석을 남긴 채 공백 축약 / trim / 대문자 변환만 한 원문.
//   raw_statement_count: 원문의 모든 ';' 에서 분할한 뒤 조각마다 주석을
//     제거하고 남는 것이 있는 조각 수. 주석 안의 ';' 도 구분자로 센다.
//   has_executable_comment: 원문 어딘가에 MySQL '/*!' 또는 MariaDB '/*M!'
//     조건부 실행 주석이 있는지. 내용은 text 에서 사라지므로 분류기가
//     이 플래그로 별도 판정한다.
// ---------------------------------------------------------------------------
struct NormalizedStatement {
    std::string text{};
    std::size_t statement_count{0};
    std::string raw_text{};
    std::size_t raw_statement_count{0};
    bool        has_executable_comment{false};

    [[nodiscard]] bool empty() const noexcept { return text.empty(); }
};

// normalize_statement
//   어떤 입력에 대해서도 예외를 던지지 않는 전 함수(total function).
//   정규화 결과를 다시 정규화해도 같은 text 가 나온다 (멱등).
[[nodiscard]] NormalizedStatement normalize_statement(std::string_view sql);
