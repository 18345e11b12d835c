#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - QueryVerdict 는 common/types.hpp 에 있으므로 직접 사용한다.
// - DatabaseType 은 include 하지 않고 이름 문자열로 받는다.
//
// [민감정보 취급 주의]
// - raw_sql 은 원문 SQL 전체를 포함한다. 운영 환경에서 로그 레벨/마스킹
//   정책을 별도로 적용할 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // QueryVerdict

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ValidationLog
//   보안 분류 결과 로그. verdict 가 kAllowed 가 아니면 warn 레벨로 기록된다.
// ---------------------------------------------------------------------------
struct ValidationLog {
    std::string                                raw_sql{};      // 원문 SQL (마스킹 주의)
    QueryVerdict                               verdict{QueryVerdict::kDenied};
    std::string                                matched_rule{};
    std::string                                reason{};
    bool                                       allow_write{false};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 분류 소요 시간
};

// ---------------------------------------------------------------------------
// ExecutionLog
//   허용된 쿼리의 ddev 실행 결과 로그.
//   exit_code: 0 = 성공, 실행 실패 시 러너가 보고한 값 (-1 = 종료 코드 없음)
// ---------------------------------------------------------------------------
struct ExecutionLog {
    std::string                                raw_sql{};
    std::string                                database_type{};  // "mysql" | "mariadb" | "postgres"
    std::string                                database{};       // 대상 DB (빈값 = 기본)
    bool                                       success{false};
    int                                        exit_code{0};
    std::size_t                                output_bytes{0};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};

// parse_log_level
//   "trace"/"debug" → kDebug, "info" → kInfo, "warn"/"warning" → kWarn,
//   "error"/"critical" → kError. 그 외는 kInfo.
[[nodiscard]] LogLevel parse_log_level(const std::string& name) noexcept;

// verdict_name
//   "allowed" | "denied" | "catastrophic"
[[nodiscard]] const char* verdict_name(QueryVerdict verdict) noexcept;
