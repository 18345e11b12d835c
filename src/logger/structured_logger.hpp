#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   QueryService 는 StructuredLogger* 를 받으며 nullptr 이면 감사 로그를 생략한다.
// - 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   ValidationLog / ExecutionLog 를 JSON 한 줄로 기록한다.
//   싱크: stdout(선택) + rotating file (10MB x 3).
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (상위 디렉터리는 자동 생성)
    //   to_stdout : true 이면 stdout 에도 기록한다. 게이트웨이 실행 파일은
    //               stdout 을 결과 출력에 쓰므로 false 로 생성한다.
    // 예외: 로그 파일 생성 실패 시 std::runtime_error
    StructuredLogger(LogLevel min_level,
                     const std::filesystem::path& log_path,
                     bool to_stdout = false);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_validation
    //   kAllowed → info  {"event":"query_validated", ...}
    //   그 외    → warn  {"event":"query_blocked", ...}
    void log_validation(const ValidationLog& entry);

    // log_execution
    //   {"event":"query_executed", ...}. 실패 시 warn 레벨.
    void log_execution(const ExecutionLog& entry);

    void flush();

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
