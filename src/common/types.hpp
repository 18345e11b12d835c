#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// QueryVerdict
//   쿼리 보안 분류 결과.
//   kCatastrophic 은 kDenied 의 하위 개념으로, write 모드로도 해제할 수 없다.
// ---------------------------------------------------------------------------
enum class QueryVerdict : std::uint8_t {
    kAllowed      = 0,  // 실행 허용
    kDenied       = 1,  // whitelist 위반 또는 멀티 스테이트먼트 (write 모드로 해제 가능할 수 있음)
    kCatastrophic = 2,  // 영구 차단 (write 모드 무관)
};

// ---------------------------------------------------------------------------
// Classification
//   QueryClassifier::classify 의 반환값.
//
//   reason: kAllowed 가 아니면 반드시 채워진다. 호출자/테스트가 문자열
//           매칭("whitelist", "catastrophic")에 의존하므로 문구를 약화하지 말 것.
//   matched_rule: 판정을 내린 규칙 식별자 (감사 로그용).
// ---------------------------------------------------------------------------
struct Classification {
    QueryVerdict verdict{QueryVerdict::kDenied};  // 기본값 kDenied (fail-close)
    std::string  reason{};
    std::string  matched_rule{};

    [[nodiscard]] bool allowed() const noexcept {
        return verdict == QueryVerdict::kAllowed;
    }
    [[nodiscard]] bool catastrophic() const noexcept {
        return verdict == QueryVerdict::kCatastrophic;
    }
};

// ---------------------------------------------------------------------------
// CommandErrorCode / CommandError
//   외부 CLI(ddev) 실행 실패 분류.
//   std::expected<std::string, CommandError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
enum class CommandErrorCode : std::uint8_t {
    kNotFound    = 0,  // 실행 파일을 PATH 에서 찾지 못함
    kSpawnFailed = 1,  // 프로세스 생성 실패
    kTimeout     = 2,  // 제한 시간 초과 (자식 프로세스 종료됨)
    kNonZeroExit = 3,  // 종료 코드 != 0
};

struct CommandError {
    CommandErrorCode code{CommandErrorCode::kSpawnFailed};
    std::string      message{};    // 사람이 읽을 수 있는 오류 설명
    std::string      context{};    // 실행한 커맨드 라인 (로깅용)
    int              exit_code{-1};
};

// ---------------------------------------------------------------------------
// QueryErrorCode / QueryError
//   QueryService::execute 실패 분류.
//   kDenied/kCatastrophic 인 경우 러너는 호출되지 않았음이 보장된다.
// ---------------------------------------------------------------------------
enum class QueryErrorCode : std::uint8_t {
    kDenied        = 0,
    kCatastrophic  = 1,
    kInvalidInput  = 2,  // 잘못된 테이블명 등 요청 자체의 오류
    kCommandFailed = 3,
};

struct QueryError {
    QueryErrorCode code{QueryErrorCode::kDenied};
    std::string    message{};
    std::string    context{};
};
