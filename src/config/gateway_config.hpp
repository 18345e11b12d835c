#pragma once

// ---------------------------------------------------------------------------
// gateway_config.hpp
//
// 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/querygate.yaml 에서 로드되고, main 에서
// 환경변수로 덮어쓴다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없어도 안전한 기본값
//   (read-only 모드)으로 동작한다.
// - allow_write 의 기본값은 false. catastrophic 규칙은 이 값과 무관하다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

#include "db/db_dialect.hpp"  // DatabaseType

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/querygate.log"};
};

// ---------------------------------------------------------------------------
// SecurityConfig
//   allow_write: true 이면 whitelist 밖의 비파괴 쿼리(INSERT/UPDATE/DDL)를 허용.
//   extra_catastrophic_patterns: 내장 규칙 뒤에 추가되는 영구 차단 정규식.
//     정규화된(대문자) SQL 에 매칭되며 *, + 반복을 쓰지 않아야 한다.
// ---------------------------------------------------------------------------
struct SecurityConfig {
    bool                     allow_write{false};
    std::vector<std::string> extra_catastrophic_patterns{};
};

// ---------------------------------------------------------------------------
// DatabaseConfig
//   name: 기본 데이터베이스. 빈 문자열이면 클라이언트 기본값 사용.
// ---------------------------------------------------------------------------
struct DatabaseConfig {
    DatabaseType type{DatabaseType::kMysql};
    std::string  name{};
};

// ---------------------------------------------------------------------------
// DdevConfig
//   binary: PATH 에서 찾을 실행 파일 이름 또는 절대 경로
//   project_dir: ddev 를 실행할 작업 디렉터리 (프로젝트 루트)
// ---------------------------------------------------------------------------
struct DdevConfig {
    std::string   binary{"ddev"};
    std::string   project_dir{"."};
    std::uint32_t command_timeout_sec{30};
};

// ---------------------------------------------------------------------------
// GatewayConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 의 반환값.
// ---------------------------------------------------------------------------
struct GatewayConfig {
    GlobalConfig   global{};
    SecurityConfig security{};
    DatabaseConfig database{};
    DdevConfig     ddev{};
};
