#pragma once

// ---------------------------------------------------------------------------
// db_dialect.hpp
//
// 프로젝트 DB 종류와 종류별 클라이언트 커맨드 어휘.
// postgres 는 psql 메타 커맨드(\dt, \d, \l)를, mysql/mariadb 는 SHOW/DESCRIBE
// 구문을 쓴다. 두 형태 모두 QueryClassifier 의 whitelist 에 포함된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class DatabaseType : std::uint8_t {
    kMysql    = 0,
    kMariadb  = 1,
    kPostgres = 2,
};

// ---------------------------------------------------------------------------
// DbCommands
//   client        : 컨테이너 안에서 실행할 클라이언트 ("mysql" | "psql")
//   command_flag  : 쿼리 전달 플래그 ("-e" | "-c")
//   database_flag : 데이터베이스 지정 플래그 ("-D" | "-d")
// ---------------------------------------------------------------------------
struct DbCommands {
    std::string_view client{};
    std::string_view command_flag{};
    std::string_view database_flag{};
    std::string_view list_tables{};
    std::string_view list_databases{};

    [[nodiscard]] std::string describe_table(std::string_view table) const;

    DatabaseType type{DatabaseType::kMysql};
};

// parse_database_type
//   대소문자 무관. 빈 문자열은 mysql (ddev 기본값). 알 수 없는 값은 std::nullopt.
[[nodiscard]] std::optional<DatabaseType> parse_database_type(std::string_view text);

[[nodiscard]] std::string_view database_type_name(DatabaseType type) noexcept;

[[nodiscard]] DbCommands db_commands(DatabaseType type) noexcept;
