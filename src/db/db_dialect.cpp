// ---------------------------------------------------------------------------
// db_dialect.cpp
// ---------------------------------------------------------------------------

#include "db/db_dialect.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

std::optional<DatabaseType> parse_database_type(std::string_view text) {
    const std::string lower = to_lower(text);
    if (lower.empty() || lower == "mysql") {
        return DatabaseType::kMysql;
    }
    if (lower == "mariadb") {
        return DatabaseType::kMariadb;
    }
    if (lower == "postgres" || lower == "postgresql") {
        return DatabaseType::kPostgres;
    }
    return std::nullopt;
}

std::string_view database_type_name(DatabaseType type) noexcept {
    switch (type) {
        case DatabaseType::kMysql:    return "mysql";
        case DatabaseType::kMariadb:  return "mariadb";
        case DatabaseType::kPostgres: return "postgres";
        default:                      return "mysql";
    }
}

DbCommands db_commands(DatabaseType type) noexcept {
    DbCommands cmds;
    cmds.type = type;

    switch (type) {
        case DatabaseType::kPostgres:
            cmds.client         = "psql";
            cmds.command_flag   = "-c";
            cmds.database_flag  = "-d";
            cmds.list_tables    = "\\dt";
            cmds.list_databases = "\\l";
            break;

        case DatabaseType::kMysql:
        case DatabaseType::kMariadb:
        default:
            cmds.client         = "mysql";
            cmds.command_flag   = "-e";
            cmds.database_flag  = "-D";
            cmds.list_tables    = "SHOW TABLES;";
            cmds.list_databases = "SHOW DATABASES;";
            break;
    }

    return cmds;
}

std::string DbCommands::describe_table(std::string_view table) const {
    if (type == DatabaseType::kPostgres) {
        return fmt::format("\\d {}", table);
    }
    return fmt::format("DESCRIBE {};", table);
}
