// ---------------------------------------------------------------------------
// test_db_dialect.cpp
//
// DatabaseType 파싱 및 DB 종류별 클라이언트 커맨드 테스트.
// ---------------------------------------------------------------------------

#include "db/db_dialect.hpp"
#include "policy/query_classifier.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(DbDialect, ParseDatabaseType) {
    EXPECT_EQ(parse_database_type("mysql"), DatabaseType::kMysql);
    EXPECT_EQ(parse_database_type("MariaDB"), DatabaseType::kMariadb);
    EXPECT_EQ(parse_database_type("postgres"), DatabaseType::kPostgres);
    EXPECT_EQ(parse_database_type("PostgreSQL"), DatabaseType::kPostgres);
}

TEST(DbDialect, EmptyTypeDefaultsToMysql) {
    EXPECT_EQ(parse_database_type(""), DatabaseType::kMysql);
}

TEST(DbDialect, UnknownTypeRejected) {
    EXPECT_FALSE(parse_database_type("oracle").has_value());
    EXPECT_FALSE(parse_database_type("mysql ").has_value());
}

TEST(DbDialect, TypeNames) {
    EXPECT_EQ(database_type_name(DatabaseType::kMysql), "mysql");
    EXPECT_EQ(database_type_name(DatabaseType::kMariadb), "mariadb");
    EXPECT_EQ(database_type_name(DatabaseType::kPostgres), "postgres");
}

TEST(DbDialect, MysqlCommands) {
    const auto cmds = db_commands(DatabaseType::kMysql);
    EXPECT_EQ(cmds.client, "mysql");
    EXPECT_EQ(cmds.command_flag, "-e");
    EXPECT_EQ(cmds.database_flag, "-D");
    EXPECT_EQ(cmds.list_tables, "SHOW TABLES;");
    EXPECT_EQ(cmds.list_databases, "SHOW DATABASES;");
    EXPECT_EQ(cmds.describe_table("users"), "DESCRIBE users;");
}

TEST(DbDialect, MariadbUsesMysqlClient) {
    const auto cmds = db_commands(DatabaseType::kMariadb);
    EXPECT_EQ(cmds.client, "mysql");
    EXPECT_EQ(cmds.type, DatabaseType::kMariadb);
}

TEST(DbDialect, PostgresCommands) {
    const auto cmds = db_commands(DatabaseType::kPostgres);
    EXPECT_EQ(cmds.client, "psql");
    EXPECT_EQ(cmds.command_flag, "-c");
    EXPECT_EQ(cmds.database_flag, "-d");
    EXPECT_EQ(cmds.list_tables, "\\dt");
    EXPECT_EQ(cmds.list_databases, "\\l");
    EXPECT_EQ(cmds.describe_table("users"), "\\d users");
}

TEST(DbDialect, IntrospectionCommandsPassReadOnlyClassifier) {
    for (const auto type : {DatabaseType::kMysql, DatabaseType::kPostgres}) {
        const auto cmds = db_commands(type);
        EXPECT_TRUE(validate_query_security(cmds.list_tables, false).allowed());
        EXPECT_TRUE(validate_query_security(cmds.list_databases, false).allowed());
        EXPECT_TRUE(validate_query_security(cmds.describe_table("shop.users"), false).allowed());
    }
}
