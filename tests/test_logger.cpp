// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - ValidationLog / ExecutionLog JSON 필드
// - 허용/차단 이벤트 이름과 레벨
// - 로그 레벨 필터링, JSON 이스케이프, 멀티스레드 로깅
// - parse_log_level / verdict_name
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 파싱 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }

        pos += search_key.length();

        // Skip whitespace
        while (pos < parsed_.size() && std::isspace(static_cast<unsigned char>(parsed_[pos]))) {
            ++pos;
        }

        if (pos >= parsed_.size()) {
            return "";
        }

        // Extract value (string, number or boolean)
        std::ostringstream oss;

        if (parsed_[pos] == '"') {
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            while (pos < parsed_.size() &&
                   (std::isalnum(static_cast<unsigned char>(parsed_[pos])) ||
                    parsed_[pos] == '-' || parsed_[pos] == '.' || parsed_[pos] == '+')) {
                oss << parsed_[pos];
                ++pos;
            }
        }

        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "querygate_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip timestamps and keep only JSON part
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: 허용된 쿼리의 ValidationLog
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ValidationLogAllowedJsonFields) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ValidationLog entry;
    entry.raw_sql      = "SELECT * FROM users WHERE id = 1";
    entry.verdict      = QueryVerdict::kAllowed;
    entry.matched_rule = "select";
    entry.allow_write  = false;
    entry.timestamp    = std::chrono::system_clock::now();
    entry.duration     = std::chrono::microseconds(42);

    logger.log_validation(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0) << "No log lines found";

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("timestamp"));
    EXPECT_TRUE(parser.has_field("reason"));

    EXPECT_EQ(parser.get_field("event"), "query_validated");
    EXPECT_EQ(parser.get_field("verdict"), "allowed");
    EXPECT_EQ(parser.get_field("matched_rule"), "select");
    EXPECT_EQ(parser.get_field("raw_sql"), "SELECT * FROM users WHERE id = 1");
    EXPECT_EQ(parser.get_field("duration_us"), "42");
    EXPECT_NE(lines[0].find(R"("allow_write":false)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 차단된 쿼리의 ValidationLog matched_rule과 reason
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ValidationLogBlockedMatchedRuleAndReason) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    ValidationLog entry;
    entry.raw_sql      = "DROP DATABASE shop";
    entry.verdict      = QueryVerdict::kCatastrophic;
    entry.matched_rule = "drop-database";
    entry.reason       = "permanently blocked";
    entry.allow_write  = true;
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_validation(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "query_blocked");
    EXPECT_EQ(parser.get_field("verdict"), "catastrophic");
    EXPECT_EQ(parser.get_field("matched_rule"), "drop-database");
    EXPECT_EQ(parser.get_field("reason"), "permanently blocked");
    EXPECT_NE(lines[0].find(R"("allow_write":true)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: ExecutionLog JSON 필드
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ExecutionLogJsonFields) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ExecutionLog entry;
    entry.raw_sql       = "SHOW TABLES;";
    entry.database_type = "postgres";
    entry.database      = "shop";
    entry.success       = true;
    entry.exit_code     = 0;
    entry.output_bytes  = 128;
    entry.timestamp     = std::chrono::system_clock::now();
    entry.duration      = std::chrono::microseconds(1500);

    logger.log_execution(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "query_executed");
    EXPECT_EQ(parser.get_field("database_type"), "postgres");
    EXPECT_EQ(parser.get_field("database"), "shop");
    EXPECT_EQ(parser.get_field("exit_code"), "0");
    EXPECT_EQ(parser.get_field("output_bytes"), "128");
    EXPECT_EQ(parser.get_field("duration_us"), "1500");
    EXPECT_NE(lines[0].find(R"("success":true)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    auto now = std::chrono::system_clock::now();

    // Info 레벨의 로그 (필터되어야 함)
    ValidationLog allowed;
    allowed.verdict   = QueryVerdict::kAllowed;
    allowed.timestamp = now;
    logger.log_validation(allowed);

    ExecutionLog executed;
    executed.success   = true;
    executed.timestamp = now;
    logger.log_execution(executed);

    // Warn 레벨의 로그 (기록되어야 함)
    ValidationLog denied;
    denied.verdict   = QueryVerdict::kDenied;
    denied.timestamp = now;
    logger.log_validation(denied);

    logger.flush();

    auto lines = read_log_lines();
    // 차단 로그만 기록되어야 함 (기록된 JSON 라인만 카운트)
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].find("query_blocked") != std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 실패한 실행은 warn 레벨
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, FailedExecutionLoggedAtWarn) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    ExecutionLog entry;
    entry.raw_sql   = "SELECT * FROM nope";
    entry.success   = false;
    entry.exit_code = 1;
    entry.timestamp = std::chrono::system_clock::now();
    logger.log_execution(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1);
    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("exit_code"), "1");
    EXPECT_NE(lines[0].find(R"("success":false)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (크래시 없음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingNoCrash) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    const int                      num_threads = 4;
    const int                      logs_per_thread = 10;
    std::vector<std::thread>       threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            auto now = std::chrono::system_clock::now();
            for (int i = 0; i < logs_per_thread; ++i) {
                ValidationLog entry;
                entry.raw_sql      = "SELECT * FROM table_" + std::to_string(i);
                entry.verdict      = QueryVerdict::kAllowed;
                entry.matched_rule = "select";
                entry.reason       = "thread " + std::to_string(t);
                entry.timestamp    = now;
                logger.log_validation(entry);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    logger.flush();

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ValidationLog entry;
    entry.raw_sql      = "SELECT \"quoted\\path\"\nFROM users\t-- x";
    entry.verdict      = QueryVerdict::kAllowed;
    entry.matched_rule = "select";
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_validation(entry);
    logger.flush();

    auto lines = read_log_lines();
    // 개행이 이스케이프되어 한 줄로 기록되어야 한다
    ASSERT_EQ(lines.size(), 1);
    EXPECT_NE(lines[0].find(R"(\"quoted\\path\"\nFROM users\t-- x)"), std::string::npos);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("matched_rule"), "select");
}

// ---------------------------------------------------------------------------
// Test: 제어 문자는 \u00XX 로 기록
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ControlCharactersEscaped) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ValidationLog entry;
    entry.raw_sql   = std::string("SELECT \x01", 8);
    entry.verdict   = QueryVerdict::kAllowed;
    entry.timestamp = std::chrono::system_clock::now();

    logger.log_validation(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1);
    EXPECT_NE(lines[0].find(R"(SELECT \u0001)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 로그 디렉터리 자동 생성
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, CreatesMissingParentDirectory) {
    const fs::path nested = log_dir_ / "a" / "b" / "audit.log";
    {
        StructuredLogger logger(LogLevel::kInfo, nested);
        ValidationLog entry;
        entry.verdict = QueryVerdict::kDenied;
        logger.log_validation(entry);
    }
    EXPECT_TRUE(fs::exists(nested));
}

// ---------------------------------------------------------------------------
// Test: parse_log_level / verdict_name
// ---------------------------------------------------------------------------
TEST(LogTypes, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("nonsense"), LogLevel::kInfo);
}

TEST(LogTypes, VerdictName) {
    EXPECT_STREQ(verdict_name(QueryVerdict::kAllowed), "allowed");
    EXPECT_STREQ(verdict_name(QueryVerdict::kDenied), "denied");
    EXPECT_STREQ(verdict_name(QueryVerdict::kCatastrophic), "catastrophic");
}
