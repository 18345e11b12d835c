// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
static std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

// ---------------------------------------------------------------------------
// log_types.hpp 자유 함수
// ---------------------------------------------------------------------------
LogLevel parse_log_level(const std::string& name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

const char* verdict_name(QueryVerdict verdict) noexcept {
    switch (verdict) {
        case QueryVerdict::kAllowed:      return "allowed";
        case QueryVerdict::kDenied:       return "denied";
        case QueryVerdict::kCatastrophic: return "catastrophic";
        default:                          return "denied";
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level,
                                   const std::filesystem::path& log_path,
                                   bool to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (10MB, 3개 파일 유지)
        const std::size_t max_file_size = 10 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 레지스트리에 등록하지 않는다 (인스턴스마다 독립된 로거).
        logger_ = std::make_shared<spdlog::logger>("querygate-audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 타임스탬프만 앞에 붙인다.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_validation: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_validation(const ValidationLog& entry) {
    const bool blocked = entry.verdict != QueryVerdict::kAllowed;
    const LogLevel level = blocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << (blocked ? "query_blocked" : "query_validated")
         << R"(","verdict":")" << verdict_name(entry.verdict)
         << R"(","matched_rule":")" << escape_json_string(entry.matched_rule)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","allow_write":)" << (entry.allow_write ? "true" : "false")
         << R"(,"raw_sql":")" << escape_json_string(entry.raw_sql)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    if (blocked) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_execution: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_execution(const ExecutionLog& entry) {
    const LogLevel level = entry.success ? LogLevel::kInfo : LogLevel::kWarn;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query_executed","database_type":")"
         << escape_json_string(entry.database_type)
         << R"(","database":")" << escape_json_string(entry.database)
         << R"(","success":)" << (entry.success ? "true" : "false")
         << R"(,"exit_code":)" << entry.exit_code
         << R"(,"output_bytes":)" << entry.output_bytes
         << R"(,"raw_sql":")" << escape_json_string(entry.raw_sql)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    if (entry.success) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}
