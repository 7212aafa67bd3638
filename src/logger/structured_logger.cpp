// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 SQL 추적 JSON 로거 구현.
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

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    const auto millis  = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds);

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(seconds);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
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

const char* event_name(TraceEvent event) {
    switch (event) {
        case TraceEvent::kSql:
            return "sql";
        case TraceEvent::kSlowSql:
            return "slow_sql";
        case TraceEvent::kSqlError:
            return "sql_error";
    }
    return "sql";
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        case LogLevel::kSilent:
            return static_cast<int>(spdlog::level::off);
    }
    return static_cast<int>(spdlog::level::info);
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LoggerConfig                          config,
                                   ExplainOptions                        explain_options,
                                   std::shared_ptr<const ParamFormatter> formatter)
    : config_(std::move(config))
    , explain_options_(std::move(explain_options))
    , explainer_(std::move(formatter))
{
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        if (!config_.log_path.empty()) {
            if (config_.log_path.has_parent_path()) {
                std::filesystem::create_directories(config_.log_path.parent_path());
            }

            // Rotating file sink (100MB, 3개 파일 유지)
            const std::size_t max_file_size = 100 * 1024 * 1024;
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.log_path.string(), max_file_size, max_files));
        }

        // 레지스트리에 등록하지 않는다: 인스턴스마다 독립 로거
        logger_ = std::make_shared<spdlog::logger>("sqlexplain", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(config_.level)));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 log_trace 에서 JSON 으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

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

// ---------------------------------------------------------------------------
// explain
// ---------------------------------------------------------------------------
std::string StructuredLogger::explain(std::string_view             sql,
                                      const std::vector<SqlValue>& values) const {
    if (config_.parameterized_queries) {
        return std::string(sql);
    }

    const std::regex* pattern = explain_options_.numbered_placeholder
                                    ? &*explain_options_.numbered_placeholder
                                    : nullptr;
    return explainer_.explain(sql, pattern, explain_options_.escaper, values);
}

// ---------------------------------------------------------------------------
// trace: 기록 규칙 적용
// ---------------------------------------------------------------------------
void StructuredLogger::trace(std::chrono::steady_clock::time_point begin,
                             const TraceFn&                        fc,
                             const std::optional<TraceError>&      error,
                             std::source_location                  location) {
    if (!logger_ || config_.level == LogLevel::kSilent) {
        return;
    }

    const auto elapsed = std::chrono::steady_clock::now() - begin;

    SqlTraceLog entry;
    entry.elapsed   = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    entry.caller    = std::string(location.file_name()) + ":" + std::to_string(location.line());
    entry.timestamp = std::chrono::system_clock::now();

    const bool report_error =
        error.has_value() && config_.level <= LogLevel::kError &&
        !(error->record_not_found && config_.ignore_record_not_found);
    const bool report_slow =
        config_.slow_threshold.count() != 0 && elapsed > config_.slow_threshold &&
        config_.level <= LogLevel::kWarn;

    if (report_error) {
        entry.event = TraceEvent::kSqlError;
        entry.error = error->message;
    } else if (report_slow) {
        entry.event          = TraceEvent::kSlowSql;
        entry.slow_threshold = config_.slow_threshold;
    } else if (config_.level <= LogLevel::kInfo) {
        entry.event = TraceEvent::kSql;
    } else {
        return;
    }

    auto [sql, rows] = fc();
    entry.sql  = std::move(sql);
    entry.rows = rows;

    log_trace(entry);
}

// ---------------------------------------------------------------------------
// log_trace: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_trace(const SqlTraceLog& entry) {
    if (!logger_) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << event_name(entry.event) << R"(","caller":")"
         << escape_json_string(entry.caller) << R"(","elapsed_ms":)" << std::fixed
         << std::setprecision(3)
         << static_cast<double>(entry.elapsed.count()) / 1e6 << R"(,"rows":)";

    if (entry.rows < 0) {
        json << R"("-")";
    } else {
        json << entry.rows;
    }

    json << R"(,"sql":")" << escape_json_string(entry.sql) << '"';

    if (entry.event == TraceEvent::kSqlError && entry.error.has_value()) {
        json << R"(,"error":")" << escape_json_string(*entry.error) << '"';
    }
    if (entry.event == TraceEvent::kSlowSql) {
        json << R"(,"slow_threshold_ms":)" << entry.slow_threshold.count();
    }

    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    switch (entry.event) {
        case TraceEvent::kSqlError:
            logger_->error(json.str());
            break;
        case TraceEvent::kSlowSql:
            logger_->warn(json.str());
            break;
        case TraceEvent::kSql:
            logger_->info(json.str());
            break;
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
