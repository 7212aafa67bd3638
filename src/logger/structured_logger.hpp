#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 SQL 추적(trace) JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 포매터/설정 의존성을 명시한다.
// - trace() 는 SQL 렌더링 콜백을 지연 호출한다. 기록 대상이 아닌 레벨에서는
//   바인딩 값 렌더링 비용이 발생하지 않는다.
// - parameterized_queries 가 켜져 있으면 explain() 은 템플릿을 그대로
//   반환한다 (바인딩 값 비노출).
//
// [기록 규칙 (우선순위 순)]
//   1. error 있음 && level <= kError && !(record_not_found && ignore_record_not_found)
//      → "sql_error" (error)
//   2. elapsed > slow_threshold && slow_threshold != 0 && level <= kWarn
//      → "slow_sql" (warn)
//   3. level <= kInfo → "sql" (info)
// ---------------------------------------------------------------------------

#include "explain/param_formatter.hpp"
#include "explain/sql_explainer.hpp"
#include "log_types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// LoggerConfig
//   log_path 가 비어 있으면 stdout 싱크만 사용한다.
// ---------------------------------------------------------------------------
struct LoggerConfig {
    LogLevel                  level{LogLevel::kInfo};
    std::filesystem::path     log_path{"/tmp/sqlexplain.log"};
    std::chrono::milliseconds slow_threshold{200};  // 0 = slow SQL 탐지 끔
    bool                      ignore_record_not_found{false};
    bool                      parameterized_queries{false};
};

// ---------------------------------------------------------------------------
// StructuredLogger
//   SqlTraceLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // TraceFn
    //   {렌더링된 SQL, 영향받은 행 수(-1 = 알 수 없음)} 를 반환하는 콜백.
    using TraceFn = std::function<std::pair<std::string, std::int64_t>()>;

    explicit StructuredLogger(
        LoggerConfig                          config,
        ExplainOptions                        explain_options = {},
        std::shared_ptr<const ParamFormatter> formatter       = default_param_formatter());

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // explain
    //   설정된 escaper / numbered_placeholder 로 SQL 을 렌더링한다.
    //   parameterized_queries 이면 sql 원문을 그대로 반환한다.
    [[nodiscard]] std::string explain(std::string_view sql,
                                      const std::vector<SqlValue>& values) const;

    // trace
    //   begin 부터 현재까지의 소요 시간으로 기록 규칙을 적용한다.
    //   [고빈도 호출 경로] fc 는 기록이 결정된 경우에만 호출된다.
    void trace(std::chrono::steady_clock::time_point begin,
               const TraceFn&                        fc,
               const std::optional<TraceError>&      error    = std::nullopt,
               std::source_location                  location = std::source_location::current());

    // log_trace
    //   이미 구성된 SqlTraceLog 한 건을 JSON 으로 기록한다.
    void log_trace(const SqlTraceLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] const LoggerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] static int to_spdlog_level(LogLevel level);

    LoggerConfig                    config_;
    ExplainOptions                  explain_options_;
    SqlExplainer                    explainer_;
    std::shared_ptr<spdlog::logger> logger_;
};
