#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - sql 은 바인딩 값이 치환된 SQL 전체를 포함한다. 운영 환경에서는
//   parameterized_queries 옵션으로 값 기록을 끌 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
//   kSilent 는 SQL 추적 로그를 모두 끈다.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug  = 0,
    kInfo   = 1,
    kWarn   = 2,
    kError  = 3,
    kSilent = 4,
};

// ---------------------------------------------------------------------------
// TraceError
//   SQL 실행 실패 정보.
//   record_not_found: 조회 결과 없음 오류. ignore_record_not_found 설정 시
//   에러 로그 대상에서 제외된다.
// ---------------------------------------------------------------------------
struct TraceError {
    std::string message{};
    bool        record_not_found{false};
};

// ---------------------------------------------------------------------------
// TraceEvent
//   SQL 추적 로그 종류.
// ---------------------------------------------------------------------------
enum class TraceEvent : std::uint8_t {
    kSql      = 0,  // "sql"       : 일반 실행 (info)
    kSlowSql  = 1,  // "slow_sql"  : slow_threshold 초과 (warn)
    kSqlError = 2,  // "sql_error" : 실행 실패 (error)
};

// ---------------------------------------------------------------------------
// SqlTraceLog
//   SQL 실행 추적 로그 한 건.
//
//   rows: 영향받은 행 수. -1 이면 알 수 없음 ("-" 로 기록)
// ---------------------------------------------------------------------------
struct SqlTraceLog {
    TraceEvent                            event{TraceEvent::kSql};
    std::string                           caller{};     // "file:line"
    std::string                           sql{};        // 렌더링된 SQL (마스킹 주의)
    std::int64_t                          rows{-1};
    std::chrono::nanoseconds              elapsed{0};
    std::optional<std::string>            error{};      // kSqlError 일 때만
    std::chrono::milliseconds             slow_threshold{0};  // kSlowSql 일 때만 기록
    std::chrono::system_clock::time_point timestamp{};
};
