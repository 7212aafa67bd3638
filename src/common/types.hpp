#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SqlTime / NullableSqlTime
//   바인딩 파라미터로 전달되는 시각 값.
//   값 초기화된 time_point{} 를 "zero time" 으로 취급한다.
// ---------------------------------------------------------------------------
using SqlTime         = std::chrono::system_clock::time_point;
using NullableSqlTime = std::optional<SqlTime>;

// ---------------------------------------------------------------------------
// Bytes
//   BLOB/VARBINARY 바인딩 값. 출력 가능 문자만 있으면 문자열로 취급된다.
// ---------------------------------------------------------------------------
using Bytes = std::vector<std::uint8_t>;

// ---------------------------------------------------------------------------
// ConfigErrorCode
//   설정 로드 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kFileNotFound = 0,  // 설정 파일이 존재하지 않음
    kInvalidYaml  = 1,  // YAML 문법 오류
    kInvalidValue = 2,  // 값의 범위/형식 오류 (잘못된 regex 포함)
};

// ---------------------------------------------------------------------------
// ConfigError
//   설정 로드 실패 시 반환되는 오류 정보.
//   std::expected<T, ConfigError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kInvalidValue};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 오류가 발생한 키 또는 경로 (로깅용)
};
