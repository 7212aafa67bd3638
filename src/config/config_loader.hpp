#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드하여 ExplainConfig 로 파싱하는 로더.
//
// [설계 원칙]
// - load()/parse() 실패 시 std::unexpected(ConfigError) 반환.
//   부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 키가 없으면 구조체 기본값을 적용한다.
// - 잘못된 값(알 수 없는 레벨, 잘못된 regex 등)은 무시하지 않고 오류로
//   처리한다. 설정 실수를 조기에 드러내기 위함이다.
//
// [순환 의존성]
// config_loader.hpp → param_formatter.hpp / sql_explainer.hpp / structured_logger.hpp
// (단방향만)
// ---------------------------------------------------------------------------

#include "common/types.hpp"             // ConfigError
#include "explain/param_formatter.hpp"  // FormatterConfig
#include "explain/sql_explainer.hpp"    // ExplainOptions
#include "logger/structured_logger.hpp" // LoggerConfig

#include <expected>
#include <filesystem>
#include <string_view>

// ---------------------------------------------------------------------------
// ExplainConfig
//   설정 파일 최상위 구조.
//     formatter: FormatterConfig
//     explain  : ExplainOptions
//     logger   : LoggerConfig
// ---------------------------------------------------------------------------
struct ExplainConfig {
    FormatterConfig formatter{};
    ExplainOptions  explain{};
    LoggerConfig    logger{};
};

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 ExplainConfig 로 파싱한다.
    //   파일 없음: kFileNotFound / 문법 오류: kInvalidYaml / 값 오류: kInvalidValue
    [[nodiscard]] static std::expected<ExplainConfig, ConfigError>
    load(const std::filesystem::path& config_path);

    // parse
    //   YAML 텍스트를 직접 파싱한다 (테스트, 내장 설정용).
    [[nodiscard]] static std::expected<ExplainConfig, ConfigError>
    parse(std::string_view yaml_text);
};
