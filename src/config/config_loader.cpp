// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 ExplainConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 키 누락 또는 null 값(`key:` / `key: ~`) 은 구조체 기본값을 적용한다.
// - 타입이 맞지 않는 값, 알 수 없는 열거 값, 잘못된 regex 는 kInvalidValue.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - numbered_placeholder 에 캡처 그룹이 없으면 모든 매치가 "$$" 로
//   정규화되어 값이 치환되지 않는다. 오류가 아닌 경고로 처리한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr int kMaxFractionDigits = 9;

[[nodiscard]] ConfigError invalid_value(std::string_view key, std::string_view message) {
    return ConfigError{ConfigErrorCode::kInvalidValue, std::string(message), std::string(key)};
}

[[nodiscard]] std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 값을 읽는다.
// 노드가 없거나 null 이면 fallback, 스칼라가 아니거나 변환 실패 시 kInvalidValue.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] std::expected<T, ConfigError> read_scalar(const YAML::Node& node,
                                                        std::string_view  key,
                                                        const T&          fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return std::unexpected(invalid_value(key, "expected a scalar value"));
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        return std::unexpected(invalid_value(key, e.what()));
    }
}

[[nodiscard]] std::expected<ConvertibleType, ConfigError> parse_convertible_type(
    const std::string& raw) {
    const std::string name = to_lower(raw);
    if (name == "time") {
        return ConvertibleType::kTime;
    }
    if (name == "bool") {
        return ConvertibleType::kBool;
    }
    if (name == "bytes") {
        return ConvertibleType::kBytes;
    }
    return std::unexpected(invalid_value(
        "formatter.convertible_types",
        fmt::format("unknown convertible type '{}' (expected time, bool or bytes)", raw)));
}

[[nodiscard]] std::expected<LogLevel, ConfigError> parse_log_level(const std::string& raw) {
    const std::string name = to_lower(raw);
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "info") {
        return LogLevel::kInfo;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    if (name == "silent" || name == "off") {
        return LogLevel::kSilent;
    }
    return std::unexpected(invalid_value(
        "logger.level",
        fmt::format("unknown log level '{}' (expected debug, info, warn, error or silent)", raw)));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: formatter 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<FormatterConfig, ConfigError> parse_formatter(const YAML::Node& node) {
    FormatterConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return std::unexpected(invalid_value("formatter", "expected a map"));
    }

    auto time_format = read_scalar<std::string>(node["time_format"], "formatter.time_format",
                                                cfg.time_format);
    if (!time_format) {
        return std::unexpected(time_format.error());
    }
    cfg.time_format = std::move(*time_format);

    auto digits = read_scalar<int>(node["fraction_digits"], "formatter.fraction_digits",
                                   cfg.fraction_digits);
    if (!digits) {
        return std::unexpected(digits.error());
    }
    if (*digits < 0 || *digits > kMaxFractionDigits) {
        return std::unexpected(invalid_value(
            "formatter.fraction_digits",
            fmt::format("fraction_digits {} out of range 0..{}", *digits, kMaxFractionDigits)));
    }
    cfg.fraction_digits = static_cast<std::uint8_t>(*digits);

    auto trim = read_scalar<bool>(node["trim_fraction_zeros"], "formatter.trim_fraction_zeros",
                                  cfg.trim_fraction_zeros);
    if (!trim) {
        return std::unexpected(trim.error());
    }
    cfg.trim_fraction_zeros = *trim;

    auto zone = read_scalar<std::string>(node["time_zone"], "formatter.time_zone", "utc");
    if (!zone) {
        return std::unexpected(zone.error());
    }
    const std::string zone_name = to_lower(*zone);
    if (zone_name == "utc") {
        cfg.time_zone = TimeZoneMode::kUtc;
    } else if (zone_name == "local") {
        cfg.time_zone = TimeZoneMode::kLocal;
    } else {
        return std::unexpected(invalid_value(
            "formatter.time_zone",
            fmt::format("unknown time_zone '{}' (expected utc or local)", *zone)));
    }

    auto zero_time =
        read_scalar<std::string>(node["zero_time"], "formatter.zero_time", cfg.zero_time);
    if (!zero_time) {
        return std::unexpected(zero_time.error());
    }
    cfg.zero_time = std::move(*zero_time);

    auto null_literal = read_scalar<std::string>(node["null_literal"], "formatter.null_literal",
                                                 cfg.null_literal);
    if (!null_literal) {
        return std::unexpected(null_literal.error());
    }
    if (null_literal->empty()) {
        return std::unexpected(
            invalid_value("formatter.null_literal", "null literal must not be empty"));
    }
    cfg.null_literal = std::move(*null_literal);

    const YAML::Node& types_node = node["convertible_types"];
    if (types_node && !types_node.IsNull()) {
        if (!types_node.IsSequence()) {
            return std::unexpected(
                invalid_value("formatter.convertible_types", "expected a sequence"));
        }
        std::vector<ConvertibleType> types;
        types.reserve(types_node.size());
        for (const auto& item : types_node) {
            auto raw = read_scalar<std::string>(item, "formatter.convertible_types", "");
            if (!raw) {
                return std::unexpected(raw.error());
            }
            auto type = parse_convertible_type(*raw);
            if (!type) {
                return std::unexpected(type.error());
            }
            if (std::find(types.begin(), types.end(), *type) == types.end()) {
                types.push_back(*type);
            }
        }
        cfg.convertible_types = std::move(types);
    }

    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: explain 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ExplainOptions, ConfigError> parse_explain(const YAML::Node& node) {
    ExplainOptions opts{};
    if (!node || node.IsNull()) {
        return opts;
    }
    if (!node.IsMap()) {
        return std::unexpected(invalid_value("explain", "expected a map"));
    }

    auto escaper = read_scalar<std::string>(node["escaper"], "explain.escaper", opts.escaper);
    if (!escaper) {
        return std::unexpected(escaper.error());
    }
    opts.escaper = std::move(*escaper);

    auto pattern = read_scalar<std::string>(node["numbered_placeholder"],
                                            "explain.numbered_placeholder", "");
    if (!pattern) {
        return std::unexpected(pattern.error());
    }
    if (!pattern->empty()) {
        try {
            std::regex re(*pattern, std::regex_constants::ECMAScript);
            if (re.mark_count() == 0) {
                spdlog::warn(
                    "config_loader: numbered_placeholder '{}' has no capture group, "
                    "placeholders will not be substituted",
                    *pattern);
            }
            opts.numbered_placeholder        = std::move(re);
            opts.numbered_placeholder_source = *pattern;
        } catch (const std::regex_error& e) {
            return std::unexpected(invalid_value(
                "explain.numbered_placeholder",
                fmt::format("invalid regex '{}': {}", *pattern, e.what())));
        }
    }

    return opts;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: logger 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<LoggerConfig, ConfigError> parse_logger(const YAML::Node& node) {
    LoggerConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return std::unexpected(invalid_value("logger", "expected a map"));
    }

    auto level = read_scalar<std::string>(node["level"], "logger.level", "info");
    if (!level) {
        return std::unexpected(level.error());
    }
    auto parsed_level = parse_log_level(*level);
    if (!parsed_level) {
        return std::unexpected(parsed_level.error());
    }
    cfg.level = *parsed_level;

    auto log_path =
        read_scalar<std::string>(node["log_path"], "logger.log_path", cfg.log_path.string());
    if (!log_path) {
        return std::unexpected(log_path.error());
    }
    cfg.log_path = *log_path;

    auto slow_ms = read_scalar<std::uint32_t>(
        node["slow_threshold_ms"], "logger.slow_threshold_ms",
        static_cast<std::uint32_t>(cfg.slow_threshold.count()));
    if (!slow_ms) {
        return std::unexpected(slow_ms.error());
    }
    cfg.slow_threshold = std::chrono::milliseconds(*slow_ms);

    auto ignore_not_found = read_scalar<bool>(
        node["ignore_record_not_found"], "logger.ignore_record_not_found",
        cfg.ignore_record_not_found);
    if (!ignore_not_found) {
        return std::unexpected(ignore_not_found.error());
    }
    cfg.ignore_record_not_found = *ignore_not_found;

    auto parameterized = read_scalar<bool>(node["parameterized_queries"],
                                           "logger.parameterized_queries",
                                           cfg.parameterized_queries);
    if (!parameterized) {
        return std::unexpected(parameterized.error());
    }
    cfg.parameterized_queries = *parameterized;

    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 최상위 노드 파싱. origin 은 로그용 (파일 경로 또는 "<inline>")
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ExplainConfig, ConfigError> parse_root(const YAML::Node& root,
                                                                   const std::string& origin) {
    ExplainConfig cfg{};

    if (!root || root.IsNull()) {
        spdlog::info("config_loader: '{}' is empty, using defaults", origin);
        return cfg;
    }
    if (!root.IsMap()) {
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidYaml,
                                           "top-level node is not a YAML map", origin});
    }

    auto formatter = parse_formatter(root["formatter"]);
    if (!formatter) {
        spdlog::error("config_loader: {} ({}): {}", origin, formatter.error().context,
                      formatter.error().message);
        return std::unexpected(formatter.error());
    }
    cfg.formatter = std::move(*formatter);

    auto explain = parse_explain(root["explain"]);
    if (!explain) {
        spdlog::error("config_loader: {} ({}): {}", origin, explain.error().context,
                      explain.error().message);
        return std::unexpected(explain.error());
    }
    cfg.explain = std::move(*explain);

    auto logger = parse_logger(root["logger"]);
    if (!logger) {
        spdlog::error("config_loader: {} ({}): {}", origin, logger.error().context,
                      logger.error().message);
        return std::unexpected(logger.error());
    }
    cfg.logger = std::move(*logger);

    spdlog::info(
        "config_loader: config loaded from '{}': escaper='{}', numbered_placeholder='{}', "
        "log_level={}",
        origin, cfg.explain.escaper, cfg.explain.numbered_placeholder_source,
        static_cast<int>(cfg.logger.level));

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<ExplainConfig, ConfigError> ConfigLoader::load(
    const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec) || ec) {
        const std::string msg =
            fmt::format("config file '{}' does not exist", config_path.string());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(
            ConfigError{ConfigErrorCode::kFileNotFound, msg, config_path.string()});
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string msg =
            fmt::format("cannot open file '{}': {}", config_path.string(), e.what());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(
            ConfigError{ConfigErrorCode::kFileNotFound, msg, config_path.string()});
    } catch (const YAML::ParserException& e) {
        const std::string msg = fmt::format(
            "YAML parse error in '{}' at line {}, col {}: {}", config_path.string(),
            e.mark.line + 1,  // yaml-cpp는 0-based
            e.mark.column + 1, e.what());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(
            ConfigError{ConfigErrorCode::kInvalidYaml, msg, config_path.string()});
    } catch (const YAML::Exception& e) {
        const std::string msg =
            fmt::format("YAML error in '{}': {}", config_path.string(), e.what());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(
            ConfigError{ConfigErrorCode::kInvalidYaml, msg, config_path.string()});
    }

    return parse_root(root, config_path.string());
}

// ---------------------------------------------------------------------------
// ConfigLoader::parse
// ---------------------------------------------------------------------------
std::expected<ExplainConfig, ConfigError> ConfigLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string msg = fmt::format("YAML parse error at line {}, col {}: {}",
                                            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidYaml, msg, "<inline>"});
    } catch (const YAML::Exception& e) {
        const std::string msg = fmt::format("YAML error: {}", e.what());
        spdlog::error("config_loader: {}", msg);
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidYaml, msg, "<inline>"});
    }

    return parse_root(root, "<inline>");
}
