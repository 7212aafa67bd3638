#pragma once

// ---------------------------------------------------------------------------
// param_formatter.hpp
//
// 바인딩 파라미터 하나를 SQL 리터럴 텍스트로 변환하는 포매터.
//
// [설계 원칙]
// - 싱글턴 금지: ParamFormatter 는 단일 메서드 인터페이스이며 SqlExplainer 에
//   생성자 주입한다. 프로세스 기본 인스턴스(default_param_formatter)는
//   최초 호출 시 한 번 생성되고 이후 읽기 전용이다.
// - FormatterConfig 는 생성 후 변경되지 않는다. 동시 호출 시 잠금 불필요.
//
// [렌더링 규칙 (우선순위 순)]
//   1. bool                 → true / false
//   2. SqlTime              → zero time 이면 zero_time 리터럴, 아니면 time_format (escape)
//   3. NullableSqlTime      → 값 없음: null 리터럴 / 값 있음: 2번
//   4. DriverValuer         → nullptr: null 리터럴 / value() 결과를 재귀 렌더링
//   5. Stringer             → 기반 표현에 따라 정수/소수(6자리)/bool/escape 문자열
//   6. Bytes                → 출력 가능 문자만: escape 문자열 / 아니면 '<binary>'
//   7. 정수                 → 10진수 (escape 없음)
//   8. float                → 32비트 정밀도 최단 표현
//   9. double               → 64비트 정밀도 최단 표현
//  10. std::string          → escape
//  11. fallback             → SqlRef 역참조, GenericValue 변환/문자열화
//
// [민감정보 취급 주의]
// - 출력은 바인딩 값 원문을 포함한다. 실행 경로에 전달하지 말 것
//   (escape 는 표시용이며 SQL Injection 방어가 아니다).
// ---------------------------------------------------------------------------

#include "explain/sql_value.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// TimeZoneMode
//   시각 렌더링 시 사용할 시간대.
// ---------------------------------------------------------------------------
enum class TimeZoneMode : std::uint8_t {
    kUtc   = 0,
    kLocal = 1,
};

// ---------------------------------------------------------------------------
// FormatterConfig
//   time_format         : strftime 패턴 (소수 초 제외)
//   fraction_digits     : 초 뒤에 붙일 소수 자릿수 (0 = 생략, 최대 9)
//   trim_fraction_zeros : 소수부 끝의 0 제거, 모두 0 이면 '.' 까지 생략
//   zero_time           : zero time 대체 리터럴 (빈 문자열 = time_format 으로 렌더링)
//   null_literal        : NULL 값 리터럴 (escape 하지 않음)
//   convertible_types   : GenericValue 변환 시도 순서
// ---------------------------------------------------------------------------
struct FormatterConfig {
    std::string                  time_format{"%Y-%m-%d %H:%M:%S"};
    std::uint8_t                 fraction_digits{3};
    bool                         trim_fraction_zeros{true};
    TimeZoneMode                 time_zone{TimeZoneMode::kUtc};
    std::string                  zero_time{"0000-00-00 00:00:00"};
    std::string                  null_literal{"NULL"};
    std::vector<ConvertibleType> convertible_types{
        ConvertibleType::kTime, ConvertibleType::kBool, ConvertibleType::kBytes};
};

// ---------------------------------------------------------------------------
// ParamFormatter
//   값 하나를 escaper 로 감싼 SQL 리터럴 텍스트로 변환한다.
//   실패하지 않는다: 알 수 없는 값은 일반 문자열 표현으로 대체한다.
// ---------------------------------------------------------------------------
class ParamFormatter {
public:
    virtual ~ParamFormatter() = default;

    [[nodiscard]] virtual std::string format(const SqlValue& value,
                                             std::string_view escaper) const = 0;
};

// ---------------------------------------------------------------------------
// DefaultParamFormatter
// ---------------------------------------------------------------------------
class DefaultParamFormatter final : public ParamFormatter {
public:
    explicit DefaultParamFormatter(FormatterConfig config = {});

    ~DefaultParamFormatter() override = default;

    DefaultParamFormatter(const DefaultParamFormatter&)            = default;
    DefaultParamFormatter& operator=(const DefaultParamFormatter&) = default;
    DefaultParamFormatter(DefaultParamFormatter&&)                 = default;
    DefaultParamFormatter& operator=(DefaultParamFormatter&&)      = default;

    [[nodiscard]] std::string format(const SqlValue& value,
                                     std::string_view escaper) const override;

    [[nodiscard]] const FormatterConfig& config() const noexcept { return config_; }

private:
    // depth: DriverValuer / SqlRef / 변환으로 재귀한 횟수
    [[nodiscard]] std::string format_impl(const SqlValue& value,
                                          std::string_view escaper,
                                          int depth) const;
    [[nodiscard]] std::string format_time(SqlTime t, std::string_view escaper) const;
    [[nodiscard]] std::string format_valuer(const DriverValuer& valuer,
                                            std::string_view escaper,
                                            int depth) const;
    [[nodiscard]] std::string format_stringer(const Stringer& stringer,
                                              std::string_view escaper) const;
    [[nodiscard]] std::string format_generic(const GenericValue& generic,
                                             std::string_view escaper,
                                             int depth) const;
    [[nodiscard]] std::string format_null() const { return config_.null_literal; }

    FormatterConfig config_;
};

// ---------------------------------------------------------------------------
// default_param_formatter
//   기본 FormatterConfig 로 구성된 프로세스 공유 포매터.
// ---------------------------------------------------------------------------
[[nodiscard]] std::shared_ptr<const ParamFormatter> default_param_formatter();
