#pragma once

// ---------------------------------------------------------------------------
// format_detail.hpp (테스트 전용 내부 인터페이스)
//
// param_formatter.cpp 내부 detail namespace 의 순수 함수를 노출한다.
// 공개 API(param_formatter.hpp)를 변경하지 않고 테스트 가능성만 확보한다.
// ---------------------------------------------------------------------------

#include "explain/param_formatter.hpp"

#include <span>
#include <string>
#include <string_view>

namespace detail {

// escape_str
//   s 안의 escaper 를 모두 "\" + escaper 로 치환한 뒤 양끝을 escaper 로 감싼다.
//   escaper 가 비어 있으면 모든 UTF-8 문자 앞과 끝에 "\" 를 넣는다 ("ab" → \a\b\).
[[nodiscard]] std::string escape_str(std::string_view s, std::string_view escaper);

// wrap
//   치환 없이 양끝만 escaper 로 감싼다.
[[nodiscard]] std::string wrap(std::string_view s, std::string_view escaper);

// is_printable
//   UTF-8 로 디코드한 모든 코드 포인트가 출력 가능하면 true.
//   잘못된 UTF-8 시퀀스는 U+FFFD (출력 가능) 로 취급한다.
//   판정은 제어/서식/공백/사설/비문자 목록과 plane 2-13 의 미할당 영역 기준이다.
//   BMP 와 plane 1 안의 개별 미할당 코드 포인트(예: U+0378)는 출력 가능으로
//   판정되므로 Unicode 범주 테이블 기반 판정과 다를 수 있다.
[[nodiscard]] bool is_printable(std::span<const std::uint8_t> bytes);

// format_float32 / format_float64
//   고정 소수점 최단 왕복(round-trip) 표현. 지수 표기를 사용하지 않는다.
//   NaN / +Inf / -Inf 는 해당 문자열로 렌더링한다.
[[nodiscard]] std::string format_float32(float v);
[[nodiscard]] std::string format_float64(double v);

// format_fixed6
//   소수점 이하 6자리 고정 표현 (Stringer 기반 float 용).
[[nodiscard]] std::string format_fixed6(double v);

// format_time_text
//   config 의 time_format / fraction_digits / time_zone 으로 시각을 렌더링한다.
//   escape 는 하지 않는다.
[[nodiscard]] std::string format_time_text(SqlTime t, const FormatterConfig& config);

}  // namespace detail
