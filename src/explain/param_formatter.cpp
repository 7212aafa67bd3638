// ---------------------------------------------------------------------------
// param_formatter.cpp
//
// 바인딩 파라미터 → SQL 리터럴 텍스트 변환 구현.
//
// [알려진 한계]
// - escape 는 escaper 앞에 '\' 만 붙인다. 이미 존재하는 '\' 는 이중화하지
//   않으므로 출력은 실행 가능한 SQL 이 아니다 (로그 전용).
// - is_printable 은 Unicode 전체 범주 테이블이 아닌 제어/서식/공백/사설 영역
//   코드 포인트 목록으로 판정한다. plane 2-13 의 미할당 영역은 출력 불가,
//   BMP/plane 1 의 개별 미할당 코드 포인트는 출력 가능으로 본다.
// - DriverValuer / SqlRef 가 자기 자신을 반환하는 순환은 kMaxUnwrapDepth
//   에서 끊고 null 리터럴로 렌더링한다.
// ---------------------------------------------------------------------------

#include "explain/param_formatter.hpp"
#include "explain/format_detail.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

namespace {

constexpr int         kMaxUnwrapDepth = 32;
constexpr const char* kBinaryToken    = "<binary>";

// 고정 소수점 표현의 최대 길이: DBL_MAX (309자리) 및 최소 subnormal (소수 324자리)
constexpr std::size_t kFloatBufferSize = 512;

// 출력 불가 코드 포인트 판정.
// 제어 문자(Cc), 서식 문자(Cf), ASCII space 이외의 공백(Z*), 사설 영역(Co),
// 비문자(noncharacter) 를 출력 불가로 본다.
bool is_printable_rune(char32_t cp) {
    if (cp < 0x20 || cp == 0x7F) {
        return false;
    }
    if (cp < 0x7F) {
        return true;
    }
    if (cp <= 0xA0 || cp == 0xAD) {
        return false;  // C1 제어 문자, NBSP, soft hyphen
    }
    if (cp == 0x061C || cp == 0x1680 || cp == 0x180E || cp == 0x3000 || cp == 0xFEFF) {
        return false;
    }
    if ((cp >= 0x2000 && cp <= 0x200F) || (cp >= 0x2028 && cp <= 0x202F) ||
        (cp >= 0x205F && cp <= 0x206F)) {
        return false;
    }
    if ((cp >= 0xE000 && cp <= 0xF8FF) || (cp >= 0xFFF9 && cp <= 0xFFFB) ||
        cp == 0xFFFE || cp == 0xFFFF) {
        return false;
    }
    if ((cp >= 0xE0000 && cp <= 0xE007F) || cp >= 0xF0000) {
        return false;  // tag 문자, 사설 영역 plane 15/16
    }
    if ((cp >= 0xFDD0 && cp <= 0xFDEF) || (cp & 0xFFFE) == 0xFFFE) {
        return false;  // 비문자 (모든 plane 의 xxFFFE/xxFFFF 포함)
    }
    if ((cp >= 0x2FA20 && cp <= 0x2FFFF) || (cp >= 0x323B0 && cp <= 0xDFFFF)) {
        return false;  // plane 2 끝, plane 3-13 의 미할당 영역
    }
    return true;
}

// UTF-8 시퀀스 하나를 디코딩한 결과.
// valid 가 false 이면 len 은 1 이고 해당 바이트는 U+FFFD 로 취급한다.
struct Utf8Rune {
    char32_t    cp{0};
    std::size_t len{1};
    bool        valid{false};
};

Utf8Rune decode_utf8(std::span<const std::uint8_t> bytes, std::size_t i) {
    const std::uint8_t lead = bytes[i];
    if (lead < 0x80) {
        return {lead, 1, true};
    }

    std::size_t seq_len{0};
    char32_t    cp{0};
    char32_t    min_cp{0};
    if ((lead & 0xE0) == 0xC0) {
        seq_len = 2;
        cp      = lead & 0x1F;
        min_cp  = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        seq_len = 3;
        cp      = lead & 0x0F;
        min_cp  = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        seq_len = 4;
        cp      = lead & 0x07;
        min_cp  = 0x10000;
    }

    if (seq_len == 0 || i + seq_len > bytes.size()) {
        return {};
    }
    for (std::size_t k = 1; k < seq_len; ++k) {
        const std::uint8_t cont = bytes[i + k];
        if ((cont & 0xC0) != 0x80) {
            return {};
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return {};
    }
    return {cp, seq_len, true};
}

std::span<const std::uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

// 빈 escaper 는 모든 문자 경계에 매치된다: 각 문자 앞과 끝에 '\' 를 넣는다.
std::string escape_at_rune_boundaries(std::string_view s) {
    const auto  bytes = as_bytes(s);
    std::string result;
    result.reserve(s.size() * 2 + 1);

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto rune = decode_utf8(bytes, i);
        result.push_back('\\');
        result.append(s.substr(i, rune.len));
        i += rune.len;
    }
    result.push_back('\\');
    return result;
}

// to_chars(scientific) 의 최단 자릿수를 고정 소수점 표기로 펼친다.
//   "1.2345679e+08" → "123456790", "1e-01" → "0.1"
std::string scientific_to_fixed(std::string_view sci) {
    std::string result;
    if (!sci.empty() && sci.front() == '-') {
        result.push_back('-');
        sci.remove_prefix(1);
    }

    const auto e_pos = sci.find('e');
    std::string digits;
    for (const char ch : sci.substr(0, e_pos)) {
        if (ch != '.') {
            digits.push_back(ch);
        }
    }

    int exponent{0};
    if (e_pos != std::string_view::npos) {
        std::string_view exp_text = sci.substr(e_pos + 1);
        if (!exp_text.empty() && exp_text.front() == '+') {
            exp_text.remove_prefix(1);
        }
        const auto [ptr, ec] =
            std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
        if (ec != std::errc{} || ptr != exp_text.data() + exp_text.size()) {
            return std::string(sci);
        }
    }

    // 정수부 자릿수
    const int point = exponent + 1;
    const int ndigits = static_cast<int>(digits.size());
    if (point <= 0) {
        result.append("0.");
        result.append(static_cast<std::size_t>(-point), '0');
        result.append(digits);
    } else if (point >= ndigits) {
        result.append(digits);
        result.append(static_cast<std::size_t>(point - ndigits), '0');
    } else {
        result.append(digits, 0, static_cast<std::size_t>(point));
        result.push_back('.');
        result.append(digits, static_cast<std::size_t>(point));
    }
    return result;
}

template <typename Float>
std::string format_shortest(Float v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "+Inf" : "-Inf";
    }

    // fixed 모드의 최단 표현은 "가장 짧은 문자열" 기준이라 큰 수에서 정확한
    // 이진 값을 출력한다. 최단 round-trip 자릿수는 scientific 모드로 얻는다.
    std::array<char, kFloatBufferSize> buf{};
    const auto [ptr, ec] =
        std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::scientific);
    if (ec != std::errc{}) {
        return std::to_string(v);
    }
    return scientific_to_fixed(
        std::string_view(buf.data(), static_cast<std::size_t>(ptr - buf.data())));
}

}  // namespace

// ---------------------------------------------------------------------------
// detail namespace 구현 (순수 함수)
// ---------------------------------------------------------------------------
namespace detail {

std::string wrap(std::string_view s, std::string_view escaper) {
    std::string result;
    result.reserve(s.size() + escaper.size() * 2);
    result.append(escaper);
    result.append(s);
    result.append(escaper);
    return result;
}

std::string escape_str(std::string_view s, std::string_view escaper) {
    if (escaper.empty()) {
        return escape_at_rune_boundaries(s);
    }

    std::string replaced;
    replaced.reserve(s.size() + 8);

    std::size_t pos = 0;
    while (pos < s.size()) {
        const auto found = s.find(escaper, pos);
        if (found == std::string_view::npos) {
            replaced.append(s.substr(pos));
            break;
        }
        replaced.append(s.substr(pos, found - pos));
        replaced.push_back('\\');
        replaced.append(escaper);
        pos = found + escaper.size();
    }

    return wrap(replaced, escaper);
}

bool is_printable(std::span<const std::uint8_t> bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto rune = decode_utf8(bytes, i);
        // 잘못된 시퀀스는 1바이트씩 U+FFFD 로 소비한다 (출력 가능).
        if (rune.valid && !is_printable_rune(rune.cp)) {
            return false;
        }
        i += rune.len;
    }
    return true;
}

std::string format_float32(float v) {
    return format_shortest(v);
}

std::string format_float64(double v) {
    return format_shortest(v);
}

std::string format_fixed6(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "+Inf" : "-Inf";
    }

    std::array<char, kFloatBufferSize> buf{};
    const auto [ptr, ec] =
        std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed, 6);
    if (ec != std::errc{}) {
        return std::to_string(v);
    }
    return std::string(buf.data(), ptr);
}

std::string format_time_text(SqlTime t, const FormatterConfig& config) {
    const auto secs  = std::chrono::floor<std::chrono::seconds>(t);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(t - secs).count();

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(secs);
    std::tm           tm_val{};
    const bool converted = config.time_zone == TimeZoneMode::kLocal
                               ? localtime_r(&time_t_val, &tm_val) != nullptr
                               : gmtime_r(&time_t_val, &tm_val) != nullptr;
    if (!converted) {
        spdlog::debug("param_formatter: cannot convert time {} to calendar time",
                      static_cast<long long>(time_t_val));
        return std::to_string(static_cast<long long>(time_t_val));
    }

    std::string result;
    if (!config.time_format.empty()) {
        // strftime 은 버퍼 부족 시 0 을 반환하므로 버퍼를 늘려가며 재시도한다.
        std::string buf(64, '\0');
        for (int attempt = 0; attempt < 8; ++attempt) {
            const std::size_t written =
                std::strftime(buf.data(), buf.size(), config.time_format.c_str(), &tm_val);
            if (written > 0) {
                result.assign(buf.data(), written);
                break;
            }
            buf.resize(buf.size() * 2);
        }
    }

    const int digits = std::min<int>(config.fraction_digits, 9);
    if (digits > 0) {
        std::string fraction = std::to_string(nanos);
        fraction.insert(0, 9 - fraction.size(), '0');
        fraction.resize(static_cast<std::size_t>(digits));

        if (config.trim_fraction_zeros) {
            const auto last = fraction.find_last_not_of('0');
            fraction.erase(last == std::string::npos ? 0 : last + 1);
        }
        if (!fraction.empty()) {
            result.push_back('.');
            result.append(fraction);
        }
    }

    return result;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// DefaultParamFormatter
// ---------------------------------------------------------------------------
DefaultParamFormatter::DefaultParamFormatter(FormatterConfig config)
    : config_(std::move(config)) {}

std::string DefaultParamFormatter::format(const SqlValue& value,
                                          std::string_view escaper) const {
    return format_impl(value, escaper, 0);
}

std::string DefaultParamFormatter::format_impl(const SqlValue& value,
                                               std::string_view escaper,
                                               int depth) const {
    if (depth > kMaxUnwrapDepth) {
        spdlog::warn("param_formatter: unwrap depth {} exceeded, rendering as null",
                     kMaxUnwrapDepth);
        return format_null();
    }

    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, SqlTime>) {
                return format_time(v, escaper);
            } else if constexpr (std::is_same_v<T, NullableSqlTime>) {
                return v.has_value() ? format_time(*v, escaper) : format_null();
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const DriverValuer>>) {
                return v ? format_valuer(*v, escaper, depth) : format_null();
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const Stringer>>) {
                return v ? format_stringer(*v, escaper) : format_null();
            } else if constexpr (std::is_same_v<T, Bytes>) {
                if (detail::is_printable(v)) {
                    return detail::escape_str(
                        std::string_view(reinterpret_cast<const char*>(v.data()), v.size()),
                        escaper);
                }
                return detail::wrap(kBinaryToken, escaper);
            } else if constexpr (std::is_same_v<T, std::int64_t> ||
                                 std::is_same_v<T, std::uint64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, float>) {
                return detail::format_float32(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return detail::format_float64(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return detail::escape_str(v, escaper);
            } else if constexpr (std::is_same_v<T, SqlRef>) {
                return v.target ? format_impl(*v.target, escaper, depth + 1) : format_null();
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const GenericValue>>) {
                return v ? format_generic(*v, escaper, depth) : format_null();
            } else {
                // std::monostate
                return format_null();
            }
        },
        value.storage());
}

std::string DefaultParamFormatter::format_time(SqlTime t, std::string_view escaper) const {
    if (t == SqlTime{} && !config_.zero_time.empty()) {
        return detail::escape_str(config_.zero_time, escaper);
    }
    return detail::escape_str(detail::format_time_text(t, config_), escaper);
}

// ---------------------------------------------------------------------------
// format_valuer
//   value() 실패는 호출자에게 전파하지 않고 NULL 결과와 동일하게 처리한다.
// ---------------------------------------------------------------------------
std::string DefaultParamFormatter::format_valuer(const DriverValuer& valuer,
                                                 std::string_view escaper,
                                                 int depth) const {
    auto result = valuer.value();
    if (!result) {
        spdlog::debug("param_formatter: driver value accessor failed, rendering as null: {}",
                      result.error());
        return format_null();
    }
    return format_impl(*result, escaper, depth + 1);
}

std::string DefaultParamFormatter::format_stringer(const Stringer& stringer,
                                                   std::string_view escaper) const {
    return std::visit(
        [&](const auto& repr) -> std::string {
            using R = std::decay_t<decltype(repr)>;

            if constexpr (std::is_same_v<R, bool>) {
                return repr ? "true" : "false";
            } else if constexpr (std::is_same_v<R, std::int64_t> ||
                                 std::is_same_v<R, std::uint64_t>) {
                return std::to_string(repr);
            } else if constexpr (std::is_same_v<R, double>) {
                return detail::format_fixed6(repr);
            } else {
                // StringKind, std::monostate
                return detail::escape_str(stringer.to_string(), escaper);
            }
        },
        stringer.underlying());
}

// ---------------------------------------------------------------------------
// format_generic
//   1. DriverValuer 도 구현하고 있으면 기반 값으로 재귀
//   2. convertible_types 순서대로 변환 시도
//   3. to_string() 결과를 escape
// ---------------------------------------------------------------------------
std::string DefaultParamFormatter::format_generic(const GenericValue& generic,
                                                  std::string_view escaper,
                                                  int depth) const {
    if (const auto* valuer = dynamic_cast<const DriverValuer*>(&generic)) {
        return format_valuer(*valuer, escaper, depth);
    }

    for (const auto type : config_.convertible_types) {
        auto converted = generic.convert_to(type);
        if (!converted) {
            continue;
        }

        const bool matches =
            (type == ConvertibleType::kTime && converted->get_if<SqlTime>() != nullptr) ||
            (type == ConvertibleType::kBool && converted->get_if<bool>() != nullptr) ||
            (type == ConvertibleType::kBytes && converted->get_if<Bytes>() != nullptr);
        if (!matches) {
            spdlog::debug("param_formatter: convert_to({}) returned a different type, ignored",
                          static_cast<int>(type));
            continue;
        }
        return format_impl(*converted, escaper, depth + 1);
    }

    return detail::escape_str(generic.to_string(), escaper);
}

// ---------------------------------------------------------------------------
// default_param_formatter
// ---------------------------------------------------------------------------
std::shared_ptr<const ParamFormatter> default_param_formatter() {
    static const std::shared_ptr<const ParamFormatter> instance =
        std::make_shared<const DefaultParamFormatter>();
    return instance;
}
