#pragma once

// ---------------------------------------------------------------------------
// sql_value.hpp
//
// 로그용 SQL 렌더링에 전달되는 바인딩 파라미터 값 타입.
//
// [설계 원칙]
// - 런타임 타입 스위치 대신 닫힌 tagged variant (std::variant) 로 표현한다.
// - 호스트 타입이 선택적으로 구현하는 capability 는 추상 클래스로 제공한다.
//     DriverValuer : 드라이버가 이해하는 기반 값을 노출 (예: Nullable 래퍼)
//     Stringer     : 사용자 정의 문자열 표현
//     GenericValue : 위 둘에 해당하지 않는 임의 타입 (fallback 규칙 대상)
// - 여러 capability 를 동시에 구현한 객체는 생성 시점에 우선순위
//   (DriverValuer > Stringer > GenericValue) 가 가장 높은 쪽으로 저장된다.
//
// [주의]
// - SqlValue 는 로그 출력 전용이다. 렌더링 결과를 실행 경로에 넘기지 말 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // SqlTime, NullableSqlTime, Bytes

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

class SqlValue;
class DriverValuer;
class Stringer;
class GenericValue;

// ---------------------------------------------------------------------------
// SqlRef
//   다른 SqlValue 를 가리키는 참조 (포인터 파라미터).
//   target 이 nullptr 이면 NULL 로 렌더링된다.
// ---------------------------------------------------------------------------
struct SqlRef {
    std::shared_ptr<const SqlValue> target{};
};

// ---------------------------------------------------------------------------
// ConvertibleType
//   GenericValue 가 변환될 수 있는 SQL 원시 타입.
//   FormatterConfig::convertible_types 의 순서대로 시도한다.
// ---------------------------------------------------------------------------
enum class ConvertibleType : std::uint8_t {
    kTime  = 0,
    kBool  = 1,
    kBytes = 2,
};

// ---------------------------------------------------------------------------
// SqlValue
// ---------------------------------------------------------------------------
class SqlValue {
public:
    using Storage = std::variant<
        std::monostate,                       // NULL
        bool,
        SqlTime,
        NullableSqlTime,
        std::shared_ptr<const DriverValuer>,
        std::shared_ptr<const Stringer>,
        Bytes,
        std::int64_t,                         // 모든 폭의 signed 정수
        std::uint64_t,                        // 모든 폭의 unsigned 정수
        float,
        double,
        std::string,
        SqlRef,
        std::shared_ptr<const GenericValue>>;

    SqlValue() = default;
    SqlValue(std::nullptr_t) {}  // NOLINT(google-explicit-constructor)

    // 암시적 변환 허용: explain_sql(sql, nullptr, "'", 5, "bob") 형태의 가변 인자 호출용
    SqlValue(bool v) : storage_(std::in_place_type<bool>, v) {}  // NOLINT

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    SqlValue(T v) {  // NOLINT(google-explicit-constructor)
        if constexpr (std::is_signed_v<T>) {
            storage_.emplace<std::int64_t>(static_cast<std::int64_t>(v));
        } else {
            storage_.emplace<std::uint64_t>(static_cast<std::uint64_t>(v));
        }
    }

    SqlValue(float v) : storage_(std::in_place_type<float>, v) {}    // NOLINT
    SqlValue(double v) : storage_(std::in_place_type<double>, v) {}  // NOLINT

    SqlValue(const char* v)  // NOLINT
        : storage_(v == nullptr ? Storage{} : Storage{std::in_place_type<std::string>, v}) {}
    SqlValue(std::string v) : storage_(std::in_place_type<std::string>, std::move(v)) {}  // NOLINT
    SqlValue(std::string_view v) : storage_(std::in_place_type<std::string>, v) {}        // NOLINT

    SqlValue(SqlTime v) : storage_(std::in_place_type<SqlTime>, v) {}                  // NOLINT
    SqlValue(NullableSqlTime v) : storage_(std::in_place_type<NullableSqlTime>, v) {}  // NOLINT
    SqlValue(Bytes v) : storage_(std::in_place_type<Bytes>, std::move(v)) {}           // NOLINT
    SqlValue(SqlRef v) : storage_(std::in_place_type<SqlRef>, std::move(v)) {}         // NOLINT

    // capability 객체: 우선순위가 가장 높은 인터페이스로 저장한다.
    // std::shared_ptr<SqlValue> 는 참조(SqlRef)로 저장한다.
    template <typename T>
    SqlValue(std::shared_ptr<T> ptr) {  // NOLINT(google-explicit-constructor)
        using U = std::remove_const_t<T>;
        if constexpr (std::is_same_v<U, SqlValue>) {
            storage_.emplace<SqlRef>(SqlRef{std::move(ptr)});
        } else if constexpr (std::is_base_of_v<DriverValuer, U>) {
            storage_.emplace<std::shared_ptr<const DriverValuer>>(std::move(ptr));
        } else if constexpr (std::is_base_of_v<Stringer, U>) {
            storage_.emplace<std::shared_ptr<const Stringer>>(std::move(ptr));
        } else {
            static_assert(std::is_base_of_v<GenericValue, U>,
                          "SqlValue: shared_ptr must point to SqlValue, DriverValuer, "
                          "Stringer or GenericValue");
            storage_.emplace<std::shared_ptr<const GenericValue>>(std::move(ptr));
        }
    }

    // ref
    //   target 을 가리키는 참조 값을 만든다.
    [[nodiscard]] static SqlValue ref(SqlValue target);

    // null_ref
    //   아무것도 가리키지 않는 참조 값 (nil 포인터 파라미터).
    [[nodiscard]] static SqlValue null_ref();

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&storage_);
    }

    // is_absent
    //   NULL 이거나, 포인터 계열(참조/capability)의 대상이 nullptr 이거나,
    //   값이 없는 NullableSqlTime 이면 true.
    //   0, false, 빈 문자열 같은 zero value 는 absent 가 아니다.
    [[nodiscard]] bool is_absent() const noexcept;

private:
    Storage storage_{};
};

// ---------------------------------------------------------------------------
// DriverValuer
//   드라이버에 전달될 기반 값을 노출하는 capability.
//   value() 실패(std::unexpected)는 렌더링 시 NULL 결과와 구분하지 않는다.
// ---------------------------------------------------------------------------
class DriverValuer {
public:
    virtual ~DriverValuer() = default;

    [[nodiscard]] virtual std::expected<SqlValue, std::string> value() const = 0;
};

// ---------------------------------------------------------------------------
// StringerRepr
//   Stringer 구현 타입의 기반 표현 종류.
//     std::monostate : 원시 타입이 아님 (구조체 등) → to_string() 사용
//     StringKind     : 기반 타입이 문자열 → to_string() 사용
//     그 외          : 해당 원시 값을 직접 렌더링 (to_string() 무시)
// ---------------------------------------------------------------------------
struct StringKind {};

using StringerRepr =
    std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, StringKind>;

class Stringer {
public:
    virtual ~Stringer() = default;

    [[nodiscard]] virtual std::string to_string() const = 0;

    [[nodiscard]] virtual StringerRepr underlying() const { return {}; }
};

// ---------------------------------------------------------------------------
// GenericValue
//   특정 규칙에 해당하지 않는 임의 타입.
//   convert_to() 가 값을 반환하면 변환된 값으로 다시 렌더링한다.
// ---------------------------------------------------------------------------
class GenericValue {
public:
    virtual ~GenericValue() = default;

    [[nodiscard]] virtual std::string to_string() const = 0;

    [[nodiscard]] virtual std::optional<SqlValue> convert_to(ConvertibleType /*type*/) const {
        return std::nullopt;
    }
};
