// ---------------------------------------------------------------------------
// sql_value.cpp
//
// SqlValue 헬퍼 구현.
// ---------------------------------------------------------------------------

#include "explain/sql_value.hpp"

SqlValue SqlValue::ref(SqlValue target) {
    return SqlValue{SqlRef{std::make_shared<const SqlValue>(std::move(target))}};
}

SqlValue SqlValue::null_ref() {
    return SqlValue{SqlRef{}};
}

// ---------------------------------------------------------------------------
// is_absent
//   포인터 계열 alternative 는 대상이 nullptr 인지로 판정한다.
// ---------------------------------------------------------------------------
bool SqlValue::is_absent() const noexcept {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else if constexpr (std::is_same_v<T, NullableSqlTime>) {
                return !v.has_value();
            } else if constexpr (std::is_same_v<T, SqlRef>) {
                return v.target == nullptr;
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const DriverValuer>> ||
                                 std::is_same_v<T, std::shared_ptr<const Stringer>> ||
                                 std::is_same_v<T, std::shared_ptr<const GenericValue>>) {
                return v == nullptr;
            } else {
                return false;
            }
        },
        storage_);
}
