#pragma once

// ---------------------------------------------------------------------------
// arg_parser.hpp
//
// sqlexplain CLI 인자 → SqlValue 변환.
//
//   null / NULL   → NULL
//   true / false  → bool
//   정수          → int64
//   소수          → double (숫자 형태만: nan / inf 같은 단어는 문자열)
//   0x<hex>       → Bytes
//   그 외         → 문자열
// ---------------------------------------------------------------------------

#include "explain/sql_value.hpp"

#include <string_view>

[[nodiscard]] SqlValue parse_cli_value(std::string_view arg);
