// ---------------------------------------------------------------------------
// arg_parser.cpp
// ---------------------------------------------------------------------------

#include "cli/arg_parser.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

namespace {

// "0x..." 의 16진 부분을 Bytes 로 변환한다. 형식이 맞지 않으면 false.
bool parse_hex_bytes(std::string_view text, Bytes& out) {
    if (text.size() < 2 || (text.size() % 2) != 0) {
        return false;
    }
    out.clear();
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        std::uint8_t byte{0};
        const auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + i + 2, byte, 16);
        if (ec != std::errc{} || ptr != text.data() + i + 2) {
            return false;
        }
        out.push_back(byte);
    }
    return true;
}

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// from_chars(double) 는 "nan", "inf", "infinity" 도 받아들인다.
// 부호 뒤 첫 글자가 숫자이거나 '.' + 숫자인 경우만 소수 후보로 본다.
bool looks_decimal(std::string_view arg) {
    if (!arg.empty() && (arg.front() == '-' || arg.front() == '+')) {
        arg.remove_prefix(1);
    }
    if (arg.empty()) {
        return false;
    }
    if (is_digit(arg.front())) {
        return true;
    }
    return arg.size() > 1 && arg.front() == '.' && is_digit(arg[1]);
}

} // namespace

SqlValue parse_cli_value(std::string_view arg) {
    if (arg == "null" || arg == "NULL") {
        return SqlValue{};
    }
    if (arg == "true") {
        return SqlValue{true};
    }
    if (arg == "false") {
        return SqlValue{false};
    }

    const char* begin = arg.data();
    const char* end   = arg.data() + arg.size();

    std::int64_t int_val{0};
    if (const auto [ptr, ec] = std::from_chars(begin, end, int_val);
        ec == std::errc{} && ptr == end) {
        return SqlValue{int_val};
    }

    if (looks_decimal(arg)) {
        // from_chars 는 선행 '+' 를 받지 않는다
        const char* num_begin = (arg.front() == '+') ? begin + 1 : begin;
        double      double_val{0.0};
        if (const auto [ptr, ec] = std::from_chars(num_begin, end, double_val);
            ec == std::errc{} && ptr == end) {
            return SqlValue{double_val};
        }
    }

    if (arg.starts_with("0x") || arg.starts_with("0X")) {
        Bytes bytes;
        if (parse_hex_bytes(arg.substr(2), bytes)) {
            return SqlValue{std::move(bytes)};
        }
    }

    return SqlValue{arg};
}
