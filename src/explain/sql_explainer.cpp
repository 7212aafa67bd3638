// ---------------------------------------------------------------------------
// sql_explainer.cpp
//
// placeholder 치환 구현.
//
// [정규화 단계]
// 사용자 패턴(예: Postgres "\$(\d+)", SQL Server "@p(\d+)")의 매치를
// regex_replace 포맷 "$$$1$$" 로 "$N$" 정규형으로 바꾼 뒤, 정규형 토큰을
// 바이트 단위로 스캔하여 치환한다. 정규형 스캔에 std::regex 를 쓰지 않으므로
// 긴 숫자열도 재귀 깊이와 무관하다. 패턴에 캡처 그룹이 없으면 "$$" 로
// 정규화되어 어떤 값으로도 치환되지 않는다.
// ---------------------------------------------------------------------------

#include "explain/sql_explainer.hpp"

#include <charconv>
#include <cstddef>
#include <regex>
#include <string>
#include <system_error>

namespace {

bool is_ascii_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// '?' 를 순서대로 치환한다. 값이 모자라면 '?' 를 그대로 둔다.
std::string replace_unnumbered(std::string_view sql, const std::vector<std::string>& vars) {
    std::string result;
    result.reserve(sql.size() + vars.size() * 8);

    std::size_t idx = 0;
    for (const char ch : sql) {
        if (ch == '?' && idx < vars.size()) {
            result.append(vars[idx]);
            ++idx;
            continue;
        }
        result.push_back(ch);
    }

    return result;
}

// "$N$" 토큰 하나를 값으로 바꾼다. 번호가 1..vars.size() 범위 밖이거나
// 파싱할 수 없으면 (overflow 포함) 토큰을 그대로 반환한다.
std::string resolve_numbered_token(const std::string& token, const std::vector<std::string>& vars) {
    if (token.size() < 3) {
        return token;
    }

    const char* begin = token.data() + 1;
    const char* end   = token.data() + token.size() - 1;

    unsigned long long n{0};
    const auto [ptr, ec] = std::from_chars(begin, end, n);
    if (ec != std::errc{} || ptr != end) {
        return token;
    }

    // 번호는 1부터 시작한다 ($1, $2, ...)
    if (n == 0 || n > vars.size()) {
        return token;
    }
    return vars[static_cast<std::size_t>(n - 1)];
}

std::string replace_numbered(std::string_view                sql,
                             const std::regex&               numeric_placeholder,
                             const std::vector<std::string>& vars) {
    const std::string normalized =
        std::regex_replace(std::string(sql), numeric_placeholder, "$$$1$$");

    std::string result;
    result.reserve(normalized.size() + vars.size() * 8);

    // 정규형 "$N$" 스캔: '$' + 10진수 1자리 이상 + '$'
    const std::size_t len = normalized.size();
    std::size_t       i   = 0;
    while (i < len) {
        if (normalized[i] != '$') {
            result.push_back(normalized[i]);
            ++i;
            continue;
        }

        std::size_t j = i + 1;
        while (j < len && is_ascii_digit(normalized[j])) {
            ++j;
        }
        if (j == i + 1 || j >= len || normalized[j] != '$') {
            // 토큰이 아니다. 이 '$' 만 출력하고 다음 바이트부터 다시 본다.
            result.push_back('$');
            ++i;
            continue;
        }

        result.append(resolve_numbered_token(normalized.substr(i, j - i + 1), vars));
        i = j + 1;
    }

    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// SqlExplainer
// ---------------------------------------------------------------------------
SqlExplainer::SqlExplainer(std::shared_ptr<const ParamFormatter> formatter)
    : formatter_(formatter ? std::move(formatter) : default_param_formatter()) {}

std::string SqlExplainer::explain(std::string_view             sql,
                                  const std::regex*            numeric_placeholder,
                                  std::string_view             escaper,
                                  const std::vector<SqlValue>& values) const {
    // 파라미터를 먼저 모두 렌더링한 뒤 템플릿에 삽입한다.
    std::vector<std::string> vars;
    vars.reserve(values.size());
    for (const auto& value : values) {
        vars.push_back(formatter_->format(value, escaper));
    }

    if (numeric_placeholder == nullptr) {
        return replace_unnumbered(sql, vars);
    }
    return replace_numbered(sql, *numeric_placeholder, vars);
}

// ---------------------------------------------------------------------------
// explain_sql
// ---------------------------------------------------------------------------
std::string explain_sql(std::string_view             sql,
                        const std::regex*            numeric_placeholder,
                        std::string_view             escaper,
                        const std::vector<SqlValue>& values) {
    static const SqlExplainer kDefaultExplainer{};
    return kDefaultExplainer.explain(sql, numeric_placeholder, escaper, values);
}
