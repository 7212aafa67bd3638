#pragma once

// ---------------------------------------------------------------------------
// sql_explainer.hpp
//
// SQL 템플릿의 placeholder 를 렌더링된 파라미터 리터럴로 치환하여
// 사람이 읽을 수 있는 SQL 문자열 하나를 만든다.
//
// [사용 범위]
// - 결과는 진단 로그 전용이다. 실행 경로(드라이버, 프록시 upstream)에 절대
//   전달하지 말 것. escape 는 표시용이며 SQL Injection 을 막지 못한다.
// - SQL 문법 검증이나 AST 파싱은 수행하지 않는다 (순수 텍스트 치환).
//
// [placeholder 모드]
// 1. numeric_placeholder == nullptr : '?' 를 왼쪽부터 순서대로 치환한다.
//    값이 모자라면 남은 '?' 는 그대로 둔다.
//    바이트 단위 스캔이지만 UTF-8 continuation byte (0x80-0xBF) 는 '?' (0x3F)
//    와 겹치지 않으므로 멀티바이트 문자를 깨뜨리지 않는다.
// 2. numeric_placeholder != nullptr : 패턴 매치를 "$<그룹1>$" 형태로 정규화한 뒤
//    "$N$" 을 N 번째(1부터) 값으로 치환한다. 범위 밖 번호, 파싱 불가 번호는
//    정규화된 토큰 그대로 남는다.
//
// [오류 처리]
// - 어떤 입력에도 실패하지 않는다. 항상 문자열을 반환한다.
// ---------------------------------------------------------------------------

#include "explain/param_formatter.hpp"
#include "explain/sql_value.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ExplainOptions
//   설정 파일에서 로드되는 치환 옵션.
//   numbered_placeholder 가 없으면 '?' 모드로 동작한다.
//   numbered_placeholder_source 는 로그/진단용 원문 패턴.
// ---------------------------------------------------------------------------
struct ExplainOptions {
    std::string               escaper{"'"};
    std::optional<std::regex> numbered_placeholder{};
    std::string               numbered_placeholder_source{};
};

// ---------------------------------------------------------------------------
// SqlExplainer
//   ParamFormatter 를 생성자 주입받아 placeholder 치환을 수행한다.
//   상태가 없으므로 여러 스레드에서 동시에 explain() 을 호출해도 안전하다.
// ---------------------------------------------------------------------------
class SqlExplainer {
public:
    explicit SqlExplainer(
        std::shared_ptr<const ParamFormatter> formatter = default_param_formatter());

    ~SqlExplainer() = default;

    SqlExplainer(const SqlExplainer&)            = default;
    SqlExplainer& operator=(const SqlExplainer&) = default;
    SqlExplainer(SqlExplainer&&)                 = default;
    SqlExplainer& operator=(SqlExplainer&&)      = default;

    // explain
    //   sql                 : SQL 템플릿
    //   numeric_placeholder : 번호 placeholder 패턴 (캡처 그룹 1 = 번호), nullptr = '?' 모드
    //   escaper             : 문자열 리터럴 구분자 (보통 "'")
    //   values              : 바인딩 값 목록
    [[nodiscard]] std::string explain(std::string_view              sql,
                                      const std::regex*             numeric_placeholder,
                                      std::string_view              escaper,
                                      const std::vector<SqlValue>&  values) const;

    // 가변 인자 버전: explain(sql, nullptr, "'", 5, "bob")
    template <typename... Args>
        requires(std::constructible_from<SqlValue, Args> && ...)
    [[nodiscard]] std::string explain(std::string_view  sql,
                                      const std::regex* numeric_placeholder,
                                      std::string_view  escaper,
                                      Args&&... args) const {
        const std::vector<SqlValue> values{SqlValue(std::forward<Args>(args))...};
        return explain(sql, numeric_placeholder, escaper, values);
    }

    [[nodiscard]] const ParamFormatter& formatter() const noexcept { return *formatter_; }

private:
    std::shared_ptr<const ParamFormatter> formatter_;
};

// ---------------------------------------------------------------------------
// explain_sql
//   default_param_formatter() 를 사용하는 편의 함수.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string explain_sql(std::string_view             sql,
                                      const std::regex*            numeric_placeholder,
                                      std::string_view             escaper,
                                      const std::vector<SqlValue>& values);

template <typename... Args>
    requires(std::constructible_from<SqlValue, Args> && ...)
[[nodiscard]] std::string explain_sql(std::string_view  sql,
                                      const std::regex* numeric_placeholder,
                                      std::string_view  escaper,
                                      Args&&... args) {
    const std::vector<SqlValue> values{SqlValue(std::forward<Args>(args))...};
    return explain_sql(sql, numeric_placeholder, escaper, values);
}
