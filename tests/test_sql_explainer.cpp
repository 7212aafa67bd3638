// ---------------------------------------------------------------------------
// test_sql_explainer.cpp
//
// SqlExplainer / explain_sql 단위 테스트.
//
// [테스트 범위]
// - '?' 순차 치환 (값 부족/초과, 값 안의 '?', UTF-8 템플릿)
// - 번호 placeholder 정규화 및 치환 ($N$, Postgres $N, SQL Server @pN)
// - 범위 밖 / 0 / overflow 번호는 토큰 유지
// - ParamFormatter 주입
// - 멀티스레드 동시 호출
// ---------------------------------------------------------------------------

#include "explain/param_formatter.hpp"
#include "explain/sql_explainer.hpp"
#include "explain/sql_value.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace {

// 모든 값을 "<v>" 로 렌더링하는 포매터
class MarkerFormatter final : public ParamFormatter {
public:
    std::string format(const SqlValue& /*value*/, std::string_view /*escaper*/) const override {
        return "<v>";
    }
};

} // namespace

// ---------------------------------------------------------------------------
// '?' 모드
// ---------------------------------------------------------------------------

TEST(SqlExplainer, QuestionMarksReplacedInOrder) {
    EXPECT_EQ(explain_sql("SELECT * FROM t WHERE id = ? AND name = ?", nullptr, "'", 5, "bob"),
              "SELECT * FROM t WHERE id = 5 AND name = 'bob'");
}

TEST(SqlExplainer, MixedValueKinds) {
    EXPECT_EQ(explain_sql("INSERT INTO t VALUES (?, ?, ?, ?)", nullptr, "'", nullptr, true, 1.5,
                          "o'brien"),
              "INSERT INTO t VALUES (NULL, true, 1.5, 'o\\'brien')");
}

TEST(SqlExplainer, SurplusPlaceholdersKept) {
    EXPECT_EQ(explain_sql("a = ? AND b = ? AND c = ?", nullptr, "'", 1),
              "a = 1 AND b = ? AND c = ?");
}

TEST(SqlExplainer, SurplusValuesIgnored) {
    EXPECT_EQ(explain_sql("a = ?", nullptr, "'", 1, 2, 3), "a = 1");
}

TEST(SqlExplainer, NoPlaceholdersNoValues) {
    EXPECT_EQ(explain_sql("SELECT 1", nullptr, "'"), "SELECT 1");
    EXPECT_EQ(explain_sql("", nullptr, "'", 1), "");
}

TEST(SqlExplainer, QuestionMarkInsideValueNotRescanned) {
    EXPECT_EQ(explain_sql("a = ? AND b = ?", nullptr, "'", "what?", 2),
              "a = 'what?' AND b = 2");
}

TEST(SqlExplainer, Utf8TemplatePreserved) {
    EXPECT_EQ(explain_sql("SELECT * FROM 사용자 WHERE 이름 = ?", nullptr, "'", "김철수"),
              "SELECT * FROM 사용자 WHERE 이름 = '김철수'");
}

TEST(SqlExplainer, CustomEscaper) {
    EXPECT_EQ(explain_sql("a = ?", nullptr, "\"", "x\"y"), "a = \"x\\\"y\"");
}

TEST(SqlExplainer, VectorOverload) {
    const std::vector<SqlValue> values{SqlValue{7}, SqlValue{"z"}};
    EXPECT_EQ(explain_sql("? ?", nullptr, "'", values), "7 'z'");
}

// ---------------------------------------------------------------------------
// 번호 placeholder 모드
// ---------------------------------------------------------------------------

TEST(SqlExplainer, CanonicalNumberedPlaceholders) {
    const std::regex pattern(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("a = $1$ AND b = $2$", &pattern, "'", 10, "x"), "a = 10 AND b = 'x'");
}

TEST(SqlExplainer, PostgresStyleReusesValues) {
    const std::regex pattern(R"(\$(\d+))");
    EXPECT_EQ(explain_sql("SELECT $1, $2, $1", &pattern, "'", 1, "a"), "SELECT 1, 'a', 1");
}

TEST(SqlExplainer, MultiDigitNumbers) {
    const std::regex pattern(R"(\$(\d+))");
    std::vector<SqlValue> values;
    for (int i = 1; i <= 11; ++i) {
        values.emplace_back(i * 100);
    }
    EXPECT_EQ(explain_sql("$11 $1 $10", &pattern, "'", values), "1100 100 1000");
}

TEST(SqlExplainer, SqlServerStyle) {
    const std::regex pattern(R"(@p(\d+))");
    EXPECT_EQ(explain_sql("x = @p1 AND y = @p2", &pattern, "'", 3, "y"), "x = 3 AND y = 'y'");
}

TEST(SqlExplainer, OutOfRangeNumberKeepsCanonicalToken) {
    const std::regex pattern(R"(\$(\d+))");
    EXPECT_EQ(explain_sql("a = $1 AND b = $5", &pattern, "'", 1, 2), "a = 1 AND b = $5$");
}

TEST(SqlExplainer, ZeroNumberKeepsToken) {
    const std::regex pattern(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("a = $0$", &pattern, "'", 1), "a = $0$");
}

TEST(SqlExplainer, OverflowingNumberKeepsToken) {
    const std::regex pattern(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("a = $99999999999999999999999$", &pattern, "'", 1),
              "a = $99999999999999999999999$");
}

TEST(SqlExplainer, NumberedModeLeavesQuestionMarks) {
    const std::regex pattern(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("a = ? AND b = $1$", &pattern, "'", 5), "a = ? AND b = 5");
}

TEST(SqlExplainer, RenderedValueNotSubstitutedAgain) {
    const std::regex pattern(R"(\$(\d+))");
    EXPECT_EQ(explain_sql("a = $1 AND b = $2", &pattern, "'", "$2", 9), "a = '$2' AND b = 9");
}

TEST(SqlExplainer, LeadingZeroNumberResolves) {
    const std::regex canonical(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("a = $01$", &canonical, "'", 7), "a = 7");

    const std::regex postgres(R"(\$(\d+))");
    EXPECT_EQ(explain_sql("a = $001 AND b = $02", &postgres, "'", 1, "b"), "a = 1 AND b = 'b'");
}

TEST(SqlExplainer, StrayDollarSignsKept) {
    const std::regex pattern(R"(\$(\d+)\$)");
    EXPECT_EQ(explain_sql("price $ 5 $$ $1$ $", &pattern, "'", "x"), "price $ 5 $$ 'x' $");
}

// 패턴에 매치되지 않는 긴 숫자열이 템플릿에 있어도 정상 처리
TEST(SqlExplainer, LongDigitRunInTemplate) {
    const std::regex  pattern(R"(@p(\d+))");
    const std::string digits(100000, '9');

    const std::string sql = "SELECT '$" + digits + "' WHERE x = @p1";
    EXPECT_EQ(explain_sql(sql, &pattern, "'", 1), "SELECT '$" + digits + "' WHERE x = 1");
}

TEST(SqlExplainer, LongCanonicalTokenKept) {
    const std::regex  pattern(R"(@p(\d+))");
    const std::string token = "$" + std::string(100000, '1') + "$";

    EXPECT_EQ(explain_sql("x = " + token, &pattern, "'", 1), "x = " + token);
}

// ---------------------------------------------------------------------------
// 포매터 주입
// ---------------------------------------------------------------------------

TEST(SqlExplainer, InjectedFormatterUsedForEveryValue) {
    const SqlExplainer explainer{std::make_shared<MarkerFormatter>()};
    EXPECT_EQ(explainer.explain("a = ? AND b = ?", nullptr, "'", 1, "x"), "a = <v> AND b = <v>");
}

TEST(SqlExplainer, NullFormatterFallsBackToDefault) {
    const SqlExplainer explainer{nullptr};
    EXPECT_EQ(explainer.explain("a = ?", nullptr, "'", "x"), "a = 'x'");
}

TEST(SqlExplainer, ConfiguredDefaultFormatter) {
    FormatterConfig cfg;
    cfg.null_literal = "null";
    const SqlExplainer explainer{std::make_shared<DefaultParamFormatter>(cfg)};
    EXPECT_EQ(explainer.explain("a = ?", nullptr, "'", nullptr), "a = null");
}

// ---------------------------------------------------------------------------
// 동시 호출
// ---------------------------------------------------------------------------

TEST(SqlExplainer, ConcurrentCallsProduceSameResult) {
    const std::regex pattern(R"(\$(\d+))");
    const std::string expected = "SELECT 1, 'a', NULL";

    constexpr int kThreads   = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    std::vector<int>         mismatches(kThreads, 0);
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                if (explain_sql("SELECT $1, $2, $3", &pattern, "'", 1, "a", nullptr) != expected) {
                    ++mismatches[static_cast<std::size_t>(t)];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (const int m : mismatches) {
        EXPECT_EQ(m, 0);
    }
}
