// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - trace() 기록 규칙 (sql / slow_sql / sql_error, 레벨 필터)
// - ignore_record_not_found, parameterized_queries
// - JSON 필드 (caller, rows "-", slow_threshold_ms, escape)
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <iterator>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <regex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 파싱 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }

        pos += search_key.length();

        // Skip whitespace
        while (pos < parsed_.size() && std::isspace(parsed_[pos])) {
            ++pos;
        }

        if (pos >= parsed_.size()) {
            return "";
        }

        // Extract value (string or number)
        std::ostringstream oss;

        if (parsed_[pos] == '"') {
            // String value
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            // Number
            while (pos < parsed_.size() && (std::isdigit(parsed_[pos]) || parsed_[pos] == '-' ||
                                             parsed_[pos] == '.' || parsed_[pos] == 'e' ||
                                             parsed_[pos] == 'E' || parsed_[pos] == '+')) {
                oss << parsed_[pos];
                ++pos;
            }
        }

        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "sqlexplain_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip timestamps and keep only JSON part
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    LoggerConfig make_config(LogLevel level) const {
        LoggerConfig cfg;
        cfg.level          = level;
        cfg.log_path       = log_file_;
        cfg.slow_threshold = std::chrono::milliseconds{0};
        return cfg;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

namespace {

StructuredLogger::TraceFn fixed_sql(std::string sql, std::int64_t rows) {
    return [sql = std::move(sql), rows]() { return std::pair<std::string, std::int64_t>{sql, rows}; };
}

} // namespace

// ---------------------------------------------------------------------------
// Test: 일반 실행은 "sql" 이벤트로 기록
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, TraceWritesSqlEvent) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT 1", 3));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("caller"));
    EXPECT_TRUE(parser.has_field("elapsed_ms"));
    EXPECT_TRUE(parser.has_field("timestamp"));
    EXPECT_FALSE(parser.has_field("error"));
    EXPECT_FALSE(parser.has_field("slow_threshold_ms"));

    EXPECT_EQ(parser.get_field("event"), "sql");
    EXPECT_EQ(parser.get_field("rows"), "3");
    EXPECT_EQ(parser.get_field("sql"), "SELECT 1");
    EXPECT_NE(parser.get_field("caller").find("test_logger.cpp:"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 행 수를 알 수 없으면 "-"
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, UnknownRowsWrittenAsDash) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("UPDATE t SET a = 1", -1));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("rows"), "-");
}

// ---------------------------------------------------------------------------
// Test: 오류가 있으면 "sql_error" + error 필드
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, TraceErrorWritesSqlErrorEvent) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("INSERT INTO t VALUES (1)", 0),
                 TraceError{"duplicate key", false});

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "sql_error");
    EXPECT_EQ(parser.get_field("error"), "duplicate key");
    EXPECT_EQ(parser.get_field("rows"), "0");
}

// ---------------------------------------------------------------------------
// Test: level=kError 에서도 오류는 기록, 일반 실행은 기록하지 않음
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ErrorLevelKeepsOnlyErrors) {
    StructuredLogger logger(make_config(LogLevel::kError));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT 1", 1));
    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT 2", 0),
                 TraceError{"boom", false});

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(JsonLineParser(lines[0]).get_field("sql"), "SELECT 2");
}

// ---------------------------------------------------------------------------
// Test: ignore_record_not_found 이면 not-found 오류는 일반 실행으로 기록
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, RecordNotFoundIgnoredWhenConfigured) {
    auto cfg                    = make_config(LogLevel::kInfo);
    cfg.ignore_record_not_found = true;
    StructuredLogger logger(cfg);

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT * FROM t WHERE id = 9", 0),
                 TraceError{"record not found", true});

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "sql");
    EXPECT_FALSE(parser.has_field("error"));
}

TEST_F(StructuredLoggerTest, RecordNotFoundReportedByDefault) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT * FROM t WHERE id = 9", 0),
                 TraceError{"record not found", true});

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(JsonLineParser(lines[0]).get_field("event"), "sql_error");
}

// ---------------------------------------------------------------------------
// Test: slow_threshold 초과 시 "slow_sql"
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, SlowQueryWritesSlowSqlEvent) {
    auto cfg           = make_config(LogLevel::kWarn);
    cfg.slow_threshold = std::chrono::milliseconds{1};
    StructuredLogger logger(cfg);

    const auto begin = std::chrono::steady_clock::now() - std::chrono::milliseconds(50);
    logger.trace(begin, fixed_sql("SELECT SLEEP(1)", 1));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "slow_sql");
    EXPECT_EQ(parser.get_field("slow_threshold_ms"), "1");
    EXPECT_GE(std::stod(parser.get_field("elapsed_ms")), 50.0);
}

// ---------------------------------------------------------------------------
// Test: 레벨 필터링 시 SQL 콜백을 호출하지 않음
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, FilteredTraceSkipsCallback) {
    StructuredLogger logger(make_config(LogLevel::kWarn));

    bool called = false;
    logger.trace(std::chrono::steady_clock::now(), [&called]() {
        called = true;
        return std::pair<std::string, std::int64_t>{"SELECT 1", 1};
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_FALSE(called);
    EXPECT_TRUE(read_log_lines().empty());
}

TEST_F(StructuredLoggerTest, SilentWritesNothing) {
    StructuredLogger logger(make_config(LogLevel::kSilent));

    logger.trace(std::chrono::steady_clock::now(), fixed_sql("SELECT 1", 1),
                 TraceError{"boom", false});

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_TRUE(read_log_lines().empty());
}

// ---------------------------------------------------------------------------
// Test: explain() 은 설정된 placeholder 옵션을 사용
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ExplainUsesConfiguredOptions) {
    ExplainOptions options;
    options.numbered_placeholder        = std::regex(R"(\$(\d+))");
    options.numbered_placeholder_source = R"(\$(\d+))";
    StructuredLogger logger(make_config(LogLevel::kInfo), options);

    EXPECT_EQ(logger.explain("SELECT * FROM t WHERE a = $2 AND b = $1", {SqlValue{1}, SqlValue{"x"}}),
              "SELECT * FROM t WHERE a = 'x' AND b = 1");
}

TEST_F(StructuredLoggerTest, ParameterizedQueriesKeepTemplate) {
    auto cfg                  = make_config(LogLevel::kInfo);
    cfg.parameterized_queries = true;
    StructuredLogger logger(cfg);

    EXPECT_EQ(logger.explain("SELECT * FROM users WHERE name = ?", {SqlValue{"secret"}}),
              "SELECT * FROM users WHERE name = ?");
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 trace 안전성
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedTraceNoCrash) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    constexpr int kThreads   = 4;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string sql =
                    logger.explain("SELECT ? , ?", {SqlValue{t}, SqlValue{i}});
                logger.trace(std::chrono::steady_clock::now(), fixed_sql(sql, 1));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(read_log_lines().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// ---------------------------------------------------------------------------
// Test: JSON 특수문자 escape
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(make_config(LogLevel::kInfo));

    const std::string sql = logger.explain("SELECT \"col\" FROM t WHERE a = ?", {SqlValue{"x\\y"}});
    logger.trace(std::chrono::steady_clock::now(), fixed_sql(sql + "\n", 1));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::ifstream file(log_file_);
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    EXPECT_NE(content.find(R"(\"col\")"), std::string::npos);
    EXPECT_NE(content.find(R"('x\\y')"), std::string::npos);
    EXPECT_NE(content.find(R"(\n")"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 진단 로그 (debug, info, warn, error)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(make_config(LogLevel::kDebug));

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // 진단 로그는 일반 텍스트이므로, 파일이 생성되고 크기가 0이 아닌지 확인
    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
