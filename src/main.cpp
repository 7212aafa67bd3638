#include "cli/arg_parser.hpp"
#include "config/config_loader.hpp"
#include "explain/param_formatter.hpp"
#include "explain/sql_value.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage(const char* prog) {
    std::cerr << "usage: " << prog << " <sql-template> [values...]\n"
              << "  values: null | true | false | <int> | <decimal> | 0x<hex> | <text>\n"
              << "  env   : SQLEXPLAIN_CONFIG (default: config/sqlexplain.yaml)\n";
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    // ── 설정 로드 (환경변수 우선, 파일 없으면 기본값 fallback) ──────────
    const std::string config_path = env_str("SQLEXPLAIN_CONFIG", "config/sqlexplain.yaml");

    ExplainConfig config{};
    auto loaded = ConfigLoader::load(config_path);
    if (loaded) {
        config = std::move(*loaded);
    } else if (loaded.error().code == ConfigErrorCode::kFileNotFound) {
        spdlog::warn("config '{}' not found, using defaults", config_path);
    } else {
        spdlog::error("invalid config '{}': {}", config_path, loaded.error().message);
        return EXIT_FAILURE;
    }

    std::vector<SqlValue> values;
    values.reserve(static_cast<std::size_t>(argc - 2));
    for (int i = 2; i < argc; ++i) {
        values.push_back(parse_cli_value(argv[i]));
    }

    // ── 로거 생성 및 렌더링 ──────────────────────────────────────────────
    try {
        const auto begin     = std::chrono::steady_clock::now();
        auto       formatter = std::make_shared<const DefaultParamFormatter>(config.formatter);
        StructuredLogger logger{config.logger, config.explain, formatter};

        const std::string explained = logger.explain(argv[1], values);
        std::cout << explained << '\n';

        logger.trace(begin, [&explained]() {
            return std::pair<std::string, std::int64_t>{explained, -1};
        });
    } catch (const std::runtime_error& e) {
        spdlog::error("sqlexplain: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
