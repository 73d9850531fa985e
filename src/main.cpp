#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/security_pipeline.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// inputgate CLI
//
//   inputgate [--operation OP] [--schema NAME] [--user ID] [--role ROLE]
//             [--license TIER] [--query-template TEXT] [--param name=value]...
//             [--raw-query TEXT] [--stats]
//
// 요청 본문은 stdin 에서 읽는다. 판정 결과를 JSON 한 줄로 stdout 에 쓴다.
// 종료 코드: 0 = allowed, 1 = 설정/초기화 실패, 2 = 요청 거부, 64 = 인자 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitRejected = 2;
constexpr int kExitUsage    = 64;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

bool env_bool(const char* name, bool default_val) {
    const std::string val = env_str(name, "");
    if (val.empty()) {
        return default_val;
    }
    if (val == "1" || val == "true" || val == "yes") {
        return true;
    }
    if (val == "0" || val == "false" || val == "no") {
        return false;
    }
    spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
    return default_val;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

void print_usage() {
    std::cerr << "usage: inputgate [--operation OP] [--schema NAME] [--user ID] [--role ROLE]\n"
                 "                 [--license TIER] [--query-template TEXT] [--param name=value]...\n"
                 "                 [--raw-query TEXT] [--stats]  < body\n";
}

struct CliArgs {
    PipelineRequest request{};
    bool            print_stats{false};
};

// 성공 시 true. 실패 원인은 stderr 로 출력한다.
bool parse_args(int argc, char* argv[], CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--stats") {
            out.print_stats = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "inputgate: missing value for " << arg << "\n";
            return false;
        }
        const std::string value = argv[++i];
        if (arg == "--operation") {
            out.request.operation = value;
        } else if (arg == "--schema") {
            out.request.schema = value;
        } else if (arg == "--user") {
            out.request.identifier = value;
        } else if (arg == "--role") {
            out.request.caller.role = value;
        } else if (arg == "--license") {
            out.request.caller.license_tier = value;
        } else if (arg == "--query-template") {
            out.request.query_template = value;
        } else if (arg == "--raw-query") {
            out.request.raw_query = value;
        } else if (arg == "--param") {
            const auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "inputgate: --param expects name=value, got '" << value << "'\n";
                return false;
            }
            out.request.parameters[value.substr(0, eq)] = value.substr(eq + 1);
        } else {
            std::cerr << "inputgate: unknown argument " << arg << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return kExitUsage;
    }

    // ── 설정 로드 (환경변수 우선) ───────────────────────────────────────
    const std::string config_path = env_str("INPUTGATE_CONFIG", "config/inputgate.yaml");
    auto loaded = ConfigLoader::load(config_path);
    if (!loaded) {
        std::cerr << "inputgate: " << loaded.error() << "\n";
        return EXIT_FAILURE;
    }
    PipelineConfig config = std::move(*loaded);
    config.global.log_path         = env_str("INPUTGATE_LOG_PATH", config.global.log_path);
    config.global.log_level        = env_str("INPUTGATE_LOG_LEVEL", config.global.log_level);
    config.global.development_mode = env_bool("INPUTGATE_DEV_MODE", config.global.development_mode);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    const LogLevel level = log_level_from_string(config.global.log_level);
    spdlog::set_level(to_spdlog_level(level));

    std::shared_ptr<StructuredLogger> audit;
    try {
        audit = std::make_shared<StructuredLogger>(level, config.global.log_path);
    } catch (const std::exception& ex) {
        std::cerr << "inputgate: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }

    spdlog::info("Starting inputgate");
    spdlog::info("Config: {}", config_path);
    spdlog::info("Audit log: {}", config.global.log_path);

    // ── 요청 처리 ───────────────────────────────────────────────────────
    args.request.body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());

    SecurityPipeline pipeline{config, audit};
    const PipelineResponse response = pipeline.process(args.request);

    std::cout << response.to_json() << "\n";
    if (args.print_stats) {
        std::cout << pipeline.stats().snapshot().to_json() << "\n";
    }
    std::cout.flush();

    return response.allowed() ? EXIT_SUCCESS : kExitRejected;
}
