// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"
#include "logger/json_format.hpp"

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

// 같은 프로세스에서 여러 인스턴스(테스트)가 생성돼도 레지스트리 이름이 겹치지 않게 한다.
std::string next_logger_name() {
    static std::atomic<std::uint32_t> seq{0};
    const auto n = seq.fetch_add(1, std::memory_order_relaxed);
    return n == 0 ? std::string("inputgate") : "inputgate-" + std::to_string(n);
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (본문은 각 이벤트의 JSON)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
    }
}

// ---------------------------------------------------------------------------
// to_json: 이벤트 직렬화
//   {"event":..,"level":..,"correlation_id":..,<fields...>,"timestamp":..}
// ---------------------------------------------------------------------------
std::string StructuredLogger::to_json(const SecurityEvent& event) {
    static constexpr const char* kLevelNames[] = {"debug", "info", "warn", "error"};

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(event.event) << R"(","level":")"
         << kLevelNames[static_cast<std::size_t>(event.level)] << '"';
    if (!event.correlation_id.empty()) {
        json << R"(,"correlation_id":")" << escape_json_string(event.correlation_id) << '"';
    }
    for (const auto& [key, value] : event.fields) {
        json << R"(,")" << escape_json_string(key) << R"(":")" << escape_json_string(value) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(event.timestamp) << R"("})";
    return json.str();
}

// ---------------------------------------------------------------------------
// emit: 레벨 필터 후 JSON 한 줄 기록
// ---------------------------------------------------------------------------
void StructuredLogger::emit(const SecurityEvent& event) noexcept {
    if (!logger_ || static_cast<int>(event.level) < static_cast<int>(min_level_)) {
        return;
    }
    try {
        const std::string line = to_json(event);
        switch (event.level) {
            case LogLevel::kDebug: logger_->debug(line); break;
            case LogLevel::kInfo:  logger_->info(line);  break;
            case LogLevel::kWarn:  logger_->warn(line);  break;
            case LogLevel::kError: logger_->error(line); break;
        }
    } catch (const std::exception& ex) {
        // 감사 실패는 요청 경로로 전파하지 않는다.
        spdlog::error("structured_logger: failed to emit '{}': {}", event.event, ex.what());
    }
}
