#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLogLevelEnv = "FILE_TAXONOMY_LOG_LEVEL";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names() {
    static const std::vector<std::string> names = {"core_logger", "llm_logger", "db_logger"};
    return names;
}

spdlog::level::level_enum resolve_log_level() {
    const char* value = std::getenv(kLogLevelEnv);
    if (!value || *value == '\0') {
        return spdlog::level::info;
    }
    const auto level = spdlog::level::from_str(Utils::to_lower_copy(value));
    if (level == spdlog::level::off && Utils::to_lower_copy(value) != "off") {
        std::fprintf(stderr, "Ignoring unknown log level '%s'\n", value);
        return spdlog::level::info;
    }
    return level;
}
} // namespace

std::string Logger::get_log_file_path(const std::string& log_dir)
{
    return (std::filesystem::path(log_dir) / "file_taxonomy.log").string();
}

bool Logger::setup_loggers(const std::string& log_dir)
{
    const std::string directory = log_dir.empty()
        ? (std::filesystem::path(Utils::default_config_dir()) / "logs").string()
        : log_dir;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::fprintf(stderr, "Failed to create log directory '%s': %s\n",
                     directory.c_str(), ec.message().c_str());
    } else {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                get_log_file_path(directory), kMaxLogFileSize, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "Failed to open log file: %s\n", ex.what());
        }
    }

    const auto level = resolve_log_level();
    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
    return sinks.size() > 1;
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

void Logger::shutdown()
{
    spdlog::shutdown();
}
