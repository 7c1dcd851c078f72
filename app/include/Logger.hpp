#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

namespace spdlog { class logger; }

class Logger {
public:
    // Creates core_logger, llm_logger and db_logger with console and rotating file sinks.
    static bool setup_loggers(const std::string& log_dir = std::string());
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static std::string get_log_file_path(const std::string& log_dir);
    static void shutdown();
};

#endif
