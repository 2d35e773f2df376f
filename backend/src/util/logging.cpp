#include "util/logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <mutex>

namespace
{
    std::mutex g_sink_mtx;
    spdlog::sink_ptr g_console_sink;

    spdlog::sink_ptr console_sink()
    {
        std::lock_guard<std::mutex> lk(g_sink_mtx);
        if (!g_console_sink) {
            g_console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            g_console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        }
        return g_console_sink;
    }
}

void init_logging(const std::string &level)
{
    console_sink();
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::flush_every(std::chrono::seconds(2));
}

std::shared_ptr<spdlog::logger> make_logger(const std::string &name)
{
    if (auto existing = spdlog::get(name)) return existing;
    auto logger = std::make_shared<spdlog::logger>(name, console_sink());
    logger->set_level(spdlog::get_level());
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> make_silent_logger(const std::string &name)
{
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

void shutdown_logging()
{
    spdlog::shutdown();
    std::lock_guard<std::mutex> lk(g_sink_mtx);
    g_console_sink.reset();
}
