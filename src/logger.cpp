#include "mcpserve/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace mcpserve {
namespace log {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default() {
    auto logger = spdlog::get("mcpserve");
    if (!logger) {
        logger = spdlog::stderr_color_mt("mcpserve");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_default();
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace log
} // namespace mcpserve
