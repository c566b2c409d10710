#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#define MCPSERVE_TRACE(...) ::mcpserve::log::get()->trace(__VA_ARGS__)
#define MCPSERVE_DEBUG(...) ::mcpserve::log::get()->debug(__VA_ARGS__)
#define MCPSERVE_INFO(...)  ::mcpserve::log::get()->info(__VA_ARGS__)
#define MCPSERVE_WARN(...)  ::mcpserve::log::get()->warn(__VA_ARGS__)
#define MCPSERVE_ERROR(...) ::mcpserve::log::get()->error(__VA_ARGS__)

namespace mcpserve {
namespace log {

/// The library logger. Created on first use; writes to stderr so that it
/// never interleaves with protocol traffic on stdout.
std::shared_ptr<spdlog::logger> get();

/// Replace the library logger (e.g. to route diagnostics to a file).
void set_logger(std::shared_ptr<spdlog::logger> logger);

void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace mcpserve
