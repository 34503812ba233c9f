#include "Logging.hpp"

#include <atomic>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace reclo {
namespace log {

namespace {

std::mutex g_mu;
std::atomic<spdlog::level::level_enum> g_level{spdlog::level::info};

} // namespace

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mu);

    auto logger = spdlog::get(name);
    if (logger) return logger;

    logger = spdlog::stdout_color_mt(name);
    logger->set_level(g_level.load());
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_mu);
    g_level.store(level);
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> l) {
        l->set_level(level);
    });
}

} // namespace log
} // namespace reclo
