#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace reclo {
namespace log {

/// Named component logger ("recorder", "transfer", "client", ...).
/// Created on first use with a stdout colour sink at the current level.
std::shared_ptr<spdlog::logger> get(const std::string& name);

/// Change the level of every existing and future component logger.
void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace reclo
