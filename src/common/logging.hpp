#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace scout::log {

bool IsValidLogLevel(std::string level);
std::string NormalizeLogLevel(std::string level);
spdlog::level::level_enum ParseLogLevel(const std::string &level);
void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp);

} // namespace scout::log
