#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace parkinglot {

// Creates (or reconfigures) the "parkinglot" stderr logger.
// level is one of spdlog's names: trace, debug, info, warn, error, critical, off.
void setupLogging(const std::string& level);

// The shared component logger. Created on first use at "info" if
// setupLogging() has not been called yet.
std::shared_ptr<spdlog::logger> logger();

}  // namespace parkinglot
