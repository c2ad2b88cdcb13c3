#include "parkinglot/logging.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "parkinglot/error.h"

using namespace std;

namespace parkinglot {

namespace {

constexpr const char* kLoggerName = "parkinglot";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

mutex& loggerMutex() {
  static mutex m;
  return m;
}

shared_ptr<spdlog::logger> getOrCreate() {
  auto existing = spdlog::get(kLoggerName);
  if (existing) return existing;
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_pattern(kPattern);
  created->set_level(spdlog::level::info);
  return created;
}

}  // namespace

void setupLogging(const string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps anything it does not know to "off"
  if (lvl == spdlog::level::off && level != "off") {
    throw ParkingError(ErrorCode::InvalidConfiguration, "unknown log level: " + level);
  }
  lock_guard lock(loggerMutex());
  auto log = getOrCreate();
  log->set_level(lvl);
  log->flush_on(spdlog::level::warn);
}

shared_ptr<spdlog::logger> logger() {
  static shared_ptr<spdlog::logger> cached = [] {
    lock_guard lock(loggerMutex());
    return getOrCreate();
  }();
  return cached;
}

}  // namespace parkinglot
