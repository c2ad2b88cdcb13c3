#include "parkinglot/fee_calculator.h"

#include <limits>

#include <fmt/format.h>

#include "parkinglot/error.h"

using namespace std;

namespace parkinglot {

namespace {
constexpr int64_t kMillisPerHour = 3600LL * 1000LL;
}

Money computeFee(TimePoint entry, TimePoint exit, Money ratePerHour) {
  if (exit < entry) {
    throw ParkingError(ErrorCode::InvalidDuration, "exit time precedes entry time");
  }
  if (ratePerHour < 0) {
    throw ParkingError(ErrorCode::InvalidConfiguration, "negative hourly rate");
  }
  int64_t millis = chrono::duration_cast<chrono::milliseconds>(exit - entry).count();
  if (millis == 0 || ratePerHour == 0) return 0;

  constexpr int64_t kHalf = kMillisPerHour / 2;
  if (millis > (numeric_limits<int64_t>::max() - kHalf) / ratePerHour) {
    throw ParkingError(ErrorCode::InvalidDuration, "stay too long to price");
  }
  return (millis * ratePerHour + kHalf) / kMillisPerHour;
}

string formatMoney(Money amount) {
  // -0.05 has no whole units to carry the sign
  const char* sign = amount < 0 ? "-" : "";
  uint64_t magnitude = amount < 0 ? 0ULL - static_cast<uint64_t>(amount)
                                  : static_cast<uint64_t>(amount);
  return fmt::format("{}{}.{:02}", sign, magnitude / 100, magnitude % 100);
}

}  // namespace parkinglot
