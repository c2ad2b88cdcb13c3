#pragma once

#include <string>

#include "parkinglot/types.h"

namespace parkinglot {

// fee = elapsed hours (millisecond resolution) * ratePerHour, rounded half-up
// to minor units. exit == entry costs nothing; exit < entry throws
// ParkingError(InvalidDuration).
Money computeFee(TimePoint entry, TimePoint exit, Money ratePerHour);

// 2000 -> "20.00", -5 -> "-0.05"
std::string formatMoney(Money amount);

}  // namespace parkinglot
