#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace parkinglot {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Amounts are kept in currency minor units (cents).
using Money = std::int64_t;

using SpotId = std::string;
using SessionId = std::string;
using VehicleId = std::string;

// A spot's size category uses the same values: a car parks in a car spot.
enum class VehicleCategory { Motorcycle, Car, Bus };

const char* toString(VehicleCategory category);

// Throws ParkingError(UnknownVehicleCategory) for anything but
// "motorcycle", "car" or "bus" (case-insensitive).
VehicleCategory parseVehicleCategory(const std::string& name);

struct Constraints {
  bool accessible = false;
  bool charging = false;
};

/*
 Static description plus occupancy. Occupancy is only changed by the
 SpotRegistry's claim/release primitives; everything else sees copies.
*/
struct Spot {
  SpotId id;
  int floor = 0;
  VehicleCategory size = VehicleCategory::Car;
  bool accessible = false;
  bool charging = false;
  int distance = 0;  // from the entrance, precomputed at provisioning
  std::optional<VehicleId> occupant;  // empty == free
  std::uint64_t version = 0;

  bool isFree() const { return !occupant.has_value(); }
};

bool fits(const Spot& spot, VehicleCategory category, const Constraints& constraints);

struct Session {
  SessionId id;
  VehicleId vehicleId;
  VehicleCategory category = VehicleCategory::Car;
  std::string licensePlate;
  SpotId spotId;
  Money ratePerHour = 0;  // locked in at entry
  TimePoint entry;
  // exit == end of stay
  std::optional<TimePoint> exit;
  std::optional<Money> fee;

  bool isActive() const { return !exit.has_value(); }
};

struct Receipt {
  std::string id;
  SessionId sessionId;
  VehicleId vehicleId;
  SpotId spotId;
  TimePoint entry;
  TimePoint exit;
  Money fee = 0;
};

}  // namespace parkinglot
