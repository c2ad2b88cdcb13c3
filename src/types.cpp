#include "parkinglot/types.h"

#include <algorithm>
#include <cctype>

#include "parkinglot/error.h"

using namespace std;

namespace parkinglot {

const char* toString(VehicleCategory category) {
  switch (category) {
    case VehicleCategory::Motorcycle: return "motorcycle";
    case VehicleCategory::Car:        return "car";
    case VehicleCategory::Bus:        return "bus";
  }
  return "unknown";
}

VehicleCategory parseVehicleCategory(const string& name) {
  string lower = name;
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  if (lower == "motorcycle") return VehicleCategory::Motorcycle;
  if (lower == "car")        return VehicleCategory::Car;
  if (lower == "bus")        return VehicleCategory::Bus;
  throw ParkingError(ErrorCode::UnknownVehicleCategory, "unknown vehicle category: " + name);
}

bool fits(const Spot& spot, VehicleCategory category, const Constraints& constraints) {
  if (spot.size != category) return false;
  if (constraints.accessible && !spot.accessible) return false;
  if (constraints.charging && !spot.charging) return false;
  return true;
}

}  // namespace parkinglot
