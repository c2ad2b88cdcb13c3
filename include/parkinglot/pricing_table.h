#pragma once

#include <map>
#include <shared_mutex>

#include "parkinglot/types.h"

namespace parkinglot {

/*
 Category -> hourly rate (minor units). Read-mostly: lookups take a shared
 lock, out-of-band refreshes swap the whole table under an exclusive lock.
*/
class PricingTable {
public:
  PricingTable() = default;
  explicit PricingTable(std::map<VehicleCategory, Money> rates);

  // Throws ParkingError(UnknownVehicleCategory) if no rule exists.
  Money rateFor(VehicleCategory category) const;

  bool hasRate(VehicleCategory category) const;

  // Throws ParkingError(InvalidConfiguration) for a negative rate.
  void setRate(VehicleCategory category, Money ratePerHour);

  void replaceAll(std::map<VehicleCategory, Money> rates);

  std::map<VehicleCategory, Money> snapshot() const;

private:
  static void validate(VehicleCategory category, Money ratePerHour);

  std::map<VehicleCategory, Money> rates_;
  mutable std::shared_mutex mtx_;
};

}  // namespace parkinglot
