#include "parkinglot/pricing_table.h"

#include <mutex>
#include <string>

#include "parkinglot/error.h"
#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

PricingTable::PricingTable(map<VehicleCategory, Money> rates) {
  replaceAll(std::move(rates));
}

Money PricingTable::rateFor(VehicleCategory category) const {
  shared_lock lock(mtx_);
  auto it = rates_.find(category);
  if (it == rates_.end()) {
    throw ParkingError(ErrorCode::UnknownVehicleCategory,
                       string("no pricing rule for category ") + toString(category));
  }
  return it->second;
}

bool PricingTable::hasRate(VehicleCategory category) const {
  shared_lock lock(mtx_);
  return rates_.count(category) > 0;
}

void PricingTable::setRate(VehicleCategory category, Money ratePerHour) {
  validate(category, ratePerHour);
  unique_lock lock(mtx_);
  rates_[category] = ratePerHour;
}

void PricingTable::replaceAll(map<VehicleCategory, Money> rates) {
  for (auto& [category, rate] : rates) validate(category, rate);
  size_t count = rates.size();
  {
    unique_lock lock(mtx_);
    rates_.swap(rates);
  }
  logger()->info("pricing table loaded with {} rule(s)", count);
}

map<VehicleCategory, Money> PricingTable::snapshot() const {
  shared_lock lock(mtx_);
  return rates_;
}

void PricingTable::validate(VehicleCategory category, Money ratePerHour) {
  if (ratePerHour < 0) {
    throw ParkingError(ErrorCode::InvalidConfiguration,
                       string("negative rate for category ") + toString(category));
  }
}

}  // namespace parkinglot
