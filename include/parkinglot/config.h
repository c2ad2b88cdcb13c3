#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "parkinglot/allocation_engine.h"
#include "parkinglot/gateway.h"
#include "parkinglot/types.h"

namespace parkinglot {

struct LotConfig {
  std::string name;
  std::vector<Spot> spots;
  std::map<VehicleCategory, Money> rates;
  std::string strategy = "nearest";
  int maxClaimRetries = AllocationEngine::kDefaultMaxClaimRetries;
  int closeRetries = Gateway::kDefaultCloseRetries;
  std::string logLevel = "info";
  int workers = 4;
};

// All three throw ParkingError(InvalidConfiguration) on missing keys or
// bad values.
LotConfig parseConfig(const nlohmann::json& j);
LotConfig parseConfigString(const std::string& text);
LotConfig loadConfig(const std::string& path);

// Decimal currency amount (e.g. 4.5) -> minor units, half-up.
Money moneyFromDecimal(double amount);

}  // namespace parkinglot
