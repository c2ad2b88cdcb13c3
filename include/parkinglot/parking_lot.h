#pragma once

#include <memory>

#include "parkinglot/allocation_engine.h"
#include "parkinglot/config.h"
#include "parkinglot/gateway.h"
#include "parkinglot/pricing_table.h"
#include "parkinglot/session_ledger.h"
#include "parkinglot/session_store.h"
#include "parkinglot/spot_registry.h"

namespace parkinglot {

// Wires one lot instance together from its configuration: the single
// authority for that lot's spot and session state.
class ParkingLot {
public:
  // store may be null, in which case an InMemorySessionStore is used.
  explicit ParkingLot(const LotConfig& config, std::unique_ptr<SessionStore> store = nullptr,
                      Gateway::ClockFn clock = &Clock::now);

  Gateway& gateway() { return *gateway_; }
  SpotRegistry& registry() { return registry_; }
  SessionLedger& ledger() { return *ledger_; }
  PricingTable& pricing() { return pricing_; }
  const std::string& name() const { return name_; }

private:
  std::string name_;
  PricingTable pricing_;
  SpotRegistry registry_;
  std::unique_ptr<SessionStore> store_;
  std::unique_ptr<SessionLedger> ledger_;
  std::unique_ptr<AllocationStrategy> strategy_;
  std::unique_ptr<AllocationEngine> engine_;
  std::unique_ptr<Gateway> gateway_;
};

}  // namespace parkinglot
