#pragma once

#include <functional>
#include <string>

#include "parkinglot/allocation_engine.h"
#include "parkinglot/pricing_table.h"
#include "parkinglot/session_ledger.h"
#include "parkinglot/spot_registry.h"
#include "parkinglot/types.h"

namespace parkinglot {

struct EntryRequest {
  VehicleId vehicleId;
  VehicleCategory category = VehicleCategory::Car;
  std::string licensePlate;
  Constraints constraints;
};

struct ExitRequest {
  VehicleId vehicleId;
};

struct AllocationResult {
  SessionId sessionId;
  SpotId spotId;
  TimePoint entry;
};

struct ExitResult {
  Receipt receipt;
};

/*
 Entry/exit protocol, per vehicle: NoSession -> Active -> Closed.

 enter: pricing lookup -> allocate -> open session. If opening the session
        fails, the claimed spot is released again before the error leaves.
 exit:  find session -> fee -> release spot + close session. The close runs
        inside the registry's release, under the spot's lock; the spot is
        only freed once the session is closed, so a failed close leaves both
        untouched.

 Every failure is a ParkingError scoped to the one request.
*/
class Gateway {
public:
  using ClockFn = std::function<TimePoint()>;

  static constexpr int kDefaultCloseRetries = 3;

  Gateway(PricingTable& pricing, SpotRegistry& registry, AllocationEngine& engine,
          SessionLedger& ledger, AllocationStrategy& strategy,
          int closeRetries = kDefaultCloseRetries, ClockFn clock = &Clock::now);

  AllocationResult enter(const EntryRequest& request);
  ExitResult exit(const ExitRequest& request);

private:
  Receipt closeWithRetry(const SessionId& sessionId, TimePoint exitTime, Money fee);

  PricingTable& pricing_;
  SpotRegistry& registry_;
  AllocationEngine& engine_;
  SessionLedger& ledger_;
  AllocationStrategy& strategy_;
  int closeRetries_;
  ClockFn clock_;
};

}  // namespace parkinglot
