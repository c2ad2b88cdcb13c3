#include "parkinglot/parking_lot.h"

#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

ParkingLot::ParkingLot(const LotConfig& config, unique_ptr<SessionStore> store,
                       Gateway::ClockFn clock)
  : name_(config.name), pricing_(config.rates), store_(std::move(store)) {
  for (const auto& spot : config.spots) registry_.addSpot(spot);
  if (!store_) store_ = make_unique<InMemorySessionStore>();

  ledger_ = make_unique<SessionLedger>(*store_);
  strategy_ = makeStrategy(config.strategy);
  engine_ = make_unique<AllocationEngine>(registry_, config.maxClaimRetries);
  gateway_ = make_unique<Gateway>(pricing_, registry_, *engine_, *ledger_, *strategy_,
                                  config.closeRetries, std::move(clock));

  logger()->info("lot '{}' provisioned: {} spot(s), strategy {}", name_, registry_.size(),
                 strategy_->name());
}

}  // namespace parkinglot
