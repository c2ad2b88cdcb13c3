#include "parkinglot/gateway.h"

#include <optional>

#include "parkinglot/error.h"
#include "parkinglot/fee_calculator.h"
#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

Gateway::Gateway(PricingTable& pricing, SpotRegistry& registry, AllocationEngine& engine,
                 SessionLedger& ledger, AllocationStrategy& strategy, int closeRetries,
                 ClockFn clock)
  : pricing_(pricing), registry_(registry), engine_(engine), ledger_(ledger),
    strategy_(strategy), closeRetries_(closeRetries), clock_(std::move(clock)) {
  if (closeRetries_ < 0) {
    throw ParkingError(ErrorCode::InvalidConfiguration, "close retries must be >= 0");
  }
}

AllocationResult Gateway::enter(const EntryRequest& request) {
  Money rate = pricing_.rateFor(request.category);

  auto spotId = engine_.allocate(request.category, request.constraints, request.vehicleId,
                                 strategy_);
  if (!spotId) {
    logger()->info("entry {} ({}) rejected: lot full", request.vehicleId,
                   toString(request.category));
    throw ParkingError(ErrorCode::NoAvailableSpot,
                       string("no available spot for category ") + toString(request.category));
  }

  TimePoint entry = clock_();
  SessionId sessionId;
  try {
    sessionId = ledger_.openSession(request.vehicleId, request.category, request.licensePlate,
                                    *spotId, rate, entry);
  } catch (const exception& e) {
    // undo the claim so the entry leaves no trace
    auto outcome = registry_.releaseHeldBy(*spotId, request.vehicleId, nullptr);
    logger()->warn("entry {} failed after claiming spot {} ({}); compensating release: {}",
                   request.vehicleId, *spotId, e.what(), toString(outcome));
    throw;
  }

  logger()->info("entry {} plate={} -> spot {} session {}", request.vehicleId,
                 request.licensePlate, *spotId, sessionId);
  return AllocationResult{sessionId, *spotId, entry};
}

ExitResult Gateway::exit(const ExitRequest& request) {
  auto session = ledger_.findActiveSession(request.vehicleId);
  if (!session) {
    throw ParkingError(ErrorCode::SessionNotFound,
                       "no active session for vehicle " + request.vehicleId);
  }

  TimePoint exitTime = clock_();
  Money fee = computeFee(session->entry, exitTime, session->ratePerHour);

  optional<Receipt> receipt;
  auto outcome = registry_.releaseHeldBy(session->spotId, request.vehicleId, [&] {
    receipt = closeWithRetry(session->id, exitTime, fee);
  });
  if (outcome != ReleaseOutcome::Released) {
    logger()->error("exit {}: session {} closed but spot {} was {}", request.vehicleId,
                    session->id, session->spotId, toString(outcome));
  }

  logger()->info("exit {} from spot {} fee={}", request.vehicleId, session->spotId,
                 formatMoney(fee));
  return ExitResult{*receipt};
}

Receipt Gateway::closeWithRetry(const SessionId& sessionId, TimePoint exitTime, Money fee) {
  for (int attempt = 0;; ++attempt) {
    try {
      return ledger_.closeSession(sessionId, exitTime, fee);
    } catch (const ParkingError& e) {
      if (e.code() != ErrorCode::StoreFailure || attempt >= closeRetries_) throw;
      logger()->warn("closing session {} failed (attempt {}): {}", sessionId, attempt + 1,
                     e.what());
    }
  }
}

}  // namespace parkinglot
