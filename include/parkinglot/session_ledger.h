#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "parkinglot/session_store.h"
#include "parkinglot/types.h"

namespace parkinglot {

/*
 Active and completed parking sessions.

 open/close for the same vehicle are serialized (both run under the
 ledger's exclusive lock), so a vehicle can never hold two active sessions
 and a session can never be closed twice. The store is written first; the
 in-memory indices only change once the store has accepted the write.
 Only active sessions are indexed here; closed ones are read back from the
 store.
*/
class SessionLedger {
public:
  explicit SessionLedger(SessionStore& store);

  // Throws ParkingError(DuplicateActiveSession) if vehicleId already has an
  // open session. Store failures propagate with nothing recorded.
  SessionId openSession(const VehicleId& vehicleId, VehicleCategory category,
                        const std::string& licensePlate, const SpotId& spotId,
                        Money ratePerHour, TimePoint entry);

  // Terminal. Throws ParkingError(SessionNotFound | SessionAlreadyClosed |
  // InvalidDuration).
  Receipt closeSession(const SessionId& sessionId, TimePoint exit, Money fee);

  std::optional<Session> findActiveSession(const VehicleId& vehicleId) const;
  std::optional<Session> findSession(const SessionId& sessionId) const;

  std::vector<Receipt> receipts() const;
  std::size_t activeCount() const;

private:
  SessionStore& store_;
  std::map<SessionId, Session> sessions_;  // active only
  std::map<VehicleId, SessionId> activeByVehicle_;
  mutable std::shared_mutex mtx_;
};

}  // namespace parkinglot
