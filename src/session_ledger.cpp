#include "parkinglot/session_ledger.h"

#include <mutex>

#include "parkinglot/error.h"
#include "parkinglot/ids.h"
#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

SessionLedger::SessionLedger(SessionStore& store) : store_(store) {}

SessionId SessionLedger::openSession(const VehicleId& vehicleId, VehicleCategory category,
                                     const string& licensePlate, const SpotId& spotId,
                                     Money ratePerHour, TimePoint entry) {
  unique_lock lock(mtx_);
  auto active = activeByVehicle_.find(vehicleId);
  if (active != activeByVehicle_.end()) {
    throw ParkingError(ErrorCode::DuplicateActiveSession,
                       "vehicle " + vehicleId + " already has open session " + active->second);
  }

  Session s;
  s.id = newUUID();
  s.vehicleId = vehicleId;
  s.category = category;
  s.licensePlate = licensePlate;
  s.spotId = spotId;
  s.ratePerHour = ratePerHour;
  s.entry = entry;

  store_.saveSession(s);
  activeByVehicle_[vehicleId] = s.id;
  SessionId id = s.id;
  sessions_.emplace(id, std::move(s));
  logger()->debug("session {} opened for {} at spot {}", id, vehicleId, spotId);
  return id;
}

Receipt SessionLedger::closeSession(const SessionId& sessionId, TimePoint exit, Money fee) {
  unique_lock lock(mtx_);
  auto it = sessions_.find(sessionId);
  if (it == sessions_.end()) {
    // closed sessions live only in the store
    auto stored = store_.loadSession(sessionId);
    if (stored && !stored->isActive()) {
      throw ParkingError(ErrorCode::SessionAlreadyClosed, "session already closed: " + sessionId);
    }
    throw ParkingError(ErrorCode::SessionNotFound, "no such session: " + sessionId);
  }
  const Session& current = it->second;
  if (exit < current.entry) {
    throw ParkingError(ErrorCode::InvalidDuration, "exit precedes entry for session " + sessionId);
  }

  Session closed = current;
  closed.exit = exit;
  closed.fee = fee;

  Receipt r;
  r.id = newUUID();
  r.sessionId = closed.id;
  r.vehicleId = closed.vehicleId;
  r.spotId = closed.spotId;
  r.entry = closed.entry;
  r.exit = exit;
  r.fee = fee;

  store_.commitClosure(closed, r);
  activeByVehicle_.erase(closed.vehicleId);
  sessions_.erase(it);
  logger()->debug("session {} closed, receipt {}", sessionId, r.id);
  return r;
}

optional<Session> SessionLedger::findActiveSession(const VehicleId& vehicleId) const {
  shared_lock lock(mtx_);
  auto it = activeByVehicle_.find(vehicleId);
  if (it == activeByVehicle_.end()) return nullopt;
  return sessions_.at(it->second);
}

optional<Session> SessionLedger::findSession(const SessionId& sessionId) const {
  shared_lock lock(mtx_);
  auto it = sessions_.find(sessionId);
  if (it == sessions_.end()) return store_.loadSession(sessionId);
  return it->second;
}

vector<Receipt> SessionLedger::receipts() const {
  return store_.loadReceipts();
}

size_t SessionLedger::activeCount() const {
  shared_lock lock(mtx_);
  return activeByVehicle_.size();
}

}  // namespace parkinglot
