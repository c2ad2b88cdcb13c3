#include "parkinglot/spot_registry.h"

#include "parkinglot/error.h"
#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

const char* toString(ReleaseOutcome outcome) {
  switch (outcome) {
    case ReleaseOutcome::Released:    return "Released";
    case ReleaseOutcome::AlreadyFree: return "AlreadyFree";
    case ReleaseOutcome::HeldByOther: return "HeldByOther";
  }
  return "Unknown";
}

void SpotRegistry::addSpot(Spot spot) {
  unique_lock lock(mtx_);
  if (slots_.count(spot.id)) {
    throw ParkingError(ErrorCode::DuplicateSpot, "spot already provisioned: " + spot.id);
  }
  auto slot = make_unique<Slot>();
  SpotId id = spot.id;
  slot->spot = std::move(spot);
  slots_.emplace(std::move(id), std::move(slot));
}

optional<SpotId> SpotRegistry::claim(VehicleCategory category, const Constraints& constraints,
                                     const VehicleId& vehicleId) {
  shared_lock lock(mtx_);
  // map order == lowest id first
  for (auto& [spotId, slot] : slots_) {
    lock_guard spotLock(slot->mtx);
    Spot& s = slot->spot;
    if (!s.isFree() || !fits(s, category, constraints)) continue;
    s.occupant = vehicleId;
    ++s.version;
    logger()->debug("spot {} claimed by {}", spotId, vehicleId);
    return spotId;
  }
  return nullopt;
}

bool SpotRegistry::tryClaim(const SpotId& spotId, const VehicleId& vehicleId) {
  Slot& slot = mustFind(spotId);
  lock_guard spotLock(slot.mtx);
  if (!slot.spot.isFree()) return false;
  slot.spot.occupant = vehicleId;
  ++slot.spot.version;
  logger()->debug("spot {} claimed by {}", spotId, vehicleId);
  return true;
}

vector<Spot> SpotRegistry::candidates(VehicleCategory category,
                                      const Constraints& constraints) const {
  vector<Spot> res;
  shared_lock lock(mtx_);
  for (auto& [_, slot] : slots_) {
    lock_guard spotLock(slot->mtx);
    if (slot->spot.isFree() && fits(slot->spot, category, constraints))
      res.push_back(slot->spot);
  }
  return res;
}

ReleaseOutcome SpotRegistry::release(const SpotId& spotId) {
  Slot& slot = mustFind(spotId);
  lock_guard spotLock(slot.mtx);
  if (slot.spot.isFree()) {
    logger()->warn("release of spot {} which is already free", spotId);
    return ReleaseOutcome::AlreadyFree;
  }
  slot.spot.occupant.reset();
  ++slot.spot.version;
  logger()->debug("spot {} released", spotId);
  return ReleaseOutcome::Released;
}

ReleaseOutcome SpotRegistry::releaseHeldBy(const SpotId& spotId, const VehicleId& vehicleId,
                                           const function<void()>& commit) {
  Slot& slot = mustFind(spotId);
  lock_guard spotLock(slot.mtx);
  if (commit) commit();

  Spot& s = slot.spot;
  if (s.isFree()) {
    logger()->warn("spot {} already free when {} released it", spotId, vehicleId);
    return ReleaseOutcome::AlreadyFree;
  }
  if (*s.occupant != vehicleId) {
    logger()->error("spot {} is held by {}, not by releasing vehicle {}",
                    spotId, *s.occupant, vehicleId);
    return ReleaseOutcome::HeldByOther;
  }
  s.occupant.reset();
  ++s.version;
  logger()->debug("spot {} released by {}", spotId, vehicleId);
  return ReleaseOutcome::Released;
}

optional<Spot> SpotRegistry::status(const SpotId& spotId) const {
  Slot* slot = find(spotId);
  if (!slot) return nullopt;
  lock_guard spotLock(slot->mtx);
  return slot->spot;
}

Occupancy SpotRegistry::occupancy() const {
  Occupancy o;
  shared_lock lock(mtx_);
  for (auto& [_, slot] : slots_) {
    lock_guard spotLock(slot->mtx);
    ++o.total;
    if (slot->spot.isFree()) ++o.free;
    else ++o.reserved;
  }
  return o;
}

map<int, Occupancy> SpotRegistry::occupancyByFloor() const {
  map<int, Occupancy> res;
  shared_lock lock(mtx_);
  for (auto& [_, slot] : slots_) {
    lock_guard spotLock(slot->mtx);
    Occupancy& o = res[slot->spot.floor];
    ++o.total;
    if (slot->spot.isFree()) ++o.free;
    else ++o.reserved;
  }
  return res;
}

size_t SpotRegistry::size() const {
  shared_lock lock(mtx_);
  return slots_.size();
}

SpotRegistry::Slot* SpotRegistry::find(const SpotId& spotId) const {
  shared_lock lock(mtx_);
  auto it = slots_.find(spotId);
  if (it == slots_.end()) return nullptr;
  return it->second.get();
}

SpotRegistry::Slot& SpotRegistry::mustFind(const SpotId& spotId) const {
  Slot* slot = find(spotId);
  if (!slot) throw ParkingError(ErrorCode::SpotNotFound, "no such spot: " + spotId);
  return *slot;
}

}  // namespace parkinglot
