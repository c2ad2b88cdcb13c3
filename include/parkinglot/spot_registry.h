#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "parkinglot/types.h"

namespace parkinglot {

enum class ReleaseOutcome { Released, AlreadyFree, HeldByOther };

const char* toString(ReleaseOutcome outcome);

struct Occupancy {
  std::size_t total = 0;
  std::size_t free = 0;
  std::size_t reserved = 0;
};

/*
 Owns every spot's occupancy. Each spot carries its own mutex, so claims
 and releases on different spots never contend; the catalogue itself is
 guarded by a shared_mutex and only grows (spots are never removed, which
 keeps slot pointers stable once the catalogue lock is dropped).

 All state transitions happen under the spot's mutex: there is no
 read-then-write path from outside the registry.
*/
class SpotRegistry {
public:
  // Throws ParkingError(DuplicateSpot).
  void addSpot(Spot spot);

  // Claims the lowest-id free spot that fits. Empty when the lot is full for
  // this category/constraints; that is a normal outcome.
  std::optional<SpotId> claim(VehicleCategory category, const Constraints& constraints,
                              const VehicleId& vehicleId);

  // Claims exactly this spot if it is still free. false == lost the race.
  // Throws ParkingError(SpotNotFound).
  bool tryClaim(const SpotId& spotId, const VehicleId& vehicleId);

  // Free spots that fit, as of now. Copies: callers still have to claim.
  std::vector<Spot> candidates(VehicleCategory category, const Constraints& constraints) const;

  // Unconditional release. Throws ParkingError(SpotNotFound).
  ReleaseOutcome release(const SpotId& spotId);

  // Runs commit under the spot's lock, then frees the spot if it is still
  // held by vehicleId. If commit throws, the spot is left untouched and the
  // exception propagates. commit may be empty.
  ReleaseOutcome releaseHeldBy(const SpotId& spotId, const VehicleId& vehicleId,
                               const std::function<void()>& commit);

  std::optional<Spot> status(const SpotId& spotId) const;

  Occupancy occupancy() const;
  std::map<int, Occupancy> occupancyByFloor() const;
  std::size_t size() const;

private:
  struct Slot {
    Spot spot;
    mutable std::mutex mtx;
  };

  Slot* find(const SpotId& spotId) const;
  Slot& mustFind(const SpotId& spotId) const;

  std::map<SpotId, std::unique_ptr<Slot>> slots_;
  mutable std::shared_mutex mtx_;
};

}  // namespace parkinglot
