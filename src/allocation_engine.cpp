#include "parkinglot/allocation_engine.h"

#include <algorithm>
#include <set>

#include "parkinglot/error.h"
#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

void NearestFirst::rank(vector<Spot>& candidates) {
  sort(candidates.begin(), candidates.end(), [](const Spot& a, const Spot& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.id < b.id;
  });
}

void FarthestFirst::rank(vector<Spot>& candidates) {
  sort(candidates.begin(), candidates.end(), [](const Spot& a, const Spot& b) {
    if (a.distance != b.distance) return a.distance > b.distance;
    return a.id < b.id;
  });
}

void RoundRobin::rank(vector<Spot>& candidates) {
  if (candidates.empty()) return;

  set<int> floors;
  for (auto& s : candidates) floors.insert(s.floor);

  int start;
  {
    lock_guard lock(mtx_);
    auto next = lastFloor_ ? floors.upper_bound(*lastFloor_) : floors.begin();
    if (next == floors.end()) next = floors.begin();
    start = *next;
  }

  // floors at or after start come first, then the wrapped-around ones
  sort(candidates.begin(), candidates.end(), [start](const Spot& a, const Spot& b) {
    bool aWrapped = a.floor < start, bWrapped = b.floor < start;
    if (aWrapped != bWrapped) return bWrapped;
    if (a.floor != b.floor) return a.floor < b.floor;
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.id < b.id;
  });
}

void RoundRobin::allocated(const Spot& spot) {
  lock_guard lock(mtx_);
  lastFloor_ = spot.floor;
}

unique_ptr<AllocationStrategy> makeStrategy(const string& name) {
  if (name == "nearest")     return make_unique<NearestFirst>();
  if (name == "farthest")    return make_unique<FarthestFirst>();
  if (name == "round-robin") return make_unique<RoundRobin>();
  throw ParkingError(ErrorCode::InvalidConfiguration, "unknown allocation strategy: " + name);
}

AllocationEngine::AllocationEngine(SpotRegistry& registry, int maxClaimRetries)
  : registry_(registry), maxClaimRetries_(maxClaimRetries) {
  if (maxClaimRetries_ < 0) {
    throw ParkingError(ErrorCode::InvalidConfiguration, "max claim retries must be >= 0");
  }
}

optional<SpotId> AllocationEngine::allocate(VehicleCategory category,
                                            const Constraints& constraints,
                                            const VehicleId& vehicleId,
                                            AllocationStrategy& strategy) {
  int lostRaces = 0;
  while (true) {
    vector<Spot> candidates = registry_.candidates(category, constraints);
    if (candidates.empty()) return nullopt;
    strategy.rank(candidates);

    for (auto& c : candidates) {
      if (registry_.tryClaim(c.id, vehicleId)) {
        strategy.allocated(c);
        logger()->debug("{} allocated spot {} ({}, {} lost race(s))",
                        vehicleId, c.id, strategy.name(), lostRaces);
        return c.id;
      }
      if (++lostRaces > maxClaimRetries_) {
        logger()->warn("{} gave up after {} lost claim race(s)", vehicleId, lostRaces);
        return nullopt;
      }
    }
    // every candidate in this snapshot went to someone else; look again
  }
}

}  // namespace parkinglot
