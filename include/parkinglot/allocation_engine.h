#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "parkinglot/spot_registry.h"
#include "parkinglot/types.h"

namespace parkinglot {

// Orders candidate spots, best first. Implementations break ties by lowest
// spot id so the result is reproducible.
class AllocationStrategy {
public:
  virtual ~AllocationStrategy() = default;
  virtual void rank(std::vector<Spot>& candidates) = 0;
  virtual const char* name() const = 0;

  // Called once per successful allocation with the spot that was claimed.
  virtual void allocated(const Spot& /*spot*/) {}
};

class NearestFirst final : public AllocationStrategy {
public:
  void rank(std::vector<Spot>& candidates) override;
  const char* name() const override { return "nearest"; }
};

class FarthestFirst final : public AllocationStrategy {
public:
  void rank(std::vector<Spot>& candidates) override;
  const char* name() const override { return "farthest"; }
};

// Rotates over floors: ranking starts at the first floor after the one the
// last allocation landed on (wrapping), nearest spot first within a floor.
// Re-ranking without an allocation in between gives the same order.
class RoundRobin final : public AllocationStrategy {
public:
  void rank(std::vector<Spot>& candidates) override;
  void allocated(const Spot& spot) override;
  const char* name() const override { return "round-robin"; }

private:
  std::optional<int> lastFloor_;
  std::mutex mtx_;
};

// "nearest", "farthest" or "round-robin".
// Throws ParkingError(InvalidConfiguration) for anything else.
std::unique_ptr<AllocationStrategy> makeStrategy(const std::string& name);

class AllocationEngine {
public:
  // Lost races allowed per allocate() call, across all snapshots. Every lost
  // race is a spot another caller got, so with at most this many concurrent
  // winners ahead of a caller it never reports NoAvailableSpot while a
  // matching spot is free. Above that the caller may give up early and has
  // to retry from outside.
  static constexpr int kDefaultMaxClaimRetries = 16;

  explicit AllocationEngine(SpotRegistry& registry,
                            int maxClaimRetries = kDefaultMaxClaimRetries);

  // Ranks the free candidates with strategy and claims the best one through
  // the registry. A lost race moves on to the next-ranked candidate; after
  // maxClaimRetries lost races the result is empty (NoAvailableSpot).
  std::optional<SpotId> allocate(VehicleCategory category, const Constraints& constraints,
                                 const VehicleId& vehicleId, AllocationStrategy& strategy);

  int maxClaimRetries() const { return maxClaimRetries_; }

private:
  SpotRegistry& registry_;
  int maxClaimRetries_;
};

}  // namespace parkinglot
