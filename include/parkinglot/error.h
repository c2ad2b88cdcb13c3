#pragma once

#include <stdexcept>
#include <string>

namespace parkinglot {

enum class ErrorCode {
  NoAvailableSpot,
  UnknownVehicleCategory,
  DuplicateActiveSession,
  SessionNotFound,
  SessionAlreadyClosed,
  InvalidDuration,
  SpotNotFound,
  DuplicateSpot,
  InvalidConfiguration,
  StoreFailure,
  ChannelClosed,
};

const char* toString(ErrorCode code);

// Every failure of a single request surfaces as a ParkingError.
// Expected absences (lot full at the registry level, lookups) use std::optional instead.
class ParkingError : public std::runtime_error {
public:
  ParkingError(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

}  // namespace parkinglot
