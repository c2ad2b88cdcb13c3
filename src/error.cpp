#include "parkinglot/error.h"

namespace parkinglot {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NoAvailableSpot:        return "NoAvailableSpot";
    case ErrorCode::UnknownVehicleCategory: return "UnknownVehicleCategory";
    case ErrorCode::DuplicateActiveSession: return "DuplicateActiveSession";
    case ErrorCode::SessionNotFound:        return "SessionNotFound";
    case ErrorCode::SessionAlreadyClosed:   return "SessionAlreadyClosed";
    case ErrorCode::InvalidDuration:        return "InvalidDuration";
    case ErrorCode::SpotNotFound:           return "SpotNotFound";
    case ErrorCode::DuplicateSpot:          return "DuplicateSpot";
    case ErrorCode::InvalidConfiguration:   return "InvalidConfiguration";
    case ErrorCode::StoreFailure:           return "StoreFailure";
    case ErrorCode::ChannelClosed:          return "ChannelClosed";
  }
  return "Unknown";
}

ParkingError::ParkingError(ErrorCode code, const std::string& message)
  : std::runtime_error(message), code_(code) {}

}  // namespace parkinglot
