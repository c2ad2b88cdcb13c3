#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "parkinglot/config.h"
#include "parkinglot/error.h"
#include "parkinglot/fee_calculator.h"
#include "parkinglot/logging.h"
#include "parkinglot/parking_lot.h"
using namespace std;
using namespace parkinglot;

/*
 1) APIs: (All APIs are thread-safe and can be called directly by clients)
    - Gateway::enter(vehicleId, category, plate, constraints) -> AllocationResult{sessionId, spotId}
    - Gateway::exit(vehicleId) -> ExitResult{receipt}
    - SpotRegistry::status(spotId) -> optional<Spot>
    - SpotRegistry::occupancy() -> {total, free, reserved}
*/

/*
 2) Data Models: how things are stored (parkinglot/types.h)

   enum class VehicleCategory { Motorcycle, Car, Bus };   // also the spot size

   struct Spot {
     string id;
     int floor;
     VehicleCategory size;
     bool accessible, charging;
     int distance;                 // from the entrance
     optional<string> occupant;    // empty == free
     uint64_t version;             // bumped by every claim/release
   };

   struct Session {
     string id, vehicleId, licensePlate, spotId;
     Money ratePerHour;            // locked in at entry
     time_point entry;
     optional<time_point> exit;    // set once, then the session is frozen
     optional<Money> fee;
   };

   struct Receipt { id, sessionId, vehicleId, spotId, entry, exit, fee };
*/

/*
 3) Repositories: handle all data access (no business logic here)
    - SpotRegistry: spot catalogue, one mutex per spot, claim/release only
    - SessionStore / InMemorySessionStore: sessions + receipts
    - PricingTable: category -> hourly rate
*/

/*
 4) Services: business logic on top of the repositories
    - AllocationEngine: rank candidates (nearest / farthest / round-robin),
      claim the best one, retry on a lost race up to a bound
    - SessionLedger: open/close sessions, one active session per vehicle
    - computeFee: pure (entry, exit, rate) -> amount
    - Gateway: entry/exit protocol with compensating release
*/

/*
 5) Flow:
    - lot is provisioned once from the JSON config
    - on entry: enter(...) -> claims a spot, opens a session, or NoAvailableSpot
    - on exit: exit(...) -> fee, closes the session and frees the spot together
    - status/occupancy for a dashboard
*/

/* Thread-safety notes:
   - One mutex per spot: two cars park in different spots concurrently.
   - "Pick" and "claim" are separate; the claim re-checks under the spot's lock.
   - The ledger serializes open/close, so one vehicle never holds two sessions.
   - Exit closes the session while holding the spot's lock; lock order is
     always spot -> ledger.
*/

namespace {

void printUsage() {
  cout << "commands:\n"
       << "  enter <vehicle> <motorcycle|car|bus> <plate> [accessible] [charging]\n"
       << "  exit <vehicle>\n"
       << "  status <spot>\n"
       << "  occupancy\n"
       << "  quit\n";
}

void handleEnter(ParkingLot& lot, istringstream& in) {
  EntryRequest req;
  string category;
  if (!(in >> req.vehicleId >> category >> req.licensePlate)) {
    cout << "ERROR usage: enter <vehicle> <category> <plate> [accessible] [charging]\n";
    return;
  }
  req.category = parseVehicleCategory(category);
  string flag;
  while (in >> flag) {
    if (flag == "accessible") req.constraints.accessible = true;
    else if (flag == "charging") req.constraints.charging = true;
    else {
      cout << "ERROR unknown constraint: " << flag << "\n";
      return;
    }
  }
  auto res = lot.gateway().enter(req);
  cout << "OK spot=" << res.spotId << " session=" << res.sessionId << "\n";
}

void handleExit(ParkingLot& lot, istringstream& in) {
  ExitRequest req;
  if (!(in >> req.vehicleId)) {
    cout << "ERROR usage: exit <vehicle>\n";
    return;
  }
  auto res = lot.gateway().exit(req);
  cout << "OK spot=" << res.receipt.spotId << " fee=" << formatMoney(res.receipt.fee)
       << " receipt=" << res.receipt.id << "\n";
}

void handleStatus(ParkingLot& lot, istringstream& in) {
  string spotId;
  if (!(in >> spotId)) {
    cout << "ERROR usage: status <spot>\n";
    return;
  }
  auto spot = lot.registry().status(spotId);
  if (!spot) {
    cout << "ERROR " << toString(ErrorCode::SpotNotFound) << " " << spotId << "\n";
    return;
  }
  cout << "OK spot=" << spot->id << " floor=" << spot->floor << " size=" << toString(spot->size)
       << " state=" << (spot->isFree() ? "free" : "reserved:" + *spot->occupant)
       << " version=" << spot->version << "\n";
}

void handleOccupancy(ParkingLot& lot) {
  auto o = lot.registry().occupancy();
  cout << "OK total=" << o.total << " free=" << o.free << " reserved=" << o.reserved
       << " active_sessions=" << lot.ledger().activeCount() << "\n";
  for (auto& [floor, f] : lot.registry().occupancyByFloor())
    cout << "   floor " << floor << ": " << f.free << "/" << f.total << " free\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  try {
    LotConfig cfg = loadConfig(argv[1]);
    setupLogging(cfg.logLevel);
    ParkingLot lot(cfg);

    string line;
    while (getline(cin, line)) {
      istringstream in(line);
      string cmd;
      if (!(in >> cmd)) continue;
      if (cmd == "quit") break;

      try {
        if (cmd == "enter")          handleEnter(lot, in);
        else if (cmd == "exit")      handleExit(lot, in);
        else if (cmd == "status")    handleStatus(lot, in);
        else if (cmd == "occupancy") handleOccupancy(lot);
        else                         printUsage();
      } catch (const ParkingError& e) {
        // scoped to this one request
        cout << "ERROR " << toString(e.code()) << " " << e.what() << "\n";
      }
    }
  } catch (const ParkingError& e) {
    logger()->critical("{}: {}", toString(e.code()), e.what());
    return 1;
  } catch (const exception& e) {
    logger()->critical("fatal: {}", e.what());
    return 1;
  }
  return 0;
}
