#include "parkinglot/session_store.h"

#include <mutex>

#include "parkinglot/error.h"

using namespace std;

namespace parkinglot {

void InMemorySessionStore::saveSession(const Session& session) {
  unique_lock lock(mtx_);
  sessions_[session.id] = session;
}

void InMemorySessionStore::commitClosure(const Session& closed, const Receipt& receipt) {
  unique_lock lock(mtx_);
  if (receipts_.count(closed.id)) {
    throw ParkingError(ErrorCode::StoreFailure, "receipt already recorded for session " + closed.id);
  }
  sessions_[closed.id] = closed;
  receipts_.emplace(closed.id, receipt);
}

optional<Session> InMemorySessionStore::loadSession(const SessionId& id) const {
  shared_lock lock(mtx_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return nullopt;
  return it->second;
}

vector<Receipt> InMemorySessionStore::loadReceipts() const {
  shared_lock lock(mtx_);
  vector<Receipt> res;
  res.reserve(receipts_.size());
  for (auto& [_, r] : receipts_) res.push_back(r);
  return res;
}

}  // namespace parkinglot
