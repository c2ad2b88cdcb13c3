#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "parkinglot/types.h"

namespace parkinglot {

/*
 Durable side of the session ledger: persistence only, no business logic.
 Each call is atomic on its own; implementations report failure by throwing
 ParkingError(StoreFailure) and must leave the record unchanged when they do.
*/
class SessionStore {
public:
  virtual ~SessionStore() = default;

  virtual void saveSession(const Session& session) = 0;
  // Writes the terminal session and its receipt as one unit.
  virtual void commitClosure(const Session& closed, const Receipt& receipt) = 0;
  virtual std::optional<Session> loadSession(const SessionId& id) const = 0;
  virtual std::vector<Receipt> loadReceipts() const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
  void saveSession(const Session& session) override;
  void commitClosure(const Session& closed, const Receipt& receipt) override;
  std::optional<Session> loadSession(const SessionId& id) const override;
  std::vector<Receipt> loadReceipts() const override;

private:
  std::map<SessionId, Session> sessions_;
  std::map<SessionId, Receipt> receipts_;  // by session id
  mutable std::shared_mutex mtx_;
};

}  // namespace parkinglot
