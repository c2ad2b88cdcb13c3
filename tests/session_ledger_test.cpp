#include "parkinglot/session_ledger.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "parkinglot/error.h"
#include "test_support.h"

using namespace std::chrono;
using namespace parkinglot;
using parkinglot::test::FlakySessionStore;

namespace {

class SessionLedgerTest : public ::testing::Test {
protected:
  SessionId open(const VehicleId& vehicle, const SpotId& spot = "S-1") {
    return ledger.openSession(vehicle, VehicleCategory::Car, "PLATE-" + vehicle, spot, 400, t0);
  }

  static ErrorCode codeOf(const std::function<void()>& fn) {
    try {
      fn();
    } catch (const ParkingError& e) {
      return e.code();
    }
    ADD_FAILURE() << "expected a ParkingError";
    return ErrorCode::StoreFailure;
  }

  const TimePoint t0 = TimePoint{} + hours(24 * 365 * 50);
  FlakySessionStore store;
  SessionLedger ledger{store};
};

TEST_F(SessionLedgerTest, OpenThenFindActive) {
  auto id = open("v1");
  auto s = ledger.findActiveSession("v1");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->id, id);
  EXPECT_EQ(s->spotId, "S-1");
  EXPECT_EQ(s->licensePlate, "PLATE-v1");
  EXPECT_EQ(s->ratePerHour, 400);
  EXPECT_TRUE(s->isActive());
  EXPECT_EQ(ledger.activeCount(), 1u);
  EXPECT_FALSE(ledger.findActiveSession("v2"));
}

TEST_F(SessionLedgerTest, SecondOpenForSameVehicleFails) {
  open("v1");
  EXPECT_EQ(codeOf([&] { open("v1", "S-2"); }), ErrorCode::DuplicateActiveSession);
  EXPECT_EQ(ledger.findActiveSession("v1")->spotId, "S-1");
}

TEST_F(SessionLedgerTest, CloseProducesReceiptAndFreezesSession) {
  auto id = open("v1");
  auto r = ledger.closeSession(id, t0 + hours(2), 800);
  EXPECT_EQ(r.sessionId, id);
  EXPECT_EQ(r.vehicleId, "v1");
  EXPECT_EQ(r.spotId, "S-1");
  EXPECT_EQ(r.fee, 800);
  EXPECT_EQ(r.entry, t0);
  EXPECT_EQ(r.exit, t0 + hours(2));
  EXPECT_FALSE(r.id.empty());

  EXPECT_FALSE(ledger.findActiveSession("v1"));
  auto closed = ledger.findSession(id);
  ASSERT_TRUE(closed);
  EXPECT_FALSE(closed->isActive());
  EXPECT_EQ(*closed->fee, 800);

  ASSERT_EQ(ledger.receipts().size(), 1u);
}

TEST_F(SessionLedgerTest, CloseIsTerminal) {
  auto id = open("v1");
  ledger.closeSession(id, t0 + hours(1), 400);
  EXPECT_EQ(codeOf([&] { ledger.closeSession(id, t0 + hours(3), 1200); }),
            ErrorCode::SessionAlreadyClosed);
  // never charged twice
  ASSERT_EQ(ledger.receipts().size(), 1u);
  EXPECT_EQ(ledger.receipts()[0].fee, 400);
}

TEST_F(SessionLedgerTest, ClosedSessionIsReadBackFromStore) {
  auto id = open("v1");
  ledger.closeSession(id, t0 + hours(2), 800);

  auto closed = ledger.findSession(id);
  ASSERT_TRUE(closed);
  EXPECT_FALSE(closed->isActive());
  EXPECT_EQ(*closed->exit, t0 + hours(2));
  EXPECT_EQ(*closed->fee, 800);

  // a ledger with no in-memory history still sees it through the store
  SessionLedger reopened{store};
  auto fromStore = reopened.findSession(id);
  ASSERT_TRUE(fromStore);
  EXPECT_EQ(*fromStore->fee, 800);
  EXPECT_EQ(codeOf([&] { reopened.closeSession(id, t0 + hours(3), 1200); }),
            ErrorCode::SessionAlreadyClosed);
  EXPECT_EQ(codeOf([&] { reopened.closeSession("missing", t0, 0); }), ErrorCode::SessionNotFound);
  EXPECT_EQ(store.loadReceipts().size(), 1u);
}

TEST_F(SessionLedgerTest, CloseUnknownSession) {
  EXPECT_EQ(codeOf([&] { ledger.closeSession("missing", t0, 0); }), ErrorCode::SessionNotFound);
}

TEST_F(SessionLedgerTest, CloseBeforeEntryIsInvalid) {
  auto id = open("v1");
  EXPECT_EQ(codeOf([&] { ledger.closeSession(id, t0 - seconds(1), 0); }),
            ErrorCode::InvalidDuration);
  EXPECT_TRUE(ledger.findActiveSession("v1"));
}

TEST_F(SessionLedgerTest, VehicleCanReturnAfterClosing) {
  auto first = open("v1");
  ledger.closeSession(first, t0 + minutes(5), 33);
  auto second = open("v1");
  EXPECT_NE(first, second);
  EXPECT_EQ(ledger.findActiveSession("v1")->id, second);
}

TEST_F(SessionLedgerTest, StoreFailureOnOpenRecordsNothing) {
  store.failNextSaves(1);
  EXPECT_EQ(codeOf([&] { open("v1"); }), ErrorCode::StoreFailure);
  EXPECT_FALSE(ledger.findActiveSession("v1"));
  EXPECT_EQ(ledger.activeCount(), 0u);
  open("v1");
  EXPECT_TRUE(ledger.findActiveSession("v1"));
}

TEST_F(SessionLedgerTest, StoreFailureOnCloseLeavesSessionActive) {
  auto id = open("v1");
  store.failNextClosures(1);
  EXPECT_EQ(codeOf([&] { ledger.closeSession(id, t0 + hours(1), 400); }), ErrorCode::StoreFailure);
  EXPECT_TRUE(ledger.findActiveSession("v1"));
  EXPECT_TRUE(ledger.receipts().empty());
  ledger.closeSession(id, t0 + hours(1), 400);
  EXPECT_EQ(ledger.receipts().size(), 1u);
}

TEST_F(SessionLedgerTest, ConcurrentCheckInsOfOneVehicleYieldOneSession) {
  const int kThreads = 16;
  std::atomic<int> go{0}, opened{0}, duplicates{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load()) std::this_thread::yield();
      try {
        open("same", "S-" + std::to_string(t));
        ++opened;
      } catch (const ParkingError& e) {
        if (e.code() == ErrorCode::DuplicateActiveSession) ++duplicates;
      }
    });
  }
  go.store(1);
  for (auto& th : threads) th.join();
  EXPECT_EQ(opened.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);
}

TEST_F(SessionLedgerTest, ConcurrentCheckOutsCloseOnce) {
  auto id = open("v1");
  const int kThreads = 16;
  std::atomic<int> go{0}, closed{0}, rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      while (!go.load()) std::this_thread::yield();
      try {
        ledger.closeSession(id, t0 + hours(1), 400);
        ++closed;
      } catch (const ParkingError& e) {
        if (e.code() == ErrorCode::SessionAlreadyClosed) ++rejected;
      }
    });
  }
  go.store(1);
  for (auto& th : threads) th.join();
  EXPECT_EQ(closed.load(), 1);
  EXPECT_EQ(rejected.load(), kThreads - 1);
  EXPECT_EQ(ledger.receipts().size(), 1u);
}

}  // namespace
