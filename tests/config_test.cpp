#include "parkinglot/config.h"

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "parkinglot/error.h"
#include "parkinglot/parking_lot.h"

using namespace parkinglot;

namespace {

const char* kLot = R"({
  "lot": {
    "name": "test-lot",
    "floors": [
      {"floor": 1, "spots": [
        {"id": "A", "size": "car", "accessible": true, "distance": 7},
        {"size": "motorcycle"}
      ]},
      {"floor": 2, "spots": [
        {"id": "B", "size": "bus", "charging": true, "distance": 300}
      ]}
    ]
  },
  "pricing": {"car": 4.0, "motorcycle": 1.5, "bus": 12.25},
  "allocation": {"strategy": "round-robin", "max_claim_retries": 5},
  "gateway": {"close_retries": 2},
  "logging": {"level": "debug"},
  "channel": {"workers": 3}
})";

ErrorCode codeOf(const std::string& text) {
  try {
    parseConfigString(text);
  } catch (const ParkingError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a ParkingError for: " << text;
  return ErrorCode::StoreFailure;
}

TEST(ConfigTest, ParsesFullDocument) {
  LotConfig cfg = parseConfigString(kLot);
  EXPECT_EQ(cfg.name, "test-lot");
  ASSERT_EQ(cfg.spots.size(), 3u);

  EXPECT_EQ(cfg.spots[0].id, "A");
  EXPECT_EQ(cfg.spots[0].size, VehicleCategory::Car);
  EXPECT_TRUE(cfg.spots[0].accessible);
  EXPECT_FALSE(cfg.spots[0].charging);
  EXPECT_EQ(cfg.spots[0].distance, 7);

  // generated id and distance
  EXPECT_EQ(cfg.spots[1].id, "L1-002");
  EXPECT_EQ(cfg.spots[1].distance, 101);
  EXPECT_EQ(cfg.spots[1].floor, 1);

  EXPECT_EQ(cfg.spots[2].floor, 2);
  EXPECT_TRUE(cfg.spots[2].charging);

  EXPECT_EQ(cfg.rates.at(VehicleCategory::Car), 400);
  EXPECT_EQ(cfg.rates.at(VehicleCategory::Motorcycle), 150);
  EXPECT_EQ(cfg.rates.at(VehicleCategory::Bus), 1225);

  EXPECT_EQ(cfg.strategy, "round-robin");
  EXPECT_EQ(cfg.maxClaimRetries, 5);
  EXPECT_EQ(cfg.closeRetries, 2);
  EXPECT_EQ(cfg.logLevel, "debug");
  EXPECT_EQ(cfg.workers, 3);
}

TEST(ConfigTest, OptionalSectionsDefault) {
  LotConfig cfg = parseConfigString(R"({
    "lot": {"floors": [{"floor": 0, "spots": [{"size": "car"}]}]},
    "pricing": {"car": 2}
  })");
  EXPECT_EQ(cfg.name, "parking-lot");
  EXPECT_EQ(cfg.strategy, "nearest");
  EXPECT_EQ(cfg.maxClaimRetries, AllocationEngine::kDefaultMaxClaimRetries);
  EXPECT_EQ(cfg.closeRetries, Gateway::kDefaultCloseRetries);
  EXPECT_EQ(cfg.spots[0].id, "L0-001");
}

TEST(ConfigTest, RejectsBadInput) {
  EXPECT_EQ(codeOf("not json"), ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"pricing": {"car": 1}})"), ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": []}, "pricing": {"car": 1}})"),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": [{"floor": 1, "spots": [{"size": "tank"}]}]},
                       "pricing": {"car": 1}})"),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": [{"floor": 1, "spots": [{"size": "car"}]}]},
                       "pricing": {"car": -1}})"),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": [{"floor": 1, "spots": [{"size": "car"}]}]},
                       "pricing": {"car": "cheap"}})"),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": [{"floor": 1, "spots": [{"size": "car"}]}]},
                       "pricing": {"car": 1}, "allocation": {"strategy": "random"}})"),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf(R"({"lot": {"floors": [{"floor": 1, "spots": [
                         {"id": "X", "size": "car"}, {"id": "X", "size": "car"}]}]},
                       "pricing": {"car": 1}})"),
            ErrorCode::InvalidConfiguration);
}

TEST(ConfigTest, MoneyFromDecimalRoundsHalfUp) {
  EXPECT_EQ(moneyFromDecimal(4.0), 400);
  EXPECT_EQ(moneyFromDecimal(0.125), 13);
  EXPECT_EQ(moneyFromDecimal(0), 0);
  // decimal half-cents whose binary value sits just below the half
  EXPECT_EQ(moneyFromDecimal(0.285), 29);
  EXPECT_EQ(moneyFromDecimal(1.005), 101);
  EXPECT_EQ(moneyFromDecimal(2.675), 268);
  EXPECT_EQ(moneyFromDecimal(0.284), 28);
  EXPECT_EQ(moneyFromDecimal(-0.285), -29);
  EXPECT_THROW(moneyFromDecimal(1e15), ParkingError);
}

TEST(ConfigTest, DecimalRatesRoundOnTheirDigits) {
  LotConfig cfg = parseConfigString(R"({
    "lot": {"floors": [{"floor": 1, "spots": [{"size": "car"}]}]},
    "pricing": {"car": 0.285, "bus": 1.005}
  })");
  EXPECT_EQ(cfg.rates.at(VehicleCategory::Car), 29);
  EXPECT_EQ(cfg.rates.at(VehicleCategory::Bus), 101);
}

TEST(ConfigTest, LoadsFromFileAndBuildsLot) {
  std::string path = ::testing::TempDir() + "parkinglot_config_test.json";
  {
    std::ofstream out(path);
    out << kLot;
  }
  LotConfig cfg = loadConfig(path);
  std::remove(path.c_str());

  ParkingLot lot(cfg);
  EXPECT_EQ(lot.name(), "test-lot");
  EXPECT_EQ(lot.registry().size(), 3u);
  EXPECT_EQ(lot.pricing().rateFor(VehicleCategory::Bus), 1225);

  auto res = lot.gateway().enter(EntryRequest{"bus-1", VehicleCategory::Bus, "BUS", {}});
  EXPECT_EQ(res.spotId, "B");
}

TEST(ConfigTest, MissingFile) {
  EXPECT_THROW(loadConfig("/nonexistent/parkinglot.json"), ParkingError);
}

}  // namespace
