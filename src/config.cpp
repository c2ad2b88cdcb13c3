#include "parkinglot/config.h"

#include <cmath>
#include <fstream>
#include <set>
#include <string>

#include <fmt/format.h>

#include "parkinglot/error.h"

using namespace std;
using json = nlohmann::json;

namespace parkinglot {

namespace {

[[noreturn]] void invalid(const string& what) {
  throw ParkingError(ErrorCode::InvalidConfiguration, what);
}

const json& must(const json& j, const char* key) {
  if (!j.is_object() || !j.contains(key)) invalid(string("config missing key: ") + key);
  return j.at(key);
}

template <typename T>
T valueOr(const json& j, const char* key, T fallback) {
  if (!j.contains(key)) return fallback;
  return j.at(key).get<T>();
}

VehicleCategory categoryFrom(const string& name) {
  try {
    return parseVehicleCategory(name);
  } catch (const ParkingError&) {
    invalid("unknown category in config: " + name);
  }
}

Spot spotFrom(const json& js, int floor, size_t index) {
  Spot s;
  s.floor = floor;
  s.id = js.contains("id") ? js.at("id").get<string>()
                           : fmt::format("L{}-{:03}", floor, index + 1);
  s.size = categoryFrom(must(js, "size").get<string>());
  s.accessible = valueOr(js, "accessible", false);
  s.charging = valueOr(js, "charging", false);
  // default: walk further the deeper into the row and the higher the floor
  s.distance = valueOr(js, "distance", floor * 100 + static_cast<int>(index));
  if (s.id.empty()) invalid(fmt::format("empty spot id on floor {}", floor));
  if (s.distance < 0) invalid("negative distance for spot " + s.id);
  return s;
}

}  // namespace

Money moneyFromDecimal(double amount) {
  if (!isfinite(amount)) invalid("amount is not a finite number");
  if (fabs(amount) > 1e12) invalid(fmt::format("amount out of range: {}", amount));

  // Round on the decimal digits, not the binary value: 0.285 is stored as
  // 0.28499999.. but means 28.5 cents. Nine places absorb the binary error.
  string digits = fmt::format("{:.9f}", fabs(amount));
  auto dot = digits.find('.');
  Money whole = stoll(digits.substr(0, dot));
  Money cents = stoll(digits.substr(dot + 1, 2));
  Money rounded = whole * 100 + cents + (digits[dot + 3] >= '5' ? 1 : 0);
  return amount < 0 ? -rounded : rounded;
}

LotConfig parseConfig(const json& j) {
  LotConfig cfg;
  try {
    const auto& lot = must(j, "lot");
    cfg.name = valueOr<string>(lot, "name", "parking-lot");

    const auto& floors = must(lot, "floors");
    if (!floors.is_array() || floors.empty()) invalid("'lot.floors' must be a non-empty array");

    set<SpotId> seen;
    for (const auto& jf : floors) {
      int floor = must(jf, "floor").get<int>();
      const auto& spots = must(jf, "spots");
      if (!spots.is_array() || spots.empty())
        invalid(fmt::format("floor {} has no spots", floor));
      for (size_t i = 0; i < spots.size(); ++i) {
        Spot s = spotFrom(spots[i], floor, i);
        if (!seen.insert(s.id).second) invalid("duplicate spot id: " + s.id);
        cfg.spots.push_back(std::move(s));
      }
    }

    const auto& pricing = must(j, "pricing");
    if (!pricing.is_object() || pricing.empty()) invalid("'pricing' must be a non-empty object");
    for (auto it = pricing.begin(); it != pricing.end(); ++it) {
      Money rate = moneyFromDecimal(it.value().get<double>());
      if (rate < 0) invalid("negative rate for " + it.key());
      cfg.rates[categoryFrom(it.key())] = rate;
    }

    if (j.contains("allocation")) {
      const auto& a = j.at("allocation");
      cfg.strategy = valueOr(a, "strategy", cfg.strategy);
      cfg.maxClaimRetries = valueOr(a, "max_claim_retries", cfg.maxClaimRetries);
    }
    if (j.contains("gateway")) {
      cfg.closeRetries = valueOr(j.at("gateway"), "close_retries", cfg.closeRetries);
    }
    if (j.contains("logging")) {
      cfg.logLevel = valueOr(j.at("logging"), "level", cfg.logLevel);
    }
    if (j.contains("channel")) {
      cfg.workers = valueOr(j.at("channel"), "workers", cfg.workers);
    }
  } catch (const json::exception& e) {
    invalid(string("malformed config: ") + e.what());
  }

  makeStrategy(cfg.strategy);  // validates the name
  if (cfg.maxClaimRetries < 0) invalid("'allocation.max_claim_retries' must be >= 0");
  if (cfg.closeRetries < 0) invalid("'gateway.close_retries' must be >= 0");
  if (cfg.workers < 1) invalid("'channel.workers' must be >= 1");
  return cfg;
}

LotConfig parseConfigString(const string& text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) invalid("config is not valid JSON");
  return parseConfig(j);
}

LotConfig loadConfig(const string& path) {
  ifstream f(path);
  if (!f) invalid("could not open config file: " + path);
  json j = json::parse(f, nullptr, false);
  if (j.is_discarded()) invalid("config is not valid JSON: " + path);
  return parseConfig(j);
}

}  // namespace parkinglot
