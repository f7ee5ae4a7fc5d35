#include "errors.hpp"
#include "network_store.hpp"
#include "test_support.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

namespace {
void expectSameStations(const ChargeNetwork &a, const ChargeNetwork &b) {
  ASSERT_EQ(a.stationCount(), b.stationCount());
  for (size_t i = 0; i < a.stationCount(); ++i) {
    const ChargeStation &x = *a.stations()[i];
    const ChargeStation &y = *b.stations()[i];
    EXPECT_EQ(x.name, y.name);
    EXPECT_EQ(x.address, y.address);
    EXPECT_EQ(x.hours, y.hours);
    EXPECT_EQ(x.phone, y.phone);
    EXPECT_EQ(x.coord, y.coord);
    EXPECT_EQ(x.openDate, y.openDate);
  }
}
} // namespace

TEST(NetworkStore, RoundTripsEmptyNetwork) {
  ChargeNetwork network(4, 700000);
  ChargeNetwork restored =
      NetworkStore::ImportFromJson(NetworkStore::ExportToJson(network));
  EXPECT_EQ(restored.minChargersAtStation(), 4);
  EXPECT_EQ(restored.evRange(), 700000);
  EXPECT_EQ(restored.stationCount(), 0u);
  EXPECT_EQ(restored.legCount(), 0u);
}

TEST(NetworkStore, RoundTripsOptionalFields) {
  ChargeNetwork network(2, 500000);
  network.addStation(makeStation(std::string("Depot"),
                                 std::string("1 Main St, Ottawa"),
                                 std::string("24 hours daily"),
                                 std::string("613-555-0100"), 45.42, -75.69,
                                 CalendarDate::parse("2019-07-04")));
  network.addStation(stationAt(45.5, -73.56));

  std::string json = NetworkStore::ExportToJson(network);
  EXPECT_NE(json.find("\"min_chargers_at_station\""), std::string::npos);
  EXPECT_NE(json.find("\"charge_stations\""), std::string::npos);
  EXPECT_NE(json.find("\"2019-07-04\""), std::string::npos);

  ChargeNetwork restored = NetworkStore::ImportFromJson(json);
  expectSameStations(network, restored);
  EXPECT_FALSE(restored.stations()[1]->name.has_value());
  EXPECT_FALSE(restored.stations()[1]->openDate.has_value());
}

TEST(NetworkStore, RoundTripsSingleStation) {
  ChargeNetwork network(4, 700000);
  network.addStation(makeStation(std::string("Depot"),
                                 std::string("1 Main St, Ottawa"),
                                 std::string("24 hours daily"),
                                 std::string("613-555-0100"), 45.42, -75.69,
                                 CalendarDate::parse("2019-07-04")));

  ChargeNetwork restored =
      NetworkStore::ImportFromJson(NetworkStore::ExportToJson(network));
  expectSameStations(network, restored);
  EXPECT_EQ(restored.legCount(), 0u);
}

TEST(NetworkStore, WritesAbsentFieldsAsNull) {
  ChargeNetwork network(4, 700000);
  network.addStation(stationAt(45.0, -75.0));

  std::string json = NetworkStore::ExportToJson(network);
  for (const char *key : {"name", "address", "hours", "phone", "open_date"})
    EXPECT_NE(json.find("\"" + std::string(key) + "\": null"),
              std::string::npos)
        << key << " missing from " << json;

  ChargeNetwork restored = NetworkStore::ImportFromJson(json);
  expectSameStations(network, restored);
}

TEST(NetworkStore, RejectsNonTextFields) {
  EXPECT_THROW(NetworkStore::ImportFromJson(R"({"ev_range": 1000, "graph": {
      "charge_stations": {"1": {"name": 5, "lat": 0, "lng": 0}}}})"),
               NetworkFormatError);
}

TEST(NetworkStore, RoundTripsLegsUnderNewIdentities) {
  ChargeNetwork network(4, 300000);
  std::vector<StationPtr> stations = {
      stationAt(45.42, -75.69, "Ottawa"), stationAt(45.50, -73.56, "Montreal"),
      stationAt(46.81, -71.20, "Quebec"), stationAt(44.23, -76.48, "Kingston")};
  for (const auto &cs : stations)
    network.addStation(cs);
  network.commitLegs({Leg(stations[0], stations[1], 199000, 7000),
                      Leg(stations[1], stations[2], 253000, 9100),
                      Leg(stations[0], stations[3], 196000, 7300)});

  ChargeNetwork restored =
      NetworkStore::ImportFromJson(NetworkStore::ExportToJson(network));
  expectSameStations(network, restored);
  EXPECT_EQ(restored.legCount(), 3u);
  EXPECT_EQ(legKeys(restored.legs()), legKeys(network.legs()));
  EXPECT_FALSE(restored.hasStation(stations[0].get()));

  auto path = restored.getShortestPath(restored.stations()[3],
                                       restored.stations()[2], 0, 300000);
  EXPECT_EQ(path.size(), 3u);
}

TEST(NetworkStore, ImportsHandWrittenFile) {
  const std::string json = R"({
    "min_chargers_at_station": 2,
    "ev_range": 500000,
    "graph": {
      "charge_stations": {
        "7": {"name": "A", "address": null, "lat": 45.0, "lng": -75.0,
              "open_date": null},
        "9": {"name": "B", "lat": 45.5, "lng": -75.5,
              "open_date": "2020-03-05"},
        "12": {"lat": 49.0, "lng": -75.0}
      },
      "legs": [
        {"endpoint_ids": [9, 7], "driving_distance": 80000,
         "driving_time": 3600},
        {"endpoint_ids": [7, 12], "driving_distance": 600000,
         "driving_time": 20000}
      ]
    }
  })";

  ChargeNetwork network = NetworkStore::ImportFromJson(json);
  ASSERT_EQ(network.stationCount(), 3u);
  EXPECT_EQ(*network.stations()[0]->name, "A");
  EXPECT_FALSE(network.stations()[0]->address.has_value());
  EXPECT_EQ(network.stations()[1]->openDate->displayString(), "March 5 2020");
  EXPECT_FALSE(network.stations()[2]->name.has_value());

  // The second leg exceeds ev_range and is dropped.
  ASSERT_EQ(network.legCount(), 1u);
  EXPECT_EQ(network.legs()[0].drivingDistance, 80000);
}

TEST(NetworkStore, RejectsMalformedFiles) {
  EXPECT_THROW(NetworkStore::ImportFromJson("{not json"), NetworkFormatError);

  EXPECT_THROW(NetworkStore::ImportFromJson(R"({"ev_range": 1000, "graph": {
      "charge_stations": {"1": {"lat": 0, "lng": 0}},
      "legs": [{"endpoint_ids": [1, 2], "driving_distance": 10}]}})"),
               NetworkFormatError);

  EXPECT_THROW(NetworkStore::ImportFromJson(R"({"ev_range": 1000, "graph": {
      "charge_stations": {"1": {"lat": 0, "lng": 0}},
      "legs": [{"endpoint_ids": [1], "driving_distance": 10}]}})"),
               NetworkFormatError);

  EXPECT_THROW(NetworkStore::ImportFromJson(R"({"ev_range": 1000, "graph": {
      "charge_stations": {"1": {"lat": 0, "lng": 0,
                                "open_date": "2021-02-30"}}}})"),
               NetworkFormatError);

  EXPECT_THROW(NetworkStore::ImportFromJson(R"({"ev_range": 1000, "graph": {
      "charge_stations": {"1": {"lat": 95, "lng": 0}}}})"),
               InvalidGeoInput);
}

TEST(NetworkStore, RoundTripsThroughFile) {
  ChargeNetwork network(4, 300000);
  auto a = stationAt(45.42, -75.69, "Ottawa");
  auto b = stationAt(45.50, -73.56, "Montreal");
  network.addStation(a);
  network.addStation(b);
  network.commitLegs({Leg(a, b, 199000, 7000)});

  std::string path = ::testing::TempDir() + "chargenet_store_test.json";
  NetworkStore::ExportToFile(network, path);
  ChargeNetwork restored = NetworkStore::ImportFromFile(path);
  std::remove(path.c_str());

  expectSameStations(network, restored);
  EXPECT_EQ(legKeys(restored.legs()), legKeys(network.legs()));
}

TEST(NetworkStore, MissingFileIsFormatError) {
  EXPECT_THROW(NetworkStore::ImportFromFile(::testing::TempDir() +
                                            "chargenet_does_not_exist.json"),
               NetworkFormatError);
}
