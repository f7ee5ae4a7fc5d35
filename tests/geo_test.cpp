#include "types.hpp"
#include <gtest/gtest.h>
#include <random>

TEST(GreatCircleDistance, MatchesReferenceValue) {
  Coordinates saskatoon(52.133174, -106.630807);
  Coordinates kyiv(50.401793, 30.449782);
  EXPECT_EQ(std::lround(greatCircleDistance(saskatoon, kyiv)), 7920);
}

TEST(GreatCircleDistance, IsZeroForSamePoint) {
  Coordinates p(43.6532, -79.3832);
  EXPECT_EQ(greatCircleDistance(p, p), 0.0);
}

TEST(GreatCircleDistance, IsSymmetric) {
  std::mt19937 gen(7);
  std::uniform_real_distribution<double> lat(-90.0, 90.0);
  std::uniform_real_distribution<double> lng(-180.0, 180.0);

  for (int i = 0; i < 1000; ++i) {
    Coordinates p(lat(gen), lng(gen));
    Coordinates q(lat(gen), lng(gen));
    EXPECT_EQ(greatCircleDistance(p, q), greatCircleDistance(q, p));
  }
}

TEST(GreatCircleDistance, OneDegreeOfLongitudeAtEquator) {
  EXPECT_NEAR(greatCircleDistance({0, 0}, {0, 1}), 111.195, 0.01);
  EXPECT_DOUBLE_EQ(greatCircleDistanceMeters({0, 0}, {0, 1}),
                   greatCircleDistance({0, 0}, {0, 1}) * 1000.0);
}

TEST(GreatCircleDistance, NeverExceedsKnownRoadDistances) {
  struct RoadLeg {
    Coordinates from;
    Coordinates to;
    double roadMeters;
  };
  const RoadLeg legs[] = {
      {{43.6532, -79.3832}, {45.5017, -73.5673}, 541000}, // Toronto-Montreal
      {{43.6532, -79.3832}, {45.4215, -75.6972}, 450000}, // Toronto-Ottawa
      {{45.4215, -75.6972}, {45.5017, -73.5673}, 199000}, // Ottawa-Montreal
      {{49.2827, -123.1207}, {47.6062, -122.3321}, 230000}, // Vancouver-Seattle
  };
  for (const auto &leg : legs)
    EXPECT_LE(greatCircleDistanceMeters(leg.from, leg.to), leg.roadMeters);
}

TEST(Coordinates, Validation) {
  EXPECT_TRUE(isValidCoordinate({90, 180}));
  EXPECT_TRUE(isValidCoordinate({-90, -180}));
  EXPECT_FALSE(isValidCoordinate({90.5, 0}));
  EXPECT_FALSE(isValidCoordinate({0, -180.1}));
}

TEST(CalendarDate, ParsesAndPrints) {
  auto date = CalendarDate::parse("2020-03-05");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->year, 2020);
  EXPECT_EQ(date->month, 3);
  EXPECT_EQ(date->day, 5);
  EXPECT_EQ(date->toString(), "2020-03-05");
  EXPECT_EQ(date->displayString(), "March 5 2020");
}

TEST(CalendarDate, RejectsMalformedDates) {
  EXPECT_FALSE(CalendarDate::parse(""));
  EXPECT_FALSE(CalendarDate::parse("2020/03/05"));
  EXPECT_FALSE(CalendarDate::parse("2020-13-01"));
  EXPECT_FALSE(CalendarDate::parse("2021-02-29"));
  EXPECT_FALSE(CalendarDate::parse("20a0-01-01"));
  EXPECT_TRUE(CalendarDate::parse("2020-02-29"));
}
