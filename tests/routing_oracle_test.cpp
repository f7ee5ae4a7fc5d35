#include "errors.hpp"
#include "routing_oracle.hpp"
#include <gtest/gtest.h>

TEST(Polyline, EncodesReferenceRoute) {
  std::vector<Coordinates> points = {
      {38.5, -120.2}, {40.7, -120.95}, {43.252, -126.453}};
  EXPECT_EQ(encodePolyline(points), "_p~iF~ps|U_ulLnnqC_mqNvxq`@");
}

TEST(Polyline, DecodesReferenceRoute) {
  auto points = decodePolyline("_p~iF~ps|U_ulLnnqC_mqNvxq`@");
  ASSERT_EQ(points.size(), 3u);
  EXPECT_NEAR(points[0].lat, 38.5, 1e-9);
  EXPECT_NEAR(points[0].lng, -120.2, 1e-9);
  EXPECT_NEAR(points[2].lat, 43.252, 1e-9);
  EXPECT_NEAR(points[2].lng, -126.453, 1e-9);
}

TEST(Polyline, RejectsMalformedInput) {
  EXPECT_THROW(decodePolyline("_"), std::invalid_argument);
  EXPECT_THROW(decodePolyline(" "), std::invalid_argument);
  EXPECT_TRUE(decodePolyline("").empty());
}

TEST(Polyline, BoundsCoverEveryPoint) {
  Bounds b = boundsOf({{10, -5}, {-3, 7}, {4, 2}});
  EXPECT_EQ(b.northeast.lat, 10);
  EXPECT_EQ(b.northeast.lng, 7);
  EXPECT_EQ(b.southwest.lat, -3);
  EXPECT_EQ(b.southwest.lng, -5);
}

TEST(EstimatedRoutingOracle, MeasuresEveryConsecutivePair) {
  EstimatedRoutingOracle oracle(1.25, 25.0);
  std::vector<Coordinates> waypoints = {{45.4215, -75.6972},
                                        {45.5017, -73.5673},
                                        {46.8139, -71.2080}};
  Directions d = oracle.directions(waypoints);

  ASSERT_EQ(d.legs.size(), 2u);
  for (size_t i = 0; i < d.legs.size(); ++i) {
    Meters gc = greatCircleDistanceMeters(waypoints[i], waypoints[i + 1]);
    EXPECT_DOUBLE_EQ(d.legs[i].drivingDistance, gc * 1.25);
    EXPECT_DOUBLE_EQ(d.legs[i].drivingTime, gc * 1.25 / 25.0);
    EXPECT_GE(d.legs[i].drivingDistance, gc);
  }

  auto route = decodePolyline(d.polyline);
  ASSERT_EQ(route.size(), waypoints.size());
  for (size_t i = 0; i < route.size(); ++i) {
    EXPECT_NEAR(route[i].lat, waypoints[i].lat, 1e-5);
    EXPECT_NEAR(route[i].lng, waypoints[i].lng, 1e-5);
  }
  EXPECT_EQ(d.bounds.northeast.lat, 46.8139);
  EXPECT_EQ(d.bounds.southwest.lng, -75.6972);
}

TEST(EstimatedRoutingOracle, FailsOnBadWaypoints) {
  EstimatedRoutingOracle oracle;
  EXPECT_THROW(oracle.directions({{45, -75}}), OracleFailure);
  EXPECT_THROW(oracle.directions({{45, -75}, {95, -75}}), OracleFailure);
}

TEST(EstimatedRoutingOracle, RejectsShortcutFactor) {
  EXPECT_THROW(EstimatedRoutingOracle(0.9, 25.0), std::invalid_argument);
  EXPECT_THROW(EstimatedRoutingOracle(1.2, 0.0), std::invalid_argument);
}
