#include "service_impl.hpp"
#include "errors.hpp"
#include "trip_planner.hpp"
#include <iostream>

namespace {
void setLatLng(chargenet::LatLng *out, const Coordinates &c) {
  out->set_latitude(c.lat);
  out->set_longitude(c.lng);
}

void fillStation(chargenet::StationSummary *out, const ChargeStation &cs) {
  out->set_name(displayField(cs.name));
  out->set_address(displayField(cs.address));
  out->set_hours(displayField(cs.hours));
  out->set_phone(displayField(cs.phone));
  setLatLng(out->mutable_location(), cs.coord);
  out->set_open_date(displayDate(cs.openDate));
}

Status errorStatus(grpc::StatusCode code, const std::exception &e) {
  std::cerr << "[Server] " << e.what() << std::endl;
  return Status(code, e.what());
}
} // namespace

Status ChargeRoutingServiceImpl::GetPath(ServerContext *context,
                                         const PathRequest *request,
                                         PathResponse *reply) {
  TripRequest trip;
  trip.start = Coordinates(request->start().latitude(),
                           request->start().longitude());
  trip.end =
      Coordinates(request->end().latitude(), request->end().longitude());
  trip.minLegLength = request->min_leg_length();
  trip.evRange = request->ev_range();
  trip.minBattery = request->min_battery();
  trip.maxBattery = request->max_battery();
  trip.startBattery = request->start_battery();

  std::cout << "Received request: From (" << trip.start.lat << ", "
            << trip.start.lng << ") to (" << trip.end.lat << ", "
            << trip.end.lng << ")" << std::endl;

  TripPlan plan;
  try {
    TripPlanner planner(network_, oracle_);
    plan = planner.plan(trip);
  } catch (const PathNotNeeded &e) {
    return errorStatus(grpc::StatusCode::FAILED_PRECONDITION, e);
  } catch (const PathNotFound &e) {
    return errorStatus(grpc::StatusCode::NOT_FOUND, e);
  } catch (const OracleFailure &e) {
    return errorStatus(grpc::StatusCode::UNAVAILABLE, e);
  } catch (const UnknownStation &e) {
    return errorStatus(grpc::StatusCode::FAILED_PRECONDITION, e);
  } catch (const std::invalid_argument &e) {
    return errorStatus(grpc::StatusCode::INVALID_ARGUMENT, e);
  }

  reply->set_polyline(plan.polyline);
  setLatLng(reply->mutable_bounds()->mutable_northeast(), plan.bounds.northeast);
  setLatLng(reply->mutable_bounds()->mutable_southwest(), plan.bounds.southwest);

  auto *summary = reply->mutable_path_summary();
  summary->set_total_driving_distance(formatMeters(plan.totalDrivingDistance));
  summary->set_total_driving_time(formatSeconds(plan.totalDrivingTime));
  summary->set_total_charge_time(formatSeconds(plan.totalChargeTime));
  summary->set_total_time(formatSeconds(plan.totalTime()));

  for (size_t i = 0; i < plan.stops.size(); ++i) {
    const StopInfo &stop = plan.stops[i];
    auto *leg = reply->add_legs_summary();
    fillStation(leg->mutable_charge_station(), *plan.stations[i]);
    leg->set_driving_distance(formatMeters(stop.drivingDistance));
    leg->set_driving_time(formatSeconds(stop.drivingTime));
    leg->set_charge_time(formatSeconds(stop.chargeTime));
    leg->set_battery_start(formatBattery(stop.batteryStart));
    leg->set_battery_end(formatBattery(stop.batteryEnd));
    leg->set_exceeds_capacity(stop.exceedsCapacity);
  }

  auto *destination = reply->mutable_destination_summary();
  fillStation(destination->mutable_charge_station(), *plan.stations.back());
  destination->set_dest_start_battery(formatBattery(plan.destinationBattery));

  reply->set_total_driving_distance_meters(plan.totalDrivingDistance);
  reply->set_total_driving_time_seconds(plan.totalDrivingTime);
  reply->set_total_charge_time_seconds(plan.totalChargeTime);

  return Status::OK;
}
