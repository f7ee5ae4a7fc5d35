#include "network_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <google/protobuf/util/json_util.h>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace {
void setNullable(google::protobuf::Value *out,
                 const std::optional<std::string> &value) {
  if (value)
    out->set_string_value(*value);
  else
    out->set_null_value(google::protobuf::NULL_VALUE);
}

std::optional<std::string> getNullable(bool present,
                                       const google::protobuf::Value &field,
                                       const char *name, uint32_t id) {
  if (!present || field.kind_case() == google::protobuf::Value::kNullValue)
    return std::nullopt;
  if (field.kind_case() != google::protobuf::Value::kStringValue)
    throw NetworkFormatError(std::string(name) + " of station " +
                             std::to_string(id) + " must be a string or null");
  return field.string_value();
}
} // namespace

chargenet::NetworkRecord NetworkStore::ToRecord(const ChargeNetwork &network) {
  chargenet::NetworkRecord record;
  record.set_min_chargers_at_station(network.minChargersAtStation());
  record.set_ev_range(network.evRange());

  auto *graph = record.mutable_graph();
  auto &stations = *graph->mutable_charge_stations();

  for (const auto &cs : network.stations()) {
    chargenet::StationRecord sr;
    setNullable(sr.mutable_name(), cs->name);
    setNullable(sr.mutable_address(), cs->address);
    setNullable(sr.mutable_hours(), cs->hours);
    setNullable(sr.mutable_phone(), cs->phone);
    sr.set_lat(cs->coord.lat);
    sr.set_lng(cs->coord.lng);
    if (cs->openDate)
      setNullable(sr.mutable_open_date(), cs->openDate->toString());
    else
      setNullable(sr.mutable_open_date(), std::nullopt);

    stations[(uint32_t)network.stationId(cs.get())] = sr;
  }

  for (const auto &leg : network.legs()) {
    auto *lr = graph->add_legs();
    lr->add_endpoint_ids((uint32_t)network.stationId(leg.endpoints.first.get()));
    lr->add_endpoint_ids(
        (uint32_t)network.stationId(leg.endpoints.second.get()));
    lr->set_driving_distance(leg.drivingDistance);
    lr->set_driving_time(leg.drivingTime);
  }

  return record;
}

ChargeNetwork NetworkStore::FromRecord(const chargenet::NetworkRecord &record) {
  ChargeNetwork network(record.min_chargers_at_station(), record.ev_range());

  std::unordered_map<uint32_t, StationPtr> byId;
  for (const auto &entry : record.graph().charge_stations()) {
    const chargenet::StationRecord &sr = entry.second;

    Coordinates coord(sr.lat(), sr.lng());
    if (!isValidCoordinate(coord))
      throw InvalidGeoInput(coord.lat, coord.lng);

    uint32_t id = entry.first;
    std::optional<CalendarDate> openDate;
    if (auto text =
            getNullable(sr.has_open_date(), sr.open_date(), "open_date", id)) {
      openDate = CalendarDate::parse(*text);
      if (!openDate)
        throw NetworkFormatError("bad open_date '" + *text +
                                 "' for station " + std::to_string(id));
    }

    byId[id] = makeStation(
        getNullable(sr.has_name(), sr.name(), "name", id),
        getNullable(sr.has_address(), sr.address(), "address", id),
        getNullable(sr.has_hours(), sr.hours(), "hours", id),
        getNullable(sr.has_phone(), sr.phone(), "phone", id), coord.lat,
        coord.lng, openDate);
  }

  // Add in id order so a re-export numbers stations the same way.
  std::vector<uint32_t> ids;
  ids.reserve(byId.size());
  for (const auto &entry : byId)
    ids.push_back(entry.first);
  std::sort(ids.begin(), ids.end());
  for (uint32_t id : ids)
    network.addStation(byId[id]);

  std::vector<Leg> legs;
  legs.reserve(record.graph().legs_size());
  for (const auto &lr : record.graph().legs()) {
    if (lr.endpoint_ids_size() != 2)
      throw NetworkFormatError("leg needs exactly 2 endpoint ids");

    auto a = byId.find(lr.endpoint_ids(0));
    auto b = byId.find(lr.endpoint_ids(1));
    if (a == byId.end() || b == byId.end())
      throw NetworkFormatError("leg refers to an unknown station id");
    if (a->second == b->second)
      throw NetworkFormatError("leg endpoints must be distinct");

    legs.emplace_back(a->second, b->second, lr.driving_distance(),
                      lr.driving_time());
  }
  network.commitLegs(legs);

  return network;
}

std::string NetworkStore::ExportToJson(const ChargeNetwork &network) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(ToRecord(network), &json, options);
  if (!status.ok())
    throw NetworkFormatError(status.ToString());
  return json;
}

ChargeNetwork NetworkStore::ImportFromJson(const std::string &json) {
  chargenet::NetworkRecord record;
  google::protobuf::util::JsonParseOptions options;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok())
    throw NetworkFormatError(status.ToString());
  return FromRecord(record);
}

void NetworkStore::ExportToFile(const ChargeNetwork &network,
                                const std::string &filepath) {
  std::string json = ExportToJson(network);

  std::ofstream file(filepath);
  if (!file.is_open())
    throw NetworkFormatError("cannot open " + filepath + " for writing");
  file << json;
  if (!file)
    throw NetworkFormatError("failed writing " + filepath);

  std::cout << "[NetworkStore] Exported " << network.stationCount()
            << " charge stations and " << network.legCount() << " legs to "
            << filepath << std::endl;
}

ChargeNetwork NetworkStore::ImportFromFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open())
    throw NetworkFormatError("cannot open " + filepath);

  std::stringstream buffer;
  buffer << file.rdbuf();
  ChargeNetwork network = ImportFromJson(buffer.str());

  std::cout << "[NetworkStore] Loaded " << network.stationCount()
            << " charge stations and " << network.legCount() << " legs from "
            << filepath << std::endl;
  return network;
}
