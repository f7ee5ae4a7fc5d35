#ifndef NETWORK_STORE_HPP
#define NETWORK_STORE_HPP

#include "charge_network.hpp"
#include "charge_network.pb.h"
#include <string>

// Saves and restores a ChargeNetwork as JSON (see charge_network.proto).
//
// Station ids in the file are per-export surrogates for station identity.
// import(export(n)) yields the same station fields and the same set of
// (endpoints, distance, time) legs, under new station objects.
class NetworkStore {
public:
  static chargenet::NetworkRecord ToRecord(const ChargeNetwork &network);

  // Throws NetworkFormatError or InvalidGeoInput.
  static ChargeNetwork FromRecord(const chargenet::NetworkRecord &record);

  static std::string ExportToJson(const ChargeNetwork &network);
  static ChargeNetwork ImportFromJson(const std::string &json);

  static void ExportToFile(const ChargeNetwork &network,
                           const std::string &filepath);
  static ChargeNetwork ImportFromFile(const std::string &filepath);
};

#endif // NETWORK_STORE_HPP
