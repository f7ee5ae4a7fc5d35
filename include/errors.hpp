#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error raised by the charge network library.
class ChargeNetError : public std::runtime_error {
public:
  explicit ChargeNetError(const std::string &what) : std::runtime_error(what) {}
};

class DuplicateVertex : public ChargeNetError {
public:
  DuplicateVertex()
      : ChargeNetError("charge station is already in the network") {}
};

class UnknownStation : public ChargeNetError {
public:
  explicit UnknownStation(const std::string &context)
      : ChargeNetError("charge station is not in the network: " + context) {}
};

class PathNotNeeded : public ChargeNetError {
public:
  PathNotNeeded()
      : ChargeNetError(
            "tried to find a path between the same 2 charge stations") {}
};

class PathNotFound : public ChargeNetError {
public:
  PathNotFound()
      : ChargeNetError("no path between the 2 charge stations was found") {}
};

class OracleFailure : public ChargeNetError {
public:
  explicit OracleFailure(const std::string &reason)
      : ChargeNetError("routing oracle failed: " + reason) {}
};

class InvalidGeoInput : public ChargeNetError {
public:
  InvalidGeoInput(double lat, double lng)
      : ChargeNetError("coordinate out of range: (" + std::to_string(lat) +
                       ", " + std::to_string(lng) + ")") {}
};

class NetworkFormatError : public ChargeNetError {
public:
  explicit NetworkFormatError(const std::string &reason)
      : ChargeNetError("invalid network file: " + reason) {}
};

class BatchDeclined : public ChargeNetError {
public:
  explicit BatchDeclined(size_t calls)
      : ChargeNetError("declined a batch of " + std::to_string(calls) +
                       " routing oracle calls") {}
};

#endif // ERRORS_HPP
