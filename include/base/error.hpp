// sconnect
// Copyright (C) 2022  Tim Hughey
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// https://www.wisslanding.com

#pragma once

#include "base/types.hpp"

#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>

namespace sconnect {

/// @brief Root of every error raised by the device directory and cast sessions
class Error : public std::runtime_error {
public:
  explicit Error(const string &msg) : std::runtime_error(msg) {}
};

/// @brief A device name or id could not be mapped to a directory entry and
///        there is no active device to fall back on
class ResolutionError : public Error {
public:
  explicit ResolutionError(const string &msg) : Error(msg) {}
};

/// @brief Activation of the playback application on a cast receiver failed
class ActivationError : public Error {
public:
  explicit ActivationError(const string &msg) : Error(msg) {}
};

/// @brief A receiver answered with a non-success status
class ProtocolError : public ActivationError {
public:
  ProtocolError(csv source, int64_t status, csv status_string, int64_t vendor_error = 0)
      : ActivationError(fmt::format("{} failed status={} {} vendor_error={}", source, status,
                                    status_string, vendor_error)),
        status(status), status_string(status_string), vendor_error(vendor_error) {}

  // order independent
  int64_t status;
  string status_string;
  int64_t vendor_error;
};

/// @brief An expected asynchronous message did not arrive within its bound
class TimeoutError : public ActivationError {
public:
  explicit TimeoutError(const string &msg) : ActivationError(msg) {}
};

/// @brief Network level failure reaching a receiver (connect, resolve, http)
class TransientDiscoveryError : public Error {
public:
  explicit TransientDiscoveryError(const string &msg) : Error(msg) {}
};

} // namespace sconnect
