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

#include <ArduinoJson.h>
#include <cstdint>
#include <fmt/format.h>
#include <map>

namespace sconnect {

/// @brief Last asynchronous protocol response observed for a directory entry
struct ProtocolOutcome {
  enum kind_t : uint8_t {
    None = 0,
    GetInfoError,
    AddUserResponse,
    AddUserError,
    TransferSuccess,
    TransferError,
    LaunchError
  };

  static constexpr int64_t STATUS_OK{101};
  static constexpr int64_t STATUS_RECEIVE_FAILED{1000};
  static constexpr csv RECEIVE_FAILED{"ERROR-CHROMECAST-RECEIVE-MESSAGE"};

  // order independent
  kind_t kind{None};
  int64_t spotify_error{0};
  int64_t status{0};
  string status_string;
  string response_source;

  bool is_ok() const noexcept { return status == STATUS_OK; }
  bool is_error() const noexcept {
    return (kind == GetInfoError) || (kind == AddUserError) || (kind == TransferError) ||
           (kind == LaunchError);
  }

  bool operator==(const ProtocolOutcome &) const = default;

  /// @brief Populate status fields from a response payload object
  static ProtocolOutcome from_json(kind_t kind, JsonObjectConst payload) noexcept;

  /// @brief Outcome recorded when a received message could not be handled
  static ProtocolOutcome receive_failed(csv source) noexcept {
    return ProtocolOutcome{.kind = None,
                           .status = STATUS_RECEIVE_FAILED,
                           .status_string = string(RECEIVE_FAILED),
                           .response_source = string(source)};
  }

  /// @brief Map a cast message type to a kind
  /// @return kind or None for an unknown type
  static kind_t kind_of(csv type) noexcept;

  /// @brief Message type text for a kind (e.g. addUserError)
  static csv kind_name(kind_t kind) noexcept;

private:
  static const std::map<kind_t, string> names;

public:
  MOD_ID("device.outcome");
};

} // namespace sconnect

template <> struct fmt::formatter<sconnect::ProtocolOutcome> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const sconnect::ProtocolOutcome &o, FormatContext &ctx) const
      -> decltype(ctx.out()) {

    return fmt::format_to(ctx.out(), "{} status={} {} spotify_error={}",
                          sconnect::ProtocolOutcome::kind_name(o.kind), o.status, o.status_string,
                          o.spotify_error);
  }
};
