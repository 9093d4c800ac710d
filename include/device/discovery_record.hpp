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
#include "mdns/record.hpp"

#include <map>
#include <optional>

namespace sconnect {

/// @brief One multicast-DNS advertisement (or a synthetic one for a
///        device known only through the Web API device list)
struct DiscoveryRecord {
  using Properties = std::map<string, string>;

  static constexpr csv CAST_AUDIO{"audio"};
  static constexpr csv CAST_GROUP{"group"};
  static constexpr csv CAST_CAST{"cast"};
  static constexpr csv CAST_NONE{"none"};
  static constexpr csv CAST_GROUP_MODEL{"Google Cast Group"};

  // order independent
  string device_name;  // display name (instance name or cast friendly name)
  string service_name; // full service instance name
  string key;          // stable identity within one discovery session
  string server;       // advertised host name
  Strings addresses;   // ipv4 addresses as text
  Port port{0};
  string service_type;
  string cpath;
  string version;
  Properties properties; // TXT records
  bool is_cast{false};
  string cast_type;

  /// @brief Address to use for requests, the last address or the server
  ///        name when no address is known
  string host_address() const noexcept {
    return addresses.empty() ? server : addresses.back();
  }

  /// @brief Pseudo record fabricated for a device absent from discovery
  bool is_dynamic() const noexcept { return (port == 0) && service_type.empty(); }

  bool operator==(const DiscoveryRecord &) const = default;

  /// @brief Build from a native receiver advertisement
  static DiscoveryRecord from_native(const mdns::Record &rec) noexcept;

  /// @brief Build from a casting receiver advertisement
  /// @return std::nullopt when the advertised cast type is not supported
  static std::optional<DiscoveryRecord> from_cast(const mdns::Record &rec) noexcept;

  /// @brief Derive the cast type from the md and ca TXT values
  static string make_cast_type(csv model, csv capabilities) noexcept;

  string inspect() const noexcept;

  MOD_ID("device.disc_rec");
};

} // namespace sconnect
