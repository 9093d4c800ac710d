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

#include <optional>
#include <vector>

namespace sconnect {

/// @brief A player device as reported by the Web API device list
struct RemoteDevice {
  // order independent
  string id;
  string name;
  string type;
  bool is_active{false};
  bool is_restricted{false};

  bool operator==(const RemoteDevice &) const = default;
};

using RemoteDevices = std::vector<RemoteDevice>;

/// @brief Subset of the Web API playback state used to determine the active device
struct PlaybackState {
  // order independent
  std::optional<RemoteDevice> device;
  bool is_playing{false};
  bool is_restricted{false};
};

} // namespace sconnect
