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
#include "device/remote.hpp"

namespace sconnect {
namespace webapi {

/// @brief The small slice of the Spotify Web API the directory depends on
class Client {
public:
  virtual ~Client() = default;

  /// @brief GET /me/player/devices
  virtual RemoteDevices list_player_devices() = 0;

  /// @brief GET /me/player, an empty state when nothing is playing
  virtual PlaybackState playback_state() = 0;

  /// @brief PUT /me/player
  virtual void transfer_playback(csv device_id, bool play) = 0;
};

/// @brief Supplies the OAuth2 access token of the signed-in account
class TokenProvider {
public:
  virtual ~TokenProvider() = default;

  virtual string current_access_token() = 0;

  /// @brief Obtain a fresh token (e.g. after a 401)
  virtual void refresh() = 0;
};

/// @brief Exchanges the account access token for a short lived
///        device scoped token accepted by the cast application
class DeviceAuth {
public:
  virtual ~DeviceAuth() = default;

  virtual string exchange(csv access_token, csv client_id, csv device_id) = 0;
};

} // namespace webapi
} // namespace sconnect
