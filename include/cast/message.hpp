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

namespace sconnect {
namespace cast {

/// @brief Spotify cast application identity and its json message vocabulary
struct Message {
  static constexpr csv APP_ID{"CC32E753"};
  static constexpr csv NS{"urn:x-cast:com.spotify.chromecast.secure.v1"};

  static constexpr csv GET_INFO{"getInfo"};
  static constexpr csv GET_INFO_RESPONSE{"getInfoResponse"};
  static constexpr csv ADD_USER{"addUser"};
  static constexpr csv TOKEN_TYPE{"accesstoken"};

  /// @brief getInfo request, the device id is the md5 of the remote name
  static string get_info(csv remote_name, bool is_group) noexcept;

  /// @brief addUser request carrying the device scoped access token
  static string add_user(csv blob) noexcept;

  MOD_ID("cast.msg");
};

} // namespace cast
} // namespace sconnect
