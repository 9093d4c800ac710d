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

#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "webapi/client.hpp"

namespace sconnect {
namespace webapi {

/// @brief Device token exchange against the Spotify device-auth service
class HttpDeviceAuth : public DeviceAuth {
public:
  HttpDeviceAuth() noexcept;

  /// @throws Error when the service rejects the request or replies without a token
  string exchange(csv access_token, csv client_id, csv device_id) override;

private:
  // order dependent
  conf::token tokc;
  const string url;
  const Millis timeout;

public:
  static constexpr csv default_url{"https://spclient.wg.spotify.com/device-auth/v1/refresh"};

  MOD_ID("webapi.device_auth");
};

} // namespace webapi
} // namespace sconnect
