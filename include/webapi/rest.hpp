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
#include "http/client.hpp"
#include "webapi/client.hpp"

#include <ArduinoJson.h>

namespace sconnect {
namespace webapi {

/// @brief Web API client over https using a bearer token
class Rest : public Client {
public:
  Rest(TokenProvider &tokens) noexcept;

  RemoteDevices list_player_devices() override;
  PlaybackState playback_state() override;
  void transfer_playback(csv device_id, bool play) override;

  static RemoteDevice make_device(JsonObjectConst obj) noexcept;

private:
  /// @brief Perform the request, refreshing the token and retrying once on 401
  http::Reply call(csv method, csv path, string body = string());

private:
  // order dependent
  TokenProvider &tokens;
  conf::token tokc;
  const string base;
  const Millis timeout;

public:
  static constexpr size_t doc_capacity{16 * 1024};

  MOD_ID("webapi");
};

} // namespace webapi
} // namespace sconnect
