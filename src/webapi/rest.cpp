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

#include "webapi/rest.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <fmt/format.h>

namespace sconnect {
namespace webapi {

Rest::Rest(TokenProvider &tokens) noexcept
    : tokens(tokens),                                                //
      tokc(module_id),                                               //
      base(tokc.val<string>("base", "https://api.spotify.com/v1")), //
      timeout(tokc.timeout_val("http", 10s)) {}

http::Reply Rest::call(csv method, csv path, string body) {
  INFO_AUTO_CAT("call");

  http::Request req;
  req.method = string(method);
  req.url = fmt::format("{}{}", base, path);
  req.timeout = timeout;
  req.resolve_timeout = timeout;

  if (!body.empty()) {
    req.headers.emplace("Content-Type", "application/json");
    req.body = std::move(body);
  }

  for (int attempt = 1;; ++attempt) {
    req.headers.insert_or_assign("Authorization",
                                 fmt::format("Bearer {}", tokens.current_access_token()));

    auto reply = http::Client::perform(req);

    if ((reply.status == 401) && (attempt == 1)) {
      INFO_AUTO("{} {} unauthorized, refreshing token\n", method, path);
      tokens.refresh();
      continue;
    }

    if (!reply.ok()) {
      throw Error(fmt::format("webapi {} {} failed status={} {}", method, path, reply.status,
                              reply.body));
    }

    return reply;
  }
}

RemoteDevice Rest::make_device(JsonObjectConst obj) noexcept {
  return RemoteDevice{.id = obj["id"] | "",
                      .name = obj["name"] | "",
                      .type = obj["type"] | "",
                      .is_active = obj["is_active"] | false,
                      .is_restricted = obj["is_restricted"] | false};
}

RemoteDevices Rest::list_player_devices() {
  INFO_AUTO_CAT("devices");

  const auto reply = call("GET", "/me/player/devices");

  DynamicJsonDocument doc(doc_capacity);
  if (auto err = deserializeJson(doc, reply.body); err) {
    throw Error(fmt::format("player devices json: {}", err.c_str()));
  }

  RemoteDevices devices;

  for (JsonObjectConst obj : doc["devices"].as<JsonArrayConst>()) {
    devices.emplace_back(make_device(obj));
  }

  INFO_AUTO("count={}\n", devices.size());

  return devices;
}

PlaybackState Rest::playback_state() {
  INFO_AUTO_CAT("playback_state");

  const auto reply = call("GET", "/me/player?additional_types=episode");

  PlaybackState state;

  // nothing is playing
  if ((reply.status == 204) || reply.body.empty()) return state;

  // the full state includes the playing item, keep only what is used
  StaticJsonDocument<256> filter;
  filter["device"] = true;
  filter["is_playing"] = true;

  DynamicJsonDocument doc(doc_capacity);
  if (auto err = deserializeJson(doc, reply.body, DeserializationOption::Filter(filter)); err) {
    throw Error(fmt::format("playback state json: {}", err.c_str()));
  }

  state.is_playing = doc["is_playing"] | false;

  if (JsonObjectConst dev = doc["device"]; !dev.isNull()) {
    state.device.emplace(make_device(dev));
    state.is_restricted = state.device->is_restricted;
  }

  return state;
}

void Rest::transfer_playback(csv device_id, bool play) {
  INFO_AUTO_CAT("transfer");

  StaticJsonDocument<256> doc;
  doc["device_ids"].add(string(device_id));
  doc["play"] = play;

  string body;
  serializeJson(doc, body);

  call("PUT", "/me/player", std::move(body));

  INFO_AUTO("device_id={} play={}\n", device_id, play);
}

} // namespace webapi
} // namespace sconnect
