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

#include "webapi/device_auth.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "http/client.hpp"

#include <ArduinoJson.h>
#include <fmt/format.h>

namespace sconnect {
namespace webapi {

HttpDeviceAuth::HttpDeviceAuth() noexcept
    : tokc("webapi"),                                         //
      url(tokc.val<string>("device_auth", default_url)), //
      timeout(tokc.timeout_val("http", 10s)) {}

string HttpDeviceAuth::exchange(csv access_token, csv client_id, csv device_id) {
  INFO_AUTO_CAT("exchange");

  StaticJsonDocument<512> req_doc;
  req_doc["clientId"] = string(client_id);
  req_doc["deviceId"] = string(device_id);

  http::Request req;
  req.method = "POST";
  req.url = url;
  req.timeout = timeout;
  req.resolve_timeout = timeout;
  req.headers.emplace("authorization", fmt::format("Bearer {}", access_token));
  req.headers.emplace("content-type", "text/plain;charset=UTF-8");
  serializeJson(req_doc, req.body);

  const auto reply = http::Client::perform(req);

  if (!reply.ok()) {
    throw Error(fmt::format("device auth failed status={} {}", reply.status, reply.body));
  }

  StaticJsonDocument<2048> doc;
  if (auto err = deserializeJson(doc, reply.body); err) {
    throw Error(fmt::format("device auth json: {}", err.c_str()));
  }

  const string token = doc["accessToken"] | "";
  if (token.empty()) throw Error("device auth reply has no accessToken");

  INFO_AUTO("client_id={} device_id={} token len={}\n", client_id, device_id, token.size());

  return token;
}

} // namespace webapi
} // namespace sconnect
