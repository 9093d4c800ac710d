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

#include "cast/message.hpp"
#include "base/crypto.hpp"

#include <ArduinoJson.h>

namespace sconnect {
namespace cast {

string Message::get_info(csv remote_name, bool is_group) noexcept {
  StaticJsonDocument<512> doc;

  doc["type"] = string(GET_INFO);

  auto payload = doc.createNestedObject("payload");
  payload["remoteName"] = string(remote_name);
  payload["deviceID"] = crypto::md5_hex(remote_name);
  payload["deviceAPI_isGroup"] = is_group;

  string json;
  serializeJson(doc, json);

  return json;
}

string Message::add_user(csv blob) noexcept {
  DynamicJsonDocument doc(1024 + blob.size());

  doc["type"] = string(ADD_USER);

  auto payload = doc.createNestedObject("payload");
  payload["blob"] = string(blob);
  payload["tokenType"] = string(TOKEN_TYPE);

  string json;
  serializeJson(doc, json);

  return json;
}

} // namespace cast
} // namespace sconnect
