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

#include "device/self_description.hpp"
#include "base/error.hpp"

#include <fmt/format.h>
#include <iterator>

namespace sconnect {

// json values arrive as strings or numbers depending on the receiver
static string as_text(JsonVariantConst v) noexcept {
  if (v.isNull()) return string();
  if (v.is<const char *>()) return string(v.as<const char *>());
  if (v.is<bool>()) return v.as<bool>() ? "true" : "false";
  if (v.is<int64_t>()) return fmt::format("{}", v.as<int64_t>());

  return string();
}

SelfDescription SelfDescription::from_json(JsonObjectConst obj) noexcept {
  SelfDescription sd;

  sd.account_req = as_text(obj["accountReq"]);
  sd.active_user = as_text(obj["activeUser"]);
  sd.availability = as_text(obj["availability"]);
  sd.brand_display_name = as_text(obj["brandDisplayName"]);
  sd.client_id = as_text(obj["clientID"]);
  sd.device_id = as_text(obj["deviceID"]);
  sd.device_type = as_text(obj["deviceType"]);
  sd.group_status = as_text(obj["groupStatus"]);
  sd.is_group = obj["deviceAPI_isGroup"] | false;
  sd.library_version = as_text(obj["libraryVersion"]);
  sd.model_display_name = as_text(obj["modelDisplayName"]);
  sd.product_id = as_text(obj["productID"]);
  sd.public_key = as_text(obj["publicKey"]);
  sd.remote_name = as_text(obj["remoteName"]);
  sd.resolver_version = as_text(obj["resolverVersion"]);
  sd.scope = as_text(obj["scope"]);
  sd.supported_capabilities = obj["supported_capabilities"] | 0;
  sd.token_type = as_text(obj["tokenType"]);
  sd.version = as_text(obj["version"]);
  sd.voice_support = as_text(obj["voiceSupport"]);

  sd.spotify_error = obj["spotifyError"] | 0;
  sd.status = obj["status"] | 0;
  sd.status_string = as_text(obj["statusString"]);
  sd.response_source = as_text(obj["responseSource"]);

  // cast receivers report a placeholder key
  if (sd.public_key == csv{"empty"}) sd.public_key.clear();

  for (JsonObjectConst alias : obj["aliases"].as<JsonArrayConst>()) {
    sd.aliases.emplace_back(Alias{.id = as_text(alias["id"]),
                                  .is_group = alias["isGroup"] | false,
                                  .name = as_text(alias["name"])});
  }

  return sd;
}

SelfDescription SelfDescription::parse(csv text) {
  DynamicJsonDocument doc(doc_capacity);

  if (auto err = deserializeJson(doc, text.data(), text.size()); err) {
    throw Error(fmt::format("getInfo json parse failed: {}", err.c_str()));
  }

  if (!doc.is<JsonObject>()) throw Error("getInfo response is not a json object");

  return from_json(doc.as<JsonObjectConst>());
}

string SelfDescription::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "id={} name={} brand={} model={} type={} status={} {}", device_id,
                 display_name(), brand_display_name, model_display_name, device_type, status,
                 status_string);

  if (!active_user.empty()) fmt::format_to(w, " user={}", active_user);
  if (has_aliases()) fmt::format_to(w, " aliases={}", aliases.size());

  return msg;
}

} // namespace sconnect
