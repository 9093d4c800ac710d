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

#include "zc/connect.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <ArduinoJson.h>
#include <fmt/format.h>
#include <thread>

namespace sconnect {
namespace zc {

Connect::Connect() noexcept
    : tokc(module_id),                                  //
      info_timeout(tokc.timeout_val("info", 5s)),       //
      resolve_timeout(tokc.timeout_val("resolve", 3s)), //
      default_version(tokc.val<string>("version", "2.7.1")) {}

string Connect::uri(const Endpoint &ep) noexcept {
  return fmt::format("http://{}:{}{}", ep.host, ep.port, ep.cpath);
}

string Connect::version_of(const Endpoint &ep) const noexcept {
  return ep.version.empty() ? default_version : ep.version;
}

http::Request Connect::make_request(const Endpoint &ep) const noexcept {
  http::Request req;

  req.url = uri(ep);
  req.headers.emplace("Content-Type", "application/x-www-form-urlencoded");
  req.headers.emplace("Connection", "close");
  req.timeout = info_timeout;
  req.resolve_timeout = resolve_timeout;

  return req;
}

http::Reply Connect::perform(const http::Request &req) const {
  INFO_AUTO_CAT("perform");

  for (int attempt = 1;; ++attempt) {
    try {
      return http::Client::perform(req);
    } catch (const TransientDiscoveryError &e) {
      const csv msg{e.what()};

      if ((attempt >= refused_retries) || (msg.find("refused") == csv::npos)) throw;

      INFO_AUTO("{} refused, attempt={}\n", req.url, attempt);
      std::this_thread::sleep_for(refused_delay);
    }
  }
}

SelfDescription Connect::get_info(const Endpoint &ep) {
  INFO_AUTO_CAT("get_info");

  auto req = make_request(ep);
  req.method = "GET";
  req.url.append("?").append(http::Client::form({{"action", "getInfo"},              //
                                                 {"version", version_of(ep)}})); //

  const auto reply = perform(req);

  SelfDescription sd;

  try {
    sd = SelfDescription::parse(reply.body);
  } catch (const Error &e) {
    // some receivers reply without a json body
    throw ProtocolError("getInfo", reply.status, reply.body.empty() ? e.what() : reply.body);
  }

  if (!sd.is_ok()) {
    throw ProtocolError("getInfo", sd.status, sd.status_string, sd.spotify_error);
  }

  INFO_AUTO("{} {}\n", ep.host, sd.inspect());

  return sd;
}

ProtocolOutcome Connect::add_user(const Endpoint &ep, const AddUser &au) {
  INFO_AUTO_CAT("add_user");

  auto req = make_request(ep);
  req.method = "POST";

  http::Fields fields{{"action", "addUser"},          //
                      {"version", version_of(ep)},    //
                      {"tokenType", au.token_type},   //
                      {"clientKey", au.client_key},   //
                      {"loginId", au.login_id},       //
                      {"userName", au.user_name},     //
                      {"blob", au.blob}};             //

  if (!au.device_name.empty()) fields.emplace_back("deviceName", au.device_name);
  if (!au.device_id.empty()) fields.emplace_back("deviceId", au.device_id);

  req.body = http::Client::form(fields);

  auto outcome = to_outcome(perform(req), "addUser", ProtocolOutcome::AddUserResponse,
                            ProtocolOutcome::AddUserError);

  if (!outcome.is_ok()) {
    throw ProtocolError("addUser", outcome.status, outcome.status_string, outcome.spotify_error);
  }

  INFO_AUTO("{} user={} {}\n", ep.host, au.user_name, outcome);

  return outcome;
}

ProtocolOutcome Connect::reset_users(const Endpoint &ep) {
  INFO_AUTO_CAT("reset_users");

  auto req = make_request(ep);
  req.method = "POST";
  req.body = http::Client::form({{"action", "resetUsers"}, {"version", version_of(ep)}});

  auto outcome =
      to_outcome(perform(req), "resetUsers", ProtocolOutcome::None, ProtocolOutcome::None);

  INFO_AUTO("{} {}\n", ep.host, outcome);

  return outcome;
}

ProtocolOutcome Connect::to_outcome(const http::Reply &reply, csv action,
                                    ProtocolOutcome::kind_t ok_kind,
                                    ProtocolOutcome::kind_t err_kind) {
  StaticJsonDocument<1024> doc;
  ProtocolOutcome o;

  const auto err = deserializeJson(doc, reply.body);

  if (err || !doc.is<JsonObject>() || doc["status"].isNull()) {
    // no status triple, the http status is all there is
    if (reply.status != 200) throw ProtocolError(action, reply.status, reply.body);

    o.status = ProtocolOutcome::STATUS_OK;
    o.status_string = "OK";
  } else {
    o = ProtocolOutcome::from_json(ok_kind, doc.as<JsonObjectConst>());
  }

  o.kind = o.is_ok() ? ok_kind : err_kind;
  o.response_source = string(action);

  return o;
}

} // namespace zc
} // namespace sconnect
