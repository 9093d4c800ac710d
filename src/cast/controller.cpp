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

#include "cast/controller.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "cast/message.hpp"

#include <ArduinoJson.h>
#include <exception>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace sconnect {
namespace cast {

Controller::Controller(Channel &channel, Sink &sink, webapi::TokenProvider &tokens,
                       webapi::DeviceAuth &auth, csv remote_name, bool is_group) noexcept
    : channel(channel),         //
      sink(sink),               //
      tokens(tokens),           //
      auth(auth),               //
      remote_name(remote_name), //
      is_group(is_group) {}

void Controller::check(const ProtocolOutcome &o, csv what) { // static
  if (o.is_error()) {
    throw ProtocolError(what, o.status, o.status_string, o.spotify_error);
  }
}

void Controller::check_get_info() const {
  std::scoped_lock lck(mtx);
  check(get_info_result, Message::GET_INFO);
}

void Controller::check_add_user() const {
  std::scoped_lock lck(mtx);
  check(add_user_result, Message::ADD_USER);
}

void Controller::check_transfer() const {
  std::scoped_lock lck(mtx);
  check(transfer_result, "transfer"sv);
}

void Controller::expect_transfer() noexcept {
  std::scoped_lock lck(mtx);

  transfer_result = ProtocolOutcome();
  transfer_sig.clear();
}

SelfDescription Controller::info() const noexcept {
  std::scoped_lock lck(mtx);

  return info_last;
}

ProtocolOutcome Controller::outcome() const noexcept {
  std::scoped_lock lck(mtx);

  return outcome_last;
}

void Controller::get_information(Millis timeout) {
  INFO_AUTO_CAT("get_info");

  {
    std::scoped_lock lck(mtx);
    get_info_result = ProtocolOutcome();
    get_info_sig.clear();
  }

  channel.send(Message::NS, Message::get_info(remote_name, is_group));

  if (launching()) return;

  if (!get_info_sig.wait_for(timeout)) {
    throw TimeoutError(fmt::format("{} getInfo reply not received within {}", remote_name, timeout));
  }

  check_get_info();
}

void Controller::add_user(Millis timeout) {
  INFO_AUTO_CAT("add_user");

  const auto current = info();

  if (current.client_id.empty()) {
    throw ActivationError(fmt::format("{} addUser requires a getInfo reply", remote_name));
  }

  // device scoped token for the client id the receiver reported
  const auto blob = auth.exchange(tokens.current_access_token(), current.client_id,
                                  current.device_id);

  {
    std::scoped_lock lck(mtx);
    add_user_result = ProtocolOutcome();
    activation_sig.clear();
  }

  channel.send(Message::NS, Message::add_user(blob));

  INFO_AUTO("{} sent, device_id={}\n", remote_name, current.device_id);

  if (launching()) return;

  if (!activation_sig.wait_for(timeout)) {
    throw TimeoutError(fmt::format("{} addUser reply not received within {}", remote_name, timeout));
  }

  check_add_user();
}

void Controller::record(ProtocolOutcome o, ProtocolOutcome &step) noexcept {
  {
    std::scoped_lock lck(mtx);

    step = o;
    outcome_last = o;
  }

  sink.outcome(o);
}

void Controller::receive(csv ns, csv payload) noexcept {
  INFO_AUTO_CAT("receive");

  if (ns != Message::NS) return;

  try {
    DynamicJsonDocument doc(payload.size() * 2 + 1024);

    if (auto err = deserializeJson(doc, payload.data(), payload.size()); err) {
      throw Error(fmt::format("json: {}", err.c_str()));
    }

    const string type = doc["type"] | "";
    JsonObjectConst body = doc["payload"].as<JsonObjectConst>();

    INFO_AUTO("{} type={}\n", remote_name, type);

    if (type == Message::GET_INFO_RESPONSE) {
      auto info = SelfDescription::from_json(body);

      if (info.status == 0) {
        info.status = SelfDescription::STATUS_OK;
        info.status_string = "OK";
      }

      info.response_source = type;

      {
        std::scoped_lock lck(mtx);
        info_last = info;
        get_info_result = ProtocolOutcome();
      }

      sink.self_description(info);
      get_info_sig.set();

      return;
    }

    switch (const auto kind = ProtocolOutcome::kind_of(type); kind) {
    case ProtocolOutcome::GetInfoError: {
      record(ProtocolOutcome::from_json(kind, body), get_info_result);
      get_info_sig.set();
    } break;

    case ProtocolOutcome::AddUserResponse: {
      SelfDescription info;

      {
        std::scoped_lock lck(mtx);

        if (info_last.active_user.empty()) info_last.active_user = body["user"]["id"] | "";
        info = info_last;
      }

      record(ProtocolOutcome::from_json(kind, body), add_user_result);
      sink.self_description(info);
      activation_sig.set();
    } break;

    case ProtocolOutcome::AddUserError: {
      record(ProtocolOutcome::from_json(kind, body), add_user_result);
      activation_sig.set();
    } break;

    case ProtocolOutcome::TransferSuccess:
    case ProtocolOutcome::TransferError: {
      record(ProtocolOutcome::from_json(kind, body), transfer_result);
      transfer_sig.set();
    } break;

    default:
      INFO_AUTO("{} ignoring unknown type={}\n", remote_name, type);
    }

  } catch (const std::exception &e) {
    INFO_AUTO("{} failed: {}\n", remote_name, e.what());

    auto o = ProtocolOutcome::receive_failed(remote_name);

    {
      std::scoped_lock lck(mtx);
      outcome_last = o;
    }

    sink.outcome(o);
  }
}

} // namespace cast
} // namespace sconnect
