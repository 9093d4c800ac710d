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

#include "cast/session.hpp"
#include "base/elapsed.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "cast/message.hpp"
#include "directory/directory.hpp"

#include <algorithm>
#include <fmt/chrono.h>

namespace sconnect {
namespace cast {

const std::map<Session::state_t, string> Session::state_names{
    {Idle, "Idle"},                   //
    {Launching, "Launching"},         //
    {AwaitGetInfo, "AwaitGetInfo"},   //
    {AwaitAddUser, "AwaitAddUser"},   //
    {Activated, "Activated"},         //
    {AwaitTransfer, "AwaitTransfer"}, //
    {Running, "Running"},             //
    {Stopped, "Stopped"},             //
    {Error, "Error"}                  //
};

Session::Session(Directory &directory, const DirectoryEntry &entry,
                 std::unique_ptr<Channel> channel, webapi::Client &web,
                 webapi::TokenProvider &tokens, webapi::DeviceAuth &auth, Opts opts) noexcept
    : tokc("cast"),                                            //
      directory(directory),                                    //
      entry_key(entry.key()),                                  //
      entry_name(entry.discovery.device_name),                 //
      host(entry.discovery.host_address()),                    //
      port(entry.discovery.port),                              //
      channel(std::move(channel)),                             //
      web(web),                                                //
      opts(opts),                                              //
      grace(tokc.timeout_val("app_transfer", 20s)),            //
      controller(*this->channel, *this, tokens, auth, entry_name,
                 entry.discovery.cast_type == DiscoveryRecord::CAST_GROUP) {}

Session::~Session() noexcept { stop(); }

string Session::activated_id() const noexcept {
  std::scoped_lock lck(mtx);

  return activated_device_id;
}

csv Session::state_name(state_t s) noexcept { // static
  if (auto it = state_names.find(s); it != state_names.end()) return it->second;

  return state_names.at(Idle);
}

void Session::set_state(state_t next) noexcept {
  INFO_AUTO_CAT("state");

  const auto prev = std::atomic_exchange(&state_now, next);

  INFO_AUTO("{} {} => {}\n", entry_name, state_name(prev), state_name(next));
}

void Session::start() noexcept {
  thread = std::jthread([this]() {
    name_thread("sconnect_sess");

    run();
  });
}

void Session::wait_ready() {
  // every step of the activation is bounded on its own, grace covers connect and launch
  const auto bound = opts.activation + (opts.transfer_playback ? opts.transfer : 0ms) + grace;

  if (!ready.wait_for(bound)) {
    throw TimeoutError(fmt::format("{} session not ready within {}", entry_name, bound));
  }

  std::scoped_lock lck(mtx);
  if (error) std::rethrow_exception(error);
}

void Session::stop() noexcept {
  INFO_AUTO_CAT("stop");

  stop_sig.set();

  if (thread.joinable()) {
    thread.join();
    INFO_AUTO("{}\n", *this);
  }
}

void Session::run() noexcept {
  INFO_AUTO_CAT("run");

  try {
    activate();

    if (opts.transfer_playback) transfer();

    set_state(Running);
    ready.set();

    // the application only accepts commands while the channel is open
    stop_sig.wait();

    set_state(Stopped);

  } catch (const std::exception &e) {
    INFO_AUTO("{} failed in {}: {}\n", entry_name, state_name(state()), e.what());

    // protocol errors were already recorded as they arrived, a transfer
    // timeout leaves the last outcome untouched
    const bool record = (state() < Activated) && !dynamic_cast<const ProtocolError *>(&e);

    if (record) {
      outcome(ProtocolOutcome{.kind = ProtocolOutcome::LaunchError,
                              .status = SelfDescription::STATUS_GET_INFO_FAILED,
                              .status_string = e.what(),
                              .response_source = string(module_id)});
    }

    {
      std::scoped_lock lck(mtx);
      error = std::current_exception();
    }

    set_state(Error);
    ready.set();
  }

  channel->close();
}

void Session::activate() {
  INFO_AUTO_CAT("activate");

  if (host.empty() || (port == 0)) {
    throw ActivationError(fmt::format("{} has no cast address", entry_name));
  }

  Elapsed e;

  set_state(Launching);
  channel->connect(host, port);
  channel->set_receiver([this](csv ns, csv payload) { controller.receive(ns, payload); });
  channel->launch(Message::APP_ID);

  controller.set_launching(true);

  set_state(AwaitGetInfo);
  controller.get_information(opts.activation);

  if (!controller.get_info_signal().wait_for(opts.activation)) {
    throw TimeoutError(fmt::format("{} getInfo reply not received within {}", entry_name,
                                   opts.activation));
  }

  controller.check_get_info();

  set_state(AwaitAddUser);
  controller.add_user(opts.activation);

  const auto remaining = std::max(opts.activation - e.as<Millis>(), Millis(0));

  if (!controller.activation_signal().wait_for(remaining)) {
    throw TimeoutError(fmt::format("{} addUser reply not received within {}", entry_name,
                                   opts.activation));
  }

  controller.check_add_user();
  controller.set_launching(false);

  {
    std::scoped_lock lck(mtx);
    activated_device_id = controller.info().device_id;
  }

  set_state(Activated);

  INFO_AUTO("{} activated as {} in {}\n", entry_name, activated_id(), e.humanize());
}

void Session::transfer() {
  INFO_AUTO_CAT("transfer");

  set_state(AwaitTransfer);

  controller.expect_transfer();
  web.transfer_playback(activated_id(), opts.play);

  if (!controller.transfer_signal().wait_for(opts.transfer)) {
    throw TimeoutError(fmt::format("{} transfer reply not received within {}", entry_name,
                                   opts.transfer));
  }

  controller.check_transfer();

  INFO_AUTO("{} {}\n", entry_name, controller.outcome());
}

void Session::self_description(const SelfDescription &info) {
  directory.apply_self_description(entry_key, info);
}

void Session::outcome(const ProtocolOutcome &outcome) {
  directory.apply_outcome(entry_key, outcome);
}

} // namespace cast
} // namespace sconnect
