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

#include "directory/task.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "mdns/browser.hpp"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <exception>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <thread>

namespace sconnect {

Task::Task(Collaborators collab) noexcept
    : tokc(module_id),                                                //
      collab(std::move(collab)),                                      //
      initial_discovery(tokc.timeout_val("initial_discovery", 3s)),   //
      idle_poll(tokc.timeout_val("idle_poll", 500ms)),                //
      default_device_id(tokc.val<string>("default_device", "")),      //
      login(tokc.val<string>("login_id", "")),                        //
      user_name(tokc.val<string>("user_name", "")),                   //
      password(tokc.val<string>("password", "")),                     //
      zeroconf(tokc.val<bool>("zeroconf", true)),                     //
      activation_timeout(tokc.timeout_val("activation", activation_min)), //
      transfer_timeout(tokc.timeout_val("transfer", transfer_min)),   //
      players(this->collab.speakers),                                 //
      connect_lsn(dir, discovery_mtx, this->collab.zc, players),      //
      cast_lsn(dir, discovery_mtx) {}

Task::~Task() noexcept { shutdown(); }

Millis Task::clamp_activation(Millis requested, Millis configured) noexcept { // static
  const auto want = (requested > 0ms) ? requested : configured;

  return std::clamp(want, activation_min, activation_max);
}

Millis Task::clamp_transfer(Millis requested, Millis configured) noexcept { // static
  const auto want = (requested > 0ms) ? requested : configured;

  return std::clamp(want, transfer_min, transfer_max);
}

void Task::start() noexcept {
  INFO_AUTO_CAT("start");

  if (zeroconf) {
    browser = std::make_unique<mdns::Browser>();
    browser->add_listener(&connect_lsn);
    browser->add_listener(&cast_lsn);

    if (auto err = browser->start(); !err.empty()) {
      INFO_AUTO("discovery unavailable: {}\n", err);
    }
  }

  thread = std::jthread([this]() {
    name_thread("sconnect_dir");

    run();
  });

  INFO_AUTO("initial_discovery={} idle_poll={} default_device='{}'\n", initial_discovery,
            idle_poll, default_device_id);
}

void Task::run() noexcept {
  INFO_AUTO_CAT("run");

  // devices only the Web API knows are present before discovery settles
  try {
    refresh();
  } catch (const std::exception &e) {
    INFO_AUTO("initial refresh failed: {}\n", e.what());
  }

  // discovery populates the directory during the grace period
  if (!stop_sig.wait_for(initial_discovery)) {
    ready.set();

    INFO_AUTO("ready, devices={}\n", dir.size());
  }

  while (!stop_sig.wait_for(idle_poll)) {
  }

  INFO_AUTO("stop requested\n");
}

void Task::shutdown() noexcept {
  INFO_AUTO_CAT("shutdown");

  stop_sig.set();

  // cast sessions first, discovery resources last
  stop_sessions();

  if (thread.joinable()) thread.join();

  browser.reset();

  // unblock any waiter that missed the ready signal
  ready.set();
}

void Task::stop_sessions() noexcept {
  INFO_AUTO_CAT("stop_sessions");

  std::map<string, std::unique_ptr<cast::Session>> stopping;

  {
    std::scoped_lock lck(sessions_mtx);
    stopping.swap(sessions);
  }

  for (auto &[key, session] : stopping) {
    session->stop();
  }

  if (!stopping.empty()) INFO_AUTO("stopped {} sessions\n", stopping.size());
}

size_t Task::session_count() const noexcept {
  std::scoped_lock lck(sessions_mtx);

  return sessions.size();
}

DirectoryEntries Task::get_devices(bool refresh_first) {
  if (refresh_first) refresh();

  return dir.snapshot();
}

OptEntry Task::get_device(csv value, bool refresh_first, bool raise) {
  // the active device is the fallback for empty and default values
  if (refresh_first) {
    refresh();
  } else {
    update_active();
  }

  return dir.resolve(value, default_device_id, raise);
}

OptEntry Task::get_active_device(bool refresh_first) {
  if (refresh_first) refresh();

  return update_active();
}

OptEntry Task::get_player_device(csv value, bool refresh_first) {
  if (refresh_first) refresh();

  return dir.player_device(value);
}

// request paths use only the directory lock, observers may call back into the Task
void Task::add_dynamic_device(const RemoteDevice &device) noexcept {
  dir.add_dynamic(device, login);
}

size_t Task::remove_device(csv id, bool dynamic_only) noexcept {
  return dir.remove(id, dynamic_only);
}

void Task::refresh() {
  INFO_AUTO_CAT("refresh");

  // the Web API is called without holding either lock
  const auto remote = collab.web.list_player_devices();
  const auto state = collab.web.playback_state();

  dir.reconcile_listed(remote, login);
  const auto active = dir.mark_active(state);

  INFO_AUTO("listed={} active={}\n", remote.size(), active.has_value() ? active->name : "<none>");
}

OptEntry Task::update_active() {
  INFO_AUTO_CAT("update_active");

  return dir.mark_active(collab.web.playback_state());
}

void Task::activate_and_optionally_transfer(csv device, bool transfer, Timeouts timeouts) {
  INFO_AUTO_CAT("activate");

  if (boost::algorithm::trim_copy(string(device)).empty()) {
    throw ResolutionError("a device name or id is required for activation");
  }

  const auto entry = activation_entry(device);

  if (!entry.is_cast()) {
    throw ActivationError(fmt::format("device \"{}\" is not a cast receiver", entry.name));
  }

  if (!collab.channel_factory) throw ActivationError("no cast transport available");

  cast::Session::Opts opts{.activation = clamp_activation(timeouts.activation, activation_timeout),
                           .transfer = clamp_transfer(timeouts.transfer, transfer_timeout),
                           .transfer_playback = transfer,
                           .play = true};

  // an existing session holds the application, replace it
  std::unique_ptr<cast::Session> prev;

  {
    std::scoped_lock lck(sessions_mtx);

    if (auto node = sessions.extract(entry.key()); !node.empty()) prev = std::move(node.mapped());
  }

  if (prev) prev->stop();

  auto session = std::make_unique<cast::Session>(dir, entry, collab.channel_factory(), collab.web,
                                                 collab.tokens, collab.auth, opts);

  INFO_AUTO("{} activation={} transfer={}\n", entry.name, opts.activation,
            transfer ? fmt::format("{}", opts.transfer) : string("no"));

  session->start();
  session->wait_ready(); // throws on failure, the session thread has already ended

  INFO_AUTO("{}\n", *session);

  std::scoped_lock lck(sessions_mtx);
  sessions.insert_or_assign(entry.key(), std::move(session));
}

DirectoryEntry Task::activation_entry(csv device) const {
  const auto want = boost::algorithm::trim_copy(string(device));

  // names first, then ids, the default device only when asked for
  if (want == Directory::DEFAULT_DEVICE) return dir.resolve(want, default_device_id, true).value();
  if (auto found = dir.find_by_name(want); found.has_value()) return found.value();
  if (auto found = dir.find_by_id(want); found.has_value()) return found.value();

  throw ResolutionError(
      fmt::format("Spotify Player device \"{}\" was not found for activation", want));
}

DirectoryEntry Task::native_entry(csv device) const {
  auto entry = dir.resolve(device, default_device_id, true).value();

  if (entry.is_cast() || entry.is_dynamic()) {
    throw ActivationError(fmt::format("device \"{}\" has no zeroconf endpoint", entry.name));
  }

  return entry;
}

ProtocolOutcome Task::add_user(csv device, zc::AddUser req) {
  const auto entry = native_entry(device);

  return add_user_at(entry, zc::Endpoint::make(entry.discovery, entry.discovery.host_address()),
                     std::move(req));
}

ProtocolOutcome Task::add_user_at(const DirectoryEntry &entry, const zc::Endpoint &ep,
                                  zc::AddUser req) {
  INFO_AUTO_CAT("add_user");

  if (req.login_id.empty()) req.login_id = login;

  try {
    auto outcome = collab.zc.add_user(ep, req);
    dir.apply_outcome(entry.key(), outcome);

    INFO_AUTO("{} login={} {}\n", entry.name, req.login_id, outcome);

    return outcome;
  } catch (const ProtocolError &e) {
    dir.apply_outcome(entry.key(), ProtocolOutcome{.kind = ProtocolOutcome::AddUserError,
                                                   .spotify_error = e.vendor_error,
                                                   .status = e.status,
                                                   .status_string = e.status_string,
                                                   .response_source = "addUser"});
    throw;
  }
}

zc::Credentials Task::credentials() const noexcept {
  return zc::Credentials{.user_name = user_name,
                         .password = uint8v(password.begin(), password.end())};
}

zc::AddUser Task::login_request(const SelfDescription &info, const zc::Credentials &creds) {
  zc::AddUser req{.user_name = creds.user_name, .login_id = login};

  if ((info.public_key == invalid_public_key) && (info.availability == not_loaded)) {
    // the receiver can not decrypt yet, identify the origin instead
    req.device_name = string(zc::BlobBuilder::origin_device_name);
    req.device_id = zc::BlobBuilder::origin_device_id();
  } else if (info.token_type == csv{"authorization_code"}) {
    req.blob = collab.tokens.current_access_token();
    req.token_type = info.token_type;
    req.device_name = string(zc::BlobBuilder::origin_device_name);
    req.device_id = zc::BlobBuilder::origin_device_id();
  } else {
    zc::BlobBuilder builder(creds, info.device_id, info.public_key);

    req.blob = builder.build();
    req.client_key = builder.client_key();
  }

  return req;
}

ProtocolOutcome Task::connect_user(csv device, const zc::Credentials &creds, bool reset_first) {
  INFO_AUTO_CAT("connect_user");

  if (creds.user_name.empty()) throw ActivationError("a user name is required to connect");

  const auto entry = native_entry(device);
  const auto ep = zc::Endpoint::make(entry.discovery, entry.discovery.host_address());

  if (reset_first) {
    const auto reset = collab.zc.reset_users(ep);
    INFO_AUTO("{} reset {}\n", entry.name, reset);
  }

  auto info = collab.zc.get_info(ep);

  try {
    return add_user_at(entry, ep, login_request(info, creds));
  } catch (const ProtocolError &e) {
    if ((e.status != 203) || (e.status_string != csv{"ERROR-INVALID-PUBLICKEY"})) throw;

    INFO_AUTO("{} public key not ready, waiting\n", entry.name);
  }

  // the receiver had not loaded its keys, wait for it briefly and try once more
  for (Millis waited{0}; waited < not_loaded_max; waited += not_loaded_poll) {
    std::this_thread::sleep_for(not_loaded_poll);

    info = collab.zc.get_info(ep);
    if (info.availability != not_loaded) break;
  }

  return add_user_at(entry, ep, login_request(info, creds));
}

ProtocolOutcome Task::reset_users(csv device) {
  INFO_AUTO_CAT("reset_users");

  const auto entry = native_entry(device);

  auto outcome =
      collab.zc.reset_users(zc::Endpoint::make(entry.discovery, entry.discovery.host_address()));

  INFO_AUTO("{} {}\n", entry.name, outcome);

  return outcome;
}

speaker::shPlayer Task::sonos_player(const DirectoryEntry &entry, bool return_coordinator) {
  return speaker::select(players.find(entry.discovery.host_address()), return_coordinator,
                         entry.name);
}

} // namespace sconnect
