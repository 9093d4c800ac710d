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
#include "base/signal.hpp"
#include "base/types.hpp"
#include "cast/channel.hpp"
#include "cast/session.hpp"
#include "device/entry.hpp"
#include "directory/directory.hpp"
#include "discovery/cast_listener.hpp"
#include "discovery/connect_listener.hpp"
#include "speaker/players.hpp"
#include "webapi/client.hpp"
#include "zc/api.hpp"
#include "zc/blob.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace sconnect {

namespace mdns {
class Browser;
}

/// @brief Background coordinator of the device directory: runs discovery,
///        reconciles the Web API device list and drives cast activations
class Task {
public:
  using ChannelFactory = std::function<std::unique_ptr<cast::Channel>()>;

  /// @brief External collaborators, all must outlive the Task
  struct Collaborators {
    webapi::Client &web;
    webapi::TokenProvider &tokens;
    webapi::DeviceAuth &auth;
    zc::Api &zc;
    ChannelFactory channel_factory;
    speaker::Factory *speakers{nullptr};
  };

  /// @brief Per call activation bounds, zero selects the configured value
  struct Timeouts {
    Millis activation{0};
    Millis transfer{0};
  };

public:
  Task(Collaborators collab) noexcept;
  ~Task() noexcept;

  Task(const Task &) = delete;
  Task &operator=(const Task &) = delete;

  /// @brief Start discovery and the directory thread
  void start() noexcept;

  /// @brief Wait for the initial discovery period to complete
  bool wait_ready(Millis timeout) noexcept { return ready.wait_for(timeout); }
  bool is_ready() const noexcept { return ready.is_set(); }

  /// @brief Stop cast sessions, the directory thread and then discovery
  void shutdown() noexcept;

  void subscribe(Observer *observer) noexcept { dir.subscribe(observer); }
  void unsubscribe(Observer *observer) noexcept { dir.unsubscribe(observer); }

  // queries
  DirectoryEntries get_devices(bool refresh_first = false);

  /// @brief Resolve a device id or name.  Without a full refresh the active
  ///        device is still taken from the current playback state.
  OptEntry get_device(csv value, bool refresh_first = true, bool raise = true);
  OptEntry get_active_device(bool refresh_first = false);
  OptEntry get_player_device(csv value, bool refresh_first = false);

  // mutations
  void add_dynamic_device(const RemoteDevice &device) noexcept;
  size_t remove_device(csv id, bool dynamic_only = false) noexcept;

  /// @brief Reconcile the directory with the Web API device list and playback state
  void refresh();

  /// @brief Activate the Spotify application on a cast receiver, log in the
  ///        account and optionally transfer playback to it.  The device is
  ///        looked up by name and then by id.
  /// @throws ResolutionError device empty or not found
  /// @throws ActivationError (ProtocolError, TimeoutError) activation failed
  void activate_and_optionally_transfer(csv device, bool transfer, Timeouts timeouts = {});

  /// @brief Log an account into a native receiver through its zeroconf endpoint.
  ///        An empty login id in the request selects the configured login.
  /// @throws ResolutionError device not found
  /// @throws ActivationError the device is not a native receiver
  /// @throws ProtocolError the receiver refused the account
  ProtocolOutcome add_user(csv device, zc::AddUser req);

  /// @brief Sign every account out of a native receiver
  /// @throws ResolutionError device not found
  /// @throws ActivationError the device is not a native receiver
  ProtocolOutcome reset_users(csv device);

  /// @brief Log the account into a native receiver with an encrypted blob
  ///        built from a fresh getInfo (or the account token when the
  ///        receiver asks for an authorization code token)
  /// @param reset_first sign out current users before adding ours
  /// @throws ResolutionError device not found
  /// @throws ActivationError the device is not a native receiver or the
  ///         credentials are incomplete
  /// @throws ProtocolError the receiver refused the account
  ProtocolOutcome connect_user(csv device, const zc::Credentials &creds, bool reset_first = true);

  /// @brief Credentials from the directory configuration
  zc::Credentials credentials() const noexcept;

  /// @brief Player for a Sonos entry
  /// @param return_coordinator prefer the group coordinator
  /// @throws ResolutionError when no player exists for the entry
  speaker::shPlayer sonos_player(const DirectoryEntry &entry, bool return_coordinator);

  /// @brief Running cast sessions
  size_t session_count() const noexcept;

  Directory &directory() noexcept { return dir; }
  discovery::ConnectListener &connect_listener() noexcept { return connect_lsn; }
  discovery::CastListener &cast_listener() noexcept { return cast_lsn; }

  const string &default_device() const noexcept { return default_device_id; }
  const string &login_id() const noexcept { return login; }

  static Millis clamp_activation(Millis requested, Millis configured) noexcept;
  static Millis clamp_transfer(Millis requested, Millis configured) noexcept;

private:
  DirectoryEntry activation_entry(csv device) const;
  DirectoryEntry native_entry(csv device) const;
  zc::AddUser login_request(const SelfDescription &info, const zc::Credentials &creds);
  ProtocolOutcome add_user_at(const DirectoryEntry &entry, const zc::Endpoint &ep, zc::AddUser req);
  OptEntry update_active();
  void run() noexcept;
  void stop_sessions() noexcept;

private:
  // order dependent
  conf::token tokc;
  Collaborators collab;
  const Millis initial_discovery;
  const Millis idle_poll;
  const string default_device_id;
  const string login;
  const string user_name;
  const string password;
  const bool zeroconf;
  const Millis activation_timeout;
  const Millis transfer_timeout;
  Directory dir;
  std::mutex discovery_mtx;
  speaker::Players players;
  discovery::ConnectListener connect_lsn;
  discovery::CastListener cast_lsn;

  // order independent
  Signal ready;
  Signal stop_sig;
  std::unique_ptr<mdns::Browser> browser;
  std::jthread thread;

  mutable std::mutex sessions_mtx;
  std::map<string, std::unique_ptr<cast::Session>> sessions;

public:
  static constexpr Millis activation_min{15s};
  static constexpr Millis activation_max{30s};
  static constexpr Millis transfer_min{10s};
  static constexpr Millis transfer_max{20s};

  // receivers still loading report this public key ("INVALID")
  static constexpr csv invalid_public_key{"SU5WQUxJRA=="};
  static constexpr csv not_loaded{"NOT-LOADED"};
  static constexpr Millis not_loaded_poll{250};
  static constexpr Millis not_loaded_max{5s};

  MOD_ID("directory");
};

} // namespace sconnect
