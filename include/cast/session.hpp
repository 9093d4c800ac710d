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
#include "cast/controller.hpp"
#include "device/entry.hpp"
#include "webapi/client.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace sconnect {

class Directory;

namespace cast {

/// @brief One activation of the Spotify application on a cast receiver.
///        Runs on its own thread from launch until stopped; the application
///        stays resident on the receiver for the lifetime of the session.
class Session : private Sink {
  friend struct fmt::formatter<Session>;

public:
  enum state_t : uint8_t {
    Idle = 0,
    Launching,
    AwaitGetInfo,
    AwaitAddUser,
    Activated,
    AwaitTransfer,
    Running,
    Stopped,
    Error
  };

  struct Opts {
    Millis activation{15s};
    Millis transfer{10s};
    bool transfer_playback{false};
    bool play{true};
  };

public:
  Session(Directory &directory, const DirectoryEntry &entry, std::unique_ptr<Channel> channel,
          webapi::Client &web, webapi::TokenProvider &tokens, webapi::DeviceAuth &auth,
          Opts opts) noexcept;

  ~Session() noexcept;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// @brief Spawn the session thread
  void start() noexcept;

  /// @brief Wait until the session is running or has failed
  /// @throws the activation failure (ActivationError, ProtocolError, TimeoutError)
  /// @throws TimeoutError when the session neither runs nor fails in time
  void wait_ready();

  /// @brief Request the session to stop and join its thread
  void stop() noexcept;

  /// @brief Device id the receiver reported when the account was added.
  ///        May differ from the targeted id for groups.
  string activated_id() const noexcept;

  const string &key() const noexcept { return entry_key; }
  const string &name() const noexcept { return entry_name; }

  state_t state() const noexcept { return state_now.load(); }
  bool is_running() const noexcept { return state() == Running; }

  static csv state_name(state_t s) noexcept;

private:
  void run() noexcept;
  void activate();
  void transfer();

  void set_state(state_t next) noexcept;

  // Sink
  void self_description(const SelfDescription &info) override;
  void outcome(const ProtocolOutcome &outcome) override;

private:
  // order dependent
  conf::token tokc;
  Directory &directory;
  const string entry_key;
  const string entry_name;
  const string host;
  const Port port;
  std::unique_ptr<Channel> channel;
  webapi::Client &web;
  const Opts opts;
  const Millis grace;
  Controller controller;

  // order independent
  std::atomic<state_t> state_now{Idle};
  Signal ready;
  Signal stop_sig;
  std::jthread thread;

  mutable std::mutex mtx;
  string activated_device_id;
  std::exception_ptr error;

  static const std::map<state_t, string> state_names;

public:
  MOD_ID("cast.session");
};

} // namespace cast
} // namespace sconnect

template <> struct fmt::formatter<sconnect::cast::Session> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const sconnect::cast::Session &s, FormatContext &ctx) const
      -> decltype(ctx.out()) {

    return fmt::format_to(ctx.out(), "{} key={} state={}", s.entry_name, s.entry_key,
                          sconnect::cast::Session::state_name(s.state()));
  }
};
