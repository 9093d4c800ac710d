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

#include "base/dura_t.hpp"
#include "base/signal.hpp"
#include "base/types.hpp"
#include "cast/channel.hpp"
#include "device/outcome.hpp"
#include "device/self_description.hpp"
#include "webapi/client.hpp"

#include <atomic>
#include <mutex>

namespace sconnect {
namespace cast {

/// @brief Receives identity and outcome updates as they arrive.
///        Invoked on the channel thread.
class Sink {
public:
  virtual ~Sink() = default;

  virtual void self_description(const SelfDescription &info) = 0;
  virtual void outcome(const ProtocolOutcome &outcome) = 0;
};

/// @brief Spotify cast application protocol: getInfo and addUser requests
///        and the receipt of their (and transfer) outcomes
class Controller {
public:
  Controller(Channel &channel, Sink &sink, webapi::TokenProvider &tokens,
             webapi::DeviceAuth &auth, csv remote_name, bool is_group) noexcept;

  Controller(const Controller &) = delete;
  Controller &operator=(const Controller &) = delete;

  /// @brief While launching, requests are sent without waiting because the
  ///        launch sequence waits on the signals itself
  void set_launching(bool launching) noexcept { launching_flag = launching; }
  bool launching() const noexcept { return launching_flag.load(); }

  /// @brief Request the receiver self description
  /// @throws TimeoutError no reply within timeout (standalone only)
  /// @throws ProtocolError the receiver answered getInfoError (standalone only)
  void get_information(Millis timeout);

  /// @brief Exchange the account token for a device token and log the account in
  /// @throws TimeoutError no reply within timeout (standalone only)
  /// @throws ProtocolError the receiver answered addUserError (standalone only)
  void add_user(Millis timeout);

  /// @brief Handle one message from the application namespace
  void receive(csv ns, csv payload) noexcept;

  // throw ProtocolError when the recorded reply is an error
  void check_get_info() const;
  void check_add_user() const;
  void check_transfer() const;

  /// @brief Prepare for a transfer outcome, call before the transfer request
  void expect_transfer() noexcept;

  SelfDescription info() const noexcept;
  ProtocolOutcome outcome() const noexcept;

  Signal &get_info_signal() noexcept { return get_info_sig; }
  Signal &activation_signal() noexcept { return activation_sig; }
  Signal &transfer_signal() noexcept { return transfer_sig; }

private:
  void record(ProtocolOutcome o, ProtocolOutcome &step) noexcept;
  static void check(const ProtocolOutcome &o, csv what);

private:
  // order dependent
  Channel &channel;
  Sink &sink;
  webapi::TokenProvider &tokens;
  webapi::DeviceAuth &auth;
  const string remote_name;
  const bool is_group;

  // order independent
  std::atomic_bool launching_flag{false};
  Signal get_info_sig;
  Signal activation_sig;
  Signal transfer_sig;

  // guarded by mtx
  mutable std::mutex mtx;
  SelfDescription info_last;
  ProtocolOutcome outcome_last;
  ProtocolOutcome get_info_result;
  ProtocolOutcome add_user_result;
  ProtocolOutcome transfer_result;

public:
  MOD_ID("cast.ctrl");
};

} // namespace cast
} // namespace sconnect
