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

#include "base/asio.hpp"
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/signal.hpp"
#include "base/types.hpp"
#include "cast/channel.hpp"

#include <array>
#include <atomic>
#include <boost/asio/ssl.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace cast_channel {
class CastMessage;
}

namespace sconnect {
namespace cast {

namespace ssl = boost::asio::ssl;

/// @brief Cast v2 channel: TLS to the receiver, length prefixed protobuf
///        frames, heartbeat and application launch
class TlsChannel : public Channel {
public:
  TlsChannel() noexcept;
  ~TlsChannel() noexcept;

  TlsChannel(const TlsChannel &) = delete;
  TlsChannel &operator=(const TlsChannel &) = delete;

  void connect(csv host, Port port) override;
  void launch(csv app_id) override;
  void send(csv ns, csv payload) override;
  void set_receiver(Receiver r) override;
  void close() noexcept override;

private:
  void dispatch(const cast_channel::CastMessage &msg) noexcept;
  void handle_receiver_status(csv payload) noexcept;

  void heartbeat() noexcept;
  void read_header() noexcept;
  void read_body(uint32_t len) noexcept;
  void send_frame(csv src, csv dest, csv ns, csv payload) noexcept;
  void write_next() noexcept;

  /// @brief Run the io_context until the pending operation completes or the timeout
  void run_bounded(csv what, Millis timeout);

private:
  // order dependent
  conf::token tokc;
  const Millis connect_timeout;
  const Millis launch_timeout;
  const Millis heartbeat_interval;
  io_context io_ctx;
  ssl::context ssl_ctx;
  ssl::stream<tcp_socket> stream;
  steady_timer heartbeat_timer;

  // order independent
  std::array<uint8_t, 4> header_buf{};
  string body_buf;
  std::deque<string> write_queue;
  std::atomic_bool connected{false};
  std::atomic_int request_id{1};
  error_code op_ec;
  std::jthread thread;

  // launch state, guarded by launch_mtx
  std::mutex launch_mtx;
  string launch_app_id;
  string transport_id;
  string launch_error;
  Signal launch_sig;

  std::mutex receiver_mtx;
  Receiver receiver;

public:
  static constexpr csv SENDER_ID{"sender-0"};
  static constexpr csv RECEIVER_ID{"receiver-0"};
  static constexpr csv NS_CONNECTION{"urn:x-cast:com.google.cast.tp.connection"};
  static constexpr csv NS_HEARTBEAT{"urn:x-cast:com.google.cast.tp.heartbeat"};
  static constexpr csv NS_RECEIVER{"urn:x-cast:com.google.cast.receiver"};
  static constexpr uint32_t max_frame{64 * 1024};

  MOD_ID("cast");
};

} // namespace cast
} // namespace sconnect
