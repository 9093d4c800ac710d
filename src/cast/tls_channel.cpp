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

#include "cast/tls_channel.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "cast_channel.pb.h"

#include <ArduinoJson.h>
#include <arpa/inet.h>
#include <cstring>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace sconnect {
namespace cast {

static string make_json(csv type, int request_id = 0, csv app_id = csv()) noexcept {
  StaticJsonDocument<256> doc;

  doc["type"] = string(type);
  if (request_id) doc["requestId"] = request_id;
  if (!app_id.empty()) doc["appId"] = string(app_id);

  string json;
  serializeJson(doc, json);

  return json;
}

TlsChannel::TlsChannel() noexcept
    : tokc(module_id),                                      //
      connect_timeout(tokc.timeout_val("connect", 5s)),     //
      launch_timeout(tokc.timeout_val("launch", 10s)),      //
      heartbeat_interval(tokc.timeout_val("heartbeat", 5s)), //
      ssl_ctx(ssl::context::tlsv12_client),                  //
      stream(io_ctx, ssl_ctx),                               //
      heartbeat_timer(io_ctx) {
  // receivers present self-signed certificates
  ssl_ctx.set_verify_mode(ssl::verify_none);
}

TlsChannel::~TlsChannel() noexcept { close(); }

void TlsChannel::run_bounded(csv what, Millis timeout) {
  op_ec = asio::error::would_block;

  io_ctx.restart();
  io_ctx.run_for(timeout);

  if (op_ec == asio::error::would_block) {
    // still pending, abandon the operation
    error_code ec;
    stream.lowest_layer().close(ec);
    io_ctx.restart();
    io_ctx.run();

    throw TransientDiscoveryError(fmt::format("cast {} timed out", what));
  } else if (op_ec) {
    throw TransientDiscoveryError(fmt::format("cast {} failed: {}", what, op_ec.message()));
  }
}

void TlsChannel::connect(csv host, Port port) {
  INFO_AUTO_CAT("connect");

  error_code ec;
  const auto addr = asio::ip::make_address(string(host), ec);

  if (ec) throw TransientDiscoveryError(fmt::format("cast host {} invalid: {}", host, ec.message()));

  const tcp_endpoint ep(addr, port);

  stream.lowest_layer().async_connect(ep, [this](error_code ec) { op_ec = ec; });
  run_bounded("connect", connect_timeout);

  stream.async_handshake(ssl::stream_base::client, [this](error_code ec) { op_ec = ec; });
  run_bounded("handshake", connect_timeout);

  connected = true;

  INFO_AUTO("{}:{} established\n", host, port);

  // from here the io_context is owned by the channel thread
  io_ctx.restart();
  send_frame(SENDER_ID, RECEIVER_ID, NS_CONNECTION, make_json("CONNECT"));
  read_header();
  heartbeat();

  thread = std::jthread([this]() {
    name_thread("sconnect_cast");

    io_ctx.run();

    INFO_AUTO("io_ctx exited\n");
  });
}

void TlsChannel::launch(csv app_id) {
  INFO_AUTO_CAT("launch");

  {
    std::scoped_lock lck(launch_mtx);

    launch_app_id = string(app_id);
    transport_id.clear();
    launch_error.clear();
    launch_sig.clear();
  }

  send_frame(SENDER_ID, RECEIVER_ID, NS_RECEIVER, make_json("LAUNCH", request_id++, app_id));

  if (!launch_sig.wait_for(launch_timeout)) {
    throw TimeoutError(fmt::format("app {} did not start within {}", app_id, launch_timeout));
  }

  string tid;

  {
    std::scoped_lock lck(launch_mtx);

    if (!launch_error.empty()) {
      throw ActivationError(fmt::format("app {} launch failed: {}", app_id, launch_error));
    }

    tid = transport_id;
  }

  send_frame(SENDER_ID, tid, NS_CONNECTION, make_json("CONNECT"));

  INFO_AUTO("app={} transport={}\n", app_id, tid);
}

void TlsChannel::send(csv ns, csv payload) {
  INFO_AUTO_CAT("send");

  string tid;

  {
    std::scoped_lock lck(launch_mtx);
    tid = transport_id;
  }

  if (!connected || tid.empty()) throw ActivationError("cast application is not connected");

  INFO_AUTO("{} {}\n", ns, payload);

  send_frame(SENDER_ID, tid, ns, payload);
}

void TlsChannel::set_receiver(Receiver r) {
  std::scoped_lock lck(receiver_mtx);

  receiver = std::move(r);
}

void TlsChannel::close() noexcept {
  INFO_AUTO_CAT("close");

  connected = false;

  // unblock any launch waiter
  launch_sig.set();

  if (!thread.joinable()) {
    error_code ec;
    stream.lowest_layer().close(ec);
    return;
  }

  // the channel thread owns the socket, io_ctx.run() returns once its work drains
  asio::post(io_ctx, [this]() {
    error_code ec;

    heartbeat_timer.cancel();
    stream.lowest_layer().shutdown(ip_tcp::socket::shutdown_both, ec);
    stream.lowest_layer().close(ec);
  });

  thread.join();

  INFO_AUTO("closed\n");
}

void TlsChannel::heartbeat() noexcept {
  heartbeat_timer.expires_after(heartbeat_interval);

  heartbeat_timer.async_wait([this](error_code ec) {
    if (ec || !connected) return;

    send_frame(SENDER_ID, RECEIVER_ID, NS_HEARTBEAT, make_json("PING"));
    heartbeat();
  });
}

void TlsChannel::read_header() noexcept {
  asio::async_read(stream, asio::buffer(header_buf), [this](error_code ec, size_t) {
    INFO_AUTO_CAT("read");

    if (ec) {
      INFO_AUTO("header failed: {}\n", ec.message());
      connected = false;
      launch_sig.set();
      return;
    }

    uint32_t len{0};
    std::memcpy(&len, header_buf.data(), sizeof(len));
    len = ntohl(len);

    if (len > max_frame) {
      INFO_AUTO("frame too large len={}\n", len);
      connected = false;
      launch_sig.set();
      return;
    }

    read_body(len);
  });
}

void TlsChannel::read_body(uint32_t len) noexcept {
  body_buf.assign(len, '\0');

  asio::async_read(stream, asio::buffer(body_buf), [this](error_code ec, size_t) {
    INFO_AUTO_CAT("read");

    if (ec) {
      INFO_AUTO("body failed: {}\n", ec.message());
      connected = false;
      launch_sig.set();
      return;
    }

    cast_channel::CastMessage msg;

    if (msg.ParseFromString(body_buf)) {
      dispatch(msg);
    } else {
      INFO_AUTO("unable to parse frame len={}\n", body_buf.size());
    }

    read_header();
  });
}

void TlsChannel::dispatch(const cast_channel::CastMessage &msg) noexcept {
  INFO_AUTO_CAT("dispatch");

  if (msg.payload_type() != cast_channel::CastMessage::STRING) return;

  const csv ns{msg.namespace_()};
  const csv payload{msg.payload_utf8()};

  if (ns == NS_HEARTBEAT) {
    if (payload.find("\"PING\"") != csv::npos) {
      send_frame(SENDER_ID, msg.source_id(), NS_HEARTBEAT, make_json("PONG"));
    }
  } else if (ns == NS_RECEIVER) {
    handle_receiver_status(payload);
  } else if (ns == NS_CONNECTION) {
    if (payload.find("\"CLOSE\"") != csv::npos) INFO_AUTO("CLOSE from {}\n", msg.source_id());
  } else {
    std::scoped_lock lck(receiver_mtx);

    if (receiver) {
      try {
        receiver(ns, payload);
      } catch (const std::exception &e) {
        INFO_AUTO("receiver failed: {}\n", e.what());
      }
    }
  }
}

void TlsChannel::handle_receiver_status(csv payload) noexcept {
  INFO_AUTO_CAT("receiver");

  DynamicJsonDocument doc(8 * 1024);
  if (auto err = deserializeJson(doc, payload.data(), payload.size()); err) {
    INFO_AUTO("json failed: {}\n", err.c_str());
    return;
  }

  const csv type{doc["type"] | ""};

  std::scoped_lock lck(launch_mtx);

  if (type == csv{"RECEIVER_STATUS"}) {
    for (JsonObjectConst app : doc["status"]["applications"].as<JsonArrayConst>()) {
      const csv app_id{app["appId"] | ""};

      if (!launch_app_id.empty() && (app_id == launch_app_id)) {
        transport_id = app["transportId"] | "";

        INFO_AUTO("app={} transport={} status={}\n", app_id, transport_id,
                  app["statusText"] | "");

        if (!transport_id.empty()) launch_sig.set();
      }
    }
  } else if ((type == csv{"LAUNCH_ERROR"}) || (type == csv{"INVALID_REQUEST"})) {
    launch_error = fmt::format("{} {}", type, doc["reason"] | "");
    launch_sig.set();
  }
}

void TlsChannel::send_frame(csv src, csv dest, csv ns, csv payload) noexcept {
  cast_channel::CastMessage msg;

  msg.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
  msg.set_source_id(string(src));
  msg.set_destination_id(string(dest));
  msg.set_namespace_(string(ns));
  msg.set_payload_type(cast_channel::CastMessage::STRING);
  msg.set_payload_utf8(string(payload));

  string serialized;
  msg.SerializeToString(&serialized);

  const uint32_t len = htonl(static_cast<uint32_t>(serialized.size()));

  string frame;
  frame.append(reinterpret_cast<const char *>(&len), sizeof(len));
  frame.append(serialized);

  // writes are serialized on the channel thread
  asio::post(io_ctx, [this, frame = std::move(frame)]() mutable {
    const bool idle = write_queue.empty();
    write_queue.emplace_back(std::move(frame));

    if (idle) write_next();
  });
}

void TlsChannel::write_next() noexcept {
  asio::async_write(stream, asio::buffer(write_queue.front()), [this](error_code ec, size_t) {
    INFO_AUTO_CAT("write");

    if (ec) {
      INFO_AUTO("failed: {}\n", ec.message());
      write_queue.clear();
      return;
    }

    write_queue.pop_front();
    if (!write_queue.empty()) write_next();
  });
}

} // namespace cast
} // namespace sconnect
