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

#include "http/client.hpp"
#include "base/asio.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <cctype>
#include <exception>
#include <fmt/format.h>
#include <future>
#include <iterator>
#include <memory>
#include <openssl/ssl.h>
#include <thread>

namespace sconnect {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace ssl = boost::asio::ssl;

Url Url::parse(csv url) {
  Url u;
  string_view rest;

  if (url.starts_with("https://")) {
    u.tls = true;
    rest = url.substr(8);
  } else if (url.starts_with("http://")) {
    rest = url.substr(7);
  } else {
    throw Error(fmt::format("unsupported url: {}", url));
  }

  const auto slash = rest.find('/');
  const auto authority = rest.substr(0, slash);
  u.target = (slash == string_view::npos) ? string("/") : string(rest.substr(slash));

  if (const auto colon = authority.rfind(':'); colon != string_view::npos) {
    u.host = string(authority.substr(0, colon));
    u.port = string(authority.substr(colon + 1));
  } else {
    u.host = string(authority);
    u.port = u.tls ? "443" : "80";
  }

  if (u.host.empty()) throw Error(fmt::format("url has no host: {}", url));

  return u;
}

string Client::encode(csv val) noexcept {
  string out;
  auto w = std::back_inserter(out);

  for (const unsigned char c : val) {
    if (std::isalnum(c) || (c == '-') || (c == '_') || (c == '.') || (c == '~')) {
      out.push_back(static_cast<char>(c));
    } else {
      fmt::format_to(w, "%{:02X}", c);
    }
  }

  return out;
}

string Client::form(const Fields &fields) noexcept {
  string out;

  for (const auto &[key, val] : fields) {
    if (!out.empty()) out.push_back('&');

    out.append(encode(key)).append("=").append(encode(val));
  }

  return out;
}

namespace {

// runs the io_context until the pending operation completes, converting
// a failure into the exception reported to callers
struct Runner {
  io_context &io_ctx;
  const Url &url;
  error_code ec{};

  void wait(csv what) {
    io_ctx.restart();
    io_ctx.run();

    if (ec) {
      throw TransientDiscoveryError(
          fmt::format("{} {}:{} failed: {}", what, url.host, url.port, ec.message()));
    }
  }

  auto handler() {
    return [this](error_code e, auto &&...) { ec = e; };
  }
};

template <typename Stream>
Reply exchange(Stream &stream, Runner &r, const Url &url, const Request &req) {
  auto &lowest = beast::get_lowest_layer(stream);

  bhttp::request<bhttp::string_body> hreq{bhttp::string_to_verb(req.method), url.target, 11};
  hreq.set(bhttp::field::host, url.host);
  hreq.set(bhttp::field::user_agent, string(Client::user_agent));

  for (const auto &[key, val] : req.headers) {
    hreq.set(key, val);
  }

  if (!req.body.empty() || (hreq.method() != bhttp::verb::get)) {
    hreq.body() = req.body;
    hreq.prepare_payload();
  }

  lowest.expires_after(req.timeout);
  bhttp::async_write(stream, hreq, r.handler());
  r.wait("write");

  beast::flat_buffer buffer;
  bhttp::response<bhttp::string_body> hres;

  lowest.expires_after(req.timeout);
  bhttp::async_read(stream, buffer, hres, r.handler());
  r.wait("read");

  Reply reply;
  reply.status = hres.result_int();
  reply.body = std::move(hres.body());

  for (const auto &field : hres) {
    reply.headers.insert_or_assign(string(field.name_string()), string(field.value()));
  }

  error_code ec;
  lowest.socket().shutdown(ip_tcp::socket::shutdown_both, ec);

  return reply;
}

} // namespace

Endpoints Client::system_lookup(const string &host, const string &port) { // static
  io_context io_ctx;
  ip_tcp::resolver resolver(io_ctx);
  Endpoints endpoints;

  for (const auto &entry : resolver.resolve(ip_tcp::v4(), host, port)) {
    endpoints.emplace_back(entry.endpoint());
  }

  return endpoints;
}

Endpoints Client::lookup(csv host, csv port, Millis timeout, Lookup fn) { // static
  // getaddrinfo can not be interrupted, the thread finishes on its own when
  // the caller has given up
  auto promise = std::make_shared<std::promise<Endpoints>>();
  auto future = promise->get_future();

  std::thread([promise, fn = std::move(fn), h = string(host), p = string(port)]() {
    try {
      promise->set_value(fn(h, p));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    throw TransientDiscoveryError(fmt::format("resolve {} timed out", host));
  }

  try {
    return future.get();
  } catch (const std::exception &e) {
    throw TransientDiscoveryError(fmt::format("resolve {} failed: {}", host, e.what()));
  }
}

string Client::resolve_address(csv host, Millis timeout) {
  const auto endpoints = lookup(host, "0", timeout);

  if (endpoints.empty()) throw TransientDiscoveryError(fmt::format("{} has no address", host));

  return endpoints.front().address().to_string();
}

Reply Client::perform(const Request &req) {
  INFO_AUTO_CAT("perform");

  const auto url = Url::parse(req.url);

  // resolution is bounded separately, a host name may need the system resolver
  const auto endpoints = lookup(url.host, url.port, req.resolve_timeout);

  if (endpoints.empty()) throw TransientDiscoveryError(fmt::format("{} has no address", url.host));

  io_context io_ctx;
  Runner r{io_ctx, url};

  INFO_AUTO("{} {}://{}:{}{}\n", req.method, url.tls ? "https" : "http", url.host, url.port,
            url.target);

  if (url.tls) {
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(io_ctx, ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      throw TransientDiscoveryError(fmt::format("unable to set SNI for {}", url.host));
    }

    auto &lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(req.timeout);
    lowest.async_connect(endpoints, r.handler());
    r.wait("connect");

    lowest.expires_after(req.timeout);
    stream.async_handshake(ssl::stream_base::client, r.handler());
    r.wait("handshake");

    return exchange(stream, r, url, req);
  }

  beast::tcp_stream stream(io_ctx);
  stream.expires_after(req.timeout);
  stream.async_connect(endpoints, r.handler());
  r.wait("connect");

  return exchange(stream, r, url, req);
}

} // namespace http
} // namespace sconnect
