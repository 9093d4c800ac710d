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
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <functional>
#include <map>
#include <vector>

namespace sconnect {
namespace http {

using Headers = std::map<string, string>;
using Fields = std::vector<std::pair<string, string>>;
using Endpoints = std::vector<ip_tcp::endpoint>;
using Lookup = std::function<Endpoints(const string &host, const string &port)>;

/// @brief Components of an http or https url
struct Url {
  bool tls{false};
  string host;
  string port;
  string target; // path plus query, always starts with /

  /// @throws Error when the url is not http or https
  static Url parse(csv url);
};

struct Request {
  string method{"GET"};
  string url;
  Headers headers;
  string body;
  Millis timeout{10000};
  Millis resolve_timeout{3000};
};

struct Reply {
  unsigned status{0};
  Headers headers;
  string body;

  bool ok() const noexcept { return (status >= 200) && (status < 300); }
};

/// @brief Blocking http/1.1 client, each request uses a private io_context
///        so the caller's thread is the only one involved
class Client {
public:
  /// @brief Perform a single request, the connection is closed afterwards
  /// @throws TransientDiscoveryError on resolve, connect or transfer failure
  ///         (including expiry of the timeouts)
  static Reply perform(const Request &req);

  /// @brief First IPv4 address of the host, bounded by the timeout
  /// @throws TransientDiscoveryError when resolution fails or expires
  static string resolve_address(csv host, Millis timeout);

  /// @brief Resolve on a detached thread that owns the lookup, the caller
  ///        waits at most timeout and never for the system resolver
  /// @throws TransientDiscoveryError when resolution fails or expires
  static Endpoints lookup(csv host, csv port, Millis timeout, Lookup fn = system_lookup);

  /// @brief IPv4 endpoints from the system resolver (blocking)
  static Endpoints system_lookup(const string &host, const string &port);

  /// @brief Percent encode a query or form value
  static string encode(csv val) noexcept;

  /// @brief application/x-www-form-urlencoded body (or query string)
  static string form(const Fields &fields) noexcept;

public:
  static constexpr csv user_agent{"sconnect/1.0"};

  MOD_ID("http.client");
};

} // namespace http
} // namespace sconnect
