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
#include "base/types.hpp"
#include "http/client.hpp"
#include "zc/api.hpp"

namespace sconnect {
namespace zc {

/// @brief Zeroconf api over plain http
class Connect : public Api {
public:
  Connect() noexcept;

  SelfDescription get_info(const Endpoint &ep) override;
  ProtocolOutcome add_user(const Endpoint &ep, const AddUser &req) override;
  ProtocolOutcome reset_users(const Endpoint &ep) override;

  /// @brief Base url of the endpoint (e.g. http://10.0.0.5:8080/zc)
  static string uri(const Endpoint &ep) noexcept;

  /// @brief Interpret a reply carrying a status triple
  /// @throws ProtocolError when the reply has no status triple and http failed
  static ProtocolOutcome to_outcome(const http::Reply &reply, csv action,
                                    ProtocolOutcome::kind_t ok_kind,
                                    ProtocolOutcome::kind_t err_kind);

private:
  http::Request make_request(const Endpoint &ep) const noexcept;
  http::Reply perform(const http::Request &req) const;
  string version_of(const Endpoint &ep) const noexcept;

private:
  // order dependent
  conf::token tokc;
  const Millis info_timeout;
  const Millis resolve_timeout;
  const string default_version;

public:
  // receivers may refuse connections briefly after advertising
  static constexpr int refused_retries{4};
  static constexpr Millis refused_delay{250};

  MOD_ID("connect");
};

} // namespace zc
} // namespace sconnect
