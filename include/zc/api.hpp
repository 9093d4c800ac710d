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

#include "base/types.hpp"
#include "device/discovery_record.hpp"
#include "device/outcome.hpp"
#include "device/self_description.hpp"

namespace sconnect {
namespace zc {

/// @brief Where a native receiver answers zeroconf requests
struct Endpoint {
  string host;
  Port port{0};
  string cpath;
  string version;

  /// @brief Endpoint for the record using an explicit host (address or name)
  static Endpoint make(const DiscoveryRecord &rec, csv host) noexcept {
    return Endpoint{.host = string(host), .port = rec.port, .cpath = rec.cpath, .version = rec.version};
  }
};

/// @brief Fields of an addUser request, see zc::BlobBuilder for the blob
struct AddUser {
  string user_name;
  string blob;
  string client_key;
  string token_type{"default"};
  string login_id;
  string device_name; // optional origin device
  string device_id;   // optional origin device
};

/// @brief Native receiver zeroconf api (getInfo, addUser, resetUsers)
class Api {
public:
  virtual ~Api() = default;

  /// @throws ProtocolError for a non-success status
  /// @throws TransientDiscoveryError when the receiver can not be reached
  virtual SelfDescription get_info(const Endpoint &ep) = 0;

  /// @throws ProtocolError for a non-success status
  /// @throws TransientDiscoveryError when the receiver can not be reached
  virtual ProtocolOutcome add_user(const Endpoint &ep, const AddUser &req) = 0;

  /// @brief Sign out every user from the receiver
  virtual ProtocolOutcome reset_users(const Endpoint &ep) = 0;
};

} // namespace zc
} // namespace sconnect
